#include "connection_manager.hpp"
#include "dsn_resolver.hpp"
#include "error_translator.hpp"
#include "odbc_error.hpp"
#include "odbc_statement.hpp"
#include "logger.hpp"

#include <array>

namespace ibarrow::core {

namespace {

// Dialects differ on the shortest valid query; the first one that runs wins
constexpr std::array<const char*, 4> CHECK_QUERIES = {
    "SELECT 1",
    "SELECT 1 FROM RDB$DATABASE",   // Firebird / InterBase
    "SELECT 1 FROM DUAL",           // Oracle
    "VALUES 1"                      // DB2, Derby
};

} // anonymous namespace

ConnectionHandle ConnectionManager::open(std::string_view dsn, std::string_view user,
                                         std::string_view password, const QueryConfig& config) {
    std::string resolved = DsnResolver::resolve(dsn, config);
    std::string conn_str = DsnResolver::build_connection_string(resolved, user, password);

    LOG_INFO("Connecting: " + DsnResolver::redact(conn_str));

    ConnectionHandle handle;
    auto start = std::chrono::steady_clock::now();
    try {
        auto env = std::make_shared<OdbcEnvironment>();
        handle = std::make_unique<OdbcConnection>(std::move(env));
        handle->set_login_timeout(config.connection_timeout());
        handle->connect(conn_str);
    } catch (const OdbcError& e) {
        close(handle);
        ErrorTranslator::raise_connect(e, std::chrono::steady_clock::now() - start,
                                       config.connection_timeout());
    }

    try {
        apply_session_attributes(*handle, config);
    } catch (const OdbcError& e) {
        close(handle);
        ErrorTranslator::raise(e, Phase::Session);
    }

    LOG_INFO("Connected");
    return handle;
}

void ConnectionManager::close(ConnectionHandle& handle) noexcept {
    if (!handle) {
        return;
    }
    if (!handle->release()) {
        LOG_WARN("Driver reported an error while releasing the connection");
    }
    handle.reset();
}

bool ConnectionManager::test_connection(OdbcConnection& handle, const QueryConfig& config) {
    if (!handle.is_connected()) {
        return false;
    }

    SQLUINTEGER dead = SQL_CD_FALSE;
    SQLRETURN ret = SQLGetConnectAttr(handle.get_handle(), SQL_ATTR_CONNECTION_DEAD,
                                      &dead, 0, nullptr);
    if (SQL_SUCCEEDED(ret) && dead == SQL_CD_TRUE) {
        LOG_INFO("test_connection: driver reports the connection as dead");
        return false;
    }

    try {
        OdbcStatement stmt(handle);
        stmt.set_query_timeout(config.connection_timeout());

        for (const char* check : CHECK_QUERIES) {
            try {
                stmt.execute(check);
                stmt.fetch();
                stmt.close_cursor();
                LOG_DEBUG(std::string("test_connection succeeded with: ") + check);
                return true;
            } catch (const OdbcError& e) {
                // A lost link makes every further check query pointless
                if (e.has_sqlstate_class("08") || e.has_sqlstate("HYT00") ||
                    e.has_sqlstate("HYT01")) {
                    LOG_INFO(std::string("test_connection failed: ") + e.what());
                    return false;
                }
                LOG_DEBUG(std::string("Check query rejected: ") + check + ": " + e.what());
            }
        }
    } catch (const OdbcError& e) {
        LOG_INFO(std::string("test_connection failed: ") + e.what());
        return false;
    }

    LOG_INFO("test_connection: no check query was accepted");
    return false;
}

SQLULEN ConnectionManager::isolation_to_odbc(IsolationLevel level) noexcept {
    switch (level) {
        case IsolationLevel::ReadUncommitted: return SQL_TXN_READ_UNCOMMITTED;
        case IsolationLevel::ReadCommitted: return SQL_TXN_READ_COMMITTED;
        case IsolationLevel::RepeatableRead: return SQL_TXN_REPEATABLE_READ;
        case IsolationLevel::Serializable: return SQL_TXN_SERIALIZABLE;
    }
    return SQL_TXN_READ_COMMITTED;
}

void ConnectionManager::apply_session_attributes(OdbcConnection& handle, const QueryConfig& config) {
    if (config.read_only()) {
        bool applied = handle.try_set_attribute(SQL_ATTR_ACCESS_MODE, SQL_MODE_READ_ONLY,
                                                "SQLSetConnectAttr(ACCESS_MODE)");
        LOG_IF(applied, "Session set read-only", "Driver ignored read-only access mode");
    }

    bool applied = handle.try_set_attribute(SQL_ATTR_TXN_ISOLATION,
                                            isolation_to_odbc(config.isolation_level()),
                                            "SQLSetConnectAttr(TXN_ISOLATION)");
    LOG_IF(applied,
           std::string("Isolation level ") + isolation_to_string(config.isolation_level()),
           "Driver kept its default isolation level");
}

} // namespace ibarrow::core
