#include "odbc_connection.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace ibarrow::core {

OdbcConnection::OdbcConnection(std::shared_ptr<OdbcEnvironment> env)
    : env_(std::move(env)) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_DBC, env_->get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, env_->get_handle(), "SQLAllocHandle(DBC)");
}

OdbcConnection::~OdbcConnection() {
    release();
}

void OdbcConnection::set_login_timeout(std::chrono::seconds timeout) {
    SQLULEN seconds = static_cast<SQLULEN>(timeout.count());

    SQLRETURN ret = SQLSetConnectAttr(handle_, SQL_ATTR_LOGIN_TIMEOUT,
                                      (SQLPOINTER)seconds, 0);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLSetConnectAttr(LOGIN_TIMEOUT)");

    // Bounds network round trips other than query execution; optional
    try_set_attribute(SQL_ATTR_CONNECTION_TIMEOUT, seconds, "SQLSetConnectAttr(CONNECTION_TIMEOUT)");
}

void OdbcConnection::connect(std::string_view connection_string) {
    if (connected_) {
        throw OdbcError("Already connected");
    }

    SQLCHAR out_conn_str[1024];
    SQLSMALLINT out_conn_str_len = 0;

    std::string conn_str(connection_string);
    SQLRETURN ret = SQLDriverConnect(
        handle_,
        nullptr,  // No window handle
        reinterpret_cast<SQLCHAR*>(conn_str.data()),
        static_cast<SQLSMALLINT>(conn_str.length()),
        out_conn_str,
        sizeof(out_conn_str),
        &out_conn_str_len,
        SQL_DRIVER_NOPROMPT
    );

    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDriverConnect");
    connected_ = true;
}

void OdbcConnection::disconnect() {
    if (!connected_) {
        return;
    }

    SQLRETURN ret = SQLDisconnect(handle_);
    connected_ = false;
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDisconnect");
}

bool OdbcConnection::release() noexcept {
    bool clean = true;

    if (handle_ == SQL_NULL_HDBC) {
        return clean;
    }

    if (connected_) {
        SQLRETURN ret = SQLDisconnect(handle_);
        connected_ = false;
        if (!SQL_SUCCEEDED(ret)) {
            // An open transaction (25000) blocks disconnect; roll it back and retry
            SQLEndTran(SQL_HANDLE_DBC, handle_, SQL_ROLLBACK);
            ret = SQLDisconnect(handle_);
            clean = SQL_SUCCEEDED(ret);
        }
    }

    SQLRETURN ret = SQLFreeHandle(SQL_HANDLE_DBC, handle_);
    handle_ = SQL_NULL_HDBC;
    return clean && SQL_SUCCEEDED(ret);
}

bool OdbcConnection::try_set_attribute(SQLINTEGER attribute, SQLULEN value, const char* context) {
    SQLRETURN ret = SQLSetConnectAttr(handle_, attribute, (SQLPOINTER)value, 0);
    if (SQL_SUCCEEDED(ret)) {
        return true;
    }

    OdbcError error = OdbcError::from_handle(SQL_HANDLE_DBC, handle_, context, ret);
    if (error.has_sqlstate("HYC00") || error.has_sqlstate("HY092") ||
        error.has_sqlstate("HY024")) {
        LOG_WARN(std::string(context) + " not supported by driver: " + error.what());
        return false;
    }
    throw error;
}

} // namespace ibarrow::core
