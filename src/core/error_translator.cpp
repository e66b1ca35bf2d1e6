#include "error_translator.hpp"
#include "logger.hpp"

namespace ibarrow::core {

namespace {

Classification connection(ConnectionError::Kind kind) {
    return {ErrorCategory::Connection, static_cast<int>(kind)};
}

Classification sql(SqlError::Kind kind) {
    return {ErrorCategory::Sql, static_cast<int>(kind)};
}

Classification query(QueryError::Kind kind) {
    return {ErrorCategory::Query, static_cast<int>(kind)};
}

bool is_timeout(const OdbcError& error) {
    return error.has_sqlstate("HYT00") || error.has_sqlstate("HYT01");
}

bool is_resolution(const OdbcError& error) {
    // IM002 data source not found, IM003 driver could not be loaded,
    // IM007 no data source or driver specified, IM010 DSN too long
    return error.has_sqlstate("IM002") || error.has_sqlstate("IM003") ||
           error.has_sqlstate("IM007") || error.has_sqlstate("IM010") ||
           error.has_sqlstate("IM012");
}

} // anonymous namespace

const char* phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::Connect: return "connect";
        case Phase::Session: return "session";
        case Phase::Prepare: return "prepare";
        case Phase::Execute: return "execute";
        case Phase::Describe: return "describe";
        case Phase::Fetch: return "fetch";
    }
    return "unknown";
}

Classification ErrorTranslator::classify(const OdbcError& error, Phase phase) {
    const bool connecting = phase == Phase::Connect || phase == Phase::Session;

    if (is_timeout(error)) {
        return connecting ? connection(ConnectionError::Kind::Timeout)
                          : query(QueryError::Kind::Timeout);
    }
    if (is_resolution(error)) {
        return connection(ConnectionError::Kind::Resolution);
    }
    if (error.has_sqlstate_class("28")) {
        return connection(ConnectionError::Kind::Authentication);
    }
    // 08xxx is a link failure in every phase, including mid-fetch
    if (error.has_sqlstate_class("08")) {
        return connection(ConnectionError::Kind::Transport);
    }

    switch (phase) {
        case Phase::Connect:
        case Phase::Session:
            return connection(ConnectionError::Kind::Transport);
        case Phase::Prepare:
        case Phase::Execute:
        case Phase::Describe:
            if (error.has_sqlstate_class("42") || error.has_sqlstate("37000")) {
                return sql(SqlError::Kind::Syntax);
            }
            if (error.has_sqlstate_class("24") || error.has_sqlstate("HY010")) {
                return sql(SqlError::Kind::Cursor);
            }
            return phase == Phase::Prepare ? sql(SqlError::Kind::Syntax)
                                           : sql(SqlError::Kind::Execution);
        case Phase::Fetch:
            return sql(SqlError::Kind::Cursor);
    }
    return sql(SqlError::Kind::Execution);
}

Classification ErrorTranslator::classify_connect(const OdbcError& error,
                                                 std::chrono::steady_clock::duration elapsed,
                                                 std::chrono::seconds timeout) {
    Classification c = classify(error, Phase::Connect);
    if (c.category == ErrorCategory::Connection &&
        c.kind == static_cast<int>(ConnectionError::Kind::Transport) &&
        timeout.count() > 0 && elapsed >= timeout) {
        return connection(ConnectionError::Kind::Timeout);
    }
    return c;
}

void ErrorTranslator::raise(const Classification& classification, const std::string& message,
                            const std::vector<OdbcDiagnostic>& diagnostics) {
    switch (classification.category) {
        case ErrorCategory::Connection:
            throw ConnectionError(static_cast<ConnectionError::Kind>(classification.kind),
                                  message, diagnostics);
        case ErrorCategory::Sql:
            throw SqlError(static_cast<SqlError::Kind>(classification.kind),
                           message, diagnostics);
        case ErrorCategory::Query:
            throw QueryError(static_cast<QueryError::Kind>(classification.kind),
                             message, diagnostics);
        case ErrorCategory::Arrow:
            throw ArrowError(static_cast<ArrowError::Kind>(classification.kind), message);
    }
    throw SqlError(SqlError::Kind::Execution, message, diagnostics);
}

void ErrorTranslator::raise(const OdbcError& error, Phase phase) {
    Classification c = classify(error, phase);
    LOG_ERROR(std::string(category_to_string(c.category)) + " during " +
              phase_to_string(phase) + ": " + error.format_diagnostics());
    raise(c, error.what(), error.diagnostics());
}

void ErrorTranslator::raise_connect(const OdbcError& error,
                                    std::chrono::steady_clock::duration elapsed,
                                    std::chrono::seconds timeout) {
    Classification c = classify_connect(error, elapsed, timeout);
    LOG_ERROR("ConnectionError during connect: " + error.format_diagnostics());
    raise(c, error.what(), error.diagnostics());
}

ArrowError ErrorTranslator::from_status(const arrow::Status& status, const std::string& context) {
    if (status.IsOutOfMemory() || status.IsCapacityError()) {
        return ArrowError(ArrowError::Kind::BufferLimit, context + ": " + status.ToString());
    }
    return ArrowError(ArrowError::Kind::Decode, context + ": " + status.ToString());
}

void check_arrow(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw ErrorTranslator::from_status(status, context);
    }
}

} // namespace ibarrow::core
