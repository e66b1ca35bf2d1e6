#include "errors.hpp"

namespace ibarrow {

const char* category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Connection: return "ConnectionError";
        case ErrorCategory::Sql: return "SQLError";
        case ErrorCategory::Arrow: return "ArrowError";
        case ErrorCategory::Query: return "QueryError";
        default: return "Error";
    }
}

Error::Error(ErrorCategory category, const std::string& message,
             std::vector<core::OdbcDiagnostic> diagnostics)
    : std::runtime_error(message),
      category_(category),
      diagnostics_(std::move(diagnostics)) {
}

std::string Error::sqlstate() const {
    if (diagnostics_.empty()) {
        return "";
    }
    return diagnostics_.front().sqlstate;
}

ConnectionError::ConnectionError(Kind kind, const std::string& message,
                                 std::vector<core::OdbcDiagnostic> diagnostics)
    : Error(ErrorCategory::Connection, message, std::move(diagnostics)), kind_(kind) {
}

const char* ConnectionError::kind_name() const noexcept {
    switch (kind_) {
        case Kind::Resolution: return "Resolution";
        case Kind::Authentication: return "Authentication";
        case Kind::Transport: return "Transport";
        case Kind::Timeout: return "Timeout";
    }
    return "Unknown";
}

SqlError::SqlError(Kind kind, const std::string& message,
                   std::vector<core::OdbcDiagnostic> diagnostics)
    : Error(ErrorCategory::Sql, message, std::move(diagnostics)), kind_(kind) {
}

const char* SqlError::kind_name() const noexcept {
    switch (kind_) {
        case Kind::Syntax: return "Syntax";
        case Kind::Execution: return "Execution";
        case Kind::Cursor: return "Cursor";
    }
    return "Unknown";
}

ArrowError::ArrowError(Kind kind, const std::string& message,
                       std::optional<std::string> column,
                       std::optional<int64_t> row)
    : Error(ErrorCategory::Arrow, message, {}),
      kind_(kind),
      column_(std::move(column)),
      row_(row) {
}

const char* ArrowError::kind_name() const noexcept {
    switch (kind_) {
        case Kind::UnsupportedType: return "UnsupportedType";
        case Kind::Truncated: return "Truncated";
        case Kind::Decode: return "Decode";
        case Kind::BufferLimit: return "BufferLimit";
    }
    return "Unknown";
}

QueryError::QueryError(Kind kind, const std::string& message,
                       std::vector<core::OdbcDiagnostic> diagnostics)
    : Error(ErrorCategory::Query, message, std::move(diagnostics)), kind_(kind) {
}

const char* QueryError::kind_name() const noexcept {
    switch (kind_) {
        case Kind::Timeout: return "Timeout";
    }
    return "Unknown";
}

} // namespace ibarrow
