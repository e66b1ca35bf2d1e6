#pragma once

#include "core/odbc_error.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ibarrow {

enum class ErrorCategory {
    Connection,
    Sql,
    Arrow,
    Query
};

const char* category_to_string(ErrorCategory category);

// Root of every error that crosses the library boundary
class Error : public std::runtime_error {
public:
    ErrorCategory category() const noexcept { return category_; }

    // Name of the concrete kind, e.g. "Timeout" or "UnsupportedType"
    virtual const char* kind_name() const noexcept = 0;

    const std::vector<core::OdbcDiagnostic>& diagnostics() const noexcept { return diagnostics_; }

    // First SQLSTATE, empty for failures that did not originate in the driver
    std::string sqlstate() const;

protected:
    Error(ErrorCategory category, const std::string& message,
          std::vector<core::OdbcDiagnostic> diagnostics);

private:
    ErrorCategory category_;
    std::vector<core::OdbcDiagnostic> diagnostics_;
};

class ConnectionError : public Error {
public:
    enum class Kind {
        Resolution,       // data source name or driver could not be found
        Authentication,
        Transport,        // network failure, link lost, connection closed
        Timeout
    };

    ConnectionError(Kind kind, const std::string& message,
                    std::vector<core::OdbcDiagnostic> diagnostics = {});

    Kind kind() const noexcept { return kind_; }
    const char* kind_name() const noexcept override;

private:
    Kind kind_;
};

class SqlError : public Error {
public:
    enum class Kind {
        Syntax,      // preparation or syntax failure
        Execution,   // permission, constraint and other run-time failures
        Cursor
    };

    SqlError(Kind kind, const std::string& message,
             std::vector<core::OdbcDiagnostic> diagnostics = {});

    Kind kind() const noexcept { return kind_; }
    const char* kind_name() const noexcept override;

private:
    Kind kind_;
};

class ArrowError : public Error {
public:
    enum class Kind {
        UnsupportedType,
        Truncated,
        Decode,
        // Row group or column buffer over the configured or addressable size
        BufferLimit
    };

    ArrowError(Kind kind, const std::string& message,
               std::optional<std::string> column = std::nullopt,
               std::optional<int64_t> row = std::nullopt);

    Kind kind() const noexcept { return kind_; }
    const char* kind_name() const noexcept override;

    // Offending column, when the failure is tied to one
    const std::optional<std::string>& column() const noexcept { return column_; }

    // Row index within the whole result set, when known
    const std::optional<int64_t>& row() const noexcept { return row_; }

private:
    Kind kind_;
    std::optional<std::string> column_;
    std::optional<int64_t> row_;
};

class QueryError : public Error {
public:
    enum class Kind {
        Timeout
    };

    QueryError(Kind kind, const std::string& message,
               std::vector<core::OdbcDiagnostic> diagnostics = {});

    Kind kind() const noexcept { return kind_; }
    const char* kind_name() const noexcept override;

private:
    Kind kind_;
};

} // namespace ibarrow
