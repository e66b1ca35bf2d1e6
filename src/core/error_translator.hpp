#pragma once

#include "errors.hpp"
#include "core/odbc_error.hpp"
#include <arrow/result.h>
#include <arrow/status.h>
#include <chrono>
#include <string>
#include <utility>

namespace ibarrow::core {

// ODBC operation during which a failure happened
enum class Phase {
    Connect,    // SQLDriverConnect
    Session,    // session attributes right after connect
    Prepare,    // SQLPrepare, SQLAllocHandle(STMT)
    Execute,    // SQLExecute / SQLExecDirect
    Describe,   // SQLNumResultCols, SQLDescribeCol, SQLColAttribute
    Fetch       // SQLBindCol, SQLFetch
};

const char* phase_to_string(Phase phase);

// Outcome of classifying a native failure; kind is the integral value of the
// category's Kind enum
struct Classification {
    ErrorCategory category;
    int kind;
};

/**
 * @brief Maps native failures into the public error taxonomy
 *
 * Every ODBC or Arrow failure passes through here before it leaves the
 * library, so callers only ever see ConnectionError, SqlError, ArrowError
 * or QueryError.
 */
class ErrorTranslator {
public:
    static Classification classify(const OdbcError& error, Phase phase);

    // A failed connect that consumed the whole login timeout is a timeout,
    // whatever SQLSTATE the driver picked
    static Classification classify_connect(const OdbcError& error,
                                           std::chrono::steady_clock::duration elapsed,
                                           std::chrono::seconds timeout);

    // Throw the concrete taxonomy type for a classification
    [[noreturn]] static void raise(const Classification& classification, const std::string& message,
                      const std::vector<OdbcDiagnostic>& diagnostics);

    [[noreturn]] static void raise(const OdbcError& error, Phase phase);
    [[noreturn]] static void raise_connect(const OdbcError& error,
                              std::chrono::steady_clock::duration elapsed,
                              std::chrono::seconds timeout);

    static ArrowError from_status(const arrow::Status& status, const std::string& context);
};

// Throw ArrowError{Decode} when an Arrow call fails
void check_arrow(const arrow::Status& status, const std::string& context);

template <typename T>
T check_arrow(arrow::Result<T> result, const std::string& context) {
    if (!result.ok()) {
        throw ErrorTranslator::from_status(result.status(), context);
    }
    return std::move(result).ValueUnsafe();
}

} // namespace ibarrow::core
