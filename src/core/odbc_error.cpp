#include "odbc_error.hpp"
#include <sstream>

namespace ibarrow::core {

std::vector<OdbcDiagnostic> read_diagnostics(SQLSMALLINT handle_type, SQLHANDLE handle) {
    std::vector<OdbcDiagnostic> diagnostics;
    if (handle == SQL_NULL_HANDLE) {
        return diagnostics;
    }

    SQLSMALLINT rec = 1;
    SQLCHAR sqlstate[6] = {0};
    SQLCHAR message[SQL_MAX_MESSAGE_LENGTH] = {0};
    SQLINTEGER native_error = 0;
    SQLSMALLINT text_length = 0;

    while (SQL_SUCCEEDED(SQLGetDiagRec(handle_type, handle, rec,
                                       sqlstate, &native_error,
                                       message, SQL_MAX_MESSAGE_LENGTH, &text_length))) {
        OdbcDiagnostic diag;
        diag.sqlstate = reinterpret_cast<char*>(sqlstate);
        diag.native_error = native_error;
        diag.message = reinterpret_cast<char*>(message);
        diag.record_number = rec;

        diagnostics.push_back(std::move(diag));
        rec++;
    }

    return diagnostics;
}

OdbcError OdbcError::from_handle(SQLSMALLINT handle_type, SQLHANDLE handle,
                                 const std::string& context, SQLRETURN ret) {
    auto diagnostics = read_diagnostics(handle_type, handle);

    std::string error_msg = context.empty() ? "ODBC error" : context;
    if (!diagnostics.empty()) {
        error_msg += ": [" + diagnostics.front().sqlstate + "] " + diagnostics.front().message;
    } else if (ret == SQL_INVALID_HANDLE) {
        error_msg += ": invalid handle";
    }
    return OdbcError(error_msg, std::move(diagnostics), ret);
}

OdbcError::OdbcError(const std::string& message)
    : std::runtime_error(message) {
}

OdbcError::OdbcError(const std::string& message, std::vector<OdbcDiagnostic> diagnostics,
                     SQLRETURN ret)
    : std::runtime_error(message), diagnostics_(std::move(diagnostics)), ret_(ret) {
}

std::string OdbcError::primary_sqlstate() const {
    if (diagnostics_.empty()) {
        return "";
    }
    return diagnostics_.front().sqlstate;
}

bool OdbcError::has_sqlstate(std::string_view sqlstate) const {
    for (const auto& diag : diagnostics_) {
        if (diag.sqlstate == sqlstate) {
            return true;
        }
    }
    return false;
}

bool OdbcError::has_sqlstate_class(std::string_view two_chars) const {
    for (const auto& diag : diagnostics_) {
        if (diag.sqlstate.compare(0, two_chars.size(), two_chars) == 0) {
            return true;
        }
    }
    return false;
}

std::string OdbcError::format_diagnostics() const {
    std::ostringstream oss;
    oss << what() << "\n";

    for (const auto& diag : diagnostics_) {
        oss << "  [" << diag.sqlstate << "] (Native: " << diag.native_error << ") "
            << diag.message << "\n";
    }

    return oss.str();
}

void check_odbc_result(SQLRETURN ret, SQLSMALLINT handle_type, SQLHANDLE handle,
                       const std::string& context) {
    if (!SQL_SUCCEEDED(ret)) {
        throw OdbcError::from_handle(handle_type, handle, context, ret);
    }
}

} // namespace ibarrow::core
