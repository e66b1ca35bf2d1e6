#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace ibarrow::core {

// Diagnostic record from SQLGetDiagRec
struct OdbcDiagnostic {
    std::string sqlstate;           // 5-character SQLSTATE code
    SQLINTEGER native_error = 0;    // Driver-specific error code
    std::string message;
    SQLSMALLINT record_number = 0;
};

// Raw failure of an ODBC call, before classification into the public taxonomy
class OdbcError : public std::runtime_error {
public:
    // Extract all diagnostic records from a handle
    static OdbcError from_handle(SQLSMALLINT handle_type, SQLHANDLE handle,
                                 const std::string& context = "",
                                 SQLRETURN ret = SQL_ERROR);

    explicit OdbcError(const std::string& message);
    OdbcError(const std::string& message, std::vector<OdbcDiagnostic> diagnostics,
              SQLRETURN ret = SQL_ERROR);

    const std::vector<OdbcDiagnostic>& diagnostics() const noexcept { return diagnostics_; }
    SQLRETURN return_code() const noexcept { return ret_; }

    // SQLSTATE of the first diagnostic record, empty if there is none
    std::string primary_sqlstate() const;

    bool has_sqlstate(std::string_view sqlstate) const;
    bool has_sqlstate_class(std::string_view two_chars) const;

    std::string format_diagnostics() const;

private:
    std::vector<OdbcDiagnostic> diagnostics_;
    SQLRETURN ret_ = SQL_ERROR;
};

// Read every diagnostic record currently attached to a handle
std::vector<OdbcDiagnostic> read_diagnostics(SQLSMALLINT handle_type, SQLHANDLE handle);

// Check ODBC return code and throw on error
void check_odbc_result(SQLRETURN ret, SQLSMALLINT handle_type, SQLHANDLE handle,
                       const std::string& context);

} // namespace ibarrow::core
