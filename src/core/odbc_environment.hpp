#pragma once

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace ibarrow::core {

// RAII wrapper for ODBC Environment handle. Requests ODBC 3.80 behaviour and
// falls back to 3.0 on driver managers that predate it.
class OdbcEnvironment {
public:
    OdbcEnvironment();
    ~OdbcEnvironment();

    // Non-copyable
    OdbcEnvironment(const OdbcEnvironment&) = delete;
    OdbcEnvironment& operator=(const OdbcEnvironment&) = delete;

    // Movable
    OdbcEnvironment(OdbcEnvironment&& other) noexcept;
    OdbcEnvironment& operator=(OdbcEnvironment&& other) noexcept;

    SQLHENV get_handle() const noexcept { return handle_; }

    // SQL_OV_ODBC3_80 or SQL_OV_ODBC3
    SQLINTEGER odbc_version() const noexcept { return odbc_version_; }

private:
    SQLHENV handle_ = SQL_NULL_HENV;
    SQLINTEGER odbc_version_ = SQL_OV_ODBC3;
};

} // namespace ibarrow::core
