#include "odbc_environment.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace ibarrow::core {

OdbcEnvironment::OdbcEnvironment() {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, SQL_NULL_HANDLE, "SQLAllocHandle(ENV)");

#ifdef SQL_OV_ODBC3_80
    ret = SQLSetEnvAttr(handle_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3_80, 0);
    if (SQL_SUCCEEDED(ret)) {
        odbc_version_ = SQL_OV_ODBC3_80;
        LOG_TRACE("ODBC environment allocated (3.80)");
        return;
    }
    LOG_DEBUG("Driver manager rejected ODBC 3.80, falling back to 3.0");
#endif

    ret = SQLSetEnvAttr(handle_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
    if (!SQL_SUCCEEDED(ret)) {
        OdbcError error = OdbcError::from_handle(SQL_HANDLE_ENV, handle_,
                                                 "SQLSetEnvAttr(ODBC_VERSION)", ret);
        SQLFreeHandle(SQL_HANDLE_ENV, handle_);
        handle_ = SQL_NULL_HENV;
        throw error;
    }
    odbc_version_ = SQL_OV_ODBC3;
}

OdbcEnvironment::~OdbcEnvironment() {
    if (handle_ != SQL_NULL_HENV) {
        SQLFreeHandle(SQL_HANDLE_ENV, handle_);
    }
}

OdbcEnvironment::OdbcEnvironment(OdbcEnvironment&& other) noexcept
    : handle_(other.handle_), odbc_version_(other.odbc_version_) {
    other.handle_ = SQL_NULL_HENV;
}

OdbcEnvironment& OdbcEnvironment::operator=(OdbcEnvironment&& other) noexcept {
    if (this != &other) {
        if (handle_ != SQL_NULL_HENV) {
            SQLFreeHandle(SQL_HANDLE_ENV, handle_);
        }
        handle_ = other.handle_;
        odbc_version_ = other.odbc_version_;
        other.handle_ = SQL_NULL_HENV;
    }
    return *this;
}

} // namespace ibarrow::core
