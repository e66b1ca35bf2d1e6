#include "odbc_statement.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace ibarrow::core {

OdbcStatement::OdbcStatement(OdbcConnection& conn)
    : conn_(conn) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, conn_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, conn_.get_handle(), "SQLAllocHandle(STMT)");
}

OdbcStatement::~OdbcStatement() {
    if (handle_ != SQL_NULL_HSTMT) {
        SQLFreeStmt(handle_, SQL_CLOSE);
        SQLFreeHandle(SQL_HANDLE_STMT, handle_);
    }
}

void OdbcStatement::recycle() noexcept {
    // SQL_CLOSE silently succeeds when no cursor is open, unlike
    // SQLCloseCursor which returns 24000 in that case
    SQLFreeStmt(handle_, SQL_CLOSE);
    SQLFreeStmt(handle_, SQL_UNBIND);
    SQLFreeStmt(handle_, SQL_RESET_PARAMS);
}

void OdbcStatement::set_query_timeout(std::chrono::seconds timeout) {
    SQLRETURN ret = SQLSetStmtAttr(handle_, SQL_ATTR_QUERY_TIMEOUT,
                                   (SQLPOINTER)static_cast<SQLULEN>(timeout.count()), 0);
    if (!SQL_SUCCEEDED(ret)) {
        OdbcError error = OdbcError::from_handle(SQL_HANDLE_STMT, handle_,
                                                 "SQLSetStmtAttr(QUERY_TIMEOUT)", ret);
        if (error.has_sqlstate("HYC00") || error.has_sqlstate("HY092")) {
            // The fetch stage still enforces the deadline on its own
            LOG_WARN(std::string("Driver ignores query timeout: ") + error.what());
            return;
        }
        throw error;
    }
}

void OdbcStatement::execute(std::string_view sql) {
    recycle();
    std::string text(sql);
    SQLRETURN ret = SQLExecDirect(handle_, reinterpret_cast<SQLCHAR*>(text.data()),
                                  static_cast<SQLINTEGER>(text.length()));
    // SQL_NO_DATA: searched UPDATE/DELETE touching no rows
    if (ret == SQL_NO_DATA) {
        return;
    }
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLExecDirect");
}

void OdbcStatement::prepare(std::string_view sql) {
    recycle();
    std::string text(sql);
    SQLRETURN ret = SQLPrepare(handle_, reinterpret_cast<SQLCHAR*>(text.data()),
                               static_cast<SQLINTEGER>(text.length()));
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLPrepare");
}

void OdbcStatement::execute_prepared() {
    // Close any open cursor from a previous execution, but keep bindings
    SQLFreeStmt(handle_, SQL_CLOSE);
    SQLRETURN ret = SQLExecute(handle_);
    if (ret == SQL_NO_DATA) {
        return;
    }
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLExecute");
}

SQLSMALLINT OdbcStatement::num_result_cols() {
    SQLSMALLINT count = 0;
    SQLRETURN ret = SQLNumResultCols(handle_, &count);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLNumResultCols");
    return count;
}

ColumnMetadata OdbcStatement::describe_column(SQLUSMALLINT column) {
    ColumnMetadata meta;

    SQLCHAR name[512] = {0};
    SQLSMALLINT name_len = 0;
    SQLRETURN ret = SQLDescribeCol(handle_, column, name, sizeof(name), &name_len,
                                   &meta.sql_type, &meta.column_size,
                                   &meta.decimal_digits, &meta.nullable);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLDescribeCol");
    meta.name = reinterpret_cast<char*>(name);

    SQLLEN is_unsigned = SQL_FALSE;
    ret = SQLColAttribute(handle_, column, SQL_DESC_UNSIGNED, nullptr, 0, nullptr, &is_unsigned);
    if (SQL_SUCCEEDED(ret)) {
        meta.is_unsigned = (is_unsigned == SQL_TRUE);
    } else {
        LOG_DEBUG("SQL_DESC_UNSIGNED unavailable for column " + meta.name + ", assuming signed");
    }

    return meta;
}

bool OdbcStatement::fetch() {
    SQLRETURN ret = SQLFetch(handle_);

    if (ret == SQL_NO_DATA) {
        return false;
    }

    // Allow SQL_SUCCESS_WITH_INFO (warnings)
    if (ret == SQL_SUCCESS || ret == SQL_SUCCESS_WITH_INFO) {
        return true;
    }

    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLFetch");
    return false;
}

void OdbcStatement::close_cursor() noexcept {
    SQLFreeStmt(handle_, SQL_CLOSE);
}

void OdbcStatement::cancel() noexcept {
    if (handle_ != SQL_NULL_HSTMT) {
        SQLCancel(handle_);
    }
}

} // namespace ibarrow::core
