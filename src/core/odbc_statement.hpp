#pragma once

#include "odbc_connection.hpp"
#include "column_metadata.hpp"
#include <chrono>
#include <string>
#include <string_view>

namespace ibarrow::core {

// RAII wrapper for ODBC Statement handle
class OdbcStatement {
public:
    explicit OdbcStatement(OdbcConnection& conn);
    ~OdbcStatement();

    // Non-copyable, non-movable (due to reference member)
    OdbcStatement(const OdbcStatement&) = delete;
    OdbcStatement& operator=(const OdbcStatement&) = delete;
    OdbcStatement(OdbcStatement&&) = delete;
    OdbcStatement& operator=(OdbcStatement&&) = delete;

    // Per-call bound on SQLExecDirect/SQLFetch; ignored if unsupported
    void set_query_timeout(std::chrono::seconds timeout);

    void execute(std::string_view sql);
    void prepare(std::string_view sql);
    void execute_prepared();

    SQLSMALLINT num_result_cols();
    ColumnMetadata describe_column(SQLUSMALLINT column);

    bool fetch();
    void close_cursor() noexcept;

    // Safe to call from a thread other than the one running the statement
    void cancel() noexcept;

    SQLHSTMT get_handle() const noexcept { return handle_; }

private:
    void recycle() noexcept;

    SQLHSTMT handle_ = SQL_NULL_HSTMT;
    OdbcConnection& conn_;
};

} // namespace ibarrow::core
