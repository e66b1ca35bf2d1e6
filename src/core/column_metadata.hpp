#pragma once

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

#include <string>

namespace ibarrow::core {

// Result-set column as reported by SQLDescribeCol / SQLColAttribute
struct ColumnMetadata {
    std::string name;
    SQLSMALLINT sql_type = SQL_UNKNOWN_TYPE;
    SQLULEN column_size = 0;          // characters, bytes or digits, per type
    SQLSMALLINT decimal_digits = 0;   // scale for DECIMAL/NUMERIC
    SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;
    bool is_unsigned = false;

    // SQL_NULLABLE_UNKNOWN is treated as nullable
    bool allows_null() const noexcept { return nullable != SQL_NO_NULLS; }
};

} // namespace ibarrow::core
