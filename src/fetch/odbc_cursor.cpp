#include "odbc_cursor.hpp"
#include "core/error_translator.hpp"
#include "core/logger.hpp"

namespace ibarrow::fetch {

using core::ErrorTranslator;
using core::OdbcError;
using core::Phase;

OdbcCursor::OdbcCursor(core::OdbcConnection& conn, const core::QueryConfig& config)
{
    try {
        statement_ = std::make_unique<core::OdbcStatement>(conn);
        statement_->set_query_timeout(config.query_timeout());
    } catch (const OdbcError& e) {
        ErrorTranslator::raise(e, Phase::Prepare);
    }
}

void OdbcCursor::throw_if_cancelled() const {
    if (cancelled_) {
        throw SqlError(SqlError::Kind::Execution, "statement was cancelled before it ran");
    }
}

void OdbcCursor::execute(std::string_view sql) {
    throw_if_cancelled();
    try {
        statement_->prepare(sql);
    } catch (const OdbcError& e) {
        ErrorTranslator::raise(e, Phase::Prepare);
    }

    throw_if_cancelled();
    try {
        statement_->execute_prepared();
    } catch (const OdbcError& e) {
        ErrorTranslator::raise(e, Phase::Execute);
    }

    try {
        num_columns_ = statement_->num_result_cols();
    } catch (const OdbcError& e) {
        ErrorTranslator::raise(e, Phase::Describe);
    }

    if (num_columns_ == 0) {
        throw SqlError(SqlError::Kind::Execution, "statement did not return a result set");
    }
    LOG_DEBUG("Cursor open with " + std::to_string(num_columns_) + " columns");
}

OdbcCursor::~OdbcCursor() {
    if (statement_) {
        statement_->close_cursor();
    }
}

std::vector<core::ColumnMetadata> OdbcCursor::describe() {
    std::vector<core::ColumnMetadata> columns;
    columns.reserve(static_cast<size_t>(num_columns_));
    try {
        for (SQLSMALLINT i = 1; i <= num_columns_; ++i) {
            columns.push_back(statement_->describe_column(static_cast<SQLUSMALLINT>(i)));
        }
    } catch (const OdbcError& e) {
        ErrorTranslator::raise(e, Phase::Describe);
    }
    return columns;
}

void OdbcCursor::set_row_array_size(SQLULEN rows) {
    SQLHSTMT h = statement_->get_handle();
    SQLRETURN ret = SQLSetStmtAttr(h, SQL_ATTR_ROW_ARRAY_SIZE, (SQLPOINTER)rows, 0);
    if (!SQL_SUCCEEDED(ret)) {
        ErrorTranslator::raise(
            OdbcError::from_handle(SQL_HANDLE_STMT, h, "SQLSetStmtAttr(ROW_ARRAY_SIZE)", ret),
            Phase::Fetch);
    }

    // 01S02: the driver substituted a smaller value
    SQLULEN effective = rows;
    if (ret == SQL_SUCCESS_WITH_INFO) {
        ret = SQLGetStmtAttr(h, SQL_ATTR_ROW_ARRAY_SIZE, &effective, 0, nullptr);
        if (!SQL_SUCCEEDED(ret) || effective == 0) {
            effective = 1;
        }
        LOG_INFO("Driver lowered row array size from " + std::to_string(rows) +
                 " to " + std::to_string(effective));
    }
    row_array_size_ = effective;

    ret = SQLSetStmtAttr(h, SQL_ATTR_ROWS_FETCHED_PTR, &rows_fetched_, 0);
    if (!SQL_SUCCEEDED(ret)) {
        ErrorTranslator::raise(
            OdbcError::from_handle(SQL_HANDLE_STMT, h, "SQLSetStmtAttr(ROWS_FETCHED_PTR)", ret),
            Phase::Fetch);
    }
}

void OdbcCursor::bind(columnar::RowGroup& group, size_t offset) {
    SQLHSTMT h = statement_->get_handle();
    for (size_t i = 0; i < group.num_columns(); ++i) {
        columnar::ColumnBuffer& buffer = group.column(i);
        SQLRETURN ret = SQLBindCol(h, static_cast<SQLUSMALLINT>(i + 1), buffer.c_type(),
                                   buffer.value_ptr(offset),
                                   static_cast<SQLLEN>(buffer.element_size()),
                                   buffer.indicator_ptr(offset));
        if (!SQL_SUCCEEDED(ret)) {
            ErrorTranslator::raise(
                OdbcError::from_handle(SQL_HANDLE_STMT, h,
                                       "SQLBindCol(" + std::to_string(i + 1) + ")", ret),
                Phase::Fetch);
        }
    }
    bound_base_ = group.column(0).value_ptr(0);
    bound_offset_ = offset;
}

size_t OdbcCursor::fetch(columnar::RowGroup& group, size_t offset, size_t max_rows) {
    if (finished_ || max_rows == 0) {
        return 0;
    }

    SQLULEN wanted = static_cast<SQLULEN>(max_rows);
    if (wanted != requested_row_array_size_) {
        requested_row_array_size_ = wanted;
        set_row_array_size(wanted);
    }

    // Buffers are recycled between groups, so rebinding is only needed
    // when either the storage or the offset changed
    if (bound_base_ != group.column(0).value_ptr(0) || bound_offset_ != offset) {
        bind(group, offset);
    }

    rows_fetched_ = 0;
    SQLHSTMT h = statement_->get_handle();
    SQLRETURN ret = SQLFetch(h);
    if (ret == SQL_NO_DATA) {
        finished_ = true;
        return 0;
    }
    if (!SQL_SUCCEEDED(ret)) {
        ErrorTranslator::raise(OdbcError::from_handle(SQL_HANDLE_STMT, h, "SQLFetch", ret),
                               Phase::Fetch);
    }
    if (ret == SQL_SUCCESS_WITH_INFO) {
        // 01004 (right truncation) is detected per value from the indicators
        LOG_TRACE("SQLFetch returned SQL_SUCCESS_WITH_INFO");
    }

    return static_cast<size_t>(rows_fetched_);
}

void OdbcCursor::cancel() noexcept {
    cancelled_ = true;
    if (statement_) {
        statement_->cancel();
    }
}

} // namespace ibarrow::fetch
