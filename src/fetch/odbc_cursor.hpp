#pragma once

#include "cursor.hpp"
#include "core/odbc_statement.hpp"
#include "core/query_config.hpp"
#include <atomic>
#include <memory>
#include <string_view>

namespace ibarrow::fetch {

// Block cursor over one executed statement. Columns are bound column-wise
// into the RowGroup at the requested offset and fetched
// SQL_ATTR_ROW_ARRAY_SIZE rows at a time.
//
// Construction only allocates the statement, so the cursor can be handed
// to whoever may cancel it before the possibly long execute() starts.
class OdbcCursor : public Cursor {
public:
    OdbcCursor(core::OdbcConnection& conn, const core::QueryConfig& config);
    ~OdbcCursor() override;

    // Prepares and executes; failures surface as SqlError or QueryError.
    // After cancel() it throws SqlError{Execution} without running.
    void execute(std::string_view sql);

    OdbcCursor(const OdbcCursor&) = delete;
    OdbcCursor& operator=(const OdbcCursor&) = delete;

    std::vector<core::ColumnMetadata> describe() override;
    size_t fetch(columnar::RowGroup& group, size_t offset, size_t max_rows) override;
    void cancel() noexcept override;

    // Row array size the driver accepted for the last fetch
    SQLULEN effective_row_array_size() const noexcept { return row_array_size_; }

private:
    void throw_if_cancelled() const;
    void set_row_array_size(SQLULEN rows);
    void bind(columnar::RowGroup& group, size_t offset);

    std::unique_ptr<core::OdbcStatement> statement_;
    SQLSMALLINT num_columns_ = 0;
    SQLULEN requested_row_array_size_ = 0;
    SQLULEN row_array_size_ = 0;
    SQLULEN rows_fetched_ = 0;

    // Where the columns are currently bound
    const uint8_t* bound_base_ = nullptr;
    size_t bound_offset_ = 0;

    bool finished_ = false;
    std::atomic<bool> cancelled_{false};
};

} // namespace ibarrow::fetch
