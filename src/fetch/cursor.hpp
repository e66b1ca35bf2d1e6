#pragma once

#include "columnar/row_group.hpp"
#include "core/column_metadata.hpp"
#include <cstddef>
#include <vector>

namespace ibarrow::fetch {

/**
 * @brief Open result set that writes rows straight into RowGroup buffers
 *
 * Values land in the ODBC C-type layout of each ColumnBuffer (fixed stride,
 * one length/indicator per row), so the encoder does not care whether a
 * driver or an in-memory source filled them.
 */
class Cursor {
public:
    virtual ~Cursor() = default;

    virtual std::vector<core::ColumnMetadata> describe() = 0;

    // Writes up to max_rows rows starting at row `offset` of the group.
    // Returns the number written; 0 means the result set is exhausted.
    virtual size_t fetch(columnar::RowGroup& group, size_t offset, size_t max_rows) = 0;

    // May be called from another thread while fetch() blocks
    virtual void cancel() noexcept = 0;
};

} // namespace ibarrow::fetch
