#pragma once

#include "row_group.hpp"
#include "schema_descriptor.hpp"
#include "type_mapper.hpp"
#include "errors.hpp"
#include <arrow/memory_pool.h>
#include <arrow/record_batch.h>
#include <memory>
#include <vector>

namespace ibarrow::columnar {

// One encoded group of rows. Moved, never shared, from encoder to output.
struct Batch {
    std::shared_ptr<arrow::RecordBatch> record_batch;

    // ArrowError{Truncated} per column that lost data in this batch
    std::vector<ArrowError> warnings;

    // Position of the batch in fetch order, starting at 0
    int64_t sequence = 0;

    int64_t num_rows() const { return record_batch ? record_batch->num_rows() : 0; }
};

/**
 * @brief Turns a RowGroup into a record batch
 *
 * Pure and single threaded: each column's decode rule is applied to every
 * row in order, producing one Arrow array with its validity bitmap. All
 * batches reference the schema descriptor's Arrow schema.
 *
 * Values longer than the column limit are cut to the limit (text at the
 * last complete UTF-8 sequence) and reported as an ArrowError{Truncated}
 * warning; decimal text that does not parse throws ArrowError{Decode}.
 * Text columns must hold UTF-8: any other byte sequence throws
 * ArrowError{Decode} naming the column and row.
 */
class ColumnEncoder {
public:
    ColumnEncoder(SchemaDescriptor schema, std::vector<DecodeRule> rules,
                  arrow::MemoryPool* pool = arrow::default_memory_pool());

    Batch encode(const RowGroup& group, int64_t sequence = 0);

    const SchemaDescriptor& schema() const noexcept { return schema_; }

    // Zero-row batch carrying only the schema
    Batch empty_batch() const;

private:
    std::shared_ptr<arrow::Array> encode_column(size_t index, const ColumnBuffer& buffer,
                                                const RowGroup& group,
                                                std::vector<ArrowError>& warnings);

    SchemaDescriptor schema_;
    std::vector<DecodeRule> rules_;
    arrow::MemoryPool* pool_;

    // Truncation is logged once per column for the encoder's lifetime
    std::vector<bool> truncation_logged_;
};

// Length of the longest prefix of data[0, len) that does not end inside a
// multi-byte UTF-8 sequence
size_t utf8_complete_prefix(const uint8_t* data, size_t len) noexcept;

// Days since 1970-01-01 in the proleptic Gregorian calendar
int32_t days_from_civil(int32_t year, uint32_t month, uint32_t day) noexcept;

} // namespace ibarrow::columnar
