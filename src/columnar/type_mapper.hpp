#pragma once

#include "schema_descriptor.hpp"
#include "core/column_metadata.hpp"
#include "core/query_config.hpp"
#include <cstddef>
#include <vector>

namespace ibarrow::columnar {

// How one column is fetched from the driver and decoded into its buffer
struct DecodeRule {
    LogicalType type = LogicalType::Utf8;
    SQLSMALLINT c_type = SQL_C_CHAR;   // C type passed to SQLBindCol
    size_t element_size = 0;           // bytes reserved per row in the bound buffer
    size_t max_value_bytes = 0;        // payload limit for text/binary, 0 otherwise
    int32_t precision = 0;
    int32_t scale = 0;
};

/**
 * @brief Maps ODBC column metadata to columnar types and decode rules
 *
 * Integers map to the smallest signed width that holds every value (an
 * unsigned source column moves one width up), floating point to float32 or
 * float64, DECIMAL/NUMERIC to decimal128 or decimal256 with the source
 * precision and scale, character data to utf8, binary data to binary and
 * date/time/timestamp to date32, time32[s] and timestamp[us].
 *
 * Text and binary values longer than max_text_size / max_binary_size are
 * truncated by the encoder and flagged; the buffer width is sized here.
 *
 * Any other SQL type throws ArrowError{UnsupportedType} naming the column.
 */
class TypeMapper {
public:
    explicit TypeMapper(const core::QueryConfig& config);

    SchemaDescriptor derive_schema(const std::vector<core::ColumnMetadata>& columns) const;

    DecodeRule decode_rule(const core::ColumnMetadata& column) const;

    std::vector<DecodeRule> decode_rules(const std::vector<core::ColumnMetadata>& columns) const;

    static constexpr int32_t MAX_DECIMAL128_PRECISION = 38;
    static constexpr int32_t MAX_DECIMAL256_PRECISION = 76;

private:
    size_t max_text_size_;
    size_t max_binary_size_;
};

} // namespace ibarrow::columnar
