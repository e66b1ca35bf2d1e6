#pragma once

#include <arrow/type_fwd.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ibarrow::columnar {

// Columnar logical type a result-set column is encoded into
enum class LogicalType {
    Boolean,
    Int8,
    Int16,
    Int32,
    Int64,
    UInt64,
    Float32,
    Float64,
    Decimal128,
    Decimal256,
    Utf8,
    Binary,
    Date32,          // days since epoch
    Time32Second,
    TimestampMicro   // microseconds since epoch, no time zone
};

const char* logical_type_to_string(LogicalType type);

struct ColumnDescriptor {
    std::string name;
    LogicalType type = LogicalType::Utf8;
    bool nullable = true;
    uint64_t declared_size = 0;   // column size reported by the source
    int32_t precision = 0;        // decimals only
    int32_t scale = 0;            // decimals only

    bool operator==(const ColumnDescriptor& other) const;
    bool operator!=(const ColumnDescriptor& other) const { return !(*this == other); }
};

std::shared_ptr<arrow::DataType> to_arrow_type(const ColumnDescriptor& column);

/**
 * @brief Ordered column list of one result set
 *
 * Derived once per query and immutable afterwards. The Arrow schema is
 * built eagerly so every batch of the query shares the same instance.
 */
class SchemaDescriptor {
public:
    SchemaDescriptor() = default;
    explicit SchemaDescriptor(std::vector<ColumnDescriptor> columns);

    const std::vector<ColumnDescriptor>& columns() const noexcept { return columns_; }
    size_t size() const noexcept { return columns_.size(); }
    const ColumnDescriptor& operator[](size_t i) const { return columns_[i]; }

    const std::shared_ptr<arrow::Schema>& arrow_schema() const noexcept { return arrow_schema_; }

    bool operator==(const SchemaDescriptor& other) const { return columns_ == other.columns_; }
    bool operator!=(const SchemaDescriptor& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    std::vector<ColumnDescriptor> columns_;
    std::shared_ptr<arrow::Schema> arrow_schema_;
};

} // namespace ibarrow::columnar
