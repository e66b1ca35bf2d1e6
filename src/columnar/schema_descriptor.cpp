#include "schema_descriptor.hpp"
#include <arrow/type.h>
#include <sstream>

namespace ibarrow::columnar {

const char* logical_type_to_string(LogicalType type) {
    switch (type) {
        case LogicalType::Boolean: return "bool";
        case LogicalType::Int8: return "int8";
        case LogicalType::Int16: return "int16";
        case LogicalType::Int32: return "int32";
        case LogicalType::Int64: return "int64";
        case LogicalType::UInt64: return "uint64";
        case LogicalType::Float32: return "float32";
        case LogicalType::Float64: return "float64";
        case LogicalType::Decimal128: return "decimal128";
        case LogicalType::Decimal256: return "decimal256";
        case LogicalType::Utf8: return "utf8";
        case LogicalType::Binary: return "binary";
        case LogicalType::Date32: return "date32[day]";
        case LogicalType::Time32Second: return "time32[s]";
        case LogicalType::TimestampMicro: return "timestamp[us]";
    }
    return "unknown";
}

bool ColumnDescriptor::operator==(const ColumnDescriptor& other) const {
    return name == other.name && type == other.type && nullable == other.nullable &&
           declared_size == other.declared_size && precision == other.precision &&
           scale == other.scale;
}

std::shared_ptr<arrow::DataType> to_arrow_type(const ColumnDescriptor& column) {
    switch (column.type) {
        case LogicalType::Boolean: return arrow::boolean();
        case LogicalType::Int8: return arrow::int8();
        case LogicalType::Int16: return arrow::int16();
        case LogicalType::Int32: return arrow::int32();
        case LogicalType::Int64: return arrow::int64();
        case LogicalType::UInt64: return arrow::uint64();
        case LogicalType::Float32: return arrow::float32();
        case LogicalType::Float64: return arrow::float64();
        case LogicalType::Decimal128: return arrow::decimal128(column.precision, column.scale);
        case LogicalType::Decimal256: return arrow::decimal256(column.precision, column.scale);
        case LogicalType::Utf8: return arrow::utf8();
        case LogicalType::Binary: return arrow::binary();
        case LogicalType::Date32: return arrow::date32();
        case LogicalType::Time32Second: return arrow::time32(arrow::TimeUnit::SECOND);
        case LogicalType::TimestampMicro: return arrow::timestamp(arrow::TimeUnit::MICRO);
    }
    return arrow::utf8();
}

SchemaDescriptor::SchemaDescriptor(std::vector<ColumnDescriptor> columns)
    : columns_(std::move(columns)) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    fields.reserve(columns_.size());
    for (const auto& column : columns_) {
        fields.push_back(arrow::field(column.name, to_arrow_type(column), column.nullable));
    }
    arrow_schema_ = arrow::schema(std::move(fields));
}

std::string SchemaDescriptor::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < columns_.size(); ++i) {
        const auto& c = columns_[i];
        if (i > 0) oss << ", ";
        oss << "(" << c.name << ", " << logical_type_to_string(c.type);
        if (c.type == LogicalType::Decimal128 || c.type == LogicalType::Decimal256) {
            oss << "(" << c.precision << "," << c.scale << ")";
        }
        oss << ", " << (c.nullable ? "nullable" : "not null") << ")";
    }
    oss << "]";
    return oss.str();
}

} // namespace ibarrow::columnar
