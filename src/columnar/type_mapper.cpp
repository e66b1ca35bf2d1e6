#include "type_mapper.hpp"
#include "errors.hpp"
#include "core/logger.hpp"
#include <algorithm>

namespace ibarrow::columnar {

namespace {

// UTF-8 needs up to four bytes per character
constexpr size_t UTF8_MAX_BYTES_PER_CHAR = 4;

// Declared GUID text length: 8-4-4-4-12 hex digits plus dashes
constexpr size_t GUID_TEXT_LENGTH = 36;

template <typename T>
DecodeRule fixed(LogicalType type, SQLSMALLINT c_type) {
    DecodeRule rule;
    rule.type = type;
    rule.c_type = c_type;
    rule.element_size = sizeof(T);
    return rule;
}

[[noreturn]] void unsupported(const core::ColumnMetadata& column, const std::string& why) {
    throw ArrowError(ArrowError::Kind::UnsupportedType,
                     "Column '" + column.name + "': " + why, column.name);
}

} // anonymous namespace

TypeMapper::TypeMapper(const core::QueryConfig& config)
    : max_text_size_(config.max_text_size()),
      max_binary_size_(config.max_binary_size()) {
}

DecodeRule TypeMapper::decode_rule(const core::ColumnMetadata& column) const {
    switch (column.sql_type) {
        case SQL_BIT:
            return fixed<unsigned char>(LogicalType::Boolean, SQL_C_BIT);

        case SQL_TINYINT:
            return column.is_unsigned ? fixed<SQLSMALLINT>(LogicalType::Int16, SQL_C_SSHORT)
                                      : fixed<SQLSCHAR>(LogicalType::Int8, SQL_C_STINYINT);
        case SQL_SMALLINT:
            return column.is_unsigned ? fixed<SQLINTEGER>(LogicalType::Int32, SQL_C_SLONG)
                                      : fixed<SQLSMALLINT>(LogicalType::Int16, SQL_C_SSHORT);
        case SQL_INTEGER:
            return column.is_unsigned ? fixed<SQLBIGINT>(LogicalType::Int64, SQL_C_SBIGINT)
                                      : fixed<SQLINTEGER>(LogicalType::Int32, SQL_C_SLONG);
        case SQL_BIGINT:
            // No wider signed integer exists; unsigned BIGINT keeps its full range
            return column.is_unsigned ? fixed<SQLUBIGINT>(LogicalType::UInt64, SQL_C_UBIGINT)
                                      : fixed<SQLBIGINT>(LogicalType::Int64, SQL_C_SBIGINT);

        case SQL_REAL:
            return fixed<SQLREAL>(LogicalType::Float32, SQL_C_FLOAT);
        case SQL_FLOAT:
        case SQL_DOUBLE:
            return fixed<SQLDOUBLE>(LogicalType::Float64, SQL_C_DOUBLE);

        case SQL_DECIMAL:
        case SQL_NUMERIC: {
            auto precision = static_cast<int32_t>(column.column_size);
            int32_t scale = column.decimal_digits;
            if (precision <= 0 || precision > MAX_DECIMAL256_PRECISION) {
                unsupported(column, "decimal precision " + std::to_string(precision) +
                                    " is outside 1.." + std::to_string(MAX_DECIMAL256_PRECISION));
            }
            if (scale < 0 || scale > precision) {
                unsupported(column, "decimal scale " + std::to_string(scale) +
                                    " is outside 0.." + std::to_string(precision));
            }
            DecodeRule rule;
            rule.type = precision <= MAX_DECIMAL128_PRECISION ? LogicalType::Decimal128
                                                              : LogicalType::Decimal256;
            // Fetched as text: sign, leading zero, digits, decimal point, terminator
            rule.c_type = SQL_C_CHAR;
            rule.element_size = static_cast<size_t>(precision) + 4;
            rule.max_value_bytes = rule.element_size - 1;
            rule.precision = precision;
            rule.scale = scale;
            return rule;
        }

        case SQL_CHAR:
        case SQL_VARCHAR:
        case SQL_LONGVARCHAR:
        case SQL_WCHAR:
        case SQL_WVARCHAR:
        case SQL_WLONGVARCHAR:
        case SQL_GUID: {
            size_t declared = column.sql_type == SQL_GUID ? GUID_TEXT_LENGTH
                                                          : static_cast<size_t>(column.column_size);
            size_t bytes = max_text_size_;
            if (declared > 0 && declared <= max_text_size_ / UTF8_MAX_BYTES_PER_CHAR) {
                bytes = declared * UTF8_MAX_BYTES_PER_CHAR;
            }
            DecodeRule rule;
            rule.type = LogicalType::Utf8;
            rule.c_type = SQL_C_CHAR;
            rule.element_size = bytes + 1;
            rule.max_value_bytes = bytes;
            return rule;
        }

        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY: {
            size_t declared = static_cast<size_t>(column.column_size);
            size_t bytes = (declared > 0) ? std::min(declared, max_binary_size_) : max_binary_size_;
            DecodeRule rule;
            rule.type = LogicalType::Binary;
            rule.c_type = SQL_C_BINARY;
            rule.element_size = bytes;
            rule.max_value_bytes = bytes;
            return rule;
        }

        case SQL_TYPE_DATE:
        case SQL_DATE:
            return fixed<SQL_DATE_STRUCT>(LogicalType::Date32, SQL_C_TYPE_DATE);
        case SQL_TYPE_TIME:
        case SQL_TIME:
            return fixed<SQL_TIME_STRUCT>(LogicalType::Time32Second, SQL_C_TYPE_TIME);
        case SQL_TYPE_TIMESTAMP:
        case SQL_TIMESTAMP:
            return fixed<SQL_TIMESTAMP_STRUCT>(LogicalType::TimestampMicro, SQL_C_TYPE_TIMESTAMP);

        default:
            unsupported(column, "unsupported SQL type " + std::to_string(column.sql_type));
    }
}

std::vector<DecodeRule> TypeMapper::decode_rules(const std::vector<core::ColumnMetadata>& columns) const {
    std::vector<DecodeRule> rules;
    rules.reserve(columns.size());
    for (const auto& column : columns) {
        rules.push_back(decode_rule(column));
    }
    return rules;
}

SchemaDescriptor TypeMapper::derive_schema(const std::vector<core::ColumnMetadata>& columns) const {
    std::vector<ColumnDescriptor> descriptors;
    descriptors.reserve(columns.size());

    for (const auto& column : columns) {
        DecodeRule rule = decode_rule(column);

        ColumnDescriptor desc;
        desc.name = column.name;
        desc.type = rule.type;
        desc.nullable = column.allows_null();
        desc.declared_size = column.column_size;
        desc.precision = rule.precision;
        desc.scale = rule.scale;

        LOG_DEBUG("Column '" + desc.name + "' sql_type=" + std::to_string(column.sql_type) +
                  " -> " + logical_type_to_string(desc.type) +
                  " element_size=" + std::to_string(rule.element_size));
        descriptors.push_back(std::move(desc));
    }

    return SchemaDescriptor(std::move(descriptors));
}

} // namespace ibarrow::columnar
