#include "column_encoder.hpp"
#include "core/error_translator.hpp"
#include "core/logger.hpp"

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/util/decimal.h>
#include <arrow/util/utf8.h>

#include <limits>
#include <mutex>
#include <string>
#include <string_view>

namespace ibarrow::columnar {

using core::check_arrow;

namespace {

constexpr int64_t MICROS_PER_SECOND = 1000000;
constexpr int64_t SECONDS_PER_DAY = 86400;

// 32-bit offsets: the last offset must stay representable
constexpr int64_t MAX_VALUE_DATA_BYTES = std::numeric_limits<int32_t>::max() - 1;

struct TruncationTally {
    int64_t count = 0;
    int64_t first_row = -1;
};

template <typename ArrowType, typename CType>
std::shared_ptr<arrow::Array> encode_fixed(const ColumnBuffer& buffer, size_t rows,
                                           const std::shared_ptr<arrow::DataType>& type,
                                           arrow::MemoryPool* pool, const std::string& name) {
    arrow::NumericBuilder<ArrowType> builder(type, pool);
    check_arrow(builder.Reserve(static_cast<int64_t>(rows)), "reserve column '" + name + "'");

    for (size_t row = 0; row < rows; ++row) {
        if (buffer.is_null(row)) {
            builder.UnsafeAppendNull();
        } else {
            builder.UnsafeAppend(
                static_cast<typename ArrowType::c_type>(buffer.get<CType>(row)));
        }
    }
    return check_arrow(builder.Finish(), "finish column '" + name + "'");
}

template <typename ArrowType, typename Convert>
std::shared_ptr<arrow::Array> encode_converted(const ColumnBuffer& buffer, size_t rows,
                                               const std::shared_ptr<arrow::DataType>& type,
                                               arrow::MemoryPool* pool, const std::string& name,
                                               Convert&& convert) {
    arrow::NumericBuilder<ArrowType> builder(type, pool);
    check_arrow(builder.Reserve(static_cast<int64_t>(rows)), "reserve column '" + name + "'");

    for (size_t row = 0; row < rows; ++row) {
        if (buffer.is_null(row)) {
            builder.UnsafeAppendNull();
        } else {
            builder.UnsafeAppend(convert(row));
        }
    }
    return check_arrow(builder.Finish(), "finish column '" + name + "'");
}

// Payload length of a variable-length value and whether it was cut
size_t payload_length(const ColumnBuffer& buffer, size_t row, bool& truncated,
                      const std::string& name, int64_t absolute_row) {
    SQLLEN ind = buffer.indicator(row);
    size_t limit = buffer.max_value_bytes();

    if (ind == SQL_NO_TOTAL) {
        truncated = true;
        return limit;
    }
    if (ind < 0) {
        throw ArrowError(ArrowError::Kind::Decode,
                         "Column '" + name + "': invalid length indicator " + std::to_string(ind) +
                         " at row " + std::to_string(absolute_row),
                         name, absolute_row);
    }
    if (static_cast<size_t>(ind) > limit) {
        truncated = true;
        return limit;
    }
    truncated = false;
    return static_cast<size_t>(ind);
}

template <typename BuilderType>
std::shared_ptr<arrow::Array> encode_variable(const ColumnBuffer& buffer, const RowGroup& group,
                                              bool utf8, arrow::MemoryPool* pool,
                                              const std::string& name, TruncationTally& tally) {
    size_t rows = group.num_rows();
    BuilderType builder(pool);
    check_arrow(builder.Reserve(static_cast<int64_t>(rows)), "reserve column '" + name + "'");

    for (size_t row = 0; row < rows; ++row) {
        if (buffer.is_null(row)) {
            check_arrow(builder.AppendNull(), "append null to '" + name + "'");
            continue;
        }

        int64_t absolute_row = group.first_row() + static_cast<int64_t>(row);
        bool truncated = false;
        size_t len = payload_length(buffer, row, truncated, name, absolute_row);
        const uint8_t* data = buffer.value_ptr(row);

        if (truncated) {
            if (utf8) {
                len = utf8_complete_prefix(data, len);
            }
            if (tally.count++ == 0) {
                tally.first_row = absolute_row;
            }
        }
        if (utf8 && !arrow::util::ValidateUTF8(data, static_cast<int64_t>(len))) {
            throw ArrowError(ArrowError::Kind::Decode,
                             "Column '" + name + "' row " + std::to_string(absolute_row) +
                             ": text is not valid UTF-8",
                             name, absolute_row);
        }
        if (builder.value_data_length() + static_cast<int64_t>(len) > MAX_VALUE_DATA_BYTES) {
            throw ArrowError(ArrowError::Kind::BufferLimit,
                             "Column '" + name + "' row " + std::to_string(absolute_row) +
                             ": batch holds more than " + std::to_string(MAX_VALUE_DATA_BYTES) +
                             " bytes of values; lower batch_size or max_text_size",
                             name, absolute_row);
        }
        check_arrow(builder.Append(data, static_cast<int32_t>(len)),
                    "append value to '" + name + "'");
    }
    return check_arrow(builder.Finish(), "finish column '" + name + "'");
}

template <typename DecimalType, typename BuilderType>
std::shared_ptr<arrow::Array> encode_decimal(const ColumnBuffer& buffer, const RowGroup& group,
                                             const ColumnDescriptor& column,
                                             const std::shared_ptr<arrow::DataType>& type,
                                             arrow::MemoryPool* pool) {
    size_t rows = group.num_rows();
    BuilderType builder(type, pool);
    check_arrow(builder.Reserve(static_cast<int64_t>(rows)), "reserve column '" + column.name + "'");

    for (size_t row = 0; row < rows; ++row) {
        if (buffer.is_null(row)) {
            check_arrow(builder.AppendNull(), "append null to '" + column.name + "'");
            continue;
        }

        int64_t absolute_row = group.first_row() + static_cast<int64_t>(row);
        bool truncated = false;
        size_t len = payload_length(buffer, row, truncated, column.name, absolute_row);
        std::string_view text(reinterpret_cast<const char*>(buffer.value_ptr(row)), len);
        while (!text.empty() && text.back() == ' ') text.remove_suffix(1);
        while (!text.empty() && text.front() == ' ') text.remove_prefix(1);

        auto fail = [&](const std::string& why) {
            return ArrowError(ArrowError::Kind::Decode,
                              "Column '" + column.name + "' row " + std::to_string(absolute_row) +
                              ": cannot decode decimal '" + std::string(text) + "': " + why,
                              column.name, absolute_row);
        };

        if (truncated) {
            throw fail("value wider than declared precision");
        }

        DecimalType value;
        int32_t parsed_precision = 0;
        int32_t parsed_scale = 0;
        arrow::Status st = DecimalType::FromString(text, &value, &parsed_precision, &parsed_scale);
        if (!st.ok()) {
            throw fail(st.ToString());
        }
        if (parsed_scale != column.scale) {
            auto rescaled = value.Rescale(parsed_scale, column.scale);
            if (!rescaled.ok()) {
                throw fail(rescaled.status().ToString());
            }
            value = *rescaled;
        }
        if (!value.FitsInPrecision(column.precision)) {
            throw fail("exceeds precision " + std::to_string(column.precision));
        }
        check_arrow(builder.Append(value), "append value to '" + column.name + "'");
    }
    return check_arrow(builder.Finish(), "finish column '" + column.name + "'");
}

} // anonymous namespace

size_t utf8_complete_prefix(const uint8_t* data, size_t len) noexcept {
    if (len == 0) {
        return 0;
    }

    // Walk back over at most three continuation bytes to the last lead byte
    size_t lead = len;
    size_t steps = 0;
    while (lead > 0 && steps < 4) {
        --lead;
        ++steps;
        if ((data[lead] & 0xC0) != 0x80) {
            break;
        }
    }

    uint8_t b = data[lead];
    size_t needed = 1;
    if ((b & 0x80) == 0x00) {
        needed = 1;
    } else if ((b & 0xE0) == 0xC0) {
        needed = 2;
    } else if ((b & 0xF0) == 0xE0) {
        needed = 3;
    } else if ((b & 0xF8) == 0xF0) {
        needed = 4;
    } else {
        // Not a lead byte: malformed input, leave it to the consumer
        return len;
    }

    return (len - lead >= needed) ? len : lead;
}

int32_t days_from_civil(int32_t year, uint32_t month, uint32_t day) noexcept {
    // Howard Hinnant's algorithm
    year -= month <= 2 ? 1 : 0;
    const int32_t era = (year >= 0 ? year : year - 399) / 400;
    const uint32_t yoe = static_cast<uint32_t>(year - era * 400);
    const uint32_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int32_t>(doe) - 719468;
}

ColumnEncoder::ColumnEncoder(SchemaDescriptor schema, std::vector<DecodeRule> rules,
                             arrow::MemoryPool* pool)
    : schema_(std::move(schema)), rules_(std::move(rules)), pool_(pool),
      truncation_logged_(schema_.size(), false) {
    static std::once_flag utf8_tables;
    std::call_once(utf8_tables, [] { arrow::util::InitializeUTF8(); });
}

Batch ColumnEncoder::encode(const RowGroup& group, int64_t sequence) {
    Batch batch;
    batch.sequence = sequence;

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.reserve(schema_.size());
    for (size_t i = 0; i < schema_.size(); ++i) {
        arrays.push_back(encode_column(i, group.column(i), group, batch.warnings));
    }

    batch.record_batch = arrow::RecordBatch::Make(schema_.arrow_schema(),
                                                  static_cast<int64_t>(group.num_rows()),
                                                  std::move(arrays));
    LOG_TRACE("Encoded batch " + std::to_string(sequence) + " with " +
              std::to_string(group.num_rows()) + " rows");
    return batch;
}

Batch ColumnEncoder::empty_batch() const {
    Batch batch;
    batch.record_batch = check_arrow(
        arrow::RecordBatch::MakeEmpty(schema_.arrow_schema(), pool_), "empty batch");
    return batch;
}

std::shared_ptr<arrow::Array> ColumnEncoder::encode_column(size_t index, const ColumnBuffer& buffer,
                                                           const RowGroup& group,
                                                           std::vector<ArrowError>& warnings) {
    const ColumnDescriptor& column = schema_[index];
    const auto& type = schema_.arrow_schema()->field(static_cast<int>(index))->type();
    const size_t rows = group.num_rows();
    TruncationTally tally;
    std::shared_ptr<arrow::Array> array;

    switch (column.type) {
        case LogicalType::Boolean: {
            arrow::BooleanBuilder builder(pool_);
            check_arrow(builder.Reserve(static_cast<int64_t>(rows)), "reserve column '" + column.name + "'");
            for (size_t row = 0; row < rows; ++row) {
                if (buffer.is_null(row)) {
                    builder.UnsafeAppendNull();
                } else {
                    builder.UnsafeAppend(buffer.get<unsigned char>(row) != 0);
                }
            }
            array = check_arrow(builder.Finish(), "finish column '" + column.name + "'");
            break;
        }
        case LogicalType::Int8:
            array = encode_fixed<arrow::Int8Type, SQLSCHAR>(buffer, rows, type, pool_, column.name);
            break;
        case LogicalType::Int16:
            array = encode_fixed<arrow::Int16Type, SQLSMALLINT>(buffer, rows, type, pool_, column.name);
            break;
        case LogicalType::Int32:
            array = encode_fixed<arrow::Int32Type, SQLINTEGER>(buffer, rows, type, pool_, column.name);
            break;
        case LogicalType::Int64:
            array = encode_fixed<arrow::Int64Type, SQLBIGINT>(buffer, rows, type, pool_, column.name);
            break;
        case LogicalType::UInt64:
            array = encode_fixed<arrow::UInt64Type, SQLUBIGINT>(buffer, rows, type, pool_, column.name);
            break;
        case LogicalType::Float32:
            array = encode_fixed<arrow::FloatType, SQLREAL>(buffer, rows, type, pool_, column.name);
            break;
        case LogicalType::Float64:
            array = encode_fixed<arrow::DoubleType, SQLDOUBLE>(buffer, rows, type, pool_, column.name);
            break;

        case LogicalType::Decimal128:
            array = encode_decimal<arrow::Decimal128, arrow::Decimal128Builder>(
                buffer, group, column, type, pool_);
            break;
        case LogicalType::Decimal256:
            array = encode_decimal<arrow::Decimal256, arrow::Decimal256Builder>(
                buffer, group, column, type, pool_);
            break;

        case LogicalType::Utf8:
            array = encode_variable<arrow::StringBuilder>(buffer, group, true, pool_, column.name, tally);
            break;
        case LogicalType::Binary:
            array = encode_variable<arrow::BinaryBuilder>(buffer, group, false, pool_, column.name, tally);
            break;

        case LogicalType::Date32:
            array = encode_converted<arrow::Date32Type>(buffer, rows, type, pool_, column.name,
                [&](size_t row) {
                    auto d = buffer.get<SQL_DATE_STRUCT>(row);
                    return days_from_civil(d.year, d.month, d.day);
                });
            break;
        case LogicalType::Time32Second:
            array = encode_converted<arrow::Time32Type>(buffer, rows, type, pool_, column.name,
                [&](size_t row) {
                    auto t = buffer.get<SQL_TIME_STRUCT>(row);
                    return static_cast<int32_t>(t.hour * 3600 + t.minute * 60 + t.second);
                });
            break;
        case LogicalType::TimestampMicro:
            array = encode_converted<arrow::TimestampType>(buffer, rows, type, pool_, column.name,
                [&](size_t row) {
                    auto ts = buffer.get<SQL_TIMESTAMP_STRUCT>(row);
                    int64_t days = days_from_civil(ts.year, ts.month, ts.day);
                    int64_t seconds = days * SECONDS_PER_DAY + ts.hour * 3600 +
                                      ts.minute * 60 + ts.second;
                    // fraction is in nanoseconds
                    return seconds * MICROS_PER_SECOND + static_cast<int64_t>(ts.fraction / 1000);
                });
            break;
    }

    if (tally.count > 0) {
        std::string message = "Column '" + column.name + "': " + std::to_string(tally.count) +
                              " value(s) longer than " + std::to_string(buffer.max_value_bytes()) +
                              " bytes truncated (first at row " + std::to_string(tally.first_row) + ")";
        if (!truncation_logged_[index]) {
            truncation_logged_[index] = true;
            LOG_WARN(message);
        }
        warnings.emplace_back(ArrowError::Kind::Truncated, message, column.name, tally.first_row);
    }

    return array;
}

} // namespace ibarrow::columnar
