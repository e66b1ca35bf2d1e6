#include <gtest/gtest.h>
#include "columnar/column_encoder.hpp"
#include "core/logger.hpp"
#include "fake_cursor.hpp"
#include <arrow/array.h>
#include <arrow/util/decimal.h>

using namespace ibarrow;
using namespace ibarrow::columnar;
using ibarrow::fakes::FakeCursor;
using ibarrow::fakes::FakeValue;
using ibarrow::fakes::make_column;

class ColumnEncoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::instance().set_console_enabled(false);
    }

    void TearDown() override {
        core::Logger::instance().set_console_enabled(true);
    }

    // Fetches every row of the cursor into one group and encodes it
    Batch encode_all(std::vector<core::ColumnMetadata> columns,
                     std::vector<std::vector<FakeValue>> rows,
                     const core::QueryConfig& config = core::QueryConfig()) {
        TypeMapper mapper(config);
        auto rules = mapper.decode_rules(columns);
        SchemaDescriptor schema = mapper.derive_schema(columns);

        size_t count = rows.size();
        FakeCursor cursor(columns, std::move(rows));
        RowGroup group(rules, count == 0 ? 1 : count);
        group.set_num_rows(cursor.fetch(group, 0, count));

        ColumnEncoder encoder(schema, rules);
        return encoder.encode(group);
    }

    static core::QueryConfig text_limit(uint32_t bytes) {
        core::QueryConfig::Options options;
        options.max_text_size = bytes;
        options.max_binary_size = bytes;
        return core::QueryConfig(options);
    }
};

TEST_F(ColumnEncoderTest, IntegersAndNulls) {
    Batch batch = encode_all(
        {make_column("id", SQL_INTEGER), make_column("v", SQL_BIGINT, 0, 0, SQL_NULLABLE)},
        {{int64_t{1}, int64_t{10}}, {int64_t{2}, std::monostate{}}, {int64_t{3}, int64_t{-30}}});

    ASSERT_EQ(batch.num_rows(), 3);
    auto ids = std::static_pointer_cast<arrow::Int32Array>(batch.record_batch->column(0));
    auto values = std::static_pointer_cast<arrow::Int64Array>(batch.record_batch->column(1));
    EXPECT_EQ(ids->Value(0), 1);
    EXPECT_EQ(ids->Value(2), 3);
    EXPECT_EQ(ids->null_count(), 0);
    EXPECT_EQ(values->Value(0), 10);
    EXPECT_TRUE(values->IsNull(1));
    EXPECT_EQ(values->Value(2), -30);
    EXPECT_TRUE(batch.warnings.empty());
}

TEST_F(ColumnEncoderTest, BooleanAndFloats) {
    Batch batch = encode_all(
        {make_column("b", SQL_BIT), make_column("r", SQL_REAL), make_column("d", SQL_DOUBLE)},
        {{int64_t{1}, 1.5, 2.25}, {int64_t{0}, -0.5, 1e300}});

    auto b = std::static_pointer_cast<arrow::BooleanArray>(batch.record_batch->column(0));
    auto r = std::static_pointer_cast<arrow::FloatArray>(batch.record_batch->column(1));
    auto d = std::static_pointer_cast<arrow::DoubleArray>(batch.record_batch->column(2));
    EXPECT_TRUE(b->Value(0));
    EXPECT_FALSE(b->Value(1));
    EXPECT_FLOAT_EQ(r->Value(0), 1.5f);
    EXPECT_DOUBLE_EQ(d->Value(1), 1e300);
}

TEST_F(ColumnEncoderTest, TextAtLimitIsNotTruncated) {
    Batch batch = encode_all({make_column("t", SQL_VARCHAR, 100)},
                             {{std::string("12345678")}}, text_limit(8));

    auto t = std::static_pointer_cast<arrow::StringArray>(batch.record_batch->column(0));
    EXPECT_EQ(t->GetString(0), "12345678");
    EXPECT_TRUE(batch.warnings.empty());
}

TEST_F(ColumnEncoderTest, TextOverLimitIsTruncatedAndFlagged) {
    Batch batch = encode_all({make_column("t", SQL_VARCHAR, 100, 0, SQL_NULLABLE)},
                             {{std::string("short")}, {std::string("123456789")}, {std::monostate{}}},
                             text_limit(8));

    auto t = std::static_pointer_cast<arrow::StringArray>(batch.record_batch->column(0));
    EXPECT_EQ(t->GetString(0), "short");
    EXPECT_EQ(t->GetString(1), "12345678");
    EXPECT_TRUE(t->IsNull(2));

    ASSERT_EQ(batch.warnings.size(), 1u);
    const ArrowError& warning = batch.warnings.front();
    EXPECT_EQ(warning.kind(), ArrowError::Kind::Truncated);
    EXPECT_EQ(warning.column().value_or(""), "t");
    EXPECT_EQ(warning.row().value_or(-1), 1);
}

TEST_F(ColumnEncoderTest, TruncationKeepsWholeUtf8Sequences) {
    // "abcdef" then a three-byte euro sign straddling the 8-byte limit
    std::string text = "abcdef\xE2\x82\xAC";
    Batch batch = encode_all({make_column("t", SQL_VARCHAR, 100)}, {{text}}, text_limit(8));

    auto t = std::static_pointer_cast<arrow::StringArray>(batch.record_batch->column(0));
    EXPECT_EQ(t->GetString(0), "abcdef");
    EXPECT_EQ(batch.warnings.size(), 1u);
    EXPECT_TRUE(t->ValidateFull().ok());
}

TEST_F(ColumnEncoderTest, InvalidUtf8TextIsDecodeError) {
    try {
        encode_all({make_column("name", SQL_VARCHAR, 20)},
                   {{std::string("fine")}, {std::string("ab\xff")}});
        FAIL() << "expected ArrowError";
    } catch (const ArrowError& e) {
        EXPECT_EQ(e.kind(), ArrowError::Kind::Decode);
        EXPECT_EQ(e.column().value_or(""), "name");
        EXPECT_EQ(e.row().value_or(-1), 1);
    }
}

TEST_F(ColumnEncoderTest, Latin1BytesInBinaryColumnAreKept) {
    Batch batch = encode_all({make_column("raw", SQL_VARBINARY, 20)}, {{std::string("ab\xff")}});

    auto b = std::static_pointer_cast<arrow::BinaryArray>(batch.record_batch->column(0));
    EXPECT_EQ(b->GetString(0), std::string("ab\xff"));
}

TEST_F(ColumnEncoderTest, BinaryTruncation) {
    Batch batch = encode_all({make_column("b", SQL_VARBINARY, 0)},
                             {{std::string("\x00\x01\x02\x03\x04\x05\x06\x07\x08", 9)}},
                             text_limit(8));

    auto b = std::static_pointer_cast<arrow::BinaryArray>(batch.record_batch->column(0));
    EXPECT_EQ(b->GetString(0).size(), 8u);
    ASSERT_EQ(batch.warnings.size(), 1u);
    EXPECT_EQ(batch.warnings.front().column().value_or(""), "b");
}

TEST_F(ColumnEncoderTest, DecimalsFromText) {
    Batch batch = encode_all({make_column("amount", SQL_DECIMAL, 10, 2, SQL_NULLABLE)},
                             {{std::string("123.45")}, {std::string("-0.5")}, {std::string("7")},
                              {std::monostate{}}});

    auto d = std::static_pointer_cast<arrow::Decimal128Array>(batch.record_batch->column(0));
    EXPECT_EQ(d->FormatValue(0), "123.45");
    EXPECT_EQ(d->FormatValue(1), "-0.50");
    EXPECT_EQ(d->FormatValue(2), "7.00");
    EXPECT_TRUE(d->IsNull(3));
}

TEST_F(ColumnEncoderTest, FractionOnlyDecimalKeepsLeadingZeroAndSign) {
    Batch batch = encode_all({make_column("ratio", SQL_DECIMAL, 5, 5)},
                             {{std::string("-0.12345")}, {std::string("0.12345")}});

    auto d = std::static_pointer_cast<arrow::Decimal128Array>(batch.record_batch->column(0));
    EXPECT_EQ(d->FormatValue(0), "-0.12345");
    EXPECT_EQ(d->FormatValue(1), "0.12345");
    EXPECT_TRUE(batch.warnings.empty());
}

TEST_F(ColumnEncoderTest, WideDecimal) {
    std::string digits(50, '9');
    Batch batch = encode_all({make_column("big", SQL_NUMERIC, 60, 0)}, {{digits}});

    auto d = std::static_pointer_cast<arrow::Decimal256Array>(batch.record_batch->column(0));
    EXPECT_EQ(d->FormatValue(0), digits);
}

TEST_F(ColumnEncoderTest, MalformedDecimalIsDecodeError) {
    try {
        encode_all({make_column("amount", SQL_DECIMAL, 10, 2)},
                   {{std::string("1.00")}, {std::string("12abc")}});
        FAIL() << "expected ArrowError";
    } catch (const ArrowError& e) {
        EXPECT_EQ(e.kind(), ArrowError::Kind::Decode);
        EXPECT_EQ(e.column().value_or(""), "amount");
        EXPECT_EQ(e.row().value_or(-1), 1);
    }
}

TEST_F(ColumnEncoderTest, DatesTimesTimestamps) {
    SQL_DATE_STRUCT date{2024, 2, 29};
    SQL_TIME_STRUCT time{13, 45, 30};
    SQL_TIMESTAMP_STRUCT ts{1970, 1, 2, 0, 0, 1, 500000000};

    Batch batch = encode_all({make_column("d", SQL_TYPE_DATE), make_column("t", SQL_TYPE_TIME),
                              make_column("ts", SQL_TYPE_TIMESTAMP)},
                             {{date, time, ts}});

    auto d = std::static_pointer_cast<arrow::Date32Array>(batch.record_batch->column(0));
    auto t = std::static_pointer_cast<arrow::Time32Array>(batch.record_batch->column(1));
    auto s = std::static_pointer_cast<arrow::TimestampArray>(batch.record_batch->column(2));
    EXPECT_EQ(d->Value(0), 19782);
    EXPECT_EQ(t->Value(0), 13 * 3600 + 45 * 60 + 30);
    EXPECT_EQ(s->Value(0), 86401500000LL);
}

TEST_F(ColumnEncoderTest, EveryBatchSharesTheSchema) {
    std::vector<core::ColumnMetadata> columns = {make_column("a", SQL_INTEGER)};
    TypeMapper mapper{core::QueryConfig()};
    auto rules = mapper.decode_rules(columns);
    ColumnEncoder encoder(mapper.derive_schema(columns), rules);

    RowGroup group(rules, 2);
    group.column(0).set<SQLINTEGER>(0, 1);
    group.set_num_rows(1);

    Batch first = encoder.encode(group, 0);
    Batch second = encoder.encode(group, 1);
    Batch empty = encoder.empty_batch();
    EXPECT_EQ(first.record_batch->schema(), second.record_batch->schema());
    EXPECT_TRUE(empty.record_batch->schema()->Equals(*first.record_batch->schema()));
    EXPECT_EQ(empty.num_rows(), 0);
    EXPECT_EQ(second.sequence, 1);
}

TEST(Utf8PrefixTest, CompleteAndPartialSequences) {
    const auto prefix = [](const std::string& s) {
        return utf8_complete_prefix(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    };
    EXPECT_EQ(prefix(""), 0u);
    EXPECT_EQ(prefix("abc"), 3u);
    EXPECT_EQ(prefix("ab\xC3\xA9"), 4u);        // complete two-byte sequence
    EXPECT_EQ(prefix("ab\xC3"), 2u);            // lead byte only
    EXPECT_EQ(prefix("a\xE2\x82"), 1u);         // two of three bytes
    EXPECT_EQ(prefix("\xF0\x9F\x98\x80"), 4u);  // complete four-byte sequence
    EXPECT_EQ(prefix("x\xF0\x9F\x98"), 1u);
}

TEST(DaysFromCivilTest, KnownDates) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(days_from_civil(1969, 12, 31), -1);
    EXPECT_EQ(days_from_civil(2000, 3, 1), 11017);
    EXPECT_EQ(days_from_civil(2024, 2, 29), 19782);
    EXPECT_EQ(days_from_civil(1900, 1, 1), -25567);
}
