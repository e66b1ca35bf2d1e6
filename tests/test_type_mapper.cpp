#include <gtest/gtest.h>
#include "columnar/type_mapper.hpp"
#include "core/logger.hpp"
#include "errors.hpp"
#include "fake_cursor.hpp"
#include <arrow/type.h>

using namespace ibarrow;
using namespace ibarrow::columnar;
using ibarrow::fakes::make_column;

class TypeMapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::instance().set_console_enabled(false);
    }

    void TearDown() override {
        core::Logger::instance().set_console_enabled(true);
    }

    static core::QueryConfig small_limits() {
        core::QueryConfig::Options options;
        options.max_text_size = 8;
        options.max_binary_size = 16;
        return core::QueryConfig(options);
    }

    TypeMapper mapper{core::QueryConfig()};
};

TEST_F(TypeMapperTest, IntegersUseSmallestSignedWidth) {
    EXPECT_EQ(mapper.decode_rule(make_column("a", SQL_TINYINT)).type, LogicalType::Int8);
    EXPECT_EQ(mapper.decode_rule(make_column("a", SQL_SMALLINT)).type, LogicalType::Int16);
    EXPECT_EQ(mapper.decode_rule(make_column("a", SQL_INTEGER)).type, LogicalType::Int32);
    EXPECT_EQ(mapper.decode_rule(make_column("a", SQL_BIGINT)).type, LogicalType::Int64);

    auto rule = mapper.decode_rule(make_column("a", SQL_INTEGER));
    EXPECT_EQ(rule.c_type, SQL_C_SLONG);
    EXPECT_EQ(rule.element_size, sizeof(SQLINTEGER));
}

TEST_F(TypeMapperTest, UnsignedMovesOneWidthUp) {
    auto unsigned_col = [](SQLSMALLINT type) {
        return make_column("u", type, 0, 0, SQL_NO_NULLS, true);
    };
    EXPECT_EQ(mapper.decode_rule(unsigned_col(SQL_TINYINT)).type, LogicalType::Int16);
    EXPECT_EQ(mapper.decode_rule(unsigned_col(SQL_SMALLINT)).type, LogicalType::Int32);
    EXPECT_EQ(mapper.decode_rule(unsigned_col(SQL_INTEGER)).type, LogicalType::Int64);
    EXPECT_EQ(mapper.decode_rule(unsigned_col(SQL_BIGINT)).type, LogicalType::UInt64);
}

TEST_F(TypeMapperTest, FloatingPointAndBit) {
    EXPECT_EQ(mapper.decode_rule(make_column("f", SQL_REAL)).type, LogicalType::Float32);
    EXPECT_EQ(mapper.decode_rule(make_column("f", SQL_FLOAT)).type, LogicalType::Float64);
    EXPECT_EQ(mapper.decode_rule(make_column("f", SQL_DOUBLE)).type, LogicalType::Float64);
    EXPECT_EQ(mapper.decode_rule(make_column("b", SQL_BIT)).type, LogicalType::Boolean);
}

TEST_F(TypeMapperTest, DecimalKeepsPrecisionAndScale) {
    auto small = mapper.decode_rule(make_column("d", SQL_DECIMAL, 18, 4));
    EXPECT_EQ(small.type, LogicalType::Decimal128);
    EXPECT_EQ(small.precision, 18);
    EXPECT_EQ(small.scale, 4);
    EXPECT_EQ(small.c_type, SQL_C_CHAR);
    // "-0." ahead of the digits plus the terminator
    EXPECT_EQ(small.max_value_bytes, 21u);
    EXPECT_EQ(small.element_size, 22u);

    auto wide = mapper.decode_rule(make_column("d", SQL_NUMERIC, 60, 10));
    EXPECT_EQ(wide.type, LogicalType::Decimal256);

    EXPECT_THROW(mapper.decode_rule(make_column("d", SQL_NUMERIC, 0, 0)), ArrowError);
    EXPECT_THROW(mapper.decode_rule(make_column("d", SQL_NUMERIC, 77, 0)), ArrowError);
    EXPECT_THROW(mapper.decode_rule(make_column("d", SQL_NUMERIC, 5, 6)), ArrowError);
}

TEST_F(TypeMapperTest, TextBufferWidth) {
    TypeMapper limited(small_limits());

    // Two characters may need eight UTF-8 bytes
    auto fits = limited.decode_rule(make_column("t", SQL_VARCHAR, 2));
    EXPECT_EQ(fits.max_value_bytes, 8u);
    EXPECT_EQ(fits.element_size, 9u);

    auto capped = limited.decode_rule(make_column("t", SQL_VARCHAR, 100));
    EXPECT_EQ(capped.max_value_bytes, 8u);

    auto unknown = limited.decode_rule(make_column("t", SQL_LONGVARCHAR, 0));
    EXPECT_EQ(unknown.max_value_bytes, 8u);

    auto guid = mapper.decode_rule(make_column("g", SQL_GUID));
    EXPECT_EQ(guid.type, LogicalType::Utf8);
    EXPECT_EQ(guid.max_value_bytes, 36u * 4);
}

TEST_F(TypeMapperTest, BinaryBufferWidth) {
    TypeMapper limited(small_limits());
    EXPECT_EQ(limited.decode_rule(make_column("b", SQL_VARBINARY, 4)).element_size, 4u);
    EXPECT_EQ(limited.decode_rule(make_column("b", SQL_VARBINARY, 400)).element_size, 16u);
    EXPECT_EQ(limited.decode_rule(make_column("b", SQL_LONGVARBINARY, 0)).element_size, 16u);
}

TEST_F(TypeMapperTest, TemporalTypes) {
    EXPECT_EQ(mapper.decode_rule(make_column("d", SQL_TYPE_DATE)).type, LogicalType::Date32);
    EXPECT_EQ(mapper.decode_rule(make_column("t", SQL_TYPE_TIME)).type, LogicalType::Time32Second);
    EXPECT_EQ(mapper.decode_rule(make_column("ts", SQL_TYPE_TIMESTAMP)).type,
              LogicalType::TimestampMicro);
}

TEST_F(TypeMapperTest, UnsupportedTypeNamesColumn) {
    try {
        mapper.derive_schema({make_column("ok", SQL_INTEGER),
                              make_column("interval_col", SQL_INTERVAL_DAY)});
        FAIL() << "expected ArrowError";
    } catch (const ArrowError& e) {
        EXPECT_EQ(e.kind(), ArrowError::Kind::UnsupportedType);
        ASSERT_TRUE(e.column().has_value());
        EXPECT_EQ(*e.column(), "interval_col");
        EXPECT_NE(std::string(e.what()).find("interval_col"), std::string::npos);
    }
}

TEST_F(TypeMapperTest, SchemaCopiesNullability) {
    auto schema = mapper.derive_schema({
        make_column("col1", SQL_INTEGER, 10, 0, SQL_NO_NULLS),
        make_column("col2", SQL_VARCHAR, 20, 0, SQL_NULLABLE),
        make_column("col3", SQL_DOUBLE, 15, 0, SQL_NULLABLE_UNKNOWN)
    });

    ASSERT_EQ(schema.size(), 3u);
    EXPECT_FALSE(schema[0].nullable);
    EXPECT_TRUE(schema[1].nullable);
    EXPECT_TRUE(schema[2].nullable);
    EXPECT_EQ(schema[1].declared_size, 20u);

    const auto& arrow_schema = schema.arrow_schema();
    ASSERT_EQ(arrow_schema->num_fields(), 3);
    EXPECT_EQ(arrow_schema->field(0)->name(), "col1");
    EXPECT_TRUE(arrow_schema->field(0)->type()->Equals(arrow::int32()));
    EXPECT_FALSE(arrow_schema->field(0)->nullable());
    EXPECT_TRUE(arrow_schema->field(1)->type()->Equals(arrow::utf8()));
}

TEST_F(TypeMapperTest, SchemaIsDeterministic) {
    std::vector<core::ColumnMetadata> columns = {
        make_column("a", SQL_BIGINT), make_column("b", SQL_DECIMAL, 10, 2, SQL_NULLABLE)
    };
    EXPECT_EQ(mapper.derive_schema(columns), mapper.derive_schema(columns));
    EXPECT_EQ(mapper.derive_schema(columns).to_string(),
              "[(a, int64, not null), (b, decimal128(10,2), nullable)]");
}
