#include <gtest/gtest.h>
#include "pipeline/pipeline.hpp"
#include "columnar/type_mapper.hpp"
#include "core/logger.hpp"
#include "fake_cursor.hpp"
#include <arrow/array.h>
#include <thread>

using namespace ibarrow;
using namespace ibarrow::pipeline;
using ibarrow::fakes::FakeCursor;
using ibarrow::fakes::FakeValue;
using ibarrow::fakes::make_column;

namespace {

core::QueryConfig make_config(uint32_t batch_size, uint32_t queue_depth,
                              uint32_t query_timeout = 60) {
    core::QueryConfig::Options options;
    options.batch_size = batch_size;
    options.queue_depth = queue_depth;
    options.query_timeout = query_timeout;
    return core::QueryConfig(options);
}

} // anonymous namespace

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::instance().set_console_enabled(false);
    }

    void TearDown() override {
        core::Logger::instance().set_console_enabled(true);
    }

    std::unique_ptr<Pipeline> make_pipeline(FakeCursor& cursor, const core::QueryConfig& config) {
        columnar::TypeMapper mapper(config);
        auto columns = cursor.describe();
        return std::make_unique<Pipeline>(cursor, mapper.derive_schema(columns),
                                          mapper.decode_rules(columns), config);
    }
};

TEST_F(PipelineTest, FiveRowsInBatchesOfTwo) {
    std::vector<std::vector<FakeValue>> rows;
    for (int64_t i = 1; i <= 5; ++i) {
        rows.push_back({i, i * 10});
    }
    FakeCursor cursor({make_column("id", SQL_INTEGER), make_column("v", SQL_INTEGER)},
                      std::move(rows));
    auto config = make_config(2, 2);
    auto pipeline = make_pipeline(cursor, config);

    std::vector<columnar::Batch> batches;
    PipelineStats stats = pipeline->run([&](columnar::Batch&& b) { batches.push_back(std::move(b)); });

    ASSERT_EQ(batches.size(), 3u);
    EXPECT_EQ(batches[0].num_rows(), 2);
    EXPECT_EQ(batches[1].num_rows(), 2);
    EXPECT_EQ(batches[2].num_rows(), 1);
    EXPECT_EQ(stats.batches, 3);
    EXPECT_EQ(stats.rows, 5);

    // Same schema instance everywhere, rows in fetch order
    int32_t expected = 1;
    for (size_t i = 0; i < batches.size(); ++i) {
        EXPECT_EQ(batches[i].sequence, static_cast<int64_t>(i));
        EXPECT_EQ(batches[i].record_batch->schema(), pipeline->schema().arrow_schema());
        auto ids = std::static_pointer_cast<arrow::Int32Array>(batches[i].record_batch->column(0));
        auto vs = std::static_pointer_cast<arrow::Int32Array>(batches[i].record_batch->column(1));
        for (int64_t r = 0; r < ids->length(); ++r) {
            EXPECT_EQ(ids->Value(r), expected);
            EXPECT_EQ(vs->Value(r), expected * 10);
            ++expected;
        }
    }
    EXPECT_EQ(expected, 6);
}

TEST_F(PipelineTest, EmptyResultProducesNoBatches) {
    FakeCursor cursor({make_column("id", SQL_INTEGER)}, std::vector<std::vector<FakeValue>>{});
    auto pipeline = make_pipeline(cursor, make_config(16, 2));

    size_t calls = 0;
    PipelineStats stats = pipeline->run([&](columnar::Batch&&) { ++calls; });
    EXPECT_EQ(calls, 0u);
    EXPECT_EQ(stats.rows, 0);
    EXPECT_EQ(stats.batches, 0);
}

TEST_F(PipelineTest, MemoryStaysBoundedBySlowConsumer) {
    const size_t total = 100000;
    FakeCursor cursor({make_column("id", SQL_BIGINT), make_column("name", SQL_VARCHAR, 16)},
                      total, [](size_t row, size_t column) -> FakeValue {
                          if (column == 0) return static_cast<int64_t>(row);
                          return std::string("row-") + std::to_string(row % 1000);
                      });
    auto pipeline = make_pipeline(cursor, make_config(1000, 1));

    int64_t rows = 0;
    int64_t next_id = 0;
    PipelineStats stats = pipeline->run([&](columnar::Batch&& b) {
        auto ids = std::static_pointer_cast<arrow::Int64Array>(b.record_batch->column(0));
        EXPECT_EQ(ids->Value(0), next_id);
        next_id += b.num_rows();
        rows += b.num_rows();
        if (b.sequence % 10 == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    });

    EXPECT_EQ(rows, static_cast<int64_t>(total));
    EXPECT_EQ(stats.batches, 100);
    EXPECT_LE(stats.row_groups_allocated, 2u);
    EXPECT_LE(stats.peak_in_flight, 2u);
    EXPECT_GT(stats.row_group_bytes, 0u);
}

TEST_F(PipelineTest, FetchFailureIsRethrownAfterDeliveredBatches) {
    FakeCursor cursor({make_column("id", SQL_INTEGER)}, 50,
                      [](size_t row, size_t) -> FakeValue { return static_cast<int64_t>(row); });
    cursor.fail_at_row(25);
    auto pipeline = make_pipeline(cursor, make_config(10, 2));

    int64_t delivered = 0;
    try {
        pipeline->run([&](columnar::Batch&& b) { delivered += b.num_rows(); });
        FAIL() << "expected SqlError";
    } catch (const SqlError& e) {
        EXPECT_NE(std::string(e.what()).find("simulated fetch failure"), std::string::npos);
    }
    // Groups fetched but not yet encoded are discarded on failure
    EXPECT_LE(delivered, 20);
    EXPECT_EQ(delivered % 10, 0);
}

TEST_F(PipelineTest, EncodeFailureStopsFetching) {
    FakeCursor cursor({make_column("amount", SQL_DECIMAL, 10, 2)}, 10000,
                      [](size_t row, size_t) -> FakeValue {
                          return row == 5 ? std::string("oops") : std::string("1.00");
                      });
    auto pipeline = make_pipeline(cursor, make_config(4, 1));

    EXPECT_THROW(pipeline->run([](columnar::Batch&&) {}), ArrowError);
    EXPECT_LT(cursor.rows_produced(), 10000u);
}

TEST_F(PipelineTest, SinkFailurePropagates) {
    FakeCursor cursor({make_column("id", SQL_INTEGER)}, 1000,
                      [](size_t row, size_t) -> FakeValue { return static_cast<int64_t>(row); });
    auto pipeline = make_pipeline(cursor, make_config(10, 2));

    EXPECT_THROW(pipeline->run([](columnar::Batch&& b) {
        if (b.sequence == 3) throw std::runtime_error("consumer gone");
    }), std::runtime_error);
    EXPECT_TRUE(cursor.cancelled());
}

TEST_F(PipelineTest, CancelFromAnotherThread) {
    FakeCursor cursor({make_column("id", SQL_INTEGER)}, 1000000,
                      [](size_t row, size_t) -> FakeValue { return static_cast<int64_t>(row); });
    cursor.set_rows_per_fetch(10);
    cursor.set_fetch_delay(std::chrono::milliseconds(1));
    auto pipeline = make_pipeline(cursor, make_config(100, 2));

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        pipeline->cancel();
    });

    try {
        pipeline->run([](columnar::Batch&&) {});
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.kind(), ConnectionError::Kind::Transport);
    }
    canceller.join();

    EXPECT_TRUE(pipeline->cancelled());
    EXPECT_TRUE(cursor.cancelled());
    EXPECT_LT(cursor.rows_produced(), 1000000u);
}

TEST_F(PipelineTest, TimeoutSurfacesAsQueryError) {
    FakeCursor cursor({make_column("id", SQL_INTEGER)}, 1000000,
                      [](size_t row, size_t) -> FakeValue { return static_cast<int64_t>(row); });
    cursor.set_rows_per_fetch(1);
    cursor.set_fetch_delay(std::chrono::milliseconds(5));
    auto pipeline = make_pipeline(cursor, make_config(100, 2, 1));

    EXPECT_THROW(pipeline->run([](columnar::Batch&&) {}), QueryError);
}

TEST_F(PipelineTest, OversizedRowGroupIsRejectedBeforeFetching) {
    // Undeclared length: every row reserves max_text_size bytes
    FakeCursor cursor({make_column("id", SQL_INTEGER), make_column("notes", SQL_LONGVARCHAR, 0)},
                      10, [](size_t row, size_t) -> FakeValue { return static_cast<int64_t>(row); });
    core::QueryConfig config;   // 65536 rows x 65537 bytes is over 512 MiB

    try {
        make_pipeline(cursor, config);
        FAIL() << "expected ArrowError";
    } catch (const ArrowError& e) {
        EXPECT_EQ(e.kind(), ArrowError::Kind::BufferLimit);
        EXPECT_EQ(e.column().value_or(""), "notes");
        EXPECT_NE(std::string(e.what()).find("max_bytes_per_batch"), std::string::npos);
    }
    EXPECT_EQ(cursor.rows_produced(), 0u);
}

TEST_F(PipelineTest, SmallerBatchFitsUnderTheLimit) {
    FakeCursor cursor({make_column("notes", SQL_LONGVARCHAR, 0)}, 3,
                      [](size_t row, size_t) -> FakeValue { return "n" + std::to_string(row); });
    core::QueryConfig::Options options;
    options.batch_size = 1024;
    options.max_bytes_per_batch = 1024 * (65537 + sizeof(SQLLEN));
    auto pipeline = make_pipeline(cursor, core::QueryConfig(options));

    int64_t rows = 0;
    pipeline->run([&](columnar::Batch&& b) { rows += b.num_rows(); });
    EXPECT_EQ(rows, 3);
}

TEST_F(PipelineTest, UnaddressableRowGroupIsBufferLimitError) {
    FakeCursor cursor({make_column("doc", SQL_LONGVARCHAR, 0)}, 1,
                      [](size_t, size_t) -> FakeValue { return std::string("x"); });
    core::QueryConfig::Options options;
    options.batch_size = 4000000000u;
    options.max_text_size = UINT32_MAX - 1;
    options.max_bytes_per_batch = UINT64_MAX;
    auto pipeline = make_pipeline(cursor, core::QueryConfig(options));

    try {
        pipeline->run([](columnar::Batch&&) {});
        FAIL() << "expected ArrowError";
    } catch (const ArrowError& e) {
        EXPECT_EQ(e.kind(), ArrowError::Kind::BufferLimit);
    }
}
