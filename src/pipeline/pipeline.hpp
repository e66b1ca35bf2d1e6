#pragma once

#include "bounded_queue.hpp"
#include "columnar/column_encoder.hpp"
#include "core/query_config.hpp"
#include "fetch/cursor.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>

namespace ibarrow::pipeline {

struct PipelineStats {
    int64_t batches = 0;
    int64_t rows = 0;

    // Most filled row groups waiting for or under encoding at once
    size_t peak_in_flight = 0;

    // Row groups ever allocated; never more than queue_depth + 1
    size_t row_groups_allocated = 0;
    size_t row_group_bytes = 0;

    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Two-stage fetch/encode pipeline for one result set
 *
 * A background thread owns the cursor and fills row groups; the calling
 * thread encodes them in fetch order and hands each batch to the sink. The
 * stages meet at a bounded queue of queue_depth groups, and filled groups
 * are recycled through a free list, so at most queue_depth + 1 groups
 * exist for the whole query.
 *
 * Construction throws ArrowError{BufferLimit}, naming the widest column,
 * when one row group of batch_size rows would need more than
 * max_bytes_per_batch bytes; a failed row group allocation raises the same
 * kind from run().
 *
 * The first failure in either stage (or in the sink) aborts both queues,
 * cancels the cursor and is rethrown from run() once the fetch thread has
 * been joined. Batches already handed to the sink stay valid.
 */
class Pipeline {
public:
    using BatchSink = std::function<void(columnar::Batch&&)>;

    Pipeline(fetch::Cursor& cursor, columnar::SchemaDescriptor schema,
             std::vector<columnar::DecodeRule> rules, const core::QueryConfig& config);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Runs to completion on the calling thread; call once
    PipelineStats run(const BatchSink& sink);

    // Safe from any thread. run() then throws ConnectionError{Transport}.
    void cancel() noexcept;
    bool cancelled() const noexcept { return cancelled_.load(); }

    const columnar::SchemaDescriptor& schema() const noexcept { return schema_; }

private:
    void check_row_group_size(uint64_t max_bytes) const;
    columnar::RowGroup allocate_group() const;
    void fetch_stage();
    void record_error(std::exception_ptr error);
    void note_in_flight();

    fetch::Cursor& cursor_;
    columnar::SchemaDescriptor schema_;
    std::vector<columnar::DecodeRule> rules_;
    size_t batch_size_;
    size_t queue_depth_;
    std::chrono::seconds query_timeout_;

    BoundedQueue<columnar::RowGroup> ready_;
    BoundedQueue<columnar::RowGroup> free_;

    std::atomic<bool> cancelled_{false};
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_in_flight_{0};
    size_t row_groups_allocated_ = 0;   // fetch thread only
    size_t row_group_bytes_ = 0;        // fetch thread only

    std::mutex error_mutex_;
    std::exception_ptr first_error_;
};

} // namespace ibarrow::pipeline
