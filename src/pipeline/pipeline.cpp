#include "pipeline.hpp"
#include "errors.hpp"
#include "core/logger.hpp"
#include "fetch/batch_fetcher.hpp"
#include <cstdint>
#include <new>
#include <stdexcept>
#include <thread>

namespace ibarrow::pipeline {

Pipeline::Pipeline(fetch::Cursor& cursor, columnar::SchemaDescriptor schema,
                   std::vector<columnar::DecodeRule> rules, const core::QueryConfig& config)
    : cursor_(cursor),
      schema_(std::move(schema)),
      rules_(std::move(rules)),
      batch_size_(config.batch_size()),
      queue_depth_(config.queue_depth()),
      query_timeout_(config.query_timeout()),
      ready_(config.queue_depth()),
      free_(config.queue_depth() + 1) {
    check_row_group_size(config.max_bytes_per_batch());
}

void Pipeline::check_row_group_size(uint64_t max_bytes) const {
    uint64_t per_row = 0;
    size_t widest = 0;
    for (size_t i = 0; i < rules_.size(); ++i) {
        per_row += columnar::row_bytes(rules_[i]);
        if (rules_[i].element_size > rules_[widest].element_size) {
            widest = i;
        }
    }
    if (rules_.empty() || per_row <= max_bytes / batch_size_) {
        return;
    }

    const std::string& name = schema_[widest].name;
    std::string bytes = (per_row > UINT64_MAX / batch_size_)
                            ? std::string("more than ") + std::to_string(UINT64_MAX)
                            : std::to_string(per_row * batch_size_);
    throw ArrowError(ArrowError::Kind::BufferLimit,
                     "Row group of " + std::to_string(batch_size_) + " rows needs " + bytes +
                     " bytes, over max_bytes_per_batch " + std::to_string(max_bytes) +
                     "; widest column '" + name + "' takes " +
                     std::to_string(rules_[widest].element_size) +
                     " bytes per row, lower batch_size or max_text_size/max_binary_size",
                     name);
}

columnar::RowGroup Pipeline::allocate_group() const {
    try {
        return columnar::RowGroup(rules_, batch_size_);
    } catch (const std::bad_alloc&) {
        throw ArrowError(ArrowError::Kind::BufferLimit,
                         "cannot allocate a row group of " + std::to_string(batch_size_) + " rows");
    } catch (const std::length_error&) {
        throw ArrowError(ArrowError::Kind::BufferLimit,
                         "row group of " + std::to_string(batch_size_) + " rows is not addressable");
    }
}

void Pipeline::record_error(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    if (!first_error_) {
        first_error_ = error;
    }
}

void Pipeline::note_in_flight() {
    size_t now = ++in_flight_;
    size_t peak = peak_in_flight_.load();
    while (now > peak && !peak_in_flight_.compare_exchange_weak(peak, now)) {
    }
}

void Pipeline::cancel() noexcept {
    if (cancelled_.exchange(true)) {
        return;
    }
    LOG_INFO("Cancelling query pipeline");
    ready_.abort();
    free_.abort();
    cursor_.cancel();
}

void Pipeline::fetch_stage() {
    core::Logger::set_thread_tag("fetch");
    const size_t max_groups = queue_depth_ + 1;

    try {
        fetch::BatchFetcher fetcher(cursor_, query_timeout_);

        while (!cancelled_) {
            std::optional<columnar::RowGroup> group = free_.try_pop();
            if (!group) {
                if (row_groups_allocated_ < max_groups) {
                    group.emplace(allocate_group());
                    ++row_groups_allocated_;
                    row_group_bytes_ += group->allocated_bytes();
                    LOG_DEBUG("Allocated row group " + std::to_string(row_groups_allocated_) +
                              " (" + std::to_string(group->allocated_bytes()) + " bytes)");
                } else {
                    // Backpressure: wait for the encoder to hand a group back
                    group = free_.pop();
                    if (!group) {
                        break;
                    }
                }
            }

            if (!fetcher.next_batch(*group)) {
                break;
            }
            note_in_flight();
            if (!ready_.push(std::move(*group))) {
                break;
            }
        }
        ready_.close();
        LOG_DEBUG("Fetch stage done after " + std::to_string(fetcher.rows_fetched()) + " rows");
    } catch (...) {
        record_error(std::current_exception());
        ready_.abort();
    }
}

PipelineStats Pipeline::run(const BatchSink& sink) {
    const auto started = std::chrono::steady_clock::now();
    const std::string caller_tag = core::Logger::thread_tag();
    PipelineStats stats;

    std::thread fetch_thread(&Pipeline::fetch_stage, this);
    core::Logger::set_thread_tag("encode");

    try {
        columnar::ColumnEncoder encoder(schema_, rules_);
        int64_t sequence = 0;

        while (std::optional<columnar::RowGroup> group = ready_.pop()) {
            columnar::Batch batch = encoder.encode(*group, sequence++);
            --in_flight_;
            free_.push(std::move(*group));

            ++stats.batches;
            stats.rows += batch.num_rows();
            sink(std::move(batch));
        }
    } catch (...) {
        record_error(std::current_exception());
        ready_.abort();
        free_.abort();
        cursor_.cancel();
    }

    fetch_thread.join();
    core::Logger::set_thread_tag(caller_tag);

    stats.peak_in_flight = peak_in_flight_.load();
    stats.row_groups_allocated = row_groups_allocated_;
    stats.row_group_bytes = row_group_bytes_;
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (cancelled_) {
        throw ConnectionError(ConnectionError::Kind::Transport,
                              "query cancelled: connection is closed");
    }
    if (first_error_) {
        std::rethrow_exception(first_error_);
    }

    LOG_INFO("Pipeline produced " + std::to_string(stats.batches) + " batches, " +
             std::to_string(stats.rows) + " rows in " + std::to_string(stats.elapsed.count()) +
             " ms (peak in flight " + std::to_string(stats.peak_in_flight) + ")");
    return stats;
}

} // namespace ibarrow::pipeline
