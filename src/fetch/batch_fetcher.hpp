#pragma once

#include "cursor.hpp"
#include <chrono>
#include <cstdint>

namespace ibarrow::fetch {

/**
 * @brief Pulls fixed-size groups of rows from a cursor
 *
 * next_batch() fills the group completely unless the result set runs out,
 * in which case it returns the remainder and reports end of results on the
 * following call. The query timeout bounds the whole fetch sequence,
 * measured from construction.
 */
class BatchFetcher {
public:
    using Clock = std::chrono::steady_clock;

    BatchFetcher(Cursor& cursor, std::chrono::seconds query_timeout);

    // false at end of results (the group then holds no rows)
    bool next_batch(columnar::RowGroup& group);

    int64_t rows_fetched() const noexcept { return rows_fetched_; }
    int64_t batches_fetched() const noexcept { return batches_fetched_; }
    bool exhausted() const noexcept { return exhausted_; }

private:
    void check_deadline() const;

    Cursor& cursor_;
    std::chrono::seconds timeout_;
    Clock::time_point deadline_;
    int64_t rows_fetched_ = 0;
    int64_t batches_fetched_ = 0;
    bool exhausted_ = false;
};

} // namespace ibarrow::fetch
