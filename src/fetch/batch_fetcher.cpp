#include "batch_fetcher.hpp"
#include "errors.hpp"
#include "core/logger.hpp"

namespace ibarrow::fetch {

BatchFetcher::BatchFetcher(Cursor& cursor, std::chrono::seconds query_timeout)
    : cursor_(cursor),
      timeout_(query_timeout),
      deadline_(Clock::now() + query_timeout) {
}

void BatchFetcher::check_deadline() const {
    if (Clock::now() >= deadline_) {
        throw QueryError(QueryError::Kind::Timeout,
                         "query exceeded timeout of " + std::to_string(timeout_.count()) +
                         "s after " + std::to_string(rows_fetched_) + " rows");
    }
}

bool BatchFetcher::next_batch(columnar::RowGroup& group) {
    group.set_num_rows(0);
    group.set_first_row(rows_fetched_);

    if (exhausted_) {
        return false;
    }

    size_t filled = 0;
    while (filled < group.capacity()) {
        check_deadline();
        size_t n = cursor_.fetch(group, filled, group.capacity() - filled);
        if (n == 0) {
            exhausted_ = true;
            break;
        }
        filled += n;
    }
    check_deadline();

    group.set_num_rows(filled);
    if (filled == 0) {
        LOG_DEBUG("End of results after " + std::to_string(rows_fetched_) + " rows");
        return false;
    }

    rows_fetched_ += static_cast<int64_t>(filled);
    ++batches_fetched_;
    LOG_TRACE("Fetched batch " + std::to_string(batches_fetched_) + " with " +
              std::to_string(filled) + " rows");
    return true;
}

} // namespace ibarrow::fetch
