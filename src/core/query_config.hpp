#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ibarrow::core {

enum class IsolationLevel {
    ReadUncommitted,
    ReadCommitted,
    RepeatableRead,
    Serializable
};

const char* isolation_to_string(IsolationLevel level);

// Accepts READ_COMMITTED, read-committed, ReadCommitted, ... ; throws
// std::invalid_argument for anything else
IsolationLevel parse_isolation_level(std::string_view name);

/**
 * @brief Immutable per-connection configuration
 *
 * Build an Options aggregate, then construct the config from it. The
 * constructor validates every field and throws std::invalid_argument on
 * the first bad value.
 */
class QueryConfig {
public:
    static constexpr uint32_t DEFAULT_BATCH_SIZE = 65536;
    static constexpr uint32_t DEFAULT_CONNECTION_TIMEOUT_S = 30;
    static constexpr uint32_t DEFAULT_QUERY_TIMEOUT_S = 3600;
    static constexpr uint32_t DEFAULT_MAX_TEXT_SIZE = 65536;
    static constexpr uint32_t DEFAULT_MAX_BINARY_SIZE = 65536;
    static constexpr uint32_t DEFAULT_QUEUE_DEPTH = 2;
    static constexpr uint32_t MAX_QUEUE_DEPTH = 16;
    static constexpr uint64_t DEFAULT_MAX_BYTES_PER_BATCH = 512ull * 1024 * 1024;

    struct Options {
        uint32_t batch_size = DEFAULT_BATCH_SIZE;             // rows per batch
        bool read_only = false;
        uint32_t connection_timeout = DEFAULT_CONNECTION_TIMEOUT_S;  // seconds
        uint32_t query_timeout = DEFAULT_QUERY_TIMEOUT_S;     // seconds, whole fetch sequence
        uint32_t max_text_size = DEFAULT_MAX_TEXT_SIZE;       // bytes per text value
        uint32_t max_binary_size = DEFAULT_MAX_BINARY_SIZE;   // bytes per binary value
        IsolationLevel isolation_level = IsolationLevel::ReadCommitted;
        uint32_t queue_depth = DEFAULT_QUEUE_DEPTH;           // row groups in flight
        // Bind buffer bytes of one row group; a query whose batch_size rows
        // need more is rejected before anything is allocated
        uint64_t max_bytes_per_batch = DEFAULT_MAX_BYTES_PER_BATCH;
        std::string driver;   // used when a file path is rewritten to keywords
    };

    QueryConfig();
    explicit QueryConfig(Options options);

    uint32_t batch_size() const noexcept { return options_.batch_size; }
    bool read_only() const noexcept { return options_.read_only; }
    std::chrono::seconds connection_timeout() const noexcept {
        return std::chrono::seconds(options_.connection_timeout);
    }
    std::chrono::seconds query_timeout() const noexcept {
        return std::chrono::seconds(options_.query_timeout);
    }
    uint32_t max_text_size() const noexcept { return options_.max_text_size; }
    uint32_t max_binary_size() const noexcept { return options_.max_binary_size; }
    IsolationLevel isolation_level() const noexcept { return options_.isolation_level; }
    uint32_t queue_depth() const noexcept { return options_.queue_depth; }
    uint64_t max_bytes_per_batch() const noexcept { return options_.max_bytes_per_batch; }
    const std::string& driver() const noexcept { return options_.driver; }

    const Options& options() const noexcept { return options_; }

    // Missing keys take defaults, unknown keys are rejected
    static QueryConfig from_json(const nlohmann::json& j);
    static QueryConfig from_file(const std::string& path);
    nlohmann::json to_json() const;

private:
    Options options_;
};

} // namespace ibarrow::core
