#include "query_config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace ibarrow::core {

namespace {

// Upper-case and fold '-' and ' ' to '_' so every common spelling compares equal
std::string normalize_name(std::string_view name) {
    std::string result;
    result.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        if (c == '-' || c == ' ') {
            result += '_';
        } else if (std::isupper(c) && i > 0 && std::islower(static_cast<unsigned char>(name[i - 1]))) {
            // CamelCase boundary: ReadCommitted -> READ_COMMITTED
            result += '_';
            result += static_cast<char>(c);
        } else {
            result += static_cast<char>(std::toupper(c));
        }
    }
    return result;
}

void require_positive(uint32_t value, const char* field) {
    if (value == 0) {
        throw std::invalid_argument(std::string("QueryConfig: ") + field + " must be > 0");
    }
}

uint32_t read_u32(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
        value.get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
        throw std::invalid_argument("QueryConfig: '" + key + "' must be a non-negative integer");
    }
    return value.get<uint32_t>();
}

uint64_t read_u64(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
        throw std::invalid_argument("QueryConfig: '" + key + "' must be a non-negative integer");
    }
    return value.get<uint64_t>();
}

} // anonymous namespace

const char* isolation_to_string(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::ReadUncommitted: return "READ_UNCOMMITTED";
        case IsolationLevel::ReadCommitted: return "READ_COMMITTED";
        case IsolationLevel::RepeatableRead: return "REPEATABLE_READ";
        case IsolationLevel::Serializable: return "SERIALIZABLE";
    }
    return "UNKNOWN";
}

IsolationLevel parse_isolation_level(std::string_view name) {
    std::string n = normalize_name(name);
    if (n == "READ_UNCOMMITTED") return IsolationLevel::ReadUncommitted;
    if (n == "READ_COMMITTED") return IsolationLevel::ReadCommitted;
    if (n == "REPEATABLE_READ") return IsolationLevel::RepeatableRead;
    if (n == "SERIALIZABLE") return IsolationLevel::Serializable;
    throw std::invalid_argument("Unknown isolation level: " + std::string(name));
}

QueryConfig::QueryConfig() : QueryConfig(Options{}) {
}

QueryConfig::QueryConfig(Options options) : options_(std::move(options)) {
    require_positive(options_.batch_size, "batch_size");
    require_positive(options_.connection_timeout, "connection_timeout");
    require_positive(options_.query_timeout, "query_timeout");
    require_positive(options_.max_text_size, "max_text_size");
    require_positive(options_.max_binary_size, "max_binary_size");
    require_positive(options_.queue_depth, "queue_depth");
    if (options_.max_bytes_per_batch == 0) {
        throw std::invalid_argument("QueryConfig: max_bytes_per_batch must be > 0");
    }

    if (options_.queue_depth > MAX_QUEUE_DEPTH) {
        throw std::invalid_argument("QueryConfig: queue_depth must be <= " +
                                    std::to_string(MAX_QUEUE_DEPTH));
    }
    // One terminator byte is added to every text buffer element
    if (options_.max_text_size == UINT32_MAX) {
        throw std::invalid_argument("QueryConfig: max_text_size is too large");
    }
}

QueryConfig QueryConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("QueryConfig: JSON configuration must be an object");
    }

    Options options;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& value = it.value();

        if (key == "batch_size") {
            options.batch_size = read_u32(value, key);
        } else if (key == "read_only") {
            if (!value.is_boolean()) {
                throw std::invalid_argument("QueryConfig: 'read_only' must be a boolean");
            }
            options.read_only = value.get<bool>();
        } else if (key == "connection_timeout") {
            options.connection_timeout = read_u32(value, key);
        } else if (key == "query_timeout") {
            options.query_timeout = read_u32(value, key);
        } else if (key == "max_text_size") {
            options.max_text_size = read_u32(value, key);
        } else if (key == "max_binary_size") {
            options.max_binary_size = read_u32(value, key);
        } else if (key == "queue_depth") {
            options.queue_depth = read_u32(value, key);
        } else if (key == "max_bytes_per_batch") {
            options.max_bytes_per_batch = read_u64(value, key);
        } else if (key == "isolation_level") {
            if (!value.is_string()) {
                throw std::invalid_argument("QueryConfig: 'isolation_level' must be a string");
            }
            options.isolation_level = parse_isolation_level(value.get<std::string>());
        } else if (key == "driver") {
            if (!value.is_string()) {
                throw std::invalid_argument("QueryConfig: 'driver' must be a string");
            }
            options.driver = value.get<std::string>();
        } else {
            throw std::invalid_argument("QueryConfig: unknown key '" + key + "'");
        }
    }

    return QueryConfig(std::move(options));
}

QueryConfig QueryConfig::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::invalid_argument("QueryConfig: cannot open " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("QueryConfig: " + path + ": " + e.what());
    }
    return from_json(j);
}

nlohmann::json QueryConfig::to_json() const {
    nlohmann::json j;
    j["batch_size"] = options_.batch_size;
    j["read_only"] = options_.read_only;
    j["connection_timeout"] = options_.connection_timeout;
    j["query_timeout"] = options_.query_timeout;
    j["max_text_size"] = options_.max_text_size;
    j["max_binary_size"] = options_.max_binary_size;
    j["isolation_level"] = isolation_to_string(options_.isolation_level);
    j["queue_depth"] = options_.queue_depth;
    j["max_bytes_per_batch"] = options_.max_bytes_per_batch;
    j["driver"] = options_.driver;
    return j;
}

} // namespace ibarrow::core
