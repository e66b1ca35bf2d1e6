#pragma once

#include "query_config.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ibarrow::core {

/**
 * @brief Turns a user-supplied data source identifier into a connection string
 *
 * Three inputs are recognized:
 *   - a keyword string ("DRIVER={...};DBNAME=...;"), returned unchanged; an
 *     '=' inside a file name does not make a path a keyword string
 *   - a file path (contains '/' or '\'), rewritten to DBNAME=<path>
 *   - a data source name; names longer than SQL_MAX_DSN_LENGTH are rewritten
 *     to an explicit DSN= keyword, shorter ones are returned unchanged
 *
 * Everything here is pure. resolve() is idempotent because every rewrite
 * yields a keyword string.
 */
class DsnResolver {
public:
    static std::string resolve(std::string_view raw_dsn, const QueryConfig& config);

    static bool is_keyword_string(std::string_view dsn) noexcept;
    static bool looks_like_path(std::string_view dsn) noexcept;

    // Append credentials to a resolved identifier; plain names become DSN=
    static std::string build_connection_string(std::string_view resolved,
                                               std::string_view user,
                                               std::string_view password);

    // Copy of a connection string with PWD/PASSWORD values masked, safe to log.
    // Names and paths are returned unchanged.
    static std::string redact(std::string_view connection_string);

    // Split "K1=V1;K2={V;2}" into ordered pairs, keys as written, braces removed
    static std::vector<std::pair<std::string, std::string>> parse_pairs(
        std::string_view connection_string);

    // Brace-quote a value when it contains characters that end an attribute
    static std::string quote_value(std::string_view value);
};

} // namespace ibarrow::core
