#include "dsn_resolver.hpp"

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

#include <algorithm>
#include <cctype>

namespace ibarrow::core {

namespace {

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool is_password_key(std::string_view key) {
    std::string upper = to_upper(trim(key));
    return upper == "PWD" || upper == "PASSWORD";
}

bool has_key(const std::vector<std::pair<std::string, std::string>>& pairs,
             std::string_view key) {
    for (const auto& [k, v] : pairs) {
        if (to_upper(trim(k)) == key) {
            return true;
        }
    }
    return false;
}

bool has_password_key(const std::vector<std::pair<std::string, std::string>>& pairs) {
    for (const auto& [k, v] : pairs) {
        if (is_password_key(k)) {
            return true;
        }
    }
    return false;
}

// Splits on top-level ';', keeping brace-quoted values (with "}}" escapes) intact
template <typename Fn>
void for_each_attribute(std::string_view conn_str, Fn&& fn) {
    std::string current;
    bool in_braces = false;

    for (size_t i = 0; i < conn_str.size(); ++i) {
        char c = conn_str[i];
        if (c == '{' && !in_braces) {
            in_braces = true;
            current += c;
        } else if (c == '}' && in_braces) {
            if (i + 1 < conn_str.size() && conn_str[i + 1] == '}') {
                current += "}}";
                ++i;
            } else {
                in_braces = false;
                current += c;
            }
        } else if (c == ';' && !in_braces) {
            fn(current);
            current.clear();
        } else {
            current += c;
        }
    }

    if (!trim(current).empty()) {
        fn(current);
    }
}

} // anonymous namespace

bool DsnResolver::is_keyword_string(std::string_view dsn) noexcept {
    // '=' is not allowed in a data source name; a separator before the first
    // '=' means it belongs to a file name instead of ending a keyword
    auto eq_pos = dsn.find('=');
    if (eq_pos == std::string_view::npos || eq_pos == 0) {
        return false;
    }
    return !looks_like_path(dsn.substr(0, eq_pos));
}

bool DsnResolver::looks_like_path(std::string_view dsn) noexcept {
    return dsn.find('/') != std::string_view::npos ||
           dsn.find('\\') != std::string_view::npos;
}

std::string DsnResolver::resolve(std::string_view raw_dsn, const QueryConfig& config) {
    if (is_keyword_string(raw_dsn)) {
        return std::string(raw_dsn);
    }

    if (looks_like_path(raw_dsn)) {
        std::string result;
        if (!config.driver().empty()) {
            result += "DRIVER=" + quote_value(config.driver()) + ";";
        }
        result += "DBNAME=" + quote_value(raw_dsn) + ";";
        return result;
    }

    if (raw_dsn.size() > SQL_MAX_DSN_LENGTH) {
        // The driver manager rejects long names (IM010) before any lookup
        return "DSN=" + quote_value(raw_dsn) + ";";
    }

    return std::string(raw_dsn);
}

std::string DsnResolver::build_connection_string(std::string_view resolved,
                                                 std::string_view user,
                                                 std::string_view password) {
    std::string result;
    if (is_keyword_string(resolved)) {
        result = std::string(resolved);
        if (!result.empty() && result.back() != ';') {
            result += ';';
        }
    } else {
        result = "DSN=" + quote_value(resolved) + ";";
    }

    auto pairs = parse_pairs(result);
    if (!user.empty() && !has_key(pairs, "UID")) {
        result += "UID=" + quote_value(user) + ";";
    }
    if (!password.empty() && !has_password_key(pairs)) {
        result += "PWD=" + quote_value(password) + ";";
    }
    return result;
}

std::string DsnResolver::redact(std::string_view connection_string) {
    if (!is_keyword_string(connection_string)) {
        // Names and paths carry no attributes
        return std::string(connection_string);
    }

    std::string result;
    for_each_attribute(connection_string, [&](const std::string& attr) {
        auto eq_pos = attr.find('=');
        if (eq_pos != std::string::npos && is_password_key(attr.substr(0, eq_pos))) {
            result += attr.substr(0, eq_pos) + "=***;";
        } else {
            result += attr + ";";
        }
    });
    return result;
}

std::vector<std::pair<std::string, std::string>> DsnResolver::parse_pairs(
    std::string_view connection_string) {
    std::vector<std::pair<std::string, std::string>> result;

    for_each_attribute(connection_string, [&](const std::string& attr) {
        auto eq_pos = attr.find('=');
        if (eq_pos == std::string::npos) {
            return;
        }
        std::string key = trim(attr.substr(0, eq_pos));
        std::string value = trim(attr.substr(eq_pos + 1));

        if (value.size() >= 2 && value.front() == '{' && value.back() == '}') {
            std::string inner = value.substr(1, value.size() - 2);
            value.clear();
            for (size_t i = 0; i < inner.size(); ++i) {
                value += inner[i];
                if (inner[i] == '}' && i + 1 < inner.size() && inner[i + 1] == '}') {
                    ++i;
                }
            }
        }
        result.emplace_back(std::move(key), std::move(value));
    });

    return result;
}

std::string DsnResolver::quote_value(std::string_view value) {
    bool needs_braces = value.find_first_of(";{}") != std::string_view::npos ||
                        (!value.empty() && (value.front() == ' ' || value.back() == ' '));
    if (!needs_braces) {
        return std::string(value);
    }

    std::string result = "{";
    for (char c : value) {
        result += c;
        if (c == '}') {
            result += '}';
        }
    }
    result += '}';
    return result;
}

} // namespace ibarrow::core
