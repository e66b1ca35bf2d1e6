#pragma once

#include "odbc_connection.hpp"
#include "query_config.hpp"
#include <memory>
#include <string_view>

namespace ibarrow::core {

using ConnectionHandle = std::unique_ptr<OdbcConnection>;

/**
 * @brief Opens, checks and releases native connection handles
 *
 * open() resolves the identifier, applies the login timeout, connects and
 * then applies the read-only and isolation session attributes before any
 * statement can run. Failures leave no handle behind and surface as
 * ConnectionError.
 */
class ConnectionManager {
public:
    static ConnectionHandle open(std::string_view dsn, std::string_view user,
                                 std::string_view password, const QueryConfig& config);

    // Idempotent; never throws, also on a handle the driver already invalidated
    static void close(ConnectionHandle& handle) noexcept;

    // Runs a trivial round-trip query. Connectivity failures yield false.
    static bool test_connection(OdbcConnection& handle, const QueryConfig& config);

    static SQLULEN isolation_to_odbc(IsolationLevel level) noexcept;

private:
    static void apply_session_attributes(OdbcConnection& handle, const QueryConfig& config);
};

} // namespace ibarrow::core
