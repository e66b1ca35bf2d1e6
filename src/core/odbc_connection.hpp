#pragma once

#include "odbc_environment.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace ibarrow::core {

// RAII wrapper for ODBC Connection handle. Shares ownership of its
// environment so the pair can live inside a movable owner.
class OdbcConnection {
public:
    explicit OdbcConnection(std::shared_ptr<OdbcEnvironment> env);
    ~OdbcConnection();

    // Non-copyable, non-movable: statements hold a reference to it
    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;
    OdbcConnection(OdbcConnection&&) = delete;
    OdbcConnection& operator=(OdbcConnection&&) = delete;

    // Must be called before connect()
    void set_login_timeout(std::chrono::seconds timeout);

    void connect(std::string_view connection_string);
    void disconnect();

    // Disconnect and free the handle; safe on an invalid or already released
    // handle, never throws. Returns false if the driver reported a failure.
    bool release() noexcept;

    /**
     * @brief Set a connection attribute
     * @return false if the driver does not support the attribute or value
     *         (HYC00, HY092, HY024); other failures throw OdbcError
     */
    bool try_set_attribute(SQLINTEGER attribute, SQLULEN value, const char* context);

    bool is_connected() const noexcept { return connected_; }

    SQLHDBC get_handle() const noexcept { return handle_; }

private:
    std::shared_ptr<OdbcEnvironment> env_;
    SQLHDBC handle_ = SQL_NULL_HDBC;
    bool connected_ = false;
};

} // namespace ibarrow::core
