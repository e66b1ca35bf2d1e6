#pragma once

#include "errors.hpp"
#include "core/query_config.hpp"
#include "output/output_adapter.hpp"
#include "pipeline/pipeline.hpp"
#include <arrow/io/interfaces.h>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ibarrow {

enum class ConnectionState {
    Created,
    Connected,
    Querying,
    Closed
};

const char* state_to_string(ConnectionState state);

using QueryStats = pipeline::PipelineStats;

/**
 * @brief Open session against one ODBC data source
 *
 * One query runs at a time; a second caller waits for the first to finish.
 * Every operation except close() throws ConnectionError{Transport} once the
 * connection is closed. close() may be called from another thread while a
 * query runs: the query is cancelled and the handle is released after it
 * has unwound.
 */
class Connection {
public:
    using State = ConnectionState;

    // Does not connect; see open() and ibarrow::connect()
    Connection(std::string dsn, std::string user, std::string password,
               core::QueryConfig config = core::QueryConfig());
    ~Connection();

    Connection(Connection&&) noexcept;
    Connection& operator=(Connection&&) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Created -> Connected; throws ConnectionError
    void open();

    State state() const noexcept;
    const core::QueryConfig& config() const noexcept;
    const std::string& dsn() const noexcept;
    const std::string& user() const noexcept;

    // Whole IPC stream in memory
    std::shared_ptr<arrow::Buffer> query_stream(std::string_view sql);

    // IPC stream written batch by batch to the sink
    void query_stream(std::string_view sql, std::shared_ptr<arrow::io::OutputStream> sink);

    // The whole result as one exported batch; zero rows yield an empty batch
    output::ExportedBatch query_capsules(std::string_view sql);

    // Every batch exported as soon as it is encoded
    void query_capsules_each(std::string_view sql,
                             const std::function<void(output::ExportedBatch&&)>& fn);

    std::shared_ptr<arrow::Table> query_table(
        std::string_view sql,
        output::HandoffStrategy strategy = output::HandoffStrategy::CDataInterface);

    output::OutputResult query(std::string_view sql, output::OutputFormat format);

    // false on connectivity failures, never throws for them
    bool test_connection();

    // Idempotent, never throws
    void close() noexcept;

    std::vector<ArrowError> last_query_warnings() const;
    QueryStats last_query_stats() const;
    std::shared_ptr<arrow::Schema> last_query_schema() const;

    // dsn, user and state; never the password
    std::string to_string() const;

private:
    struct Impl;
    void ensure_open() const;

    std::unique_ptr<Impl> impl_;
};

Connection connect(std::string_view dsn, std::string_view user, std::string_view password,
                   core::QueryConfig config = core::QueryConfig());

} // namespace ibarrow
