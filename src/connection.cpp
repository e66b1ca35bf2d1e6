#include "connection.hpp"
#include "columnar/type_mapper.hpp"
#include "core/connection_manager.hpp"
#include "core/logger.hpp"
#include "fetch/odbc_cursor.hpp"

#include <atomic>
#include <mutex>
#include <thread>

namespace ibarrow {

const char* state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Created:   return "Created";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Querying:  return "Querying";
        case ConnectionState::Closed:    return "Closed";
        default: return "Unknown";
    }
}

struct Connection::Impl {
    std::string dsn;
    std::string user;
    std::string password;
    core::QueryConfig config;

    core::ConnectionHandle handle;
    std::atomic<State> state{State::Created};

    // Held for the whole of a query or connection test
    std::mutex query_mutex;
    std::atomic<std::thread::id> query_thread{};

    // What close() must cancel while a query runs
    std::mutex active_mutex;
    fetch::Cursor* active_cursor = nullptr;
    pipeline::Pipeline* active_pipeline = nullptr;

    mutable std::mutex results_mutex;
    std::vector<ArrowError> last_warnings;
    QueryStats last_stats;
    std::shared_ptr<arrow::Schema> last_schema;

    void cancel_active() noexcept {
        std::lock_guard<std::mutex> lock(active_mutex);
        if (active_pipeline) {
            active_pipeline->cancel();
        } else if (active_cursor) {
            active_cursor->cancel();
        }
    }
};

namespace {

// Marks the connection as querying and restores it on every exit
class ActiveQuery {
public:
    ActiveQuery(std::atomic<ConnectionState>& state, std::atomic<std::thread::id>& query_thread,
                core::ConnectionHandle& handle)
        : state_(state), query_thread_(query_thread), handle_(handle) {
        ConnectionState expected = ConnectionState::Connected;
        state_.compare_exchange_strong(expected, ConnectionState::Querying);
        query_thread_ = std::this_thread::get_id();
    }

    ~ActiveQuery() {
        query_thread_ = std::thread::id();
        ConnectionState expected = ConnectionState::Querying;
        if (!state_.compare_exchange_strong(expected, ConnectionState::Connected)) {
            // Closed while the query ran on this thread: release here
            core::ConnectionManager::close(handle_);
        }
    }

    ActiveQuery(const ActiveQuery&) = delete;
    ActiveQuery& operator=(const ActiveQuery&) = delete;

private:
    std::atomic<ConnectionState>& state_;
    std::atomic<std::thread::id>& query_thread_;
    core::ConnectionHandle& handle_;
};

// Publishes an object close() may cancel for as long as it is alive
template <typename T>
class ActiveSlot {
public:
    ActiveSlot(std::mutex& mutex, T*& slot, T* value) : mutex_(mutex), slot_(slot) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = value;
    }

    ~ActiveSlot() {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = nullptr;
    }

    ActiveSlot(const ActiveSlot&) = delete;
    ActiveSlot& operator=(const ActiveSlot&) = delete;

private:
    std::mutex& mutex_;
    T*& slot_;
};

ConnectionError closed_error() {
    return ConnectionError(ConnectionError::Kind::Transport, "connection is closed");
}

} // anonymous namespace

Connection::Connection(std::string dsn, std::string user, std::string password,
                       core::QueryConfig config)
    : impl_(std::make_unique<Impl>()) {
    impl_->dsn = std::move(dsn);
    impl_->user = std::move(user);
    impl_->password = std::move(password);
    impl_->config = std::move(config);
}

Connection::~Connection() {
    close();
}

Connection::Connection(Connection&&) noexcept = default;

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        impl_ = std::move(other.impl_);
    }
    return *this;
}

void Connection::open() {
    if (!impl_ || impl_->state == State::Closed) {
        throw closed_error();
    }
    std::lock_guard<std::mutex> lock(impl_->query_mutex);
    if (impl_->state != State::Created) {
        return;
    }
    impl_->handle = core::ConnectionManager::open(impl_->dsn, impl_->user, impl_->password,
                                                  impl_->config);
    State expected = State::Created;
    if (!impl_->state.compare_exchange_strong(expected, State::Connected)) {
        // Closed while connecting
        core::ConnectionManager::close(impl_->handle);
        throw closed_error();
    }
}

ConnectionState Connection::state() const noexcept {
    return impl_ ? impl_->state.load() : State::Closed;
}

const core::QueryConfig& Connection::config() const noexcept {
    return impl_->config;
}

const std::string& Connection::dsn() const noexcept {
    return impl_->dsn;
}

const std::string& Connection::user() const noexcept {
    return impl_->user;
}

void Connection::ensure_open() const {
    if (!impl_ || impl_->state == State::Closed) {
        throw closed_error();
    }
    if (impl_->state == State::Created) {
        throw ConnectionError(ConnectionError::Kind::Transport, "connection is not open");
    }
}

output::OutputResult Connection::query(std::string_view sql, output::OutputFormat format) {
    ensure_open();
    std::lock_guard<std::mutex> lock(impl_->query_mutex);
    // close() may have won the race for the lock
    ensure_open();

    LOG_INFO("Query: " + std::string(sql));
    ActiveQuery active(impl_->state, impl_->query_thread, impl_->handle);

    fetch::OdbcCursor cursor(*impl_->handle, impl_->config);
    ActiveSlot<fetch::Cursor> cursor_slot(impl_->active_mutex, impl_->active_cursor, &cursor);
    // Published before executing so close() can cancel a long execute
    if (impl_->state == State::Closed) {
        throw closed_error();
    }
    try {
        cursor.execute(sql);
    } catch (const Error&) {
        if (impl_->state == State::Closed) {
            throw closed_error();
        }
        throw;
    }

    columnar::TypeMapper mapper(impl_->config);
    std::vector<core::ColumnMetadata> columns = cursor.describe();
    columnar::SchemaDescriptor schema = mapper.derive_schema(columns);
    std::vector<columnar::DecodeRule> rules = mapper.decode_rules(columns);
    std::shared_ptr<arrow::Schema> arrow_schema = schema.arrow_schema();
    LOG_DEBUG("Result schema: " + schema.to_string());

    pipeline::Pipeline pipeline(cursor, std::move(schema), std::move(rules), impl_->config);
    ActiveSlot<pipeline::Pipeline> pipeline_slot(impl_->active_mutex, impl_->active_pipeline,
                                                 &pipeline);
    if (impl_->state == State::Closed) {
        throw closed_error();
    }

    output::OutputAdapter adapter(std::move(format));
    adapter.begin(arrow_schema);

    std::vector<ArrowError> warnings;
    QueryStats stats = pipeline.run([&](columnar::Batch&& batch) {
        for (auto& warning : batch.warnings) {
            warnings.push_back(std::move(warning));
        }
        adapter.consume(std::move(batch));
    });
    output::OutputResult result = adapter.finish();

    {
        std::lock_guard<std::mutex> results_lock(impl_->results_mutex);
        impl_->last_warnings = std::move(warnings);
        impl_->last_stats = stats;
        impl_->last_schema = arrow_schema;
    }
    LOG_IF(!impl_->last_warnings.empty(),
           std::to_string(impl_->last_warnings.size()) + " truncation warning(s) in query");
    return result;
}

std::shared_ptr<arrow::Buffer> Connection::query_stream(std::string_view sql) {
    output::OutputResult result = query(sql, output::StreamOutput{});
    return std::get<std::shared_ptr<arrow::Buffer>>(std::move(result));
}

void Connection::query_stream(std::string_view sql, std::shared_ptr<arrow::io::OutputStream> sink) {
    if (!sink) {
        throw std::invalid_argument("query_stream: sink must not be null");
    }
    query(sql, output::StreamOutput{std::move(sink)});
}

output::ExportedBatch Connection::query_capsules(std::string_view sql) {
    output::OutputResult result = query(sql, output::CapsuleOutput{});
    return std::get<output::ExportedBatch>(std::move(result));
}

void Connection::query_capsules_each(std::string_view sql,
                                     const std::function<void(output::ExportedBatch&&)>& fn) {
    if (!fn) {
        throw std::invalid_argument("query_capsules_each: callback must not be empty");
    }
    query(sql, output::CapsuleOutput{fn});
}

std::shared_ptr<arrow::Table> Connection::query_table(std::string_view sql,
                                                      output::HandoffStrategy strategy) {
    output::OutputResult result = query(sql, output::TableOutput{strategy});
    return std::get<std::shared_ptr<arrow::Table>>(std::move(result));
}

bool Connection::test_connection() {
    ensure_open();
    std::lock_guard<std::mutex> lock(impl_->query_mutex);
    ensure_open();
    return core::ConnectionManager::test_connection(*impl_->handle, impl_->config);
}

void Connection::close() noexcept {
    if (!impl_) {
        return;
    }
    State previous = impl_->state.exchange(State::Closed);
    if (previous == State::Closed) {
        return;
    }

    if (previous == State::Querying) {
        LOG_INFO("Closing connection with a query in progress");
        impl_->cancel_active();
        if (impl_->query_thread.load() == std::this_thread::get_id()) {
            // The query unwinds on this thread and releases the handle
            return;
        }
    }

    // Wait for a running query to unwind
    std::lock_guard<std::mutex> lock(impl_->query_mutex);
    core::ConnectionManager::close(impl_->handle);
    LOG_INFO("Connection closed");
}

std::vector<ArrowError> Connection::last_query_warnings() const {
    if (!impl_) return {};
    std::lock_guard<std::mutex> lock(impl_->results_mutex);
    return impl_->last_warnings;
}

QueryStats Connection::last_query_stats() const {
    if (!impl_) return {};
    std::lock_guard<std::mutex> lock(impl_->results_mutex);
    return impl_->last_stats;
}

std::shared_ptr<arrow::Schema> Connection::last_query_schema() const {
    if (!impl_) return nullptr;
    std::lock_guard<std::mutex> lock(impl_->results_mutex);
    return impl_->last_schema;
}

std::string Connection::to_string() const {
    if (!impl_) {
        return "Connection(state=Closed)";
    }
    return "Connection(dsn='" + impl_->dsn + "', user='" + impl_->user +
           "', state=" + state_to_string(impl_->state.load()) + ")";
}

Connection connect(std::string_view dsn, std::string_view user, std::string_view password,
                   core::QueryConfig config) {
    Connection conn{std::string(dsn), std::string(user), std::string(password), std::move(config)};
    conn.open();
    return conn;
}

} // namespace ibarrow
