#include <iostream>
#include <memory>
#include <optional>
#include <CLI/CLI.hpp>
#include <arrow/io/file.h>
#include <arrow/io/stdio.h>
#include "ibarrow/version.hpp"
#include "connection.hpp"
#include "core/dsn_resolver.hpp"
#include "core/error_translator.hpp"
#include "core/logger.hpp"
#include "reporting/console_reporter.hpp"
#include "reporting/json_reporter.hpp"

using namespace ibarrow;

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_TEST_FAILED = 1,
    EXIT_CONNECTION_ERROR = 2,
    EXIT_SQL_ERROR = 3,
    EXIT_ARROW_ERROR = 4,
    EXIT_QUERY_ERROR = 5,
    EXIT_OTHER_ERROR = 6
};

int exit_code_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Connection: return EXIT_CONNECTION_ERROR;
        case ErrorCategory::Sql:        return EXIT_SQL_ERROR;
        case ErrorCategory::Arrow:      return EXIT_ARROW_ERROR;
        case ErrorCategory::Query:      return EXIT_QUERY_ERROR;
    }
    return EXIT_OTHER_ERROR;
}

std::shared_ptr<arrow::io::OutputStream> open_sink(const std::string& path) {
    if (path == "-") {
        return std::make_shared<arrow::io::StdoutStream>();
    }
    return core::check_arrow(arrow::io::FileOutputStream::Open(path), "open " + path);
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{
        "ibarrow - ODBC to Apache Arrow\n"
        "\n"
        "  Runs a query against an ODBC data source and streams the result\n"
        "  as Arrow record batches, in constant memory.\n"
        "\n"
        "Examples:\n"
        "  ibarrow MyDsn -u sysdba -p masterkey -q \"SELECT * FROM T\" -o t.arrows\n"
        "  ibarrow /data/db.fdb --driver \"Firebird/InterBase(r) driver\" -q \"...\" -o -\n"
        "  ibarrow \"Driver={PostgreSQL};Server=localhost;...\" --test\n",
        "ibarrow"
    };

    app.set_version_flag("--version,-V", IBARROW_VERSION);

    std::string dsn;
    app.add_option("dsn", dsn,
                   "Data source: DSN name, database file path or keyword string")
        ->required();

    std::string user;
    std::string password;
    std::string sql;
    std::string out_path;
    app.add_option("-u,--user", user, "User name");
    app.add_option("-p,--password", password, "Password");
    app.add_option("-q,--sql", sql, "SQL query to run");
    app.add_option("-o,--out", out_path,
                   "Write the result as an Arrow IPC stream to FILE ('-' for stdout)");

    std::string config_file;
    app.add_option("--config", config_file, "JSON file with query configuration")
        ->check(CLI::ExistingFile);

    uint32_t batch_size = 0;
    uint32_t connection_timeout = 0;
    uint32_t query_timeout = 0;
    uint32_t max_text_size = 0;
    uint32_t max_binary_size = 0;
    uint32_t queue_depth = 0;
    uint64_t max_bytes_per_batch = 0;
    bool read_only = false;
    std::string isolation;
    std::string driver;
    auto* batch_size_opt = app.add_option("--batch-size", batch_size, "Rows per batch");
    auto* read_only_opt = app.add_flag("--read-only", read_only, "Open a read-only session");
    auto* conn_timeout_opt = app.add_option("--connection-timeout", connection_timeout,
                                            "Login timeout in seconds");
    auto* query_timeout_opt = app.add_option("--query-timeout", query_timeout,
                                             "Timeout for the whole fetch, in seconds");
    auto* max_text_opt = app.add_option("--max-text-size", max_text_size,
                                        "Longest text value kept, in bytes");
    auto* max_binary_opt = app.add_option("--max-binary-size", max_binary_size,
                                          "Longest binary value kept, in bytes");
    auto* queue_depth_opt = app.add_option("--queue-depth", queue_depth,
                                           "Row groups buffered between fetch and encode");
    auto* max_bytes_opt = app.add_option("--max-bytes-per-batch", max_bytes_per_batch,
                                         "Largest bind buffer of one batch, in bytes");
    auto* isolation_opt = app.add_option("--isolation", isolation,
                                         "read_uncommitted, read_committed, repeatable_read "
                                         "or serializable");
    auto* driver_opt = app.add_option("--driver", driver,
                                      "ODBC driver used when the dsn is a file path");

    bool test_only = false;
    app.add_flag("--test", test_only, "Only check that the data source answers a query");

    std::string report_format = "console";
    app.add_option("--report", report_format, "Run summary: 'console' (default) or 'json'")
        ->check(CLI::IsMember({"console", "json"}));

    std::string report_file;
    app.add_option("--report-file", report_file, "Write the JSON summary to FILE");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Show diagnostics and buffer statistics");

    std::string log_level = "warn";
    std::string log_file;
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error or fatal");
    app.add_option("--log-file", log_file, "Append log lines to FILE");

    CLI11_PARSE(app, argc, argv);

    core::LogLevel level;
    if (!core::Logger::parse_level(log_level, level)) {
        std::cerr << "Error: unknown log level '" << log_level << "'\n";
        return EXIT_OTHER_ERROR;
    }
    core::Logger::instance().set_level(level);
    if (!log_file.empty()) {
        core::Logger::instance().set_output(log_file);
    }
    core::Logger::set_thread_tag("main");

    if (!test_only && sql.empty()) {
        std::cerr << "Error: --sql is required unless --test is given\n";
        return EXIT_OTHER_ERROR;
    }

    // Reports never share stdout with an IPC stream
    std::ostream& report_out = (out_path == "-") ? std::cerr : std::cout;
    std::unique_ptr<reporting::Reporter> reporter;
    if (report_format == "json") {
        reporter = std::make_unique<reporting::JsonReporter>(report_file, report_out);
    } else {
        reporter = std::make_unique<reporting::ConsoleReporter>(report_out, verbose);
    }

    try {
        core::QueryConfig base = config_file.empty() ? core::QueryConfig()
                                                     : core::QueryConfig::from_file(config_file);
        core::QueryConfig::Options options = base.options();
        if (batch_size_opt->count()) options.batch_size = batch_size;
        if (read_only_opt->count()) options.read_only = read_only;
        if (conn_timeout_opt->count()) options.connection_timeout = connection_timeout;
        if (query_timeout_opt->count()) options.query_timeout = query_timeout;
        if (max_text_opt->count()) options.max_text_size = max_text_size;
        if (max_binary_opt->count()) options.max_binary_size = max_binary_size;
        if (queue_depth_opt->count()) options.queue_depth = queue_depth;
        if (max_bytes_opt->count()) options.max_bytes_per_batch = max_bytes_per_batch;
        if (isolation_opt->count()) options.isolation_level = core::parse_isolation_level(isolation);
        if (driver_opt->count()) options.driver = driver;
        core::QueryConfig config(options);

        std::string description = core::DsnResolver::redact(dsn);
        if (!user.empty()) {
            description += " (user " + user + ")";
        }
        reporter->report_start(description);

        Connection conn = connect(dsn, user, password, config);

        if (test_only) {
            bool ok = conn.test_connection();
            reporter->report_connection_test(ok);
            reporter->report_end();
            conn.close();
            return ok ? EXIT_OK : EXIT_TEST_FAILED;
        }

        std::string destination;
        if (!out_path.empty()) {
            auto sink = open_sink(out_path);
            conn.query_stream(sql, sink);
            core::check_arrow(sink->Close(), "close output");
            destination = (out_path == "-") ? "stdout" : out_path;
        } else {
            // Nothing to write: export and drop each batch
            conn.query_capsules_each(sql, [](output::ExportedBatch&&) {});
        }

        if (auto schema = conn.last_query_schema()) {
            reporter->report_schema(*schema);
        }
        reporter->report_warnings(conn.last_query_warnings());
        reporter->report_summary(conn.last_query_stats(), destination);
        reporter->report_end();
        conn.close();
        return EXIT_OK;

    } catch (const Error& e) {
        reporter->report_error(e);
        reporter->report_end();
        return exit_code_for(e.category());
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return EXIT_OTHER_ERROR;
    }
}
