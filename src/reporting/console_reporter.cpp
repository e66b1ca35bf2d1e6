#include "console_reporter.hpp"
#include "ibarrow/version.hpp"
#include <iomanip>
#include <sstream>

namespace ibarrow::reporting {

void ConsoleReporter::report_start(const std::string& connection_description) {
    out_ << "ibarrow v" << IBARROW_VERSION << " - ODBC to Arrow\n";
    out_ << "  Source:       " << connection_description << "\n\n";
}

void ConsoleReporter::report_connection_test(bool ok) {
    out_ << "Connection test: " << (ok ? "[OK] round-trip succeeded" : "[FAIL] no round-trip")
         << "\n\n";
}

void ConsoleReporter::report_schema(const arrow::Schema& schema) {
    out_ << "SCHEMA (" << schema.num_fields() << " columns):\n";

    size_t width = 4;
    for (const auto& field : schema.fields()) {
        width = std::max(width, field->name().size());
    }
    for (const auto& field : schema.fields()) {
        out_ << "  " << std::left << std::setw(static_cast<int>(width) + 2) << field->name()
             << field->type()->ToString();
        if (!field->nullable()) {
            out_ << " not null";
        }
        out_ << "\n";
    }
    out_ << std::right << "\n";
}

void ConsoleReporter::report_warnings(const std::vector<ArrowError>& warnings) {
    if (warnings.empty()) {
        return;
    }
    out_ << "WARNINGS (" << warnings.size() << "):\n";
    for (const auto& warning : warnings) {
        out_ << "  [!] " << warning.kind_name() << ": " << warning.what() << "\n";
    }
    out_ << "\n";
}

void ConsoleReporter::report_summary(const pipeline::PipelineStats& stats,
                                     const std::string& destination) {
    out_ << "SUMMARY:\n";
    out_ << "  Rows:         " << stats.rows << "\n";
    out_ << "  Batches:      " << stats.batches << "\n";
    if (stats.elapsed.count() > 0 && stats.rows > 0) {
        out_ << "  Throughput:   " << std::fixed << std::setprecision(0)
             << (stats.rows * 1000.0 / stats.elapsed.count()) << " rows/s\n";
    }
    out_ << "  Total Time:   "
         << format_duration(std::chrono::duration_cast<std::chrono::microseconds>(stats.elapsed))
         << "\n";
    if (verbose_) {
        out_ << "  Peak groups:  " << stats.peak_in_flight << " in flight, "
             << stats.row_groups_allocated << " allocated ("
             << format_bytes(stats.row_group_bytes) << ")\n";
    }
    if (!destination.empty()) {
        out_ << "  Output:       " << destination << "\n";
    }
    out_ << "\n";
}

void ConsoleReporter::report_error(const Error& error) {
    out_ << "ERROR: " << category_to_string(error.category()) << "{" << error.kind_name()
         << "}: " << error.what() << "\n";
    if (verbose_) {
        for (const auto& diag : error.diagnostics()) {
            out_ << "  [" << diag.sqlstate << "] (" << diag.native_error << ") "
                 << diag.message << "\n";
        }
    }
    out_ << "\n";
}

void ConsoleReporter::report_end() {
    out_.flush();
}

std::string ConsoleReporter::format_duration(std::chrono::microseconds duration) {
    auto us = duration.count();

    if (us < 1000) {
        return std::to_string(us) + " us";
    } else if (us < 1000000) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << (us / 1000.0) << " ms";
        return oss.str();
    } else {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << (us / 1000000.0) << " s";
        return oss.str();
    }
}

std::string ConsoleReporter::format_bytes(size_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (bytes / 1024.0) << " KiB";
    } else {
        oss << std::fixed << std::setprecision(1) << (bytes / (1024.0 * 1024.0)) << " MiB";
    }
    return oss.str();
}

} // namespace ibarrow::reporting
