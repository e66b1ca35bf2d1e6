#pragma once

#include "reporter.hpp"
#include <chrono>
#include <iostream>

namespace ibarrow::reporting {

// Console reporter with formatted output
class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& out = std::cout, bool verbose = false)
        : out_(out), verbose_(verbose) {}

    void report_start(const std::string& connection_description) override;
    void report_connection_test(bool ok) override;
    void report_schema(const arrow::Schema& schema) override;
    void report_warnings(const std::vector<ArrowError>& warnings) override;
    void report_summary(const pipeline::PipelineStats& stats,
                        const std::string& destination) override;
    void report_error(const Error& error) override;
    void report_end() override;

    static std::string format_duration(std::chrono::microseconds duration);
    static std::string format_bytes(size_t bytes);

private:
    std::ostream& out_;
    bool verbose_;
};

} // namespace ibarrow::reporting
