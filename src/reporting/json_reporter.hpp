#pragma once

#include "reporter.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace ibarrow::reporting {

// JSON reporter for structured output
class JsonReporter : public Reporter {
public:
    // Without a file the document goes to `out`
    explicit JsonReporter(const std::string& output_file = "", std::ostream& out = std::cout)
        : output_file_(output_file), out_(out) {}

    void report_start(const std::string& connection_description) override;
    void report_connection_test(bool ok) override;
    void report_schema(const arrow::Schema& schema) override;
    void report_warnings(const std::vector<ArrowError>& warnings) override;
    void report_summary(const pipeline::PipelineStats& stats,
                        const std::string& destination) override;
    void report_error(const Error& error) override;
    void report_end() override;

    const nlohmann::json& document() const noexcept { return root_; }

private:
    std::string output_file_;
    std::ostream& out_;
    nlohmann::json root_;
};

} // namespace ibarrow::reporting
