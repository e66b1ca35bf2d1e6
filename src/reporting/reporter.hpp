#pragma once

#include "errors.hpp"
#include "pipeline/pipeline.hpp"
#include <arrow/type.h>
#include <string>
#include <vector>

namespace ibarrow::reporting {

// Reporter interface for the summary of one command-line run
class Reporter {
public:
    virtual ~Reporter() = default;

    // Report the start of the run; the description is already redacted
    virtual void report_start(const std::string& connection_description) = 0;

    virtual void report_connection_test(bool ok) = 0;

    // Report the result schema of the query
    virtual void report_schema(const arrow::Schema& schema) = 0;

    virtual void report_warnings(const std::vector<ArrowError>& warnings) = 0;

    // Report batches, rows and timing of the query
    virtual void report_summary(const pipeline::PipelineStats& stats,
                                const std::string& destination) = 0;

    virtual void report_error(const Error& error) = 0;

    // Report the end of the run
    virtual void report_end() = 0;
};

} // namespace ibarrow::reporting
