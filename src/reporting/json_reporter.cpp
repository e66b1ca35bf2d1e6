#include "json_reporter.hpp"
#include "ibarrow/version.hpp"
#include <ctime>
#include <iomanip>

namespace ibarrow::reporting {

void JsonReporter::report_start(const std::string& connection_description) {
    root_ = nlohmann::json::object();
    root_["version"] = IBARROW_VERSION;
    root_["source"] = connection_description;
    root_["timestamp"] = std::time(nullptr);
}

void JsonReporter::report_connection_test(bool ok) {
    root_["connection_test"] = ok;
}

void JsonReporter::report_schema(const arrow::Schema& schema) {
    nlohmann::json columns = nlohmann::json::array();
    for (const auto& field : schema.fields()) {
        nlohmann::json column;
        column["name"] = field->name();
        column["type"] = field->type()->ToString();
        column["nullable"] = field->nullable();
        columns.push_back(column);
    }
    root_["schema"] = columns;
}

void JsonReporter::report_warnings(const std::vector<ArrowError>& warnings) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& warning : warnings) {
        nlohmann::json w;
        w["kind"] = warning.kind_name();
        w["message"] = warning.what();
        if (warning.column()) {
            w["column"] = *warning.column();
        }
        if (warning.row()) {
            w["row"] = *warning.row();
        }
        list.push_back(w);
    }
    root_["warnings"] = list;
}

void JsonReporter::report_summary(const pipeline::PipelineStats& stats,
                                  const std::string& destination) {
    nlohmann::json summary;
    summary["rows"] = stats.rows;
    summary["batches"] = stats.batches;
    summary["peak_in_flight"] = stats.peak_in_flight;
    summary["row_groups_allocated"] = stats.row_groups_allocated;
    summary["row_group_bytes"] = stats.row_group_bytes;
    summary["elapsed_ms"] = stats.elapsed.count();
    if (!destination.empty()) {
        summary["output"] = destination;
    }
    root_["summary"] = summary;
}

void JsonReporter::report_error(const Error& error) {
    nlohmann::json err;
    err["category"] = category_to_string(error.category());
    err["kind"] = error.kind_name();
    err["message"] = error.what();

    nlohmann::json diagnostics = nlohmann::json::array();
    for (const auto& diag : error.diagnostics()) {
        diagnostics.push_back({
            {"sqlstate", diag.sqlstate},
            {"native_error", diag.native_error},
            {"message", diag.message}
        });
    }
    err["diagnostics"] = diagnostics;
    root_["error"] = err;
}

void JsonReporter::report_end() {
    if (output_file_.empty()) {
        out_ << std::setw(2) << root_ << std::endl;
    } else {
        std::ofstream file(output_file_);
        if (file.is_open()) {
            file << std::setw(2) << root_ << std::endl;
        } else {
            std::cerr << "Error: Could not write to " << output_file_ << std::endl;
        }
    }
}

} // namespace ibarrow::reporting
