#include "output_adapter.hpp"
#include "core/error_translator.hpp"
#include "core/logger.hpp"
#include <arrow/ipc/reader.h>

namespace ibarrow::output {

using core::check_arrow;

namespace {

// std::visit helper
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

const char* handoff_to_string(HandoffStrategy strategy) {
    switch (strategy) {
        case HandoffStrategy::CDataInterface: return "c-data-interface";
        case HandoffStrategy::IpcStream:      return "ipc-stream";
        default: return "unknown";
    }
}

OutputAdapter::OutputAdapter(OutputFormat format, arrow::MemoryPool* pool)
    : state_(std::visit(overloaded{
          [](StreamOutput& f) -> std::variant<StreamState, CapsuleState, TableState> {
              return StreamState{std::move(f.sink), nullptr, nullptr};
          },
          [](CapsuleOutput& f) -> std::variant<StreamState, CapsuleState, TableState> {
              return CapsuleState{std::move(f.each), {}};
          },
          [](TableOutput& f) -> std::variant<StreamState, CapsuleState, TableState> {
              return TableState{f.strategy, {}};
          }}, format)),
      pool_(pool) {
}

void OutputAdapter::begin(std::shared_ptr<arrow::Schema> schema) {
    schema_ = std::move(schema);

    if (auto* stream = std::get_if<StreamState>(&state_)) {
        if (!stream->sink) {
            stream->buffer = check_arrow(arrow::io::BufferOutputStream::Create(4096, pool_),
                                         "create IPC buffer");
            stream->sink = stream->buffer;
        }
        // The schema message goes out before the first batch
        stream->writer = check_arrow(arrow::ipc::MakeStreamWriter(stream->sink, schema_),
                                     "open IPC stream writer");
    }
}

void OutputAdapter::consume(columnar::Batch&& batch) {
    ++batches_consumed_;
    std::visit(overloaded{
        [&](StreamState& s) {
            check_arrow(s.writer->WriteRecordBatch(*batch.record_batch), "write IPC batch");
            if (!s.buffer) {
                check_arrow(s.sink->Flush(), "flush IPC sink");
            }
        },
        [&](CapsuleState& s) {
            if (s.each) {
                s.each(ExportedBatch::from_record_batch(*batch.record_batch));
            } else {
                s.batches.push_back(std::move(batch.record_batch));
            }
        },
        [&](TableState& s) {
            s.batches.push_back(std::move(batch.record_batch));
        }}, state_);
}

OutputResult OutputAdapter::finish() {
    return std::visit(overloaded{
        [&](StreamState& s) { return finish_stream(s); },
        [&](CapsuleState& s) { return finish_capsules(s); },
        [&](TableState& s) { return finish_table(s); }}, state_);
}

OutputResult OutputAdapter::finish_stream(StreamState& state) {
    // End-of-stream marker
    check_arrow(state.writer->Close(), "close IPC stream");
    if (!state.buffer) {
        return std::monostate{};
    }
    std::shared_ptr<arrow::Buffer> bytes = check_arrow(state.buffer->Finish(), "finish IPC buffer");
    LOG_DEBUG("IPC stream of " + std::to_string(bytes->size()) + " bytes, " +
              std::to_string(batches_consumed_) + " batches");
    return bytes;
}

OutputResult OutputAdapter::finish_capsules(CapsuleState& state) {
    if (state.each) {
        if (batches_consumed_ == 0) {
            auto empty = check_arrow(arrow::RecordBatch::MakeEmpty(schema_, pool_), "empty batch");
            state.each(ExportedBatch::from_record_batch(*empty));
        }
        return std::monostate{};
    }

    std::shared_ptr<arrow::RecordBatch> combined;
    if (state.batches.empty()) {
        combined = check_arrow(arrow::RecordBatch::MakeEmpty(schema_, pool_), "empty batch");
    } else if (state.batches.size() == 1) {
        combined = std::move(state.batches.front());
    } else {
        auto table = check_arrow(arrow::Table::FromRecordBatches(schema_, state.batches),
                                 "assemble table");
        combined = check_arrow(table->CombineChunksToBatch(pool_), "concatenate batches");
    }
    state.batches.clear();
    return ExportedBatch::from_record_batch(*combined);
}

OutputResult OutputAdapter::finish_table(TableState& state) {
    if (state.strategy == HandoffStrategy::IpcStream) {
        auto stream = write_ipc_stream(schema_, state.batches, pool_);
        state.batches.clear();
        return read_ipc_stream(stream);
    }

    std::vector<std::shared_ptr<arrow::RecordBatch>> handed_off;
    handed_off.reserve(state.batches.size());
    for (auto& batch : state.batches) {
        handed_off.push_back(import_batch(ExportedBatch::from_record_batch(*batch)));
        batch.reset();
    }
    state.batches.clear();
    return check_arrow(arrow::Table::FromRecordBatches(schema_, handed_off), "assemble table");
}

std::shared_ptr<arrow::Buffer> write_ipc_stream(
    const std::shared_ptr<arrow::Schema>& schema,
    const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
    arrow::MemoryPool* pool) {
    auto sink = check_arrow(arrow::io::BufferOutputStream::Create(4096, pool), "create IPC buffer");
    auto writer = check_arrow(arrow::ipc::MakeStreamWriter(sink, schema), "open IPC stream writer");
    for (const auto& batch : batches) {
        check_arrow(writer->WriteRecordBatch(*batch), "write IPC batch");
    }
    check_arrow(writer->Close(), "close IPC stream");
    return check_arrow(sink->Finish(), "finish IPC buffer");
}

std::shared_ptr<arrow::Table> read_ipc_stream(const std::shared_ptr<arrow::Buffer>& stream) {
    auto input = std::make_shared<arrow::io::BufferReader>(stream);
    auto reader = check_arrow(arrow::ipc::RecordBatchStreamReader::Open(input),
                              "open IPC stream reader");
    return check_arrow(reader->ToTable(), "read IPC stream");
}

} // namespace ibarrow::output
