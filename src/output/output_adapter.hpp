#pragma once

#include "c_data_export.hpp"
#include "columnar/column_encoder.hpp"
#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/io/memory.h>
#include <arrow/ipc/writer.h>
#include <arrow/table.h>
#include <functional>
#include <memory>
#include <variant>
#include <vector>

namespace ibarrow::output {

// How query_table hands the accumulated batches to the host table
enum class HandoffStrategy {
    CDataInterface,   // export, then ImportRecordBatch: buffers are shared
    IpcStream         // serialize, then read back with the IPC stream reader
};

const char* handoff_to_string(HandoffStrategy strategy);

// IPC stream. Without a sink the stream is accumulated into one buffer.
struct StreamOutput {
    std::shared_ptr<arrow::io::OutputStream> sink;
};

// C Data Interface. With a callback every batch is exported as produced;
// without one the whole result is concatenated into one exported batch.
struct CapsuleOutput {
    std::function<void(ExportedBatch&&)> each;
};

struct TableOutput {
    HandoffStrategy strategy = HandoffStrategy::CDataInterface;
};

using OutputFormat = std::variant<StreamOutput, CapsuleOutput, TableOutput>;

// std::monostate when the output went to a caller-supplied sink or callback
using OutputResult = std::variant<std::monostate,
                                  std::shared_ptr<arrow::Buffer>,
                                  ExportedBatch,
                                  std::shared_ptr<arrow::Table>>;

/**
 * @brief Renders the batches of one query in the requested format
 *
 * begin() is called once with the schema before any batch, consume() for
 * every batch in fetch order, finish() once at the end. A result with no
 * rows still yields the schema: an IPC stream with zero record batches, a
 * single empty exported batch, or an empty table.
 */
class OutputAdapter {
public:
    explicit OutputAdapter(OutputFormat format,
                           arrow::MemoryPool* pool = arrow::default_memory_pool());

    void begin(std::shared_ptr<arrow::Schema> schema);
    void consume(columnar::Batch&& batch);
    OutputResult finish();

    int64_t batches_consumed() const noexcept { return batches_consumed_; }

private:
    struct StreamState {
        std::shared_ptr<arrow::io::OutputStream> sink;
        std::shared_ptr<arrow::io::BufferOutputStream> buffer;   // set when accumulating
        std::shared_ptr<arrow::ipc::RecordBatchWriter> writer;
    };

    struct CapsuleState {
        std::function<void(ExportedBatch&&)> each;
        std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
    };

    struct TableState {
        HandoffStrategy strategy;
        std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
    };

    OutputResult finish_stream(StreamState& state);
    OutputResult finish_capsules(CapsuleState& state);
    OutputResult finish_table(TableState& state);

    std::variant<StreamState, CapsuleState, TableState> state_;
    std::shared_ptr<arrow::Schema> schema_;
    arrow::MemoryPool* pool_;
    int64_t batches_consumed_ = 0;
};

// Serializes batches as an IPC stream into memory
std::shared_ptr<arrow::Buffer> write_ipc_stream(
    const std::shared_ptr<arrow::Schema>& schema,
    const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
    arrow::MemoryPool* pool = arrow::default_memory_pool());

// Reads a complete IPC stream back into a table
std::shared_ptr<arrow::Table> read_ipc_stream(const std::shared_ptr<arrow::Buffer>& stream);

} // namespace ibarrow::output
