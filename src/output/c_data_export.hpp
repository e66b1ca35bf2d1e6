#pragma once

#include <arrow/c/abi.h>
#include <arrow/record_batch.h>
#include <memory>

namespace ibarrow::output {

/**
 * @brief One record batch exported through the Arrow C Data Interface
 *
 * Owns an ArrowSchema and an ArrowArray. Ownership of either structure
 * passes to an importer through release_schema()/release_array(): the
 * structure is moved out and the copy held here is marked released.
 * Whatever is still owned on destruction is released exactly once.
 */
class ExportedBatch {
public:
    // Empty: both structures already released
    ExportedBatch() noexcept;
    ~ExportedBatch();

    ExportedBatch(ExportedBatch&& other) noexcept;
    ExportedBatch& operator=(ExportedBatch&& other) noexcept;
    ExportedBatch(const ExportedBatch&) = delete;
    ExportedBatch& operator=(const ExportedBatch&) = delete;

    // Throws ArrowError{Decode} if the export fails
    static ExportedBatch from_record_batch(const arrow::RecordBatch& batch);

    bool owns_schema() const noexcept;
    bool owns_array() const noexcept;

    // Borrowed views, for importers that move from the pointer themselves
    ArrowSchema* schema() noexcept { return &schema_; }
    ArrowArray* array() noexcept { return &array_; }

    ArrowSchema release_schema() noexcept;
    ArrowArray release_array() noexcept;

    int64_t num_rows() const noexcept;

    void reset() noexcept;

private:
    ArrowSchema schema_;
    ArrowArray array_;
};

// Imports the pair back without copying buffers; consumes both structures
std::shared_ptr<arrow::RecordBatch> import_batch(ExportedBatch&& exported);

} // namespace ibarrow::output
