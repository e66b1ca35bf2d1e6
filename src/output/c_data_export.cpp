#include "c_data_export.hpp"
#include "core/error_translator.hpp"
#include <arrow/c/bridge.h>
#include <arrow/c/helpers.h>

namespace ibarrow::output {

namespace {

// The C helpers require a live source; a released one just marks dest
void move_schema(ArrowSchema* src, ArrowSchema* dest) noexcept {
    if (ArrowSchemaIsReleased(src)) {
        ArrowSchemaMarkReleased(dest);
    } else {
        ArrowSchemaMove(src, dest);
    }
}

void move_array(ArrowArray* src, ArrowArray* dest) noexcept {
    if (ArrowArrayIsReleased(src)) {
        ArrowArrayMarkReleased(dest);
    } else {
        ArrowArrayMove(src, dest);
    }
}

} // anonymous namespace

ExportedBatch::ExportedBatch() noexcept {
    ArrowSchemaMarkReleased(&schema_);
    ArrowArrayMarkReleased(&array_);
}

ExportedBatch::~ExportedBatch() {
    reset();
}

ExportedBatch::ExportedBatch(ExportedBatch&& other) noexcept {
    move_schema(&other.schema_, &schema_);
    move_array(&other.array_, &array_);
}

ExportedBatch& ExportedBatch::operator=(ExportedBatch&& other) noexcept {
    if (this != &other) {
        reset();
        move_schema(&other.schema_, &schema_);
        move_array(&other.array_, &array_);
    }
    return *this;
}

ExportedBatch ExportedBatch::from_record_batch(const arrow::RecordBatch& batch) {
    ExportedBatch exported;
    core::check_arrow(arrow::ExportRecordBatch(batch, &exported.array_, &exported.schema_),
                      "export record batch");
    return exported;
}

bool ExportedBatch::owns_schema() const noexcept {
    return !ArrowSchemaIsReleased(&schema_);
}

bool ExportedBatch::owns_array() const noexcept {
    return !ArrowArrayIsReleased(&array_);
}

ArrowSchema ExportedBatch::release_schema() noexcept {
    ArrowSchema out;
    move_schema(&schema_, &out);
    return out;
}

ArrowArray ExportedBatch::release_array() noexcept {
    ArrowArray out;
    move_array(&array_, &out);
    return out;
}

int64_t ExportedBatch::num_rows() const noexcept {
    return owns_array() ? array_.length : 0;
}

void ExportedBatch::reset() noexcept {
    // Both helpers are no-ops on a released structure
    ArrowArrayRelease(&array_);
    ArrowSchemaRelease(&schema_);
}

std::shared_ptr<arrow::RecordBatch> import_batch(ExportedBatch&& exported) {
    ExportedBatch owned(std::move(exported));
    // ImportRecordBatch moves from both structures, also on failure
    return core::check_arrow(arrow::ImportRecordBatch(owned.array(), owned.schema()),
                             "import record batch");
}

} // namespace ibarrow::output
