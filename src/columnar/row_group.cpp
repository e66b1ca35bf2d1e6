#include "row_group.hpp"
#include <algorithm>

namespace ibarrow::columnar {

ColumnBuffer::ColumnBuffer(const DecodeRule& rule, size_t capacity)
    : c_type_(rule.c_type),
      element_size_(rule.element_size),
      max_value_bytes_(rule.max_value_bytes),
      values_(rule.element_size * capacity),
      indicators_(capacity, SQL_NULL_DATA) {
}

void ColumnBuffer::set_bytes(size_t row, std::string_view bytes) noexcept {
    size_t room = element_size_;
    if (c_type_ == SQL_C_CHAR) {
        room = element_size_ - 1;   // terminator
    }
    size_t n = std::min(bytes.size(), room);

    uint8_t* dst = value_ptr(row);
    std::memcpy(dst, bytes.data(), n);
    if (c_type_ == SQL_C_CHAR) {
        dst[n] = 0;
    }
    indicators_[row] = static_cast<SQLLEN>(bytes.size());
}

RowGroup::RowGroup(const std::vector<DecodeRule>& rules, size_t capacity)
    : capacity_(capacity) {
    columns_.reserve(rules.size());
    for (const auto& rule : rules) {
        columns_.emplace_back(rule, capacity);
    }
}

size_t RowGroup::allocated_bytes() const noexcept {
    size_t total = 0;
    for (const auto& column : columns_) {
        total += column.allocated_bytes();
    }
    return total;
}

} // namespace ibarrow::columnar
