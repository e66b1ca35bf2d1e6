#pragma once

#include "type_mapper.hpp"
#include <cstdint>
#include <cstring>
#include <string_view>
#include <vector>

namespace ibarrow::columnar {

/**
 * @brief Column-wise ODBC bind buffer for a group of rows
 *
 * Values are stored row after row with a fixed stride (element_size) and
 * one length/indicator per row, exactly as SQLBindCol with column-wise
 * binding expects, so a block cursor can fetch straight into it.
 */
class ColumnBuffer {
public:
    ColumnBuffer(const DecodeRule& rule, size_t capacity);

    SQLSMALLINT c_type() const noexcept { return c_type_; }
    size_t element_size() const noexcept { return element_size_; }
    size_t max_value_bytes() const noexcept { return max_value_bytes_; }
    size_t capacity() const noexcept { return indicators_.size(); }

    uint8_t* value_ptr(size_t row) noexcept { return values_.data() + row * element_size_; }
    const uint8_t* value_ptr(size_t row) const noexcept { return values_.data() + row * element_size_; }
    SQLLEN* indicator_ptr(size_t row) noexcept { return indicators_.data() + row; }

    SQLLEN indicator(size_t row) const noexcept { return indicators_[row]; }
    bool is_null(size_t row) const noexcept { return indicators_[row] == SQL_NULL_DATA; }

    template <typename T>
    T get(size_t row) const noexcept {
        T value;
        std::memcpy(&value, value_ptr(row), sizeof(T));
        return value;
    }

    // Writers with the same observable effect as a driver filling the buffer
    void set_null(size_t row) noexcept { indicators_[row] = SQL_NULL_DATA; }

    template <typename T>
    void set(size_t row, const T& value) noexcept {
        std::memcpy(value_ptr(row), &value, sizeof(T));
        indicators_[row] = static_cast<SQLLEN>(sizeof(T));
    }

    // Copies what fits; the indicator keeps the full length, as on 01004
    void set_bytes(size_t row, std::string_view bytes) noexcept;

    size_t allocated_bytes() const noexcept {
        return values_.size() + indicators_.size() * sizeof(SQLLEN);
    }

private:
    SQLSMALLINT c_type_;
    size_t element_size_;
    size_t max_value_bytes_;
    std::vector<uint8_t> values_;
    std::vector<SQLLEN> indicators_;
};

// Bind buffer bytes one row of a column takes, value plus indicator
inline uint64_t row_bytes(const DecodeRule& rule) noexcept {
    return static_cast<uint64_t>(rule.element_size) + sizeof(SQLLEN);
}

// Buffers for up to `capacity` rows of every column, plus the filled count
class RowGroup {
public:
    RowGroup(const std::vector<DecodeRule>& rules, size_t capacity);

    RowGroup(RowGroup&&) noexcept = default;
    RowGroup& operator=(RowGroup&&) noexcept = default;
    RowGroup(const RowGroup&) = delete;
    RowGroup& operator=(const RowGroup&) = delete;

    size_t capacity() const noexcept { return capacity_; }
    size_t num_rows() const noexcept { return num_rows_; }
    void set_num_rows(size_t rows) noexcept { num_rows_ = rows; }

    // Index of this group's first row within the whole result set
    int64_t first_row() const noexcept { return first_row_; }
    void set_first_row(int64_t row) noexcept { first_row_ = row; }

    size_t num_columns() const noexcept { return columns_.size(); }
    ColumnBuffer& column(size_t i) { return columns_[i]; }
    const ColumnBuffer& column(size_t i) const { return columns_[i]; }

    size_t allocated_bytes() const noexcept;

private:
    std::vector<ColumnBuffer> columns_;
    size_t capacity_ = 0;
    size_t num_rows_ = 0;
    int64_t first_row_ = 0;
};

} // namespace ibarrow::columnar
