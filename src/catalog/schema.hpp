#pragma once

/**
 * @file schema.hpp
 * @brief Table schema and its physical record layout
 */

#include <string>
#include <vector>

#include "catalog/column.hpp"

namespace mdfkit {

/**
 * @brief Where a column lives inside a record
 *
 * Fixed columns are packed in column order from the start of the fixed
 * region; up to eight bit columns share one byte, allocated where the first
 * of them appears. Variable columns are numbered in column order. Computed
 * columns have no storage and no null bit.
 */
struct ColumnLayout {
    bool stored = true;
    bool variable = false;
    size_t fixed_offset = 0;    // relative to the fixed region (record offset 4)
    size_t fixed_width = 0;     // bytes; 1 for bit columns
    uint8_t bit_index = 0;      // bit columns only
    size_t null_bit = 0;        // index in the null bitmap
    size_t variable_index = 0;  // variable columns only
};

/**
 * @brief Table schema - ordered columns plus the derived layout
 */
class Schema {
public:
    Schema() = default;
    explicit Schema(std::vector<Column> columns);

    [[nodiscard]] const std::vector<Column>& columns() const noexcept {
        return columns_;
    }

    [[nodiscard]] size_t column_count() const noexcept {
        return columns_.size();
    }

    [[nodiscard]] const Column& column(size_t idx) const {
        return columns_.at(idx);
    }

    [[nodiscard]] const ColumnLayout& layout(size_t idx) const {
        return layouts_.at(idx);
    }

    /// Get column index by name, returns -1 if not found
    [[nodiscard]] int get_column_index(const std::string& name) const;

    /// Bytes of the fixed region
    [[nodiscard]] size_t fixed_width() const noexcept { return fixed_width_; }

    /// Record header plus fixed region; what pages of this table report as p_min_len
    [[nodiscard]] size_t min_record_length() const noexcept { return fixed_width_ + 4; }

    [[nodiscard]] size_t stored_column_count() const noexcept { return stored_count_; }
    [[nodiscard]] size_t variable_column_count() const noexcept { return variable_count_; }

    [[nodiscard]] std::string to_string() const;

private:
    void compute_layout();

    std::vector<Column> columns_;
    std::vector<ColumnLayout> layouts_;
    size_t fixed_width_ = 0;
    size_t stored_count_ = 0;
    size_t variable_count_ = 0;
};

}  // namespace mdfkit
