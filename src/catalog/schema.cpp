/**
 * @file schema.cpp
 * @brief Schema implementation
 */

#include "catalog/schema.hpp"

namespace mdfkit {

Schema::Schema(std::vector<Column> columns) : columns_(std::move(columns)) {
    compute_layout();
}

void Schema::compute_layout() {
    layouts_.clear();
    layouts_.reserve(columns_.size());

    size_t offset = 0;
    size_t bits = 0;
    size_t bit_byte = 0;

    for (const Column& column : columns_) {
        ColumnLayout layout;
        if (column.is_computed()) {
            layout.stored = false;
            layouts_.push_back(layout);
            continue;
        }

        layout.null_bit = stored_count_++;

        if (column.is_variable()) {
            layout.variable = true;
            layout.variable_index = variable_count_++;
        } else if (column.sql_type() == SqlType::kBit) {
            if (bits % 8 == 0) {
                bit_byte = offset;
                offset += 1;
            }
            layout.fixed_offset = bit_byte;
            layout.fixed_width = 1;
            layout.bit_index = static_cast<uint8_t>(bits % 8);
            ++bits;
        } else {
            layout.fixed_offset = offset;
            layout.fixed_width = column.type().fixed_width();
            offset += layout.fixed_width;
        }
        layouts_.push_back(layout);
    }

    fixed_width_ = offset;
}

int Schema::get_column_index(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name() == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::string Schema::to_string() const {
    std::string out = "(";
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += columns_[i].to_string();
    }
    out += ")";
    return out;
}

}  // namespace mdfkit
