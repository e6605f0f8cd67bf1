/**
 * @file row.cpp
 * @brief Row implementation
 */

#include "catalog/row.hpp"

#include <stdexcept>

namespace mdfkit {

const SqlValue* Row::get(const std::string& name) const {
    if (schema_ == nullptr) {
        return nullptr;
    }
    int idx = schema_->get_column_index(name);
    if (idx < 0 || static_cast<size_t>(idx) >= values_.size()) {
        return nullptr;
    }
    return &values_[static_cast<size_t>(idx)];
}

const SqlValue& Row::operator[](const std::string& name) const {
    const SqlValue* value = get(name);
    if (value == nullptr) {
        throw std::out_of_range("no column named " + name);
    }
    return *value;
}

std::string Row::to_string() const {
    std::string out;
    for (size_t i = 0; i < values_.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        if (schema_ != nullptr && i < schema_->column_count()) {
            out += schema_->column(i).name();
            out += "=";
        }
        out += values_[i].to_string();
    }
    return out;
}

}  // namespace mdfkit
