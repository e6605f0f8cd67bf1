/**
 * @file column.cpp
 * @brief Column implementation
 */

#include "catalog/column.hpp"

namespace mdfkit {

Column::Column(std::string name, TypeInfo type, bool nullable)
    : name_(std::move(name)), type_(type), nullable_(nullable) {}

std::string Column::to_string() const {
    std::string out = name_ + " " + type_.to_string();
    if (computed_) {
        out += " COMPUTED";
    }
    out += nullable_ ? " NULL" : " NOT NULL";
    return out;
}

}  // namespace mdfkit
