#pragma once

/**
 * @file row.hpp
 * @brief Decoded row
 */

#include <memory>
#include <string>
#include <vector>

#include "catalog/schema.hpp"
#include "types/value.hpp"

namespace mdfkit {

/**
 * @brief One decoded row: a value per schema column
 */
class Row {
public:
    Row() = default;
    Row(std::shared_ptr<const Schema> schema, std::vector<SqlValue> values)
        : schema_(std::move(schema)), values_(std::move(values)) {}

    [[nodiscard]] const std::vector<SqlValue>& values() const noexcept { return values_; }
    [[nodiscard]] size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    [[nodiscard]] const SqlValue& operator[](size_t idx) const { return values_.at(idx); }

    /**
     * @brief Value by column name
     * @return nullptr if the schema has no such column
     */
    [[nodiscard]] const SqlValue* get(const std::string& name) const;

    [[nodiscard]] const SqlValue& operator[](const std::string& name) const;

    [[nodiscard]] const std::shared_ptr<const Schema>& schema() const noexcept { return schema_; }

    /// "name=value, name=value"
    [[nodiscard]] std::string to_string() const;

private:
    std::shared_ptr<const Schema> schema_;
    std::vector<SqlValue> values_;
};

}  // namespace mdfkit
