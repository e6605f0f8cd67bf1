#pragma once

/**
 * @file column.hpp
 * @brief Column metadata
 */

#include <string>

#include "types/sql_type.hpp"

namespace mdfkit {

/**
 * @brief Column definition in a table schema
 */
class Column {
public:
    Column(std::string name, TypeInfo type, bool nullable = true);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const TypeInfo& type() const noexcept { return type_; }
    [[nodiscard]] SqlType sql_type() const noexcept { return type_.type; }
    [[nodiscard]] bool is_nullable() const noexcept { return nullable_; }
    [[nodiscard]] bool is_variable() const noexcept { return type_.is_variable(); }

    /// Computed columns are not stored in the record
    [[nodiscard]] bool is_computed() const noexcept { return computed_; }

    /// syscolpars.colid
    [[nodiscard]] int32_t column_id() const noexcept { return column_id_; }

    void set_nullable(bool nullable) noexcept { nullable_ = nullable; }
    void set_computed(bool computed) noexcept { computed_ = computed; }
    void set_column_id(int32_t column_id) noexcept { column_id_ = column_id; }

    /// "name type [NULL|NOT NULL]"
    [[nodiscard]] std::string to_string() const;

private:
    std::string name_;
    TypeInfo type_;
    bool nullable_;
    bool computed_ = false;
    int32_t column_id_ = 0;
};

}  // namespace mdfkit
