#pragma once

/**
 * @file sql_type.hpp
 * @brief SQL Server column types and their physical layout
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mdfkit {

/**
 * @brief Declared column types
 *
 * Every type SQL Server can store is listed so that its physical layout
 * (fixed width or variable) is known, even when the value itself is only
 * surfaced as opaque bytes.
 */
enum class SqlType : uint8_t {
    kUnknown = 0,

    // Decoded types
    kTinyInt,
    kSmallInt,
    kInt,
    kBigInt,
    kReal,
    kFloat,
    kBit,
    kBinary,
    kVarBinary,
    kChar,
    kVarChar,
    kNChar,
    kNVarChar,
    kSysName,
    kDateTime,
    kSmallDateTime,
    kUniqueIdentifier,
    kSqlVariant,
    kImage,
    kText,
    kNText,

    // Layout known, value surfaced as opaque bytes
    kDecimal,
    kNumeric,
    kMoney,
    kSmallMoney,
    kTimestamp,
    kDate,
    kTime,
    kDateTime2,
    kDateTimeOffset,
    kXml,
    kClr,  // hierarchyid, geometry, geography
};

/**
 * @brief Static facts about one xtype
 */
struct SqlTypeTraits {
    uint8_t xtype;
    SqlType type;
    const char* name;
    uint8_t fixed_size;  // 0 for variable-length or length-dependent
    bool variable;
    bool supported;      // decoded into a typed value
};

/**
 * @brief Look up an xtype
 * @return nullptr for xtypes outside the table
 */
[[nodiscard]] const SqlTypeTraits* sql_type_traits(uint8_t xtype) noexcept;

/**
 * @brief Traits of a SqlType (first xtype mapping to it)
 * @return nullptr for kUnknown
 */
[[nodiscard]] const SqlTypeTraits* sql_type_traits(SqlType type) noexcept;

/// Map an xtype; unknown xtypes map to kUnknown
[[nodiscard]] SqlType sql_type_from_xtype(uint8_t xtype) noexcept;

/// Map a type name ("int", "nvarchar", "sysname", ...); kUnknown if unknown
[[nodiscard]] SqlType sql_type_from_name(std::string_view name) noexcept;

[[nodiscard]] const char* sql_type_name(SqlType type) noexcept;

/// Unknown types are treated as variable-length
[[nodiscard]] bool is_variable_length(SqlType type) noexcept;

[[nodiscard]] bool is_supported(SqlType type) noexcept;

/// text, ntext, image
[[nodiscard]] bool is_text_pointer_type(SqlType type) noexcept;

/// Unicode character types (nchar, nvarchar, sysname, ntext)
[[nodiscard]] bool is_unicode(SqlType type) noexcept;

/**
 * @brief Declared type of a column
 */
struct TypeInfo {
    SqlType type = SqlType::kUnknown;
    uint8_t xtype = 0;
    int16_t max_length = 0;  // bytes; -1 = max
    uint8_t precision = 0;
    uint8_t scale = 0;

    TypeInfo() = default;
    TypeInfo(SqlType t, uint8_t xt, int16_t len, uint8_t prec = 0, uint8_t sc = 0)
        : type(t), xtype(xt), max_length(len), precision(prec), scale(sc) {}

    /// varchar(max), nvarchar(max), varbinary(max)
    [[nodiscard]] bool is_max() const noexcept { return max_length == -1; }

    [[nodiscard]] bool is_variable() const noexcept { return is_variable_length(type); }

    /// Values may be stored out of row and come back as LOB descriptors
    [[nodiscard]] bool is_lob_class() const noexcept;

    /**
     * @brief Bytes occupied in the fixed region
     *
     * 0 for variable-length types and for bit (bits are packed separately).
     */
    [[nodiscard]] size_t fixed_width() const noexcept;

    /// "nvarchar(50)", "varbinary(max)", "decimal(18,2)", "int"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const TypeInfo& other) const noexcept {
        return type == other.type && xtype == other.xtype && max_length == other.max_length &&
               precision == other.precision && scale == other.scale;
    }
};

}  // namespace mdfkit
