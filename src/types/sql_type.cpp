/**
 * @file sql_type.cpp
 * @brief SQL type table
 */

#include "types/sql_type.hpp"

#include <array>

namespace mdfkit {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Type Table
// ─────────────────────────────────────────────────────────────────────────────

// xtype, type, name, fixed size, variable, supported
constexpr std::array<SqlTypeTraits, 35> kTypeTable = {{
    {34,  SqlType::kImage,            "image",            0,  true,  true},
    {35,  SqlType::kText,             "text",             0,  true,  true},
    {36,  SqlType::kUniqueIdentifier, "uniqueidentifier", 16, false, true},
    {40,  SqlType::kDate,             "date",             3,  false, false},
    {41,  SqlType::kTime,             "time",             0,  false, false},
    {42,  SqlType::kDateTime2,        "datetime2",        0,  false, false},
    {43,  SqlType::kDateTimeOffset,   "datetimeoffset",   0,  false, false},
    {48,  SqlType::kTinyInt,          "tinyint",          1,  false, true},
    {52,  SqlType::kSmallInt,         "smallint",         2,  false, true},
    {56,  SqlType::kInt,              "int",              4,  false, true},
    {58,  SqlType::kSmallDateTime,    "smalldatetime",    4,  false, true},
    {59,  SqlType::kReal,             "real",             4,  false, true},
    {60,  SqlType::kMoney,            "money",            8,  false, false},
    {61,  SqlType::kDateTime,         "datetime",         8,  false, true},
    {62,  SqlType::kFloat,            "float",            8,  false, true},
    {98,  SqlType::kSqlVariant,       "sql_variant",      0,  true,  true},
    {99,  SqlType::kNText,            "ntext",            0,  true,  true},
    {104, SqlType::kBit,              "bit",              1,  false, true},
    {106, SqlType::kDecimal,          "decimal",          0,  false, false},
    {108, SqlType::kNumeric,          "numeric",          0,  false, false},
    {122, SqlType::kSmallMoney,       "smallmoney",       4,  false, false},
    {127, SqlType::kBigInt,           "bigint",           8,  false, true},
    {165, SqlType::kVarBinary,        "varbinary",        0,  true,  true},
    {167, SqlType::kVarChar,          "varchar",          0,  true,  true},
    {173, SqlType::kBinary,           "binary",           0,  false, true},
    {175, SqlType::kChar,             "char",             0,  false, true},
    {189, SqlType::kTimestamp,        "timestamp",        8,  false, false},
    {231, SqlType::kNVarChar,         "nvarchar",         0,  true,  true},
    {231, SqlType::kSysName,          "sysname",          0,  true,  true},
    {239, SqlType::kNChar,            "nchar",            0,  false, true},
    {240, SqlType::kClr,              "hierarchyid",      0,  true,  false},
    {240, SqlType::kClr,              "geometry",         0,  true,  false},
    {240, SqlType::kClr,              "geography",        0,  true,  false},
    {241, SqlType::kXml,              "xml",              0,  true,  false},
    {189, SqlType::kTimestamp,        "rowversion",       8,  false, false},
}};

}  // namespace

const SqlTypeTraits* sql_type_traits(uint8_t xtype) noexcept {
    for (const auto& traits : kTypeTable) {
        if (traits.xtype == xtype) {
            return &traits;
        }
    }
    return nullptr;
}

const SqlTypeTraits* sql_type_traits(SqlType type) noexcept {
    if (type == SqlType::kUnknown) {
        return nullptr;
    }
    for (const auto& traits : kTypeTable) {
        if (traits.type == type) {
            return &traits;
        }
    }
    return nullptr;
}

SqlType sql_type_from_xtype(uint8_t xtype) noexcept {
    const SqlTypeTraits* traits = sql_type_traits(xtype);
    return traits == nullptr ? SqlType::kUnknown : traits->type;
}

SqlType sql_type_from_name(std::string_view name) noexcept {
    for (const auto& traits : kTypeTable) {
        if (name == traits.name) {
            return traits.type;
        }
    }
    return SqlType::kUnknown;
}

const char* sql_type_name(SqlType type) noexcept {
    const SqlTypeTraits* traits = sql_type_traits(type);
    return traits == nullptr ? "unknown" : traits->name;
}

bool is_variable_length(SqlType type) noexcept {
    const SqlTypeTraits* traits = sql_type_traits(type);
    return traits == nullptr || traits->variable;
}

bool is_supported(SqlType type) noexcept {
    const SqlTypeTraits* traits = sql_type_traits(type);
    return traits != nullptr && traits->supported;
}

bool is_text_pointer_type(SqlType type) noexcept {
    return type == SqlType::kText || type == SqlType::kNText || type == SqlType::kImage;
}

bool is_unicode(SqlType type) noexcept {
    return type == SqlType::kNChar || type == SqlType::kNVarChar ||
           type == SqlType::kSysName || type == SqlType::kNText;
}

// ─────────────────────────────────────────────────────────────────────────────
// TypeInfo
// ─────────────────────────────────────────────────────────────────────────────

bool TypeInfo::is_lob_class() const noexcept {
    if (is_text_pointer_type(type)) {
        return true;
    }
    switch (type) {
        case SqlType::kVarBinary:
        case SqlType::kVarChar:
        case SqlType::kNVarChar:
            // Row-overflow can push any of these out of row, not only max
            return true;
        case SqlType::kXml:
        case SqlType::kClr:
            return is_max() || max_length == 0;
        default:
            return false;
    }
}

size_t TypeInfo::fixed_width() const noexcept {
    if (is_variable() || type == SqlType::kBit) {
        return 0;
    }
    if (max_length > 0) {
        return static_cast<size_t>(max_length);
    }
    const SqlTypeTraits* traits = sql_type_traits(type);
    return traits == nullptr ? 0 : traits->fixed_size;
}

std::string TypeInfo::to_string() const {
    std::string name = sql_type_name(type);
    switch (type) {
        case SqlType::kBinary:
        case SqlType::kVarBinary:
        case SqlType::kChar:
        case SqlType::kVarChar:
            return name + "(" + (is_max() ? std::string("max") : std::to_string(max_length)) + ")";
        case SqlType::kNChar:
        case SqlType::kNVarChar:
            return name + "(" + (is_max() ? std::string("max") : std::to_string(max_length / 2)) +
                   ")";
        case SqlType::kDecimal:
        case SqlType::kNumeric:
            return name + "(" + std::to_string(precision) + "," + std::to_string(scale) + ")";
        case SqlType::kUnknown:
            return "xtype" + std::to_string(xtype);
        default:
            return name;
    }
}

}  // namespace mdfkit
