#pragma once

/**
 * @file system_tables.hpp
 * @brief Bootstrap schemas and typed rows of the base system tables
 *
 * The schemas of sysallocunits, sysrowsets, sysschobjs, syscolpars and
 * sysscalartypes cannot be read from the catalog (they describe it), so
 * they are compiled in as constant tables.
 */

#include <array>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "catalog/row.hpp"
#include "catalog/schema.hpp"
#include "common/types.hpp"
#include "types/value.hpp"

namespace mdfkit {

/**
 * @brief One column of a bootstrap schema
 */
struct BootstrapColumn {
    const char* name;
    SqlType type;
    uint8_t xtype;
    int16_t length;
    bool nullable;
};

/**
 * @brief The base system tables
 */
enum class SystemTable : uint8_t {
    kSysAllocUnits,
    kSysRowSets,
    kSysSchObjs,
    kSysColPars,
    kSysScalarTypes,
};

[[nodiscard]] const char* system_table_name(SystemTable table) noexcept;

/// Constant column list of a system table
[[nodiscard]] std::span<const BootstrapColumn> bootstrap_columns(SystemTable table) noexcept;

/// Schema built once from bootstrap_columns() and shared
[[nodiscard]] const std::shared_ptr<const Schema>& bootstrap_schema(SystemTable table);

// ─────────────────────────────────────────────────────────────────────────────
// sysallocunits
// ─────────────────────────────────────────────────────────────────────────────

enum class AllocUnitType : uint8_t {
    kDropped = 0,
    kInRowData = 1,
    kLobData = 2,
    kRowOverflowData = 3,
};

[[nodiscard]] const char* alloc_unit_type_name(AllocUnitType type) noexcept;

struct SysAllocUnit {
    alloc_unit_id_t auid = 0;
    AllocUnitType type = AllocUnitType::kDropped;
    int64_t owner_id = 0;
    int32_t status = 0;
    int16_t fgid = 0;
    PagePointer first_page;
    PagePointer root_page;
    PagePointer first_iam_page;
    int64_t pages_used = 0;
    int64_t pages_data = 0;
    int64_t pages_reserved = 0;

    [[nodiscard]] static Status from_row(const Row& row, SysAllocUnit* out);
};

// ─────────────────────────────────────────────────────────────────────────────
// sysrowsets
// ─────────────────────────────────────────────────────────────────────────────

struct SysRowSet {
    rowset_id_t rowset_id = 0;
    uint8_t owner_type = 0;
    int32_t id_major = 0;  // object id
    int32_t id_minor = 0;  // index id
    int32_t num_part = 0;
    int32_t status = 0;
    int16_t fgidfs = 0;
    int64_t row_count = 0;

    [[nodiscard]] static Status from_row(const Row& row, SysRowSet* out);
};

// ─────────────────────────────────────────────────────────────────────────────
// sysschobjs
// ─────────────────────────────────────────────────────────────────────────────

enum class ObjectType : uint8_t {
    kSystemTable,
    kUserTable,
    kInternalTable,
    kView,
    kPrimaryKey,
    kUniqueConstraint,
    kDefaultConstraint,
    kStoredProcedure,
    kScalarFunction,
    kTableFunction,
    kTrigger,
    kServiceQueue,
    kOther,
};

/// Map the char(2) type code ("U ", "S ", ...); unknown codes map to kOther
[[nodiscard]] ObjectType object_type_from_code(std::string_view code) noexcept;

[[nodiscard]] const char* object_type_name(ObjectType type) noexcept;

struct SysSchObj {
    object_id_t id = 0;
    std::string name;
    int32_t nsid = 0;
    uint8_t nsclass = 0;
    int32_t status = 0;
    std::string type_code;
    ObjectType type = ObjectType::kOther;
    int32_t pid = 0;
    uint8_t pclass = 0;
    int32_t intprop = 0;
    DateTime created;
    DateTime modified;

    [[nodiscard]] bool is_table() const noexcept {
        return type == ObjectType::kUserTable || type == ObjectType::kSystemTable;
    }

    [[nodiscard]] static Status from_row(const Row& row, SysSchObj* out);
};

// ─────────────────────────────────────────────────────────────────────────────
// syscolpars
// ─────────────────────────────────────────────────────────────────────────────

/// syscolpars.status bits
namespace colpar_status {
constexpr int32_t kNotNullable = 1 << 0;
constexpr int32_t kAnsiPadded = 1 << 1;
constexpr int32_t kIdentity = 1 << 2;
constexpr int32_t kRowGuidCol = 1 << 3;
constexpr int32_t kComputed = 1 << 4;
constexpr int32_t kFilestream = 1 << 5;
constexpr int32_t kSparse = 1 << 24;
constexpr int32_t kColumnSet = 1 << 25;
}  // namespace colpar_status

struct SysColPar {
    object_id_t id = 0;
    int16_t number = 0;
    int32_t colid = 0;
    std::string name;
    uint8_t xtype = 0;
    int32_t utype = 0;
    int16_t length = 0;
    uint8_t precision = 0;
    uint8_t scale = 0;
    int32_t collation_id = 0;
    int32_t status = 0;

    [[nodiscard]] bool is_nullable() const noexcept {
        return (status & colpar_status::kNotNullable) == 0;
    }
    [[nodiscard]] bool is_computed() const noexcept {
        return (status & colpar_status::kComputed) != 0;
    }

    [[nodiscard]] static Status from_row(const Row& row, SysColPar* out);
};

// ─────────────────────────────────────────────────────────────────────────────
// sysscalartypes
// ─────────────────────────────────────────────────────────────────────────────

struct SysScalarType {
    int32_t id = 0;
    int32_t schema_id = 0;
    std::string name;
    uint8_t xtype = 0;
    int16_t length = 0;
    uint8_t precision = 0;
    uint8_t scale = 0;
    int32_t collation_id = 0;
    int32_t status = 0;

    [[nodiscard]] static Status from_row(const Row& row, SysScalarType* out);
};

}  // namespace mdfkit
