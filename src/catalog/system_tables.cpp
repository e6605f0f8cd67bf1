/**
 * @file system_tables.cpp
 * @brief Bootstrap schemas and system row decoding
 */

#include "catalog/system_tables.hpp"

#include <array>

#include "common/config.hpp"

namespace mdfkit {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Bootstrap Column Lists
// ─────────────────────────────────────────────────────────────────────────────

constexpr BootstrapColumn col_int(const char* name, bool nullable = false) {
    return {name, SqlType::kInt, 56, 4, nullable};
}
constexpr BootstrapColumn col_bigint(const char* name) {
    return {name, SqlType::kBigInt, 127, 8, false};
}
constexpr BootstrapColumn col_smallint(const char* name, bool nullable = false) {
    return {name, SqlType::kSmallInt, 52, 2, nullable};
}
constexpr BootstrapColumn col_tinyint(const char* name, bool nullable = false) {
    return {name, SqlType::kTinyInt, 48, 1, nullable};
}
constexpr BootstrapColumn col_datetime(const char* name) {
    return {name, SqlType::kDateTime, 61, 8, false};
}
constexpr BootstrapColumn col_sysname(const char* name, bool nullable = false) {
    return {name, SqlType::kSysName, 231, 256, nullable};
}
constexpr BootstrapColumn col_varbinary(const char* name) {
    return {name, SqlType::kVarBinary, 165, -1, true};
}
constexpr BootstrapColumn col_pointer(const char* name) {
    return {name, SqlType::kBinary, 173, 6, false};
}

constexpr std::array kSysAllocUnitsColumns = {
    col_bigint("auid"),
    col_tinyint("type"),
    col_bigint("ownerid"),
    col_int("status"),
    col_smallint("fgid"),
    col_pointer("pgfirst"),
    col_pointer("pgroot"),
    col_pointer("pgfirstiam"),
    col_bigint("pcused"),
    col_bigint("pcdata"),
    col_bigint("pcreserved"),
    col_int("dbfragid", true),
};

constexpr std::array kSysRowSetsColumns = {
    col_bigint("rowsetid"),
    col_tinyint("ownertype"),
    col_int("idmajor"),
    col_int("idminor"),
    col_int("numpart"),
    col_int("status"),
    col_smallint("fgidfs"),
    col_bigint("rcrows"),
    col_tinyint("cmprlevel", true),
    col_tinyint("fillfact", true),
    col_int("maxleaf", true),
    col_smallint("maxint", true),
    col_smallint("minleaf", true),
    col_smallint("minint", true),
    col_varbinary("rsguid"),
    col_varbinary("lockres"),
    col_int("dbfragid", true),
};

constexpr std::array kSysSchObjsColumns = {
    col_int("id"),
    col_sysname("name"),
    col_int("nsid"),
    col_tinyint("nsclass"),
    col_int("status"),
    BootstrapColumn{"type", SqlType::kChar, 175, 2, false},
    col_int("pid"),
    col_tinyint("pclass"),
    col_int("intprop"),
    col_datetime("created"),
    col_datetime("modified"),
};

constexpr std::array kSysColParsColumns = {
    col_int("id"),
    col_smallint("number"),
    col_int("colid"),
    col_sysname("name", true),
    col_tinyint("xtype"),
    col_int("utype"),
    col_smallint("length"),
    col_tinyint("prec"),
    col_tinyint("scale"),
    col_int("collationid"),
    col_int("status"),
    col_smallint("maxinrow"),
    col_int("xmlns"),
    col_int("dflt"),
    col_int("chk"),
    col_varbinary("idtval"),
};

constexpr std::array kSysScalarTypesColumns = {
    col_int("id"),
    col_int("schid"),
    col_sysname("name"),
    col_tinyint("xtype"),
    col_smallint("length"),
    col_tinyint("prec"),
    col_tinyint("scale"),
    col_int("collationid"),
    col_int("status"),
    col_datetime("created"),
    col_datetime("modified"),
    col_int("dflt"),
    col_int("chk"),
};

std::shared_ptr<const Schema> make_schema(std::span<const BootstrapColumn> columns) {
    std::vector<Column> out;
    out.reserve(columns.size());
    for (const BootstrapColumn& c : columns) {
        out.emplace_back(c.name, TypeInfo(c.type, c.xtype, c.length), c.nullable);
    }
    return std::make_shared<const Schema>(std::move(out));
}

// ─────────────────────────────────────────────────────────────────────────────
// Field Reader
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Pulls typed fields out of a decoded system row by column index. The first
 * failure sticks; NULL in a nullable field reads as zero / empty.
 */
class FieldReader {
public:
    FieldReader(const Row& row, const char* table) : row_(row), table_(table) {}

    template <typename T>
    T integer(size_t idx) {
        const SqlValue* value = field(idx);
        if (value == nullptr || value->is_null()) {
            return T{};
        }
        int64_t wide = 0;
        if (!value->to_int64(&wide)) {
            fail(idx, "is not an integer");
            return T{};
        }
        return static_cast<T>(wide);
    }

    std::string text(size_t idx) {
        const SqlValue* value = field(idx);
        if (value == nullptr || value->is_null()) {
            return {};
        }
        if (!value->is_string()) {
            fail(idx, "is not a string");
            return {};
        }
        return value->as_string();
    }

    PagePointer pointer(size_t idx) {
        const SqlValue* value = field(idx);
        if (value == nullptr || value->is_null()) {
            return {};
        }
        if (!value->is_bytes() || value->as_bytes().size() < config::kPagePointerSize) {
            fail(idx, "is not a page pointer");
            return {};
        }
        return PagePointer::parse(value->as_bytes(), 0);
    }

    DateTime datetime(size_t idx) {
        const SqlValue* value = field(idx);
        if (value == nullptr || value->is_null()) {
            return {};
        }
        if (!value->is_datetime()) {
            fail(idx, "is not a datetime");
            return {};
        }
        return value->as_datetime();
    }

    [[nodiscard]] const Status& status() const noexcept { return status_; }

private:
    const SqlValue* field(size_t idx) {
        if (!status_.ok()) {
            return nullptr;
        }
        if (idx >= row_.size()) {
            status_ = Status::CatalogCorrupt(std::string(table_) + " row has " +
                                             std::to_string(row_.size()) + " columns");
            return nullptr;
        }
        const SqlValue& value = row_[idx];
        if (value.is_null() && !row_.schema()->column(idx).is_nullable()) {
            fail(idx, "is NULL");
            return nullptr;
        }
        return &value;
    }

    void fail(size_t idx, const char* what) {
        status_ = Status::CatalogCorrupt(std::string(table_) + "." +
                                         row_.schema()->column(idx).name() + " " + what);
    }

    const Row& row_;
    const char* table_;
    Status status_;
};

}  // namespace

const char* system_table_name(SystemTable table) noexcept {
    switch (table) {
        case SystemTable::kSysAllocUnits:   return "sysallocunits";
        case SystemTable::kSysRowSets:      return "sysrowsets";
        case SystemTable::kSysSchObjs:      return "sysschobjs";
        case SystemTable::kSysColPars:      return "syscolpars";
        case SystemTable::kSysScalarTypes:  return "sysscalartypes";
    }
    return "unknown";
}

std::span<const BootstrapColumn> bootstrap_columns(SystemTable table) noexcept {
    switch (table) {
        case SystemTable::kSysAllocUnits:   return kSysAllocUnitsColumns;
        case SystemTable::kSysRowSets:      return kSysRowSetsColumns;
        case SystemTable::kSysSchObjs:      return kSysSchObjsColumns;
        case SystemTable::kSysColPars:      return kSysColParsColumns;
        case SystemTable::kSysScalarTypes:  return kSysScalarTypesColumns;
    }
    return {};
}

const std::shared_ptr<const Schema>& bootstrap_schema(SystemTable table) {
    static const std::array<std::shared_ptr<const Schema>, 5> schemas = {
        make_schema(kSysAllocUnitsColumns),
        make_schema(kSysRowSetsColumns),
        make_schema(kSysSchObjsColumns),
        make_schema(kSysColParsColumns),
        make_schema(kSysScalarTypesColumns),
    };
    return schemas[static_cast<size_t>(table)];
}

// ─────────────────────────────────────────────────────────────────────────────
// sysallocunits
// ─────────────────────────────────────────────────────────────────────────────

const char* alloc_unit_type_name(AllocUnitType type) noexcept {
    switch (type) {
        case AllocUnitType::kDropped:          return "DROPPED";
        case AllocUnitType::kInRowData:        return "IN_ROW_DATA";
        case AllocUnitType::kLobData:          return "LOB_DATA";
        case AllocUnitType::kRowOverflowData:  return "ROW_OVERFLOW_DATA";
    }
    return "UNKNOWN";
}

Status SysAllocUnit::from_row(const Row& row, SysAllocUnit* out) {
    FieldReader f(row, "sysallocunits");
    SysAllocUnit au;
    au.auid = f.integer<alloc_unit_id_t>(0);
    const auto type = f.integer<uint8_t>(1);
    au.owner_id = f.integer<int64_t>(2);
    au.status = f.integer<int32_t>(3);
    au.fgid = f.integer<int16_t>(4);
    au.first_page = f.pointer(5);
    au.root_page = f.pointer(6);
    au.first_iam_page = f.pointer(7);
    au.pages_used = f.integer<int64_t>(8);
    au.pages_data = f.integer<int64_t>(9);
    au.pages_reserved = f.integer<int64_t>(10);
    if (!f.status().ok()) {
        return f.status();
    }
    if (type > static_cast<uint8_t>(AllocUnitType::kRowOverflowData)) {
        return Status::CatalogCorrupt("sysallocunits.type " + std::to_string(type) +
                                      " of allocation unit " + std::to_string(au.auid));
    }
    au.type = static_cast<AllocUnitType>(type);
    *out = au;
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// sysrowsets
// ─────────────────────────────────────────────────────────────────────────────

Status SysRowSet::from_row(const Row& row, SysRowSet* out) {
    FieldReader f(row, "sysrowsets");
    SysRowSet rs;
    rs.rowset_id = f.integer<rowset_id_t>(0);
    rs.owner_type = f.integer<uint8_t>(1);
    rs.id_major = f.integer<int32_t>(2);
    rs.id_minor = f.integer<int32_t>(3);
    rs.num_part = f.integer<int32_t>(4);
    rs.status = f.integer<int32_t>(5);
    rs.fgidfs = f.integer<int16_t>(6);
    rs.row_count = f.integer<int64_t>(7);
    if (!f.status().ok()) {
        return f.status();
    }
    *out = rs;
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// sysschobjs
// ─────────────────────────────────────────────────────────────────────────────

ObjectType object_type_from_code(std::string_view code) noexcept {
    struct Entry {
        const char* code;
        ObjectType type;
    };
    static constexpr Entry kCodes[] = {
        {"S ", ObjectType::kSystemTable},
        {"U ", ObjectType::kUserTable},
        {"IT", ObjectType::kInternalTable},
        {"V ", ObjectType::kView},
        {"PK", ObjectType::kPrimaryKey},
        {"UQ", ObjectType::kUniqueConstraint},
        {"D ", ObjectType::kDefaultConstraint},
        {"P ", ObjectType::kStoredProcedure},
        {"FN", ObjectType::kScalarFunction},
        {"IF", ObjectType::kTableFunction},
        {"TR", ObjectType::kTrigger},
        {"SQ", ObjectType::kServiceQueue},
    };
    for (const Entry& e : kCodes) {
        if (code == e.code) {
            return e.type;
        }
    }
    return ObjectType::kOther;
}

const char* object_type_name(ObjectType type) noexcept {
    switch (type) {
        case ObjectType::kSystemTable:       return "SYSTEM_TABLE";
        case ObjectType::kUserTable:         return "USER_TABLE";
        case ObjectType::kInternalTable:     return "INTERNAL_TABLE";
        case ObjectType::kView:              return "VIEW";
        case ObjectType::kPrimaryKey:        return "PRIMARY_KEY_CONSTRAINT";
        case ObjectType::kUniqueConstraint:  return "UNIQUE_CONSTRAINT";
        case ObjectType::kDefaultConstraint: return "DEFAULT_CONSTRAINT";
        case ObjectType::kStoredProcedure:   return "SQL_STORED_PROCEDURE";
        case ObjectType::kScalarFunction:    return "SQL_SCALAR_FUNCTION";
        case ObjectType::kTableFunction:     return "SQL_INLINE_TABLE_VALUED_FUNCTION";
        case ObjectType::kTrigger:           return "SQL_TRIGGER";
        case ObjectType::kServiceQueue:      return "SERVICE_QUEUE";
        case ObjectType::kOther:             return "OTHER";
    }
    return "OTHER";
}

Status SysSchObj::from_row(const Row& row, SysSchObj* out) {
    FieldReader f(row, "sysschobjs");
    SysSchObj obj;
    obj.id = f.integer<object_id_t>(0);
    obj.name = f.text(1);
    obj.nsid = f.integer<int32_t>(2);
    obj.nsclass = f.integer<uint8_t>(3);
    obj.status = f.integer<int32_t>(4);
    obj.type_code = f.text(5);
    obj.pid = f.integer<int32_t>(6);
    obj.pclass = f.integer<uint8_t>(7);
    obj.intprop = f.integer<int32_t>(8);
    obj.created = f.datetime(9);
    obj.modified = f.datetime(10);
    if (!f.status().ok()) {
        return f.status();
    }
    obj.type = object_type_from_code(obj.type_code);
    *out = std::move(obj);
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// syscolpars / sysscalartypes
// ─────────────────────────────────────────────────────────────────────────────

Status SysColPar::from_row(const Row& row, SysColPar* out) {
    FieldReader f(row, "syscolpars");
    SysColPar col;
    col.id = f.integer<object_id_t>(0);
    col.number = f.integer<int16_t>(1);
    col.colid = f.integer<int32_t>(2);
    col.name = f.text(3);
    col.xtype = f.integer<uint8_t>(4);
    col.utype = f.integer<int32_t>(5);
    col.length = f.integer<int16_t>(6);
    col.precision = f.integer<uint8_t>(7);
    col.scale = f.integer<uint8_t>(8);
    col.collation_id = f.integer<int32_t>(9);
    col.status = f.integer<int32_t>(10);
    if (!f.status().ok()) {
        return f.status();
    }
    *out = std::move(col);
    return Status::Ok();
}

Status SysScalarType::from_row(const Row& row, SysScalarType* out) {
    FieldReader f(row, "sysscalartypes");
    SysScalarType t;
    t.id = f.integer<int32_t>(0);
    t.schema_id = f.integer<int32_t>(1);
    t.name = f.text(2);
    t.xtype = f.integer<uint8_t>(3);
    t.length = f.integer<int16_t>(4);
    t.precision = f.integer<uint8_t>(5);
    t.scale = f.integer<uint8_t>(6);
    t.collation_id = f.integer<int32_t>(7);
    t.status = f.integer<int32_t>(8);
    if (!f.status().ok()) {
        return f.status();
    }
    *out = std::move(t);
    return Status::Ok();
}

}  // namespace mdfkit
