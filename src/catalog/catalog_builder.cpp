/**
 * @file catalog_builder.cpp
 * @brief CatalogBuilder implementation
 */

#include "catalog/catalog_builder.hpp"

#include <algorithm>

#include "common/logger.hpp"
#include "common/status.hpp"

namespace mdfkit {

namespace {

/// Prefix a status message with the system table it came from
Status annotate(const Status& status, const char* table) {
    return Status(status.code(), std::string(table) + ": " + std::string(status.message()));
}

}  // namespace

std::string CatalogError::to_string() const {
    return name + " (id " + std::to_string(object_id) + "): " + status.to_string();
}

CatalogBuilder::CatalogBuilder(std::shared_ptr<PageSource> source, CatalogOptions options)
    : source_(std::move(source)), options_(options) {}

// ─────────────────────────────────────────────────────────────────────────────
// System Table Reading
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
Status CatalogBuilder::read_system_table(SystemTable table, PagePointer first,
                                         std::vector<T>* out) {
    const char* name = system_table_name(table);
    if (first.is_null()) {
        return Status::CatalogCorrupt(std::string(name) + " has no first page");
    }

    std::shared_ptr<const Page> head;
    Status status = fetch_page(*source_, first, &head);
    if (!status.ok()) {
        return annotate(status, name);
    }
    if (head->type() != PageType::kData) {
        return Status::CatalogCorrupt(std::string(name) + " first page " + first.to_string() +
                                      " is a " + page_type_name(head->type()) + " page");
    }

    RowIterator rows(source_, bootstrap_schema(table),
                     std::make_unique<ChainPageWalker>(std::vector<PagePointer>{first}),
                     options_.max_forward_hops);
    RowResult result;
    size_t skipped = 0;
    while (rows.next(&result)) {
        if (!result.ok()) {
            LOG_WARN("{} row {}: {}", name, result.rid.to_string(), result.status.to_string());
            ++skipped;
            continue;
        }
        T item;
        status = T::from_row(result.row, &item);
        if (!status.ok()) {
            LOG_WARN("{} row {}: {}", name, result.rid.to_string(), status.to_string());
            ++skipped;
            continue;
        }
        out->push_back(std::move(item));
    }

    LOG_DEBUG("{}: {} rows, {} skipped", name, out->size(), skipped);
    return Status::Ok();
}

Status CatalogBuilder::system_table_first_page(SystemTable table, object_id_t object_id,
                                               PagePointer* out) const {
    const char* name = system_table_name(table);
    if (!rowsets_status_.ok()) {
        return Status::CatalogCorrupt(std::string(name) + " unreachable, sysrowsets: " +
                                      std::string(rowsets_status_.message()));
    }
    for (const SysRowSet* rowset : rowsets_of(object_id)) {
        for (const AllocationUnit& unit : allocation_units_of(rowset->rowset_id)) {
            if (unit.type == AllocUnitType::kInRowData && !unit.first_page.is_null()) {
                *out = unit.first_page;
                return Status::Ok();
            }
        }
    }
    return Status::CatalogCorrupt(std::string(name) + " has no in-row allocation unit");
}

// ─────────────────────────────────────────────────────────────────────────────
// Lookups
// ─────────────────────────────────────────────────────────────────────────────

std::vector<const SysRowSet*> CatalogBuilder::rowsets_of(object_id_t object_id) const {
    std::vector<const SysRowSet*> out;
    for (const SysRowSet& rowset : rowsets_) {
        if (rowset.id_major == object_id && rowset.id_minor <= 1) {
            out.push_back(&rowset);
        }
    }
    return out;
}

std::vector<AllocationUnit> CatalogBuilder::allocation_units_of(rowset_id_t rowset_id) const {
    auto collect = [this](auto&& matches) {
        std::vector<AllocationUnit> units;
        for (const SysAllocUnit& au : alloc_units_) {
            if (au.type == AllocUnitType::kDropped || !matches(au)) {
                continue;
            }
            units.push_back(AllocationUnit{au.auid, au.type, au.first_page, au.root_page,
                                           au.first_iam_page});
        }
        std::stable_sort(units.begin(), units.end(),
                         [](const AllocationUnit& a, const AllocationUnit& b) {
                             return static_cast<uint8_t>(a.type) < static_cast<uint8_t>(b.type);
                         });
        return units;
    };

    std::vector<AllocationUnit> units = collect([rowset_id](const SysAllocUnit& au) {
        return au.owner_id == rowset_id;
    });
    if (units.empty()) {
        units = collect([rowset_id](const SysAllocUnit& au) {
            return static_cast<rowset_id_t>(au.auid) == rowset_id;
        });
    }
    return units;
}

TypeInfo CatalogBuilder::resolve_type(const SysColPar& column) const {
    SqlType type = SqlType::kUnknown;
    for (const SysScalarType& scalar : scalar_types_) {
        if (scalar.xtype == column.xtype && scalar.id <= config::kMaxSystemTypeId) {
            type = sql_type_from_name(scalar.name);
            break;
        }
    }
    if (type == SqlType::kUnknown) {
        type = sql_type_from_xtype(column.xtype);
    }
    if (type == SqlType::kUnknown) {
        LOG_DEBUG("column {} has unknown xtype {}, treated as variable-length", column.name,
                  column.xtype);
    }

    return TypeInfo(type, column.xtype, column.length, column.precision, column.scale);
}

// ─────────────────────────────────────────────────────────────────────────────
// Table Resolution
// ─────────────────────────────────────────────────────────────────────────────

Status CatalogBuilder::resolve_table(const SysSchObj& object,
                                     std::shared_ptr<const Table>* out) const {
    if (!columns_status_.ok()) {
        return Status::CatalogCorrupt("syscolpars unavailable: " +
                                      std::string(columns_status_.message()));
    }
    if (!scalar_types_status_.ok()) {
        return Status::CatalogCorrupt("sysscalartypes unavailable: " +
                                      std::string(scalar_types_status_.message()));
    }
    if (!rowsets_status_.ok()) {
        return Status::CatalogCorrupt("sysrowsets unavailable: " +
                                      std::string(rowsets_status_.message()));
    }

    std::vector<const SysColPar*> colpars;
    for (const SysColPar& colpar : columns_) {
        if (colpar.id == object.id && colpar.number == 0) {
            colpars.push_back(&colpar);
        }
    }
    if (colpars.empty()) {
        return Status::CatalogCorrupt("no columns");
    }
    std::stable_sort(colpars.begin(), colpars.end(),
                     [](const SysColPar* a, const SysColPar* b) { return a->colid < b->colid; });

    std::vector<Column> columns;
    columns.reserve(colpars.size());
    for (const SysColPar* colpar : colpars) {
        Column column(colpar->name, resolve_type(*colpar), colpar->is_nullable());
        column.set_computed(colpar->is_computed());
        column.set_column_id(colpar->colid);
        columns.push_back(std::move(column));
    }

    std::vector<const SysRowSet*> rowsets = rowsets_of(object.id);
    if (rowsets.empty()) {
        return Status::CatalogCorrupt("no rowset");
    }

    std::vector<Partition> partitions;
    for (const SysRowSet* rowset : rowsets) {
        Partition partition;
        partition.rowset_id = rowset->rowset_id;
        partition.index_id = rowset->id_minor;
        partition.allocation_units = allocation_units_of(rowset->rowset_id);
        if (partition.allocation_units.empty()) {
            return Status::CatalogCorrupt("no allocation unit for rowset " +
                                          std::to_string(rowset->rowset_id));
        }
        partitions.push_back(std::move(partition));
    }

    auto schema = std::make_shared<const Schema>(std::move(columns));
    LOG_TRACE("table {} layout: fixed width {}, {} variable columns", object.name,
              schema->fixed_width(), schema->variable_column_count());

    *out = std::make_shared<const Table>(object.id, object.name, object.type, std::move(schema),
                                         std::move(partitions), source_,
                                         options_.max_forward_hops, options_.lob_policy);
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// build
// ─────────────────────────────────────────────────────────────────────────────

Status CatalogBuilder::build(CatalogContents* out) {
    CatalogContents contents;

    std::shared_ptr<const Page> boot_page;
    Status status =
        fetch_page(*source_, PagePointer(config::kPrimaryFileId, config::kBootPageId), &boot_page);
    if (!status.ok()) {
        return annotate(status, "boot page");
    }
    status = BootPage::parse(*boot_page, &contents.boot);
    if (!status.ok()) {
        return annotate(status, "boot page");
    }
    LOG_DEBUG("database '{}' (version {}), sysallocunits at {}", contents.boot.database_name,
              contents.boot.version, contents.boot.first_sys_indices.to_string());

    MDFKIT_RETURN_IF_ERROR(read_system_table(SystemTable::kSysAllocUnits,
                                             contents.boot.first_sys_indices, &alloc_units_));

    PagePointer rowsets_first;
    for (const SysAllocUnit& au : alloc_units_) {
        if (au.auid == config::kSysRowSetsAllocUnitId) {
            rowsets_first = au.first_page;
            break;
        }
    }
    rowsets_status_ = rowsets_first.is_null()
                          ? Status::CatalogCorrupt("no allocation unit " +
                                                   std::to_string(config::kSysRowSetsAllocUnitId))
                          : read_system_table(SystemTable::kSysRowSets, rowsets_first, &rowsets_);
    if (!rowsets_status_.ok()) {
        LOG_WARN("sysrowsets: {}", rowsets_status_.to_string());
    }

    PagePointer first;
    MDFKIT_RETURN_IF_ERROR(
        system_table_first_page(SystemTable::kSysSchObjs, config::kSysSchObjsId, &first));
    MDFKIT_RETURN_IF_ERROR(read_system_table(SystemTable::kSysSchObjs, first, &objects_));

    columns_status_ =
        system_table_first_page(SystemTable::kSysColPars, config::kSysColParsId, &first);
    if (columns_status_.ok()) {
        columns_status_ = read_system_table(SystemTable::kSysColPars, first, &columns_);
    }
    if (!columns_status_.ok()) {
        LOG_WARN("syscolpars: {}", columns_status_.to_string());
    }

    scalar_types_status_ =
        system_table_first_page(SystemTable::kSysScalarTypes, config::kSysScalarTypesId, &first);
    if (scalar_types_status_.ok()) {
        scalar_types_status_ =
            read_system_table(SystemTable::kSysScalarTypes, first, &scalar_types_);
    }
    if (!scalar_types_status_.ok()) {
        LOG_WARN("sysscalartypes: {}", scalar_types_status_.to_string());
    }

    std::stable_sort(objects_.begin(), objects_.end(),
                     [](const SysSchObj& a, const SysSchObj& b) { return a.id < b.id; });

    for (const SysSchObj& object : objects_) {
        if (!object.is_table()) {
            continue;
        }
        if (object.type == ObjectType::kSystemTable && !options_.include_system_tables) {
            continue;
        }

        std::shared_ptr<const Table> table;
        status = resolve_table(object, &table);
        if (!status.ok()) {
            LOG_WARN("table {} (id {}): {}", object.name, object.id, status.to_string());
            contents.errors.push_back(CatalogError{object.id, object.name, status});
            continue;
        }
        contents.tables.push_back(std::move(table));
    }

    *out = std::move(contents);
    return Status::Ok();
}

}  // namespace mdfkit
