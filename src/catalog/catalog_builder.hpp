#pragma once

/**
 * @file catalog_builder.hpp
 * @brief Resolves table schemas from the system tables
 *
 * Bootstrap order:
 *   boot page (1:9) -> sysallocunits -> sysrowsets (allocation unit 327680)
 *   -> sysschobjs, syscolpars, sysscalartypes (via their rowsets)
 *   -> one Table per user (and optionally system) table object
 */

#include <memory>
#include <string>
#include <vector>

#include "catalog/boot_page.hpp"
#include "common/config.hpp"
#include "catalog/system_tables.hpp"
#include "catalog/table.hpp"
#include "storage/page_source.hpp"

namespace mdfkit {

/**
 * @brief An object the catalog could not resolve into a table
 */
struct CatalogError {
    object_id_t object_id = 0;
    std::string name;
    Status status;

    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Settings the builder passes on to the tables it creates
 */
struct CatalogOptions {
    size_t max_forward_hops = config::kDefaultMaxForwardHops;
    bool include_system_tables = false;
    LobReadPolicy lob_policy = LobReadPolicy::kAbort;
};

/**
 * @brief Result of a catalog build
 */
struct CatalogContents {
    BootPage boot;
    std::vector<std::shared_ptr<const Table>> tables;  // ordered by object id
    std::vector<CatalogError> errors;
};

/**
 * @brief One-shot catalog reader
 *
 * The boot page, sysallocunits and sysschobjs are required; failing to read
 * any of them fails build(). Everything else fails per object.
 */
class CatalogBuilder {
public:
    CatalogBuilder(std::shared_ptr<PageSource> source, CatalogOptions options);

    /**
     * @brief Read the system tables and resolve every table object
     * @return an error only when the database cannot be bootstrapped at all;
     *         per-object failures are listed in CatalogContents::errors
     */
    [[nodiscard]] Status build(CatalogContents* out);

private:
    /// Decode every row of a system table chain, skipping rows that fail
    template <typename T>
    [[nodiscard]] Status read_system_table(SystemTable table, PagePointer first,
                                           std::vector<T>* out);

    /// First in-row page of a system table found through sysrowsets
    [[nodiscard]] Status system_table_first_page(SystemTable table, object_id_t object_id,
                                                 PagePointer* out) const;

    /// Rowsets of an object (idminor 0 heap or 1 clustered index)
    [[nodiscard]] std::vector<const SysRowSet*> rowsets_of(object_id_t object_id) const;

    /// Allocation units of a rowset, in-row data first
    [[nodiscard]] std::vector<AllocationUnit> allocation_units_of(rowset_id_t rowset_id) const;

    /// sysscalartypes by xtype (system types only), then the built-in xtype table
    [[nodiscard]] TypeInfo resolve_type(const SysColPar& column) const;

    [[nodiscard]] Status resolve_table(const SysSchObj& object,
                                       std::shared_ptr<const Table>* out) const;

    std::shared_ptr<PageSource> source_;
    CatalogOptions options_;

    std::vector<SysAllocUnit> alloc_units_;
    std::vector<SysRowSet> rowsets_;
    std::vector<SysSchObj> objects_;
    std::vector<SysColPar> columns_;
    std::vector<SysScalarType> scalar_types_;

    // Why an optional system table is unusable; OK when it was read
    Status rowsets_status_;
    Status columns_status_;
    Status scalar_types_status_;
};

}  // namespace mdfkit
