#pragma once

/**
 * @file table.hpp
 * @brief Catalog table: schema, partitions, and row access
 */

#include <memory>
#include <string>
#include <vector>

#include "catalog/row_iterator.hpp"
#include "catalog/schema.hpp"
#include "catalog/system_tables.hpp"
#include "lob/lob_reader.hpp"
#include "storage/page_source.hpp"

namespace mdfkit {

/**
 * @brief One allocation unit of a partition
 */
struct AllocationUnit {
    alloc_unit_id_t id = 0;
    AllocUnitType type = AllocUnitType::kInRowData;
    PagePointer first_page;
    PagePointer root_page;
    PagePointer first_iam_page;
};

/**
 * @brief One rowset of a table (heap or clustered index)
 */
struct Partition {
    rowset_id_t rowset_id = 0;
    int32_t index_id = 0;
    std::vector<AllocationUnit> allocation_units;  // in-row data first

    /// nullptr if the partition has no in-row data unit
    [[nodiscard]] const AllocationUnit* in_row_data() const noexcept;
};

/**
 * @brief A table resolved from the system catalog
 *
 * Immutable once built. Rows are decoded lazily from the page source on each
 * call to rows().
 */
class Table {
public:
    Table(object_id_t object_id, std::string name, ObjectType type,
          std::shared_ptr<const Schema> schema, std::vector<Partition> partitions,
          std::shared_ptr<PageSource> source, size_t max_forward_hops,
          LobReadPolicy lob_policy = LobReadPolicy::kAbort);

    [[nodiscard]] object_id_t object_id() const noexcept { return object_id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] ObjectType type() const noexcept { return type_; }
    [[nodiscard]] const std::shared_ptr<const Schema>& schema() const noexcept { return schema_; }
    [[nodiscard]] const std::vector<Partition>& partitions() const noexcept { return partitions_; }

    /// First in-row data page of every partition, in partition order
    [[nodiscard]] std::vector<PagePointer> first_pages() const;

    [[nodiscard]] size_t max_forward_hops() const noexcept { return max_forward_hops_; }

    [[nodiscard]] size_t min_record_length() const noexcept {
        return schema_->min_record_length();
    }

    /**
     * @brief Rows of every partition, in page-chain order
     *
     * @code
     *   for (const RowResult& r : table.rows()) {
     *       if (!r.ok()) { ... continue; }
     *       std::cout << r.row.to_string() << "\n";
     *   }
     * @endcode
     */
    [[nodiscard]] RowRange rows() const;

    /**
     * @brief Rows of an explicit page list, decoded with this table's schema
     */
    [[nodiscard]] RowRange rows_on(std::vector<PagePointer> pages) const;

    /**
     * @brief Open a reader over a LOB value of one of this table's rows
     * @return InvalidArgument if the value holds no LOB descriptor
     */
    [[nodiscard]] Status open_lob(const SqlValue& value, std::unique_ptr<LobReader>* out) const;

    /// Read a whole LOB value
    [[nodiscard]] Status read_lob(const SqlValue& value, std::vector<uint8_t>* out) const;

    /// "name (id N, TYPE) (columns)"
    [[nodiscard]] std::string to_string() const;

private:
    object_id_t object_id_;
    std::string name_;
    ObjectType type_;
    std::shared_ptr<const Schema> schema_;
    std::vector<Partition> partitions_;
    std::shared_ptr<PageSource> source_;
    size_t max_forward_hops_;
    LobReadPolicy lob_policy_;
};

}  // namespace mdfkit
