/**
 * @file table.cpp
 * @brief Table implementation
 */

#include "catalog/table.hpp"

#include "common/status.hpp"

namespace mdfkit {

const AllocationUnit* Partition::in_row_data() const noexcept {
    for (const AllocationUnit& unit : allocation_units) {
        if (unit.type == AllocUnitType::kInRowData) {
            return &unit;
        }
    }
    return nullptr;
}

Table::Table(object_id_t object_id, std::string name, ObjectType type,
             std::shared_ptr<const Schema> schema, std::vector<Partition> partitions,
             std::shared_ptr<PageSource> source, size_t max_forward_hops,
             LobReadPolicy lob_policy)
    : object_id_(object_id),
      name_(std::move(name)),
      type_(type),
      schema_(std::move(schema)),
      partitions_(std::move(partitions)),
      source_(std::move(source)),
      max_forward_hops_(max_forward_hops),
      lob_policy_(lob_policy) {}

std::vector<PagePointer> Table::first_pages() const {
    std::vector<PagePointer> pages;
    for (const Partition& partition : partitions_) {
        const AllocationUnit* unit = partition.in_row_data();
        if (unit != nullptr && !unit->first_page.is_null()) {
            pages.push_back(unit->first_page);
        }
    }
    return pages;
}

RowRange Table::rows() const {
    std::vector<PagePointer> heads = first_pages();
    return RowRange(
        source_, schema_,
        [heads = std::move(heads)]() { return std::make_unique<ChainPageWalker>(heads); },
        max_forward_hops_);
}

RowRange Table::rows_on(std::vector<PagePointer> pages) const {
    return RowRange(
        source_, schema_,
        [pages = std::move(pages)]() { return std::make_unique<ListPageWalker>(pages); },
        max_forward_hops_);
}

Status Table::open_lob(const SqlValue& value, std::unique_ptr<LobReader>* out) const {
    if (!value.is_lob()) {
        return Status::InvalidArgument("value of type " + std::string(sql_type_name(value.type())) +
                                       " holds no LOB descriptor");
    }
    *out = std::make_unique<LobReader>(source_, value.as_lob(), lob_policy_);
    return Status::Ok();
}

Status Table::read_lob(const SqlValue& value, std::vector<uint8_t>* out) const {
    std::unique_ptr<LobReader> reader;
    MDFKIT_RETURN_IF_ERROR(open_lob(value, &reader));
    return reader->read_all(out);
}

std::string Table::to_string() const {
    return name_ + " (id " + std::to_string(object_id_) + ", " + object_type_name(type_) + ") " +
           schema_->to_string();
}

}  // namespace mdfkit
