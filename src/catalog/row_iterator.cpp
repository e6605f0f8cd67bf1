/**
 * @file row_iterator.cpp
 * @brief RowIterator and page walker implementation
 */

#include "catalog/row_iterator.hpp"

#include "common/logger.hpp"
#include "common/status.hpp"

namespace mdfkit {

// ─────────────────────────────────────────────────────────────────────────────
// ChainPageWalker
// ─────────────────────────────────────────────────────────────────────────────

ChainPageWalker::ChainPageWalker(std::vector<PagePointer> heads, uint64_t max_pages)
    : heads_(std::move(heads)), max_pages_(max_pages) {}

bool ChainPageWalker::next(PagePointer* out) {
    while (current_.is_null()) {
        if (head_index_ >= heads_.size()) {
            return false;
        }
        current_ = heads_[head_index_++];
        chain_pages_ = 0;
        if (!current_.is_null() && visited_.count(current_) != 0) {
            LOG_DEBUG("chain head {} already visited", current_.to_string());
            current_ = PagePointer();
        }
    }
    *out = current_;
    return true;
}

Status ChainPageWalker::accept(const Page& page) {
    visited_.insert(page.pointer());
    if (page.type() != PageType::kData) {
        current_ = PagePointer();
        return Status::MalformedPage("page " + page.pointer().to_string() + " in a data chain is a " +
                                     page_type_name(page.type()) + " page");
    }

    current_ = page.header().next_page;
    if (current_.is_null()) {
        return Status::Ok();
    }
    if (visited_.count(current_) != 0) {
        LOG_WARN("page chain loops from {} back to {}, cut", page.pointer().to_string(),
                 current_.to_string());
        current_ = PagePointer();
    } else if (max_pages_ != 0 && ++chain_pages_ >= max_pages_) {
        LOG_WARN("page chain through {} exceeds {} pages, cut", page.pointer().to_string(),
                 max_pages_);
        current_ = PagePointer();
    }
    return Status::Ok();
}

void ChainPageWalker::fail() {
    visited_.insert(current_);
    current_ = PagePointer();
}

// ─────────────────────────────────────────────────────────────────────────────
// ListPageWalker
// ─────────────────────────────────────────────────────────────────────────────

bool ListPageWalker::next(PagePointer* out) {
    if (index_ >= pages_.size()) {
        return false;
    }
    *out = pages_[index_];
    return true;
}

Status ListPageWalker::accept(const Page& page) {
    ++index_;
    if (page.type() != PageType::kData) {
        return Status::MalformedPage("page " + page.pointer().to_string() + " is a " +
                                     page_type_name(page.type()) + " page");
    }
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// RowIterator
// ─────────────────────────────────────────────────────────────────────────────

RowIterator::RowIterator(std::shared_ptr<PageSource> source, std::shared_ptr<const Schema> schema,
                         std::unique_ptr<PageWalker> walker, size_t max_forward_hops)
    : source_(std::move(source)),
      decoder_(std::move(schema)),
      walker_(std::move(walker)),
      max_forward_hops_(max_forward_hops) {}

bool RowIterator::next(RowResult* out) {
    while (!done_) {
        if (page_ == nullptr) {
            PagePointer pointer;
            if (!walker_->next(&pointer)) {
                done_ = true;
                return false;
            }

            std::shared_ptr<const Page> page = walker_->take_page();
            Status status;
            if (page == nullptr) {
                status = fetch_page(*source_, pointer, &page);
            }
            if (!status.ok()) {
                walker_->fail();
                *out = RowResult{RecordPointer(pointer, 0), std::move(status), Row()};
                return true;
            }
            status = walker_->accept(*page);
            if (!status.ok()) {
                *out = RowResult{RecordPointer(pointer, 0), std::move(status), Row()};
                return true;
            }
            page_ = std::move(page);
            next_slot_ = 0;
        }

        while (next_slot_ < page_->slot_count()) {
            const auto slot = static_cast<slot_id_t>(next_slot_++);
            if (produce(slot, out)) {
                return true;
            }
        }
        page_.reset();
    }
    return false;
}

bool RowIterator::produce(slot_id_t slot, RowResult* out) {
    const RecordPointer rid(page_->pointer(), slot);

    Record record;
    Status status = page_->record(slot, &record);
    if (status.is_not_found()) {
        return false;
    }
    if (!status.ok()) {
        *out = RowResult{rid, std::move(status), Row()};
        return true;
    }

    if (record.is_ghost() || record.is_forwarded()) {
        return false;
    }

    if (record.is_forwarding_stub()) {
        std::shared_ptr<const Page> target_page;
        Record target;
        status = follow_forward(record.forward_target(), &target_page, &target);
        if (!status.ok()) {
            *out = RowResult{rid, std::move(status), Row()};
            return true;
        }
        Row row;
        status = decoder_.decode(target, &row);
        *out = RowResult{rid, std::move(status), std::move(row)};
        return true;
    }

    if (!record.carries_columns()) {
        LOG_DEBUG("slot {} holds a {} record, skipped", rid.to_string(),
                  record_kind_name(record.kind()));
        return false;
    }

    Row row;
    status = decoder_.decode(record, &row);
    *out = RowResult{rid, std::move(status), std::move(row)};
    return true;
}

Status RowIterator::follow_forward(RecordPointer target, std::shared_ptr<const Page>* page,
                                   Record* record) const {
    for (size_t hop = 1;; ++hop) {
        if (hop > max_forward_hops_) {
            return Status::ForwardLoopDetected("still forwarding after " +
                                               std::to_string(max_forward_hops_) + " hops at " +
                                               target.to_string());
        }

        std::shared_ptr<const Page> target_page;
        MDFKIT_RETURN_IF_ERROR(fetch_page(*source_, target.page, &target_page));

        Record target_record;
        Status status = target_page->record(target.slot, &target_record);
        if (status.is_not_found()) {
            return Status::Corruption("forwarding target " + target.to_string() + " is empty");
        }
        MDFKIT_RETURN_IF_ERROR(status);

        if (target_record.is_forwarding_stub()) {
            target = target_record.forward_target();
            continue;
        }
        if (!target_record.carries_columns()) {
            return Status::Corruption("forwarding target " + target.to_string() + " is a " +
                                      record_kind_name(target_record.kind()) + " record");
        }

        *page = std::move(target_page);
        *record = target_record;
        return Status::Ok();
    }
}

}  // namespace mdfkit
