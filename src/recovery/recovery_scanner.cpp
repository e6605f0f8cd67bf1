/**
 * @file recovery_scanner.cpp
 * @brief RecoveryScanner implementation
 */

#include "recovery/recovery_scanner.hpp"

#include <algorithm>

#include "common/logger.hpp"
#include "mdfkit/database.hpp"

namespace mdfkit {

namespace {

std::vector<object_id_t> match_signatures(const std::vector<TableSignature>& signatures,
                                          uint16_t p_min_len) {
    std::vector<object_id_t> out;
    for (const TableSignature& signature : signatures) {
        if (signature.p_min_len == p_min_len) {
            out.push_back(signature.object_id);
        }
    }
    return out;
}

/**
 * Feeds a RowIterator with the data pages a scan attributes to one table.
 * Pages are handed over already parsed; index pages are never decoded as rows.
 */
class ScanPageWalker : public PageWalker {
public:
    ScanPageWalker(ScanIterator scan, object_id_t object_id)
        : scan_(std::move(scan)), object_id_(object_id) {}

    bool next(PagePointer* out) override {
        ScanEntry entry;
        while (scan_.next(&entry)) {
            if (!entry.status.ok() || entry.page_type != PageType::kData) {
                continue;
            }
            if (std::find(entry.candidates.begin(), entry.candidates.end(), object_id_) !=
                entry.candidates.end()) {
                *out = entry.pointer;
                page_ = std::move(entry.page);
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<const Page> take_page() override { return std::move(page_); }

    Status accept(const Page& page) override {
        if (page.type() != PageType::kData) {
            return Status::MalformedPage("page " + page.pointer().to_string() + " is a " +
                                         page_type_name(page.type()) + " page");
        }
        return Status::Ok();
    }

    void fail() override { page_.reset(); }

private:
    ScanIterator scan_;
    object_id_t object_id_;
    std::shared_ptr<const Page> page_;
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// ScanIterator
// ─────────────────────────────────────────────────────────────────────────────

ScanIterator::ScanIterator(std::shared_ptr<PageSource> source,
                           std::shared_ptr<const std::vector<TableSignature>> signatures,
                           ScanOptions options, PagePointer start)
    : source_(std::move(source)),
      signatures_(std::move(signatures)),
      options_(options),
      files_(source_->file_ids()) {
    std::sort(files_.begin(), files_.end());
    while (file_index_ < files_.size() && files_[file_index_] < start.file_id) {
        ++file_index_;
    }
    if (file_index_ < files_.size() && files_[file_index_] == start.file_id) {
        next_page_ = start.page_id;
    }
}

bool ScanIterator::advance(PagePointer* out) {
    while (file_index_ < files_.size()) {
        const file_id_t file = files_[file_index_];
        if (next_page_ < source_->page_count(file)) {
            *out = PagePointer(file, next_page_++);
            return true;
        }
        ++file_index_;
        next_page_ = 0;
    }
    return false;
}

bool ScanIterator::next(ScanEntry* out) {
    PagePointer pointer;
    while (advance(&pointer)) {
        ScanEntry entry;
        entry.pointer = pointer;

        std::vector<uint8_t> bytes(config::kPageSize);
        Status status = source_->read_page(pointer, bytes);
        if (status.is_not_found()) {
            continue;  // hole in a sparse source
        }
        if (status.ok()) {
            status = Page::parse(pointer, std::move(bytes), &entry.page);
        }
        if (!status.ok()) {
            LOG_DEBUG("scan {}: {}", pointer.to_string(), status.to_string());
            entry.status = std::move(status);
            *out = std::move(entry);
            return true;
        }

        const PageHeader& header = entry.page->header();
        entry.page_type = header.type;
        entry.p_min_len = header.p_min_len;
        entry.object_id = header.object_id;

        const bool eligible = header.type == PageType::kData ||
                              (options_.include_index_pages && header.type == PageType::kIndex);
        if (!eligible) {
            continue;
        }

        entry.candidates = match_signatures(*signatures_, header.p_min_len);
        if (entry.candidates.empty() && !options_.report_unmatched) {
            continue;
        }
        if (entry.is_ambiguous()) {
            LOG_DEBUG("page {} matches {} tables (p_min_len {})", pointer.to_string(),
                      entry.candidates.size(), header.p_min_len);
        }
        *out = std::move(entry);
        return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// RecoveryScanner
// ─────────────────────────────────────────────────────────────────────────────

RecoveryScanner::RecoveryScanner(std::shared_ptr<PageSource> source,
                                 std::vector<TableSignature> signatures, ScanOptions options)
    : source_(std::move(source)),
      signatures_(std::make_shared<const std::vector<TableSignature>>(std::move(signatures))),
      options_(options) {}

std::vector<TableSignature> RecoveryScanner::signatures_for(const Database& db) {
    std::vector<TableSignature> out;
    for (const auto& table : db.tables()) {
        TableSignature signature;
        signature.object_id = table->object_id();
        signature.name = table->name();
        signature.p_min_len = static_cast<uint16_t>(table->min_record_length());

        const std::vector<PagePointer> pages = table->first_pages();
        if (!pages.empty()) {
            std::shared_ptr<const Page> page;
            Status status = fetch_page(*db.source(), pages.front(), &page);
            if (status.ok() && page->type() == PageType::kData) {
                signature.p_min_len = page->header().p_min_len;
            } else {
                LOG_DEBUG("table {}: first page unusable, signature from schema", table->name());
            }
        }
        out.push_back(std::move(signature));
    }
    return out;
}

std::vector<object_id_t> RecoveryScanner::candidates_for(uint16_t p_min_len) const {
    return match_signatures(*signatures_, p_min_len);
}

ScanRange RecoveryScanner::scan() const {
    return ScanRange{source_, signatures_, options_, PagePointer()};
}

ScanRange RecoveryScanner::scan_from(PagePointer start) const {
    return ScanRange{source_, signatures_, options_, start};
}

RowRange RecoveryScanner::recover_rows(const Table& table) const {
    auto source = source_;
    auto signatures = signatures_;
    const ScanOptions options = options_;
    const object_id_t object_id = table.object_id();
    return RowRange(
        source_, table.schema(),
        [source, signatures, options, object_id]() {
            return std::make_unique<ScanPageWalker>(
                ScanIterator(source, signatures, options, PagePointer()), object_id);
        },
        table.max_forward_hops());
}

}  // namespace mdfkit
