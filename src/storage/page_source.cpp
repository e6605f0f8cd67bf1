/**
 * @file page_source.cpp
 * @brief PageSource and MemoryPageSource implementation
 */

#include "storage/page_source.hpp"

#include <cstring>
#include <limits>

namespace mdfkit {

uint64_t PageSource::total_page_count() const {
    uint64_t total = 0;
    for (file_id_t file_id : file_ids()) {
        total += page_count(file_id);
    }
    return total;
}

// ─────────────────────────────────────────────────────────────────────────────
// MemoryPageSource
// ─────────────────────────────────────────────────────────────────────────────

Status MemoryPageSource::add_page(PagePointer pointer, std::vector<uint8_t> bytes) {
    if (bytes.size() != config::kPageSize) {
        return Status::InvalidArgument("page image must be " +
                                       std::to_string(config::kPageSize) + " bytes, got " +
                                       std::to_string(bytes.size()));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pages_[pointer] = std::move(bytes);
    return Status::Ok();
}

void MemoryPageSource::remove_page(PagePointer pointer) {
    std::lock_guard<std::mutex> lock(mutex_);
    pages_.erase(pointer);
}

Status MemoryPageSource::read_page(PagePointer pointer, std::span<uint8_t> out) {
    if (out.size() != config::kPageSize) {
        return Status::InvalidArgument("page buffer must be one page");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++reads_;

    auto it = pages_.find(pointer);
    if (it == pages_.end()) {
        return Status::NotFound("page " + pointer.to_string() + " not present");
    }
    std::memcpy(out.data(), it->second.data(), config::kPageSize);
    return Status::Ok();
}

std::vector<file_id_t> MemoryPageSource::file_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<file_id_t> ids;
    for (const auto& [pointer, bytes] : pages_) {
        if (ids.empty() || ids.back() != pointer.file_id) {
            ids.push_back(pointer.file_id);
        }
    }
    return ids;
}

page_id_t MemoryPageSource::page_count(file_id_t file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    // Pages are ordered by (file, page); the last entry of the file wins
    auto it = file_id == std::numeric_limits<file_id_t>::max()
                  ? pages_.end()
                  : pages_.lower_bound(PagePointer(static_cast<file_id_t>(file_id + 1), 0));
    if (it == pages_.begin()) {
        return 0;
    }
    --it;
    if (it->first.file_id != file_id) {
        return 0;
    }
    return it->first.page_id + 1;
}

uint64_t MemoryPageSource::read_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reads_;
}

}  // namespace mdfkit
