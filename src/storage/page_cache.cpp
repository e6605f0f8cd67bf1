/**
 * @file page_cache.cpp
 * @brief CachingPageSource implementation
 */

#include "storage/page_cache.hpp"

#include <algorithm>
#include <cstring>

#include "common/logger.hpp"
#include "common/status.hpp"

namespace mdfkit {

CachingPageSource::CachingPageSource(std::shared_ptr<PageSource> inner, size_t capacity)
    : inner_(std::move(inner)),
      capacity_(std::max(capacity, config::kMinPageCacheSize)),
      frames_(capacity_),
      frame_pages_(capacity_) {
    // Initialize free list with all frames
    free_list_.reserve(capacity_);
    for (size_t i = capacity_; i > 0; --i) {
        free_list_.push_back(static_cast<frame_id_t>(i - 1));
    }
}

Status CachingPageSource::read_page(PagePointer pointer, std::span<uint8_t> out) {
    if (out.size() != config::kPageSize) {
        return Status::InvalidArgument("page buffer must be one page");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Check if page is already cached
    auto it = page_table_.find(pointer);
    if (it != page_table_.end()) {
        ++stats_.hits;
        replacer_.touch(it->second);
        std::memcpy(out.data(), frames_[it->second].data(), config::kPageSize);
        return Status::Ok();
    }

    ++stats_.misses;
    MDFKIT_RETURN_IF_ERROR(inner_->read_page(pointer, out));

    frame_id_t frame_id = find_victim_frame();
    if (frame_id == INVALID_FRAME_ID) {
        return Status::Internal("page cache has no usable frame");
    }

    std::memcpy(frames_[frame_id].data(), out.data(), config::kPageSize);
    frame_pages_[frame_id] = pointer;
    page_table_[pointer] = frame_id;
    replacer_.touch(frame_id);
    return Status::Ok();
}

frame_id_t CachingPageSource::find_victim_frame() {
    if (!free_list_.empty()) {
        frame_id_t frame_id = free_list_.back();
        free_list_.pop_back();
        return frame_id;
    }

    frame_id_t frame_id = INVALID_FRAME_ID;
    if (replacer_.evict(&frame_id)) {
        ++stats_.evictions;
        LOG_TRACE("Evicting page {} from frame {}", frame_pages_[frame_id].to_string(),
                  frame_id);
        page_table_.erase(frame_pages_[frame_id]);
    }
    return frame_id;
}

std::vector<file_id_t> CachingPageSource::file_ids() const {
    return inner_->file_ids();
}

page_id_t CachingPageSource::page_count(file_id_t file_id) const {
    return inner_->page_count(file_id);
}

size_t CachingPageSource::cached_pages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page_table_.size();
}

PageCacheStats CachingPageSource::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void CachingPageSource::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    frame_id_t frame_id = INVALID_FRAME_ID;
    while (replacer_.evict(&frame_id)) {
        free_list_.push_back(frame_id);
    }
    page_table_.clear();
}

}  // namespace mdfkit
