#pragma once

/**
 * @file page_cache.hpp
 * @brief LRU caching wrapper around a PageSource
 */

#include <array>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "common/macros.hpp"
#include "storage/lru_replacer.hpp"
#include "storage/page_source.hpp"

namespace mdfkit {

/**
 * @brief Cache statistics
 */
struct PageCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
};

/**
 * @brief Bounded window of recently read pages
 *
 * Keeps up to `capacity` page images from the wrapped source and evicts the
 * least recently used one when full. Catalog bootstrap and forwarding
 * resolution revisit the same few pages many times; the cache keeps those
 * revisits off the disk without ever holding the whole file. Failed reads
 * are not cached.
 */
class CachingPageSource : public PageSource {
public:
    /**
     * @brief Wrap a source
     * @param inner Source to read through to
     * @param capacity Number of cached pages (at least config::kMinPageCacheSize)
     */
    CachingPageSource(std::shared_ptr<PageSource> inner, size_t capacity);

    MDFKIT_DISALLOW_COPY_AND_MOVE(CachingPageSource);

    [[nodiscard]] Status read_page(PagePointer pointer, std::span<uint8_t> out) override;
    [[nodiscard]] std::vector<file_id_t> file_ids() const override;
    [[nodiscard]] page_id_t page_count(file_id_t file_id) const override;

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t cached_pages() const;
    [[nodiscard]] PageCacheStats stats() const;

    /// Drop every cached page
    void clear();

private:
    using Frame = std::array<uint8_t, config::kPageSize>;

    /// Find a frame to use (evict if necessary)
    [[nodiscard]] frame_id_t find_victim_frame();

    std::shared_ptr<PageSource> inner_;
    size_t capacity_;
    std::vector<Frame> frames_;
    std::vector<PagePointer> frame_pages_;
    LRUReplacer replacer_;
    std::unordered_map<PagePointer, frame_id_t> page_table_;
    std::vector<frame_id_t> free_list_;
    PageCacheStats stats_;
    mutable std::mutex mutex_;
};

}  // namespace mdfkit
