#pragma once

/**
 * @file lru_replacer.hpp
 * @brief LRU eviction policy for the page cache
 */

#include <cstddef>
#include <cstdint>
#include <list>
#include <unordered_map>

namespace mdfkit {

/// Frame identifier in the page cache
using frame_id_t = int32_t;

/// Invalid frame ID
constexpr frame_id_t INVALID_FRAME_ID = -1;

/**
 * @brief LRU Replacer for page cache eviction
 *
 * Tracks occupied frames in access order and selects the least recently
 * used one as victim. Not synchronized; the owning cache holds its lock.
 */
class LRUReplacer {
public:
    LRUReplacer() = default;

    /**
     * @brief Remove the least recently used frame
     * @param frame_id Output parameter for the evicted frame
     * @return true if a frame was evicted, false if replacer is empty
     */
    bool evict(frame_id_t* frame_id);

    /**
     * @brief Record an access, making the frame most recently used
     */
    void touch(frame_id_t frame_id);

    /**
     * @brief Stop tracking a frame
     */
    void remove(frame_id_t frame_id);

    /**
     * @brief Get the number of tracked frames
     */
    [[nodiscard]] std::size_t size() const noexcept { return lru_list_.size(); }

private:
    std::list<frame_id_t> lru_list_;
    std::unordered_map<frame_id_t, std::list<frame_id_t>::iterator> frame_map_;
};

}  // namespace mdfkit
