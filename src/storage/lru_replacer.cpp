/**
 * @file lru_replacer.cpp
 * @brief LRU Replacer implementation
 */

#include "storage/lru_replacer.hpp"

namespace mdfkit {

bool LRUReplacer::evict(frame_id_t* frame_id) {
    if (lru_list_.empty()) {
        return false;
    }

    // Evict from back (least recently used)
    *frame_id = lru_list_.back();
    lru_list_.pop_back();
    frame_map_.erase(*frame_id);

    return true;
}

void LRUReplacer::touch(frame_id_t frame_id) {
    auto it = frame_map_.find(frame_id);
    if (it != frame_map_.end()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Add to front (most recently used)
    lru_list_.push_front(frame_id);
    frame_map_[frame_id] = lru_list_.begin();
}

void LRUReplacer::remove(frame_id_t frame_id) {
    auto it = frame_map_.find(frame_id);
    if (it != frame_map_.end()) {
        lru_list_.erase(it->second);
        frame_map_.erase(it);
    }
}

}  // namespace mdfkit
