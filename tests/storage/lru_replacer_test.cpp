/**
 * @file lru_replacer_test.cpp
 * @brief Unit tests for LRUReplacer
 */

#include <gtest/gtest.h>

#include "storage/lru_replacer.hpp"

namespace mdfkit {
namespace {

TEST(LRUReplacerTest, InitiallyEmpty) {
    LRUReplacer replacer;
    EXPECT_EQ(replacer.size(), 0);
}

TEST(LRUReplacerTest, Touch) {
    LRUReplacer replacer;

    replacer.touch(1);
    replacer.touch(2);
    replacer.touch(3);

    EXPECT_EQ(replacer.size(), 3);
}

TEST(LRUReplacerTest, Remove) {
    LRUReplacer replacer;

    replacer.touch(1);
    replacer.touch(2);
    replacer.touch(3);

    replacer.remove(2);
    EXPECT_EQ(replacer.size(), 2);

    replacer.remove(7);  // untracked
    EXPECT_EQ(replacer.size(), 2);
}

TEST(LRUReplacerTest, Evict) {
    LRUReplacer replacer;

    replacer.touch(1);
    replacer.touch(2);
    replacer.touch(3);

    frame_id_t frame_id;

    // Least recently touched goes first
    EXPECT_TRUE(replacer.evict(&frame_id));
    EXPECT_EQ(frame_id, 1);

    EXPECT_TRUE(replacer.evict(&frame_id));
    EXPECT_EQ(frame_id, 2);

    EXPECT_TRUE(replacer.evict(&frame_id));
    EXPECT_EQ(frame_id, 3);

    EXPECT_FALSE(replacer.evict(&frame_id));
}

TEST(LRUReplacerTest, TouchRefreshesOrder) {
    LRUReplacer replacer;

    replacer.touch(1);
    replacer.touch(2);
    replacer.touch(3);
    replacer.touch(1);

    frame_id_t frame_id;
    EXPECT_TRUE(replacer.evict(&frame_id));
    EXPECT_EQ(frame_id, 2);
}

TEST(LRUReplacerTest, EvictEmpty) {
    LRUReplacer replacer;

    frame_id_t frame_id;
    EXPECT_FALSE(replacer.evict(&frame_id));
}

TEST(LRUReplacerTest, DuplicateTouch) {
    LRUReplacer replacer;

    replacer.touch(1);
    replacer.touch(1);

    EXPECT_EQ(replacer.size(), 1);
}

}  // namespace
}  // namespace mdfkit
