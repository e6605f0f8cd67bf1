/**
 * @file page_cache_test.cpp
 * @brief Unit tests for CachingPageSource
 */

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "storage/page_cache.hpp"

namespace mdfkit {
namespace {

class PageCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        inner_ = std::make_shared<MemoryPageSource>();
        for (page_id_t id = 0; id < 10; ++id) {
            std::vector<uint8_t> bytes(config::kPageSize, static_cast<uint8_t>(id + 1));
            ASSERT_TRUE(inner_->add_page(PagePointer(1, id), std::move(bytes)).ok());
        }
        cache_ = std::make_unique<CachingPageSource>(inner_, cache_size_);
    }

    Status read(page_id_t id) {
        return cache_->read_page(PagePointer(1, id), buffer_);
    }

    static constexpr size_t cache_size_ = 4;
    std::shared_ptr<MemoryPageSource> inner_;
    std::unique_ptr<CachingPageSource> cache_;
    std::vector<uint8_t> buffer_ = std::vector<uint8_t>(config::kPageSize);
};

TEST_F(PageCacheTest, ReadThrough) {
    ASSERT_TRUE(read(3).ok());
    EXPECT_EQ(buffer_[0], 4);
    EXPECT_EQ(buffer_[config::kPageSize - 1], 4);
    EXPECT_EQ(inner_->read_count(), 1u);
    EXPECT_EQ(cache_->cached_pages(), 1u);
}

TEST_F(PageCacheTest, RepeatedReadIsHit) {
    ASSERT_TRUE(read(2).ok());
    ASSERT_TRUE(read(2).ok());
    ASSERT_TRUE(read(2).ok());

    EXPECT_EQ(inner_->read_count(), 1u);
    PageCacheStats stats = cache_->stats();
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(buffer_[100], 3);
}

TEST_F(PageCacheTest, EvictsLeastRecentlyUsed) {
    for (page_id_t id = 0; id < 4; ++id) {
        ASSERT_TRUE(read(id).ok());
    }
    ASSERT_TRUE(read(0).ok());  // page 1 is now the oldest
    ASSERT_TRUE(read(5).ok());

    EXPECT_EQ(cache_->cached_pages(), cache_size_);
    EXPECT_EQ(cache_->stats().evictions, 1u);

    const uint64_t before = inner_->read_count();
    ASSERT_TRUE(read(0).ok());
    EXPECT_EQ(inner_->read_count(), before);
    ASSERT_TRUE(read(1).ok());
    EXPECT_EQ(inner_->read_count(), before + 1);
}

TEST_F(PageCacheTest, FailedReadIsNotCached) {
    EXPECT_TRUE(read(50).is_not_found());
    EXPECT_EQ(cache_->cached_pages(), 0u);

    ASSERT_TRUE(inner_->add_page(PagePointer(1, 50),
                                 std::vector<uint8_t>(config::kPageSize, 0xAB))
                    .ok());
    ASSERT_TRUE(read(50).ok());
    EXPECT_EQ(buffer_[0], 0xAB);
}

TEST_F(PageCacheTest, RejectsWrongBufferSize) {
    std::vector<uint8_t> small(100);
    EXPECT_EQ(cache_->read_page(PagePointer(1, 0), small).code(), StatusCode::kInvalidArgument);
}

TEST_F(PageCacheTest, CapacityHasFloor) {
    CachingPageSource tiny(inner_, 1);
    EXPECT_EQ(tiny.capacity(), config::kMinPageCacheSize);
}

TEST_F(PageCacheTest, ForwardsGeometry) {
    EXPECT_EQ(cache_->file_ids(), std::vector<file_id_t>{1});
    EXPECT_EQ(cache_->page_count(1), 10u);
    EXPECT_EQ(cache_->total_page_count(), 10u);
}

TEST_F(PageCacheTest, Clear) {
    ASSERT_TRUE(read(0).ok());
    ASSERT_TRUE(read(1).ok());
    cache_->clear();
    EXPECT_EQ(cache_->cached_pages(), 0u);

    ASSERT_TRUE(read(0).ok());
    EXPECT_EQ(inner_->read_count(), 3u);
}

}  // namespace
}  // namespace mdfkit
