/**
 * @file page_test.cpp
 * @brief Unit tests for page header and slot array decoding
 */

#include <gtest/gtest.h>

#include <type_traits>

#include "mdf_builder.hpp"
#include "storage/page.hpp"
#include "storage/page_source.hpp"

namespace mdfkit {
namespace {

using test::ByteVec;
using test::PageBuilder;
using test::RecordBuilder;

class PageTest : public ::testing::Test {
protected:
    const PagePointer self_{1, 120};
};

TEST_F(PageTest, DecodesHeaderFields) {
    PageBuilder builder(self_, PageType::kData);
    builder.set_next(PagePointer(1, 121)).set_prev(PagePointer(1, 119)).set_p_min_len(12);
    builder.set_object_id(77).set_index_id(1);
    builder.add_record(RecordBuilder().fixed(test::le<int32_t>(5)).columns(1).build());

    auto page = builder.parse();
    const PageHeader& h = page->header();
    EXPECT_EQ(h.header_version, 1);
    EXPECT_EQ(h.type, PageType::kData);
    EXPECT_EQ(h.next_page, PagePointer(1, 121));
    EXPECT_EQ(h.prev_page, PagePointer(1, 119));
    EXPECT_EQ(h.this_page, self_);
    EXPECT_EQ(h.p_min_len, 12);
    EXPECT_EQ(h.slot_count, 1);
    EXPECT_EQ(h.object_id, 77u);
    EXPECT_EQ(h.allocation_unit_id(), (uint64_t{1} << 48) | (uint64_t{77} << 16));
}

TEST_F(PageTest, UnknownTypeIsPreserved) {
    PageBuilder builder(self_, PageType::kData);
    builder.bytes()[1] = 42;

    auto page = builder.parse();
    EXPECT_EQ(page->type(), PageType::kUnrecognized);
    EXPECT_EQ(page->header().raw_type, 42);
}

TEST_F(PageTest, AllZeroPageParses) {
    std::shared_ptr<const Page> page;
    ASSERT_TRUE(Page::parse(self_, ByteVec(config::kPageSize, 0), &page).ok());
    EXPECT_EQ(page->type(), PageType::kUnrecognized);
    EXPECT_EQ(page->slot_count(), 0);
}

TEST_F(PageTest, ParsedPageOwnsItsBytes) {
    static_assert(!std::is_default_constructible_v<Page>);
    static_assert(!std::is_constructible_v<Page, PagePointer, std::vector<uint8_t>, PageHeader>);

    PageBuilder builder(self_, PageType::kData);
    builder.add_record(RecordBuilder().fixed(test::le<int32_t>(5)).columns(1).build());
    std::shared_ptr<const Page> page;
    ASSERT_TRUE(Page::parse(self_, builder.bytes(), &page).ok());
    builder.bytes()[96] = 0xFF;

    EXPECT_EQ(page.use_count(), 1);
    EXPECT_EQ(page->pointer(), self_);
    EXPECT_EQ(page->slot_count(), 1);
    EXPECT_NE(page->bytes()[96], 0xFF);
}

TEST_F(PageTest, RejectsWrongSize) {
    std::shared_ptr<const Page> page;
    EXPECT_EQ(Page::parse(self_, ByteVec(100, 0), &page).code(), StatusCode::kInvalidArgument);
}

TEST_F(PageTest, SlotCountOverlappingHeaderIsMalformed) {
    PageBuilder builder(self_, PageType::kData);
    builder.set_slot_count(5000);

    std::shared_ptr<const Page> page;
    EXPECT_EQ(Page::parse(self_, builder.bytes(), &page).code(), StatusCode::kMalformedPage);
}

TEST_F(PageTest, FreeDataOutsideRecordRegionIsMalformed) {
    PageBuilder builder(self_, PageType::kData);
    builder.set_free_data(40);

    std::shared_ptr<const Page> page;
    EXPECT_EQ(Page::parse(self_, builder.bytes(), &page).code(), StatusCode::kMalformedPage);
}

TEST_F(PageTest, SlotRangesEndAtNextRecord) {
    PageBuilder builder(self_, PageType::kData);
    ByteVec a = RecordBuilder().fixed(test::le<int32_t>(1)).columns(1).build();
    ByteVec b = RecordBuilder().fixed(test::le<int64_t>(2)).columns(1).build();
    builder.add_record(a);
    builder.add_record(b);

    auto page = builder.parse();
    SlotRange range;
    ASSERT_TRUE(page->slot(0, &range).ok());
    EXPECT_EQ(range.offset, config::kPageHeaderSize);
    EXPECT_EQ(range.length, a.size());

    ASSERT_TRUE(page->slot(1, &range).ok());
    EXPECT_EQ(range.offset, config::kPageHeaderSize + a.size());
    EXPECT_EQ(range.length, b.size());
}

TEST_F(PageTest, SlotOutOfRange) {
    PageBuilder builder(self_, PageType::kData);
    auto page = builder.parse();

    SlotRange range;
    EXPECT_EQ(page->slot(0, &range).code(), StatusCode::kInvalidArgument);
}

TEST_F(PageTest, SlotPointingIntoHeaderIsCorruption) {
    PageBuilder builder(self_, PageType::kData);
    builder.add_record(RecordBuilder().fixed(test::le<int32_t>(1)).columns(1).build());
    builder.set_slot_offset(0, 10);

    auto page = builder.parse();
    SlotRange range;
    EXPECT_EQ(page->slot(0, &range).code(), StatusCode::kCorruption);
}

TEST_F(PageTest, EmptySlotIsNotFound) {
    PageBuilder builder(self_, PageType::kData);
    builder.add_empty_slot();

    auto page = builder.parse();
    Record record;
    EXPECT_TRUE(page->record(0, &record).is_not_found());
}

TEST_F(PageTest, RecordsSkipsEmptySlotsAndKeepsBadOnes) {
    PageBuilder builder(self_, PageType::kData);
    builder.add_record(RecordBuilder().fixed(test::le<int32_t>(1)).columns(1).build());
    builder.add_empty_slot();
    builder.add_record(RecordBuilder().fixed(test::le<int32_t>(3)).columns(1).build());
    builder.add_record(RecordBuilder().fixed(test::le<int32_t>(4)).columns(1).build());
    builder.set_slot_offset(3, 8190);  // inside the slot array

    auto page = builder.parse();
    std::vector<slot_id_t> slots;
    std::vector<bool> ok;
    for (const PageRecord& entry : page->records()) {
        slots.push_back(entry.slot);
        ok.push_back(entry.status.ok());
    }
    EXPECT_EQ(slots, (std::vector<slot_id_t>{0, 2, 3}));
    EXPECT_EQ(ok, (std::vector<bool>{true, true, false}));
}

TEST_F(PageTest, FetchPageReportsMissingPage) {
    MemoryPageSource source;
    std::shared_ptr<const Page> page;
    EXPECT_TRUE(fetch_page(source, self_, &page).is_not_found());
}

TEST_F(PageTest, FetchPageParsesSourcePage) {
    MemoryPageSource source;
    PageBuilder builder(self_, PageType::kIam);
    ASSERT_TRUE(source.add_page(self_, builder.bytes()).ok());

    std::shared_ptr<const Page> page;
    ASSERT_TRUE(fetch_page(source, self_, &page).ok());
    EXPECT_EQ(page->type(), PageType::kIam);
    EXPECT_EQ(page->pointer(), self_);
}

}  // namespace
}  // namespace mdfkit
