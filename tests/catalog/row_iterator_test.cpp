/**
 * @file row_iterator_test.cpp
 * @brief Unit tests for RowIterator, page walkers and forwarding resolution
 */

#include <gtest/gtest.h>

#include "catalog/row_iterator.hpp"
#include "catalog_fixture.hpp"

namespace mdfkit {
namespace {

using test::ByteVec;
using test::ColumnDef;
using test::PageBuilder;
using test::TableDef;

class RowIteratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<MemoryPageSource>();
        schema_ = test::schema_of(
            TableDef{200, "items", {ColumnDef{"id", 56, 4, false}, ColumnDef{"label", 167, 20}}});
    }

    ByteVec row(int32_t id, const std::string& label = "") {
        return test::encode_row(*schema_, {test::f_int(id), test::f_varchar(label)});
    }

    ByteVec forwarded(int32_t id) {
        return test::encode_row(*schema_, {test::f_int(id), test::f_varchar("moved")},
                                RecordKind::kForwarded);
    }

    PageBuilder page(page_id_t id) {
        PageBuilder builder(PagePointer(1, id), PageType::kData);
        builder.set_p_min_len(static_cast<uint16_t>(schema_->min_record_length()));
        return builder;
    }

    void store(const PageBuilder& builder) {
        ASSERT_TRUE(source_->add_page(builder.pointer(), builder.bytes()).ok());
    }

    RowIterator chain(std::vector<PagePointer> heads, uint64_t max_pages = 0,
                      size_t hops = config::kDefaultMaxForwardHops) {
        return RowIterator(source_, schema_,
                           std::make_unique<ChainPageWalker>(std::move(heads), max_pages), hops);
    }

    /// Drain an iterator; ids of good rows and codes of bad ones
    static void drain(RowIterator& it, std::vector<int32_t>* ids,
                      std::vector<StatusCode>* errors = nullptr) {
        RowResult result;
        while (it.next(&result)) {
            if (result.ok()) {
                ids->push_back(result.row["id"].as_int());
            } else if (errors != nullptr) {
                errors->push_back(result.status.code());
            }
        }
    }

    std::shared_ptr<MemoryPageSource> source_;
    std::shared_ptr<const Schema> schema_;
};

TEST_F(RowIteratorTest, FollowsPageChain) {
    PageBuilder p1 = page(10);
    PageBuilder p2 = page(11);
    p1.set_next(p2.pointer());
    p1.add_record(row(1, "a"));
    p1.add_record(row(2, "b"));
    p2.add_record(row(3, "c"));
    store(p1);
    store(p2);

    RowIterator it = chain({p1.pointer()});
    std::vector<int32_t> ids;
    drain(it, &ids);
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 2, 3}));
}

TEST_F(RowIteratorTest, ReportsRecordIds) {
    PageBuilder p = page(10);
    p.add_record(row(1));
    p.add_empty_slot();
    p.add_record(row(3));
    store(p);

    RowIterator it = chain({p.pointer()});
    RowResult result;
    ASSERT_TRUE(it.next(&result));
    EXPECT_EQ(result.rid, RecordPointer(p.pointer(), 0));
    ASSERT_TRUE(it.next(&result));
    EXPECT_EQ(result.rid, RecordPointer(p.pointer(), 2));
    EXPECT_FALSE(it.next(&result));
}

TEST_F(RowIteratorTest, SkipsGhostsAndForwardedRecords) {
    PageBuilder p = page(10);
    p.add_record(row(1));
    p.add_record(test::ghost_record());
    p.add_record(forwarded(99));
    p.add_record(row(4));
    store(p);

    RowIterator it = chain({p.pointer()});
    std::vector<int32_t> ids;
    drain(it, &ids);
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 4}));
}

TEST_F(RowIteratorTest, ForwardedRowReportedAtStub) {
    PageBuilder home = page(10);
    PageBuilder away = page(20);
    slot_id_t target = away.add_record(forwarded(7));
    home.add_record(row(1));
    home.add_record(test::forwarding_stub(RecordPointer(away.pointer(), target)));
    store(home);
    store(away);

    RowIterator it = chain({home.pointer()});
    RowResult result;
    ASSERT_TRUE(it.next(&result));
    ASSERT_TRUE(it.next(&result));
    ASSERT_TRUE(result.ok()) << result.status.to_string();
    EXPECT_EQ(result.rid, RecordPointer(home.pointer(), 1));
    EXPECT_EQ(result.row["id"].as_int(), 7);
    EXPECT_EQ(result.row["label"].as_string(), "moved");
    EXPECT_FALSE(it.next(&result));
}

TEST_F(RowIteratorTest, MultiHopForwarding) {
    PageBuilder home = page(10);
    PageBuilder mid = page(20);
    PageBuilder last = page(30);
    slot_id_t final_slot = last.add_record(forwarded(42));
    slot_id_t mid_slot =
        mid.add_record(test::forwarding_stub(RecordPointer(last.pointer(), final_slot)));
    home.add_record(test::forwarding_stub(RecordPointer(mid.pointer(), mid_slot)));
    store(home);
    store(mid);
    store(last);

    RowIterator it = chain({home.pointer()}, 100, 2);
    std::vector<int32_t> ids;
    drain(it, &ids);
    EXPECT_EQ(ids, (std::vector<int32_t>{42}));
}

TEST_F(RowIteratorTest, ForwardingCycleIsDetected) {
    // Three stubs pointing at each other, then an ordinary row
    PageBuilder p = page(10);
    p.add_record(test::forwarding_stub(RecordPointer(PagePointer(1, 10), 1)));
    p.add_record(test::forwarding_stub(RecordPointer(PagePointer(1, 10), 2)));
    p.add_record(test::forwarding_stub(RecordPointer(PagePointer(1, 10), 0)));
    p.add_record(row(5, "after"));
    store(p);

    RowIterator it = chain({p.pointer()});
    std::vector<int32_t> ids;
    std::vector<StatusCode> errors;
    drain(it, &ids, &errors);
    EXPECT_EQ(errors, std::vector<StatusCode>(3, StatusCode::kForwardLoopDetected));
    EXPECT_EQ(ids, (std::vector<int32_t>{5}));
}

TEST_F(RowIteratorTest, ForwardToEmptySlotIsCorruption) {
    PageBuilder p = page(10);
    p.add_record(test::forwarding_stub(RecordPointer(PagePointer(1, 10), 1)));
    p.add_empty_slot();
    store(p);

    RowIterator it = chain({p.pointer()});
    RowResult result;
    ASSERT_TRUE(it.next(&result));
    EXPECT_EQ(result.status.code(), StatusCode::kCorruption);
    EXPECT_FALSE(it.next(&result));
}

TEST_F(RowIteratorTest, BadSlotDoesNotStopIteration) {
    PageBuilder p = page(10);
    p.add_record(row(1));
    ByteVec broken = row(2, "truncated");
    broken.resize(broken.size() - 5);
    p.add_record(broken);  // variable data now ends past the slot
    p.add_record(row(3));
    store(p);

    RowIterator it = chain({p.pointer()});
    std::vector<int32_t> ids;
    std::vector<StatusCode> errors;
    drain(it, &ids, &errors);
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 3}));
    EXPECT_EQ(errors, std::vector<StatusCode>{StatusCode::kRecordTooShort});
}

TEST_F(RowIteratorTest, MissingPageEndsChainWithError) {
    PageBuilder p1 = page(10);
    p1.set_next(PagePointer(1, 11));  // never stored
    p1.add_record(row(1));
    store(p1);
    PageBuilder other = page(12);
    other.add_record(row(2));
    store(other);

    RowIterator it = chain({p1.pointer(), other.pointer()});
    std::vector<int32_t> ids;
    std::vector<StatusCode> errors;
    drain(it, &ids, &errors);
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 2}));
    EXPECT_EQ(errors, std::vector<StatusCode>{StatusCode::kNotFound});
}

TEST_F(RowIteratorTest, NonDataPageEndsChain) {
    PageBuilder p1 = page(10);
    p1.set_next(PagePointer(1, 11));
    p1.add_record(row(1));
    store(p1);
    PageBuilder iam(PagePointer(1, 11), PageType::kIam);
    store(iam);

    RowIterator it = chain({p1.pointer()});
    std::vector<int32_t> ids;
    std::vector<StatusCode> errors;
    drain(it, &ids, &errors);
    EXPECT_EQ(ids, (std::vector<int32_t>{1}));
    EXPECT_EQ(errors, std::vector<StatusCode>{StatusCode::kMalformedPage});
}

TEST_F(RowIteratorTest, CyclicPageChainIsCut) {
    PageBuilder p1 = page(10);
    PageBuilder p2 = page(11);
    p1.set_next(p2.pointer());
    p2.set_next(p1.pointer());
    p1.add_record(row(1));
    p2.add_record(row(2));
    store(p1);
    store(p2);

    RowIterator it = chain({p1.pointer()});
    std::vector<int32_t> ids;
    std::vector<StatusCode> errors;
    drain(it, &ids, &errors);
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 2}));
    EXPECT_TRUE(errors.empty());
}

TEST_F(RowIteratorTest, SelfLinkedPageIsReadOnce) {
    PageBuilder p = page(10);
    p.set_next(p.pointer());
    p.add_record(row(1));
    p.add_record(row(2));
    store(p);

    RowIterator it = chain({p.pointer()});
    std::vector<int32_t> ids;
    drain(it, &ids);
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 2}));
}

TEST_F(RowIteratorTest, ZeroPageLimitIsUnbounded) {
    std::vector<PageBuilder> pages;
    for (page_id_t id = 10; id < 16; ++id) {
        pages.push_back(page(id));
    }
    for (size_t i = 0; i < pages.size(); ++i) {
        if (i + 1 < pages.size()) {
            pages[i].set_next(pages[i + 1].pointer());
        }
        pages[i].add_record(row(static_cast<int32_t>(i)));
        store(pages[i]);
    }

    RowIterator it = chain({pages.front().pointer()}, 0);
    std::vector<int32_t> ids;
    drain(it, &ids);
    EXPECT_EQ(ids, (std::vector<int32_t>{0, 1, 2, 3, 4, 5}));
}

TEST_F(RowIteratorTest, PageLimitCutsLongChain) {
    std::vector<PageBuilder> pages;
    for (page_id_t id = 10; id < 14; ++id) {
        pages.push_back(page(id));
    }
    for (size_t i = 0; i < pages.size(); ++i) {
        if (i + 1 < pages.size()) {
            pages[i].set_next(pages[i + 1].pointer());
        }
        pages[i].add_record(row(static_cast<int32_t>(i)));
        store(pages[i]);
    }

    RowIterator it = chain({pages.front().pointer()}, 2);
    std::vector<int32_t> ids;
    drain(it, &ids);
    EXPECT_EQ(ids, (std::vector<int32_t>{0, 1}));
}

TEST_F(RowIteratorTest, HeadReachedByEarlierChainIsSkipped) {
    PageBuilder p1 = page(10);
    PageBuilder p2 = page(11);
    p1.set_next(p2.pointer());
    p1.add_record(row(1));
    p2.add_record(row(2));
    store(p1);
    store(p2);

    RowIterator it = chain({p1.pointer(), p2.pointer()});
    std::vector<int32_t> ids;
    drain(it, &ids);
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 2}));
}

TEST_F(RowIteratorTest, ListWalkerVisitsGivenPages) {
    PageBuilder p1 = page(10);
    PageBuilder p2 = page(11);
    p1.set_next(p2.pointer());
    p1.add_record(row(1));
    p2.add_record(row(2));
    store(p1);
    store(p2);

    RowIterator it(source_, schema_, std::make_unique<ListPageWalker>(std::vector<PagePointer>{
                                         p2.pointer(), PagePointer(1, 77), p1.pointer()}),
                   config::kDefaultMaxForwardHops);
    std::vector<int32_t> ids;
    std::vector<StatusCode> errors;
    drain(it, &ids, &errors);
    EXPECT_EQ(ids, (std::vector<int32_t>{2, 1}));
    EXPECT_EQ(errors, std::vector<StatusCode>{StatusCode::kNotFound});
}

TEST_F(RowIteratorTest, RangeIsRestartable) {
    PageBuilder p = page(10);
    for (int32_t i = 0; i < 5; ++i) {
        p.add_record(row(i));
    }
    store(p);

    const PagePointer head = p.pointer();
    RowRange range(source_, schema_,
                   [head]() {
                       return std::make_unique<ChainPageWalker>(std::vector<PagePointer>{head});
                   },
                   config::kDefaultMaxForwardHops);

    for (int pass = 0; pass < 2; ++pass) {
        std::vector<int32_t> ids;
        for (const RowResult& result : range) {
            ASSERT_TRUE(result.ok());
            ids.push_back(result.row[0].as_int());
        }
        EXPECT_EQ(ids, (std::vector<int32_t>{0, 1, 2, 3, 4}));
    }
}

TEST_F(RowIteratorTest, EmptyChain) {
    RowIterator it = chain({});
    RowResult result;
    EXPECT_FALSE(it.next(&result));
    EXPECT_FALSE(it.next(&result));
}

}  // namespace
}  // namespace mdfkit
