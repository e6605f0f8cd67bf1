/**
 * @file recovery_scanner_test.cpp
 * @brief Unit tests for the catalog-free page scan
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <unordered_map>

#include "catalog_fixture.hpp"
#include "mdfkit/mdfkit.hpp"

namespace mdfkit {
namespace {

using test::ColumnDef;
using test::PageBuilder;
using test::TableDef;

/// Counts reads of each page
class CountingPageSource : public PageSource {
public:
    explicit CountingPageSource(std::shared_ptr<PageSource> inner) : inner_(std::move(inner)) {}

    Status read_page(PagePointer pointer, std::span<uint8_t> out) override {
        ++reads_[pointer];
        return inner_->read_page(pointer, out);
    }
    std::vector<file_id_t> file_ids() const override { return inner_->file_ids(); }
    page_id_t page_count(file_id_t file_id) const override { return inner_->page_count(file_id); }

    int reads(PagePointer pointer) const {
        auto it = reads_.find(pointer);
        return it == reads_.end() ? 0 : it->second;
    }

private:
    std::shared_ptr<PageSource> inner_;
    std::unordered_map<PagePointer, int> reads_;
};

class RecoveryScannerTest : public ::testing::Test {
protected:
    void SetUp() override { source_ = std::make_shared<MemoryPageSource>(); }

    void put(PagePointer pointer, PageType type, uint16_t p_min_len) {
        PageBuilder page(pointer, type);
        page.set_p_min_len(p_min_len);
        ASSERT_TRUE(source_->add_page(pointer, page.bytes()).ok());
    }

    static std::vector<PagePointer> pages_of(const ScanRange& range) {
        std::vector<PagePointer> out;
        for (const ScanEntry& entry : range) {
            out.push_back(entry.pointer);
        }
        return out;
    }

    std::shared_ptr<MemoryPageSource> source_;
};

TEST_F(RecoveryScannerTest, AttributesPagesBySignature) {
    put(PagePointer(1, 0), PageType::kData, 12);
    put(PagePointer(1, 1), PageType::kData, 20);
    put(PagePointer(1, 2), PageType::kData, 33);

    RecoveryScanner scanner(source_, {{1, "a", 12}, {2, "b", 20}});
    std::vector<ScanEntry> entries;
    for (const ScanEntry& entry : scanner.scan()) {
        entries.push_back(entry);
    }
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].pointer, PagePointer(1, 0));
    EXPECT_EQ(entries[0].candidates, std::vector<object_id_t>{1});
    EXPECT_EQ(entries[1].pointer, PagePointer(1, 1));
    EXPECT_EQ(entries[1].candidates, std::vector<object_id_t>{2});
    EXPECT_FALSE(entries[1].is_ambiguous());
    EXPECT_EQ(entries[1].p_min_len, 20);
    EXPECT_NE(entries[1].page, nullptr);
}

TEST_F(RecoveryScannerTest, EqualSignaturesAreAmbiguous) {
    put(PagePointer(1, 0), PageType::kData, 16);

    RecoveryScanner scanner(source_, {{1, "a", 16}, {2, "b", 16}, {3, "c", 8}});
    std::vector<ScanEntry> entries;
    for (const ScanEntry& entry : scanner.scan()) {
        entries.push_back(entry);
    }
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].is_ambiguous());
    EXPECT_EQ(entries[0].candidates, (std::vector<object_id_t>{1, 2}));
    EXPECT_EQ(scanner.candidates_for(16).size(), 2u);
    EXPECT_TRUE(scanner.candidates_for(99).empty());
}

TEST_F(RecoveryScannerTest, SkipsNonDataPages) {
    put(PagePointer(1, 0), PageType::kIam, 12);
    put(PagePointer(1, 1), PageType::kIndex, 12);
    put(PagePointer(1, 2), PageType::kTextMix, 12);
    put(PagePointer(1, 3), PageType::kData, 12);

    RecoveryScanner scanner(source_, {{1, "a", 12}});
    EXPECT_EQ(pages_of(scanner.scan()), std::vector<PagePointer>{PagePointer(1, 3)});

    ScanOptions options;
    options.include_index_pages = true;
    RecoveryScanner with_index(source_, {{1, "a", 12}}, options);
    EXPECT_EQ(pages_of(with_index.scan()),
              (std::vector<PagePointer>{PagePointer(1, 1), PagePointer(1, 3)}));
}

TEST_F(RecoveryScannerTest, ReportUnmatched) {
    put(PagePointer(1, 0), PageType::kData, 12);
    put(PagePointer(1, 1), PageType::kData, 40);

    ScanOptions options;
    options.report_unmatched = true;
    RecoveryScanner scanner(source_, {{1, "a", 12}}, options);
    std::vector<ScanEntry> entries;
    for (const ScanEntry& entry : scanner.scan()) {
        entries.push_back(entry);
    }
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(entries[1].status.ok());
    EXPECT_TRUE(entries[1].candidates.empty());
}

TEST_F(RecoveryScannerTest, UnparseablePageIsErrorEntry) {
    put(PagePointer(1, 0), PageType::kData, 12);
    PageBuilder bad(PagePointer(1, 1), PageType::kData);
    bad.set_slot_count(6000);
    ASSERT_TRUE(source_->add_page(bad.pointer(), bad.bytes()).ok());
    put(PagePointer(1, 2), PageType::kData, 12);

    RecoveryScanner scanner(source_, {{1, "a", 12}});
    std::vector<ScanEntry> entries;
    for (const ScanEntry& entry : scanner.scan()) {
        entries.push_back(entry);
    }
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[1].status.code(), StatusCode::kMalformedPage);
    EXPECT_TRUE(entries[1].candidates.empty());
    EXPECT_TRUE(entries[2].status.ok());
}

TEST_F(RecoveryScannerTest, HolesAndZeroPagesAreSkipped) {
    put(PagePointer(1, 2), PageType::kData, 12);
    ASSERT_TRUE(source_->add_page(PagePointer(1, 4),
                                  std::vector<uint8_t>(config::kPageSize, 0)).ok());
    put(PagePointer(1, 7), PageType::kData, 12);

    RecoveryScanner scanner(source_, {{1, "a", 12}});
    EXPECT_EQ(pages_of(scanner.scan()),
              (std::vector<PagePointer>{PagePointer(1, 2), PagePointer(1, 7)}));
}

TEST_F(RecoveryScannerTest, ScansFilesInOrder) {
    put(PagePointer(3, 0), PageType::kData, 12);
    put(PagePointer(1, 1), PageType::kData, 12);
    put(PagePointer(1, 5), PageType::kData, 12);

    RecoveryScanner scanner(source_, {{1, "a", 12}});
    EXPECT_EQ(pages_of(scanner.scan()),
              (std::vector<PagePointer>{PagePointer(1, 1), PagePointer(1, 5), PagePointer(3, 0)}));
    EXPECT_EQ(pages_of(scanner.scan_from(PagePointer(1, 2))),
              (std::vector<PagePointer>{PagePointer(1, 5), PagePointer(3, 0)}));
    EXPECT_EQ(pages_of(scanner.scan_from(PagePointer(2, 0))),
              std::vector<PagePointer>{PagePointer(3, 0)});
}

TEST_F(RecoveryScannerTest, EmptySource) {
    RecoveryScanner scanner(source_, {{1, "a", 12}});
    EXPECT_TRUE(pages_of(scanner.scan()).empty());
}

TEST_F(RecoveryScannerTest, RecoversRowsOfUnlinkedPages) {
    test::SyntheticDatabaseBuilder builder;
    auto schema = builder.add_table(
        TableDef{300, "events", {ColumnDef{"id", 56, 4, false}, ColumnDef{"kind", 48, 1}}});
    builder.add_table(
        TableDef{301, "notes", {ColumnDef{"id", 127, 8, false}, ColumnDef{"text", 167, 50}}});

    // Three pages of "events", none linked to another
    int32_t next_id = 1;
    std::vector<PagePointer> pages;
    for (int p = 0; p < 3; ++p) {
        PagePointer pointer = builder.allocate_page();
        PageBuilder page = builder.data_page(300, pointer);
        for (int r = 0; r < 4; ++r) {
            page.add_record(test::encode_row(
                *schema, {test::f_int(next_id++), test::f_tinyint(static_cast<uint8_t>(r))}));
        }
        builder.add_page(page);
        pages.push_back(pointer);
    }
    builder.set_first_page(300, pages.front());

    std::unique_ptr<Database> db;
    ASSERT_TRUE(Database::open(builder.build(), DatabaseOptions(), &db).ok());
    const Table* events = db->table("events");
    ASSERT_NE(events, nullptr);

    int chain_rows = 0;
    for (const RowResult& result : events->rows()) {
        EXPECT_TRUE(result.ok());
        ++chain_rows;
    }
    EXPECT_EQ(chain_rows, 4);

    RecoveryScanner scanner(db->source(), RecoveryScanner::signatures_for(*db));
    ASSERT_EQ(scanner.signatures().size(), 2u);
    EXPECT_EQ(scanner.signatures()[0].p_min_len, schema->min_record_length());

    std::vector<int32_t> ids;
    for (const RowResult& result : scanner.recover_rows(*events)) {
        ASSERT_TRUE(result.ok()) << result.status.to_string();
        ids.push_back(result.row["id"].as_int());
    }
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}));
}

TEST_F(RecoveryScannerTest, RecoveredRowsComeOnlyFromDataPages) {
    test::SyntheticDatabaseBuilder builder;
    auto schema = builder.add_table(
        TableDef{300, "events", {ColumnDef{"id", 56, 4, false}, ColumnDef{"kind", 48, 1}}});
    builder.add_rows(300, {test::encode_row(*schema, {test::f_int(1), test::f_tinyint(0)}),
                           test::encode_row(*schema, {test::f_int(2), test::f_tinyint(0)})});

    // An index page whose records look exactly like the table's rows
    const PagePointer index_pointer = builder.allocate_page();
    PageBuilder index(index_pointer, PageType::kIndex);
    index.set_p_min_len(static_cast<uint16_t>(schema->min_record_length()));
    index.add_record(test::encode_row(*schema, {test::f_int(99), test::f_tinyint(0)}));
    builder.add_page(index);

    std::unique_ptr<Database> db;
    ASSERT_TRUE(Database::open(builder.build(), DatabaseOptions(), &db).ok());
    const Table* events = db->table("events");
    ASSERT_NE(events, nullptr);
    const PagePointer data_pointer = events->first_pages().front();

    auto counting = std::make_shared<CountingPageSource>(db->source());
    ScanOptions options;
    options.include_index_pages = true;
    RecoveryScanner scanner(counting, RecoveryScanner::signatures_for(*db), options);

    std::vector<PagePointer> scanned = pages_of(scanner.scan());
    EXPECT_NE(std::find(scanned.begin(), scanned.end(), index_pointer), scanned.end());

    const int data_reads = counting->reads(data_pointer);
    std::vector<int32_t> ids;
    for (const RowResult& result : scanner.recover_rows(*events)) {
        ASSERT_TRUE(result.ok()) << result.status.to_string();
        ids.push_back(result.row["id"].as_int());
    }
    EXPECT_EQ(ids, (std::vector<int32_t>{1, 2}));
    EXPECT_EQ(counting->reads(data_pointer) - data_reads, 1);
}

}  // namespace
}  // namespace mdfkit
