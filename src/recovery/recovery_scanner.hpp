#pragma once

/**
 * @file recovery_scanner.hpp
 * @brief Catalog-free page scan for damaged databases
 *
 * When the catalog cannot be trusted, data pages can still be attributed to
 * tables by their header's p_min_len (the fixed record length of the table
 * that owns the page). Equal signatures are never disambiguated: every
 * matching table is reported as a candidate.
 */

#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "catalog/row_iterator.hpp"
#include "catalog/table.hpp"
#include "common/macros.hpp"
#include "storage/page.hpp"
#include "storage/page_source.hpp"

namespace mdfkit {

class Database;

/**
 * @brief Expected data page header of one table
 */
struct TableSignature {
    object_id_t object_id = 0;
    std::string name;
    uint16_t p_min_len = 0;
};

/**
 * @brief One page reported by a scan
 *
 * Either a page whose p_min_len matches at least one signature, or a page
 * that could not be read or parsed (status set, no candidates).
 */
struct ScanEntry {
    PagePointer pointer;
    Status status;
    PageType page_type = PageType::kUnrecognized;
    uint16_t p_min_len = 0;
    uint32_t object_id = 0;  // header object id (allocation-unit part)
    std::vector<object_id_t> candidates;
    std::shared_ptr<const Page> page;

    [[nodiscard]] bool is_ambiguous() const noexcept { return candidates.size() > 1; }
};

struct ScanOptions {
    /// Also attribute index pages
    bool include_index_pages = false;

    /// Report data pages that match no signature (empty candidate list)
    bool report_unmatched = false;
};

// ─────────────────────────────────────────────────────────────────────────────
// ScanIterator
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Pull-based walk over every page of every file, in page order
 */
class ScanIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ScanEntry;
    using difference_type = std::ptrdiff_t;

    ScanIterator(std::shared_ptr<PageSource> source,
                 std::shared_ptr<const std::vector<TableSignature>> signatures,
                 ScanOptions options, PagePointer start);

    MDFKIT_DEFAULT_MOVE(ScanIterator);
    MDFKIT_DISALLOW_COPY(ScanIterator);

    /**
     * @brief Produce the next reported page
     * @return false once every page has been examined
     */
    bool next(ScanEntry* out);

    const ScanEntry& operator*() const { return current_; }
    const ScanEntry* operator->() const { return &current_; }
    ScanIterator& operator++() {
        has_current_ = next(&current_);
        return *this;
    }

    friend bool operator==(const ScanIterator& it, std::default_sentinel_t) noexcept {
        return !it.has_current_;
    }

private:
    /// Move to the next page address; false at the end of the last file
    bool advance(PagePointer* out);

    std::shared_ptr<PageSource> source_;
    std::shared_ptr<const std::vector<TableSignature>> signatures_;
    ScanOptions options_;

    std::vector<file_id_t> files_;
    size_t file_index_ = 0;
    page_id_t next_page_ = 0;

    ScanEntry current_;
    bool has_current_ = false;
};

struct ScanRange {
    std::shared_ptr<PageSource> source;
    std::shared_ptr<const std::vector<TableSignature>> signatures;
    ScanOptions options;
    PagePointer start;

    [[nodiscard]] ScanIterator begin() const {
        ScanIterator it(source, signatures, options, start);
        ++it;
        return it;
    }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }
};

// ─────────────────────────────────────────────────────────────────────────────
// RecoveryScanner
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Attributes data pages to tables without the catalog
 *
 * A scan never fails as a whole; unreadable pages become error entries.
 */
class RecoveryScanner {
public:
    RecoveryScanner(std::shared_ptr<PageSource> source, std::vector<TableSignature> signatures,
                    ScanOptions options = {});

    /**
     * @brief Signatures of every table of an opened database
     *
     * Uses the p_min_len observed on each table's first data page, falling
     * back to the schema's minimum record length when that page is unreadable.
     */
    [[nodiscard]] static std::vector<TableSignature> signatures_for(const Database& db);

    [[nodiscard]] const std::vector<TableSignature>& signatures() const noexcept {
        return *signatures_;
    }

    /// Tables whose signature matches a p_min_len
    [[nodiscard]] std::vector<object_id_t> candidates_for(uint16_t p_min_len) const;

    /// Scan every page of every file
    [[nodiscard]] ScanRange scan() const;

    /// Scan from a page onward (the rest of that file, then later files)
    [[nodiscard]] ScanRange scan_from(PagePointer start) const;

    /**
     * @brief Rows of every data page attributed to a table
     *
     * Pages are found lazily while iterating and each is read once. Ambiguous
     * pages are included, so rows may come from another table with the same
     * signature. Index pages are skipped even with include_index_pages set.
     */
    [[nodiscard]] RowRange recover_rows(const Table& table) const;

private:
    std::shared_ptr<PageSource> source_;
    std::shared_ptr<const std::vector<TableSignature>> signatures_;
    ScanOptions options_;
};

}  // namespace mdfkit
