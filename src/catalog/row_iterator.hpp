#pragma once

/**
 * @file row_iterator.hpp
 * @brief Lazy row iteration over page chains
 */

#include <functional>
#include <iterator>
#include <memory>
#include <unordered_set>
#include <vector>

#include "catalog/row.hpp"
#include "catalog/row_decoder.hpp"
#include "common/macros.hpp"
#include "storage/page.hpp"
#include "storage/page_source.hpp"

namespace mdfkit {

/**
 * @brief One produced row, or the reason a slot could not be decoded
 *
 * `rid` is the row's home slot; for forwarded rows that is the stub, not
 * the slot the data lives in.
 */
struct RowResult {
    RecordPointer rid;
    Status status;
    Row row;

    [[nodiscard]] bool ok() const noexcept { return status.ok(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// Page Walkers
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Decides which pages a RowIterator visits
 */
class PageWalker {
public:
    virtual ~PageWalker() = default;

    /// Next page to read; false when there are no more
    virtual bool next(PagePointer* out) = 0;

    /// The page returned by next() was read; validate it
    [[nodiscard]] virtual Status accept(const Page& page) = 0;

    /// The page returned by next() could not be read; move past it
    virtual void fail() = 0;

    /// Page already parsed by next(), if any; null means the iterator reads it
    virtual std::shared_ptr<const Page> take_page() { return nullptr; }
};

/**
 * @brief Follows next-page pointers from a list of chain heads
 *
 * No page is visited twice: a next-page pointer back to a visited page ends
 * the chain, and so does a head reached from an earlier chain. A chain is
 * also cut after `max_pages` pages; 0 leaves it unbounded. A page that is
 * not a data page ends its chain.
 */
class ChainPageWalker : public PageWalker {
public:
    explicit ChainPageWalker(std::vector<PagePointer> heads, uint64_t max_pages = 0);

    bool next(PagePointer* out) override;
    [[nodiscard]] Status accept(const Page& page) override;
    void fail() override;

private:
    std::vector<PagePointer> heads_;
    size_t head_index_ = 0;
    PagePointer current_;
    uint64_t chain_pages_ = 0;
    uint64_t max_pages_;
    std::unordered_set<PagePointer> visited_;
};

/**
 * @brief Visits a fixed list of pages, in order
 */
class ListPageWalker : public PageWalker {
public:
    explicit ListPageWalker(std::vector<PagePointer> pages) : pages_(std::move(pages)) {}

    bool next(PagePointer* out) override;
    [[nodiscard]] Status accept(const Page& page) override;
    void fail() override { ++index_; }

private:
    std::vector<PagePointer> pages_;
    size_t index_ = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// RowIterator
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Pull-based row sequence
 *
 * Holds at most one page at a time. Ghost records and forwarded records met
 * directly on a page are skipped (the stub produces them); forwarding stubs
 * are followed for at most `max_forward_hops` hops. A slot that fails to
 * decode produces a RowResult with the error and iteration continues. An
 * unreadable page produces one error result and ends its chain.
 *
 * Usable both as `while (it.next(&r))` and in a range-for through RowRange.
 */
class RowIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = RowResult;
    using difference_type = std::ptrdiff_t;

    RowIterator(std::shared_ptr<PageSource> source, std::shared_ptr<const Schema> schema,
                std::unique_ptr<PageWalker> walker, size_t max_forward_hops);

    MDFKIT_DEFAULT_MOVE(RowIterator);
    MDFKIT_DISALLOW_COPY(RowIterator);

    /**
     * @brief Produce the next row result
     * @return false when every page has been visited
     */
    bool next(RowResult* out);

    const RowResult& operator*() const { return current_; }
    const RowResult* operator->() const { return &current_; }
    RowIterator& operator++() {
        has_current_ = next(&current_);
        return *this;
    }

    friend bool operator==(const RowIterator& it, std::default_sentinel_t) noexcept {
        return !it.has_current_;
    }

private:
    /// Result for one slot of the current page; false if the slot yields nothing
    bool produce(slot_id_t slot, RowResult* out);

    /// Follow a stub's redirect chain to the forwarded record
    [[nodiscard]] Status follow_forward(RecordPointer target, std::shared_ptr<const Page>* page,
                                        Record* record) const;

    std::shared_ptr<PageSource> source_;
    RowDecoder decoder_;
    std::unique_ptr<PageWalker> walker_;
    size_t max_forward_hops_;

    std::shared_ptr<const Page> page_;
    uint32_t next_slot_ = 0;
    bool done_ = false;

    RowResult current_;
    bool has_current_ = false;
};

/**
 * @brief Restartable row sequence
 *
 * Every begin() starts a fresh traversal from the first page.
 */
class RowRange {
public:
    using WalkerFactory = std::function<std::unique_ptr<PageWalker>()>;

    RowRange(std::shared_ptr<PageSource> source, std::shared_ptr<const Schema> schema,
             WalkerFactory make_walker, size_t max_forward_hops)
        : source_(std::move(source)),
          schema_(std::move(schema)),
          make_walker_(std::move(make_walker)),
          max_forward_hops_(max_forward_hops) {}

    [[nodiscard]] RowIterator iterator() const {
        return RowIterator(source_, schema_, make_walker_(), max_forward_hops_);
    }

    [[nodiscard]] RowIterator begin() const {
        RowIterator it = iterator();
        ++it;
        return it;
    }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

private:
    std::shared_ptr<PageSource> source_;
    std::shared_ptr<const Schema> schema_;
    WalkerFactory make_walker_;
    size_t max_forward_hops_;
};

}  // namespace mdfkit
