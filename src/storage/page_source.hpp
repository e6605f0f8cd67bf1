#pragma once

/**
 * @file page_source.hpp
 * @brief Page access layer
 *
 * A PageSource hands out raw 8 KB page images by (file, page) address. The
 * decoder never assumes the whole file is in memory: every layer above pulls
 * pages one at a time through this interface, in any order and as often as
 * it needs to.
 */

#include <map>
#include <mutex>
#include <span>
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"
#include "mdfkit/status.hpp"

namespace mdfkit {

/**
 * @brief Supplier of raw page bytes
 *
 * Implementations must tolerate arbitrary access order and repeated reads of
 * the same page. A page that does not exist returns NotFound; a page that
 * exists but cannot be read returns IOError.
 */
class PageSource {
public:
    virtual ~PageSource() = default;

    /**
     * @brief Copy one page into `out`
     * @param pointer Page address
     * @param out Destination buffer, exactly config::kPageSize bytes
     */
    [[nodiscard]] virtual Status read_page(PagePointer pointer, std::span<uint8_t> out) = 0;

    /**
     * @brief File ids served by this source, ascending
     */
    [[nodiscard]] virtual std::vector<file_id_t> file_ids() const = 0;

    /**
     * @brief Number of pages in a file (0 for unknown files)
     */
    [[nodiscard]] virtual page_id_t page_count(file_id_t file_id) const = 0;

    /**
     * @brief Sum of page_count() over every file
     */
    [[nodiscard]] uint64_t total_page_count() const;
};

/**
 * @brief PageSource over page images held in memory
 *
 * Used by tests and by callers that extract pages from somewhere other than
 * a plain file. Pages that were never added read as NotFound.
 */
class MemoryPageSource : public PageSource {
public:
    MemoryPageSource() = default;

    /**
     * @brief Add or replace a page image
     * @return InvalidArgument unless `bytes` is exactly one page
     */
    [[nodiscard]] Status add_page(PagePointer pointer, std::vector<uint8_t> bytes);

    /// Drop a page so that it reads as missing
    void remove_page(PagePointer pointer);

    [[nodiscard]] Status read_page(PagePointer pointer, std::span<uint8_t> out) override;
    [[nodiscard]] std::vector<file_id_t> file_ids() const override;
    [[nodiscard]] page_id_t page_count(file_id_t file_id) const override;

    /// Number of reads served, including failed ones
    [[nodiscard]] uint64_t read_count() const;

private:
    std::map<PagePointer, std::vector<uint8_t>> pages_;
    uint64_t reads_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace mdfkit
