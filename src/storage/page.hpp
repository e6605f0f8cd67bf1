#pragma once

/**
 * @file page.hpp
 * @brief MDF page header and slot array
 *
 * Layout:
 * +------------------+  offset 0
 * | Page Header      |  96 bytes
 * +------------------+  offset 96
 * | Records          |  Grow UP (toward higher offsets)
 * | [record_0]       |
 * | ...              |
 * +------------------+  free data offset
 * | Free Space       |
 * +------------------+  8192 - 2 * slot_count
 * | Slot Array       |  Grows DOWN, slot 0 in the last two bytes
 * +------------------+  8192
 */

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"
#include "mdfkit/status.hpp"
#include "storage/record.hpp"

namespace mdfkit {

class PageSource;

/**
 * @brief Page types (header byte 1)
 */
enum class PageType : uint8_t {
    kUnrecognized = 0,
    kData = 1,
    kIndex = 2,
    kTextMix = 3,
    kTextTree = 4,
    kSort = 7,
    kGam = 8,
    kSgam = 9,
    kIam = 10,
    kPfs = 11,
    kBoot = 13,
    kFileHeader = 15,
    kDiffMap = 16,
    kMlMap = 17,
    kDbccTemp = 18,
    kAlterIndexTemp = 19,
    kPreAlloc = 20,
};

/// Map the raw header byte; unknown values become kUnrecognized
[[nodiscard]] PageType page_type_from_raw(uint8_t raw) noexcept;

[[nodiscard]] const char* page_type_name(PageType type) noexcept;

/// Text mix and text tree pages hold LOB fragments
[[nodiscard]] inline bool is_lob_page(PageType type) noexcept {
    return type == PageType::kTextMix || type == PageType::kTextTree;
}

/**
 * @brief Log sequence number (VLF : log block : slot)
 */
struct Lsn {
    uint32_t vlf = 0;
    uint32_t block = 0;
    uint16_t slot = 0;

    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Decoded 96-byte page header
 */
struct PageHeader {
    uint8_t header_version = 0;
    uint8_t raw_type = 0;
    PageType type = PageType::kUnrecognized;
    uint8_t type_flag_bits = 0;
    uint8_t level = 0;
    uint16_t flag_bits = 0;
    uint16_t index_id = 0;
    PagePointer prev_page;
    uint16_t p_min_len = 0;
    PagePointer next_page;
    uint16_t slot_count = 0;
    uint32_t object_id = 0;  // allocation-unit object part, not the table id
    uint16_t free_count = 0;
    uint16_t free_data = 0;
    PagePointer this_page;
    uint16_t reserved_count = 0;
    Lsn lsn;
    uint16_t xact_reserved = 0;
    uint64_t xdes_id = 0;
    uint16_t ghost_record_count = 0;
    uint32_t torn_bits = 0;

    /**
     * @brief Decode the header fields
     * @pre page.size() >= config::kPageHeaderSize
     */
    [[nodiscard]] static PageHeader parse(ByteSpan page) noexcept;

    /// (index_id << 48) | (object_id << 16)
    [[nodiscard]] alloc_unit_id_t allocation_unit_id() const noexcept {
        return (static_cast<uint64_t>(index_id) << 48) |
               (static_cast<uint64_t>(object_id) << 16);
    }

    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Byte range of one slot's record
 */
struct SlotRange {
    slot_id_t slot = 0;
    offset_t offset = 0;
    size_t length = 0;

    /// Offset 0 marks a deleted slot
    [[nodiscard]] bool is_empty() const noexcept { return offset == 0; }
};

/**
 * @brief One entry produced by Page::records()
 */
struct PageRecord {
    slot_id_t slot = 0;
    Status status;
    Record record;
};

/**
 * @brief Immutable, validated 8 KB page
 *
 * Pages are shared as std::shared_ptr<const Page>; records and slot ranges
 * point into the page bytes and are valid as long as the page is.
 */
class Page {
    struct ParseTag {
        explicit ParseTag() = default;
    };

public:
    /// Only parse() can construct a page
    Page(ParseTag, PagePointer pointer, std::vector<uint8_t> bytes, const PageHeader& header);

    /**
     * @brief Validate a page image
     * @param pointer Address the bytes were read from
     * @param bytes Exactly config::kPageSize bytes
     * @param out Receives the page
     * @return MalformedPage if the header is internally inconsistent
     */
    [[nodiscard]] static Status parse(PagePointer pointer, std::vector<uint8_t> bytes,
                                      std::shared_ptr<const Page>* out);

    [[nodiscard]] PagePointer pointer() const noexcept { return pointer_; }
    [[nodiscard]] const PageHeader& header() const noexcept { return header_; }
    [[nodiscard]] PageType type() const noexcept { return header_.type; }
    [[nodiscard]] ByteSpan bytes() const noexcept { return bytes_; }
    [[nodiscard]] uint16_t slot_count() const noexcept { return header_.slot_count; }

    /**
     * @brief Byte range of a slot
     * @return InvalidArgument for slot >= slot_count, Corruption when the slot
     *         offset points into the header or the slot array
     */
    [[nodiscard]] Status slot(slot_id_t slot, SlotRange* out) const;

    /**
     * @brief Parse the record in a slot
     * @return NotFound for an empty slot, otherwise slot() or Record::parse() errors
     */
    [[nodiscard]] Status record(slot_id_t slot, Record* out) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Record Iteration
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Iterator over non-empty slots
     *
     * Slots whose record fails to parse are still produced, with the error in
     * PageRecord::status.
     */
    class RecordIterator {
    public:
        RecordIterator() = default;
        RecordIterator(const Page* page, uint32_t slot);

        const PageRecord& operator*() const { return current_; }
        const PageRecord* operator->() const { return &current_; }
        RecordIterator& operator++();

        bool operator==(const RecordIterator& other) const noexcept {
            return page_ == other.page_ && slot_ == other.slot_;
        }
        bool operator!=(const RecordIterator& other) const noexcept {
            return !(*this == other);
        }

    private:
        void settle();

        const Page* page_ = nullptr;
        uint32_t slot_ = 0;
        PageRecord current_;
    };

    struct RecordRange {
        RecordIterator first;
        RecordIterator last;
        [[nodiscard]] RecordIterator begin() const { return first; }
        [[nodiscard]] RecordIterator end() const { return last; }
    };

    [[nodiscard]] RecordRange records() const;

private:
    [[nodiscard]] size_t slot_array_start() const noexcept {
        return config::kPageSize - config::kSlotEntrySize * header_.slot_count;
    }

    PagePointer pointer_;
    std::vector<uint8_t> bytes_;
    PageHeader header_;
    std::vector<uint16_t> sorted_offsets_;  // valid slot offsets, ascending
};

/**
 * @brief Read and validate one page from a source
 */
[[nodiscard]] Status fetch_page(PageSource& source, PagePointer pointer,
                                std::shared_ptr<const Page>* out);

}  // namespace mdfkit
