#pragma once

/**
 * @file types.hpp
 * @brief Common type definitions for mdfkit
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "common/bytes.hpp"

namespace mdfkit {

// ─────────────────────────────────────────────────────────────────────────────
// Basic Type Aliases
// ─────────────────────────────────────────────────────────────────────────────

/// Page number within a file
using page_id_t = uint32_t;

/// Database file identifier (1 = primary data file)
using file_id_t = uint16_t;

/// Slot number within a page
using slot_id_t = uint16_t;

/// Offset within a page or record
using offset_t = uint16_t;

/// Object identifier (tables, system tables)
using object_id_t = int32_t;

/// Rowset (partition) identifier
using rowset_id_t = int64_t;

/// Allocation unit identifier
using alloc_unit_id_t = uint64_t;

// ─────────────────────────────────────────────────────────────────────────────
// Page Pointer - (file, page) address of a page
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Address of a page inside the database
 *
 * Stored on disk as 6 bytes: page id (u32) followed by file id (u16).
 * A zero page id is the null pointer used to terminate page chains.
 */
struct PagePointer {
    page_id_t page_id = 0;
    file_id_t file_id = 0;

    PagePointer() = default;
    PagePointer(file_id_t fid, page_id_t pid) : page_id(pid), file_id(fid) {}

    /**
     * @brief Decode the 6-byte on-disk form at `offset`
     * @pre offset + 6 <= bytes.size()
     */
    [[nodiscard]] static PagePointer parse(ByteSpan bytes, size_t offset) noexcept {
        return PagePointer(load_le<file_id_t>(bytes, offset + 4),
                           load_le<page_id_t>(bytes, offset));
    }

    [[nodiscard]] bool is_null() const noexcept { return page_id == 0; }

    bool operator==(const PagePointer& other) const noexcept {
        return page_id == other.page_id && file_id == other.file_id;
    }

    bool operator!=(const PagePointer& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const PagePointer& other) const noexcept {
        if (file_id != other.file_id) return file_id < other.file_id;
        return page_id < other.page_id;
    }

    /// "(file:page)", the notation DBCC PAGE uses
    [[nodiscard]] std::string to_string() const {
        return "(" + std::to_string(file_id) + ":" + std::to_string(page_id) + ")";
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Record Pointer (RID) - uniquely identifies a record
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Record ID - page pointer plus slot number
 *
 * Stored on disk as 8 bytes: page id (u32), file id (u16), slot (u16).
 */
struct RecordPointer {
    PagePointer page;
    slot_id_t slot = 0;

    RecordPointer() = default;
    RecordPointer(PagePointer p, slot_id_t s) : page(p), slot(s) {}

    /**
     * @brief Decode the 8-byte on-disk form at `offset`
     * @pre offset + 8 <= bytes.size()
     */
    [[nodiscard]] static RecordPointer parse(ByteSpan bytes, size_t offset) noexcept {
        return RecordPointer(PagePointer::parse(bytes, offset),
                             load_le<slot_id_t>(bytes, offset + 6));
    }

    [[nodiscard]] bool is_null() const noexcept { return page.is_null(); }

    bool operator==(const RecordPointer& other) const noexcept {
        return page == other.page && slot == other.slot;
    }

    bool operator!=(const RecordPointer& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const RecordPointer& other) const noexcept {
        if (page != other.page) return page < other.page;
        return slot < other.slot;
    }

    /// "(file:page:slot)"
    [[nodiscard]] std::string to_string() const {
        return "(" + std::to_string(page.file_id) + ":" + std::to_string(page.page_id) +
               ":" + std::to_string(slot) + ")";
    }
};

}  // namespace mdfkit

// Hash support for page and record pointers
namespace std {
template <>
struct hash<mdfkit::PagePointer> {
    size_t operator()(const mdfkit::PagePointer& ptr) const noexcept {
        return hash<uint64_t>{}(
            (static_cast<uint64_t>(ptr.file_id) << 32) | ptr.page_id
        );
    }
};

template <>
struct hash<mdfkit::RecordPointer> {
    size_t operator()(const mdfkit::RecordPointer& rid) const noexcept {
        return hash<uint64_t>{}(
            (static_cast<uint64_t>(rid.page.file_id) << 48) |
            (static_cast<uint64_t>(rid.page.page_id) << 16) | rid.slot
        );
    }
};
}  // namespace std
