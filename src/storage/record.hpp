#pragma once

/**
 * @file record.hpp
 * @brief Physical record format (FixedVar row layout)
 *
 * Record Layout:
 * +--------------------+  offset 0
 * | Status A           |  bits 1-3 kind, 0x10 null bitmap, 0x20 var cols
 * | Status B           |
 * | Fixed end (u16)    |
 * +--------------------+  offset 4
 * | Fixed-size cols    |  packed by declared width
 * +--------------------+  fixed end
 * | Column count (u16) |
 * | Null bitmap        |  ceil(count / 8) bytes, 1 bit per column
 * +--------------------+
 * | Var col count (u16)|  only with 0x20
 * | Var end offsets    |  u16 each, relative to record start, bit 15 = complex
 * +--------------------+
 * | Var col data       |
 * +--------------------+
 *
 * Forwarding stubs are 9 bytes: status byte plus the RID of the moved row.
 * Blob fragments (LOB tree nodes) have only the fixed region.
 */

#include <cstdint>
#include <span>

#include "common/types.hpp"
#include "mdfkit/status.hpp"

namespace mdfkit {

/**
 * @brief Record kind, bits 1-3 of status byte A
 */
enum class RecordKind : uint8_t {
    kPrimary = 0,
    kForwarded = 1,
    kForwardingStub = 2,
    kIndex = 3,
    kBlobFragment = 4,
    kGhostIndex = 5,
    kGhostData = 6,
    kGhostVersion = 7,
};

[[nodiscard]] const char* record_kind_name(RecordKind kind) noexcept;

/**
 * @brief Byte slice of one variable-length column
 */
struct VariableColumn {
    ByteSpan data;
    bool complex = false;  // LOB / row-overflow pointer or back pointer
};

/**
 * @brief Decoded view over one record's bytes
 *
 * Parsing validates every offset once, so the accessors never read outside
 * the record. The view borrows the bytes; the page that holds them must stay
 * alive while the record is used.
 */
class Record {
public:
    static constexpr uint8_t kNullBitmapFlag = 0x10;
    static constexpr uint8_t kVariableColumnsFlag = 0x20;
    static constexpr uint8_t kVersionTagFlag = 0x40;

    Record() = default;

    /**
     * @brief Parse a record
     * @param bytes Record byte range (may include slack up to the next record)
     * @param out Receives the record
     * @return RecordTooShort if any header field or offset points past the range
     */
    [[nodiscard]] static Status parse(ByteSpan bytes, Record* out);

    [[nodiscard]] RecordKind kind() const noexcept { return kind_; }
    [[nodiscard]] uint8_t status_a() const noexcept { return status_a_; }
    [[nodiscard]] uint8_t status_b() const noexcept { return status_b_; }

    [[nodiscard]] bool is_ghost() const noexcept {
        return kind_ == RecordKind::kGhostIndex || kind_ == RecordKind::kGhostData ||
               kind_ == RecordKind::kGhostVersion;
    }
    [[nodiscard]] bool is_forwarding_stub() const noexcept {
        return kind_ == RecordKind::kForwardingStub;
    }
    [[nodiscard]] bool is_forwarded() const noexcept { return kind_ == RecordKind::kForwarded; }
    [[nodiscard]] bool is_blob_fragment() const noexcept {
        return kind_ == RecordKind::kBlobFragment;
    }

    /// Primary and forwarded records carry column data
    [[nodiscard]] bool carries_columns() const noexcept {
        return kind_ == RecordKind::kPrimary || kind_ == RecordKind::kForwarded;
    }

    [[nodiscard]] bool has_null_bitmap() const noexcept {
        return (status_a_ & kNullBitmapFlag) != 0;
    }
    [[nodiscard]] bool has_variable_columns() const noexcept {
        return (status_a_ & kVariableColumnsFlag) != 0;
    }
    [[nodiscard]] bool has_version_tag() const noexcept {
        return (status_a_ & kVersionTagFlag) != 0;
    }

    /// Full byte range handed to parse()
    [[nodiscard]] ByteSpan bytes() const noexcept { return bytes_; }

    /// Bytes actually used by the record layout
    [[nodiscard]] size_t length() const noexcept { return length_; }

    /// Fixed-length column region, [4, fixed end)
    [[nodiscard]] ByteSpan fixed_data() const noexcept;

    /// Stored column count (0 for stubs, ghosts, and blob fragments)
    [[nodiscard]] uint16_t column_count() const noexcept { return column_count_; }

    /**
     * @brief Null bit for a column (0-based, storage order)
     *
     * Columns past the bitmap are reported null: they were added to the
     * table after this row was written.
     */
    [[nodiscard]] bool is_null(size_t column_index) const noexcept;

    [[nodiscard]] uint16_t variable_column_count() const noexcept { return var_count_; }

    /**
     * @brief Slice of a variable column
     * @return NotFound if the record stores fewer variable columns
     */
    [[nodiscard]] Status variable_column(size_t index, VariableColumn* out) const;

    /// Redirect target of a forwarding stub
    [[nodiscard]] RecordPointer forward_target() const noexcept { return forward_target_; }

private:
    ByteSpan bytes_;
    RecordKind kind_ = RecordKind::kPrimary;
    uint8_t status_a_ = 0;
    uint8_t status_b_ = 0;
    uint16_t fixed_end_ = 0;
    uint16_t column_count_ = 0;
    size_t bitmap_offset_ = 0;
    size_t bitmap_size_ = 0;
    uint16_t var_count_ = 0;
    size_t var_offsets_offset_ = 0;
    size_t var_data_start_ = 0;
    size_t length_ = 0;
    RecordPointer forward_target_;
};

}  // namespace mdfkit
