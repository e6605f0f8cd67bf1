#pragma once

/**
 * @file lob_descriptor.hpp
 * @brief In-row placeholders for large object values
 *
 * A LOB-class column stores one of four things in the row:
 * - the value itself, when short (inline);
 * - a 16-byte text pointer: timestamp @0, RID of the LOB root @8;
 * - a 24-byte row-overflow pointer (type 2): level @1, timestamp @4,
 *   length @12, RID of the single data fragment @16;
 * - an inline root (type 4 or 5): level @1, timestamp @4, then 12-byte
 *   links from @12, each a cumulative end offset (u32) and a RID.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "mdfkit/status.hpp"

namespace mdfkit {

enum class LobDescriptorKind : uint8_t {
    kInline,
    kTextPointer,
    kRowOverflow,
    kInlineRoot,
};

[[nodiscard]] const char* lob_descriptor_kind_name(LobDescriptorKind kind) noexcept;

/**
 * @brief Reference to a LOB subtree covering bytes up to `end_offset`
 */
struct LobLink {
    uint64_t end_offset = 0;
    RecordPointer target;

    bool operator==(const LobLink& other) const noexcept {
        return end_offset == other.end_offset && target == other.target;
    }
};

/**
 * @brief Owned copy of an in-row LOB placeholder
 *
 * Never refers back into page memory, so a descriptor outlives the row it
 * was decoded from.
 */
class LobDescriptor {
public:
    static constexpr uint8_t kRowOverflowType = 2;
    static constexpr uint8_t kInlineRootType = 4;
    static constexpr uint8_t kInlineRootAltType = 5;
    static constexpr size_t kInlineRootHeaderSize = 12;
    static constexpr size_t kInlineRootLinkSize = 12;
    static constexpr uint16_t kBackPointerId = 0x0400;

    LobDescriptor() = default;

    /// Value stored directly in the row
    [[nodiscard]] static LobDescriptor make_inline(ByteSpan bytes);

    /**
     * @brief Parse a 16-byte text/ntext/image pointer
     * @return Corruption unless `bytes` is exactly 16 bytes
     */
    [[nodiscard]] static Status parse_text_pointer(ByteSpan bytes, LobDescriptor* out);

    /**
     * @brief Parse the slice of a complex variable column
     *
     * Dispatches on the type byte: row-overflow pointer, inline root, or a
     * 16-byte root pointer for max types stored out of row.
     * @return NotSupported for forwarding back pointers, Corruption otherwise
     */
    [[nodiscard]] static Status parse_complex(ByteSpan bytes, LobDescriptor* out);

    [[nodiscard]] LobDescriptorKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_inline() const noexcept { return kind_ == LobDescriptorKind::kInline; }

    /// Inline value bytes (kInline only)
    [[nodiscard]] const std::vector<uint8_t>& inline_data() const noexcept { return inline_; }

    /// Root record of a text pointer
    [[nodiscard]] RecordPointer root() const noexcept { return root_; }

    /// Top-level links (row-overflow: one link; inline root: all links)
    [[nodiscard]] const std::vector<LobLink>& links() const noexcept { return links_; }

    [[nodiscard]] uint32_t timestamp() const noexcept { return timestamp_; }
    [[nodiscard]] uint8_t level() const noexcept { return level_; }

    /**
     * @brief Total value length when the descriptor records it
     *
     * Unknown (false) for text pointers until the root record is read.
     */
    [[nodiscard]] bool known_length(uint64_t* length) const noexcept;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const LobDescriptor& other) const noexcept {
        return kind_ == other.kind_ && inline_ == other.inline_ && root_ == other.root_ &&
               links_ == other.links_ && timestamp_ == other.timestamp_ &&
               level_ == other.level_;
    }

private:
    LobDescriptorKind kind_ = LobDescriptorKind::kInline;
    std::vector<uint8_t> inline_;
    RecordPointer root_;
    std::vector<LobLink> links_;
    uint32_t timestamp_ = 0;
    uint8_t level_ = 0;
};

}  // namespace mdfkit
