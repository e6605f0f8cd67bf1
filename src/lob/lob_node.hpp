#pragma once

/**
 * @file lob_node.hpp
 * @brief LOB tree nodes stored as blob fragment records
 *
 * Fixed region of every node: blob id (u64) @0, node type (u16) @8.
 *
 *  type  node             body
 *  0     small root       length (u16) @10, data @16
 *  2     internal         max links @10, cur links @12, level @14,
 *                         16-byte links from @16: end offset (u64) + RID
 *  3     data             data @10
 *  5     large root       max links @10, cur links @12, level @14,
 *                         12-byte links from @20: end offset (u32) + RID
 *  8     null             empty value
 */

#include <cstdint>
#include <vector>

#include "lob/lob_descriptor.hpp"
#include "storage/record.hpp"

namespace mdfkit {

enum class LobNodeType : uint16_t {
    kSmallRoot = 0,
    kLargeRoot = 1,
    kInternal = 2,
    kData = 3,
    kLargeRootShiloh = 4,
    kLargeRootYukon = 5,
    kSuperLargeRoot = 6,
    kNull = 8,
};

[[nodiscard]] const char* lob_node_type_name(uint16_t raw_type) noexcept;

/**
 * @brief Parsed LOB node; `data` borrows from the page
 */
struct LobNode {
    uint64_t blob_id = 0;
    LobNodeType type = LobNodeType::kNull;
    ByteSpan data;               // small root, data
    std::vector<LobLink> links;  // internal, large root
    uint16_t max_links = 0;
    uint16_t level = 0;

    [[nodiscard]] bool is_leaf() const noexcept {
        return type == LobNodeType::kSmallRoot || type == LobNodeType::kData;
    }

    /**
     * @brief Parse a blob fragment record
     * @return BrokenLobChain for other record kinds, unsupported node types,
     *         or bodies that do not fit in the record
     */
    [[nodiscard]] static Status parse(const Record& record, LobNode* out);
};

}  // namespace mdfkit
