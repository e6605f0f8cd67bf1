/**
 * @file lob_node.cpp
 * @brief LOB node parsing
 */

#include "lob/lob_node.hpp"

namespace mdfkit {

const char* lob_node_type_name(uint16_t raw_type) noexcept {
    switch (raw_type) {
        case 0: return "small root";
        case 1: return "large root";
        case 2: return "internal";
        case 3: return "data";
        case 4: return "large root (shiloh)";
        case 5: return "large root (yukon)";
        case 6: return "super large root";
        case 8: return "null";
        default: return "unknown";
    }
}

namespace {

constexpr size_t kTypeOffset = 8;
constexpr size_t kSmallRootDataOffset = 16;
constexpr size_t kDataOffset = 10;
constexpr size_t kInternalLinksOffset = 16;
constexpr size_t kInternalLinkSize = 16;
constexpr size_t kLargeRootLinksOffset = 20;
constexpr size_t kLargeRootLinkSize = 12;

Status broken(const std::string& what) {
    return Status::BrokenLobChain(what);
}

}  // namespace

Status LobNode::parse(const Record& record, LobNode* out) {
    if (!record.is_blob_fragment()) {
        return broken(std::string("expected a blob fragment, found a ") +
                      record_kind_name(record.kind()) + " record");
    }

    ByteSpan fixed = record.fixed_data();
    if (fixed.size() < kDataOffset) {
        return broken("blob fragment of " + std::to_string(fixed.size()) + " bytes");
    }

    LobNode node;
    node.blob_id = load_le<uint64_t>(fixed, 0);
    uint16_t raw_type = load_le<uint16_t>(fixed, kTypeOffset);

    switch (raw_type) {
        case 0: {
            uint16_t length = 0;
            if (!try_load_le(fixed, 10, &length) ||
                kSmallRootDataOffset + length > fixed.size()) {
                return broken("small root data exceeds its record");
            }
            node.type = LobNodeType::kSmallRoot;
            node.data = fixed.subspan(kSmallRootDataOffset, length);
            break;
        }
        case 3:
            node.type = LobNodeType::kData;
            node.data = fixed.subspan(kDataOffset);
            break;
        case 2:
        case 5: {
            const bool internal = raw_type == 2;
            const size_t links_at = internal ? kInternalLinksOffset : kLargeRootLinksOffset;
            const size_t link_size = internal ? kInternalLinkSize : kLargeRootLinkSize;
            uint16_t cur_links = 0;
            if (fixed.size() < links_at || !try_load_le(fixed, 10, &node.max_links) ||
                !try_load_le(fixed, 12, &cur_links) || !try_load_le(fixed, 14, &node.level)) {
                return broken("LOB root header exceeds its record");
            }
            if (links_at + static_cast<size_t>(cur_links) * link_size > fixed.size()) {
                return broken(std::to_string(cur_links) + " links exceed the LOB node record");
            }
            node.type = internal ? LobNodeType::kInternal : LobNodeType::kLargeRootYukon;
            node.links.reserve(cur_links);
            for (size_t i = 0; i < cur_links; ++i) {
                size_t at = links_at + i * link_size;
                LobLink link;
                if (internal) {
                    link.end_offset = load_le<uint64_t>(fixed, at);
                    link.target = RecordPointer::parse(fixed, at + 8);
                } else {
                    link.end_offset = load_le<uint32_t>(fixed, at);
                    link.target = RecordPointer::parse(fixed, at + 4);
                }
                node.links.push_back(link);
            }
            break;
        }
        case 8:
            node.type = LobNodeType::kNull;
            break;
        default:
            return broken(std::string("unsupported LOB node type ") + std::to_string(raw_type) +
                          " (" + lob_node_type_name(raw_type) + ")");
    }

    *out = std::move(node);
    return Status::Ok();
}

}  // namespace mdfkit
