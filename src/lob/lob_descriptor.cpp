/**
 * @file lob_descriptor.cpp
 * @brief LOB descriptor parsing
 */

#include "lob/lob_descriptor.hpp"

#include "common/config.hpp"

namespace mdfkit {

const char* lob_descriptor_kind_name(LobDescriptorKind kind) noexcept {
    switch (kind) {
        case LobDescriptorKind::kInline:      return "inline";
        case LobDescriptorKind::kTextPointer: return "text pointer";
        case LobDescriptorKind::kRowOverflow: return "row overflow";
        case LobDescriptorKind::kInlineRoot:  return "inline root";
    }
    return "unknown";
}

LobDescriptor LobDescriptor::make_inline(ByteSpan bytes) {
    LobDescriptor desc;
    desc.kind_ = LobDescriptorKind::kInline;
    desc.inline_.assign(bytes.begin(), bytes.end());
    return desc;
}

Status LobDescriptor::parse_text_pointer(ByteSpan bytes, LobDescriptor* out) {
    if (bytes.size() != config::kTextPointerSize) {
        return Status::Corruption("text pointer must be 16 bytes, got " +
                                  std::to_string(bytes.size()));
    }
    LobDescriptor desc;
    desc.kind_ = LobDescriptorKind::kTextPointer;
    desc.timestamp_ = load_le<uint32_t>(bytes, 0);
    desc.root_ = RecordPointer::parse(bytes, 8);
    *out = std::move(desc);
    return Status::Ok();
}

Status LobDescriptor::parse_complex(ByteSpan bytes, LobDescriptor* out) {
    if (bytes.size() < 2) {
        return Status::Corruption("complex column of " + std::to_string(bytes.size()) +
                                  " bytes");
    }
    if (load_le<uint16_t>(bytes, 0) == kBackPointerId) {
        return Status::NotSupported("forwarding back pointer is not a LOB value");
    }

    const uint8_t type = bytes[0];
    if (type == kRowOverflowType && bytes.size() == config::kRowOverflowPointerSize) {
        LobDescriptor desc;
        desc.kind_ = LobDescriptorKind::kRowOverflow;
        desc.level_ = bytes[1];
        desc.timestamp_ = load_le<uint32_t>(bytes, 4);
        desc.links_.push_back(
            LobLink{load_le<uint32_t>(bytes, 12), RecordPointer::parse(bytes, 16)});
        *out = std::move(desc);
        return Status::Ok();
    }

    if ((type == kInlineRootType || type == kInlineRootAltType) &&
        bytes.size() >= kInlineRootHeaderSize + kInlineRootLinkSize &&
        (bytes.size() - kInlineRootHeaderSize) % kInlineRootLinkSize == 0) {
        LobDescriptor desc;
        desc.kind_ = LobDescriptorKind::kInlineRoot;
        desc.level_ = bytes[1];
        desc.timestamp_ = load_le<uint32_t>(bytes, 4);
        size_t count = (bytes.size() - kInlineRootHeaderSize) / kInlineRootLinkSize;
        desc.links_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            size_t at = kInlineRootHeaderSize + i * kInlineRootLinkSize;
            desc.links_.push_back(
                LobLink{load_le<uint32_t>(bytes, at), RecordPointer::parse(bytes, at + 4)});
        }
        *out = std::move(desc);
        return Status::Ok();
    }

    // Max types stored out of row keep a root pointer in the text pointer layout
    if (bytes.size() == config::kTextPointerSize) {
        return parse_text_pointer(bytes, out);
    }

    return Status::Corruption("unrecognized complex column (type " + std::to_string(type) +
                              ", " + std::to_string(bytes.size()) + " bytes)");
}

bool LobDescriptor::known_length(uint64_t* length) const noexcept {
    switch (kind_) {
        case LobDescriptorKind::kInline:
            *length = inline_.size();
            return true;
        case LobDescriptorKind::kRowOverflow:
        case LobDescriptorKind::kInlineRoot:
            *length = links_.empty() ? 0 : links_.back().end_offset;
            return true;
        case LobDescriptorKind::kTextPointer:
            return false;
    }
    return false;
}

std::string LobDescriptor::to_string() const {
    std::string out = std::string("<lob ") + lob_descriptor_kind_name(kind_);
    uint64_t length = 0;
    if (kind_ == LobDescriptorKind::kTextPointer) {
        out += " root=" + root_.to_string();
    } else if (!links_.empty()) {
        out += " first=" + links_.front().target.to_string();
    }
    if (known_length(&length)) {
        out += " length=" + std::to_string(length);
    }
    out += ">";
    return out;
}

}  // namespace mdfkit
