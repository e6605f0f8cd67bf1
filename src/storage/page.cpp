/**
 * @file page.cpp
 * @brief Page header and slot array decoding
 */

#include "storage/page.hpp"

#include <algorithm>

#include "common/status.hpp"
#include "storage/page_source.hpp"

namespace mdfkit {

PageType page_type_from_raw(uint8_t raw) noexcept {
    switch (raw) {
        case 1: case 2: case 3: case 4: case 7: case 8: case 9: case 10: case 11:
        case 13: case 15: case 16: case 17: case 18: case 19: case 20:
            return static_cast<PageType>(raw);
        default:
            return PageType::kUnrecognized;
    }
}

const char* page_type_name(PageType type) noexcept {
    switch (type) {
        case PageType::kUnrecognized:   return "unrecognized";
        case PageType::kData:           return "data";
        case PageType::kIndex:          return "index";
        case PageType::kTextMix:        return "text mix";
        case PageType::kTextTree:       return "text tree";
        case PageType::kSort:           return "sort";
        case PageType::kGam:            return "GAM";
        case PageType::kSgam:           return "SGAM";
        case PageType::kIam:            return "IAM";
        case PageType::kPfs:            return "PFS";
        case PageType::kBoot:           return "boot";
        case PageType::kFileHeader:     return "file header";
        case PageType::kDiffMap:        return "diff map";
        case PageType::kMlMap:          return "ML map";
        case PageType::kDbccTemp:       return "DBCC temp";
        case PageType::kAlterIndexTemp: return "ALTER INDEX temp";
        case PageType::kPreAlloc:       return "pre-alloc";
    }
    return "unrecognized";
}

std::string Lsn::to_string() const {
    return "(" + std::to_string(vlf) + ":" + std::to_string(block) + ":" +
           std::to_string(slot) + ")";
}

// ─────────────────────────────────────────────────────────────────────────────
// PageHeader
// ─────────────────────────────────────────────────────────────────────────────

PageHeader PageHeader::parse(ByteSpan page) noexcept {
    PageHeader h;
    h.header_version = page[0];
    h.raw_type = page[1];
    h.type = page_type_from_raw(h.raw_type);
    h.type_flag_bits = page[2];
    h.level = page[3];
    h.flag_bits = load_le<uint16_t>(page, 4);
    h.index_id = load_le<uint16_t>(page, 6);
    h.prev_page = PagePointer::parse(page, 8);
    h.p_min_len = load_le<uint16_t>(page, 14);
    h.next_page = PagePointer::parse(page, 16);
    h.slot_count = load_le<uint16_t>(page, 22);
    h.object_id = load_le<uint32_t>(page, 24);
    h.free_count = load_le<uint16_t>(page, 28);
    h.free_data = load_le<uint16_t>(page, 30);
    h.this_page = PagePointer::parse(page, 32);
    h.reserved_count = load_le<uint16_t>(page, 38);
    h.lsn.vlf = load_le<uint32_t>(page, 40);
    h.lsn.block = load_le<uint32_t>(page, 44);
    h.lsn.slot = load_le<uint16_t>(page, 48);
    h.xact_reserved = load_le<uint16_t>(page, 50);
    h.xdes_id = static_cast<uint64_t>(load_le<uint16_t>(page, 52)) << 32 |
                load_le<uint32_t>(page, 54);
    h.ghost_record_count = load_le<uint16_t>(page, 58);
    h.torn_bits = load_le<uint32_t>(page, 60);
    return h;
}

std::string PageHeader::to_string() const {
    return std::string("type=") + page_type_name(type) + "(" + std::to_string(raw_type) +
           ") this=" + this_page.to_string() + " prev=" + prev_page.to_string() +
           " next=" + next_page.to_string() + " slots=" + std::to_string(slot_count) +
           " p_min_len=" + std::to_string(p_min_len) + " au=" +
           std::to_string(allocation_unit_id()) + " free_data=" + std::to_string(free_data) +
           " lsn=" + lsn.to_string();
}

// ─────────────────────────────────────────────────────────────────────────────
// Page
// ─────────────────────────────────────────────────────────────────────────────

Page::Page(ParseTag, PagePointer pointer, std::vector<uint8_t> bytes, const PageHeader& header)
    : pointer_(pointer), bytes_(std::move(bytes)), header_(header) {
    const size_t limit = slot_array_start();
    sorted_offsets_.reserve(header_.slot_count);
    for (uint16_t i = 0; i < header_.slot_count; ++i) {
        uint16_t offset = load_le<uint16_t>(bytes_, config::kPageSize - 2 * (i + 1u));
        if (offset >= config::kPageHeaderSize && offset < limit) {
            sorted_offsets_.push_back(offset);
        }
    }
    std::sort(sorted_offsets_.begin(), sorted_offsets_.end());
}

Status Page::parse(PagePointer pointer, std::vector<uint8_t> bytes,
                   std::shared_ptr<const Page>* out) {
    if (bytes.size() != config::kPageSize) {
        return Status::InvalidArgument("page image must be " +
                                       std::to_string(config::kPageSize) + " bytes");
    }

    PageHeader header = PageHeader::parse(bytes);

    const size_t max_slots =
        (config::kPageSize - config::kPageHeaderSize) / config::kSlotEntrySize;
    if (header.slot_count > max_slots) {
        return Status::MalformedPage("page " + pointer.to_string() + " claims " +
                                     std::to_string(header.slot_count) +
                                     " slots, slot array would overlap the header");
    }

    // Unallocated and unknown pages carry no usable free-data offset
    const size_t slot_start = config::kPageSize - config::kSlotEntrySize * header.slot_count;
    if (header.type != PageType::kUnrecognized && header.free_data != 0 &&
        (header.free_data < config::kPageHeaderSize || header.free_data > slot_start)) {
        return Status::MalformedPage("page " + pointer.to_string() + " free data offset " +
                                     std::to_string(header.free_data) +
                                     " outside the record region");
    }

    *out = std::make_shared<const Page>(ParseTag(), pointer, std::move(bytes), header);
    return Status::Ok();
}

Status Page::slot(slot_id_t slot, SlotRange* out) const {
    if (slot >= header_.slot_count) {
        return Status::InvalidArgument("slot " + std::to_string(slot) + " out of range, page " +
                                       pointer_.to_string() + " has " +
                                       std::to_string(header_.slot_count) + " slots");
    }

    SlotRange range;
    range.slot = slot;
    range.offset = load_le<uint16_t>(bytes_, config::kPageSize - 2 * (slot + 1u));
    if (range.is_empty()) {
        *out = range;
        return Status::Ok();
    }

    const size_t limit = slot_array_start();
    if (range.offset < config::kPageHeaderSize || range.offset >= limit) {
        return Status::Corruption("slot " + std::to_string(slot) + " offset " +
                                  std::to_string(range.offset) +
                                  " outside the record region of page " + pointer_.to_string());
    }

    // The record ends where the next record starts, or at the end of used space
    size_t end = limit;
    if (header_.free_data > range.offset && header_.free_data <= limit) {
        end = header_.free_data;
    }
    auto next = std::upper_bound(sorted_offsets_.begin(), sorted_offsets_.end(), range.offset);
    if (next != sorted_offsets_.end() && *next < end) {
        end = *next;
    }
    range.length = end - range.offset;

    *out = range;
    return Status::Ok();
}

Status Page::record(slot_id_t slot, Record* out) const {
    SlotRange range;
    MDFKIT_RETURN_IF_ERROR(this->slot(slot, &range));
    if (range.is_empty()) {
        return Status::NotFound("slot " + std::to_string(slot) + " of page " +
                                pointer_.to_string() + " is empty");
    }
    return Record::parse(ByteSpan(bytes_).subspan(range.offset, range.length), out);
}

Page::RecordRange Page::records() const {
    return RecordRange{RecordIterator(this, 0), RecordIterator(this, header_.slot_count)};
}

// ─────────────────────────────────────────────────────────────────────────────
// RecordIterator
// ─────────────────────────────────────────────────────────────────────────────

Page::RecordIterator::RecordIterator(const Page* page, uint32_t slot)
    : page_(page), slot_(slot) {
    settle();
}

Page::RecordIterator& Page::RecordIterator::operator++() {
    ++slot_;
    settle();
    return *this;
}

void Page::RecordIterator::settle() {
    if (page_ == nullptr) {
        return;
    }
    // Skip empty slots; keep bad ones so the caller sees the error
    while (slot_ < page_->slot_count()) {
        auto id = static_cast<slot_id_t>(slot_);
        SlotRange range;
        Status status = page_->slot(id, &range);
        if (status.ok() && range.is_empty()) {
            ++slot_;
            continue;
        }
        current_ = PageRecord{};
        current_.slot = id;
        if (status.ok()) {
            status = Record::parse(page_->bytes().subspan(range.offset, range.length),
                                   &current_.record);
        }
        current_.status = std::move(status);
        return;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// fetch_page
// ─────────────────────────────────────────────────────────────────────────────

Status fetch_page(PageSource& source, PagePointer pointer, std::shared_ptr<const Page>* out) {
    std::vector<uint8_t> bytes(config::kPageSize);
    MDFKIT_RETURN_IF_ERROR(source.read_page(pointer, bytes));
    return Page::parse(pointer, std::move(bytes), out);
}

}  // namespace mdfkit
