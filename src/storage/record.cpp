/**
 * @file record.cpp
 * @brief Record parsing
 */

#include "storage/record.hpp"

#include "common/config.hpp"

namespace mdfkit {

const char* record_kind_name(RecordKind kind) noexcept {
    switch (kind) {
        case RecordKind::kPrimary:        return "primary";
        case RecordKind::kForwarded:      return "forwarded";
        case RecordKind::kForwardingStub: return "forwarding stub";
        case RecordKind::kIndex:          return "index";
        case RecordKind::kBlobFragment:   return "blob fragment";
        case RecordKind::kGhostIndex:     return "ghost index";
        case RecordKind::kGhostData:      return "ghost data";
        case RecordKind::kGhostVersion:   return "ghost version";
    }
    return "unknown";
}

namespace {

Status too_short(const char* what, size_t need, size_t have) {
    return Status::RecordTooShort(std::string(what) + " needs " + std::to_string(need) +
                                  " bytes, record has " + std::to_string(have));
}

}  // namespace

Status Record::parse(ByteSpan bytes, Record* out) {
    Record rec;
    rec.bytes_ = bytes;

    if (bytes.empty()) {
        return too_short("status byte", 1, 0);
    }
    rec.status_a_ = bytes[0];
    rec.kind_ = static_cast<RecordKind>((rec.status_a_ >> 1) & 0x07);

    // Ghosts are a deleted marker only
    if (rec.is_ghost()) {
        rec.length_ = 1;
        *out = rec;
        return Status::Ok();
    }

    if (rec.is_forwarding_stub()) {
        if (bytes.size() < config::kForwardingStubSize) {
            return too_short("forwarding stub", config::kForwardingStubSize, bytes.size());
        }
        rec.forward_target_ = RecordPointer::parse(bytes, 1);
        rec.length_ = config::kForwardingStubSize;
        *out = rec;
        return Status::Ok();
    }

    if (bytes.size() < config::kRecordHeaderSize) {
        return too_short("record header", config::kRecordHeaderSize, bytes.size());
    }
    rec.status_b_ = bytes[1];
    rec.fixed_end_ = load_le<uint16_t>(bytes, 2);
    if (rec.fixed_end_ < config::kRecordHeaderSize) {
        return Status::RecordTooShort("fixed region end " + std::to_string(rec.fixed_end_) +
                                      " precedes the record header");
    }
    if (rec.fixed_end_ > bytes.size()) {
        return too_short("fixed region", rec.fixed_end_, bytes.size());
    }
    rec.length_ = rec.fixed_end_;

    if (!rec.carries_columns()) {
        // Blob fragments and index records: fixed region only
        *out = rec;
        return Status::Ok();
    }

    size_t pos = rec.fixed_end_;
    if (pos + config::kColumnCountSize > bytes.size()) {
        return too_short("column count", pos + config::kColumnCountSize, bytes.size());
    }
    rec.column_count_ = load_le<uint16_t>(bytes, pos);
    pos += config::kColumnCountSize;

    if (rec.has_null_bitmap()) {
        rec.bitmap_offset_ = pos;
        rec.bitmap_size_ = (static_cast<size_t>(rec.column_count_) + 7) / 8;
        pos += rec.bitmap_size_;
        if (pos > bytes.size()) {
            return too_short("null bitmap", pos, bytes.size());
        }
    }

    if (rec.has_variable_columns()) {
        if (pos + 2 > bytes.size()) {
            return too_short("variable column count", pos + 2, bytes.size());
        }
        rec.var_count_ = load_le<uint16_t>(bytes, pos);
        pos += 2;
        rec.var_offsets_offset_ = pos;
        pos += static_cast<size_t>(rec.var_count_) * 2;
        if (pos > bytes.size()) {
            return too_short("variable column offset array", pos, bytes.size());
        }
        rec.var_data_start_ = pos;

        // Validate every end offset now so that accessors can trust them
        size_t prev_end = pos;
        for (uint16_t i = 0; i < rec.var_count_; ++i) {
            size_t end = load_le<uint16_t>(bytes, rec.var_offsets_offset_ + i * 2u) &
                         static_cast<uint16_t>(~config::kComplexColumnFlag);
            if (end > bytes.size()) {
                return Status::RecordTooShort("variable column " + std::to_string(i) +
                                              " ends at " + std::to_string(end) +
                                              ", record has " + std::to_string(bytes.size()) +
                                              " bytes");
            }
            if (end < prev_end) {
                return Status::RecordTooShort("variable column " + std::to_string(i) +
                                              " ends at " + std::to_string(end) +
                                              " before its start " + std::to_string(prev_end));
            }
            prev_end = end;
        }
        pos = prev_end;
    }

    rec.length_ = pos;
    *out = rec;
    return Status::Ok();
}

ByteSpan Record::fixed_data() const noexcept {
    if (fixed_end_ < config::kRecordHeaderSize) {
        return {};
    }
    return bytes_.subspan(config::kRecordHeaderSize, fixed_end_ - config::kRecordHeaderSize);
}

bool Record::is_null(size_t column_index) const noexcept {
    if (column_index >= column_count_) {
        return true;
    }
    if (!has_null_bitmap()) {
        return false;
    }
    uint8_t byte = bytes_[bitmap_offset_ + column_index / 8];
    return (byte & (1u << (column_index % 8))) != 0;
}

Status Record::variable_column(size_t index, VariableColumn* out) const {
    if (index >= var_count_) {
        return Status::NotFound("variable column " + std::to_string(index) + " not stored");
    }
    uint16_t raw_end = load_le<uint16_t>(bytes_, var_offsets_offset_ + index * 2);
    size_t end = raw_end & static_cast<uint16_t>(~config::kComplexColumnFlag);
    size_t start = var_data_start_;
    if (index > 0) {
        start = load_le<uint16_t>(bytes_, var_offsets_offset_ + (index - 1) * 2) &
                static_cast<uint16_t>(~config::kComplexColumnFlag);
    }
    out->data = bytes_.subspan(start, end - start);
    out->complex = (raw_end & config::kComplexColumnFlag) != 0;
    return Status::Ok();
}

}  // namespace mdfkit
