/**
 * @file boot_page.cpp
 * @brief BootPage implementation
 */

#include "catalog/boot_page.hpp"

#include "common/encoding.hpp"
#include "common/status.hpp"
#include "storage/page.hpp"

namespace mdfkit {

Status BootPage::parse(const Page& page, BootPage* out) {
    if (page.type() != PageType::kBoot) {
        return Status::MalformedPage("page " + page.pointer().to_string() + " is a " +
                                     page_type_name(page.type()) + " page, not a boot page");
    }

    Record record;
    MDFKIT_RETURN_IF_ERROR(page.record(0, &record));
    const ByteSpan data = record.fixed_data();
    if (data.size() < kMinFixedSize) {
        return Status::RecordTooShort("boot record fixed region is " +
                                      std::to_string(data.size()) + " bytes");
    }

    BootPage boot;
    boot.version = load_le<uint16_t>(data, kVersionOffset);
    boot.create_version = load_le<uint16_t>(data, kCreateVersionOffset);
    boot.status = load_le<uint32_t>(data, kStatusOffset);
    boot.next_id = load_le<uint32_t>(data, kNextIdOffset);
    boot.database_name = utf16le_to_utf8(data.subspan(kNameOffset, kNameSize));
    while (!boot.database_name.empty() &&
           (boot.database_name.back() == '\0' || boot.database_name.back() == ' ')) {
        boot.database_name.pop_back();
    }
    boot.db_id = load_le<uint16_t>(data, kDbIdOffset);
    boot.max_db_timestamp = load_le<uint64_t>(data, kMaxTimestampOffset);
    boot.first_sys_indices = PagePointer::parse(data, kFirstSysIndicesOffset);

    *out = std::move(boot);
    return Status::Ok();
}

}  // namespace mdfkit
