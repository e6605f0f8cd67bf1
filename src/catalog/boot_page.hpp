#pragma once

/**
 * @file boot_page.hpp
 * @brief Database boot page (1:9)
 */

#include <cstdint>
#include <string>

#include "common/types.hpp"
#include "mdfkit/status.hpp"

namespace mdfkit {

class Page;

/**
 * @brief Fields of the boot record (slot 0 of the boot page)
 *
 * Offsets are relative to the record's fixed region.
 */
struct BootPage {
    static constexpr size_t kVersionOffset = 0;
    static constexpr size_t kCreateVersionOffset = 2;
    static constexpr size_t kStatusOffset = 32;
    static constexpr size_t kNextIdOffset = 36;
    static constexpr size_t kNameOffset = 48;
    static constexpr size_t kNameSize = 256;  // nchar(128)
    static constexpr size_t kDbIdOffset = 308;
    static constexpr size_t kMaxTimestampOffset = 312;
    static constexpr size_t kFirstSysIndicesOffset = 512;
    static constexpr size_t kMinFixedSize = kFirstSysIndicesOffset + 6;

    uint16_t version = 0;
    uint16_t create_version = 0;
    uint32_t status = 0;
    uint32_t next_id = 0;
    std::string database_name;
    uint16_t db_id = 0;
    uint64_t max_db_timestamp = 0;
    PagePointer first_sys_indices;  // first sysallocunits page

    /**
     * @brief Decode the boot record
     * @return MalformedPage if the page is not a boot page, RecordTooShort if
     *         the boot record's fixed region is too small
     */
    [[nodiscard]] static Status parse(const Page& page, BootPage* out);
};

}  // namespace mdfkit
