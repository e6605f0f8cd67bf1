#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for mdfkit
 */

#include <cstddef>
#include <cstdint>

namespace mdfkit {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Page Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Page size in bytes (fixed for every MDF file)
constexpr size_t kPageSize = 8192;

/// Page header size in bytes
constexpr size_t kPageHeaderSize = 96;

/// Size of one slot array entry
constexpr size_t kSlotEntrySize = 2;

/// Size of an on-disk page pointer (page id u32 + file id u16)
constexpr size_t kPagePointerSize = 6;

// ─────────────────────────────────────────────────────────────────────────────
// Record Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Status bytes plus fixed-region end offset
constexpr size_t kRecordHeaderSize = 4;

/// Status byte plus the redirect RID
constexpr size_t kForwardingStubSize = 9;

/// Size of the variable column count field
constexpr size_t kColumnCountSize = 2;

/// Bit 15 of a variable column end offset marks a complex column
constexpr uint16_t kComplexColumnFlag = 0x8000;

// ─────────────────────────────────────────────────────────────────────────────
// Bootstrap Locations
// ─────────────────────────────────────────────────────────────────────────────

/// File id of the primary data file
constexpr uint16_t kPrimaryFileId = 1;

/// Boot page of the primary file
constexpr uint32_t kBootPageId = 9;

/// Allocation unit id of the sysrowsets in-row data
constexpr uint64_t kSysRowSetsAllocUnitId = 327680;

/// Object id of sysschobjs
constexpr int32_t kSysSchObjsId = 34;

/// Object id of syscolpars
constexpr int32_t kSysColParsId = 41;

/// Object id of sysscalartypes
constexpr int32_t kSysScalarTypesId = 50;

/// Largest system type id; anything above is a user-defined type
constexpr int32_t kMaxSystemTypeId = 255;

// ─────────────────────────────────────────────────────────────────────────────
// Traversal Limits
// ─────────────────────────────────────────────────────────────────────────────

/// Default number of forwarding hops followed before giving up
constexpr size_t kDefaultMaxForwardHops = 8;

/// Deepest LOB tree accepted by the reassembler
constexpr size_t kMaxLobDepth = 16;

/// Value length of text/ntext/image pointers
constexpr size_t kTextPointerSize = 16;

/// Value length of a row-overflow pointer
constexpr size_t kRowOverflowPointerSize = 24;

// ─────────────────────────────────────────────────────────────────────────────
// Page Cache Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Default page cache size in pages
constexpr size_t kDefaultPageCacheSize = 256;  // 2MB

/// Minimum page cache size
constexpr size_t kMinPageCacheSize = 4;

}  // namespace config
}  // namespace mdfkit
