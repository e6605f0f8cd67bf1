#pragma once

/**
 * @file type_decoder.hpp
 * @brief Raw column bytes to typed values
 */

#include <cstdint>

#include "common/types.hpp"
#include "mdfkit/status.hpp"
#include "types/sql_type.hpp"
#include "types/value.hpp"

namespace mdfkit {

/**
 * @brief Raw bytes of one column as cut out of a record
 */
struct ColumnSlice {
    ByteSpan bytes;
    bool is_null = false;
    bool complex = false;   // variable column with bit 15 set
    uint8_t bit_index = 0;  // bit columns: bit within bytes[0]
};

/**
 * @brief Decode one column value
 *
 * A null slice yields a null value without looking at its bytes. Complex
 * slices yield LobDescriptor values; a 16-byte complex text/ntext/image slice
 * is a text pointer. Without the complex flag every value is in row.
 *
 * @return OK; UnsupportedType when the declared type is not interpreted
 *         (`out` then holds opaque bytes and is usable); Corruption when the
 *         bytes cannot hold a value of the declared type (`out` untouched)
 */
[[nodiscard]] Status decode_value(const TypeInfo& type, const ColumnSlice& slice,
                                  SqlValue* out);

/**
 * @brief Decode the self-describing sql_variant payload
 *
 * Layout: base xtype, version byte, a property block that depends on the
 * base type, then the value bytes. The value is decoded by decode_value()
 * with the embedded type; a sql_variant nested in a sql_variant is Corruption.
 */
[[nodiscard]] Status decode_sql_variant(ByteSpan bytes, SqlValue* out);

/**
 * @brief Size of the sql_variant property block for a base type
 */
[[nodiscard]] size_t sql_variant_property_size(SqlType base) noexcept;

}  // namespace mdfkit
