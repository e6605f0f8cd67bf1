#pragma once

/**
 * @file encoding.hpp
 * @brief Text and byte formatting helpers
 */

#include <string>

#include "common/bytes.hpp"

namespace mdfkit {

/**
 * @brief Convert UTF-16LE bytes (nchar/nvarchar/ntext) to UTF-8
 *
 * Unpaired surrogates become U+FFFD. A trailing odd byte is dropped.
 */
[[nodiscard]] std::string utf16le_to_utf8(ByteSpan bytes);

/**
 * @brief Convert single-byte character data to UTF-8
 *
 * char/varchar/text are decoded as Latin-1 (code page 1252 without the
 * 0x80-0x9F block), which is lossless for ASCII.
 */
[[nodiscard]] std::string latin1_to_utf8(ByteSpan bytes);

/**
 * @brief "0x" followed by upper-case hex digits, as SQL Server prints binary
 */
[[nodiscard]] std::string hex_string(ByteSpan bytes);

}  // namespace mdfkit
