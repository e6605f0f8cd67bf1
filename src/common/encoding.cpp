/**
 * @file encoding.cpp
 * @brief Text and byte formatting helpers
 */

#include "common/encoding.hpp"

namespace mdfkit {

namespace {

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

constexpr uint32_t kReplacementChar = 0xFFFD;

}  // namespace

std::string utf16le_to_utf8(ByteSpan bytes) {
    std::string out;
    out.reserve(bytes.size() / 2);

    size_t units = bytes.size() / 2;
    for (size_t i = 0; i < units; ++i) {
        uint32_t unit = load_le<uint16_t>(bytes, i * 2);
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 1 < units) {
                uint32_t low = load_le<uint16_t>(bytes, (i + 1) * 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    append_utf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                    ++i;
                    continue;
                }
            }
            append_utf8(out, kReplacementChar);
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            append_utf8(out, kReplacementChar);
        } else {
            append_utf8(out, unit);
        }
    }
    return out;
}

std::string latin1_to_utf8(ByteSpan bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t b : bytes) {
        append_utf8(out, b);
    }
    return out;
}

std::string hex_string(ByteSpan bytes) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out = "0x";
    out.reserve(2 + bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

}  // namespace mdfkit
