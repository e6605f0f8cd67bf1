#pragma once

/**
 * @file bytes.hpp
 * @brief Little-endian field reads over page and record bytes
 *
 * All MDF structures are little-endian. Values are assembled byte by byte so
 * that unaligned offsets and big-endian hosts are fine; callers check bounds
 * first or use try_load_le.
 */

#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>

namespace mdfkit {

/// Read-only view over raw bytes
using ByteSpan = std::span<const uint8_t>;

/**
 * @brief Read a little-endian integer or float at `offset`
 * @pre offset + sizeof(T) <= bytes.size()
 */
template <typename T>
[[nodiscard]] inline T load_le(ByteSpan bytes, size_t offset) noexcept {
    static_assert(std::is_trivially_copyable_v<T>);
    static_assert(sizeof(T) <= sizeof(uint64_t));
    uint64_t raw = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        raw |= static_cast<uint64_t>(bytes[offset + i]) << (8 * i);
    }
    if constexpr (std::is_integral_v<T>) {
        return static_cast<T>(raw);
    } else {
        // float/double: reinterpret the low sizeof(T) bytes
        std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t> bits =
            static_cast<std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>(raw);
        T value;
        std::memcpy(&value, &bits, sizeof(T));
        return value;
    }
}

/**
 * @brief Bounds-checked variant of load_le
 * @return false if the field does not fit inside `bytes`
 */
template <typename T>
[[nodiscard]] inline bool try_load_le(ByteSpan bytes, size_t offset, T* out) noexcept {
    if (offset > bytes.size() || bytes.size() - offset < sizeof(T)) {
        return false;
    }
    *out = load_le<T>(bytes, offset);
    return true;
}

}  // namespace mdfkit
