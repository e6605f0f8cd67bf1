/**
 * @file value.cpp
 * @brief Typed column values
 */

#include "types/value.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

#include "common/encoding.hpp"

namespace mdfkit {

// ─────────────────────────────────────────────────────────────────────────────
// Guid
// ─────────────────────────────────────────────────────────────────────────────

Guid Guid::from_bytes(ByteSpan data) noexcept {
    Guid g;
    for (size_t i = 0; i < g.bytes.size(); ++i) {
        g.bytes[i] = data[i];
    }
    return g;
}

std::string Guid::to_string() const {
    // Data1..Data3 are little-endian, Data4 is a plain byte sequence
    static constexpr int kOrder[16] = {3, 2, 1, 0, 5, 4, 7, 6, 8, 9, 10, 11, 12, 13, 14, 15};
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        uint8_t b = bytes[kOrder[i]];
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// DateTime
// ─────────────────────────────────────────────────────────────────────────────

namespace {

constexpr std::chrono::sys_days kEpoch1900 =
    std::chrono::sys_days{std::chrono::year{1900} / std::chrono::January / 1};

}  // namespace

DateTime DateTime::from_datetime(int32_t days, int32_t ticks) noexcept {
    // One tick is 1/300 s; round to the nearest millisecond
    int64_t ms = (static_cast<int64_t>(ticks) * 10 + 1) / 3;
    return DateTime{kEpoch1900 + std::chrono::days{days} + std::chrono::milliseconds{ms}};
}

DateTime DateTime::from_smalldatetime(uint16_t days, uint16_t minutes) noexcept {
    return DateTime{kEpoch1900 + std::chrono::days{days} + std::chrono::minutes{minutes}};
}

std::string DateTime::to_string() const {
    auto day = std::chrono::floor<std::chrono::days>(time);
    std::chrono::year_month_day ymd{day};
    std::chrono::hh_mm_ss<std::chrono::milliseconds> hms{time - day};

    std::ostringstream os;
    os << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
       << static_cast<unsigned>(ymd.day()) << ' ' << std::setw(2) << hms.hours().count()
       << ':' << std::setw(2) << hms.minutes().count() << ':' << std::setw(2)
       << hms.seconds().count() << '.' << std::setw(3) << hms.subseconds().count();
    return os.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// SqlValue
// ─────────────────────────────────────────────────────────────────────────────

bool SqlValue::to_int64(int64_t* out) const noexcept {
    if (is_tinyint()) {
        *out = as_tinyint();
    } else if (is_smallint()) {
        *out = as_smallint();
    } else if (is_int()) {
        *out = as_int();
    } else if (is_bigint()) {
        *out = as_bigint();
    } else {
        return false;
    }
    return true;
}

namespace {

template <typename T>
std::string format_floating(T value) {
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<T>::digits10) << value;
    return os.str();
}

}  // namespace

std::string SqlValue::to_string() const {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "1" : "0";
            } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                return format_floating(v);
            } else if constexpr (std::is_integral_v<T>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Bytes>) {
                return hex_string(v);
            } else {
                // DateTime, Guid, LobDescriptor
                return v.to_string();
            }
        },
        value_);
}

}  // namespace mdfkit
