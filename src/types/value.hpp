#pragma once

/**
 * @file value.hpp
 * @brief Typed column values
 */

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "common/types.hpp"
#include "lob/lob_descriptor.hpp"
#include "types/sql_type.hpp"

namespace mdfkit {

/// Raw binary data (binary, varbinary, opaque values)
using Bytes = std::vector<uint8_t>;

/**
 * @brief uniqueidentifier, kept in on-disk byte order
 */
struct Guid {
    std::array<uint8_t, 16> bytes{};

    /// @pre data.size() >= 16
    [[nodiscard]] static Guid from_bytes(ByteSpan data) noexcept;

    /// Canonical "XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX" (mixed-endian groups)
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Guid& other) const noexcept { return bytes == other.bytes; }
};

/**
 * @brief Point in time decoded from datetime / smalldatetime
 */
struct DateTime {
    using TimePoint = std::chrono::sys_time<std::chrono::milliseconds>;

    TimePoint time;

    /**
     * @brief datetime: days since 1900-01-01 and 1/300 s ticks since midnight
     */
    [[nodiscard]] static DateTime from_datetime(int32_t days, int32_t ticks) noexcept;

    /**
     * @brief smalldatetime: days since 1900-01-01 and minutes since midnight
     */
    [[nodiscard]] static DateTime from_smalldatetime(uint16_t days, uint16_t minutes) noexcept;

    /// "YYYY-MM-DD hh:mm:ss.mmm"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const DateTime& other) const noexcept { return time == other.time; }
};

/**
 * @brief One decoded column value
 *
 * Always tagged with the column's declared SqlType. For sql_variant columns
 * base_type() names the type stored inside the variant. Values of types the
 * decoder does not interpret are held as opaque bytes.
 */
class SqlValue {
public:
    using ValueType = std::variant<
        std::monostate,  // NULL
        bool,            // bit
        uint8_t,         // tinyint
        int16_t,         // smallint
        int32_t,         // int
        int64_t,         // bigint
        float,           // real
        double,          // float
        std::string,     // char, varchar, nchar, nvarchar (UTF-8)
        Bytes,           // binary, varbinary, opaque
        DateTime,        // datetime, smalldatetime
        Guid,            // uniqueidentifier
        LobDescriptor    // out-of-row or not yet resolved LOB value
    >;

    /// Construct a NULL of unknown type
    SqlValue() : type_(SqlType::kUnknown), base_type_(SqlType::kUnknown) {}

    SqlValue(SqlType type, ValueType value)
        : type_(type), base_type_(type), value_(std::move(value)) {}

    static SqlValue null(SqlType type) { return SqlValue(type, std::monostate{}); }

    /// Opaque bytes of an undecoded type
    static SqlValue opaque(SqlType type, ByteSpan bytes) {
        SqlValue v(type, Bytes(bytes.begin(), bytes.end()));
        v.opaque_ = true;
        return v;
    }

    /// Wrap an inner value as the content of a sql_variant
    static SqlValue variant_of(SqlValue inner) {
        SqlValue v(SqlType::kSqlVariant, std::move(inner.value_));
        v.base_type_ = inner.type_;
        v.opaque_ = inner.opaque_;
        return v;
    }

    [[nodiscard]] SqlType type() const noexcept { return type_; }
    [[nodiscard]] SqlType base_type() const noexcept { return base_type_; }

    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(value_);
    }
    [[nodiscard]] bool is_opaque() const noexcept { return opaque_; }

    /// Type checking methods
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] bool is_tinyint() const noexcept { return std::holds_alternative<uint8_t>(value_); }
    [[nodiscard]] bool is_smallint() const noexcept { return std::holds_alternative<int16_t>(value_); }
    [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<int32_t>(value_); }
    [[nodiscard]] bool is_bigint() const noexcept { return std::holds_alternative<int64_t>(value_); }
    [[nodiscard]] bool is_real() const noexcept { return std::holds_alternative<float>(value_); }
    [[nodiscard]] bool is_float() const noexcept { return std::holds_alternative<double>(value_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }
    [[nodiscard]] bool is_bytes() const noexcept { return std::holds_alternative<Bytes>(value_); }
    [[nodiscard]] bool is_datetime() const noexcept { return std::holds_alternative<DateTime>(value_); }
    [[nodiscard]] bool is_guid() const noexcept { return std::holds_alternative<Guid>(value_); }
    [[nodiscard]] bool is_lob() const noexcept { return std::holds_alternative<LobDescriptor>(value_); }

    /// Value retrieval methods
    [[nodiscard]] bool as_bool() const { return std::get<bool>(value_); }
    [[nodiscard]] uint8_t as_tinyint() const { return std::get<uint8_t>(value_); }
    [[nodiscard]] int16_t as_smallint() const { return std::get<int16_t>(value_); }
    [[nodiscard]] int32_t as_int() const { return std::get<int32_t>(value_); }
    [[nodiscard]] int64_t as_bigint() const { return std::get<int64_t>(value_); }
    [[nodiscard]] float as_real() const { return std::get<float>(value_); }
    [[nodiscard]] double as_float() const { return std::get<double>(value_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(value_); }
    [[nodiscard]] const Bytes& as_bytes() const { return std::get<Bytes>(value_); }
    [[nodiscard]] const DateTime& as_datetime() const { return std::get<DateTime>(value_); }
    [[nodiscard]] const Guid& as_guid() const { return std::get<Guid>(value_); }
    [[nodiscard]] const LobDescriptor& as_lob() const { return std::get<LobDescriptor>(value_); }

    /**
     * @brief Widen any integer alternative to int64
     * @return false if the value is not an integer
     */
    [[nodiscard]] bool to_int64(int64_t* out) const noexcept;

    [[nodiscard]] const ValueType& value() const noexcept { return value_; }

    /// Display form: NULL, numbers, text, 0x-hex for binary
    [[nodiscard]] std::string to_string() const;

    bool operator==(const SqlValue& other) const {
        return type_ == other.type_ && base_type_ == other.base_type_ && value_ == other.value_;
    }
    bool operator!=(const SqlValue& other) const { return !(*this == other); }

private:
    SqlType type_;
    SqlType base_type_;
    bool opaque_ = false;
    ValueType value_;
};

}  // namespace mdfkit
