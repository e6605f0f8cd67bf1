/**
 * @file type_decoder.cpp
 * @brief Per-type value decoding
 */

#include "types/type_decoder.hpp"

#include "common/config.hpp"
#include "common/encoding.hpp"
#include "common/logger.hpp"
#include "common/status.hpp"

namespace mdfkit {

namespace {

Status need(const TypeInfo& type, size_t width, ByteSpan bytes) {
    if (bytes.size() < width) {
        return Status::Corruption(type.to_string() + " needs " + std::to_string(width) +
                                  " bytes, column has " + std::to_string(bytes.size()));
    }
    return Status::Ok();
}

std::string decode_text(SqlType type, ByteSpan bytes) {
    return is_unicode(type) ? utf16le_to_utf8(bytes) : latin1_to_utf8(bytes);
}

Status decode_lob_class(const TypeInfo& type, const ColumnSlice& slice, SqlValue* out) {
    LobDescriptor desc;
    Status status;
    if (is_text_pointer_type(type.type) && slice.bytes.size() == config::kTextPointerSize) {
        status = LobDescriptor::parse_text_pointer(slice.bytes, &desc);
    } else {
        status = LobDescriptor::parse_complex(slice.bytes, &desc);
    }
    if (!status.ok()) {
        return Status::Corruption(type.to_string() + ": " + status.to_string());
    }
    *out = SqlValue(type.type, std::move(desc));
    return Status::Ok();
}

}  // namespace

size_t sql_variant_property_size(SqlType base) noexcept {
    switch (base) {
        case SqlType::kBinary:
        case SqlType::kVarBinary:
            return 2;  // max length
        case SqlType::kChar:
        case SqlType::kVarChar:
        case SqlType::kNChar:
        case SqlType::kNVarChar:
        case SqlType::kSysName:
            return 7;  // max length + collation
        case SqlType::kDecimal:
        case SqlType::kNumeric:
            return 2;  // precision, scale
        case SqlType::kTime:
        case SqlType::kDateTime2:
        case SqlType::kDateTimeOffset:
            return 1;  // scale
        default:
            return 0;
    }
}

Status decode_value(const TypeInfo& type, const ColumnSlice& slice, SqlValue* out) {
    if (slice.is_null) {
        *out = SqlValue::null(type.type);
        return Status::Ok();
    }

    // Out-of-row values and text pointers carry the complex flag; a text
    // value without it is stored in row
    if (slice.complex) {
        return decode_lob_class(type, slice, out);
    }

    const ByteSpan bytes = slice.bytes;

    switch (type.type) {
        case SqlType::kBit:
            MDFKIT_RETURN_IF_ERROR(need(type, 1, bytes));
            *out = SqlValue(type.type, ((bytes[0] >> slice.bit_index) & 0x01) != 0);
            return Status::Ok();

        case SqlType::kTinyInt:
            MDFKIT_RETURN_IF_ERROR(need(type, 1, bytes));
            *out = SqlValue(type.type, bytes[0]);
            return Status::Ok();

        case SqlType::kSmallInt:
            MDFKIT_RETURN_IF_ERROR(need(type, 2, bytes));
            *out = SqlValue(type.type, load_le<int16_t>(bytes, 0));
            return Status::Ok();

        case SqlType::kInt:
            MDFKIT_RETURN_IF_ERROR(need(type, 4, bytes));
            *out = SqlValue(type.type, load_le<int32_t>(bytes, 0));
            return Status::Ok();

        case SqlType::kBigInt:
            MDFKIT_RETURN_IF_ERROR(need(type, 8, bytes));
            *out = SqlValue(type.type, load_le<int64_t>(bytes, 0));
            return Status::Ok();

        case SqlType::kReal:
            MDFKIT_RETURN_IF_ERROR(need(type, 4, bytes));
            *out = SqlValue(type.type, load_le<float>(bytes, 0));
            return Status::Ok();

        case SqlType::kFloat:
            // float(1..24) is stored in 4 bytes
            if (bytes.size() == 4) {
                *out = SqlValue(type.type, static_cast<double>(load_le<float>(bytes, 0)));
                return Status::Ok();
            }
            MDFKIT_RETURN_IF_ERROR(need(type, 8, bytes));
            *out = SqlValue(type.type, load_le<double>(bytes, 0));
            return Status::Ok();

        case SqlType::kDateTime:
            MDFKIT_RETURN_IF_ERROR(need(type, 8, bytes));
            *out = SqlValue(type.type, DateTime::from_datetime(load_le<int32_t>(bytes, 4),
                                                               load_le<int32_t>(bytes, 0)));
            return Status::Ok();

        case SqlType::kSmallDateTime:
            MDFKIT_RETURN_IF_ERROR(need(type, 4, bytes));
            *out = SqlValue(type.type, DateTime::from_smalldatetime(load_le<uint16_t>(bytes, 2),
                                                                    load_le<uint16_t>(bytes, 0)));
            return Status::Ok();

        case SqlType::kUniqueIdentifier:
            MDFKIT_RETURN_IF_ERROR(need(type, 16, bytes));
            *out = SqlValue(type.type, Guid::from_bytes(bytes));
            return Status::Ok();

        case SqlType::kBinary:
        case SqlType::kVarBinary:
        case SqlType::kImage:
            *out = SqlValue(type.type, Bytes(bytes.begin(), bytes.end()));
            return Status::Ok();

        case SqlType::kChar:
        case SqlType::kVarChar:
        case SqlType::kText:
        case SqlType::kNChar:
        case SqlType::kNVarChar:
        case SqlType::kSysName:
        case SqlType::kNText:
            *out = SqlValue(type.type, decode_text(type.type, bytes));
            return Status::Ok();

        case SqlType::kSqlVariant:
            return decode_sql_variant(bytes, out);

        default:
            break;
    }

    *out = SqlValue::opaque(type.type, bytes);
    return Status::UnsupportedType(type.to_string() + " is decoded as opaque bytes");
}

Status decode_sql_variant(ByteSpan bytes, SqlValue* out) {
    if (bytes.empty()) {
        *out = SqlValue::null(SqlType::kSqlVariant);
        return Status::Ok();
    }
    if (bytes.size() < 2) {
        return Status::Corruption("sql_variant header needs 2 bytes");
    }

    const uint8_t base_xtype = bytes[0];
    const SqlType base = sql_type_from_xtype(base_xtype);
    if (base == SqlType::kSqlVariant) {
        return Status::Corruption("sql_variant nested inside sql_variant");
    }

    const size_t props_size = sql_variant_property_size(base);
    if (bytes.size() < 2 + props_size) {
        return Status::Corruption("sql_variant property block truncated");
    }
    ByteSpan props = bytes.subspan(2, props_size);
    ByteSpan value = bytes.subspan(2 + props_size);

    TypeInfo inner(base, base_xtype, static_cast<int16_t>(value.size()));
    if (base == SqlType::kDecimal || base == SqlType::kNumeric) {
        inner.precision = props[0];
        inner.scale = props[1];
    } else if (props_size == 1) {
        inner.scale = props[0];
    } else if (props_size >= 2) {
        inner.max_length = load_le<int16_t>(props, 0);
    }

    LOG_TRACE("sql_variant base {} with {} value bytes", inner.to_string(), value.size());

    SqlValue inner_value;
    ColumnSlice inner_slice;
    inner_slice.bytes = value;
    Status status = decode_value(inner, inner_slice, &inner_value);
    if (!status.ok() && !status.is_unsupported_type()) {
        return status;
    }
    *out = SqlValue::variant_of(std::move(inner_value));
    return status;
}

}  // namespace mdfkit
