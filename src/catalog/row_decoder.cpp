/**
 * @file row_decoder.cpp
 * @brief RowDecoder implementation
 */

#include "catalog/row_decoder.hpp"

#include "common/logger.hpp"
#include "common/status.hpp"

namespace mdfkit {

RowDecoder::RowDecoder(std::shared_ptr<const Schema> schema) : schema_(std::move(schema)) {}

Status RowDecoder::slice(const Record& record, std::vector<ColumnSlice>* out) const {
    if (!record.carries_columns()) {
        return Status::InvalidArgument(std::string("a ") + record_kind_name(record.kind()) +
                                       " record carries no columns");
    }

    const ByteSpan fixed = record.fixed_data();
    out->assign(schema_->column_count(), ColumnSlice{});

    for (size_t i = 0; i < schema_->column_count(); ++i) {
        const ColumnLayout& layout = schema_->layout(i);
        ColumnSlice& slice = (*out)[i];

        if (!layout.stored || record.is_null(layout.null_bit)) {
            slice.is_null = true;
            continue;
        }

        if (layout.variable) {
            if (layout.variable_index >= record.variable_column_count()) {
                continue;  // trailing empty value
            }
            VariableColumn column;
            MDFKIT_RETURN_IF_ERROR(record.variable_column(layout.variable_index, &column));
            slice.bytes = column.data;
            slice.complex = column.complex;
            continue;
        }

        if (layout.fixed_offset + layout.fixed_width > fixed.size()) {
            return Status::RecordTooShort("column " + schema_->column(i).name() + " at " +
                                          std::to_string(layout.fixed_offset) + "+" +
                                          std::to_string(layout.fixed_width) +
                                          " exceeds the fixed region of " +
                                          std::to_string(fixed.size()) + " bytes");
        }
        slice.bytes = fixed.subspan(layout.fixed_offset, layout.fixed_width);
        slice.bit_index = layout.bit_index;
    }
    return Status::Ok();
}

Status RowDecoder::decode(const Record& record, Row* out) const {
    std::vector<ColumnSlice> slices;
    MDFKIT_RETURN_IF_ERROR(slice(record, &slices));

    std::vector<SqlValue> values(slices.size());
    for (size_t i = 0; i < slices.size(); ++i) {
        const Column& column = schema_->column(i);
        Status status = decode_value(column.type(), slices[i], &values[i]);
        if (status.is_unsupported_type()) {
            LOG_TRACE("column {}: {}", column.name(), status.to_string());
            continue;
        }
        if (!status.ok()) {
            return Status(status.code(),
                          "column " + column.name() + ": " + std::string(status.message()));
        }
    }

    *out = Row(schema_, std::move(values));
    return Status::Ok();
}

}  // namespace mdfkit
