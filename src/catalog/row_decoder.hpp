#pragma once

/**
 * @file row_decoder.hpp
 * @brief Schema-driven record decoding
 */

#include <memory>
#include <vector>

#include "catalog/row.hpp"
#include "catalog/schema.hpp"
#include "storage/record.hpp"
#include "types/type_decoder.hpp"

namespace mdfkit {

/**
 * @brief Cuts records into column slices and decodes them
 *
 * Stateless apart from the schema it holds; decoding the same bytes twice
 * gives the same row.
 */
class RowDecoder {
public:
    explicit RowDecoder(std::shared_ptr<const Schema> schema);

    /**
     * @brief Raw slice per schema column
     *
     * Null bits are honored without reading column bytes. Columns beyond the
     * record's stored column count are null; variable columns missing from
     * the end of the offset array are empty.
     *
     * @return InvalidArgument for records that carry no columns,
     *         RecordTooShort when a fixed column lies past the fixed region
     */
    [[nodiscard]] Status slice(const Record& record, std::vector<ColumnSlice>* out) const;

    /**
     * @brief Decode a record into a row
     *
     * Columns of undecoded types come back as opaque bytes; any other
     * column failure fails the row.
     */
    [[nodiscard]] Status decode(const Record& record, Row* out) const;

    [[nodiscard]] const std::shared_ptr<const Schema>& schema() const noexcept { return schema_; }

private:
    std::shared_ptr<const Schema> schema_;
};

}  // namespace mdfkit
