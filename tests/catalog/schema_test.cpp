/**
 * @file schema_test.cpp
 * @brief Unit tests for Schema layout and Row access
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include "catalog/row.hpp"
#include "catalog/schema.hpp"

namespace mdfkit {
namespace {

Column make_column(const std::string& name, uint8_t xtype, int16_t length,
                   bool computed = false) {
    Column column(name, TypeInfo(sql_type_from_xtype(xtype), xtype, length));
    column.set_computed(computed);
    return column;
}

class SchemaTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<Column> columns;
        columns.push_back(make_column("id", 56, 4));
        columns.push_back(make_column("name", 231, 100));
        columns.push_back(make_column("active", 104, 1));
        columns.push_back(make_column("total", 56, 4, true));
        columns.push_back(make_column("deleted", 104, 1));
        columns.push_back(make_column("created", 61, 8));
        columns.push_back(make_column("note", 167, -1));
        schema_ = Schema(std::move(columns));
    }

    Schema schema_;
};

TEST_F(SchemaTest, FixedColumnsPackInOrder) {
    EXPECT_EQ(schema_.layout(0).fixed_offset, 0u);
    EXPECT_EQ(schema_.layout(0).fixed_width, 4u);

    // Both bits share the byte allocated by the first one
    EXPECT_EQ(schema_.layout(2).fixed_offset, 4u);
    EXPECT_EQ(schema_.layout(2).bit_index, 0);
    EXPECT_EQ(schema_.layout(4).fixed_offset, 4u);
    EXPECT_EQ(schema_.layout(4).bit_index, 1);

    EXPECT_EQ(schema_.layout(5).fixed_offset, 5u);
    EXPECT_EQ(schema_.fixed_width(), 13u);
    EXPECT_EQ(schema_.min_record_length(), 17u);
}

TEST_F(SchemaTest, VariableColumnsNumberedInOrder) {
    EXPECT_TRUE(schema_.layout(1).variable);
    EXPECT_EQ(schema_.layout(1).variable_index, 0u);
    EXPECT_TRUE(schema_.layout(6).variable);
    EXPECT_EQ(schema_.layout(6).variable_index, 1u);
    EXPECT_EQ(schema_.variable_column_count(), 2u);
}

TEST_F(SchemaTest, ComputedColumnsAreNotStored) {
    EXPECT_FALSE(schema_.layout(3).stored);
    EXPECT_EQ(schema_.stored_column_count(), 6u);

    // Null bits skip the computed column
    EXPECT_EQ(schema_.layout(2).null_bit, 2u);
    EXPECT_EQ(schema_.layout(4).null_bit, 3u);
}

TEST_F(SchemaTest, ColumnLookup) {
    EXPECT_EQ(schema_.get_column_index("created"), 5);
    EXPECT_EQ(schema_.get_column_index("missing"), -1);
    EXPECT_EQ(schema_.column(1).name(), "name");
    EXPECT_THROW((void)schema_.column(20), std::out_of_range);
}

TEST_F(SchemaTest, ToString) {
    Schema small({make_column("id", 56, 4), make_column("name", 231, 40)});
    EXPECT_EQ(small.to_string(), "(id int NULL, name nvarchar(20) NULL)");
}

TEST(RowTest, AccessByName) {
    auto schema = std::make_shared<const Schema>(
        std::vector<Column>{make_column("id", 56, 4), make_column("name", 167, 10)});
    Row row(schema, {SqlValue(SqlType::kInt, int32_t{7}),
                     SqlValue(SqlType::kVarChar, std::string("seven"))});

    EXPECT_EQ(row.size(), 2u);
    EXPECT_EQ(row["id"].as_int(), 7);
    EXPECT_EQ(row[1].as_string(), "seven");
    EXPECT_EQ(row.get("missing"), nullptr);
    EXPECT_THROW((void)row["missing"], std::out_of_range);
    EXPECT_EQ(row.to_string(), "id=7, name=seven");
}

}  // namespace
}  // namespace mdfkit
