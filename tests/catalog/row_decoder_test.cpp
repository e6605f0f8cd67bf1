/**
 * @file row_decoder_test.cpp
 * @brief Unit tests for decoding records into rows
 */

#include <gtest/gtest.h>

#include "catalog/row_decoder.hpp"
#include "catalog_fixture.hpp"
#include "common/status.hpp"

namespace mdfkit {
namespace {

using test::ByteVec;
using test::ColumnDef;
using test::TableDef;

class RowDecoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema_ = test::schema_of(TableDef{
            100,
            "people",
            {ColumnDef{"id", 56, 4, false}, ColumnDef{"name", 231, 100},
             ColumnDef{"active", 104, 1}, ColumnDef{"score", 127, 8},
             ColumnDef{"admin", 104, 1}, ColumnDef{"email", 167, 50}},
        });
        decoder_ = std::make_unique<RowDecoder>(schema_);
    }

    Status decode(const ByteVec& bytes, Row* row) {
        storage_ = bytes;
        Record record;
        MDFKIT_RETURN_IF_ERROR(Record::parse(storage_, &record));
        return decoder_->decode(record, row);
    }

    std::shared_ptr<const Schema> schema_;
    std::unique_ptr<RowDecoder> decoder_;
    ByteVec storage_;
};

TEST_F(RowDecoderTest, DecodesAllColumns) {
    ByteVec bytes = test::encode_row(*schema_, {test::f_int(1), test::f_nvarchar("Ada"),
                                                test::f_bit(true), test::f_bigint(99),
                                                test::f_bit(false), test::f_varchar("a@x")});
    Row row;
    ASSERT_TRUE(decode(bytes, &row).ok());
    ASSERT_EQ(row.size(), 6u);
    EXPECT_EQ(row["id"].as_int(), 1);
    EXPECT_EQ(row["name"].as_string(), "Ada");
    EXPECT_TRUE(row["active"].as_bool());
    EXPECT_EQ(row["score"].as_bigint(), 99);
    EXPECT_FALSE(row["admin"].as_bool());
    EXPECT_EQ(row["email"].as_string(), "a@x");
}

TEST_F(RowDecoderTest, NullColumns) {
    ByteVec bytes = test::encode_row(*schema_, {test::f_int(2), test::f_null(), test::f_null(),
                                                test::f_bigint(5), test::f_bit(true),
                                                test::f_null()});
    Row row;
    ASSERT_TRUE(decode(bytes, &row).ok());
    EXPECT_TRUE(row["name"].is_null());
    EXPECT_EQ(row["name"].type(), SqlType::kNVarChar);
    EXPECT_TRUE(row["active"].is_null());
    EXPECT_TRUE(row["admin"].as_bool());
    EXPECT_TRUE(row["email"].is_null());
}

TEST_F(RowDecoderTest, MissingTrailingVariableColumnIsEmpty) {
    ByteVec fixed;
    test::append(fixed, test::le<int32_t>(3));
    fixed.push_back(0x01);
    test::append(fixed, test::le<int64_t>(0));
    ByteVec bytes =
        test::RecordBuilder().fixed(fixed).columns(6).var(test::utf16("Bob")).build();

    Row row;
    ASSERT_TRUE(decode(bytes, &row).ok());
    EXPECT_EQ(row["name"].as_string(), "Bob");
    EXPECT_FALSE(row["email"].is_null());
    EXPECT_EQ(row["email"].as_string(), "");
}

TEST_F(RowDecoderTest, ColumnsAddedLaterAreNull) {
    ByteVec fixed;
    test::append(fixed, test::le<int32_t>(4));
    fixed.push_back(0x00);
    test::append(fixed, test::le<int64_t>(0));
    ByteVec bytes = test::RecordBuilder().fixed(fixed).columns(4).var(test::utf16("C")).build();

    Row row;
    ASSERT_TRUE(decode(bytes, &row).ok());
    EXPECT_EQ(row["id"].as_int(), 4);
    EXPECT_TRUE(row["admin"].is_null());
    EXPECT_TRUE(row["email"].is_null());
}

TEST_F(RowDecoderTest, ShortFixedRegionIsTooShort) {
    ByteVec bytes = test::RecordBuilder().fixed(test::le<int32_t>(1)).columns(6).build();

    Row row;
    EXPECT_EQ(decode(bytes, &row).code(), StatusCode::kRecordTooShort);
}

TEST_F(RowDecoderTest, VariableOffsetPastRecordIsTooShort) {
    ByteVec bytes = test::encode_row(*schema_, {test::f_int(1), test::f_nvarchar("long name"),
                                                test::f_bit(true), test::f_bigint(1),
                                                test::f_bit(true), test::f_varchar("x")});
    bytes.resize(bytes.size() - 4);

    Row row;
    EXPECT_EQ(decode(bytes, &row).code(), StatusCode::kRecordTooShort);
}

TEST_F(RowDecoderTest, StubHasNoColumns) {
    Row row;
    EXPECT_EQ(decode(test::forwarding_stub(RecordPointer(PagePointer(1, 5), 0)), &row).code(),
              StatusCode::kInvalidArgument);
}

TEST_F(RowDecoderTest, ComputedColumnDecodesAsNull) {
    auto schema = test::schema_of(TableDef{
        101,
        "orders",
        {ColumnDef{"qty", 56, 4}, ColumnDef{"total", 56, 4, true, true}, ColumnDef{"price", 56, 4}},
    });
    ByteVec bytes =
        test::encode_row(*schema, {test::f_int(3), test::f_null(), test::f_int(10)});

    Record record;
    ASSERT_TRUE(Record::parse(bytes, &record).ok());
    Row row;
    ASSERT_TRUE(RowDecoder(schema).decode(record, &row).ok());
    EXPECT_EQ(row["qty"].as_int(), 3);
    EXPECT_TRUE(row["total"].is_null());
    EXPECT_EQ(row["price"].as_int(), 10);
}

TEST_F(RowDecoderTest, UnsupportedTypeStillProducesRow) {
    auto schema = test::schema_of(TableDef{
        102,
        "prices",
        {ColumnDef{"id", 56, 4}, ColumnDef{"amount", 106, 9, true, false, 18, 2}},
    });
    ByteVec bytes = test::encode_row(*schema, {test::f_int(1), test::f_bytes(ByteVec(9, 0x01))});

    Record record;
    ASSERT_TRUE(Record::parse(bytes, &record).ok());
    Row row;
    ASSERT_TRUE(RowDecoder(schema).decode(record, &row).ok());
    EXPECT_TRUE(row["amount"].is_opaque());
    EXPECT_EQ(row["amount"].as_bytes().size(), 9u);
}

TEST_F(RowDecoderTest, DecodeIsIdempotent) {
    ByteVec bytes = test::encode_row(*schema_, {test::f_int(9), test::f_nvarchar("Eve"),
                                                test::f_bit(false), test::f_bigint(-1),
                                                test::f_bit(true), test::f_null()});
    storage_ = bytes;
    Record record;
    ASSERT_TRUE(Record::parse(storage_, &record).ok());

    Row first;
    Row second;
    ASSERT_TRUE(decoder_->decode(record, &first).ok());
    ASSERT_TRUE(decoder_->decode(record, &second).ok());
    EXPECT_EQ(first.values(), second.values());
}

TEST_F(RowDecoderTest, ComplexColumnBecomesLob) {
    auto schema = test::schema_of(TableDef{
        103,
        "docs",
        {ColumnDef{"id", 56, 4}, ColumnDef{"body", 165, -1}},
    });
    const RecordPointer target(PagePointer(1, 300), 0);
    ByteVec bytes = test::encode_row(
        *schema, {test::f_int(1), test::f_bytes(test::row_overflow_pointer(10000, target), true)});

    Record record;
    ASSERT_TRUE(Record::parse(bytes, &record).ok());
    Row row;
    ASSERT_TRUE(RowDecoder(schema).decode(record, &row).ok());
    ASSERT_TRUE(row["body"].is_lob());
    EXPECT_EQ(row["body"].as_lob().kind(), LobDescriptorKind::kRowOverflow);
}

}  // namespace
}  // namespace mdfkit
