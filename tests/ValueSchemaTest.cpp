#include <gtest/gtest.h>

#include "errors/EtlErrors.hpp"
#include "model/Record.hpp"
#include "model/Schema.hpp"
#include "model/Value.hpp"
#include "validator/SchemaValidator.hpp"

using namespace PartitionFlow;

TEST(ValueTest, NumericTypesCompareAcrossIntegerAndFloat)
{
    EXPECT_TRUE(compare_values(Value{int64_t{2}}, Value{2.5}) < 0);
    EXPECT_TRUE(compare_values(Value{3.0}, Value{int64_t{3}}) == 0);
    EXPECT_TRUE(compare_values(Value{std::string("b")}, Value{std::string("a")}) > 0);
}

TEST(ValueTest, NullAndMixedTypesAreUnordered)
{
    EXPECT_EQ(compare_values(Value{}, Value{int64_t{1}}), std::partial_ordering::unordered);
    EXPECT_EQ(compare_values(Value{true}, Value{int64_t{1}}), std::partial_ordering::unordered);
}

TEST(ValueTest, ToStringFormats)
{
    EXPECT_EQ(to_string(Value{}), "null");
    EXPECT_EQ(to_string(Value{int64_t{-42}}), "-42");
    EXPECT_EQ(to_string(Value{0.1}), "0.1");
    EXPECT_EQ(to_string(Value{std::string("east")}), "\"east\"");
    EXPECT_EQ(to_string(Value{false}), "false");
    EXPECT_EQ(to_string(Value{Timestamp{0}}), "1970-01-01T00:00:00Z");
    EXPECT_EQ(to_string(Value{Timestamp{1'704'067'200'500'000'000LL}}), "2024-01-01T00:00:00.500000000Z");
}

TEST(ValueTest, PlainStringIsEmptyForNull)
{
    EXPECT_EQ(to_plain_string(Value{}), "");
    EXPECT_EQ(to_plain_string(Value{std::string("x")}), "x");
    EXPECT_EQ(to_plain_string(Value{Timestamp{123}}), "123");
}

TEST(ValueTest, AsDoubleRejectsText)
{
    EXPECT_DOUBLE_EQ(as_double(Value{int64_t{4}}), 4.0);
    EXPECT_THROW((void)as_double(Value{std::string("4")}), std::invalid_argument);
}

TEST(SchemaValidatorTest, IdentifierShape)
{
    EXPECT_TRUE(SchemaValidator::is_valid_identifier("amount_with_tax"));
    EXPECT_TRUE(SchemaValidator::is_valid_identifier("_x1"));
    EXPECT_FALSE(SchemaValidator::is_valid_identifier("1st"));
    EXPECT_FALSE(SchemaValidator::is_valid_identifier("total revenue"));
    EXPECT_FALSE(SchemaValidator::is_valid_identifier(""));
    EXPECT_FALSE(SchemaValidator::is_valid_identifier(std::string(64, 'a')));
}

TEST(SchemaTest, RejectsDuplicateAndInvalidColumns)
{
    EXPECT_THROW(Schema({{"a", ColumnType::Integer}, {"a", ColumnType::Float}}), SchemaError);
    EXPECT_THROW(Schema({{"bad name", ColumnType::Integer}}), SchemaError);
    EXPECT_THROW(Schema({{"nothing", ColumnType::Null}}), SchemaError);
}

TEST(SchemaTest, LooksUpColumnsByName)
{
    Schema s({{"amount", ColumnType::Float}, {"region", ColumnType::Text}});

    EXPECT_EQ(s.index_of("region"), 1u);
    EXPECT_FALSE(s.index_of("missing").has_value());
    EXPECT_TRUE(s.contains("amount"));
    EXPECT_THROW((void)s.require_index("missing"), SchemaError);
    EXPECT_EQ(s.describe(), "{amount: float, region: text}");
    EXPECT_EQ(s.names(), (std::vector<std::string>{"amount", "region"}));
}

TEST(RecordTest, ChecksValuesAgainstSchema)
{
    auto schema = make_schema({{"amount", ColumnType::Float}, {"region", ColumnType::Text}});

    EXPECT_NO_THROW(Record(schema, {Value{}, std::string("north")}));
    EXPECT_THROW(Record(schema, {1.0}), SchemaError);
    EXPECT_THROW(Record(schema, {std::string("oops"), std::string("north")}), SchemaError);
}

TEST(RecordTest, TypedAccessors)
{
    auto schema = make_schema({{"qty", ColumnType::Integer},
                               {"price", ColumnType::Float},
                               {"sku", ColumnType::Text},
                               {"online", ColumnType::Boolean}});
    Record r(schema, {int64_t{3}, 2.5, std::string("A-1"), true});

    EXPECT_EQ(r.get_int("qty"), 3);
    EXPECT_DOUBLE_EQ(r.get_float("qty"), 3.0);
    EXPECT_DOUBLE_EQ(r.get_float("price"), 2.5);
    EXPECT_EQ(r.get_text("sku"), "A-1");
    EXPECT_TRUE(r.get_bool("online"));
    EXPECT_THROW((void)r.get_text("qty"), std::invalid_argument);
    EXPECT_THROW((void)r.get("nope"), std::out_of_range);
    EXPECT_EQ(r.describe(), "{qty=3, price=2.5, sku=\"A-1\", online=true}");
}
