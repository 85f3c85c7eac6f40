#include <gtest/gtest.h>

#include <limits>

#include "TestData.hpp"
#include "errors/EtlErrors.hpp"
#include "execution/PartitionExecutor.hpp"
#include "graph/OperationGraph.hpp"

using namespace PartitionFlow;
using namespace PartitionFlow::testing;

TEST(PartitionExecutorTest, FilterKeepsMatchingRecordsInOrder)
{
    auto plan = OperationGraph::source(sales_schema())
                    .filter(Predicate::compare("amount", CompareOp::Greater, 0.0))
                    .compile();

    Partition p(3, {sale(5.0, "north"), sale(-1.0, "south"), sale(0.0, "east"), sale(2.5, "west")});
    PartialResult out = PartitionExecutor::execute(plan, p);

    EXPECT_EQ(out.partition_index, 3u);
    EXPECT_EQ(out.input_records, 4u);
    ASSERT_FALSE(out.is_grouped());
    ASSERT_EQ(out.rows().size(), 2u);
    EXPECT_EQ(out.rows()[0], sale(5.0, "north"));
    EXPECT_EQ(out.rows()[1], sale(2.5, "west"));
}

TEST(PartitionExecutorTest, NullNeverSatisfiesAComparison)
{
    auto plan = OperationGraph::source(sales_schema())
                    .filter(Predicate::compare("amount", CompareOp::NotEqual, 1.0))
                    .compile();

    Partition p(0, {Record(sales_schema(), {Value{}, std::string("north")}), sale(2.0, "south")});
    PartialResult out = PartitionExecutor::execute(plan, p);

    ASSERT_EQ(out.rows().size(), 1u);
    EXPECT_EQ(out.rows()[0], sale(2.0, "south"));
}

TEST(PartitionExecutorTest, MapThenFilterSeesProjectedRecord)
{
    auto plan = OperationGraph::source(sales_schema())
                    .map(Projection()
                             .keep("region")
                             .derive("doubled", ColumnType::Float, {"amount"},
                                     [](const Record &r)
                                     { return Value{r.get_float("amount") * 2}; }))
                    .filter(Predicate::compare("doubled", CompareOp::GreaterEqual, 10.0))
                    .compile();

    Partition p(0, {sale(4.0, "north"), sale(5.0, "south"), sale(7.5, "east")});
    PartialResult out = PartitionExecutor::execute(plan, p);

    ASSERT_EQ(out.rows().size(), 2u);
    EXPECT_EQ(out.rows()[0].schema()->names(), (std::vector<std::string>{"region", "doubled"}));
    EXPECT_EQ(out.rows()[0].get_text("region"), "south");
    EXPECT_DOUBLE_EQ(out.rows()[0].get_float("doubled"), 10.0);
    EXPECT_DOUBLE_EQ(out.rows()[1].get_float("doubled"), 15.0);
}

TEST(PartitionExecutorTest, IntegerDerivedValueWidensToFloat)
{
    auto plan = OperationGraph::source(sales_schema())
                    .map(Projection().derive("one", ColumnType::Float, {},
                                             [](const Record &)
                                             { return Value{int64_t{1}}; }))
                    .compile();

    PartialResult out = PartitionExecutor::execute(plan, Partition(0, {sale(1.0, "north")}));

    ASSERT_EQ(out.rows().size(), 1u);
    EXPECT_EQ(out.rows()[0].get("one"), Value{1.0});
}

TEST(PartitionExecutorTest, FoldsIntoLocalGroups)
{
    auto plan = OperationGraph::source(sales_schema())
                    .group_aggregate({"region"},
                                     {{"total", AggregateSpec::sum("amount")},
                                      {"n", AggregateSpec::count()}})
                    .compile();

    Partition p(1, {sale(1.0, "north"), sale(2.0, "south"), sale(3.0, "north")});
    PartialResult out = PartitionExecutor::execute(plan, p);

    ASSERT_TRUE(out.is_grouped());
    ASSERT_EQ(out.groups().size(), 2u);

    const AccumulatorRow &north = out.groups().at(GroupKey{std::string("north")});
    EXPECT_EQ(north[0].finalize(), Value{4.0});
    EXPECT_EQ(north[1].finalize(), Value{int64_t{2}});
}

TEST(PartitionExecutorTest, EmptyPartitionProducesEmptyPayload)
{
    auto grouped = OperationGraph::source(sales_schema())
                       .group_aggregate({"region"}, {{"n", AggregateSpec::count()}})
                       .compile();

    PartialResult out = PartitionExecutor::execute(grouped, Partition(0, {}));

    EXPECT_TRUE(out.is_grouped());
    EXPECT_EQ(out.output_size(), 0u);
}

TEST(PartitionExecutorTest, NonBooleanPredicateResultNamesTheRecord)
{
    auto plan = OperationGraph::source(sales_schema())
                    .filter(Predicate::from_value("region_as_flag", {"region"},
                                                  [](const Record &r)
                                                  { return r.get("region"); }))
                    .compile();

    Partition p(6, {sale(1.0, "north"), sale(2.0, "south")});

    try
    {
        (void)PartitionExecutor::execute(plan, p);
        FAIL() << "expected EvaluationError";
    }
    catch (const EvaluationError &e)
    {
        EXPECT_EQ(e.partition_index(), 6u);
        EXPECT_EQ(e.record_offset(), 0u);
        EXPECT_NE(e.record_description().find("north"), std::string::npos);
        EXPECT_NE(e.reason().find("region_as_flag"), std::string::npos);
    }
}

TEST(PartitionExecutorTest, ThrowingUserFunctionIsScopedToItsRecord)
{
    auto plan = OperationGraph::source(sales_schema())
                    .filter(Predicate::custom("explodes_on_east", {"region"},
                                              [](const Record &r)
                                              {
                                                  if (r.get_text("region") == "east")
                                                      throw std::runtime_error("bad region");
                                                  return true;
                                              }))
                    .compile();

    Partition p(2, {sale(1.0, "north"), sale(2.0, "south"), sale(3.0, "east")});

    try
    {
        (void)PartitionExecutor::execute(plan, p);
        FAIL() << "expected EvaluationError";
    }
    catch (const EvaluationError &e)
    {
        EXPECT_EQ(e.partition_index(), 2u);
        EXPECT_EQ(e.record_offset(), 2u);
        EXPECT_EQ(e.reason(), "bad region");
    }
}

TEST(PartitionExecutorTest, DerivedValueOfWrongTypeFails)
{
    auto plan = OperationGraph::source(sales_schema())
                    .map(Projection().keep_all().derive("label", ColumnType::Integer, {"region"},
                                                        [](const Record &r)
                                                        { return r.get("region"); }))
                    .compile();

    EXPECT_THROW((void)PartitionExecutor::execute(plan, Partition(0, {sale(1.0, "north")})),
                 EvaluationError);
}

TEST(PartitionExecutorTest, RejectsRecordsOfAnotherSchema)
{
    auto plan = OperationGraph::source(sales_schema())
                    .filter(Predicate::is_not_null("amount"))
                    .compile();

    auto other = make_schema({{"amount", ColumnType::Integer}});
    Partition p(0, {Record(other, {int64_t{4}})});

    EXPECT_THROW((void)PartitionExecutor::execute(plan, p), EvaluationError);
}

TEST(PartitionExecutorTest, NaNKeysShareOneGroup)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto plan = OperationGraph::source(sales_schema())
                    .group_aggregate({"amount"}, {{"n", AggregateSpec::count()}})
                    .compile();

    Partition p(0, {sale(nan, "north"), sale(1.0, "south"), sale(nan, "east")});
    PartialResult out = PartitionExecutor::execute(plan, p);

    ASSERT_EQ(out.groups().size(), 2u);
    auto it = out.groups().find(GroupKey{nan});
    ASSERT_NE(it, out.groups().end());
    EXPECT_EQ(it->second[0].finalize(), Value{int64_t{2}});
}

TEST(PartitionExecutorTest, IntegerSumOverflowFailsTheRecord)
{
    auto schema = make_schema({{"qty", ColumnType::Integer}, {"region", ColumnType::Text}});
    auto plan = OperationGraph::source(schema)
                    .group_aggregate({"region"}, {{"total", AggregateSpec::sum("qty")}})
                    .compile();

    Partition p(5, {Record(schema, {std::numeric_limits<int64_t>::max(), std::string("north")}),
                    Record(schema, {int64_t{1}, std::string("north")})});

    try
    {
        (void)PartitionExecutor::execute(plan, p);
        FAIL() << "expected EvaluationError";
    }
    catch (const EvaluationError &e)
    {
        EXPECT_EQ(e.partition_index(), 5u);
        EXPECT_EQ(e.record_offset(), 1u);
        EXPECT_NE(e.reason().find("overflow"), std::string::npos) << e.reason();
    }
}

TEST(PartitionExecutorTest, NonStandardThrowIsStillAnEvaluationError)
{
    auto plan = OperationGraph::source(sales_schema())
                    .filter(Predicate::custom("throws_an_int", {},
                                              [](const Record &) -> bool
                                              { throw 42; }))
                    .compile();

    try
    {
        (void)PartitionExecutor::execute(plan, Partition(4, {sale(1.0, "north")}));
        FAIL() << "expected EvaluationError";
    }
    catch (const EvaluationError &e)
    {
        EXPECT_EQ(e.partition_index(), 4u);
        EXPECT_EQ(e.record_offset(), 0u);
        EXPECT_EQ(e.reason(), "unknown exception");
    }
}
