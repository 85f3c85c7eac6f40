#include <gtest/gtest.h>

#include <map>

#include "TestData.hpp"
#include "errors/EtlErrors.hpp"
#include "execution/Scheduler.hpp"
#include "graph/OperationGraph.hpp"
#include "partitioning/Partitioner.hpp"

using namespace PartitionFlow;
using namespace PartitionFlow::testing;

namespace
{
    OperationGraph positive_totals_by_region()
    {
        return OperationGraph::source(sales_schema())
            .filter(Predicate::compare("amount", CompareOp::Greater, 0.0))
            .group_aggregate({"region"},
                             {{"total", AggregateSpec::sum("amount")},
                              {"count", AggregateSpec::count()}});
    }

    ExecutionConfig config_with(int concurrency, int max_in_flight = 0)
    {
        ExecutionConfig config;
        config.target_partition_size = 100;
        config.concurrency = concurrency;
        config.max_in_flight = max_in_flight;
        return config;
    }
} // namespace

// ============================================================================
// End-to-end: 1,000 records, 10 partitions, filter + group by region
// ============================================================================
TEST(SchedulerTest, GroupedResultMatchesDirectComputation)
{
    auto records = sales_records(1000);

    std::map<std::string, std::pair<double, int64_t>> expected;
    for (const auto &r : records)
    {
        const double amount = r.get_float("amount");
        if (amount > 0.0)
        {
            auto &[total, count] = expected[r.get_text("region")];
            total += amount;
            ++count;
        }
    }

    auto parts = Partitioner::partition(sales_schema(), records, 100);
    ASSERT_EQ(parts.size(), 10u);

    RunOutput out = Scheduler(config_with(4)).run(positive_totals_by_region(), parts);

    ASSERT_TRUE(out.result.is_grouped());
    ASSERT_EQ(out.result.size(), expected.size());
    for (const auto &[region, totals] : expected)
    {
        const Record *group = out.result.find_group({region});
        ASSERT_NE(group, nullptr) << region;
        EXPECT_DOUBLE_EQ(group->get_float("total"), totals.first) << region;
        EXPECT_EQ(group->get_int("count"), totals.second) << region;
    }

    EXPECT_TRUE(out.report.succeeded());
    EXPECT_EQ(out.report.partition_timings().size(), 10u);
    EXPECT_EQ(out.report.completed_tasks(), 10u);
    EXPECT_EQ(out.report.input_records(), 1000u);
}

TEST(SchedulerTest, ConcurrencyDoesNotChangeTheResult)
{
    auto parts = Partitioner::partition(sales_schema(), sales_records(1000), 100);
    auto graph = positive_totals_by_region();

    const FinalResult sequential = Scheduler(config_with(1)).run(graph, parts).result;

    for (int concurrency : {2, 4, 10})
    {
        RunOutput out = Scheduler(config_with(concurrency)).run(graph, parts);
        EXPECT_EQ(out.result, sequential) << "concurrency " << concurrency;
        EXPECT_LE(out.report.peak_concurrent_tasks(), static_cast<size_t>(concurrency));
    }
}

TEST(SchedulerTest, RowGraphEqualsUnpartitionedEvaluation)
{
    auto records = sales_records(523);
    auto graph = OperationGraph::source(sales_schema())
                     .filter(Predicate::compare("region", CompareOp::NotEqual, std::string("west")))
                     .map(Projection::select({"region", "amount"}));

    RunOutput whole = Scheduler(config_with(1)).run(graph, {Partition(0, records)});
    RunOutput split = Scheduler(config_with(4)).run(graph, Partitioner::partition(sales_schema(), records, 50));

    EXPECT_FALSE(split.result.is_grouped());
    EXPECT_EQ(split.result, whole.result);
}

TEST(SchedulerTest, PartitionsMayArriveInAnyOrder)
{
    auto parts = Partitioner::partition(sales_schema(), sales_records(90), 10);
    auto graph = OperationGraph::source(sales_schema());

    std::vector<Partition> reversed(parts.rbegin(), parts.rend());

    EXPECT_EQ(Scheduler(config_with(3)).run(graph, reversed).result,
              Scheduler(config_with(3)).run(graph, parts).result);
}

TEST(SchedulerTest, EmptyInputGivesEmptyResult)
{
    RunOutput out = Scheduler(config_with(4)).run(positive_totals_by_region(), std::vector<Partition>{});

    EXPECT_TRUE(out.result.empty());
    EXPECT_TRUE(out.report.partition_timings().empty());
    EXPECT_TRUE(out.report.succeeded());
}

TEST(SchedulerTest, FailingPartitionIsReportedAndOthersFinish)
{
    auto records = sales_records(1000);
    records[437] = sale(1.0, "poison"); // partition 4

    auto graph = OperationGraph::source(sales_schema())
                     .filter(Predicate::custom("rejects_poison", {"region"},
                                               [](const Record &r)
                                               {
                                                   if (r.get_text("region") == "poison")
                                                       throw std::runtime_error("poisoned record");
                                                   return true;
                                               }))
                     .group_aggregate({"region"}, {{"n", AggregateSpec::count()}});

    ExecutionMonitor monitor;
    try
    {
        (void)Scheduler(config_with(4)).run(graph, Partitioner::partition(sales_schema(), records, 100), &monitor);
        FAIL() << "expected PartitionFailure";
    }
    catch (const PartitionFailure &e)
    {
        EXPECT_EQ(e.failed_partitions(), std::vector<size_t>{4});
        ASSERT_EQ(e.failures().size(), 1u);
        EXPECT_NE(e.failures()[0].message.find("record 37"), std::string::npos);
        EXPECT_NE(e.failures()[0].message.find("poisoned record"), std::string::npos);
    }

    EXPECT_EQ(monitor.completed_tasks(), 9u);
    EXPECT_EQ(monitor.failed_tasks(), 1u);
    EXPECT_FALSE(monitor.report().succeeded());
}

TEST(SchedulerTest, NonStandardThrowStillBecomesPartitionFailure)
{
    auto records = sales_records(300);
    records[250] = sale(1.0, "odd"); // partition 2

    auto graph = OperationGraph::source(sales_schema())
                     .filter(Predicate::custom("throws_an_int_on_odd", {"region"},
                                               [](const Record &r)
                                               {
                                                   if (r.get_text("region") == "odd")
                                                       throw 42;
                                                   return true;
                                               }));

    ExecutionMonitor monitor;
    try
    {
        (void)Scheduler(config_with(3)).run(graph, Partitioner::partition(sales_schema(), records, 100), &monitor);
        FAIL() << "expected PartitionFailure";
    }
    catch (const PartitionFailure &e)
    {
        EXPECT_EQ(e.failed_partitions(), std::vector<size_t>{2});
        EXPECT_NE(e.failures()[0].message.find("unknown exception"), std::string::npos);
    }

    EXPECT_EQ(monitor.completed_tasks(), 2u);
    EXPECT_EQ(monitor.failed_tasks(), 1u);
}

TEST(SchedulerTest, RejectsNonContiguousIndices)
{
    std::vector<Partition> parts;
    parts.emplace_back(0, std::vector<Record>{sale(1.0, "north")});
    parts.emplace_back(2, std::vector<Record>{sale(2.0, "south")});

    EXPECT_THROW((void)Scheduler(config_with(2)).run(OperationGraph::source(sales_schema()), parts),
                 InvalidConfiguration);

    parts[1] = Partition(0, {sale(2.0, "south")});
    EXPECT_THROW((void)Scheduler(config_with(2)).run(OperationGraph::source(sales_schema()), parts),
                 InvalidConfiguration);
}

TEST(SchedulerTest, RejectsInvalidConfiguration)
{
    EXPECT_THROW(Scheduler(config_with(0)), InvalidConfiguration);
    EXPECT_THROW(Scheduler(config_with(2, -1)), InvalidConfiguration);

    ExecutionConfig bad_size = config_with(2);
    bad_size.target_partition_size = 0;
    EXPECT_THROW(Scheduler{bad_size}, InvalidConfiguration);
}

TEST(SchedulerTest, CancelledBeforeStartProducesNoResult)
{
    ExecutionConfig config = config_with(2);
    config.cancellation = std::make_shared<CancellationToken>();
    config.cancellation->request();

    auto parts = Partitioner::partition(sales_schema(), sales_records(300), 100);
    EXPECT_THROW((void)Scheduler(config).run(positive_totals_by_region(), parts), ExecutionCancelled);
}

TEST(SchedulerTest, CancellationStopsFurtherDispatch)
{
    ExecutionConfig config = config_with(1, 1);
    config.cancellation = std::make_shared<CancellationToken>();
    auto token = config.cancellation;

    auto graph = OperationGraph::source(sales_schema())
                     .filter(Predicate::custom("cancels_on_first_record", {},
                                               [token](const Record &)
                                               {
                                                   token->request();
                                                   return true;
                                               }));

    ExecutionMonitor monitor;
    auto parts = Partitioner::partition(sales_schema(), sales_records(500), 100);

    EXPECT_THROW((void)Scheduler(config).run(graph, parts, &monitor), ExecutionCancelled);
    EXPECT_EQ(monitor.completed_tasks(), 1u);
    EXPECT_EQ(monitor.failed_tasks(), 0u);
}

TEST(SchedulerTest, StreamsFromARecordSource)
{
    auto records = sales_records(750);
    VectorRecordSource source(sales_schema(), records);

    RunOutput streamed = Scheduler(config_with(3, 1)).run(positive_totals_by_region(), source);
    RunOutput batch = Scheduler(config_with(3)).run(positive_totals_by_region(),
                                                    Partitioner::partition(sales_schema(), records, 100));

    EXPECT_EQ(streamed.result, batch.result);
    EXPECT_EQ(streamed.report.partition_timings().size(), 8u);
    EXPECT_LE(streamed.report.peak_concurrent_tasks(), 1u);
}

TEST(SchedulerTest, SourceSchemaMustMatchGraphInput)
{
    VectorRecordSource source(make_schema({{"amount", ColumnType::Integer}}), {});

    EXPECT_THROW((void)Scheduler(config_with(2)).run(positive_totals_by_region(), source), SchemaError);
}

TEST(SchedulerTest, ComparisonAgainstSequentialRun)
{
    auto parts = Partitioner::partition(sales_schema(), sales_records(2000), 100);

    ComparisonReport cmp = compare_against_sequential(positive_totals_by_region(), parts, config_with(4));

    EXPECT_TRUE(cmp.identical_results);
    EXPECT_EQ(cmp.sequential.report.worker_count(), 1u);
    EXPECT_EQ(cmp.parallel.report.worker_count(), 4u);
    EXPECT_GE(cmp.speedup, 0.0);
}
