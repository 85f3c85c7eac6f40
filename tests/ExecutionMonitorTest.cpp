#include <gtest/gtest.h>

#include <thread>

#include "monitor/ExecutionMonitor.hpp"

using namespace PartitionFlow;

namespace
{
    PartitionTiming timing(size_t index, int64_t elapsed_ns, bool ok = true)
    {
        PartitionTiming t;
        t.partition_index = index;
        t.elapsed_ns = elapsed_ns;
        t.input_records = 10;
        t.succeeded = ok;
        return t;
    }
} // namespace

TEST(ExecutionMonitorTest, CompareIsSequentialOverParallel)
{
    ExecutionReport parallel(4, 4, 250, 4, 0, {}, true);
    ExecutionReport sequential(1, 1, 1000, 1, 0, {}, true);

    EXPECT_DOUBLE_EQ(ExecutionMonitor::compare(parallel, sequential), 4.0);
    EXPECT_DOUBLE_EQ(ExecutionMonitor::compare(sequential, parallel), 0.25);
}

TEST(ExecutionMonitorTest, CompareIsZeroWhenParallelTookNoTime)
{
    ExecutionReport sequential(1, 1, 1000, 1, 0, {}, true);

    EXPECT_EQ(ExecutionMonitor::compare(ExecutionReport{}, sequential), 0.0);
}

TEST(ExecutionMonitorTest, ReportAggregatesTimings)
{
    ExecutionReport report(2, 2, 1000, 2, 1,
                           {timing(0, 400), timing(1, 600), timing(2, 300, false)}, false);

    EXPECT_EQ(report.completed_tasks(), 2u);
    EXPECT_EQ(report.failed_tasks(), 1u);
    EXPECT_EQ(report.skipped_tasks(), 1u);
    EXPECT_EQ(report.input_records(), 30u);
    EXPECT_EQ(report.busy_ns(), 1300);
    EXPECT_DOUBLE_EQ(report.parallel_efficiency(), 0.65);
    EXPECT_FALSE(report.succeeded());
}

TEST(ExecutionMonitorTest, TracksTasksAcrossThreads)
{
    ExecutionMonitor monitor;
    monitor.begin_run(4, 4);

    std::vector<std::thread> threads;
    for (size_t i = 0; i < 8; ++i)
    {
        threads.emplace_back([&monitor, i]
                             {
                                 monitor.task_started(i, i % 4);
                                 std::this_thread::sleep_for(std::chrono::milliseconds(1));
                                 monitor.task_finished(i, 100, i != 5); });
    }
    for (auto &t : threads)
        t.join();

    monitor.end_run(false);

    EXPECT_EQ(monitor.completed_tasks(), 7u);
    EXPECT_EQ(monitor.failed_tasks(), 1u);
    EXPECT_EQ(monitor.running_tasks(), 0u);
    EXPECT_GE(monitor.peak_concurrent_tasks(), 1u);
    EXPECT_LE(monitor.peak_concurrent_tasks(), 8u);

    ExecutionReport report = monitor.report();
    ASSERT_EQ(report.partition_timings().size(), 8u);
    for (size_t i = 0; i < 8; ++i)
    {
        const PartitionTiming &t = report.partition_timings()[i];
        EXPECT_EQ(t.partition_index, i);
        EXPECT_EQ(t.worker, std::optional<size_t>(i % 4));
        EXPECT_GT(t.elapsed_ns, 0);
        EXPECT_GE(t.start_offset_ns, 0);
    }
    EXPECT_GT(report.total_ns(), 0);
    EXPECT_EQ(report.worker_count(), 4u);
    EXPECT_EQ(report.input_records(), 800u);
}

TEST(ExecutionMonitorTest, BeginRunResetsState)
{
    ExecutionMonitor monitor;
    monitor.begin_run(2, 2);
    monitor.task_started(0);
    monitor.task_finished(0, 5, true);
    monitor.task_skipped(1);
    monitor.end_run(false);

    EXPECT_EQ(monitor.skipped_tasks(), 1u);

    monitor.begin_run(1, 1);
    EXPECT_EQ(monitor.completed_tasks(), 0u);
    EXPECT_EQ(monitor.skipped_tasks(), 0u);
    EXPECT_TRUE(monitor.report().partition_timings().empty());
}
