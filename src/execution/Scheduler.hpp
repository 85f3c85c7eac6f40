#pragma once

// ============================================================================
// Scheduler — Runs an OperationGraph over partitions on a worker pool
// ============================================================================
//
//   partitions / RecordSource
//        │  (Partitioner, pulled lazily)
//        ▼
//   ┌──────────┐   submit    ┌────────────┐  PartitionExecutor   ┌─────────────┐
//   │ dispatch │ ──────────► │ ThreadPool │ ───────────────────► │ PartialResult│
//   │  loop    │ ◄────────── │ N workers  │   (or an exception)  │ per index   │
//   └──────────┘   futures   └────────────┘                      └──────┬──────┘
//        │ every task finished or failed                               │
//        ▼                                                             ▼
//   PartitionFailure / ExecutionCancelled          AggregationMerger::merge
//                                                          │
//                                                   FinalResult + ExecutionReport
//
// At most max_in_flight partitions are dispatched and unfinished at any
// time, so a streaming source is never read further ahead than that.
//
// A failing partition never stops the others. The merge starts only after
// every task has finished; if any failed, run() throws PartitionFailure
// naming all of them and no result is produced.
//
// Output does not depend on concurrency: concurrency = 1 gives the same
// FinalResult as any other setting, just without overlap.
// ============================================================================

#include <vector>
#include "../graph/OperationGraph.hpp"
#include "../model/Partition.hpp"
#include "../monitor/ExecutionMonitor.hpp"
#include "../partitioning/RecordSource.hpp"
#include "ExecutionConfig.hpp"
#include "FinalResult.hpp"

namespace PartitionFlow
{

    struct RunOutput
    {
        FinalResult result;
        ExecutionReport report;
    };

    class Scheduler
    {
    public:
        // Throws InvalidConfiguration for a bad config
        explicit Scheduler(ExecutionConfig config = {});

        const ExecutionConfig &config() const { return config_; }

        // Partition indices must be exactly 0..n-1 (any order).
        // When `monitor` is given it records the run, including after a throw.
        [[nodiscard]]
        RunOutput run(const OperationGraph &graph,
                      std::vector<Partition> partitions,
                      ExecutionMonitor *monitor = nullptr) const;

        // Partitions `source` itself with config().target_partition_size
        [[nodiscard]]
        RunOutput run(const OperationGraph &graph,
                      RecordSource &source,
                      ExecutionMonitor *monitor = nullptr) const;

    private:
        ExecutionConfig config_;
    };

    struct ComparisonReport
    {
        RunOutput parallel;
        RunOutput sequential;
        double speedup = 0.0;
        bool identical_results = false;
    };

    // Same graph, same partitions: once at config.concurrency, once at 1
    [[nodiscard]]
    ComparisonReport compare_against_sequential(const OperationGraph &graph,
                                                const std::vector<Partition> &partitions,
                                                ExecutionConfig config);

} // namespace PartitionFlow
