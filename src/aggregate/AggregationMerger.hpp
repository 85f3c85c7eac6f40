#pragma once

// ============================================================================
// AggregationMerger — Turns per-partition results into one final answer
// ============================================================================
//
// NON-AGGREGATE GRAPHS
//   Partials are sorted by partition index and concatenated. Completion
//   order of the tasks is irrelevant: index order is restored here.
//
// GROUPAGGREGATE GRAPHS
//   1. union of all key sets
//   2. accumulators of the same key combined pairwise
//   3. finalize() every accumulator (averages divided only now)
//
//   Step 2 walks partials in index order as well. combine() is commutative
//   and associative, so any order gives the same value; a fixed order also
//   makes floating-point sums bit-identical across concurrency levels.
//
// Runs single-threaded, after every partition task has finished.
// ============================================================================

#include <vector>
#include "../execution/FinalResult.hpp"
#include "../execution/PartialResult.hpp"
#include "../graph/ExecutionPlan.hpp"
#include "AggregateAccumulator.hpp"

namespace PartitionFlow
{

    class AggregationMerger
    {
    public:
        // Throws MergeError on mixed payload kinds, duplicate partition
        // indices, or accumulators that cannot be combined.
        [[nodiscard]]
        static FinalResult merge(const ExecutionPlan &plan, std::vector<PartialResult> partials);

        // Folds `from` into `into`, key by key. Either order yields the same table.
        static void combine_into(GroupTable &into, const GroupTable &from);

        // Finalized records (key columns + aggregate outputs) per group
        [[nodiscard]]
        static FinalResult finalize(const ExecutionPlan &plan, const GroupTable &groups);
    };

} // namespace PartitionFlow
