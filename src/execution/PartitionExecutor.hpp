#pragma once

#include "../graph/ExecutionPlan.hpp"
#include "../model/Partition.hpp"
#include "PartialResult.hpp"

namespace PartitionFlow
{

    // ============================================================================
    // PartitionExecutor — Runs the per-partition part of a plan on one partition
    // ============================================================================
    //
    //   record ─► filter ─► map ─► filter ─► ...  ─┬─► kept row          (no aggregate)
    //                                              └─► fold into group   (GroupAggregate)
    //
    // Records stream through the stages one at a time; nothing is
    // materialized between stages. The only state is the output vector or
    // the local GroupTable, both created here and returned by value, so
    // concurrent calls on different partitions share nothing mutable.
    //
    // A predicate or projection failure throws EvaluationError carrying the
    // partition index, the record offset and the record as it entered the
    // failing stage. The scheduler scopes it to this partition's task.
    // ============================================================================
    class PartitionExecutor
    {
    public:
        [[nodiscard]]
        static PartialResult execute(const ExecutionPlan &plan, const Partition &partition);
    };

} // namespace PartitionFlow
