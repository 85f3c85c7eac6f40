#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "../aggregate/AggregateSpec.hpp"
#include "../model/Schema.hpp"
#include "Predicate.hpp"
#include "Projection.hpp"

namespace PartitionFlow
{

    // One aggregate output column, with names resolved to indices
    struct BoundAggregate
    {
        std::string output_name;
        AggregateKind kind;
        std::optional<size_t> input_index; // nullopt = count(*)
        ColumnType input_type;
        ColumnType output_type;
    };

    // GroupAggregate resolved against its input schema.
    // output_schema = key columns, then aggregate outputs in spec order.
    struct AggregateStage
    {
        std::vector<size_t> key_indices;
        std::vector<BoundAggregate> aggregates;
        SchemaPtr output_schema;
    };

    struct FilterStage
    {
        Predicate predicate; // bound
    };

    struct MapStage
    {
        BoundProjection projection;
    };

    using PartitionStage = std::variant<FilterStage, MapStage>;

    // ============================================================================
    // ExecutionPlan — The compiled, immutable form of an OperationGraph
    // ============================================================================
    // Produced by OperationGraph::compile(). Every partition task reads the
    // same plan concurrently; nothing in it is ever written after compile.
    //
    //   stages     Filter / Map, applied per record in declared order
    //   aggregate  present when the graph ends in GroupAggregate: the
    //              per-partition fold, followed by the merge phase
    // ============================================================================
    struct ExecutionPlan
    {
        SchemaPtr input_schema;
        std::vector<PartitionStage> stages;
        std::optional<AggregateStage> aggregate;
        SchemaPtr output_schema;
        std::string description;

        bool is_aggregate() const { return aggregate.has_value(); }
    };

} // namespace PartitionFlow
