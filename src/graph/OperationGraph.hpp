#pragma once

// ============================================================================
// OperationGraph — A lazy description of a filter / map / aggregate pipeline
// ============================================================================
//
//   auto graph = OperationGraph::source(schema)
//                    .filter(Predicate::compare("amount", CompareOp::Greater, 0.0))
//                    .group_aggregate({"region"},
//                                     {{"total", AggregateSpec::sum("amount")},
//                                      {"count", AggregateSpec::count()}});
//
// Each builder call returns a NEW handle whose tail node points at the
// previous tail as its upstream. No record is touched and no user function
// is called until a Scheduler runs the graph.
//
//   source ──► filter ──► group_aggregate          (graph A)
//                 │
//                 └──────► map                     (graph B, shares the prefix)
//
// Nodes are immutable and shared through shared_ptr<const OperationNode>,
// so branching off an existing handle is free and never disturbs it.
//
// Every builder call validates against the schema flowing out of the
// previous node and throws SchemaError on the spot.
// ============================================================================

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "../aggregate/AggregateSpec.hpp"
#include "../model/Schema.hpp"
#include "ExecutionPlan.hpp"
#include "Predicate.hpp"
#include "Projection.hpp"

namespace PartitionFlow
{

    enum class NodeKind
    {
        Source,
        Filter,
        Map,
        GroupAggregate
    };

    std::string_view node_kind_name(NodeKind kind);

    struct SourceOp
    {
    };

    struct FilterOp
    {
        Predicate predicate; // bound against the upstream schema
    };

    struct MapOp
    {
        Projection projection;
        BoundProjection bound;
    };

    struct GroupAggregateOp
    {
        std::vector<std::string> key_columns;
        AggregateSpecs specs;
        AggregateStage bound;
    };

    struct OperationNode
    {
        std::variant<SourceOp, FilterOp, MapOp, GroupAggregateOp> op;
        std::shared_ptr<const OperationNode> upstream; // null for the source
        SchemaPtr output_schema;

        NodeKind kind() const { return static_cast<NodeKind>(op.index()); }
        std::string describe() const;
    };

    class OperationGraph
    {
    public:
        // Entry point: a graph with only a source node over this schema
        [[nodiscard]]
        static OperationGraph source(SchemaPtr schema);

        [[nodiscard]] OperationGraph filter(Predicate predicate) const;
        [[nodiscard]] OperationGraph map(Projection projection) const;
        [[nodiscard]] OperationGraph group_aggregate(std::vector<std::string> key_columns,
                                                     AggregateSpecs specs) const;

        const SchemaPtr &input_schema() const { return input_schema_; }
        const SchemaPtr &output_schema() const { return tail_->output_schema; }
        const OperationNode &tail() const { return *tail_; }

        bool has_aggregate() const { return tail_->kind() == NodeKind::GroupAggregate; }

        // Nodes from source to tail
        std::vector<const OperationNode *> lineage() const;

        // Resolves the chain into an immutable ExecutionPlan. Pure: the
        // graph itself is left untouched and can be compiled again.
        [[nodiscard]]
        ExecutionPlan compile() const;

        // "source{amount: float, region: text} -> filter[amount > 0] -> ..."
        std::string explain() const;

    private:
        OperationGraph(SchemaPtr input_schema, std::shared_ptr<const OperationNode> tail)
            : input_schema_(std::move(input_schema)), tail_(std::move(tail))
        {
        }

        OperationGraph append(OperationNode node) const;

        SchemaPtr input_schema_;
        std::shared_ptr<const OperationNode> tail_;
    };

} // namespace PartitionFlow
