#include "OperationGraph.hpp"
#include "../aggregate/AggregateAccumulator.hpp"
#include "../errors/EtlErrors.hpp"

#include <set>

namespace PartitionFlow
{

    std::string_view node_kind_name(NodeKind kind)
    {
        switch (kind)
        {
        case NodeKind::Source:
            return "source";
        case NodeKind::Filter:
            return "filter";
        case NodeKind::Map:
            return "map";
        case NodeKind::GroupAggregate:
            return "group_aggregate";
        }
        return "unknown";
    }

    std::string OperationNode::describe() const
    {
        switch (kind())
        {
        case NodeKind::Source:
            return "source" + output_schema->describe();
        case NodeKind::Filter:
            return "filter[" + std::get<FilterOp>(op).predicate.label() + "]";
        case NodeKind::Map:
            return "map[" + std::get<MapOp>(op).projection.describe() + "]";
        case NodeKind::GroupAggregate:
        {
            const auto &g = std::get<GroupAggregateOp>(op);
            std::string out = "group_aggregate[by ";
            for (size_t i = 0; i < g.key_columns.size(); ++i)
                out += (i ? "," : "") + g.key_columns[i];
            out += ":";
            for (const auto &[name, spec] : g.specs)
                out += " " + name + "=" + spec.describe();
            out += "]";
            return out;
        }
        }
        return "?";
    }

    OperationGraph OperationGraph::source(SchemaPtr schema)
    {
        if (!schema || schema->empty())
            throw SchemaError("graph source needs a non-empty schema");

        auto node = std::make_shared<const OperationNode>(
            OperationNode{SourceOp{}, nullptr, schema});
        return OperationGraph(std::move(schema), std::move(node));
    }

    OperationGraph OperationGraph::append(OperationNode node) const
    {
        if (has_aggregate())
        {
            throw SchemaError("cannot append " + std::string(node_kind_name(node.kind())) +
                              " after group_aggregate: it must be the last stage");
        }
        node.upstream = tail_;
        return OperationGraph(input_schema_, std::make_shared<const OperationNode>(std::move(node)));
    }

    OperationGraph OperationGraph::filter(Predicate predicate) const
    {
        // Checked before append() so the error names the real problem first
        if (has_aggregate())
            throw SchemaError("cannot filter after group_aggregate: it must be the last stage");

        Predicate bound = predicate.bind(*output_schema());
        return append(OperationNode{FilterOp{std::move(bound)}, nullptr, output_schema()});
    }

    OperationGraph OperationGraph::map(Projection projection) const
    {
        if (has_aggregate())
            throw SchemaError("cannot map after group_aggregate: it must be the last stage");

        BoundProjection bound = projection.bind(*output_schema());
        SchemaPtr out = bound.output_schema();
        return append(OperationNode{MapOp{std::move(projection), std::move(bound)}, nullptr, std::move(out)});
    }

    // =========================================================================
    // group_aggregate() — validate keys and specs, resolve the output schema
    // =========================================================================
    OperationGraph OperationGraph::group_aggregate(std::vector<std::string> key_columns,
                                                   AggregateSpecs specs) const
    {
        if (has_aggregate())
            throw SchemaError("graph already ends in group_aggregate");

        const Schema &in = *output_schema();

        if (key_columns.empty())
            throw SchemaError("group_aggregate needs at least one key column");
        if (specs.empty())
            throw SchemaError("group_aggregate needs at least one aggregate spec");

        AggregateStage stage;
        std::vector<ColumnDef> out_columns;
        std::set<std::string> seen_keys;

        for (const auto &key : key_columns)
        {
            if (!seen_keys.insert(key).second)
                throw SchemaError("duplicate key column '" + key + "' in group_aggregate");

            const size_t idx = in.require_index(key, "group_aggregate keys");
            stage.key_indices.push_back(idx);
            out_columns.push_back(in.column(idx));
        }

        for (const auto &[output_name, spec] : specs)
        {
            const std::string context = "aggregate '" + output_name + "' = " + spec.describe();

            BoundAggregate agg{output_name, spec.kind, std::nullopt, ColumnType::Integer, ColumnType::Integer};

            if (spec.input_column)
            {
                const size_t idx = in.require_index(*spec.input_column, context);
                agg.input_index = idx;
                agg.input_type = in.column(idx).type;
            }
            else if (spec.kind != AggregateKind::Count)
            {
                throw SchemaError(context + ": only count may omit the input column");
            }

            if ((spec.kind == AggregateKind::Sum || spec.kind == AggregateKind::Average) &&
                !is_numeric(agg.input_type))
            {
                throw SchemaError(context + ": " + std::string(kind_name(spec.kind)) +
                                  " needs an integer or float column, '" + *spec.input_column +
                                  "' is " + std::string(type_name(agg.input_type)));
            }

            agg.output_type = AggregateAccumulator::output_type(spec.kind, agg.input_type);
            out_columns.push_back({output_name, agg.output_type});
            stage.aggregates.push_back(std::move(agg));
        }

        // Duplicate output names (including collisions with key columns) are
        // rejected by the Schema constructor.
        stage.output_schema = make_schema(std::move(out_columns));
        SchemaPtr out = stage.output_schema;

        return append(OperationNode{GroupAggregateOp{std::move(key_columns), std::move(specs), std::move(stage)},
                                    nullptr, std::move(out)});
    }

    std::vector<const OperationNode *> OperationGraph::lineage() const
    {
        std::vector<const OperationNode *> chain;
        for (const OperationNode *n = tail_.get(); n != nullptr; n = n->upstream.get())
            chain.push_back(n);
        return {chain.rbegin(), chain.rend()};
    }

    ExecutionPlan OperationGraph::compile() const
    {
        ExecutionPlan plan;
        plan.input_schema = input_schema_;
        plan.output_schema = output_schema();
        plan.description = explain();

        for (const OperationNode *node : lineage())
        {
            switch (node->kind())
            {
            case NodeKind::Source:
                break;
            case NodeKind::Filter:
                plan.stages.emplace_back(FilterStage{std::get<FilterOp>(node->op).predicate});
                break;
            case NodeKind::Map:
                plan.stages.emplace_back(MapStage{std::get<MapOp>(node->op).bound});
                break;
            case NodeKind::GroupAggregate:
                plan.aggregate = std::get<GroupAggregateOp>(node->op).bound;
                break;
            }
        }

        return plan;
    }

    std::string OperationGraph::explain() const
    {
        std::string out;
        for (const OperationNode *node : lineage())
        {
            if (!out.empty())
                out += " -> ";
            out += node->describe();
        }
        return out;
    }

} // namespace PartitionFlow
