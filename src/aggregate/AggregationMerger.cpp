#include "AggregationMerger.hpp"
#include "../errors/EtlErrors.hpp"

#include <algorithm>
#include <iterator>

namespace PartitionFlow
{

    void AggregationMerger::combine_into(GroupTable &into, const GroupTable &from)
    {
        for (const auto &[key, row] : from)
        {
            auto it = into.find(key);
            if (it == into.end())
            {
                into.emplace(key, row);
                continue;
            }

            AccumulatorRow &target = it->second;
            if (target.size() != row.size())
            {
                throw MergeError("group has " + std::to_string(target.size()) +
                                 " accumulators on one side and " + std::to_string(row.size()) +
                                 " on the other");
            }

            for (size_t i = 0; i < row.size(); ++i)
                target[i].combine(row[i]);
        }
    }

    FinalResult AggregationMerger::finalize(const ExecutionPlan &plan, const GroupTable &groups)
    {
        if (!plan.aggregate)
            throw MergeError("finalize called on a plan without group_aggregate");

        const AggregateStage &stage = *plan.aggregate;
        FinalResult::Groups out;

        for (const auto &[key, row] : groups)
        {
            if (row.size() != stage.aggregates.size())
            {
                throw MergeError("group carries " + std::to_string(row.size()) +
                                 " accumulators, plan declares " +
                                 std::to_string(stage.aggregates.size()));
            }

            std::vector<Value> values(key.begin(), key.end());
            values.reserve(key.size() + row.size());

            for (size_t i = 0; i < row.size(); ++i)
            {
                const auto &expected = stage.aggregates[i];
                if (row[i].kind() != expected.kind || row[i].input_type() != expected.input_type)
                {
                    throw MergeError("accumulator for '" + expected.output_name + "' is " +
                                     std::string(kind_name(row[i].kind())) + ", plan declares " +
                                     std::string(kind_name(expected.kind)));
                }
                values.push_back(row[i].finalize());
            }

            out.emplace(key, Record(stage.output_schema, std::move(values)));
        }

        return FinalResult(stage.output_schema, std::move(out));
    }

    FinalResult AggregationMerger::merge(const ExecutionPlan &plan, std::vector<PartialResult> partials)
    {
        std::sort(partials.begin(), partials.end(),
                  [](const PartialResult &a, const PartialResult &b)
                  { return a.partition_index < b.partition_index; });

        for (size_t i = 1; i < partials.size(); ++i)
        {
            if (partials[i].partition_index == partials[i - 1].partition_index)
                throw MergeError("partition " + std::to_string(partials[i].partition_index) +
                                 " delivered more than one partial result");
        }

        for (const auto &p : partials)
        {
            if (p.is_grouped() != plan.is_aggregate())
            {
                throw MergeError("partition " + std::to_string(p.partition_index) + " delivered " +
                                 (p.is_grouped() ? "a group table" : "rows") + " for a " +
                                 (plan.is_aggregate() ? "group_aggregate" : "row") + " plan");
            }
        }

        if (!plan.is_aggregate())
        {
            size_t total = 0;
            for (const auto &p : partials)
                total += p.rows().size();

            std::vector<Record> rows;
            rows.reserve(total);
            for (auto &p : partials)
            {
                auto &part_rows = std::get<std::vector<Record>>(p.payload);
                std::move(part_rows.begin(), part_rows.end(), std::back_inserter(rows));
            }
            return FinalResult(plan.output_schema, std::move(rows));
        }

        GroupTable merged;
        for (const auto &p : partials)
        {
            if (merged.empty())
                merged = p.groups();
            else
                combine_into(merged, p.groups());
        }

        return finalize(plan, merged);
    }

} // namespace PartitionFlow
