#include "PartitionExecutor.hpp"
#include "../errors/EtlErrors.hpp"

#include <optional>

namespace PartitionFlow
{

    // Folds one surviving record into its group's accumulators. The group
    // entry is created on the first record carrying that key.
    static void fold_into_groups(const AggregateStage &stage, const Record &record, GroupTable &groups)
    {
        GroupKey key;
        key.reserve(stage.key_indices.size());
        for (size_t idx : stage.key_indices)
            key.push_back(record.at(idx));

        auto it = groups.find(key);
        if (it == groups.end())
        {
            AccumulatorRow row;
            row.reserve(stage.aggregates.size());
            for (const auto &agg : stage.aggregates)
                row.emplace_back(agg.kind, agg.input_type);
            it = groups.emplace(std::move(key), std::move(row)).first;
        }

        AccumulatorRow &row = it->second;
        for (size_t i = 0; i < stage.aggregates.size(); ++i)
        {
            const auto &agg = stage.aggregates[i];
            if (agg.input_index)
                row[i].add(record.at(*agg.input_index));
            else
                row[i].add_row();
        }
    }

    PartialResult PartitionExecutor::execute(const ExecutionPlan &plan, const Partition &partition)
    {
        PartialResult result;
        result.partition_index = partition.index();
        result.input_records = partition.size();

        std::vector<Record> rows;
        GroupTable groups;

        size_t offset = 0;
        for (const Record &input : partition.records())
        {
            // Records of a foreign schema would silently index the wrong columns
            if (input.schema() != plan.input_schema && *input.schema() != *plan.input_schema)
            {
                throw EvaluationError(partition.index(), offset, input.describe(),
                                      "record schema " + input.schema()->describe() +
                                          " does not match graph input " + plan.input_schema->describe());
            }

            // The record as it currently flows; replaced by each Map stage
            std::optional<Record> projected;
            const Record *current = &input;
            bool keep = true;

            for (const auto &stage : plan.stages)
            {
                try
                {
                    if (const auto *f = std::get_if<FilterStage>(&stage))
                    {
                        keep = f->predicate.evaluate(*current);
                    }
                    else
                    {
                        projected = std::get<MapStage>(stage).projection.apply(*current);
                        current = &*projected;
                    }
                }
                catch (const std::exception &e)
                {
                    throw EvaluationError(partition.index(), offset, current->describe(), e.what());
                }
                catch (...)
                {
                    throw EvaluationError(partition.index(), offset, current->describe(), "unknown exception");
                }

                if (!keep)
                    break;
            }

            if (keep)
            {
                if (plan.aggregate)
                {
                    // Integer sums can overflow while folding
                    try
                    {
                        fold_into_groups(*plan.aggregate, *current, groups);
                    }
                    catch (const std::exception &e)
                    {
                        throw EvaluationError(partition.index(), offset, current->describe(), e.what());
                    }
                }
                else if (projected)
                    rows.push_back(std::move(*projected));
                else
                    rows.push_back(input);
            }

            ++offset;
        }

        if (plan.aggregate)
            result.payload = std::move(groups);
        else
            result.payload = std::move(rows);

        return result;
    }

} // namespace PartitionFlow
