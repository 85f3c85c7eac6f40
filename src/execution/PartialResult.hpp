#pragma once

#include <cstddef>
#include <variant>
#include <vector>
#include "../aggregate/AggregateAccumulator.hpp"
#include "../model/Record.hpp"

namespace PartitionFlow
{

    // ============================================================================
    // PartialResult — What one partition task hands to the merge phase
    // ============================================================================
    // Either the surviving / projected records (non-aggregate graphs) or the
    // partition-local group table (GroupAggregate graphs). Owned by the
    // worker that built it until the task returns; read-only afterwards.
    // ============================================================================
    struct PartialResult
    {
        size_t partition_index = 0;
        size_t input_records = 0;
        std::variant<std::vector<Record>, GroupTable> payload;

        bool is_grouped() const { return std::holds_alternative<GroupTable>(payload); }

        const std::vector<Record> &rows() const { return std::get<std::vector<Record>>(payload); }
        const GroupTable &groups() const { return std::get<GroupTable>(payload); }

        size_t output_size() const
        {
            return is_grouped() ? groups().size() : rows().size();
        }
    };

} // namespace PartitionFlow
