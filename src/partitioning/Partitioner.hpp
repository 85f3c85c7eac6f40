#pragma once

// ============================================================================
// Partitioner — Splits a record stream into bounded-size partitions
// ============================================================================
//
//   source:  r0 r1 r2 r3 r4 r5 r6 r7 r8 r9      target_partition_size = 4
//            └────┬────┘ └────┬────┘ └─┬─┘
//   output:   partition 0  partition 1  partition 2 (short tail)
//
// next_partition() pulls at most target_partition_size records from the
// source, wraps them in a Partition and hands it over. Nothing else is
// buffered, so memory is bounded by one partition no matter how big the
// input is. An empty source yields zero partitions.
// ============================================================================

#include <cstdint>
#include <optional>
#include <vector>
#include "../model/Partition.hpp"
#include "RecordSource.hpp"

namespace PartitionFlow
{

    class Partitioner
    {
    public:
        static constexpr int64_t kDefaultPartitionSize = 100'000;

        // Throws InvalidConfiguration if target_partition_size <= 0
        Partitioner(RecordSource &source, int64_t target_partition_size);

        // Next partition in emission order, or std::nullopt when the source is drained
        [[nodiscard]]
        std::optional<Partition> next_partition();

        size_t partitions_emitted() const { return next_index_; }
        size_t records_consumed() const { return records_consumed_; }
        int64_t target_partition_size() const { return target_size_; }

        // Drains the whole source. Convenience for datasets that fit in memory.
        [[nodiscard]]
        static std::vector<Partition> partition(RecordSource &source, int64_t target_partition_size);

        [[nodiscard]]
        static std::vector<Partition> partition(SchemaPtr schema,
                                                std::vector<Record> records,
                                                int64_t target_partition_size);

        static void validate_partition_size(int64_t target_partition_size);

    private:
        RecordSource &source_;
        int64_t target_size_;
        size_t next_index_ = 0;
        size_t records_consumed_ = 0;
        bool exhausted_ = false;
    };

} // namespace PartitionFlow
