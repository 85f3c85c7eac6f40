#pragma once

#include <cstddef>
#include <vector>
#include "Record.hpp"

namespace PartitionFlow
{

    // ============================================================================
    // Partition — A contiguous, immutable chunk of the input stream
    // ============================================================================
    // The Partitioner numbers partitions 0, 1, 2, ... in emission order.
    // Records keep their input order inside a partition. Once built, nothing
    // mutates a partition: executors only read it through const accessors.
    // ============================================================================
    class Partition
    {
    public:
        Partition(size_t index, std::vector<Record> records)
            : index_(index), records_(std::move(records))
        {
        }

        size_t index() const { return index_; }
        const std::vector<Record> &records() const { return records_; }
        size_t size() const { return records_.size(); }
        bool empty() const { return records_.empty(); }

    private:
        size_t index_;
        std::vector<Record> records_;
    };

} // namespace PartitionFlow
