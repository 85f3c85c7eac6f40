#include "Partitioner.hpp"
#include "../errors/EtlErrors.hpp"

#include <algorithm>

namespace PartitionFlow
{

    void Partitioner::validate_partition_size(int64_t target_partition_size)
    {
        if (target_partition_size <= 0)
        {
            throw InvalidConfiguration("target_partition_size must be > 0, got " +
                                       std::to_string(target_partition_size));
        }
    }

    Partitioner::Partitioner(RecordSource &source, int64_t target_partition_size)
        : source_(source), target_size_(target_partition_size)
    {
        validate_partition_size(target_partition_size);
    }

    std::optional<Partition> Partitioner::next_partition()
    {
        if (exhausted_)
            return std::nullopt;

        const auto limit = static_cast<size_t>(target_size_);

        std::vector<Record> records;
        // Cap the up-front reservation: a huge target size on a short
        // source must not allocate the full target.
        records.reserve(std::min<size_t>(limit, 4096));

        while (records.size() < limit)
        {
            auto record = source_.next();
            if (!record)
            {
                exhausted_ = true;
                break;
            }
            records.push_back(std::move(*record));
        }

        if (records.empty())
            return std::nullopt;

        records_consumed_ += records.size();
        return Partition(next_index_++, std::move(records));
    }

    std::vector<Partition> Partitioner::partition(RecordSource &source, int64_t target_partition_size)
    {
        Partitioner partitioner(source, target_partition_size);

        std::vector<Partition> partitions;
        while (auto p = partitioner.next_partition())
            partitions.push_back(std::move(*p));
        return partitions;
    }

    std::vector<Partition> Partitioner::partition(SchemaPtr schema,
                                                  std::vector<Record> records,
                                                  int64_t target_partition_size)
    {
        validate_partition_size(target_partition_size);
        VectorRecordSource source(std::move(schema), std::move(records));
        return partition(source, target_partition_size);
    }

} // namespace PartitionFlow
