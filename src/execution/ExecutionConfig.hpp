#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include "../errors/EtlErrors.hpp"
#include "../partitioning/Partitioner.hpp"

namespace PartitionFlow
{

    // ============================================================================
    // CancellationToken — Cooperative stop flag shared with a running Scheduler
    // ============================================================================
    // Any thread may request(). Partition tasks that have not started yet see
    // the flag and skip themselves; tasks already running finish normally.
    // ============================================================================
    class CancellationToken
    {
    public:
        void request() noexcept { requested_.store(true, std::memory_order_release); }

        bool is_requested() const noexcept
        {
            return requested_.load(std::memory_order_acquire);
        }

    private:
        std::atomic<bool> requested_{false};
    };

    // Hardware threads, never less than 1
    inline int default_concurrency()
    {
        unsigned int hw = std::thread::hardware_concurrency();
        return hw == 0 ? 1 : static_cast<int>(hw);
    }

    // ============================================================================
    // ExecutionConfig — Everything a run needs to know besides graph and data
    // ============================================================================
    struct ExecutionConfig
    {
        int64_t target_partition_size = Partitioner::kDefaultPartitionSize;
        int concurrency = default_concurrency();

        // Partitions dispatched but not yet finished during a streaming run.
        // 0 = 2 * concurrency.
        int max_in_flight = 0;

        std::shared_ptr<CancellationToken> cancellation;

        bool verbose = false;

        void validate() const
        {
            if (target_partition_size <= 0)
                throw InvalidConfiguration("target_partition_size must be positive, got " +
                                           std::to_string(target_partition_size));
            if (concurrency <= 0)
                throw InvalidConfiguration("concurrency must be positive, got " +
                                           std::to_string(concurrency));
            if (max_in_flight < 0)
                throw InvalidConfiguration("max_in_flight must not be negative, got " +
                                           std::to_string(max_in_flight));
        }

        size_t effective_in_flight() const
        {
            return max_in_flight == 0 ? static_cast<size_t>(concurrency) * 2
                                      : static_cast<size_t>(max_in_flight);
        }
    };

} // namespace PartitionFlow
