#pragma once

// ============================================================================
// ExecutionMonitor — Observes one Scheduler run, never touches its data
// ============================================================================
//
//   begin_run ──► task_started(i) ... task_finished(i) (xN, any thread) ──► end_run
//        │                                                                     │
//        t0                        per-task offsets are measured from t0       t1
//
// All mutating calls take one mutex; they happen once per partition task,
// not per record, so contention is negligible next to partition work.
//
// report() snapshots the state into an immutable ExecutionReport. A monitor
// handed to Scheduler::run by the caller still holds its counts after run()
// throws, which is how failed-task bookkeeping is inspected.
// ============================================================================

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace PartitionFlow
{

    // ============================================================================
    // PartitionTiming — One partition task as the monitor saw it
    // ============================================================================
    struct PartitionTiming
    {
        size_t partition_index = 0;
        int64_t start_offset_ns = 0; // from run start
        int64_t elapsed_ns = 0;
        size_t input_records = 0;
        bool succeeded = false;
        std::optional<size_t> worker; // pool slot, when known

        double elapsed_ms() const
        {
            return static_cast<double>(elapsed_ns) / 1'000'000.0;
        }
    };

    class ExecutionReport
    {
    public:
        ExecutionReport() = default;

        ExecutionReport(int configured_concurrency,
                        size_t worker_count,
                        int64_t total_ns,
                        size_t peak_concurrent_tasks,
                        size_t skipped_tasks,
                        std::vector<PartitionTiming> timings,
                        bool succeeded);

        int configured_concurrency() const { return configured_concurrency_; }
        size_t worker_count() const { return worker_count_; }
        int64_t total_ns() const { return total_ns_; }
        size_t peak_concurrent_tasks() const { return peak_concurrent_tasks_; }
        size_t skipped_tasks() const { return skipped_tasks_; }
        bool succeeded() const { return succeeded_; }

        // Ordered by partition index
        const std::vector<PartitionTiming> &partition_timings() const { return timings_; }

        double total_ms() const
        {
            return static_cast<double>(total_ns_) / 1'000'000.0;
        }

        size_t completed_tasks() const;
        size_t failed_tasks() const;
        size_t input_records() const;

        // Sum of every task's elapsed time
        int64_t busy_ns() const;

        // busy / (wall * workers), in [0, 1] for a well-behaved run
        double parallel_efficiency() const;

    private:
        int configured_concurrency_ = 0;
        size_t worker_count_ = 0;
        int64_t total_ns_ = 0;
        size_t peak_concurrent_tasks_ = 0;
        size_t skipped_tasks_ = 0;
        std::vector<PartitionTiming> timings_;
        bool succeeded_ = false;
    };

    class ExecutionMonitor
    {
    public:
        using Clock = std::chrono::high_resolution_clock;
        using TimePoint = std::chrono::time_point<Clock>;

        // Resets all state; the monitor can be reused for another run
        void begin_run(int configured_concurrency, size_t worker_count);
        void end_run(bool succeeded);

        void task_started(size_t partition_index, std::optional<size_t> worker = std::nullopt);
        void task_finished(size_t partition_index, size_t input_records, bool succeeded);

        // A task that never ran because the run was cancelled
        void task_skipped(size_t partition_index);

        [[nodiscard]]
        ExecutionReport report() const;

        size_t completed_tasks() const;
        size_t failed_tasks() const;
        size_t skipped_tasks() const;
        size_t running_tasks() const;
        size_t peak_concurrent_tasks() const;

        // Speedup of `parallel` over `sequential`: sequential total / parallel
        // total. 0.0 when the parallel run took no measurable time.
        static double compare(const ExecutionReport &parallel, const ExecutionReport &sequential);

    private:
        int64_t since_start_ns(TimePoint t) const;

        mutable std::mutex mutex_;

        TimePoint run_start_{};
        std::optional<TimePoint> run_end_;
        int configured_concurrency_ = 0;
        size_t worker_count_ = 0;
        bool succeeded_ = false;

        std::map<size_t, PartitionTiming> timings_;
        std::map<size_t, TimePoint> started_at_;
        size_t running_ = 0;
        size_t peak_running_ = 0;
        size_t completed_ = 0;
        size_t failed_ = 0;
        size_t skipped_ = 0;
    };

    // Box-drawn table: one line per partition (up to max_rows), then totals
    void print_execution_report(const ExecutionReport &report, size_t max_rows = 16);

} // namespace PartitionFlow
