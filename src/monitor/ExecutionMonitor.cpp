#include "ExecutionMonitor.hpp"

#include <iomanip>
#include <iostream>
#include <string>

namespace PartitionFlow
{

    // ============================================================================
    // ExecutionReport
    // ============================================================================

    ExecutionReport::ExecutionReport(int configured_concurrency,
                                     size_t worker_count,
                                     int64_t total_ns,
                                     size_t peak_concurrent_tasks,
                                     size_t skipped_tasks,
                                     std::vector<PartitionTiming> timings,
                                     bool succeeded)
        : configured_concurrency_(configured_concurrency),
          worker_count_(worker_count),
          total_ns_(total_ns),
          peak_concurrent_tasks_(peak_concurrent_tasks),
          skipped_tasks_(skipped_tasks),
          timings_(std::move(timings)),
          succeeded_(succeeded)
    {
    }

    size_t ExecutionReport::completed_tasks() const
    {
        size_t n = 0;
        for (const auto &t : timings_)
            n += t.succeeded ? 1 : 0;
        return n;
    }

    size_t ExecutionReport::failed_tasks() const
    {
        return timings_.size() - completed_tasks();
    }

    size_t ExecutionReport::input_records() const
    {
        size_t n = 0;
        for (const auto &t : timings_)
            n += t.input_records;
        return n;
    }

    int64_t ExecutionReport::busy_ns() const
    {
        int64_t busy = 0;
        for (const auto &t : timings_)
            busy += t.elapsed_ns;
        return busy;
    }

    double ExecutionReport::parallel_efficiency() const
    {
        if (total_ns_ <= 0 || worker_count_ == 0)
            return 0.0;
        return static_cast<double>(busy_ns()) /
               (static_cast<double>(total_ns_) * static_cast<double>(worker_count_));
    }

    // ============================================================================
    // ExecutionMonitor
    // ============================================================================

    void ExecutionMonitor::begin_run(int configured_concurrency, size_t worker_count)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_start_ = Clock::now();
        run_end_.reset();
        configured_concurrency_ = configured_concurrency;
        worker_count_ = worker_count;
        succeeded_ = false;
        timings_.clear();
        started_at_.clear();
        running_ = peak_running_ = 0;
        completed_ = failed_ = skipped_ = 0;
    }

    void ExecutionMonitor::end_run(bool succeeded)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_end_ = Clock::now();
        succeeded_ = succeeded;
    }

    int64_t ExecutionMonitor::since_start_ns(TimePoint t) const
    {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(t - run_start_).count();
    }

    void ExecutionMonitor::task_started(size_t partition_index, std::optional<size_t> worker)
    {
        auto now = Clock::now();
        std::lock_guard<std::mutex> lock(mutex_);

        started_at_[partition_index] = now;

        PartitionTiming &timing = timings_[partition_index];
        timing.partition_index = partition_index;
        timing.start_offset_ns = since_start_ns(now);
        timing.worker = worker;

        ++running_;
        if (running_ > peak_running_)
            peak_running_ = running_;
    }

    void ExecutionMonitor::task_finished(size_t partition_index, size_t input_records, bool succeeded)
    {
        auto now = Clock::now();
        std::lock_guard<std::mutex> lock(mutex_);

        PartitionTiming &timing = timings_[partition_index];
        timing.partition_index = partition_index;
        timing.input_records = input_records;
        timing.succeeded = succeeded;

        auto it = started_at_.find(partition_index);
        if (it != started_at_.end())
        {
            timing.elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now - it->second).count();
            started_at_.erase(it);
            if (running_ > 0)
                --running_;
        }

        if (succeeded)
            ++completed_;
        else
            ++failed_;
    }

    void ExecutionMonitor::task_skipped(size_t /*partition_index*/)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++skipped_;
    }

    ExecutionReport ExecutionMonitor::report() const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        TimePoint end = run_end_ ? *run_end_ : Clock::now();

        std::vector<PartitionTiming> timings;
        timings.reserve(timings_.size());
        for (const auto &[index, timing] : timings_)
            timings.push_back(timing);

        return ExecutionReport(configured_concurrency_,
                               worker_count_,
                               since_start_ns(end),
                               peak_running_,
                               skipped_,
                               std::move(timings),
                               succeeded_);
    }

    size_t ExecutionMonitor::completed_tasks() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

    size_t ExecutionMonitor::failed_tasks() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return failed_;
    }

    size_t ExecutionMonitor::skipped_tasks() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return skipped_;
    }

    size_t ExecutionMonitor::running_tasks() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    size_t ExecutionMonitor::peak_concurrent_tasks() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_running_;
    }

    double ExecutionMonitor::compare(const ExecutionReport &parallel, const ExecutionReport &sequential)
    {
        if (parallel.total_ns() <= 0)
            return 0.0;
        return static_cast<double>(sequential.total_ns()) / static_cast<double>(parallel.total_ns());
    }

    // ============================================================================
    // print_execution_report()
    // ============================================================================
    void print_execution_report(const ExecutionReport &report, size_t max_rows)
    {
        std::cout << "\n";
        std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
        std::cout << "║         PartitionFlow — Execution Report (concurrency "
                  << std::left << std::setw(3) << report.configured_concurrency() << ")   ║\n";
        std::cout << "╠═══════════╦══════════╦══════════════╦══════════════╦═════════╣\n";
        std::cout << "║ Partition ║  Worker  ║  Records     ║ Start (ms)   ║ Elapsed ║\n";
        std::cout << "╠═══════════╬══════════╬══════════════╬══════════════╬═════════╣\n";

        const auto &timings = report.partition_timings();
        size_t shown = 0;
        for (const auto &t : timings)
        {
            if (shown++ == max_rows)
                break;

            std::string worker = t.worker ? std::to_string(*t.worker) : "-";
            std::string elapsed = t.succeeded ? "" : "!";

            std::cout << "║ "
                      << std::right << std::setw(9) << t.partition_index
                      << " ║ "
                      << std::setw(8) << worker
                      << " ║ "
                      << std::setw(12) << t.input_records
                      << " ║ "
                      << std::fixed << std::setprecision(3)
                      << std::setw(12) << static_cast<double>(t.start_offset_ns) / 1'000'000.0
                      << " ║ "
                      << std::setw(6) << std::setprecision(2) << t.elapsed_ms()
                      << std::left << std::setw(1) << elapsed
                      << " ║\n";
        }

        if (timings.size() > max_rows)
        {
            std::cout << "║ " << std::left << std::setw(60)
                      << ("... " + std::to_string(timings.size() - max_rows) + " more partitions")
                      << " ║\n";
        }

        std::cout << "╠═══════════╩══════════╩══════════════╩══════════════╩═════════╣\n";

        std::cout << std::right << std::fixed;
        std::cout << "║ Wall time (ms)       " << std::setprecision(3) << std::setw(39) << report.total_ms() << " ║\n";
        std::cout << "║ Busy time (ms)       " << std::setw(39)
                  << static_cast<double>(report.busy_ns()) / 1'000'000.0 << " ║\n";
        std::cout << "║ Workers / peak       " << std::setw(39)
                  << (std::to_string(report.worker_count()) + " / " +
                      std::to_string(report.peak_concurrent_tasks()))
                  << " ║\n";
        std::cout << "║ Efficiency           " << std::setprecision(1) << std::setw(38)
                  << report.parallel_efficiency() * 100.0 << "%" << " ║\n";
        std::cout << "║ Tasks ok / failed    " << std::setw(39)
                  << (std::to_string(report.completed_tasks()) + " / " +
                      std::to_string(report.failed_tasks()))
                  << " ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
        std::cout << std::defaultfloat << std::left;
    }

} // namespace PartitionFlow
