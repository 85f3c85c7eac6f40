#pragma once

// ============================================================================
// Benchmarker — Wall-clock timing of pipeline stages
// ============================================================================
// Stage-level timing for etl_pipeline (extract, partition, run, load).
// Per-partition timing inside a run is the ExecutionMonitor's job; this
// only brackets whole stages.
// ============================================================================

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace PartitionFlow
{

    struct BenchmarkResult
    {
        std::string label;
        long long duration_ns;
        size_t item_count; // records handled by the stage

        double duration_ms() const
        {
            return static_cast<double>(duration_ns) / 1'000'000.0;
        }

        // 0 for stages that handled no records or took no measurable time
        double records_per_second() const
        {
            if (duration_ns <= 0 || item_count == 0)
                return 0.0;
            return static_cast<double>(item_count) * 1e9 / static_cast<double>(duration_ns);
        }
    };

    // ============================================================================
    // Scoped timer: starts on construction, appends a BenchmarkResult to
    // `results` on destruction (including during unwinding).
    //
    //   {
    //       Benchmarker bm("Partition", records.size(), results);
    //       ...
    //   }
    // ============================================================================
    class Benchmarker
    {
    public:
        using Clock = std::chrono::high_resolution_clock;
        using TimePoint = std::chrono::time_point<Clock>;

        Benchmarker(std::string label, size_t item_count,
                    std::vector<BenchmarkResult> &results)
            : label_(std::move(label)), item_count_(item_count), results_(results), start_(Clock::now())
        {
        }

        ~Benchmarker()
        {
            auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                                   Clock::now() - start_)
                                   .count();

            results_.push_back({label_, duration_ns, item_count_});
        }

        Benchmarker(const Benchmarker &) = delete;
        Benchmarker &operator=(const Benchmarker &) = delete;

    private:
        std::string label_;
        size_t item_count_;
        std::vector<BenchmarkResult> &results_;
        TimePoint start_;
    };

    // One line per stage with its share of the summed stage time
    inline void print_benchmark_report(const std::vector<BenchmarkResult> &results)
    {
        long long total_ns = 0;
        for (const auto &r : results)
            total_ns += r.duration_ns;

        auto share = [total_ns](long long ns)
        {
            return total_ns > 0 ? 100.0 * static_cast<double>(ns) / static_cast<double>(total_ns) : 0.0;
        };

        std::cout << "\n";
        std::cout << "╔═════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║                PartitionFlow ETL — Stage Timings                ║\n";
        std::cout << "╠══════════════════╦══════════════╦═════════╦═════════════════════╣\n";
        std::cout << "║ Stage            ║  Time (ms)   ║ Share % ║    records / sec    ║\n";
        std::cout << "╠══════════════════╬══════════════╬═════════╬═════════════════════╣\n";

        std::cout << std::fixed;
        for (const auto &r : results)
        {
            std::cout << "║ " << std::left << std::setw(16) << r.label << " ║ "
                      << std::right << std::setprecision(3) << std::setw(12) << r.duration_ms() << " ║ "
                      << std::setprecision(1) << std::setw(7) << share(r.duration_ns) << " ║ "
                      << std::setprecision(0) << std::setw(19) << r.records_per_second() << " ║\n";
        }

        std::cout << "╠══════════════════╬══════════════╬═════════╬═════════════════════╣\n";
        std::cout << "║ " << std::left << std::setw(16) << "ALL STAGES" << " ║ "
                  << std::right << std::setprecision(3) << std::setw(12)
                  << static_cast<double>(total_ns) / 1'000'000.0
                  << " ║   100.0 ║                     ║\n";
        std::cout << "╚══════════════════╩══════════════╩═════════╩═════════════════════╝\n\n";
        std::cout << std::defaultfloat << std::left;
    }

} // namespace PartitionFlow
