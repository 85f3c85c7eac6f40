#include "Scheduler.hpp"
#include "../aggregate/AggregationMerger.hpp"
#include "../errors/EtlErrors.hpp"
#include "../partitioning/Partitioner.hpp"
#include "PartitionExecutor.hpp"
#include "ThreadPool.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <future>
#include <iostream>
#include <optional>
#include <utility>

namespace PartitionFlow
{

    namespace
    {
        using PartitionProducer = std::function<std::optional<Partition>()>;

        // nullopt = skipped because cancellation was requested first
        using TaskFuture = std::future<std::optional<PartialResult>>;

        struct InFlight
        {
            size_t partition_index;
            TaskFuture future;
        };

        void check_contiguous(const std::vector<Partition> &partitions)
        {
            std::vector<size_t> indices;
            indices.reserve(partitions.size());
            for (const auto &p : partitions)
                indices.push_back(p.index());
            std::sort(indices.begin(), indices.end());

            for (size_t i = 0; i < indices.size(); ++i)
            {
                if (indices[i] != i)
                    throw InvalidConfiguration("partition indices must be 0.." +
                                               std::to_string(indices.size() - 1) +
                                               " without gaps or repeats; found index " +
                                               std::to_string(indices[i]) + " at position " +
                                               std::to_string(i));
            }
        }

        // ====================================================================
        // execute_run() — the dispatch / collect / merge cycle behind both
        // public run() overloads
        // ====================================================================
        RunOutput execute_run(const ExecutionConfig &config,
                              const OperationGraph &graph,
                              const PartitionProducer &next_partition,
                              ExecutionMonitor *external_monitor)
        {
            const ExecutionPlan plan = graph.compile();

            ExecutionMonitor local_monitor;
            ExecutionMonitor &monitor = external_monitor ? *external_monitor : local_monitor;
            const std::shared_ptr<CancellationToken> cancel = config.cancellation;

            auto cancelled = [&cancel]
            { return cancel && cancel->is_requested(); };

            std::vector<PartialResult> partials;
            std::vector<PartitionFailure::Entry> failures;
            bool incomplete = false;

            // Takes ownership of one finished (or failed) task's outcome.
            // Blocks until that task is done.
            auto collect = [&](InFlight &task)
            {
                try
                {
                    std::optional<PartialResult> partial = task.future.get();
                    if (partial)
                        partials.push_back(std::move(*partial));
                    else
                        incomplete = true;
                }
                catch (const std::exception &e)
                {
                    failures.push_back({task.partition_index, e.what()});
                }
                catch (...)
                {
                    failures.push_back({task.partition_index, "unknown exception"});
                }
            };

            if (config.verbose)
            {
                std::cout << "[SCHEDULER] " << graph.explain() << "\n";
                std::cout << "[SCHEDULER] concurrency " << config.concurrency
                          << ", max in flight " << config.effective_in_flight() << "\n";
            }

            try
            {
                // Declared after plan and monitor: its destructor joins every
                // worker before anything a task references goes away.
                ThreadPool pool(static_cast<size_t>(config.concurrency));
                monitor.begin_run(config.concurrency, pool.thread_count());

                const size_t max_in_flight = config.effective_in_flight();
                std::deque<InFlight> in_flight;

                while (true)
                {
                    if (cancelled())
                    {
                        incomplete = true;
                        break;
                    }

                    std::optional<Partition> partition = next_partition();
                    if (!partition)
                        break;

                    // Oldest first: the window slides in dispatch order
                    while (in_flight.size() >= max_in_flight)
                    {
                        collect(in_flight.front());
                        in_flight.pop_front();
                    }

                    const size_t index = partition->index();
                    auto future = pool.submit(
                        [&plan, &monitor, cancel, part = std::move(*partition)]() -> std::optional<PartialResult>
                        {
                            if (cancel && cancel->is_requested())
                            {
                                monitor.task_skipped(part.index());
                                return std::nullopt;
                            }

                            monitor.task_started(part.index(), ThreadPool::current_worker());
                            try
                            {
                                PartialResult result = PartitionExecutor::execute(plan, part);
                                monitor.task_finished(part.index(), part.size(), true);
                                return result;
                            }
                            catch (...)
                            {
                                monitor.task_finished(part.index(), part.size(), false);
                                throw;
                            }
                        });

                    in_flight.push_back({index, std::move(future)});
                }

                for (auto &task : in_flight)
                    collect(task);
                in_flight.clear();

                pool.wait_all();
            }
            catch (...)
            {
                // Source or pool failure outside any partition task
                monitor.end_run(false);
                throw;
            }

            if (!failures.empty())
            {
                monitor.end_run(false);
                if (config.verbose)
                    std::cerr << "[SCHEDULER ERROR] " << failures.size() << " partition(s) failed\n";
                throw PartitionFailure(std::move(failures));
            }

            if (incomplete)
            {
                monitor.end_run(false);
                throw ExecutionCancelled("run stopped after " + std::to_string(partials.size()) +
                                         " completed partition(s)");
            }

            try
            {
                FinalResult result = AggregationMerger::merge(plan, std::move(partials));
                monitor.end_run(true);

                ExecutionReport report = monitor.report();
                if (config.verbose)
                {
                    std::cout << "[SCHEDULER] " << report.partition_timings().size() << " partitions, "
                              << report.input_records() << " records -> " << result.size()
                              << " output rows in " << report.total_ms() << " ms\n";
                }
                return RunOutput{std::move(result), std::move(report)};
            }
            catch (...)
            {
                monitor.end_run(false);
                throw;
            }
        }
    } // namespace

    Scheduler::Scheduler(ExecutionConfig config)
        : config_(std::move(config))
    {
        config_.validate();
    }

    RunOutput Scheduler::run(const OperationGraph &graph,
                             std::vector<Partition> partitions,
                             ExecutionMonitor *monitor) const
    {
        check_contiguous(partitions);

        // Dispatch in index order; completion order is up to the workers
        std::sort(partitions.begin(), partitions.end(),
                  [](const Partition &a, const Partition &b)
                  { return a.index() < b.index(); });

        size_t next = 0;
        PartitionProducer producer = [&partitions, &next]() -> std::optional<Partition>
        {
            if (next >= partitions.size())
                return std::nullopt;
            return std::move(partitions[next++]);
        };

        return execute_run(config_, graph, producer, monitor);
    }

    RunOutput Scheduler::run(const OperationGraph &graph,
                             RecordSource &source,
                             ExecutionMonitor *monitor) const
    {
        if (*source.schema() != *graph.input_schema())
            throw SchemaError("source schema " + source.schema()->describe() +
                              " does not match graph input " + graph.input_schema()->describe());

        Partitioner partitioner(source, config_.target_partition_size);
        PartitionProducer producer = [&partitioner]()
        { return partitioner.next_partition(); };

        RunOutput out = execute_run(config_, graph, producer, monitor);

        if (config_.verbose)
        {
            std::cout << "[PARTITIONER] " << partitioner.records_consumed() << " records in "
                      << partitioner.partitions_emitted() << " partitions of at most "
                      << partitioner.target_partition_size() << "\n";
        }
        return out;
    }

    ComparisonReport compare_against_sequential(const OperationGraph &graph,
                                                const std::vector<Partition> &partitions,
                                                ExecutionConfig config)
    {
        ExecutionConfig sequential_config = config;
        sequential_config.concurrency = 1;

        RunOutput parallel = Scheduler(std::move(config)).run(graph, partitions);
        RunOutput sequential = Scheduler(std::move(sequential_config)).run(graph, partitions);

        double speedup = ExecutionMonitor::compare(parallel.report, sequential.report);
        bool identical = parallel.result == sequential.result;

        return ComparisonReport{std::move(parallel), std::move(sequential), speedup, identical};
    }

} // namespace PartitionFlow
