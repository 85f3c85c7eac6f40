#pragma once

// ============================================================================
// ThreadPool — Fixed set of worker threads fed from one task queue
// ============================================================================
//
//   Scheduler (caller thread)               Workers (N, created once)
//   ─────────────────────────               ─────────────────────────
//   submit(partition 0) ──┐                 slot 0: waiting on task_cv_
//   submit(partition 1) ──┼──► task_queue_ ─► slot 1: waiting on task_cv_
//   submit(partition 2) ──┘                 slot 2: waiting on task_cv_
//            │
//   future<PartialResult> per task  ◄────── result or exception stored by
//            │                              std::packaged_task
//   wait_all() ◄─────────────────────────── done_cv_ when queue empty and
//                                           no task running
//
// The queue and the running-task counter are the ONLY shared mutable state,
// and both live under queue_mutex_. Tasks run outside the lock. Whatever a
// task throws is captured in its future, never lost on the worker thread.
//
// Idle workers take the next queued task: first available, first served.
// ============================================================================

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace PartitionFlow
{

    class ThreadPool
    {
    public:
        // Throws std::invalid_argument for zero threads
        explicit ThreadPool(size_t num_threads)
        {
            if (num_threads == 0)
                throw std::invalid_argument("[ThreadPool] needs at least one worker");

            workers_.reserve(num_threads);
            for (size_t slot = 0; slot < num_threads; ++slot)
                workers_.emplace_back(&ThreadPool::worker_loop, this, slot);
        }

        // Drains the queue, then joins every worker
        ~ThreadPool()
        {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                shutdown_ = true;
            }
            task_cv_.notify_all();

            for (auto &worker : workers_)
            {
                if (worker.joinable())
                    worker.join();
            }
        }

        ThreadPool(const ThreadPool &) = delete;
        ThreadPool &operator=(const ThreadPool &) = delete;
        ThreadPool(ThreadPool &&) = delete;
        ThreadPool &operator=(ThreadPool &&) = delete;

        // ====================================================================
        // submit() — queue a callable, get a future for its result
        // ====================================================================
        // packaged_task is move-only but std::function must be copyable,
        // hence the shared_ptr wrapper captured by the queued lambda.
        // ====================================================================
        template <typename F>
        auto submit(F &&f) -> std::future<std::invoke_result_t<F>>
        {
            using ReturnType = std::invoke_result_t<F>;

            auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
            std::future<ReturnType> future = task->get_future();

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);

                if (shutdown_)
                    throw std::runtime_error("[ThreadPool] Cannot submit to a shut-down pool");

                task_queue_.push([task]()
                                 { (*task)(); });
                ++active_tasks_;
            }

            task_cv_.notify_one();
            return future;
        }

        // Blocks until every submitted task has finished (or thrown)
        void wait_all()
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            done_cv_.wait(lock, [this]
                          { return task_queue_.empty() && active_tasks_ == 0; });
        }

        size_t thread_count() const { return workers_.size(); }

        // Tasks queued or running
        size_t pending() const
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            return active_tasks_;
        }

        // Slot number of the calling worker thread; nullopt off the pool
        static std::optional<size_t> current_worker()
        {
            return current_slot_;
        }

    private:
        void worker_loop(size_t slot)
        {
            current_slot_ = slot;

            while (true)
            {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    task_cv_.wait(lock, [this]
                                  { return shutdown_ || !task_queue_.empty(); });

                    // Queued work is still executed during shutdown
                    if (shutdown_ && task_queue_.empty())
                        return;

                    task = std::move(task_queue_.front());
                    task_queue_.pop();
                }

                task();

                // Drop the task (and everything it captured) before signalling
                // completion, so wait_all() never returns while a partition
                // is still referenced by a finished task.
                task = nullptr;

                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    --active_tasks_;
                }
                done_cv_.notify_all();
            }
        }

        std::vector<std::thread> workers_;

        std::queue<std::function<void()>> task_queue_;
        mutable std::mutex queue_mutex_;
        std::condition_variable task_cv_;
        std::condition_variable done_cv_;

        size_t active_tasks_ = 0; // queued + running, under queue_mutex_
        bool shutdown_ = false;   // under queue_mutex_

        static inline thread_local std::optional<size_t> current_slot_;
    };

} // namespace PartitionFlow
