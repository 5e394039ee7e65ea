#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include "Configuration.hpp"

// Fixed pool of threads evaluating configurations
// Results come back through futures, so callers decide the output order
class SweepWorkerPool {
public:
    explicit SweepWorkerPool(size_t num_threads);

    ~SweepWorkerPool();

    SweepWorkerPool(const SweepWorkerPool&) = delete;
    SweepWorkerPool& operator=(const SweepWorkerPool&) = delete;

    // Queue a configuration evaluation
    std::future<MetricRow> submit(std::function<MetricRow()> job);

    // Get pool statistics
    struct Stats {
        size_t active_workers = 0;
        size_t queue_size = 0;
        size_t completed_tasks = 0;
        size_t failed_tasks = 0;
    };
    Stats get_stats() const;

    size_t num_workers() const { return workers_.size(); }

private:
    struct Task {
        std::function<MetricRow()> job;
        std::promise<MetricRow> result;
    };

    void worker_thread();
    void run_task(Task& task);

    std::vector<std::thread> workers_;
    std::queue<Task> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> shutdown_{false};

    mutable std::mutex stats_mutex_;
    Stats stats_{};
};
