#include "SweepWorkerPool.hpp"
#include <iostream>
#include <sstream>
#include <utility>

SweepWorkerPool::SweepWorkerPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&SweepWorkerPool::worker_thread, this);
    }

    stats_.active_workers = num_threads;
}

// Drains the queue before joining
SweepWorkerPool::~SweepWorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_ = true;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<MetricRow> SweepWorkerPool::submit(std::function<MetricRow()> job) {
    Task task;
    task.job = std::move(job);

    auto future = task.result.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));

        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.queue_size = task_queue_.size();
    }

    queue_cv_.notify_one();

    return future;
}

SweepWorkerPool::Stats SweepWorkerPool::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void SweepWorkerPool::worker_thread() {
    while (true) {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        queue_cv_.wait(lock, [this]() {
            return shutdown_ || !task_queue_.empty();
        });

        if (shutdown_ && task_queue_.empty()) break;

        Task task = std::move(task_queue_.front());
        task_queue_.pop();

        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.queue_size = task_queue_.size();
        }

        lock.unlock();

        run_task(task);
    }
}

void SweepWorkerPool::run_task(Task& task) {
    try {
        MetricRow row = task.job();

        // Count before publishing so a caller holding every future sees final stats
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.completed_tasks++;
        }

        task.result.set_value(std::move(row));
    } catch (const std::exception& e) {
        std::ostringstream line;
        line << "[SweepWorkerPool] Task failed: " << e.what() << "\n";
        std::cerr << line.str();

        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.failed_tasks++;
        }

        task.result.set_exception(std::current_exception());
    }
}
