// src/worker_pool.cpp
// Implementation of the shared push worker pool

#include "sqltelemetry/worker_pool.hpp"
#include "sqltelemetry/errors.hpp"
#include "sqltelemetry/logging.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace sqltelemetry {

class WorkerPool::Impl {
public:
    Impl(size_t thread_count, size_t max_pending_tasks)
        : max_pending_tasks_(max_pending_tasks), thread_count_(thread_count),
          running_(true), completed_(0) {
        if (thread_count == 0) {
            throw Errors::invalid_thread_pool_size(thread_count);
        }

        workers_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            workers_.emplace_back([this]() {
                worker_loop();
            });
        }
    }

    ~Impl() {
        shutdown();
    }

    void submit(Task task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                throw Errors::task_rejected("worker pool is shut down");
            }
            if (tasks_.size() >= max_pending_tasks_) {
                throw Errors::task_rejected("worker pool queue is full");
            }
            tasks_.push_back(std::move(task));
        }
        condition_.notify_one();
    }

    void shutdown() {
        std::lock_guard<std::mutex> shutdown_lock(shutdown_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_ && workers_.empty()) return;
            running_ = false;
        }

        condition_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
                worker.join();
            } else if (worker.joinable()) {
                worker.detach();
            }
        }
        workers_.clear();
    }

    bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    size_t thread_count() const {
        return thread_count_;
    }

    size_t pending_tasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    size_t completed_tasks() const {
        return completed_.load();
    }

private:
    void worker_loop() {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                condition_.wait(lock, [this]() {
                    return !running_ || !tasks_.empty();
                });

                // Drain remaining work before exiting
                if (tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop_front();
            }

            try {
                task();
            } catch (const std::exception& e) {
                Log::error("WorkerPool", std::string("Task failed: ") + e.what());
            } catch (...) {
                Log::error("WorkerPool", "Task failed with an unknown exception");
            }
            completed_++;
        }
    }

    size_t max_pending_tasks_;
    size_t thread_count_;

    std::mutex shutdown_mutex_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Task> tasks_;
    std::vector<std::thread> workers_;
    bool running_;
    std::atomic<size_t> completed_;
};

WorkerPool::WorkerPool(size_t thread_count, size_t max_pending_tasks)
    : pimpl_(std::make_unique<Impl>(thread_count, max_pending_tasks)) {}

WorkerPool::~WorkerPool() = default;

void WorkerPool::submit(Task task) { pimpl_->submit(std::move(task)); }
void WorkerPool::shutdown() { pimpl_->shutdown(); }
bool WorkerPool::is_running() const { return pimpl_->is_running(); }
size_t WorkerPool::thread_count() const { return pimpl_->thread_count(); }
size_t WorkerPool::pending_tasks() const { return pimpl_->pending_tasks(); }
size_t WorkerPool::completed_tasks() const { return pimpl_->completed_tasks(); }

} // namespace sqltelemetry
