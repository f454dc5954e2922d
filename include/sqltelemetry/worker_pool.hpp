// include/sqltelemetry/worker_pool.hpp
// Purpose: Fixed-size worker pool shared by every telemetry client of a registry

#pragma once

#include <cstddef>
#include <functional>
#include <memory>

namespace sqltelemetry {

class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t thread_count = 10, size_t max_pending_tasks = 1000);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queues a task for execution. Throws ClientError(TASK_REJECTED) when the pool
    // is shut down or the pending queue is full.
    void submit(Task task);

    // Stops accepting work, drains queued tasks and joins the workers. Idempotent.
    void shutdown();

    bool is_running() const;
    size_t thread_count() const;
    size_t pending_tasks() const;
    size_t completed_tasks() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace sqltelemetry
