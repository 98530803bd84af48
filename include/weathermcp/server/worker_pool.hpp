#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace weathermcp::server
{

/// Fixed set of worker threads fed from a bounded queue.
///
/// try_submit() refuses work once `queue_capacity` jobs are waiting, so the
/// amount of pending work held in memory never grows without bound.
class WorkerPool
{
  public:
    WorkerPool(size_t threads, size_t queue_capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// False when the queue is full or the pool is shutting down.
    bool try_submit(std::function<void()> job);

    size_t thread_count() const
    {
        return workers_.size();
    }
    size_t queued() const;
    size_t busy() const;

  private:
    void worker_loop();

    size_t queue_capacity_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t busy_{0};
    bool stop_requested_{false};
};

} // namespace weathermcp::server
