#include "weathermcp/server/worker_pool.hpp"

#include "weathermcp/logging.hpp"

#include <exception>

namespace weathermcp::server
{

WorkerPool::WorkerPool(size_t threads, size_t queue_capacity) : queue_capacity_(queue_capacity)
{
    if (threads == 0)
        threads = 1;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i)
        workers_.emplace_back([this]() { worker_loop(); });
}

WorkerPool::~WorkerPool()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_)
        if (w.joinable())
            w.join();
}

bool WorkerPool::try_submit(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_ || queue_.size() >= queue_capacity_)
            return false;
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

size_t WorkerPool::queued() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t WorkerPool::busy() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

void WorkerPool::worker_loop()
{
    while (true)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return stop_requested_ || !queue_.empty(); });
            if (stop_requested_ && queue_.empty())
                break;
            job = std::move(queue_.front());
            queue_.pop_front();
            ++busy_;
        }

        try
        {
            job();
        }
        catch (const std::exception& e)
        {
            // Jobs report their own failures; reaching here is a bug in the job.
            logging::error(std::string("worker job escaped with exception: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --busy_;
        }
    }
}

} // namespace weathermcp::server
