#pragma once

#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <functional>

namespace atx::concurrency {

namespace asio = boost::asio;

/**
 * @brief Fixed-size pool executing transfer tasks
 *
 * Wraps asio::thread_pool. Tasks run in submission order as threads free up.
 * An exception escaping a task is logged and swallowed at the task boundary
 * so one bad unit cannot take a worker thread down.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);

    /// Blocks until every submitted task has finished; no submissions afterwards.
    void join();

    [[nodiscard]] std::size_t size() const noexcept { return threads_; }

private:
    std::size_t threads_;
    asio::thread_pool pool_;
    bool joined_ = false;
};

} // namespace atx::concurrency
