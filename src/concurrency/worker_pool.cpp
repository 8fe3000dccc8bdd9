#include "atx/concurrency/worker_pool.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace atx::concurrency {

WorkerPool::WorkerPool(std::size_t threads)
    : threads_(std::max<std::size_t>(threads, 1)), pool_(threads_) {}

WorkerPool::~WorkerPool() {
    join();
}

void WorkerPool::submit(std::function<void()> task) {
    asio::post(pool_, [task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[WorkerPool] task failed with exception: {}", e.what());
        }
    });
}

void WorkerPool::join() {
    if (joined_) {
        return;
    }
    pool_.join();
    joined_ = true;
}

} // namespace atx::concurrency
