#include "atx/concurrency/semaphore.hpp"

#include <algorithm>

namespace atx::concurrency {

CountingSemaphore::CountingSemaphore(std::size_t slots)
    : capacity_(std::max<std::size_t>(slots, 1)), available_(capacity_) {}

void CountingSemaphore::acquire() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]() { return available_ > 0; });
    --available_;
    peak_ = std::max(peak_, capacity_ - available_);
}

void CountingSemaphore::release() {
    {
        std::unique_lock lock(mutex_);
        if (available_ < capacity_) {
            ++available_;
        }
    }
    cv_.notify_one();
}

std::size_t CountingSemaphore::in_use() const {
    std::unique_lock lock(mutex_);
    return capacity_ - available_;
}

std::size_t CountingSemaphore::peak_in_use() const {
    std::unique_lock lock(mutex_);
    return peak_;
}

void WaitGroup::add(std::size_t count) {
    std::unique_lock lock(mutex_);
    pending_ += count;
}

void WaitGroup::done() {
    bool finished = false;
    {
        std::unique_lock lock(mutex_);
        if (pending_ > 0) {
            --pending_;
        }
        finished = pending_ == 0;
    }
    if (finished) {
        cv_.notify_all();
    }
}

void WaitGroup::wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]() { return pending_ == 0; });
}

std::size_t WaitGroup::pending() const {
    std::unique_lock lock(mutex_);
    return pending_;
}

} // namespace atx::concurrency
