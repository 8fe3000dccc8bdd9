#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace atx::concurrency {

/**
 * @brief Counting semaphore bounding the number of in-flight transfers
 *
 * One instance is shared by every part (upload) or file (download) task of a
 * run, so units from different sequences draw from the same pool of slots.
 */
class CountingSemaphore {
public:
    explicit CountingSemaphore(std::size_t slots);

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void acquire();
    void release();

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t in_use() const;
    /// Highest simultaneous in_use() observed since construction
    [[nodiscard]] std::size_t peak_in_use() const;

private:
    const std::size_t capacity_;
    std::size_t available_;
    std::size_t peak_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

/// Holds one semaphore slot for its lifetime.
class SemaphoreGuard {
public:
    explicit SemaphoreGuard(CountingSemaphore& semaphore) : semaphore_(semaphore) {
        semaphore_.acquire();
    }
    ~SemaphoreGuard() { semaphore_.release(); }

    SemaphoreGuard(const SemaphoreGuard&) = delete;
    SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;

private:
    CountingSemaphore& semaphore_;
};

/**
 * @brief Counts outstanding tasks and lets one thread wait for all of them
 */
class WaitGroup {
public:
    void add(std::size_t count = 1);
    void done();
    void wait();

    [[nodiscard]] std::size_t pending() const;

private:
    std::size_t pending_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace atx::concurrency
