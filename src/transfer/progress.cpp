#include "atx/transfer/progress.hpp"

#include <algorithm>

namespace atx::transfer {

double ProgressSnapshot::fraction() const noexcept {
    if (total_bytes == 0) {
        return total_files > 0 && completed_files + failed_files < total_files ? 0.0 : 1.0;
    }
    return std::min(1.0, static_cast<double>(completed_bytes) / static_cast<double>(total_bytes));
}

double ProgressSnapshot::throughput() const noexcept {
    if (elapsed_seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(completed_bytes) / elapsed_seconds;
}

std::optional<double> ProgressSnapshot::eta_seconds() const noexcept {
    if (completed_bytes == 0) {
        return std::nullopt;
    }
    const double rate = throughput();
    if (rate <= 0.0) {
        return std::nullopt;
    }
    const std::uint64_t remaining = total_bytes > completed_bytes ? total_bytes - completed_bytes : 0;
    return static_cast<double>(remaining) / rate;
}

TransferProgress::TransferProgress(ProgressCallback callback)
    : callback_(std::move(callback)), started_at_(std::chrono::steady_clock::now()) {}

template<typename Fn>
void TransferProgress::update(Fn&& mutate) {
    {
        std::lock_guard lock(mutex_);
        mutate();
    }
    if (callback_) {
        std::lock_guard delivery(callback_mutex_);
        callback_(*this);
    }
}

FileProgress& TransferProgress::file_locked(const std::string& key) {
    return state_.files[key];
}

void TransferProgress::register_file(const std::string& key, std::uint64_t bytes_total, std::size_t parts_total) {
    update([&]() {
        auto [it, inserted] = state_.files.try_emplace(key);
        if (!inserted) {
            return;
        }
        it->second.bytes_total = bytes_total;
        it->second.parts_total = parts_total;
        ++state_.total_files;
        state_.total_bytes += bytes_total;
        state_.total_parts += parts_total;
    });
}

void TransferProgress::transfer_started() {
    update([&]() { ++state_.active_transfers; });
}

void TransferProgress::transfer_finished() {
    update([&]() {
        if (state_.active_transfers > 0) {
            --state_.active_transfers;
        }
    });
}

void TransferProgress::part_started(const std::string& key) {
    update([&]() {
        auto& file = file_locked(key);
        if (file.status == FileStatus::Pending) {
            file.status = FileStatus::InProgress;
        }
    });
}

void TransferProgress::part_completed(const std::string& key, std::uint64_t bytes) {
    update([&]() {
        auto& file = file_locked(key);
        file.bytes_completed += bytes;
        ++file.parts_completed;
        state_.completed_bytes += bytes;
        ++state_.completed_parts;
    });
}

void TransferProgress::part_failed(const std::string& key) {
    update([&]() {
        file_locked(key);
        ++state_.failed_parts;
    });
}

void TransferProgress::file_bytes(const std::string& key, std::uint64_t absolute_bytes) {
    update([&]() {
        auto& file = file_locked(key);
        if (file.status == FileStatus::Pending) {
            file.status = FileStatus::InProgress;
        }
        if (absolute_bytes <= file.bytes_completed) {
            return;
        }
        if (absolute_bytes > file.bytes_total) {
            state_.total_bytes += absolute_bytes - file.bytes_total;
            file.bytes_total = absolute_bytes;
        }
        state_.completed_bytes += absolute_bytes - file.bytes_completed;
        file.bytes_completed = absolute_bytes;
    });
}

void TransferProgress::file_completed(const std::string& key) {
    update([&]() {
        auto& file = file_locked(key);
        if (file.status == FileStatus::Completed || file.status == FileStatus::Failed) {
            return;
        }
        file.status = FileStatus::Completed;
        ++state_.completed_files;
    });
}

void TransferProgress::file_failed(const std::string& key, const std::string& error) {
    update([&]() {
        auto& file = file_locked(key);
        if (file.status == FileStatus::Completed || file.status == FileStatus::Failed) {
            return;
        }
        file.status = FileStatus::Failed;
        file.error = error;
        ++state_.failed_files;
    });
}

ProgressSnapshot TransferProgress::snapshot() const {
    std::lock_guard lock(mutex_);
    ProgressSnapshot copy = state_;
    copy.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
    return copy;
}

bool TransferProgress::settled() const {
    std::lock_guard lock(mutex_);
    return state_.completed_files + state_.failed_files >= state_.total_files;
}

ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval) : interval_(interval) {}

bool ProgressThrottle::should_render(bool force) {
    std::lock_guard lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (!force && last_render_ && now - *last_render_ < interval_) {
        return false;
    }
    last_render_ = now;
    return true;
}

} // namespace atx::transfer
