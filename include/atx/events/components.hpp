/**
 * @file components.hpp
 * @brief Subscribers that turn transfer events into log lines and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // run an orchestrator against bus, then metrics.print_stats()
 */

#pragma once

#include "atx/events/event_bus.hpp"
#include "atx/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace atx::events {

/**
 * @brief Logs every transfer event through spdlog
 *
 * Per-part success is logged at debug so large uploads stay readable at info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        track<SequenceInitializedEvent>([](const SequenceInitializedEvent& e) {
            spdlog::info("[SequenceInitialized] sequence={} kind={} session={} files={} parts={} bytes={}",
                         e.sequence_id, kind_name(e.kind), e.session_id, e.files, e.parts, e.bytes);
        });
        track<SequenceFailedEvent>([](const SequenceFailedEvent& e) {
            spdlog::error("[SequenceFailed] sequence={} stage={} files={} error={}",
                          e.sequence_id, e.stage, e.files_affected, e.error);
        });
        track<PartTransferredEvent>([](const PartTransferredEvent& e) {
            spdlog::debug("[PartTransferred] sequence={} key={} part={} bytes={} attempts={} duration={}ms",
                          e.sequence_id, e.file_key, e.part_number, e.bytes, e.attempts, e.duration.count());
        });
        track<PartRetryEvent>([](const PartRetryEvent& e) {
            spdlog::warn("[PartRetry] sequence={} key={} part={} attempt={} retry_in={}ms error={}",
                         e.sequence_id, e.file_key, e.part_number, e.attempt, e.delay.count(), e.error);
        });
        track<PartFailedEvent>([](const PartFailedEvent& e) {
            if (e.skipped) {
                spdlog::warn("[PartSkipped] sequence={} key={} part={} attempts={} error={}",
                             e.sequence_id, e.file_key, e.part_number, e.attempts, e.error);
            } else {
                spdlog::error("[PartFailed] sequence={} key={} part={} attempts={} error={}",
                              e.sequence_id, e.file_key, e.part_number, e.attempts, e.error);
            }
        });
        track<SequenceFinalizedEvent>([](const SequenceFinalizedEvent& e) {
            spdlog::info("[SequenceFinalized] sequence={} kind={} session={} succeeded={} failed={}{}",
                         e.sequence_id, kind_name(e.kind), e.session_id, e.successful_files, e.failed_files,
                         e.asynchronous ? " async=true" : "");
        });
        track<DownloadCompletedEvent>([](const DownloadCompletedEvent& e) {
            spdlog::info("[DownloadCompleted] key={} path={} bytes={} attempts={} duration={}ms",
                         e.key, e.local_path.string(), e.bytes, e.attempts, e.duration.count());
        });
        track<DownloadFailedEvent>([](const DownloadFailedEvent& e) {
            spdlog::error("[DownloadFailed] key={} path={} attempts={} error={}",
                          e.key, e.local_path.string(), e.attempts, e.error);
        });
    }

    ~LoggerComponent() {
        for (auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    static const char* kind_name(transfer::SequenceKind kind) {
        return kind == transfer::SequenceKind::Preview ? "preview" : "regular";
    }

    template<typename EventType>
    void track(std::function<void(const EventType&)> handler) {
        const size_t id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Counts transfer activity
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("parts: {}", stats.parts_transferred.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sequences_initialized{0};
        std::atomic<uint64_t> sequences_failed{0};
        std::atomic<uint64_t> sequences_finalized{0};
        std::atomic<uint64_t> parts_transferred{0};
        std::atomic<uint64_t> parts_failed{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> retries{0};
        std::atomic<uint64_t> files_uploaded{0};
        std::atomic<uint64_t> files_downloaded{0};
        std::atomic<uint64_t> bytes_downloaded{0};
        std::atomic<uint64_t> downloads_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        track<SequenceInitializedEvent>([this](const SequenceInitializedEvent&) {
            stats_.sequences_initialized++;
        });
        track<SequenceFailedEvent>([this](const SequenceFailedEvent&) {
            stats_.sequences_failed++;
        });
        track<SequenceFinalizedEvent>([this](const SequenceFinalizedEvent& e) {
            stats_.sequences_finalized++;
            stats_.files_uploaded += e.successful_files;
        });
        track<PartTransferredEvent>([this](const PartTransferredEvent& e) {
            stats_.parts_transferred++;
            stats_.bytes_uploaded += e.bytes;
        });
        track<PartFailedEvent>([this](const PartFailedEvent&) {
            stats_.parts_failed++;
        });
        track<PartRetryEvent>([this](const PartRetryEvent&) {
            stats_.retries++;
        });
        track<DownloadCompletedEvent>([this](const DownloadCompletedEvent& e) {
            stats_.files_downloaded++;
            stats_.bytes_downloaded += e.bytes;
        });
        track<DownloadFailedEvent>([this](const DownloadFailedEvent&) {
            stats_.downloads_failed++;
        });
    }

    ~MetricsComponent() {
        for (auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Transfer statistics:");
        spdlog::info("  Sequences initialized: {}", stats_.sequences_initialized.load());
        spdlog::info("  Sequences finalized:   {}", stats_.sequences_finalized.load());
        spdlog::info("  Sequences failed:      {}", stats_.sequences_failed.load());
        spdlog::info("  Parts transferred:     {}", stats_.parts_transferred.load());
        spdlog::info("  Parts failed:          {}", stats_.parts_failed.load());
        spdlog::info("  Retries:               {}", stats_.retries.load());
        spdlog::info("  Bytes uploaded:        {}", stats_.bytes_uploaded.load());
        spdlog::info("  Files uploaded:        {}", stats_.files_uploaded.load());
        spdlog::info("  Files downloaded:      {}", stats_.files_downloaded.load());
        spdlog::info("  Bytes downloaded:      {}", stats_.bytes_downloaded.load());
        spdlog::info("  Downloads failed:      {}", stats_.downloads_failed.load());
    }

private:
    template<typename EventType>
    void track(std::function<void(const EventType&)> handler) {
        const size_t id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    Stats stats_;
    std::vector<std::function<void()>> unsubscribers_;
};

} // namespace atx::events
