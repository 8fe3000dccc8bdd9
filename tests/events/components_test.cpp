#include "atx/events/components.hpp"

#include <gtest/gtest.h>

using namespace atx::events;
using atx::transfer::SequenceKind;

TEST(MetricsComponentTest, CountsUploadActivity) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(SequenceInitializedEvent{1, SequenceKind::Regular, "upl-1", 2, 3, 300});
    bus.emit(PartTransferredEvent{1, "a", 1, 100, 1, std::chrono::milliseconds(10)});
    bus.emit(PartTransferredEvent{1, "a", 2, 150, 2, std::chrono::milliseconds(10)});
    bus.emit(PartRetryEvent{1, "a", 2, 1, "HTTP 503", std::chrono::milliseconds(500)});
    bus.emit(PartFailedEvent{1, "b", 1, 4, "HTTP 500", true});
    bus.emit(SequenceFinalizedEvent{1, SequenceKind::Regular, "upl-1", 1, 1, false});
    bus.emit(SequenceFailedEvent{2, "finalize", "HTTP 500", 1});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.sequences_initialized.load(), 1u);
    EXPECT_EQ(stats.sequences_finalized.load(), 1u);
    EXPECT_EQ(stats.sequences_failed.load(), 1u);
    EXPECT_EQ(stats.parts_transferred.load(), 2u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 250u);
    EXPECT_EQ(stats.retries.load(), 1u);
    EXPECT_EQ(stats.parts_failed.load(), 1u);
    EXPECT_EQ(stats.files_uploaded.load(), 1u);
}

TEST(MetricsComponentTest, CountsDownloads) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(DownloadCompletedEvent{"a", "/tmp/a", 2048, 1, std::chrono::milliseconds(5)});
    bus.emit(DownloadFailedEvent{"b", "/tmp/b", 3, "HTTP 404"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_downloaded.load(), 1u);
    EXPECT_EQ(stats.bytes_downloaded.load(), 2048u);
    EXPECT_EQ(stats.downloads_failed.load(), 1u);
}

TEST(ComponentsTest, UnsubscribeOnDestruction) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        MetricsComponent metrics(bus);
        EXPECT_EQ(bus.subscriber_count<PartTransferredEvent>(), 2u);
        EXPECT_EQ(bus.subscriber_count<DownloadFailedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<PartTransferredEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<DownloadFailedEvent>(), 0u);
}

TEST(ComponentsTest, LoggerHandlesEveryEvent) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_NO_THROW((bus.emit(SequenceInitializedEvent{1, SequenceKind::Preview, "s", 1, 1, 1})));
    EXPECT_NO_THROW((bus.emit(PartFailedEvent{1, "a", 1, 4, "x", false})));
    EXPECT_NO_THROW((bus.emit(SequenceFinalizedEvent{1, SequenceKind::Regular, "s", 1, 0, true})));
    EXPECT_NO_THROW((bus.emit(DownloadCompletedEvent{"a", "/tmp/a", 1, 1, std::chrono::milliseconds(1)})));
}
