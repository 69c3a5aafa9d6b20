#include "harvest/events/components.hpp"
#include "harvest/events/event_bus.hpp"
#include "harvest/events/events.hpp"

#include <gtest/gtest.h>

using harvest::events::ArchiveFailedEvent;
using harvest::events::ArchiveSealedEvent;
using harvest::events::EventBus;
using harvest::events::ItemProcessedEvent;
using harvest::events::MetricsComponent;
using harvest::events::SessionAcquiredEvent;
using harvest::events::SessionExpiredEvent;
using harvest::events::group_digits;
using harvest::fetch::ItemOutcome;

TEST(MetricsComponentTest, TracksOutcomeArchiveAndSessionCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    ItemProcessedEvent downloaded;
    downloaded.outcome = ItemOutcome::Downloaded;
    downloaded.bytes = 1024;
    bus.emit(downloaded);
    downloaded.bytes = 2048;
    bus.emit(downloaded);

    ItemProcessedEvent other;
    for (auto outcome : {ItemOutcome::Skipped, ItemOutcome::NotFound, ItemOutcome::ContentMismatch,
                         ItemOutcome::AuthRejected, ItemOutcome::HttpError,
                         ItemOutcome::TransportError, ItemOutcome::WriteFailed}) {
        other.outcome = outcome;
        bus.emit(other);
    }

    bus.emit(ArchiveSealedEvent{1, "batch_0001.zip", 2, 4096, 0});
    bus.emit(ArchiveFailedEvent{2, "batch_0002.zip", 3, "disk full"});
    bus.emit(SessionAcquiredEvent{1, 3});
    bus.emit(SessionExpiredEvent{1, 7, "gate page", 1, 5});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.items_downloaded.load(), 2u);
    EXPECT_EQ(stats.bytes_downloaded.load(), 3072u);
    EXPECT_EQ(stats.items_skipped.load(), 1u);
    EXPECT_EQ(stats.items_not_found.load(), 1u);
    EXPECT_EQ(stats.items_mismatched.load(), 1u);
    EXPECT_EQ(stats.items_auth_rejected.load(), 1u);
    EXPECT_EQ(stats.items_http_error.load(), 1u);
    EXPECT_EQ(stats.items_transport_error.load(), 1u);
    EXPECT_EQ(stats.items_write_failed.load(), 1u);
    EXPECT_EQ(stats.archives_sealed.load(), 1u);
    EXPECT_EQ(stats.bytes_archived.load(), 4096u);
    EXPECT_EQ(stats.archives_failed.load(), 1u);
    EXPECT_EQ(stats.sessions_acquired.load(), 1u);
    EXPECT_EQ(stats.sessions_expired.load(), 1u);
}

TEST(GroupDigitsTest, InsertsThousandsSeparators) {
    EXPECT_EQ(group_digits(0), "0");
    EXPECT_EQ(group_digits(999), "999");
    EXPECT_EQ(group_digits(1000), "1,000");
    EXPECT_EQ(group_digits(25000), "25,000");
    EXPECT_EQ(group_digits(1234567), "1,234,567");
}
