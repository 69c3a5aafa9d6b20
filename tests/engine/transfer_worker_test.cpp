#include "harvest/engine/transfer_worker.hpp"
#include "harvest/events/events.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

using harvest::CancellationToken;
using harvest::ErrorCode;
using harvest::TransferPolicy;
using harvest::archive::ArchiveBatcher;
using harvest::archive::PendingArchiveSet;
using harvest::engine::AttemptResult;
using harvest::engine::AttemptStatus;
using harvest::engine::TransferWorker;
using harvest::events::EventBus;
using harvest::events::ItemProcessedEvent;
using harvest::events::ProgressReportEvent;
using harvest::fetch::ItemOutcome;
using harvest::fetch::TransferProgress;
using harvest::fetch::WorkItem;
namespace support = harvest::test_support;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

class TransferWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = support::create_temp_dir("worker");
        policy_.inter_item_delay = 0ms;
        session_.cookies.push_back(support::kSessionCookie);
        session_.valid = true;
        session_.generation = 1;
        bus_.subscribe<ItemProcessedEvent>([this](const ItemProcessedEvent& e) { outcomes_.push_back(e.outcome); });
    }

    void make_queue(std::size_t count) {
        for (std::size_t i = 0; i < count; ++i) {
            queue_.push_back(WorkItem{name(i), url(i)});
        }
    }

    static std::string name(std::size_t i) { return "doc_" + std::to_string(i) + ".pdf"; }
    static std::string url(std::size_t i) { return "https://example.test/files/" + name(i); }

    AttemptResult run() {
        batcher_ = std::make_unique<ArchiveBatcher>(dir_ / "zipped", "batch_", writer_, bus_);
        EXPECT_TRUE(batcher_->initialize().is_ok());
        TransferWorker worker(queue_, dir_, policy_, client_, *batcher_, bus_);
        return worker.run_attempt(session_, progress_, pending_, cancel_,
                                  [this](const TransferProgress& p) { checkpoints_.push_back(p.last_processed_index); });
    }

    fs::path dir_;
    TransferPolicy policy_;
    harvest::session::SessionState session_;
    std::vector<WorkItem> queue_;
    support::FakeHttpClient client_;
    support::RecordingArchiveWriter writer_;
    EventBus bus_;
    std::unique_ptr<ArchiveBatcher> batcher_;
    TransferProgress progress_;
    PendingArchiveSet pending_;
    CancellationToken cancel_;
    std::vector<std::size_t> checkpoints_;
    std::vector<ItemOutcome> outcomes_;
};

TEST_F(TransferWorkerTest, DownloadsEveryPayload) {
    make_queue(3);
    for (std::size_t i = 0; i < 3; ++i) {
        client_.respond(url(i), 200, support::pdf_content(name(i)));
    }

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::Completed);
    EXPECT_EQ(result.items_settled, 3u);
    EXPECT_EQ(result.items_downloaded, 3u);
    EXPECT_EQ(progress_.last_processed_index, 3u);
    EXPECT_EQ(progress_.success_count, 3u);
    EXPECT_EQ(progress_.error_count, 0u);
    ASSERT_EQ(pending_.size(), 3u);
    EXPECT_EQ(support::read_file(dir_ / name(1)), support::pdf_content(name(1)));
    EXPECT_FALSE(fs::exists(dir_ / (name(1) + ".part")));
    EXPECT_EQ(client_.cookie_counts, (std::vector<std::size_t>{1, 1, 1}));
}

TEST_F(TransferWorkerTest, MixedAttemptStopsOnVerificationPage) {
    make_queue(5);
    client_.respond(url(0), 200, support::pdf_content("one"));
    client_.respond(url(1), 404, "missing");
    client_.respond(url(2), 200, support::pdf_content("three"));
    client_.respond(url(3), 200, support::kGatePage);
    client_.respond(url(4), 200, support::pdf_content("five"));

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::SessionExpired);
    EXPECT_FALSE(result.expiry_reason.empty());
    EXPECT_EQ(progress_.success_count, 2u);
    EXPECT_EQ(progress_.error_count, 2u);
    EXPECT_EQ(progress_.last_processed_index, 3u);
    EXPECT_EQ(client_.requests.size(), 4u);
    EXPECT_FALSE(fs::exists(dir_ / name(3)));
    EXPECT_EQ(outcomes_.back(), ItemOutcome::ContentMismatch);
}

TEST_F(TransferWorkerTest, NineMismatchesStayBelowThreshold) {
    make_queue(10);
    for (std::size_t i = 0; i < 9; ++i) {
        client_.respond(url(i), 200, support::html_content());
    }
    client_.respond(url(9), 200, support::pdf_content("last"));

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::Completed);
    EXPECT_EQ(progress_.error_count, 9u);
    EXPECT_EQ(progress_.success_count, 1u);
    EXPECT_EQ(progress_.last_processed_index, 10u);
}

TEST_F(TransferWorkerTest, TenthMismatchExpiresSession) {
    make_queue(12);
    for (std::size_t i = 0; i < 12; ++i) {
        client_.respond(url(i), 200, support::html_content());
    }

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::SessionExpired);
    EXPECT_EQ(progress_.error_count, 10u);
    EXPECT_EQ(progress_.last_processed_index, 9u);
    EXPECT_EQ(result.items_settled, 9u);
    EXPECT_EQ(result.items_downloaded, 0u);
}

TEST_F(TransferWorkerTest, NotFoundNeitherCountsNorBreaksStreak) {
    policy_.error_streak_threshold = 3;
    make_queue(5);
    client_.respond(url(0), 200, support::html_content());
    client_.respond(url(1), 404, "missing");
    client_.respond(url(2), 200, support::html_content());
    client_.respond(url(3), 200, support::html_content());

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::SessionExpired);
    EXPECT_EQ(progress_.last_processed_index, 3u);
    EXPECT_EQ(progress_.error_count, 4u);
}

TEST_F(TransferWorkerTest, FiftyMissingItemsNeverExpireSession) {
    make_queue(50);
    for (std::size_t i = 0; i < 50; ++i) {
        client_.respond(url(i), 404, "missing");
    }

    const auto result = run();

    EXPECT_EQ(policy_.error_streak_threshold, 10u);
    EXPECT_EQ(result.status, AttemptStatus::Completed);
    EXPECT_TRUE(result.expiry_reason.empty());
    EXPECT_EQ(progress_.error_count, 50u);
    EXPECT_EQ(progress_.success_count, 0u);
    EXPECT_EQ(progress_.last_processed_index, 50u);
    EXPECT_EQ(result.items_settled, 50u);
    EXPECT_EQ(result.items_downloaded, 0u);
    EXPECT_EQ(std::count(outcomes_.begin(), outcomes_.end(), ItemOutcome::NotFound), 50);
}

TEST_F(TransferWorkerTest, ZeroCheckpointIntervalNeverCheckpoints) {
    policy_.checkpoint_interval = 0;
    make_queue(3);
    for (std::size_t i = 0; i < 3; ++i) {
        client_.respond(url(i), 200, support::pdf_content(name(i)));
    }

    EXPECT_EQ(run().status, AttemptStatus::Completed);
    EXPECT_TRUE(checkpoints_.empty());
}

TEST_F(TransferWorkerTest, PayloadResetsStreak) {
    policy_.error_streak_threshold = 2;
    make_queue(4);
    client_.respond(url(0), 200, support::html_content());
    client_.respond(url(1), 200, support::pdf_content("b"));
    client_.respond(url(2), 200, support::html_content());
    client_.respond(url(3), 200, support::pdf_content("d"));

    EXPECT_EQ(run().status, AttemptStatus::Completed);
    EXPECT_EQ(progress_.error_count, 2u);
}

TEST_F(TransferWorkerTest, AuthRejectionExpiresSession) {
    make_queue(3);
    client_.respond(url(0), 200, support::pdf_content("a"));
    client_.respond(url(1), 403, "forbidden");

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::SessionExpired);
    EXPECT_EQ(progress_.last_processed_index, 1u);
    EXPECT_EQ(progress_.error_count, 1u);
    EXPECT_EQ(outcomes_.back(), ItemOutcome::AuthRejected);
}

TEST_F(TransferWorkerTest, ServerAndTransportErrorsAreCountedAndSkipped) {
    policy_.error_streak_threshold = 1;
    make_queue(3);
    client_.respond(url(0), 500, "oops");
    client_.fail(url(1), ErrorCode::Timeout, "timed out");
    client_.respond(url(2), 200, support::pdf_content("c"));

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::Completed);
    EXPECT_EQ(progress_.error_count, 2u);
    EXPECT_EQ(progress_.success_count, 1u);
    EXPECT_EQ(outcomes_, (std::vector<ItemOutcome>{ItemOutcome::HttpError, ItemOutcome::TransportError,
                                                   ItemOutcome::Downloaded}));
}

TEST_F(TransferWorkerTest, ValidFileOnDiskIsSkipped) {
    make_queue(2);
    support::write_file(dir_ / name(0), support::pdf_content("already here"));
    support::write_file(dir_ / name(1), support::html_content());
    client_.respond(url(1), 200, support::pdf_content("fresh"));

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::Completed);
    EXPECT_EQ(client_.requests, (std::vector<std::string>{url(1)}));
    EXPECT_EQ(progress_.success_count, 1u);
    EXPECT_EQ(progress_.error_count, 0u);
    EXPECT_EQ(progress_.last_processed_index, 2u);
    EXPECT_EQ(support::read_file(dir_ / name(1)), support::pdf_content("fresh"));
    EXPECT_EQ(outcomes_.front(), ItemOutcome::Skipped);
}

TEST_F(TransferWorkerTest, ResumesFromCursor) {
    make_queue(4);
    for (std::size_t i = 0; i < 4; ++i) {
        client_.respond(url(i), 200, support::pdf_content(name(i)));
    }
    progress_.last_processed_index = 3;
    progress_.success_count = 7;

    EXPECT_EQ(run().status, AttemptStatus::Completed);
    EXPECT_EQ(client_.requests, (std::vector<std::string>{url(3)}));
    EXPECT_EQ(progress_.success_count, 8u);
}

TEST_F(TransferWorkerTest, SealsOnceBatchThresholdIsReached) {
    policy_.batch_threshold = 2;
    make_queue(3);
    fs::create_directories(dir_ / "zipped");
    support::write_file(dir_ / "zipped" / "batch_0004.zip", "earlier run");
    for (std::size_t i = 0; i < 3; ++i) {
        client_.respond(url(i), 200, support::pdf_content(name(i)));
    }

    std::size_t archives_before_third = 0;
    client_.on_request = [&](const std::string& requested) {
        if (requested == url(2)) {
            archives_before_third = writer_.written.size();
        }
    };

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::Completed);
    EXPECT_EQ(archives_before_third, 1u);
    ASSERT_EQ(writer_.written.size(), 1u);
    EXPECT_EQ(writer_.written[0].filename(), "batch_0005.zip");
    EXPECT_FALSE(fs::exists(dir_ / name(0)));
    EXPECT_FALSE(fs::exists(dir_ / name(1)));
    ASSERT_EQ(pending_.size(), 1u);
    EXPECT_EQ(pending_[0].filename(), name(2));
    EXPECT_EQ(checkpoints_, (std::vector<std::size_t>{2}));
}

TEST_F(TransferWorkerTest, CheckpointsEveryInterval) {
    policy_.checkpoint_interval = 2;
    make_queue(5);

    std::size_t reports = 0;
    bus_.subscribe<ProgressReportEvent>([&](const ProgressReportEvent& e) {
        ++reports;
        EXPECT_EQ(e.queue_size, 5u);
    });

    EXPECT_EQ(run().status, AttemptStatus::Completed);
    EXPECT_EQ(checkpoints_, (std::vector<std::size_t>{2, 4}));
    EXPECT_EQ(reports, 2u);
    EXPECT_EQ(progress_.error_count, 5u);
}

TEST_F(TransferWorkerTest, CancellationStopsBeforeNextItem) {
    make_queue(4);
    for (std::size_t i = 0; i < 4; ++i) {
        client_.respond(url(i), 200, support::pdf_content(name(i)));
    }
    bus_.subscribe<ItemProcessedEvent>([this](const ItemProcessedEvent& e) {
        if (e.index == 1) {
            cancel_.cancel();
        }
    });

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::Cancelled);
    EXPECT_EQ(progress_.last_processed_index, 2u);
    EXPECT_EQ(client_.requests.size(), 2u);
}

TEST_F(TransferWorkerTest, CancelledFetchDoesNotAdvance) {
    make_queue(2);
    client_.fail(url(0), ErrorCode::Cancelled, "cancelled");

    const auto result = run();

    EXPECT_EQ(result.status, AttemptStatus::Cancelled);
    EXPECT_EQ(progress_.last_processed_index, 0u);
    EXPECT_EQ(progress_.error_count, 0u);
}

TEST(StorePayloadTest, ReplacesDestinationAtomically) {
    const auto dir = support::create_temp_dir("store_payload");
    support::write_file(dir / "a.pdf", "old");
    const std::string body = support::pdf_content("new");

    auto stored = TransferWorker::store_payload(dir / "a.pdf", std::vector<std::uint8_t>(body.begin(), body.end()));

    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(support::read_file(dir / "a.pdf"), body);
    EXPECT_FALSE(fs::exists(dir / "a.pdf.part"));
}

TEST(StorePayloadTest, MissingDirectoryIsAnError) {
    const auto dir = support::create_temp_dir("store_payload_missing");
    auto stored = TransferWorker::store_payload(dir / "nope" / "a.pdf", {'%', 'P', 'D', 'F'});
    ASSERT_TRUE(stored.is_error());
    EXPECT_EQ(stored.error().code, ErrorCode::IoError);
}
