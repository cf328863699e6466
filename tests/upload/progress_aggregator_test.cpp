#include "scingest/upload/progress_aggregator.hpp"

#include "scingest/events/event_bus.hpp"
#include "scingest/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace scingest;
using namespace scingest::upload;
using namespace std::chrono_literals;

TEST(ProgressAggregatorTest, UnknownJobHasNoProgress) {
    ProgressAggregator progress;
    EXPECT_FALSE(progress.get_progress("nope").has_value());
    EXPECT_FALSE(progress.contains("nope"));

    progress.add_bytes("nope", 10);
    progress.set_status("nope", JobStatus::Uploading);
    EXPECT_FALSE(progress.contains("nope"));
}

TEST(ProgressAggregatorTest, RegisterStartsWithAlreadyUploadedBytes) {
    ProgressAggregator progress;
    progress.register_job("job", 1000, "scan.tif", 250);

    auto snapshot = progress.get_progress("job");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->status, JobStatus::Queued);
    EXPECT_EQ(snapshot->bytes_uploaded, 250u);
    EXPECT_EQ(snapshot->bytes_total, 1000u);
    EXPECT_DOUBLE_EQ(snapshot->progress_percentage, 25.0);
    EXPECT_EQ(snapshot->current_file, "scan.tif");
    EXPECT_DOUBLE_EQ(snapshot->speed_mbps, 0.0);
}

TEST(ProgressAggregatorTest, BytesNeverExceedTotal) {
    ProgressAggregator progress;
    progress.register_job("job", 100, "f");
    progress.add_bytes("job", 60);
    progress.add_bytes("job", 60);

    auto snapshot = progress.get_progress("job");
    EXPECT_EQ(snapshot->bytes_uploaded, 100u);
    EXPECT_DOUBLE_EQ(snapshot->progress_percentage, 100.0);
}

TEST(ProgressAggregatorTest, SpeedAndEtaFromWindow) {
    ProgressAggregator progress(nullptr, 10s);
    progress.register_job("job", 10'000'000, "f");
    progress.set_status("job", JobStatus::Uploading);

    const auto start = ProgressAggregator::Clock::now();
    progress.add_bytes_at("job", 1'000'000, start);
    EXPECT_DOUBLE_EQ(progress.get_progress("job")->speed_mbps, 0.0);

    progress.add_bytes_at("job", 2'000'000, start + 1s);
    auto snapshot = progress.get_progress("job");
    // 2 MB over one second, 7 MB left
    EXPECT_NEAR(snapshot->speed_mbps, 2.0, 1e-9);
    EXPECT_NEAR(snapshot->eta_seconds, 3.5, 1e-9);
}

TEST(ProgressAggregatorTest, OldSamplesLeaveTheWindow) {
    ProgressAggregator progress(nullptr, 5s);
    progress.register_job("job", 100'000'000, "f");

    const auto start = ProgressAggregator::Clock::now();
    progress.add_bytes_at("job", 1'000'000, start);
    progress.add_bytes_at("job", 9'000'000, start + 1s);
    progress.add_bytes_at("job", 1'000'000, start + 20s);

    // Only the last sample remains inside the window.
    EXPECT_DOUBLE_EQ(progress.get_progress("job")->speed_mbps, 0.0);
    EXPECT_EQ(progress.get_progress("job")->bytes_uploaded, 11'000'000u);
}

TEST(ProgressAggregatorTest, PauseClearsSpeed) {
    ProgressAggregator progress(nullptr, 10s);
    progress.register_job("job", 10'000'000, "f");
    const auto start = ProgressAggregator::Clock::now();
    progress.add_bytes_at("job", 1'000'000, start);
    progress.add_bytes_at("job", 1'000'000, start + 1s);
    ASSERT_GT(progress.get_progress("job")->speed_mbps, 0.0);

    progress.set_status("job", JobStatus::Paused);
    auto snapshot = progress.get_progress("job");
    EXPECT_EQ(snapshot->status, JobStatus::Paused);
    EXPECT_DOUBLE_EQ(snapshot->speed_mbps, 0.0);
    EXPECT_EQ(snapshot->bytes_uploaded, 2'000'000u);
}

TEST(ProgressAggregatorTest, TerminalStatusFreezesProgress) {
    ProgressAggregator progress;
    progress.register_job("job", 100, "f");
    progress.add_bytes("job", 40);
    progress.set_status("job", JobStatus::Failed, "chunk 3 gave up");

    progress.add_bytes("job", 40);
    progress.set_status("job", JobStatus::Uploading);

    auto snapshot = progress.get_progress("job");
    EXPECT_EQ(snapshot->status, JobStatus::Failed);
    EXPECT_EQ(snapshot->bytes_uploaded, 40u);
    EXPECT_EQ(snapshot->error_message, "chunk 3 gave up");
}

TEST(ProgressAggregatorTest, EmptyFileIsCompleteOncePastUpload) {
    ProgressAggregator progress;
    progress.register_job("job", 0, "empty.bin");
    EXPECT_DOUBLE_EQ(progress.get_progress("job")->progress_percentage, 0.0);

    progress.set_status("job", JobStatus::Uploading);
    EXPECT_DOUBLE_EQ(progress.get_progress("job")->progress_percentage, 0.0);

    progress.set_status("job", JobStatus::Processing);
    EXPECT_DOUBLE_EQ(progress.get_progress("job")->progress_percentage, 100.0);
}

TEST(ProgressAggregatorTest, PublishesEveryMutation) {
    events::EventBus bus;
    std::vector<UploadProgress> seen;
    bus.subscribe<events::ProgressUpdatedEvent>([&seen](const events::ProgressUpdatedEvent& e) {
        seen.push_back(e.progress);
    });

    ProgressAggregator progress(&bus);
    progress.register_job("job", 100, "f");
    progress.set_status("job", JobStatus::Uploading);
    progress.add_bytes("job", 50);
    progress.set_status("job", JobStatus::Cancelled);
    progress.add_bytes("job", 50);  // frozen, no event

    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0].status, JobStatus::Queued);
    EXPECT_EQ(seen[2].bytes_uploaded, 50u);
    EXPECT_EQ(seen[3].status, JobStatus::Cancelled);
}

TEST(ProgressAggregatorTest, ConcurrentAddsAreMonotonic) {
    ProgressAggregator progress;
    progress.register_job("job", 1'000'000, "f");

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&progress]() {
            std::uint64_t last = 0;
            for (int i = 0; i < 1000; ++i) {
                progress.add_bytes("job", 10);
                const auto now = progress.get_progress("job")->bytes_uploaded;
                EXPECT_GE(now, last);
                last = now;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(progress.get_progress("job")->bytes_uploaded, 40'000u);
}

TEST(ProgressAggregatorTest, RemoveForgetsJob) {
    ProgressAggregator progress;
    progress.register_job("job", 1, "f");
    progress.remove("job");
    EXPECT_FALSE(progress.contains("job"));
}
