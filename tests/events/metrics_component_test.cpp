#include "scingest/events/components.hpp"
#include "scingest/events/event_bus.hpp"
#include "scingest/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace scingest;
using namespace scingest::events;

TEST(MetricsComponentTest, CountsJobAndChunkActivity) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(JobQueuedEvent{"a", "a.bin", 300, 3, std::nullopt});
    bus.emit(JobQueuedEvent{"b", "b.bin", 300, 3, std::string("a")});
    bus.emit(ChunkCommittedEvent{"b", 0, 3, 100});
    bus.emit(ChunkCommittedEvent{"b", 1, 3, 100});
    bus.emit(ChunkRetryEvent{"b", 2, 1, std::chrono::milliseconds(10), "reset"});
    bus.emit(JobCompletedEvent{"b", "/data/ds/b.bin", "cbf29ce484222325", 300, std::chrono::milliseconds(40)});
    bus.emit(JobFailedEvent{"a", make_error(ErrorCode::TimeoutExceeded, "too slow")});
    bus.emit(JobFailedEvent{"c", make_error(ErrorCode::ConversionFailed, "bad tiff")});
    bus.emit(JobCancelledEvent{"d"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.jobs_queued.load(), 2u);
    EXPECT_EQ(stats.jobs_resumed.load(), 1u);
    EXPECT_EQ(stats.chunks_committed.load(), 2u);
    EXPECT_EQ(stats.bytes_committed.load(), 200u);
    EXPECT_EQ(stats.chunk_retries.load(), 1u);
    EXPECT_EQ(stats.jobs_completed.load(), 1u);
    EXPECT_EQ(stats.bytes_completed.load(), 300u);
    EXPECT_EQ(stats.jobs_failed.load(), 2u);
    EXPECT_EQ(stats.jobs_timed_out.load(), 1u);
    EXPECT_EQ(stats.jobs_cancelled.load(), 1u);
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<ChunkCommittedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<ChunkCommittedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<JobQueuedEvent>(), 0u);
}
