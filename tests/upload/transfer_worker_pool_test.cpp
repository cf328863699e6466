#include "scingest/upload/transfer_worker_pool.hpp"

#include "scingest/core/checksum.hpp"
#include "scingest/events/event_bus.hpp"
#include "scingest/events/events.hpp"
#include "scingest/upload/chunk_planner.hpp"
#include "scingest/upload/progress_aggregator.hpp"
#include "scingest/upload/resume_ledger.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

using namespace scingest;
using namespace scingest::upload;
using namespace std::chrono_literals;

namespace {

class MemoryReader : public ChunkReader {
public:
    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    UploadResult<std::vector<std::uint8_t>> read(const ChunkDescriptor& chunk) override {
        const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(chunk.offset);
        return Ok(std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(chunk.length)));
    }

private:
    std::vector<std::uint8_t> data_;
};

// Collects what it receives. `fault` may override the ack for a given
// chunk and attempt number (1-based).
class RecordingTransport : public ChunkTransport {
public:
    using Fault = std::function<std::optional<UploadResult<ChunkAck>>(std::size_t index, int attempt)>;

    UploadResult<ChunkAck> transmit(const std::string&,
                                    const ChunkDescriptor& chunk,
                                    const std::vector<std::uint8_t>& payload,
                                    const std::string& checksum,
                                    std::chrono::milliseconds) override {
        int attempt = 0;
        {
            std::lock_guard lock(mutex_);
            attempt = ++attempts_[chunk.index];
        }
        if (fault) {
            if (auto injected = fault(chunk.index, attempt)) {
                return std::move(*injected);
            }
        }
        std::lock_guard lock(mutex_);
        received_[chunk.index] = payload;
        return Ok(ChunkAck{true, checksum_hex(payload), 0});
    }

    std::map<std::size_t, std::vector<std::uint8_t>> received() const {
        std::lock_guard lock(mutex_);
        return received_;
    }

    int attempts_for(std::size_t index) const {
        std::lock_guard lock(mutex_);
        auto it = attempts_.find(index);
        return it == attempts_.end() ? 0 : it->second;
    }

    Fault fault;

private:
    mutable std::mutex mutex_;
    std::map<std::size_t, int> attempts_;
    std::map<std::size_t, std::vector<std::uint8_t>> received_;
};

std::vector<std::uint8_t> make_data(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
    }
    return data;
}

RetryPolicy fast_policy(int max_retries = 3) {
    RetryPolicy policy;
    policy.max_retries = max_retries;
    policy.retry_delay = 1ms;
    policy.max_delay = 5ms;
    policy.chunk_timeout = 1s;
    return policy;
}

UploadResult<ChunkAck> transient_failure() {
    return Err(make_error(ErrorCode::ChunkUploadFailed, "connection reset"));
}

struct Fixture {
    explicit Fixture(std::size_t file_size, std::size_t chunk_size)
        : data(make_data(file_size)),
          manifest(ChunkPlanner::plan(static_cast<std::int64_t>(file_size),
                                      static_cast<std::int64_t>(chunk_size)).value()),
          reader(data) {
        EXPECT_TRUE(ledger.open("job", manifest.size()).is_ok());
        progress.register_job("job", file_size, "data.bin");
    }

    std::vector<std::uint8_t> data;
    ChunkManifest manifest;
    MemoryReader reader;
    RecordingTransport transport;
    ResumeLedger ledger;
    ProgressAggregator progress;
    CancellationToken token;
};

} // namespace

TEST(TransferWorkerPoolTest, UploadsEveryChunkOnce) {
    Fixture f(1000, 64);
    TransferWorkerPool pool(4, fast_policy(), f.reader, f.transport, f.ledger, f.progress);

    auto report = pool.upload("job", f.manifest, {}, f.token);
    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_EQ(report.value().chunks_uploaded, f.manifest.size());
    EXPECT_EQ(report.value().bytes_uploaded, 1000u);
    EXPECT_EQ(report.value().retries, 0u);

    auto received = f.transport.received();
    ASSERT_EQ(received.size(), f.manifest.size());
    std::vector<std::uint8_t> reassembled;
    for (const auto& [index, bytes] : received) {
        reassembled.insert(reassembled.end(), bytes.begin(), bytes.end());
    }
    EXPECT_EQ(reassembled, f.data);
    EXPECT_EQ(f.ledger.committed_count("job"), f.manifest.size());
    EXPECT_EQ(f.progress.get_progress("job")->bytes_uploaded, 1000u);
}

TEST(TransferWorkerPoolTest, ResumeSendsOnlyMissingChunks) {
    Fixture f(1000, 100);
    const std::set<std::size_t> done = {0, 2, 5};
    TransferWorkerPool pool(3, fast_policy(), f.reader, f.transport, f.ledger, f.progress);

    auto report = pool.upload("job", f.manifest, done, f.token);
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().chunks_uploaded, 7u);
    EXPECT_EQ(report.value().chunks_skipped, 3u);
    for (std::size_t index : done) {
        EXPECT_EQ(f.transport.attempts_for(index), 0) << "chunk " << index;
    }
}

TEST(TransferWorkerPoolTest, SkipsChunksAlreadyInLedger) {
    Fixture f(300, 100);
    const std::vector<std::uint8_t> first(f.data.begin(), f.data.begin() + 100);
    ASSERT_TRUE(f.ledger.commit("job", 0, checksum_hex(first), 100).is_ok());

    TransferWorkerPool pool(2, fast_policy(), f.reader, f.transport, f.ledger, f.progress);
    auto report = pool.upload("job", f.manifest, {}, f.token);
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().chunks_uploaded, 2u);
    EXPECT_EQ(f.transport.attempts_for(0), 0);
}

TEST(TransferWorkerPoolTest, RetriesTransientFailure) {
    Fixture f(400, 100);
    f.transport.fault = [](std::size_t index, int attempt) -> std::optional<UploadResult<ChunkAck>> {
        if (index == 2 && attempt < 3) {
            return transient_failure();
        }
        return std::nullopt;
    };

    events::EventBus bus;
    std::vector<int> retry_attempts;
    std::mutex retry_mutex;
    bus.subscribe<events::ChunkRetryEvent>([&](const events::ChunkRetryEvent& e) {
        std::lock_guard lock(retry_mutex);
        EXPECT_EQ(e.chunk_index, 2u);
        retry_attempts.push_back(e.attempt);
    });

    TransferWorkerPool pool(2, fast_policy(3), f.reader, f.transport, f.ledger, f.progress, &bus);
    auto report = pool.upload("job", f.manifest, {}, f.token);
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().retries, 2u);
    EXPECT_EQ(f.transport.attempts_for(2), 3);
    EXPECT_EQ(retry_attempts, (std::vector<int>{1, 2}));
}

TEST(TransferWorkerPoolTest, ExhaustedChunkFailsTheRun) {
    Fixture f(400, 100);
    f.transport.fault = [](std::size_t index, int) -> std::optional<UploadResult<ChunkAck>> {
        if (index == 1) {
            return transient_failure();
        }
        return std::nullopt;
    };

    TransferWorkerPool pool(1, fast_policy(3), f.reader, f.transport, f.ledger, f.progress);
    auto report = pool.upload("job", f.manifest, {}, f.token);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::ChunkUploadFailed);
    ASSERT_TRUE(report.error().chunk_index.has_value());
    EXPECT_EQ(*report.error().chunk_index, 1u);
    EXPECT_EQ(f.transport.attempts_for(1), 3);
    // A single worker stops after the failing chunk.
    EXPECT_EQ(f.transport.attempts_for(2), 0);
    EXPECT_FALSE(f.ledger.is_committed("job", 1));
}

TEST(TransferWorkerPoolTest, ZeroRetriesStillMakesOneAttempt) {
    Fixture f(100, 100);
    f.transport.fault = [](std::size_t, int) -> std::optional<UploadResult<ChunkAck>> {
        return transient_failure();
    };

    TransferWorkerPool pool(1, fast_policy(0), f.reader, f.transport, f.ledger, f.progress);
    auto report = pool.upload("job", f.manifest, {}, f.token);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(f.transport.attempts_for(0), 1);
}

TEST(TransferWorkerPoolTest, ChecksumMismatchIsRetried) {
    Fixture f(200, 100);
    f.transport.fault = [](std::size_t index, int attempt) -> std::optional<UploadResult<ChunkAck>> {
        if (index == 0 && attempt == 1) {
            return UploadResult<ChunkAck>(Ok(ChunkAck{true, "0000000000000000", 0}));
        }
        return std::nullopt;
    };

    TransferWorkerPool pool(1, fast_policy(), f.reader, f.transport, f.ledger, f.progress);
    auto report = pool.upload("job", f.manifest, {}, f.token);
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(f.transport.attempts_for(0), 2);
    auto stored = f.ledger.checksum_of("job", 0);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, checksum_hex(std::vector<std::uint8_t>(f.data.begin(), f.data.begin() + 100)));
}

TEST(TransferWorkerPoolTest, PermanentRejectionStopsImmediately) {
    Fixture f(300, 100);
    f.transport.fault = [](std::size_t index, int) -> std::optional<UploadResult<ChunkAck>> {
        if (index == 0) {
            return UploadResult<ChunkAck>(Err(make_error(ErrorCode::InvalidTransition, "job is PAUSED")));
        }
        return std::nullopt;
    };

    TransferWorkerPool pool(1, fast_policy(5), f.reader, f.transport, f.ledger, f.progress);
    auto report = pool.upload("job", f.manifest, {}, f.token);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::InvalidTransition);
    EXPECT_EQ(f.transport.attempts_for(0), 1);
}

TEST(TransferWorkerPoolTest, CancelledBeforeStart) {
    Fixture f(300, 100);
    f.token.cancel();

    TransferWorkerPool pool(2, fast_policy(), f.reader, f.transport, f.ledger, f.progress);
    auto report = pool.upload("job", f.manifest, {}, f.token);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::CancelledByUser);
    EXPECT_TRUE(f.transport.received().empty());
}

TEST(TransferWorkerPoolTest, CancelWakesBackoff) {
    Fixture f(200, 100);
    f.transport.fault = [](std::size_t, int) -> std::optional<UploadResult<ChunkAck>> {
        return transient_failure();
    };
    RetryPolicy slow = fast_policy(5);
    slow.retry_delay = 10s;
    slow.max_delay = 10s;

    TransferWorkerPool pool(1, slow, f.reader, f.transport, f.ledger, f.progress);
    std::thread canceller([&f]() {
        std::this_thread::sleep_for(100ms);
        f.token.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    auto report = pool.upload("job", f.manifest, {}, f.token);
    canceller.join();

    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::CancelledByUser);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(TransferWorkerPoolTest, PublishesChunkCommittedEvents) {
    Fixture f(250, 100);
    events::EventBus bus;
    std::mutex mutex;
    std::vector<std::size_t> committed;
    bus.subscribe<events::ChunkCommittedEvent>([&](const events::ChunkCommittedEvent& e) {
        std::lock_guard lock(mutex);
        EXPECT_EQ(e.total_chunks, 3u);
        committed.push_back(e.chunk_index);
    });

    TransferWorkerPool pool(3, fast_policy(), f.reader, f.transport, f.ledger, f.progress, &bus);
    ASSERT_TRUE(pool.upload("job", f.manifest, {}, f.token).is_ok());

    std::sort(committed.begin(), committed.end());
    EXPECT_EQ(committed, (std::vector<std::size_t>{0, 1, 2}));
}

TEST(TransferWorkerPoolTest, WorkerCountIsAtLeastOne) {
    Fixture f(10, 10);
    TransferWorkerPool pool(0, fast_policy(), f.reader, f.transport, f.ledger, f.progress);
    EXPECT_EQ(pool.max_workers(), 1u);
    EXPECT_TRUE(pool.upload("job", f.manifest, {}, f.token).is_ok());
}
