#include "scingest/api/upload_client.hpp"

#include "scingest/api/upload_routes.hpp"
#include "scingest/core/checksum.hpp"
#include "scingest/events/event_bus.hpp"
#include "scingest/network/http_server_asio.hpp"
#include "scingest/upload/chunk_planner.hpp"
#include "scingest/upload/chunk_store.hpp"
#include "scingest/upload/conversion.hpp"
#include "scingest/upload/job_registry.hpp"
#include "scingest/upload/progress_aggregator.hpp"
#include "scingest/upload/resume_ledger.hpp"
#include "scingest/upload/transfer_worker_pool.hpp"
#include "scingest/upload/upload_service.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
namespace asio = boost::asio;
using namespace scingest;
using namespace scingest::upload;
using namespace std::chrono_literals;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() /
                   ("scingest_client_test_" + std::to_string(::getpid()) + "_" +
                    std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::uint8_t> make_data(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 53 + 11) & 0xFF);
    }
    return data;
}

class MemoryReader : public ChunkReader {
public:
    explicit MemoryReader(const std::vector<std::uint8_t>& data) : data_(data) {}

    UploadResult<std::vector<std::uint8_t>> read(const ChunkDescriptor& chunk) override {
        const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(chunk.offset);
        return Ok(std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(chunk.length)));
    }

private:
    const std::vector<std::uint8_t>& data_;
};

// An HttpServerAsio on an ephemeral port, served from a background thread.
class ServerThread {
public:
    explicit ServerThread(network::HttpRequestHandler handler)
        : server_(io_, "127.0.0.1", 0, 1 << 20) {
        server_.set_handler(std::move(handler));
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~ServerThread() {
        asio::post(io_, [this]() { server_.stop(); });
        io_.stop();
        thread_.join();
    }

    uint16_t port() const { return server_.get_port(); }

private:
    asio::io_context io_;
    network::HttpServerAsio server_;
    std::thread thread_;
};

ServiceOptions test_options(const fs::path& root) {
    ServiceOptions options;
    options.destination_root = root / "data";
    options.max_file_size = 1 << 20;
    options.default_chunk_size = 64;
    options.min_chunk_size = 1;
    options.max_chunk_size = 4096;
    options.max_workers = 2;
    options.max_concurrent_jobs = 2;
    return options;
}

// Ingest server and a client pointed at it.
struct EndToEnd {
    EndToEnd()
        : root(create_temp_dir()),
          store(root / "staging"),
          progress(&bus),
          service(test_options(root), registry, ledger, progress, store, converters, bus),
          server([this]() {
              api::register_upload_routes(router, service);
              return [this](const network::HttpRequest& request) { return router.handle_request(request); };
          }()),
          client(network::HttpClient("127.0.0.1", server.port()), 5s) {
    }

    ~EndToEnd() {
        service.shutdown();
        fs::remove_all(root);
    }

    UploadJobConfig config(std::uint64_t file_size, std::uint64_t chunk_size) const {
        UploadJobConfig cfg = service.job_defaults();
        cfg.dataset_id = "ds";
        cfg.file_name = "plot.bin";
        cfg.file_size = file_size;
        cfg.chunk_size = chunk_size;
        cfg.auto_convert = false;
        return cfg;
    }

    JobStatus wait_for_terminal(const std::string& job_id) {
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (std::chrono::steady_clock::now() < deadline) {
            auto status = client.status(job_id);
            if (status.is_ok() && is_terminal(status.value().status)) {
                return status.value().status;
            }
            std::this_thread::sleep_for(10ms);
        }
        return client.status(job_id).value().status;
    }

    fs::path root;
    events::EventBus bus;
    ResumeLedger ledger;
    ChunkStore store;
    ProgressAggregator progress;
    JobRegistry registry;
    ConverterRegistry converters;
    UploadService service;
    network::HttpRouter router;
    ServerThread server;
    api::UploadClient client;
};

RetryPolicy client_policy() {
    RetryPolicy policy;
    policy.max_retries = 2;
    policy.retry_delay = 5ms;
    policy.max_delay = 20ms;
    policy.chunk_timeout = 5s;
    return policy;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

TEST(UploadClientTest, WorkerPoolUploadsOverHttp) {
    EndToEnd e;
    const auto data = make_data(1000);

    auto job = e.client.initiate(e.config(data.size(), 128));
    ASSERT_TRUE(job.is_ok()) << job.error().describe();
    EXPECT_EQ(job.value().total_chunks, 8u);
    EXPECT_EQ(job.value().chunk_size, 128u);
    const std::string job_id = job.value().job_id;

    auto manifest = ChunkPlanner::plan(1000, 128);
    ASSERT_TRUE(manifest.is_ok());

    MemoryReader reader(data);
    api::HttpChunkTransport transport(e.client);
    ResumeLedger client_ledger;
    ProgressAggregator client_progress;
    ASSERT_TRUE(client_ledger.open(job_id, manifest.value().size()).is_ok());
    client_progress.register_job(job_id, data.size(), "plot.bin");

    CancellationToken token;
    TransferWorkerPool pool(3, client_policy(), reader, transport, client_ledger, client_progress);
    auto report = pool.upload(job_id, manifest.value(), {}, token);
    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_EQ(report.value().chunks_uploaded, 8u);
    EXPECT_EQ(report.value().bytes_uploaded, 1000u);

    EXPECT_EQ(e.wait_for_terminal(job_id), JobStatus::Completed);
    const std::string on_disk = read_file(e.root / "data" / "ds" / "plot.bin");
    EXPECT_EQ(on_disk, std::string(data.begin(), data.end()));

    auto info = e.client.resume_info(job_id);
    ASSERT_TRUE(info.is_ok());
    EXPECT_TRUE(info.value().missing_chunks.empty());
    EXPECT_EQ(info.value().total_chunks, 8u);
}

TEST(UploadClientTest, ResumeInfoDrivesSecondPass) {
    EndToEnd e;
    const auto data = make_data(300);
    auto job = e.client.initiate(e.config(data.size(), 100));
    ASSERT_TRUE(job.is_ok());
    const std::string job_id = job.value().job_id;

    const std::vector<std::uint8_t> first(data.begin(), data.begin() + 100);
    auto receipt = e.client.put_chunk(job_id, 0, first, checksum_hex(first), 5s);
    ASSERT_TRUE(receipt.is_ok()) << receipt.error().describe();
    EXPECT_TRUE(receipt.value().committed);
    EXPECT_EQ(receipt.value().bytes_uploaded, 100u);

    auto info = e.client.resume_info(job_id);
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().missing_chunks, (std::vector<std::size_t>{1, 2}));
    EXPECT_EQ(info.value().chunk_size, 100u);

    auto manifest = ChunkPlanner::plan(300, static_cast<std::int64_t>(info.value().chunk_size)).value();
    std::set<std::size_t> done;
    for (std::size_t i = 0; i < manifest.size(); ++i) {
        done.insert(i);
    }
    for (std::size_t missing : info.value().missing_chunks) {
        done.erase(missing);
    }

    MemoryReader reader(data);
    api::HttpChunkTransport transport(e.client);
    ResumeLedger client_ledger;
    ProgressAggregator client_progress;
    ASSERT_TRUE(client_ledger.open(job_id, manifest.size()).is_ok());
    client_progress.register_job(job_id, data.size(), "plot.bin");
    CancellationToken token;
    TransferWorkerPool pool(2, client_policy(), reader, transport, client_ledger, client_progress);
    auto report = pool.upload(job_id, manifest, done, token);
    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_EQ(report.value().chunks_uploaded, 2u);

    EXPECT_EQ(e.wait_for_terminal(job_id), JobStatus::Completed);
}

TEST(UploadClientTest, ServerErrorsComeBackTyped) {
    EndToEnd e;
    auto missing = e.client.status("upload_0123456789abcdef");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto job = e.client.initiate(e.config(200, 100));
    ASSERT_TRUE(job.is_ok());
    const std::string job_id = job.value().job_id;

    const std::vector<std::uint8_t> chunk(100, 0x41);
    ASSERT_TRUE(e.client.put_chunk(job_id, 1, chunk, checksum_hex(chunk), 5s).is_ok());

    const std::vector<std::uint8_t> other(100, 0x42);
    auto conflict = e.client.put_chunk(job_id, 1, other, checksum_hex(other), 5s);
    ASSERT_TRUE(conflict.is_error());
    EXPECT_EQ(conflict.error().code, ErrorCode::IntegrityError);
    EXPECT_EQ(conflict.error().chunk_index, std::optional<std::size_t>(1));

    auto too_big = e.client.initiate(e.config(2 << 20, 100));
    ASSERT_TRUE(too_big.is_error());
    EXPECT_EQ(too_big.error().code, ErrorCode::PayloadTooLarge);
}

TEST(UploadClientTest, ControlCallsReportStatus) {
    EndToEnd e;
    auto job = e.client.initiate(e.config(200, 100));
    ASSERT_TRUE(job.is_ok());
    const std::string job_id = job.value().job_id;

    const std::vector<std::uint8_t> chunk(100, 0x07);
    ASSERT_TRUE(e.client.put_chunk(job_id, 0, chunk, checksum_hex(chunk), 5s).is_ok());

    auto paused = e.client.pause(job_id);
    ASSERT_TRUE(paused.is_ok()) << paused.error().describe();
    EXPECT_EQ(paused.value(), JobStatus::Paused);

    auto resumed = e.client.resume(job_id);
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_EQ(resumed.value(), JobStatus::Uploading);

    auto cancelled = e.client.cancel(job_id);
    ASSERT_TRUE(cancelled.is_ok());
    EXPECT_EQ(cancelled.value(), JobStatus::Cancelled);

    auto status = e.client.status(job_id);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().status, JobStatus::Cancelled);
}

TEST(UploadClientTest, UnreachableServerIsIoError) {
    api::UploadClient client(network::HttpClient("127.0.0.1", 1), 500ms);
    auto result = client.status("upload_0123456789abcdef");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::IoError);
}

TEST(HttpRangeReaderTest, ReadsRangesAndWholeBodies) {
    const auto data = make_data(500);
    std::atomic<bool> honour_range{true};
    ServerThread source([&](const network::HttpRequest& request) {
        const std::string range = request.get_header("Range");
        if (honour_range && range.rfind("bytes=", 0) == 0) {
            const auto dash = range.find('-');
            const std::size_t first = std::stoul(range.substr(6, dash - 6));
            const std::size_t last = std::stoul(range.substr(dash + 1));
            network::HttpResponse response(network::HttpStatus::PARTIAL_CONTENT);
            response.body.assign(data.begin() + static_cast<std::ptrdiff_t>(first),
                                 data.begin() + static_cast<std::ptrdiff_t>(last + 1));
            return response;
        }
        network::HttpResponse response(network::HttpStatus::OK);
        response.body = data;
        return response;
    });

    auto url = network::parse_http_url("http://127.0.0.1:" + std::to_string(source.port()) + "/raw/scan.bin");
    ASSERT_TRUE(url.is_ok()) << url.error();
    api::HttpRangeReader reader(url.value(), 5s);

    ChunkDescriptor middle{2, 200, 100};
    auto ranged = reader.read(middle);
    ASSERT_TRUE(ranged.is_ok()) << ranged.error().describe();
    EXPECT_EQ(ranged.value(), std::vector<std::uint8_t>(data.begin() + 200, data.begin() + 300));

    honour_range = false;
    auto sliced = reader.read(middle);
    ASSERT_TRUE(sliced.is_ok()) << sliced.error().describe();
    EXPECT_EQ(sliced.value(), std::vector<std::uint8_t>(data.begin() + 200, data.begin() + 300));

    ChunkDescriptor past_end{9, 900, 100};
    auto short_read = reader.read(past_end);
    ASSERT_TRUE(short_read.is_error());
    EXPECT_EQ(short_read.error().code, ErrorCode::IoError);
    EXPECT_EQ(short_read.error().chunk_index, std::optional<std::size_t>(9));
}
