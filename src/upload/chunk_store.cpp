#include "scingest/upload/chunk_store.hpp"

#include "scingest/core/checksum.hpp"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <functional>
#include <iterator>
#include <system_error>
#include <thread>

namespace scingest::upload {
namespace fs = std::filesystem;
namespace {

std::string temp_suffix() {
    static std::atomic<std::uint64_t> counter{0};
    return ".part-" + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) +
           "-" + std::to_string(counter.fetch_add(1));
}

} // namespace

constexpr const char* kIncomingDir = ".incoming";

ChunkStore::ChunkStore(fs::path staging_root)
    : staging_root_(std::move(staging_root)) {
    std::error_code ec;
    fs::create_directories(staging_root_, ec);
    // Leftovers of writes cut short by a crash.
    fs::remove_all(incoming_dir(), ec);
}

fs::path ChunkStore::job_dir(const std::string& job_id) const {
    return staging_root_ / job_id;
}

fs::path ChunkStore::incoming_dir() const {
    return staging_root_ / kIncomingDir;
}

fs::path ChunkStore::chunk_path(const std::string& job_id, std::size_t index) const {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%06zu", index);
    return job_dir(job_id) / name;
}

UploadResult<fs::path> ChunkStore::stage(const std::string& job_id, std::size_t index,
                                         const std::vector<std::uint8_t>& data) {
    if (auto res = ensure_directory(incoming_dir()); res.is_error()) {
        return Err(std::move(res.error()));
    }

    const fs::path staged = incoming_dir() / (job_id + "." + chunk_path(job_id, index).filename().string() +
                                              temp_suffix());
    std::ofstream out(staged, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err(make_error(ErrorCode::IoError, "failed to create " + staged.string(), index));
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        out.close();
        discard(staged);
        return Err(make_error(ErrorCode::IoError, "failed to write " + staged.string(), index));
    }
    return Ok(staged);
}

UploadResult<void> ChunkStore::publish(const fs::path& staged, const std::string& job_id, std::size_t index) {
    if (auto res = ensure_directory(job_dir(job_id)); res.is_error()) {
        discard(staged);
        return res;
    }

    const auto final_path = chunk_path(job_id, index);
    std::error_code ec;
    fs::rename(staged, final_path, ec);
    if (ec) {
        discard(staged);
        return Err(make_error(ErrorCode::IoError, "failed to move chunk into " + final_path.string(), index));
    }
    return Ok();
}

void ChunkStore::discard(const fs::path& staged) {
    std::error_code ec;
    fs::remove(staged, ec);
}

UploadResult<void> ChunkStore::write(const std::string& job_id, std::size_t index,
                                     const std::vector<std::uint8_t>& data) {
    auto staged = stage(job_id, index, data);
    if (staged.is_error()) {
        return Err(std::move(staged.error()));
    }
    return publish(staged.value(), job_id, index);
}

UploadResult<std::vector<std::uint8_t>> ChunkStore::read(const std::string& job_id, std::size_t index) const {
    const auto path = chunk_path(job_id, index);
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err(make_error(ErrorCode::NotFound, "chunk not staged: " + path.string(), index));
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return Ok(std::move(data));
}

bool ChunkStore::has(const std::string& job_id, std::size_t index) const {
    std::error_code ec;
    return fs::is_regular_file(chunk_path(job_id, index), ec);
}

UploadResult<std::string> ChunkStore::assemble(const std::string& job_id,
                                               const ChunkManifest& manifest,
                                               const fs::path& destination) const {
    if (auto res = ensure_directory(destination.parent_path()); res.is_error()) {
        return Err(std::move(res.error()));
    }

    const fs::path temp_path = destination.string() + temp_suffix();
    Fnv1a64 hasher;
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err(make_error(ErrorCode::IoError, "failed to create " + temp_path.string()));
        }

        std::vector<char> buffer(1 << 20);
        for (const auto& chunk : manifest) {
            std::ifstream input(chunk_path(job_id, chunk.index), std::ios::binary);
            if (!input) {
                out.close();
                std::error_code ec;
                fs::remove(temp_path, ec);
                return Err(make_error(ErrorCode::IoError, "staged chunk missing", chunk.index));
            }

            std::uint64_t copied = 0;
            while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
                const auto count = static_cast<std::size_t>(input.gcount());
                hasher.update(buffer.data(), count);
                out.write(buffer.data(), static_cast<std::streamsize>(count));
                copied += count;
            }
            if (copied != chunk.length || !out) {
                out.close();
                std::error_code ec;
                fs::remove(temp_path, ec);
                return Err(make_error(ErrorCode::IoError,
                                      "staged chunk has " + std::to_string(copied) + " bytes, expected " +
                                      std::to_string(chunk.length),
                                      chunk.index));
            }
        }
        out.flush();
        if (!out) {
            return Err(make_error(ErrorCode::IoError, "failed to write " + temp_path.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp_path, destination, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        return Err(make_error(ErrorCode::IoError, "failed to move assembled file to " + destination.string()));
    }
    return Ok(hasher.hex());
}

UploadResult<void> ChunkStore::adopt(const std::string& from_job, const std::string& to_job) {
    const auto source = job_dir(from_job);
    const auto target = job_dir(to_job);

    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return Ok();
    }
    if (fs::exists(target, ec)) {
        // The new job already staged chunks of its own; move the old ones in beside them.
        std::vector<fs::path> staged;
        for (const auto& entry : fs::directory_iterator(source, ec)) {
            staged.push_back(entry.path());
        }
        for (const auto& path : staged) {
            const auto moved = target / path.filename();
            if (!fs::exists(moved, ec)) {
                fs::rename(path, moved, ec);
                if (ec) {
                    return Err(make_error(ErrorCode::IoError, "failed to move " + path.string()));
                }
            }
        }
        fs::remove_all(source, ec);
        return Ok();
    }

    fs::rename(source, target, ec);
    if (ec) {
        return Err(make_error(ErrorCode::IoError, "failed to move staging " + source.string() + " to " + target.string()));
    }
    return Ok();
}

void ChunkStore::remove(const std::string& job_id) {
    std::error_code ec;
    fs::remove_all(job_dir(job_id), ec);
}

UploadResult<void> ChunkStore::ensure_directory(const fs::path& dir) {
    if (dir.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec && !fs::exists(dir)) {
        return Err(make_error(ErrorCode::IoError, "failed to create directory " + dir.string()));
    }
    return Ok();
}

} // namespace scingest::upload
