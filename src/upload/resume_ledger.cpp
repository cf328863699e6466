#include "scingest/upload/resume_ledger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <system_error>

namespace scingest::upload {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool ends_with_newline(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    input.seekg(-1, std::ios::end);
    char last = '\n';
    return !input.get(last) || last == '\n';
}

} // namespace

ResumeLedger::ResumeLedger(std::optional<fs::path> journal_root)
    : journal_root_(std::move(journal_root)) {
    if (journal_root_) {
        std::error_code ec;
        fs::create_directories(*journal_root_, ec);
    }
}

UploadResult<void> ResumeLedger::open(const std::string& job_id, std::size_t total_chunks,
                                      const json& descriptor) {
    if (total_chunks == 0) {
        return Err(make_error(ErrorCode::InvalidConfig, "a job needs at least one chunk"));
    }

    std::unique_lock lock(mutex_);
    if (auto it = entries_.find(job_id); it != entries_.end()) {
        std::lock_guard entry_lock(it->second->mutex);
        if (it->second->total_chunks != total_chunks) {
            return Err(make_error(ErrorCode::InvalidConfig,
                                  "ledger for " + job_id + " already open with " +
                                  std::to_string(it->second->total_chunks) + " chunks"));
        }
        return Ok();
    }

    auto entry = std::make_shared<Entry>();
    entry->total_chunks = total_chunks;
    if (journal_root_) {
        const auto path = journal_path(job_id);
        std::error_code ec;
        const bool fresh = !fs::exists(path, ec) || fs::file_size(path, ec) == 0;
        if (!fresh) {
            replay_journal(*entry, job_id);
        }
        entry->journal.open(path, std::ios::app);
        if (!entry->journal) {
            return Err(make_error(ErrorCode::IoError, "failed to open ledger journal " + path.string()));
        }
        if (!fresh && !ends_with_newline(path)) {
            // Terminate a torn line so the next record starts on its own line.
            entry->journal << '\n';
        }
        if (fresh) {
            json header{{"job", job_id}, {"chunks", total_chunks}, {"descriptor", descriptor}};
            if (auto res = write_line(*entry, job_id, header); res.is_error()) {
                return res;
            }
        }
    }
    entries_.emplace(job_id, std::move(entry));
    return Ok();
}

UploadResult<CommitOutcome> ResumeLedger::commit(const std::string& job_id,
                                                 std::size_t index,
                                                 const std::string& checksum,
                                                 std::uint64_t length) {
    auto entry = find(job_id);
    if (!entry) {
        return Err(make_error(ErrorCode::NotFound, "no ledger for job " + job_id));
    }

    std::lock_guard lock(entry->mutex);
    if (index >= entry->total_chunks) {
        return Err(make_error(ErrorCode::InvalidConfig,
                              "chunk index out of range (total " + std::to_string(entry->total_chunks) + ")",
                              index));
    }

    if (auto it = entry->chunks.find(index); it != entry->chunks.end()) {
        if (it->second.checksum != checksum) {
            return Err(make_error(ErrorCode::IntegrityError,
                                  "already committed with checksum " + it->second.checksum +
                                  ", received " + checksum,
                                  index));
        }
        return Ok(CommitOutcome::Duplicate);
    }

    ChunkRecord record{checksum, length};
    if (journal_root_) {
        json line{{"i", index}, {"c", checksum}, {"n", length}};
        if (auto res = write_line(*entry, job_id, line); res.is_error()) {
            res.error().chunk_index = index;
            return Err(std::move(res.error()));
        }
    }
    entry->chunks.emplace(index, std::move(record));
    entry->bytes += length;
    return Ok(CommitOutcome::Committed);
}

bool ResumeLedger::contains(const std::string& job_id) const {
    return find(job_id) != nullptr;
}

bool ResumeLedger::is_committed(const std::string& job_id, std::size_t index) const {
    auto entry = find(job_id);
    if (!entry) {
        return false;
    }
    std::lock_guard lock(entry->mutex);
    return entry->chunks.count(index) > 0;
}

std::optional<std::string> ResumeLedger::checksum_of(const std::string& job_id, std::size_t index) const {
    auto entry = find(job_id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard lock(entry->mutex);
    auto it = entry->chunks.find(index);
    if (it == entry->chunks.end()) {
        return std::nullopt;
    }
    return it->second.checksum;
}

std::vector<std::size_t> ResumeLedger::committed(const std::string& job_id) const {
    std::vector<std::size_t> indices;
    auto entry = find(job_id);
    if (!entry) {
        return indices;
    }
    std::lock_guard lock(entry->mutex);
    indices.reserve(entry->chunks.size());
    for (const auto& [index, record] : entry->chunks) {
        indices.push_back(index);
    }
    return indices;
}

std::vector<std::size_t> ResumeLedger::missing(const std::string& job_id) const {
    std::vector<std::size_t> indices;
    auto entry = find(job_id);
    if (!entry) {
        return indices;
    }
    std::lock_guard lock(entry->mutex);
    for (std::size_t i = 0; i < entry->total_chunks; ++i) {
        if (entry->chunks.count(i) == 0) {
            indices.push_back(i);
        }
    }
    return indices;
}

std::size_t ResumeLedger::committed_count(const std::string& job_id) const {
    auto entry = find(job_id);
    if (!entry) {
        return 0;
    }
    std::lock_guard lock(entry->mutex);
    return entry->chunks.size();
}

std::uint64_t ResumeLedger::committed_bytes(const std::string& job_id) const {
    auto entry = find(job_id);
    if (!entry) {
        return 0;
    }
    std::lock_guard lock(entry->mutex);
    return entry->bytes;
}

std::size_t ResumeLedger::total_chunks(const std::string& job_id) const {
    auto entry = find(job_id);
    if (!entry) {
        return 0;
    }
    std::lock_guard lock(entry->mutex);
    return entry->total_chunks;
}

UploadResult<std::size_t> ResumeLedger::adopt(const std::string& from_job, const std::string& to_job) {
    auto source = find(from_job);
    if (!source) {
        return Err(make_error(ErrorCode::NotFound, "no ledger for job " + from_job));
    }
    auto target = find(to_job);
    if (!target) {
        return Err(make_error(ErrorCode::NotFound, "no ledger for job " + to_job));
    }
    if (source == target) {
        return Ok(std::size_t{0});
    }

    const std::size_t target_total = total_chunks(to_job);
    std::map<std::size_t, ChunkRecord> copied;
    {
        std::lock_guard lock(source->mutex);
        if (source->total_chunks != target_total) {
            return Err(make_error(ErrorCode::InvalidConfig,
                                  "cannot adopt " + from_job + ": chunk counts differ"));
        }
        copied = source->chunks;
    }

    std::size_t adopted = 0;
    for (const auto& [index, record] : copied) {
        auto res = commit(to_job, index, record.checksum, record.length);
        if (res.is_error()) {
            return Err(std::move(res.error()));
        }
        if (res.value() == CommitOutcome::Committed) {
            ++adopted;
        }
    }
    return Ok(adopted);
}

std::vector<JournaledJob> ResumeLedger::journaled_jobs() const {
    std::vector<JournaledJob> jobs;
    if (!journal_root_) {
        return jobs;
    }

    std::error_code ec;
    for (const auto& file : fs::directory_iterator(*journal_root_, ec)) {
        if (file.path().extension() != ".ledger") {
            continue;
        }
        JournaledJob job;
        job.job_id = file.path().stem().string();

        std::ifstream input(file.path());
        std::string line;
        if (std::getline(input, line)) {
            auto header = json::parse(line, nullptr, false);
            if (!header.is_discarded() && header.is_object() &&
                header.value("job", std::string()) == job.job_id &&
                header.contains("chunks") && header["chunks"].is_number_unsigned()) {
                job.total_chunks = header["chunks"].get<std::size_t>();
                job.descriptor = header.value("descriptor", json::object());
            }
        }
        jobs.push_back(std::move(job));
    }
    std::sort(jobs.begin(), jobs.end(),
              [](const JournaledJob& a, const JournaledJob& b) { return a.job_id < b.job_id; });
    return jobs;
}

void ResumeLedger::purge(const std::string& job_id) {
    std::shared_ptr<Entry> removed;
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(job_id);
        if (it != entries_.end()) {
            removed = std::move(it->second);
            entries_.erase(it);
        }
    }
    if (removed) {
        std::lock_guard lock(removed->mutex);
        removed->journal.close();
    }
    if (journal_root_) {
        std::error_code ec;
        fs::remove(journal_path(job_id), ec);
    }
}

std::shared_ptr<ResumeLedger::Entry> ResumeLedger::find(const std::string& job_id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(job_id);
    return it != entries_.end() ? it->second : nullptr;
}

fs::path ResumeLedger::journal_path(const std::string& job_id) const {
    return *journal_root_ / (job_id + ".ledger");
}

UploadResult<void> ResumeLedger::write_line(Entry& entry, const std::string& job_id, const json& line) {
    entry.journal << line.dump() << '\n';
    entry.journal.flush();
    if (!entry.journal) {
        return Err(make_error(ErrorCode::IoError, "failed to append to ledger journal of " + job_id));
    }
    return Ok();
}

void ResumeLedger::replay_journal(Entry& entry, const std::string& job_id) const {
    std::ifstream input(journal_path(job_id));
    if (!input) {
        return;
    }

    std::string line;
    while (std::getline(input, line)) {
        auto parsed = json::parse(line, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object() ||
            !parsed.contains("i") || !parsed["i"].is_number_unsigned() ||
            !parsed.contains("c") || !parsed["c"].is_string() ||
            !parsed.contains("n") || !parsed["n"].is_number_unsigned()) {
            continue;
        }
        const auto index = parsed["i"].get<std::size_t>();
        if (index >= entry.total_chunks || entry.chunks.count(index) > 0) {
            continue;
        }
        ChunkRecord record{parsed["c"].get<std::string>(), parsed["n"].get<std::uint64_t>()};
        entry.bytes += record.length;
        entry.chunks.emplace(index, std::move(record));
    }
}

} // namespace scingest::upload
