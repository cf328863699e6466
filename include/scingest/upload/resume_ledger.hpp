#pragma once

#include "scingest/core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace scingest::upload {

enum class CommitOutcome {
    Committed,  ///< First commit of this index
    Duplicate   ///< Already committed with the same checksum; nothing changed
};

/**
 * @brief Record of which chunk indices each upload has durably received
 *
 * Each job has its own entry and lock; the map of entries is behind a
 * reader/writer lock, so commits for different jobs never contend.
 *
 * With a journal directory, each job has a journal <journal_root>/<job>.ledger.
 * Its first line is a header ({"job": id, "chunks": total, "descriptor": {...}})
 * carrying whatever the owner needs to rebuild the job after a restart. Every
 * first commit is then appended as one JSON line ({"i": index, "c": checksum,
 * "n": length}) and open() replays the file. A torn last line from a crash is
 * skipped.
 */
struct JournaledJob {
    std::string job_id;
    std::size_t total_chunks = 0;   ///< 0 when the header is missing or unreadable
    nlohmann::json descriptor;
};

class ResumeLedger {
public:
    explicit ResumeLedger(std::optional<std::filesystem::path> journal_root = std::nullopt);

    ResumeLedger(const ResumeLedger&) = delete;
    ResumeLedger& operator=(const ResumeLedger&) = delete;

    /**
     * @brief Start tracking a job; replays its journal when one exists
     *
     * Opening an already open job is a no-op when total_chunks matches.
     * `descriptor` goes into the header of a new journal.
     */
    UploadResult<void> open(const std::string& job_id, std::size_t total_chunks,
                            const nlohmann::json& descriptor = nlohmann::json::object());

    /**
     * @brief Record chunk `index` as durably stored
     *
     * ERRORS:
     * - NotFound: job not open
     * - InvalidConfig: index outside the manifest
     * - IntegrityError: index already committed with a different checksum
     */
    UploadResult<CommitOutcome> commit(const std::string& job_id,
                                       std::size_t index,
                                       const std::string& checksum,
                                       std::uint64_t length);

    [[nodiscard]] bool contains(const std::string& job_id) const;
    [[nodiscard]] bool is_committed(const std::string& job_id, std::size_t index) const;
    [[nodiscard]] std::optional<std::string> checksum_of(const std::string& job_id, std::size_t index) const;

    std::vector<std::size_t> committed(const std::string& job_id) const;
    std::vector<std::size_t> missing(const std::string& job_id) const;
    std::size_t committed_count(const std::string& job_id) const;
    std::uint64_t committed_bytes(const std::string& job_id) const;
    std::size_t total_chunks(const std::string& job_id) const;

    /**
     * @brief Copy every commit of `from_job` into the open entry `to_job`
     *
     * Used when a failed upload is continued under a new job id. Both jobs
     * must have the same chunk count.
     */
    UploadResult<std::size_t> adopt(const std::string& from_job, const std::string& to_job);

    /**
     * @brief Every journal found in the journal directory, open or not
     *
     * Empty without a journal directory.
     */
    std::vector<JournaledJob> journaled_jobs() const;

    /**
     * @brief Forget a job and delete its journal
     */
    void purge(const std::string& job_id);

private:
    struct ChunkRecord {
        std::string checksum;
        std::uint64_t length = 0;
    };

    struct Entry {
        std::mutex mutex;
        std::size_t total_chunks = 0;
        std::map<std::size_t, ChunkRecord> chunks;
        std::uint64_t bytes = 0;
        std::ofstream journal;
    };

    std::shared_ptr<Entry> find(const std::string& job_id) const;
    std::filesystem::path journal_path(const std::string& job_id) const;
    UploadResult<void> write_line(Entry& entry, const std::string& job_id, const nlohmann::json& line);
    void replay_journal(Entry& entry, const std::string& job_id) const;

    std::optional<std::filesystem::path> journal_root_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace scingest::upload
