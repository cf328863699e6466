#pragma once

#include "scingest/core/error.hpp"
#include "scingest/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace scingest::upload {

/**
 * @brief Server-side staging area for received chunks
 *
 * Layout: <staging_root>/<job_id>/chunk_000042. Chunk bytes are first
 * staged under <staging_root>/.incoming and only renamed into the job
 * directory by publish(), so a chunk file that exists is complete and a
 * staged write never creates a job directory on its own.
 */
class ChunkStore {
public:
    explicit ChunkStore(std::filesystem::path staging_root);

    /**
     * @brief Write chunk bytes to a private file outside the job directory
     *
     * RETURNS: path of the staged file, to be passed to publish() or discard()
     */
    UploadResult<std::filesystem::path> stage(const std::string& job_id, std::size_t index,
                                              const std::vector<std::uint8_t>& data);

    // Rename a staged file into place as chunk `index`; the staged file is gone either way.
    UploadResult<void> publish(const std::filesystem::path& staged, const std::string& job_id,
                               std::size_t index);

    void discard(const std::filesystem::path& staged);

    // stage() followed by publish().
    UploadResult<void> write(const std::string& job_id, std::size_t index,
                             const std::vector<std::uint8_t>& data);

    UploadResult<std::vector<std::uint8_t>> read(const std::string& job_id, std::size_t index) const;

    [[nodiscard]] bool has(const std::string& job_id, std::size_t index) const;

    /**
     * @brief Concatenate every chunk of the manifest into `destination`
     *
     * Written to a sibling temporary file first, then renamed.
     *
     * RETURNS: checksum of the assembled file
     */
    UploadResult<std::string> assemble(const std::string& job_id,
                                       const ChunkManifest& manifest,
                                       const std::filesystem::path& destination) const;

    /**
     * @brief Move the staged chunks of `from_job` under `to_job`
     */
    UploadResult<void> adopt(const std::string& from_job, const std::string& to_job);

    void remove(const std::string& job_id);

    [[nodiscard]] std::filesystem::path job_dir(const std::string& job_id) const;
    [[nodiscard]] std::filesystem::path chunk_path(const std::string& job_id, std::size_t index) const;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return staging_root_; }

private:
    std::filesystem::path incoming_dir() const;
    static UploadResult<void> ensure_directory(const std::filesystem::path& dir);

    std::filesystem::path staging_root_;
};

} // namespace scingest::upload
