#include "scingest/upload/job_registry.hpp"

namespace scingest::upload {

std::shared_ptr<JobRecord> JobRegistry::insert(UploadJobConfig config) {
    const std::string job_id = config.job_id;
    auto record = std::make_shared<JobRecord>(std::move(config));

    std::unique_lock lock(mutex_);
    auto [it, inserted] = jobs_.emplace(job_id, record);
    if (!inserted) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<JobRecord> JobRegistry::find(const std::string& job_id) const {
    std::shared_lock lock(mutex_);
    auto it = jobs_.find(job_id);
    return it != jobs_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<JobRecord>> JobRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<JobRecord>> records;
    records.reserve(jobs_.size());
    for (const auto& [id, record] : jobs_) {
        records.push_back(record);
    }
    return records;
}

bool JobRegistry::erase(const std::string& job_id) {
    std::unique_lock lock(mutex_);
    return jobs_.erase(job_id) > 0;
}

std::size_t JobRegistry::size() const {
    std::shared_lock lock(mutex_);
    return jobs_.size();
}

} // namespace scingest::upload
