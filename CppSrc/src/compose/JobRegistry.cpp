#include "../../include/compose/JobRegistry.h"
#include <mutex>

namespace vmx::compose {

bool JobRegistry::create(const std::string& id, int totalSegments) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (m_jobs.count(id)) return false;
    core::CompositionJob job;
    job.id = id;
    job.totalSegments = totalSegments;
    m_jobs.emplace(id, std::move(job));
    return true;
}

bool JobRegistry::apply(const std::string& id, const core::JobProgress& progress) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end() || core::isTerminal(it->second.status)) return false;

    core::CompositionJob& job = it->second;
    job.status = progress.status;
    job.progress = progress.progress;
    job.currentStage = progress.currentStage;
    job.segmentIndex = progress.segmentIndex;
    job.totalSegments = progress.totalSegments;
    if (progress.error) job.error = progress.error;
    return true;
}

bool JobRegistry::finish(const std::string& id, const core::CompositionJob& finalJob) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return false;
    const core::JobStatus current = it->second.status;
    if (core::isTerminal(current) && current != finalJob.status) return false;
    it->second = finalJob;
    it->second.id = id;
    return true;
}

std::optional<core::CompositionJob> JobRegistry::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return std::nullopt;
    return it->second;
}

std::vector<core::CompositionJob> JobRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<core::CompositionJob> jobs;
    jobs.reserve(m_jobs.size());
    for (const auto& [id, job] : m_jobs) {
        jobs.push_back(job);
    }
    return jobs;
}

bool JobRegistry::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_jobs.erase(id) > 0;
}

size_t JobRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_jobs.size();
}

} // namespace vmx::compose
