#pragma once

#include "../core/MixTypes.h"
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace vmx::compose {

/**
 * @brief Process-wide table of composition jobs.
 *
 * Readers take a shared lock and receive snapshots. Updates to a job in a
 * terminal state are ignored, so a late progress event can never resurrect a
 * finished, failed or cancelled job.
 */
class JobRegistry {
public:
    /**
     * @brief Registers a pending job.
     * @return false if the id is already known.
     */
    bool create(const std::string& id, int totalSegments = 0);

    /**
     * @brief Applies a progress event.
     * @return false if the job is unknown or already terminal.
     */
    bool apply(const std::string& id, const core::JobProgress& progress);

    /**
     * @brief Stores the final snapshot returned by the pipeline.
     *
     * Accepted while the job is non-terminal or when it already reached the
     * same terminal status (its own terminal progress event).
     */
    bool finish(const std::string& id, const core::CompositionJob& finalJob);

    std::optional<core::CompositionJob> get(const std::string& id) const;
    std::vector<core::CompositionJob> list() const;

    bool remove(const std::string& id);
    size_t size() const;

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, core::CompositionJob> m_jobs;
};

} // namespace vmx::compose
