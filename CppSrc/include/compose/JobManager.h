#pragma once

#include "CompositionPipeline.h"
#include "JobRegistry.h"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vmx::compose {

/**
 * @brief Runs composition jobs on background threads and records them in a JobRegistry.
 *
 * One thread and one cancellation flag per job. The destructor waits for every
 * job still running.
 */
class JobManager {
public:
    using JobObserver = std::function<void(const std::string& jobId, const core::JobProgress&)>;

    JobManager(core::MixConfig config, ITranscoder& transcoder, SourceCache& sources,
               JobRegistry& registry, std::vector<ICommentaryProvider*> voiceProviders = {});
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    /**
     * @brief Registers a pending job and starts it.
     * @param outputName Export file name without extension; the configured name when empty.
     * @return The job id.
     */
    std::string submit(const core::MixPlan& plan, const std::string& outputName = "");

    /**
     * @brief Requests cooperative cancellation.
     * @return false if the job is unknown to this manager.
     */
    bool cancel(const std::string& jobId);

    /**
     * @brief Blocks until the job's thread ends and returns its final record.
     */
    std::optional<core::CompositionJob> wait(const std::string& jobId);

    void waitAll();

    /** @brief Jobs submitted and not yet waited for. */
    size_t runningCount() const;

    /** @brief Additional observer called after the registry was updated. */
    void setObserver(JobObserver observer);

private:
    struct Running {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    core::MixConfig m_config;
    ITranscoder& m_transcoder;
    SourceCache& m_sources;
    JobRegistry& m_registry;
    std::vector<ICommentaryProvider*> m_voiceProviders;

    mutable std::mutex m_mutex;
    std::map<std::string, Running> m_running;
    JobObserver m_observer;
    unsigned m_counter = 0;
};

} // namespace vmx::compose
