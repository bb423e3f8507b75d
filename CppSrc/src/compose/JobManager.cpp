#include "../../include/compose/JobManager.h"
#include "../../include/core/JsonContract.h"
#include <iostream>

namespace vmx::compose {

JobManager::JobManager(core::MixConfig config, ITranscoder& transcoder, SourceCache& sources,
                       JobRegistry& registry, std::vector<ICommentaryProvider*> voiceProviders)
    : m_config(std::move(config))
    , m_transcoder(transcoder)
    , m_sources(sources)
    , m_registry(registry)
    , m_voiceProviders(std::move(voiceProviders)) {}

JobManager::~JobManager() {
    waitAll();
}

void JobManager::setObserver(JobObserver observer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_observer = std::move(observer);
}

std::string JobManager::submit(const core::MixPlan& plan, const std::string& outputName) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const std::string jobId = core::JsonContract::generateId("job") + "_" + std::to_string(++m_counter);
    m_registry.create(jobId, static_cast<int>(plan.size()));

    core::MixConfig jobConfig = m_config;
    if (!outputName.empty()) jobConfig.exports.outputName = outputName;

    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    JobObserver observer = m_observer;

    std::thread worker([this, jobId, plan, jobConfig, cancelled, observer]() {
        CompositionPipeline pipeline(jobConfig, m_transcoder, m_sources, m_voiceProviders);
        core::CompositionJob result = pipeline.run(jobId, plan, *cancelled,
            [this, &jobId, &observer](const core::JobProgress& progress) {
                m_registry.apply(jobId, progress);
                if (observer) observer(jobId, progress);
            });
        m_registry.finish(jobId, result);
    });

    std::cout << "[Jobs] Started " << jobId << " (" << plan.size() << " segments)" << std::endl;
    m_running.emplace(jobId, Running{std::move(worker), cancelled});
    return jobId;
}

bool JobManager::cancel(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_running.find(jobId);
    if (it == m_running.end()) return false;
    it->second.cancelled->store(true);
    std::cout << "[Jobs] Cancellation requested for " << jobId << std::endl;
    return true;
}

std::optional<core::CompositionJob> JobManager::wait(const std::string& jobId) {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_running.find(jobId);
        if (it != m_running.end()) {
            worker = std::move(it->second.thread);
        }
    }
    if (worker.joinable()) {
        worker.join();
        // Cancel stays possible until the thread has ended
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running.erase(jobId);
    }
    return m_registry.get(jobId);
}

void JobManager::waitAll() {
    std::vector<std::pair<std::string, std::thread>> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [id, running] : m_running) {
            if (running.thread.joinable()) workers.emplace_back(id, std::move(running.thread));
        }
    }
    for (auto& [id, worker] : workers) {
        worker.join();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [id, worker] : workers) {
        m_running.erase(id);
    }
}

size_t JobManager::runningCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running.size();
}

} // namespace vmx::compose
