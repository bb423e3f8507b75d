#include "../../include/pipeline/AnalysisPipeline.h"
#include "../../include/core/JsonContract.h"
#include "../../include/core/Errors.h"
#include "../../include/modules/TempoModule.h"
#include "../../include/modules/EnergyModule.h"
#include "../../include/modules/SegmentModule.h"
#include "../../include/modules/HighlightModule.h"
#include <iostream>
#include <queue>
#include <algorithm>

namespace vmx::pipeline {

AnalysisPipeline::AnalysisPipeline()
    : m_globalConfig({
        {"version", 1},
        {"debug", false}
    })
{
}

AnalysisPipeline::~AnalysisPipeline() = default;

/**
 * @brief Registers an analysis module with the pipeline.
 *
 * The module's dependencies are extracted, and it is initially enabled.
 */
void AnalysisPipeline::registerModule(std::unique_ptr<core::IAnalysisModule> module) {
    if (!module) return;

    std::string name = module->getName();
    ModuleInfo info;
    info.module = std::move(module);
    info.dependencies = info.module->getDependencies();
    info.enabled = true;
    info.config = nlohmann::json::object();

    m_modules[name] = std::move(info);
    std::cout << "[Pipeline] Registered module: " << name << std::endl;
}

bool AnalysisPipeline::hasModule(const std::string& name) const {
    return m_modules.count(name) > 0;
}

void AnalysisPipeline::enableModule(const std::string& name, bool enabled) {
    if (m_modules.count(name)) {
        m_modules[name].enabled = enabled;
    }
}

/**
 * @brief Sets or updates the global configuration using JSON merge-patch.
 */
void AnalysisPipeline::setGlobalConfig(const nlohmann::json& config) {
    m_globalConfig.merge_patch(config);
}

void AnalysisPipeline::setModuleConfig(const std::string& moduleName,
                                        const nlohmann::json& config) {
    if (m_modules.count(moduleName)) {
        m_modules[moduleName].config = config;
    }
}

/**
 * @brief Executes the full analysis pipeline on the provided audio buffer.
 *
 * Modules are executed in dependency order (topological sort). Each result is
 * stored in the context before the next module runs.
 */
nlohmann::json AnalysisPipeline::analyze(const core::AudioBuffer& audio,
                                         ProgressCallback progress) {
    std::cout << "[Pipeline] Starting analysis..." << std::endl;
    m_lastResults.clear();

    if (audio.empty()) {
        throw core::AnalysisError("load", "audio buffer is empty");
    }

    core::AnalysisContext context;
    context.sampleRate = audio.getSampleRate();
    context.globalConfig = m_globalConfig;

    auto executionOrder = getExecutionOrder();
    if (executionOrder.empty()) {
        throw core::AnalysisError("pipeline", "No modules to execute or circular dependency detected");
    }
    if (!validateDependencies()) {
        throw core::AnalysisError("pipeline", "Enabled module depends on an unregistered module");
    }

    for (const auto& name : executionOrder) {
        auto& moduleInfo = m_modules[name];
        moduleInfo.module->reset();
        if (!moduleInfo.module->initialize(moduleInfo.config)) {
            throw core::AnalysisError(name, "Failed to initialize module");
        }
    }

    size_t moduleIndex = 0;
    for (const auto& name : executionOrder) {
        if (progress) {
            float progressValue = moduleIndex / static_cast<float>(executionOrder.size());
            progress(name, progressValue);
        }

        std::cout << "[Pipeline] Executing: " << name << std::endl;

        auto result = executeModule(name, audio, context);
        // Dependent modules read this through AnalysisContext::getModuleResult
        context.moduleResults[name] = result;

        moduleIndex++;
    }

    if (progress) {
        progress("Complete", 1.0f);
    }

    m_lastResults = context.moduleResults;

    nlohmann::json audioMetadata = {
        {"sampleRate", audio.getSampleRate()},
        {"duration", audio.getDuration()},
        {"channels", audio.getChannelCount()}
    };

    return core::JsonContract::createOutput(audioMetadata, context.moduleResults);
}

std::vector<std::string> AnalysisPipeline::getExecutionOrder() const {
    return topologicalSort();
}

bool AnalysisPipeline::validateDependencies() const {
    for (const auto& [name, info] : m_modules) {
        if (!info.enabled) continue;
        for (const auto& dep : info.dependencies) {
            if (!m_modules.count(dep)) {
                std::cerr << "[Pipeline] Module '" << name << "' depends on missing module '"
                          << dep << "'" << std::endl;
                return false;
            }
        }
    }
    return !hasCycles();
}

/**
 * @brief Kahn's algorithm over the enabled modules.
 *
 * A disabled dependency counts as met so optional modules can be switched off.
 * @return Module names in topological order, or an empty vector if a cycle is detected.
 */
std::vector<std::string> AnalysisPipeline::topologicalSort() const {
    std::vector<std::string> result;
    std::map<std::string, size_t> inDegree;
    // A -> [B, C] means A must run before B and C
    std::map<std::string, std::vector<std::string>> adjacency;

    for (const auto& [name, info] : m_modules) {
        if (!info.enabled) continue;

        inDegree[name] = 0;
        for (const auto& dep : info.dependencies) {
            if (m_modules.count(dep) && m_modules.at(dep).enabled) {
                adjacency[dep].push_back(name);
                inDegree[name]++;
            }
        }
    }

    std::queue<std::string> queue;
    for (const auto& [name, degree] : inDegree) {
        if (degree == 0) {
            queue.push(name);
        }
    }

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop();
        result.push_back(current);

        if (adjacency.count(current)) {
            for (const auto& dependent : adjacency[current]) {
                inDegree[dependent]--;
                if (inDegree[dependent] == 0) {
                    queue.push(dependent);
                }
            }
        }
    }

    if (result.size() != inDegree.size()) {
        return {};
    }

    return result;
}

bool AnalysisPipeline::hasCycles() const {
    bool anyEnabled = std::any_of(m_modules.begin(), m_modules.end(),
                                  [](const auto& entry) { return entry.second.enabled; });
    return anyEnabled && getExecutionOrder().empty();
}

nlohmann::json AnalysisPipeline::executeModule(const std::string& name,
                                               const core::AudioBuffer& audio,
                                               core::AnalysisContext& context) {
    auto& moduleInfo = m_modules[name];

    nlohmann::json result;
    try {
        result = moduleInfo.module->process(audio, context);
    } catch (const core::AnalysisError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::AnalysisError(name, e.what());
    }

    if (!moduleInfo.module->validateOutput(result)) {
        throw core::AnalysisError(name, "Module output validation failed");
    }

    result["version"] = moduleInfo.module->getVersion();
    return result;
}

// ============================================================================
// PipelineBuilder Implementation
// ============================================================================

AnalysisPipeline& PipelineBuilder::pipeline() {
    if (!m_pipeline) {
        m_pipeline = std::make_unique<AnalysisPipeline>();
    }
    return *m_pipeline;
}

PipelineBuilder& PipelineBuilder::withTempo(double fallbackBpm) {
    if (!pipeline().hasModule("Tempo")) {
        pipeline().registerModule(modules::createTempoModule());
    }

    m_config["Tempo"] = {
        {"fallbackBpm", fallbackBpm}
    };

    return *this;
}

PipelineBuilder& PipelineBuilder::withEnergy(size_t hopSize, size_t frameSize,
                                             size_t maxSmoothingFrames) {
    if (!pipeline().hasModule("Energy")) {
        pipeline().registerModule(modules::createEnergyModule());
    }

    m_config["Energy"] = {
        {"hopSize", hopSize},
        {"frameSize", frameSize},
        {"maxSmoothingFrames", maxSmoothingFrames}
    };

    return *this;
}

PipelineBuilder& PipelineBuilder::withSegments(double minLength, double maxLength,
                                               int maxSegments, double minGap) {
    if (!pipeline().hasModule("Segments")) {
        pipeline().registerModule(modules::createSegmentModule());
    }

    m_config["Segments"] = {
        {"minLength", minLength},
        {"maxLength", maxLength},
        {"maxSegments", maxSegments},
        {"minGap", minGap}
    };

    return *this;
}

PipelineBuilder& PipelineBuilder::withHighlight(double length, double minAlignedLength) {
    if (!pipeline().hasModule("Highlight")) {
        pipeline().registerModule(modules::createHighlightModule());
    }

    m_config["Highlight"] = {
        {"length", length},
        {"minAlignedLength", minAlignedLength}
    };

    return *this;
}

PipelineBuilder& PipelineBuilder::withConfig(const nlohmann::json& config) {
    m_config.merge_patch(config);
    return *this;
}

/**
 * @brief Finalizes the pipeline construction, applying all configurations.
 */
std::unique_ptr<AnalysisPipeline> PipelineBuilder::build() {
    pipeline();

    for (const auto& [moduleName, config] : m_config.items()) {
        m_pipeline->setModuleConfig(moduleName, config);
    }

    return std::move(m_pipeline);
}

} // namespace vmx::pipeline
