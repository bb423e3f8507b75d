#pragma once

#include "../core/IAnalysisModule.h"
#include "../core/AudioBuffer.h"
#include <memory>
#include <vector>
#include <map>
#include <functional>
#include <nlohmann/json.hpp>

namespace vmx::pipeline {

/**
 * @brief Type definition for a progress reporting callback function.
 *
 * @param module The name of the module currently running.
 * @param progress The current progress, between 0.0 and 1.0.
 */
using ProgressCallback = std::function<void(const std::string& module, float progress)>;

/**
 * @brief Runs the track analysis modules in dependency order.
 *
 * It is responsible for module registration, configuration, dependency resolution,
 * and sequencing the execution of all enabled analysis modules.
 */
class AnalysisPipeline {
public:
    AnalysisPipeline();
    ~AnalysisPipeline();

    // Module registration
    /**
     * @brief Registers a pre-instantiated analysis module with the pipeline.
     *
     * A module registered under an existing name replaces the previous one.
     * @param module A unique pointer to the IAnalysisModule instance.
     */
    void registerModule(std::unique_ptr<core::IAnalysisModule> module);

    bool hasModule(const std::string& name) const;

    // Module management
    /**
     * @brief Enables or disables a registered module.
     *
     * Only enabled modules will be executed during the analysis phase.
     * @param name The unique name of the module.
     * @param enabled If true, the module is enabled; otherwise, it is disabled (default is true).
     */
    void enableModule(const std::string& name, bool enabled = true);

    // Configuration
    /**
     * @brief Merges settings into the global configuration seen by every module
     * through AnalysisContext::globalConfig.
     */
    void setGlobalConfig(const nlohmann::json& config);

    /**
     * @brief Sets the configuration passed to a module's initialize().
     */
    void setModuleConfig(const std::string& moduleName, const nlohmann::json& config);

    // Processing
    /**
     * @brief Executes the full analysis pipeline on the provided audio buffer.
     *
     * The modules are executed in an order determined by their dependencies.
     * @param audio The decoded track.
     * @param progress An optional callback function to report analysis progress.
     * @return The analysis report built by core::JsonContract.
     * @throw core::AnalysisError naming the failing module, or "pipeline" when
     * nothing can be executed.
     */
    nlohmann::json analyze(const core::AudioBuffer& audio,
                           ProgressCallback progress = nullptr);

    /**
     * @brief Raw module results of the last analyze() call, keyed by module name.
     */
    const std::map<std::string, nlohmann::json>& getLastResults() const { return m_lastResults; }

    // Dependency resolution
    /**
     * @brief Determines the order in which the enabled modules must run.
     *
     * Uses topological sorting to find the valid execution sequence.
     * @return Module names in execution order, empty if a cycle exists.
     */
    std::vector<std::string> getExecutionOrder() const;

    /**
     * @brief Checks that the enabled modules form an acyclic graph whose
     * dependencies are all registered.
     */
    bool validateDependencies() const;

private:
    struct ModuleInfo {
        std::unique_ptr<core::IAnalysisModule> module;
        nlohmann::json config;
        bool enabled = true;
        std::vector<std::string> dependencies;
    };

    std::map<std::string, ModuleInfo> m_modules;
    nlohmann::json m_globalConfig;
    std::map<std::string, nlohmann::json> m_lastResults;

    /**
     * @brief Performs a topological sort of the enabled modules (Kahn's algorithm).
     */
    std::vector<std::string> topologicalSort() const;

    bool hasCycles() const;

    /**
     * @brief Executes one module and validates its output.
     */
    nlohmann::json executeModule(const std::string& name,
                                 const core::AudioBuffer& audio,
                                 core::AnalysisContext& context);
};

/**
 * @brief Builder for the standard track analysis pipeline.
 *
 * Each withX() registers the module if needed and records its configuration.
 */
class PipelineBuilder {
public:
    /**
     * @brief Beat tracking, reporting fallbackBpm when tracking fails.
     */
    PipelineBuilder& withTempo(double fallbackBpm = 120.0);

    /**
     * @brief Composite energy curve.
     * @param hopSize Hop between frames in samples.
     * @param frameSize FFT frame size in samples.
     * @param maxSmoothingFrames Upper bound of the moving-average kernel.
     */
    PipelineBuilder& withEnergy(size_t hopSize = 512, size_t frameSize = 2048,
                                size_t maxSmoothingFrames = 21);

    /**
     * @brief High-energy segment search over the energy curve.
     */
    PipelineBuilder& withSegments(double minLength = 30.0, double maxLength = 60.0,
                                  int maxSegments = 3, double minGap = 10.0);

    /**
     * @brief Popularity/energy highlight window with beat and phrase alignment.
     * @param length Target highlight length in seconds.
     * @param minAlignedLength Alignment is abandoned below this length.
     */
    PipelineBuilder& withHighlight(double length = 45.0, double minAlignedLength = 40.0);

    /**
     * @brief Merges per-module configuration keyed by module name.
     */
    PipelineBuilder& withConfig(const nlohmann::json& config);

    std::unique_ptr<AnalysisPipeline> build();

private:
    AnalysisPipeline& pipeline();

    std::unique_ptr<AnalysisPipeline> m_pipeline;
    nlohmann::json m_config = nlohmann::json::object();
};

} // namespace vmx::pipeline
