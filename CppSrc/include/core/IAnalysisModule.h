#pragma once

#include <memory>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace vmx::core {

class AudioBuffer;

/**
 * @brief Data shared between the analysis modules of one track.
 *
 * Holds the sample rate, the global analysis settings and the results of the
 * modules that already ran, so dependent modules can build on them.
 */
class AnalysisContext {
public:
    /** @brief Sample rate of the analyzed signal in Hz. */
    float sampleRate = 22050.0f;

    /** @brief Results (as JSON) of the modules executed so far, keyed by module name. */
    std::map<std::string, nlohmann::json> moduleResults;

    /** @brief Global analysis parameters (segment bounds, gap, ...). */
    nlohmann::json globalConfig;

    /**
     * @brief Retrieves the result of a module that already ran.
     * @param moduleName Name of the dependency.
     * @return The result, or std::nullopt if the module did not run.
     */
    std::optional<nlohmann::json> getModuleResult(const std::string& moduleName) const {
        auto it = moduleResults.find(moduleName);
        if (it != moduleResults.end()) {
            return it->second;
        }
        return std::nullopt;
    }
};

/**
 * @brief Base interface for every track analysis module.
 *
 * A module owns a single concern (tempo, energy curve, segment search, ...)
 * and declares the modules it depends on so the pipeline can order them.
 */
class IAnalysisModule {
public:
    virtual ~IAnalysisModule() = default;

    /**
     * @brief Unique module name, also the key of its result in the context.
     */
    virtual std::string getName() const = 0;

    virtual std::string getVersion() const = 0;

    /**
     * @brief Applies module configuration. Called before every analysis run.
     * @param config Module specific settings; missing keys keep their defaults.
     * @return true on success, false if the configuration is unusable.
     */
    virtual bool initialize(const nlohmann::json& config) = 0;

    /**
     * @brief Drops any state kept from a previous track.
     */
    virtual void reset() = 0;

    /**
     * @brief Runs the analysis.
     *
     * @param audio The decoded track.
     * @param context Shared context holding the dependency results.
     * @return The module result as JSON.
     */
    virtual nlohmann::json process(const AudioBuffer& audio,
                                   const AnalysisContext& context) = 0;

    /**
     * @brief Checks that a result produced by process() has the expected shape.
     */
    virtual bool validateOutput(const nlohmann::json& output) const = 0;

    /**
     * @brief Names of the modules whose results this module reads.
     */
    virtual std::vector<std::string> getDependencies() const {
        return {};
    }
};

} // namespace vmx::core
