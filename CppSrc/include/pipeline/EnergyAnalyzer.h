#ifndef VIDMIX_ENERGYANALYZER_H
#define VIDMIX_ENERGYANALYZER_H

#include "AnalysisPipeline.h"
#include "../core/MixConfig.h"
#include "../core/MixTypes.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vmx::compose {
    class ITranscoder;
}

namespace vmx::pipeline {

    /**
     * @brief Tempo, energy curve, candidate segments and highlight window of one track.
     *
     * Wraps the Tempo, Energy, Segments and Highlight modules in an AnalysisPipeline
     * and converts the module results to a core::TrackAnalysis.
     */
    class EnergyAnalyzer {
    public:
        explicit EnergyAnalyzer(core::AnalysisConfig config = {});

        /**
         * @brief Analyzes decoded audio.
         *
         * @param popularity Replay intensity samples; empty selects the highlight by energy only.
         * @throw core::AnalysisError naming the failing stage.
         */
        core::TrackAnalysis analyze(const core::AudioBuffer& audio,
                                    const std::vector<core::PopularitySample>& popularity = {});

        /**
         * @brief Analyzes a mono signal.
         */
        core::TrackAnalysis analyze(const std::vector<float>& signal, float sampleRate);

        /**
         * @brief Decodes any media file to mono 16-bit PCM through the transcoder, then analyzes it.
         *
         * @param workDir Directory receiving the temporary WAV file.
         * @throw core::AnalysisError with stage "decode" or "load" when the media cannot be read.
         */
        core::TrackAnalysis analyzeFile(const std::string& mediaPath, compose::ITranscoder& transcoder,
                                        const std::string& workDir,
                                        const std::vector<core::PopularitySample>& popularity = {});

        /**
         * @brief JSON report of the last analysis (see core::JsonContract).
         */
        const nlohmann::json& lastReport() const { return m_report; }

        const core::AnalysisConfig& config() const { return m_config; }

        /**
         * @brief Converts a pipeline report plus raw module results to a TrackAnalysis.
         */
        static core::TrackAnalysis toTrackAnalysis(const nlohmann::json& report,
                                                   const std::map<std::string, nlohmann::json>& results);

    private:
        core::AnalysisConfig m_config;
        std::unique_ptr<AnalysisPipeline> m_pipeline;
        nlohmann::json m_report;
    };

} // namespace vmx::pipeline

#endif //VIDMIX_ENERGYANALYZER_H
