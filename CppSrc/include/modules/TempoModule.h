#ifndef VIDMIX_TEMPOMODULE_H
#define VIDMIX_TEMPOMODULE_H

#include <memory>
#include <nlohmann/json.hpp>

namespace vmx {
    namespace core {
        class IAnalysisModule;
    }
    namespace modules {

        /**
         * @brief Configuration of the beat tracking module.
         */
        struct TempoConfig {
            /** @brief Tempo reported when beat tracking fails (default: 120). */
            double fallbackBpm = 120.0;

            /** @brief Tracked tempi are folded by octaves into [minBPM, maxBPM]. */
            double minBPM = 60.0;
            double maxBPM = 200.0;

            /** @brief Signals shorter than this are not tracked (seconds). */
            double minDuration = 3.0;
        };

        /**
         * @brief Creates the beat tracking module ("Tempo").
         *
         * Beats come from the qm-dsp complex spectral difference detection
         * function and TempoTrackV2; the tempo is 60 / median inter-beat interval.
         */
        std::unique_ptr<core::IAnalysisModule> createTempoModule();

    } // namespace modules
} // namespace vmx

#endif //VIDMIX_TEMPOMODULE_H
