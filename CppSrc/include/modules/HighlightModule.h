#ifndef VIDMIX_HIGHLIGHTMODULE_H
#define VIDMIX_HIGHLIGHTMODULE_H

#include <memory>
#include <nlohmann/json.hpp>

namespace vmx {
    namespace core {
        class IAnalysisModule;
    }
    namespace modules {

        /**
         * @brief Configuration of the highlight window refinement.
         */
        struct HighlightConfig {
            double length = 45.0;               ///< target window length, seconds
            double minAlignedLength = 40.0;     ///< aligned windows shorter than this are dropped
            double phraseSearchWindow = 2.0;    ///< seconds on each side of the target end
            double phraseDipRatio = 0.6;        ///< dip must be below ratio * mean RMS of the search window
            double localEnergyRatio = 0.5;      ///< popularity start kept when local >= ratio * peak
            double popularityScoreThreshold = 0.7;
        };

        /**
         * @brief Creates the highlight module ("Highlight"), which depends on "Energy" and "Tempo".
         *
         * The popularity curve, when present, is read from the global config key
         * "popularity" as an array of {start, end, score}.
         */
        std::unique_ptr<core::IAnalysisModule> createHighlightModule();

    } // namespace modules
} // namespace vmx

#endif //VIDMIX_HIGHLIGHTMODULE_H
