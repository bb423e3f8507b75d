#ifndef VIDMIX_SEGMENTMODULE_H
#define VIDMIX_SEGMENTMODULE_H

#include <memory>
#include <nlohmann/json.hpp>

namespace vmx {
    namespace core {
        class IAnalysisModule;
    }
    namespace modules {

        /**
         * @brief Configuration of the high-energy segment search.
         */
        struct SegmentConfig {
            double minLength = 30.0;        ///< seconds
            double maxLength = 60.0;        ///< seconds
            int maxSegments = 3;
            double minGap = 10.0;           ///< seconds between accepted segments
            double extendTolerance = 0.95;  ///< extension stops below tolerance * best mean
        };

        /**
         * @brief Creates the segment module ("Segments"), which depends on "Energy".
         */
        std::unique_ptr<core::IAnalysisModule> createSegmentModule();

    } // namespace modules
} // namespace vmx

#endif //VIDMIX_SEGMENTMODULE_H
