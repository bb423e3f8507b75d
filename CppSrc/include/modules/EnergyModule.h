#ifndef VIDMIX_ENERGYMODULE_H
#define VIDMIX_ENERGYMODULE_H

#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

namespace vmx {
    namespace core {
        class IAnalysisModule;
    }
    namespace modules {

        /**
         * @brief Configuration of the composite energy curve.
         */
        struct EnergyConfig {
            size_t hopSize = 512;
            size_t frameSize = 2048;

            /** @brief Upper bound of the moving-average kernel (frames). */
            size_t maxSmoothingFrames = 21;

            float rmsWeight = 0.4f;
            float centroidWeight = 0.3f;
            float fluxWeight = 0.3f;
        };

        /**
         * @brief Scales values to [0,1]; a zero-range input yields all zeros.
         */
        std::vector<float> normalizeCurve(const std::vector<float>& values);

        /**
         * @brief Centered moving average with zero padding at the edges.
         *
         * Kernel size is min(maxKernel, size / 5), forced odd. Curves of 10
         * frames or fewer are returned unchanged.
         */
        std::vector<float> smoothCurve(const std::vector<float>& values, size_t maxKernel);

        /**
         * @brief Creates the energy module ("Energy").
         *
         * Combines loudness (RMS), brightness (spectral centroid) and punch
         * (positive log spectral flux) into one smoothed 0-1 curve.
         */
        std::unique_ptr<core::IAnalysisModule> createEnergyModule();

    } // namespace modules
} // namespace vmx

#endif //VIDMIX_ENERGYMODULE_H
