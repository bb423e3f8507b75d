#include "../../include/modules/EnergyModule.h"
#include "../../include/core/IAnalysisModule.h"
#include "../../include/core/AudioBuffer.h"
#include <nlohmann/json.hpp>
#include <fftw3.h>
#include <vector>
#include <cmath>
#include <algorithm>
#include <numeric>
#include <iostream>
#include <stdexcept>

namespace vmx::modules {

std::vector<float> normalizeCurve(const std::vector<float>& values) {
    if (values.empty()) return {};
    auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    float range = *maxIt - *minIt;
    std::vector<float> out(values.size(), 0.0f);
    if (range < 1e-8f) {
        return out;
    }
    for (size_t i = 0; i < values.size(); ++i) {
        out[i] = (values[i] - *minIt) / range;
    }
    return out;
}

std::vector<float> smoothCurve(const std::vector<float>& values, size_t maxKernel) {
    if (values.size() <= 10 || maxKernel == 0) return values;

    size_t kernel = std::min(maxKernel, values.size() / 5);
    if (kernel % 2 == 0) kernel += 1;
    if (kernel <= 1) return values;

    const long half = static_cast<long>(kernel / 2);
    const long n = static_cast<long>(values.size());
    std::vector<float> out(values.size(), 0.0f);
    for (long i = 0; i < n; ++i) {
        double sum = 0.0;
        for (long k = i - half; k <= i + half; ++k) {
            if (k >= 0 && k < n) sum += values[k];
        }
        out[i] = static_cast<float>(sum / kernel);
    }
    return out;
}

class EnergyModule : public core::IAnalysisModule {
public:
    std::string getName() const override { return "Energy"; }
    std::string getVersion() const override { return "1.0.0"; }

    bool initialize(const nlohmann::json& config) override {
        if (config.contains("hopSize")) m_cfg.hopSize = config["hopSize"].get<size_t>();
        if (config.contains("frameSize")) m_cfg.frameSize = config["frameSize"].get<size_t>();
        if (config.contains("maxSmoothingFrames")) m_cfg.maxSmoothingFrames = config["maxSmoothingFrames"].get<size_t>();
        if (config.contains("rmsWeight")) m_cfg.rmsWeight = config["rmsWeight"].get<float>();
        if (config.contains("centroidWeight")) m_cfg.centroidWeight = config["centroidWeight"].get<float>();
        if (config.contains("fluxWeight")) m_cfg.fluxWeight = config["fluxWeight"].get<float>();
        return m_cfg.hopSize > 0 && m_cfg.frameSize >= 64;
    }

    void reset() override {}

    nlohmann::json process(const core::AudioBuffer& audio, const core::AnalysisContext& context) override {
        const float sr = audio.getSampleRate() > 0.0f ? audio.getSampleRate() : context.sampleRate;
        const size_t N = m_cfg.frameSize;
        const size_t H = m_cfg.hopSize;
        const std::vector<float> mono = audio.getMono();

        if (mono.empty()) {
            return makeResult({}, {}, sr / static_cast<float>(H));
        }

        const size_t numFrames = mono.size() >= N ? 1 + (mono.size() - N) / H : 1;

        double* in = static_cast<double*>(fftw_malloc(sizeof(double) * N));
        fftw_complex* out = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * (N / 2 + 1)));
        if (!in || !out) {
            if (in) fftw_free(in);
            if (out) fftw_free(out);
            throw std::runtime_error("FFTW allocation failed");
        }
        fftw_plan plan = fftw_plan_dft_r2c_1d(static_cast<int>(N), in, out, FFTW_ESTIMATE);

        const std::vector<float> window = core::window::hann(N);

        std::vector<float> rms(numFrames, 0.0f);
        std::vector<float> centroid(numFrames, 0.0f);
        std::vector<float> flux(numFrames, 0.0f);
        core::SpectralFrame previous;
        core::SpectralFrame current;
        current.magnitudes.resize(N / 2 + 1);

        for (size_t f = 0; f < numFrames; ++f) {
            const size_t start = f * H;
            double sumSquares = 0.0;
            for (size_t i = 0; i < N; ++i) {
                double x = (start + i < mono.size()) ? mono[start + i] : 0.0;
                sumSquares += x * x;
                in[i] = x * window[i];
            }
            rms[f] = static_cast<float>(std::sqrt(sumSquares / N));

            fftw_execute(plan);
            for (size_t k = 0; k < N / 2 + 1; ++k) {
                current.magnitudes[k] = static_cast<float>(std::hypot(out[k][0], out[k][1]));
            }
            current.timestamp = static_cast<float>(start) / sr;

            centroid[f] = current.getSpectralCentroid();
            flux[f] = previous.magnitudes.empty() ? 0.0f : current.getLogSpectralFlux(previous);
            previous = current;
        }

        fftw_destroy_plan(plan);
        fftw_free(in);
        fftw_free(out);

        const std::vector<float> rmsNorm = normalizeCurve(rms);
        const std::vector<float> centroidNorm = normalizeCurve(centroid);
        const std::vector<float> fluxNorm = normalizeCurve(flux);

        std::vector<float> energy(numFrames, 0.0f);
        for (size_t f = 0; f < numFrames; ++f) {
            energy[f] = m_cfg.rmsWeight * rmsNorm[f] +
                        m_cfg.centroidWeight * centroidNorm[f] +
                        m_cfg.fluxWeight * fluxNorm[f];
        }
        energy = smoothCurve(energy, m_cfg.maxSmoothingFrames);

        return makeResult(energy, rms, sr / static_cast<float>(H));
    }

    bool validateOutput(const nlohmann::json& output) const override {
        if (!output.contains("curve") || !output["curve"].is_array()) return false;
        if (!output.contains("frameRate") || output["frameRate"].get<double>() <= 0.0) return false;
        for (const auto& v : output["curve"]) {
            double e = v.get<double>();
            if (!std::isfinite(e) || e < -1e-6 || e > 1.0 + 1e-6) return false;
        }
        return true;
    }

private:
    EnergyConfig m_cfg{};

    nlohmann::json makeResult(const std::vector<float>& energy, const std::vector<float>& rms,
                              float frameRate) const {
        double mean = energy.empty() ? 0.0
            : std::accumulate(energy.begin(), energy.end(), 0.0) / energy.size();
        return {
            {"curve", energy},
            {"rms", rms},
            {"frameRate", frameRate},
            {"hopSize", m_cfg.hopSize},
            {"frameCount", energy.size()},
            {"overallEnergy", mean * 100.0}
        };
    }
};

std::unique_ptr<core::IAnalysisModule> createEnergyModule() {
    return std::make_unique<EnergyModule>();
}

} // namespace vmx::modules
