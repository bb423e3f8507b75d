#include "../../include/modules/TempoModule.h"
#include "../../include/core/IAnalysisModule.h"
#include "../../include/core/AudioBuffer.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <cmath>
#include <algorithm>
#include <iostream>
#include <string>
// QM-DSP (Queen Mary) beat tracking
#include <dsp/onsets/DetectionFunction.h>
#include <dsp/tempotracking/TempoTrackV2.h>
#include <maths/MathUtilities.h>

namespace vmx::modules {

class TempoModule : public core::IAnalysisModule {
public:
    std::string getName() const override { return "Tempo"; }
    std::string getVersion() const override { return "1.0.0-qmdsp"; }

    bool initialize(const nlohmann::json& config) override {
        if (config.contains("fallbackBpm")) m_cfg.fallbackBpm = config["fallbackBpm"].get<double>();
        if (config.contains("minBPM")) m_cfg.minBPM = config["minBPM"].get<double>();
        if (config.contains("maxBPM")) m_cfg.maxBPM = config["maxBPM"].get<double>();
        if (config.contains("minDuration")) m_cfg.minDuration = config["minDuration"].get<double>();
        return m_cfg.fallbackBpm > 0.0 && m_cfg.minBPM > 0.0 && m_cfg.maxBPM >= 2.0 * m_cfg.minBPM;
    }

    void reset() override {}

    nlohmann::json process(const core::AudioBuffer& audio, const core::AnalysisContext& context) override {
        const float sr = audio.getSampleRate() > 0.0f ? audio.getSampleRate() : context.sampleRate;
        const double duration = audio.getDuration();
        if (duration < m_cfg.minDuration) {
            std::cerr << "[Tempo] Signal too short for beat tracking (" << duration << "s), using fallback" << std::endl;
            return makeFallback();
        }

        std::vector<double> beats;
        try {
            beats = trackBeats(audio.getMono(), sr, duration);
        } catch (const std::exception& e) {
            std::cerr << "[Tempo] Beat tracking failed: " << e.what() << ", using fallback" << std::endl;
            return makeFallback();
        }

        if (beats.size() < 2) {
            std::cerr << "[Tempo] No beats detected, using fallback" << std::endl;
            return makeFallback();
        }

        std::vector<double> intervals;
        intervals.reserve(beats.size() - 1);
        for (size_t i = 1; i < beats.size(); ++i) {
            double ibi = beats[i] - beats[i - 1];
            if (ibi > 0.0) intervals.push_back(ibi);
        }
        if (intervals.empty()) return makeFallback();

        std::nth_element(intervals.begin(), intervals.begin() + intervals.size() / 2, intervals.end());
        double medianInterval = intervals[intervals.size() / 2];
        double bpm = foldIntoRange(60.0 / medianInterval);

        return {
            {"bpm", bpm},
            {"method", "qm-dsp"},
            {"beatInterval", 60.0 / bpm},
            {"beats", beats}
        };
    }

    bool validateOutput(const nlohmann::json& output) const override {
        return output.contains("bpm") && output["bpm"].is_number() && output["bpm"].get<double>() > 0.0 &&
               output.contains("beats") && output["beats"].is_array();
    }

private:
    TempoConfig m_cfg{};

    nlohmann::json makeFallback() const {
        return {
            {"bpm", m_cfg.fallbackBpm},
            {"method", "fallback"},
            {"beatInterval", 60.0 / m_cfg.fallbackBpm},
            {"beats", nlohmann::json::array()}
        };
    }

    double foldIntoRange(double bpm) const {
        while (bpm < m_cfg.minBPM) bpm *= 2.0;
        while (bpm > m_cfg.maxBPM) bpm *= 0.5;
        return bpm;
    }

    std::vector<double> trackBeats(const std::vector<float>& mono, float sr, double duration) const;
};

/**
 * @brief Beat times in seconds through the qm-dsp detection function and TempoTrackV2.
 *
 * Step and window sizes use the integer math of the Queen Mary beat analyzer:
 * step = sr * 0.01161, window = next power of two of sr / 50 (at least 256).
 */
std::vector<double> TempoModule::trackBeats(const std::vector<float>& mono, float sr, double duration) const {
    constexpr float kStepSecs = 0.01161f;

    const int sampleRate = static_cast<int>(std::lround(sr));
    const int stepSize = std::max(1, static_cast<int>(sampleRate * kStepSecs));
    int windowSize = MathUtilities::nextPowerOfTwo(sampleRate / 50);
    if (windowSize < 256) windowSize = 256;

    if (mono.size() < static_cast<size_t>(windowSize)) return {};

    DFConfig cfg{};
    cfg.DFType = DF_COMPLEXSD;
    cfg.stepSize = stepSize;
    cfg.frameLength = windowSize;
    cfg.dbRise = 3;
    cfg.adaptiveWhitening = false;
    cfg.whiteningRelaxCoeff = -1;
    cfg.whiteningFloor = -1;

    DetectionFunction det(cfg);

    std::vector<double> detection;
    detection.reserve(1 + (mono.size() - static_cast<size_t>(windowSize)) / static_cast<size_t>(stepSize));
    std::vector<double> frame(windowSize, 0.0);

    for (size_t start = 0; start + static_cast<size_t>(windowSize) <= mono.size(); start += static_cast<size_t>(stepSize)) {
        // qm-dsp applies its own window
        for (int i = 0; i < windowSize; ++i) frame[i] = static_cast<double>(mono[start + i]);
        detection.push_back(det.processTimeDomain(frame.data()));
    }

    int nonZeroCount = static_cast<int>(detection.size());
    while (nonZeroCount > 0 && detection[nonZeroCount - 1] <= 0.0) {
        --nonZeroCount;
    }
    if (nonZeroCount <= 2) return {};

    // The first two detection values are transients of the detector itself
    std::vector<double> df(detection.begin() + 2, detection.begin() + nonZeroCount);
    std::vector<double> beatPeriod(df.size(), 0.0);

    TempoTrackV2 tt(static_cast<float>(sampleRate), stepSize);
    tt.calculateBeatPeriod(df, beatPeriod);

    std::vector<double> beatFrames;
    tt.calculateBeats(df, beatPeriod, beatFrames);

    std::vector<double> beatTimes;
    beatTimes.reserve(beatFrames.size());
    for (double beat : beatFrames) {
        double samplePos = beat * stepSize + stepSize / 2.0;
        double t = samplePos / static_cast<double>(sampleRate);
        if (t >= 0.0 && t <= duration + 1e-6) {
            beatTimes.push_back(t);
        }
    }
    return beatTimes;
}

std::unique_ptr<core::IAnalysisModule> createTempoModule() {
    return std::make_unique<TempoModule>();
}

} // namespace vmx::modules
