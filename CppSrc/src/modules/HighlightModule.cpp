#include "../../include/modules/HighlightModule.h"
#include "../../include/modules/EnergyCurve.h"
#include "../../include/core/IAnalysisModule.h"
#include "../../include/core/AudioBuffer.h"
#include "../../include/core/MixTypes.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <cmath>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace vmx::modules {

class HighlightModule : public core::IAnalysisModule {
public:
    std::string getName() const override { return "Highlight"; }
    std::string getVersion() const override { return "1.0.0"; }

    std::vector<std::string> getDependencies() const override { return {"Energy", "Tempo"}; }

    bool initialize(const nlohmann::json& config) override {
        if (config.contains("length")) m_cfg.length = config["length"].get<double>();
        if (config.contains("minAlignedLength")) m_cfg.minAlignedLength = config["minAlignedLength"].get<double>();
        if (config.contains("phraseSearchWindow")) m_cfg.phraseSearchWindow = config["phraseSearchWindow"].get<double>();
        if (config.contains("phraseDipRatio")) m_cfg.phraseDipRatio = config["phraseDipRatio"].get<double>();
        if (config.contains("localEnergyRatio")) m_cfg.localEnergyRatio = config["localEnergyRatio"].get<double>();
        if (config.contains("popularityScoreThreshold")) {
            m_cfg.popularityScoreThreshold = config["popularityScoreThreshold"].get<double>();
        }
        return m_cfg.length > 0.0 && m_cfg.phraseSearchWindow >= 0.0;
    }

    void reset() override {}

    nlohmann::json process(const core::AudioBuffer& /*audio*/, const core::AnalysisContext& context) override {
        auto energyResult = context.getModuleResult("Energy");
        if (!energyResult) {
            throw std::runtime_error("Highlight requires the Energy result");
        }
        const EnergyCurve curve = EnergyCurve::fromResult(*energyResult);
        const double duration = curve.duration();
        if (curve.empty() || duration <= 0.0) {
            return {{"available", false}};
        }

        std::vector<double> beats;
        if (auto tempo = context.getModuleResult("Tempo")) {
            beats = tempo->value("beats", std::vector<double>{});
        }

        const double length = std::min(m_cfg.length, duration);

        // Energy peak window
        const size_t windowFrames = std::max<size_t>(1, static_cast<size_t>(std::llround(length * curve.frameRate())));
        size_t peakStart = 0;
        double peakMean = -1.0;
        for (size_t s = 0; s + windowFrames <= curve.size(); ++s) {
            double m = curve.mean(s, s + windowFrames);
            if (m > peakMean) {
                peakMean = m;
                peakStart = s;
            }
        }
        if (peakMean < 0.0) peakMean = curve.mean(0, curve.size());
        double rawStart = curve.toSeconds(peakStart);
        std::string source = "energy";

        // Popularity only wins when it does not land in a quiet passage
        if (auto pop = bestPopularity(context.globalConfig)) {
            double popStart = std::clamp(pop->start, 0.0, std::max(0.0, duration - length));
            double localEnergy = curve.meanBetween(popStart, popStart + length);
            if (localEnergy >= m_cfg.localEnergyRatio * peakMean || pop->score > m_cfg.popularityScoreThreshold) {
                rawStart = popStart;
                source = "popularity";
            }
        }
        const double rawEnd = std::min(rawStart + length, duration);

        double start = alignStart(rawStart, rawEnd, beats);
        double end = alignEnd(curve, start, rawEnd, beats);
        bool aligned = true;
        if (end - start < std::min(m_cfg.minAlignedLength, length)) {
            start = rawStart;
            end = rawEnd;
            aligned = false;
        }

        core::AudioSegment highlight = core::AudioSegment::make(
            start, end, curve.meanBetween(start, end) * 100.0, "highlight", false);

        std::cout << "[Highlight] " << source << " window " << start << "s - " << end << "s"
                  << (aligned ? " (aligned)" : "") << std::endl;

        return {
            {"available", true},
            {"segment", highlight},
            {"source", source},
            {"aligned", aligned}
        };
    }

    bool validateOutput(const nlohmann::json& output) const override {
        if (!output.contains("available")) return false;
        if (!output["available"].get<bool>()) return true;
        return output.contains("segment") &&
               output["segment"]["end_time"].get<double>() > output["segment"]["start_time"].get<double>();
    }

private:
    HighlightConfig m_cfg{};

    static std::optional<core::PopularitySample> bestPopularity(const nlohmann::json& globalConfig) {
        if (!globalConfig.is_object() || !globalConfig.contains("popularity") ||
            !globalConfig["popularity"].is_array()) {
            return std::nullopt;
        }
        std::optional<core::PopularitySample> best;
        for (const auto& entry : globalConfig["popularity"]) {
            core::PopularitySample sample = entry.get<core::PopularitySample>();
            if (!best || sample.score > best->score) best = sample;
        }
        return best;
    }

    /**
     * @brief First beat inside [rawStart, rawEnd), or rawStart when there is none.
     */
    static double alignStart(double rawStart, double rawEnd, const std::vector<double>& beats) {
        auto it = std::lower_bound(beats.begin(), beats.end(), rawStart);
        if (it != beats.end() && *it < rawEnd) return *it;
        return rawStart;
    }

    /**
     * @brief Snaps the end to a clear RMS dip near rawEnd, else to the last beat before it.
     */
    double alignEnd(const EnergyCurve& curve, double alignedStart, double rawEnd,
                    const std::vector<double>& beats) const {
        const auto& rms = curve.rms();
        if (!rms.empty()) {
            const size_t lo = curve.toFrame(std::max(alignedStart, rawEnd - m_cfg.phraseSearchWindow));
            const size_t hi = std::min(rms.size(), curve.toFrame(rawEnd + m_cfg.phraseSearchWindow) + 1);
            if (hi > lo + 2) {
                double windowMean = 0.0;
                for (size_t i = lo; i < hi; ++i) windowMean += rms[i];
                windowMean /= static_cast<double>(hi - lo);

                size_t dip = hi;
                for (size_t i = lo + 1; i + 1 < hi; ++i) {
                    bool isMinimum = rms[i] <= rms[i - 1] && rms[i] <= rms[i + 1];
                    if (isMinimum && (dip == hi || rms[i] < rms[dip])) dip = i;
                }
                if (dip != hi && rms[dip] <= m_cfg.phraseDipRatio * windowMean) {
                    double t = std::min(curve.toSeconds(dip), curve.duration());
                    if (t > alignedStart) return t;
                }
            }
        }

        double end = rawEnd;
        for (double b : beats) {
            if (b > rawEnd) break;
            if (b > alignedStart) end = b;
        }
        return end;
    }
};

std::unique_ptr<core::IAnalysisModule> createHighlightModule() {
    return std::make_unique<HighlightModule>();
}

} // namespace vmx::modules
