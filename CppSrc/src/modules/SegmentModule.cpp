#include "../../include/modules/SegmentModule.h"
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

class SegmentModule : public core::IAnalysisModule {
public:
    std::string getName() const override { return "Segments"; }
    std::string getVersion() const override { return "1.0.0"; }

    std::vector<std::string> getDependencies() const override { return {"Energy"}; }

    bool initialize(const nlohmann::json& config) override {
        if (config.contains("minLength")) m_cfg.minLength = config["minLength"].get<double>();
        if (config.contains("maxLength")) m_cfg.maxLength = config["maxLength"].get<double>();
        if (config.contains("maxSegments")) m_cfg.maxSegments = config["maxSegments"].get<int>();
        if (config.contains("minGap")) m_cfg.minGap = config["minGap"].get<double>();
        if (config.contains("extendTolerance")) m_cfg.extendTolerance = config["extendTolerance"].get<double>();
        return m_cfg.minLength > 0.0 && m_cfg.maxLength >= m_cfg.minLength && m_cfg.minGap >= 0.0;
    }

    void reset() override {}

    nlohmann::json process(const core::AudioBuffer& /*audio*/, const core::AnalysisContext& context) override {
        auto energyResult = context.getModuleResult("Energy");
        if (!energyResult) {
            throw std::runtime_error("Segments requires the Energy result");
        }
        const EnergyCurve curve = EnergyCurve::fromResult(*energyResult);

        std::vector<Candidate> candidates = findCandidates(curve);
        std::vector<Candidate> selected = selectSeparated(candidates, curve.frameRate());

        std::sort(selected.begin(), selected.end(),
                  [](const Candidate& a, const Candidate& b) { return a.startFrame < b.startFrame; });

        size_t primary = 0;
        for (size_t i = 1; i < selected.size(); ++i) {
            if (selected[i].energy > selected[primary].energy) primary = i;
        }

        nlohmann::json segments = nlohmann::json::array();
        for (size_t i = 0; i < selected.size(); ++i) {
            const auto& c = selected[i];
            segments.push_back(core::AudioSegment::make(
                curve.toSeconds(c.startFrame), curve.toSeconds(c.endFrame), c.energy * 100.0,
                "segment_" + std::to_string(i + 1), i == primary));
        }

        std::cout << "[Segments] " << candidates.size() << " candidate windows, "
                  << selected.size() << " selected" << std::endl;
        return {{"segments", segments}, {"candidateCount", candidates.size()}};
    }

    bool validateOutput(const nlohmann::json& output) const override {
        if (!output.contains("segments") || !output["segments"].is_array()) return false;
        int primaries = 0;
        for (const auto& s : output["segments"]) {
            if (s["end_time"].get<double>() <= s["start_time"].get<double>()) return false;
            if (s["is_primary"].get<bool>()) ++primaries;
        }
        return primaries <= 1 && static_cast<int>(output["segments"].size()) <= std::max(0, m_cfg.maxSegments);
    }

private:
    struct Candidate {
        size_t startFrame;
        size_t endFrame;
        double energy;
    };

    SegmentConfig m_cfg{};

    /**
     * @brief Slides a mid-length window with 75% overlap and extends each window
     * toward maxLength while its mean stays within tolerance of the best mean.
     */
    std::vector<Candidate> findCandidates(const EnergyCurve& curve) const {
        std::vector<Candidate> candidates;
        const size_t n = curve.size();
        const double fps = curve.frameRate();
        if (n == 0 || fps <= 0.0 || m_cfg.maxSegments <= 0) return candidates;

        const size_t minFrames = std::max<size_t>(1, static_cast<size_t>(std::llround(m_cfg.minLength * fps)));
        const size_t maxFrames = std::max(minFrames, static_cast<size_t>(std::llround(m_cfg.maxLength * fps)));
        const size_t windowFrames = (minFrames + maxFrames) / 2;
        const size_t step = std::max<size_t>(1, windowFrames / 4);
        const size_t extendStep = std::max<size_t>(1, step / 2);

        for (size_t start = 0; start + windowFrames <= n; start += step) {
            size_t bestEnd = start + windowFrames;
            double bestMean = curve.mean(start, bestEnd);
            const size_t limit = std::min(start + maxFrames, n);
            for (size_t end = bestEnd + extendStep; end <= limit; end += extendStep) {
                double m = curve.mean(start, end);
                if (m < bestMean * m_cfg.extendTolerance) break;
                bestEnd = end;
                bestMean = std::max(bestMean, m);
            }
            candidates.push_back({start, bestEnd, curve.mean(start, bestEnd)});
        }

        // Track shorter than the sliding window but long enough for one segment
        if (candidates.empty() && n >= minFrames) {
            size_t end = std::min(n, maxFrames);
            candidates.push_back({0, end, curve.mean(0, end)});
        }
        return candidates;
    }

    /**
     * @brief Greedy acceptance by descending energy; ties keep the earlier window.
     */
    std::vector<Candidate> selectSeparated(std::vector<Candidate> candidates, double fps) const {
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const Candidate& a, const Candidate& b) { return a.energy > b.energy; });

        std::vector<Candidate> selected;
        for (const auto& cand : candidates) {
            if (static_cast<int>(selected.size()) >= m_cfg.maxSegments) break;
            const double cs = cand.startFrame / fps;
            const double ce = cand.endFrame / fps;
            bool separated = std::all_of(selected.begin(), selected.end(), [&](const Candidate& sel) {
                const double ss = sel.startFrame / fps;
                const double se = sel.endFrame / fps;
                return ce + m_cfg.minGap <= ss || cs >= se + m_cfg.minGap;
            });
            if (separated) selected.push_back(cand);
        }
        return selected;
    }
};

std::unique_ptr<core::IAnalysisModule> createSegmentModule() {
    return std::make_unique<SegmentModule>();
}

} // namespace vmx::modules
