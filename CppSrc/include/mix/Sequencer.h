#pragma once

#include "../core/MixConfig.h"
#include "../core/MixTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace vmx::mix {

struct SequenceParams {
    std::string energyCurve = "peak_middle";   ///< peak_middle, ascending, descending, wave
    int maxConsecutive = 2;                    ///< longest allowed run of one language
    unsigned seed = 42;                        ///< seeds the tier shuffles of peak_middle

    static SequenceParams fromConfig(const core::SequencingConfig& config);
};

struct Suggestion {
    core::PlanEntry entry;
    double score = 0.0;
};

/**
 * @brief Orders plan entries for smooth musical flow and scores the result.
 *
 * Strategies: "tempo_smooth" (alias "bpm_smooth"), "language_variety",
 * "energy_curve", "balanced" (energy curve, then language variety) and "none".
 * Every call is deterministic for a given seed.
 */
class Sequencer {
public:
    explicit Sequencer(SequenceParams params = {});

    core::MixPlan sequence(const std::vector<core::PlanEntry>& entries,
                           const std::string& strategy = "balanced") const;

    /**
     * @brief Ranks candidates to follow current, best first (stable on ties).
     */
    std::vector<Suggestion> suggestNext(const core::PlanEntry& current,
                                        const std::vector<core::PlanEntry>& candidates,
                                        const std::vector<std::string>& recentLanguages = {}) const;

    /**
     * @brief BPM distance that treats half/double time as close (scaled by 1.5).
     *
     * Unknown tempo on either side costs a flat 10.
     */
    static double tempoDistance(const std::optional<double>& a, const std::optional<double>& b);

    /** @brief |e1 - e2| on 0-1 energies. */
    static double energyDistance(double e1, double e2);

    std::vector<core::PlanEntry> tempoSmooth(std::vector<core::PlanEntry> entries) const;
    std::vector<core::PlanEntry> languageVariety(std::vector<core::PlanEntry> entries) const;
    std::vector<core::PlanEntry> energyCurve(std::vector<core::PlanEntry> entries,
                                             const std::string& curve) const;

    static std::vector<core::TransitionRecord> transitions(const std::vector<core::PlanEntry>& entries);

    /**
     * @brief Mean smoothness minus 5 per window of maxConsecutive + 1 same-language entries.
     */
    static double qualityScore(const std::vector<core::PlanEntry>& entries,
                               const std::vector<core::TransitionRecord>& transitions,
                               int maxConsecutive);

    const SequenceParams& params() const { return m_params; }

private:
    SequenceParams m_params;
};

} // namespace vmx::mix
