#include "../../include/mix/Sequencer.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <numeric>
#include <random>

namespace vmx::mix {

namespace {

double energyOf(const core::PlanEntry& e) {
    return e.segment.energyScore / 100.0;
}

/**
 * @brief Length of the run of `language` at the end of the placed entries.
 */
int trailingRun(const std::vector<core::PlanEntry>& placed, const std::string& language) {
    int run = 0;
    for (auto it = placed.rbegin(); it != placed.rend() && it->track.language == language; ++it) {
        ++run;
    }
    return run;
}

/**
 * @brief Whether the entries left after taking `pick` can still be ordered without
 * a run longer than maxRun, given that the sequence then ends in `run` entries of
 * the picked language.
 *
 * Each language needs count <= maxRun * (others + 1); the picked language loses
 * the slots its trailing run already uses.
 */
bool remainderFeasible(const std::vector<core::PlanEntry>& entries, size_t pick, int run, int maxRun) {
    std::map<std::string, int> counts;
    int total = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i == pick) continue;
        ++counts[entries[i].track.language];
        ++total;
    }
    const std::string& last = entries[pick].track.language;
    for (const auto& [language, count] : counts) {
        int capacity = maxRun * (total - count + 1);
        if (language == last) capacity -= run;
        if (count > capacity) return false;
    }
    return true;
}

std::vector<core::PlanEntry> sortedByEnergy(std::vector<core::PlanEntry> entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const core::PlanEntry& a, const core::PlanEntry& b) {
        return energyOf(a) < energyOf(b);
    });
    return entries;
}

} // namespace

SequenceParams SequenceParams::fromConfig(const core::SequencingConfig& config) {
    SequenceParams params;
    params.energyCurve = config.energyCurve;
    params.maxConsecutive = std::max(1, config.maxConsecutive);
    params.seed = config.seed;
    return params;
}

Sequencer::Sequencer(SequenceParams params)
    : m_params(std::move(params)) {
    m_params.maxConsecutive = std::max(1, m_params.maxConsecutive);
}

double Sequencer::tempoDistance(const std::optional<double>& a, const std::optional<double>& b) {
    if (!a || !b) return 10.0;
    const double b1 = *a;
    const double b2 = *b;

    const double direct = std::abs(b1 - b2);
    const double half = b2 > b1 ? std::abs(b1 - b2 / 2.0) : std::abs(b2 - b1 / 2.0);
    const double twice = b1 < b2 ? std::abs(b1 * 2.0 - b2) : std::abs(b2 * 2.0 - b1);
    return std::min({direct, half * 1.5, twice * 1.5});
}

double Sequencer::energyDistance(double e1, double e2) {
    return std::abs(e1 - e2);
}

std::vector<core::PlanEntry> Sequencer::tempoSmooth(std::vector<core::PlanEntry> entries) const {
    if (entries.size() <= 2) return entries;

    const double mean = std::accumulate(entries.begin(), entries.end(), 0.0,
        [](double acc, const core::PlanEntry& e) { return acc + energyOf(e); }) / entries.size();

    size_t first = 0;
    for (size_t i = 1; i < entries.size(); ++i) {
        if (std::abs(energyOf(entries[i]) - mean) < std::abs(energyOf(entries[first]) - mean)) first = i;
    }

    std::vector<core::PlanEntry> ordered;
    ordered.reserve(entries.size());
    ordered.push_back(entries[first]);
    entries.erase(entries.begin() + static_cast<long>(first));

    while (!entries.empty()) {
        const auto& last = ordered.back().track.tempoBpm;
        size_t best = 0;
        double bestDistance = tempoDistance(last, entries[0].track.tempoBpm);
        for (size_t i = 1; i < entries.size(); ++i) {
            double d = tempoDistance(last, entries[i].track.tempoBpm);
            if (d < bestDistance) {
                bestDistance = d;
                best = i;
            }
        }
        ordered.push_back(entries[best]);
        entries.erase(entries.begin() + static_cast<long>(best));
    }
    return ordered;
}

std::vector<core::PlanEntry> Sequencer::languageVariety(std::vector<core::PlanEntry> entries) const {
    const int maxRun = m_params.maxConsecutive;
    if (static_cast<int>(entries.size()) <= maxRun) return entries;

    std::vector<core::PlanEntry> result;
    result.reserve(entries.size());

    while (!entries.empty()) {
        std::vector<size_t> valid;
        for (size_t i = 0; i < entries.size(); ++i) {
            if (trailingRun(result, entries[i].track.language) < maxRun) valid.push_back(i);
        }

        // Keep only picks that do not strand a language for later
        std::vector<size_t> safe;
        for (size_t i : valid) {
            const int run = trailingRun(result, entries[i].track.language) + 1;
            if (remainderFeasible(entries, i, run, maxRun)) safe.push_back(i);
        }
        if (!safe.empty()) valid = std::move(safe);

        if (valid.empty()) {
            // Relax: anything that at least breaks the current run
            for (size_t i = 0; i < entries.size(); ++i) {
                if (result.empty() || entries[i].track.language != result.back().track.language) {
                    valid.push_back(i);
                    break;
                }
            }
            if (valid.empty()) valid.push_back(0);
        }

        size_t pick = valid.front();
        if (!result.empty()) {
            const auto& last = result.back().track.tempoBpm;
            double bestDistance = tempoDistance(last, entries[pick].track.tempoBpm);
            for (size_t i : valid) {
                double d = tempoDistance(last, entries[i].track.tempoBpm);
                if (d < bestDistance) {
                    bestDistance = d;
                    pick = i;
                }
            }
        }
        result.push_back(entries[pick]);
        entries.erase(entries.begin() + static_cast<long>(pick));
    }
    return result;
}

std::vector<core::PlanEntry> Sequencer::energyCurve(std::vector<core::PlanEntry> entries,
                                                    const std::string& curve) const {
    if (curve == "ascending") return sortedByEnergy(std::move(entries));
    if (curve == "descending") {
        std::vector<core::PlanEntry> sorted = sortedByEnergy(std::move(entries));
        std::reverse(sorted.begin(), sorted.end());
        return sorted;
    }
    if (entries.size() <= 3) return entries;

    const std::vector<core::PlanEntry> sorted = sortedByEnergy(entries);
    const size_t n = sorted.size();

    if (curve == "peak_middle") {
        std::mt19937 rng(m_params.seed);
        const size_t third = n / 3;
        std::vector<core::PlanEntry> low(sorted.begin(), sorted.begin() + static_cast<long>(third));
        std::vector<core::PlanEntry> mid(sorted.begin() + static_cast<long>(third),
                                         sorted.begin() + static_cast<long>(2 * third));
        std::vector<core::PlanEntry> high(sorted.begin() + static_cast<long>(2 * third), sorted.end());
        std::shuffle(low.begin(), low.end(), rng);
        std::shuffle(mid.begin(), mid.end(), rng);
        std::shuffle(high.begin(), high.end(), rng);

        std::vector<core::PlanEntry> result;
        result.reserve(n);
        if (!mid.empty()) {
            result.push_back(mid.front());
            mid.erase(mid.begin());
        }
        std::vector<core::PlanEntry> buildup = mid;
        buildup.insert(buildup.end(), high.begin(), high.end());
        std::shuffle(buildup.begin(), buildup.end(), rng);
        result.insert(result.end(), buildup.begin(), buildup.end());
        result.insert(result.end(), low.begin(), low.end());
        return result;
    }

    if (curve == "wave") {
        std::vector<core::PlanEntry> result;
        result.reserve(n);
        const size_t half = n / 2;
        for (size_t i = 0; i < half; ++i) {
            result.push_back(sorted[i]);
            result.push_back(sorted[n - 1 - i]);
        }
        if (n % 2 == 1) result.push_back(sorted[half]);
        return result;
    }

    std::cerr << "[Sequencer] Unknown energy curve '" << curve << "', keeping input order" << std::endl;
    return entries;
}

std::vector<core::TransitionRecord> Sequencer::transitions(const std::vector<core::PlanEntry>& entries) {
    std::vector<core::TransitionRecord> records;
    for (size_t i = 0; i + 1 < entries.size(); ++i) {
        const auto& a = entries[i];
        const auto& b = entries[i + 1];
        core::TransitionRecord t;
        t.from = a.id();
        t.to = b.id();
        t.tempoDelta = tempoDistance(a.track.tempoBpm, b.track.tempoBpm);
        t.energyDelta = energyDistance(energyOf(a), energyOf(b));
        t.sameLanguage = a.track.language == b.track.language;
        t.smoothnessScore = std::clamp(100.0 - 2.0 * t.tempoDelta - 50.0 * t.energyDelta, 0.0, 100.0);
        records.push_back(t);
    }
    return records;
}

double Sequencer::qualityScore(const std::vector<core::PlanEntry>& entries,
                               const std::vector<core::TransitionRecord>& transitions,
                               int maxConsecutive) {
    if (transitions.empty()) return 100.0;

    double mean = 0.0;
    for (const auto& t : transitions) mean += t.smoothnessScore;
    mean /= static_cast<double>(transitions.size());

    const size_t window = static_cast<size_t>(std::max(1, maxConsecutive)) + 1;
    int violations = 0;
    for (size_t i = 0; i + window <= entries.size(); ++i) {
        bool same = true;
        for (size_t j = 1; j < window && same; ++j) {
            same = entries[i + j].track.language == entries[i].track.language;
        }
        if (same) ++violations;
    }
    return std::max(0.0, mean - 5.0 * violations);
}

core::MixPlan Sequencer::sequence(const std::vector<core::PlanEntry>& entries, const std::string& strategy) const {
    core::MixPlan plan;
    if (entries.empty()) {
        plan.qualityScore = 0.0;
        plan.notes.push_back("Empty playlist");
        return plan;
    }
    if (entries.size() == 1) {
        plan.entries = entries;
        plan.qualityScore = 100.0;
        plan.notes.push_back("Single segment");
        return plan;
    }

    const std::string curve = m_params.energyCurve;
    const std::string maxRun = std::to_string(m_params.maxConsecutive);

    if (strategy == "tempo_smooth" || strategy == "bpm_smooth") {
        plan.entries = tempoSmooth(entries);
        plan.notes.push_back("Optimized for tempo transitions");
    } else if (strategy == "language_variety") {
        plan.entries = languageVariety(entries);
        plan.notes.push_back("Ensured max " + maxRun + " consecutive same-language segments");
    } else if (strategy == "energy_curve") {
        plan.entries = energyCurve(entries, curve);
        plan.notes.push_back("Applied " + curve + " energy curve");
    } else if (strategy == "balanced") {
        plan.entries = languageVariety(energyCurve(entries, curve));
        plan.notes.push_back("Balanced mix: " + curve + " curve, language variety");
    } else {
        if (strategy != "none") {
            std::cerr << "[Sequencer] Unknown strategy '" << strategy << "', keeping input order" << std::endl;
        }
        plan.entries = entries;
        plan.notes.push_back("No optimization applied");
    }

    plan.transitions = transitions(plan.entries);
    plan.qualityScore = qualityScore(plan.entries, plan.transitions, m_params.maxConsecutive);
    std::cout << "[Sequencer] " << strategy << ": " << plan.size() << " entries, quality "
              << plan.qualityScore << std::endl;
    return plan;
}

std::vector<Suggestion> Sequencer::suggestNext(const core::PlanEntry& current,
                                               const std::vector<core::PlanEntry>& candidates,
                                               const std::vector<std::string>& recentLanguages) const {
    std::vector<Suggestion> scored;
    scored.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        double score = 50.0;
        score += std::max(0.0, 30.0 - tempoDistance(current.track.tempoBpm, candidate.track.tempoBpm));
        score += std::max(0.0, 20.0 - 40.0 * energyDistance(energyOf(current), energyOf(candidate)));
        if (candidate.track.language != current.track.language) score += 10.0;
        if (std::find(recentLanguages.begin(), recentLanguages.end(), candidate.track.language) ==
            recentLanguages.end()) {
            score += 5.0;
        }
        scored.push_back({candidate, score});
    }
    std::stable_sort(scored.begin(), scored.end(), [](const Suggestion& a, const Suggestion& b) {
        return a.score > b.score;
    });
    return scored;
}

} // namespace vmx::mix
