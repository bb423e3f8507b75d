#include <iostream>
#include <string>
#include <vector>
#include <cmath>
#include "../include/mix/Sequencer.h"
#include "TestFakes.h"

using vmx::core::PlanEntry;
using vmx::mix::Sequencer;
using vmx::mix::SequenceParams;
using vmx::test::makeEntry;

namespace {

std::vector<double> tempos(const vmx::core::MixPlan& plan) {
    std::vector<double> out;
    for (const auto& e : plan.entries) out.push_back(e.track.tempoBpm.value_or(0.0));
    return out;
}

std::vector<std::string> ids(const std::vector<PlanEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) out.push_back(e.track.sourceId);
    return out;
}

int longestRun(const std::vector<PlanEntry>& entries) {
    int best = 0;
    int run = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        run = (i > 0 && entries[i].track.language == entries[i - 1].track.language) ? run + 1 : 1;
        best = std::max(best, run);
    }
    return best;
}

} // namespace

bool test_tempo_distance_half_double_time() {
    bool ok = Sequencer::tempoDistance(80.0, 160.0) == 0.0;
    ok &= Sequencer::tempoDistance(160.0, 80.0) == 0.0;
    ok &= Sequencer::tempoDistance(120.0, 124.0) == 4.0;
    ok &= Sequencer::tempoDistance(std::nullopt, 120.0) == 10.0;
    ok &= Sequencer::tempoDistance(120.0, std::nullopt) == 10.0;
    // 70 vs 150: direct 80, half |70 - 75| * 1.5 = 7.5, double |140 - 150| * 1.5 = 15
    ok &= std::abs(Sequencer::tempoDistance(70.0, 150.0) - 7.5) < 1e-9;
    ok &= Sequencer::energyDistance(0.2, 0.9) > 0.69 && Sequencer::energyDistance(0.2, 0.9) < 0.71;
    return ok;
}

bool test_sequencer_tempo_smooth() {
    Sequencer seq;
    std::vector<PlanEntry> entries = {
        makeEntry("a", 100.0, 40.0, "english"),
        makeEntry("b", 140.0, 60.0, "hindi"),
        makeEntry("c", 120.0, 50.0, "tamil"),
    };
    auto plan = seq.sequence(entries, "tempo_smooth");
    auto t = tempos(plan);
    std::cout << "Tempo smooth order: " << t[0] << " " << t[1] << " " << t[2] << std::endl;
    return t == std::vector<double>{120.0, 100.0, 140.0} &&
           plan.notes.size() == 1 && plan.notes[0] == "Optimized for tempo transitions" &&
           plan.transitions.size() == 2;
}

bool test_sequencer_descending_energy() {
    SequenceParams params;
    params.energyCurve = "descending";
    Sequencer seq(params);
    std::vector<PlanEntry> entries = {
        makeEntry("low", 120.0, 30.0, "english"),
        makeEntry("high", 120.0, 90.0, "english"),
        makeEntry("mid", 120.0, 60.0, "english"),
    };
    auto plan = seq.sequence(entries, "energy_curve");
    return ids(plan.entries) == std::vector<std::string>{"high", "mid", "low"} &&
           plan.notes[0] == "Applied descending energy curve";
}

bool test_sequencer_language_variety_bounds_runs() {
    SequenceParams params;
    params.maxConsecutive = 2;
    Sequencer seq(params);
    std::vector<PlanEntry> entries = {
        makeEntry("e1", 120.0, 50.0, "english"),
        makeEntry("e2", 121.0, 50.0, "english"),
        makeEntry("e3", 122.0, 50.0, "english"),
        makeEntry("e4", 123.0, 50.0, "english"),
        makeEntry("h1", 90.0, 50.0, "hindi"),
        makeEntry("t1", 150.0, 50.0, "tamil"),
    };
    auto plan = seq.sequence(entries, "language_variety");
    std::cout << "Language variety longest run: " << longestRun(plan.entries) << std::endl;
    return plan.entries.size() == entries.size() && longestRun(plan.entries) <= 2 &&
           plan.notes[0] == "Ensured max 2 consecutive same-language segments";
}

bool test_sequencer_language_variety_looks_ahead() {
    SequenceParams params;
    params.maxConsecutive = 2;
    Sequencer seq(params);
    // Greedy tempo order would spend both b tracks early and end on a a a
    std::vector<PlanEntry> entries = {
        makeEntry("a1", 120.0, 50.0, "A"),
        makeEntry("b1", 121.0, 50.0, "B"),
        makeEntry("b2", 122.0, 50.0, "B"),
        makeEntry("a2", 123.0, 50.0, "A"),
        makeEntry("a3", 124.0, 50.0, "A"),
        makeEntry("a4", 125.0, 50.0, "A"),
    };
    auto ordered = seq.languageVariety(entries);
    std::cout << "Look-ahead order longest run: " << longestRun(ordered) << std::endl;
    return ordered.size() == entries.size() && longestRun(ordered) <= 2;
}

bool test_sequencer_language_variety_relaxes_when_impossible() {
    Sequencer seq;
    std::vector<PlanEntry> entries;
    for (int i = 0; i < 5; ++i) entries.push_back(makeEntry("s" + std::to_string(i), 120.0, 50.0, "english"));
    auto ordered = seq.languageVariety(entries);
    return ordered.size() == 5;
}

bool test_sequencer_is_deterministic() {
    std::vector<PlanEntry> entries;
    const char* langs[] = {"english", "hindi", "tamil", "turkish"};
    for (int i = 0; i < 9; ++i) {
        entries.push_back(makeEntry("id" + std::to_string(i), 90.0 + 7.0 * i, 10.0 * (i + 1), langs[i % 4]));
    }
    SequenceParams params;
    params.seed = 1234;
    Sequencer first(params);
    Sequencer second(params);
    for (const char* strategy : {"balanced", "energy_curve", "tempo_smooth", "language_variety"}) {
        if (ids(first.sequence(entries, strategy).entries) != ids(second.sequence(entries, strategy).entries)) {
            std::cerr << "Strategy " << strategy << " is not deterministic" << std::endl;
            return false;
        }
    }

    // peak_middle keeps every entry and ends on the quietest third
    auto plan = first.sequence(entries, "energy_curve");
    if (plan.entries.size() != entries.size()) return false;
    for (size_t i = plan.entries.size() - 3; i < plan.entries.size(); ++i) {
        if (plan.entries[i].segment.energyScore > 30.0) return false;
    }
    return true;
}

bool test_sequencer_wave_alternates() {
    SequenceParams params;
    params.energyCurve = "wave";
    Sequencer seq(params);
    std::vector<PlanEntry> entries;
    for (int i = 1; i <= 5; ++i) entries.push_back(makeEntry("w" + std::to_string(i), 120.0, 10.0 * i, "english"));
    auto ordered = seq.energyCurve(entries, "wave");
    return ids(ordered) == std::vector<std::string>{"w1", "w5", "w2", "w4", "w3"};
}

bool test_sequencer_edge_cases() {
    Sequencer seq;
    auto empty = seq.sequence({}, "balanced");
    if (!empty.entries.empty() || empty.qualityScore != 0.0 || empty.notes[0] != "Empty playlist") return false;

    auto single = seq.sequence({makeEntry("one", 120.0, 50.0, "english")}, "balanced");
    if (single.entries.size() != 1 || single.qualityScore != 100.0 || single.notes[0] != "Single segment") {
        return false;
    }

    std::vector<PlanEntry> entries = {
        makeEntry("x", 120.0, 50.0, "english"),
        makeEntry("y", 120.0, 50.0, "hindi"),
    };
    auto none = seq.sequence(entries, "none");
    auto unknown = seq.sequence(entries, "shuffle_everything");
    return ids(none.entries) == ids(entries) && ids(unknown.entries) == ids(entries) &&
           none.notes[0] == "No optimization applied" && std::abs(none.qualityScore - 100.0) < 1e-9;
}

bool test_sequencer_quality_penalizes_language_runs() {
    std::vector<PlanEntry> same = {
        makeEntry("a", 120.0, 50.0, "english"),
        makeEntry("b", 120.0, 50.0, "english"),
        makeEntry("c", 120.0, 50.0, "english"),
    };
    auto transitions = Sequencer::transitions(same);
    double score = Sequencer::qualityScore(same, transitions, 2);
    std::cout << "Quality of three same-language entries: " << score << std::endl;
    return transitions.size() == 2 && transitions[0].sameLanguage &&
           transitions[0].smoothnessScore == 100.0 && std::abs(score - 95.0) < 1e-9;
}

bool test_sequencer_suggest_next() {
    Sequencer seq;
    PlanEntry current = makeEntry("now", 120.0, 60.0, "english");
    std::vector<PlanEntry> candidates = {
        makeEntry("far", 175.0, 10.0, "english"),
        makeEntry("close_other_lang", 121.0, 62.0, "hindi"),
        makeEntry("close_same_lang", 121.0, 62.0, "english"),
    };
    auto ranked = seq.suggestNext(current, candidates, {"english"});
    return ranked.size() == 3 && ranked[0].entry.track.sourceId == "close_other_lang" &&
           ranked[1].entry.track.sourceId == "close_same_lang" &&
           ranked[2].entry.track.sourceId == "far" && ranked[0].score > ranked[1].score;
}
