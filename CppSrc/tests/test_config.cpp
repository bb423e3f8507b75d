#include <iostream>
#include <string>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include "../include/core/JsonContract.h"
#include "../include/core/MixConfig.h"
#include "../include/core/MixTypes.h"
#include "../include/core/StrategyChain.h"
#include "../include/core/TempDir.h"

using vmx::core::MixConfig;
using vmx::core::JsonContract;
using vmx::core::JobStatus;

bool test_config_defaults_and_clamps() {
    try {
        MixConfig defaults = MixConfig::fromJson(nlohmann::json::object());
        if (defaults.exports.crossfadeDuration != 3.5 || defaults.sequencing.maxConsecutive != 2 ||
            defaults.analysis.maxSegments != 3 || defaults.commentary.enabled) {
            std::cerr << "Unexpected defaults" << std::endl;
            return false;
        }

        nlohmann::json j = {
            {"analysis", {{"minSegmentLength", 40.0}, {"maxSegmentLength", 20.0}}},
            {"sequencing", {{"maxConsecutive", 0}, {"strategy", "tempo_smooth"}}},
            {"export", {{"crossfadeDuration", -2.0}, {"quality", "1080p"}, {"minSegments", 0}}},
            {"commentary", {{"duckLevel", 0.9}, {"voiceGain", 1.0}, {"frequency", "frequent"}, {"energyCues", false}}}
        };
        MixConfig cfg = MixConfig::fromJson(j);

        bool ok = true;
        ok &= cfg.analysis.maxSegmentLength == 40.0;
        ok &= cfg.sequencing.maxConsecutive == 1;
        ok &= cfg.sequencing.strategy == "tempo_smooth";
        ok &= cfg.exports.crossfadeDuration == 0.0;
        ok &= cfg.exports.width() == 1920 && cfg.exports.height() == 1080;
        ok &= cfg.exports.minSegments == 1;
        ok &= cfg.commentary.duckLevel == 0.25;
        ok &= cfg.commentary.voiceGain == 2.0;
        ok &= cfg.commentary.maxTransitionCues() == 4 && !cfg.commentary.energyCues;
        if (!ok) std::cerr << "Config clamps not applied: " << cfg.toJson().dump() << std::endl;
        return ok;
    } catch (const std::exception& e) {
        std::cerr << "Exception in config test: " << e.what() << std::endl;
        return false;
    }
}

bool test_transition_cue_caps() {
    vmx::core::CommentaryConfig c;
    c.frequency = "minimal";
    int minimal = c.maxTransitionCues();
    c.frequency = "moderate";
    int moderate = c.maxTransitionCues();
    c.transitionCues = false;
    int disabled = c.maxTransitionCues();
    std::cout << "Cue caps: minimal=" << minimal << " moderate=" << moderate << " disabled=" << disabled << std::endl;
    return minimal == 0 && moderate == 2 && disabled == 0;
}

bool test_json_contract_beat_grid() {
    nlohmann::json regular = {0.5, 1.0, 1.5, 2.0, 2.5};
    nlohmann::json grid = JsonContract::compressBeatGrid(regular);
    if (!grid.is_object() || grid["type"] != "regular" || grid["count"].get<size_t>() != 5) {
        std::cerr << "Regular beats not compressed: " << grid.dump() << std::endl;
        return false;
    }
    auto expanded = JsonContract::expandBeatGrid(grid);
    if (expanded.size() != 5 || std::abs(expanded[4] - 2.5) > 1e-9) {
        std::cerr << "Expanded grid mismatch" << std::endl;
        return false;
    }

    nlohmann::json irregular = {0.5, 1.1, 1.4, 2.3};
    if (!JsonContract::compressBeatGrid(irregular).is_array()) {
        std::cerr << "Irregular beats must stay a list" << std::endl;
        return false;
    }
    return JsonContract::expandBeatGrid(irregular).size() == 4;
}

bool test_json_contract_validate() {
    std::map<std::string, nlohmann::json> results = {
        {"Energy", {{"overallEnergy", 42.0}, {"frameRate", 43.0}, {"curve", {0.1, 0.2}}, {"version", "1.0.0"}}},
        {"Segments", {{"segments", nlohmann::json::array()}, {"version", "1.0.0"}}}
    };
    nlohmann::json report = JsonContract::createOutput({{"sampleRate", 22050}}, results, "analysis_test");
    if (!JsonContract::validate(report)) {
        std::cerr << "Report failed validation: " << report.dump() << std::endl;
        return false;
    }
    if (report["analysisId"] != "analysis_test" || report.contains("tempo") || report.contains("highlight")) {
        std::cerr << "Unexpected report content" << std::endl;
        return false;
    }
    nlohmann::json broken = report;
    broken.erase("segments");
    return !JsonContract::validate(broken) && !JsonContract::validate(report, 2);
}

bool test_mix_types_json() {
    try {
        vmx::core::PlanEntry e;
        e.segment = vmx::core::AudioSegment::make(10.0, 40.0, 77.0, "segment_2", true);
        e.track.sourceId = "abc123";
        e.track.language = "tamil";
        nlohmann::json j = e;
        if (j["id"] != "abc123#segment_2" || !j["track"]["tempo_bpm"].is_null() ||
            j["segment"]["duration"].get<double>() != 30.0) {
            std::cerr << "PlanEntry JSON mismatch: " << j.dump() << std::endl;
            return false;
        }
        auto back = j.get<vmx::core::PlanEntry>();
        if (back.track.tempoBpm || back.track.language != "tamil" || !back.segment.isPrimary) {
            std::cerr << "PlanEntry did not survive JSON" << std::endl;
            return false;
        }

        bool ok = vmx::core::jobStatusFromString("concatenating") == JobStatus::Concatenating;
        ok &= vmx::core::isTerminal(JobStatus::Cancelled) && !vmx::core::isTerminal(JobStatus::Encoding);
        try {
            vmx::core::jobStatusFromString("exploded");
            ok = false;
        } catch (const std::invalid_argument&) {
        }
        return ok;
    } catch (const std::exception& e) {
        std::cerr << "Exception in mix types test: " << e.what() << std::endl;
        return false;
    }
}

bool test_strategy_chain_fallback() {
    vmx::core::StrategyChain<int> chain;
    chain.add("throws", []() -> std::optional<int> { throw std::runtime_error("boom"); })
         .add("empty", []() -> std::optional<int> { return std::nullopt; })
         .add("works", []() -> std::optional<int> { return 7; })
         .add("never", []() -> std::optional<int> { return 9; });

    auto result = chain.run();
    if (!result || *result != 7 || chain.winner() != "works") {
        std::cerr << "Wrong strategy won" << std::endl;
        return false;
    }
    if (chain.notes().size() != 2 || chain.notes()[0] != "throws: boom") {
        std::cerr << "Unexpected notes" << std::endl;
        return false;
    }

    vmx::core::StrategyChain<int> none;
    none.add("empty", []() -> std::optional<int> { return std::nullopt; });
    return !none.run() && none.winner().empty() && none.notes().size() == 1;
}

bool test_scoped_temp_dir_cleanup() {
    std::filesystem::path kept;
    {
        vmx::core::ScopedTempDir dir("vmx_test");
        kept = dir.path();
        std::ofstream(dir.file("clip.mp4")) << "x";
        if (!std::filesystem::exists(dir.file("clip.mp4"))) return false;
    }
    return !std::filesystem::exists(kept);
}
