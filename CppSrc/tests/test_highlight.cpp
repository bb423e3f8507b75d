#include <iostream>
#include <vector>
#include <cmath>
#include "../include/core/AudioBuffer.h"
#include "../include/core/IAnalysisModule.h"
#include "../include/modules/HighlightModule.h"

using vmx::core::AudioBuffer;
using vmx::core::AnalysisContext;

namespace {

constexpr double kFps = 2.0;

// 120 s track, loud from 60 s to 105 s
AnalysisContext makeContext(const std::vector<double>& beats, bool withDip) {
    std::vector<double> curve(240, 0.2);
    for (size_t i = 120; i < 210; ++i) curve[i] = 0.9;
    std::vector<double> rms(240, 1.0);
    if (withDip) rms[207] = 0.1;  // 103.5 s

    AnalysisContext ctx;
    ctx.moduleResults["Energy"] = {{"curve", curve}, {"rms", rms}, {"frameRate", kFps}};
    ctx.moduleResults["Tempo"] = {{"bpm", 120.0}, {"beats", beats}};
    ctx.globalConfig = nlohmann::json::object();
    return ctx;
}

nlohmann::json runHighlight(const AnalysisContext& ctx, const nlohmann::json& cfg = nlohmann::json::object()) {
    auto mod = vmx::modules::createHighlightModule();
    if (!mod->initialize(cfg)) throw std::runtime_error("Highlight config rejected");
    AudioBuffer empty;
    auto out = mod->process(empty, ctx);
    if (!mod->validateOutput(out)) throw std::runtime_error("Highlight output failed validation");
    return out;
}

std::vector<double> beatGrid() {
    std::vector<double> beats;
    for (double t = 0.25; t < 120.0; t += 0.5) beats.push_back(t);
    return beats;
}

bool near(double a, double b) { return std::abs(a - b) < 1e-6; }

} // namespace

bool test_highlight_energy_peak_without_popularity() {
    try {
        auto out = runHighlight(makeContext({}, false));
        std::cout << "Energy highlight: " << out.dump() << std::endl;
        return out["available"].get<bool>() && out["source"] == "energy" &&
               near(out["segment"]["start_time"].get<double>(), 60.0) &&
               near(out["segment"]["end_time"].get<double>(), 105.0);
    } catch (const std::exception& e) {
        std::cerr << "Exception in energy highlight test: " << e.what() << std::endl;
        return false;
    }
}

bool test_highlight_popularity_in_loud_passage_wins() {
    try {
        AnalysisContext ctx = makeContext({}, false);
        ctx.globalConfig["popularity"] = nlohmann::json::array({
            {{"start", 10.0}, {"end", 15.0}, {"score", 0.3}},
            {{"start", 62.0}, {"end", 67.0}, {"score", 0.65}}
        });
        auto out = runHighlight(ctx);
        std::cout << "Popularity highlight: " << out.dump() << std::endl;
        return out["source"] == "popularity" && near(out["segment"]["start_time"].get<double>(), 62.0);
    } catch (const std::exception& e) {
        std::cerr << "Exception in popularity highlight test: " << e.what() << std::endl;
        return false;
    }
}

bool test_highlight_quiet_popularity_falls_back_to_energy() {
    try {
        AnalysisContext ctx = makeContext({}, false);
        ctx.globalConfig["popularity"] = nlohmann::json::array({
            {{"start", 5.0}, {"end", 10.0}, {"score", 0.4}}
        });
        auto out = runHighlight(ctx);
        if (out["source"] != "energy") return false;

        // A strong enough score wins even in a quiet passage
        ctx.globalConfig["popularity"] = nlohmann::json::array({
            {{"start", 5.0}, {"end", 10.0}, {"score", 0.9}}
        });
        auto strong = runHighlight(ctx);
        return strong["source"] == "popularity" && near(strong["segment"]["start_time"].get<double>(), 5.0);
    } catch (const std::exception& e) {
        std::cerr << "Exception in quiet popularity test: " << e.what() << std::endl;
        return false;
    }
}

bool test_highlight_aligns_to_beat_and_phrase_dip() {
    try {
        auto out = runHighlight(makeContext(beatGrid(), true));
        std::cout << "Aligned highlight: " << out.dump() << std::endl;
        return out["aligned"].get<bool>() &&
               near(out["segment"]["start_time"].get<double>(), 60.25) &&
               near(out["segment"]["end_time"].get<double>(), 103.5);
    } catch (const std::exception& e) {
        std::cerr << "Exception in alignment test: " << e.what() << std::endl;
        return false;
    }
}

bool test_highlight_short_alignment_keeps_raw_window() {
    try {
        auto out = runHighlight(makeContext(beatGrid(), true), {{"minAlignedLength", 44.9}});
        return !out["aligned"].get<bool>() &&
               near(out["segment"]["start_time"].get<double>(), 60.0) &&
               near(out["segment"]["end_time"].get<double>(), 105.0);
    } catch (const std::exception& e) {
        std::cerr << "Exception in raw window test: " << e.what() << std::endl;
        return false;
    }
}

bool test_highlight_empty_curve_unavailable() {
    try {
        AnalysisContext ctx;
        ctx.moduleResults["Energy"] = {{"curve", nlohmann::json::array()}, {"frameRate", kFps}};
        auto out = runHighlight(ctx);
        return !out["available"].get<bool>();
    } catch (const std::exception& e) {
        std::cerr << "Exception in empty curve test: " << e.what() << std::endl;
        return false;
    }
}
