#include <iostream>
#include <fstream>
#include <chrono>
#include <memory>
#include <filesystem>
#include "../include/core/Errors.h"
#include "../include/core/JsonContract.h"
#include "../include/core/MixConfig.h"
#include "../include/core/MixTypes.h"
#include "../include/pipeline/AudioLoader.h"
#include "../include/pipeline/EnergyAnalyzer.h"
#include "../include/mix/Sequencer.h"
#include "../include/compose/Commentary.h"
#include "../include/compose/JobManager.h"
#include "../include/compose/JobRegistry.h"
#include "../include/compose/Sources.h"
#include "../include/compose/Transcoder.h"
#include <nlohmann/json.hpp>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage:" << std::endl
              << "  " << program << " analyze  <media> <analysis.json> <config.json>" << std::endl
              << "  " << program << " sequence <entries.json> <plan.json> <config.json>" << std::endl
              << "  " << program << " compose  <plan.json> <output-name> <config.json>" << std::endl;
}

/**
 * @brief Reads a JSON document, throwing std::runtime_error with the path on failure.
 */
nlohmann::json readJson(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open " + path);
    }
    try {
        nlohmann::json j;
        in >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse JSON ('" + path + "'): " + e.what());
    }
}

void writeJson(const std::string& path, const nlohmann::json& j) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Could not write " + path);
    }
    out << j.dump(2);
}

int runAnalyze(const std::string& mediaPath, const std::string& outputPath, const vmx::core::MixConfig& cfg) {
    namespace fs = std::filesystem;
    vmx::pipeline::EnergyAnalyzer analyzer(cfg.analysis);

    const fs::path media(mediaPath);
    const auto popularity = vmx::compose::readPopularitySidecar(
        media.parent_path() / (media.stem().string() + ".popularity.json"));
    if (!popularity.empty()) {
        std::cout << "[Analyze] Using " << popularity.size() << " popularity samples" << std::endl;
    }

    vmx::core::TrackAnalysis analysis;
    if (media.extension() == ".wav") {
        vmx::core::AudioBuffer audio;
        try {
            audio = vmx::pipeline::AudioLoader::loadWav(mediaPath);
        } catch (const std::runtime_error& e) {
            throw vmx::core::AnalysisError("load", e.what());
        }
        analysis = analyzer.analyze(audio, popularity);
    } else {
        vmx::compose::FfmpegTranscoder transcoder(cfg.transcoder);
        analysis = analyzer.analyzeFile(mediaPath, transcoder, cfg.exports.workDir, popularity);
    }

    nlohmann::json output = analyzer.lastReport();
    output["track"] = analysis;
    if (!vmx::core::JsonContract::validate(output)) {
        std::cerr << "Warning: Output validation failed! The result may not conform to the expected schema." << std::endl;
    }
    writeJson(outputPath, output);

    std::cout << "\n=== Analysis Complete ===" << std::endl;
    std::cout << "BPM: " << analysis.tempoBpm << " (" << analysis.tempoMethod << ")" << std::endl;
    std::cout << "Overall energy: " << analysis.overallEnergy << std::endl;
    for (const auto& s : analysis.segments) {
        std::cout << "  " << s.label << ": " << s.startTime << "s - " << s.endTime << "s, energy "
                  << s.energyScore << (s.isPrimary ? " (primary)" : "") << std::endl;
    }
    if (analysis.highlight) {
        std::cout << "Highlight: " << analysis.highlight->startTime << "s - " << analysis.highlight->endTime
                  << "s via " << analysis.highlightSource << std::endl;
    }
    std::cout << "\nOutput saved to: " << outputPath << std::endl;
    return 0;
}

int runSequence(const std::string& entriesPath, const std::string& outputPath, const vmx::core::MixConfig& cfg) {
    nlohmann::json input = readJson(entriesPath);
    if (input.is_object() && input.contains("entries")) input = input["entries"];
    if (!input.is_array()) {
        std::cerr << "Error: " << entriesPath << " must hold an array of plan entries" << std::endl;
        return 1;
    }

    const auto entries = input.get<std::vector<vmx::core::PlanEntry>>();
    vmx::mix::Sequencer sequencer(vmx::mix::SequenceParams::fromConfig(cfg.sequencing));
    vmx::core::MixPlan plan = sequencer.sequence(entries, cfg.sequencing.strategy);
    writeJson(outputPath, plan);

    std::cout << "\n=== Sequence Complete ===" << std::endl;
    for (size_t i = 0; i < plan.entries.size(); ++i) {
        const auto& e = plan.entries[i];
        std::cout << "  " << (i + 1) << ". " << e.id() << " [" << e.track.language << "]" << std::endl;
    }
    std::cout << "Quality score: " << plan.qualityScore << std::endl;
    for (const auto& note : plan.notes) {
        std::cout << "Note: " << note << std::endl;
    }
    return 0;
}

int runCompose(const std::string& planPath, const std::string& outputName, const vmx::core::MixConfig& cfg) {
    const auto plan = readJson(planPath).get<vmx::core::MixPlan>();

    vmx::compose::FfmpegTranscoder transcoder(cfg.transcoder);

    std::unique_ptr<vmx::compose::ISourceFetcher> fetcher;
    if (!cfg.sources.fetchCommand.empty()) {
        fetcher = std::make_unique<vmx::compose::CommandSourceFetcher>(cfg.sources.fetchCommand, &transcoder);
    } else {
        fetcher = std::make_unique<vmx::compose::LocalSourceFetcher>(cfg.sources.mediaDir);
    }
    vmx::compose::SourceCache cache(cfg.sources.cacheDir, *fetcher);

    vmx::compose::ScriptedVoiceProvider voice(cfg.commentary.ttsCommand, transcoder);
    vmx::compose::JobRegistry registry;
    vmx::compose::JobManager jobs(cfg, transcoder, cache, registry, {&voice});
    jobs.setObserver([](const std::string&, const vmx::core::JobProgress& p) {
        std::cout << "  [" << vmx::core::toString(p.status) << "] "
                  << static_cast<int>(p.progress) << "% " << p.currentStage << std::endl;
    });

    const std::string jobId = jobs.submit(plan, outputName);
    auto job = jobs.wait(jobId);
    if (!job) {
        std::cerr << "Error: job " << jobId << " vanished from the registry" << std::endl;
        return 1;
    }

    std::cout << "\n=== Composition " << vmx::core::toString(job->status) << " ===" << std::endl;
    for (const auto& warning : job->warnings) {
        std::cout << "Warning: " << warning << std::endl;
    }
    if (job->status != vmx::core::JobStatus::Complete) {
        std::cerr << "Error: " << job->error.value_or("job did not complete") << std::endl;
        return 1;
    }
    std::cout << "Output: " << job->outputPath.value_or("") << " (" << job->durationSeconds << "s, "
              << job->fileSizeBytes / (1024.0 * 1024.0) << " MB)" << std::endl;
    return 0;
}

} // namespace

/**
 * @brief Entry point of the vidmix command line tool.
 *
 * Every command takes an input, an output and the JSON configuration file.
 * @return 0 on success, 2 on usage errors, 3/4 when the configuration cannot be
 * opened/parsed, 1 on any other error.
 */
int main(int argc, char* argv[]) {
    std::cout << "=== VidMix - Segment Selection & Mix Composition ===" << std::endl;
    std::cout << "Version: 1.0.0" << std::endl << std::endl;

    if (argc < 5) {
        printUsage(argv[0]);
        std::cerr << "Error: Configuration file path must be provided as the last argument." << std::endl;
        return 2;
    }
    const std::string command = argv[1];
    const std::string inputPath = argv[2];
    const std::string outputPath = argv[3];
    const std::string configPath = argv[4];

    if (command != "analyze" && command != "sequence" && command != "compose") {
        printUsage(argv[0]);
        std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
        return 2;
    }

    nlohmann::json cfgJson;
    {
        std::ifstream cfgIn(configPath);
        if (!cfgIn.is_open()) {
            std::cerr << "[Config] Could not open configuration file: " << configPath << std::endl;
            return 3;
        }
        try {
            cfgIn >> cfgJson;
            std::cout << "[Config] Loaded configuration from: " << configPath << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[Config] Failed to parse JSON ('" << configPath << "'): " << e.what() << std::endl;
            return 4;
        }
    }

    try {
        vmx::core::MixConfig cfg = vmx::core::MixConfig::fromJson(cfgJson);
        cfg.applyEnvironment();

        auto startTime = std::chrono::high_resolution_clock::now();
        int rc = 0;
        if (command == "analyze") {
            rc = runAnalyze(inputPath, outputPath, cfg);
        } else if (command == "sequence") {
            rc = runSequence(inputPath, outputPath, cfg);
        } else {
            rc = runCompose(inputPath, outputPath, cfg);
        }
        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();
        std::cout << "Processing time: " << duration / 1000.0 << " seconds" << std::endl;
        return rc;
    } catch (const vmx::core::AnalysisError& e) {
        std::cerr << "Error [" << e.stage() << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
