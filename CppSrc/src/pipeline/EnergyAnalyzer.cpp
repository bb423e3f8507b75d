#include "../../include/pipeline/EnergyAnalyzer.h"
#include "../../include/pipeline/AudioLoader.h"
#include "../../include/compose/Transcoder.h"
#include "../../include/core/Errors.h"
#include "../../include/core/JsonContract.h"
#include "../../include/core/TempDir.h"
#include <chrono>
#include <iostream>

namespace vmx::pipeline {

EnergyAnalyzer::EnergyAnalyzer(core::AnalysisConfig config)
    : m_config(std::move(config)) {
    PipelineBuilder builder;
    builder.withTempo(m_config.fallbackBpm)
           .withEnergy(m_config.hopSize, m_config.frameSize, m_config.maxSmoothingFrames)
           .withSegments(m_config.minSegmentLength, m_config.maxSegmentLength,
                         m_config.maxSegments, m_config.minGap)
           .withHighlight(m_config.highlightLength, m_config.minAlignedLength)
           .withConfig({
               {"Segments", {{"extendTolerance", m_config.extendTolerance}}},
               {"Highlight", {
                   {"phraseSearchWindow", m_config.phraseSearchWindow},
                   {"phraseDipRatio", m_config.phraseDipRatio}
               }}
           });
    m_pipeline = builder.build();
    m_pipeline->enableModule("Highlight", m_config.highlight);
}

core::TrackAnalysis EnergyAnalyzer::analyze(const core::AudioBuffer& audio,
                                            const std::vector<core::PopularitySample>& popularity) {
    // null removes the key under merge-patch
    m_pipeline->setGlobalConfig({
        {"popularity", popularity.empty() ? nlohmann::json(nullptr) : nlohmann::json(popularity)}
    });

    auto start = std::chrono::high_resolution_clock::now();
    m_report = m_pipeline->analyze(audio, [](const std::string& module, float progress) {
        std::cout << "[Analyzer] " << module << " " << static_cast<int>(progress * 100) << "%" << std::endl;
    });
    auto end = std::chrono::high_resolution_clock::now();
    m_report["analysisMetadata"]["processingTime"] =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count() / 1000.0;

    core::TrackAnalysis analysis = toTrackAnalysis(m_report, m_pipeline->getLastResults());
    std::cout << "[Analyzer] " << analysis.tempoBpm << " BPM (" << analysis.tempoMethod << "), energy "
              << analysis.overallEnergy << ", " << analysis.segments.size() << " segments" << std::endl;
    return analysis;
}

core::TrackAnalysis EnergyAnalyzer::analyze(const std::vector<float>& signal, float sampleRate) {
    return analyze(core::AudioBuffer::fromMono(signal, sampleRate));
}

core::TrackAnalysis EnergyAnalyzer::analyzeFile(const std::string& mediaPath, compose::ITranscoder& transcoder,
                                                const std::string& workDir,
                                                const std::vector<core::PopularitySample>& popularity) {
    core::ScopedTempDir dir("vmx_decode", workDir);
    const std::string wavPath = dir.file("decoded.wav").string();

    compose::TranscodeCommand decode;
    decode.label = "decode";
    decode.outputPath = wavPath;
    decode.args = {
        "-i", mediaPath, "-vn",
        "-ac", "1", "-ar", std::to_string(static_cast<int>(m_config.sampleRate)),
        "-c:a", "pcm_s16le", wavPath
    };

    compose::TranscodeResult result;
    try {
        result = transcoder.run(decode);
    } catch (const std::runtime_error& e) {
        throw core::AnalysisError("decode", e.what());
    }
    if (!result.ok) {
        throw core::AnalysisError("decode", "cannot decode " + mediaPath + " (exit " +
                                  std::to_string(result.exitCode) + ")");
    }

    core::AudioBuffer audio;
    try {
        audio = AudioLoader::loadWav(wavPath);
    } catch (const std::runtime_error& e) {
        throw core::AnalysisError("load", e.what());
    }
    return analyze(audio, popularity);
}

core::TrackAnalysis EnergyAnalyzer::toTrackAnalysis(const nlohmann::json& report,
                                                    const std::map<std::string, nlohmann::json>& results) {
    core::TrackAnalysis analysis;
    if (report.contains("audio")) {
        analysis.duration = report["audio"].value("duration", 0.0);
    }
    if (report.contains("tempo")) {
        analysis.tempoBpm = report["tempo"].value("bpm", 120.0);
        analysis.tempoMethod = report["tempo"].value("method", std::string("unknown"));
        analysis.beats = core::JsonContract::expandBeatGrid(report["tempo"]["beatGrid"]);
    }
    if (report.contains("energy")) {
        analysis.overallEnergy = report["energy"].value("overall", 0.0);
    }
    for (const auto& s : report["segments"]) {
        analysis.segments.push_back(s.get<core::AudioSegment>());
    }

    auto highlight = results.find("Highlight");
    if (highlight != results.end() && highlight->second.value("available", false)) {
        analysis.highlight = highlight->second["segment"].get<core::AudioSegment>();
        analysis.highlightSource = highlight->second.value("source", std::string("energy"));
        analysis.highlightAligned = highlight->second.value("aligned", false);
    }
    return analysis;
}

} // namespace vmx::pipeline
