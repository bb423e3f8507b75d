#include "../../include/core/MixConfig.h"
#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace vmx::core {

int ExportConfig::width() const {
    if (quality == "480p") return 854;
    if (quality == "1080p") return 1920;
    return 1280;
}

int ExportConfig::height() const {
    if (quality == "480p") return 480;
    if (quality == "1080p") return 1080;
    return 720;
}

int CommentaryConfig::maxTransitionCues() const {
    if (!transitionCues) return 0;
    if (frequency == "minimal") return 0;
    if (frequency == "frequent") return 4;
    return 2;
}

void from_json(const nlohmann::json& j, AnalysisConfig& c) {
    c.sampleRate = j.value("sampleRate", c.sampleRate);
    c.minSegmentLength = j.value("minSegmentLength", c.minSegmentLength);
    c.maxSegmentLength = j.value("maxSegmentLength", c.maxSegmentLength);
    c.maxSegments = j.value("maxSegments", c.maxSegments);
    c.minGap = j.value("minGap", c.minGap);
    c.hopSize = j.value("hopSize", c.hopSize);
    c.frameSize = j.value("frameSize", c.frameSize);
    c.maxSmoothingFrames = j.value("maxSmoothingFrames", c.maxSmoothingFrames);
    c.extendTolerance = j.value("extendTolerance", c.extendTolerance);
    c.fallbackBpm = j.value("fallbackBpm", c.fallbackBpm);
    c.highlight = j.value("highlight", c.highlight);
    c.highlightLength = j.value("highlightLength", c.highlightLength);
    c.minAlignedLength = j.value("minAlignedLength", c.minAlignedLength);
    c.phraseSearchWindow = j.value("phraseSearchWindow", c.phraseSearchWindow);
    c.phraseDipRatio = j.value("phraseDipRatio", c.phraseDipRatio);
    if (c.maxSegmentLength < c.minSegmentLength) {
        std::cerr << "[Config] maxSegmentLength < minSegmentLength, using minSegmentLength for both" << std::endl;
        c.maxSegmentLength = c.minSegmentLength;
    }
}

void from_json(const nlohmann::json& j, SequencingConfig& c) {
    c.strategy = j.value("strategy", c.strategy);
    c.energyCurve = j.value("energyCurve", c.energyCurve);
    c.maxConsecutive = std::max(1, j.value("maxConsecutive", c.maxConsecutive));
    c.seed = j.value("seed", c.seed);
}

void from_json(const nlohmann::json& j, ExportConfig& c) {
    c.outputName = j.value("outputName", c.outputName);
    c.exportsDir = j.value("exportsDir", c.exportsDir);
    c.workDir = j.value("workDir", c.workDir);
    c.quality = j.value("quality", c.quality);
    c.crossfadeDuration = std::max(0.0, j.value("crossfadeDuration", c.crossfadeDuration));
    c.transition = j.value("transition", c.transition);
    c.textOverlay = j.value("textOverlay", c.textOverlay);
    c.intro = j.value("intro", c.intro);
    c.introDuration = j.value("introDuration", c.introDuration);
    c.introTitle = j.value("introTitle", c.introTitle);
    c.outro = j.value("outro", c.outro);
    c.outroDuration = j.value("outroDuration", c.outroDuration);
    c.outroMessage = j.value("outroMessage", c.outroMessage);
    c.minSegments = std::max(1, j.value("minSegments", c.minSegments));
}

void from_json(const nlohmann::json& j, CommentaryConfig& c) {
    c.enabled = j.value("enabled", c.enabled);
    c.voice = j.value("voice", c.voice);
    c.frequency = j.value("frequency", c.frequency);
    c.duckLevel = std::clamp(j.value("duckLevel", c.duckLevel), 0.15, 0.25);
    c.voiceGain = std::clamp(j.value("voiceGain", c.voiceGain), 2.0, 3.0);
    c.transitionCues = j.value("transitionCues", c.transitionCues);
    c.energyCues = j.value("energyCues", c.energyCues);
    c.ttsCommand = j.value("ttsCommand", c.ttsCommand);
    c.theme = j.value("theme", c.theme);
    c.mood = j.value("mood", c.mood);
}

void from_json(const nlohmann::json& j, SourcesConfig& c) {
    c.mediaDir = j.value("mediaDir", c.mediaDir);
    c.cacheDir = j.value("cacheDir", c.cacheDir);
    c.fetchCommand = j.value("fetchCommand", c.fetchCommand);
}

void from_json(const nlohmann::json& j, TranscoderConfig& c) {
    c.ffmpeg = j.value("ffmpeg", c.ffmpeg);
    c.ffprobe = j.value("ffprobe", c.ffprobe);
}

MixConfig MixConfig::fromJson(const nlohmann::json& j) {
    MixConfig cfg;
    if (!j.is_object()) return cfg;
    if (j.contains("analysis")) from_json(j["analysis"], cfg.analysis);
    if (j.contains("sequencing")) from_json(j["sequencing"], cfg.sequencing);
    if (j.contains("export")) from_json(j["export"], cfg.exports);
    if (j.contains("commentary")) from_json(j["commentary"], cfg.commentary);
    if (j.contains("sources")) from_json(j["sources"], cfg.sources);
    if (j.contains("transcoder")) from_json(j["transcoder"], cfg.transcoder);
    return cfg;
}

void MixConfig::applyEnvironment() {
    if (const char* ffmpeg = std::getenv("VMX_FFMPEG")) {
        transcoder.ffmpeg = ffmpeg;
        std::cout << "[Config] ffmpeg overridden by VMX_FFMPEG: " << ffmpeg << std::endl;
    }
    if (const char* ffprobe = std::getenv("VMX_FFPROBE")) {
        transcoder.ffprobe = ffprobe;
        std::cout << "[Config] ffprobe overridden by VMX_FFPROBE: " << ffprobe << std::endl;
    }
    if (const char* exportsDir = std::getenv("VMX_EXPORTS_DIR")) {
        exports.exportsDir = exportsDir;
    }
}

nlohmann::json MixConfig::toJson() const {
    return {
        {"analysis", {
            {"sampleRate", analysis.sampleRate},
            {"minSegmentLength", analysis.minSegmentLength},
            {"maxSegmentLength", analysis.maxSegmentLength},
            {"maxSegments", analysis.maxSegments},
            {"minGap", analysis.minGap},
            {"highlight", analysis.highlight},
            {"minAlignedLength", analysis.minAlignedLength}
        }},
        {"sequencing", {
            {"strategy", sequencing.strategy},
            {"energyCurve", sequencing.energyCurve},
            {"maxConsecutive", sequencing.maxConsecutive},
            {"seed", sequencing.seed}
        }},
        {"export", {
            {"outputName", exports.outputName},
            {"exportsDir", exports.exportsDir},
            {"quality", exports.quality},
            {"crossfadeDuration", exports.crossfadeDuration},
            {"transition", exports.transition}
        }},
        {"commentary", {
            {"enabled", commentary.enabled},
            {"voice", commentary.voice},
            {"frequency", commentary.frequency},
            {"duckLevel", commentary.duckLevel},
            {"voiceGain", commentary.voiceGain}
        }},
        {"transcoder", {
            {"ffmpeg", transcoder.ffmpeg},
            {"ffprobe", transcoder.ffprobe}
        }}
    };
}

} // namespace vmx::core
