#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace vmx::core {

/**
 * @brief Segment detection and alignment settings.
 */
struct AnalysisConfig {
    float sampleRate = 22050.0f;        ///< rate tracks are decoded to
    double minSegmentLength = 30.0;     ///< seconds
    double maxSegmentLength = 60.0;     ///< seconds
    int maxSegments = 3;
    double minGap = 10.0;               ///< seconds between segments of one track
    size_t hopSize = 512;
    size_t frameSize = 2048;
    size_t maxSmoothingFrames = 21;
    double extendTolerance = 0.95;      ///< keep extending while mean >= tolerance * best
    double fallbackBpm = 120.0;
    bool highlight = true;
    double highlightLength = 45.0;      ///< seconds
    double minAlignedLength = 40.0;     ///< below this alignment is abandoned
    double phraseSearchWindow = 2.0;    ///< seconds around the target end
    double phraseDipRatio = 0.6;        ///< RMS dip must be below ratio * window mean
};

struct SequencingConfig {
    std::string strategy = "balanced";
    std::string energyCurve = "peak_middle";
    int maxConsecutive = 2;
    unsigned seed = 42;
};

/**
 * @brief Output rendering settings.
 */
struct ExportConfig {
    std::string outputName = "vidmix";
    std::string exportsDir = "exports";
    std::string workDir;                 ///< parent of job temp dirs, system temp when empty
    std::string quality = "720p";        ///< 480p, 720p, 1080p
    double crossfadeDuration = 3.5;      ///< seconds, 0 joins with plain concatenation
    std::string transition = "random";
    bool textOverlay = true;
    bool intro = true;
    double introDuration = 4.0;
    std::string introTitle = "DJ MIX";
    bool outro = true;
    double outroDuration = 3.0;
    std::string outroMessage = "Thanks for listening!";
    int minSegments = 2;

    int width() const;
    int height() const;
};

/**
 * @brief Commentary (DJ voice) settings, constructed once and passed explicitly.
 */
struct CommentaryConfig {
    bool enabled = false;
    std::string voice = "energetic_male";
    std::string frequency = "moderate";  ///< minimal, moderate, frequent
    double duckLevel = 0.15;             ///< clamped to [0.15, 0.25]
    double voiceGain = 3.0;              ///< clamped to [2, 3]
    bool transitionCues = true;
    bool energyCues = true;              ///< peak and energy-change cues at same-language joins
    std::string ttsCommand;              ///< template with {text_file}, {output}, {voice}
    std::string theme;
    std::string mood;

    /** @brief Maximum number of cues placed at segment joins for the frequency setting. */
    int maxTransitionCues() const;
};

struct SourcesConfig {
    std::string mediaDir = "media";
    std::string cacheDir = "cache";
    std::string fetchCommand;            ///< template with {id} and {output}; empty = local only
};

struct TranscoderConfig {
    std::string ffmpeg = "ffmpeg";
    std::string ffprobe = "ffprobe";
};

/**
 * @brief Whole-application configuration loaded from the JSON config file.
 *
 * Missing sections or keys keep their defaults.
 */
struct MixConfig {
    AnalysisConfig analysis;
    SequencingConfig sequencing;
    ExportConfig exports;
    CommentaryConfig commentary;
    SourcesConfig sources;
    TranscoderConfig transcoder;

    static MixConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Applies VMX_FFMPEG, VMX_FFPROBE and VMX_EXPORTS_DIR overrides.
     */
    void applyEnvironment();

    nlohmann::json toJson() const;
};

void from_json(const nlohmann::json& j, AnalysisConfig& c);
void from_json(const nlohmann::json& j, SequencingConfig& c);
void from_json(const nlohmann::json& j, ExportConfig& c);
void from_json(const nlohmann::json& j, CommentaryConfig& c);
void from_json(const nlohmann::json& j, SourcesConfig& c);
void from_json(const nlohmann::json& j, TranscoderConfig& c);

} // namespace vmx::core
