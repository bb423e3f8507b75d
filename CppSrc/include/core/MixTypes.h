#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vmx::core {

/**
 * @brief A time window [startTime, endTime] inside a source track chosen for the mix.
 *
 * Created by the analyzer, never modified afterwards.
 */
struct AudioSegment {
    double startTime = 0.0;     ///< seconds
    double endTime = 0.0;       ///< seconds
    double duration = 0.0;      ///< endTime - startTime
    double energyScore = 0.0;   ///< 0-100
    bool isPrimary = false;     ///< highest energy segment of its track
    std::string label;

    /**
     * @brief Builds a segment whose duration is derived from its bounds.
     */
    static AudioSegment make(double start, double end, double energy,
                             const std::string& label, bool primary = false);

    bool isValid() const { return endTime > startTime; }
};

/**
 * @brief Read-only reference data about the song a segment was cut from.
 */
struct TrackMetadata {
    std::string sourceId;              ///< identifier handed to the source fetcher
    std::optional<double> tempoBpm;    ///< unknown tempo is penalized by the sequencer
    double energyScore = 0.0;          ///< 0-100
    std::string language;
    std::string title;
    std::string artist;
    double sourceDuration = 0.0;       ///< seconds
};

/**
 * @brief One entry of a mix plan: a segment together with its track metadata.
 */
struct PlanEntry {
    AudioSegment segment;
    TrackMetadata track;

    /** @brief Stable id "sourceId#label". */
    std::string id() const;
};

struct TransitionRecord {
    std::string from;
    std::string to;
    double tempoDelta = 0.0;
    double energyDelta = 0.0;      ///< normalized 0-1
    bool sameLanguage = false;
    double smoothnessScore = 0.0;  ///< 0-100
};

/**
 * @brief Ordered work order for the composition pipeline. Never mutated once sequenced.
 */
struct MixPlan {
    std::vector<PlanEntry> entries;
    std::vector<TransitionRecord> transitions;
    double qualityScore = 0.0;
    std::vector<std::string> notes;

    bool empty() const { return entries.empty(); }
    size_t size() const { return entries.size(); }
};

/**
 * @brief One sample of an externally supplied "most replayed" curve.
 */
struct PopularitySample {
    double start = 0.0;
    double end = 0.0;
    double score = 0.0;  ///< 0-1
};

/**
 * @brief Typed result of analyzing one track.
 */
struct TrackAnalysis {
    double tempoBpm = 120.0;
    std::string tempoMethod;
    double overallEnergy = 0.0;               ///< 0-100
    double duration = 0.0;
    std::vector<AudioSegment> segments;
    std::vector<double> beats;
    std::optional<AudioSegment> highlight;    ///< hybrid popularity/energy window, aligned when possible
    std::string highlightSource;              ///< "popularity" or "energy"
    bool highlightAligned = false;
};

enum class JobStatus {
    Pending,
    Downloading,
    Processing,
    Concatenating,
    Encoding,
    Complete,
    Failed,
    Cancelled
};

std::string toString(JobStatus status);
JobStatus jobStatusFromString(const std::string& value);
bool isTerminal(JobStatus status);

/**
 * @brief Snapshot of a composition job as seen by observers.
 */
struct CompositionJob {
    std::string id;
    JobStatus status = JobStatus::Pending;
    double progress = 0.0;          ///< 0-100
    std::string currentStage;
    int segmentIndex = 0;
    int totalSegments = 0;
    std::optional<std::string> error;
    std::optional<std::string> outputPath;
    double durationSeconds = 0.0;
    std::uintmax_t fileSizeBytes = 0;
    std::vector<std::string> warnings;
};

/**
 * @brief Progress event emitted by the pipeline after every state change.
 */
struct JobProgress {
    JobStatus status = JobStatus::Pending;
    double progress = 0.0;
    std::string currentStage;
    int segmentIndex = 0;
    int totalSegments = 0;
    std::optional<std::string> error;
};

enum class CueKind { Intro, Mid, Outro, Transition, Peak };

std::string toString(CueKind kind);

/**
 * @brief A spoken commentary clip anchored to the final timeline.
 */
struct CommentaryCue {
    std::string text;
    CueKind kind = CueKind::Intro;
    double scheduledTime = 0.0;   ///< seconds into the final mix
    double clipDuration = 0.0;
    std::string clipPath;         ///< owned by the job working directory
};

// JSON (de)serialization, found through ADL by nlohmann::json
void to_json(nlohmann::json& j, const AudioSegment& s);
void from_json(const nlohmann::json& j, AudioSegment& s);
void to_json(nlohmann::json& j, const TrackMetadata& t);
void from_json(const nlohmann::json& j, TrackMetadata& t);
void to_json(nlohmann::json& j, const PlanEntry& e);
void from_json(const nlohmann::json& j, PlanEntry& e);
void to_json(nlohmann::json& j, const TransitionRecord& t);
void to_json(nlohmann::json& j, const MixPlan& p);
void from_json(const nlohmann::json& j, MixPlan& p);
void to_json(nlohmann::json& j, const PopularitySample& p);
void from_json(const nlohmann::json& j, PopularitySample& p);
void to_json(nlohmann::json& j, const TrackAnalysis& a);
void to_json(nlohmann::json& j, const CompositionJob& job);
void to_json(nlohmann::json& j, const CommentaryCue& cue);

} // namespace vmx::core
