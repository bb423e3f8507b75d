#include "../../include/core/MixTypes.h"
#include <stdexcept>

namespace vmx::core {

AudioSegment AudioSegment::make(double start, double end, double energy,
                                const std::string& label, bool primary) {
    AudioSegment s;
    s.startTime = start;
    s.endTime = end;
    s.duration = end - start;
    s.energyScore = energy;
    s.label = label;
    s.isPrimary = primary;
    return s;
}

std::string PlanEntry::id() const {
    return track.sourceId + "#" + segment.label;
}

std::string toString(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Downloading: return "downloading";
        case JobStatus::Processing: return "processing";
        case JobStatus::Concatenating: return "concatenating";
        case JobStatus::Encoding: return "encoding";
        case JobStatus::Complete: return "complete";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

JobStatus jobStatusFromString(const std::string& value) {
    static const JobStatus all[] = {
        JobStatus::Pending, JobStatus::Downloading, JobStatus::Processing,
        JobStatus::Concatenating, JobStatus::Encoding, JobStatus::Complete,
        JobStatus::Failed, JobStatus::Cancelled
    };
    for (JobStatus s : all) {
        if (toString(s) == value) return s;
    }
    throw std::invalid_argument("Unknown job status: " + value);
}

bool isTerminal(JobStatus status) {
    return status == JobStatus::Complete || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

std::string toString(CueKind kind) {
    switch (kind) {
        case CueKind::Intro: return "intro";
        case CueKind::Mid: return "mid";
        case CueKind::Outro: return "outro";
        case CueKind::Transition: return "transition";
        case CueKind::Peak: return "peak";
    }
    return "intro";
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const AudioSegment& s) {
    j = {
        {"start_time", s.startTime},
        {"end_time", s.endTime},
        {"duration", s.duration},
        {"energy_score", s.energyScore},
        {"is_primary", s.isPrimary},
        {"label", s.label}
    };
}

void from_json(const nlohmann::json& j, AudioSegment& s) {
    s.startTime = j.at("start_time").get<double>();
    s.endTime = j.at("end_time").get<double>();
    s.duration = s.endTime - s.startTime;
    s.energyScore = j.value("energy_score", 0.0);
    s.isPrimary = j.value("is_primary", false);
    s.label = j.value("label", std::string("segment"));
}

void to_json(nlohmann::json& j, const TrackMetadata& t) {
    j = {
        {"source_id", t.sourceId},
        {"energy_score", t.energyScore},
        {"language", t.language},
        {"title", t.title},
        {"artist", t.artist},
        {"source_duration", t.sourceDuration}
    };
    j["tempo_bpm"] = t.tempoBpm ? nlohmann::json(*t.tempoBpm) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, TrackMetadata& t) {
    t.sourceId = j.value("source_id", std::string());
    if (j.contains("tempo_bpm") && j["tempo_bpm"].is_number()) {
        t.tempoBpm = j["tempo_bpm"].get<double>();
    } else {
        t.tempoBpm.reset();
    }
    t.energyScore = j.value("energy_score", 0.0);
    t.language = j.value("language", std::string("unknown"));
    t.title = j.value("title", std::string());
    t.artist = j.value("artist", std::string("Unknown Artist"));
    t.sourceDuration = j.value("source_duration", 0.0);
}

void to_json(nlohmann::json& j, const PlanEntry& e) {
    j = {{"id", e.id()}, {"segment", e.segment}, {"track", e.track}};
}

void from_json(const nlohmann::json& j, PlanEntry& e) {
    j.at("segment").get_to(e.segment);
    j.at("track").get_to(e.track);
}

void to_json(nlohmann::json& j, const TransitionRecord& t) {
    j = {
        {"from", t.from},
        {"to", t.to},
        {"tempo_delta", t.tempoDelta},
        {"energy_delta", t.energyDelta},
        {"same_language", t.sameLanguage},
        {"smoothness_score", t.smoothnessScore}
    };
}

void to_json(nlohmann::json& j, const MixPlan& p) {
    j = {
        {"entries", p.entries},
        {"transitions", p.transitions},
        {"quality_score", p.qualityScore},
        {"notes", p.notes}
    };
}

void from_json(const nlohmann::json& j, MixPlan& p) {
    p = MixPlan{};
    if (j.contains("entries")) {
        for (const auto& e : j["entries"]) {
            p.entries.push_back(e.get<PlanEntry>());
        }
    }
    p.qualityScore = j.value("quality_score", 0.0);
    if (j.contains("notes")) {
        p.notes = j["notes"].get<std::vector<std::string>>();
    }
}

void to_json(nlohmann::json& j, const PopularitySample& p) {
    j = {{"start", p.start}, {"end", p.end}, {"score", p.score}};
}

void from_json(const nlohmann::json& j, PopularitySample& p) {
    p.start = j.at("start").get<double>();
    p.end = j.value("end", p.start);
    p.score = j.value("score", 0.0);
}

void to_json(nlohmann::json& j, const TrackAnalysis& a) {
    j = {
        {"tempo_bpm", a.tempoBpm},
        {"tempo_method", a.tempoMethod},
        {"overall_energy", a.overallEnergy},
        {"duration", a.duration},
        {"segments", a.segments},
        {"beat_count", a.beats.size()}
    };
    if (a.highlight) {
        j["highlight"] = *a.highlight;
        j["highlight"]["source"] = a.highlightSource;
        j["highlight"]["aligned"] = a.highlightAligned;
    }
}

void to_json(nlohmann::json& j, const CompositionJob& job) {
    j = {
        {"id", job.id},
        {"status", toString(job.status)},
        {"progress", job.progress},
        {"current_stage", job.currentStage},
        {"segment_index", job.segmentIndex},
        {"total_segments", job.totalSegments},
        {"duration_seconds", job.durationSeconds},
        {"file_size_bytes", job.fileSizeBytes},
        {"warnings", job.warnings}
    };
    j["error"] = job.error ? nlohmann::json(*job.error) : nlohmann::json(nullptr);
    j["output_path"] = job.outputPath ? nlohmann::json(*job.outputPath) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const CommentaryCue& cue) {
    j = {
        {"text", cue.text},
        {"kind", toString(cue.kind)},
        {"scheduled_time", cue.scheduledTime},
        {"clip_duration", cue.clipDuration}
    };
}

} // namespace vmx::core
