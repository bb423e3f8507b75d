#pragma once

#include "Collaborators.h"
#include "Transcoder.h"
#include "../core/MixConfig.h"
#include "../core/MixTypes.h"
#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vmx::compose {

class SourceCache;

using ProgressObserver = std::function<void(const core::JobProgress&)>;

/**
 * @brief Turns a sequenced MixPlan into one video file.
 *
 * Stages: intro card, per-segment cut and overlay, outro card, transition-joined
 * concatenation, optional commentary overlay, finalization into the exports
 * directory. Intro, outro, transitions and commentary degrade instead of
 * failing; a segment that fails is skipped with a warning.
 */
class CompositionPipeline {
public:
    CompositionPipeline(core::MixConfig config, ITranscoder& transcoder, SourceCache& sources,
                        std::vector<ICommentaryProvider*> voiceProviders = {});

    /**
     * @brief Runs the whole job. Never throws: every failure ends in a terminal job state.
     *
     * @param cancelled Checked between stages and around every transcoder call.
     * @param observer Receives a JobProgress after every state change.
     * @return The terminal job snapshot.
     */
    core::CompositionJob run(const std::string& jobId, const core::MixPlan& plan,
                             const std::atomic<bool>& cancelled,
                             ProgressObserver observer = nullptr);

    /** @brief Date line of the intro card; today's date when never set. */
    void setDateText(std::string text) { m_dateText = std::move(text); }

    const core::MixConfig& config() const { return m_config; }

private:
    struct RunState;

    std::optional<std::string> renderCard(RunState& st, bool intro);
    void renderSegments(RunState& st, const core::MixPlan& plan);
    std::string joinClips(RunState& st, const std::vector<std::string>& clips, std::vector<double>& starts);
    bool plainConcat(RunState& st, const std::vector<std::string>& inputs, const std::string& output);
    std::string addCommentary(RunState& st, const std::string& video, const std::vector<double>& boundaries);
    void finalize(RunState& st, const std::string& video);

    TranscodeResult invoke(RunState& st, const TranscodeCommand& command);
    void report(RunState& st, core::JobStatus status, double progress, const std::string& stage,
                int segmentIndex = 0);
    void warn(RunState& st, const std::string& message);
    void checkCancelled(RunState& st, const std::string& stage);
    double clipLength(const std::string& path);
    std::string dateText() const;

    core::MixConfig m_config;
    ITranscoder& m_transcoder;
    SourceCache& m_sources;
    std::vector<ICommentaryProvider*> m_voiceProviders;
    std::string m_dateText;
};

} // namespace vmx::compose
