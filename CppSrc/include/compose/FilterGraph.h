#pragma once

#include "Transcoder.h"
#include "../core/MixConfig.h"
#include "../core/MixTypes.h"
#include <string>
#include <vector>

namespace vmx::compose {

/**
 * @brief Timing of one pairwise transition, identical for video and audio.
 */
struct TransitionPlan {
    double duration = 0.0;   ///< seconds of overlap
    double offset = 0.0;     ///< start of the overlap inside the first clip
    double firstLength = 0.0;
    double secondLength = 0.0;
};

/**
 * @brief Builds the ffmpeg argument lists and filter graphs of every composition stage.
 *
 * Pure functions: nothing here touches the filesystem or spawns processes.
 */
class FilterGraph {
public:
    static constexpr int kFrameRate = 30;
    static constexpr int kAudioRate = 44100;

    /**
     * @brief Escapes text for a single-quoted drawtext value.
     */
    static std::string escapeDrawtext(const std::string& text);

    static const std::vector<std::string>& palette();

    /**
     * @brief Transition name for join index: the configured one, or round-robin over
     * the palette for "random" and unknown names.
     */
    static std::string pickTransition(const std::string& configured, size_t joinIndex);

    static TranscodeCommand introCommand(const core::ExportConfig& config, const std::string& dateText,
                                         const std::string& output);

    static TranscodeCommand outroCommand(const core::ExportConfig& config, const std::string& output);

    /**
     * @brief Cuts a plan entry out of its source, scales/pads it and overlays its metadata.
     */
    static TranscodeCommand segmentCommand(const core::PlanEntry& entry, const std::string& source,
                                           const core::ExportConfig& config, const std::string& output);

    /**
     * @brief Usable length of a clip: the shorter stream when both exist, else whichever exists.
     */
    static double reconcileDuration(const StreamDurations& streams);

    /**
     * @brief Caps the requested overlap at 40% of the shorter clip and derives the offset.
     *
     * The overlap stays at or above min(2 s, cap) so short clips still blend.
     */
    static TransitionPlan planTransition(double firstLength, double secondLength, double requested);

    /**
     * @brief filter_complex of one xfade join with matching audio fade/adelay/amix timing.
     */
    static std::string transitionFilter(const TransitionPlan& plan, const std::string& transition);

    static TranscodeCommand transitionCommand(const std::string& first, const std::string& second,
                                              const TransitionPlan& plan, const std::string& transition,
                                              const std::string& output);

    /**
     * @brief Re-encodes a clip truncated to length so its streams agree.
     */
    static TranscodeCommand trimCommand(const std::string& input, double length, const std::string& output);

    /**
     * @brief Concat demuxer list ("file '<path>'" per line).
     */
    static std::string concatList(const std::vector<std::string>& inputs);

    static TranscodeCommand concatCommand(const std::string& listPath, const std::string& output);

    /**
     * @brief Music volume expression ducked during every cue window.
     */
    static std::string duckingFilter(const std::vector<core::CommentaryCue>& cues, double duckLevel);

    /**
     * @brief Mixes voice clips over the video's soundtrack at their scheduled offsets.
     */
    static std::string commentaryFilter(const std::vector<core::CommentaryCue>& cues,
                                        double duckLevel, double voiceGain);

    static TranscodeCommand commentaryCommand(const std::string& video,
                                              const std::vector<core::CommentaryCue>& cues,
                                              double duckLevel, double voiceGain,
                                              const std::string& output);

    /** @brief Fixed-point formatting used inside filter expressions. */
    static std::string num(double value);
};

} // namespace vmx::compose
