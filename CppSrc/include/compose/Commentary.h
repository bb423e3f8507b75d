#pragma once

#include "Collaborators.h"
#include "../core/MixConfig.h"
#include "../core/MixTypes.h"
#include <string>
#include <vector>

namespace vmx::compose {

class ITranscoder;

/**
 * @brief Places commentary cues on the final timeline and phrases them.
 */
class CommentaryPlanner {
public:
    static constexpr double kIntroTime = 2.0;
    /** @brief Join cues closer than this to another cue are dropped. */
    static constexpr double kMinCueSpacing = 6.0;
    /** @brief Energy difference (0-1 scale) that counts as a rise or a drop. */
    static constexpr double kEnergyShift = 0.15;

    /**
     * @brief Places intro, mid and outro cues, then one cue per join up to the frequency cap.
     *
     * A join gets a language shout-out when the language changes; otherwise,
     * with energy cues enabled, a peak cue if the next segment is the most
     * energetic one, else a rise, drop or smooth-transition line.
     *
     * @param languages Language of every rendered segment, in timeline order.
     * @param energies Energy of every rendered segment on a 0-1 scale; may be empty.
     * @param boundaries Start time of segment i+1 in the final timeline, one per join.
     * @param totalDuration Length of the joined mix in seconds.
     */
    static std::vector<core::CommentaryCue> plan(const std::vector<std::string>& languages,
                                                 const std::vector<double>& energies,
                                                 const std::vector<double>& boundaries,
                                                 double totalDuration,
                                                 const core::CommentaryConfig& config);

    static double outroTime(double totalDuration);

    static std::string introText();
    static std::string midText(const std::vector<std::string>& languages);
    static std::string outroText();
    static std::string languageSwitchText(const std::string& language, size_t variant);
    static std::string peakText(size_t variant);
    static std::string energyShiftText(double previous, double current, size_t variant);
};

/**
 * @brief Voice provider that runs an external text-to-speech command template.
 *
 * The template receives {text_file}, {output} and {voice}; the clip length is
 * probed through the transcoder.
 */
class ScriptedVoiceProvider : public ICommentaryProvider {
public:
    ScriptedVoiceProvider(std::string commandTemplate, ITranscoder& transcoder);

    std::string name() const override { return "tts-command"; }

    std::optional<VoiceClip> render(const core::CommentaryCue& cue,
                                    const CommentaryContext& context,
                                    const std::string& outputPath) override;

private:
    std::string m_template;
    ITranscoder& m_transcoder;
};

} // namespace vmx::compose
