#pragma once

#include "../core/MixTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace vmx::compose {

/**
 * @brief Outcome of obtaining one source media file.
 */
struct FetchResult {
    bool ok = false;
    std::string path;
    double duration = 0.0;                           ///< 0 when unknown
    std::vector<core::PopularitySample> popularity;  ///< empty when unavailable
    std::string error;
};

/**
 * @brief Obtains source media for a source id.
 */
class ISourceFetcher {
public:
    virtual ~ISourceFetcher() = default;

    /**
     * @brief Writes the media for sourceId to destPath.
     *
     * Failures are reported in the result, never thrown.
     */
    virtual FetchResult fetch(const std::string& sourceId, const std::string& destPath) = 0;
};

/**
 * @brief Everything a voice provider may use to phrase a cue.
 */
struct CommentaryContext {
    std::string voice;
    std::string theme;
    std::string mood;
    std::string language;        ///< language of the segment playing at the cue
};

struct VoiceClip {
    std::string path;
    double duration = 0.0;
    std::string text;
};

/**
 * @brief Renders the spoken clip of one commentary cue.
 */
class ICommentaryProvider {
public:
    virtual ~ICommentaryProvider() = default;

    virtual std::string name() const = 0;

    /**
     * @return The clip, or std::nullopt when this provider cannot render the cue.
     */
    virtual std::optional<VoiceClip> render(const core::CommentaryCue& cue,
                                            const CommentaryContext& context,
                                            const std::string& outputPath) = 0;
};

} // namespace vmx::compose
