#pragma once

#include "../include/compose/Collaborators.h"
#include "../include/compose/Transcoder.h"
#include "../include/core/MixTypes.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace vmx::test {

inline void touchFile(const std::string& path, const std::string& content = "data") {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

/**
 * @brief Transcoder that writes a placeholder output file instead of running ffmpeg.
 *
 * Commands whose label starts with one of failLabels fail. Every clip probes
 * as clipLength seconds unless a path-specific duration was set.
 */
class FakeTranscoder : public compose::ITranscoder {
public:
    std::vector<std::string> failLabels;
    double clipLength = 10.0;
    std::map<std::string, compose::StreamDurations> durations;

    /** @brief Raised when a command whose label starts with cancelLabel runs. */
    std::atomic<bool>* cancelFlag = nullptr;
    std::string cancelLabel;

    compose::TranscodeResult run(const compose::TranscodeCommand& command) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_labels.push_back(command.label);
        m_commands.push_back(command);
        if (cancelFlag && !cancelLabel.empty() && command.label.rfind(cancelLabel, 0) == 0) {
            cancelFlag->store(true);
        }
        for (const auto& prefix : failLabels) {
            if (command.label.rfind(prefix, 0) == 0) {
                return {false, 1, "scripted failure"};
            }
        }
        if (!command.outputPath.empty()) touchFile(command.outputPath);
        return {true, 0, ""};
    }

    compose::StreamDurations probeStreams(const std::string& path) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = durations.find(std::filesystem::path(path).filename().string());
        if (it != durations.end()) return it->second;
        return {clipLength, clipLength};
    }

    double probeDuration(const std::string& path) override {
        compose::StreamDurations d = probeStreams(path);
        return std::max(d.video, d.audio);
    }

    std::vector<std::string> labels() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_labels;
    }

    std::vector<compose::TranscodeCommand> commands() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_commands;
    }

    size_t count(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t n = 0;
        for (const auto& label : m_labels) {
            if (label.rfind(prefix, 0) == 0) ++n;
        }
        return n;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_labels;
    std::vector<compose::TranscodeCommand> m_commands;
};

/**
 * @brief Fetcher producing a small file per source id; ids in missing fail.
 */
class FakeFetcher : public compose::ISourceFetcher {
public:
    std::set<std::string> missing;
    std::vector<core::PopularitySample> popularity;
    std::chrono::milliseconds delay{0};

    compose::FetchResult fetch(const std::string& sourceId, const std::string& destPath) override {
        ++calls;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        compose::FetchResult result;
        if (missing.count(sourceId)) {
            result.error = "no such source";
            return result;
        }
        touchFile(destPath, "media:" + sourceId);
        result.ok = true;
        result.path = destPath;
        result.duration = 180.0;
        result.popularity = popularity;
        return result;
    }

    std::atomic<int> calls{0};
};

/**
 * @brief Voice provider writing a placeholder clip of fixed length.
 */
class FakeVoice : public compose::ICommentaryProvider {
public:
    explicit FakeVoice(std::string name = "fake-voice", double clipDuration = 3.0)
        : m_name(std::move(name))
        , m_clipDuration(clipDuration) {}

    bool fail = false;
    bool decline = false;
    std::vector<std::string> texts;
    std::vector<std::string> languages;

    std::string name() const override { return m_name; }

    std::optional<compose::VoiceClip> render(const core::CommentaryCue& cue,
                                             const compose::CommentaryContext& context,
                                             const std::string& outputPath) override {
        if (fail) throw std::runtime_error("voice engine offline");
        if (decline) return std::nullopt;
        texts.push_back(cue.text);
        languages.push_back(context.language);
        touchFile(outputPath, "voice");
        return compose::VoiceClip{outputPath, m_clipDuration, cue.text};
    }

private:
    std::string m_name;
    double m_clipDuration;
};

inline core::PlanEntry makeEntry(const std::string& sourceId, double bpm, double energy,
                                 const std::string& language, double start = 30.0, double end = 60.0) {
    core::PlanEntry e;
    e.segment = core::AudioSegment::make(start, end, energy, "segment_1", true);
    e.track.sourceId = sourceId;
    e.track.tempoBpm = bpm;
    e.track.energyScore = energy;
    e.track.language = language;
    e.track.title = "Song " + sourceId;
    e.track.artist = "Artist " + sourceId;
    e.track.sourceDuration = 200.0;
    return e;
}

} // namespace vmx::test
