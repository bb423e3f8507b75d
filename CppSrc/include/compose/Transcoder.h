#pragma once

#include "../core/MixConfig.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vmx::compose {

/**
 * @brief One transcoder invocation: arguments after the binary name and the file it produces.
 */
struct TranscodeCommand {
    std::vector<std::string> args;
    std::string outputPath;
    std::string label;          ///< stage name used in logs
};

struct TranscodeResult {
    bool ok = false;
    int exitCode = -1;
    std::string log;
};

/**
 * @brief Durations of the first video and audio streams of a file, 0 when absent.
 */
struct StreamDurations {
    double video = 0.0;
    double audio = 0.0;
};

/**
 * @brief External media transcoder used by the analyzer and the composition pipeline.
 */
class ITranscoder {
public:
    virtual ~ITranscoder() = default;

    /**
     * @brief Runs one command. Success requires a zero exit code and a non-empty output file.
     * @throw std::runtime_error if the process cannot be spawned.
     */
    virtual TranscodeResult run(const TranscodeCommand& command) = 0;

    virtual StreamDurations probeStreams(const std::string& path) = 0;

    /**
     * @brief Container duration in seconds, 0 if it cannot be determined.
     */
    virtual double probeDuration(const std::string& path) = 0;
};

/**
 * @brief ITranscoder backed by the ffmpeg and ffprobe executables.
 */
class FfmpegTranscoder : public ITranscoder {
public:
    explicit FfmpegTranscoder(core::TranscoderConfig config);

    TranscodeResult run(const TranscodeCommand& command) override;
    StreamDurations probeStreams(const std::string& path) override;
    double probeDuration(const std::string& path) override;

    /**
     * @brief Extracts stream durations from "ffprobe -of json" output.
     */
    static StreamDurations parseStreams(const nlohmann::json& probe);

    /**
     * @brief Extracts format.duration from "ffprobe -of json" output.
     */
    static double parseFormatDuration(const nlohmann::json& probe);

private:
    nlohmann::json probe(const std::string& path);

    core::TranscoderConfig m_config;
};

} // namespace vmx::compose
