#include "../../include/compose/Transcoder.h"
#include "../../include/compose/Process.h"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace vmx::compose {

namespace {

double parseDurationField(const nlohmann::json& object) {
    if (!object.contains("duration")) return 0.0;
    const auto& d = object["duration"];
    try {
        if (d.is_string()) return std::stod(d.get<std::string>());
        if (d.is_number()) return d.get<double>();
    } catch (const std::exception&) {
        // "N/A" and similar
    }
    return 0.0;
}

std::string lastLines(const std::string& log, size_t count) {
    size_t pos = log.size();
    for (size_t i = 0; i < count && pos > 0; ++i) {
        pos = log.find_last_of('\n', pos - 1);
        if (pos == std::string::npos) return log;
    }
    return log.substr(pos + 1);
}

} // namespace

FfmpegTranscoder::FfmpegTranscoder(core::TranscoderConfig config)
    : m_config(std::move(config)) {}

TranscodeResult FfmpegTranscoder::run(const TranscodeCommand& command) {
    std::vector<std::string> argv = {m_config.ffmpeg, "-y", "-hide_banner", "-loglevel", "error"};
    argv.insert(argv.end(), command.args.begin(), command.args.end());

    ProcessResult process = runProcess(argv);

    TranscodeResult result;
    result.exitCode = process.exitCode;
    result.log = std::move(process.output);

    std::error_code ec;
    const bool produced = command.outputPath.empty() ||
        (std::filesystem::exists(command.outputPath, ec) &&
         std::filesystem::file_size(command.outputPath, ec) > 0 && !ec);
    result.ok = result.exitCode == 0 && produced;

    if (!result.ok) {
        std::cerr << "[Transcoder] " << (command.label.empty() ? "ffmpeg" : command.label)
                  << " failed (exit " << result.exitCode << "): " << lastLines(result.log, 3) << std::endl;
    }
    return result;
}

nlohmann::json FfmpegTranscoder::probe(const std::string& path) {
    ProcessResult process = runProcess({
        m_config.ffprobe, "-v", "error",
        "-show_entries", "stream=codec_type,duration:format=duration",
        "-of", "json", path
    });
    if (process.exitCode != 0) {
        std::cerr << "[Transcoder] ffprobe failed for " << path << std::endl;
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(process.output);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[Transcoder] Unreadable ffprobe output for " << path << ": " << e.what() << std::endl;
        return nlohmann::json::object();
    }
}

StreamDurations FfmpegTranscoder::probeStreams(const std::string& path) {
    return parseStreams(probe(path));
}

double FfmpegTranscoder::probeDuration(const std::string& path) {
    return parseFormatDuration(probe(path));
}

StreamDurations FfmpegTranscoder::parseStreams(const nlohmann::json& probe) {
    StreamDurations durations;
    if (!probe.contains("streams") || !probe["streams"].is_array()) return durations;

    bool haveVideo = false;
    bool haveAudio = false;
    for (const auto& stream : probe["streams"]) {
        const std::string type = stream.value("codec_type", std::string());
        if (type == "video" && !haveVideo) {
            durations.video = parseDurationField(stream);
            haveVideo = true;
        } else if (type == "audio" && !haveAudio) {
            durations.audio = parseDurationField(stream);
            haveAudio = true;
        }
    }
    return durations;
}

double FfmpegTranscoder::parseFormatDuration(const nlohmann::json& probe) {
    if (!probe.contains("format")) return 0.0;
    return parseDurationField(probe["format"]);
}

} // namespace vmx::compose
