#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <map>
#include <vector>
#include <cmath>

namespace vmx::core {

/**
 * @brief Manages the JSON contract for track analysis output and job records.
 *
 * This class handles versioning, structure creation, validation and the
 * compression of bulky curves for the files written next to the media.
 */
class JsonContract {
public:
    /** @brief The current version number of the JSON contract schema. */
    static constexpr int CURRENT_VERSION = 1;

    /**
     * @brief Creates the structured analysis report from the collected module results.
     *
     * @param audioMetadata Basic information about the decoded audio (sample rate, duration, channels).
     * @param moduleResults Module outputs keyed by module name.
     * @param analysisId Optional id. If empty, one will be generated.
     * @return The analysis report.
     */
    static nlohmann::json createOutput(
        const nlohmann::json& audioMetadata,
        const std::map<std::string, nlohmann::json>& moduleResults,
        const std::string& analysisId = ""
    ) {
        nlohmann::json output;

        output["version"] = CURRENT_VERSION;
        output["timestamp"] = getCurrentTimestamp();
        output["analysisId"] = analysisId.empty() ? generateId("analysis") : analysisId;
        output["audio"] = audioMetadata;

        if (moduleResults.count("Tempo")) {
            const auto& tempo = moduleResults.at("Tempo");
            output["tempo"] = {
                {"bpm", tempo["bpm"]},
                {"method", tempo.value("method", std::string("unknown"))},
                {"beatGrid", compressBeatGrid(tempo.value("beats", nlohmann::json::array()))}
            };
        }

        if (moduleResults.count("Energy")) {
            const auto& energy = moduleResults.at("Energy");
            output["energy"] = {
                {"overall", energy["overallEnergy"]},
                {"frameRate", energy["frameRate"]},
                {"curve", compressCurve(energy.value("curve", nlohmann::json::array()))}
            };
        }

        if (moduleResults.count("Segments") && moduleResults.at("Segments").contains("segments")) {
            output["segments"] = moduleResults.at("Segments")["segments"];
        } else {
            output["segments"] = nlohmann::json::array();
        }

        if (moduleResults.count("Highlight")) {
            const auto& highlight = moduleResults.at("Highlight");
            if (highlight.value("available", false)) {
                output["highlight"] = highlight["segment"];
                output["highlight"]["source"] = highlight.value("source", std::string("energy"));
                output["highlight"]["aligned"] = highlight.value("aligned", false);
            }
        }

        output["analysisMetadata"] = {
            {"modules", getModuleVersions(moduleResults)},
            {"processingTime", 0.0} // filled by the caller
        };

        return output;
    }

    /**
     * @brief Wraps a job status snapshot into the record written beside an export.
     */
    static nlohmann::json createJobRecord(const nlohmann::json& job) {
        return {
            {"version", CURRENT_VERSION},
            {"timestamp", getCurrentTimestamp()},
            {"job", job}
        };
    }

    /**
     * @brief Validates an analysis report against a contract version.
     */
    static bool validate(const nlohmann::json& json, int version = CURRENT_VERSION) {
        if (!json.contains("version") || json["version"] != version) {
            return false;
        }

        if (version == 1) {
            return json.contains("audio") &&
                   json.contains("timestamp") &&
                   json.contains("analysisId") &&
                   json.contains("segments") && json["segments"].is_array();
        }

        return false;
    }

    /**
     * @brief Compresses a beat list.
     *
     * If the beats are regularly spaced, only the start time, interval and count are stored.
     * Otherwise the plain list of times is kept.
     *
     * @param beats Array of beat times in seconds.
     */
    static nlohmann::json compressBeatGrid(const nlohmann::json& beats) {
        if (beats.size() <= 2) return beats;

        std::vector<double> times;
        for (const auto& beat : beats) {
            times.push_back(beat.get<double>());
        }

        double interval = times[1] - times[0];
        bool isRegular = true;
        for (size_t i = 2; i < times.size(); ++i) {
            double expectedTime = times[0] + interval * i;
            if (std::abs(times[i] - expectedTime) > 0.01) {
                isRegular = false;
                break;
            }
        }

        if (isRegular) {
            return {
                {"type", "regular"},
                {"start", times[0]},
                {"interval", interval},
                {"count", times.size()}
            };
        }
        return beats;
    }

    /**
     * @brief Inverse of compressBeatGrid().
     */
    static std::vector<double> expandBeatGrid(const nlohmann::json& grid) {
        std::vector<double> times;
        if (grid.is_object() && grid.value("type", std::string()) == "regular") {
            double start = grid.value("start", 0.0);
            double interval = grid.value("interval", 0.0);
            size_t count = grid.value("count", static_cast<size_t>(0));
            for (size_t i = 0; i < count; ++i) {
                times.push_back(start + interval * i);
            }
        } else if (grid.is_array()) {
            for (const auto& t : grid) {
                times.push_back(t.get<double>());
            }
        }
        return times;
    }

    /**
     * @brief Subsamples a curve to at most maxPoints values.
     */
    static nlohmann::json compressCurve(const nlohmann::json& curve, size_t maxPoints = 200) {
        nlohmann::json compressed = nlohmann::json::array();
        size_t size = curve.size();
        size_t step = (size > maxPoints) ? size / maxPoints : 1;
        for (size_t i = 0; i < size; i += step) {
            compressed.push_back(curve[i]);
        }
        return compressed;
    }

    /**
     * @brief Generates an id from a prefix and the current time in milliseconds.
     */
    static std::string generateId(const std::string& prefix) {
        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count();
        return prefix + "_" + std::to_string(millis);
    }

private:
    /**
     * @brief Current time as ISO 8601 UTC, "YYYY-MM-DDTHH:MM:SSZ".
     */
    static std::string getCurrentTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    static nlohmann::json getModuleVersions(const std::map<std::string, nlohmann::json>& results) {
        nlohmann::json versions = nlohmann::json::object();
        for (const auto& [name, result] : results) {
            versions[name] = result.value("version", std::string("1.0.0"));
        }
        return versions;
    }
};

} // namespace vmx::core
