#include "../../include/compose/Sources.h"
#include "../../include/compose/Process.h"
#include "../../include/compose/Transcoder.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace vmx::compose {

std::vector<core::PopularitySample> readPopularitySidecar(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return {};

    std::ifstream in(path);
    if (!in) return {};
    try {
        nlohmann::json j;
        in >> j;
        if (!j.is_array()) {
            std::cerr << "[Cache] Popularity sidecar is not an array: " << path << std::endl;
            return {};
        }
        return j.get<std::vector<core::PopularitySample>>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Cache] Ignoring unreadable popularity sidecar " << path << ": " << e.what() << std::endl;
        return {};
    }
}

void writePopularitySidecar(const fs::path& path, const std::vector<core::PopularitySample>& samples) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "[Cache] Could not write popularity sidecar " << path << std::endl;
        return;
    }
    out << nlohmann::json(samples).dump(2);
}

std::string sanitizeSourceId(const std::string& sourceId) {
    std::string safe;
    for (char ch : sourceId) {
        unsigned char c = static_cast<unsigned char>(ch);
        safe += (std::isalnum(c) || ch == '-' || ch == '_') ? ch : '_';
    }
    return safe.empty() ? "source" : safe;
}

// ----------------------------------------------------------------------------
// LocalSourceFetcher
// ----------------------------------------------------------------------------

LocalSourceFetcher::LocalSourceFetcher(fs::path mediaDir)
    : m_mediaDir(std::move(mediaDir)) {}

fs::path LocalSourceFetcher::locate(const std::string& sourceId) const {
    static const char* extensions[] = {".mp4", ".mkv", ".webm", ".mov", ".m4a", ".mp3", ".wav"};
    std::error_code ec;
    for (const char* ext : extensions) {
        fs::path candidate = m_mediaDir / (sourceId + ext);
        if (fs::is_regular_file(candidate, ec)) return candidate;
    }
    return {};
}

FetchResult LocalSourceFetcher::fetch(const std::string& sourceId, const std::string& destPath) {
    FetchResult result;
    const fs::path source = locate(sourceId);
    if (source.empty()) {
        result.error = "no media for '" + sourceId + "' in " + m_mediaDir.string();
        return result;
    }

    std::error_code ec;
    fs::copy_file(source, destPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        result.error = "copy failed: " + ec.message();
        return result;
    }

    result.ok = true;
    result.path = destPath;
    result.popularity = readPopularitySidecar(m_mediaDir / (sourceId + ".popularity.json"));
    return result;
}

// ----------------------------------------------------------------------------
// CommandSourceFetcher
// ----------------------------------------------------------------------------

CommandSourceFetcher::CommandSourceFetcher(std::string commandTemplate, ITranscoder* transcoder)
    : m_template(std::move(commandTemplate))
    , m_transcoder(transcoder) {}

FetchResult CommandSourceFetcher::fetch(const std::string& sourceId, const std::string& destPath) {
    FetchResult result;
    if (m_template.empty()) {
        result.error = "no fetch command configured";
        return result;
    }

    const std::string command = expandTemplate(m_template, {{"id", sourceId}, {"output", destPath}});
    try {
        ProcessResult process = runShell(command);
        if (process.exitCode != 0) {
            result.error = "fetch command exited with " + std::to_string(process.exitCode);
            return result;
        }
    } catch (const std::runtime_error& e) {
        result.error = e.what();
        return result;
    }

    std::error_code ec;
    if (!fs::exists(destPath, ec) || fs::file_size(destPath, ec) == 0 || ec) {
        result.error = "fetch command produced no file";
        return result;
    }

    result.ok = true;
    result.path = destPath;
    result.popularity = readPopularitySidecar(destPath + ".popularity.json");
    if (m_transcoder) {
        result.duration = m_transcoder->probeDuration(destPath);
    }
    return result;
}

// ----------------------------------------------------------------------------
// SourceCache
// ----------------------------------------------------------------------------

SourceCache::SourceCache(fs::path cacheDir, ISourceFetcher& fetcher)
    : m_cacheDir(std::move(cacheDir))
    , m_fetcher(fetcher) {}

fs::path SourceCache::entryPath(const std::string& sourceId) const {
    return m_cacheDir / (sanitizeSourceId(sourceId) + ".mp4");
}

// Keyed by cache file name: ids that sanitize alike share one entry
std::mutex& SourceCache::keyMutex(const std::string& sourceId) {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    auto& slot = m_keyMutexes[sanitizeSourceId(sourceId)];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

size_t SourceCache::fetchCount() const {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    return m_fetchCount;
}

FetchResult SourceCache::get(const std::string& sourceId) {
    std::lock_guard<std::mutex> keyLock(keyMutex(sourceId));

    const fs::path entry = entryPath(sourceId);
    const fs::path sidecar = m_cacheDir / (sanitizeSourceId(sourceId) + ".popularity.json");

    std::error_code ec;
    if (fs::is_regular_file(entry, ec) && fs::file_size(entry, ec) > 0 && !ec) {
        FetchResult hit;
        hit.ok = true;
        hit.path = entry.string();
        hit.popularity = readPopularitySidecar(sidecar);
        return hit;
    }

    fs::create_directories(m_cacheDir, ec);
    if (ec) {
        FetchResult failed;
        failed.error = "cannot create cache directory " + m_cacheDir.string() + ": " + ec.message();
        return failed;
    }

    const fs::path partial = entry.string() + ".part";
    {
        std::lock_guard<std::mutex> lock(m_mapMutex);
        ++m_fetchCount;
    }
    std::cout << "[Cache] Fetching " << sourceId << std::endl;
    FetchResult fetched = m_fetcher.fetch(sourceId, partial.string());
    if (!fetched.ok) {
        fs::remove(partial, ec);
        return fetched;
    }

    fs::rename(partial, entry, ec);
    if (ec) {
        FetchResult failed;
        failed.error = "cannot move fetched media into the cache: " + ec.message();
        fs::remove(partial, ec);
        return failed;
    }
    if (!fetched.popularity.empty()) {
        writePopularitySidecar(sidecar, fetched.popularity);
    }

    fetched.path = entry.string();
    return fetched;
}

} // namespace vmx::compose
