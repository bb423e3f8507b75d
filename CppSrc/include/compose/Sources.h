#pragma once

#include "Collaborators.h"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vmx::compose {

class ITranscoder;

/**
 * @brief Reads a "<media>.popularity.json" sidecar (array of {start, end, score}).
 * @return Empty when the file is missing or unreadable.
 */
std::vector<core::PopularitySample> readPopularitySidecar(const std::filesystem::path& path);

void writePopularitySidecar(const std::filesystem::path& path,
                            const std::vector<core::PopularitySample>& samples);

/**
 * @brief Makes a source id safe to use as a file name.
 */
std::string sanitizeSourceId(const std::string& sourceId);

/**
 * @brief Looks sources up in a media directory as "<id>.<ext>".
 */
class LocalSourceFetcher : public ISourceFetcher {
public:
    explicit LocalSourceFetcher(std::filesystem::path mediaDir);

    FetchResult fetch(const std::string& sourceId, const std::string& destPath) override;

    /** @brief The media file for sourceId, empty if none exists. */
    std::filesystem::path locate(const std::string& sourceId) const;

private:
    std::filesystem::path m_mediaDir;
};

/**
 * @brief Runs an external downloader command template with {id} and {output}.
 */
class CommandSourceFetcher : public ISourceFetcher {
public:
    CommandSourceFetcher(std::string commandTemplate, ITranscoder* transcoder = nullptr);

    FetchResult fetch(const std::string& sourceId, const std::string& destPath) override;

private:
    std::string m_template;
    ITranscoder* m_transcoder;
};

/**
 * @brief Read-through cache of source media keyed by source id.
 *
 * Concurrent lookups of one id share a per-key mutex, so the underlying fetch
 * runs once. Entries are fetched into a temporary name and renamed into place.
 */
class SourceCache {
public:
    SourceCache(std::filesystem::path cacheDir, ISourceFetcher& fetcher);

    FetchResult get(const std::string& sourceId);

    std::filesystem::path entryPath(const std::string& sourceId) const;

    /** @brief Number of fetches delegated to the fetcher. */
    size_t fetchCount() const;

private:
    std::mutex& keyMutex(const std::string& sourceId);

    std::filesystem::path m_cacheDir;
    ISourceFetcher& m_fetcher;
    mutable std::mutex m_mapMutex;
    std::map<std::string, std::unique_ptr<std::mutex>> m_keyMutexes;
    size_t m_fetchCount = 0;
};

} // namespace vmx::compose
