#pragma once

#include <filesystem>
#include <string>

namespace vmx::core {

/**
 * @brief Uniquely named working directory removed with its contents on destruction.
 *
 * Every composition job owns one, so cleanup runs on success, failure and
 * cancellation alike.
 */
class ScopedTempDir {
public:
    /**
     * @param prefix Directory name prefix.
     * @param parent Parent directory; the system temp directory when empty.
     * @throw std::filesystem::filesystem_error if the directory cannot be created.
     */
    explicit ScopedTempDir(const std::string& prefix = "vmx",
                           const std::filesystem::path& parent = {});
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    /** @brief Path of a file inside the directory. */
    std::filesystem::path file(const std::string& name) const { return m_path / name; }

private:
    std::filesystem::path m_path;
};

} // namespace vmx::core
