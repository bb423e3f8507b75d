#include "../../include/core/TempDir.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
#include <system_error>

namespace vmx::core {

namespace {

std::string uniqueSuffix() {
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    std::mt19937 gen(rd());
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(ticks) + "_" + std::to_string(counter++) + "_" +
           std::to_string(gen() % 100000);
}

} // namespace

ScopedTempDir::ScopedTempDir(const std::string& prefix, const std::filesystem::path& parent) {
    std::filesystem::path base = parent.empty() ? std::filesystem::temp_directory_path() : parent;
    std::filesystem::create_directories(base);
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::filesystem::path candidate = base / (prefix + "_" + uniqueSuffix());
        if (std::filesystem::create_directory(candidate)) {
            m_path = candidate;
            return;
        }
    }
    throw std::filesystem::filesystem_error(
        "Could not create a unique temporary directory", base,
        std::make_error_code(std::errc::file_exists));
}

ScopedTempDir::~ScopedTempDir() {
    if (m_path.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
    if (ec) {
        std::cerr << "[TempDir] Failed to remove " << m_path << ": " << ec.message() << std::endl;
    }
}

} // namespace vmx::core
