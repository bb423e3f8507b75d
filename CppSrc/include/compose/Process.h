#pragma once

#include <string>
#include <vector>

namespace vmx::compose {

struct ProcessResult {
    int exitCode = -1;
    std::string output;   ///< stdout and stderr, interleaved
};

/**
 * @brief Wraps a value in single quotes for /bin/sh.
 */
std::string shellEscape(const std::string& value);

/**
 * @brief Runs a shell command line and collects its output.
 * @throw std::runtime_error if the process cannot be spawned.
 */
ProcessResult runShell(const std::string& commandLine);

/**
 * @brief Runs argv[0] with the remaining arguments, each one escaped.
 * @throw std::runtime_error if argv is empty or the process cannot be spawned.
 */
ProcessResult runProcess(const std::vector<std::string>& argv);

/**
 * @brief Replaces every "{key}" of a command template with the escaped value.
 */
std::string expandTemplate(std::string commandTemplate,
                           const std::vector<std::pair<std::string, std::string>>& values);

} // namespace vmx::compose
