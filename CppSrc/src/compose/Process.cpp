#include "../../include/compose/Process.h"
#include <array>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>

namespace vmx::compose {

std::string shellEscape(const std::string& value) {
    std::string escaped = "'";
    for (char ch : value) {
        if (ch == '\'') {
            escaped += "'\\''";
        } else {
            escaped += ch;
        }
    }
    escaped += "'";
    return escaped;
}

ProcessResult runShell(const std::string& commandLine) {
    const std::string full = commandLine + " 2>&1";
    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to launch subprocess: " + commandLine);
    }

    ProcessResult result;
    std::array<char, 4096> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.output += buffer.data();
    }

    const int status = pclose(pipe);
    if (status == -1) {
        throw std::runtime_error("Failed to wait for subprocess: " + commandLine);
    }
    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return result;
}

ProcessResult runProcess(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::runtime_error("Empty command");
    }
    std::ostringstream command;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) command << ' ';
        command << shellEscape(argv[i]);
    }
    return runShell(command.str());
}

std::string expandTemplate(std::string commandTemplate,
                           const std::vector<std::pair<std::string, std::string>>& values) {
    for (const auto& [key, value] : values) {
        const std::string placeholder = "{" + key + "}";
        const std::string escaped = shellEscape(value);
        size_t pos = 0;
        while ((pos = commandTemplate.find(placeholder, pos)) != std::string::npos) {
            commandTemplate.replace(pos, placeholder.size(), escaped);
            pos += escaped.size();
        }
    }
    return commandTemplate;
}

} // namespace vmx::compose
