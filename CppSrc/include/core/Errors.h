#pragma once

#include <stdexcept>
#include <string>

namespace vmx::core {

/**
 * @brief Hard failure while analyzing a track (missing/corrupt audio, module failure).
 *
 * The stage is one of "decode", "load" or the name of the failing module.
 */
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(const std::string& stage, const std::string& message)
        : std::runtime_error(stage + ": " + message)
        , m_stage(stage) {}

    const std::string& stage() const { return m_stage; }

private:
    std::string m_stage;
};

/**
 * @brief Failure of one composition stage (intro, segment, transitions, ...).
 */
class StageError : public std::runtime_error {
public:
    StageError(const std::string& stage, const std::string& message)
        : std::runtime_error(message)
        , m_stage(stage) {}

    const std::string& stage() const { return m_stage; }

private:
    std::string m_stage;
};

/**
 * @brief Raised inside the composition pipeline when the job's cancel flag is observed.
 */
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& stage)
        : std::runtime_error("cancelled during " + stage)
        , m_stage(stage) {}

    const std::string& stage() const { return m_stage; }

private:
    std::string m_stage;
};

} // namespace vmx::core
