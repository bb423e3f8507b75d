#pragma once

#include "Errors.h"
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vmx::core {

/**
 * @brief Ordered list of named fallback attempts; the first engaged result wins.
 *
 * Each attempt returns std::optional<T>. An empty optional or a thrown
 * std::exception moves on to the next attempt and is recorded in notes().
 * CancelledError is never absorbed: it leaves run() untouched.
 */
template <typename T>
class StrategyChain {
public:
    using Attempt = std::function<std::optional<T>()>;

    StrategyChain& add(const std::string& name, Attempt attempt) {
        m_attempts.emplace_back(name, std::move(attempt));
        return *this;
    }

    std::optional<T> run() {
        m_notes.clear();
        m_winner.clear();
        for (auto& [name, attempt] : m_attempts) {
            try {
                std::optional<T> result = attempt();
                if (result) {
                    m_winner = name;
                    return result;
                }
                m_notes.push_back(name + ": no result");
            } catch (const CancelledError&) {
                throw;
            } catch (const std::exception& e) {
                m_notes.push_back(name + ": " + e.what());
            }
        }
        return std::nullopt;
    }

    size_t size() const { return m_attempts.size(); }
    bool empty() const { return m_attempts.empty(); }

    /** @brief Name of the attempt that produced the last result, empty if none did. */
    const std::string& winner() const { return m_winner; }

    /** @brief One entry per failed attempt of the last run(). */
    const std::vector<std::string>& notes() const { return m_notes; }

private:
    std::vector<std::pair<std::string, Attempt>> m_attempts;
    std::vector<std::string> m_notes;
    std::string m_winner;
};

} // namespace vmx::core
