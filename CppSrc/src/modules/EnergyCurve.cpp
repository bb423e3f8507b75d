#include "../../include/modules/EnergyCurve.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace vmx::modules {

EnergyCurve EnergyCurve::fromResult(const nlohmann::json& energyResult) {
    if (!energyResult.contains("curve") || !energyResult.contains("frameRate")) {
        throw std::runtime_error("Energy result is missing 'curve' or 'frameRate'");
    }
    std::vector<double> values = energyResult["curve"].get<std::vector<double>>();
    std::vector<double> rms;
    if (energyResult.contains("rms")) {
        rms = energyResult["rms"].get<std::vector<double>>();
    }
    return EnergyCurve(std::move(values), std::move(rms), energyResult["frameRate"].get<double>());
}

EnergyCurve::EnergyCurve(std::vector<double> values, std::vector<double> rms, double frameRate)
    : m_values(std::move(values))
    , m_rms(std::move(rms))
    , m_frameRate(frameRate) {
    m_prefix.assign(m_values.size() + 1, 0.0);
    for (size_t i = 0; i < m_values.size(); ++i) {
        m_prefix[i + 1] = m_prefix[i] + m_values[i];
    }
}

double EnergyCurve::mean(size_t begin, size_t end) const {
    end = std::min(end, m_values.size());
    if (begin >= end) return 0.0;
    return (m_prefix[end] - m_prefix[begin]) / static_cast<double>(end - begin);
}

double EnergyCurve::meanBetween(double startSec, double endSec) const {
    return mean(toFrame(startSec), static_cast<size_t>(std::ceil(std::max(0.0, endSec) * m_frameRate)));
}

size_t EnergyCurve::toFrame(double seconds) const {
    if (seconds <= 0.0) return 0;
    return std::min(m_values.size(), static_cast<size_t>(std::floor(seconds * m_frameRate)));
}

} // namespace vmx::modules
