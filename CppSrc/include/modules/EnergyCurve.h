#ifndef VIDMIX_ENERGYCURVE_H
#define VIDMIX_ENERGYCURVE_H

#include <vector>
#include <nlohmann/json.hpp>

namespace vmx::modules {

    /**
     * @brief Read-only view of an "Energy" module result with O(1) window means.
     */
    class EnergyCurve {
    public:
        /**
         * @throw std::runtime_error if the result has no curve or frame rate.
         */
        static EnergyCurve fromResult(const nlohmann::json& energyResult);

        EnergyCurve(std::vector<double> values, std::vector<double> rms, double frameRate);

        size_t size() const { return m_values.size(); }
        bool empty() const { return m_values.empty(); }
        double frameRate() const { return m_frameRate; }
        double duration() const { return m_frameRate > 0.0 ? m_values.size() / m_frameRate : 0.0; }

        const std::vector<double>& values() const { return m_values; }
        const std::vector<double>& rms() const { return m_rms; }

        /** @brief Mean of frames [begin, end), 0 for an empty range. */
        double mean(size_t begin, size_t end) const;

        /** @brief Mean over the frames covering [startSec, endSec). */
        double meanBetween(double startSec, double endSec) const;

        size_t toFrame(double seconds) const;
        double toSeconds(size_t frame) const { return m_frameRate > 0.0 ? frame / m_frameRate : 0.0; }

    private:
        std::vector<double> m_values;
        std::vector<double> m_rms;
        std::vector<double> m_prefix;
        double m_frameRate = 0.0;
    };

} // namespace vmx::modules

#endif //VIDMIX_ENERGYCURVE_H
