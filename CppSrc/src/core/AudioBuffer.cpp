#include "../../include/core/AudioBuffer.h"
#include <algorithm>
#include <cmath>

namespace vmx::core {

// ============================================================================
// AudioBuffer Implementation
// ============================================================================

AudioBuffer::AudioBuffer(size_t channels, size_t frames, float sampleRate)
    : m_channels(channels)
    , m_frames(frames)
    , m_sampleRate(sampleRate) {
    m_data.assign(channels * frames, 0.0f);
}

float* AudioBuffer::getChannel(size_t channel) {
    if (channel >= m_channels) {
        return nullptr;
    }
    return m_data.data() + channel * m_frames;
}

const float* AudioBuffer::getChannel(size_t channel) const {
    if (channel >= m_channels) {
        return nullptr;
    }
    return m_data.data() + channel * m_frames;
}

/**
 * @brief Creates a mono mixdown of the buffer.
 *
 * The resulting vector contains the average of all channels for each frame.
 */
std::vector<float> AudioBuffer::getMono() const {
    if (m_channels == 0 || m_frames == 0) {
        return {};
    }

    std::vector<float> mono(m_frames, 0.0f);

    if (m_channels == 1) {
        const float* channel = getChannel(0);
        std::copy(channel, channel + m_frames, mono.begin());
        return mono;
    }

    for (size_t ch = 0; ch < m_channels; ++ch) {
        const float* channel = getChannel(ch);
        for (size_t i = 0; i < m_frames; ++i) {
            mono[i] += channel[i];
        }
    }

    float scale = 1.0f / m_channels;
    for (float& sample : mono) {
        sample *= scale;
    }
    return mono;
}

AudioBuffer AudioBuffer::fromMono(const std::vector<float>& samples, float sampleRate) {
    AudioBuffer buffer(1, samples.size(), sampleRate);
    if (!samples.empty()) {
        std::copy(samples.begin(), samples.end(), buffer.getChannel(0));
    }
    return buffer;
}

// ============================================================================
// SpectralFrame Implementation
// ============================================================================

/**
 * @brief Calculates the spectral centroid, the "center of gravity" of the spectrum.
 *
 * Higher values mean brighter frames. Units are FFT bins; callers normalize
 * the resulting curve so the unit never leaks out of the analyzer.
 */
float SpectralFrame::getSpectralCentroid() const {
    if (magnitudes.empty()) {
        return 0.0f;
    }

    float weightedSum = 0.0f;
    float magnitudeSum = 0.0f;
    for (size_t i = 0; i < magnitudes.size(); ++i) {
        weightedSum += static_cast<float>(i) * magnitudes[i];
        magnitudeSum += magnitudes[i];
    }

    if (magnitudeSum <= 0.0f) {
        return 0.0f;
    }
    return weightedSum / magnitudeSum;
}

float SpectralFrame::getLogSpectralFlux(const SpectralFrame& previous) const {
    if (magnitudes.size() != previous.magnitudes.size()) {
        return 0.0f;
    }

    float flux = 0.0f;
    for (size_t i = 0; i < magnitudes.size(); ++i) {
        // log1p compression keeps loud bins from dominating the flux
        float diff = std::log1p(magnitudes[i]) - std::log1p(previous.magnitudes[i]);
        if (diff > 0.0f) {
            flux += diff;
        }
    }
    return flux;
}

// ============================================================================
// Window Functions Implementation
// ============================================================================

namespace window {

std::vector<float> hann(size_t size) {
    std::vector<float> window(size, 1.0f);
    if (size < 2) {
        return window;
    }
    // Hann window formula: 0.5 * (1 - cos(2*pi*i / (N-1)))
    for (size_t i = 0; i < size; ++i) {
        float t = static_cast<float>(i) / (size - 1);
        window[i] = 0.5f * (1.0f - std::cos(2.0f * static_cast<float>(M_PI) * t));
    }
    return window;
}

} // namespace window

} // namespace vmx::core
