#pragma once

#include <vector>
#include <cstddef>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace vmx::core {

/**
 * @brief Planar (non-interleaved) multi-channel audio buffer.
 *
 * Samples are stored channel after channel: L L L ... R R R ...
 * This is the decoded form of a source track handed to the energy analyzer.
 */
class AudioBuffer {
public:
    AudioBuffer() = default;

    /**
     * @brief Constructs a zeroed buffer.
     *
     * @param channels The number of audio channels.
     * @param frames The number of sample frames per channel.
     * @param sampleRate The sample rate in Hz (default 22050, the analysis rate).
     */
    AudioBuffer(size_t channels, size_t frames, float sampleRate = 22050.0f);

    /**
     * @brief Pointer to the first sample of a channel, or nullptr when out of range.
     */
    float* getChannel(size_t channel);
    const float* getChannel(size_t channel) const;

    /**
     * @brief Averages all channels into a single mono signal.
     * @return The mono mix; empty when the buffer is empty.
     */
    std::vector<float> getMono() const;

    size_t getChannelCount() const { return m_channels; }
    size_t getFrameCount() const { return m_frames; }
    float getSampleRate() const { return m_sampleRate; }

    /**
     * @brief Duration of the buffer in seconds.
     */
    double getDuration() const {
        return m_sampleRate > 0.0f ? m_frames / static_cast<double>(m_sampleRate) : 0.0;
    }

    bool empty() const { return m_frames == 0 || m_channels == 0; }

    /**
     * @brief Builds a mono buffer from already decoded samples.
     */
    static AudioBuffer fromMono(const std::vector<float>& samples, float sampleRate);

private:
    std::vector<float> m_data;
    size_t m_channels = 0;
    size_t m_frames = 0;
    float m_sampleRate = 22050.0f;
};

/**
 * @brief Magnitude spectrum of one analysis frame (FFT size / 2 + 1 bins).
 */
class SpectralFrame {
public:
    std::vector<float> magnitudes;
    float timestamp = 0.0f;           ///< Time in seconds of the frame center

    /**
     * @brief Spectral centroid in bin units ("brightness").
     * @return 0 for an empty or silent frame.
     */
    float getSpectralCentroid() const;

    /**
     * @brief Half-wave rectified difference of log-compressed magnitudes against
     * the previous frame ("punch").
     * @return 0 if the frame sizes differ.
     */
    float getLogSpectralFlux(const SpectralFrame& previous) const;
};

namespace window {

    /**
     * @brief Hann window coefficients.
     */
    std::vector<float> hann(size_t size);

}

} // namespace vmx::core
