#ifndef VIDMIX_AUDIOLOADER_H
#define VIDMIX_AUDIOLOADER_H

#include <string>
#include <vector>
#include "../core/AudioBuffer.h"

namespace vmx::pipeline {

    /**
     * @brief Reads and writes the uncompressed WAV files exchanged with the transcoder.
     */
    class AudioLoader {
    public:
        /**
         * @brief Loads audio data from a WAV file into an AudioBuffer.
         *
         * Handles PCM 16/24-bit and IEEE float 32-bit, little-endian.
         *
         * @param path The file path to the WAV file.
         * @return The decoded audio, normalized to [-1.0, 1.0].
         * @throws std::runtime_error If the file cannot be opened, is corrupted, or if the format is unsupported.
         */
        static core::AudioBuffer loadWav(const std::string& path);

        /**
         * @brief Writes mono samples as a 16-bit PCM WAV file.
         * @throws std::runtime_error If the file cannot be written.
         */
        static void writeWavMono16(const std::string& path, const std::vector<float>& samples,
                                   float sampleRate);
    };

} // namespace vmx::pipeline

#endif //VIDMIX_AUDIOLOADER_H
