#include "../../include/pipeline/AudioLoader.h"
#include <fstream>
#include <stdexcept>
#include <cstdint>
#include <vector>
#include <string>
#include <algorithm>
#include <cstring>
#include <cmath>

namespace vmx::pipeline {

static uint32_t read_u32_le(std::ifstream& f) { uint32_t v = 0; f.read(reinterpret_cast<char*>(&v), 4); return v; }

static uint16_t read_u16_le(std::ifstream& f) { uint16_t v = 0; f.read(reinterpret_cast<char*>(&v), 2); return v; }

namespace {

float decodeSample(const uint8_t* p, uint16_t audioFormat, uint16_t bitsPerSample) {
    if (audioFormat == 3) {
        float s;
        std::memcpy(&s, p, 4);
        return s;
    }
    if (bitsPerSample == 16) {
        int16_t s;
        std::memcpy(&s, p, 2);
        return static_cast<float>(s) / 32768.0f;
    }
    // 24-bit little-endian with sign extension
    int32_t v = p[0] | (p[1] << 8) | (p[2] << 16);
    if (v & 0x800000) v |= ~0xFFFFFF;
    return static_cast<float>(v) / 8388608.0f;
}

} // namespace

/**
 * @brief Loads a WAV file into an AudioBuffer.
 *
 * Walks the RIFF chunks to find 'fmt ' and 'data', then decodes the whole
 * data block at once. A data chunk that claims more bytes than the file holds
 * (interrupted writer) is truncated to what is actually present.
 */
core::AudioBuffer AudioLoader::loadWav(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open WAV: " + path);

    char riff[4]; f.read(riff, 4);
    if (f.gcount() != 4 || std::string(riff, 4) != "RIFF") throw std::runtime_error("Not a RIFF file: " + path);
    (void)read_u32_le(f);
    char wave[4]; f.read(wave, 4);
    if (f.gcount() != 4 || std::string(wave, 4) != "WAVE") throw std::runtime_error("Not a WAVE file: " + path);

    uint16_t audioFormat = 0, numChannels = 0, bitsPerSample = 0;
    uint32_t sampleRate = 0;
    std::vector<uint8_t> data;

    while (f) {
        char id[4]; f.read(id, 4);
        if (f.gcount() != 4) break;
        uint32_t chunkSize = read_u32_le(f);
        if (!f) break;
        std::string chunkId(id, 4);
        if (chunkId == "fmt ") {
            audioFormat = read_u16_le(f);
            numChannels = read_u16_le(f);
            sampleRate = read_u32_le(f);
            (void)read_u32_le(f); (void)read_u16_le(f); // byte rate, block align
            bitsPerSample = read_u16_le(f);
            if (chunkSize > 16) f.seekg(chunkSize - 16, std::ios::cur);
        } else if (chunkId == "data") {
            data.resize(chunkSize);
            f.read(reinterpret_cast<char*>(data.data()), chunkSize);
            data.resize(static_cast<size_t>(f.gcount()));
            break;
        } else {
            f.seekg(chunkSize, std::ios::cur);
        }
        if (chunkSize % 2 == 1) f.seekg(1, std::ios::cur);
    }

    if (audioFormat == 0 || numChannels == 0 || sampleRate == 0) {
        throw std::runtime_error("Invalid WAV: missing 'fmt ' chunk in " + path);
    }
    bool supported = (audioFormat == 1 && (bitsPerSample == 16 || bitsPerSample == 24)) ||
                     (audioFormat == 3 && bitsPerSample == 32);
    if (!supported) {
        throw std::runtime_error("Unsupported audio format or bit depth: Format=" + std::to_string(audioFormat) +
                                 ", Bits=" + std::to_string(bitsPerSample));
    }
    if (data.empty()) throw std::runtime_error("Invalid WAV: empty 'data' chunk in " + path);

    const size_t bytesPerSample = bitsPerSample / 8;
    const size_t frameBytes = bytesPerSample * numChannels;
    const size_t frames = data.size() / frameBytes;
    core::AudioBuffer buffer(numChannels, frames, static_cast<float>(sampleRate));

    for (size_t ch = 0; ch < numChannels; ++ch) {
        float* out = buffer.getChannel(ch);
        const uint8_t* in = data.data() + ch * bytesPerSample;
        for (size_t i = 0; i < frames; ++i, in += frameBytes) {
            out[i] = decodeSample(in, audioFormat, bitsPerSample);
        }
    }
    return buffer;
}

void AudioLoader::writeWavMono16(const std::string& path, const std::vector<float>& samples,
                                 float sampleRate) {
    if (sampleRate <= 0.0f) throw std::runtime_error("Invalid sample rate for WAV output");
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) throw std::runtime_error("Failed to open WAV output: " + path);

    const uint16_t channels = 1;
    const uint16_t bitsPerSample = 16;
    const uint32_t rate = static_cast<uint32_t>(std::lround(sampleRate));
    const uint32_t byteRate = rate * channels * (bitsPerSample / 8);
    const uint16_t blockAlign = channels * (bitsPerSample / 8);
    const uint32_t dataSize = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint32_t riffSize = 36 + dataSize;
    const uint32_t fmtSize = 16;
    const uint16_t audioFormat = 1;

    out.write("RIFF", 4);
    out.write(reinterpret_cast<const char*>(&riffSize), 4);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    out.write(reinterpret_cast<const char*>(&fmtSize), 4);
    out.write(reinterpret_cast<const char*>(&audioFormat), 2);
    out.write(reinterpret_cast<const char*>(&channels), 2);
    out.write(reinterpret_cast<const char*>(&rate), 4);
    out.write(reinterpret_cast<const char*>(&byteRate), 4);
    out.write(reinterpret_cast<const char*>(&blockAlign), 2);
    out.write(reinterpret_cast<const char*>(&bitsPerSample), 2);
    out.write("data", 4);
    out.write(reinterpret_cast<const char*>(&dataSize), 4);

    for (float sample : samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, sample));
        int16_t s = static_cast<int16_t>(std::lround(clamped * 32767.0f));
        out.write(reinterpret_cast<const char*>(&s), 2);
    }
    if (!out) throw std::runtime_error("Failed to write WAV: " + path);
}

} // namespace vmx::pipeline
