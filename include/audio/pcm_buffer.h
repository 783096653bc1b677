#ifndef NEEDLEDROP_PCM_BUFFER_H
#define NEEDLEDROP_PCM_BUFFER_H

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace needledrop {
namespace audio {

/**
 * @brief A block of captured audio.
 *
 * Samples are normalized floats in [-1, 1], interleaved when channels > 1.
 * The session core always works on mono buffers (see downmixToMono).
 */
struct PcmBuffer {
    std::vector<float> samples;
    uint32_t sampleRate = 48000;
    uint16_t channels = 1;

    size_t frames() const {
        return channels == 0 ? 0 : samples.size() / channels;
    }
    bool empty() const {
        return samples.empty();
    }
};

// Scale used when a metric is expressed in 16-bit integer units
constexpr float kInt16Scale = 32767.0f;

// Peak absolute amplitude of normalized samples (0.0 for an empty buffer)
inline float peakAmplitude(const PcmBuffer& buffer) {
    float peak = 0.0f;
    for (float sample : buffer.samples) {
        float value = std::fabs(sample);
        if (value > peak) {
            peak = value;
        }
    }
    return peak;
}

/**
 * @brief RMS energy in 16-bit integer units.
 *
 * Integer-sample thresholds (e.g. ~100 for "silence") apply directly.
 */
inline float rmsLevel(const PcmBuffer& buffer) {
    if (buffer.samples.empty()) {
        return 0.0f;
    }
    double sumSquares = 0.0;
    for (float sample : buffer.samples) {
        double scaled = static_cast<double>(sample) * kInt16Scale;
        sumSquares += scaled * scaled;
    }
    return static_cast<float>(std::sqrt(sumSquares / static_cast<double>(buffer.samples.size())));
}

inline PcmBuffer downmixToMono(const PcmBuffer& buffer) {
    if (buffer.channels <= 1) {
        return buffer;
    }
    PcmBuffer mono;
    mono.sampleRate = buffer.sampleRate;
    mono.channels = 1;
    const size_t frames = buffer.frames();
    mono.samples.resize(frames);
    for (size_t frame = 0; frame < frames; ++frame) {
        float sum = 0.0f;
        for (uint16_t ch = 0; ch < buffer.channels; ++ch) {
            sum += buffer.samples[frame * buffer.channels + ch];
        }
        mono.samples[frame] = sum / static_cast<float>(buffer.channels);
    }
    return mono;
}

// Append @p tail to @p head; formats must already match
inline void append(PcmBuffer& head, const PcmBuffer& tail) {
    head.samples.insert(head.samples.end(), tail.samples.begin(), tail.samples.end());
}

// Clamp and scale to signed 16-bit
inline std::vector<int16_t> toInt16(const PcmBuffer& buffer) {
    std::vector<int16_t> out;
    out.reserve(buffer.samples.size());
    for (float sample : buffer.samples) {
        float clamped = sample > 1.0f ? 1.0f : (sample < -1.0f ? -1.0f : sample);
        out.push_back(static_cast<int16_t>(std::lrint(clamped * kInt16Scale)));
    }
    return out;
}

/**
 * @brief Encode as an in-memory RIFF/WAVE file with 16-bit PCM samples.
 *
 * This is the clip format handed to the recognition sidecar.
 * Returns an empty vector if libsndfile rejects the format.
 */
std::vector<uint8_t> encodeWav16(const PcmBuffer& buffer);

}  // namespace audio
}  // namespace needledrop

#endif  // NEEDLEDROP_PCM_BUFFER_H
