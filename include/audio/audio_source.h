#pragma once

#include "audio/pcm_buffer.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace needledrop {
namespace audio {

struct CaptureDeviceInfo {
    int index = -1;
    std::string name;         // ALSA PCM name, e.g. "sysdefault:CARD=USB"
    std::string description;  // Human readable, first line of the ALSA hint
};

/**
 * @brief Exclusive capture handle for one session.
 *
 * open() and read() report failures by throwing DeviceError: OpenFailed
 * from open(), StreamClosed or IoError from read(). After StreamClosed the
 * caller closes and re-opens the same device.
 */
class AudioSource {
   public:
    virtual ~AudioSource() = default;

    virtual void open(int deviceId) = 0;

    // Blocks until @p frames mono frames are available
    virtual PcmBuffer read(size_t frames) = 0;

    // Idempotent
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    // Rate of the frames read() returns; a device may grant another rate than requested
    virtual uint32_t sampleRate() const = 0;
};

/**
 * @brief Capture @p frames frames in reads of at most @p chunkFrames.
 *
 * Mirrors how the session records a clip of fixed duration.
 */
PcmBuffer captureFrames(AudioSource& source, size_t frames, size_t chunkFrames);

}  // namespace audio
}  // namespace needledrop
