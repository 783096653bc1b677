#include "audio/audio_source.h"

#include <algorithm>

namespace needledrop {
namespace audio {

PcmBuffer captureFrames(AudioSource& source, size_t frames, size_t chunkFrames) {
    if (chunkFrames == 0) {
        chunkFrames = frames;
    }

    PcmBuffer clip;
    clip.samples.reserve(frames);
    size_t remaining = frames;
    bool first = true;
    while (remaining > 0) {
        const size_t request = std::min(remaining, chunkFrames);
        PcmBuffer chunk = source.read(request);
        if (first) {
            clip.sampleRate = chunk.sampleRate;
            clip.channels = chunk.channels;
            first = false;
        }
        append(clip, chunk);
        // A short read still consumes its request so capture always terminates.
        remaining -= request;
    }
    return clip;
}

}  // namespace audio
}  // namespace needledrop
