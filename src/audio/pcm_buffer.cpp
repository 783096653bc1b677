#include "audio/pcm_buffer.h"

#include "logging/logger.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <sndfile.h>

namespace needledrop {
namespace audio {

namespace {

// libsndfile rewrites the RIFF header on close, so the sink must support
// seeking backwards and overwriting.
struct MemorySink {
    std::vector<uint8_t> bytes;
    sf_count_t position = 0;
};

sf_count_t memLength(void* userData) {
    return static_cast<sf_count_t>(static_cast<MemorySink*>(userData)->bytes.size());
}

sf_count_t memSeek(sf_count_t offset, int whence, void* userData) {
    auto* sink = static_cast<MemorySink*>(userData);
    sf_count_t base = 0;
    switch (whence) {
    case SEEK_SET:
        base = 0;
        break;
    case SEEK_CUR:
        base = sink->position;
        break;
    case SEEK_END:
        base = static_cast<sf_count_t>(sink->bytes.size());
        break;
    default:
        return -1;
    }
    sf_count_t target = base + offset;
    if (target < 0) {
        return -1;
    }
    sink->position = target;
    return sink->position;
}

sf_count_t memRead(void* ptr, sf_count_t count, void* userData) {
    auto* sink = static_cast<MemorySink*>(userData);
    const auto size = static_cast<sf_count_t>(sink->bytes.size());
    if (sink->position >= size || count <= 0) {
        return 0;
    }
    sf_count_t n = std::min(count, size - sink->position);
    std::memcpy(ptr, sink->bytes.data() + sink->position, static_cast<size_t>(n));
    sink->position += n;
    return n;
}

sf_count_t memWrite(const void* ptr, sf_count_t count, void* userData) {
    auto* sink = static_cast<MemorySink*>(userData);
    if (count <= 0) {
        return 0;
    }
    const auto end = static_cast<size_t>(sink->position + count);
    if (end > sink->bytes.size()) {
        sink->bytes.resize(end);
    }
    std::memcpy(sink->bytes.data() + sink->position, ptr, static_cast<size_t>(count));
    sink->position += count;
    return count;
}

sf_count_t memTell(void* userData) {
    return static_cast<MemorySink*>(userData)->position;
}

}  // namespace

std::vector<uint8_t> encodeWav16(const PcmBuffer& buffer) {
    SF_VIRTUAL_IO io{};
    io.get_filelen = memLength;
    io.seek = memSeek;
    io.read = memRead;
    io.write = memWrite;
    io.tell = memTell;

    SF_INFO info{};
    info.samplerate = static_cast<int>(buffer.sampleRate);
    info.channels = buffer.channels == 0 ? 1 : buffer.channels;
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    MemorySink sink;
    SNDFILE* file = sf_open_virtual(&io, SFM_WRITE, &info, &sink);
    if (!file) {
        LOG_ERROR("WAV encode failed: {}", sf_strerror(nullptr));
        return {};
    }

    const std::vector<int16_t> pcm = toInt16(buffer);
    const auto frames = static_cast<sf_count_t>(pcm.size() / static_cast<size_t>(info.channels));
    const sf_count_t written = sf_writef_short(file, pcm.data(), frames);
    sf_close(file);

    if (written != frames) {
        LOG_ERROR("WAV encode incomplete: expected {} frames, wrote {}", frames, written);
        return {};
    }
    return std::move(sink.bytes);
}

}  // namespace audio
}  // namespace needledrop
