#include "audio/alsa_audio_source.h"

#include "core/errors.h"
#include "logging/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace needledrop {
namespace audio {

namespace {

std::string alsaMessage(const std::string& prefix, int err) {
    return prefix + ": " + snd_strerror(err);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isDisconnect(long err) {
    return err == -ENODEV || err == -EBADFD || err == -ENOTTY || err == -EIO;
}

}  // namespace

AlsaAudioSource::AlsaAudioSource(Config config) : config_(config) {}

AlsaAudioSource::~AlsaAudioSource() {
    close();
}

void AlsaAudioSource::open(int deviceId) {
    const auto devices = listCaptureDevices();
    auto it = std::find_if(devices.begin(), devices.end(),
                           [deviceId](const CaptureDeviceInfo& d) { return d.index == deviceId; });
    if (it == devices.end()) {
        throw DeviceError(DeviceError::Kind::OpenFailed,
                          "No capture device with index " + std::to_string(deviceId));
    }
    openByName(it->name);
}

void AlsaAudioSource::openByName(const std::string& pcmName) {
    close();
    deviceName_ = pcmName;

    auto fail = [&](const std::string& message, int err) {
        std::string text = alsaMessage(message, err);
        close();
        throw DeviceError(DeviceError::Kind::OpenFailed, text);
    };

    int rc = snd_pcm_open(&handle_, pcmName.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (rc < 0) {
        handle_ = nullptr;
        throw DeviceError(DeviceError::Kind::OpenFailed,
                          alsaMessage("snd_pcm_open(" + pcmName + ") failed", rc));
    }

    snd_pcm_hw_params_t* hwParams = nullptr;
    snd_pcm_hw_params_alloca(&hwParams);
    snd_pcm_hw_params_any(handle_, hwParams);

    rc = snd_pcm_hw_params_set_access(handle_, hwParams, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (rc < 0) {
        fail("set_access failed", rc);
    }

    auto selected = selectSupportedFormat(config_.format, [&](SampleFormat fmt) {
        return snd_pcm_hw_params_test_format(handle_, hwParams, toAlsaFormat(fmt)) == 0;
    });
    if (!selected) {
        close();
        throw DeviceError(DeviceError::Kind::OpenFailed,
                          "No supported capture format on " + pcmName);
    }
    if (*selected != config_.format) {
        LOG_INFO("[AlsaAudioSource] {} not supported, falling back to {}",
                 snd_pcm_format_name(toAlsaFormat(config_.format)),
                 snd_pcm_format_name(toAlsaFormat(*selected)));
        config_.format = *selected;
    }

    rc = snd_pcm_hw_params_set_format(handle_, hwParams, toAlsaFormat(config_.format));
    if (rc < 0) {
        fail("set_format failed", rc);
    }

    rc = snd_pcm_hw_params_set_channels(handle_, hwParams, config_.channels);
    if (rc < 0) {
        fail("set_channels failed", rc);
    }

    unsigned int rate = config_.sampleRate;
    rc = snd_pcm_hw_params_set_rate_near(handle_, hwParams, &rate, nullptr);
    if (rc < 0) {
        fail("set_rate_near failed", rc);
    }
    if (rate != config_.sampleRate) {
        LOG_WARN("[AlsaAudioSource] Requested rate {} Hz, device granted {} Hz",
                 config_.sampleRate, rate);
        config_.sampleRate = rate;
    }

    snd_pcm_uframes_t period = config_.periodFrames;
    rc = snd_pcm_hw_params_set_period_size_near(handle_, hwParams, &period, nullptr);
    if (rc < 0) {
        fail("set_period_size failed", rc);
    }

    rc = snd_pcm_hw_params(handle_, hwParams);
    if (rc < 0) {
        fail("apply hw_params failed", rc);
    }

    rc = snd_pcm_prepare(handle_);
    if (rc < 0) {
        fail("snd_pcm_prepare failed", rc);
    }

    LOG_INFO("[AlsaAudioSource] opened {} rate={} ch={} fmt={} period={}", pcmName,
             config_.sampleRate, config_.channels,
             snd_pcm_format_name(toAlsaFormat(config_.format)), period);
}

PcmBuffer AlsaAudioSource::read(size_t frames) {
    if (!handle_) {
        throw DeviceError(DeviceError::Kind::StreamClosed, "Stream closed");
    }

    const std::size_t sampleBytes = bytesPerSample(config_.format);
    const std::size_t frameBytes = sampleBytes * config_.channels;
    scratch_.resize(frames * frameBytes);

    PcmBuffer interleaved;
    interleaved.sampleRate = config_.sampleRate;
    interleaved.channels = static_cast<uint16_t>(config_.channels);
    interleaved.samples.reserve(frames * config_.channels);

    size_t got = 0;
    while (got < frames) {
        snd_pcm_sframes_t n =
            snd_pcm_readi(handle_, scratch_.data() + got * frameBytes, frames - got);
        if (n == -EPIPE) {
            // Overrun: drop what the hardware lost and keep capturing.
            LOG_EVERY_N(WARN, 50, "[AlsaAudioSource] XRUN on {}, recovering", deviceName_);
            int rc = snd_pcm_prepare(handle_);
            if (rc < 0) {
                throw DeviceError(DeviceError::Kind::StreamClosed,
                                  alsaMessage("snd_pcm_prepare after XRUN failed", rc));
            }
            continue;
        }
        if (n == -EAGAIN) {
            continue;
        }
        if (n < 0) {
            const auto kind = isDisconnect(n) ? DeviceError::Kind::StreamClosed
                                              : DeviceError::Kind::IoError;
            throw DeviceError(kind, alsaMessage("snd_pcm_readi failed", static_cast<int>(n)));
        }
        got += static_cast<size_t>(n);
    }

    decodeToFloat(scratch_.data(), frames * config_.channels, config_.format,
                  interleaved.samples);
    return downmixToMono(interleaved);
}

void AlsaAudioSource::close() {
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
        LOG_INFO("[AlsaAudioSource] closed {}", deviceName_);
    }
}

bool AlsaAudioSource::isOpen() const {
    return handle_ != nullptr;
}

std::vector<CaptureDeviceInfo> AlsaAudioSource::listCaptureDevices() {
    std::vector<CaptureDeviceInfo> devices;

    void** hints = nullptr;
    if (snd_device_name_hint(-1, "pcm", &hints) != 0 || hints == nullptr) {
        LOG_WARN("[AlsaAudioSource] snd_device_name_hint failed");
        return devices;
    }

    for (void** hint = hints; *hint != nullptr; ++hint) {
        char* name = snd_device_name_get_hint(*hint, "NAME");
        char* desc = snd_device_name_get_hint(*hint, "DESC");
        char* ioid = snd_device_name_get_hint(*hint, "IOID");

        // A missing IOID means the PCM does both directions.
        const bool capture = ioid == nullptr || std::strcmp(ioid, "Input") == 0;
        if (name && capture && std::strcmp(name, "null") != 0) {
            CaptureDeviceInfo info;
            info.index = static_cast<int>(devices.size());
            info.name = name;
            if (desc) {
                std::string text{desc};
                info.description = text.substr(0, text.find('\n'));
            }
            devices.push_back(std::move(info));
        }
        std::free(name);
        std::free(desc);
        std::free(ioid);
    }
    snd_device_name_free_hint(hints);
    return devices;
}

std::optional<int> AlsaAudioSource::chooseDefaultDevice(
    const std::vector<CaptureDeviceInfo>& devices) {
    for (const auto& device : devices) {
        if (toLower(device.name).find("sysdefault") != std::string::npos) {
            return device.index;
        }
    }
    for (const auto& device : devices) {
        if (toLower(device.name).find("usb") != std::string::npos ||
            toLower(device.description).find("usb") != std::string::npos) {
            return device.index;
        }
    }
    if (!devices.empty()) {
        return devices.front().index;
    }
    return std::nullopt;
}

snd_pcm_format_t AlsaAudioSource::toAlsaFormat(SampleFormat format) {
    switch (format) {
    case SampleFormat::FLOAT_LE:
        return SND_PCM_FORMAT_FLOAT_LE;
    case SampleFormat::S32_LE:
        return SND_PCM_FORMAT_S32_LE;
    case SampleFormat::S16_LE:
        return SND_PCM_FORMAT_S16_LE;
    }
    return SND_PCM_FORMAT_UNKNOWN;
}

std::size_t AlsaAudioSource::bytesPerSample(SampleFormat format) {
    switch (format) {
    case SampleFormat::FLOAT_LE:
    case SampleFormat::S32_LE:
        return 4;
    case SampleFormat::S16_LE:
        return 2;
    }
    return 0;
}

std::optional<AlsaAudioSource::SampleFormat> AlsaAudioSource::selectSupportedFormat(
    SampleFormat requested, const std::function<bool(SampleFormat)>& isSupported) {
    if (isSupported(requested)) {
        return requested;
    }
    static constexpr std::array<SampleFormat, 3> kPriority = {
        SampleFormat::FLOAT_LE, SampleFormat::S32_LE, SampleFormat::S16_LE};
    for (auto fmt : kPriority) {
        if (fmt != requested && isSupported(fmt)) {
            return fmt;
        }
    }
    return std::nullopt;
}

void AlsaAudioSource::decodeToFloat(const std::uint8_t* raw, std::size_t samples,
                                    SampleFormat format, std::vector<float>& out) {
    out.resize(samples);
    switch (format) {
    case SampleFormat::FLOAT_LE:
        std::memcpy(out.data(), raw, samples * sizeof(float));
        break;
    case SampleFormat::S32_LE:
        for (std::size_t i = 0; i < samples; ++i) {
            int32_t v;
            std::memcpy(&v, raw + i * 4, 4);
            out[i] = static_cast<float>(static_cast<double>(v) / 2147483648.0);
        }
        break;
    case SampleFormat::S16_LE:
        for (std::size_t i = 0; i < samples; ++i) {
            int16_t v;
            std::memcpy(&v, raw + i * 2, 2);
            out[i] = static_cast<float>(v) / 32768.0f;
        }
        break;
    }
}

}  // namespace audio
}  // namespace needledrop
