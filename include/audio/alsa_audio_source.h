#pragma once

#include "audio/audio_source.h"

#include <alsa/asoundlib.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace needledrop {
namespace audio {

/**
 * @brief AudioSource backed by an ALSA capture PCM.
 *
 * Devices are addressed by their index in listCaptureDevices(). Captured
 * frames are converted to normalized float and downmixed to mono.
 */
class AlsaAudioSource : public AudioSource {
   public:
    enum class SampleFormat {
        FLOAT_LE,
        S32_LE,
        S16_LE,
    };

    struct Config {
        unsigned int sampleRate{48000};
        unsigned int channels{1};
        SampleFormat format{SampleFormat::FLOAT_LE};
        snd_pcm_uframes_t periodFrames{4096};
    };

    explicit AlsaAudioSource(Config config);
    ~AlsaAudioSource() override;

    AlsaAudioSource(const AlsaAudioSource&) = delete;
    AlsaAudioSource& operator=(const AlsaAudioSource&) = delete;

    void open(int deviceId) override;
    PcmBuffer read(size_t frames) override;
    void close() override;
    bool isOpen() const override;
    uint32_t sampleRate() const override {
        return config_.sampleRate;
    }

    // Open by ALSA PCM name, bypassing the device index
    void openByName(const std::string& pcmName);

    const std::string& deviceName() const {
        return deviceName_;
    }

    static std::vector<CaptureDeviceInfo> listCaptureDevices();

    /**
     * @brief Pick a default capture device.
     *
     * Preference: a "sysdefault" PCM, then any name containing "usb"
     * (case-insensitive), then the first entry.
     */
    static std::optional<int> chooseDefaultDevice(const std::vector<CaptureDeviceInfo>& devices);

    // Exposed for unit tests
    static snd_pcm_format_t toAlsaFormat(SampleFormat format);
    static std::size_t bytesPerSample(SampleFormat format);
    static std::optional<SampleFormat> selectSupportedFormat(
        SampleFormat requested, const std::function<bool(SampleFormat)>& isSupported);
    static void decodeToFloat(const std::uint8_t* raw, std::size_t samples, SampleFormat format,
                              std::vector<float>& out);

   private:
    Config config_;
    std::string deviceName_;
    snd_pcm_t* handle_{nullptr};
    std::vector<std::uint8_t> scratch_;
};

}  // namespace audio
}  // namespace needledrop
