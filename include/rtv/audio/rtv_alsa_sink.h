#ifndef RTV_ALSA_SINK_H
#define RTV_ALSA_SINK_H

// =============================================================================
// ALSA Audio Sink - speaker output for the playback queue
// =============================================================================
// Opens the device lazily on resume()/start(), writes each unit from a
// writer thread and reports completion once the last frame is handed to
// ALSA. The device is not drained between units so consecutive units play
// back to back without a gap.
// =============================================================================

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "rtv/audio/rtv_playback_queue.h"

namespace rtv {

struct AlsaSinkConfig {
    std::string device;       // ALSA device (default: "default")
    uint32_t sample_rate;     // Hz (default: 24000, realtime output format)
    uint32_t channels;        // default: 1
    uint32_t buffer_frames;   // default: 4096
    uint32_t period_frames;   // default: 1024

    static AlsaSinkConfig defaults() {
        return {
            .device = "default",
            .sample_rate = kRealtimeSampleRate,
            .channels = 1,
            .buffer_frames = 4096,
            .period_frames = 1024
        };
    }
};

class AlsaAudioSink : public AudioSink {
public:
    AlsaAudioSink();
    explicit AlsaAudioSink(const AlsaSinkConfig& config);
    ~AlsaAudioSink() override;

    // Non-copyable
    AlsaAudioSink(const AlsaAudioSink&) = delete;
    AlsaAudioSink& operator=(const AlsaAudioSink&) = delete;

    bool is_suspended() const override;
    rtv_result_t resume() override;
    rtv_result_t start(AudioUnit unit, CompletionFn on_complete) override;
    void halt() override;
    void close() override;

    const AlsaSinkConfig& config() const { return config_; }
    std::string last_error() const;

    // List available playback devices
    static std::vector<std::string> list_devices();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    AlsaSinkConfig config_;

    rtv_result_t open_device();
    void writer_loop();
    bool write_unit(const AudioUnit& unit);
};

}  // namespace rtv

#endif  // RTV_ALSA_SINK_H
