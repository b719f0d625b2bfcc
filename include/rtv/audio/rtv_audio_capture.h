#ifndef RTV_AUDIO_CAPTURE_H
#define RTV_AUDIO_CAPTURE_H

// =============================================================================
// Audio Capture - ALSA microphone input
// =============================================================================
// Delivers float samples in [-1, 1] at 24 kHz mono, one period per callback.
// The device is opened on start() and closed again on stop(), so the
// microphone is never held while capture is off.
// =============================================================================

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "rtv/core/rtv_error.h"
#include "rtv/core/rtv_types.h"

namespace rtv {

// Audio callback: receives float samples (24kHz, mono), runs on the capture thread
using AudioCaptureCallback = std::function<void(const float* samples, size_t num_samples)>;

struct AudioCaptureConfig {
    std::string device;          // ALSA device (default: "default")
    uint32_t sample_rate;        // Hz (default: 24000)
    uint32_t channels;           // default: 1
    uint32_t buffer_frames;      // default: 16384
    uint32_t period_frames;      // Frames per callback (default: 4096)

    static AudioCaptureConfig defaults() {
        return {
            .device = "default",
            .sample_rate = kRealtimeSampleRate,
            .channels = 1,
            .buffer_frames = static_cast<uint32_t>(kCaptureChunkSamples * 4),
            .period_frames = static_cast<uint32_t>(kCaptureChunkSamples)
        };
    }
};

/**
 * @brief Microphone input seam used by the controller
 */
class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    virtual void set_callback(AudioCaptureCallback callback) = 0;

    // Acquire the microphone and begin delivering samples
    virtual rtv_result_t start() = 0;

    // Stop delivering and release the microphone before returning
    virtual void stop() = 0;

    virtual bool is_running() const = 0;
};

class AudioCapture : public CaptureSource {
public:
    AudioCapture();
    explicit AudioCapture(const AudioCaptureConfig& config);
    ~AudioCapture() override;

    // Non-copyable
    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    void set_callback(AudioCaptureCallback callback) override;

    rtv_result_t start() override;
    void stop() override;

    bool is_running() const override;

    const AudioCaptureConfig& config() const { return config_; }
    const std::string& last_error() const { return last_error_; }

    // List available capture devices
    static std::vector<std::string> list_devices();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    AudioCaptureConfig config_;
    AudioCaptureCallback callback_;
    std::string last_error_;
    bool running_ = false;

    rtv_result_t open_device();
    void close_device();
};

}  // namespace rtv

#endif  // RTV_AUDIO_CAPTURE_H
