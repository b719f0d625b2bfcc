// =============================================================================
// Audio Capture - ALSA implementation
// =============================================================================

#include "rtv/audio/rtv_audio_capture.h"

#include <alsa/asoundlib.h>

#include <atomic>
#include <cstring>
#include <thread>

#include "rtv/core/rtv_logger.h"

namespace rtv {

struct AudioCapture::Impl {
    snd_pcm_t* pcm_handle = nullptr;
    std::thread capture_thread;
    std::atomic<bool> running{false};
    std::vector<float> buffer;
};

AudioCapture::AudioCapture()
    : AudioCapture(AudioCaptureConfig::defaults()) {
}

AudioCapture::AudioCapture(const AudioCaptureConfig& config)
    : impl_(std::make_unique<Impl>())
    , config_(config) {
}

AudioCapture::~AudioCapture() {
    stop();
}

rtv_result_t AudioCapture::open_device() {
    int err;

    err = snd_pcm_open(&impl_->pcm_handle, config_.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        impl_->pcm_handle = nullptr;
        last_error_ = std::string("Cannot open capture device: ") + snd_strerror(err);
        RTV_LOG_ERROR("AudioCapture", "%s", last_error_.c_str());
        return err == -EACCES || err == -EPERM ? RTV_ERROR_PERMISSION_DENIED
                                               : RTV_ERROR_AUDIO_DEVICE;
    }

    auto fail = [&](const char* what, int code) {
        last_error_ = std::string(what) + ": " + snd_strerror(code);
        RTV_LOG_ERROR("AudioCapture", "%s", last_error_.c_str());
        close_device();
        return RTV_ERROR_AUDIO_DEVICE;
    };

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    snd_pcm_hw_params_any(impl_->pcm_handle, hw_params);

    err = snd_pcm_hw_params_set_access(impl_->pcm_handle, hw_params,
                                       SND_PCM_ACCESS_RW_INTERLEAVED);
    if (err < 0) return fail("Cannot set access type", err);

    // Float samples straight from the device; the plug layer converts
    err = snd_pcm_hw_params_set_format(impl_->pcm_handle, hw_params, SND_PCM_FORMAT_FLOAT_LE);
    if (err < 0) return fail("Cannot set sample format", err);

    unsigned int rate = config_.sample_rate;
    err = snd_pcm_hw_params_set_rate_near(impl_->pcm_handle, hw_params, &rate, nullptr);
    if (err < 0) return fail("Cannot set sample rate", err);
    if (rate != config_.sample_rate) {
        RTV_LOG_WARNING("AudioCapture", "Device rate %u Hz differs from requested %u Hz", rate,
                        config_.sample_rate);
    }

    err = snd_pcm_hw_params_set_channels(impl_->pcm_handle, hw_params, config_.channels);
    if (err < 0) return fail("Cannot set channels", err);

    snd_pcm_uframes_t buffer_size = config_.buffer_frames;
    err = snd_pcm_hw_params_set_buffer_size_near(impl_->pcm_handle, hw_params, &buffer_size);
    if (err < 0) return fail("Cannot set buffer size", err);
    config_.buffer_frames = buffer_size;

    snd_pcm_uframes_t period_size = config_.period_frames;
    err = snd_pcm_hw_params_set_period_size_near(impl_->pcm_handle, hw_params, &period_size,
                                                 nullptr);
    if (err < 0) return fail("Cannot set period size", err);
    config_.period_frames = period_size;

    err = snd_pcm_hw_params(impl_->pcm_handle, hw_params);
    if (err < 0) return fail("Cannot set hardware parameters", err);

    err = snd_pcm_prepare(impl_->pcm_handle);
    if (err < 0) return fail("Cannot prepare device", err);

    impl_->buffer.resize(config_.period_frames * config_.channels);
    return RTV_SUCCESS;
}

void AudioCapture::close_device() {
    if (impl_->pcm_handle) {
        snd_pcm_drop(impl_->pcm_handle);
        snd_pcm_close(impl_->pcm_handle);
        impl_->pcm_handle = nullptr;
    }
}

void AudioCapture::set_callback(AudioCaptureCallback callback) {
    callback_ = std::move(callback);
}

rtv_result_t AudioCapture::start() {
    if (running_) {
        return RTV_SUCCESS;
    }

    rtv_result_t rc = open_device();
    if (RTV_FAILED(rc)) {
        return rc;
    }

    impl_->running = true;
    running_ = true;

    impl_->capture_thread = std::thread([this]() {
        while (impl_->running) {
            snd_pcm_sframes_t frames =
                snd_pcm_readi(impl_->pcm_handle, impl_->buffer.data(), config_.period_frames);

            if (frames < 0) {
                if (frames == -EPIPE) {
                    // Overrun
                    snd_pcm_prepare(impl_->pcm_handle);
                    continue;
                } else if (frames == -EAGAIN) {
                    continue;
                } else {
                    RTV_LOG_ERROR("AudioCapture", "Read error: %s",
                                  snd_strerror(static_cast<int>(frames)));
                    impl_->running = false;
                    break;
                }
            }

            if (callback_ && frames > 0) {
                callback_(impl_->buffer.data(), static_cast<size_t>(frames) * config_.channels);
            }
        }
    });

    RTV_LOG_INFO("AudioCapture", "Capturing from %s @ %u Hz", config_.device.c_str(),
                 config_.sample_rate);
    return RTV_SUCCESS;
}

void AudioCapture::stop() {
    if (!running_) {
        return;
    }

    impl_->running = false;
    running_ = false;

    // Unblock a pending read, then release the device before returning
    if (impl_->pcm_handle) {
        snd_pcm_drop(impl_->pcm_handle);
    }
    if (impl_->capture_thread.joinable()) {
        impl_->capture_thread.join();
    }
    close_device();

    RTV_LOG_DEBUG("AudioCapture", "Microphone released");
}

bool AudioCapture::is_running() const {
    return running_ && impl_->running;
}

std::vector<std::string> AudioCapture::list_devices() {
    std::vector<std::string> devices;
    devices.push_back("default");

    void** hints = nullptr;
    int err = snd_device_name_hint(-1, "pcm", &hints);
    if (err < 0) {
        return devices;
    }

    for (void** hint = hints; *hint != nullptr; ++hint) {
        char* name = snd_device_name_get_hint(*hint, "NAME");
        char* ioid = snd_device_name_get_hint(*hint, "IOID");

        // Only include capture devices
        if (name && (!ioid || strcmp(ioid, "Input") == 0) && strcmp(name, "default") != 0) {
            devices.push_back(name);
        }

        if (name) free(name);
        if (ioid) free(ioid);
    }

    snd_device_name_free_hint(hints);
    return devices;
}

}  // namespace rtv
