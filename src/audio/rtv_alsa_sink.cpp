// =============================================================================
// ALSA Audio Sink - implementation
// =============================================================================

#include "rtv/audio/rtv_alsa_sink.h"

#include <alsa/asoundlib.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <thread>

#include "rtv/core/rtv_logger.h"

namespace rtv {

// =============================================================================
// Implementation
// =============================================================================

struct AlsaAudioSink::Impl {
    snd_pcm_t* pcm_handle = nullptr;
    std::thread writer;

    mutable std::mutex mutex;
    std::condition_variable cv;

    // Single-slot handoff from start() to the writer thread
    bool has_pending = false;
    AudioUnit pending;
    CompletionFn pending_done;

    bool busy = false;
    bool exit = false;
    std::atomic<bool> halt_requested{false};

    std::vector<int16_t> pcm;
    std::string last_error;
};

AlsaAudioSink::AlsaAudioSink()
    : AlsaAudioSink(AlsaSinkConfig::defaults()) {
}

AlsaAudioSink::AlsaAudioSink(const AlsaSinkConfig& config)
    : impl_(std::make_unique<Impl>())
    , config_(config) {
}

AlsaAudioSink::~AlsaAudioSink() {
    close();
}

std::string AlsaAudioSink::last_error() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_error;
}

// Caller holds impl_->mutex; the writer thread is not running
rtv_result_t AlsaAudioSink::open_device() {
    if (impl_->pcm_handle) {
        return RTV_SUCCESS;
    }

    int err;
    snd_pcm_t* handle = nullptr;

    // Open PCM device for playback
    err = snd_pcm_open(&handle, config_.device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        impl_->last_error = std::string("Cannot open audio device: ") + snd_strerror(err);
        RTV_LOG_ERROR("AlsaSink", "%s", impl_->last_error.c_str());
        return RTV_ERROR_AUDIO_DEVICE;
    }

    auto fail = [&](const char* what, int code) {
        impl_->last_error = std::string(what) + ": " + snd_strerror(code);
        RTV_LOG_ERROR("AlsaSink", "%s", impl_->last_error.c_str());
        snd_pcm_close(handle);
        return RTV_ERROR_AUDIO_DEVICE;
    };

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    snd_pcm_hw_params_any(handle, hw_params);

    err = snd_pcm_hw_params_set_access(handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (err < 0) return fail("Cannot set access type", err);

    // Signed 16-bit little-endian, the realtime output format
    err = snd_pcm_hw_params_set_format(handle, hw_params, SND_PCM_FORMAT_S16_LE);
    if (err < 0) return fail("Cannot set sample format", err);

    unsigned int rate = config_.sample_rate;
    err = snd_pcm_hw_params_set_rate_near(handle, hw_params, &rate, nullptr);
    if (err < 0) return fail("Cannot set sample rate", err);
    if (rate != config_.sample_rate) {
        RTV_LOG_WARNING("AlsaSink", "Device rate %u Hz differs from requested %u Hz", rate,
                        config_.sample_rate);
    }
    config_.sample_rate = rate;

    err = snd_pcm_hw_params_set_channels(handle, hw_params, config_.channels);
    if (err < 0) return fail("Cannot set channels", err);

    snd_pcm_uframes_t buffer_size = config_.buffer_frames;
    err = snd_pcm_hw_params_set_buffer_size_near(handle, hw_params, &buffer_size);
    if (err < 0) return fail("Cannot set buffer size", err);
    config_.buffer_frames = buffer_size;

    snd_pcm_uframes_t period_size = config_.period_frames;
    err = snd_pcm_hw_params_set_period_size_near(handle, hw_params, &period_size, nullptr);
    if (err < 0) return fail("Cannot set period size", err);
    config_.period_frames = period_size;

    err = snd_pcm_hw_params(handle, hw_params);
    if (err < 0) return fail("Cannot set hardware parameters", err);

    err = snd_pcm_prepare(handle);
    if (err < 0) return fail("Cannot prepare device", err);

    impl_->pcm_handle = handle;
    impl_->exit = false;
    impl_->writer = std::thread(&AlsaAudioSink::writer_loop, this);

    RTV_LOG_INFO("AlsaSink", "Opened %s @ %u Hz", config_.device.c_str(), config_.sample_rate);
    return RTV_SUCCESS;
}

bool AlsaAudioSink::is_suspended() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->pcm_handle) {
        return true;
    }
    return !impl_->busy && snd_pcm_state(impl_->pcm_handle) == SND_PCM_STATE_SUSPENDED;
}

rtv_result_t AlsaAudioSink::resume() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->pcm_handle) {
        return open_device();
    }
    if (impl_->busy || snd_pcm_state(impl_->pcm_handle) != SND_PCM_STATE_SUSPENDED) {
        return RTV_SUCCESS;
    }

    int err;
    while ((err = snd_pcm_resume(impl_->pcm_handle)) == -EAGAIN) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (err < 0) {
        err = snd_pcm_prepare(impl_->pcm_handle);
    }
    if (err < 0) {
        impl_->last_error = std::string("Cannot resume device: ") + snd_strerror(err);
        RTV_LOG_ERROR("AlsaSink", "%s", impl_->last_error.c_str());
        return RTV_ERROR_AUDIO_DEVICE;
    }
    return RTV_SUCCESS;
}

rtv_result_t AlsaAudioSink::start(AudioUnit unit, CompletionFn on_complete) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        rtv_result_t rc = open_device();
        if (RTV_FAILED(rc)) {
            return rc;
        }
        impl_->pending = std::move(unit);
        impl_->pending_done = std::move(on_complete);
        impl_->has_pending = true;
    }
    impl_->cv.notify_all();
    return RTV_SUCCESS;
}

void AlsaAudioSink::halt() {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->has_pending = false;
    impl_->pending_done = nullptr;

    if (impl_->busy) {
        impl_->halt_requested = true;
        impl_->cv.wait(lock, [this] { return !impl_->busy; });
    }

    // Writer is idle here, safe to touch the handle
    if (impl_->pcm_handle) {
        snd_pcm_drop(impl_->pcm_handle);
        snd_pcm_prepare(impl_->pcm_handle);
    }
    impl_->halt_requested = false;
}

void AlsaAudioSink::close() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->exit = true;
        impl_->halt_requested = true;
        impl_->has_pending = false;
        impl_->pending_done = nullptr;
    }
    impl_->cv.notify_all();

    if (impl_->writer.joinable()) {
        impl_->writer.join();
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->pcm_handle) {
        snd_pcm_drop(impl_->pcm_handle);
        snd_pcm_close(impl_->pcm_handle);
        impl_->pcm_handle = nullptr;
        RTV_LOG_DEBUG("AlsaSink", "Closed %s", config_.device.c_str());
    }
    impl_->halt_requested = false;
}

// =============================================================================
// Writer thread
// =============================================================================

void AlsaAudioSink::writer_loop() {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    while (true) {
        impl_->cv.wait(lock, [this] { return impl_->exit || impl_->has_pending; });
        if (impl_->exit) {
            break;
        }

        AudioUnit unit = std::move(impl_->pending);
        CompletionFn done = std::move(impl_->pending_done);
        impl_->pending_done = nullptr;
        impl_->has_pending = false;
        impl_->busy = true;
        impl_->halt_requested = false;

        lock.unlock();
        bool halted = !write_unit(unit);
        lock.lock();

        impl_->busy = false;
        impl_->cv.notify_all();

        if (!halted && done) {
            lock.unlock();
            done();
            lock.lock();
        }
    }
}

// Returns false only when cut short by halt(); write errors still complete
bool AlsaAudioSink::write_unit(const AudioUnit& unit) {
    auto& pcm = impl_->pcm;
    pcm.resize(unit.samples.size());
    for (size_t i = 0; i < unit.samples.size(); ++i) {
        pcm[i] = float_to_pcm16(unit.samples[i]);
    }

    size_t frames_remaining = pcm.size() / config_.channels;
    const int16_t* ptr = pcm.data();

    while (frames_remaining > 0) {
        if (impl_->halt_requested.load()) {
            return false;
        }

        snd_pcm_uframes_t chunk =
            std::min<snd_pcm_uframes_t>(frames_remaining, config_.period_frames);
        snd_pcm_sframes_t frames = snd_pcm_writei(impl_->pcm_handle, ptr, chunk);

        if (frames < 0) {
            if (frames == -EPIPE) {
                // Underrun
                snd_pcm_prepare(impl_->pcm_handle);
                continue;
            } else if (frames == -EAGAIN) {
                snd_pcm_wait(impl_->pcm_handle, 100);
                continue;
            } else if (frames == -ESTRPIPE) {
                int err;
                while ((err = snd_pcm_resume(impl_->pcm_handle)) == -EAGAIN) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
                if (err < 0) snd_pcm_prepare(impl_->pcm_handle);
                continue;
            } else {
                RTV_LOG_ERROR("AlsaSink", "Write error on unit %llu: %s",
                              static_cast<unsigned long long>(unit.sequence),
                              snd_strerror(static_cast<int>(frames)));
                snd_pcm_prepare(impl_->pcm_handle);
                return true;
            }
        }

        frames_remaining -= frames;
        ptr += frames * config_.channels;
    }

    return true;
}

std::vector<std::string> AlsaAudioSink::list_devices() {
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

        // Only include output devices
        if (name && (!ioid || strcmp(ioid, "Output") == 0) && strcmp(name, "default") != 0) {
            devices.push_back(name);
        }

        if (name) free(name);
        if (ioid) free(ioid);
    }

    snd_device_name_free_hint(hints);
    return devices;
}

}  // namespace rtv
