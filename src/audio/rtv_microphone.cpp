// =============================================================================
// Microphone permission - ALSA probe
// =============================================================================

#include "rtv/audio/rtv_microphone.h"

#include <alsa/asoundlib.h>

#include "rtv/core/rtv_logger.h"

namespace rtv {

AlsaMicrophonePermission::AlsaMicrophonePermission(std::string device)
    : device_(std::move(device)) {}

PermissionState AlsaMicrophonePermission::request() {
    snd_pcm_t* handle = nullptr;

    // Non-blocking so a device busy in another process reports instead of hanging
    int err = snd_pcm_open(&handle, device_.c_str(), SND_PCM_STREAM_CAPTURE, SND_PCM_NONBLOCK);
    if (err < 0) {
        last_error_ = std::string("Microphone unavailable: ") + snd_strerror(err);
        RTV_LOG_WARNING("Permission", "%s (%s)", last_error_.c_str(), device_.c_str());
        return PermissionState::Denied;
    }

    snd_pcm_close(handle);
    last_error_.clear();
    RTV_LOG_DEBUG("Permission", "Microphone access granted on %s", device_.c_str());
    return PermissionState::Granted;
}

}  // namespace rtv
