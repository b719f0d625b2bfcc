#ifndef RTV_MICROPHONE_H
#define RTV_MICROPHONE_H

// =============================================================================
// Microphone permission - capability check before voice-to-voice sessions
// =============================================================================

#include <string>

#include "rtv/core/rtv_types.h"

namespace rtv {

class MicrophonePermission {
public:
    virtual ~MicrophonePermission() = default;

    // Request microphone access; returns Granted or Denied, never Unknown
    virtual PermissionState request() = 0;
};

/**
 * @brief Probes the ALSA capture device
 *
 * Access counts as granted when the device can be opened. The handle is
 * closed again immediately so the probe never holds the microphone.
 */
class AlsaMicrophonePermission : public MicrophonePermission {
public:
    explicit AlsaMicrophonePermission(std::string device = "default");

    PermissionState request() override;

    const std::string& last_error() const { return last_error_; }

private:
    std::string device_;
    std::string last_error_;
};

}  // namespace rtv

#endif  // RTV_MICROPHONE_H
