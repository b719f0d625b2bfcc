/**
 * @file rtv_playback_queue.h
 * @brief rtv - Gapless FIFO playback of decoded audio units
 *
 * Producer: the protocol dispatch thread enqueues one AudioUnit per audio
 * delta. Consumer: the sink's completion notification advances the queue.
 * At most one unit sounds at a time and units play in enqueue order.
 */

#ifndef RTV_PLAYBACK_QUEUE_H
#define RTV_PLAYBACK_QUEUE_H

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

#include "rtv/audio/rtv_audio_codec.h"
#include "rtv/core/rtv_error.h"

namespace rtv {

// =============================================================================
// AudioSink - hardware output seam
// =============================================================================

class AudioSink {
public:
    using CompletionFn = std::function<void()>;

    virtual ~AudioSink() = default;

    // True while the output is unavailable until resume() (device not yet
    // opened, or suspended by the system)
    virtual bool is_suspended() const = 0;

    virtual rtv_result_t resume() = 0;

    /**
     * @brief Begin sounding one unit
     *
     * Returns without waiting for playback. on_complete fires once when the
     * unit has been fully handed to the hardware. It is never invoked from
     * inside start() itself and is not invoked for a unit cut short by halt().
     */
    virtual rtv_result_t start(AudioUnit unit, CompletionFn on_complete) = 0;

    // Silence the active unit and drop buffered output; returns once silent
    virtual void halt() = 0;

    // Release the output device; safe to call repeatedly
    virtual void close() = 0;
};

// =============================================================================
// PlaybackQueue
// =============================================================================

struct PlaybackStats {
    uint64_t enqueued = 0;
    uint64_t completed = 0;
    uint64_t discarded = 0;
};

class PlaybackQueue {
public:
    explicit PlaybackQueue(std::unique_ptr<AudioSink> sink);
    ~PlaybackQueue();

    PlaybackQueue(const PlaybackQueue&) = delete;
    PlaybackQueue& operator=(const PlaybackQueue&) = delete;

    /**
     * @brief Append a unit to the tail and start it if nothing is playing
     *
     * The first enqueue of a session resumes a suspended sink before queuing.
     */
    rtv_result_t enqueue(AudioUnit unit);

    /**
     * @brief Halt the active unit and discard every queued unit
     *
     * Idempotent. The consumer is idle when this returns.
     */
    void stop();

    // Re-arm the resume-before-first-enqueue check for a new session
    void begin_session();

    // stop(), then close and drop the sink; the queue is unusable afterwards
    void release();

    bool is_playing() const;
    size_t pending() const;
    PlaybackStats stats() const;

    AudioSink* sink() const { return sink_.get(); }

private:
    void start_next_locked();
    void on_unit_complete(uint64_t token);

    std::unique_ptr<AudioSink> sink_;

    // Serializes producer-side operations (enqueue/stop/release). The
    // completion path only takes mutex_.
    std::mutex control_mutex_;

    mutable std::mutex mutex_;
    std::deque<AudioUnit> queue_;
    bool active_ = false;
    bool session_primed_ = false;
    uint64_t token_ = 0;
    PlaybackStats stats_;
};

}  // namespace rtv

#endif  // RTV_PLAYBACK_QUEUE_H
