/**
 * @file rtv_playback_queue.cpp
 * @brief rtv - Gapless FIFO playback implementation
 */

#include "rtv/audio/rtv_playback_queue.h"

#include "rtv/core/rtv_logger.h"

namespace rtv {

PlaybackQueue::PlaybackQueue(std::unique_ptr<AudioSink> sink) : sink_(std::move(sink)) {}

PlaybackQueue::~PlaybackQueue() {
    release();
}

rtv_result_t PlaybackQueue::enqueue(AudioUnit unit) {
    if (!sink_) {
        return RTV_ERROR_INVALID_STATE;
    }

    std::lock_guard<std::mutex> control(control_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);

    if (!session_primed_) {
        if (sink_->is_suspended()) {
            RTV_LOG_DEBUG("Playback", "Resuming suspended audio sink");
            rtv_result_t rc = sink_->resume();
            if (RTV_FAILED(rc)) {
                RTV_LOG_ERROR("Playback", "Failed to resume audio sink: %s", rtv_error_message(rc));
                stats_.discarded++;
                return rc;
            }
        }
        session_primed_ = true;
    }

    queue_.push_back(std::move(unit));
    stats_.enqueued++;

    if (!active_) {
        start_next_locked();
    }
    return RTV_SUCCESS;
}

void PlaybackQueue::start_next_locked() {
    while (!queue_.empty()) {
        AudioUnit unit = std::move(queue_.front());
        queue_.pop_front();

        uint64_t token = ++token_;
        uint64_t sequence = unit.sequence;
        active_ = true;

        rtv_result_t rc =
            sink_->start(std::move(unit), [this, token]() { on_unit_complete(token); });
        if (RTV_SUCCEEDED(rc)) {
            RTV_LOG_TRACE("Playback", "Playing unit %llu (%zu queued)",
                          static_cast<unsigned long long>(sequence), queue_.size());
            return;
        }

        RTV_LOG_ERROR("Playback", "Sink rejected unit %llu: %s",
                      static_cast<unsigned long long>(sequence), rtv_error_message(rc));
        active_ = false;
        stats_.discarded++;
    }
    active_ = false;
}

void PlaybackQueue::on_unit_complete(uint64_t token) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Completion of a unit that stop() already cut off
    if (!active_ || token != token_) {
        return;
    }

    stats_.completed++;
    active_ = false;
    start_next_locked();
}

void PlaybackQueue::stop() {
    if (!sink_) return;

    std::lock_guard<std::mutex> control(control_mutex_);
    bool was_active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++token_;
        was_active = active_;
        active_ = false;
        stats_.discarded += queue_.size() + (was_active ? 1 : 0);
        queue_.clear();
    }

    // Outside mutex_: the sink may be delivering a completion right now.
    // Halt even when idle, the device can still hold written frames.
    sink_->halt();
}

void PlaybackQueue::begin_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_primed_ = false;
}

void PlaybackQueue::release() {
    stop();

    std::lock_guard<std::mutex> control(control_mutex_);
    if (sink_) {
        sink_->close();
        sink_.reset();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    session_primed_ = false;
}

bool PlaybackQueue::is_playing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

size_t PlaybackQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

PlaybackStats PlaybackQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace rtv
