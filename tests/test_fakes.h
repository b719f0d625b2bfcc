/**
 * @file test_fakes.h
 * @brief In-memory stand-ins for the hardware and network seams
 *
 * Every fake keeps its observable state in a shared tap so a test can
 * inspect it after ownership of the fake itself has moved into the code
 * under test.
 */

#ifndef RTV_TEST_FAKES_H
#define RTV_TEST_FAKES_H

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "rtv/audio/rtv_audio_capture.h"
#include "rtv/audio/rtv_microphone.h"
#include "rtv/audio/rtv_playback_queue.h"
#include "rtv/net/rtv_realtime_channel.h"
#include "rtv/net/rtv_session_negotiator.h"
#include "rtv/voice/rtv_voice_chat_controller.h"

namespace rtv_test {

// =============================================================================
// Audio sink
// =============================================================================

struct SinkTap {
    std::mutex mutex;
    bool suspended = true;
    int resume_calls = 0;
    int halt_calls = 0;
    int close_calls = 0;
    int active = 0;
    int max_active = 0;
    std::vector<uint64_t> started;  // sequence numbers in start order
    std::vector<rtv::AudioSink::CompletionFn> completions;

    size_t started_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return started.size();
    }

    // Finish the unit currently sounding; returns false if none
    bool complete_current() {
        rtv::AudioSink::CompletionFn fn;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (completions.empty()) return false;
            fn = std::move(completions.front());
            completions.erase(completions.begin());
            active--;
        }
        fn();
        return true;
    }
};

class FakeSink : public rtv::AudioSink {
public:
    explicit FakeSink(std::shared_ptr<SinkTap> tap) : tap_(std::move(tap)) {}

    bool is_suspended() const override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        return tap_->suspended;
    }

    rtv_result_t resume() override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        tap_->resume_calls++;
        tap_->suspended = false;
        return RTV_SUCCESS;
    }

    rtv_result_t start(rtv::AudioUnit unit, CompletionFn on_complete) override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        tap_->started.push_back(unit.sequence);
        tap_->completions.push_back(std::move(on_complete));
        tap_->active++;
        tap_->max_active = std::max(tap_->max_active, tap_->active);
        return RTV_SUCCESS;
    }

    void halt() override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        tap_->halt_calls++;
        tap_->completions.clear();
        tap_->active = 0;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        tap_->close_calls++;
        tap_->suspended = true;
    }

private:
    std::shared_ptr<SinkTap> tap_;
};

inline rtv::AudioUnit make_unit(uint64_t sequence, size_t samples = 240) {
    rtv::AudioUnit unit;
    unit.sequence = sequence;
    unit.samples.assign(samples, 0.1f);
    return unit;
}

// =============================================================================
// Realtime channel
// =============================================================================

struct ChannelTap {
    std::mutex mutex;
    rtv_result_t open_result = RTV_SUCCESS;
    std::function<void()> during_open;  // runs inside open() before it returns
    std::function<void(const std::string&)> after_send;  // runs after each accepted send
    bool opened = false;
    bool is_open = false;
    int close_calls = 0;
    rtv::ChannelRequest request;
    std::vector<std::string> sent;
    rtv::RealtimeChannel::MessageHandler on_message;
    rtv::RealtimeChannel::ClosedHandler on_closed;

    std::vector<std::string> sent_messages() {
        std::lock_guard<std::mutex> lock(mutex);
        return sent;
    }

    std::string header(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& h : request.headers) {
            if (h.first == name) return h.second;
        }
        return "";
    }

    // Simulate an inbound message on the receive thread
    void deliver(const std::string& message) {
        rtv::RealtimeChannel::MessageHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            handler = on_message;
        }
        if (handler) handler(message);
    }

    // Simulate the service dropping the connection
    void remote_close(rtv_result_t reason, const std::string& detail) {
        rtv::RealtimeChannel::ClosedHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            is_open = false;
            handler = on_closed;
        }
        if (handler) handler(reason, detail);
    }
};

class FakeChannel : public rtv::RealtimeChannel {
public:
    explicit FakeChannel(std::shared_ptr<ChannelTap> tap) : tap_(std::move(tap)) {}

    // The handlers point into the owning client; drop them with the channel
    ~FakeChannel() override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        tap_->on_message = nullptr;
        tap_->on_closed = nullptr;
    }

    void set_message_handler(MessageHandler handler) override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        tap_->on_message = std::move(handler);
    }

    void set_closed_handler(ClosedHandler handler) override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        tap_->on_closed = std::move(handler);
    }

    rtv_result_t open(const rtv::ChannelRequest& request) override {
        std::function<void()> hook;
        rtv_result_t result;
        {
            std::lock_guard<std::mutex> lock(tap_->mutex);
            tap_->request = request;
            tap_->opened = true;
            result = tap_->open_result;
            tap_->is_open = RTV_SUCCEEDED(result);
            hook = tap_->during_open;
        }
        if (hook) hook();
        return result;
    }

    rtv_result_t send_text(const std::string& payload) override {
        std::function<void(const std::string&)> hook;
        {
            std::lock_guard<std::mutex> lock(tap_->mutex);
            if (!tap_->is_open) return rtv_result_t(RTV_ERROR_NOT_CONNECTED);
            tap_->sent.push_back(payload);
            hook = tap_->after_send;
        }
        if (hook) hook(payload);
        return RTV_SUCCESS;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        tap_->close_calls++;
        tap_->is_open = false;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        return tap_->is_open;
    }

private:
    std::shared_ptr<ChannelTap> tap_;
};

// Hands out FakeChannels and keeps every tap, in creation order
struct ChannelFarm {
    std::mutex mutex;
    rtv_result_t next_open_result = RTV_SUCCESS;
    std::function<void(ChannelTap&)> prepare;  // runs on each new tap
    std::vector<std::shared_ptr<ChannelTap>> taps;

    rtv::ChannelFactory factory() {
        return [this]() -> std::unique_ptr<rtv::RealtimeChannel> {
            auto tap = std::make_shared<ChannelTap>();
            std::lock_guard<std::mutex> lock(mutex);
            tap->open_result = next_open_result;
            if (prepare) prepare(*tap);
            taps.push_back(tap);
            return std::make_unique<FakeChannel>(tap);
        };
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return taps.size();
    }

    std::shared_ptr<ChannelTap> last() {
        std::lock_guard<std::mutex> lock(mutex);
        return taps.empty() ? nullptr : taps.back();
    }
};

// =============================================================================
// Negotiator, permission, capture, message store
// =============================================================================

class FakeNegotiator : public rtv::SessionNegotiator {
public:
    rtv_result_t result = RTV_SUCCESS;
    std::string error_text;
    int calls = 0;
    rtv::NegotiationRequest last_request;
    int counter = 0;
    std::function<void()> during_negotiate;

    rtv_result_t negotiate(const rtv::NegotiationRequest& request,
                           rtv::ScopedCredential& out_credential) override {
        calls++;
        last_request = request;
        if (during_negotiate) during_negotiate();
        if (request.api_key.empty()) {
            return rtv_result_t(RTV_ERROR_AUTH_MISSING_CREDENTIAL);
        }
        if (RTV_FAILED(result)) {
            return result;
        }
        out_credential.value = "ek_scoped_" + std::to_string(++counter);
        out_credential.expires_at = 1700000000;
        return RTV_SUCCESS;
    }

    std::string last_error() const override { return error_text; }
};

class FakePermission : public rtv::MicrophonePermission {
public:
    rtv::PermissionState answer = rtv::PermissionState::Granted;
    int calls = 0;

    rtv::PermissionState request() override {
        calls++;
        return answer;
    }
};

struct CaptureTap {
    std::mutex mutex;
    rtv_result_t start_result = RTV_SUCCESS;
    std::function<void()> during_start;  // runs inside start() once the device is running
    bool running = false;
    int start_calls = 0;
    int stop_calls = 0;
    rtv::AudioCaptureCallback callback;

    // Simulate one period arriving from the microphone
    void push(const std::vector<float>& samples) {
        rtv::AudioCaptureCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!running) return;
            cb = callback;
        }
        if (cb) cb(samples.data(), samples.size());
    }

    bool is_running() {
        std::lock_guard<std::mutex> lock(mutex);
        return running;
    }
};

class FakeCapture : public rtv::CaptureSource {
public:
    explicit FakeCapture(std::shared_ptr<CaptureTap> tap) : tap_(std::move(tap)) {}

    void set_callback(rtv::AudioCaptureCallback callback) override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        tap_->callback = std::move(callback);
    }

    rtv_result_t start() override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(tap_->mutex);
            tap_->start_calls++;
            if (RTV_FAILED(tap_->start_result)) return tap_->start_result;
            tap_->running = true;
            hook = tap_->during_start;
        }
        if (hook) hook();
        return RTV_SUCCESS;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        tap_->stop_calls++;
        tap_->running = false;
    }

    bool is_running() const override {
        std::lock_guard<std::mutex> lock(tap_->mutex);
        return tap_->running;
    }

private:
    std::shared_ptr<CaptureTap> tap_;
};

class RecordingStore : public rtv::MessageStore {
public:
    void append_message(const std::string& text, bool is_user) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.emplace_back(text, is_user);
    }

    std::vector<std::pair<std::string, bool>> messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

private:
    std::mutex mutex_;
    std::vector<std::pair<std::string, bool>> messages_;
};

class RecordingListener : public rtv::VoiceChatListener {
public:
    std::mutex mutex;
    std::vector<rtv::VoiceChatState> states;
    std::vector<std::string> permission_warnings;
    std::vector<rtv::Error> connection_errors;
    std::vector<rtv::Error> advisories;

    void on_state_changed(const rtv::VoiceChatState& state) override {
        std::lock_guard<std::mutex> lock(mutex);
        states.push_back(state);
    }
    void on_permission_warning(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        permission_warnings.push_back(message);
    }
    void on_connection_error(const rtv::Error& error) override {
        std::lock_guard<std::mutex> lock(mutex);
        connection_errors.push_back(error);
    }
    void on_advisory(const rtv::Error& error) override {
        std::lock_guard<std::mutex> lock(mutex);
        advisories.push_back(error);
    }
};

}  // namespace rtv_test

#endif  // RTV_TEST_FAKES_H
