/**
 * @file rtv_websocket_channel.cpp
 * @brief rtv - RFC 6455 client channel implementation
 */

#include "rtv/net/rtv_websocket_channel.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>

// Socket/network
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "rtv/core/rtv_logger.h"
#include "rtv_websocket_frame.h"

namespace rtv {

namespace {

constexpr int kSendTimeoutMs = 5000;
constexpr int kPollIntervalMs = 200;
constexpr size_t kMaxHandshakeBytes = 16 * 1024;

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

}  // namespace

// =============================================================================
// Transport
// =============================================================================

struct WebSocketChannel::Impl {
    // Guards the fd lifetime against close() while open() is running
    std::mutex fd_mutex;
    bool opening = false;
    int fd = -1;

    SSL_CTX* ssl_ctx = nullptr;
    SSL* ssl = nullptr;

    // Serializes every read and write on fd/ssl
    std::mutex io_mutex;
    short want_events = POLLIN;

    ws::FrameParser parser;
    std::vector<uint8_t> leftover;

    // >0 bytes read, 0 would block, -1 closed or failed
    long read_some(uint8_t* buf, size_t len) {
        if (ssl) {
            int n = SSL_read(ssl, buf, static_cast<int>(len));
            if (n > 0) return n;
            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_WANT_READ) { want_events = POLLIN; return 0; }
            if (err == SSL_ERROR_WANT_WRITE) { want_events = POLLOUT; return 0; }
            return -1;
        }
        ssize_t n = ::recv(fd, buf, len, 0);
        if (n > 0) return static_cast<long>(n);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            want_events = POLLIN;
            return 0;
        }
        return -1;
    }

    long write_some(const uint8_t* buf, size_t len) {
        if (ssl) {
            int n = SSL_write(ssl, buf, static_cast<int>(len));
            if (n > 0) return n;
            int err = SSL_get_error(ssl, n);
            if (err == SSL_ERROR_WANT_READ) { want_events = POLLIN; return 0; }
            if (err == SSL_ERROR_WANT_WRITE) { want_events = POLLOUT; return 0; }
            return -1;
        }
        ssize_t n = ::send(fd, buf, len, MSG_NOSIGNAL);
        if (n > 0) return static_cast<long>(n);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            want_events = POLLOUT;
            return 0;
        }
        return -1;
    }

    bool has_buffered() const { return ssl && SSL_pending(ssl) > 0; }

    bool wait(short events, int timeout_ms) const {
        struct pollfd pfd = {fd, events, 0};
        int ret = poll(&pfd, 1, timeout_ms);
        return ret > 0 && (pfd.revents & (events | POLLHUP | POLLERR)) != 0;
    }

    bool write_all(const uint8_t* data, size_t len, int timeout_ms) {
        auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
        size_t total = 0;
        while (total < len) {
            long n = write_some(data + total, len - total);
            if (n < 0) return false;
            if (n == 0) {
                int left = remaining_ms(deadline);
                if (left == 0 || !wait(want_events, left)) return false;
                continue;
            }
            total += static_cast<size_t>(n);
        }
        return true;
    }

    void release_locked() {
        if (ssl) {
            SSL_free(ssl);
            ssl = nullptr;
        }
        if (ssl_ctx) {
            SSL_CTX_free(ssl_ctx);
            ssl_ctx = nullptr;
        }
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
        parser.reset();
        leftover.clear();
    }
};

// =============================================================================
// WebSocketChannel
// =============================================================================

WebSocketChannel::WebSocketChannel() : impl_(std::make_unique<Impl>()) {}

WebSocketChannel::~WebSocketChannel() {
    close();
    if (recv_thread_.joinable() && recv_thread_.get_id() != std::this_thread::get_id()) {
        recv_thread_.join();
    }
    std::lock_guard<std::mutex> lock(impl_->fd_mutex);
    impl_->release_locked();
}

void WebSocketChannel::set_message_handler(MessageHandler handler) {
    on_message_ = std::move(handler);
}

void WebSocketChannel::set_closed_handler(ClosedHandler handler) {
    on_closed_ = std::move(handler);
}

bool WebSocketChannel::is_open() const {
    return open_;
}

std::string WebSocketChannel::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void WebSocketChannel::set_error(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_ = message;
    }
    RTV_LOG_ERROR("WebSocket", "%s", message.c_str());
}

rtv_result_t WebSocketChannel::open(const ChannelRequest& request) {
    ws::WsUrl url;
    {
        std::lock_guard<std::mutex> lock(impl_->fd_mutex);
        if (closing_) {
            return RTV_ERROR_CANCELLED;
        }
        if (open_ || impl_->opening || impl_->fd >= 0) {
            return RTV_ERROR_INVALID_STATE;
        }
        if (!ws::parse_ws_url(request.url, url)) {
            set_error("Invalid URL: " + request.url);
            return RTV_ERROR_INVALID_URL;
        }
        impl_->opening = true;
    }

    rtv_result_t rc = connect_socket(url.host, url.port, request.timeout_ms);
    if (RTV_SUCCEEDED(rc) && url.secure) {
        rc = tls_handshake(url.host, request.timeout_ms);
    }
    if (RTV_SUCCEEDED(rc)) {
        rc = ws_handshake(url.host, url.port, url.secure, request);
    }

    std::lock_guard<std::mutex> lock(impl_->fd_mutex);
    impl_->opening = false;
    if (closing_) {
        impl_->release_locked();
        RTV_LOG_DEBUG("WebSocket", "Open cancelled by close()");
        return RTV_ERROR_CANCELLED;
    }
    if (RTV_FAILED(rc)) {
        impl_->release_locked();
        return rc;
    }

    open_ = true;
    running_ = true;
    recv_thread_ = std::thread(&WebSocketChannel::run_receive_loop, this);

    RTV_LOG_INFO("WebSocket", "Connected to %s:%d%s", url.host.c_str(), url.port,
                 url.secure ? " (TLS)" : "");
    return RTV_SUCCESS;
}

rtv_result_t WebSocketChannel::connect_socket(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    int gai_err = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (gai_err != 0) {
        set_error("Failed to resolve host: " + host + " (" + gai_strerror(gai_err) + ")");
        return RTV_ERROR_CONNECTION_FAILED;
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    int fd = -1;
    for (struct addrinfo* ai = result; ai != nullptr && fd < 0; ai = ai->ai_next) {
        int s = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s < 0) continue;

        fcntl(s, F_SETFL, fcntl(s, F_GETFL, 0) | O_NONBLOCK);

        // Disable Nagle for low latency
        int flag = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

        {
            std::lock_guard<std::mutex> lock(impl_->fd_mutex);
            if (closing_) {
                ::close(s);
                break;
            }
            impl_->fd = s;
        }

        if (::connect(s, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd = s;
            break;
        }
        if (errno == EINPROGRESS && impl_->wait(POLLOUT, remaining_ms(deadline))) {
            int so_error = 0;
            socklen_t so_len = sizeof(so_error);
            getsockopt(s, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
            if (so_error == 0) {
                fd = s;
                break;
            }
        }

        std::lock_guard<std::mutex> lock(impl_->fd_mutex);
        ::close(s);
        impl_->fd = -1;
    }
    freeaddrinfo(result);

    if (fd < 0) {
        set_error("Failed to connect to " + host + ":" + std::to_string(port));
        return RTV_ERROR_CONNECTION_FAILED;
    }
    return RTV_SUCCESS;
}

rtv_result_t WebSocketChannel::tls_handshake(const std::string& host, int timeout_ms) {
    impl_->ssl_ctx = SSL_CTX_new(TLS_client_method());
    if (!impl_->ssl_ctx) {
        set_error("Cannot create TLS context: " + ssl_error_string());
        return RTV_ERROR_TLS_FAILED;
    }
    SSL_CTX_set_min_proto_version(impl_->ssl_ctx, TLS1_2_VERSION);
    SSL_CTX_set_default_verify_paths(impl_->ssl_ctx);
    SSL_CTX_set_verify(impl_->ssl_ctx, SSL_VERIFY_PEER, nullptr);

    impl_->ssl = SSL_new(impl_->ssl_ctx);
    if (!impl_->ssl) {
        set_error("Cannot create TLS session: " + ssl_error_string());
        return RTV_ERROR_TLS_FAILED;
    }
    SSL_set_fd(impl_->ssl, impl_->fd);
    SSL_set_mode(impl_->ssl, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    SSL_set_tlsext_host_name(impl_->ssl, host.c_str());
    SSL_set1_host(impl_->ssl, host.c_str());

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        int ret = SSL_connect(impl_->ssl);
        if (ret == 1) break;

        int err = SSL_get_error(impl_->ssl, ret);
        short events = 0;
        if (err == SSL_ERROR_WANT_READ) {
            events = POLLIN;
        } else if (err == SSL_ERROR_WANT_WRITE) {
            events = POLLOUT;
        } else {
            long verify = SSL_get_verify_result(impl_->ssl);
            std::string detail = verify != X509_V_OK
                                     ? X509_verify_cert_error_string(verify)
                                     : ssl_error_string();
            set_error("TLS handshake with " + host + " failed: " + detail);
            return RTV_ERROR_TLS_FAILED;
        }

        int left = remaining_ms(deadline);
        if (left == 0 || !impl_->wait(events, left) || closing_) {
            set_error("TLS handshake with " + host + " timed out");
            return RTV_ERROR_TLS_FAILED;
        }
    }
    return RTV_SUCCESS;
}

rtv_result_t WebSocketChannel::ws_handshake(const std::string& host, int port, bool secure,
                                            const ChannelRequest& request) {
    ws::WsUrl url;
    ws::parse_ws_url(request.url, url);

    std::string ws_key = ws::make_client_key();
    bool default_port = (secure && port == 443) || (!secure && port == 80);

    std::ostringstream req;
    req << "GET " << url.path << " HTTP/1.1\r\n"
        << "Host: " << host;
    if (!default_port) req << ":" << port;
    req << "\r\n"
        << "Upgrade: websocket\r\n"
        << "Connection: Upgrade\r\n"
        << "Sec-WebSocket-Key: " << ws_key << "\r\n"
        << "Sec-WebSocket-Version: 13\r\n";
    for (const auto& header : request.headers) {
        req << header.first << ": " << header.second << "\r\n";
    }
    req << "\r\n";

    std::string request_str = req.str();
    if (!impl_->write_all(reinterpret_cast<const uint8_t*>(request_str.data()),
                          request_str.size(), request.timeout_ms)) {
        set_error("Failed to send WebSocket handshake");
        return RTV_ERROR_HANDSHAKE_FAILED;
    }

    // Read response headers; anything after them is the first frame data
    auto deadline = Clock::now() + std::chrono::milliseconds(request.timeout_ms);
    std::string response;
    size_t header_end = std::string::npos;
    uint8_t buf[2048];
    while (header_end == std::string::npos) {
        long n = impl_->read_some(buf, sizeof(buf));
        if (n < 0) {
            set_error("Connection closed during WebSocket handshake");
            return RTV_ERROR_HANDSHAKE_FAILED;
        }
        if (n == 0) {
            int left = remaining_ms(deadline);
            if (left == 0 || closing_ || !impl_->wait(impl_->want_events, left)) {
                set_error("WebSocket handshake timed out");
                return RTV_ERROR_HANDSHAKE_FAILED;
            }
            continue;
        }
        response.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
        header_end = response.find("\r\n\r\n");
        if (header_end == std::string::npos && response.size() > kMaxHandshakeBytes) {
            set_error("WebSocket handshake response too large");
            return RTV_ERROR_HANDSHAKE_FAILED;
        }
    }

    impl_->leftover.assign(response.begin() + static_cast<std::ptrdiff_t>(header_end + 4),
                           response.end());

    std::istringstream lines(response.substr(0, header_end));
    std::string status_line;
    std::getline(lines, status_line);
    status_line = trim(status_line);

    // "HTTP/1.1 101 Switching Protocols"
    size_t sp = status_line.find(' ');
    int status = 0;
    if (sp != std::string::npos) {
        status = std::atoi(status_line.c_str() + sp + 1);
    }
    if (status != 101) {
        set_error("WebSocket handshake rejected: " + status_line.substr(0, 80));
        return RTV_ERROR_HANDSHAKE_FAILED;
    }

    std::string accept;
    std::string line;
    while (std::getline(lines, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (to_lower(trim(line.substr(0, colon))) == "sec-websocket-accept") {
            accept = trim(line.substr(colon + 1));
        }
    }
    if (accept != ws::compute_accept_key(ws_key)) {
        set_error("WebSocket handshake failed: bad Sec-WebSocket-Accept");
        return RTV_ERROR_HANDSHAKE_FAILED;
    }
    return RTV_SUCCESS;
}

rtv_result_t WebSocketChannel::send_text(const std::string& payload) {
    if (!open_) {
        return RTV_ERROR_NOT_CONNECTED;
    }
    return send_frame(ws::kOpText, payload);
}

rtv_result_t WebSocketChannel::send_frame(uint8_t opcode, const std::string& payload) {
    std::vector<uint8_t> frame = ws::encode_client_frame(opcode, payload);

    std::lock_guard<std::mutex> lock(impl_->io_mutex);
    if (impl_->fd < 0) {
        return RTV_ERROR_NOT_CONNECTED;
    }
    if (!impl_->write_all(frame.data(), frame.size(), kSendTimeoutMs)) {
        set_error("Failed to send frame");
        return RTV_ERROR_CONNECTION_CLOSED;
    }
    return RTV_SUCCESS;
}

void WebSocketChannel::close() {
    {
        std::lock_guard<std::mutex> lock(impl_->fd_mutex);
        closing_ = true;
        if (impl_->opening) {
            // open() sees closing_ and releases the transport itself
            if (impl_->fd >= 0) {
                ::shutdown(impl_->fd, SHUT_RDWR);
            }
            return;
        }
    }

    if (open_.exchange(false)) {
        rtv_result_t rc =
            send_frame(ws::kOpClose, ws::make_close_payload(ws::kCloseNormal));
        if (RTV_FAILED(rc)) {
            RTV_LOG_DEBUG("WebSocket", "Close frame not delivered: %s", rtv_error_message(rc));
        }
    }
    running_ = false;

    {
        std::lock_guard<std::mutex> lock(impl_->fd_mutex);
        if (impl_->fd >= 0) {
            ::shutdown(impl_->fd, SHUT_RDWR);
        }
    }

    if (recv_thread_.joinable()) {
        if (recv_thread_.get_id() == std::this_thread::get_id()) {
            RTV_LOG_ERROR("WebSocket", "close() called from the receive thread");
            return;
        }
        recv_thread_.join();
    }

    std::lock_guard<std::mutex> lock(impl_->fd_mutex);
    impl_->release_locked();
}

void WebSocketChannel::finish_remote(rtv_result_t reason, const std::string& detail) {
    bool was_open = open_.exchange(false);
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(impl_->io_mutex);
        if (impl_->fd >= 0) {
            ::shutdown(impl_->fd, SHUT_RDWR);
        }
    }
    if (was_open && !closing_ && on_closed_) {
        on_closed_(reason, detail);
    }
}

// =============================================================================
// Background Receive Loop
// =============================================================================

void WebSocketChannel::run_receive_loop() {
    std::vector<uint8_t> buf(16 * 1024);
    std::vector<ws::WsFrame> frames;
    std::vector<uint8_t> pending = std::move(impl_->leftover);
    impl_->leftover.clear();

    while (running_) {
        if (pending.empty()) {
            bool buffered;
            short events;
            {
                std::lock_guard<std::mutex> lock(impl_->io_mutex);
                buffered = impl_->has_buffered();
                events = impl_->want_events;
            }
            if (!buffered) {
                struct pollfd pfd = {impl_->fd, events, 0};
                int ret = poll(&pfd, 1, kPollIntervalMs);
                if (ret < 0 && errno != EINTR) {
                    finish_remote(RTV_ERROR_CONNECTION_CLOSED, "Connection lost");
                    return;
                }
                if (ret <= 0) continue;
            }

            long n;
            {
                std::lock_guard<std::mutex> lock(impl_->io_mutex);
                n = impl_->read_some(buf.data(), buf.size());
            }
            if (n == 0) continue;
            if (n < 0) {
                if (!running_) break;
                finish_remote(RTV_ERROR_CONNECTION_CLOSED, "Connection lost");
                return;
            }
            pending.assign(buf.begin(), buf.begin() + n);
        }

        frames.clear();
        rtv_result_t rc = impl_->parser.feed(pending.data(), pending.size(), frames);
        pending.clear();

        for (auto& frame : frames) {
            switch (frame.opcode) {
                case ws::kOpText:
                    if (on_message_) {
                        on_message_(frame.payload);
                    }
                    break;
                case ws::kOpBinary:
                    RTV_LOG_DEBUG("WebSocket", "Ignoring binary message (%zu bytes)",
                                  frame.payload.size());
                    break;
                case ws::kOpPing:
                    if (RTV_FAILED(send_frame(ws::kOpPong, frame.payload))) {
                        RTV_LOG_WARNING("WebSocket", "Failed to answer ping");
                    }
                    break;
                case ws::kOpPong:
                    break;
                case ws::kOpClose: {
                    int code = frame.payload.size() >= 2
                                   ? (static_cast<uint8_t>(frame.payload[0]) << 8) |
                                         static_cast<uint8_t>(frame.payload[1])
                                   : 0;
                    RTV_LOG_INFO("WebSocket", "Server closed connection (code %d)", code);
                    if (!closing_) {
                        rtv_result_t close_rc = send_frame(
                            ws::kOpClose, ws::make_close_payload(ws::kCloseNormal));
                        if (RTV_FAILED(close_rc)) {
                            RTV_LOG_DEBUG("WebSocket", "Close reply not delivered");
                        }
                    }
                    finish_remote(RTV_ERROR_CONNECTION_CLOSED,
                                  "Server closed connection (code " + std::to_string(code) + ")");
                    return;
                }
                default:
                    break;
            }
            if (!running_) return;
        }

        if (RTV_FAILED(rc)) {
            rtv_result_t close_rc =
                send_frame(ws::kOpClose, ws::make_close_payload(ws::kCloseProtocolError));
            if (RTV_FAILED(close_rc)) {
                RTV_LOG_DEBUG("WebSocket", "Close frame not delivered");
            }
            finish_remote(RTV_ERROR_PROTOCOL_FRAME, "Invalid frame from server");
            return;
        }
    }
}

ChannelFactory websocket_channel_factory() {
    return []() -> std::unique_ptr<RealtimeChannel> { return std::make_unique<WebSocketChannel>(); };
}

}  // namespace rtv
