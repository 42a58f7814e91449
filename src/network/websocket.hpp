//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// network/websocket.hpp
//
// WebSocket (RFC 6455) client transport over TCP or TLS
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <chrono>
#include <stdexcept>

namespace exaconn {

enum class FrameType : uint8_t {
    TEXT   = 0x1,
    BINARY = 0x2
};

struct WebSocketMessage {
    FrameType type = FrameType::TEXT;
    std::string payload;
};

// Raised by the transport for any I/O, framing or handshake failure
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct WebSocketOptions {
    bool tls = true;
    bool validate_certificate = true;
    std::string certificate_fingerprint;  // SHA-256 hex, empty = not pinned
    std::chrono::milliseconds connect_timeout{DEFAULT_CONNECT_TIMEOUT_MS};
};

// One message-oriented WebSocket connection. Read and Write block and are
// not reentrant; Cancel may be called from any thread.
class WebSocketConnection {
public:
    virtual ~WebSocketConnection() = default;

    virtual void Write(FrameType type, const std::string& payload) = 0;
    virtual WebSocketMessage Read() = 0;

    virtual void Close() = 0;

    // Abort a blocked Read or Write; the connection is unusable afterwards
    virtual void Cancel() = 0;

    // Upper bound for each Read and Write, zero disables it
    virtual void SetTimeout(std::chrono::milliseconds timeout) = 0;

    // Local address of the underlying socket as seen by the peer's network
    virtual std::string GetLocalAddress() const = 0;
};

using WebSocketFactory = std::function<std::unique_ptr<WebSocketConnection>(
    const std::string& host, uint16_t port, const WebSocketOptions& options)>;

// Factory producing connected AsioWebSocket instances
WebSocketFactory DefaultWebSocketFactory();

class AsioWebSocket : public WebSocketConnection {
public:
    AsioWebSocket();
    ~AsioWebSocket() override;

    // Non-copyable
    AsioWebSocket(const AsioWebSocket&) = delete;
    AsioWebSocket& operator=(const AsioWebSocket&) = delete;

    // Resolve, connect, TLS handshake (optional) and HTTP upgrade
    void Connect(const std::string& host, uint16_t port, const WebSocketOptions& options);

    void Write(FrameType type, const std::string& payload) override;
    WebSocketMessage Read() override;
    void Close() override;
    void Cancel() override;
    void SetTimeout(std::chrono::milliseconds timeout) override;
    std::string GetLocalAddress() const override;

    bool IsConnected() const { return connected_; }

private:
    void Upgrade(const std::string& host, uint16_t port);
    void WriteFrame(uint8_t opcode, const std::string& payload);
    std::string ReadExact(size_t size);
    void ReadMore();

private:
    // Socket management (using pimpl to hide asio details)
    class SocketImpl;
    std::unique_ptr<SocketImpl> socket_impl_;

    std::atomic<bool> connected_{false};
    std::chrono::milliseconds timeout_{0};

    // Bytes received but not consumed yet
    std::string read_buffer_;
};

} // namespace exaconn
