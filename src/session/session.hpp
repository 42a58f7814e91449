//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// session/session.hpp
//
// One protocol session over a WebSocket connection
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include "errors.hpp"
#include "network/websocket.hpp"
#include "protocol/commands.hpp"

namespace exaconn {

// Strict request/response exchange of JSON commands. Send calls are
// serialized; Cancel may be called from any thread.
class Session {
public:
    using Ptr = std::unique_ptr<Session>;

    Session(std::unique_ptr<WebSocketConnection> connection, std::string host);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Send one command and return its responseData (null when absent)
    json Send(const json& command);

    // Send one command and decode responseData into response
    template <typename Command, typename Response>
    void Send(const Command& command, Response* response) {
        json data = Send(json(command));
        if (!response) {
            return;
        }
        try {
            data.get_to(*response);
        } catch (const json::exception& e) {
            throw MalformedDataError(error_code::RESPONSE_PARSE,
                "failed to parse response data '" + data.dump() + "' into " +
                Response::NAME + ": " + e.what());
        }
    }

    // Send one command and discard the payload
    template <typename Command>
    void Send(const Command& command, std::nullptr_t) {
        Send(json(command));
    }

    // Send disconnect (best effort) and close the transport
    void Close();

    // Abort an in-flight exchange; the session is unusable afterwards
    void Cancel();

    bool IsClosed() const { return closed_; }

    void SetCompression(bool enabled) { compression_ = enabled; }
    bool IsCompressionEnabled() const { return compression_; }

    // Upper bound for each exchange, zero disables it
    void SetTimeout(std::chrono::milliseconds timeout);

    const std::string& GetHost() const { return host_; }
    std::string GetLocalAddress() const;

    // Negotiated by login
    void SetInfo(const AuthResponse& info) { info_ = info; }
    const AuthResponse& GetInfo() const { return info_; }

    // Expires when the Session is destroyed
    std::weak_ptr<void> Lifetime() const { return lifetime_; }

private:
    json Exchange(const json& command);

    // Mark the session unusable after a transport level failure
    void Invalidate(const std::string& reason);

private:
    std::unique_ptr<WebSocketConnection> connection_;
    std::string host_;

    std::mutex mutex_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> compression_{false};

    AuthResponse info_;
    std::shared_ptr<void> lifetime_ = std::make_shared<char>(0);
};

// Non-owning Session handle for statements and result sets. Get() returns
// null once the Session is gone, so late cleanup does not touch freed
// memory. The Session must still not be destroyed concurrently with a use.
class SessionRef {
public:
    SessionRef() = default;
    SessionRef(Session* session)
        : session_(session)
        , lifetime_(session ? session->Lifetime() : std::weak_ptr<void>()) {}

    Session* Get() const { return lifetime_.expired() ? nullptr : session_; }

    // Referred to a Session that has been destroyed since
    bool Dangling() const { return session_ && lifetime_.expired(); }

private:
    Session* session_ = nullptr;
    std::weak_ptr<void> lifetime_;
};

} // namespace exaconn
