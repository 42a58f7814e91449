//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// session/session.cpp
//
// Session implementation
//===----------------------------------------------------------------------===//

#include "session/session.hpp"
#include "protocol/compression.hpp"
#include "logging/logger.hpp"

namespace exaconn {

namespace {

std::string CommandName(const json& command) {
    auto it = command.find("command");
    if (it != command.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "credentials";
}

} // anonymous namespace

Session::Session(std::unique_ptr<WebSocketConnection> connection, std::string host)
    : connection_(std::move(connection))
    , host_(std::move(host)) {
}

Session::~Session() {
    if (connection_ && !closed_) {
        try {
            connection_->Close();
        } catch (const TransportError& e) {
            LOG_DEBUG("session", std::string("Close on destruction failed: ") + e.what());
        }
    }
}

json Session::Send(const json& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Exchange(command);
}

json Session::Exchange(const json& command) {
    std::string request = command.dump();
    if (!connection_ || closed_) {
        throw BadConnectionError(error_code::NOT_CONNECTED,
            "could not send request '" + request + "': not connected to server");
    }

    ELOG_DEBUG("session", "Sending '{}' to {}", CommandName(command), host_);

    std::string reply;
    try {
        if (compression_) {
            connection_->Write(FrameType::BINARY, Compress(request));
        } else {
            connection_->Write(FrameType::TEXT, request);
        }
        auto message = connection_->Read();
        reply = compression_ ? Decompress(message.payload) : std::move(message.payload);
    } catch (const TransportError& e) {
        Invalidate(e.what());
        throw BadConnectionError();
    } catch (const CompressionError& e) {
        Invalidate(e.what());
        throw BadConnectionError();
    }

    json envelope_json;
    try {
        envelope_json = json::parse(reply);
    } catch (const json::parse_error& e) {
        Invalidate(std::string("invalid response envelope: ") + e.what());
        throw BadConnectionError();
    }
    if (!envelope_json.is_object()) {
        Invalidate("response envelope is not an object");
        throw BadConnectionError();
    }

    ResponseEnvelope envelope;
    try {
        envelope_json.get_to(envelope);
    } catch (const json::exception& e) {
        throw MalformedDataError(error_code::RESPONSE_PARSE,
            "failed to parse response envelope '" + reply + "': " + e.what());
    }

    if (envelope.status != "ok") {
        if (envelope.exception) {
            ELOG_DEBUG("session", "Server exception {}: {}",
                       envelope.exception->sql_code, envelope.exception->text);
            throw ServerError(envelope.exception->sql_code, envelope.exception->text);
        }
        throw MalformedDataError(error_code::MISSING_EXCEPTION,
            "result status is not 'ok': '" + envelope.status +
            "', expected exception in response " + reply);
    }
    return std::move(envelope.response_data);
}

void Session::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connection_ || closed_) {
        return;
    }
    try {
        Exchange(DisconnectCommand{});
    } catch (const Error& e) {
        LOG_WARN("session", std::string("Disconnect failed: ") + e.what());
    }
    closed_ = true;
    try {
        connection_->Close();
    } catch (const TransportError& e) {
        LOG_DEBUG("session", std::string("Transport close failed: ") + e.what());
    }
    ELOG_INFO("session", "Session {} to {} closed", info_.session_id, host_);
}

void Session::Cancel() {
    if (!connection_ || closed_.exchange(true)) {
        return;
    }
    LOG_WARN("session", "Cancelling in-flight request to " + host_);
    connection_->Cancel();
}

void Session::SetTimeout(std::chrono::milliseconds timeout) {
    if (connection_) {
        connection_->SetTimeout(timeout);
    }
}

std::string Session::GetLocalAddress() const {
    if (!connection_) {
        return std::string();
    }
    return connection_->GetLocalAddress();
}

void Session::Invalidate(const std::string& reason) {
    ELOG_WARN("session", "Connection to {} is unusable: {}", host_, reason);
    closed_ = true;
    try {
        connection_->Close();
    } catch (const TransportError& e) {
        LOG_DEBUG("session", std::string("Transport close failed: ") + e.what());
    }
}

} // namespace exaconn
