//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// network/websocket.cpp
//
// WebSocket client implementation using ASIO and OpenSSL
//===----------------------------------------------------------------------===//

#include "network/websocket.hpp"
#include "errors.hpp"
#include "protocol/crypto.hpp"
#include "logging/logger.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <openssl/x509.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <sstream>

namespace exaconn {

using asio::ip::tcp;

namespace {

constexpr uint8_t FIN_BIT      = 0x80;
constexpr uint8_t OPCODE_MASK  = 0x0F;
constexpr uint8_t MASK_BIT     = 0x80;
constexpr uint8_t PAYLOAD_MASK = 0x7F;

constexpr uint8_t OP_CONTINUATION = 0x0;
constexpr uint8_t OP_TEXT         = 0x1;
constexpr uint8_t OP_BINARY       = 0x2;
constexpr uint8_t OP_CLOSE        = 0x8;
constexpr uint8_t OP_PING         = 0x9;
constexpr uint8_t OP_PONG         = 0xA;

constexpr uint64_t MAX_FRAME_SIZE = 1ULL << 31;  // 2 GiB
constexpr size_t MAX_UPGRADE_RESPONSE_SIZE = 16384;

constexpr const char* WS_GUID = "258EAFA5-E914-47DA-95CA-5AB5DC587183";

std::string RandomBytes(size_t size) {
    std::string bytes(size, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&bytes[0]), static_cast<int>(size)) != 1) {
        throw TransportError("failed to generate random bytes");
    }
    return bytes;
}

// accept = base64(SHA1(key + GUID))
std::string ComputeAcceptKey(const std::string& sec_key) {
    std::string concat = sec_key + WS_GUID;
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(concat.data()), concat.size(), hash);
    return Base64Encode(std::string(reinterpret_cast<const char*>(hash), SHA_DIGEST_LENGTH));
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

std::string Trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

std::string NormalizeFingerprint(const std::string& fingerprint) {
    std::string out;
    for (char c : fingerprint) {
        if (c != ':') {
            out += static_cast<char>(::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

} // namespace

//===----------------------------------------------------------------------===//
// Socket Implementation (PIMPL)
//===----------------------------------------------------------------------===//

class AsioWebSocket::SocketImpl {
public:
    asio::io_context io_context;
    asio::ssl::context ssl_context;
    asio::ssl::stream<tcp::socket> stream;
    bool tls = false;
    std::atomic<bool> cancelled{false};
    std::vector<char> chunk;

    SocketImpl()
        : ssl_context(asio::ssl::context::tls_client)
        , stream(io_context, ssl_context)
        , chunk(DEFAULT_READ_BUFFER_SIZE) {}

    tcp::socket& Socket() { return stream.next_layer(); }

    void CloseSocket() {
        asio::error_code ec;
        Socket().shutdown(tcp::socket::shutdown_both, ec);
        Socket().close(ec);
    }

    // Drive the io_context until the pending operation reports into 'ec'
    void Wait(const char* what, asio::error_code& ec, std::chrono::milliseconds timeout) {
        io_context.restart();
        if (timeout.count() > 0) {
            io_context.run_for(timeout);
        } else {
            io_context.run();
        }

        if (ec == asio::error::would_block) {
            CloseSocket();
            io_context.restart();
            io_context.run();
            throw TransportError(std::string(what) + " timed out");
        }
        if (cancelled) {
            throw TransportError(std::string(what) + " cancelled");
        }
        if (ec) {
            throw TransportError(std::string(what) + " failed: " + ec.message());
        }
    }

    template <typename Handler>
    void AsyncWrite(const std::string& data, Handler&& handler) {
        if (tls) {
            asio::async_write(stream, asio::buffer(data), std::forward<Handler>(handler));
        } else {
            asio::async_write(Socket(), asio::buffer(data), std::forward<Handler>(handler));
        }
    }

    template <typename Handler>
    void AsyncReadSome(Handler&& handler) {
        if (tls) {
            stream.async_read_some(asio::buffer(chunk), std::forward<Handler>(handler));
        } else {
            Socket().async_read_some(asio::buffer(chunk), std::forward<Handler>(handler));
        }
    }
};

//===----------------------------------------------------------------------===//
// AsioWebSocket Implementation
//===----------------------------------------------------------------------===//

AsioWebSocket::AsioWebSocket() : socket_impl_(std::make_unique<SocketImpl>()) {}

AsioWebSocket::~AsioWebSocket() {
    Close();
}

void AsioWebSocket::Connect(const std::string& host, uint16_t port, const WebSocketOptions& options) {
    if (connected_) {
        throw TransportError("already connected");
    }
    auto& impl = *socket_impl_;
    impl.tls = options.tls;

    asio::error_code ec = asio::error::would_block;
    tcp::resolver resolver(impl.io_context);
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(host, std::to_string(port),
        [&ec, &endpoints](const asio::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
        });
    impl.Wait("resolve", ec, options.connect_timeout);

    ec = asio::error::would_block;
    asio::async_connect(impl.Socket(), endpoints,
        [&ec](const asio::error_code& e, const tcp::endpoint&) { ec = e; });
    impl.Wait("connect", ec, options.connect_timeout);

    impl.Socket().set_option(tcp::no_delay(true), ec);

    if (impl.tls) {
        const bool pinned = !options.certificate_fingerprint.empty();
        if (options.validate_certificate && !pinned) {
            impl.ssl_context.set_default_verify_paths(ec);
            if (!ec) impl.stream.set_verify_mode(asio::ssl::verify_peer, ec);
            if (!ec) impl.stream.set_verify_callback(asio::ssl::host_name_verification(host), ec);
        } else {
            impl.stream.set_verify_mode(asio::ssl::verify_none, ec);
        }
        if (ec) {
            impl.CloseSocket();
            throw TransportError("TLS setup failed: " + ec.message());
        }
        SSL_set_tlsext_host_name(impl.stream.native_handle(), host.c_str());

        ec = asio::error::would_block;
        impl.stream.async_handshake(asio::ssl::stream_base::client,
            [&ec](const asio::error_code& e) { ec = e; });
        impl.Wait("TLS handshake", ec, options.connect_timeout);

        if (pinned) {
            X509* cert = SSL_get1_peer_certificate(impl.stream.native_handle());
            if (cert == nullptr) {
                impl.CloseSocket();
                throw ConnectionError(error_code::CERTIFICATE_MISMATCH,
                                      "server did not present a certificate");
            }
            unsigned char md[EVP_MAX_MD_SIZE];
            unsigned int md_len = 0;
            X509_digest(cert, EVP_sha256(), md, &md_len);
            X509_free(cert);

            std::ostringstream hex;
            for (unsigned int i = 0; i < md_len; ++i) {
                static const char digits[] = "0123456789abcdef";
                hex << digits[md[i] >> 4] << digits[md[i] & 0x0F];
            }
            if (hex.str() != NormalizeFingerprint(options.certificate_fingerprint)) {
                impl.CloseSocket();
                throw ConnectionError(error_code::CERTIFICATE_MISMATCH,
                    "the server's certificate fingerprint '" + hex.str() +
                    "' does not match the expected fingerprint '" +
                    options.certificate_fingerprint + "'");
            }
        }
    }

    SetTimeout(options.connect_timeout);
    Upgrade(host, port);
    SetTimeout(std::chrono::milliseconds(0));
    connected_ = true;

    ELOG_DEBUG("websocket", "connected to {}:{} (tls={})", host, port, impl.tls);
}

void AsioWebSocket::Upgrade(const std::string& host, uint16_t port) {
    auto& impl = *socket_impl_;
    std::string raw_key = RandomBytes(16);
    std::string sec_key = Base64Encode(raw_key);

    std::ostringstream request;
    request << "GET / HTTP/1.1\r\n"
            << "Host: " << host << ":" << port << "\r\n"
            << "Upgrade: websocket\r\n"
            << "Connection: Upgrade\r\n"
            << "Sec-WebSocket-Key: " << sec_key << "\r\n"
            << "Sec-WebSocket-Version: 13\r\n"
            << "\r\n";
    std::string data = request.str();

    asio::error_code ec = asio::error::would_block;
    impl.AsyncWrite(data, [&ec](const asio::error_code& e, size_t) { ec = e; });
    impl.Wait("upgrade request", ec, timeout_);

    size_t header_end;
    while ((header_end = read_buffer_.find("\r\n\r\n")) == std::string::npos) {
        if (read_buffer_.size() > MAX_UPGRADE_RESPONSE_SIZE) {
            throw TransportError("upgrade response too large");
        }
        ReadMore();
    }

    std::string head = read_buffer_.substr(0, header_end);
    read_buffer_.erase(0, header_end + 4);

    std::istringstream lines(head);
    std::string status_line;
    std::getline(lines, status_line);
    std::istringstream status(status_line);
    std::string version;
    int status_code = 0;
    status >> version >> status_code;
    if (status_code != 101) {
        throw TransportError("WebSocket upgrade rejected: " + Trim(status_line));
    }

    std::string upgrade, connection, accept;
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = ToLower(Trim(line.substr(0, colon)));
        std::string value = Trim(line.substr(colon + 1));
        if (name == "upgrade") upgrade = ToLower(value);
        else if (name == "connection") connection = ToLower(value);
        else if (name == "sec-websocket-accept") accept = value;
    }

    if (upgrade != "websocket" || connection.find("upgrade") == std::string::npos) {
        throw TransportError("invalid WebSocket upgrade response headers");
    }
    if (accept != ComputeAcceptKey(sec_key)) {
        throw TransportError("invalid Sec-WebSocket-Accept in upgrade response");
    }
}

void AsioWebSocket::Write(FrameType type, const std::string& payload) {
    if (!connected_) {
        throw TransportError("not connected");
    }
    WriteFrame(static_cast<uint8_t>(type), payload);
}

void AsioWebSocket::WriteFrame(uint8_t opcode, const std::string& payload) {
    auto& impl = *socket_impl_;

    std::string frame;
    frame.reserve(payload.size() + 14);
    frame.push_back(static_cast<char>(FIN_BIT | opcode));

    const uint64_t size = payload.size();
    if (size <= 125) {
        frame.push_back(static_cast<char>(MASK_BIT | size));
    } else if (size <= 0xFFFF) {
        frame.push_back(static_cast<char>(MASK_BIT | 126));
        frame.push_back(static_cast<char>((size >> 8) & 0xFF));
        frame.push_back(static_cast<char>(size & 0xFF));
    } else {
        frame.push_back(static_cast<char>(MASK_BIT | 127));
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<char>((size >> (i * 8)) & 0xFF));
        }
    }

    // Client frames are always masked (RFC 6455 5.3)
    std::string mask = RandomBytes(4);
    frame += mask;
    size_t offset = frame.size();
    frame += payload;
    for (size_t i = 0; i < payload.size(); ++i) {
        frame[offset + i] = static_cast<char>(frame[offset + i] ^ mask[i & 3]);
    }

    asio::error_code ec = asio::error::would_block;
    impl.AsyncWrite(frame, [&ec](const asio::error_code& e, size_t) { ec = e; });
    impl.Wait("write", ec, timeout_);
}

WebSocketMessage AsioWebSocket::Read() {
    if (!connected_) {
        throw TransportError("not connected");
    }

    WebSocketMessage message;
    bool started = false;

    while (true) {
        std::string head = ReadExact(2);
        const auto b0 = static_cast<uint8_t>(head[0]);
        const auto b1 = static_cast<uint8_t>(head[1]);
        const bool fin = (b0 & FIN_BIT) != 0;
        const uint8_t opcode = b0 & OPCODE_MASK;
        const bool masked = (b1 & MASK_BIT) != 0;

        uint64_t length = b1 & PAYLOAD_MASK;
        if (length == 126) {
            std::string ext = ReadExact(2);
            length = (static_cast<uint64_t>(static_cast<uint8_t>(ext[0])) << 8) |
                     static_cast<uint8_t>(ext[1]);
        } else if (length == 127) {
            std::string ext = ReadExact(8);
            length = 0;
            for (char c : ext) {
                length = (length << 8) | static_cast<uint8_t>(c);
            }
        }
        if (length > MAX_FRAME_SIZE) {
            throw TransportError("frame of " + std::to_string(length) + " bytes exceeds limit");
        }

        std::string mask;
        if (masked) {
            mask = ReadExact(4);
        }
        std::string payload = ReadExact(static_cast<size_t>(length));
        if (masked) {
            for (size_t i = 0; i < payload.size(); ++i) {
                payload[i] = static_cast<char>(payload[i] ^ mask[i & 3]);
            }
        }

        switch (opcode) {
        case OP_TEXT:
        case OP_BINARY:
            if (started) {
                throw TransportError("new data frame inside a fragmented message");
            }
            started = true;
            message.type = opcode == OP_TEXT ? FrameType::TEXT : FrameType::BINARY;
            message.payload = std::move(payload);
            break;
        case OP_CONTINUATION:
            if (!started) {
                throw TransportError("continuation frame without a message");
            }
            message.payload += payload;
            break;
        case OP_PING:
            WriteFrame(OP_PONG, payload);
            continue;
        case OP_PONG:
            continue;
        case OP_CLOSE: {
            uint16_t code = 0;
            if (payload.size() >= 2) {
                code = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) |
                                             static_cast<uint8_t>(payload[1]));
            }
            connected_ = false;
            socket_impl_->CloseSocket();
            throw TransportError("connection closed by server (code " + std::to_string(code) + ")");
        }
        default:
            throw TransportError("unknown WebSocket opcode " + std::to_string(opcode));
        }

        if (fin) {
            return message;
        }
    }
}

std::string AsioWebSocket::ReadExact(size_t size) {
    while (read_buffer_.size() < size) {
        ReadMore();
    }
    std::string out = read_buffer_.substr(0, size);
    read_buffer_.erase(0, size);
    return out;
}

void AsioWebSocket::ReadMore() {
    auto& impl = *socket_impl_;
    asio::error_code ec = asio::error::would_block;
    size_t bytes = 0;
    impl.AsyncReadSome([&ec, &bytes](const asio::error_code& e, size_t n) {
        ec = e;
        bytes = n;
    });
    impl.Wait("read", ec, timeout_);
    read_buffer_.append(impl.chunk.data(), bytes);
}

void AsioWebSocket::Close() {
    if (!connected_.exchange(false)) {
        return;
    }
    auto& impl = *socket_impl_;

    // Best effort close frame (status 1000, zero mask), bounded by a short wait
    std::string frame;
    frame.push_back(static_cast<char>(FIN_BIT | OP_CLOSE));
    frame.push_back(static_cast<char>(MASK_BIT | 2));
    frame += std::string(4, '\0');
    frame.push_back(static_cast<char>(0x03));
    frame.push_back(static_cast<char>(0xE8));

    asio::error_code ec = asio::error::would_block;
    if (!impl.cancelled) {
        impl.AsyncWrite(frame, [&ec](const asio::error_code& e, size_t) { ec = e; });
        impl.io_context.restart();
        impl.io_context.run_for(std::chrono::milliseconds(500));
        if (ec) {
            ELOG_DEBUG("websocket", "close frame not delivered: {}", ec.message());
        }
    }

    impl.CloseSocket();
    impl.io_context.restart();
    impl.io_context.run();
    read_buffer_.clear();
}

void AsioWebSocket::Cancel() {
    auto* impl = socket_impl_.get();
    impl->cancelled = true;
    asio::post(impl->io_context, [impl]() { impl->CloseSocket(); });
}

void AsioWebSocket::SetTimeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
}

std::string AsioWebSocket::GetLocalAddress() const {
    asio::error_code ec;
    auto endpoint = socket_impl_->Socket().local_endpoint(ec);
    if (ec) {
        return "";
    }
    return endpoint.address().to_string();
}

//===----------------------------------------------------------------------===//
// Factory
//===----------------------------------------------------------------------===//

WebSocketFactory DefaultWebSocketFactory() {
    return [](const std::string& host, uint16_t port, const WebSocketOptions& options) {
        // Anything asio throws past the checked paths is a transport failure
        try {
            auto ws = std::make_unique<AsioWebSocket>();
            ws->Connect(host, port, options);
            return std::unique_ptr<WebSocketConnection>(std::move(ws));
        } catch (const asio::system_error& e) {
            throw TransportError(e.what());
        }
    };
}

} // namespace exaconn
