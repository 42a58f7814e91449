//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// session/connector.cpp
//
// Host failover and login handshake
//===----------------------------------------------------------------------===//

#include "session/connector.hpp"
#include "network/host_resolver.hpp"
#include "protocol/crypto.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <system_error>
#include <cstdlib>
#include <random>
#include <sys/utsname.h>

namespace exaconn {

namespace {

std::string ClientOs() {
    struct utsname name;
    if (uname(&name) != 0) {
        return "unknown";
    }
    return std::string(name.sysname) + " " + name.release;
}

std::string ClientOsUsername() {
    const char* user = std::getenv("USER");
    return user ? user : "";
}

} // anonymous namespace

Connector::Connector(ConnectionConfig config, WebSocketFactory factory)
    : config_(std::move(config))
    , factory_(std::move(factory)) {
}

Session::Ptr Connector::Connect() {
    auto hosts = ResolveHosts(config_.host);
    if (hosts.empty()) {
        throw ConnectionError(error_code::CONNECTION_FAILED,
                              "no host found in '" + config_.host + "'");
    }
    if (config_.shuffle_hosts) {
        std::mt19937 rng(std::random_device{}());
        std::shuffle(hosts.begin(), hosts.end(), rng);
    }

    std::string failures;
    for (const auto& host : hosts) {
        std::string reason;
        try {
            return ConnectTo(host);
        } catch (const Error& e) {
            reason = e.what();
        } catch (const TransportError& e) {
            reason = e.what();
        } catch (const std::system_error& e) {
            reason = e.what();
        }
        ELOG_WARN("connector", "Connection to {}:{} failed: {}", host, config_.port, reason);
        if (!failures.empty()) {
            failures += ", ";
        }
        failures += "'" + host + "': " + reason;
    }
    throw ConnectionError(error_code::CONNECTION_FAILED,
                          "failed to connect to any host: " + failures);
}

Session::Ptr Connector::ConnectTo(const std::string& host) {
    ELOG_INFO("connector", "Connecting to {}:{}", host, config_.port);

    WebSocketOptions options;
    options.tls = config_.encryption;
    options.validate_certificate = config_.validate_server_certificate;
    options.certificate_fingerprint = config_.certificate_fingerprint;
    options.connect_timeout = std::chrono::milliseconds(config_.connect_timeout_ms);

    auto connection = factory_(host, config_.port, options);
    if (!connection) {
        throw ConnectionError(error_code::CONNECTION_FAILED,
                              "no WebSocket connection to '" + host + "'");
    }
    connection->SetTimeout(std::chrono::milliseconds(config_.connect_timeout_ms));

    auto session = std::make_unique<Session>(std::move(connection), host);
    Login(*session);
    // Past the handshake every exchange is bounded by the query timeout (0 = none)
    session->SetTimeout(std::chrono::seconds(config_.query_timeout_seconds));

    ELOG_INFO("connector", "Session {} established with {} ({} {})",
              session->GetInfo().session_id, host,
              session->GetInfo().product_name, session->GetInfo().release_version);
    return session;
}

void Connector::Login(Session& session) {
    // The handshake always runs uncompressed
    session.SetCompression(false);

    LoginCommand login;
    login.protocol_version = PROTOCOL_VERSION;

    AuthCommand auth;
    if (UseTokenLogin()) {
        login.command = "loginToken";
        session.Send(login, nullptr);
        auth.access_token = config_.access_token;
        auth.refresh_token = config_.refresh_token;
    } else {
        PublicKeyResponse key;
        session.Send(login, &key);
        auth.username = config_.user;
        auth.password = EncryptPassword(key.public_key_pem, config_.password);
    }

    auth.use_compression = config_.compression;
    auth.client_name = config_.client_name;
    auth.driver_name = std::string(DRIVER_NAME) + " " + DRIVER_VERSION;
    auth.client_os = ClientOs();
    auth.client_os_username = ClientOsUsername();
    auth.client_language = "C++";
    auth.client_version = config_.client_version;
    auth.client_runtime = "C++17";
    auth.attributes = LoginAttributes();

    AuthResponse info;
    try {
        session.Send(auth, &info);
    } catch (const ServerError& e) {
        throw ConnectionError(error_code::LOGIN_FAILED, "login failed: " + e.Message());
    }
    session.SetInfo(info);
    session.SetCompression(config_.compression);

    ELOG_DEBUG("connector", "Logged in as '{}' with protocol version {}",
               UseTokenLogin() ? std::string("<token>") : config_.user, info.protocol_version);
}

Attributes Connector::LoginAttributes() const {
    Attributes attributes;
    attributes.autocommit = config_.autocommit;
    if (!config_.schema.empty()) {
        attributes.current_schema = config_.schema;
    }
    attributes.query_timeout = config_.query_timeout_seconds;
    return attributes;
}

} // namespace exaconn
