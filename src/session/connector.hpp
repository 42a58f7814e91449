//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// session/connector.hpp
//
// Opens a logged-in Session on the first reachable host
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/connection_config.hpp"
#include "network/websocket.hpp"
#include "session/session.hpp"

namespace exaconn {

class Connector {
public:
    explicit Connector(ConnectionConfig config,
                       WebSocketFactory factory = DefaultWebSocketFactory());

    // Try every resolved host in order (shuffled when configured) and
    // return the first session that completes login. Throws
    // ConnectionError naming every host and its failure otherwise.
    Session::Ptr Connect();

    const ConnectionConfig& GetConfig() const { return config_; }

private:
    Session::Ptr ConnectTo(const std::string& host);
    void Login(Session& session);

    bool UseTokenLogin() const {
        return !config_.access_token.empty() || !config_.refresh_token.empty();
    }

    // Attributes sent with the credentials
    Attributes LoginAttributes() const;

private:
    ConnectionConfig config_;
    WebSocketFactory factory_;
};

} // namespace exaconn
