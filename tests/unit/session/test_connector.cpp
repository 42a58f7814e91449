//===----------------------------------------------------------------------===//
//                         ExaConn Client - Unit Tests
//
// tests/unit/session/test_connector.cpp
//
// Unit tests for host failover and the login handshake
//===----------------------------------------------------------------------===//

#include "session/connector.hpp"
#include "mock_websocket.hpp"
#include <cassert>
#include <system_error>
#include <iostream>
#include <set>

using namespace exaconn;
using namespace exaconn::test;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

// Hands out mock connections; hosts in 'unreachable' fail to connect and
// hosts in 'misconfigured' fail with a system error while setting up
struct MockNetwork {
    std::shared_ptr<MockState> state = std::make_shared<MockState>();
    std::set<std::string> unreachable;
    std::set<std::string> misconfigured;
    std::vector<std::string> attempts;
    WebSocketOptions last_options;
    uint16_t last_port = 0;

    WebSocketFactory Factory() {
        return [this](const std::string& host, uint16_t port, const WebSocketOptions& options)
                   -> std::unique_ptr<WebSocketConnection> {
            attempts.push_back(host);
            last_options = options;
            last_port = port;
            if (unreachable.count(host)) {
                throw TransportError("connection refused");
            }
            if (misconfigured.count(host)) {
                throw std::system_error(std::make_error_code(std::errc::io_error), "TLS setup");
            }
            return std::make_unique<MockWebSocket>(state);
        };
    }
};

static ConnectionConfig MakeConfig(const std::string& hosts) {
    ConnectionConfig config;
    config.host = hosts;
    config.user = "sys";
    config.password = "exasol";
    return config;
}

//===----------------------------------------------------------------------===//
// Login
//===----------------------------------------------------------------------===//

void TestLogin() {
    std::cout << "  Testing password login..." << std::endl;

    TestKeyPair key;
    MockServer server;
    server.key = &key;
    MockNetwork network;
    network.state->responder = server.Responder();

    auto config = MakeConfig("exasol1");
    config.schema = "RETAIL";
    config.autocommit = false;
    config.query_timeout_seconds = 60;
    config.client_name = "unit-test";
    config.validate_server_certificate = false;
    config.certificate_fingerprint = "ABCD";
    config.port = 9563;

    Connector connector(config, network.Factory());
    auto session = connector.Connect();

    assert(session);
    assert(!session->IsClosed());
    assert(session->GetHost() == "exasol1");
    assert(session->GetInfo().session_id == 4242);
    assert(session->GetInfo().product_name == "EXASolution");
    assert(!session->IsCompressionEnabled());

    // Transport options
    assert(network.last_port == 9563);
    assert(network.last_options.tls);
    assert(!network.last_options.validate_certificate);
    assert(network.last_options.certificate_fingerprint == "ABCD");
    // Connect timeout is replaced by the query timeout after login
    assert(network.state->timeout == std::chrono::milliseconds(60000));

    // login, then credentials, both uncompressed
    auto& state = *network.state;
    assert(state.written.size() == 2);
    assert(state.written[0].type == FrameType::TEXT);
    assert(state.written[1].type == FrameType::TEXT);
    assert(state.Request(0)["command"] == "login");
    assert(state.Request(0)["protocolVersion"] == PROTOCOL_VERSION);

    auto credentials = state.Request(1);
    assert(credentials["username"] == "sys");
    assert(credentials["password"] != "exasol");
    assert(key.Decrypt(credentials["password"].get<std::string>()) == "exasol");
    assert(credentials["clientName"] == "unit-test");
    assert(credentials["useCompression"] == false);
    assert(credentials["attributes"]["autocommit"] == false);
    assert(credentials["attributes"]["currentSchema"] == "RETAIL");
    assert(credentials["attributes"]["queryTimeout"] == 60);

    std::cout << "    PASSED" << std::endl;
}

void TestLoginWithCompression() {
    std::cout << "  Testing compression switched on after login..." << std::endl;

    TestKeyPair key;
    MockServer server;
    server.key = &key;
    server.handler = [](const json& request) {
        assert(request["command"] == "execute");
        return OkResponse(RowCountResults(1));
    };
    MockNetwork network;
    network.state->responder = server.Responder();

    auto config = MakeConfig("exasol1");
    config.compression = true;

    Connector connector(config, network.Factory());
    auto session = connector.Connect();
    assert(session->IsCompressionEnabled());

    auto& state = *network.state;
    assert(state.Request(1)["useCompression"] == true);

    // Following commands travel deflated
    SqlQueriesResponse response;
    session->Send(ExecuteCommand{"INSERT INTO t VALUES 1", Attributes()}, &response);
    assert(response.num_results == 1);
    assert(state.written.size() == 3);
    assert(state.written[0].type == FrameType::TEXT);
    assert(state.written[1].type == FrameType::TEXT);
    assert(state.written[2].type == FrameType::BINARY);

    std::cout << "    PASSED" << std::endl;
}

void TestTokenLogin() {
    std::cout << "  Testing token login..." << std::endl;

    TestKeyPair key;
    MockServer server;
    server.key = &key;
    MockNetwork network;
    network.state->responder = server.Responder();

    ConnectionConfig config;
    config.host = "exasol1";
    config.access_token = "access";

    Connector connector(config, network.Factory());
    auto session = connector.Connect();
    assert(!session->IsClosed());

    auto& state = *network.state;
    assert(state.Request(0)["command"] == "loginToken");
    assert(state.Request(1)["accessToken"] == "access");
    assert(!state.Request(1).contains("password"));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Failover
//===----------------------------------------------------------------------===//

void TestFailoverToNextHost() {
    std::cout << "  Testing failover to the next host..." << std::endl;

    TestKeyPair key;
    MockServer server;
    server.key = &key;
    MockNetwork network;
    network.state->responder = server.Responder();
    network.unreachable = {"exasol1", "exasol2"};

    Connector connector(MakeConfig("exasol1..4"), network.Factory());
    auto session = connector.Connect();

    // Sequential in resolver order, stops at the first success
    assert(session->GetHost() == "exasol3");
    assert(network.attempts.size() == 3);
    assert(network.attempts[0] == "exasol1");
    assert(network.attempts[1] == "exasol2");
    assert(network.attempts[2] == "exasol3");

    std::cout << "    PASSED" << std::endl;
}

void TestFailoverAfterSystemError() {
    std::cout << "  Testing failover after a system error..." << std::endl;

    TestKeyPair key;
    MockServer server;
    server.key = &key;
    MockNetwork network;
    network.state->responder = server.Responder();
    network.misconfigured = {"exasol1"};

    Connector connector(MakeConfig("exasol1,exasol2"), network.Factory());
    auto session = connector.Connect();
    assert(session->GetHost() == "exasol2");
    assert(network.attempts.size() == 2);

    // Reported with the other host failures when nothing else is left
    MockNetwork alone;
    alone.misconfigured = {"exasol1"};
    Connector single(MakeConfig("exasol1"), alone.Factory());
    bool thrown = false;
    try {
        single.Connect();
    } catch (const ConnectionError& e) {
        thrown = true;
        assert(e.Code() == error_code::CONNECTION_FAILED);
        assert(e.Message().find("'exasol1': TLS setup") != std::string::npos);
    }
    assert(thrown);

    std::cout << "    PASSED" << std::endl;
}

void TestAllHostsFail() {
    std::cout << "  Testing aggregate error when every host fails..." << std::endl;

    MockNetwork network;
    network.unreachable = {"exasol1", "exasol2"};

    Connector connector(MakeConfig("exasol1,exasol2"), network.Factory());
    bool thrown = false;
    try {
        connector.Connect();
    } catch (const ConnectionError& e) {
        thrown = true;
        assert(e.Code() == error_code::CONNECTION_FAILED);
        std::string message = e.Message();
        assert(message.find("'exasol1': connection refused") != std::string::npos);
        assert(message.find("'exasol2': connection refused") != std::string::npos);
    }
    assert(thrown);
    assert(network.attempts.size() == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestAuthenticationFailure() {
    std::cout << "  Testing rejected credentials..." << std::endl;

    TestKeyPair key;
    MockServer server;
    server.key = &key;
    server.password = "other";
    MockNetwork network;
    network.state->responder = server.Responder();

    Connector connector(MakeConfig("exasol1"), network.Factory());
    bool thrown = false;
    try {
        connector.Connect();
    } catch (const ConnectionError& e) {
        thrown = true;
        assert(e.Code() == error_code::CONNECTION_FAILED);
        assert(e.Message().find("authentication failed") != std::string::npos);
        assert(e.Message().find(error_code::LOGIN_FAILED) != std::string::npos);
    }
    assert(thrown);

    std::cout << "    PASSED" << std::endl;
}

void TestInvalidHostRange() {
    std::cout << "  Testing invalid host range..." << std::endl;

    MockNetwork network;
    Connector connector(MakeConfig("exasol3..1"), network.Factory());
    bool thrown = false;
    try {
        connector.Connect();
    } catch (const InvalidArgumentError& e) {
        thrown = true;
        assert(e.Code() == error_code::INVALID_HOST_RANGE);
    }
    assert(thrown);
    // Nothing attempted
    assert(network.attempts.empty());

    std::cout << "    PASSED" << std::endl;
}

void TestShuffleHosts() {
    std::cout << "  Testing shuffled host order..." << std::endl;

    MockNetwork network;
    network.unreachable = {"exasol1", "exasol2", "exasol3", "exasol4", "exasol5"};

    auto config = MakeConfig("exasol1..5");
    config.shuffle_hosts = true;
    Connector connector(config, network.Factory());
    bool thrown = false;
    try {
        connector.Connect();
    } catch (const ConnectionError&) {
        thrown = true;
    }
    assert(thrown);

    // Every host tried exactly once
    assert(network.attempts.size() == 5);
    std::set<std::string> unique(network.attempts.begin(), network.attempts.end());
    assert(unique.size() == 5);

    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== Connector Unit Tests ===" << std::endl;

    std::cout << "\n1. Login:" << std::endl;
    TestLogin();
    TestLoginWithCompression();
    TestTokenLogin();

    std::cout << "\n2. Failover:" << std::endl;
    TestFailoverToNextHost();
    TestFailoverAfterSystemError();
    TestAllHostsFail();
    TestAuthenticationFailure();
    TestInvalidHostRange();
    TestShuffleHosts();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
