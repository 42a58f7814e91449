//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// import/import_server.hpp
//
// Transient HTTP listener serving local files to the database server
//===----------------------------------------------------------------------===//

#pragma once

#include <asio.hpp>
#include <atomic>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace exaconn {

// Serves the concatenation of the given files as GET /data.csv (and GET /)
// on its own io_context thread. A row separator is inserted after every
// file but the last one that does not already end with it. Stopped on
// destruction.
class ImportServer {
public:
    // Listens on every local address of the family of 'advertised_host'
    // (IPv6 for an IPv6 literal, IPv4 otherwise). Throws
    // InvalidArgumentError when a file is missing and ConnectionError when
    // the listener can not be bound.
    ImportServer(std::vector<std::string> paths, std::string row_separator,
                 const std::string& advertised_host = "", uint16_t port = 0);
    ~ImportServer();

    // Non-copyable
    ImportServer(const ImportServer&) = delete;
    ImportServer& operator=(const ImportServer&) = delete;

    void Start();
    void Stop();

    // Bound port, the ephemeral one when constructed with 0
    uint16_t Port() const { return port_; }
    bool IsIpv6() const { return ipv6_; }

    uint64_t GetContentLength() const { return content_length_; }
    uint64_t GetRequestCount() const { return requests_served_; }

private:
    struct Transfer;

    void DoAccept();
    void HandleConnection(asio::ip::tcp::socket socket);
    void HandleRequest(std::shared_ptr<Transfer> transfer);
    void SendBody(std::shared_ptr<Transfer> transfer);
    void Finish(std::shared_ptr<Transfer> transfer, const std::string& response);

    // Fill 'out' with the next body bytes, 0 at the end
    size_t ReadBody(Transfer& transfer, char* out, size_t max);

    std::string BuildHeader(int status_code, const std::string& status_text,
                            const std::string& content_type, uint64_t content_length);
    std::string BuildResponse(int status_code, const std::string& status_text,
                              const std::string& body);

private:
    std::vector<std::string> paths_;
    std::string row_separator_;
    std::vector<bool> append_separator_;
    uint64_t content_length_ = 0;

    uint16_t port_ = 0;
    bool ipv6_ = false;
    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> requests_served_{0};
};

} // namespace exaconn
