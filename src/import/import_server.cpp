//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// import/import_server.cpp
//
// Transient HTTP listener serving local files to the database server
//===----------------------------------------------------------------------===//

#include "import/import_server.hpp"
#include "import/import_query.hpp"
#include "common.hpp"
#include <memory>
#include <thread>
#include <vector>
#include "errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <sstream>

namespace exaconn {

struct ImportServer::Transfer {
    explicit Transfer(asio::ip::tcp::socket s) : socket(std::move(s)) {}

    asio::ip::tcp::socket socket;
    asio::streambuf request;
    std::vector<char> buffer;

    // Body state
    size_t file_index = 0;
    std::ifstream file;
    std::string pending;  // separator bytes still to send
};

namespace {

// Size of a file and whether it ends with 'suffix'
uint64_t InspectFile(std::ifstream& file, const std::string& suffix, bool& ends_with_suffix) {
    file.seekg(0, std::ios::end);
    auto size = static_cast<uint64_t>(file.tellg());
    ends_with_suffix = false;
    if (size >= suffix.size() && !suffix.empty()) {
        std::string tail(suffix.size(), '\0');
        file.seekg(static_cast<std::streamoff>(size - suffix.size()));
        file.read(&tail[0], static_cast<std::streamsize>(tail.size()));
        ends_with_suffix = tail == suffix;
    }
    return size;
}

// Listen on the family the database will connect back with: IPv6 when
// the advertised host is an IPv6 literal, IPv4 otherwise
asio::ip::tcp ListenProtocolFor(const std::string& advertised_host) {
    asio::error_code ec;
    auto address = asio::ip::make_address(advertised_host, ec);
    if (!ec && address.is_v6()) {
        return asio::ip::tcp::v6();
    }
    return asio::ip::tcp::v4();
}

} // anonymous namespace

ImportServer::ImportServer(std::vector<std::string> paths, std::string row_separator,
                           const std::string& advertised_host, uint16_t port)
    : paths_(std::move(paths))
    , row_separator_(std::move(row_separator))
    , acceptor_(io_context_) {
    for (size_t i = 0; i < paths_.size(); i++) {
        auto file = OpenFile(paths_[i]);
        bool ends_with_separator = false;
        content_length_ += InspectFile(file, row_separator_, ends_with_separator);
        bool append = i + 1 < paths_.size() && !ends_with_separator;
        append_separator_.push_back(append);
        if (append) {
            content_length_ += row_separator_.size();
        }
    }

    try {
        asio::ip::tcp::endpoint endpoint(ListenProtocolFor(advertised_host), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();
        ipv6_ = endpoint.protocol() == asio::ip::tcp::v6();
    } catch (const asio::system_error& e) {
        throw ConnectionError(error_code::IMPORT_SERVER,
                              std::string("could not start import listener: ") + e.what());
    }
}

ImportServer::~ImportServer() {
    Stop();
}

void ImportServer::Start() {
    if (running_) return;
    running_ = true;

    DoAccept();

    thread_ = std::thread([this]() {
        io_context_.run();
    });

    ELOG_INFO("import", "Import listener started on port {} ({}) serving {} file(s), {} bytes",
              port_, ipv6_ ? "IPv6" : "IPv4", paths_.size(), content_length_);
}

void ImportServer::Stop() {
    if (!running_) return;
    running_ = false;

    asio::error_code ec;
    acceptor_.close(ec);
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    ELOG_INFO("import", "Import listener on port {} stopped after {} request(s)",
              port_, requests_served_.load());
}

void ImportServer::DoAccept() {
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket socket) {
        if (!ec && running_) {
            HandleConnection(std::move(socket));
        }
        if (running_ && acceptor_.is_open()) {
            DoAccept();
        }
    });
}

void ImportServer::HandleConnection(asio::ip::tcp::socket socket) {
    auto transfer = std::make_shared<Transfer>(std::move(socket));

    asio::async_read_until(transfer->socket, transfer->request, "\r\n\r\n",
        [this, transfer](std::error_code ec, size_t /*bytes_read*/) {
            if (ec) {
                LOG_DEBUG("import", "Failed to read request: " + ec.message());
                return;
            }
            HandleRequest(transfer);
        });
}

void ImportServer::HandleRequest(std::shared_ptr<Transfer> transfer) {
    // Parse request line
    std::istream stream(&transfer->request);
    std::string method, path, version;
    stream >> method >> path >> version;

    ELOG_DEBUG("import", "{} {}", method, path);

    if (method != "GET") {
        Finish(transfer, BuildResponse(405, "Method Not Allowed", "Method Not Allowed"));
        return;
    }
    if (path != "/" && path != std::string("/") + IMPORT_RESOURCE_NAME) {
        Finish(transfer, BuildResponse(404, "Not Found", "Not Found"));
        return;
    }

    requests_served_++;
    transfer->buffer.resize(DEFAULT_WRITE_BUFFER_SIZE);

    auto header = std::make_shared<std::string>(
        BuildHeader(200, "OK", "text/csv", content_length_));
    asio::async_write(transfer->socket, asio::buffer(*header),
        [this, transfer, header](std::error_code ec, size_t /*bytes_written*/) {
            if (ec) {
                LOG_WARN("import", "Failed to send response header: " + ec.message());
                return;
            }
            SendBody(transfer);
        });
}

void ImportServer::SendBody(std::shared_ptr<Transfer> transfer) {
    size_t size = 0;
    try {
        size = ReadBody(*transfer, transfer->buffer.data(), transfer->buffer.size());
    } catch (const Error& e) {
        LOG_ERROR("import", std::string("Aborting transfer: ") + e.what());
        asio::error_code ec;
        transfer->socket.close(ec);
        return;
    }

    if (size == 0) {
        asio::error_code ec;
        transfer->socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        transfer->socket.close(ec);
        return;
    }

    asio::async_write(transfer->socket, asio::buffer(transfer->buffer.data(), size),
        [this, transfer](std::error_code ec, size_t /*bytes_written*/) {
            if (ec) {
                LOG_WARN("import", "Failed to send data: " + ec.message());
                return;
            }
            SendBody(transfer);
        });
}

void ImportServer::Finish(std::shared_ptr<Transfer> transfer, const std::string& response) {
    auto resp = std::make_shared<std::string>(response);
    asio::async_write(transfer->socket, asio::buffer(*resp),
        [transfer, resp](std::error_code /*ec*/, size_t /*bytes_written*/) {
            asio::error_code shutdown_ec;
            transfer->socket.shutdown(asio::ip::tcp::socket::shutdown_both, shutdown_ec);
            transfer->socket.close(shutdown_ec);
        });
}

size_t ImportServer::ReadBody(Transfer& transfer, char* out, size_t max) {
    size_t written = 0;
    while (written < max) {
        if (!transfer.pending.empty()) {
            size_t n = std::min(max - written, transfer.pending.size());
            std::copy(transfer.pending.begin(), transfer.pending.begin() + n, out + written);
            transfer.pending.erase(0, n);
            written += n;
            continue;
        }

        if (!transfer.file.is_open()) {
            if (transfer.file_index >= paths_.size()) {
                break;
            }
            transfer.file = OpenFile(paths_[transfer.file_index]);
        }

        transfer.file.read(out + written, static_cast<std::streamsize>(max - written));
        written += static_cast<size_t>(transfer.file.gcount());
        if (transfer.file.eof()) {
            transfer.file.close();
            if (append_separator_[transfer.file_index]) {
                transfer.pending = row_separator_;
            }
            transfer.file_index++;
        } else if (transfer.file.fail()) {
            throw InvalidArgumentError(error_code::IMPORT_SERVER,
                                       "failed to read '" + paths_[transfer.file_index] + "'");
        }
    }
    return written;
}

std::string ImportServer::BuildHeader(int status_code, const std::string& status_text,
                                      const std::string& content_type, uint64_t content_length) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status_code << " " << status_text << "\r\n"
        << "Content-Type: " << content_type << "\r\n"
        << "Content-Length: " << content_length << "\r\n"
        << "Connection: close\r\n"
        << "\r\n";
    return oss.str();
}

std::string ImportServer::BuildResponse(int status_code, const std::string& status_text,
                                        const std::string& body) {
    return BuildHeader(status_code, status_text, "text/plain", body.size()) + body;
}

} // namespace exaconn
