//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// config/connection_config.hpp
//
// Connection configuration: DSN, INI/YAML files and command line
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <map>
#include <string>
#include <vector>
#include <iostream>
#include <cstdlib>

namespace exaconn {

struct ConnectionConfig {
    // Endpoint
    std::string host = "localhost";  // Host spec, may hold lists and ranges
    uint16_t port = DEFAULT_PORT;
    bool shuffle_hosts = false;

    // Credentials
    std::string user;
    std::string password;
    std::string access_token;
    std::string refresh_token;

    // Session attributes
    std::string schema;
    bool autocommit = true;
    uint32_t query_timeout_seconds = 0;  // 0 = no timeout

    // Transport
    bool encryption = true;
    bool validate_server_certificate = true;
    std::string certificate_fingerprint;  // SHA-256, hex
    bool compression = false;
    uint32_t connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS;

    // Results
    uint32_t fetch_size_kb = DEFAULT_FETCH_SIZE_KB;
    uint64_t result_set_max_rows = 0;  // 0 = unlimited

    // Client identification
    std::string client_name = "exaconn";
    std::string client_version = DRIVER_VERSION;

    // Local import
    std::string import_host;  // empty = local address of the WebSocket

    // Logging
    std::string log_file;
    std::string log_level = "warn";

    bool Validate(std::string& error) const {
        if (host.empty()) {
            error = "Host must not be empty";
            return false;
        }
        if (port == 0) {
            error = "Invalid port number";
            return false;
        }
        if (access_token.empty() && refresh_token.empty() && user.empty()) {
            error = "User, access token or refresh token is required";
            return false;
        }
        if (fetch_size_kb == 0) {
            error = "Fetch size must be greater than 0";
            return false;
        }
        return true;
    }

    // Load a connection file; YAML for .yaml/.yml, INI otherwise. Both
    // forms share the dotted keys of ApplySettings.
    bool LoadFromFile(const std::string& path, std::string& error);
    bool LoadFromIni(const std::string& path, std::string& error);
    bool LoadFromYaml(const std::string& path, std::string& error);

    // Apply "section.key" settings such as "session.fetch_size". Unknown
    // keys and unparsable values are rejected.
    bool ApplySettings(const std::map<std::string, std::string>& settings, std::string& error);

    // Parse "exa:<hosts>[/<fingerprint>]:<port>[;key=value]..."
    // A literal ';' inside a value is written as "\;".
    bool ParseDsn(const std::string& dsn, std::string& error);
};

// Split on ';' honoring "\;" escapes
std::vector<std::string> SplitDsnProperties(const std::string& text);

// Build a config from a DSN; throws InvalidArgumentError
ConnectionConfig ConfigFromDsn(const std::string& dsn);

inline void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [DSN]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>     Connection file (.yaml/.yml or INI)\n"
              << "  -h, --host <hosts>      Host list or range (default: localhost)\n"
              << "  -p, --port <port>       Port (default: 8563)\n"
              << "  -u, --user <name>       User name\n"
              << "  -P, --password <pwd>    Password\n"
              << "  -s, --schema <name>     Schema to open\n"
              << "  --no-encryption         Disable TLS\n"
              << "  --no-cert-check         Do not validate the server certificate\n"
              << "  --compression           Enable message compression\n"
              << "  --fetch-size <kb>       Fetch size in KiB (default: 2000)\n"
              << "  --max-rows <n>          Limit rows per result set\n"
              << "  --query-timeout <s>     Query timeout in seconds\n"
              << "  --log-file <path>       Log file path\n"
              << "  --log-level <level>     Log level (debug, info, warn, error)\n"
              << "  --version               Show version info\n"
              << "  --help                  Show this help\n";
}

inline ConnectionConfig ParseCommandLine(int argc, char* argv[], bool& show_version) {
    ConnectionConfig config;
    show_version = false;
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        std::string error;
        if (!config.LoadFromFile(config_file_path, error)) {
            std::cerr << "Error loading config file: " << error << std::endl;
            std::exit(1);
        }
    }

    // Second pass: command line overrides config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;  // Already processed
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if ((arg == "-u" || arg == "--user") && i + 1 < argc) {
            config.user = argv[++i];
        } else if ((arg == "-P" || arg == "--password") && i + 1 < argc) {
            config.password = argv[++i];
        } else if ((arg == "-s" || arg == "--schema") && i + 1 < argc) {
            config.schema = argv[++i];
        } else if (arg == "--no-encryption") {
            config.encryption = false;
        } else if (arg == "--no-cert-check") {
            config.validate_server_certificate = false;
        } else if (arg == "--compression") {
            config.compression = true;
        } else if (arg == "--fetch-size" && i + 1 < argc) {
            config.fetch_size_kb = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--max-rows" && i + 1 < argc) {
            config.result_set_max_rows = static_cast<uint64_t>(std::stoull(argv[++i]));
        } else if (arg == "--query-timeout" && i + 1 < argc) {
            config.query_timeout_seconds = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--log-file" && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg.rfind("exa:", 0) == 0) {
            std::string error;
            if (!config.ParseDsn(arg, error)) {
                std::cerr << "Invalid DSN: " << error << std::endl;
                std::exit(1);
            }
        }
    }

    return config;
}

} // namespace exaconn
