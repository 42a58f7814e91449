//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// config/connection_config.cpp
//
// Settings table shared by DSN, INI and YAML sources
//===----------------------------------------------------------------------===//

#include "config/connection_config.hpp"
#include "config/config_file.hpp"
#include "config/yaml_config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace exaconn {

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

bool ParseBool(const std::string& value, bool& out) {
    std::string lower = Lower(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

template <typename T>
bool ParseUnsigned(const std::string& value, T& out) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        auto parsed = std::stoull(value);
        if (parsed > std::numeric_limits<T>::max()) {
            return false;
        }
        out = static_cast<T>(parsed);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

using Setter = bool (*)(ConnectionConfig&, const std::string&);

// One configurable field. 'dsn' is empty for settings a DSN can not carry.
struct Setting {
    const char* file;
    const char* dsn;
    Setter apply;
};

#define EXACONN_STRING(field) \
    [](ConnectionConfig& c, const std::string& v) { c.field = v; return true; }
#define EXACONN_BOOL(field) \
    [](ConnectionConfig& c, const std::string& v) { return ParseBool(v, c.field); }
#define EXACONN_UNSIGNED(field) \
    [](ConnectionConfig& c, const std::string& v) { return ParseUnsigned(v, c.field); }

const Setting SETTINGS[] = {
    {"connection.host",                 "",                          EXACONN_STRING(host)},
    {"connection.port",                 "",                          EXACONN_UNSIGNED(port)},
    {"connection.shuffle_hosts",        "",                          EXACONN_BOOL(shuffle_hosts)},
    {"connection.timeout_ms",           "",                          EXACONN_UNSIGNED(connect_timeout_ms)},
    {"auth.user",                       "user",                      EXACONN_STRING(user)},
    {"auth.password",                   "password",                  EXACONN_STRING(password)},
    {"auth.access_token",               "accesstoken",               EXACONN_STRING(access_token)},
    {"auth.refresh_token",              "refreshtoken",              EXACONN_STRING(refresh_token)},
    {"tls.enabled",                     "encryption",                EXACONN_BOOL(encryption)},
    {"tls.validate_server_certificate", "validateservercertificate", EXACONN_BOOL(validate_server_certificate)},
    {"tls.certificate_fingerprint",     "certificatefingerprint",    EXACONN_STRING(certificate_fingerprint)},
    {"session.schema",                  "schema",                    EXACONN_STRING(schema)},
    {"session.autocommit",              "autocommit",                EXACONN_BOOL(autocommit)},
    {"session.query_timeout",           "querytimeout",              EXACONN_UNSIGNED(query_timeout_seconds)},
    {"session.compression",             "compression",               EXACONN_BOOL(compression)},
    {"session.fetch_size",              "fetchsize",                 EXACONN_UNSIGNED(fetch_size_kb)},
    {"session.result_set_max_rows",     "resultsetmaxrows",          EXACONN_UNSIGNED(result_set_max_rows)},
    {"client.name",                     "clientname",                EXACONN_STRING(client_name)},
    {"client.version",                  "clientversion",             EXACONN_STRING(client_version)},
    {"client.import_host",              "",                          EXACONN_STRING(import_host)},
    {"logging.file",                    "",                          EXACONN_STRING(log_file)},
    {"logging.level",                   "",                          EXACONN_STRING(log_level)},
};

#undef EXACONN_STRING
#undef EXACONN_BOOL
#undef EXACONN_UNSIGNED

const Setting* FindByFileKey(const std::string& key) {
    for (const auto& setting : SETTINGS) {
        if (key == setting.file) {
            return &setting;
        }
    }
    return nullptr;
}

const Setting* FindByDsnKey(const std::string& key) {
    for (const auto& setting : SETTINGS) {
        if (setting.dsn[0] != '\0' && key == setting.dsn) {
            return &setting;
        }
    }
    return nullptr;
}

} // namespace

//===----------------------------------------------------------------------===//
// Connection files
//===----------------------------------------------------------------------===//

bool ConnectionConfig::LoadFromFile(const std::string& path, std::string& error) {
    std::string ext;
    auto dot_pos = path.rfind('.');
    if (dot_pos != std::string::npos) {
        ext = Lower(path.substr(dot_pos));
    }

    if (ext == ".yaml" || ext == ".yml") {
        return LoadFromYaml(path, error);
    }
    return LoadFromIni(path, error);
}

bool ConnectionConfig::LoadFromIni(const std::string& path, std::string& error) {
    ConfigFile file;
    if (!file.Load(path)) {
        error = file.GetError();
        return false;
    }
    return ApplySettings(file.Values(), error);
}

bool ConnectionConfig::LoadFromYaml(const std::string& path, std::string& error) {
    YamlConfig file;
    if (!file.Load(path)) {
        error = file.GetError();
        return false;
    }
    return ApplySettings(file.Values(), error);
}

bool ConnectionConfig::ApplySettings(const std::map<std::string, std::string>& settings,
                                     std::string& error) {
    for (const auto& entry : settings) {
        const Setting* setting = FindByFileKey(entry.first);
        if (!setting) {
            error = "unknown setting '" + entry.first + "'";
            return false;
        }
        if (!setting->apply(*this, entry.second)) {
            error = "invalid value '" + entry.second + "' for setting '" + entry.first + "'";
            return false;
        }
    }
    return true;
}

//===----------------------------------------------------------------------===//
// DSN
//===----------------------------------------------------------------------===//

std::vector<std::string> SplitDsnProperties(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size() && text[i + 1] == ';') {
            current += ';';
            ++i;
        } else if (c == ';') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

bool ConnectionConfig::ParseDsn(const std::string& dsn, std::string& error) {
    if (dsn.rfind("exa:", 0) != 0) {
        error = "invalid connection string, must start with 'exa:': '" + dsn + "'";
        return false;
    }

    auto parts = SplitDsnProperties(dsn.substr(4));
    const std::string& endpoint = parts.front();

    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        error = "invalid connection string, must contain host and port: '" + dsn + "'";
        return false;
    }

    std::string hosts = endpoint.substr(0, colon);
    uint16_t parsed_port = 0;
    if (!ParseUnsigned(endpoint.substr(colon + 1), parsed_port) || parsed_port == 0) {
        error = "invalid port '" + endpoint.substr(colon + 1) + "'";
        return false;
    }

    // "<hosts>/<fingerprint>"
    auto slash = hosts.find('/');
    if (slash != std::string::npos) {
        certificate_fingerprint = hosts.substr(slash + 1);
        hosts = hosts.substr(0, slash);
    }
    host = hosts;
    port = parsed_port;

    for (size_t i = 1; i < parts.size(); ++i) {
        const std::string& property = parts[i];
        if (property.empty()) {
            continue;
        }
        auto eq = property.find('=');
        if (eq == std::string::npos) {
            error = "invalid parameter '" + property + "', expected key=value";
            return false;
        }
        std::string key = Lower(property.substr(0, eq));
        std::string value = property.substr(eq + 1);

        const Setting* setting = FindByDsnKey(key);
        if (!setting) {
            error = "unknown DSN parameter '" + key + "'";
            return false;
        }
        if (!setting->apply(*this, value)) {
            error = "invalid value '" + value + "' for parameter '" + key + "'";
            return false;
        }
    }

    return true;
}

ConnectionConfig ConfigFromDsn(const std::string& dsn) {
    ConnectionConfig config;
    std::string error;
    if (!config.ParseDsn(dsn, error) || !config.Validate(error)) {
        throw InvalidArgumentError(error_code::INVALID_CONFIG, error);
    }
    return config;
}

} // namespace exaconn
