//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// config/config_file.hpp
//
// INI connection file. "[section]" headers prefix the keys below them, so
// "port = 8563" under "[connection]" is read as "connection.port".
//===----------------------------------------------------------------------===//

#pragma once

#include <algorithm>
#include <fstream>
#include <map>
#include <string>

namespace exaconn {

class ConfigFile {
public:
    bool Load(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            error_ = "Cannot open config file: " + path;
            return false;
        }
        return Parse(file, path);
    }

    bool Parse(std::istream& in, const std::string& origin) {
        std::string section;
        std::string line;
        int line_num = 0;
        while (std::getline(in, line)) {
            line_num++;
            line = Trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() != ']' || line.size() < 3) {
                    error_ = origin + ":" + std::to_string(line_num) + ": malformed section header";
                    return false;
                }
                section = Lower(Trim(line.substr(1, line.size() - 2)));
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos || eq_pos == 0) {
                error_ = origin + ":" + std::to_string(line_num) + ": expected key = value";
                return false;
            }

            std::string key = Lower(Trim(line.substr(0, eq_pos)));
            std::string value = Unquote(Trim(line.substr(eq_pos + 1)));
            values_[section.empty() ? key : section + "." + key] = value;
        }
        return true;
    }

    // Dotted key -> raw value
    const std::map<std::string, std::string>& Values() const { return values_; }

    const std::string& GetError() const { return error_; }

private:
    static std::string Trim(const std::string& s) {
        auto b = s.find_first_not_of(" \t\r");
        if (b == std::string::npos) return "";
        auto e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    }

    static std::string Lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return s;
    }

    static std::string Unquote(const std::string& value) {
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }

    std::map<std::string, std::string> values_;
    std::string error_;
};

} // namespace exaconn
