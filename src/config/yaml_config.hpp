//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// config/yaml_config.hpp
//
// YAML connection file, flattened to the same dotted keys as the INI form
//===----------------------------------------------------------------------===//

#pragma once

#include <map>
#include <string>
#include <yaml-cpp/yaml.h>

namespace exaconn {

class YamlConfig {
public:
    bool Load(const std::string& path) {
        try {
            return Flatten(YAML::LoadFile(path), "");
        } catch (const YAML::BadFile&) {
            error_ = "Cannot open config file: " + path;
            return false;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
    }

    bool LoadString(const std::string& text) {
        try {
            return Flatten(YAML::Load(text), "");
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
    }

    // Dotted key -> scalar text
    const std::map<std::string, std::string>& Values() const { return values_; }

    const std::string& GetError() const { return error_; }

private:
    bool Flatten(const YAML::Node& node, const std::string& prefix) {
        switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return true;
        case YAML::NodeType::Scalar:
            if (prefix.empty()) {
                error_ = "YAML parse error: expected a mapping at the top level";
                return false;
            }
            values_[prefix] = node.Scalar();
            return true;
        case YAML::NodeType::Sequence:
            error_ = "YAML parse error: lists are not supported ('" + prefix + "')";
            return false;
        case YAML::NodeType::Map:
            for (const auto& entry : node) {
                std::string key = entry.first.as<std::string>();
                if (!Flatten(entry.second, prefix.empty() ? key : prefix + "." + key)) {
                    return false;
                }
            }
            return true;
        }
        return true;
    }

    std::map<std::string, std::string> values_;
    std::string error_;
};

} // namespace exaconn
