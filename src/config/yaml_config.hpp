//===----------------------------------------------------------------------===//
//                         SQLGate
//
// config/yaml_config.hpp
//
// YAML configuration file reader with dotted key paths
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace sqlgate {

class YamlConfig {
public:
    bool Load(const std::string& path) {
        try {
            root_ = YAML::LoadFile(path);
            return true;
        } catch (const YAML::BadFile& e) {
            error_ = "Cannot open config file: " + path;
            return false;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
    }

    template<typename T>
    T Get(const std::string& path, const T& default_val) const {
        try {
            YAML::Node node = GetNode(path);
            if (node && !node.IsNull()) {
                return node.as<T>();
            }
        } catch (const YAML::Exception&) {
            // Wrong type for this key, fall through to default
        }
        return default_val;
    }

    std::string GetString(const std::string& path, const std::string& default_val = "") const {
        return Get<std::string>(path, default_val);
    }

    int64_t GetInt(const std::string& path, int64_t default_val = 0) const {
        return Get<int64_t>(path, default_val);
    }

    bool GetBool(const std::string& path, bool default_val = false) const {
        return Get<bool>(path, default_val);
    }

    // Sequence of scalars; a single scalar is returned as a one-element list
    std::vector<std::string> GetList(const std::string& path) const {
        std::vector<std::string> items;
        YAML::Node node = GetNode(path);
        if (!node || node.IsNull()) {
            return items;
        }
        try {
            if (node.IsSequence()) {
                for (const auto& item : node) {
                    items.push_back(item.as<std::string>());
                }
            } else if (node.IsScalar()) {
                items.push_back(node.as<std::string>());
            }
        } catch (const YAML::Exception&) {
            items.clear();
        }
        return items;
    }

    bool Has(const std::string& path) const {
        YAML::Node node = GetNode(path);
        return node && !node.IsNull();
    }

    // Raw node access for structured sections
    YAML::Node Node(const std::string& path) const { return GetNode(path); }

    const std::string& GetError() const { return error_; }

private:
    // Get node by dot-separated path (e.g., "limits.query_timeout_ms")
    YAML::Node GetNode(const std::string& path) const {
        YAML::Node current = YAML::Clone(root_);

        size_t start = 0;
        size_t end;

        while ((end = path.find('.', start)) != std::string::npos) {
            std::string key = path.substr(start, end - start);
            if (!current.IsMap() || !current[key]) {
                return YAML::Node();
            }
            current = current[key];
            start = end + 1;
        }

        if (!current.IsMap()) {
            return YAML::Node();
        }
        return current[path.substr(start)];
    }

    YAML::Node root_;
    std::string error_;
};

} // namespace sqlgate
