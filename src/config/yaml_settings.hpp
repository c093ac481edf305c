//===----------------------------------------------------------------------===//
//                         DBDriver
//
// config/yaml_settings.hpp
//
// YAML configuration documents
//===----------------------------------------------------------------------===//

#pragma once

#include "config/settings_source.hpp"
#include <vector>
#include <yaml-cpp/yaml.h>

namespace dbdriver {

// Dotted keys walk nested maps: "queue.max_size" reads queue: {max_size: ...}
class YamlSettings : public SettingsSource {
public:
    bool Load(const std::string& path) {
        try {
            root_ = YAML::LoadFile(path);
        } catch (const YAML::BadFile&) {
            error_ = "Cannot open config file: " + path;
            return false;
        } catch (const YAML::Exception& e) {
            error_ = path + ": YAML parse error: " + std::string(e.what());
            return false;
        }
        return CheckRoot();
    }

    bool LoadString(const std::string& text) {
        try {
            root_ = YAML::Load(text);
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
        return CheckRoot();
    }

    bool Has(const std::string& key) const override {
        YAML::Node node = Lookup(key);
        return node && !node.IsNull();
    }

    std::string GetString(const std::string& key) const override {
        YAML::Node node = Lookup(key);
        if (!node || node.IsNull()) {
            return "";
        }
        if (!node.IsScalar()) {
            throw std::invalid_argument("'" + key + "' must be a scalar");
        }
        return node.Scalar();
    }

    int64_t GetInt(const std::string& key) const override {
        YAML::Node node = Lookup(key);
        int64_t value = 0;
        if (!node || !node.IsScalar() || !YAML::convert<int64_t>::decode(node, value)) {
            throw std::invalid_argument("'" + key + "' is not an integer" +
                                        (node && node.IsScalar() ? ": " + node.Scalar() : ""));
        }
        return value;
    }

private:
    // An empty document is allowed; anything else must be a map
    bool CheckRoot() {
        if (root_.IsNull() || root_.IsMap()) {
            return true;
        }
        error_ = "Config document must be a mapping";
        return false;
    }

    YAML::Node Lookup(const std::string& key) const {
        std::vector<YAML::Node> path{root_};
        size_t start = 0;
        while (true) {
            const YAML::Node& current = path.back();
            if (!current.IsMap()) {
                return YAML::Node();
            }
            size_t dot = key.find('.', start);
            std::string part = key.substr(start, dot == std::string::npos ? std::string::npos
                                                                          : dot - start);
            YAML::Node next = current[part];
            if (!next) {
                return YAML::Node();
            }
            if (dot == std::string::npos) {
                return next;
            }
            path.push_back(next);
            start = dot + 1;
        }
    }

    YAML::Node root_;
};

} // namespace dbdriver
