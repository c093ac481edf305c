//===----------------------------------------------------------------------===//
//                         DBDriver
//
// config/settings_source.hpp
//
// Keyed view over a configuration file
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

namespace dbdriver {

// Keys are dotted paths ("pool.min"). Getters throw std::invalid_argument
// naming the key when the stored value has the wrong type.
class SettingsSource {
public:
    virtual ~SettingsSource() = default;

    virtual bool Has(const std::string& key) const = 0;
    virtual std::string GetString(const std::string& key) const = 0;
    virtual int64_t GetInt(const std::string& key) const = 0;

    const std::string& GetError() const { return error_; }

protected:
    std::string error_;
};

//===----------------------------------------------------------------------===//
// IniSettings
//
// "key = value" lines, '#' or ';' comments. A "[section]" header prefixes
// the keys below it, so "[pool]" + "min = 1" is stored as "pool.min".
//===----------------------------------------------------------------------===//
class IniSettings : public SettingsSource {
public:
    bool Load(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            error_ = "Cannot open config file: " + path;
            return false;
        }

        std::string section;
        std::string line;
        for (int line_no = 1; std::getline(in, line); line_no++) {
            line = Trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line.front() == '[') {
                if (line.back() != ']' || line.size() < 3) {
                    error_ = path + ":" + std::to_string(line_no) + ": malformed section header";
                    return false;
                }
                section = Trim(line.substr(1, line.size() - 2));
                continue;
            }

            auto eq = line.find('=');
            if (eq == std::string::npos || eq == 0) {
                error_ = path + ":" + std::to_string(line_no) + ": expected key = value";
                return false;
            }

            std::string key = Trim(line.substr(0, eq));
            std::string value = Unquote(Trim(line.substr(eq + 1)));
            values_[section.empty() ? key : section + "." + key] = value;
        }
        return true;
    }

    bool Has(const std::string& key) const override {
        return values_.count(key) != 0;
    }

    std::string GetString(const std::string& key) const override {
        auto it = values_.find(key);
        return it == values_.end() ? std::string() : it->second;
    }

    int64_t GetInt(const std::string& key) const override {
        const std::string text = GetString(key);
        size_t used = 0;
        int64_t value = 0;
        try {
            value = std::stoll(text, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != text.size()) {
            throw std::invalid_argument("'" + key + "' is not an integer: " + text);
        }
        return value;
    }

private:
    static std::string Trim(const std::string& text) {
        auto first = text.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            return "";
        }
        auto last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }

    static std::string Unquote(const std::string& text) {
        if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') &&
            text.back() == text.front()) {
            return text.substr(1, text.size() - 2);
        }
        return text;
    }

    std::map<std::string, std::string> values_;
};

} // namespace dbdriver
