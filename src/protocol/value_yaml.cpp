//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/value_yaml.cpp
//
// Value <-> YAML conversion
//===----------------------------------------------------------------------===//

#include "protocol/value_yaml.hpp"
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace dbdriver {

namespace {

Value ScalarFromYaml(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    if (tag == "!") {
        // Quoted scalar
        return Value(node.Scalar());
    }
    if (tag == "tag:yaml.org,2002:binary" || tag == "!!binary") {
        YAML::Binary binary = node.as<YAML::Binary>();
        return Value(Blob(binary.data(), binary.size()));
    }
    if (tag == "tag:yaml.org,2002:str" || tag == "!!str") {
        return Value(node.Scalar());
    }

    bool b;
    if (YAML::convert<bool>::decode(node, b)) {
        return Value(b);
    }
    int64_t i;
    if (YAML::convert<int64_t>::decode(node, i)) {
        return Value(i);
    }
    double d;
    if (YAML::convert<double>::decode(node, d)) {
        return Value(d);
    }
    return Value(node.Scalar());
}

} // namespace

Value ValueFromYaml(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return Value();
    }
    if (node.IsScalar()) {
        return ScalarFromYaml(node);
    }
    if (node.IsSequence()) {
        ValueList list;
        list.reserve(node.size());
        for (const auto& item : node) {
            list.push_back(ValueFromYaml(item));
        }
        return Value(std::move(list));
    }
    if (node.IsMap()) {
        ValueMap map;
        for (const auto& item : node) {
            map[item.first.as<std::string>()] = ValueFromYaml(item.second);
        }
        return Value(std::move(map));
    }
    return Value();
}

YAML::Node ValueToYaml(const Value& value) {
    switch (value.GetType()) {
        case Value::Type::NULL_VALUE:
            return YAML::Node(YAML::NodeType::Null);
        case Value::Type::BOOLEAN:
            return YAML::Node(value.GetBool());
        case Value::Type::INTEGER:
            return YAML::Node(value.GetInt());
        case Value::Type::DOUBLE:
            return YAML::Node(value.GetDouble());
        case Value::Type::STRING:
            return YAML::Node(value.GetString());
        case Value::Type::BLOB: {
            const auto& bytes = value.GetBlob().bytes;
            return YAML::Node(YAML::Binary(bytes.data(), bytes.size()));
        }
        case Value::Type::TIMESTAMP:
            return YAML::Node(FormatTimestamp(value.GetTimestamp()));
        case Value::Type::LIST: {
            YAML::Node node(YAML::NodeType::Sequence);
            for (const auto& item : value.GetList()) {
                node.push_back(ValueToYaml(item));
            }
            return node;
        }
        case Value::Type::MAP: {
            YAML::Node node(YAML::NodeType::Map);
            for (const auto& entry : value.GetMap()) {
                node[entry.first] = ValueToYaml(entry.second);
            }
            return node;
        }
    }
    return YAML::Node();
}

Value ParseYamlValue(const std::string& text) {
    try {
        return ValueFromYaml(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument("YAML parse error: " + std::string(e.what()));
    }
}

std::string FormatYamlValue(const Value& value) {
    YAML::Emitter out;
    out << ValueToYaml(value);
    return out.c_str();
}

std::string FormatTimestamp(const Timestamp& ts) {
    int64_t seconds = ts.micros / 1000000;
    int64_t micros = ts.micros % 1000000;
    if (micros < 0) {
        micros += 1000000;
        seconds -= 1;
    }

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char result[48];
    std::snprintf(result, sizeof(result), "%s.%06lldZ", date, static_cast<long long>(micros));
    return result;
}

} // namespace dbdriver
