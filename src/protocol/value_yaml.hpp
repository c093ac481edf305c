//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/value_yaml.hpp
//
// Conversion between Value and YAML documents
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/value.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace dbdriver {

// Plain scalars are typed as null, bool, integer, double or string in that
// order. Quoted scalars stay strings. !!binary becomes a Blob.
Value ValueFromYaml(const YAML::Node& node);

// Timestamps are written as ISO-8601 UTC strings, blobs as !!binary
YAML::Node ValueToYaml(const Value& value);

// Parse a YAML document. Throws std::invalid_argument on a syntax error.
Value ParseYamlValue(const std::string& text);

// Block-style YAML rendering
std::string FormatYamlValue(const Value& value);

// "2024-01-02T03:04:05.000006Z"
std::string FormatTimestamp(const Timestamp& ts);

} // namespace dbdriver
