//===----------------------------------------------------------------------===//
//                         DBDriver
//
// save/content_validator.hpp
//
// Structural checks on content before it replaces a file
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace dbdriver {

class ContentValidator {
public:
    virtual ~ContentValidator() = default;

    // False with a reason in error when the content is not acceptable
    virtual bool Validate(const std::string& content, std::string& error) const = 0;

    virtual const char* Name() const = 0;
};

// Well-formed UTF-8 without NUL bytes
class Utf8TextValidator : public ContentValidator {
public:
    bool Validate(const std::string& content, std::string& error) const override;
    const char* Name() const override { return "utf8"; }
};

// UTF-8 text that yaml-cpp parses
class YamlValidator : public ContentValidator {
public:
    bool Validate(const std::string& content, std::string& error) const override;
    const char* Name() const override { return "yaml"; }
};

} // namespace dbdriver
