//===----------------------------------------------------------------------===//
//                         DBDriver
//
// save/content_validator.cpp
//
// Content validator implementations
//===----------------------------------------------------------------------===//

#include "save/content_validator.hpp"
#include <cstdint>
#include <yaml-cpp/yaml.h>

namespace dbdriver {

bool Utf8TextValidator::Validate(const std::string& content, std::string& error) const {
    const auto* p = reinterpret_cast<const uint8_t*>(content.data());
    size_t n = content.size();
    size_t i = 0;

    while (i < n) {
        uint8_t c = p[i];
        if (c == 0) {
            error = "NUL byte at offset " + std::to_string(i);
            return false;
        }

        size_t extra;
        uint32_t min_code;
        uint32_t code;
        if (c < 0x80) {
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1; min_code = 0x80; code = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2; min_code = 0x800; code = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3; min_code = 0x10000; code = c & 0x07;
        } else {
            error = "invalid UTF-8 lead byte at offset " + std::to_string(i);
            return false;
        }

        if (i + extra >= n) {
            error = "truncated UTF-8 sequence at offset " + std::to_string(i);
            return false;
        }
        for (size_t k = 1; k <= extra; k++) {
            uint8_t cc = p[i + k];
            if ((cc & 0xC0) != 0x80) {
                error = "invalid UTF-8 continuation byte at offset " + std::to_string(i + k);
                return false;
            }
            code = (code << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if (code < min_code || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            error = "invalid UTF-8 code point at offset " + std::to_string(i);
            return false;
        }
        i += extra + 1;
    }
    return true;
}

bool YamlValidator::Validate(const std::string& content, std::string& error) const {
    Utf8TextValidator text;
    if (!text.Validate(content, error)) {
        return false;
    }
    try {
        YAML::LoadAll(content);
    } catch (const YAML::Exception& e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    }
    return true;
}

} // namespace dbdriver
