//===----------------------------------------------------------------------===//
//                         DBDriver
//
// utils/uuid.cpp
//
// UUID generation
//===----------------------------------------------------------------------===//

#include "utils/uuid.hpp"
#include <cstdio>
#include <random>

namespace dbdriver {

std::string GenerateUuid() {
    thread_local std::mt19937_64 rng(std::random_device{}());

    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

} // namespace dbdriver
