//===----------------------------------------------------------------------===//
//                         DBDriver
//
// utils/uuid.hpp
//
// Random (version 4) UUID strings
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace dbdriver {

// e.g. "3f2b8c1e-9a4d-4e6b-8f00-1c2d3e4f5a6b"
std::string GenerateUuid();

} // namespace dbdriver
