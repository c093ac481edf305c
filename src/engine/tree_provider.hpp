//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/tree_provider.hpp
//
// Hook for syntax tree query and modify methods
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/rpc_types.hpp"
#include "protocol/value.hpp"
#include <string>

namespace dbdriver {

enum class TreeKind : uint8_t {
    AST = 0,
    CST = 1
};

enum class TreeAction : uint8_t {
    REPLACE = 0,
    DELETE = 1,
    INSERT = 2
};

const char* TreeKindToString(TreeKind kind);
const char* TreeActionToString(TreeAction action);
bool ParseTreeAction(const std::string& name, TreeAction& out);

struct TreeQuery {
    TreeKind kind = TreeKind::AST;
    Value file_id;
    ValueMap filter;
};

struct TreeModification {
    TreeKind kind = TreeKind::AST;
    Value file_id;
    ValueMap filter;
    TreeAction action = TreeAction::REPLACE;
    ValueList nodes;
};

// Implemented outside the driver. Must be thread-safe, workers call it concurrently.
class TreeProvider {
public:
    virtual ~TreeProvider() = default;

    virtual Result Query(const TreeQuery& query) = 0;
    virtual Result Modify(const TreeModification& modification) = 0;
};

} // namespace dbdriver
