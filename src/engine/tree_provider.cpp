//===----------------------------------------------------------------------===//
//                         DBDriver
//
// engine/tree_provider.cpp
//
// Tree method enum helpers
//===----------------------------------------------------------------------===//

#include "engine/tree_provider.hpp"

namespace dbdriver {

const char* TreeKindToString(TreeKind kind) {
    switch (kind) {
        case TreeKind::AST: return "ast";
        case TreeKind::CST: return "cst";
        default: return "unknown";
    }
}

const char* TreeActionToString(TreeAction action) {
    switch (action) {
        case TreeAction::REPLACE: return "replace";
        case TreeAction::DELETE: return "delete";
        case TreeAction::INSERT: return "insert";
        default: return "unknown";
    }
}

bool ParseTreeAction(const std::string& name, TreeAction& out) {
    if (name == "replace") {
        out = TreeAction::REPLACE;
    } else if (name == "delete") {
        out = TreeAction::DELETE;
    } else if (name == "insert") {
        out = TreeAction::INSERT;
    } else {
        return false;
    }
    return true;
}

} // namespace dbdriver
