//===----------------------------------------------------------------------===//
//                         DBDriver
//
// server/method_table.cpp
//
// Method dispatch and the driver catalogue
//===----------------------------------------------------------------------===//

#include "server/method_table.hpp"
#include "engine/driver_engine.hpp"
#include "logging/logger.hpp"
#include "protocol/errors.hpp"

namespace dbdriver {

void MethodTable::Register(const std::string& name, MethodHandler handler) {
    if (!handlers_.emplace(name, std::move(handler)).second) {
        throw std::logic_error("method registered twice: " + name);
    }
}

bool MethodTable::Contains(const std::string& name) const {
    return handlers_.count(name) != 0;
}

const MethodHandler& MethodTable::Find(const std::string& name) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        throw ProtocolError("unknown method: " + name, ErrorCode::UNKNOWN_METHOD);
    }
    return it->second;
}

Result MethodTable::Invoke(const Request& request) const {
    try {
        return Find(request.method)(request.params);
    } catch (const DriverError& e) {
        return Result::Error(e.GetCode(), e.what());
    } catch (const ProtocolError& e) {
        return Result::Error(e.GetCode(), e.what());
    } catch (const std::invalid_argument& e) {
        return Result::Error(ErrorCode::INVALID_PARAMETER, request.method + ": " + e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("methods", "Unclassified failure in " + request.method + ": " + e.what());
        return Result::Error(ErrorCode::INTERNAL_ERROR, request.method + ": " + e.what());
    }
}

std::vector<std::string> MethodTable::Names() const {
    std::vector<std::string> names;
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    return names;
}

MethodTable MethodTable::ForEngine(DriverEngine& engine) {
    MethodTable table;
    DriverEngine* e = &engine;

    auto data = [](Value value) { return Result::Success(std::move(value)); };
    auto rows = [](ValueList records) { return Result::Rows(std::move(records)); };

    table.Register("create_table", [e, data](const Value& p) { return data(e->CreateTable(p)); });
    table.Register("drop_table", [e, data](const Value& p) { return data(e->DropTable(p)); });
    table.Register("alter_table", [e, data](const Value& p) { return data(e->AlterTable(p)); });
    table.Register("insert", [e, data](const Value& p) { return data(e->Insert(p)); });
    table.Register("update", [e, data](const Value& p) { return data(e->Update(p)); });
    table.Register("delete", [e, data](const Value& p) { return data(e->Delete(p)); });
    table.Register("select", [e, rows](const Value& p) { return rows(e->Select(p)); });
    table.Register("execute", [e](const Value& p) { return e->Execute(p); });

    table.Register("begin_transaction",
                   [e, data](const Value& p) { return data(e->BeginTransaction(p)); });
    table.Register("commit_transaction",
                   [e, data](const Value& p) { return data(e->CommitTransaction(p)); });
    table.Register("rollback_transaction",
                   [e, data](const Value& p) { return data(e->RollbackTransaction(p)); });

    table.Register("get_table_info", [e, rows](const Value& p) { return rows(e->GetTableInfo(p)); });
    table.Register("get_schema_version",
                   [e, data](const Value& p) { return data(e->GetSchemaVersion(p)); });
    table.Register("sync_schema", [e, data](const Value& p) { return data(e->SyncSchema(p)); });

    table.Register("query_ast", [e](const Value& p) { return e->QueryTree(TreeKind::AST, p); });
    table.Register("query_cst", [e](const Value& p) { return e->QueryTree(TreeKind::CST, p); });
    table.Register("modify_ast", [e](const Value& p) { return e->ModifyTree(TreeKind::AST, p); });
    table.Register("modify_cst", [e](const Value& p) { return e->ModifyTree(TreeKind::CST, p); });

    return table;
}

} // namespace dbdriver
