//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/value.cpp
//
// Value implementation
//===----------------------------------------------------------------------===//

#include "protocol/value.hpp"
#include <chrono>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace dbdriver {

Timestamp Timestamp::Now() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

namespace {

[[noreturn]] void ThrowTypeMismatch(Value::Type expected, Value::Type actual) {
    throw std::invalid_argument(std::string("expected ") + Value::TypeName(expected) +
                                ", got " + Value::TypeName(actual));
}

void AppendQuoted(std::ostringstream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\t': out << "\\t"; break;
            default:   out << c; break;
        }
    }
    out << '"';
}

void Render(std::ostringstream& out, const Value& value) {
    switch (value.GetType()) {
        case Value::Type::NULL_VALUE:
            out << "null";
            break;
        case Value::Type::BOOLEAN:
            out << (value.GetBool() ? "true" : "false");
            break;
        case Value::Type::INTEGER:
            out << value.GetInt();
            break;
        case Value::Type::DOUBLE: {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", value.GetDouble());
            out << buf;
            break;
        }
        case Value::Type::STRING:
            AppendQuoted(out, value.GetString());
            break;
        case Value::Type::BLOB:
            out << "<blob " << value.GetBlob().bytes.size() << " bytes>";
            break;
        case Value::Type::TIMESTAMP:
            out << "<timestamp " << value.GetTimestamp().micros << ">";
            break;
        case Value::Type::LIST: {
            out << '[';
            bool first = true;
            for (const auto& item : value.GetList()) {
                if (!first) out << ", ";
                first = false;
                Render(out, item);
            }
            out << ']';
            break;
        }
        case Value::Type::MAP: {
            out << '{';
            bool first = true;
            for (const auto& entry : value.GetMap()) {
                if (!first) out << ", ";
                first = false;
                AppendQuoted(out, entry.first);
                out << ": ";
                Render(out, entry.second);
            }
            out << '}';
            break;
        }
    }
}

} // anonymous namespace

const char* Value::TypeName(Type type) {
    switch (type) {
        case Type::NULL_VALUE: return "null";
        case Type::BOOLEAN:    return "boolean";
        case Type::INTEGER:    return "integer";
        case Type::DOUBLE:     return "double";
        case Type::STRING:     return "string";
        case Type::BLOB:       return "blob";
        case Type::TIMESTAMP:  return "timestamp";
        case Type::LIST:       return "list";
        case Type::MAP:        return "map";
        default:               return "unknown";
    }
}

bool Value::GetBool() const {
    if (!IsBool()) ThrowTypeMismatch(Type::BOOLEAN, GetType());
    return std::get<bool>(data_);
}

int64_t Value::GetInt() const {
    if (!IsInt()) ThrowTypeMismatch(Type::INTEGER, GetType());
    return std::get<int64_t>(data_);
}

double Value::GetDouble() const {
    if (IsInt()) return static_cast<double>(std::get<int64_t>(data_));
    if (!IsDouble()) ThrowTypeMismatch(Type::DOUBLE, GetType());
    return std::get<double>(data_);
}

const std::string& Value::GetString() const {
    if (!IsString()) ThrowTypeMismatch(Type::STRING, GetType());
    return std::get<std::string>(data_);
}

const Blob& Value::GetBlob() const {
    if (!IsBlob()) ThrowTypeMismatch(Type::BLOB, GetType());
    return std::get<Blob>(data_);
}

Timestamp Value::GetTimestamp() const {
    if (!IsTimestamp()) ThrowTypeMismatch(Type::TIMESTAMP, GetType());
    return std::get<Timestamp>(data_);
}

const ValueList& Value::GetList() const {
    if (!IsList()) ThrowTypeMismatch(Type::LIST, GetType());
    return std::get<ValueList>(data_);
}

ValueList& Value::GetList() {
    if (IsNull()) data_ = ValueList{};
    if (!IsList()) ThrowTypeMismatch(Type::LIST, GetType());
    return std::get<ValueList>(data_);
}

const ValueMap& Value::GetMap() const {
    if (!IsMap()) ThrowTypeMismatch(Type::MAP, GetType());
    return std::get<ValueMap>(data_);
}

ValueMap& Value::GetMap() {
    if (IsNull()) data_ = ValueMap{};
    if (!IsMap()) ThrowTypeMismatch(Type::MAP, GetType());
    return std::get<ValueMap>(data_);
}

bool Value::Has(const std::string& key) const {
    return Find(key) != nullptr;
}

const Value* Value::Find(const std::string& key) const {
    if (!IsMap()) {
        return nullptr;
    }
    const auto& map = std::get<ValueMap>(data_);
    auto it = map.find(key);
    return it == map.end() ? nullptr : &it->second;
}

const Value& Value::operator[](const std::string& key) const {
    static const Value null_value;
    const Value* found = Find(key);
    return found ? *found : null_value;
}

Value& Value::operator[](const std::string& key) {
    return GetMap()[key];
}

std::string Value::GetStringOr(const std::string& key, const std::string& fallback) const {
    const Value* found = Find(key);
    return (found && found->IsString()) ? found->GetString() : fallback;
}

int64_t Value::GetIntOr(const std::string& key, int64_t fallback) const {
    const Value* found = Find(key);
    return (found && found->IsInt()) ? found->GetInt() : fallback;
}

bool Value::GetBoolOr(const std::string& key, bool fallback) const {
    const Value* found = Find(key);
    return (found && found->IsBool()) ? found->GetBool() : fallback;
}

std::string Value::ToString() const {
    std::ostringstream out;
    Render(out, *this);
    return out.str();
}

bool Value::operator==(const Value& other) const {
    return data_ == other.data_;
}

} // namespace dbdriver
