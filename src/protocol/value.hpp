//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/value.hpp
//
// Dynamically typed value carried in params, results and row records
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace dbdriver {

struct Blob {
    std::vector<uint8_t> bytes;

    Blob() = default;
    explicit Blob(std::vector<uint8_t> data) : bytes(std::move(data)) {}
    Blob(const uint8_t* data, size_t size) : bytes(data, data + size) {}

    bool operator==(const Blob& other) const { return bytes == other.bytes; }
    bool operator!=(const Blob& other) const { return bytes != other.bytes; }
};

// Microseconds since the Unix epoch, UTC
struct Timestamp {
    int64_t micros = 0;

    Timestamp() = default;
    explicit Timestamp(int64_t us) : micros(us) {}

    static Timestamp Now();

    bool operator==(const Timestamp& other) const { return micros == other.micros; }
    bool operator!=(const Timestamp& other) const { return micros != other.micros; }
};

class Value;
using ValueList = std::vector<Value>;
using ValueMap = std::map<std::string, Value>;

class Value {
public:
    enum class Type : uint8_t {
        NULL_VALUE = 0,
        BOOLEAN = 1,
        INTEGER = 2,
        DOUBLE = 3,
        STRING = 4,
        BLOB = 5,
        TIMESTAMP = 6,
        LIST = 7,
        MAP = 8
    };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : data_(v) {}
    Value(int v) : data_(static_cast<int64_t>(v)) {}
    Value(int64_t v) : data_(v) {}
    Value(uint32_t v) : data_(static_cast<int64_t>(v)) {}
    Value(uint64_t v) : data_(static_cast<int64_t>(v)) {}
    Value(double v) : data_(v) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(Blob v) : data_(std::move(v)) {}
    Value(Timestamp v) : data_(v) {}
    Value(ValueList v) : data_(std::move(v)) {}
    Value(ValueMap v) : data_(std::move(v)) {}

    Type GetType() const { return static_cast<Type>(data_.index()); }
    static const char* TypeName(Type type);

    bool IsNull() const { return GetType() == Type::NULL_VALUE; }
    bool IsBool() const { return GetType() == Type::BOOLEAN; }
    bool IsInt() const { return GetType() == Type::INTEGER; }
    bool IsDouble() const { return GetType() == Type::DOUBLE; }
    bool IsNumber() const { return IsInt() || IsDouble(); }
    bool IsString() const { return GetType() == Type::STRING; }
    bool IsBlob() const { return GetType() == Type::BLOB; }
    bool IsTimestamp() const { return GetType() == Type::TIMESTAMP; }
    bool IsList() const { return GetType() == Type::LIST; }
    bool IsMap() const { return GetType() == Type::MAP; }

    // Typed accessors throw std::invalid_argument on a type mismatch
    bool GetBool() const;
    int64_t GetInt() const;
    double GetDouble() const;  // integers are widened
    const std::string& GetString() const;
    const Blob& GetBlob() const;
    Timestamp GetTimestamp() const;
    const ValueList& GetList() const;
    ValueList& GetList();
    const ValueMap& GetMap() const;
    ValueMap& GetMap();

    // Map helpers. The const lookup returns a shared null for missing keys.
    bool Has(const std::string& key) const;
    const Value* Find(const std::string& key) const;
    const Value& operator[](const std::string& key) const;
    Value& operator[](const std::string& key);  // converts null to an empty map

    // Lenient getters used by handlers for optional params
    std::string GetStringOr(const std::string& key, const std::string& fallback) const;
    int64_t GetIntOr(const std::string& key, int64_t fallback) const;
    bool GetBoolOr(const std::string& key, bool fallback) const;

    // JSON-like rendering for logs and the CLI
    std::string ToString() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, int64_t, double, std::string,
                 Blob, Timestamp, ValueList, ValueMap> data_;
};

} // namespace dbdriver
