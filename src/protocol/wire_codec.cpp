//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/wire_codec.cpp
//
// Value wire encoding implementation
//===----------------------------------------------------------------------===//

#include "protocol/wire_codec.hpp"
#include "protocol/errors.hpp"
#include <cstring>

namespace dbdriver {

//===----------------------------------------------------------------------===//
// ByteWriter
//===----------------------------------------------------------------------===//
void ByteWriter::WriteString(const std::string& s) {
    WriteUInt32(static_cast<uint32_t>(s.size()));
    buffer_.insert(buffer_.end(), s.begin(), s.end());
}

void ByteWriter::WriteValue(const Value& value) {
    switch (value.GetType()) {
        case Value::Type::NULL_VALUE:
            WriteUInt8(WireTag::NULL_VALUE);
            break;
        case Value::Type::BOOLEAN:
            WriteUInt8(value.GetBool() ? WireTag::BOOL_TRUE : WireTag::BOOL_FALSE);
            break;
        case Value::Type::INTEGER:
            WriteUInt8(WireTag::INTEGER);
            WriteUInt64(static_cast<uint64_t>(value.GetInt()));
            break;
        case Value::Type::DOUBLE: {
            double d = value.GetDouble();
            uint64_t bits;
            std::memcpy(&bits, &d, sizeof(bits));
            WriteUInt8(WireTag::DOUBLE);
            WriteUInt64(bits);
            break;
        }
        case Value::Type::STRING:
            WriteUInt8(WireTag::STRING);
            WriteString(value.GetString());
            break;
        case Value::Type::BLOB: {
            const auto& bytes = value.GetBlob().bytes;
            WriteUInt8(WireTag::BLOB);
            WriteUInt32(static_cast<uint32_t>(bytes.size()));
            WriteBytes(bytes.data(), bytes.size());
            break;
        }
        case Value::Type::TIMESTAMP:
            WriteUInt8(WireTag::TIMESTAMP);
            WriteUInt64(static_cast<uint64_t>(value.GetTimestamp().micros));
            break;
        case Value::Type::LIST: {
            const auto& list = value.GetList();
            WriteUInt8(WireTag::LIST);
            WriteUInt32(static_cast<uint32_t>(list.size()));
            for (const auto& item : list) {
                WriteValue(item);
            }
            break;
        }
        case Value::Type::MAP: {
            const auto& map = value.GetMap();
            WriteUInt8(WireTag::MAP);
            WriteUInt32(static_cast<uint32_t>(map.size()));
            for (const auto& entry : map) {
                WriteString(entry.first);
                WriteValue(entry.second);
            }
            break;
        }
    }
}

//===----------------------------------------------------------------------===//
// ByteReader
//===----------------------------------------------------------------------===//
void ByteReader::Require(size_t bytes, const char* what) const {
    if (bytes > size_ - offset_) {
        throw ProtocolError(std::string("payload truncated at ") + what);
    }
}

uint8_t ByteReader::ReadUInt8() {
    Require(1, "u8");
    return data_[offset_++];
}

uint32_t ByteReader::ReadUInt32() {
    Require(4, "u32");
    uint32_t v = static_cast<uint32_t>(data_[offset_]) |
                 (static_cast<uint32_t>(data_[offset_ + 1]) << 8) |
                 (static_cast<uint32_t>(data_[offset_ + 2]) << 16) |
                 (static_cast<uint32_t>(data_[offset_ + 3]) << 24);
    offset_ += 4;
    return v;
}

uint64_t ByteReader::ReadUInt64() {
    Require(8, "u64");
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(data_[offset_ + i]) << (i * 8);
    }
    offset_ += 8;
    return v;
}

std::string ByteReader::ReadString() {
    uint32_t len = ReadUInt32();
    Require(len, "string");
    std::string s(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return s;
}

std::vector<uint8_t> ByteReader::ReadBytes(size_t size) {
    Require(size, "bytes");
    std::vector<uint8_t> out(data_ + offset_, data_ + offset_ + size);
    offset_ += size;
    return out;
}

Value ByteReader::ReadValue(size_t depth) {
    if (depth > MAX_VALUE_DEPTH) {
        throw ProtocolError("value nesting exceeds " + std::to_string(MAX_VALUE_DEPTH));
    }

    uint8_t tag = ReadUInt8();
    switch (tag) {
        case WireTag::NULL_VALUE:
            return Value();
        case WireTag::BOOL_FALSE:
            return Value(false);
        case WireTag::BOOL_TRUE:
            return Value(true);
        case WireTag::INTEGER:
            return Value(static_cast<int64_t>(ReadUInt64()));
        case WireTag::DOUBLE: {
            uint64_t bits = ReadUInt64();
            double d;
            std::memcpy(&d, &bits, sizeof(d));
            return Value(d);
        }
        case WireTag::STRING:
            return Value(ReadString());
        case WireTag::BLOB: {
            uint32_t len = ReadUInt32();
            return Value(Blob(ReadBytes(len)));
        }
        case WireTag::TIMESTAMP:
            return Value(Timestamp(static_cast<int64_t>(ReadUInt64())));
        case WireTag::LIST: {
            uint32_t count = ReadUInt32();
            // Every element needs at least its tag byte
            Require(count, "list elements");
            ValueList list;
            list.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                list.push_back(ReadValue(depth + 1));
            }
            return Value(std::move(list));
        }
        case WireTag::MAP: {
            uint32_t count = ReadUInt32();
            Require(static_cast<size_t>(count) * 5, "map entries");
            ValueMap map;
            for (uint32_t i = 0; i < count; ++i) {
                std::string key = ReadString();
                map[key] = ReadValue(depth + 1);
            }
            return Value(std::move(map));
        }
        default:
            throw ProtocolError("unknown value tag " + std::to_string(tag));
    }
}

std::vector<uint8_t> EncodeValue(const Value& value) {
    ByteWriter writer;
    writer.WriteValue(value);
    return writer.TakeBuffer();
}

Value DecodeValue(const std::vector<uint8_t>& data) {
    ByteReader reader(data);
    Value value = reader.ReadValue();
    if (!reader.AtEnd()) {
        throw ProtocolError("trailing bytes after value (" +
                            std::to_string(reader.Remaining()) + ")");
    }
    return value;
}

} // namespace dbdriver
