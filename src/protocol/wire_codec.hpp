//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/wire_codec.hpp
//
// Tagged little-endian binary encoding of Value
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/value.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace dbdriver {

namespace WireTag {
    constexpr uint8_t NULL_VALUE = 0x00;
    constexpr uint8_t BOOL_FALSE = 0x01;
    constexpr uint8_t BOOL_TRUE  = 0x02;
    constexpr uint8_t INTEGER    = 0x03;  // 8 bytes, two's complement
    constexpr uint8_t DOUBLE     = 0x04;  // 8 bytes, IEEE-754 bit pattern
    constexpr uint8_t STRING     = 0x05;  // u32 length + UTF-8 bytes
    constexpr uint8_t BLOB       = 0x06;  // u32 length + bytes
    constexpr uint8_t TIMESTAMP  = 0x07;  // 8 bytes, microseconds since epoch
    constexpr uint8_t LIST       = 0x08;  // u32 count + values
    constexpr uint8_t MAP        = 0x09;  // u32 count + (u32 key length, key, value)
}

// Nesting limit for decoded containers
constexpr size_t MAX_VALUE_DEPTH = 64;

//===----------------------------------------------------------------------===//
// ByteWriter
//===----------------------------------------------------------------------===//
class ByteWriter {
public:
    ByteWriter() { buffer_.reserve(256); }

    const std::vector<uint8_t>& GetBuffer() const { return buffer_; }
    std::vector<uint8_t> TakeBuffer() { return std::move(buffer_); }

    void WriteUInt8(uint8_t v) { buffer_.push_back(v); }

    void WriteUInt32(uint32_t v) {
        buffer_.push_back(v & 0xFF);
        buffer_.push_back((v >> 8) & 0xFF);
        buffer_.push_back((v >> 16) & 0xFF);
        buffer_.push_back((v >> 24) & 0xFF);
    }

    void WriteUInt64(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            buffer_.push_back((v >> (i * 8)) & 0xFF);
        }
    }

    void WriteBytes(const uint8_t* data, size_t size) {
        buffer_.insert(buffer_.end(), data, data + size);
    }

    // u32 length prefix + bytes
    void WriteString(const std::string& s);

    void WriteValue(const Value& value);

private:
    std::vector<uint8_t> buffer_;
};

//===----------------------------------------------------------------------===//
// ByteReader - bounds-checked, throws ProtocolError on truncation
//===----------------------------------------------------------------------===//
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size), offset_(0) {}
    explicit ByteReader(const std::vector<uint8_t>& data)
        : ByteReader(data.data(), data.size()) {}

    uint8_t ReadUInt8();
    uint32_t ReadUInt32();
    uint64_t ReadUInt64();
    std::string ReadString();
    std::vector<uint8_t> ReadBytes(size_t size);

    Value ReadValue() { return ReadValue(0); }

    size_t Remaining() const { return size_ - offset_; }
    bool AtEnd() const { return offset_ == size_; }

private:
    Value ReadValue(size_t depth);
    void Require(size_t bytes, const char* what) const;

    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

// Encode a single value as a standalone payload
std::vector<uint8_t> EncodeValue(const Value& value);

// Decode a payload that must contain exactly one value
Value DecodeValue(const std::vector<uint8_t>& data);

} // namespace dbdriver
