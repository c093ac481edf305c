//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/message.hpp
//
// Frame header, message container and RPC envelopes
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/message_types.hpp"
#include "protocol/rpc_types.hpp"
#include <vector>

namespace dbdriver {

//===----------------------------------------------------------------------===//
// Frame Header
//===----------------------------------------------------------------------===//
// Wire layout, little-endian:
//   0  magic    u32   "DBDR"
//   4  version  u8
//   5  type     u8    MessageType
//   6  flags    u8
//   7  reserved u8
//   8  length   u32   payload bytes
struct MessageHeader {
    static constexpr size_t SIZE = 12;

    uint32_t magic = PROTOCOL_MAGIC;
    uint8_t version = PROTOCOL_VERSION;
    uint8_t type = static_cast<uint8_t>(MessageType::UNKNOWN);
    uint8_t flags = MessageFlags::NONE;
    uint8_t reserved = 0;
    uint32_t length = 0;

    bool IsValid() const { return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION; }
    MessageType GetType() const { return static_cast<MessageType>(type); }

    // Writes exactly SIZE bytes
    void EncodeTo(uint8_t* out) const;
};

// No validation; callers check IsValid() and the length limit
MessageHeader ParseHeader(const uint8_t* data);

//===----------------------------------------------------------------------===//
// Message
//===----------------------------------------------------------------------===//
class Message {
public:
    Message() = default;
    explicit Message(MessageType type) : type_(type) {}
    Message(MessageType type, std::vector<uint8_t> payload)
        : type_(type), payload_(std::move(payload)) {}

    // Empty message sized to receive the payload announced by header
    static Message ForHeader(const MessageHeader& header);

    MessageType GetType() const { return type_; }
    // Header as it goes on the wire; length follows the payload
    MessageHeader GetHeader() const;

    const std::vector<uint8_t>& GetPayload() const { return payload_; }
    std::vector<uint8_t>& GetPayload() { return payload_; }

    std::vector<uint8_t> Serialize() const;
    size_t TotalSize() const { return MessageHeader::SIZE + payload_.size(); }

private:
    MessageType type_ = MessageType::UNKNOWN;
    uint8_t flags_ = MessageFlags::NONE;
    std::vector<uint8_t> payload_;
};

//===----------------------------------------------------------------------===//
// Request Payload
//===----------------------------------------------------------------------===//
struct RequestPayload {
    Request request;

    std::vector<uint8_t> Serialize() const;
    // Throws ProtocolError when the envelope is missing id or method
    static RequestPayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Response Payload
//===----------------------------------------------------------------------===//
struct ResponsePayload {
    std::string request_id;
    Result result;

    std::vector<uint8_t> Serialize() const;
    static ResponsePayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Protocol Error Payload
//===----------------------------------------------------------------------===//
struct ProtocolErrorPayload {
    ErrorCode code = ErrorCode::PROTOCOL_ERROR;
    std::string message;
    std::string request_id;  // set when the offending envelope was readable

    std::vector<uint8_t> Serialize() const;
    static ProtocolErrorPayload Deserialize(const std::vector<uint8_t>& data);
};

} // namespace dbdriver
