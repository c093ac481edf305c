//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/message.cpp
//
// Message framing and envelope encoding
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"
#include "protocol/errors.hpp"
#include "protocol/wire_codec.hpp"
#include <algorithm>

namespace dbdriver {

namespace {

void WriteLE32(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

uint32_t ReadLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

const Value& RequireField(const Value& envelope, const char* key, Value::Type type) {
    const Value* field = envelope.Find(key);
    if (!field) {
        throw ProtocolError(std::string("envelope missing '") + key + "'");
    }
    if (field->GetType() != type) {
        throw ProtocolError(std::string("envelope field '") + key + "' must be " +
                            Value::TypeName(type));
    }
    return *field;
}

} // anonymous namespace

void MessageHeader::EncodeTo(uint8_t* out) const {
    WriteLE32(out, magic);
    out[4] = version;
    out[5] = type;
    out[6] = flags;
    out[7] = reserved;
    WriteLE32(out + 8, length);
}

MessageHeader ParseHeader(const uint8_t* data) {
    MessageHeader header;
    header.magic = ReadLE32(data);
    header.version = data[4];
    header.type = data[5];
    header.flags = data[6];
    header.reserved = data[7];
    header.length = ReadLE32(data + 8);
    return header;
}

Message Message::ForHeader(const MessageHeader& header) {
    Message message(header.GetType(), std::vector<uint8_t>(header.length));
    message.flags_ = header.flags;
    return message;
}

MessageHeader Message::GetHeader() const {
    MessageHeader header;
    header.type = static_cast<uint8_t>(type_);
    header.flags = flags_;
    header.length = static_cast<uint32_t>(payload_.size());
    return header;
}

std::vector<uint8_t> Message::Serialize() const {
    std::vector<uint8_t> frame(TotalSize());
    GetHeader().EncodeTo(frame.data());
    std::copy(payload_.begin(), payload_.end(), frame.begin() + MessageHeader::SIZE);
    return frame;
}

//===----------------------------------------------------------------------===//
// RequestPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> RequestPayload::Serialize() const {
    ValueMap envelope;
    envelope["id"] = request.id;
    envelope["method"] = request.method;
    envelope["params"] = request.params;
    envelope["priority"] = static_cast<int64_t>(request.priority);
    envelope["timeout_ms"] = request.timeout_ms;
    envelope["created_at"] = request.created_at;
    return EncodeValue(Value(std::move(envelope)));
}

RequestPayload RequestPayload::Deserialize(const std::vector<uint8_t>& data) {
    Value envelope = DecodeValue(data);
    if (!envelope.IsMap()) {
        throw ProtocolError("request envelope must be a map");
    }

    RequestPayload payload;
    Request& req = payload.request;
    req.id = RequireField(envelope, "id", Value::Type::STRING).GetString();
    req.method = RequireField(envelope, "method", Value::Type::STRING).GetString();
    if (req.id.empty()) {
        throw ProtocolError("request id must not be empty");
    }

    req.params = envelope["params"];

    int64_t priority = envelope.GetIntOr("priority", static_cast<int64_t>(Priority::NORMAL));
    if (priority < 0 || priority >= static_cast<int64_t>(PRIORITY_LEVELS)) {
        throw ProtocolError("invalid priority " + std::to_string(priority));
    }
    req.priority = static_cast<Priority>(priority);

    int64_t timeout = envelope.GetIntOr("timeout_ms", 0);
    if (timeout < 0 || timeout > static_cast<int64_t>(UINT32_MAX)) {
        throw ProtocolError("invalid timeout_ms " + std::to_string(timeout));
    }
    req.timeout_ms = static_cast<uint32_t>(timeout);

    const Value& created = envelope["created_at"];
    req.created_at = created.IsTimestamp() ? created.GetTimestamp() : Timestamp::Now();

    return payload;
}

//===----------------------------------------------------------------------===//
// ResponsePayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> ResponsePayload::Serialize() const {
    ValueMap envelope;
    envelope["id"] = request_id;
    envelope["outcome"] = ResultKindToString(result.GetKind());
    switch (result.GetKind()) {
        case Result::Kind::SUCCESS:
            envelope["data"] = result.GetData();
            break;
        case Result::Kind::ERROR:
            envelope["code"] = static_cast<int64_t>(result.GetErrorCode());
            envelope["message"] = result.GetErrorMessage();
            break;
        case Result::Kind::ROWS:
            envelope["records"] = result.GetRecords();
            break;
    }
    return EncodeValue(Value(std::move(envelope)));
}

ResponsePayload ResponsePayload::Deserialize(const std::vector<uint8_t>& data) {
    Value envelope = DecodeValue(data);
    if (!envelope.IsMap()) {
        throw ProtocolError("response envelope must be a map");
    }

    ResponsePayload payload;
    payload.request_id = RequireField(envelope, "id", Value::Type::STRING).GetString();
    const std::string& outcome = RequireField(envelope, "outcome", Value::Type::STRING).GetString();

    if (outcome == "success") {
        payload.result = Result::Success(envelope["data"]);
    } else if (outcome == "rows") {
        payload.result = Result::Rows(
            RequireField(envelope, "records", Value::Type::LIST).GetList());
    } else if (outcome == "error") {
        int64_t code = RequireField(envelope, "code", Value::Type::INTEGER).GetInt();
        payload.result = Result::Error(static_cast<ErrorCode>(code),
                                       envelope.GetStringOr("message", ""));
    } else {
        throw ProtocolError("unknown outcome '" + outcome + "'");
    }
    return payload;
}

//===----------------------------------------------------------------------===//
// ProtocolErrorPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> ProtocolErrorPayload::Serialize() const {
    ValueMap envelope;
    envelope["code"] = static_cast<int64_t>(code);
    envelope["message"] = message;
    if (!request_id.empty()) {
        envelope["id"] = request_id;
    }
    return EncodeValue(Value(std::move(envelope)));
}

ProtocolErrorPayload ProtocolErrorPayload::Deserialize(const std::vector<uint8_t>& data) {
    Value envelope = DecodeValue(data);
    ProtocolErrorPayload payload;
    payload.code = static_cast<ErrorCode>(envelope.GetIntOr(
        "code", static_cast<int64_t>(ErrorCode::PROTOCOL_ERROR)));
    payload.message = envelope.GetStringOr("message", "");
    payload.request_id = envelope.GetStringOr("id", "");
    return payload;
}

} // namespace dbdriver
