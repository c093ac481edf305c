//===----------------------------------------------------------------------===//
//                         DBDriver - Unit Tests
//
// tests/unit/protocol/test_message.cpp
//
// Unit tests for framing, envelopes and error codes
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"
#include "protocol/errors.hpp"
#include "protocol/wire_codec.hpp"
#include <cassert>
#include <iostream>

using namespace dbdriver;

//===----------------------------------------------------------------------===//
// Header Tests
//===----------------------------------------------------------------------===//

void TestHeaderLayout() {
    std::cout << "  Testing frame header layout..." << std::endl;

    Message msg(MessageType::REQUEST, std::vector<uint8_t>{0xAA, 0xBB, 0xCC});
    auto bytes = msg.Serialize();

    assert(bytes.size() == MessageHeader::SIZE + 3);
    // "DBDR" magic, little-endian
    assert(bytes[0] == 0x44 && bytes[1] == 0x42 && bytes[2] == 0x44 && bytes[3] == 0x52);
    assert(bytes[4] == PROTOCOL_VERSION);
    assert(bytes[5] == static_cast<uint8_t>(MessageType::REQUEST));
    assert(bytes[8] == 3 && bytes[9] == 0 && bytes[10] == 0 && bytes[11] == 0);
    assert(bytes[12] == 0xAA && bytes[14] == 0xCC);

    MessageHeader parsed = ParseHeader(bytes.data());
    assert(parsed.IsValid());
    assert(parsed.GetType() == MessageType::REQUEST);
    assert(parsed.length == 3);

    std::cout << "    PASSED" << std::endl;
}

void TestHeaderValidation() {
    std::cout << "  Testing header validation..." << std::endl;

    auto bytes = Message(MessageType::PING).Serialize();
    assert(bytes.size() == MessageHeader::SIZE);

    auto bad_magic = bytes;
    bad_magic[0] = 'X';
    assert(!ParseHeader(bad_magic.data()).IsValid());

    auto bad_version = bytes;
    bad_version[4] = PROTOCOL_VERSION + 1;
    assert(!ParseHeader(bad_version.data()).IsValid());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Envelope Tests
//===----------------------------------------------------------------------===//

void TestRequestEnvelope() {
    std::cout << "  Testing request envelope..." << std::endl;

    Value params;
    params["table"] = "users";
    params["where"]["id"] = 5;

    RequestPayload out;
    out.request = Request::Make("select", params, Priority::HIGH, 1500);
    assert(!out.request.id.empty());

    RequestPayload in = RequestPayload::Deserialize(out.Serialize());
    assert(in.request.id == out.request.id);
    assert(in.request.method == "select");
    assert(in.request.priority == Priority::HIGH);
    assert(in.request.timeout_ms == 1500);
    assert(in.request.params == params);
    assert(in.request.created_at == out.request.created_at);

    // Two requests never share an id
    assert(Request::Make("ping").id != Request::Make("ping").id);

    std::cout << "    PASSED" << std::endl;
}

static bool RequestRejected(const Value& envelope) {
    try {
        RequestPayload::Deserialize(EncodeValue(envelope));
    } catch (const ProtocolError&) {
        return true;
    }
    return false;
}

void TestMalformedRequestEnvelope() {
    std::cout << "  Testing malformed request envelopes..." << std::endl;

    assert(RequestRejected(Value("not a map")));

    Value no_method;
    no_method["id"] = "r1";
    assert(RequestRejected(no_method));

    Value bad_id;
    bad_id["id"] = 17;
    bad_id["method"] = "select";
    assert(RequestRejected(bad_id));

    Value empty_id;
    empty_id["id"] = "";
    empty_id["method"] = "select";
    assert(RequestRejected(empty_id));

    Value bad_priority;
    bad_priority["id"] = "r2";
    bad_priority["method"] = "select";
    bad_priority["priority"] = 9;
    assert(RequestRejected(bad_priority));

    // Optional fields take defaults
    Value minimal;
    minimal["id"] = "r3";
    minimal["method"] = "get_schema_version";
    RequestPayload payload = RequestPayload::Deserialize(EncodeValue(minimal));
    assert(payload.request.priority == Priority::NORMAL);
    assert(payload.request.timeout_ms == 0);
    assert(payload.request.params.IsNull());

    std::cout << "    PASSED" << std::endl;
}

void TestResponseEnvelope() {
    std::cout << "  Testing response envelopes for every outcome..." << std::endl;

    ResponsePayload success{"a", Result::Success(Value(ValueMap{{"affected_rows", Value(2)}}))};
    auto s = ResponsePayload::Deserialize(success.Serialize());
    assert(s.request_id == "a");
    assert(s.result.IsSuccess());
    assert(s.result.GetData()["affected_rows"].GetInt() == 2);

    ResponsePayload failure{"b", Result::Error(ErrorCode::TABLE_NOT_FOUND, "no table ghosts")};
    auto f = ResponsePayload::Deserialize(failure.Serialize());
    assert(f.result.IsError());
    assert(f.result.GetErrorCode() == ErrorCode::TABLE_NOT_FOUND);
    assert(f.result.GetErrorMessage() == "no table ghosts");

    ValueList records{Value(ValueMap{{"id", Value(1)}}), Value(ValueMap{{"id", Value(2)}})};
    ResponsePayload rows{"c", Result::Rows(records)};
    auto r = ResponsePayload::Deserialize(rows.Serialize());
    assert(r.result.IsRows());
    assert(r.result.GetRecords().size() == 2);
    assert(r.result.GetRecords()[1]["id"].GetInt() == 2);

    ResponsePayload empty_rows{"d", Result::Rows({})};
    assert(ResponsePayload::Deserialize(empty_rows.Serialize()).result.GetRecords().empty());

    std::cout << "    PASSED" << std::endl;
}

void TestProtocolErrorEnvelope() {
    std::cout << "  Testing protocol error envelope..." << std::endl;

    ProtocolErrorPayload out;
    out.code = ErrorCode::UNKNOWN_METHOD;
    out.message = "unknown method 'frobnicate'";
    out.request_id = "r9";

    auto in = ProtocolErrorPayload::Deserialize(out.Serialize());
    assert(in.code == ErrorCode::UNKNOWN_METHOD);
    assert(in.message == out.message);
    assert(in.request_id == "r9");

    ProtocolErrorPayload anonymous;
    anonymous.message = "bad magic";
    auto anon = ProtocolErrorPayload::Deserialize(anonymous.Serialize());
    assert(anon.code == ErrorCode::PROTOCOL_ERROR);
    assert(anon.request_id.empty());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Result and Error Code Tests
//===----------------------------------------------------------------------===//

void TestResultAccessors() {
    std::cout << "  Testing Result accessors..." << std::endl;

    Result empty;
    assert(empty.IsError());
    assert(empty.GetErrorCode() == ErrorCode::INTERNAL_ERROR);

    Result ok = Result::Success();
    assert(ok.GetData().IsNull());

    bool threw = false;
    try {
        ok.GetRecords();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    assert(Result::Error(ErrorCode::TIMEOUT, "late").ToString() == "Error(TIMEOUT: late)");
    assert(Result::Rows({Value(1)}).ToString() == "Rows(1 records)");

    std::cout << "    PASSED" << std::endl;
}

void TestErrorCategories() {
    std::cout << "  Testing error categories and retryability..." << std::endl;

    assert(GetErrorCategory(ErrorCode::UNKNOWN_METHOD) == ErrorCategory::PROTOCOL);
    assert(GetErrorCategory(ErrorCode::INVALID_PARAMETER) == ErrorCategory::VALIDATION);
    assert(GetErrorCategory(ErrorCode::QUEUE_FULL) == ErrorCategory::RESOURCE);
    assert(GetErrorCategory(ErrorCode::SYNTAX_ERROR) == ErrorCategory::STORAGE);
    assert(GetErrorCategory(ErrorCode::ATOMIC_SAVE_FAILED) == ErrorCategory::ATOMICITY);
    assert(GetErrorCategory(ErrorCode::OK) == ErrorCategory::NONE);

    assert(IsRetryable(ErrorCode::TIMEOUT));
    assert(IsRetryable(ErrorCode::TRANSACTION_CONFLICT));
    assert(!IsRetryable(ErrorCode::CONSTRAINT_VIOLATION));
    assert(!IsRetryable(ErrorCode::INVALID_PARAMETER));

    assert(std::string(ErrorCodeToString(ErrorCode::SHUTTING_DOWN)) == "SHUTTING_DOWN");

    std::cout << "    PASSED" << std::endl;
}

void TestPriorityNames() {
    std::cout << "  Testing priority names..." << std::endl;

    Priority p = Priority::LOW;
    assert(ParsePriority("URGENT", p) && p == Priority::URGENT);
    assert(ParsePriority("low", p) && p == Priority::LOW);
    assert(!ParsePriority("critical", p));
    assert(p == Priority::LOW);
    assert(std::string(PriorityToString(Priority::HIGH)) == "high");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Message Unit Tests ===" << std::endl;

    std::cout << "\n1. Frame Header:" << std::endl;
    TestHeaderLayout();
    TestHeaderValidation();

    std::cout << "\n2. Envelopes:" << std::endl;
    TestRequestEnvelope();
    TestMalformedRequestEnvelope();
    TestResponseEnvelope();
    TestProtocolErrorEnvelope();

    std::cout << "\n3. Results and Codes:" << std::endl;
    TestResultAccessors();
    TestErrorCategories();
    TestPriorityNames();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
