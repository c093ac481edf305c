//===----------------------------------------------------------------------===//
//                         DBDriver
//
// protocol/message_types.hpp
//
// Wire message types and error codes
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace dbdriver {

// "DBDR" little-endian
constexpr uint32_t PROTOCOL_MAGIC = 0x52444244;
constexpr uint8_t PROTOCOL_VERSION = 1;

//===----------------------------------------------------------------------===//
// Message Types
//===----------------------------------------------------------------------===//
enum class MessageType : uint8_t {
    // ===== Connection Management (0x01-0x0F) =====
    PING            = 0x03,  // Health check request
    PONG            = 0x04,  // Health check response (payload: health map)
    CLOSE           = 0x05,  // Close connection

    // ===== RPC (0x10-0x1F) =====
    REQUEST         = 0x10,  // Request envelope
    RESPONSE        = 0x11,  // Response envelope (correlated by request id)
    PROTOCOL_ERROR  = 0x12,  // Connection-level failure, not tied to a result

    UNKNOWN         = 0xFF
};

//===----------------------------------------------------------------------===//
// Message Flags
//===----------------------------------------------------------------------===//
namespace MessageFlags {
    constexpr uint8_t NONE              = 0x00;
    // bits 0-7: reserved
}

//===----------------------------------------------------------------------===//
// Error Codes
//===----------------------------------------------------------------------===//
enum class ErrorCode : uint32_t {
    OK                      = 0x00000000,

    // ===== 0x0001xxxx: Protocol Errors =====
    PROTOCOL_ERROR          = 0x00010001,  // Malformed frame or envelope
    UNKNOWN_METHOD          = 0x00010002,  // Method not in the catalogue
    VERSION_MISMATCH        = 0x00010003,  // Protocol version mismatch
    FRAME_TOO_LARGE         = 0x00010004,  // Payload exceeds frame limit

    // ===== 0x0002xxxx: Validation Errors =====
    INVALID_PARAMETER       = 0x00020001,  // Missing or malformed parameter
    TABLE_NOT_FOUND         = 0x00020002,  // Table does not exist
    COLUMN_NOT_FOUND        = 0x00020003,  // Column does not exist
    INVALID_SCHEMA          = 0x00020004,  // Schema description rejected
    TRANSACTION_NOT_FOUND   = 0x00020005,  // Unknown or finished transaction
    UNSUPPORTED             = 0x00020006,  // Operation not available

    // ===== 0x0003xxxx: Resource Errors =====
    QUEUE_FULL              = 0x00030001,  // Request queue at capacity
    CONNECTION_UNAVAILABLE  = 0x00030002,  // No database connection available
    TIMEOUT                 = 0x00030003,  // Request timed out
    SHUTTING_DOWN           = 0x00030004,  // Server is stopping

    // ===== 0x0004xxxx: Storage Errors =====
    STORAGE_ERROR           = 0x00040001,  // Generic storage failure
    CONSTRAINT_VIOLATION    = 0x00040002,  // Constraint violation
    TRANSACTION_CONFLICT    = 0x00040003,  // Write-write conflict
    SYNTAX_ERROR            = 0x00040004,  // SQL syntax error
    INTERNAL_ERROR          = 0x00040005,  // Unclassified failure

    // ===== 0x0005xxxx: Atomicity Errors =====
    ATOMIC_SAVE_FAILED      = 0x00050001,  // Atomic save stage failed
};

enum class ErrorCategory : uint8_t {
    NONE = 0,
    PROTOCOL = 1,
    VALIDATION = 2,
    RESOURCE = 3,
    STORAGE = 4,
    ATOMICITY = 5
};

//===----------------------------------------------------------------------===//
// Utility Functions
//===----------------------------------------------------------------------===//
inline const char* MessageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::PING:             return "PING";
        case MessageType::PONG:             return "PONG";
        case MessageType::CLOSE:            return "CLOSE";
        case MessageType::REQUEST:          return "REQUEST";
        case MessageType::RESPONSE:         return "RESPONSE";
        case MessageType::PROTOCOL_ERROR:   return "PROTOCOL_ERROR";
        default:                            return "UNKNOWN";
    }
}

inline const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                     return "OK";
        case ErrorCode::PROTOCOL_ERROR:         return "PROTOCOL_ERROR";
        case ErrorCode::UNKNOWN_METHOD:         return "UNKNOWN_METHOD";
        case ErrorCode::VERSION_MISMATCH:       return "VERSION_MISMATCH";
        case ErrorCode::FRAME_TOO_LARGE:        return "FRAME_TOO_LARGE";
        case ErrorCode::INVALID_PARAMETER:      return "INVALID_PARAMETER";
        case ErrorCode::TABLE_NOT_FOUND:        return "TABLE_NOT_FOUND";
        case ErrorCode::COLUMN_NOT_FOUND:       return "COLUMN_NOT_FOUND";
        case ErrorCode::INVALID_SCHEMA:         return "INVALID_SCHEMA";
        case ErrorCode::TRANSACTION_NOT_FOUND:  return "TRANSACTION_NOT_FOUND";
        case ErrorCode::UNSUPPORTED:            return "UNSUPPORTED";
        case ErrorCode::QUEUE_FULL:             return "QUEUE_FULL";
        case ErrorCode::CONNECTION_UNAVAILABLE: return "CONNECTION_UNAVAILABLE";
        case ErrorCode::TIMEOUT:                return "TIMEOUT";
        case ErrorCode::SHUTTING_DOWN:          return "SHUTTING_DOWN";
        case ErrorCode::STORAGE_ERROR:          return "STORAGE_ERROR";
        case ErrorCode::CONSTRAINT_VIOLATION:   return "CONSTRAINT_VIOLATION";
        case ErrorCode::TRANSACTION_CONFLICT:   return "TRANSACTION_CONFLICT";
        case ErrorCode::SYNTAX_ERROR:           return "SYNTAX_ERROR";
        case ErrorCode::INTERNAL_ERROR:         return "INTERNAL_ERROR";
        case ErrorCode::ATOMIC_SAVE_FAILED:     return "ATOMIC_SAVE_FAILED";
        default:                                return "UNKNOWN_ERROR";
    }
}

inline ErrorCategory GetErrorCategory(ErrorCode code) {
    switch (static_cast<uint32_t>(code) >> 16) {
        case 0x0001: return ErrorCategory::PROTOCOL;
        case 0x0002: return ErrorCategory::VALIDATION;
        case 0x0003: return ErrorCategory::RESOURCE;
        case 0x0004: return ErrorCategory::STORAGE;
        case 0x0005: return ErrorCategory::ATOMICITY;
        default:     return ErrorCategory::NONE;
    }
}

inline const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::PROTOCOL:   return "protocol";
        case ErrorCategory::VALIDATION: return "validation";
        case ErrorCategory::RESOURCE:   return "resource";
        case ErrorCategory::STORAGE:    return "storage";
        case ErrorCategory::ATOMICITY:  return "atomicity";
        default:                        return "none";
    }
}

// Resource errors and write conflicts can succeed when retried with backoff
inline bool IsRetryable(ErrorCode code) {
    return GetErrorCategory(code) == ErrorCategory::RESOURCE ||
           code == ErrorCode::TRANSACTION_CONFLICT;
}

} // namespace dbdriver
