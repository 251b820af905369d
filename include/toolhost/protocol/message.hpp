#pragma once

#include <toolhost/core/result.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace toolhost {

// ---------------------------------------------------------------------------
// Wire constants.
// ---------------------------------------------------------------------------
namespace message_type {
constexpr const char* kToolCall = "tool_call";
constexpr const char* kListTool = "list_tool";
constexpr const char* kToolCallResponse = "tool_call_response";
constexpr const char* kListToolsResponse = "list_tools_response";
constexpr const char* kErrorResponse = "error_response";
} // namespace message_type

enum class MessageStatus {
    None,  // omitted on requests
    Success,
    Error,
};

struct MessageHeader {
    std::string id;
    std::string correlation_id;
    std::string type;
    MessageStatus status = MessageStatus::None;
};

struct ErrorInfo {
    std::string code;
    std::string message;
};

// ---------------------------------------------------------------------------
// Message: one JSON document per WebSocket text frame:
//
//   {"header": {"id", "correlation_id", "type", "status"?},
//    "body":   <object|null>,
//    "error":  {"code", "message"} | null}
//
// Errors always travel in the top-level "error" object with a null body.
// ---------------------------------------------------------------------------
struct Message {
    MessageHeader header;
    nlohmann::json body;  // null when absent
    std::optional<ErrorInfo> error;

    [[nodiscard]] bool IsError() const { return error.has_value(); }

    [[nodiscard]] nlohmann::json ToJson() const;

    /// Serialized frame. Invalid UTF-8 inside strings is replaced, not thrown.
    [[nodiscard]] std::string Dump() const;

    /// Strict decoding of a server-produced message (used by the client).
    static Result<Message, Error> FromJson(const nlohmann::json& j);
};

/// Fresh random (v4) UUID string. Safe to call from any thread.
std::string NewMessageId();

// Request builders (client side).
Message MakeToolCallRequest(const std::string& correlation_id,
                            const std::string& tool,
                            const nlohmann::json& args);
Message MakeListToolsRequest(const std::string& correlation_id);

// Response builders (server side).
Message MakeToolCallResponse(const std::string& correlation_id,
                             const std::string& tool_name,
                             nlohmann::json result);
Message MakeListToolsResponse(const std::string& correlation_id,
                              nlohmann::json tools);
Message MakeErrorResponse(const std::string& correlation_id,
                          const Error& error);

} // namespace toolhost
