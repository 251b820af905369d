#pragma once

#include <toolhost/core/result.hpp>
#include <toolhost/protocol/message.hpp>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolhost {

enum class RequestKind {
    RequestType,  // {"request_type": "..."}
    ToolCall,     // {"tool": "...", "args": {...}}
};

// ---------------------------------------------------------------------------
// Request: a client message that passed validation.
// ---------------------------------------------------------------------------
struct Request {
    MessageHeader header;
    RequestKind kind = RequestKind::RequestType;
    std::string request_type;  // RequestType only
    std::string tool;          // ToolCall only
    nlohmann::json args = nlohmann::json::object();  // ToolCall only
};

// ---------------------------------------------------------------------------
// Validator: decodes a raw frame and checks the message shape.
//
// On failure the error side holds a ready-to-send `validation_error`
// response whose correlation id is the best-effort value extracted from the
// frame (header.correlation_id, else header.id, else empty).
//
// Body rules:
//   - "request_type" (string) makes a request-type body; it wins over "tool".
//   - "tool" is the canonical tool-call field; "tool_name" is accepted as an
//     alias. Both present with different values is rejected.
//   - "args", when present, must be an object; absent means {}.
// ---------------------------------------------------------------------------
class Validator {
public:
    [[nodiscard]] Result<Request, Message> Validate(std::string_view raw) const;

    [[nodiscard]] Result<Request, Message> Validate(const nlohmann::json& doc) const;
};

} // namespace toolhost
