#include <toolhost/protocol/validator.hpp>

namespace toolhost {

namespace {

using ValidationResult = Result<Request, Message>;

std::string BestEffortCorrelationId(const nlohmann::json& doc) {
    if (!doc.is_object()) return "";
    auto header = doc.find("header");
    if (header == doc.end() || !header->is_object()) return "";
    for (const char* key : {"correlation_id", "id"}) {
        auto it = header->find(key);
        if (it != header->end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

ValidationResult Reject(const std::string& correlation_id,
                        const std::string& message) {
    return ValidationResult::Err(MakeErrorResponse(
        correlation_id,
        Error::Make(ErrorCategory::Validation, "Validator", message)));
}

const nlohmann::json* FindString(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return nullptr;
    return &*it;
}

} // anonymous namespace

ValidationResult Validator::Validate(std::string_view raw) const {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(raw.begin(), raw.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Reject("", std::string("invalid JSON: ") + e.what());
    }
    return Validate(doc);
}

ValidationResult Validator::Validate(const nlohmann::json& doc) const {
    const auto correlation_id = BestEffortCorrelationId(doc);

    if (!doc.is_object()) {
        return Reject(correlation_id, "message must be a JSON object");
    }

    // -- Header --
    auto header_it = doc.find("header");
    if (header_it == doc.end() || !header_it->is_object()) {
        return Reject(correlation_id, "missing 'header' object");
    }
    const auto& header = *header_it;

    const auto* id = FindString(header, "id");
    if (id == nullptr) {
        return Reject(correlation_id, "header.id must be a string");
    }
    const auto* corr = FindString(header, "correlation_id");
    if (corr == nullptr) {
        return Reject(correlation_id, "header.correlation_id must be a string");
    }

    Request request;
    request.header.id = id->get<std::string>();
    request.header.correlation_id = corr->get<std::string>();
    if (const auto* type = FindString(header, "type")) {
        request.header.type = type->get<std::string>();
    }

    // -- Body --
    auto body_it = doc.find("body");
    if (body_it == doc.end() || !body_it->is_object()) {
        return Reject(correlation_id, "missing 'body' object");
    }
    const auto& body = *body_it;

    if (body.contains("request_type")) {
        const auto* request_type = FindString(body, "request_type");
        if (request_type == nullptr) {
            return Reject(correlation_id, "body.request_type must be a string");
        }
        request.kind = RequestKind::RequestType;
        request.request_type = request_type->get<std::string>();
        return ValidationResult::Ok(std::move(request));
    }

    const bool has_tool = body.contains("tool");
    const bool has_alias = body.contains("tool_name");
    if (!has_tool && !has_alias) {
        return Reject(correlation_id,
                      "body must contain 'request_type' or 'tool'");
    }

    const auto* tool = FindString(body, "tool");
    const auto* alias = FindString(body, "tool_name");
    if ((has_tool && tool == nullptr) || (has_alias && alias == nullptr)) {
        return Reject(correlation_id, "body.tool must be a string");
    }
    if (tool != nullptr && alias != nullptr && *tool != *alias) {
        return Reject(correlation_id,
                      "body.tool and body.tool_name disagree");
    }

    request.kind = RequestKind::ToolCall;
    request.tool = (tool != nullptr ? tool : alias)->get<std::string>();
    if (request.tool.empty()) {
        return Reject(correlation_id, "body.tool must not be empty");
    }

    auto args_it = body.find("args");
    if (args_it != body.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return Reject(correlation_id, "body.args must be an object");
        }
        request.args = *args_it;
    }

    return ValidationResult::Ok(std::move(request));
}

} // namespace toolhost
