#include <toolhost/protocol/message.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace toolhost {

namespace {

const char* StatusName(MessageStatus status) {
    switch (status) {
        case MessageStatus::Success: return "success";
        case MessageStatus::Error:   return "error";
        case MessageStatus::None:    break;
    }
    return nullptr;
}

Error MakeDecodeError(const std::string& message) {
    return Error::Make(ErrorCategory::Validation, "Message::FromJson", message);
}

Message MakeResponse(const std::string& correlation_id, const char* type,
                     MessageStatus status) {
    Message m;
    m.header.id = NewMessageId();
    m.header.correlation_id = correlation_id;
    m.header.type = type;
    m.header.status = status;
    return m;
}

} // anonymous namespace

std::string NewMessageId() {
    // random_generator is not thread-safe; one per thread.
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

nlohmann::json Message::ToJson() const {
    nlohmann::json header_json = {
        {"id", header.id},
        {"correlation_id", header.correlation_id},
        {"type", header.type},
    };
    if (const char* status = StatusName(header.status)) {
        header_json["status"] = status;
    }

    nlohmann::json j = {
        {"header", std::move(header_json)},
        {"body", body},
        {"error", nullptr},
    };
    if (error) {
        j["error"] = {{"code", error->code}, {"message", error->message}};
    }
    return j;
}

std::string Message::Dump() const {
    return ToJson().dump(-1, ' ', false,
                         nlohmann::json::error_handler_t::replace);
}

Result<Message, Error> Message::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<Message, Error>::Err(MakeDecodeError("message is not an object"));
    }
    auto header_it = j.find("header");
    if (header_it == j.end() || !header_it->is_object()) {
        return Result<Message, Error>::Err(MakeDecodeError("missing 'header' object"));
    }
    const auto& h = *header_it;
    auto corr_it = h.find("correlation_id");
    if (corr_it == h.end() || !corr_it->is_string()) {
        return Result<Message, Error>::Err(
            MakeDecodeError("header.correlation_id must be a string"));
    }

    Message m;
    m.header.correlation_id = corr_it->get<std::string>();
    if (auto it = h.find("id"); it != h.end() && it->is_string()) {
        m.header.id = it->get<std::string>();
    }
    if (auto it = h.find("type"); it != h.end() && it->is_string()) {
        m.header.type = it->get<std::string>();
    }
    if (auto it = h.find("status"); it != h.end() && it->is_string()) {
        const auto& status = it->get_ref<const std::string&>();
        if (status == "success") {
            m.header.status = MessageStatus::Success;
        } else if (status == "error") {
            m.header.status = MessageStatus::Error;
        } else {
            return Result<Message, Error>::Err(
                MakeDecodeError("unknown header.status '" + status + "'"));
        }
    }

    if (auto it = j.find("body"); it != j.end()) {
        m.body = *it;
    }

    if (auto it = j.find("error"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            return Result<Message, Error>::Err(MakeDecodeError("'error' must be an object"));
        }
        auto code_it = it->find("code");
        if (code_it == it->end() || !code_it->is_string() ||
            code_it->get_ref<const std::string&>().empty()) {
            return Result<Message, Error>::Err(MakeDecodeError("error.code is required"));
        }
        ErrorInfo info;
        info.code = code_it->get<std::string>();
        if (auto msg_it = it->find("message"); msg_it != it->end() && msg_it->is_string()) {
            info.message = msg_it->get<std::string>();
        }
        m.error = std::move(info);
    }

    return Result<Message, Error>::Ok(std::move(m));
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------
Message MakeToolCallRequest(const std::string& correlation_id,
                            const std::string& tool,
                            const nlohmann::json& args) {
    Message m;
    m.header.id = NewMessageId();
    m.header.correlation_id = correlation_id;
    m.header.type = message_type::kToolCall;
    m.body = {{"tool", tool}, {"args", args.is_null() ? nlohmann::json::object() : args}};
    return m;
}

Message MakeListToolsRequest(const std::string& correlation_id) {
    Message m;
    m.header.id = NewMessageId();
    m.header.correlation_id = correlation_id;
    m.header.type = message_type::kListTool;
    m.body = {{"request_type", "list_tool"}};
    return m;
}

Message MakeToolCallResponse(const std::string& correlation_id,
                             const std::string& tool_name,
                             nlohmann::json result) {
    auto m = MakeResponse(correlation_id, message_type::kToolCallResponse,
                          MessageStatus::Success);
    m.body = {{"tool_name", tool_name}, {"result", std::move(result)}};
    return m;
}

Message MakeListToolsResponse(const std::string& correlation_id,
                              nlohmann::json tools) {
    auto m = MakeResponse(correlation_id, message_type::kListToolsResponse,
                          MessageStatus::Success);
    m.body = {{"tools", std::move(tools)}};
    return m;
}

Message MakeErrorResponse(const std::string& correlation_id,
                          const Error& error) {
    auto m = MakeResponse(correlation_id, message_type::kErrorResponse,
                          MessageStatus::Error);
    m.error = ErrorInfo{error.CategoryName(), error.message};
    return m;
}

} // namespace toolhost
