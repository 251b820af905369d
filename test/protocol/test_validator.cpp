#include <catch2/catch_test_macros.hpp>

#include <toolhost/protocol/validator.hpp>

#include <string>
#include <string_view>

using namespace toolhost;
using nlohmann::json;

namespace {

json Frame(json body, json header = {{"id", "m-1"}, {"correlation_id", "c-1"}}) {
    return {{"header", std::move(header)}, {"body", std::move(body)}};
}

void CheckRejected(const Result<Request, Message>& result,
                   const std::string& correlation_id,
                   const std::string& fragment) {
    REQUIRE(result.IsErr());
    const auto& response = result.Error();
    REQUIRE(response.error.has_value());
    CHECK(response.error->code == "validation_error");
    CHECK(response.header.correlation_id == correlation_id);
    CHECK(response.header.status == MessageStatus::Error);
    CHECK(response.body.is_null());
    CHECK(response.error->message.find(fragment) != std::string::npos);
}

} // anonymous namespace

// ===========================================================================
// Accepted shapes
// ===========================================================================

TEST_CASE("Validator: tool call", "[protocol][validator]") {
    Validator v;
    auto result = v.Validate(Frame({{"tool", "add"}, {"args", {{"a", 5}, {"b", 7}}}}));
    REQUIRE(result.IsOk());
    const auto& r = result.Value();
    CHECK(r.kind == RequestKind::ToolCall);
    CHECK(r.tool == "add");
    CHECK(r.args == json{{"a", 5}, {"b", 7}});
    CHECK(r.header.id == "m-1");
    CHECK(r.header.correlation_id == "c-1");
}

TEST_CASE("Validator: tool_name alias", "[protocol][validator]") {
    Validator v;
    auto result = v.Validate(Frame({{"tool_name", "ping"}}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().tool == "ping");
    CHECK(result.Value().args == json::object());
}

TEST_CASE("Validator: tool and alias may agree", "[protocol][validator]") {
    Validator v;
    auto result = v.Validate(Frame({{"tool", "ping"}, {"tool_name", "ping"}}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().tool == "ping");
}

TEST_CASE("Validator: null args mean no arguments", "[protocol][validator]") {
    Validator v;
    auto result = v.Validate(Frame({{"tool", "ping"}, {"args", nullptr}}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().args.empty());
}

TEST_CASE("Validator: request_type wins over tool", "[protocol][validator]") {
    Validator v;
    auto result = v.Validate(Frame({{"request_type", "list_tool"}, {"tool", "add"}}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().kind == RequestKind::RequestType);
    CHECK(result.Value().request_type == "list_tool");
}

TEST_CASE("Validator: unknown request types pass validation", "[protocol][validator]") {
    Validator v;
    auto result = v.Validate(Frame({{"request_type", "reboot"}}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().request_type == "reboot");
}

TEST_CASE("Validator: raw text is parsed", "[protocol][validator]") {
    Validator v;
    std::string text =
        R"({"header":{"id":"a","correlation_id":"b","type":"tool_call"},)"
        R"("body":{"tool":"echo","args":{"message":"hi"}}})";
    auto result = v.Validate(std::string_view(text));
    REQUIRE(result.IsOk());
    CHECK(result.Value().header.type == "tool_call");
    CHECK(result.Value().args["message"] == "hi");
}

// ===========================================================================
// Rejections
// ===========================================================================

TEST_CASE("Validator: invalid JSON", "[protocol][validator]") {
    Validator v;
    std::string text = "{not json";
    CheckRejected(v.Validate(std::string_view(text)), "", "invalid JSON");
}

TEST_CASE("Validator: non-object document", "[protocol][validator]") {
    Validator v;
    CheckRejected(v.Validate(json::array({1, 2})), "", "JSON object");
}

TEST_CASE("Validator: header problems", "[protocol][validator]") {
    Validator v;
    SECTION("missing header") {
        CheckRejected(v.Validate(json{{"body", {{"tool", "x"}}}}), "", "header");
    }
    SECTION("missing id") {
        CheckRejected(v.Validate(Frame({{"tool", "x"}}, {{"correlation_id", "c-9"}})),
                      "c-9", "header.id");
    }
    SECTION("missing correlation id falls back to id") {
        CheckRejected(v.Validate(Frame({{"tool", "x"}}, {{"id", "m-9"}})),
                      "m-9", "correlation_id");
    }
    SECTION("non-string correlation id") {
        CheckRejected(v.Validate(Frame({{"tool", "x"}}, {{"id", "m"}, {"correlation_id", 3}})),
                      "m", "correlation_id");
    }
}

TEST_CASE("Validator: body problems keep the correlation id", "[protocol][validator]") {
    Validator v;
    SECTION("missing body") {
        json doc = {{"header", {{"id", "m"}, {"correlation_id", "c-2"}}}};
        CheckRejected(v.Validate(doc), "c-2", "body");
    }
    SECTION("neither request_type nor tool") {
        CheckRejected(v.Validate(Frame({{"args", json::object()}})), "c-1", "request_type");
    }
    SECTION("non-string request_type") {
        CheckRejected(v.Validate(Frame({{"request_type", 1}})), "c-1", "request_type");
    }
    SECTION("non-string tool") {
        CheckRejected(v.Validate(Frame({{"tool", 42}})), "c-1", "tool");
    }
    SECTION("empty tool") {
        CheckRejected(v.Validate(Frame({{"tool", ""}})), "c-1", "empty");
    }
    SECTION("tool and alias disagree") {
        CheckRejected(v.Validate(Frame({{"tool", "a"}, {"tool_name", "b"}})), "c-1", "disagree");
    }
    SECTION("args not an object") {
        CheckRejected(v.Validate(Frame({{"tool", "add"}, {"args", json::array({5, 7})}})),
                      "c-1", "args");
    }
}
