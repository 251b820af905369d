#include <toolhost/core/result.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <sstream>
#include <utility>

namespace toolhost {

namespace {

constexpr std::array<std::pair<ErrorCategory, const char*>, 11> kCodes = {{
    {ErrorCategory::Config,             "config_error"},
    {ErrorCategory::Load,               "load_error"},
    {ErrorCategory::Validation,         "validation_error"},
    {ErrorCategory::UnknownRequestType, "unknown_request_type"},
    {ErrorCategory::ToolNotFound,       "tool_not_found"},
    {ErrorCategory::Execution,          "execution_error"},
    {ErrorCategory::Connection,         "connection_error"},
    {ErrorCategory::ConnectionClosed,   "connection_closed"},
    {ErrorCategory::Timeout,            "timeout"},
    {ErrorCategory::NotConnected,       "not_connected"},
    {ErrorCategory::Internal,           "internal_error"},
}};

} // anonymous namespace

std::optional<ErrorCategory> Error::CategoryFromCode(std::string_view code) {
    for (const auto& [category, name] : kCodes) {
        if (code == name) {
            return category;
        }
    }
    return std::nullopt;
}

std::string Error::CategoryName() const {
    for (const auto& [cat, name] : kCodes) {
        if (cat == category) {
            return name;
        }
    }
    return "internal_error";
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Connection:
        case ErrorCategory::ConnectionClosed:
        case ErrorCategory::NotConnected:
        case ErrorCategory::Timeout:
            return 1;
        case ErrorCategory::Config:
        case ErrorCategory::Load:
            return 2;
        case ErrorCategory::Validation:
        case ErrorCategory::UnknownRequestType:
        case ErrorCategory::ToolNotFound:
        case ErrorCategory::Execution:
            return 3;
        case ErrorCategory::Internal:
            return 99;
    }
    return 99;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << " [" << CategoryName() << "]: " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json j = {
        {"error", {
            {"code", CategoryName()},
            {"operation", operation},
            {"message", message},
            {"exit_code", ExitCode()},
        }},
    };
    return j.dump();
}

} // namespace toolhost
