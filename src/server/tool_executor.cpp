#include <toolhost/server/tool_executor.hpp>

#include <toolhost/core/log.hpp>

#include <exception>
#include <optional>

#include <boost/asio/post.hpp>

namespace toolhost {

namespace {

constexpr const char* kComponent = "executor";

Message ExecutionFailure(const std::string& correlation_id,
                         const std::string& tool_name, const std::string& detail) {
    return MakeErrorResponse(
        correlation_id,
        Error::Make(ErrorCategory::Execution, "ToolExecutor::Execute",
                    FormatExecutionError(tool_name, detail)));
}

// Returns a description of the first problem with `args`, if any.
std::optional<std::string> CheckArguments(const Tool& tool, const nlohmann::json& args) {
    for (const auto& [key, value] : args.items()) {
        if (key == kInjectedRegistryParam) {
            return "argument '" + key + "' is supplied by the server";
        }
        bool declared = false;
        for (const auto& param : tool.Parameters()) {
            if (param.name == key) {
                declared = true;
                break;
            }
        }
        if (!declared) {
            return "unexpected argument '" + key + "'";
        }
    }
    for (const auto& param : tool.Parameters()) {
        if (param.required && !args.contains(param.name)) {
            return "missing required argument '" + param.name + "'";
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::string FormatExecutionError(const std::string& tool_name, const std::string& detail) {
    std::string text = "Error executing tool '" + tool_name + "': ";
    text.reserve(text.size() + detail.size());
    for (char c : detail) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f) {
            text.push_back(' ');
        } else {
            text.push_back(c);
        }
    }
    if (text.size() > kMaxExecutionErrorBytes) {
        std::size_t cut = kMaxExecutionErrorBytes;
        // Back up to the lead byte of a multi-byte sequence.
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        text.resize(cut);
    }
    return text;
}

ToolExecutor::ToolExecutor(std::size_t threads) : pool_(threads == 0 ? 1 : threads) {}

ToolExecutor::~ToolExecutor() {
    Shutdown();
}

void ToolExecutor::Submit(std::shared_ptr<const ToolRegistry> snapshot, const Tool* tool,
                          Request request, ResponseCallback done) {
    if (shut_down_.load(std::memory_order_acquire)) {
        done(MakeErrorResponse(request.header.correlation_id,
                               Error::Make(ErrorCategory::Internal, "ToolExecutor::Submit",
                                           "server is shutting down")));
        return;
    }

    in_flight_.fetch_add(1, std::memory_order_acq_rel);
    boost::asio::post(pool_, [this, snapshot = std::move(snapshot), tool,
                              request = std::move(request), done = std::move(done)] {
        auto response = Execute(snapshot, *tool, request.header.correlation_id, request.args);
        done(std::move(response));
        in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    });
}

Message ToolExecutor::Execute(const std::shared_ptr<const ToolRegistry>& snapshot,
                              const Tool& tool, const std::string& correlation_id,
                              const nlohmann::json& args) {
    if (!args.is_object()) {
        return ExecutionFailure(correlation_id, tool.Name(), "arguments must be an object");
    }
    if (auto problem = CheckArguments(tool, args)) {
        LogDebug(kComponent, tool.Name() + ": " + *problem);
        return ExecutionFailure(correlation_id, tool.Name(), *problem);
    }

    ToolCall call;
    call.args = args;
    if (tool.NeedsRegistry()) {
        call.registry = snapshot;
    }

    try {
        auto result = tool.Invoke(call);
        return MakeToolCallResponse(correlation_id, tool.Name(), std::move(result));
    } catch (const std::exception& e) {
        LogWarn(kComponent, "tool '" + tool.Name() + "' failed: " + e.what());
        return ExecutionFailure(correlation_id, tool.Name(), e.what());
    } catch (...) {
        LogWarn(kComponent, "tool '" + tool.Name() + "' threw a non-standard exception");
        return ExecutionFailure(correlation_id, tool.Name(), "unknown exception");
    }
}

void ToolExecutor::Shutdown() {
    if (shut_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    const auto pending = InFlight();
    if (pending > 0) {
        LogInfo(kComponent, "waiting for " + std::to_string(pending) + " running call(s)");
    }
    pool_.join();
}

} // namespace toolhost
