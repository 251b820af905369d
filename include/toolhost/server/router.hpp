#pragma once

#include <toolhost/protocol/message.hpp>
#include <toolhost/protocol/validator.hpp>
#include <toolhost/registry/registry_handle.hpp>
#include <toolhost/server/tool_executor.hpp>

#include <optional>

namespace toolhost {

/// The one request type the server understands.
constexpr const char* kListToolRequestType = "list_tool";

// ---------------------------------------------------------------------------
// Router: dispatches a validated request by body type.
//
//   request_type "list_tool"   catalog of the current snapshot (synchronous)
//   other request_type         unknown_request_type (synchronous)
//   tool call, tool found      handed to the executor; `on_async` gets the
//                              response later and Route() returns nullopt
//   tool call, tool missing    tool_not_found (synchronous)
// ---------------------------------------------------------------------------
class Router {
public:
    Router(const RegistryHandle& registry, ToolExecutor& executor);

    [[nodiscard]] std::optional<Message> Route(const Request& request,
                                               ResponseCallback on_async) const;

private:
    const RegistryHandle& registry_;
    ToolExecutor& executor_;
};

} // namespace toolhost
