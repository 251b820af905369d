#include <toolhost/server/router.hpp>

#include <toolhost/core/log.hpp>

namespace toolhost {

Router::Router(const RegistryHandle& registry, ToolExecutor& executor)
    : registry_(registry), executor_(executor) {}

std::optional<Message> Router::Route(const Request& request,
                                     ResponseCallback on_async) const {
    const auto& correlation_id = request.header.correlation_id;
    // One snapshot for the whole request.
    auto snapshot = registry_.Current();

    if (request.kind == RequestKind::RequestType) {
        if (request.request_type == kListToolRequestType) {
            return MakeListToolsResponse(correlation_id, snapshot->Catalog());
        }
        LogDebug("router", "unknown request type '" + request.request_type + "'");
        return MakeErrorResponse(
            correlation_id,
            Error::Make(ErrorCategory::UnknownRequestType, "Router::Route",
                        "Unknown request type: '" + request.request_type + "'"));
    }

    const Tool* tool = snapshot->Find(request.tool);
    if (tool == nullptr) {
        LogDebug("router", "tool '" + request.tool + "' not found in registry #" +
                               std::to_string(snapshot->Version()));
        return MakeErrorResponse(
            correlation_id,
            Error::Make(ErrorCategory::ToolNotFound, "Router::Route",
                        "Tool '" + request.tool + "' not found"));
    }

    executor_.Submit(std::move(snapshot), tool, request, std::move(on_async));
    return std::nullopt;
}

} // namespace toolhost
