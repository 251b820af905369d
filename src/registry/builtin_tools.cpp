#include <toolhost/registry/builtin_tools.hpp>

#include <toolhost/registry/tool_registry.hpp>

#include <stdexcept>

namespace toolhost {

void RegisterBuiltinTools(IToolRegistrar& registrar) {
    registrar.Register(ToolSpec{
        "ping",
        "Check that the server is responsive. Returns 'pong'.",
        {},
        [](const ToolCall&) -> nlohmann::json { return "pong"; },
    });

    registrar.Register(ToolSpec{
        "list_tools_available",
        "List the definitions of all tools currently available on the server.",
        {ToolParameter{kInjectedRegistryParam, "registry", "", true}},
        [](const ToolCall& call) -> nlohmann::json {
            if (!call.registry) {
                throw std::logic_error("registry was not injected");
            }
            return call.registry->Catalog();
        },
    });
}

} // namespace toolhost
