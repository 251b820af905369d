// Example tool plugin. Build it as a shared library and drop the result into
// a directory listed in `tool_repos`:
//
//   toolhost serve --tool-repo ./build/examples
//   toolhost call add --args '{"a": 5, "b": 7}'
#include <toolhost/registry/tool.hpp>
#include <toolhost/registry/tool_registry.hpp>

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

using toolhost::IToolRegistrar;
using toolhost::ToolCall;
using toolhost::ToolParameter;
using toolhost::ToolSpec;

extern "C" int toolhost_plugin_abi_version() {
    return TOOLHOST_PLUGIN_ABI_VERSION;
}

extern "C" void toolhost_register_tools(IToolRegistrar* registrar) {
    registrar->Register(ToolSpec{
        "add",
        "Add two integers.",
        {ToolParameter{"a", "int", "First addend", true},
         ToolParameter{"b", "int", "Second addend", true}},
        [](const ToolCall& call) -> nlohmann::json {
            return call.args.at("a").get<std::int64_t>() +
                   call.args.at("b").get<std::int64_t>();
        },
    });

    registrar->Register(ToolSpec{
        "multiply",
        "Multiply two numbers.",
        {ToolParameter{"a", "number", "First factor", true},
         ToolParameter{"b", "number", "Second factor", true}},
        [](const ToolCall& call) -> nlohmann::json {
            return call.args.at("a").get<double>() * call.args.at("b").get<double>();
        },
    });

    registrar->Register(ToolSpec{
        "echo",
        "Return the message unchanged.",
        {ToolParameter{"message", "string", "Text to return", true}},
        [](const ToolCall& call) -> nlohmann::json {
            return call.args.at("message").get<std::string>();
        },
    });

    // Declaring `tool_registry` makes the server pass the registry snapshot
    // the call runs against; clients never see or send this parameter.
    registrar->Register(ToolSpec{
        "tool_count",
        "Number of tools the server currently offers.",
        {ToolParameter{toolhost::kInjectedRegistryParam, "registry", "", true}},
        [](const ToolCall& call) -> nlohmann::json {
            return call.registry->Size();
        },
    });
}
