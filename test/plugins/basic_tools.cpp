// Test plugin: the tools exercised by the loader, executor and end-to-end
// tests.
#include <toolhost/registry/tool.hpp>
#include <toolhost/registry/tool_registry.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>

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
        "echo",
        "Return the message unchanged.",
        {ToolParameter{"message", "string", "Text to return", true}},
        [](const ToolCall& call) -> nlohmann::json {
            return call.args.at("message");
        },
    });

    registrar->Register(ToolSpec{
        "greet",
        "Greet someone.",
        {ToolParameter{"name", "string", "Who to greet", true},
         ToolParameter{"greeting", "string", "Defaults to Hello", false}},
        [](const ToolCall& call) -> nlohmann::json {
            return call.args.value("greeting", std::string("Hello")) + ", " +
                   call.args.at("name").get<std::string>();
        },
    });

    registrar->Register(ToolSpec{
        "boom",
        "Always fails.",
        {},
        [](const ToolCall&) -> nlohmann::json {
            throw std::runtime_error("kaboom");
        },
    });

    registrar->Register(ToolSpec{
        "sleep_then_echo",
        "Sleep for `ms` milliseconds, then return `value`.",
        {ToolParameter{"ms", "int", "Delay", true},
         ToolParameter{"value", "any", "Returned value", true}},
        [](const ToolCall& call) -> nlohmann::json {
            std::this_thread::sleep_for(
                std::chrono::milliseconds(call.args.at("ms").get<int>()));
            return call.args.at("value");
        },
    });

    registrar->Register(ToolSpec{
        "count_tools",
        "Number of tools in the calling snapshot.",
        {ToolParameter{toolhost::kInjectedRegistryParam, "registry", "", true}},
        [](const ToolCall& call) -> nlohmann::json {
            return call.registry ? call.registry->Size() : 0;
        },
    });
}
