#pragma once

#include <toolhost/core/result.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Bumped whenever ToolSpec, ToolCall or IToolRegistrar change layout.
#define TOOLHOST_PLUGIN_ABI_VERSION 1

namespace toolhost {

class ToolRegistry;

/// Parameter name that requests the live registry instead of a client value.
constexpr const char* kInjectedRegistryParam = "tool_registry";

// ---------------------------------------------------------------------------
// ToolParameter: one declared parameter. `type` is catalog metadata only
// ("int", "number", "string", "bool", "array", "object", "any").
// ---------------------------------------------------------------------------
struct ToolParameter {
    std::string name;
    std::string type = "any";
    std::string description;
    bool required = true;
};

// ---------------------------------------------------------------------------
// ToolCall: what a tool function receives.
//
// `args` is the caller's keyword-argument object, copied per call.
// `registry` is set only for tools that declare a `tool_registry` parameter;
// it is the snapshot the call was dispatched against.
// ---------------------------------------------------------------------------
struct ToolCall {
    nlohmann::json args = nlohmann::json::object();
    std::shared_ptr<const ToolRegistry> registry;
};

/// A tool body. Throwing reports `execution_error` to the caller.
using ToolFunction = std::function<nlohmann::json(const ToolCall& call)>;

// ---------------------------------------------------------------------------
// ToolSpec: what plugins hand to the registrar. Parameters are listed in
// declaration order; the description should be a short sentence.
// ---------------------------------------------------------------------------
struct ToolSpec {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    ToolFunction function;
};

// ---------------------------------------------------------------------------
// IToolRegistrar: sink for tool declarations during a scan.
//
// A plugin shared library exports:
//
//   extern "C" void toolhost_register_tools(toolhost::IToolRegistrar* r);
//   extern "C" int  toolhost_plugin_abi_version();   // optional
//
// and calls r->Register(...) once per tool.
// ---------------------------------------------------------------------------
class IToolRegistrar {
public:
    virtual ~IToolRegistrar() = default;
    virtual void Register(ToolSpec spec) = 0;
};

// ---------------------------------------------------------------------------
// Tool: an immutable, validated tool held by a registry snapshot.
// ---------------------------------------------------------------------------
class Tool {
public:
    /// Validate `spec` and derive the metadata. `origin` names where the tool
    /// came from (plugin path or "builtin"). `library` keeps the code that
    /// implements `spec.function` mapped for as long as the Tool lives.
    static Result<Tool, Error> FromSpec(ToolSpec spec, std::string origin,
                                        std::shared_ptr<const void> library = nullptr);

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] const std::string& Description() const noexcept { return description_; }
    [[nodiscard]] const std::string& Origin() const noexcept { return origin_; }

    /// Public parameters, in declaration order, without the injected one.
    [[nodiscard]] const std::vector<ToolParameter>& Parameters() const noexcept {
        return parameters_;
    }

    /// Computed once at load time from the declared parameter names.
    [[nodiscard]] bool NeedsRegistry() const noexcept { return needs_registry_; }

    /// Catalog entry: {"name", "description", "args_list": [...]}.
    [[nodiscard]] nlohmann::json Definition() const;

    [[nodiscard]] nlohmann::json Invoke(const ToolCall& call) const {
        return function_(call);
    }

private:
    Tool() = default;

    // Declared before function_ so the library is unmapped only after the
    // function object (whose code lives inside it) is destroyed.
    std::shared_ptr<const void> library_;
    std::string name_;
    std::string description_;
    std::string origin_;
    std::vector<ToolParameter> parameters_;
    bool needs_registry_ = false;
    ToolFunction function_;
};

} // namespace toolhost
