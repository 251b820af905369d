#pragma once

#include <toolhost/registry/tool.hpp>

namespace toolhost {

/// Origin string carried by built-in tools.
constexpr const char* kBuiltinOrigin = "builtin";

// Register the built-in tools through the same registrar plugins use:
//   ping()                              -> "pong"
//   list_tools_available(tool_registry) -> catalog of the calling snapshot
void RegisterBuiltinTools(IToolRegistrar& registrar);

} // namespace toolhost
