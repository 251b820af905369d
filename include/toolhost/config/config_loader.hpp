#pragma once

#include <toolhost/config/app_config.hpp>
#include <toolhost/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace toolhost {

/// Environment lookup; returns nullptr for unset variables.
using EnvLookup = std::function<const char*(const char*)>;

// What `toolhost serve` read from its command line.
struct CliConfig {
    ConfigOverrides overrides;
    std::optional<std::string> config_path;
    int verbosity = 0;   // -v / -vv
    bool no_color = false;
};

// Parse a YAML config file into an AppConfig (defaults for absent keys).
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Read TOOLHOST_HOST, TOOLHOST_PORT, TOOLHOST_TOOL_REPOS (comma-separated)
// and TOOLHOST_LOG_LEVEL.
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& getenv);

// Parse `serve` flags. argv[0] is the program name; the subcommand itself
// must already be stripped.
Result<CliConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Apply `overrides` on top of `base`.
AppConfig MergeConfigs(AppConfig base, const ConfigOverrides& overrides);

// Validate that values are usable.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Full resolution: defaults < YAML (--config) < environment < command line,
// then validation.
Result<AppConfig, Error> ResolveConfig(const CliConfig& cli, const EnvLookup& getenv);

} // namespace toolhost
