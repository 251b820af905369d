#include <toolhost/config/config_loader.hpp>

#include <toolhost/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace toolhost {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", message);
}

std::string Trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return std::string(text.substr(first, last - first + 1));
}

std::optional<int> ParseInt(std::string_view text) {
    int value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

Result<uint16_t, Error> CheckPort(int value, const std::string& source) {
    if (value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
        return Result<uint16_t, Error>::Err(
            MakeConfigError("Invalid port in " + source + ": " + std::to_string(value)));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

Result<LogLevel, Error> CheckLogLevel(const std::string& text, const std::string& source) {
    auto level = ParseLogLevel(text);
    if (!level) {
        return Result<LogLevel, Error>::Err(
            MakeConfigError("Invalid log level in " + source + ": '" + text + "'"));
    }
    return Result<LogLevel, Error>::Ok(*level);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    if (root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Config file must contain a mapping: " + std::string(file_path)));
    }

    try {
        // -- Server --
        if (const auto server = root["server"]) {
            if (server["host"]) {
                config.server.host = server["host"].as<std::string>();
            }
            if (server["port"]) {
                auto port = CheckPort(server["port"].as<int>(), "config file");
                if (port.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(port).Error());
                }
                config.server.port = port.Value();
            }
            if (server["io_threads"]) {
                config.server.io_threads = server["io_threads"].as<int>();
            }
            if (server["executor_threads"]) {
                config.server.executor_threads = server["executor_threads"].as<int>();
            }
            if (server["max_message_bytes"]) {
                config.server.max_message_bytes = server["max_message_bytes"].as<std::size_t>();
            }
        }

        // -- Tools --
        if (const auto repos = root["tool_repos"]) {
            if (!repos.IsSequence()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("'tool_repos' must be a list of directories"));
            }
            for (const auto& repo : repos) {
                config.tool_repos.push_back(repo.as<std::string>());
            }
        }
        if (root["plugin_extension"]) {
            config.plugin_extension = root["plugin_extension"].as<std::string>();
        }
        if (root["cache_dir"]) {
            config.cache_dir = root["cache_dir"].as<std::string>();
        }

        // -- Watch --
        if (const auto watch = root["watch"]) {
            if (watch["enabled"]) {
                config.watch.enabled = watch["enabled"].as<bool>();
            }
            if (watch["debounce_ms"]) {
                config.watch.debounce_ms = watch["debounce_ms"].as<int>();
            }
            if (watch["poll_interval_ms"]) {
                config.watch.poll_interval_ms = watch["poll_interval_ms"].as<int>();
            }
        }

        // -- Logging --
        if (const auto log = root["log"]) {
            if (log["level"]) {
                auto level = CheckLogLevel(log["level"].as<std::string>(), "config file");
                if (level.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(level).Error());
                }
                config.log_level = level.Value();
            }
            if (log["file"]) {
                config.log_file = log["file"].as<std::string>();
            }
            if (log["json"]) {
                config.json_logs = log["json"].as<bool>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in config file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& getenv) {
    ConfigOverrides overrides;

    if (const char* host = getenv("TOOLHOST_HOST"); host && *host) {
        overrides.host = host;
    }
    if (const char* port = getenv("TOOLHOST_PORT"); port && *port) {
        auto value = ParseInt(Trim(port));
        if (!value) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("TOOLHOST_PORT is not a number: '" + std::string(port) + "'"));
        }
        auto checked = CheckPort(*value, "TOOLHOST_PORT");
        if (checked.IsErr()) {
            return Result<ConfigOverrides, Error>::Err(std::move(checked).Error());
        }
        overrides.port = checked.Value();
    }
    if (const char* repos = getenv("TOOLHOST_TOOL_REPOS"); repos && *repos) {
        std::stringstream ss{std::string(repos)};
        std::string item;
        while (std::getline(ss, item, ',')) {
            auto trimmed = Trim(item);
            if (!trimmed.empty()) {
                overrides.tool_repos.push_back(std::move(trimmed));
            }
        }
    }
    if (const char* level = getenv("TOOLHOST_LOG_LEVEL"); level && *level) {
        auto parsed = CheckLogLevel(level, "TOOLHOST_LOG_LEVEL");
        if (parsed.IsErr()) {
            return Result<ConfigOverrides, Error>::Err(std::move(parsed).Error());
        }
        overrides.log_level = parsed.Value();
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(overrides));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("toolhost serve", kVersion,
                                     argparse::default_arguments::help);
    int verbosity = 0;

    program.add_argument("--host")
        .help("Address to listen on");
    program.add_argument("--port")
        .help("Port to listen on")
        .scan<'i', int>();
    program.add_argument("--tool-repo")
        .help("Directory scanned for tool plugins (repeatable)")
        .append();
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--no-watch")
        .help("Do not reload tools when plugin files change")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debounce-ms")
        .help("Quiet period before a reload, in milliseconds")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Append log lines to this file");
    program.add_argument("--json-logs")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("More output (-vv for debug)")
        .action([&verbosity](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliConfig cli;
    auto& overrides = cli.overrides;

    if (auto val = program.present("--host")) {
        overrides.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        auto port = CheckPort(*val, "--port");
        if (port.IsErr()) {
            return Result<CliConfig, Error>::Err(std::move(port).Error());
        }
        overrides.port = port.Value();
    }
    if (auto val = program.present<std::vector<std::string>>("--tool-repo")) {
        overrides.tool_repos = *val;
    }
    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }
    if (program.get<bool>("--no-watch")) {
        overrides.watch_enabled = false;
    }
    if (auto val = program.present<int>("--debounce-ms")) {
        overrides.debounce_ms = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = CheckLogLevel(*val, "--log-level");
        if (level.IsErr()) {
            return Result<CliConfig, Error>::Err(std::move(level).Error());
        }
        overrides.log_level = level.Value();
    }
    if (auto val = program.present("--log-file")) {
        overrides.log_file = *val;
    }
    if (program.get<bool>("--json-logs")) {
        overrides.json_logs = true;
    }
    cli.verbosity = verbosity;
    cli.no_color = program.get<bool>("--no-color");

    // -v lowers the threshold unless a level was given explicitly.
    if (!overrides.log_level && verbosity > 0) {
        overrides.log_level = LogLevel::Debug;
    }

    return Result<CliConfig, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(AppConfig base, const ConfigOverrides& overrides) {
    if (overrides.host) {
        base.server.host = *overrides.host;
    }
    if (overrides.port) {
        base.server.port = *overrides.port;
    }
    if (overrides.io_threads) {
        base.server.io_threads = *overrides.io_threads;
    }
    if (overrides.executor_threads) {
        base.server.executor_threads = *overrides.executor_threads;
    }
    if (!overrides.tool_repos.empty()) {
        base.tool_repos = overrides.tool_repos;
    }
    if (overrides.watch_enabled) {
        base.watch.enabled = *overrides.watch_enabled;
    }
    if (overrides.debounce_ms) {
        base.watch.debounce_ms = *overrides.debounce_ms;
    }
    if (overrides.log_level) {
        base.log_level = *overrides.log_level;
    }
    if (overrides.log_file) {
        base.log_file = overrides.log_file;
    }
    if (overrides.json_logs) {
        base.json_logs = *overrides.json_logs;
    }
    return base;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server.host"));
    }
    if (config.server.port == 0) {
        return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
    }
    if (config.server.io_threads < 1) {
        return Result<void, Error>::Err(MakeConfigError(
            "server.io_threads must be at least 1, got " +
            std::to_string(config.server.io_threads)));
    }
    if (config.server.executor_threads < 1) {
        return Result<void, Error>::Err(MakeConfigError(
            "server.executor_threads must be at least 1, got " +
            std::to_string(config.server.executor_threads)));
    }
    if (config.server.max_message_bytes == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("server.max_message_bytes must be positive"));
    }
    if (config.watch.debounce_ms <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "watch.debounce_ms must be positive, got " +
            std::to_string(config.watch.debounce_ms)));
    }
    if (config.watch.poll_interval_ms <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "watch.poll_interval_ms must be positive, got " +
            std::to_string(config.watch.poll_interval_ms)));
    }
    if (config.plugin_extension.size() < 2 || config.plugin_extension.front() != '.') {
        return Result<void, Error>::Err(MakeConfigError(
            "plugin_extension must look like '.so', got '" + config.plugin_extension + "'"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(const CliConfig& cli, const EnvLookup& getenv) {
    AppConfig config;
    if (cli.config_path) {
        auto yaml = LoadFromYaml(*cli.config_path);
        if (yaml.IsErr()) {
            return yaml;
        }
        config = std::move(yaml).Value();
    }

    auto env = LoadFromEnv(getenv);
    if (env.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(env).Error());
    }
    config = MergeConfigs(std::move(config), env.Value());
    config = MergeConfigs(std::move(config), cli.overrides);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(valid).Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // namespace toolhost
