#pragma once

#include <toolhost/core/log.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

struct ServerConfig {
    std::string host = "localhost";
    uint16_t port = 8765;
    int io_threads = 1;
    int executor_threads = 4;
    std::size_t max_message_bytes = 1 << 20;
};

struct WatchConfig {
    bool enabled = true;
    int debounce_ms = 1000;
    int poll_interval_ms = 250;
};

struct AppConfig {
    ServerConfig server;
    std::vector<std::string> tool_repos; // scanned in this order
    std::string plugin_extension = ".so";
    std::string cache_dir;               // shadow copies; temp dir when empty
    WatchConfig watch;
    LogLevel log_level = LogLevel::Info;
    std::optional<std::string> log_file;
    bool json_logs = false;
};

// Values supplied by one configuration source on top of a base config.
// Unset fields leave the base untouched.
struct ConfigOverrides {
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<int> io_threads;
    std::optional<int> executor_threads;
    std::vector<std::string> tool_repos; // replaces the base list when non-empty
    std::optional<bool> watch_enabled;
    std::optional<int> debounce_ms;
    std::optional<LogLevel> log_level;
    std::optional<std::string> log_file;
    std::optional<bool> json_logs;
};

} // namespace toolhost
