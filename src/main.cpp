#include <toolhost/app/toolhost_app.hpp>
#include <toolhost/client/client.hpp>
#include <toolhost/config/config_loader.hpp>
#include <toolhost/core/ansi.hpp>
#include <toolhost/core/log.hpp>
#include <toolhost/core/version.hpp>

#include <argparse/argparse.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig = 2;
constexpr int kExitInternal = 99;

enum class Subcommand { Serve, Call, List };

struct SubcommandParse {
    Subcommand cmd;
    bool found_subcommand;
};

// The first argument selects the subcommand; anything else means "serve".
SubcommandParse ParseSubcommand(int argc, const char* const* argv) {
    if (argc < 2) {
        return {Subcommand::Serve, false};
    }
    std::string_view arg1{argv[1]};
    if (arg1 == "serve") {
        return {Subcommand::Serve, true};
    }
    if (arg1 == "call") {
        return {Subcommand::Call, true};
    }
    if (arg1 == "list") {
        return {Subcommand::List, true};
    }
    return {Subcommand::Serve, false};
}

// Build argv without the subcommand token, so each parser sees plain flags.
std::vector<const char*> StripSubcommand(int argc, const char* const* argv,
                                         bool has_subcommand) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        if (has_subcommand && i == 1) {
            continue;
        }
        stripped.push_back(argv[i]);
    }
    return stripped;
}

bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "toolhost " << toolhost::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

bool HandleHelpFlag(int argc, const char* const* argv) {
    if (argc < 2) {
        return false;
    }
    auto arg = std::string_view{argv[1]};
    if (arg != "--help" && arg != "-h") {
        return false;
    }
    std::cout << "toolhost " << toolhost::kVersion << "\n\n"
              << "Usage:\n"
              << "  toolhost [serve] [--config FILE] [--host H] [--port P] [--tool-repo DIR]...\n"
              << "  toolhost call <tool> [--args JSON] [--host H] [--port P] [--timeout-ms MS]\n"
              << "  toolhost list [--host H] [--port P] [--json]\n\n"
              << "Run 'toolhost <command> --help' for the flags of one command.\n";
    return true;
}

void PrintError(const toolhost::Error& error, bool use_color) {
    std::cerr << toolhost::ansi::Paint("Error: ", toolhost::ansi::kBoldRed, use_color)
              << error.ToString() << "\n";
}

// Scan for -v/-vv/--no-color ahead of the subcommand parsers so the
// client commands can log while they parse.
struct OutputFlags {
    toolhost::LogLevel level = toolhost::LogLevel::Warn;
    bool no_color = false;
};

OutputFlags ScanOutputFlags(int argc, const char* const* argv) {
    OutputFlags flags;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "-vv") { flags.level = toolhost::LogLevel::Debug; }
        else if (arg == "-v" && flags.level != toolhost::LogLevel::Debug) {
            flags.level = toolhost::LogLevel::Info;
        }
        else if (arg == "--no-color") { flags.no_color = true; }
    }
    return flags;
}

// ---------------------------------------------------------------------------
// serve
// ---------------------------------------------------------------------------
int RunServe(int argc, const char* const* argv) {
    using namespace toolhost;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        PrintError(cli.Error(), ShouldUseColor(false, false));
        return cli.Error().ExitCode();
    }
    const bool use_color = ShouldUseColor(false, cli.Value().no_color);

    auto resolved = ResolveConfig(cli.Value(), [](const char* name) -> const char* {
        return std::getenv(name);
    });
    if (resolved.IsErr()) {
        PrintError(resolved.Error(), use_color);
        return resolved.Error().ExitCode();
    }
    auto config = std::move(resolved).Value();

    std::unique_ptr<ILogSink> sink;
    if (config.log_file) {
        auto file_sink = std::make_unique<FileSink>(*config.log_file, config.json_logs);
        if (!file_sink->IsOpen()) {
            PrintError(Error::Make(ErrorCategory::Config, "ConfigLoader",
                                   "cannot open log file " + *config.log_file),
                       use_color);
            return kExitConfig;
        }
        sink = std::move(file_sink);
    } else if (config.json_logs) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(use_color);
    }
    InitGlobalLogger(std::move(sink), config.log_level);

    if (config.tool_repos.empty()) {
        LogWarn("app", "no tool repositories configured; only built-in tools are served");
    }

    ToolhostApp app(config);
    auto started = app.Start();
    if (started.IsErr()) {
        PrintError(started.Error(), use_color);
        return started.Error().ExitCode();
    }

    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LogInfo("app", "received signal " + std::to_string(signal_number) +
                               ", shutting down");
        }
    });
    signal_ioc.run();

    app.Stop();
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// call / list
// ---------------------------------------------------------------------------
void AddClientArguments(argparse::ArgumentParser& program) {
    program.add_argument("--host")
        .help("Server host (default: TOOLHOST_HOST or localhost)");
    program.add_argument("--port")
        .help("Server port (default: TOOLHOST_PORT or 8765)")
        .scan<'i', int>();
    program.add_argument("--timeout-ms")
        .help("Give up waiting for the response after this long")
        .scan<'i', int>();
    program.add_argument("-v", "--verbose")
        .help("More output (-vv for debug)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
}

toolhost::Result<toolhost::ClientOptions, toolhost::Error> ReadClientOptions(
    const argparse::ArgumentParser& program) {
    using namespace toolhost;
    using OptionsResult = Result<ClientOptions, Error>;

    auto env = LoadFromEnv([](const char* name) -> const char* { return std::getenv(name); });
    if (env.IsErr()) {
        return OptionsResult::Err(std::move(env).Error());
    }

    ClientOptions options;
    if (env.Value().host) {
        options.host = *env.Value().host;
    }
    if (env.Value().port) {
        options.port = *env.Value().port;
    }
    if (auto host = program.present("--host")) {
        options.host = *host;
    }
    if (auto port = program.present<int>("--port")) {
        if (*port <= 0 || *port > 65535) {
            return OptionsResult::Err(Error::Make(ErrorCategory::Config, "ConfigLoader",
                                                  "Invalid port: " + std::to_string(*port)));
        }
        options.port = static_cast<uint16_t>(*port);
    }
    if (auto timeout = program.present<int>("--timeout-ms")) {
        if (*timeout <= 0) {
            return OptionsResult::Err(Error::Make(ErrorCategory::Config, "ConfigLoader",
                                                  "--timeout-ms must be positive"));
        }
        options.timeout = std::chrono::milliseconds(*timeout);
    }
    return OptionsResult::Ok(std::move(options));
}

int RunCall(int argc, const char* const* argv, bool use_color) {
    using namespace toolhost;

    argparse::ArgumentParser program("toolhost call", kVersion,
                                     argparse::default_arguments::help);
    program.add_argument("tool")
        .help("Name of the tool to call");
    program.add_argument("--args")
        .help("Keyword arguments as a JSON object")
        .default_value(std::string("{}"));
    AddClientArguments(program);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        PrintError(Error::Make(ErrorCategory::Config, "ConfigLoader",
                               "CLI parse error: " + std::string(e.what())),
                   use_color);
        return kExitConfig;
    }

    auto args = nlohmann::json::parse(program.get<std::string>("--args"), nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        auto error = Error::Make(ErrorCategory::Config, "ConfigLoader",
                                 "--args must be a JSON object");
        PrintError(error, use_color);
        return error.ExitCode();
    }

    auto options = ReadClientOptions(program);
    if (options.IsErr()) {
        PrintError(options.Error(), use_color);
        return options.Error().ExitCode();
    }

    Client client(std::move(options).Value());
    auto connected = client.Connect();
    if (connected.IsErr()) {
        PrintError(connected.Error(), use_color);
        return connected.Error().ExitCode();
    }

    auto result = client.Call(program.get<std::string>("tool"), args);
    client.Close();
    if (result.IsErr()) {
        PrintError(result.Error(), use_color);
        return result.Error().ExitCode();
    }
    std::cout << result.Value().dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << "\n";
    return kExitSuccess;
}

void PrintCatalog(const nlohmann::json& tools, bool use_color) {
    using namespace toolhost;
    for (const auto& tool : tools) {
        std::string signature;
        for (const auto& arg : tool.value("args_list", nlohmann::json::array())) {
            if (!signature.empty()) {
                signature += ", ";
            }
            signature += arg.value("name", "") + ":" + arg.value("type", "any");
            if (!arg.value("required", true)) {
                signature += "?";
            }
        }
        const auto name = tool.value("name", "");
        std::cout << ansi::Paint(name, ansi::kBold, use_color) << "(" << signature << ")  "
                  << ansi::Paint(tool.value("description", ""), ansi::kGray, use_color) << "\n";
    }
}

int RunList(int argc, const char* const* argv, bool use_color) {
    using namespace toolhost;

    argparse::ArgumentParser program("toolhost list", kVersion,
                                     argparse::default_arguments::help);
    program.add_argument("--json")
        .help("Print the raw catalog JSON")
        .default_value(false)
        .implicit_value(true);
    AddClientArguments(program);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        PrintError(Error::Make(ErrorCategory::Config, "ConfigLoader",
                               "CLI parse error: " + std::string(e.what())),
                   use_color);
        return kExitConfig;
    }

    auto options = ReadClientOptions(program);
    if (options.IsErr()) {
        PrintError(options.Error(), use_color);
        return options.Error().ExitCode();
    }

    Client client(std::move(options).Value());
    auto connected = client.Connect();
    if (connected.IsErr()) {
        PrintError(connected.Error(), use_color);
        return connected.Error().ExitCode();
    }

    auto tools = client.ListTools();
    client.Close();
    if (tools.IsErr()) {
        PrintError(tools.Error(), use_color);
        return tools.Error().ExitCode();
    }

    if (program.get<bool>("--json")) {
        std::cout << tools.Value().dump(2) << "\n";
    } else {
        PrintCatalog(tools.Value(), use_color);
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace toolhost;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }
    if (HandleHelpFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto [subcommand, has_subcommand] = ParseSubcommand(argc, argv);
    auto stripped = StripSubcommand(argc, argv, has_subcommand);
    auto stripped_argc = static_cast<int>(stripped.size());
    auto stripped_argv = stripped.data();

    try {
        if (subcommand == Subcommand::Serve) {
            return RunServe(stripped_argc, stripped_argv);
        }

        const auto flags = ScanOutputFlags(argc, argv);
        const bool use_color = ShouldUseColor(false, flags.no_color);
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), flags.level);

        if (subcommand == Subcommand::Call) {
            return RunCall(stripped_argc, stripped_argv, use_color);
        }
        return RunList(stripped_argc, stripped_argv, use_color);
    } catch (const std::exception& e) {
        std::cerr << "Error: internal error: " << e.what() << "\n";
        return kExitInternal;
    }
}
