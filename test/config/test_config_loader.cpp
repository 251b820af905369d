#include <catch2/catch_test_macros.hpp>

#include <toolhost/config/config_loader.hpp>

#include "../support/test_support.hpp"

#include <map>
#include <string>
#include <vector>

using namespace toolhost;

// ===========================================================================
// Helpers
// ===========================================================================

namespace {

// Tests are run from the build directory; testdata lives in the source tree.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);          // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/')); // .../test
    return test_root + "/testdata/" + filename;
}

// A fake environment for LoadFromEnv / ResolveConfig.
class FakeEnv {
public:
    FakeEnv(std::initializer_list<std::pair<const std::string, std::string>> vars)
        : vars_(vars) {}

    EnvLookup Lookup() const {
        return [this](const char* name) -> const char* {
            auto it = vars_.find(name);
            return it == vars_.end() ? nullptr : it->second.c_str();
        };
    }

private:
    std::map<std::string, std::string> vars_;
};

Result<CliConfig, Error> ParseServe(std::vector<const char*> args) {
    args.insert(args.begin(), "toolhost");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 9100);
    CHECK(config.server.io_threads == 2);
    CHECK(config.server.executor_threads == 8);
    CHECK(config.server.max_message_bytes == 65536);
    REQUIRE(config.tool_repos.size() == 2);
    CHECK(config.tool_repos[0] == "/opt/tools/core");
    CHECK(config.tool_repos[1] == "/opt/tools/extra");
    CHECK(config.plugin_extension == ".so");
    CHECK(config.cache_dir == "/var/cache/toolhost");
    CHECK_FALSE(config.watch.enabled);
    CHECK(config.watch.debounce_ms == 500);
    CHECK(config.watch.poll_interval_ms == 100);
    CHECK(config.log_level == LogLevel::Debug);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/var/log/toolhost.log");
    CHECK(config.json_logs);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.host == "localhost");
    CHECK(config.server.port == 8765);
    CHECK(config.watch.enabled);
    CHECK(config.watch.debounce_ms == 1000);
    CHECK(config.log_level == LogLevel::Info);
    CHECK_FALSE(config.log_file.has_value());
    REQUIRE(config.tool_repos.size() == 1);
    CHECK(config.tool_repos[0] == "./tools");
}

TEST_CASE("LoadFromYaml: empty file yields defaults", "[config][yaml]") {
    toolhost::testing::TempDir dir;
    auto path = dir / "empty.yaml";
    toolhost::testing::WriteFile(path, "");

    auto result = LoadFromYaml(path.string());
    REQUIRE(result.IsOk());
    CHECK(result.Value().server.port == 8765);
    CHECK(result.Value().tool_repos.empty());
}

TEST_CASE("LoadFromYaml: error cases", "[config][yaml]") {
    SECTION("missing file") {
        auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
        CHECK(result.Error().ExitCode() == 2);
    }
    SECTION("malformed YAML") {
        auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
    }
    SECTION("port out of range") {
        auto result = LoadFromYaml(TestDataPath("invalid_port.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("70000") != std::string::npos);
    }
    SECTION("root is not a mapping") {
        auto result = LoadFromYaml(TestDataPath("not_a_map.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("mapping") != std::string::npos);
    }
    SECTION("tool_repos is not a list") {
        auto result = LoadFromYaml(TestDataPath("bad_repos.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("tool_repos") != std::string::npos);
    }
    SECTION("unknown log level") {
        auto result = LoadFromYaml(TestDataPath("bad_log_level.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("loud") != std::string::npos);
    }
}

// ===========================================================================
// LoadFromEnv
// ===========================================================================

TEST_CASE("LoadFromEnv: reads all variables", "[config][env]") {
    FakeEnv env{{"TOOLHOST_HOST", "127.0.0.1"},
                {"TOOLHOST_PORT", "9001"},
                {"TOOLHOST_TOOL_REPOS", " /a , /b,,/c "},
                {"TOOLHOST_LOG_LEVEL", "WARN"}};

    auto result = LoadFromEnv(env.Lookup());
    REQUIRE(result.IsOk());
    const auto& o = result.Value();
    REQUIRE(o.host.has_value());
    CHECK(*o.host == "127.0.0.1");
    REQUIRE(o.port.has_value());
    CHECK(*o.port == 9001);
    CHECK(o.tool_repos == std::vector<std::string>{"/a", "/b", "/c"});
    REQUIRE(o.log_level.has_value());
    CHECK(*o.log_level == LogLevel::Warn);
}

TEST_CASE("LoadFromEnv: unset and empty variables leave overrides empty", "[config][env]") {
    FakeEnv env{{"TOOLHOST_HOST", ""}};
    auto result = LoadFromEnv(env.Lookup());
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().host.has_value());
    CHECK_FALSE(result.Value().port.has_value());
    CHECK(result.Value().tool_repos.empty());
}

TEST_CASE("LoadFromEnv: rejects bad values", "[config][env]") {
    SECTION("non-numeric port") {
        FakeEnv env{{"TOOLHOST_PORT", "eighty"}};
        auto result = LoadFromEnv(env.Lookup());
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("TOOLHOST_PORT") != std::string::npos);
    }
    SECTION("port zero") {
        FakeEnv env{{"TOOLHOST_PORT", "0"}};
        CHECK(LoadFromEnv(env.Lookup()).IsErr());
    }
    SECTION("unknown log level") {
        FakeEnv env{{"TOOLHOST_LOG_LEVEL", "chatty"}};
        CHECK(LoadFromEnv(env.Lookup()).IsErr());
    }
}

TEST_CASE("LoadFromEnv: works with the process environment", "[config][env]") {
    toolhost::testing::SetEnv("TOOLHOST_HOST", "env-host");
    auto result = LoadFromEnv([](const char* name) { return std::getenv(name); });
    toolhost::testing::UnsetEnv("TOOLHOST_HOST");

    REQUIRE(result.IsOk());
    REQUIRE(result.Value().host.has_value());
    CHECK(*result.Value().host == "env-host");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no flags yields empty overrides", "[config][cli]") {
    auto result = ParseServe({});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK_FALSE(cli.overrides.host.has_value());
    CHECK_FALSE(cli.overrides.port.has_value());
    CHECK_FALSE(cli.overrides.watch_enabled.has_value());
    CHECK_FALSE(cli.config_path.has_value());
    CHECK(cli.verbosity == 0);
    CHECK_FALSE(cli.no_color);
}

TEST_CASE("LoadFromCli: parses serve flags", "[config][cli]") {
    auto result = ParseServe({"--host", "0.0.0.0", "--port", "9200",
                              "--tool-repo", "/one", "--tool-repo", "/two",
                              "-c", "toolhost.yaml", "--no-watch",
                              "--debounce-ms", "250", "--log-file", "/tmp/t.log",
                              "--json-logs", "--no-color"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(*cli.overrides.host == "0.0.0.0");
    CHECK(*cli.overrides.port == 9200);
    CHECK(cli.overrides.tool_repos == std::vector<std::string>{"/one", "/two"});
    CHECK(*cli.config_path == "toolhost.yaml");
    CHECK(*cli.overrides.watch_enabled == false);
    CHECK(*cli.overrides.debounce_ms == 250);
    CHECK(*cli.overrides.log_file == "/tmp/t.log");
    CHECK(*cli.overrides.json_logs);
    CHECK(cli.no_color);
}

TEST_CASE("LoadFromCli: -v selects debug unless --log-level is given", "[config][cli]") {
    SECTION("-v alone") {
        auto result = ParseServe({"-v"});
        REQUIRE(result.IsOk());
        CHECK(result.Value().verbosity == 1);
        CHECK(*result.Value().overrides.log_level == LogLevel::Debug);
    }
    SECTION("explicit level wins") {
        auto result = ParseServe({"-v", "--log-level", "error"});
        REQUIRE(result.IsOk());
        CHECK(*result.Value().overrides.log_level == LogLevel::Error);
    }
}

TEST_CASE("LoadFromCli: rejects bad input", "[config][cli]") {
    SECTION("port out of range") {
        auto result = ParseServe({"--port", "99999"});
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
    SECTION("unknown flag") {
        CHECK(ParseServe({"--frobnicate"}).IsErr());
    }
    SECTION("bad log level") {
        CHECK(ParseServe({"--log-level", "shouty"}).IsErr());
    }
}

// ===========================================================================
// MergeConfigs / ValidateConfig
// ===========================================================================

TEST_CASE("MergeConfigs: only set fields override", "[config][merge]") {
    AppConfig base;
    base.server.host = "base-host";
    base.tool_repos = {"/base"};

    ConfigOverrides overrides;
    overrides.port = 9999;
    overrides.watch_enabled = false;

    auto merged = MergeConfigs(base, overrides);
    CHECK(merged.server.host == "base-host");
    CHECK(merged.server.port == 9999);
    CHECK(merged.tool_repos == std::vector<std::string>{"/base"});
    CHECK_FALSE(merged.watch.enabled);

    overrides.tool_repos = {"/x", "/y"};
    merged = MergeConfigs(base, overrides);
    CHECK(merged.tool_repos == std::vector<std::string>{"/x", "/y"});
}

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: rejects unusable values", "[config][validate]") {
    AppConfig config;
    SECTION("empty host") { config.server.host.clear(); }
    SECTION("port zero") { config.server.port = 0; }
    SECTION("no io threads") { config.server.io_threads = 0; }
    SECTION("no executor threads") { config.server.executor_threads = 0; }
    SECTION("zero message limit") { config.server.max_message_bytes = 0; }
    SECTION("zero debounce") { config.watch.debounce_ms = 0; }
    SECTION("zero poll interval") { config.watch.poll_interval_ms = 0; }
    SECTION("extension without dot") { config.plugin_extension = "so"; }

    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// ResolveConfig: precedence
// ===========================================================================

TEST_CASE("ResolveConfig: yaml < env < cli", "[config][resolve]") {
    auto cli = ParseServe({"-c", TestDataPath("valid_config.yaml").c_str(), "--port", "9300"});
    REQUIRE(cli.IsOk());
    FakeEnv env{{"TOOLHOST_HOST", "env-host"}, {"TOOLHOST_PORT", "9200"}};

    auto result = ResolveConfig(cli.Value(), env.Lookup());
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.server.host == "env-host");    // env over yaml
    CHECK(config.server.port == 9300);          // cli over env
    CHECK(config.server.executor_threads == 8); // yaml over default
}

TEST_CASE("ResolveConfig: propagates yaml and env errors", "[config][resolve]") {
    SECTION("bad yaml") {
        auto cli = ParseServe({"-c", TestDataPath("malformed.yaml").c_str()});
        REQUIRE(cli.IsOk());
        CHECK(ResolveConfig(cli.Value(), FakeEnv{}.Lookup()).IsErr());
    }
    SECTION("bad env") {
        auto cli = ParseServe({});
        REQUIRE(cli.IsOk());
        FakeEnv env{{"TOOLHOST_PORT", "-3"}};
        CHECK(ResolveConfig(cli.Value(), env.Lookup()).IsErr());
    }
    SECTION("invalid after merge") {
        auto cli = ParseServe({"--debounce-ms", "0"});
        REQUIRE(cli.IsOk());
        auto result = ResolveConfig(cli.Value(), FakeEnv{}.Lookup());
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("debounce") != std::string::npos);
    }
}
