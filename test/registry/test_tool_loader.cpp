#include <catch2/catch_test_macros.hpp>

#include <toolhost/registry/builtin_tools.hpp>
#include <toolhost/registry/plugin_library.hpp>
#include <toolhost/registry/tool_loader.hpp>

#include "../support/test_support.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

using namespace toolhost;
using toolhost::testing::CopyPlugin;
using toolhost::testing::TempDir;
using nlohmann::json;

namespace {

LoaderOptions OptionsFor(const TempDir& dir, std::vector<std::filesystem::path> roots) {
    LoaderOptions options;
    options.roots = std::move(roots);
    options.cache_dir = dir / "cache";
    return options;
}

json CallTool(const ToolRegistry& registry, const std::string& name, json args = json::object()) {
    const auto* tool = registry.Find(name);
    REQUIRE(tool != nullptr);
    ToolCall call;
    call.args = std::move(args);
    return tool->Invoke(call);
}

std::vector<std::filesystem::path> SubdirectoriesOf(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> found;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (it->is_directory()) {
            found.push_back(it->path());
        }
    }
    return found;
}

} // anonymous namespace

// ===========================================================================
// Discovery
// ===========================================================================

TEST_CASE("ToolLoader: discovers plugins recursively in sorted order", "[registry][loader]") {
    TempDir dir;
    auto root = dir / "tools";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "b.so");
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "a/z.so");
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "c.so");
    toolhost::testing::WriteFile(root / "notes.txt", "not a plugin");

    ToolLoader loader(OptionsFor(dir, {root}));
    auto plugins = loader.DiscoverPlugins();
    REQUIRE(plugins.size() == 3);
    CHECK(plugins[0] == root / "a" / "z.so");
    CHECK(plugins[1] == root / "b.so");
    CHECK(plugins[2] == root / "c.so");
}

TEST_CASE("ToolLoader: roots are scanned in configured order", "[registry][loader]") {
    TempDir dir;
    auto first = dir / "first";
    auto second = dir / "second";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, second, "a.so");
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, first, "z.so");

    ToolLoader loader(OptionsFor(dir, {first, second}));
    auto plugins = loader.DiscoverPlugins();
    REQUIRE(plugins.size() == 2);
    CHECK(plugins[0] == first / "z.so");
    CHECK(plugins[1] == second / "a.so");
}

TEST_CASE("ToolLoader: honours the configured extension", "[registry][loader]") {
    TempDir dir;
    auto root = dir / "tools";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "basic.so");
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "basic.tool");

    auto options = OptionsFor(dir, {root});
    options.extension = ".tool";
    ToolLoader loader(options);
    auto plugins = loader.DiscoverPlugins();
    REQUIRE(plugins.size() == 1);
    CHECK(plugins[0].filename() == "basic.tool");
}

// ===========================================================================
// Load
// ===========================================================================

TEST_CASE("ToolLoader: loads plugin tools plus builtins", "[registry][loader]") {
    TempDir dir;
    auto root = dir / "tools";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "basic.so");

    ToolLoader loader(OptionsFor(dir, {root}));
    auto result = loader.Load();
    REQUIRE(result.IsOk());
    auto registry = result.Value();

    CHECK(registry->Version() == 1);
    for (const char* name : {"add", "echo", "greet", "boom", "sleep_then_echo",
                             "count_tools", "ping", "list_tools_available"}) {
        CHECK(registry->HasTool(name));
    }
    CHECK(registry->Find("add")->Origin() == (root / "basic.so").string());
    CHECK(registry->Find("ping")->Origin() == kBuiltinOrigin);
    CHECK(registry->Find("count_tools")->NeedsRegistry());
    CHECK(CallTool(*registry, "add", {{"a", 5}, {"b", 7}}) == 12);
}

TEST_CASE("ToolLoader: versions increase per scan", "[registry][loader]") {
    TempDir dir;
    ToolLoader loader(OptionsFor(dir, {}));
    auto first = loader.Load();
    auto second = loader.Load();
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    CHECK(second.Value()->Version() == first.Value()->Version() + 1);
}

TEST_CASE("ToolLoader: no roots yields only builtins", "[registry][loader]") {
    TempDir dir;
    ToolLoader loader(OptionsFor(dir, {}));
    auto result = loader.Load();
    REQUIRE(result.IsOk());
    CHECK(result.Value()->Names() ==
          std::vector<std::string>{"list_tools_available", "ping"});
}

TEST_CASE("ToolLoader: builtins can be left out", "[registry][loader]") {
    TempDir dir;
    auto options = OptionsFor(dir, {});
    options.include_builtins = false;
    ToolLoader loader(options);
    auto result = loader.Load();
    REQUIRE(result.IsOk());
    CHECK(result.Value()->Size() == 0);
}

TEST_CASE("ToolLoader: missing root only warns", "[registry][loader]") {
    TempDir dir;
    auto root = dir / "tools";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "basic.so");

    ToolLoader loader(OptionsFor(dir, {dir / "does-not-exist", root}));
    auto result = loader.Load();
    REQUIRE(result.IsOk());
    CHECK(result.Value()->HasTool("add"));
}

TEST_CASE("ToolLoader: later plugin wins, builtins cannot be shadowed", "[registry][loader]") {
    TempDir dir;
    auto root = dir / "tools";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "a_basic.so");
    CopyPlugin(TOOLHOST_TEST_PLUGIN_OVERRIDE, root, "b_override.so");

    ToolLoader loader(OptionsFor(dir, {root}));
    auto result = loader.Load();
    REQUIRE(result.IsOk());
    auto registry = result.Value();

    CHECK(registry->Find("echo")->Origin() == (root / "b_override.so").string());
    CHECK(CallTool(*registry, "echo", {{"message", "hi"}}) == "overridden");
    CHECK(CallTool(*registry, "shout", {{"message", "hi"}}) == "HI");
    CHECK(CallTool(*registry, "ping") == "pong");
    CHECK(registry->Find("add") != nullptr);
}

TEST_CASE("ToolLoader: same file name in two roots loads both", "[registry][loader]") {
    TempDir dir;
    auto first = dir / "first";
    auto second = dir / "second";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, first, "tools.so");
    CopyPlugin(TOOLHOST_TEST_PLUGIN_OVERRIDE, second, "tools.so");

    ToolLoader loader(OptionsFor(dir, {first, second}));
    auto result = loader.Load();
    REQUIRE(result.IsOk());
    CHECK(result.Value()->HasTool("add"));
    CHECK(result.Value()->HasTool("shout"));
    CHECK(CallTool(*result.Value(), "echo", {{"message", "x"}}) == "overridden");
}

TEST_CASE("ToolLoader: a failing plugin fails the whole scan", "[registry][loader]") {
    TempDir dir;
    auto root = dir / "tools";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "a_basic.so");

    SECTION("missing entry point") {
        CopyPlugin(TOOLHOST_TEST_PLUGIN_NO_ENTRY, root, "b_broken.so");
        ToolLoader loader(OptionsFor(dir, {root}));
        auto result = loader.Load();
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Load);
        CHECK(result.Error().message.find("b_broken.so") != std::string::npos);
        CHECK(result.Error().message.find(kRegisterToolsSymbol) != std::string::npos);
    }
    SECTION("ABI mismatch") {
        CopyPlugin(TOOLHOST_TEST_PLUGIN_BAD_ABI, root, "b_broken.so");
        ToolLoader loader(OptionsFor(dir, {root}));
        auto result = loader.Load();
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("ABI version") != std::string::npos);
    }
    SECTION("entry point throws") {
        CopyPlugin(TOOLHOST_TEST_PLUGIN_THROWING, root, "b_broken.so");
        ToolLoader loader(OptionsFor(dir, {root}));
        auto result = loader.Load();
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("plugin initialisation failed") != std::string::npos);
    }
    SECTION("not a shared library") {
        toolhost::testing::WriteFile(root / "b_broken.so", "garbage");
        ToolLoader loader(OptionsFor(dir, {root}));
        auto result = loader.Load();
        REQUIRE(result.IsErr());
        CHECK(result.Error().ExitCode() == 2);
    }
}

TEST_CASE("ToolLoader: plugin rewritten in place is picked up", "[registry][loader]") {
    TempDir dir;
    auto root = dir / "tools";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "tools.so");

    ToolLoader loader(OptionsFor(dir, {root}));
    auto first = loader.Load();
    REQUIRE(first.IsOk());
    CHECK(CallTool(*first.Value(), "echo", {{"message", "x"}}) == "x");

    // The first snapshot stays alive and usable while the file changes.
    CopyPlugin(TOOLHOST_TEST_PLUGIN_OVERRIDE, root, "tools.so");
    auto second = loader.Load();
    REQUIRE(second.IsOk());
    CHECK(CallTool(*second.Value(), "echo", {{"message", "x"}}) == "overridden");
    CHECK_FALSE(second.Value()->HasTool("add"));
    CHECK(CallTool(*first.Value(), "echo", {{"message", "x"}}) == "x");
}

TEST_CASE("ToolLoader: shadow copies are removed with the last snapshot", "[registry][loader]") {
    TempDir dir;
    auto root = dir / "tools";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root, "basic.so");

    ToolLoader loader(OptionsFor(dir, {root}));
    {
        auto result = loader.Load();
        REQUIRE(result.IsOk());
        auto scans = SubdirectoriesOf(dir / "cache");
        REQUIRE(scans.size() == 1);
        CHECK(scans[0].filename().string().rfind("scan-", 0) == 0);
        CHECK(std::filesystem::exists(scans[0] / "0-basic.so"));
    }
    CHECK(SubdirectoriesOf(dir / "cache").empty());
}

TEST_CASE("ToolLoader: two loaders sharing a cache dir keep their own copies",
          "[registry][loader]") {
    TempDir dir;
    // Same file name and index in both scans, different contents.
    auto root_a = dir / "a";
    auto root_b = dir / "b";
    CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, root_a, "tools.so");
    CopyPlugin(TOOLHOST_TEST_PLUGIN_OVERRIDE, root_b, "tools.so");

    ToolLoader loader_a(OptionsFor(dir, {root_a}));
    ToolLoader loader_b(OptionsFor(dir, {root_b}));

    auto from_a = loader_a.Load();
    REQUIRE(from_a.IsOk());
    auto from_b = loader_b.Load();
    REQUIRE(from_b.IsOk());
    auto registry_a = std::move(from_a).Value();
    auto registry_b = std::move(from_b).Value();
    CHECK(registry_a->Version() == registry_b->Version());

    CHECK(SubdirectoriesOf(dir / "cache").size() == 2);
    CHECK(CallTool(*registry_a, "echo", {{"message", "x"}}) == "x");
    CHECK(CallTool(*registry_a, "add", {{"a", 2}, {"b", 3}}) == 5);
    CHECK(CallTool(*registry_b, "echo", {{"message", "x"}}) == "overridden");
    CHECK_FALSE(registry_b->HasTool("add"));

    // Releasing one loader's snapshot leaves the other's copy in place.
    registry_b.reset();
    CHECK(SubdirectoriesOf(dir / "cache").size() == 1);
    CHECK(CallTool(*registry_a, "echo", {{"message", "y"}}) == "y");
}

TEST_CASE("PluginLibrary: refuses to overwrite an existing shadow file", "[registry][loader]") {
    TempDir dir;
    auto source = CopyPlugin(TOOLHOST_TEST_PLUGIN_BASIC, dir / "tools", "basic.so");
    auto shadow = dir / "cache" / "scan-x" / "0-basic.so";

    auto first = PluginLibrary::Open(source, shadow);
    REQUIRE(first.IsOk());

    auto second = PluginLibrary::Open(source, shadow);
    REQUIRE(second.IsErr());
    CHECK(second.Error().category == ErrorCategory::Load);
    CHECK(second.Error().message.find("cannot copy plugin") != std::string::npos);

    // The first library's file was left alone.
    CHECK(std::filesystem::exists(shadow));
    auto specs = first.Value()->CollectTools();
    REQUIRE(specs.IsOk());
    CHECK_FALSE(specs.Value().empty());
}

// ===========================================================================
// Example plugin
// ===========================================================================

#ifdef TOOLHOST_EXAMPLE_PLUGIN

TEST_CASE("Example plugin: math tools load and run", "[registry][loader][example]") {
    TempDir dir;
    auto root = dir / "tools";
    CopyPlugin(TOOLHOST_EXAMPLE_PLUGIN, root, "math_tools.so");

    ToolLoader loader(OptionsFor(dir, {root}));
    auto result = loader.Load();
    REQUIRE(result.IsOk());
    auto registry = result.Value();

    CHECK(CallTool(*registry, "add", {{"a", 5}, {"b", 7}}) == 12);
    CHECK(CallTool(*registry, "multiply", {{"a", 1.5}, {"b", 4}}) == 6.0);
    CHECK(CallTool(*registry, "echo", {{"message", "hello"}}) == "hello");

    ToolCall call;
    call.registry = registry;
    CHECK(registry->Find("tool_count")->Invoke(call) == registry->Size());
}
#endif
