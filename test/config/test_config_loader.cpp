#include <catch2/catch_test_macros.hpp>

#include <toolmux/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace toolmux;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the source tree from __FILE__.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

Result<CliOptions, Error> ParseCli(Subcommand command, std::vector<const char*> args) {
    args.insert(args.begin(), "toolmux");
    return LoadFromCli(command, static_cast<int>(args.size()), args.data());
}

AppConfig ValidConfig() {
    AppConfig config;
    config.workers = DefaultWorkerConfigs("/usr/bin/toolmux-worker");
    return config;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    REQUIRE(config.workers.size() == 2);
    CHECK(config.workers[0].name == "math-server");
    CHECK(config.workers[0].command == "toolmux-worker");
    CHECK(config.workers[0].args ==
          std::vector<std::string>{"--toolset", "math", "--name", "math-server"});
    CHECK(config.workers[0].env.empty());

    CHECK(config.workers[1].name == "string-server");
    CHECK(config.workers[1].command == "/opt/toolmux/bin/toolmux-worker");
    CHECK(config.workers[1].args == std::vector<std::string>{"--toolset", "text"});
    CHECK(config.workers[1].env.at("LANG") == "C");
    CHECK(config.workers[1].env.at("TOOLMUX_TRACE") == "1");

    CHECK(config.timeouts.handshake_ms == 5000);
    CHECK(config.timeouts.request_ms == 15000);
    CHECK(config.timeouts.shutdown_ms == 500);

    REQUIRE(config.log_level.has_value());
    CHECK(*config.log_level == LogLevel::Info);
    CHECK(config.json_output);
    REQUIRE(config.color.has_value());
    CHECK_FALSE(*config.color);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    REQUIRE(config.workers.size() == 1);
    CHECK(config.workers[0].args.empty());
    CHECK(config.timeouts.handshake_ms == 10000);
    CHECK(config.timeouts.request_ms == 30000);
    CHECK(config.timeouts.shutdown_ms == 2000);
    CHECK_FALSE(config.log_level.has_value());
    CHECK_FALSE(config.json_output);
    CHECK_FALSE(config.color.has_value());
}

TEST_CASE("LoadFromYaml: worker without command", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("missing_command.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("workers[0]") != std::string::npos);
    CHECK(result.Error().message.find("command") != std::string::npos);
}

TEST_CASE("LoadFromYaml: syntax error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_yaml.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: missing file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("does_not_exist.yaml") != std::string::npos);
}

TEST_CASE("LoadFromYamlString: shape errors", "[config][yaml]") {
    SECTION("workers is not a sequence") {
        auto result = LoadFromYamlString("workers: {name: x}");
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "'workers' must be a sequence");
    }
    SECTION("args is not a sequence") {
        auto result = LoadFromYamlString(
            "workers:\n  - name: a\n    command: b\n    args: --flag\n");
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "workers[0].args must be a sequence");
    }
    SECTION("env is not a mapping") {
        auto result = LoadFromYamlString(
            "workers:\n  - name: a\n    command: b\n    env: [A]\n");
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "workers[0].env must be a mapping");
    }
    SECTION("bad log level") {
        auto result = LoadFromYamlString("log_level: loud");
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Invalid log_level: 'loud'");
    }
    SECTION("timeout is not a number") {
        auto result = LoadFromYamlString("timeouts:\n  request_ms: soon\n");
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
    SECTION("root is a scalar") {
        auto result = LoadFromYamlString("just a string");
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Config root must be a mapping");
    }
}

TEST_CASE("LoadFromYamlString: empty document", "[config][yaml]") {
    auto result = LoadFromYamlString("");
    REQUIRE(result.IsOk());
    CHECK(result.Value().workers.empty());
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("ParseSubcommand: known and unknown words", "[config][cli]") {
    CHECK(ParseSubcommand("list") == Subcommand::List);
    CHECK(ParseSubcommand("call") == Subcommand::Call);
    CHECK(ParseSubcommand("demo") == Subcommand::Demo);
    CHECK_FALSE(ParseSubcommand("deploy").has_value());
}

TEST_CASE("LoadFromCli: list with no flags", "[config][cli]") {
    auto result = ParseCli(Subcommand::List, {});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.command == Subcommand::List);
    CHECK_FALSE(cli.config_path.has_value());
    CHECK(cli.overrides.workers.empty());
    CHECK_FALSE(cli.overrides.json_output);
    CHECK_FALSE(cli.overrides.color.has_value());
}

TEST_CASE("LoadFromCli: call with tool and arguments", "[config][cli]") {
    auto result = ParseCli(Subcommand::Call,
                           {"add", "--args", R"({"a": 5, "b": 3})", "--json"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.tool == "add");
    CHECK(cli.arguments["a"] == 5);
    CHECK(cli.arguments["b"] == 3);
    CHECK(cli.overrides.json_output);
}

TEST_CASE("LoadFromCli: call without --args sends an empty object", "[config][cli]") {
    auto result = ParseCli(Subcommand::Call, {"uppercase"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().arguments == nlohmann::json::object());
}

TEST_CASE("LoadFromCli: --args must be a JSON object", "[config][cli]") {
    auto array = ParseCli(Subcommand::Call, {"add", "--args", "[1, 2]"});
    REQUIRE(array.IsErr());
    CHECK(array.Error().category == ErrorCategory::Config);

    auto garbage = ParseCli(Subcommand::Call, {"add", "--args", "{a:"});
    REQUIRE(garbage.IsErr());
}

TEST_CASE("LoadFromCli: call without a tool name", "[config][cli]") {
    auto result = ParseCli(Subcommand::Call, {});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: timeouts, logging and color", "[config][cli]") {
    auto result = ParseCli(Subcommand::Demo,
                           {"-c", "toolmux.yaml", "--handshake-timeout", "250",
                            "--request-timeout", "750", "--log-level", "debug",
                            "--no-color", "-v"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    REQUIRE(cli.config_path.has_value());
    CHECK(*cli.config_path == "toolmux.yaml");
    CHECK(cli.overrides.timeouts.handshake_ms == 250);
    CHECK(cli.overrides.timeouts.request_ms == 750);
    CHECK(cli.overrides.log_level == LogLevel::Debug);
    CHECK(cli.overrides.color == false);
    CHECK(cli.overrides.verbose);
}

TEST_CASE("LoadFromCli: invalid log level", "[config][cli]") {
    auto result = ParseCli(Subcommand::List, {"--log-level", "chatty"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid --log-level: 'chatty'");
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    auto result = ParseCli(Subcommand::List, {"--frobnicate"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML", "[config][merge]") {
    AppConfig yaml;
    yaml.workers = {{"from-yaml", "a", {}, {}}};
    yaml.timeouts.request_ms = 15000;
    yaml.timeouts.handshake_ms = 4000;
    yaml.log_level = LogLevel::Info;
    yaml.color = true;

    AppConfig cli;
    cli.timeouts.request_ms = 500;
    cli.json_output = true;
    cli.color = false;

    auto merged = MergeConfigs(yaml, cli);
    REQUIRE(merged.workers.size() == 1);
    CHECK(merged.workers[0].name == "from-yaml");
    CHECK(merged.timeouts.request_ms == 500);
    CHECK(merged.timeouts.handshake_ms == 4000);
    CHECK(merged.log_level == LogLevel::Info);
    CHECK(merged.json_output);
    CHECK(merged.color == false);
}

TEST_CASE("MergeConfigs: CLI workers replace YAML workers", "[config][merge]") {
    AppConfig yaml;
    yaml.workers = {{"a", "x", {}, {}}, {"b", "y", {}, {}}};
    AppConfig cli;
    cli.workers = {{"c", "z", {}, {}}};

    auto merged = MergeConfigs(yaml, cli);
    REQUIRE(merged.workers.size() == 1);
    CHECK(merged.workers[0].name == "c");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: default workers are valid", "[config][validate]") {
    CHECK(ValidateConfig(ValidConfig()).IsOk());
}

TEST_CASE("ValidateConfig: rejects bad configurations", "[config][validate]") {
    auto config = ValidConfig();

    SECTION("no workers") {
        config.workers.clear();
        auto result = ValidateConfig(config);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "At least one worker must be configured");
    }
    SECTION("duplicate worker names") {
        config.workers[1].name = config.workers[0].name;
        auto result = ValidateConfig(config);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Duplicate worker name: math-server");
    }
    SECTION("empty worker name") {
        config.workers[0].name.clear();
        CHECK(ValidateConfig(config).IsErr());
    }
    SECTION("empty command") {
        config.workers[0].command.clear();
        auto result = ValidateConfig(config);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Worker 'math-server' has an empty command");
    }
    SECTION("non-positive timeout") {
        config.timeouts.request_ms = 0;
        auto result = ValidateConfig(config);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Timeout request_ms must be positive, got 0");
    }
    SECTION("verbose and quiet") {
        config.verbose = true;
        config.quiet = true;
        auto result = ValidateConfig(config);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Cannot use both --verbose and --quiet");
    }
}

// ===========================================================================
// Defaults and conversions
// ===========================================================================

TEST_CASE("DefaultWorkerConfigs: math and string servers", "[config]") {
    auto workers = DefaultWorkerConfigs("/opt/bin/toolmux-worker");
    REQUIRE(workers.size() == 2);
    CHECK(workers[0].name == "math-server");
    CHECK(workers[0].command == "/opt/bin/toolmux-worker");
    CHECK(workers[0].args[1] == "math");
    CHECK(workers[1].name == "string-server");
    CHECK(workers[1].args[1] == "text");
}

TEST_CASE("ToCoordinatorOptions: copies timeouts", "[config]") {
    AppConfig config;
    config.timeouts = {100, 200, 300};
    auto options = ToCoordinatorOptions(config);
    CHECK(options.session.handshake_timeout == std::chrono::milliseconds(100));
    CHECK(options.session.request_timeout == std::chrono::milliseconds(200));
    CHECK(options.shutdown_grace == std::chrono::milliseconds(300));
}

TEST_CASE("EffectiveLogLevel: explicit level wins over flags", "[config]") {
    AppConfig config;
    CHECK(EffectiveLogLevel(config) == LogLevel::Warn);
    config.verbose = true;
    CHECK(EffectiveLogLevel(config) == LogLevel::Info);
    config.verbose = false;
    config.quiet = true;
    CHECK(EffectiveLogLevel(config) == LogLevel::Error);
    config.log_level = LogLevel::Debug;
    CHECK(EffectiveLogLevel(config) == LogLevel::Debug);
}
