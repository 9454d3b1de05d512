#include <toolmux/config/config_loader.hpp>

#include <toolmux/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <set>
#include <utility>

namespace toolmux {

namespace {

constexpr TimeoutConfig kDefaultTimeouts{};

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", message);
}

// Build a WorkerConfig from one entry of the `workers` sequence.
Result<WorkerConfig, Error> ParseYamlWorker(const YAML::Node& node, std::size_t index) {
    const std::string where = "workers[" + std::to_string(index) + "]";
    if (!node.IsMap()) {
        return Result<WorkerConfig, Error>::Err(
            MakeConfigError(where + " must be a mapping"));
    }
    if (!node["name"]) {
        return Result<WorkerConfig, Error>::Err(
            MakeConfigError(where + " missing 'name' field"));
    }
    if (!node["command"]) {
        return Result<WorkerConfig, Error>::Err(
            MakeConfigError(where + " missing 'command' field"));
    }

    WorkerConfig worker;
    worker.name = node["name"].as<std::string>();
    worker.command = node["command"].as<std::string>();

    if (const auto args = node["args"]) {
        if (!args.IsSequence()) {
            return Result<WorkerConfig, Error>::Err(
                MakeConfigError(where + ".args must be a sequence"));
        }
        for (const auto& arg : args) {
            worker.args.push_back(arg.as<std::string>());
        }
    }

    if (const auto env = node["env"]) {
        if (!env.IsMap()) {
            return Result<WorkerConfig, Error>::Err(
                MakeConfigError(where + ".env must be a mapping"));
        }
        for (const auto& kv : env) {
            worker.env[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }

    return Result<WorkerConfig, Error>::Ok(std::move(worker));
}

Result<AppConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Config root must be a mapping"));
    }

    // -- Workers --
    if (const auto workers = root["workers"]) {
        if (!workers.IsSequence()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("'workers' must be a sequence"));
        }
        for (std::size_t i = 0; i < workers.size(); ++i) {
            auto worker = ParseYamlWorker(workers[i], i);
            if (worker.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(worker).Error());
            }
            config.workers.push_back(std::move(worker).Value());
        }
    }

    // -- Timeouts --
    if (const auto timeouts = root["timeouts"]) {
        if (timeouts["handshake_ms"]) {
            config.timeouts.handshake_ms = timeouts["handshake_ms"].as<int>();
        }
        if (timeouts["request_ms"]) {
            config.timeouts.request_ms = timeouts["request_ms"].as<int>();
        }
        if (timeouts["shutdown_ms"]) {
            config.timeouts.shutdown_ms = timeouts["shutdown_ms"].as<int>();
        }
    }

    // -- Options --
    if (root["log_level"]) {
        auto text = root["log_level"].as<std::string>();
        auto level = ParseLogLevel(text);
        if (!level) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid log_level: '" + text + "'"));
        }
        config.log_level = *level;
    }
    if (root["json_output"]) {
        config.json_output = root["json_output"].as<bool>();
    }
    if (root["verbose"]) {
        config.verbose = root["verbose"].as<bool>();
    }
    if (root["quiet"]) {
        config.quiet = root["quiet"].as<bool>();
    }
    if (root["color"]) {
        config.color = root["color"].as<bool>();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    try {
        return ParseYamlRoot(YAML::LoadFile(std::string(file_path)));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file '" + std::string(file_path) +
                            "': " + std::string(e.what())));
    }
}

Result<AppConfig, Error> LoadFromYamlString(std::string_view document) {
    try {
        return ParseYamlRoot(YAML::Load(std::string(document)));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
std::optional<Subcommand> ParseSubcommand(std::string_view word) {
    if (word == "list") return Subcommand::List;
    if (word == "call") return Subcommand::Call;
    if (word == "demo") return Subcommand::Demo;
    return std::nullopt;
}

Result<CliOptions, Error> LoadFromCli(Subcommand command, int argc,
                                      const char* const* argv) {
    // -v means --verbose here; main() handles --version itself.
    argparse::ArgumentParser program("toolmux", kVersion,
                                     argparse::default_arguments::help);

    if (command == Subcommand::Call) {
        program.add_argument("tool")
            .help("Name of the tool to invoke");
        program.add_argument("--args")
            .help("Tool arguments as a JSON object")
            .default_value(std::string("{}"));
    }

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--handshake-timeout")
        .help("Handshake timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--request-timeout")
        .help("Request timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    cli.command = command;

    if (command == Subcommand::Call) {
        cli.tool = program.get<std::string>("tool");
        const auto raw = program.get<std::string>("--args");
        auto parsed = nlohmann::json::parse(raw, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("--args must be a JSON object, got: " + raw));
        }
        cli.arguments = std::move(parsed);
    }

    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }

    auto& config = cli.overrides;
    if (auto val = program.present<int>("--handshake-timeout")) {
        config.timeouts.handshake_ms = *val;
    }
    if (auto val = program.present<int>("--request-timeout")) {
        config.timeouts.request_ms = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --log-level: '" + *val + "'"));
        }
        config.log_level = *level;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (program.get<bool>("--no-color")) {
        config.color = false;
    } else if (program.get<bool>("--color")) {
        config.color = true;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    // CLI workers replace YAML workers if present
    if (!cli_overrides.workers.empty()) {
        merged.workers = cli_overrides.workers;
    }

    // Timeouts
    if (cli_overrides.timeouts.handshake_ms != kDefaultTimeouts.handshake_ms) {
        merged.timeouts.handshake_ms = cli_overrides.timeouts.handshake_ms;
    }
    if (cli_overrides.timeouts.request_ms != kDefaultTimeouts.request_ms) {
        merged.timeouts.request_ms = cli_overrides.timeouts.request_ms;
    }
    if (cli_overrides.timeouts.shutdown_ms != kDefaultTimeouts.shutdown_ms) {
        merged.timeouts.shutdown_ms = cli_overrides.timeouts.shutdown_ms;
    }

    // Options
    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.color.has_value()) {
        merged.color = cli_overrides.color;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.workers.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("At least one worker must be configured"));
    }

    std::set<std::string> seen;
    for (const auto& worker : config.workers) {
        if (worker.name.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Worker name must not be empty"));
        }
        if (!seen.insert(worker.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate worker name: " + worker.name));
        }
        if (worker.command.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Worker '" + worker.name + "' has an empty command"));
        }
    }

    const std::pair<const char*, int> timeouts[] = {
        {"handshake_ms", config.timeouts.handshake_ms},
        {"request_ms", config.timeouts.request_ms},
        {"shutdown_ms", config.timeouts.shutdown_ms},
    };
    for (const auto& [key, value] : timeouts) {
        if (value <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError(std::string("Timeout ") + key +
                                " must be positive, got " + std::to_string(value)));
        }
    }

    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Defaults and conversions
// ---------------------------------------------------------------------------
std::vector<WorkerConfig> DefaultWorkerConfigs(const std::string& worker_path) {
    return {
        WorkerConfig{"math-server", worker_path,
                     {"--toolset", "math", "--name", "math-server"}, {}},
        WorkerConfig{"string-server", worker_path,
                     {"--toolset", "text", "--name", "string-server"}, {}},
    };
}

CoordinatorOptions ToCoordinatorOptions(const AppConfig& config) {
    CoordinatorOptions options;
    options.session.handshake_timeout =
        std::chrono::milliseconds(config.timeouts.handshake_ms);
    options.session.request_timeout =
        std::chrono::milliseconds(config.timeouts.request_ms);
    options.shutdown_grace = std::chrono::milliseconds(config.timeouts.shutdown_ms);
    return options;
}

LogLevel EffectiveLogLevel(const AppConfig& config) {
    if (config.log_level) {
        return *config.log_level;
    }
    if (config.verbose) {
        return LogLevel::Info;
    }
    if (config.quiet) {
        return LogLevel::Error;
    }
    return LogLevel::Warn;
}

} // namespace toolmux
