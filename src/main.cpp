#include <toolmux/cli/output_formatter.hpp>
#include <toolmux/config/config_loader.hpp>
#include <toolmux/coordinator/coordinator.hpp>
#include <toolmux/core/ansi.hpp>
#include <toolmux/core/log.hpp>
#include <toolmux/core/terminal.hpp>
#include <toolmux/core/version.hpp>

#include <nlohmann/json.hpp>

#include <unistd.h>

#include <climits>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage   = 8;

constexpr const char* kWorkerBinary = "toolmux-worker";

// Flags that consume the following argument.
const std::set<std::string_view>& ValueFlags() {
    static const std::set<std::string_view> flags = {
        "-c", "--config", "--args", "--log-level",
        "--handshake-timeout", "--request-timeout",
    };
    return flags;
}

// Index of the subcommand word in argv, or -1 when there is none.
int FindSubcommandIndex(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (ValueFlags().count(arg) > 0) {
            ++i; // skip flag value
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            continue;
        }
        return i;
    }
    return -1;
}

// Resolve color mode for help output (stdout-based, before logger init).
bool ResolveColorForHelp(int argc, const char* const* argv) {
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color") force_color = true;
        if (arg == "--no-color") force_no_color = true;
    }
    if (toolmux::NoColorEnvSet()) force_no_color = true;
    return !force_no_color && (force_color || toolmux::IsStdoutTty());
}

void PrintTopLevelHelp(std::ostream& out, bool color) {
    using namespace toolmux::ansi;
    const char* bold = color ? kBold : "";
    const char* dim = color ? kDim : "";
    const char* reset = color ? kReset : "";

    out << bold << "toolmux" << reset << " " << toolmux::kVersion
        << ": route tool calls across MCP stdio workers\n\n"
        << bold << "Usage:" << reset << "\n"
        << "  toolmux list [-c FILE] [--json]\n"
        << "  toolmux call TOOL [--args JSON] [-c FILE] [--json]\n"
        << "  toolmux demo [-c FILE] [--json]\n\n"
        << bold << "Commands:" << reset << "\n"
        << "  list   Connect to every worker and print the merged tool catalog\n"
        << "  call   Connect and invoke one tool, print its text result\n"
        << "  demo   Run add, multiply, uppercase and concat against the workers\n\n"
        << bold << "Options:" << reset << "\n"
        << "  -c, --config FILE          YAML config (workers, timeouts, logging)\n"
        << "      --args JSON            Tool arguments as a JSON object (call)\n"
        << "      --handshake-timeout MS Handshake timeout in milliseconds\n"
        << "      --request-timeout MS   Request timeout in milliseconds\n"
        << "      --log-level LEVEL      debug, info, warn or error\n"
        << "      --json                 Machine-readable output\n"
        << "      --color, --no-color    Force or disable colored output\n"
        << "  -v, --verbose              Log progress to stderr\n"
        << "  -q, --quiet                Log errors only\n"
        << "      --version              Print the version and exit\n"
        << "  -h, --help                 Print this help and exit\n\n"
        << dim << "Without -c, math-server and string-server are started from "
        << kWorkerBinary << " next to this executable." << reset << "\n";
}

// Check for --version or --help before the subcommand word.
bool HandleInfoFlags(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "toolmux " << toolmux::kVersion << "\n";
            return true;
        }
        if (arg == "--help" || arg == "-h") {
            PrintTopLevelHelp(std::cout, ResolveColorForHelp(argc, argv));
            return true;
        }
        if (ValueFlags().count(arg) > 0) {
            ++i;
            continue;
        }
        // Stop at first positional (non-flag) argument.
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

// toolmux-worker in the directory of this executable, else looked up on PATH.
std::string DefaultWorkerPath() {
    char buffer[PATH_MAX];
    auto len = ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len <= 0) {
        return kWorkerBinary;
    }
    std::string self(buffer, static_cast<std::size_t>(len));
    auto slash = self.rfind('/');
    if (slash == std::string::npos) {
        return kWorkerBinary;
    }
    return self.substr(0, slash + 1) + kWorkerBinary;
}

struct DemoStep {
    std::string tool;
    nlohmann::json arguments;
};

std::vector<DemoStep> DemoSteps() {
    return {
        {"add", {{"a", 5}, {"b", 3}}},
        {"multiply", {{"a", 7}, {"b", 6}}},
        {"uppercase", {{"text", "hello world"}}},
        {"concat", {{"a", "Hello"}, {"b", "MCP"}, {"separator", ", "}}},
    };
}

int RunList(toolmux::Coordinator& coordinator,
            const toolmux::OutputFormatter& fmt) {
    fmt.PrintTools(coordinator.ListAllTools());
    return kExitSuccess;
}

int RunCall(toolmux::Coordinator& coordinator,
            const toolmux::OutputFormatter& fmt,
            const toolmux::CliOptions& cli) {
    auto result = coordinator.CallTool(cli.tool, cli.arguments);
    if (result.IsErr()) {
        fmt.PrintError(result.Error());
        return result.Error().ExitCode();
    }
    fmt.PrintToolResult(cli.tool, result.Value());
    return kExitSuccess;
}

int RunDemo(toolmux::Coordinator& coordinator,
            const toolmux::OutputFormatter& fmt) {
    auto report = nlohmann::json::array();
    std::vector<std::vector<std::string>> rows;

    for (const auto& step : DemoSteps()) {
        auto result = coordinator.CallTool(step.tool, step.arguments);
        if (result.IsErr()) {
            fmt.PrintError(result.Error());
            return result.Error().ExitCode();
        }
        const std::string server = coordinator.ResolveTool(step.tool).ValueOr("");
        report.push_back({
            {"tool", step.tool},
            {"server", server},
            {"arguments", step.arguments},
            {"result", result.Value()}
        });
        rows.push_back({step.tool, server, step.arguments.dump(), result.Value()});
    }

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(report.dump());
    } else {
        fmt.PrintTable({"tool", "server", "arguments", "result"}, rows);
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace toolmux;

    // No arguments: print top-level help.
    if (argc == 1) {
        PrintTopLevelHelp(std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    if (HandleInfoFlags(argc, argv)) {
        return kExitSuccess;
    }

    // Detect the subcommand and strip it so argparse only sees flags.
    const int sub_index = FindSubcommandIndex(argc, argv);
    if (sub_index < 0) {
        OutputFormatter(false).PrintError(Error::Make(
            ErrorCategory::Config, "ConfigLoader", "No command given (list, call, demo)"));
        return kExitUsage;
    }
    auto command = ParseSubcommand(argv[sub_index]);
    if (!command) {
        OutputFormatter(false).PrintError(Error::Make(
            ErrorCategory::Config, "ConfigLoader",
            "Unknown command '" + std::string(argv[sub_index]) +
                "' (expected list, call or demo)"));
        return kExitUsage;
    }

    std::vector<const char*> stripped;
    for (int i = 0; i < argc; ++i) {
        if (i != sub_index) stripped.push_back(argv[i]);
    }

    auto cli_result = LoadFromCli(*command, static_cast<int>(stripped.size()),
                                  stripped.data());
    if (cli_result.IsErr()) {
        OutputFormatter(false).PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    auto cli = std::move(cli_result).Value();

    // Load YAML config if -c/--config was given, merge with CLI.
    AppConfig config;
    if (cli.config_path) {
        auto yaml_result = LoadFromYaml(*cli.config_path);
        if (yaml_result.IsErr()) {
            OutputFormatter(cli.overrides.json_output).PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli.overrides);
    } else {
        config = cli.overrides;
    }
    if (config.workers.empty()) {
        config.workers = DefaultWorkerConfigs(DefaultWorkerPath());
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        OutputFormatter(config.json_output).PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // NO_COLOR env var (https://no-color.org/).
    // An explicit --color/--no-color (or `color:` in YAML) wins.
    const bool use_color = config.color.value_or(!NoColorEnvSet() && IsStdoutTty());
    const bool log_color = config.color.value_or(!NoColorEnvSet() && IsStderrTty());
    if (config.json_output) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), EffectiveLogLevel(config));
    } else {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(log_color),
                         EffectiveLogLevel(config));
    }

    OutputFormatter fmt(config.json_output, use_color);

    Coordinator coordinator(ToCoordinatorOptions(config));
    coordinator.Open();
    for (const auto& worker : config.workers) {
        coordinator.AddServer(worker);
    }

    int exit_code = kExitSuccess;
    auto connected = coordinator.ConnectAll();
    if (connected.IsErr()) {
        fmt.PrintError(connected.Error());
        exit_code = connected.Error().ExitCode();
    } else {
        switch (*command) {
            case Subcommand::List:
                exit_code = RunList(coordinator, fmt);
                break;
            case Subcommand::Call:
                exit_code = RunCall(coordinator, fmt, cli);
                break;
            case Subcommand::Demo:
                exit_code = RunDemo(coordinator, fmt);
                break;
        }
    }

    // Teardown failures are logged by the coordinator; they do not change
    // the outcome of the command.
    auto teardown = coordinator.Close();
    if (!teardown.empty()) {
        LogWarn("main", std::to_string(teardown.size()) +
                            " worker(s) did not shut down cleanly");
    }
    return exit_code;
}
