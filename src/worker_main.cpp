#include <toolmux/core/log.hpp>
#include <toolmux/core/version.hpp>
#include <toolmux/mcp/builtin_tools.hpp>
#include <toolmux/mcp/mcp_server.hpp>

#include <argparse/argparse.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage   = 8;

std::string JoinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& n : names) {
        if (!joined.empty()) joined += "|";
        joined += n;
    }
    return joined;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace toolmux;

    argparse::ArgumentParser program("toolmux-worker", kVersion);
    program.add_description("Serves a built-in toolset over stdin/stdout (MCP stdio).");
    program.add_argument("--toolset")
        .help("Toolset to serve: " + JoinNames(ToolsetNames()))
        .required();
    program.add_argument("--name")
        .help("Server name announced during the handshake");
    program.add_argument("--log-level")
        .help("debug, info, warn or error (logs go to stderr)")
        .default_value(std::string("warn"));

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        std::cerr << "toolmux-worker: " << e.what() << "\n" << program;
        return kExitUsage;
    }

    auto level = ParseLogLevel(program.get<std::string>("--log-level"));
    if (!level) {
        std::cerr << "toolmux-worker: invalid --log-level '"
                  << program.get<std::string>("--log-level") << "'\n";
        return kExitUsage;
    }
    InitGlobalLogger(std::make_unique<ConsoleSink>(), *level);

    const auto toolset = program.get<std::string>("--toolset");
    auto registry = MakeToolset(toolset);
    if (!registry) {
        std::cerr << "toolmux-worker: unknown toolset '" << toolset
                  << "' (expected " << JoinNames(ToolsetNames()) << ")\n";
        return kExitUsage;
    }

    // A coordinator that goes away closes our stdout; die quietly on write.
    std::signal(SIGPIPE, SIG_DFL);

    std::string name = toolset == "math" ? "math-server" : "string-server";
    if (auto given = program.present("--name")) {
        name = *given;
    }

    std::ios::sync_with_stdio(false);
    McpServer server(std::move(*registry), name);
    server.Run();
    return kExitSuccess;
}
