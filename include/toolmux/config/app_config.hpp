#pragma once

#include <toolmux/core/log.hpp>
#include <toolmux/core/types.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolmux {

enum class Subcommand {
    List,
    Call,
    Demo,
};

struct TimeoutConfig {
    int handshake_ms = 10000;
    int request_ms = 30000;
    int shutdown_ms = 2000;
};

struct AppConfig {
    std::vector<WorkerConfig> workers;
    TimeoutConfig timeouts;
    std::optional<LogLevel> log_level;  // explicit level wins over -v/-q
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    std::optional<bool> color;          // unset: decide from the terminal
};

// What the command line asked for, on top of the config overrides.
struct CliOptions {
    Subcommand command = Subcommand::List;
    AppConfig overrides;
    std::optional<std::string> config_path;
    std::string tool;                                      // call only
    nlohmann::json arguments = nlohmann::json::object();   // call only
};

} // namespace toolmux
