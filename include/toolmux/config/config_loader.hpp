#pragma once

#include <toolmux/config/app_config.hpp>
#include <toolmux/coordinator/coordinator.hpp>
#include <toolmux/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolmux {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Same as LoadFromYaml, from an in-memory document.
Result<AppConfig, Error> LoadFromYamlString(std::string_view document);

// Map a subcommand word ("list", "call", "demo") to its enum.
std::optional<Subcommand> ParseSubcommand(std::string_view word);

// Parse the flags of one subcommand. argv[0] is the program name and the
// subcommand word itself has already been removed.
Result<CliOptions, Error> LoadFromCli(Subcommand command, int argc,
                                      const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate worker entries, timeouts and flag combinations.
Result<void, Error> ValidateConfig(const AppConfig& config);

// math-server and string-server, both served by the given worker binary.
std::vector<WorkerConfig> DefaultWorkerConfigs(const std::string& worker_path);

CoordinatorOptions ToCoordinatorOptions(const AppConfig& config);

// Explicit log_level, else -v (info), -q (error) or warn.
LogLevel EffectiveLogLevel(const AppConfig& config);

} // namespace toolmux
