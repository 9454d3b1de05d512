#pragma once

#include <toolmux/mcp/tool_registry.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolmux {

// add, multiply: integer arithmetic on arguments "a" and "b".
void RegisterMathTools(ToolRegistry& registry);

// uppercase(text), concat(a, b, separator = " ").
void RegisterTextTools(ToolRegistry& registry);

// Toolset names accepted by toolmux-worker --toolset.
std::vector<std::string> ToolsetNames();

// Registry for a named toolset, or nullopt when the name is unknown.
std::optional<ToolRegistry> MakeToolset(std::string_view name);

} // namespace toolmux
