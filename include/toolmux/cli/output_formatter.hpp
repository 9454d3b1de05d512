#pragma once

#include <toolmux/core/result.hpp>
#include <toolmux/core/types.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace toolmux {

// ---------------------------------------------------------------------------
// OutputFormatter: human-readable and JSON output for CLI commands.
//
// Results go to `out`, errors to `err`. When color_mode is true and
// json_mode is false, tables are rendered with FTXUI and messages use ANSI
// escape codes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Print a table with headers and rows (human-readable mode).
    // In JSON mode, outputs a JSON array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // The merged catalog: name, server and description per tool. JSON mode
    // includes each input schema.
    void PrintTools(const std::vector<ToolInfo>& tools) const;

    // One tool call result. Human mode prints the bare text.
    void PrintToolResult(const std::string& tool, const std::string& text) const;

    // Print a raw JSON string to stdout.
    void PrintJson(const std::string& json) const;

    // Print an error to stderr.
    void PrintError(const Error& error) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace toolmux
