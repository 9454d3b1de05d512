#include <toolmux/cli/output_formatter.hpp>
#include <toolmux/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace toolmux {

using namespace toolmux::ansi;

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto array = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            array.push_back(std::move(obj));
        }
        out_ << array.dump() << "\n";
        return;
    }

    if (color_mode_) {
        // Build FTXUI table data: header row + data rows.
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    // Plain human-readable table: compute column widths.
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < headers.size() && c < cells.size(); ++c) {
            if (c > 0) out_ << "  ";
            // No padding after the last column.
            if (c + 1 == headers.size()) {
                out_ << cells[c];
            } else {
                out_ << std::left << std::setw(static_cast<int>(widths[c]))
                     << cells[c];
            }
        }
        out_ << "\n";
    };

    print_row(headers);
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintTools(const std::vector<ToolInfo>& tools) const {
    if (json_mode_) {
        auto array = nlohmann::json::array();
        for (const auto& t : tools) {
            array.push_back({
                {"name", t.name},
                {"server", t.server_name},
                {"description", t.description},
                {"inputSchema", t.input_schema}
            });
        }
        out_ << array.dump() << "\n";
        return;
    }

    std::vector<std::vector<std::string>> rows;
    rows.reserve(tools.size());
    for (const auto& t : tools) {
        rows.push_back({t.name, t.server_name, t.description});
    }
    PrintTable({"name", "server", "description"}, rows);
}

void OutputFormatter::PrintToolResult(const std::string& tool,
                                      const std::string& text) const {
    if (json_mode_) {
        nlohmann::json j = {{"tool", tool}, {"result", text}};
        out_ << j.dump() << "\n";
        return;
    }
    out_ << text << "\n";
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        err_ << kDim << " (" << error.CategoryName() << ")" << kReset << "\n";
        err_ << "  " << error.message << "\n";
        if (!error.server.empty()) {
            err_ << "  " << kDim << "Server: " << kReset << error.server << "\n";
        }
        if (!error.tool.empty()) {
            err_ << "  " << kDim << "Tool: " << kReset << error.tool << "\n";
        }
        return;
    }

    // Plain-text multi-line layout (same structure as color path, no ANSI).
    err_ << "Error: " << error.operation << " (" << error.CategoryName() << ")\n";
    err_ << "  " << error.message << "\n";
    if (!error.server.empty()) {
        err_ << "  Server: " << error.server << "\n";
    }
    if (!error.tool.empty()) {
        err_ << "  Tool: " << error.tool << "\n";
    }
}

} // namespace toolmux
