#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolmux {

// ---------------------------------------------------------------------------
// WorkerConfig: how to launch one worker process.
//
// `command` is an executable path or a name looked up on PATH. `env` entries
// override (or add to) the coordinator's own environment for the child.
// ---------------------------------------------------------------------------
struct WorkerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    bool operator==(const WorkerConfig& other) const {
        return name == other.name && command == other.command &&
               args == other.args && env == other.env;
    }
    bool operator!=(const WorkerConfig& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// ToolDescriptor: one entry of a worker's tool catalog.
//
// input_schema is a JSON Schema object; it documents the arguments and is
// never enforced by the coordinator.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// ToolInfo: a ToolDescriptor merged with the name of the worker serving it.
// ---------------------------------------------------------------------------
struct ToolInfo {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    std::string server_name;
};

} // namespace toolmux
