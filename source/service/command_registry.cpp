#include "service/command_registry.hpp"

namespace command_registry {

// Module-level registry (filled once at startup).
static std::vector<CommandDefinition> registered_commands;

void register_command(const CommandDefinition &definition) {
    for (auto &existing : registered_commands) {
        if (existing.name == definition.name) {
            existing = definition;
            return;
        }
    }
    registered_commands.push_back(definition);
}

const CommandDefinition *find_command(const std::string &name) {
    for (const auto &command : registered_commands) {
        if (command.name == name) {
            return &command;
        }
    }
    return nullptr;
}

json build_command_list() {
    json commands = json::array();
    for (const auto &command : registered_commands) {
        commands.push_back({
            {"name", command.name},
            {"description", command.description},
            {"params", command.params_schema},
        });
    }
    return json{{"commands", commands}};
}

void clear_registered_commands() {
    registered_commands.clear();
}

std::string require_string(const json &params, const std::string &name) {
    if (!params.contains(name) || !params[name].is_string() || params[name].get<std::string>().empty()) {
        throw InvalidParams("Missing required parameter '" + name + "' (non-empty string).");
    }
    return params[name].get<std::string>();
}

std::string optional_string(const json &params, const std::string &name) {
    if (!params.contains(name) || params[name].is_null()) {
        return "";
    }
    if (!params[name].is_string()) {
        throw InvalidParams("Parameter '" + name + "' must be a string.");
    }
    return params[name].get<std::string>();
}

std::size_t optional_target_index(const json &params) {
    if (!params.contains("target") || params["target"].is_null()) {
        return 0;
    }
    if (!params["target"].is_number_integer() || params["target"].get<long long>() < 0) {
        throw InvalidParams("Parameter 'target' must be a non-negative integer.");
    }
    return static_cast<std::size_t>(params["target"].get<long long>());
}

} // namespace command_registry
