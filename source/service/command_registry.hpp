#ifndef CDPDRIVE_COMMAND_REGISTRY_HPP
#define CDPDRIVE_COMMAND_REGISTRY_HPP

// Command registry of the stdio service: registration, listing and lookup.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "browser/driver_manager.hpp"

namespace command_registry {

using json = nlohmann::json;

// A command handler receives the request params and the manager that owns the
// browser; it returns the JSON-RPC result payload or throws.
using CommandHandler = std::function<json(const json &params, browser_driver::DriverManager &manager)>;

struct CommandDefinition {
    std::string name;
    std::string description;
    json params_schema; // JSON Schema object
    CommandHandler handler;
};

// Thrown by handlers for missing or mistyped params.
class InvalidParams : public std::invalid_argument {
public:
    explicit InvalidParams(const std::string &message) : std::invalid_argument(message) {}
};

void register_command(const CommandDefinition &definition);

// nullptr if no command has that name.
const CommandDefinition *find_command(const std::string &name);

// Result payload of list_commands.
json build_command_list();

void clear_registered_commands();

// Param helpers; throw InvalidParams.
std::string require_string(const json &params, const std::string &name);
std::string optional_string(const json &params, const std::string &name);
std::size_t optional_target_index(const json &params);

} // namespace command_registry

#endif // CDPDRIVE_COMMAND_REGISTRY_HPP
