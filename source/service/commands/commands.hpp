#ifndef CDPDRIVE_COMMANDS_HPP
#define CDPDRIVE_COMMANDS_HPP

// Command registration.
// Each command_*.cpp file provides a register function that is called during startup.

namespace service_commands {

// Register all available commands with the command registry.
void register_all_commands();

} // namespace service_commands

#endif // CDPDRIVE_COMMANDS_HPP
