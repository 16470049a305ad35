#include "service/command_registry.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Command "quit": kills the browser. The next command starts a new one.

static json handle_quit(const json &params, browser_driver::DriverManager &manager) {
    (void)params;
    const bool had_driver = manager.has_driver();
    manager.quit();
    debug_log::log("quit invoked, had_driver=" + std::string(had_driver ? "true" : "false"));
    return json{{"stopped", had_driver}};
}

namespace command_quit {

void register_commands() {
    json params_schema;
    params_schema["type"] = "object";
    params_schema["properties"] = json::object();

    command_registry::register_command({
        "quit",
        "Close the browser. Later commands transparently start a fresh one.",
        params_schema,
        handle_quit
    });
}

} // namespace command_quit
