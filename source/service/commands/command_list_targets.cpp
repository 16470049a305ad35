#include "service/command_registry.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Command "list_targets": the debug targets the browser currently exposes.

static json handle_list_targets(const json &params, browser_driver::DriverManager &manager) {
    (void)params;
    debug_log::log("list_targets invoked");

    return manager.run_with_recovery([](browser_driver::BrowserDriver &driver) {
        json targets = json::array();
        for (const auto &target : driver.list_targets()) {
            targets.push_back({
                {"id", target.id},
                {"type", target.type},
                {"title", target.title},
                {"url", target.url},
                {"webSocketDebuggerUrl", target.websocket_url},
            });
        }
        return json{{"targets", targets}};
    });
}

namespace command_list_targets {

void register_commands() {
    json params_schema;
    params_schema["type"] = "object";
    params_schema["properties"] = json::object();

    command_registry::register_command({
        "list_targets",
        "List the browser's debug targets (tabs, workers) in discovery order. "
        "The position in this list is the 'target' index accepted by other commands.",
        params_schema,
        handle_list_targets
    });
}

} // namespace command_list_targets
