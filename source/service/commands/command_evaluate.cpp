#include "service/command_registry.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Command "evaluate": runs a script in a target and returns its value.
// DOM nodes come back as their remote object id.

static json handle_evaluate(const json &params, browser_driver::DriverManager &manager) {
    const std::string script = command_registry::require_string(params, "script");
    const std::size_t target_index = command_registry::optional_target_index(params);

    debug_log::log("evaluate invoked on target " + std::to_string(target_index));
    return manager.run_with_recovery([&](browser_driver::BrowserDriver &driver) {
        auto channel = driver.open_channel(target_index);
        return json{{"value", channel->run_js_get_value(script)}};
    });
}

namespace command_evaluate {

void register_commands() {
    json params_schema;
    params_schema["type"] = "object";
    params_schema["properties"] = {
        {"script", {{"type", "string"}, {"description", "JavaScript expression to evaluate."}}},
        {"target", {{"type", "integer"}, {"description", "Debug target index (default 0)."}}}
    };
    params_schema["required"] = json::array({"script"});

    command_registry::register_command({
        "evaluate",
        "Evaluate a JavaScript expression in a debug target and return its value.",
        params_schema,
        handle_evaluate
    });
}

} // namespace command_evaluate
