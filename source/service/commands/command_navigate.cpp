#include "service/command_registry.hpp"
#include "browser/ui_actions.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Command "navigate": loads a URL and waits until the page content changes.

static json handle_navigate(const json &params, browser_driver::DriverManager &manager) {
    const std::string url = command_registry::require_string(params, "url");
    const std::size_t target_index = command_registry::optional_target_index(params);

    debug_log::log("navigate invoked: " + url);
    return manager.run_with_recovery([&](browser_driver::BrowserDriver &driver) {
        auto channel = driver.open_channel(target_index);
        ui_actions::go_to_url(*channel, url);
        return json{{"url", url}};
    });
}

namespace command_navigate {

void register_commands() {
    json params_schema;
    params_schema["type"] = "object";
    params_schema["properties"] = {
        {"url", {{"type", "string"}, {"description", "The URL to load (e.g. https://example.com)."}}},
        {"target", {{"type", "integer"}, {"description", "Debug target index (default 0)."}}}
    };
    params_schema["required"] = json::array({"url"});

    command_registry::register_command({
        "navigate",
        "Navigate a tab to the URL and wait until its body text changes.",
        params_schema,
        handle_navigate
    });
}

} // namespace command_navigate
