#include "service/command_registry.hpp"
#include "browser/ui_actions.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Commands reading element and window geometry / text from target 0.

static json handle_get_element_text(const json &params, browser_driver::DriverManager &manager) {
    const std::string selector = command_registry::require_string(params, "selector");

    debug_log::log("get_element_text invoked selector=" + selector);
    return manager.run_with_recovery([&](browser_driver::BrowserDriver &driver) {
        auto channel = driver.open_channel();
        return json{{"text", ui_actions::get_element_text(*channel, selector)}};
    });
}

static json handle_get_element_rect(const json &params, browser_driver::DriverManager &manager) {
    const std::string selector = command_registry::require_string(params, "selector");

    debug_log::log("get_element_rect invoked selector=" + selector);
    return manager.run_with_recovery([&](browser_driver::BrowserDriver &driver) {
        auto channel = driver.open_channel();
        ui_actions::ElementRect rect = ui_actions::get_element_rect(*channel, selector);
        return json{{"x", rect.x}, {"y", rect.y}, {"width", rect.width}, {"height", rect.height}};
    });
}

static json handle_get_window_scroll(const json &params, browser_driver::DriverManager &manager) {
    (void)params;
    return manager.run_with_recovery([](browser_driver::BrowserDriver &driver) {
        auto channel = driver.open_channel();
        ui_actions::ScrollOffset scroll = ui_actions::get_window_scroll(*channel);
        return json{{"x", scroll.x}, {"y", scroll.y}};
    });
}

namespace command_element {

void register_commands() {
    json selector_schema;
    selector_schema["type"] = "object";
    selector_schema["properties"] = {
        {"selector", {{"type", "string"}, {"description", "CSS selector of the element."}}}
    };
    selector_schema["required"] = json::array({"selector"});

    command_registry::register_command({
        "get_element_text",
        "innerText of the first element matching the selector; waits for it to appear.",
        selector_schema,
        handle_get_element_text
    });

    command_registry::register_command({
        "get_element_rect",
        "getBoundingClientRect (x, y, width, height) of the first element matching the selector.",
        selector_schema,
        handle_get_element_rect
    });

    json empty_schema;
    empty_schema["type"] = "object";
    empty_schema["properties"] = json::object();

    command_registry::register_command({
        "get_window_scroll",
        "Current window scroll offsets (x, y).",
        empty_schema,
        handle_get_window_scroll
    });
}

} // namespace command_element
