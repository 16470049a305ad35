#include "service/command_registry.hpp"
#include "browser/ui_actions.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <libwebsockets.h>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

// Command "capture_screenshot": PNG of the viewport or of one element.
// With "path" the image is written there; otherwise it is returned base64-encoded.

static std::string encode_base64(const std::string &bytes) {
    std::vector<char> encoded(bytes.size() / 3 * 4 + 8);
    int encoded_length = lws_b64_encode_string(bytes.data(), static_cast<int>(bytes.size()),
                                               encoded.data(), static_cast<int>(encoded.size()));
    if (encoded_length < 0) {
        throw std::runtime_error("Failed to base64-encode screenshot");
    }
    return std::string(encoded.data(), static_cast<size_t>(encoded_length));
}

static json handle_capture_screenshot(const json &params, browser_driver::DriverManager &manager) {
    const std::string selector = command_registry::optional_string(params, "selector");
    const std::string output_path = command_registry::optional_string(params, "path");

    debug_log::log("capture_screenshot invoked selector=" + selector);
    ui_actions::Screenshot screenshot = manager.run_with_recovery([&](browser_driver::BrowserDriver &driver) {
        auto channel = driver.open_channel();
        return ui_actions::take_screenshot(*channel, selector.empty() ? std::nullopt
                                                                      : std::optional<std::string>(selector));
    });

    json result;
    result["mimeType"] = "image/png";
    result["size"] = screenshot.png_bytes.size();
    if (output_path.empty()) {
        result["data"] = encode_base64(screenshot.png_bytes);
        return result;
    }

    std::ofstream output(output_path, std::ios::binary);
    if (!output) {
        throw std::runtime_error("Cannot open " + output_path + " for writing");
    }
    output.write(screenshot.png_bytes.data(), static_cast<std::streamsize>(screenshot.png_bytes.size()));
    if (!output) {
        throw std::runtime_error("Failed to write screenshot to " + output_path);
    }
    result["path"] = output_path;
    return result;
}

namespace command_screenshot {

void register_commands() {
    json params_schema;
    params_schema["type"] = "object";
    params_schema["properties"] = {
        {"selector", {{"type", "string"}, {"description", "Clip to this element (default: whole viewport)."}}},
        {"path", {{"type", "string"}, {"description", "Write the PNG here instead of returning it."}}}
    };

    command_registry::register_command({
        "capture_screenshot",
        "Capture a PNG screenshot of target 0, optionally clipped to an element.",
        params_schema,
        handle_capture_screenshot
    });
}

} // namespace command_screenshot
