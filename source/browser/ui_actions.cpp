#include "browser/ui_actions.hpp"
#include "browser/driver_errors.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_text.hpp"

#include <libwebsockets.h>
#include <cctype>
#include <vector>

namespace ui_actions {

using cdp_driver::json;

static const char kBodyTextScript[] = "document.body.innerText;";

retry::RetryPolicy default_wait_policy() {
    return retry::RetryPolicy{5, std::chrono::milliseconds(4000)};
}

// Selector as a JS string literal.
static std::string quote_js(const std::string &text) {
    return json(text).dump();
}

// Evaluates a script that returns JSON.stringify(...) and parses the string.
static json evaluate_json(cdp_driver::DebugChannel &channel, const std::string &script) {
    json value = channel.run_js_get_value(script);
    if (!value.is_string()) {
        throw driver_errors::UnknownProtocolResult(value.dump());
    }
    try {
        return json::parse(value.get<std::string>());
    } catch (const json::parse_error &) {
        throw driver_errors::UnknownProtocolResult(value.dump());
    }
}

// Decoded size of well-formed padded base64, or -1 if encoded is malformed.
static int expected_base64_length(const std::string &encoded) {
    if (encoded.size() % 4 != 0) {
        return -1;
    }
    std::size_t padding = 0;
    for (std::size_t index = 0; index < encoded.size(); ++index) {
        const unsigned char character = static_cast<unsigned char>(encoded[index]);
        if (character == '=') {
            if (index + 2 < encoded.size()) {
                return -1;
            }
            padding++;
        } else if (padding > 0 ||
                   !(std::isalnum(character) || character == '+' || character == '/')) {
            return -1;
        }
    }
    return static_cast<int>(encoded.size() / 4 * 3 - padding);
}

static double number_field(const json &object, const char *field) {
    if (!object.contains(field) || !object[field].is_number()) {
        throw driver_errors::UnknownProtocolResult(object.dump());
    }
    return object[field].get<double>();
}

void go_to_url(cdp_driver::DebugChannel &channel, const std::string &url,
               const retry::RetryPolicy &wait_policy) {
    json before_text = channel.run_js_get_value(kBodyTextScript);
    debug_log::log("go_to_url: " + url);
    channel.run_js_get_value("window.location=" + quote_js(url) + ";");

    retry::RetryWaiter(wait_policy).until_value(
        [&before_text](const json &current_text) { return current_text != before_text; },
        [&channel] { return channel.run_js_get_value(kBodyTextScript); });
}

ScrollOffset get_window_scroll(cdp_driver::DebugChannel &channel) {
    json result = evaluate_json(channel, "JSON.stringify({\"x\": window.scrollX, \"y\": window.scrollY});");
    ScrollOffset scroll;
    scroll.x = number_field(result, "x");
    scroll.y = number_field(result, "y");
    return scroll;
}

std::string get_element_text(cdp_driver::DebugChannel &channel, const std::string &css_selector,
                             const retry::RetryPolicy &wait_policy) {
    const std::string script = "document.querySelector(" + quote_js(css_selector) + ").innerText;";
    json text = retry::RetryWaiter(wait_policy).until_no_exception<driver_errors::JsExecutionError>(
        [&channel, &script] { return channel.run_js_get_value(script); });
    if (!text.is_string()) {
        throw driver_errors::UnknownProtocolResult(text.dump());
    }
    return text.get<std::string>();
}

ElementRect get_element_rect(cdp_driver::DebugChannel &channel, const std::string &css_selector) {
    json result = evaluate_json(channel, "JSON.stringify(document.querySelector(" + quote_js(css_selector) +
                                             ").getBoundingClientRect());");
    ElementRect rect;
    rect.x = number_field(result, "x");
    rect.y = number_field(result, "y");
    rect.width = number_field(result, "width");
    rect.height = number_field(result, "height");
    return rect;
}

json build_screenshot_command(const std::optional<ElementRect> &element_rect, const ScrollOffset &scroll) {
    json command;
    command["method"] = "Page.captureScreenshot";
    command["params"]["format"] = "png";
    if (element_rect) {
        command["params"]["clip"] = {
            {"x", element_rect->x + scroll.x},
            {"y", element_rect->y + scroll.y},
            {"width", element_rect->width},
            {"height", element_rect->height},
            {"scale", 1.0},
        };
    }
    return command;
}

Screenshot take_screenshot(cdp_driver::DebugChannel &channel, const std::optional<std::string> &css_selector) {
    std::optional<ElementRect> element_rect;
    ScrollOffset scroll;
    if (css_selector && !css_selector->empty()) {
        element_rect = get_element_rect(channel, *css_selector);
        scroll = get_window_scroll(channel);
    }

    json response = channel.run_command(build_screenshot_command(element_rect, scroll));
    if (!response.contains("result") || !response["result"].contains("data") ||
        !response["result"]["data"].is_string()) {
        throw driver_errors::UnknownProtocolResult(response.dump());
    }

    const std::string encoded = response["result"]["data"].get<std::string>();
    const int expected_length = expected_base64_length(encoded);
    if (expected_length < 0) {
        throw driver_errors::UnknownProtocolResult("Screenshot data is not valid base64: " +
                                                   utf8_text::abbreviate(encoded, 40));
    }
    std::vector<char> decoded(static_cast<size_t>(expected_length) + 4);
    int decoded_length = lws_b64_decode_string(encoded.c_str(), decoded.data(), static_cast<int>(decoded.size()));
    if (decoded_length != expected_length) {
        throw driver_errors::UnknownProtocolResult("Screenshot data decoded to " + std::to_string(decoded_length) +
                                                   " bytes, expected " + std::to_string(expected_length));
    }

    Screenshot screenshot;
    screenshot.png_bytes.assign(decoded.data(), static_cast<size_t>(decoded_length));
    debug_log::log("Screenshot captured: " + std::to_string(decoded_length) + " bytes");
    return screenshot;
}

} // namespace ui_actions
