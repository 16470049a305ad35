// Tests for ui_actions against a scripted page: navigation waits, element
// polling, geometry and screenshot clipping.

#include "browser/ui_actions.hpp"
#include "browser/driver_errors.hpp"
#include "fakes/fake_transport.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace test_ui_actions {

using test_fakes::evaluate_reply;
using test_fakes::json;
using test_fakes::make_channel;
using test_fakes::ScriptedTransport;

static const retry::RetryPolicy kFastPolicy{3, std::chrono::milliseconds(0)};

static bool report(bool passed, const std::string &description) {
    std::cout << (passed ? "  OK: " : "  FAIL: ") << description << std::endl;
    return passed;
}

static bool starts_with(const std::string &text, const std::string &prefix) {
    return text.rfind(prefix, 0) == 0;
}

// Test: go_to_url assigns window.location and waits for the body text to change.
static bool test_go_to_url_waits_for_new_text() {
    int body_reads = 0;
    std::string location_script;
    auto channel = make_channel(test_fakes::evaluate_responder([&](const std::string &script) -> json {
        if (script == "document.body.innerText;") {
            // Old page for the baseline read and the first poll.
            return {{"type", "string"}, {"value", ++body_reads <= 2 ? "old page" : "new page"}};
        }
        location_script = script;
        return {{"type", "string"}, {"value", "https://example.com/"}};
    }));

    ui_actions::go_to_url(*channel, "https://example.com/", kFastPolicy);
    return report(location_script == "window.location=\"https://example.com/\";" && body_reads == 3,
                  "go_to_url sets window.location and polls until the body text differs");
}

// Test: go_to_url gives up when the page never changes.
static bool test_go_to_url_times_out() {
    auto channel = make_channel(test_fakes::evaluate_responder(
        [](const std::string &) -> json { return {{"type", "string"}, {"value", "same"}}; }));
    try {
        ui_actions::go_to_url(*channel, "https://example.com/", kFastPolicy);
    } catch (const retry::OutOfRetriesError &error) {
        return report(error.attempts() == 3, "Unchanged page exhausts the wait policy");
    }
    return report(false, "Unchanged page did not exhaust the wait policy");
}

// Test: get_element_text retries while the element is missing.
static bool test_get_element_text_polls() {
    int calls = 0;
    std::string seen_script;
    auto channel = make_channel(test_fakes::evaluate_responder([&](const std::string &script) -> json {
        seen_script = script;
        if (++calls < 3) {
            return {{"type", "object"}, {"subtype", "error"},
                    {"description", "TypeError: Cannot read properties of null (reading 'innerText')"}};
        }
        return {{"type", "string"}, {"value", "Hello"}};
    }));

    std::string text = ui_actions::get_element_text(*channel, "#greeting", kFastPolicy);
    return report(text == "Hello" && calls == 3 &&
                      seen_script == "document.querySelector(\"#greeting\").innerText;",
                  "get_element_text polls through script errors until the element appears");
}

// Test: selectors are quoted as JS string literals.
static bool test_selector_quoting() {
    std::string seen_script;
    auto channel = make_channel(test_fakes::evaluate_responder([&](const std::string &script) -> json {
        seen_script = script;
        return {{"type", "string"}, {"value", "x"}};
    }));
    ui_actions::get_element_text(*channel, "a[title=\"say \\\"hi\\\"\"]", kFastPolicy);
    return report(seen_script == "document.querySelector(\"a[title=\\\"say \\\\\\\"hi\\\\\\\"\\\"]\").innerText;",
                  "Selector with quotes and backslashes is escaped");
}

// Test: scroll offset and element rect come back as numbers.
static bool test_geometry() {
    auto channel = make_channel(test_fakes::evaluate_responder([](const std::string &script) -> json {
        if (starts_with(script, "JSON.stringify({\"x\": window.scrollX")) {
            return {{"type", "string"}, {"value", "{\"x\":0,\"y\":250.5}"}};
        }
        return {{"type", "string"}, {"value", "{\"x\":8,\"y\":16,\"width\":120,\"height\":40,\"top\":16}"}};
    }));
    ui_actions::ScrollOffset scroll = ui_actions::get_window_scroll(*channel);
    ui_actions::ElementRect rect = ui_actions::get_element_rect(*channel, "#logo");
    return report(scroll.x == 0.0 && scroll.y == 250.5 && rect.x == 8.0 && rect.y == 16.0 &&
                      rect.width == 120.0 && rect.height == 40.0,
                  "Scroll offset and bounding rect are parsed");
}

// Test: the screenshot clip is the viewport rect shifted by the scroll offset.
static bool test_screenshot_command_clip() {
    ui_actions::ElementRect rect;
    rect.x = 10;
    rect.y = 20;
    rect.width = 300;
    rect.height = 150;
    ui_actions::ScrollOffset scroll;
    scroll.x = 5;
    scroll.y = 400;

    json command = ui_actions::build_screenshot_command(rect, scroll);
    const json &clip = command["params"]["clip"];
    bool clipped = command["method"] == "Page.captureScreenshot" && command["params"]["format"] == "png" &&
                   clip["x"] == 15.0 && clip["y"] == 420.0 && clip["width"] == 300.0 &&
                   clip["height"] == 150.0 && clip["scale"] == 1.0;

    json full_page = ui_actions::build_screenshot_command(std::nullopt, scroll);
    return report(clipped && !full_page["params"].contains("clip"),
                  "Clip is rect + scroll; no clip without an element");
}

// Test: take_screenshot decodes the base64 payload of the clipped capture.
static bool test_take_screenshot() {
    json capture_request;
    ScriptedTransport *transport = nullptr;
    auto channel = make_channel(
        [&capture_request](const json &request) -> std::vector<std::string> {
            if (request["method"] == "Page.captureScreenshot") {
                capture_request = request;
                return {test_fakes::reply_with({{"data", "UE5HREFUQQ=="}})};
            }
            const std::string script = request["params"]["expression"].get<std::string>();
            if (starts_with(script, "JSON.stringify({\"x\": window.scrollX")) {
                return {evaluate_reply({{"type", "string"}, {"value", "{\"x\":0,\"y\":100}"}})};
            }
            return {evaluate_reply(
                {{"type", "string"}, {"value", "{\"x\":10,\"y\":20,\"width\":30,\"height\":40}"}})};
        },
        &transport);

    ui_actions::Screenshot screenshot = ui_actions::take_screenshot(*channel, std::string("#chart"));
    bool decoded = screenshot.png_bytes == "PNGDATA";
    bool clipped = capture_request["params"]["clip"]["y"] == 120.0 && transport->sent().size() == 3;
    return report(decoded && clipped, "take_screenshot decodes data and clips to the element");
}

// Test: a capture response without data is rejected.
static bool test_take_screenshot_without_data() {
    auto channel = make_channel([](const json &) {
        return std::vector<std::string>{test_fakes::reply_with(json::object())};
    });
    try {
        ui_actions::take_screenshot(*channel);
    } catch (const driver_errors::UnknownProtocolResult &) {
        return report(true, "Capture response without data throws UnknownProtocolResult");
    }
    return report(false, "Capture response without data was accepted");
}

// Test: data outside the base64 alphabet is rejected rather than decoded.
static bool test_take_screenshot_malformed_data() {
    bool all_passed = true;
    for (const char *payload : {"!!!!", "UE5HRE", "QQ=A"}) {
        auto channel = make_channel([payload](const json &) {
            return std::vector<std::string>{test_fakes::reply_with({{"data", payload}})};
        });
        bool rejected = false;
        try {
            ui_actions::take_screenshot(*channel);
        } catch (const driver_errors::UnknownProtocolResult &) {
            rejected = true;
        }
        all_passed &= report(rejected, std::string("Malformed screenshot data '") + payload +
                                           "' throws UnknownProtocolResult");
    }
    return all_passed;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_go_to_url_waits_for_new_text();
    all_passed &= test_go_to_url_times_out();
    all_passed &= test_get_element_text_polls();
    all_passed &= test_selector_quoting();
    all_passed &= test_geometry();
    all_passed &= test_screenshot_command_clip();
    all_passed &= test_take_screenshot();
    all_passed &= test_take_screenshot_without_data();
    all_passed &= test_take_screenshot_malformed_data();
    return all_passed;
}

} // namespace test_ui_actions
