#ifndef CDPDRIVE_UI_ACTIONS_HPP
#define CDPDRIVE_UI_ACTIONS_HPP

// Page-level actions on a debug channel. Each action that depends on the page
// settling polls through a RetryWaiter rather than sleeping blindly.

#include <chrono>
#include <optional>
#include <string>

#include "browser/cdp/debug_channel.hpp"
#include "timing/retry_waiter.hpp"

namespace ui_actions {

// Poll policy used when the caller does not pass one: 5 attempts, 4 s apart.
retry::RetryPolicy default_wait_policy();

struct ScrollOffset {
    double x = 0.0;
    double y = 0.0;
};

// Element bounding box relative to the viewport (getBoundingClientRect).
struct ElementRect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

struct Screenshot {
    std::string png_bytes;
};

// Navigates by assigning window.location and waits until the body text differs
// from what it was before navigation.
void go_to_url(cdp_driver::DebugChannel &channel, const std::string &url,
               const retry::RetryPolicy &wait_policy = default_wait_policy());

ScrollOffset get_window_scroll(cdp_driver::DebugChannel &channel);

// innerText of the first element matching css_selector; waits for the element to appear.
std::string get_element_text(cdp_driver::DebugChannel &channel, const std::string &css_selector,
                             const retry::RetryPolicy &wait_policy = default_wait_policy());

ElementRect get_element_rect(cdp_driver::DebugChannel &channel, const std::string &css_selector);

// Page.captureScreenshot in PNG, of the whole viewport or clipped to the element.
Screenshot take_screenshot(cdp_driver::DebugChannel &channel,
                           const std::optional<std::string> &css_selector = std::nullopt);

// Builds the Page.captureScreenshot command; a clip is page-relative (rect + scroll).
cdp_driver::json build_screenshot_command(const std::optional<ElementRect> &element_rect,
                                          const ScrollOffset &scroll);

} // namespace ui_actions

#endif // CDPDRIVE_UI_ACTIONS_HPP
