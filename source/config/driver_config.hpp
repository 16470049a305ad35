#ifndef CDPDRIVE_DRIVER_CONFIG_HPP
#define CDPDRIVE_DRIVER_CONFIG_HPP

// Driver options from environment and command line.
//
// Precedence: built-in defaults < environment < command-line flags.
//   CDPDRIVE_PORT, CDPDRIVE_HEADLESS, CDPDRIVE_CHROME, CDPDRIVE_USER_DATA_DIR
//   --port=N --headless --keep-existing --no-wait --chrome=PATH --user-data-dir=DIR

#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"

namespace config {

// Throws std::invalid_argument for malformed values or unknown flags.
browser_driver::DriverOptions load_driver_options(const std::vector<std::string> &arguments);

browser_driver::DriverOptions load_driver_options(int argc, char **argv);

// One-paragraph usage text for --help.
std::string usage_text();

} // namespace config

#endif // CDPDRIVE_DRIVER_CONFIG_HPP
