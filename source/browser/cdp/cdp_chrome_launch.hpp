#ifndef CDPDRIVE_CDP_CHROME_LAUNCH_HPP
#define CDPDRIVE_CDP_CHROME_LAUNCH_HPP

// Chrome command line, executable discovery and stale-instance cleanup.

#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"

namespace cdp_chrome_launch {

// Build the command-line arguments for launching Chrome.
struct ChromeCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};
ChromeCommandLine build_chrome_command_line(const browser_driver::DriverOptions &options);

// Find the Chrome executable. A non-empty preferred path is used as-is if it
// exists; otherwise the well-known install locations and PATH are searched.
// Returns "" when nothing is found.
std::string find_chrome_executable(const std::string &preferred_path = "");

// Profile directory used when DriverOptions.user_data_directory is empty.
std::string default_user_data_directory(int port);

// Target discovery endpoint: http://localhost:<port>/json
std::string build_discovery_url(int port);

// SIGKILL every process whose command name contains one of process_names,
// except processes spawned by this process (and their process groups).
// Best-effort: failures are logged, never thrown. Returns the number killed.
int kill_stale_instances(const std::vector<std::string> &process_names);

} // namespace cdp_chrome_launch

#endif // CDPDRIVE_CDP_CHROME_LAUNCH_HPP
