#include "browser/cdp/cdp_chrome_launch.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <filesystem>
#include <set>
#include <sstream>
#include <cstdlib>
#include <unistd.h>

namespace cdp_chrome_launch {

// Well-known Chrome executable paths on Linux.
static const std::vector<std::string> LINUX_CHROME_PATHS = {
    "/usr/bin/chromium-browser",
    "/usr/bin/chromium",
    "/usr/bin/google-chrome",
    "/usr/bin/google-chrome-stable",
    "/snap/bin/chromium",
    "google-chrome",
    "chromium",
};

static std::string search_path(const std::string &name) {
    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        std::string full_path = directory + "/" + name;
        if (std::filesystem::exists(full_path)) {
            return full_path;
        }
    }
    return "";
}

std::string find_chrome_executable(const std::string &preferred_path) {
    if (!preferred_path.empty()) {
        if (preferred_path.find('/') == std::string::npos) {
            return search_path(preferred_path);
        }
        return std::filesystem::exists(preferred_path) ? preferred_path : "";
    }

    for (const auto &candidate : LINUX_CHROME_PATHS) {
        if (candidate.find('/') != std::string::npos) {
            if (std::filesystem::exists(candidate)) {
                return candidate;
            }
        } else {
            std::string found = search_path(candidate);
            if (!found.empty()) {
                return found;
            }
        }
    }
    return "";
}

std::string default_user_data_directory(int port) {
    return "/tmp/cdpdrive_chrome_profile_" + std::to_string(port);
}

std::string build_discovery_url(int port) {
    return "http://localhost:" + std::to_string(port) + "/json";
}

ChromeCommandLine build_chrome_command_line(const browser_driver::DriverOptions &options) {
    ChromeCommandLine command_line;
    command_line.executable_path = find_chrome_executable(options.chrome_executable);

    const std::string user_data_directory = options.user_data_directory.empty()
                                                ? default_user_data_directory(options.port)
                                                : options.user_data_directory;
    command_line.arguments = {
        "--remote-debugging-port=" + std::to_string(options.port),
        "--remote-allow-origins=*",
        "--user-data-dir=" + user_data_directory,
    };
    if (getuid() == 0) {
        command_line.arguments.push_back("--no-sandbox");
    }
    if (options.headless) {
        command_line.arguments.push_back("--headless");
    }
    std::vector<std::string> rest = {
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-background-networking",
        "--disable-default-apps",
        "--disable-extensions",
        "--disable-popup-blocking",
        "--disable-sync",
        "--disable-translate",
    };
    command_line.arguments.insert(command_line.arguments.end(), rest.begin(), rest.end());
    command_line.arguments.insert(command_line.arguments.end(),
                                  options.extra_arguments.begin(), options.extra_arguments.end());
    command_line.arguments.push_back("about:blank");
    return command_line;
}

// True for our own children and for processes in a group led by one of them
// (browsers of other managers in this process, and their helpers).
static bool is_owned_by_this_process(int process_id) {
    const int own_process_id = static_cast<int>(getpid());
    platform::ProcessLineage lineage;
    if (!platform::read_process_lineage(process_id, lineage)) {
        return false;
    }
    if (lineage.parent_process_id == own_process_id) {
        return true;
    }
    platform::ProcessLineage group_leader;
    return lineage.process_group_id > 0 && lineage.process_group_id != process_id &&
           platform::read_process_lineage(lineage.process_group_id, group_leader) &&
           group_leader.parent_process_id == own_process_id;
}

int kill_stale_instances(const std::vector<std::string> &process_names) {
    std::set<int> stale_process_ids;
    for (const auto &name : process_names) {
        for (int process_id : platform::find_processes_by_name(name)) {
            if (is_owned_by_this_process(process_id)) {
                debug_log::log("kill_stale_instances: keeping pid=" + std::to_string(process_id) +
                               " (spawned by this process)");
                continue;
            }
            stale_process_ids.insert(process_id);
        }
    }

    int killed_count = 0;
    for (int process_id : stale_process_ids) {
        if (platform::kill_process(process_id)) {
            killed_count++;
        } else {
            debug_log::log("kill_stale_instances: could not kill pid=" + std::to_string(process_id));
        }
    }
    if (killed_count > 0) {
        debug_log::notice("Killed " + std::to_string(killed_count) + " stale browser process(es).");
    }
    return killed_count;
}

} // namespace cdp_chrome_launch
