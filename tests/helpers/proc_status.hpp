#ifndef CDPDRIVE_TESTS_PROC_STATUS_HPP
#define CDPDRIVE_TESTS_PROC_STATUS_HPP

// /proc readers for process tests. Zombies count as gone: an orphan killed
// by a test may wait a while for init to reap it.

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

#include "platform/platform_abi.hpp"

namespace test_helpers {

// State letter and process group from /proc/<pid>/stat; false if gone.
inline bool read_state(int process_id, char &state, int &process_group_id) {
    std::string stat_line;
    if (!platform::read_file_contents("/proc/" + std::to_string(process_id) + "/stat", stat_line)) {
        return false;
    }
    auto comm_end = stat_line.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 >= stat_line.size()) {
        return false;
    }
    state = stat_line[comm_end + 2];
    platform::ProcessLineage lineage;
    if (!platform::read_process_lineage(process_id, lineage)) {
        return false;
    }
    process_group_id = lineage.process_group_id;
    return true;
}

inline bool is_running(int process_id) {
    char state = 'X';
    int process_group_id = -1;
    return read_state(process_id, state, process_group_id) && state != 'Z' && state != 'X';
}

// Any non-zombie process whose process group is process_group_id.
inline bool group_has_running_members(int process_group_id) {
    std::error_code directory_error;
    for (const auto &entry : std::filesystem::directory_iterator("/proc", directory_error)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        char state = 'X';
        int group = -1;
        if (read_state(std::stoi(name), state, group) && group == process_group_id && state != 'Z' &&
            state != 'X') {
            return true;
        }
    }
    return false;
}

// Polls condition every 10 ms for up to timeout_milliseconds.
inline bool eventually(const std::function<bool()> &condition, int timeout_milliseconds = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

} // namespace test_helpers

#endif // CDPDRIVE_TESTS_PROC_STATUS_HPP
