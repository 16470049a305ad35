#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <algorithm>
#include <cerrno>
#include <cctype>
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <cstring>
#include <filesystem>

extern char **environ;

namespace platform {

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments) {
    SpawnResult result;

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());

    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                   nullptr, &attributes,
                                   argv_pointers.data(), environ);
    posix_spawnattr_destroy(&attributes);

    if (spawn_status != 0) {
        result.error_message = "posix_spawn failed for " + executable_path + ": " +
                               std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
}

ProcessStatus poll_process(int process_id) {
    if (process_id <= 0) {
        return ProcessStatus::Exited;
    }

    int status = 0;
    pid_t wait_result = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
    if (wait_result == 0) {
        return ProcessStatus::Running;
    }
    if (wait_result == static_cast<pid_t>(process_id)) {
        return ProcessStatus::Exited;
    }

    // Not our child (or already reaped): fall back to an existence check.
    if (errno == ECHILD && kill(static_cast<pid_t>(process_id), 0) == 0) {
        return ProcessStatus::Running;
    }
    return ProcessStatus::Exited;
}

bool kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    pid_t pid = static_cast<pid_t>(process_id);

    bool delivered = false;
    if (getpgid(pid) == pid) {
        delivered = (kill(-pid, SIGKILL) == 0);
    }
    if (kill(pid, SIGKILL) == 0) {
        delivered = true;
    } else if (errno == ESRCH) {
        // Already gone (or only a zombie left), nothing to kill.
        delivered = true;
    }
    return delivered;
}

bool kill_process_group(int process_group_id) {
    if (process_group_id <= 0) {
        return false;
    }
    if (kill(-static_cast<pid_t>(process_group_id), SIGKILL) == 0) {
        return true;
    }
    return errno == ESRCH;
}

bool wait_for_exit(int process_id, int timeout_milliseconds) {
    auto start_time = std::chrono::steady_clock::now();
    while (true) {
        if (poll_process(process_id) == ProcessStatus::Exited) {
            return true;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_milliseconds) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::vector<int> find_processes_by_name(const std::string &name_fragment) {
    std::vector<int> matches;
    if (name_fragment.empty()) {
        return matches;
    }

    const int own_process_id = static_cast<int>(getpid());
    std::error_code directory_error;
    for (const auto &entry : std::filesystem::directory_iterator("/proc", directory_error)) {
        const std::string directory_name = entry.path().filename().string();
        if (directory_name.empty() ||
            !std::all_of(directory_name.begin(), directory_name.end(),
                         [](unsigned char character) { return std::isdigit(character) != 0; })) {
            continue;
        }

        int process_id = std::stoi(directory_name);
        if (process_id == own_process_id) {
            continue;
        }

        std::string command_name;
        if (!read_file_contents(entry.path().string() + "/comm", command_name)) {
            continue; // Process exited while scanning.
        }
        if (command_name.find(name_fragment) != std::string::npos) {
            matches.push_back(process_id);
        }
    }
    return matches;
}

bool read_process_lineage(int process_id, ProcessLineage &output_lineage) {
    std::string stat_line;
    if (!read_file_contents("/proc/" + std::to_string(process_id) + "/stat", stat_line)) {
        return false;
    }
    // Format: pid (comm) state ppid pgrp ...; comm may itself contain ") ".
    auto comm_end = stat_line.rfind(')');
    if (comm_end == std::string::npos) {
        return false;
    }
    std::istringstream fields(stat_line.substr(comm_end + 1));
    std::string state;
    int parent_process_id = -1;
    int process_group_id = -1;
    if (!(fields >> state >> parent_process_id >> process_group_id)) {
        return false;
    }
    output_lineage.parent_process_id = parent_process_id;
    output_lineage.process_group_id = process_group_id;
    return true;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

} // namespace platform
