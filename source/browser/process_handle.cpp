#include "browser/process_handle.hpp"
#include "browser/driver_errors.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <utility>

namespace browser_driver {

// Time given to the kernel to tear the process down after SIGKILL.
static constexpr int kReapTimeoutMilliseconds = 2000;

ProcessHandle ProcessHandle::spawn(const std::string &executable_path,
                                   const std::vector<std::string> &arguments) {
    platform::SpawnResult spawn_result = platform::spawn_process(executable_path, arguments);
    if (!spawn_result.success) {
        throw driver_errors::SpawnError(spawn_result.error_message);
    }
    debug_log::log("Spawned " + executable_path + " pid=" + std::to_string(spawn_result.process_id));
    return ProcessHandle(spawn_result.process_id);
}

ProcessHandle::ProcessHandle(int process_id)
    : process_id_(process_id), exited_(false), group_signaled_(false) {}

ProcessHandle::ProcessHandle(ProcessHandle &&other) noexcept
    : process_id_(std::exchange(other.process_id_, -1)),
      exited_(std::exchange(other.exited_, true)),
      group_signaled_(std::exchange(other.group_signaled_, true)) {}

ProcessHandle &ProcessHandle::operator=(ProcessHandle &&other) noexcept {
    if (this != &other) {
        kill();
        process_id_ = std::exchange(other.process_id_, -1);
        exited_ = std::exchange(other.exited_, true);
        group_signaled_ = std::exchange(other.group_signaled_, true);
    }
    return *this;
}

ProcessHandle::~ProcessHandle() {
    kill();
}

bool ProcessHandle::is_alive() {
    if (exited_) {
        return false;
    }
    if (platform::poll_process(process_id_) == platform::ProcessStatus::Exited) {
        debug_log::log("Process pid=" + std::to_string(process_id_) + " has exited.");
        exited_ = true;
    }
    return !exited_;
}

void ProcessHandle::kill() {
    if (group_signaled_) {
        return;
    }
    group_signaled_ = true;

    // The group outlives its leader; children forked before a crash are still in it.
    debug_log::log("Killing process group of pid=" + std::to_string(process_id_));
    if (!platform::kill_process_group(process_id_)) {
        debug_log::log("SIGKILL could not be delivered to process group " + std::to_string(process_id_));
    }
    if (exited_) {
        return;
    }
    if (!platform::kill_process(process_id_)) {
        debug_log::log("SIGKILL could not be delivered to pid=" + std::to_string(process_id_));
    }
    if (!platform::wait_for_exit(process_id_, kReapTimeoutMilliseconds)) {
        debug_log::log("pid=" + std::to_string(process_id_) + " not reaped within " +
                       std::to_string(kReapTimeoutMilliseconds) + " ms");
    }
    exited_ = true;
}

} // namespace browser_driver
