#ifndef CDPDRIVE_PROCESS_HANDLE_HPP
#define CDPDRIVE_PROCESS_HANDLE_HPP

// Exclusive ownership of one spawned browser process.

#include <string>
#include <vector>

namespace browser_driver {

class ProcessHandle {
public:
    // Starts executable directly (no shell) in its own process group.
    // Throws driver_errors::SpawnError on failure.
    static ProcessHandle spawn(const std::string &executable_path,
                               const std::vector<std::string> &arguments);

    ProcessHandle(ProcessHandle &&other) noexcept;
    ProcessHandle &operator=(ProcessHandle &&other) noexcept;
    ProcessHandle(const ProcessHandle &) = delete;
    ProcessHandle &operator=(const ProcessHandle &) = delete;

    // Kills the process if it is still running.
    ~ProcessHandle();

    // Non-blocking liveness probe.
    bool is_alive();

    // SIGKILL to the whole process group, then reap. The group is signaled
    // once even if the leader already exited, so its orphans go too.
    void kill();

    int pid() const { return process_id_; }

private:
    explicit ProcessHandle(int process_id);

    int process_id_ = -1;
    bool exited_ = true;
    bool group_signaled_ = true;
};

} // namespace browser_driver

#endif // CDPDRIVE_PROCESS_HANDLE_HPP
