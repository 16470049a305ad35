#ifndef CDPDRIVE_PLATFORM_ABI_HPP
#define CDPDRIVE_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

enum class ProcessStatus {
    Running,
    Exited
};

// Spawn a child process with the given executable path and arguments.
// No shell is involved. The child leads its own process group so that
// kill_process() also reaches the processes it forks.
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments);

// Non-blocking status probe. Reaps the child if it has exited.
ProcessStatus poll_process(int process_id);

// Send SIGKILL to the process group led by process_id and to the process itself.
// Returns false only if the signal could not be delivered to a live process.
bool kill_process(int process_id);

// Send SIGKILL to every process in process_group_id. Works after the group
// leader has been reaped. An empty group counts as success.
bool kill_process_group(int process_group_id);

// Wait (poll) until the child exits and is reaped, up to timeout_milliseconds.
// Returns true if the process is gone.
bool wait_for_exit(int process_id, int timeout_milliseconds);

// Process ids whose command name (/proc/<pid>/comm) contains name_fragment.
// The calling process is never included.
std::vector<int> find_processes_by_name(const std::string &name_fragment);

// Parent pid and process group of a running process, from /proc/<pid>/stat.
struct ProcessLineage {
    int parent_process_id = -1;
    int process_group_id = -1;
};

// Returns false if the process does not exist (any more).
bool read_process_lineage(int process_id, ProcessLineage &output_lineage);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

} // namespace platform

#endif // CDPDRIVE_PLATFORM_ABI_HPP
