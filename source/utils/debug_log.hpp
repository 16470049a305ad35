#ifndef CDPDRIVE_DEBUG_LOG_HPP
#define CDPDRIVE_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if CDPDRIVE_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [cdpdrive] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [cdpdrive] prefix unconditionally.
// Used for browser lifecycle events (spawn, kill, restart).
void notice(const std::string &message);

} // namespace debug_log

#endif // CDPDRIVE_DEBUG_LOG_HPP
