// Forward declarations of individual command registration functions.
// Each command_*.cpp defines its own namespace with register_commands().

namespace command_list_targets { void register_commands(); }
namespace command_evaluate { void register_commands(); }
namespace command_navigate { void register_commands(); }
namespace command_element { void register_commands(); }
namespace command_screenshot { void register_commands(); }
namespace command_quit { void register_commands(); }

#include "service/commands/commands.hpp"

namespace service_commands {

void register_all_commands() {
    command_list_targets::register_commands();
    command_evaluate::register_commands();
    command_navigate::register_commands();
    command_element::register_commands();
    command_screenshot::register_commands();
    command_quit::register_commands();
}

} // namespace service_commands
