#include "browser/port_lease.hpp"
#include "browser/driver_errors.hpp"

#include <mutex>
#include <set>

namespace browser_driver {

// Module-level registry of leased ports.
static std::mutex leased_ports_mutex;
static std::set<int> leased_ports;

PortLease::PortLease(int port) : port_(port) {
    std::lock_guard<std::mutex> lock(leased_ports_mutex);
    if (!leased_ports.insert(port).second) {
        throw driver_errors::PortInUse(port);
    }
}

PortLease::~PortLease() {
    std::lock_guard<std::mutex> lock(leased_ports_mutex);
    leased_ports.erase(port_);
}

bool PortLease::is_leased(int port) {
    std::lock_guard<std::mutex> lock(leased_ports_mutex);
    return leased_ports.count(port) > 0;
}

} // namespace browser_driver
