#ifndef CDPDRIVE_PORT_LEASE_HPP
#define CDPDRIVE_PORT_LEASE_HPP

// Exclusive in-process claim on a remote debugging port.
// Held by a DriverManager for its whole lifetime so that two managers can
// never spawn browsers competing for the same port.

namespace browser_driver {

class PortLease {
public:
    // Throws driver_errors::PortInUse if the port is already leased.
    explicit PortLease(int port);
    ~PortLease();

    PortLease(const PortLease &) = delete;
    PortLease &operator=(const PortLease &) = delete;

    int port() const { return port_; }

    static bool is_leased(int port);

private:
    int port_;
};

} // namespace browser_driver

#endif // CDPDRIVE_PORT_LEASE_HPP
