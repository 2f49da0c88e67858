#pragma once
#include "Connection.hpp"
#include "ConnectionConfig.hpp"
#include "PortDescriptor.hpp"
#include <memory>

namespace SerialDevice {

class PortOpener {
public:
    virtual ~PortOpener() = default;

    /**
     * @brief Open a connection to a port
     * @param port Port to open
     * @param config Transport settings
     * @return An open connection, exclusively owned by the caller
     * @throws PortOpenError if the port cannot be acquired
     */
    virtual std::unique_ptr<Connection> open(const PortDescriptor& port, const ConnectionConfig& config) = 0;
};

class SerialPortOpener : public PortOpener {
public:
    std::unique_ptr<Connection> open(const PortDescriptor& port, const ConnectionConfig& config) override;
};

} // namespace SerialDevice
