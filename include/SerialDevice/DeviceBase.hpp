#pragma once
#include "Connection.hpp"
#include "ConnectionConfig.hpp"
#include "ConnectionTest.hpp"
#include "PortDescriptor.hpp"
#include "PortResolver.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SerialDevice {

/**
 * @brief Base class for drivers of a device attached through a serial port
 *
 * The port is resolved automatically: testConnection() is applied to the
 * candidate ports until one succeeds, and the open connection is kept.
 */
class DeviceBase {
public:
    DeviceBase();
    explicit DeviceBase(PortResolver resolver);
    virtual ~DeviceBase();

    DeviceBase(const DeviceBase&) = delete;
    DeviceBase& operator=(const DeviceBase&) = delete;

    /**
     * @brief Resolve the device's port and keep the connection open
     * @param config Transport settings
     * @param candidates Ports to try instead of enumerating
     * @return Device path of the resolved port
     * @throws NoDeviceFoundError if no port passes testConnection()
     */
    std::string connect(const ConnectionConfig& config,
                        const std::optional<std::vector<PortDescriptor>>& candidates = std::nullopt);
    void disconnect();

    bool isConnected() const;
    const std::string& port() const { return port_.devicePath; }
    const PortDescriptor& portDescriptor() const { return port_; }
    const json& identity() const { return identity_; }

    // Throws std::logic_error when not connected.
    Connection& connection();

protected:
    // Return passed() if the device on the other end is the expected one.
    virtual TestResult testConnection(Connection& connection) = 0;

private:
    PortResolver resolver_;
    std::unique_ptr<Connection> connection_;
    PortDescriptor port_;
    json identity_ = json::object();
};

} // namespace SerialDevice
