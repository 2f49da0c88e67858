#include "SerialDevice/PortOpener.hpp"
#include "SerialDevice/Errors.hpp"
#include "SerialDevice/SerialConnection.hpp"
#include <stdexcept>

namespace SerialDevice {

std::unique_ptr<Connection> SerialPortOpener::open(const PortDescriptor& port, const ConnectionConfig& config) {
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        throw PortOpenError(port.devicePath, e.what());
    }

    auto connection = std::make_unique<SerialConnection>(port.devicePath);
    if (!connection->open(config)) {
        throw PortOpenError(port.devicePath, connection->lastError());
    }
    return connection;
}

} // namespace SerialDevice
