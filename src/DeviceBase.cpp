#include "SerialDevice/DeviceBase.hpp"
#include "SerialDevice/Logger.hpp"
#include <stdexcept>
#include <utility>

namespace SerialDevice {

DeviceBase::DeviceBase() = default;

DeviceBase::DeviceBase(PortResolver resolver) : resolver_(std::move(resolver)) {}

DeviceBase::~DeviceBase() {
    disconnect();
}

std::string DeviceBase::connect(const ConnectionConfig& config,
                                const std::optional<std::vector<PortDescriptor>>& candidates) {
    disconnect();

    Resolution resolution = resolver_.resolve(
        [this](Connection& connection) { return testConnection(connection); },
        config, candidates);

    connection_ = std::move(resolution.connection);
    port_ = std::move(resolution.port);
    identity_ = std::move(resolution.result.identity);

    SD_LOG_INFO("Connected to serial device on " + port_.devicePath);
    return port_.devicePath;
}

void DeviceBase::disconnect() {
    if (connection_) {
        connection_->close();
        connection_.reset();
        SD_LOG_DEBUG("Disconnected from " + port_.devicePath);
    }
    port_ = PortDescriptor();
    identity_ = json::object();
}

bool DeviceBase::isConnected() const {
    return connection_ && connection_->isOpen();
}

Connection& DeviceBase::connection() {
    if (!connection_) {
        throw std::logic_error("Serial device is not connected");
    }
    return *connection_;
}

} // namespace SerialDevice
