#pragma once
#include "Connection.hpp"
#include "ConnectionConfig.hpp"
#include <string>

namespace SerialDevice {

// termios-backed serial port.
class SerialConnection : public Connection {
public:
    explicit SerialConnection(const std::string& devicePath);
    ~SerialConnection() override;

    SerialConnection(const SerialConnection&) = delete;
    SerialConnection& operator=(const SerialConnection&) = delete;

    // On failure the port is left closed and lastError() holds the reason.
    bool open(const ConnectionConfig& config);
    void close() override;
    bool isOpen() const override;

    int read(uint8_t* buffer, size_t size, int timeoutMs) override;
    int write(const uint8_t* data, size_t size) override;

    const std::string& portName() const override { return devicePath_; }
    const std::string& lastError() const { return lastError_; }

private:
    bool configurePort(const ConnectionConfig& config);

    std::string devicePath_;
    int fd_;
    std::string lastError_;
};

} // namespace SerialDevice
