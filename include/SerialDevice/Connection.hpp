#pragma once
#include "ConnectionConfig.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace SerialDevice {

// An open handle to a serial port. Owned through std::unique_ptr; the
// destructor of every implementation releases the port.
class Connection {
public:
    virtual ~Connection() = default;

    virtual const std::string& portName() const = 0;
    virtual bool isOpen() const = 0;
    virtual void close() = 0;

    // Returns bytes read, 0 on timeout, -1 on error.
    virtual int read(uint8_t* buffer, size_t size, int timeoutMs) = 0;
    // Returns bytes written, -1 on error.
    virtual int write(const uint8_t* data, size_t size) = 0;

    bool writeString(const std::string& data);

    /**
     * @brief Read bytes until a newline or until the timeout expires
     * @param timeoutMs Overall deadline for the line
     * @param maxLength Give up once this many bytes have been collected
     * @return The line without its terminator ("\r\n" or "\n"), or
     *         std::nullopt on timeout, error or overflow
     */
    std::optional<std::string> readLine(int timeoutMs, size_t maxLength = 1024);

    // readLine() bounded by readTimeoutMs()
    std::optional<std::string> readLine();

    // Read timeout of the ConnectionConfig the port was opened with.
    int readTimeoutMs() const { return readTimeoutMs_; }

protected:
    int readTimeoutMs_{ConnectionConfig().readTimeoutMs};
};

} // namespace SerialDevice
