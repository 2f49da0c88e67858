#pragma once
#include "PortDescriptor.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace SerialDevice {

class SerialDeviceError : public std::runtime_error {
public:
    explicit SerialDeviceError(const std::string& message) : std::runtime_error(message) {}
};

// The host's port listing facility failed (no udev context, scan error...).
class EnumerationError : public SerialDeviceError {
public:
    explicit EnumerationError(const std::string& message) : SerialDeviceError(message) {}
};

class PortOpenError : public SerialDeviceError {
public:
    PortOpenError(const std::string& devicePath, const std::string& reason);

    const std::string& devicePath() const { return devicePath_; }
    const std::string& reason() const { return reason_; }

private:
    std::string devicePath_;
    std::string reason_;
};

// Thrown by a connection test to report that the identification check failed.
class ConnectionTestError : public SerialDeviceError {
public:
    explicit ConnectionTestError(const std::string& message) : SerialDeviceError(message) {}
};

enum class ProbeOutcome {
    OPEN_FAILED,
    TEST_FAILED,
    TEST_ERROR
};

std::string probeOutcomeToString(ProbeOutcome outcome);

struct ProbeFailure {
    PortDescriptor port;
    ProbeOutcome outcome;
    std::string reason;

    json toJson() const;
};

class NoDeviceFoundError : public SerialDeviceError {
public:
    explicit NoDeviceFoundError(std::vector<ProbeFailure> failures);

    const std::vector<ProbeFailure>& failures() const { return failures_; }
    json toJson() const;

private:
    static std::string buildMessage(const std::vector<ProbeFailure>& failures);

    std::vector<ProbeFailure> failures_;
};

} // namespace SerialDevice
