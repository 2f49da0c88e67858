#include "SerialDevice/Errors.hpp"
#include <utility>

namespace SerialDevice {

PortOpenError::PortOpenError(const std::string& devicePath, const std::string& reason)
    : SerialDeviceError("Failed to open " + devicePath + ": " + reason),
      devicePath_(devicePath), reason_(reason) {}

std::string probeOutcomeToString(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::OPEN_FAILED: return "OPEN_FAILED";
        case ProbeOutcome::TEST_FAILED: return "TEST_FAILED";
        case ProbeOutcome::TEST_ERROR: return "TEST_ERROR";
        default: return "UNKNOWN";
    }
}

json ProbeFailure::toJson() const {
    json j;
    j["port"] = port.toJson();
    j["outcome"] = probeOutcomeToString(outcome);
    j["reason"] = reason;
    return j;
}

NoDeviceFoundError::NoDeviceFoundError(std::vector<ProbeFailure> failures)
    : SerialDeviceError(buildMessage(failures)), failures_(std::move(failures)) {}

json NoDeviceFoundError::toJson() const {
    json j = json::array();
    for (const auto& failure : failures_) {
        j.push_back(failure.toJson());
    }
    return j;
}

std::string NoDeviceFoundError::buildMessage(const std::vector<ProbeFailure>& failures) {
    if (failures.empty()) {
        return "Could not connect to serial device: no candidate ports";
    }

    std::string message = "Could not connect to serial device: " +
                          std::to_string(failures.size()) + " candidate port(s) failed";
    for (const auto& failure : failures) {
        message += "; " + failure.port.devicePath + " " +
                   probeOutcomeToString(failure.outcome) + " (" + failure.reason + ")";
    }
    return message;
}

} // namespace SerialDevice
