#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace SerialDevice {

using json = nlohmann::json;

// Snapshot of one serial port as seen by the host. Empty metadata fields
// mean the host did not expose them. USB IDs are lowercase four-digit hex.
struct PortDescriptor {
    std::string devicePath;      // e.g. /dev/ttyACM0
    std::string description;     // USB product string when available
    std::string hardwareId;      // e.g. "USB VID:PID=2341:0043 SER=7543"
    std::string vendorId;
    std::string productId;
    std::string serialNumber;
    std::string manufacturer;

    PortDescriptor() = default;
    explicit PortDescriptor(const std::string& path) : devicePath(path) {}

    bool hasUsbIds() const { return !vendorId.empty() && !productId.empty(); }

    // "vvvv:pppp", or empty if the IDs are unknown
    std::string vidPid() const;

    json toJson() const;
    static PortDescriptor fromJson(const json& j);
};

bool operator==(const PortDescriptor& lhs, const PortDescriptor& rhs);
bool operator!=(const PortDescriptor& lhs, const PortDescriptor& rhs);

/**
 * @brief Extract USB vendor/product IDs from a host hardware ID string
 *
 * Understands both the Windows style (`FTDIBUS\VID_0403+PID_6001+A600\0000`)
 * and the pyserial/udev style (`USB VID:PID=16C0:0483 SNR=2145930`).
 *
 * @param hardwareId Hardware ID string
 * @param vendorId Receives the lowercase vendor ID on success
 * @param productId Receives the lowercase product ID on success
 * @return true if both IDs were found
 */
bool parseHardwareId(const std::string& hardwareId, std::string& vendorId, std::string& productId);

// Builds "USB VID:PID=vvvv:pppp[ SER=...]", or "n/a" when no IDs are known.
std::string formatHardwareId(const std::string& vendorId, const std::string& productId,
                             const std::string& serialNumber);

json portsToJson(const std::vector<PortDescriptor>& ports);

} // namespace SerialDevice
