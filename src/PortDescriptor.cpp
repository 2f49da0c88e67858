#include "SerialDevice/PortDescriptor.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace SerialDevice {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string PortDescriptor::vidPid() const {
    if (!hasUsbIds()) return "";
    return vendorId + ":" + productId;
}

json PortDescriptor::toJson() const {
    json j;
    j["devicePath"] = devicePath;
    j["description"] = description;
    j["hardwareId"] = hardwareId;
    j["vendorId"] = vendorId;
    j["productId"] = productId;
    j["serialNumber"] = serialNumber;
    j["manufacturer"] = manufacturer;
    return j;
}

PortDescriptor PortDescriptor::fromJson(const json& j) {
    PortDescriptor port;
    port.devicePath = j.value("devicePath", "");
    port.description = j.value("description", "");
    port.hardwareId = j.value("hardwareId", "");
    port.vendorId = toLower(j.value("vendorId", ""));
    port.productId = toLower(j.value("productId", ""));
    port.serialNumber = j.value("serialNumber", "");
    port.manufacturer = j.value("manufacturer", "");

    if (!port.hasUsbIds() && !port.hardwareId.empty()) {
        std::string vid, pid;
        if (parseHardwareId(port.hardwareId, vid, pid)) {
            port.vendorId = vid;
            port.productId = pid;
        }
    }
    return port;
}

bool operator==(const PortDescriptor& lhs, const PortDescriptor& rhs) {
    return lhs.devicePath == rhs.devicePath &&
           lhs.description == rhs.description &&
           lhs.hardwareId == rhs.hardwareId &&
           lhs.vendorId == rhs.vendorId &&
           lhs.productId == rhs.productId &&
           lhs.serialNumber == rhs.serialNumber &&
           lhs.manufacturer == rhs.manufacturer;
}

bool operator!=(const PortDescriptor& lhs, const PortDescriptor& rhs) {
    return !(lhs == rhs);
}

bool parseHardwareId(const std::string& hardwareId, std::string& vendorId, std::string& productId) {
    static const std::regex windowsStyle("vid_([0-9a-f]+)\\+pid_([0-9a-f]+)");
    static const std::regex usbStyle("vid:pid=([0-9a-f]+):([0-9a-f]+)");

    std::string lower = toLower(hardwareId);
    std::smatch match;

    if (std::regex_search(lower, match, windowsStyle) ||
        std::regex_search(lower, match, usbStyle)) {
        vendorId = match[1].str();
        productId = match[2].str();
        return true;
    }
    return false;
}

std::string formatHardwareId(const std::string& vendorId, const std::string& productId,
                             const std::string& serialNumber) {
    if (vendorId.empty() || productId.empty()) {
        return "n/a";
    }

    std::string hwid = "USB VID:PID=" + toLower(vendorId) + ":" + toLower(productId);
    if (!serialNumber.empty()) {
        hwid += " SER=" + serialNumber;
    }
    return hwid;
}

json portsToJson(const std::vector<PortDescriptor>& ports) {
    json j = json::array();
    for (const auto& port : ports) {
        j.push_back(port.toJson());
    }
    return j;
}

} // namespace SerialDevice
