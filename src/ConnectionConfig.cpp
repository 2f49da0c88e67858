#include "SerialDevice/ConnectionConfig.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace SerialDevice {

namespace {

const int kSupportedBaudrates[] = {
    1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200, 230400, 460800,
    500000, 576000, 921600, 1000000, 1152000, 1500000, 2000000
};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

bool isSupportedBaudrate(int baudrate) {
    return std::find(std::begin(kSupportedBaudrates), std::end(kSupportedBaudrates), baudrate) !=
           std::end(kSupportedBaudrates);
}

void ConnectionConfig::validate() const {
    if (!isSupportedBaudrate(baudrate)) {
        throw std::invalid_argument("Unsupported baudrate: " + std::to_string(baudrate));
    }
    if (dataBits < 5 || dataBits > 8) {
        throw std::invalid_argument("Unsupported data bits: " + std::to_string(dataBits));
    }
    if (stopBits != 1 && stopBits != 2) {
        throw std::invalid_argument("Unsupported stop bits: " + std::to_string(stopBits));
    }
    if (readTimeoutMs < 0) {
        throw std::invalid_argument("Read timeout must not be negative");
    }
}

json ConnectionConfig::toJson() const {
    json j;
    j["baudrate"] = baudrate;
    j["dataBits"] = dataBits;
    j["parity"] = parityToString(parity);
    j["stopBits"] = stopBits;
    j["flowControl"] = flowControlToString(flowControl);
    j["readTimeoutMs"] = readTimeoutMs;
    j["exclusive"] = exclusive;
    return j;
}

ConnectionConfig ConnectionConfig::fromJson(const json& j) {
    ConnectionConfig config;
    config.baudrate = j.value("baudrate", config.baudrate);
    config.dataBits = j.value("dataBits", config.dataBits);
    if (j.contains("parity")) {
        config.parity = parityFromString(j["parity"].get<std::string>());
    }
    config.stopBits = j.value("stopBits", config.stopBits);
    if (j.contains("flowControl")) {
        config.flowControl = flowControlFromString(j["flowControl"].get<std::string>());
    }
    config.readTimeoutMs = j.value("readTimeoutMs", config.readTimeoutMs);
    config.exclusive = j.value("exclusive", config.exclusive);
    return config;
}

std::string parityToString(Parity parity) {
    switch (parity) {
        case Parity::NONE: return "none";
        case Parity::ODD: return "odd";
        case Parity::EVEN: return "even";
        default: return "unknown";
    }
}

Parity parityFromString(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "none") return Parity::NONE;
    if (lower == "odd") return Parity::ODD;
    if (lower == "even") return Parity::EVEN;
    throw std::invalid_argument("Unknown parity: " + name);
}

std::string flowControlToString(FlowControl flowControl) {
    switch (flowControl) {
        case FlowControl::NONE: return "none";
        case FlowControl::HARDWARE: return "hardware";
        case FlowControl::SOFTWARE: return "software";
        default: return "unknown";
    }
}

FlowControl flowControlFromString(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "none") return FlowControl::NONE;
    if (lower == "hardware" || lower == "rtscts") return FlowControl::HARDWARE;
    if (lower == "software" || lower == "xonxoff") return FlowControl::SOFTWARE;
    throw std::invalid_argument("Unknown flow control: " + name);
}

} // namespace SerialDevice
