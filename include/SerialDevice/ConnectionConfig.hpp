#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace SerialDevice {

using json = nlohmann::json;

enum class Parity {
    NONE,
    ODD,
    EVEN
};

enum class FlowControl {
    NONE,
    HARDWARE,
    SOFTWARE
};

struct ConnectionConfig {
    int baudrate{115200};
    int dataBits{8};
    Parity parity{Parity::NONE};
    int stopBits{1};
    FlowControl flowControl{FlowControl::NONE};
    int readTimeoutMs{500};
    bool exclusive{true};    // take TIOCEXCL so nobody else opens the port while we hold it

    // Throws std::invalid_argument on unsupported values.
    void validate() const;

    json toJson() const;
    static ConnectionConfig fromJson(const json& j);
};

std::string parityToString(Parity parity);
Parity parityFromString(const std::string& name);
std::string flowControlToString(FlowControl flowControl);
FlowControl flowControlFromString(const std::string& name);

bool isSupportedBaudrate(int baudrate);

} // namespace SerialDevice
