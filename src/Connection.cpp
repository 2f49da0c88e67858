#include "SerialDevice/Connection.hpp"
#include <chrono>

namespace SerialDevice {

bool Connection::writeString(const std::string& data) {
    if (data.empty()) return true;
    int written = write(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return written == static_cast<int>(data.size());
}

std::optional<std::string> Connection::readLine(int timeoutMs, size_t maxLength) {
    std::string line;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    while (line.size() < maxLength) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return std::nullopt;
        }

        uint8_t byte = 0;
        int n = read(&byte, 1, static_cast<int>(remaining));
        if (n < 0) {
            return std::nullopt;
        }
        if (n == 0) {
            continue;
        }

        if (byte == '\n') {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        line.push_back(static_cast<char>(byte));
    }

    return std::nullopt;
}

std::optional<std::string> Connection::readLine() {
    return readLine(readTimeoutMs_);
}

} // namespace SerialDevice
