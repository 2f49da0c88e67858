#include "SerialDevice/PortFilter.hpp"
#include <algorithm>
#include <cctype>

namespace SerialDevice {

PortFilter::PortFilter(std::vector<std::string> vidPids, bool includeAll)
    : includeAll_(includeAll) {
    for (auto& vidPid : vidPids) {
        std::transform(vidPid.begin(), vidPid.end(), vidPid.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        vidPids_.push_back(vidPid);
    }
}

bool PortFilter::matches(const PortDescriptor& port) const {
    std::string vidPid = port.vidPid();
    if (vidPid.empty()) {
        return false;
    }
    return std::find(vidPids_.begin(), vidPids_.end(), vidPid) != vidPids_.end();
}

std::vector<PortDescriptor> PortFilter::apply(const std::vector<PortDescriptor>& ports) const {
    if (vidPids_.empty()) {
        return ports;
    }

    std::vector<PortDescriptor> result;
    result.reserve(ports.size());

    for (const auto& port : ports) {
        if (matches(port)) {
            result.push_back(port);
        }
    }

    if (includeAll_) {
        for (const auto& port : ports) {
            if (!matches(port)) {
                result.push_back(port);
            }
        }
    }

    return result;
}

} // namespace SerialDevice
