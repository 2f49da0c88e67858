#pragma once
#include "PortDescriptor.hpp"
#include <string>
#include <vector>

namespace SerialDevice {

// Restricts or reorders ports by USB vendor/product ID ("vvvv:pppp").
class PortFilter {
public:
    PortFilter() = default;
    PortFilter(std::vector<std::string> vidPids, bool includeAll);

    /**
     * @brief Apply the filter to a port list
     *
     * Without vid/pids the list is returned unchanged. With includeAll the
     * matching ports are moved to the front, keeping relative order; otherwise
     * only matching ports are kept.
     */
    std::vector<PortDescriptor> apply(const std::vector<PortDescriptor>& ports) const;

    bool matches(const PortDescriptor& port) const;
    bool empty() const { return vidPids_.empty(); }

    const std::vector<std::string>& vidPids() const { return vidPids_; }
    bool includeAll() const { return includeAll_; }

private:
    std::vector<std::string> vidPids_;
    bool includeAll_ = false;
};

} // namespace SerialDevice
