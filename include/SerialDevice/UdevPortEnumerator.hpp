#pragma once
#include "PortEnumerator.hpp"
#include <string>
#include <vector>

struct udev;
struct udev_device;

namespace SerialDevice {

// Enumerates tty devices through libudev, keeping the device nodes whose
// path starts with one of the configured prefixes.
class UdevPortEnumerator : public PortEnumerator {
public:
    UdevPortEnumerator();
    explicit UdevPortEnumerator(std::vector<std::string> devicePathFilters);

    std::vector<PortDescriptor> listPorts() override;

    const std::vector<std::string>& devicePathFilters() const { return devicePathFilters_; }
    bool matchesFilter(const std::string& devicePath) const;

    static std::vector<std::string> defaultFilters();

private:
    PortDescriptor describe(struct udev_device* dev, const std::string& devicePath) const;

    std::vector<std::string> devicePathFilters_;
};

} // namespace SerialDevice
