#include "SerialDevice/UdevPortEnumerator.hpp"
#include "SerialDevice/Errors.hpp"
#include "SerialDevice/Logger.hpp"
#include <libudev.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <utility>

namespace SerialDevice {

namespace {

struct UdevDeleter {
    void operator()(struct udev* udev) const { udev_unref(udev); }
    void operator()(struct udev_enumerate* enumerate) const { udev_enumerate_unref(enumerate); }
    void operator()(struct udev_device* dev) const { udev_device_unref(dev); }
};

using UdevPtr = std::unique_ptr<struct udev, UdevDeleter>;
using UdevEnumeratePtr = std::unique_ptr<struct udev_enumerate, UdevDeleter>;
using UdevDevicePtr = std::unique_ptr<struct udev_device, UdevDeleter>;

std::string sysattr(struct udev_device* dev, const char* name) {
    const char* value = udev_device_get_sysattr_value(dev, name);
    return value ? std::string(value) : std::string();
}

std::string property(struct udev_device* dev, const char* name) {
    const char* value = udev_device_get_property_value(dev, name);
    return value ? std::string(value) : std::string();
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

UdevPortEnumerator::UdevPortEnumerator() : devicePathFilters_(defaultFilters()) {}

UdevPortEnumerator::UdevPortEnumerator(std::vector<std::string> devicePathFilters)
    : devicePathFilters_(std::move(devicePathFilters)) {}

std::vector<std::string> UdevPortEnumerator::defaultFilters() {
    return {"/dev/ttyUSB", "/dev/ttyACM"};
}

bool UdevPortEnumerator::matchesFilter(const std::string& devicePath) const {
    if (devicePathFilters_.empty()) {
        return true;
    }
    for (const auto& filter : devicePathFilters_) {
        if (devicePath.compare(0, filter.size(), filter) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<PortDescriptor> UdevPortEnumerator::listPorts() {
    UdevPtr udev(udev_new());
    if (!udev) {
        throw EnumerationError("Failed to create udev context");
    }

    UdevEnumeratePtr enumerate(udev_enumerate_new(udev.get()));
    if (!enumerate) {
        throw EnumerationError("Failed to create udev enumerate");
    }

    udev_enumerate_add_match_subsystem(enumerate.get(), "tty");
    int ret = udev_enumerate_scan_devices(enumerate.get());
    if (ret < 0) {
        throw EnumerationError("Failed to scan tty devices: " + std::string(strerror(-ret)));
    }

    std::vector<PortDescriptor> ports;
    struct udev_list_entry* devices = udev_enumerate_get_list_entry(enumerate.get());
    struct udev_list_entry* entry;

    udev_list_entry_foreach(entry, devices) {
        const char* path = udev_list_entry_get_name(entry);
        UdevDevicePtr dev(udev_device_new_from_syspath(udev.get(), path));
        if (!dev) {
            continue;
        }

        const char* devnode = udev_device_get_devnode(dev.get());
        if (devnode && matchesFilter(devnode)) {
            ports.push_back(describe(dev.get(), devnode));
        }
    }

    std::sort(ports.begin(), ports.end(), [](const PortDescriptor& a, const PortDescriptor& b) {
        return a.devicePath < b.devicePath;
    });

    SD_LOG_DEBUG("Enumerated " + std::to_string(ports.size()) + " serial port(s)");
    return ports;
}

PortDescriptor UdevPortEnumerator::describe(struct udev_device* dev, const std::string& devicePath) const {
    PortDescriptor port(devicePath);

    // The usb_device parent is owned by dev and must not be unref'd
    struct udev_device* usbDev = udev_device_get_parent_with_subsystem_devtype(dev, "usb", "usb_device");
    if (usbDev) {
        port.vendorId = sysattr(usbDev, "idVendor");
        port.productId = sysattr(usbDev, "idProduct");
        port.serialNumber = sysattr(usbDev, "serial");
        port.manufacturer = sysattr(usbDev, "manufacturer");
        port.description = sysattr(usbDev, "product");
    }

    if (port.vendorId.empty()) port.vendorId = property(dev, "ID_VENDOR_ID");
    if (port.productId.empty()) port.productId = property(dev, "ID_MODEL_ID");
    if (port.serialNumber.empty()) port.serialNumber = property(dev, "ID_SERIAL_SHORT");
    if (port.manufacturer.empty()) port.manufacturer = property(dev, "ID_VENDOR");
    if (port.description.empty()) port.description = property(dev, "ID_MODEL");

    port.vendorId = toLower(port.vendorId);
    port.productId = toLower(port.productId);
    port.hardwareId = formatHardwareId(port.vendorId, port.productId, port.serialNumber);

    if (port.description.empty()) {
        port.description = "n/a";
    }
    return port;
}

std::vector<PortDescriptor> listPorts() {
    UdevPortEnumerator enumerator;
    return enumerator.listPorts();
}

} // namespace SerialDevice
