#pragma once
#include "PortDescriptor.hpp"
#include <vector>

namespace SerialDevice {

class PortEnumerator {
public:
    virtual ~PortEnumerator() = default;

    /**
     * @brief Snapshot the serial ports currently present on the host
     * @return Port descriptors, materialized eagerly
     * @throws EnumerationError if the host listing facility fails
     */
    virtual std::vector<PortDescriptor> listPorts() = 0;
};

// Lists ports with a default UdevPortEnumerator, sorted by device path.
std::vector<PortDescriptor> listPorts();

} // namespace SerialDevice
