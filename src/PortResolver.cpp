#include "SerialDevice/PortResolver.hpp"
#include "SerialDevice/Logger.hpp"
#include "SerialDevice/UdevPortEnumerator.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

namespace SerialDevice {

namespace {

// Releases a connection that is being discarded. A failing close must not
// abort resolution of the remaining candidates.
void closeDiscarded(Connection& connection) {
    try {
        connection.close();
    } catch (const std::exception& e) {
        SD_LOG_WARNING("Error closing " + connection.portName() + ": " + std::string(e.what()));
    } catch (...) {
        SD_LOG_WARNING("Unknown error closing " + connection.portName());
    }
}

} // namespace

PortResolver::PortResolver() : PortResolver(ResolverOptions()) {}

PortResolver::PortResolver(ResolverOptions options)
    : PortResolver(std::make_shared<UdevPortEnumerator>(),
                   std::make_shared<SerialPortOpener>(),
                   std::move(options)) {}

PortResolver::PortResolver(std::shared_ptr<PortEnumerator> enumerator,
                           std::shared_ptr<PortOpener> opener,
                           ResolverOptions options)
    : enumerator_(std::move(enumerator)), opener_(std::move(opener)), options_(std::move(options)) {
    if (!enumerator_ || !opener_) {
        throw std::invalid_argument("PortResolver requires an enumerator and an opener");
    }
}

std::vector<PortDescriptor> PortResolver::enumerateCandidates() const {
    std::vector<PortDescriptor> ports = enumerator_->listPorts();

    std::stable_sort(ports.begin(), ports.end(), [](const PortDescriptor& a, const PortDescriptor& b) {
        return a.devicePath < b.devicePath;
    });

    return options_.filter.apply(ports);
}

Resolution PortResolver::resolve(const ConnectionTest& test,
                                 const ConnectionConfig& config,
                                 const std::optional<std::vector<PortDescriptor>>& candidates) const {
    if (!test) {
        throw std::invalid_argument("Connection test must be callable");
    }

    const std::vector<PortDescriptor> ports = candidates ? *candidates : enumerateCandidates();

    if (ports.empty()) {
        SD_LOG_WARNING("No candidate serial ports to probe");
        throw NoDeviceFoundError(std::vector<ProbeFailure>());
    }

    SD_LOG_DEBUG("Probing " + std::to_string(ports.size()) + " candidate port(s) @ " +
                 std::to_string(config.baudrate) + " baud");

    std::vector<ProbeFailure> failures;
    failures.reserve(ports.size());

    for (size_t i = 0; i < ports.size(); ++i) {
        const PortDescriptor& port = ports[i];

        Resolution resolution;
        std::optional<ProbeFailure> failure = probe(port, test, config, resolution);
        if (!failure) {
            SD_LOG_INFO("Serial device found on " + port.devicePath);
            resolution.skipped = std::move(failures);
            return resolution;
        }

        SD_LOG_DEBUG(port.devicePath + ": " + probeOutcomeToString(failure->outcome) +
                     " (" + failure->reason + ")");
        failures.push_back(std::move(*failure));

        if (i + 1 < ports.size() && options_.probeDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(options_.probeDelayMs));
        }
    }

    SD_LOG_WARNING("No serial device matched after probing " + std::to_string(failures.size()) +
                   " port(s)");
    throw NoDeviceFoundError(std::move(failures));
}

std::optional<ProbeFailure> PortResolver::probe(const PortDescriptor& port,
                                                const ConnectionTest& test,
                                                const ConnectionConfig& config,
                                                Resolution& resolution) const {
    SD_LOG_DEBUG("Testing " + port.devicePath);

    std::unique_ptr<Connection> connection;
    try {
        connection = opener_->open(port, config);
    } catch (const PortOpenError& e) {
        return ProbeFailure{port, ProbeOutcome::OPEN_FAILED, e.reason()};
    } catch (const std::exception& e) {
        return ProbeFailure{port, ProbeOutcome::OPEN_FAILED, e.what()};
    } catch (...) {
        return ProbeFailure{port, ProbeOutcome::OPEN_FAILED, "unknown error"};
    }

    if (!connection || !connection->isOpen()) {
        return ProbeFailure{port, ProbeOutcome::OPEN_FAILED, "port did not open"};
    }

    std::optional<ProbeFailure> failure;
    TestResult result;
    try {
        result = test(*connection);
        if (!result.success) {
            std::string reason = result.reason.empty() ? "connection test failed" : result.reason;
            failure = ProbeFailure{port, ProbeOutcome::TEST_FAILED, reason};
        } else if (!connection->isOpen()) {
            failure = ProbeFailure{port, ProbeOutcome::TEST_ERROR, "connection closed during test"};
        }
    } catch (const ConnectionTestError& e) {
        failure = ProbeFailure{port, ProbeOutcome::TEST_FAILED, e.what()};
    } catch (const std::exception& e) {
        failure = ProbeFailure{port, ProbeOutcome::TEST_ERROR, e.what()};
    } catch (...) {
        failure = ProbeFailure{port, ProbeOutcome::TEST_ERROR, "unknown error"};
    }

    if (failure) {
        closeDiscarded(*connection);
        return failure;
    }

    resolution.port = port;
    resolution.connection = std::move(connection);
    resolution.result = std::move(result);
    return std::nullopt;
}

std::vector<PortAvailability> PortResolver::checkAvailable(const std::vector<PortDescriptor>& ports,
                                                           const ConnectionConfig& config) const {
    std::vector<PortAvailability> availability;
    availability.reserve(ports.size());

    for (const auto& port : ports) {
        PortAvailability entry;
        entry.port = port;
        try {
            std::unique_ptr<Connection> connection = opener_->open(port, config);
            entry.available = connection && connection->isOpen();
            if (connection) {
                closeDiscarded(*connection);
            }
            if (!entry.available) {
                entry.reason = "port did not open";
            }
        } catch (const PortOpenError& e) {
            entry.reason = e.reason();
        } catch (const std::exception& e) {
            entry.reason = e.what();
        } catch (...) {
            entry.reason = "unknown error";
        }

        SD_LOG_DEBUG(port.devicePath + (entry.available ? " available" : " unavailable: " + entry.reason));
        availability.push_back(std::move(entry));
    }

    return availability;
}

Resolution resolve(const ConnectionTest& test,
                   const ConnectionConfig& config,
                   const std::optional<std::vector<PortDescriptor>>& candidates) {
    PortResolver resolver;
    return resolver.resolve(test, config, candidates);
}

} // namespace SerialDevice
