#pragma once
#include "Connection.hpp"
#include "ConnectionConfig.hpp"
#include "ConnectionTest.hpp"
#include "Errors.hpp"
#include "PortDescriptor.hpp"
#include "PortEnumerator.hpp"
#include "PortFilter.hpp"
#include "PortOpener.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SerialDevice {

struct ResolverOptions {
    PortFilter filter;        // applied to enumerated candidates only
    int probeDelayMs{100};    // pause between a failed candidate and the next
};

struct Resolution {
    PortDescriptor port;
    std::unique_ptr<Connection> connection;    // open
    TestResult result;
    std::vector<ProbeFailure> skipped;         // candidates tried before the match
};

struct PortAvailability {
    PortDescriptor port;
    bool available{false};
    std::string reason;
};

class PortResolver {
public:
    // Uses a UdevPortEnumerator and a SerialPortOpener.
    PortResolver();
    explicit PortResolver(ResolverOptions options);
    PortResolver(std::shared_ptr<PortEnumerator> enumerator,
                 std::shared_ptr<PortOpener> opener,
                 ResolverOptions options = ResolverOptions());

    /**
     * @brief Find the first candidate port whose connection passes the test
     *
     * Without explicit candidates the enumerator is queried, the ports are
     * sorted by device path and the filter is applied. Explicit candidates
     * (even an empty list) are tried in the order given. Candidates are probed
     * one at a time; every connection except the returned one is closed.
     *
     * @param test Identification predicate
     * @param config Transport settings for every open attempt
     * @param candidates Ports to try instead of enumerating
     * @return The matching port with its open connection
     * @throws NoDeviceFoundError when no candidate matches
     * @throws EnumerationError when enumeration was needed and failed
     */
    Resolution resolve(const ConnectionTest& test,
                       const ConnectionConfig& config,
                       const std::optional<std::vector<PortDescriptor>>& candidates = std::nullopt) const;

    // Candidate list resolve() would use when none is given.
    std::vector<PortDescriptor> enumerateCandidates() const;

    // Opens and immediately closes each port. Never throws for a per-port failure.
    std::vector<PortAvailability> checkAvailable(const std::vector<PortDescriptor>& ports,
                                                 const ConnectionConfig& config) const;

    const ResolverOptions& options() const { return options_; }

private:
    std::optional<ProbeFailure> probe(const PortDescriptor& port,
                                      const ConnectionTest& test,
                                      const ConnectionConfig& config,
                                      Resolution& resolution) const;

    std::shared_ptr<PortEnumerator> enumerator_;
    std::shared_ptr<PortOpener> opener_;
    ResolverOptions options_;
};

// resolve() on a default PortResolver.
Resolution resolve(const ConnectionTest& test,
                   const ConnectionConfig& config,
                   const std::optional<std::vector<PortDescriptor>>& candidates = std::nullopt);

} // namespace SerialDevice
