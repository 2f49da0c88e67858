#pragma once
#include "ConnectionConfig.hpp"
#include "PortResolver.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace SerialDevice {

using json = nlohmann::json;

struct DiscoveryConfig {
    std::vector<std::string> devicePathFilters;
    std::vector<std::string> vidPids;
    bool includeAll;
    int probeDelayMs;
    ConnectionConfig connection;
    std::string logFile;
    std::string logLevel;
};

class ConfigLoader {
public:
    ConfigLoader();

    // Missing keys keep their defaults. Returns false (and keeps the
    // previous configuration) if the file cannot be read or is invalid.
    bool loadFromFile(const std::string& filename);
    bool loadFromJson(const json& jsonConfig);

    DiscoveryConfig getConfig() const;

    void applyLogSettings() const;
    PortResolver makeResolver() const;

private:
    DiscoveryConfig config_;
    void setDefaults();
};

} // namespace SerialDevice
