#include "SerialDevice/ConfigLoader.hpp"
#include "SerialDevice/Logger.hpp"
#include "SerialDevice/UdevPortEnumerator.hpp"
#include <fstream>
#include <memory>

namespace SerialDevice {

ConfigLoader::ConfigLoader() {
    setDefaults();
}

bool ConfigLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        SD_LOG_WARNING("Config file not found: " + filename + ", using defaults");
        return false;
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        SD_LOG_ERROR("Error parsing config file " + filename + ": " + std::string(e.what()));
        return false;
    }

    return loadFromJson(j);
}

bool ConfigLoader::loadFromJson(const json& j) {
    if (!j.is_object()) {
        SD_LOG_ERROR("Configuration must be a JSON object");
        return false;
    }

    DiscoveryConfig loaded = config_;

    try {
        if (j.contains("devicePathFilters")) {
            loaded.devicePathFilters = j["devicePathFilters"].get<std::vector<std::string>>();
        }
        if (j.contains("vidPids")) {
            loaded.vidPids = j["vidPids"].get<std::vector<std::string>>();
        }
        if (j.contains("includeAll")) {
            loaded.includeAll = j["includeAll"].get<bool>();
        }
        if (j.contains("probeDelayMs")) {
            loaded.probeDelayMs = j["probeDelayMs"].get<int>();
        }
        if (j.contains("connection")) {
            loaded.connection = ConnectionConfig::fromJson(j["connection"]);
        }
        if (j.contains("logFile")) {
            loaded.logFile = j["logFile"].get<std::string>();
        }
        if (j.contains("logLevel")) {
            loaded.logLevel = j["logLevel"].get<std::string>();
        }

        loaded.connection.validate();
    } catch (const std::exception& e) {
        SD_LOG_ERROR("Invalid configuration: " + std::string(e.what()));
        return false;
    }

    if (loaded.probeDelayMs < 0) {
        SD_LOG_ERROR("Invalid configuration: probeDelayMs must not be negative");
        return false;
    }
    if (!logLevelFromString(loaded.logLevel)) {
        SD_LOG_ERROR("Invalid configuration: unknown logLevel " + loaded.logLevel);
        return false;
    }

    config_ = loaded;
    SD_LOG_INFO("Discovery configuration loaded successfully");
    return true;
}

DiscoveryConfig ConfigLoader::getConfig() const {
    return config_;
}

void ConfigLoader::applyLogSettings() const {
    if (auto level = logLevelFromString(config_.logLevel)) {
        Logger::getInstance().setLogLevel(*level);
    }
    if (!config_.logFile.empty()) {
        Logger::getInstance().setLogFile(config_.logFile);
    }
}

PortResolver ConfigLoader::makeResolver() const {
    ResolverOptions options;
    options.filter = PortFilter(config_.vidPids, config_.includeAll);
    options.probeDelayMs = config_.probeDelayMs;

    return PortResolver(std::make_shared<UdevPortEnumerator>(config_.devicePathFilters),
                        std::make_shared<SerialPortOpener>(),
                        options);
}

void ConfigLoader::setDefaults() {
    config_.devicePathFilters = UdevPortEnumerator::defaultFilters();
    config_.vidPids = {};
    config_.includeAll = true;
    config_.probeDelayMs = 100;
    config_.connection = ConnectionConfig();
    config_.logFile = "";
    config_.logLevel = "INFO";
}

} // namespace SerialDevice
