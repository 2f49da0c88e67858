// Lists the serial ports on this host, then looks for a device that answers
// a line query (for example "*IDN?") with a line containing an expected string.

#include "SerialDevice/ConfigLoader.hpp"
#include "SerialDevice/Errors.hpp"
#include "SerialDevice/Logger.hpp"
#include "SerialDevice/PortEnumerator.hpp"
#include "SerialDevice/PortResolver.hpp"
#include <iostream>
#include <string>

using namespace SerialDevice;

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Discovery configuration JSON file\n";
    std::cout << "  -q, --query TEXT        Line sent to every candidate port\n";
    std::cout << "  -e, --expect TEXT       Substring the response must contain\n";
    std::cout << "  -l, --list              Only list ports and their availability\n";
    std::cout << "  -h, --help              Display this help message and exit\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << programName << " --query '*IDN?' --expect 'ACME'\n";
}

int main(int argc, char* argv[]) {
    std::string configFile;
    std::string query;
    std::string expect;
    bool listOnly = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "-l" || arg == "--list") {
            listOnly = true;
        } else if ((arg == "-c" || arg == "--config" || arg == "-q" || arg == "--query" ||
                    arg == "-e" || arg == "--expect")) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument." << std::endl;
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "-c" || arg == "--config") configFile = value;
            else if (arg == "-q" || arg == "--query") query = value;
            else expect = value;
        } else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            std::cerr << "Use -h or --help for usage information." << std::endl;
            return 1;
        }
    }

    ConfigLoader loader;
    if (!configFile.empty() && !loader.loadFromFile(configFile)) {
        std::cerr << "Error: Failed to load config file: " << configFile << std::endl;
        return 1;
    }
    loader.applyLogSettings();
    DiscoveryConfig config = loader.getConfig();
    PortResolver resolver = loader.makeResolver();

    std::vector<PortDescriptor> ports;
    try {
        ports = resolver.enumerateCandidates();
    } catch (const EnumerationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    json listing = json::array();
    for (const auto& entry : resolver.checkAvailable(ports, config.connection)) {
        json port = entry.port.toJson();
        port["available"] = entry.available;
        if (!entry.available) port["reason"] = entry.reason;
        listing.push_back(port);
    }
    std::cout << listing.dump(2) << std::endl;

    if (listOnly) {
        return 0;
    }
    if (query.empty() || expect.empty()) {
        std::cerr << "Error: --query and --expect are required to resolve a device." << std::endl;
        return 1;
    }

    ConnectionTest test = [&](Connection& connection) {
        if (!connection.writeString(query + "\n")) {
            return TestResult::failed("write failed");
        }
        auto line = connection.readLine();
        if (!line) {
            return TestResult::failed("no response");
        }
        if (line->find(expect) == std::string::npos) {
            return TestResult::failed("unexpected response: " + *line);
        }
        return TestResult::passed({{"response", *line}});
    };

    try {
        Resolution resolution = resolver.resolve(test, config.connection, ports);
        std::cout << "Device found on " << resolution.port.devicePath << ": "
                  << resolution.result.identity.dump() << std::endl;
    } catch (const NoDeviceFoundError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << e.toJson().dump(2) << std::endl;
        return 2;
    }

    return 0;
}
