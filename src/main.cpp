#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include "fleet_operator.hpp"
#include "operator_api.hpp"

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] [--state <path>] --daemon\n"
              << "       " << program << " [--config <path>] [--state <path>] backup <namespace> <name>\n"
              << "       " << program << " [--config <path>] [--state <path>] refresh-replica <namespace> <cluster>"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    bool daemonMode = false;
    std::string configFile = "pgfleet_config.json";
    std::string stateFile;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--daemon") {
            daemonMode = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--state" && i + 1 < argc) {
            stateFile = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    if (daemonMode) {
        try {
            FleetOperator fleet(configFile, stateFile);
            fleet.runDaemon();
        } catch (const std::exception& e) {
            std::cerr << "Error: Daemon failed to start: " << e.what() << std::endl;
            return 1;
        }
        return 0;
    }

    if (positional.size() != 3) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string& command = positional[0];
    if (command == "backup") {
        auto result = OperatorAPI::runBackup(configFile, stateFile, positional[1], positional[2]);
        if (!result) {
            std::cerr << "Error: " << describe(result.error()) << std::endl;
            return 1;
        }
        if (result->isDone()) {
            std::cout << "Backup completed with " << result->snapshots.size() << " snapshots." << std::endl;
        } else {
            std::cout << "Backup at step " << backupStepName(result->step) << ", run again in "
                      << result->requeueAfter.count() << " seconds." << std::endl;
        }
        return 0;
    }

    if (command == "refresh-replica") {
        auto changed = OperatorAPI::refreshReplica(configFile, stateFile, positional[1], positional[2]);
        if (!changed) {
            std::cerr << "Error: " << describe(changed.error()) << std::endl;
            return 1;
        }
        std::cout << (*changed ? "Replica configuration changed." : "Replica configuration unchanged.") << std::endl;
        return 0;
    }

    printUsage(argv[0]);
    return 1;
}
