#include "operator_api.hpp"
#include <exception>
#include "fleet_operator.hpp"

std::expected<ExecuteResult, Error> OperatorAPI::runBackup(const std::string& configFile,
                                                           const std::string& stateFile,
                                                           const std::string& namespace_,
                                                           const std::string& backupName) {
    try {
        FleetOperator fleet(configFile, stateFile);
        return fleet.reconcileBackup(namespace_, backupName);
    } catch (const std::exception& e) {
        return makeError(ErrorCode::InvalidConfiguration, std::string("Failed to start backup: ") + e.what());
    }
}

std::expected<bool, Error> OperatorAPI::refreshReplica(const std::string& configFile,
                                                       const std::string& stateFile,
                                                       const std::string& namespace_,
                                                       const std::string& clusterName) {
    try {
        FleetOperator fleet(configFile, stateFile);
        return fleet.refreshReplica(namespace_, clusterName);
    } catch (const std::exception& e) {
        return makeError(ErrorCode::InvalidConfiguration, std::string("Failed to refresh replica: ") + e.what());
    }
}
