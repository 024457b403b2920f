/**
 * @file operator_api.hpp
 * @brief High-level API for one-shot PgFleet operations.
 *
 * Builds a FleetOperator from a configuration file, runs a single operation and reports
 * the outcome. Configuration problems surface as errors instead of exceptions.
 */

#ifndef OPERATOR_API_HPP
#define OPERATOR_API_HPP

#include <expected>
#include <string>
#include "error.hpp"
#include "snapshot_orchestrator.hpp"

/**
 * @brief API for driving PgFleet from external applications.
 */
class OperatorAPI {
public:
    /**
     * @brief Runs one reconciliation of a snapshot backup.
     *
     * @param configFile Path to the JSON configuration file.
     * @param stateFile State file; the configured one when empty.
     * @param namespace_ Namespace of the Backup.
     * @param backupName Name of the Backup.
     * @return std::expected<ExecuteResult, Error> Done, a requeue delay, or the failure.
     */
    static std::expected<ExecuteResult, Error> runBackup(const std::string& configFile,
                                                         const std::string& stateFile,
                                                         const std::string& namespace_,
                                                         const std::string& backupName);

    /**
     * @brief Refreshes the configured member's standby configuration.
     *
     * @return std::expected<bool, Error> Whether the configuration changed.
     */
    static std::expected<bool, Error> refreshReplica(const std::string& configFile,
                                                     const std::string& stateFile,
                                                     const std::string& namespace_,
                                                     const std::string& clusterName);
};

#endif // OPERATOR_API_HPP
