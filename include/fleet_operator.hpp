/**
 * @file fleet_operator.hpp
 * @brief Wires the PgFleet components together around a state file.
 *
 * The operator loads its configuration, builds the stores, event sinks, fencing
 * controller, snapshot gateway, orchestrator and backup runner, and exposes the
 * operations the command line tool runs: one backup reconciliation, one replica
 * refresh, or the polling daemon.
 *
 * @note The state file is reloaded before and saved after every operation, so other
 * actors (the storage provider, an administrator) may edit it in between.
 */

#ifndef FLEET_OPERATOR_HPP
#define FLEET_OPERATOR_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include "backup_runner.hpp"
#include "error.hpp"
#include "event_sink.hpp"
#include "fencing.hpp"
#include "instance_probe.hpp"
#include "memory_store.hpp"
#include "operation_context.hpp"
#include "operator_config.hpp"
#include "replica_config.hpp"
#include "snapshot_gateway.hpp"
#include "snapshot_orchestrator.hpp"
#include "state_file.hpp"

/**
 * @brief PgFleet operator instance.
 */
class FleetOperator {
public:
    /**
     * @brief Constructs an operator from a configuration file.
     *
     * @param configFile Path to the JSON configuration file.
     * @param stateFile State file to use; the configured one when empty.
     * @throws std::runtime_error If the configuration cannot be loaded or a notifier is misconfigured.
     */
    explicit FleetOperator(const std::string& configFile, const std::string& stateFile = "");

    FleetOperator(const FleetOperator&) = delete;
    FleetOperator& operator=(const FleetOperator&) = delete;

    /**
     * @brief Runs one reconciliation of a backup and saves the resulting state.
     *
     * @return std::expected<ExecuteResult, Error> Done, a requeue delay, or the failure.
     */
    std::expected<ExecuteResult, Error> reconcileBackup(const std::string& namespace_, const std::string& name);

    /**
     * @brief Reconciles every backup that is neither completed nor failed.
     *
     * Failures are logged and do not stop the pass. The shortest requeue delay
     * seen is kept for the daemon loop.
     *
     * @return std::expected<std::size_t, Error> Number of backups still in progress.
     */
    std::expected<std::size_t, Error> reconcileAll();

    /**
     * @brief Refreshes the local member's standby configuration against a cluster.
     *
     * The member and data directory come from the replica section of the configuration.
     *
     * @return std::expected<bool, Error> Whether the configuration changed.
     */
    std::expected<bool, Error> refreshReplica(const std::string& namespace_, const std::string& clusterName);

    /**
     * @brief Polls the state file until SIGINT or SIGTERM.
     */
    void runDaemon();

    const OperatorConfig& getConfig() const { return config; }

private:
    std::expected<void, Error> loadState();
    std::expected<void, Error> saveState();
    OperationContext callContext() const;

    OperatorConfig config;
    std::string stateFile;
    InMemoryObjectStore store;
    StateBaseline baseline; ///< State file content at the last load.
    MultiEventSink events;
    CommandControlDataProbe probe;
    FencingController fencing;
    SnapshotGateway gateway;
    SnapshotOrchestrator orchestrator;
    SnapshotBackupRunner runner;
    SecretConnectionConfigurer connections;
    OperationContext rootContext; ///< Cancelled on shutdown.
    std::chrono::seconds nextRequeue{0}; ///< Earliest requeue of the last pass, zero when none.
};

#endif // FLEET_OPERATOR_HPP
