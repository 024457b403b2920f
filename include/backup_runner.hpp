/**
 * @file backup_runner.hpp
 * @brief Drives the snapshot orchestrator for one Backup object.
 *
 * The runner owns the Backup's status: it picks the target member once, moves the phase
 * from pending to running, and records completion or failure. The orchestrator itself
 * never writes the Backup.
 */

#ifndef BACKUP_RUNNER_HPP
#define BACKUP_RUNNER_HPP

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include "error.hpp"
#include "event_sink.hpp"
#include "object_store.hpp"
#include "operation_context.hpp"
#include "operator_config.hpp"
#include "snapshot_orchestrator.hpp"

/**
 * @brief Reconciles snapshot backups.
 */
class SnapshotBackupRunner {
public:
    using UnixClock = std::function<std::int64_t()>;

    /**
     * @brief Constructs a runner.
     *
     * @param backups Store holding the Backup objects.
     * @param clusters Store holding the Cluster objects.
     * @param pods Store used to resolve the target member.
     * @param volumes Store listing the member's volume claims.
     * @param orchestrator Orchestrator performing the backup steps.
     * @param events Sink receiving Starting, Completed and Failed events.
     * @param config Operator configuration (logging).
     * @param clock Time source for start/stop timestamps; the system clock when empty.
     */
    SnapshotBackupRunner(BackupStore& backups,
                         ClusterStore& clusters,
                         PodStore& pods,
                         VolumeClaimStore& volumes,
                         SnapshotOrchestrator& orchestrator,
                         EventSink& events,
                         const OperatorConfig& config,
                         UnixClock clock = {});

    /**
     * @brief Runs one reconciliation of a backup.
     *
     * A completed or failed backup is left alone and reported Done. Retryable errors are
     * returned without touching the Backup; any other error marks it failed and is
     * returned as well.
     *
     * @return std::expected<ExecuteResult, Error> Done, a requeue delay, or the failure.
     */
    std::expected<ExecuteResult, Error> reconcile(const OperationContext& ctx,
                                                  const std::string& namespace_,
                                                  const std::string& backupName);

    /**
     * @brief Chooses the member a backup snapshots.
     *
     * "primary" takes the current primary. "prefer-standby" takes the first ready member
     * other than the primary, by name, and falls back to the primary.
     *
     * @return std::expected<std::string, Error> Member name, or InvalidConfiguration when
     *         the cluster has no primary.
     */
    std::expected<std::string, Error> chooseTargetInstance(const OperationContext& ctx,
                                                           const Cluster& cluster,
                                                           const Backup& backup);

private:
    /// Records the failure on the Backup; a failing status write is logged, the error stays the caller's.
    void markFailed(const OperationContext& ctx, Backup backup, const Error& error);

    BackupStore& backups;
    ClusterStore& clusters;
    PodStore& pods;
    VolumeClaimStore& volumes;
    SnapshotOrchestrator& orchestrator;
    EventSink& events;
    const OperatorConfig& config;
    UnixClock clock;
};

#endif // BACKUP_RUNNER_HPP
