/**
 * @file snapshot_orchestrator.hpp
 * @brief Resumable state machine taking a snapshot backup of one cluster member.
 *
 * The sequence is: fence the member, wait until it stops being ready, snapshot every
 * attached volume, wait until the storage provider reports every snapshot ready, then
 * unfence. Nothing is persisted between invocations: each call to execute() observes the
 * fencing annotation, the pod readiness and the existing snapshots, decides the next
 * step with observe(), and either performs it or returns a requeue delay. The caller
 * re-invokes execute() until it reports completion or fails.
 *
 * @note execute() never sleeps. Every wait is a return with ExecuteResult::requeueAfter set.
 */

#ifndef SNAPSHOT_ORCHESTRATOR_HPP
#define SNAPSHOT_ORCHESTRATOR_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "event_sink.hpp"
#include "fencing.hpp"
#include "operation_context.hpp"
#include "operator_config.hpp"
#include "resources.hpp"
#include "snapshot_gateway.hpp"

/**
 * @brief Steps of a snapshot backup.
 */
enum class BackupStep {
    Start,
    Fencing,
    AwaitFenced,
    Snapshotting,
    AwaitSnapshotsReady,
    Unfencing,
    Done,
    Failed,
};

const char* backupStepName(BackupStep step);

/**
 * @brief Construction-time options of the orchestrator.
 */
struct OrchestratorOptions {
    bool shouldFence = true;                  ///< Fence the member while snapshotting.
    std::chrono::seconds requeueDelay{10};    ///< Delay returned while waiting.
};

/**
 * @brief What one invocation of execute() observed.
 */
struct ObservedState {
    bool shouldFence = true;
    std::string instanceName;               ///< Member being backed up.
    FencedInstances fencedInstances;        ///< Current fencing annotation.
    bool podReady = true;                   ///< Readiness of the member; only meaningful when fencing.
    std::size_t volumeCount = 0;            ///< Volumes attached to the member.
    bool snapshotsConfigured = true;        ///< The cluster carries a volume snapshot configuration.
    std::vector<SnapshotState> snapshots;   ///< States of the snapshots already created for the backup.
};

/**
 * @brief Next step decided from an ObservedState.
 */
struct NextAction {
    BackupStep step = BackupStep::Start;
    std::optional<Error> failure; ///< Set when step is Failed.
};

/**
 * @brief Result of one invocation.
 */
struct ExecuteResult {
    BackupStep step = BackupStep::Start;     ///< Step reached by this invocation.
    std::chrono::seconds requeueAfter{0};     ///< Non-zero: call again after this delay.
    std::vector<std::string> snapshots;       ///< Snapshot names, once Done.

    bool isDone() const { return step == BackupStep::Done; }
};

/**
 * @brief Snapshot backup orchestrator.
 */
class SnapshotOrchestrator {
public:
    /**
     * @brief Constructs an orchestrator.
     *
     * @param fencing Fencing controller acting on the cluster's annotation.
     * @param gateway Snapshot gateway.
     * @param events Sink receiving FencePod and UnfencePod events.
     * @param config Operator configuration (logging).
     * @param options Fencing toggle and requeue delay.
     */
    SnapshotOrchestrator(FencingController& fencing,
                         SnapshotGateway& gateway,
                         EventSink& events,
                         const OperatorConfig& config,
                         OrchestratorOptions options = {});

    /**
     * @brief Advances the snapshot backup of @p pod as far as possible without waiting.
     *
     * @param ctx Cancellation and deadline.
     * @param cluster Cluster owning the member, as last read by the caller.
     * @param backup Backup being taken.
     * @param pod Target member.
     * @param pvcs Volumes attached to the member.
     * @return std::expected<ExecuteResult, Error> Done with the snapshot names, a requeue
     *         delay, or the failure. Every error that is not retryable is final; on such
     *         an error the member is unfenced before returning, except on
     *         ConflictingFenceState where the fence belongs to someone else.
     */
    std::expected<ExecuteResult, Error> execute(const OperationContext& ctx,
                                                const Cluster& cluster,
                                                const Backup& backup,
                                                const Pod& pod,
                                                const std::vector<PersistentVolumeClaim>& pvcs);

    /**
     * @brief Decides the next step from what was observed. Has no side effects.
     *
     * Snapshots that all exist and are ready complete the backup whatever the fencing
     * state. A failed snapshot fails it. Otherwise the member must be the only fenced
     * one and must have stopped being ready before snapshots are created or awaited.
     * With no volumes at all, the backup completes as soon as fencing took effect.
     * A cluster without volume snapshot configuration fails before anything is fenced.
     */
    static NextAction observe(const ObservedState& state);

    /**
     * @brief Removes the fencing of @p instanceName.
     *
     * Safe when the member was never fenced. An UnfencePod event is recorded only when the
     * annotation was actually rewritten.
     */
    std::expected<void, Error> ensureUnfenced(const OperationContext& ctx,
                                              const Cluster& cluster,
                                              const Backup& backup,
                                              const std::string& instanceName);

    /**
     * @brief Best-effort unfence after @p failure ended the backup.
     *
     * An unfence error is logged; the caller keeps reporting @p failure.
     */
    void releaseAfterFailure(const OperationContext& ctx,
                             const Cluster& cluster,
                             const Backup& backup,
                             const std::string& instanceName,
                             const Error& failure);

    const OrchestratorOptions& getOptions() const { return options; }

private:
    std::expected<ExecuteResult, Error> advance(const OperationContext& ctx,
                                                const Cluster& cluster,
                                                const Backup& backup,
                                                const Pod& pod,
                                                const std::vector<PersistentVolumeClaim>& pvcs);
    std::expected<void, Error> ensureFenced(const OperationContext& ctx,
                                            const Cluster& cluster,
                                            const Backup& backup,
                                            const Pod& pod);
    ExecuteResult requeue(BackupStep step) const;
    void logFor(const Backup& backup, const std::string& message) const;

    FencingController& fencing;
    SnapshotGateway& gateway;
    EventSink& events;
    const OperatorConfig& config;
    OrchestratorOptions options;
};

#endif // SNAPSHOT_ORCHESTRATOR_HPP
