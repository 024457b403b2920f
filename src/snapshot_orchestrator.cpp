#include "snapshot_orchestrator.hpp"
#include <algorithm>

const char* backupStepName(BackupStep step) {
    switch (step) {
    case BackupStep::Start: return "Start";
    case BackupStep::Fencing: return "Fencing";
    case BackupStep::AwaitFenced: return "AwaitFenced";
    case BackupStep::Snapshotting: return "Snapshotting";
    case BackupStep::AwaitSnapshotsReady: return "AwaitSnapshotsReady";
    case BackupStep::Unfencing: return "Unfencing";
    case BackupStep::Done: return "Done";
    case BackupStep::Failed: return "Failed";
    }
    return "Unknown";
}

SnapshotOrchestrator::SnapshotOrchestrator(FencingController& fencing,
                                           SnapshotGateway& gateway,
                                           EventSink& events,
                                           const OperatorConfig& config,
                                           OrchestratorOptions options)
    : fencing(fencing), gateway(gateway), events(events), config(config), options(options) {}

NextAction SnapshotOrchestrator::observe(const ObservedState& state) {
    auto hasPhase = [&](SnapshotPhase phase) {
        return std::any_of(state.snapshots.begin(), state.snapshots.end(),
                           [&](const SnapshotState& s) { return s.phase == phase; });
    };

    if (!state.snapshots.empty() && !hasPhase(SnapshotPhase::Pending) && !hasPhase(SnapshotPhase::Failed)) {
        return {BackupStep::Unfencing, std::nullopt};
    }

    for (const auto& snapshot : state.snapshots) {
        if (snapshot.phase == SnapshotPhase::Failed) {
            return {BackupStep::Failed, Error{ErrorCode::SnapshotFailed, snapshot.reason}};
        }
    }

    if (!state.snapshotsConfigured && state.snapshots.empty()) {
        return {BackupStep::Failed,
                Error{ErrorCode::InvalidConfiguration, "cluster has no volume snapshot configuration"}};
    }

    if (state.shouldFence) {
        bool soleFenced = state.fencedInstances.size() == 1 && state.fencedInstances.contains(state.instanceName);
        if (!soleFenced) {
            if (!state.fencedInstances.empty()) {
                return {BackupStep::Failed,
                        Error{ErrorCode::ConflictingFenceState,
                              "cannot execute volume snapshot on a cluster that has fenced instances"}};
            }
            return {BackupStep::Fencing, std::nullopt};
        }
        if (state.podReady) {
            return {BackupStep::AwaitFenced, std::nullopt};
        }
    }

    if (state.snapshots.empty()) {
        if (state.volumeCount == 0) {
            return {BackupStep::Unfencing, std::nullopt};
        }
        return {BackupStep::Snapshotting, std::nullopt};
    }
    return {BackupStep::AwaitSnapshotsReady, std::nullopt};
}

ExecuteResult SnapshotOrchestrator::requeue(BackupStep step) const {
    ExecuteResult result;
    result.step = step;
    result.requeueAfter = options.requeueDelay;
    return result;
}

void SnapshotOrchestrator::logFor(const Backup& backup, const std::string& message) const {
    config.logMessage("[backup " + backup.metadata.namespace_ + "/" + backup.metadata.name + "] " + message);
}

std::expected<ExecuteResult, Error> SnapshotOrchestrator::execute(const OperationContext& ctx,
                                                                  const Cluster& cluster,
                                                                  const Backup& backup,
                                                                  const Pod& pod,
                                                                  const std::vector<PersistentVolumeClaim>& pvcs) {
    auto result = advance(ctx, cluster, backup, pod, pvcs);
    if (!result && !isRetryable(result.error().code) && result.error().code != ErrorCode::ConflictingFenceState) {
        // A failed backup must not leave the member write-suspended.
        releaseAfterFailure(ctx, cluster, backup, pod.metadata.name, result.error());
    }
    return result;
}

void SnapshotOrchestrator::releaseAfterFailure(const OperationContext& ctx,
                                               const Cluster& cluster,
                                               const Backup& backup,
                                               const std::string& instanceName,
                                               const Error& failure) {
    if (auto ok = ensureUnfenced(ctx, cluster, backup, instanceName); !ok) {
        config.logError("while unfencing pod " + instanceName + " after " + describe(failure) + ": " +
                        describe(ok.error()));
    }
}

std::expected<ExecuteResult, Error> SnapshotOrchestrator::advance(const OperationContext& ctx,
                                                                  const Cluster& cluster,
                                                                  const Backup& backup,
                                                                  const Pod& pod,
                                                                  const std::vector<PersistentVolumeClaim>& pvcs) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }

    auto fenced = getFencedInstances(cluster.metadata.annotations);
    if (!fenced) {
        return makeError(fenced.error().code, "could not check if cluster is fenced: " + fenced.error().message);
    }

    auto existing = gateway.listSnapshotsForBackup(ctx, cluster, backup);
    if (!existing) {
        return std::unexpected(existing.error());
    }

    ObservedState state;
    state.shouldFence = options.shouldFence;
    state.instanceName = pod.metadata.name;
    state.fencedInstances = *fenced;
    state.volumeCount = pvcs.size();
    state.snapshotsConfigured = cluster.spec.volumeSnapshot.has_value();
    std::vector<std::string> names;
    for (const auto& snapshot : *existing) {
        state.snapshots.push_back(SnapshotGateway::classifyState(snapshot));
        names.push_back(snapshot.metadata.name);
    }
    std::sort(names.begin(), names.end());

    auto refreshReadiness = [&]() -> std::expected<void, Error> {
        if (!options.shouldFence) {
            return {};
        }
        auto effective = fencing.isFenceEffective(ctx, pod.metadata.namespace_, pod.metadata.name);
        if (!effective) {
            return std::unexpected(effective.error());
        }
        state.podReady = !*effective;
        return {};
    };
    if (auto ok = refreshReadiness(); !ok) {
        return std::unexpected(ok.error());
    }

    bool fenceRequested = false;
    for (;;) {
        NextAction next = observe(state);
        config.logDebug("[backup " + backup.metadata.name + "] next step: " + backupStepName(next.step));

        switch (next.step) {
        case BackupStep::Fencing:
            if (fenceRequested) {
                return makeError(ErrorCode::Internal, "fencing of pod " + pod.metadata.name + " did not stick");
            }
            if (auto ok = ensureFenced(ctx, cluster, backup, pod); !ok) {
                return std::unexpected(ok.error());
            }
            fenceRequested = true;
            state.fencedInstances = {pod.metadata.name};
            if (auto ok = refreshReadiness(); !ok) {
                return std::unexpected(ok.error());
            }
            continue;

        case BackupStep::AwaitFenced:
            logFor(backup, "Waiting for target Pod " + pod.metadata.name + " to not be ready, retrying");
            return requeue(BackupStep::AwaitFenced);

        case BackupStep::Snapshotting: {
            auto created = gateway.createSnapshotSet(ctx, cluster, backup, pod, pvcs);
            if (!created) {
                return std::unexpected(created.error());
            }
            // The external snapshot controller picks the new requests up from here.
            logFor(backup, "Requested " + std::to_string(created->size()) + " volume snapshots");
            return requeue(BackupStep::Snapshotting);
        }

        case BackupStep::AwaitSnapshotsReady:
            logFor(backup, "Waiting for VolumeSnapshots to be ready to use");
            return requeue(BackupStep::AwaitSnapshotsReady);

        case BackupStep::Unfencing: {
            if (auto ok = ensureUnfenced(ctx, cluster, backup, pod.metadata.name); !ok) {
                return std::unexpected(ok.error());
            }
            ExecuteResult result;
            result.step = BackupStep::Done;
            result.snapshots = names;
            return result;
        }

        case BackupStep::Failed:
            return std::unexpected(next.failure.value_or(Error{ErrorCode::Internal, "snapshot backup failed"}));

        case BackupStep::Start:
        case BackupStep::Done:
            return makeError(ErrorCode::Internal, std::string("unexpected step ") + backupStepName(next.step));
        }
    }
}

std::expected<void, Error> SnapshotOrchestrator::ensureFenced(const OperationContext& ctx,
                                                              const Cluster& cluster,
                                                              const Backup& backup,
                                                              const Pod& pod) {
    recordEvent(events, config,
                backupEvent(backup.metadata.namespace_, backup.metadata.name, "Normal", "FencePod",
                            "Requesting fencing for Pod " + pod.metadata.name));

    auto fenced = fencing.requestFence(ctx, cluster.metadata.namespace_, cluster.metadata.name, pod.metadata.name);
    if (!fenced && fenced.error().code != ErrorCode::AlreadyFenced) {
        return fenced;
    }
    return {};
}

std::expected<void, Error> SnapshotOrchestrator::ensureUnfenced(const OperationContext& ctx,
                                                                const Cluster& cluster,
                                                                const Backup& backup,
                                                                const std::string& instanceName) {
    auto unfenced = fencing.requestUnfence(ctx, cluster.metadata.namespace_, cluster.metadata.name, instanceName);
    if (!unfenced) {
        return std::unexpected(unfenced.error());
    }
    if (!*unfenced || !options.shouldFence) {
        return {};
    }
    logFor(backup, "Unfenced Pod " + instanceName);
    recordEvent(events, config,
                backupEvent(backup.metadata.namespace_, backup.metadata.name, "Normal", "UnfencePod",
                            "Un-fencing Pod " + instanceName));
    return {};
}
