#include "backup_runner.hpp"
#include <algorithm>
#include <chrono>

namespace {

std::int64_t systemUnixSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

SnapshotBackupRunner::SnapshotBackupRunner(BackupStore& backups,
                                           ClusterStore& clusters,
                                           PodStore& pods,
                                           VolumeClaimStore& volumes,
                                           SnapshotOrchestrator& orchestrator,
                                           EventSink& events,
                                           const OperatorConfig& config,
                                           UnixClock clock)
    : backups(backups), clusters(clusters), pods(pods), volumes(volumes), orchestrator(orchestrator),
      events(events), config(config), clock(clock ? std::move(clock) : UnixClock(systemUnixSeconds)) {}

std::expected<std::string, Error> SnapshotBackupRunner::chooseTargetInstance(const OperationContext& ctx,
                                                                             const Cluster& cluster,
                                                                             const Backup& backup) {
    const std::string& primary = cluster.status.currentPrimary;
    if (primary.empty()) {
        return makeError(ErrorCode::InvalidConfiguration,
                         "cluster " + cluster.metadata.name + " has no current primary");
    }
    if (backup.spec.target == BackupTarget::Primary) {
        return primary;
    }

    auto members = pods.listPods(ctx, cluster.metadata.namespace_, {{kClusterLabel, cluster.metadata.name}});
    if (!members) {
        return std::unexpected(members.error());
    }
    std::sort(members->begin(), members->end(),
              [](const Pod& a, const Pod& b) { return a.metadata.name < b.metadata.name; });
    for (const auto& pod : *members) {
        if (pod.metadata.name != primary && isPodReady(pod)) {
            return pod.metadata.name;
        }
    }
    config.logDebug("No ready standby in cluster " + cluster.metadata.name + ", backing up the primary");
    return primary;
}

void SnapshotBackupRunner::markFailed(const OperationContext& ctx, Backup backup, const Error& error) {
    backup.status.phase = BackupPhase::Failed;
    backup.status.error = describe(error);
    backup.status.stoppedAt = clock();
    auto updated = backups.updateBackup(ctx, backup);
    if (!updated) {
        config.logError("while marking backup " + backup.metadata.name + " as failed: " + describe(updated.error()));
        return;
    }
    recordEvent(events, config,
                backupEvent(backup.metadata.namespace_, backup.metadata.name, "Warning", "Failed",
                            "Backup failed: " + describe(error)));
}

std::expected<ExecuteResult, Error> SnapshotBackupRunner::reconcile(const OperationContext& ctx,
                                                                    const std::string& namespace_,
                                                                    const std::string& backupName) {
    auto backup = backups.getBackup(ctx, namespace_, backupName);
    if (!backup) {
        return std::unexpected(backup.error());
    }
    if (backup->isDone()) {
        ExecuteResult result;
        result.step = backup->status.phase == BackupPhase::Completed ? BackupStep::Done : BackupStep::Failed;
        result.snapshots = backup->status.snapshots;
        return result;
    }

    auto fail = [&](const Error& error) -> std::expected<ExecuteResult, Error> {
        if (!isRetryable(error.code)) {
            markFailed(ctx, *backup, error);
        }
        return std::unexpected(error);
    };

    auto cluster = clusters.getCluster(ctx, namespace_, backup->spec.clusterName);
    if (!cluster) {
        return fail(cluster.error());
    }

    // The target is chosen once: fencing makes it unready, which would change the choice.
    bool targetChosen = false;
    if (backup->status.instanceName.empty()) {
        auto target = chooseTargetInstance(ctx, *cluster, *backup);
        if (!target) {
            return fail(target.error());
        }
        backup->status.instanceName = *target;
        targetChosen = true;
    }

    if (backup->status.phase == BackupPhase::Pending || targetChosen) {
        backup->status.phase = BackupPhase::Running;
        if (!backup->status.startedAt) {
            backup->status.startedAt = clock();
        }
        auto updated = backups.updateBackup(ctx, *backup);
        if (!updated) {
            return std::unexpected(updated.error());
        }
        backup = std::move(updated);
        recordEvent(events, config,
                    backupEvent(namespace_, backupName, "Normal", "Starting",
                                "Starting snapshot backup of Pod " + backup->status.instanceName));
    }

    auto pod = pods.getPod(ctx, namespace_, backup->status.instanceName);
    if (!pod) {
        if (!isRetryable(pod.error().code)) {
            // The member may have been fenced by an earlier pass before it disappeared.
            orchestrator.releaseAfterFailure(ctx, *cluster, *backup, backup->status.instanceName, pod.error());
        }
        return fail(pod.error());
    }

    auto pvcs = volumes.listVolumeClaims(ctx, namespace_, {{kInstanceNameLabel, backup->status.instanceName}});
    if (!pvcs) {
        return std::unexpected(pvcs.error());
    }
    std::sort(pvcs->begin(), pvcs->end(), [](const PersistentVolumeClaim& a, const PersistentVolumeClaim& b) {
        return a.metadata.name < b.metadata.name;
    });

    auto result = orchestrator.execute(ctx, *cluster, *backup, *pod, *pvcs);
    if (!result) {
        return fail(result.error());
    }
    if (!result->isDone()) {
        return result;
    }

    backup->status.phase = BackupPhase::Completed;
    backup->status.error.clear();
    backup->status.snapshots = result->snapshots;
    backup->status.stoppedAt = clock();
    auto updated = backups.updateBackup(ctx, *backup);
    if (!updated) {
        return std::unexpected(updated.error());
    }
    config.logMessage("[backup " + namespace_ + "/" + backupName + "] completed with " +
                      std::to_string(result->snapshots.size()) + " snapshots");
    recordEvent(events, config,
                backupEvent(namespace_, backupName, "Normal", "Completed", "Backup completed"));
    return result;
}
