#include "snapshot_gateway.hpp"
#include <chrono>
#include "manifest.hpp"

namespace {

std::int64_t systemUnixSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

SnapshotGateway::SnapshotGateway(SnapshotStore& snapshots,
                                 InstanceProbe& probe,
                                 EventSink& events,
                                 const OperatorConfig& config,
                                 UnixClock clock)
    : snapshots(snapshots), probe(probe), events(events), config(config),
      clock(clock ? std::move(clock) : UnixClock(systemUnixSeconds)) {}

std::string SnapshotGateway::snapshotName(const std::string& pvcName, const std::string& suffix) {
    return pvcName + "-" + suffix;
}

VolumeSnapshot SnapshotGateway::buildSnapshot(const OperationContext& ctx,
                                              const Cluster& cluster,
                                              const Backup& backup,
                                              const Pod& pod,
                                              const PersistentVolumeClaim& pvc,
                                              const std::string& suffix) {
    const auto& snapshotConfig = *cluster.spec.volumeSnapshot;

    VolumeSnapshot snapshot;
    snapshot.metadata.name = snapshotName(pvc.metadata.name, suffix);
    snapshot.metadata.namespace_ = pvc.metadata.namespace_;
    snapshot.metadata.labels = pvc.metadata.labels;
    mergeMap(snapshot.metadata.labels, snapshotConfig.labels);
    snapshot.metadata.annotations = pvc.metadata.annotations;
    mergeMap(snapshot.metadata.annotations, snapshotConfig.annotations);
    snapshot.sourcePvcName = pvc.metadata.name;

    if (pvc.role() == kPvcRolePgWal && !snapshotConfig.walClassName.empty()) {
        snapshot.className = snapshotConfig.walClassName;
    } else if (!snapshotConfig.className.empty()) {
        snapshot.className = snapshotConfig.className;
    }

    snapshot.metadata.labels[kBackupNameLabel] = backup.metadata.name;

    switch (snapshotConfig.ownerReference) {
    case SnapshotOwnerReference::Cluster:
        mergeMap(snapshot.metadata.labels, cluster.spec.inheritedMetadata.labels);
        mergeMap(snapshot.metadata.annotations, cluster.spec.inheritedMetadata.annotations);
        snapshot.metadata.ownerReferences.push_back(
            OwnerReference{"Cluster", cluster.metadata.name, cluster.metadata.uid, true});
        break;
    case SnapshotOwnerReference::Backup:
        snapshot.metadata.ownerReferences.push_back(
            OwnerReference{"Backup", backup.metadata.name, backup.metadata.uid, true});
        break;
    case SnapshotOwnerReference::None:
        break;
    }

    // pg_controldata is taken right before the snapshot; it is only informative.
    if (auto data = probe.getControlData(ctx, pod)) {
        snapshot.metadata.annotations[kPgControldataAnnotation] = *data;
    } else {
        config.logError("while querying for pg_controldata on pod " + pod.metadata.name + ": " +
                        describe(data.error()));
    }

    snapshot.metadata.annotations[kClusterManifestAnnotation] = toCompactString(toJson(cluster));
    return snapshot;
}

std::expected<std::vector<std::string>, Error> SnapshotGateway::createSnapshotSet(
    const OperationContext& ctx,
    const Cluster& cluster,
    const Backup& backup,
    const Pod& pod,
    const std::vector<PersistentVolumeClaim>& pvcs) {
    if (!cluster.spec.volumeSnapshot) {
        return makeError(ErrorCode::InvalidConfiguration,
                         "cluster " + cluster.metadata.name + " has no volume snapshot configuration");
    }

    std::string suffix = std::to_string(clock());
    std::vector<std::string> created;
    for (const auto& pvc : pvcs) {
        recordEvent(events, config,
                    backupEvent(backup.metadata.namespace_, backup.metadata.name, "Normal", "CreateSnapshot",
                                "Creating VolumeSnapshot for PVC " + pvc.metadata.name));

        VolumeSnapshot snapshot = buildSnapshot(ctx, cluster, backup, pod, pvc, suffix);
        if (auto ok = snapshots.createSnapshot(ctx, snapshot); !ok) {
            return makeError(ok.error().code,
                             "while creating VolumeSnapshot " + snapshot.metadata.name + ": " + ok.error().message);
        }
        created.push_back(snapshot.metadata.name);
    }
    return created;
}

std::expected<std::vector<VolumeSnapshot>, Error> SnapshotGateway::listSnapshotsForBackup(const OperationContext& ctx,
                                                                                          const Cluster& cluster,
                                                                                          const Backup& backup) {
    return snapshots.listSnapshots(ctx, cluster.metadata.namespace_, {{kBackupNameLabel, backup.metadata.name}});
}

SnapshotState SnapshotGateway::classifyState(const VolumeSnapshot& snapshot) {
    const Json::Value& status = snapshot.status;
    if (status.isNull()) {
        return {SnapshotPhase::Pending, ""};
    }
    if (!status.isObject()) {
        return {SnapshotPhase::Failed, "cannot parse status of VolumeSnapshot " + snapshot.metadata.name +
                                           ": expected an object"};
    }

    const Json::Value& readyToUse = status["readyToUse"];
    if (!readyToUse.isNull() && !readyToUse.isBool()) {
        return {SnapshotPhase::Failed, "cannot parse status of VolumeSnapshot " + snapshot.metadata.name +
                                           ": readyToUse must be a boolean"};
    }

    const Json::Value& error = status["error"];
    if (!error.isNull()) {
        if (!error.isObject() || !error["message"].isString()) {
            return {SnapshotPhase::Failed, "cannot parse status of VolumeSnapshot " + snapshot.metadata.name +
                                               ": error must carry a message"};
        }
        return {SnapshotPhase::Failed, "VolumeSnapshot " + snapshot.metadata.name +
                                           " failed: " + error["message"].asString()};
    }

    if (readyToUse.isBool() && readyToUse.asBool()) {
        return {SnapshotPhase::Ready, ""};
    }
    return {SnapshotPhase::Pending, ""};
}
