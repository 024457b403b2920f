// Builders and fakes shared by the PgFleet unit tests.
#ifndef PGFLEET_TEST_SUPPORT_HPP
#define PGFLEET_TEST_SUPPORT_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <json/json.h>
#include "event_sink.hpp"
#include "instance_probe.hpp"
#include "memory_store.hpp"
#include "operator_config.hpp"
#include "resources.hpp"

inline void makeQuiet(OperatorConfig& config) {
    config.quiet = true;
    config.debug = false;
}

class RecordingEventSink : public EventSink {
public:
    std::expected<void, Error> record(const Event& event) override {
        events.push_back(event);
        return {};
    }

    std::size_t count(const std::string& reason) const {
        std::size_t n = 0;
        for (const auto& event : events) {
            if (event.reason == reason) {
                ++n;
            }
        }
        return n;
    }

    std::vector<Event> events;
};

class StaticProbe : public InstanceProbe {
public:
    std::expected<std::string, Error> getControlData(const OperationContext& /*ctx*/, const Pod& /*pod*/) override {
        ++calls;
        if (fail) {
            return makeError(ErrorCode::Unavailable, "instance manager unreachable");
        }
        return output;
    }

    std::string output = "pg_control version number: 1300\n";
    bool fail = false;
    int calls = 0;
};

/// Counts writes and can fail a number of cluster updates with Conflict.
class ScriptedStore : public InMemoryObjectStore {
public:
    std::expected<Cluster, Error> updateCluster(const OperationContext& ctx, const Cluster& cluster) override {
        ++clusterUpdates;
        if (conflictsToInject > 0) {
            --conflictsToInject;
            return makeError(ErrorCode::Conflict, "the object has been modified");
        }
        return InMemoryObjectStore::updateCluster(ctx, cluster);
    }

    std::expected<void, Error> createSnapshot(const OperationContext& ctx, const VolumeSnapshot& snapshot) override {
        ++snapshotCreates;
        return InMemoryObjectStore::createSnapshot(ctx, snapshot);
    }

    int conflictsToInject = 0;
    int clusterUpdates = 0;
    int snapshotCreates = 0;
};

inline Cluster makeCluster(const std::string& name, const std::string& primary = "db-1") {
    Cluster cluster;
    cluster.metadata.name = name;
    cluster.metadata.namespace_ = "default";
    cluster.metadata.uid = name + "-uid";
    cluster.spec.volumeSnapshot = VolumeSnapshotConfig{};
    cluster.status.currentPrimary = primary;
    cluster.status.targetPrimary = primary;
    return cluster;
}

inline Pod makePod(const std::string& name, const std::string& clusterName, bool ready) {
    Pod pod;
    pod.metadata.name = name;
    pod.metadata.namespace_ = "default";
    pod.metadata.labels[kClusterLabel] = clusterName;
    pod.metadata.labels[kInstanceNameLabel] = name;
    pod.conditions.push_back(PodCondition{"Ready", ready ? "True" : "False"});
    return pod;
}

inline void setReady(Pod& pod, bool ready) {
    pod.conditions = {PodCondition{"Ready", ready ? "True" : "False"}};
}

inline PersistentVolumeClaim makePvc(const std::string& name, const std::string& instance,
                                     const std::string& role = kPvcRolePgData) {
    PersistentVolumeClaim pvc;
    pvc.metadata.name = name;
    pvc.metadata.namespace_ = "default";
    pvc.metadata.labels[kInstanceNameLabel] = instance;
    pvc.metadata.labels[kPvcRoleLabel] = role;
    return pvc;
}

inline Backup makeBackup(const std::string& name, const std::string& clusterName,
                         BackupTarget target = BackupTarget::Primary) {
    Backup backup;
    backup.metadata.name = name;
    backup.metadata.namespace_ = "default";
    backup.metadata.uid = name + "-uid";
    backup.spec.clusterName = clusterName;
    backup.spec.target = target;
    return backup;
}

inline Json::Value readyStatus() {
    Json::Value status(Json::objectValue);
    status["readyToUse"] = true;
    return status;
}

inline Json::Value errorStatus(const std::string& message) {
    Json::Value status(Json::objectValue);
    status["readyToUse"] = false;
    status["error"]["message"] = message;
    return status;
}

/// Plays the storage provider: sets the status of every snapshot in the store.
inline void reportSnapshots(InMemoryObjectStore& store, const Json::Value& status) {
    for (auto snapshot : store.snapshots()) {
        snapshot.status = status;
        store.putSnapshot(snapshot);
    }
}

#endif // PGFLEET_TEST_SUPPORT_HPP
