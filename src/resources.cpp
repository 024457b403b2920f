#include "resources.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

bool Cluster::isReplica() const {
    return spec.replica && spec.replica->enabled;
}

std::optional<ExternalCluster> Cluster::externalCluster(const std::string& name) const {
    for (const auto& server : spec.externalClusters) {
        if (server.name == name) {
            return server;
        }
    }
    return std::nullopt;
}

std::string Cluster::slotNameForInstance(const std::string& instanceName) const {
    if (!spec.replicationSlots.highAvailability) {
        return "";
    }
    static const std::regex slotNameNegative("[^a-z0-9_]+");
    std::string lowered = instanceName;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return spec.replicationSlots.slotPrefix + std::regex_replace(lowered, slotNameNegative, "_");
}

std::string Cluster::readWriteServiceName() const {
    return metadata.name + "-rw";
}

bool isPodReady(const Pod& pod) {
    for (const auto& condition : pod.conditions) {
        if (condition.type == "Ready") {
            return condition.status == "True";
        }
    }
    return false;
}

std::string PersistentVolumeClaim::role() const {
    auto it = metadata.labels.find(kPvcRoleLabel);
    if (it == metadata.labels.end() || it->second.empty()) {
        return kPvcRolePgData;
    }
    return it->second;
}

bool Backup::isDone() const {
    return status.phase == BackupPhase::Completed || status.phase == BackupPhase::Failed;
}

const char* backupPhaseName(BackupPhase phase) {
    switch (phase) {
    case BackupPhase::Pending: return "pending";
    case BackupPhase::Running: return "running";
    case BackupPhase::Completed: return "completed";
    case BackupPhase::Failed: return "failed";
    }
    return "pending";
}

std::optional<BackupPhase> parseBackupPhase(const std::string& name) {
    if (name.empty() || name == "pending") return BackupPhase::Pending;
    if (name == "running") return BackupPhase::Running;
    if (name == "completed") return BackupPhase::Completed;
    if (name == "failed") return BackupPhase::Failed;
    return std::nullopt;
}

const char* backupTargetName(BackupTarget target) {
    switch (target) {
    case BackupTarget::Primary: return "primary";
    case BackupTarget::PreferStandby: return "prefer-standby";
    }
    return "prefer-standby";
}

std::optional<BackupTarget> parseBackupTarget(const std::string& name) {
    if (name.empty() || name == "prefer-standby") return BackupTarget::PreferStandby;
    if (name == "primary") return BackupTarget::Primary;
    return std::nullopt;
}

const char* snapshotOwnerReferenceName(SnapshotOwnerReference reference) {
    switch (reference) {
    case SnapshotOwnerReference::None: return "none";
    case SnapshotOwnerReference::Cluster: return "cluster";
    case SnapshotOwnerReference::Backup: return "backup";
    }
    return "none";
}

std::optional<SnapshotOwnerReference> parseSnapshotOwnerReference(const std::string& name) {
    if (name.empty() || name == "none") return SnapshotOwnerReference::None;
    if (name == "cluster") return SnapshotOwnerReference::Cluster;
    if (name == "backup") return SnapshotOwnerReference::Backup;
    return std::nullopt;
}

void mergeMap(StringMap& target, const StringMap& source) {
    for (const auto& [key, value] : source) {
        target[key] = value;
    }
}

bool matchesLabels(const StringMap& labels, const StringMap& selector) {
    for (const auto& [key, value] : selector) {
        auto it = labels.find(key);
        if (it == labels.end() || it->second != value) {
            return false;
        }
    }
    return true;
}
