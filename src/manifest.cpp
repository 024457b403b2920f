#include "manifest.hpp"
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

struct ParseFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

const Json::Value& member(const Json::Value& object, const char* key) {
    static const Json::Value null;
    if (object.isNull()) {
        return null;
    }
    if (!object.isObject()) {
        throw ParseFailure(std::string("expected an object around '") + key + "'");
    }
    return object.isMember(key) ? object[key] : null;
}

std::string readString(const Json::Value& object, const char* key, const std::string& fallback = "") {
    const auto& value = member(object, key);
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isString()) {
        throw ParseFailure(std::string("field '") + key + "' must be a string");
    }
    return value.asString();
}

bool readBool(const Json::Value& object, const char* key, bool fallback) {
    const auto& value = member(object, key);
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isBool()) {
        throw ParseFailure(std::string("field '") + key + "' must be a boolean");
    }
    return value.asBool();
}

std::optional<std::int64_t> readOptionalInt(const Json::Value& object, const char* key) {
    const auto& value = member(object, key);
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isIntegral()) {
        throw ParseFailure(std::string("field '") + key + "' must be an integer");
    }
    return value.asInt64();
}

StringMap readStringMap(const Json::Value& object, const char* key) {
    StringMap result;
    const auto& value = member(object, key);
    if (value.isNull()) {
        return result;
    }
    if (!value.isObject()) {
        throw ParseFailure(std::string("field '") + key + "' must be an object of strings");
    }
    for (const auto& name : value.getMemberNames()) {
        if (!value[name].isString()) {
            throw ParseFailure(std::string("field '") + key + "." + name + "' must be a string");
        }
        result[name] = value[name].asString();
    }
    return result;
}

std::vector<std::string> readStringList(const Json::Value& object, const char* key) {
    std::vector<std::string> result;
    const auto& value = member(object, key);
    if (value.isNull()) {
        return result;
    }
    if (!value.isArray()) {
        throw ParseFailure(std::string("field '") + key + "' must be a list of strings");
    }
    for (const auto& item : value) {
        if (!item.isString()) {
            throw ParseFailure(std::string("field '") + key + "' must be a list of strings");
        }
        result.push_back(item.asString());
    }
    return result;
}

Json::Value stringMapToJson(const StringMap& map) {
    Json::Value result(Json::objectValue);
    for (const auto& [key, value] : map) {
        result[key] = value;
    }
    return result;
}

ObjectMeta readMeta(const Json::Value& value) {
    const auto& metadata = member(value, "metadata");
    ObjectMeta meta;
    meta.name = readString(metadata, "name");
    if (meta.name.empty()) {
        throw ParseFailure("metadata.name is required");
    }
    meta.namespace_ = readString(metadata, "namespace", "default");
    meta.uid = readString(metadata, "uid");
    meta.resourceVersion = readString(metadata, "resourceVersion");
    meta.labels = readStringMap(metadata, "labels");
    meta.annotations = readStringMap(metadata, "annotations");
    const auto& owners = member(metadata, "ownerReferences");
    if (!owners.isNull() && !owners.isArray()) {
        throw ParseFailure("metadata.ownerReferences must be a list");
    }
    for (const auto& owner : owners) {
        OwnerReference reference;
        reference.kind = readString(owner, "kind");
        reference.name = readString(owner, "name");
        reference.uid = readString(owner, "uid");
        reference.controller = readBool(owner, "controller", true);
        meta.ownerReferences.push_back(reference);
    }
    return meta;
}

template <typename T, typename Fn>
std::expected<T, Error> decode(const char* kind, Fn&& fn) {
    try {
        return fn();
    } catch (const ParseFailure& e) {
        return makeError(ErrorCode::ParseError, std::string("invalid ") + kind + ": " + e.what());
    }
}

} // namespace

Json::Value toJson(const ObjectMeta& meta) {
    Json::Value result(Json::objectValue);
    result["name"] = meta.name;
    result["namespace"] = meta.namespace_;
    if (!meta.uid.empty()) {
        result["uid"] = meta.uid;
    }
    if (!meta.resourceVersion.empty()) {
        result["resourceVersion"] = meta.resourceVersion;
    }
    if (!meta.labels.empty()) {
        result["labels"] = stringMapToJson(meta.labels);
    }
    if (!meta.annotations.empty()) {
        result["annotations"] = stringMapToJson(meta.annotations);
    }
    if (!meta.ownerReferences.empty()) {
        Json::Value owners(Json::arrayValue);
        for (const auto& reference : meta.ownerReferences) {
            Json::Value owner;
            owner["kind"] = reference.kind;
            owner["name"] = reference.name;
            owner["uid"] = reference.uid;
            owner["controller"] = reference.controller;
            owners.append(owner);
        }
        result["ownerReferences"] = owners;
    }
    return result;
}

Json::Value toJson(const Cluster& cluster) {
    Json::Value result;
    result["kind"] = "Cluster";
    result["metadata"] = toJson(cluster.metadata);

    Json::Value spec(Json::objectValue);
    if (cluster.spec.volumeSnapshot) {
        const auto& config = *cluster.spec.volumeSnapshot;
        Json::Value snapshot(Json::objectValue);
        snapshot["className"] = config.className;
        snapshot["walClassName"] = config.walClassName;
        snapshot["labels"] = stringMapToJson(config.labels);
        snapshot["annotations"] = stringMapToJson(config.annotations);
        snapshot["snapshotOwnerReference"] = snapshotOwnerReferenceName(config.ownerReference);
        spec["backup"]["volumeSnapshot"] = snapshot;
    }
    if (cluster.spec.replica) {
        spec["replica"]["enabled"] = cluster.spec.replica->enabled;
        spec["replica"]["source"] = cluster.spec.replica->source;
    }
    if (!cluster.spec.externalClusters.empty()) {
        Json::Value servers(Json::arrayValue);
        for (const auto& server : cluster.spec.externalClusters) {
            Json::Value item;
            item["name"] = server.name;
            item["connectionParameters"] = stringMapToJson(server.connectionParameters);
            if (server.password) {
                item["password"]["name"] = server.password->name;
                item["password"]["key"] = server.password->key;
            }
            servers.append(item);
        }
        spec["externalClusters"] = servers;
    }
    spec["replicationSlots"]["highAvailability"]["enabled"] = cluster.spec.replicationSlots.highAvailability;
    spec["replicationSlots"]["highAvailability"]["slotPrefix"] = cluster.spec.replicationSlots.slotPrefix;
    if (!cluster.spec.inheritedMetadata.labels.empty() || !cluster.spec.inheritedMetadata.annotations.empty()) {
        spec["inheritedMetadata"]["labels"] = stringMapToJson(cluster.spec.inheritedMetadata.labels);
        spec["inheritedMetadata"]["annotations"] = stringMapToJson(cluster.spec.inheritedMetadata.annotations);
    }
    result["spec"] = spec;

    result["status"]["currentPrimary"] = cluster.status.currentPrimary;
    result["status"]["targetPrimary"] = cluster.status.targetPrimary;
    return result;
}

std::expected<Cluster, Error> clusterFromJson(const Json::Value& value) {
    return decode<Cluster>("cluster", [&] {
        Cluster cluster;
        cluster.metadata = readMeta(value);
        const auto& spec = member(value, "spec");

        const auto& snapshot = member(member(spec, "backup"), "volumeSnapshot");
        if (!snapshot.isNull()) {
            VolumeSnapshotConfig config;
            config.className = readString(snapshot, "className");
            config.walClassName = readString(snapshot, "walClassName");
            config.labels = readStringMap(snapshot, "labels");
            config.annotations = readStringMap(snapshot, "annotations");
            auto owner = parseSnapshotOwnerReference(readString(snapshot, "snapshotOwnerReference"));
            if (!owner) {
                throw ParseFailure("unknown snapshotOwnerReference");
            }
            config.ownerReference = *owner;
            cluster.spec.volumeSnapshot = config;
        }

        const auto& replica = member(spec, "replica");
        if (!replica.isNull()) {
            ReplicaClusterConfig config;
            config.enabled = readBool(replica, "enabled", false);
            config.source = readString(replica, "source");
            cluster.spec.replica = config;
        }

        const auto& servers = member(spec, "externalClusters");
        if (!servers.isNull() && !servers.isArray()) {
            throw ParseFailure("spec.externalClusters must be a list");
        }
        for (const auto& item : servers) {
            ExternalCluster server;
            server.name = readString(item, "name");
            server.connectionParameters = readStringMap(item, "connectionParameters");
            const auto& password = member(item, "password");
            if (!password.isNull()) {
                server.password = SecretKeySelector{readString(password, "name"), readString(password, "key")};
            }
            cluster.spec.externalClusters.push_back(server);
        }

        const auto& slots = member(member(spec, "replicationSlots"), "highAvailability");
        cluster.spec.replicationSlots.highAvailability = readBool(slots, "enabled", true);
        cluster.spec.replicationSlots.slotPrefix = readString(slots, "slotPrefix", "_cnpg_");

        const auto& inherited = member(spec, "inheritedMetadata");
        cluster.spec.inheritedMetadata.labels = readStringMap(inherited, "labels");
        cluster.spec.inheritedMetadata.annotations = readStringMap(inherited, "annotations");

        const auto& status = member(value, "status");
        cluster.status.currentPrimary = readString(status, "currentPrimary");
        cluster.status.targetPrimary = readString(status, "targetPrimary");
        return cluster;
    });
}

Json::Value toJson(const Pod& pod) {
    Json::Value result;
    result["kind"] = "Pod";
    result["metadata"] = toJson(pod.metadata);
    Json::Value conditions(Json::arrayValue);
    for (const auto& condition : pod.conditions) {
        Json::Value item;
        item["type"] = condition.type;
        item["status"] = condition.status;
        conditions.append(item);
    }
    result["status"]["conditions"] = conditions;
    return result;
}

std::expected<Pod, Error> podFromJson(const Json::Value& value) {
    return decode<Pod>("pod", [&] {
        Pod pod;
        pod.metadata = readMeta(value);
        const auto& conditions = member(member(value, "status"), "conditions");
        if (!conditions.isNull() && !conditions.isArray()) {
            throw ParseFailure("status.conditions must be a list");
        }
        for (const auto& item : conditions) {
            pod.conditions.push_back(PodCondition{readString(item, "type"), readString(item, "status", "Unknown")});
        }
        return pod;
    });
}

Json::Value toJson(const PersistentVolumeClaim& pvc) {
    Json::Value result;
    result["kind"] = "PersistentVolumeClaim";
    result["metadata"] = toJson(pvc.metadata);
    return result;
}

std::expected<PersistentVolumeClaim, Error> pvcFromJson(const Json::Value& value) {
    return decode<PersistentVolumeClaim>("persistent volume claim", [&] {
        PersistentVolumeClaim pvc;
        pvc.metadata = readMeta(value);
        return pvc;
    });
}

Json::Value toJson(const VolumeSnapshot& snapshot) {
    Json::Value result;
    result["kind"] = "VolumeSnapshot";
    result["metadata"] = toJson(snapshot.metadata);
    result["spec"]["source"]["persistentVolumeClaimName"] = snapshot.sourcePvcName;
    if (snapshot.className) {
        result["spec"]["volumeSnapshotClassName"] = *snapshot.className;
    }
    if (!snapshot.status.isNull()) {
        result["status"] = snapshot.status;
    }
    return result;
}

std::expected<VolumeSnapshot, Error> snapshotFromJson(const Json::Value& value) {
    return decode<VolumeSnapshot>("volume snapshot", [&] {
        VolumeSnapshot snapshot;
        snapshot.metadata = readMeta(value);
        const auto& spec = member(value, "spec");
        snapshot.sourcePvcName = readString(member(spec, "source"), "persistentVolumeClaimName");
        const auto& className = member(spec, "volumeSnapshotClassName");
        if (!className.isNull()) {
            snapshot.className = readString(spec, "volumeSnapshotClassName");
        }
        // Kept verbatim: the provider owns this document and classifyState judges it.
        snapshot.status = member(value, "status");
        return snapshot;
    });
}

Json::Value toJson(const Backup& backup) {
    Json::Value result;
    result["kind"] = "Backup";
    result["metadata"] = toJson(backup.metadata);
    result["spec"]["cluster"]["name"] = backup.spec.clusterName;
    result["spec"]["target"] = backupTargetName(backup.spec.target);

    Json::Value status(Json::objectValue);
    status["phase"] = backupPhaseName(backup.status.phase);
    if (!backup.status.error.empty()) {
        status["error"] = backup.status.error;
    }
    if (!backup.status.instanceName.empty()) {
        status["instanceID"]["podName"] = backup.status.instanceName;
    }
    if (!backup.status.snapshots.empty()) {
        Json::Value snapshots(Json::arrayValue);
        for (const auto& name : backup.status.snapshots) {
            snapshots.append(name);
        }
        status["backupSnapshotStatus"]["elements"] = snapshots;
    }
    if (backup.status.startedAt) {
        status["startedAt"] = static_cast<Json::Int64>(*backup.status.startedAt);
    }
    if (backup.status.stoppedAt) {
        status["stoppedAt"] = static_cast<Json::Int64>(*backup.status.stoppedAt);
    }
    result["status"] = status;
    return result;
}

std::expected<Backup, Error> backupFromJson(const Json::Value& value) {
    return decode<Backup>("backup", [&] {
        Backup backup;
        backup.metadata = readMeta(value);
        const auto& spec = member(value, "spec");
        backup.spec.clusterName = readString(member(spec, "cluster"), "name");
        if (backup.spec.clusterName.empty()) {
            throw ParseFailure("spec.cluster.name is required");
        }
        auto target = parseBackupTarget(readString(spec, "target"));
        if (!target) {
            throw ParseFailure("unknown spec.target");
        }
        backup.spec.target = *target;

        const auto& status = member(value, "status");
        auto phase = parseBackupPhase(readString(status, "phase"));
        if (!phase) {
            throw ParseFailure("unknown status.phase");
        }
        backup.status.phase = *phase;
        backup.status.error = readString(status, "error");
        backup.status.instanceName = readString(member(status, "instanceID"), "podName");
        backup.status.snapshots = readStringList(member(status, "backupSnapshotStatus"), "elements");
        backup.status.startedAt = readOptionalInt(status, "startedAt");
        backup.status.stoppedAt = readOptionalInt(status, "stoppedAt");
        return backup;
    });
}

Json::Value toJson(const Secret& secret) {
    Json::Value result;
    result["kind"] = "Secret";
    result["metadata"] = toJson(secret.metadata);
    result["data"] = stringMapToJson(secret.data);
    return result;
}

std::expected<Secret, Error> secretFromJson(const Json::Value& value) {
    return decode<Secret>("secret", [&] {
        Secret secret;
        secret.metadata = readMeta(value);
        secret.data = readStringMap(value, "data");
        return secret;
    });
}

std::string toCompactString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string toStyledString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

std::expected<Json::Value, Error> parseJsonDocument(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value document;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &document, &errors)) {
        return makeError(ErrorCode::ParseError, "invalid JSON document: " + errors);
    }
    return document;
}
