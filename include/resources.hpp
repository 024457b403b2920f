/**
 * @file resources.hpp
 * @brief Resource model handled by PgFleet: clusters, members, volumes, snapshots and backups.
 *
 * These are plain value types. Stores hand out copies; a copy is written back through
 * a compare-and-swap update that checks ObjectMeta::resourceVersion.
 *
 * @note Well-known label and annotation keys are declared here so that every component
 * stamps and selects objects the same way.
 */

#ifndef RESOURCES_HPP
#define RESOURCES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

using StringMap = std::map<std::string, std::string>;

/// Annotation on the Cluster holding the JSON list of fenced members.
inline constexpr const char* kFencedInstancesAnnotation = "pgfleet.io/fencedInstances";
/// Wildcard member name meaning "every member of the cluster".
inline constexpr const char* kFenceAllInstances = "*";
/// Label selecting the pods of a cluster.
inline constexpr const char* kClusterLabel = "pgfleet.io/cluster";
/// Label binding a volume claim to the member that mounts it.
inline constexpr const char* kInstanceNameLabel = "pgfleet.io/instanceName";
/// Label carrying the volume role (PG_DATA or PG_WAL).
inline constexpr const char* kPvcRoleLabel = "pgfleet.io/pvcRole";
/// Label binding a snapshot to the backup that produced it.
inline constexpr const char* kBackupNameLabel = "pgfleet.io/backupName";
/// Annotation with the serialized Cluster at snapshot time.
inline constexpr const char* kClusterManifestAnnotation = "pgfleet.io/clusterManifest";
/// Annotation with the pg_controldata output captured before snapshotting.
inline constexpr const char* kPgControldataAnnotation = "pgfleet.io/pgControldata";

inline constexpr const char* kPvcRolePgData = "PG_DATA";
inline constexpr const char* kPvcRolePgWal = "PG_WAL";

/**
 * @brief Reference from a dependent object to its owner.
 */
struct OwnerReference {
    std::string kind; ///< "Cluster" or "Backup".
    std::string name; ///< Owner name.
    std::string uid;  ///< Owner UID.
    bool controller = true;

    bool operator==(const OwnerReference&) const = default;
};

/**
 * @brief Metadata shared by every stored object.
 */
struct ObjectMeta {
    std::string name;
    std::string namespace_;
    std::string uid;
    std::string resourceVersion;               ///< Version token checked by compare-and-swap updates.
    StringMap labels;
    StringMap annotations;
    std::vector<OwnerReference> ownerReferences;
};

/**
 * @brief Who owns the snapshots taken for a backup.
 */
enum class SnapshotOwnerReference {
    None,
    Cluster,
    Backup,
};

/**
 * @brief Volume snapshot settings of a cluster.
 */
struct VolumeSnapshotConfig {
    std::string className;    ///< Snapshot class for data volumes (empty: provider default).
    std::string walClassName; ///< Snapshot class for WAL volumes (empty: use className).
    StringMap labels;         ///< Labels added to every snapshot; win over volume labels.
    StringMap annotations;    ///< Annotations added to every snapshot; win over volume annotations.
    SnapshotOwnerReference ownerReference = SnapshotOwnerReference::None;
};

/**
 * @brief Reference to a key inside a Secret.
 */
struct SecretKeySelector {
    std::string name;
    std::string key;
};

/**
 * @brief PostgreSQL server living outside the fleet.
 */
struct ExternalCluster {
    std::string name;
    StringMap connectionParameters;            ///< libpq keywords (host, port, user, dbname, ...).
    std::optional<SecretKeySelector> password; ///< Password materialized into a pgpass file.
};

/**
 * @brief Replica cluster settings: the whole fleet follows an external source.
 */
struct ReplicaClusterConfig {
    bool enabled = false;
    std::string source; ///< Name of an entry in ClusterSpec::externalClusters.
};

/**
 * @brief Replication slot high-availability settings.
 */
struct ReplicationSlotsConfig {
    bool highAvailability = true;
    std::string slotPrefix = "_cnpg_";
};

/**
 * @brief Metadata the cluster propagates to objects it owns.
 */
struct InheritedMetadata {
    StringMap labels;
    StringMap annotations;
};

struct ClusterSpec {
    std::optional<VolumeSnapshotConfig> volumeSnapshot;
    std::optional<ReplicaClusterConfig> replica;
    std::vector<ExternalCluster> externalClusters;
    ReplicationSlotsConfig replicationSlots;
    InheritedMetadata inheritedMetadata;
};

struct ClusterStatus {
    std::string currentPrimary; ///< Member currently accepting writes.
    std::string targetPrimary;  ///< Member that should become (or stay) primary.
};

/**
 * @brief Shared fleet descriptor.
 */
struct Cluster {
    ObjectMeta metadata;
    ClusterSpec spec;
    ClusterStatus status;

    /**
     * @brief Tells whether the whole cluster replicates from an external source.
     */
    bool isReplica() const;

    /**
     * @brief Looks up an external cluster by name.
     */
    std::optional<ExternalCluster> externalCluster(const std::string& name) const;

    /**
     * @brief Returns the replication slot name reserved for a member.
     *
     * The slot prefix followed by the lower-cased member name, where every run of
     * characters outside [a-z0-9_] becomes a single underscore. Empty when slot
     * high availability is disabled.
     */
    std::string slotNameForInstance(const std::string& instanceName) const;

    /**
     * @brief Name of the service routing to the current primary.
     */
    std::string readWriteServiceName() const;
};

struct PodCondition {
    std::string type;   ///< e.g. "Ready".
    std::string status; ///< "True", "False" or "Unknown".
};

/**
 * @brief Fleet member.
 */
struct Pod {
    ObjectMeta metadata;
    std::vector<PodCondition> conditions;
};

/**
 * @brief Tells whether the pod's Ready condition is True.
 */
bool isPodReady(const Pod& pod);

/**
 * @brief Volume attached to a member.
 */
struct PersistentVolumeClaim {
    ObjectMeta metadata;

    /**
     * @brief Returns the pgfleet.io/pvcRole label, PG_DATA when absent.
     */
    std::string role() const;
};

/**
 * @brief Storage snapshot resource.
 *
 * The status is written by the storage provider and kept as the raw document it
 * reported; SnapshotGateway::classifyState interprets it.
 */
struct VolumeSnapshot {
    ObjectMeta metadata;
    std::string sourcePvcName;
    std::optional<std::string> className;
    Json::Value status; ///< Provider-reported status; null until the provider reconciles it.
};

enum class BackupPhase {
    Pending,
    Running,
    Completed,
    Failed,
};

/**
 * @brief Which member a backup prefers to snapshot.
 */
enum class BackupTarget {
    Primary,
    PreferStandby,
};

struct BackupSpec {
    std::string clusterName;
    BackupTarget target = BackupTarget::PreferStandby;
};

struct BackupStatus {
    BackupPhase phase = BackupPhase::Pending;
    std::string error;                   ///< Failure message when phase is Failed.
    std::string instanceName;            ///< Member chosen on the first reconciliation.
    std::vector<std::string> snapshots;  ///< Snapshot names once completed.
    std::optional<std::int64_t> startedAt; ///< Unix seconds.
    std::optional<std::int64_t> stoppedAt; ///< Unix seconds.
};

/**
 * @brief A single backup attempt.
 */
struct Backup {
    ObjectMeta metadata;
    BackupSpec spec;
    BackupStatus status;

    /**
     * @brief Tells whether the backup reached Completed or Failed.
     */
    bool isDone() const;
};

/**
 * @brief Secret holding credentials, key by key.
 */
struct Secret {
    ObjectMeta metadata;
    StringMap data;
};

const char* backupPhaseName(BackupPhase phase);
std::optional<BackupPhase> parseBackupPhase(const std::string& name);

const char* backupTargetName(BackupTarget target);
std::optional<BackupTarget> parseBackupTarget(const std::string& name);

const char* snapshotOwnerReferenceName(SnapshotOwnerReference reference);
std::optional<SnapshotOwnerReference> parseSnapshotOwnerReference(const std::string& name);

/**
 * @brief Copies every entry of @p source into @p target, overwriting existing keys.
 */
void mergeMap(StringMap& target, const StringMap& source);

/**
 * @brief Tells whether every entry of @p selector is present in @p labels.
 */
bool matchesLabels(const StringMap& labels, const StringMap& selector);

#endif // RESOURCES_HPP
