/**
 * @file snapshot_gateway.hpp
 * @brief Creates, lists and classifies the storage snapshots of a backup.
 *
 * One VolumeSnapshot is created per volume of the target member, named
 * "<pvcName>-<unixTimestamp>" and labelled with the backup name so that later
 * reconciliations find the set instead of creating it again.
 */

#ifndef SNAPSHOT_GATEWAY_HPP
#define SNAPSHOT_GATEWAY_HPP

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>
#include "error.hpp"
#include "event_sink.hpp"
#include "instance_probe.hpp"
#include "object_store.hpp"
#include "operation_context.hpp"
#include "operator_config.hpp"
#include "resources.hpp"

/**
 * @brief Provider-reported state of a snapshot, as judged by SnapshotGateway::classifyState.
 */
enum class SnapshotPhase {
    Pending, ///< Still being taken.
    Ready,   ///< Ready to use.
    Failed,  ///< Terminal provider error, or a status that cannot be trusted.
};

struct SnapshotState {
    SnapshotPhase phase = SnapshotPhase::Pending;
    std::string reason; ///< Failure reason when phase is Failed.
};

/**
 * @brief Gateway to the snapshot store for one backup at a time.
 */
class SnapshotGateway {
public:
    /// Returns the current time in unix seconds; used for the snapshot name suffix.
    using UnixClock = std::function<std::int64_t()>;

    /**
     * @brief Constructs a snapshot gateway.
     *
     * @param snapshots Store the snapshots are created in.
     * @param probe Probe capturing pg_controldata before each snapshot.
     * @param events Sink receiving one CreateSnapshot event per volume.
     * @param config Operator configuration (logging).
     * @param clock Time source for snapshot names; the system clock when empty.
     */
    SnapshotGateway(SnapshotStore& snapshots,
                    InstanceProbe& probe,
                    EventSink& events,
                    const OperatorConfig& config,
                    UnixClock clock = {});

    /**
     * @brief Creates one snapshot per volume claim.
     *
     * Volume labels and annotations are merged with the cluster's snapshot templates,
     * the templates winning on conflicts. The backup label, the owner reference and the
     * cluster manifest are stamped on every snapshot; the pg_controldata dump is added
     * when the member answers.
     *
     * @return std::expected<std::vector<std::string>, Error> Names of the created snapshots,
     *         InvalidConfiguration when the cluster has no snapshot settings, or the store error.
     */
    std::expected<std::vector<std::string>, Error> createSnapshotSet(const OperationContext& ctx,
                                                                     const Cluster& cluster,
                                                                     const Backup& backup,
                                                                     const Pod& pod,
                                                                     const std::vector<PersistentVolumeClaim>& pvcs);

    /**
     * @brief Lists the snapshots already taken for a backup, in the cluster's namespace.
     */
    std::expected<std::vector<VolumeSnapshot>, Error> listSnapshotsForBackup(const OperationContext& ctx,
                                                                             const Cluster& cluster,
                                                                             const Backup& backup);

    /**
     * @brief Builds the snapshot resource for one volume without creating it.
     */
    VolumeSnapshot buildSnapshot(const OperationContext& ctx,
                                 const Cluster& cluster,
                                 const Backup& backup,
                                 const Pod& pod,
                                 const PersistentVolumeClaim& pvc,
                                 const std::string& suffix);

    /**
     * @brief Interprets the provider-reported status of a snapshot.
     *
     * A missing status is Pending. A status that is malformed or contradictory is
     * Failed with a parse error, so that a stuck resource is not polled forever.
     */
    static SnapshotState classifyState(const VolumeSnapshot& snapshot);

    /**
     * @brief Returns "<pvcName>-<suffix>".
     */
    static std::string snapshotName(const std::string& pvcName, const std::string& suffix);

private:
    SnapshotStore& snapshots;
    InstanceProbe& probe;
    EventSink& events;
    const OperatorConfig& config;
    UnixClock clock;
};

#endif // SNAPSHOT_GATEWAY_HPP
