/**
 * @file object_store.hpp
 * @brief Store interfaces PgFleet reads and writes fleet objects through.
 *
 * Each interface is the contract the orchestration layer needs from the platform:
 * get, list by label and compare-and-swap update. Updates carry the resourceVersion
 * read earlier and fail with ErrorCode::Conflict when someone else wrote in between.
 *
 * @note Every call accepts an OperationContext and must fail with Cancelled or Timeout
 * rather than silently dropping the request.
 */

#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include <expected>
#include <string>
#include <vector>
#include "error.hpp"
#include "operation_context.hpp"
#include "resources.hpp"

/**
 * @brief Access to Cluster objects.
 */
class ClusterStore {
public:
    virtual ~ClusterStore() = default;

    /**
     * @brief Fetches a cluster by name.
     *
     * @return std::expected<Cluster, Error> The cluster, or NotFound.
     */
    virtual std::expected<Cluster, Error> getCluster(const OperationContext& ctx,
                                                     const std::string& namespace_,
                                                     const std::string& name) = 0;

    /**
     * @brief Writes a cluster back if its resourceVersion is still current.
     *
     * @return std::expected<Cluster, Error> The stored cluster with its new resourceVersion, or Conflict.
     */
    virtual std::expected<Cluster, Error> updateCluster(const OperationContext& ctx, const Cluster& cluster) = 0;
};

/**
 * @brief Read access to fleet members.
 */
class PodStore {
public:
    virtual ~PodStore() = default;

    virtual std::expected<Pod, Error> getPod(const OperationContext& ctx,
                                             const std::string& namespace_,
                                             const std::string& name) = 0;

    /**
     * @brief Lists the pods of a namespace carrying every label of @p selector.
     */
    virtual std::expected<std::vector<Pod>, Error> listPods(const OperationContext& ctx,
                                                            const std::string& namespace_,
                                                            const StringMap& selector) = 0;
};

/**
 * @brief Read access to volume claims.
 */
class VolumeClaimStore {
public:
    virtual ~VolumeClaimStore() = default;

    virtual std::expected<std::vector<PersistentVolumeClaim>, Error> listVolumeClaims(const OperationContext& ctx,
                                                                                      const std::string& namespace_,
                                                                                      const StringMap& selector) = 0;
};

/**
 * @brief Access to storage snapshot resources.
 */
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    /**
     * @brief Creates a snapshot resource.
     *
     * @return std::expected<void, Error> Success, or AlreadyExists when the name is taken.
     */
    virtual std::expected<void, Error> createSnapshot(const OperationContext& ctx, const VolumeSnapshot& snapshot) = 0;

    virtual std::expected<std::vector<VolumeSnapshot>, Error> listSnapshots(const OperationContext& ctx,
                                                                            const std::string& namespace_,
                                                                            const StringMap& selector) = 0;
};

/**
 * @brief Access to Backup objects.
 */
class BackupStore {
public:
    virtual ~BackupStore() = default;

    virtual std::expected<Backup, Error> getBackup(const OperationContext& ctx,
                                                   const std::string& namespace_,
                                                   const std::string& name) = 0;

    virtual std::expected<std::vector<Backup>, Error> listBackups(const OperationContext& ctx) = 0;

    /**
     * @brief Writes a backup back if its resourceVersion is still current.
     */
    virtual std::expected<Backup, Error> updateBackup(const OperationContext& ctx, const Backup& backup) = 0;
};

/**
 * @brief Read access to secrets.
 */
class SecretStore {
public:
    virtual ~SecretStore() = default;

    virtual std::expected<Secret, Error> getSecret(const OperationContext& ctx,
                                                   const std::string& namespace_,
                                                   const std::string& name) = 0;
};

#endif // OBJECT_STORE_HPP
