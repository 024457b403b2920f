/**
 * @file memory_store.hpp
 * @brief In-memory implementation of every PgFleet store.
 *
 * Objects are kept per namespace and name. Every successful write stamps a new
 * resourceVersion taken from a store-wide counter, and updates are compare-and-swap:
 * a stale resourceVersion is rejected with ErrorCode::Conflict.
 */

#ifndef MEMORY_STORE_HPP
#define MEMORY_STORE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <utility>
#include "object_store.hpp"

/**
 * @brief Thread-safe in-memory object store.
 */
class InMemoryObjectStore : public ClusterStore,
                            public PodStore,
                            public VolumeClaimStore,
                            public SnapshotStore,
                            public BackupStore,
                            public SecretStore {
public:
    using Key = std::pair<std::string, std::string>; ///< (namespace, name).

    std::expected<Cluster, Error> getCluster(const OperationContext& ctx,
                                             const std::string& namespace_,
                                             const std::string& name) override;
    std::expected<Cluster, Error> updateCluster(const OperationContext& ctx, const Cluster& cluster) override;

    std::expected<Pod, Error> getPod(const OperationContext& ctx,
                                     const std::string& namespace_,
                                     const std::string& name) override;
    std::expected<std::vector<Pod>, Error> listPods(const OperationContext& ctx,
                                                    const std::string& namespace_,
                                                    const StringMap& selector) override;

    std::expected<std::vector<PersistentVolumeClaim>, Error> listVolumeClaims(const OperationContext& ctx,
                                                                              const std::string& namespace_,
                                                                              const StringMap& selector) override;

    std::expected<void, Error> createSnapshot(const OperationContext& ctx, const VolumeSnapshot& snapshot) override;
    std::expected<std::vector<VolumeSnapshot>, Error> listSnapshots(const OperationContext& ctx,
                                                                    const std::string& namespace_,
                                                                    const StringMap& selector) override;

    std::expected<Backup, Error> getBackup(const OperationContext& ctx,
                                           const std::string& namespace_,
                                           const std::string& name) override;
    std::expected<std::vector<Backup>, Error> listBackups(const OperationContext& ctx) override;
    std::expected<Backup, Error> updateBackup(const OperationContext& ctx, const Backup& backup) override;

    std::expected<Secret, Error> getSecret(const OperationContext& ctx,
                                           const std::string& namespace_,
                                           const std::string& name) override;

    /**
     * @brief Inserts or replaces an object unconditionally, stamping a new resourceVersion.
     *
     * Used to seed the store and, for snapshots, to play the storage provider reporting status.
     */
    void putCluster(Cluster cluster);
    void putPod(Pod pod);
    void putVolumeClaim(PersistentVolumeClaim pvc);
    void putSnapshot(VolumeSnapshot snapshot);
    void putBackup(Backup backup);
    void putSecret(Secret secret);

    /**
     * @brief Inserts or replaces an object keeping the resourceVersion it carries.
     *
     * Used when loading persisted state. Versions stamped afterwards never reuse a
     * numeric version seen here.
     */
    void restore(Cluster cluster);
    void restore(Pod pod);
    void restore(PersistentVolumeClaim pvc);
    void restore(VolumeSnapshot snapshot);
    void restore(Backup backup);
    void restore(Secret secret);

    /// Drops every object; the version counter keeps increasing.
    void clear();

    std::vector<Cluster> clusters() const;
    std::vector<Pod> pods() const;
    std::vector<PersistentVolumeClaim> volumeClaims() const;
    std::vector<VolumeSnapshot> snapshots() const;
    std::vector<Backup> backups() const;
    std::vector<Secret> secrets() const;

private:
    std::string nextVersion();
    template <typename T>
    void restoreObject(std::map<Key, T>& objects, T object);

    mutable std::mutex mutex;
    std::uint64_t versionCounter = 0;
    std::map<Key, Cluster> clusterObjects;
    std::map<Key, Pod> podObjects;
    std::map<Key, PersistentVolumeClaim> pvcObjects;
    std::map<Key, VolumeSnapshot> snapshotObjects;
    std::map<Key, Backup> backupObjects;
    std::map<Key, Secret> secretObjects;
};

#endif // MEMORY_STORE_HPP
