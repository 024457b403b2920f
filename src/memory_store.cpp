#include "memory_store.hpp"
#include <charconv>

namespace {

template <typename T>
std::expected<T, Error> findObject(const std::map<InMemoryObjectStore::Key, T>& objects,
                                   const char* kind,
                                   const std::string& namespace_,
                                   const std::string& name) {
    auto it = objects.find({namespace_, name});
    if (it == objects.end()) {
        return makeError(ErrorCode::NotFound, std::string(kind) + " " + namespace_ + "/" + name + " not found");
    }
    return it->second;
}

template <typename T>
std::vector<T> selectObjects(const std::map<InMemoryObjectStore::Key, T>& objects,
                             const std::string& namespace_,
                             const StringMap& selector) {
    std::vector<T> result;
    for (const auto& [key, object] : objects) {
        if (key.first == namespace_ && matchesLabels(object.metadata.labels, selector)) {
            result.push_back(object);
        }
    }
    return result;
}

template <typename T>
std::vector<T> allObjects(const std::map<InMemoryObjectStore::Key, T>& objects) {
    std::vector<T> result;
    result.reserve(objects.size());
    for (const auto& entry : objects) {
        result.push_back(entry.second);
    }
    return result;
}

template <typename T>
std::expected<void, Error> checkVersion(const std::map<InMemoryObjectStore::Key, T>& objects,
                                        const char* kind,
                                        const T& candidate) {
    const auto& meta = candidate.metadata;
    auto it = objects.find({meta.namespace_, meta.name});
    if (it == objects.end()) {
        return makeError(ErrorCode::NotFound, std::string(kind) + " " + meta.namespace_ + "/" + meta.name + " not found");
    }
    if (it->second.metadata.resourceVersion != meta.resourceVersion) {
        return makeError(ErrorCode::Conflict,
                         std::string("the object has been modified; please apply your changes to the latest version of ") +
                             kind + " " + meta.namespace_ + "/" + meta.name);
    }
    return {};
}

InMemoryObjectStore::Key keyOf(const ObjectMeta& meta) {
    return {meta.namespace_, meta.name};
}

} // namespace

void InMemoryObjectStore::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    clusterObjects.clear();
    podObjects.clear();
    pvcObjects.clear();
    snapshotObjects.clear();
    backupObjects.clear();
    secretObjects.clear();
}

std::string InMemoryObjectStore::nextVersion() {
    return std::to_string(++versionCounter);
}

template <typename T>
void InMemoryObjectStore::restoreObject(std::map<Key, T>& objects, T object) {
    std::lock_guard<std::mutex> lock(mutex);
    const std::string& version = object.metadata.resourceVersion;
    std::uint64_t seen = 0;
    auto [end, ec] = std::from_chars(version.data(), version.data() + version.size(), seen);
    if (ec == std::errc() && end == version.data() + version.size() && seen > versionCounter) {
        versionCounter = seen;
    }
    objects[keyOf(object.metadata)] = std::move(object);
}

std::expected<Cluster, Error> InMemoryObjectStore::getCluster(const OperationContext& ctx,
                                                              const std::string& namespace_,
                                                              const std::string& name) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    return findObject(clusterObjects, "cluster", namespace_, name);
}

std::expected<Cluster, Error> InMemoryObjectStore::updateCluster(const OperationContext& ctx, const Cluster& cluster) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (auto ok = checkVersion(clusterObjects, "cluster", cluster); !ok) {
        return std::unexpected(ok.error());
    }
    Cluster stored = cluster;
    stored.metadata.resourceVersion = nextVersion();
    clusterObjects[keyOf(stored.metadata)] = stored;
    return stored;
}

std::expected<Pod, Error> InMemoryObjectStore::getPod(const OperationContext& ctx,
                                                      const std::string& namespace_,
                                                      const std::string& name) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    return findObject(podObjects, "pod", namespace_, name);
}

std::expected<std::vector<Pod>, Error> InMemoryObjectStore::listPods(const OperationContext& ctx,
                                                                     const std::string& namespace_,
                                                                     const StringMap& selector) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    return selectObjects(podObjects, namespace_, selector);
}

std::expected<std::vector<PersistentVolumeClaim>, Error> InMemoryObjectStore::listVolumeClaims(
    const OperationContext& ctx,
    const std::string& namespace_,
    const StringMap& selector) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    return selectObjects(pvcObjects, namespace_, selector);
}

std::expected<void, Error> InMemoryObjectStore::createSnapshot(const OperationContext& ctx, const VolumeSnapshot& snapshot) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto key = keyOf(snapshot.metadata);
    if (snapshotObjects.contains(key)) {
        return makeError(ErrorCode::AlreadyExists,
                         "volume snapshot " + key.first + "/" + key.second + " already exists");
    }
    VolumeSnapshot stored = snapshot;
    stored.metadata.resourceVersion = nextVersion();
    snapshotObjects[key] = stored;
    return {};
}

std::expected<std::vector<VolumeSnapshot>, Error> InMemoryObjectStore::listSnapshots(const OperationContext& ctx,
                                                                                     const std::string& namespace_,
                                                                                     const StringMap& selector) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    return selectObjects(snapshotObjects, namespace_, selector);
}

std::expected<Backup, Error> InMemoryObjectStore::getBackup(const OperationContext& ctx,
                                                            const std::string& namespace_,
                                                            const std::string& name) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    return findObject(backupObjects, "backup", namespace_, name);
}

std::expected<std::vector<Backup>, Error> InMemoryObjectStore::listBackups(const OperationContext& ctx) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    return allObjects(backupObjects);
}

std::expected<Backup, Error> InMemoryObjectStore::updateBackup(const OperationContext& ctx, const Backup& backup) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (auto ok = checkVersion(backupObjects, "backup", backup); !ok) {
        return std::unexpected(ok.error());
    }
    Backup stored = backup;
    stored.metadata.resourceVersion = nextVersion();
    backupObjects[keyOf(stored.metadata)] = stored;
    return stored;
}

std::expected<Secret, Error> InMemoryObjectStore::getSecret(const OperationContext& ctx,
                                                            const std::string& namespace_,
                                                            const std::string& name) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }
    std::lock_guard<std::mutex> lock(mutex);
    return findObject(secretObjects, "secret", namespace_, name);
}

void InMemoryObjectStore::putCluster(Cluster cluster) {
    std::lock_guard<std::mutex> lock(mutex);
    cluster.metadata.resourceVersion = nextVersion();
    clusterObjects[keyOf(cluster.metadata)] = std::move(cluster);
}

void InMemoryObjectStore::putPod(Pod pod) {
    std::lock_guard<std::mutex> lock(mutex);
    pod.metadata.resourceVersion = nextVersion();
    podObjects[keyOf(pod.metadata)] = std::move(pod);
}

void InMemoryObjectStore::putVolumeClaim(PersistentVolumeClaim pvc) {
    std::lock_guard<std::mutex> lock(mutex);
    pvc.metadata.resourceVersion = nextVersion();
    pvcObjects[keyOf(pvc.metadata)] = std::move(pvc);
}

void InMemoryObjectStore::putSnapshot(VolumeSnapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex);
    snapshot.metadata.resourceVersion = nextVersion();
    snapshotObjects[keyOf(snapshot.metadata)] = std::move(snapshot);
}

void InMemoryObjectStore::putBackup(Backup backup) {
    std::lock_guard<std::mutex> lock(mutex);
    backup.metadata.resourceVersion = nextVersion();
    backupObjects[keyOf(backup.metadata)] = std::move(backup);
}

void InMemoryObjectStore::putSecret(Secret secret) {
    std::lock_guard<std::mutex> lock(mutex);
    secret.metadata.resourceVersion = nextVersion();
    secretObjects[keyOf(secret.metadata)] = std::move(secret);
}

void InMemoryObjectStore::restore(Cluster cluster) {
    restoreObject(clusterObjects, std::move(cluster));
}

void InMemoryObjectStore::restore(Pod pod) {
    restoreObject(podObjects, std::move(pod));
}

void InMemoryObjectStore::restore(PersistentVolumeClaim pvc) {
    restoreObject(pvcObjects, std::move(pvc));
}

void InMemoryObjectStore::restore(VolumeSnapshot snapshot) {
    restoreObject(snapshotObjects, std::move(snapshot));
}

void InMemoryObjectStore::restore(Backup backup) {
    restoreObject(backupObjects, std::move(backup));
}

void InMemoryObjectStore::restore(Secret secret) {
    restoreObject(secretObjects, std::move(secret));
}

std::vector<Cluster> InMemoryObjectStore::clusters() const {
    std::lock_guard<std::mutex> lock(mutex);
    return allObjects(clusterObjects);
}

std::vector<Pod> InMemoryObjectStore::pods() const {
    std::lock_guard<std::mutex> lock(mutex);
    return allObjects(podObjects);
}

std::vector<PersistentVolumeClaim> InMemoryObjectStore::volumeClaims() const {
    std::lock_guard<std::mutex> lock(mutex);
    return allObjects(pvcObjects);
}

std::vector<VolumeSnapshot> InMemoryObjectStore::snapshots() const {
    std::lock_guard<std::mutex> lock(mutex);
    return allObjects(snapshotObjects);
}

std::vector<Backup> InMemoryObjectStore::backups() const {
    std::lock_guard<std::mutex> lock(mutex);
    return allObjects(backupObjects);
}

std::vector<Secret> InMemoryObjectStore::secrets() const {
    std::lock_guard<std::mutex> lock(mutex);
    return allObjects(secretObjects);
}
