#include "state_file.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include "manifest.hpp"

namespace fs = std::filesystem;

namespace {

std::string objectId(const char* list, const ObjectMeta& meta) {
    return std::string(list) + "/" + meta.namespace_ + "/" + meta.name;
}

template <typename T, typename Decode>
std::expected<std::vector<T>, Error> decodeList(const Json::Value& document, const char* key, Decode decode) {
    std::vector<T> objects;
    if (!document.isMember(key)) {
        return objects;
    }
    const auto& list = document[key];
    if (!list.isArray()) {
        return makeError(ErrorCode::ParseError, std::string("state entry '") + key + "' must be a list");
    }
    for (Json::ArrayIndex i = 0; i < list.size(); ++i) {
        std::expected<T, Error> object = decode(list[i]);
        if (!object) {
            return makeError(ErrorCode::ParseError,
                             std::string(key) + "[" + std::to_string(i) + "]: " + object.error().message);
        }
        objects.push_back(std::move(*object));
    }
    return objects;
}

template <typename T, typename Decode>
std::expected<void, Error> loadList(const Json::Value& document,
                                    const char* key,
                                    Decode decode,
                                    InMemoryObjectStore& store,
                                    StateBaseline& baseline) {
    auto objects = decodeList<T>(document, key, decode);
    if (!objects) {
        return std::unexpected(objects.error());
    }
    for (auto& object : *objects) {
        baseline.objects[objectId(key, object.metadata)] = toJson(object);
        store.restore(std::move(object));
    }
    return {};
}

/**
 * @brief Merges one kind: the file's objects, overridden by those changed here since loading.
 */
template <typename T, typename Decode>
std::expected<void, Error> mergeList(const Json::Value& onDisk,
                                     const char* key,
                                     Decode decode,
                                     const std::vector<T>& ours,
                                     const StateBaseline& baseline,
                                     InMemoryObjectStore& merged,
                                     std::size_t& changed) {
    auto theirs = decodeList<T>(onDisk, key, decode);
    if (!theirs) {
        return std::unexpected(theirs.error());
    }
    std::map<std::string, T> result;
    for (auto& object : *theirs) {
        std::string id = objectId(key, object.metadata);
        result.insert_or_assign(id, std::move(object));
    }

    for (const auto& object : ours) {
        std::string id = objectId(key, object.metadata);
        Json::Value encoded = toJson(object);
        auto loaded = baseline.objects.find(id);
        if (loaded != baseline.objects.end() && loaded->second == encoded) {
            continue;
        }

        auto current = result.find(id);
        bool movedOnDisk = loaded == baseline.objects.end()
                               ? current != result.end()
                               : current == result.end() || toJson(current->second) != loaded->second;
        if (movedOnDisk) {
            return makeError(ErrorCode::Conflict, id + " was modified in the state file since it was loaded");
        }
        result.insert_or_assign(id, object);
        ++changed;
    }

    for (auto& entry : result) {
        merged.restore(std::move(entry.second));
    }
    return {};
}

template <typename T>
Json::Value dumpList(const std::vector<T>& objects) {
    Json::Value list(Json::arrayValue);
    for (const auto& object : objects) {
        list.append(toJson(object));
    }
    return list;
}

std::expected<Json::Value, Error> readDocument(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return makeError(ErrorCode::IoFailed, "Failed to open state file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto document = parseJsonDocument(buffer.str());
    if (!document) {
        return makeError(ErrorCode::ParseError, path + ": " + document.error().message);
    }
    return document;
}

} // namespace

std::expected<StateBaseline, Error> loadState(const Json::Value& document, InMemoryObjectStore& store) {
    if (!document.isObject()) {
        return makeError(ErrorCode::ParseError, "state document must be a JSON object");
    }
    StateBaseline baseline;
    if (auto ok = loadList<Cluster>(document, "clusters", clusterFromJson, store, baseline); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = loadList<Pod>(document, "pods", podFromJson, store, baseline); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = loadList<PersistentVolumeClaim>(document, "volumeClaims", pvcFromJson, store, baseline); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = loadList<VolumeSnapshot>(document, "volumeSnapshots", snapshotFromJson, store, baseline); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = loadList<Backup>(document, "backups", backupFromJson, store, baseline); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = loadList<Secret>(document, "secrets", secretFromJson, store, baseline); !ok) {
        return std::unexpected(ok.error());
    }
    return baseline;
}

Json::Value dumpState(const InMemoryObjectStore& store) {
    Json::Value document(Json::objectValue);
    document["clusters"] = dumpList(store.clusters());
    document["pods"] = dumpList(store.pods());
    document["volumeClaims"] = dumpList(store.volumeClaims());
    document["volumeSnapshots"] = dumpList(store.snapshots());
    document["backups"] = dumpList(store.backups());
    document["secrets"] = dumpList(store.secrets());
    return document;
}

std::expected<StateBaseline, Error> loadStateFile(const std::string& path, InMemoryObjectStore& store) {
    auto document = readDocument(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    return loadState(*document, store);
}

std::expected<void, Error> saveStateFile(const std::string& path, const InMemoryObjectStore& store) {
    fs::path target(path);
    fs::path temporary = target;
    temporary += ".tmp";
    {
        std::ofstream out(temporary, std::ios::trunc);
        if (!out.is_open()) {
            return makeError(ErrorCode::IoFailed, "Failed to open state file for writing: " + temporary.string());
        }
        out << toStyledString(dumpState(store)) << '\n';
        if (!out) {
            return makeError(ErrorCode::IoFailed, "Failed to write state file: " + temporary.string());
        }
    }
    std::error_code ec;
    fs::rename(temporary, target, ec);
    if (ec) {
        return makeError(ErrorCode::IoFailed, "Failed to replace state file " + path + ": " + ec.message());
    }
    return {};
}

std::expected<void, Error> saveStateFile(const std::string& path,
                                         const InMemoryObjectStore& store,
                                         const StateBaseline& baseline) {
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) {
        return makeError(ErrorCode::IoFailed, "Failed to check state file " + path + ": " + ec.message());
    }
    Json::Value onDisk(Json::objectValue);
    if (exists) {
        auto document = readDocument(path);
        if (!document) {
            return std::unexpected(document.error());
        }
        if (!document->isObject()) {
            return makeError(ErrorCode::ParseError, path + ": state document must be a JSON object");
        }
        onDisk = std::move(*document);
    }

    InMemoryObjectStore merged;
    std::size_t changed = 0;
    if (auto ok = mergeList(onDisk, "clusters", clusterFromJson, store.clusters(), baseline, merged, changed); !ok) {
        return ok;
    }
    if (auto ok = mergeList(onDisk, "pods", podFromJson, store.pods(), baseline, merged, changed); !ok) {
        return ok;
    }
    if (auto ok = mergeList(onDisk, "volumeClaims", pvcFromJson, store.volumeClaims(), baseline, merged, changed);
        !ok) {
        return ok;
    }
    if (auto ok = mergeList(onDisk, "volumeSnapshots", snapshotFromJson, store.snapshots(), baseline, merged,
                            changed);
        !ok) {
        return ok;
    }
    if (auto ok = mergeList(onDisk, "backups", backupFromJson, store.backups(), baseline, merged, changed); !ok) {
        return ok;
    }
    if (auto ok = mergeList(onDisk, "secrets", secretFromJson, store.secrets(), baseline, merged, changed); !ok) {
        return ok;
    }

    if (changed == 0) {
        return {};
    }
    return saveStateFile(path, merged);
}
