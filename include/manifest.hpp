/**
 * @file manifest.hpp
 * @brief JSON encoding of PgFleet resources.
 *
 * The same documents are used for the cluster manifest annotation stamped on snapshots
 * and for the state file read by the command line tool. Objects follow the familiar
 * {"metadata": ..., "spec": ..., "status": ...} layout.
 */

#ifndef MANIFEST_HPP
#define MANIFEST_HPP

#include <expected>
#include <string>
#include <json/json.h>
#include "error.hpp"
#include "resources.hpp"

Json::Value toJson(const ObjectMeta& meta);
Json::Value toJson(const Cluster& cluster);
Json::Value toJson(const Pod& pod);
Json::Value toJson(const PersistentVolumeClaim& pvc);
Json::Value toJson(const VolumeSnapshot& snapshot);
Json::Value toJson(const Backup& backup);
Json::Value toJson(const Secret& secret);

/**
 * @brief Decodes a cluster document.
 *
 * @return std::expected<Cluster, Error> The cluster, or ParseError naming the offending field.
 */
std::expected<Cluster, Error> clusterFromJson(const Json::Value& value);
std::expected<Pod, Error> podFromJson(const Json::Value& value);
std::expected<PersistentVolumeClaim, Error> pvcFromJson(const Json::Value& value);
std::expected<VolumeSnapshot, Error> snapshotFromJson(const Json::Value& value);
std::expected<Backup, Error> backupFromJson(const Json::Value& value);
std::expected<Secret, Error> secretFromJson(const Json::Value& value);

/**
 * @brief Serializes a document on a single line.
 */
std::string toCompactString(const Json::Value& value);

/**
 * @brief Serializes a document with indentation, for files meant to be edited.
 */
std::string toStyledString(const Json::Value& value);

/**
 * @brief Parses a JSON document held in a string.
 *
 * @return std::expected<Json::Value, Error> The document, or ParseError with the reader's diagnostics.
 */
std::expected<Json::Value, Error> parseJsonDocument(const std::string& text);

#endif // MANIFEST_HPP
