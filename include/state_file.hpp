/**
 * @file state_file.hpp
 * @brief Persists an InMemoryObjectStore as a JSON document.
 *
 * The document has one list per kind: "clusters", "pods", "volumeClaims",
 * "volumeSnapshots", "backups" and "secrets". The command line tool loads it before a
 * reconciliation and saves it afterwards; the storage provider and other actors edit
 * it in between. Saving therefore merges: only the objects changed since loading are
 * written back, on top of whatever the file holds by then.
 */

#ifndef STATE_FILE_HPP
#define STATE_FILE_HPP

#include <expected>
#include <map>
#include <string>
#include <json/json.h>
#include "error.hpp"
#include "memory_store.hpp"

/**
 * @brief Objects of a state document as they were when it was loaded.
 */
struct StateBaseline {
    /// Encoded objects keyed by "<list>/<namespace>/<name>".
    std::map<std::string, Json::Value> objects;
};

/**
 * @brief Loads every object of a state document into the store, keeping their resourceVersions.
 *
 * @param document Parsed state document.
 * @param store Store receiving the objects.
 * @return std::expected<StateBaseline, Error> What was loaded, or ParseError naming the broken entry.
 */
std::expected<StateBaseline, Error> loadState(const Json::Value& document, InMemoryObjectStore& store);

/**
 * @brief Encodes every object of the store.
 */
Json::Value dumpState(const InMemoryObjectStore& store);

/**
 * @brief Reads and loads a state file.
 *
 * @return std::expected<StateBaseline, Error> What was loaded, IoFailed when unreadable,
 *         ParseError when malformed.
 */
std::expected<StateBaseline, Error> loadStateFile(const std::string& path, InMemoryObjectStore& store);

/**
 * @brief Writes the whole store to a state file, replacing it atomically.
 */
std::expected<void, Error> saveStateFile(const std::string& path, const InMemoryObjectStore& store);

/**
 * @brief Writes back the objects changed since @p baseline was loaded.
 *
 * The file is re-read first. Objects this process did not change keep their current
 * content in the file, including additions and removals made by other writers.
 * Nothing is written when nothing changed.
 *
 * @return std::expected<void, Error> Success; Conflict, with the file untouched, when an
 *         object changed here was also changed, created or removed in the file since loading.
 */
std::expected<void, Error> saveStateFile(const std::string& path,
                                         const InMemoryObjectStore& store,
                                         const StateBaseline& baseline);

#endif // STATE_FILE_HPP
