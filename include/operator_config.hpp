/**
 * @file operator_config.hpp
 * @brief Configuration management for the PgFleet operator.
 *
 * Defines the configuration class holding fencing, requeue, replica and notification
 * settings, and the logging helpers every component writes through.
 *
 * @note Configuration is loaded from a JSON file. Every key is optional; missing keys
 * fall back to the defaults documented on each field.
 */

#ifndef OPERATOR_CONFIG_HPP
#define OPERATOR_CONFIG_HPP

#include <chrono>
#include <mutex>
#include <string>
#include <json/json.h>

/**
 * @brief Settings used by the replica configuration writer.
 */
struct ReplicaSettings {
    std::string pgData = "/var/lib/postgresql/data/pgdata"; ///< Data directory of the local member.
    std::string podName;                                    ///< Name of the local member.
    std::string clusterName;                                ///< Cluster the member belongs to.
    std::string namespace_ = "default";                     ///< Namespace of the cluster.
    std::string serverCertDir = "/controller/certificates"; ///< Streaming replication TLS material.
    std::string passfileDir = "/controller/external";       ///< Where external pgpass files are written.
    std::string restoreCommand;                             ///< Optional restore_command for standbys.
};

/**
 * @brief Configuration class for the operator.
 *
 * Loads and manages settings from a JSON configuration file, providing defaults.
 */
class OperatorConfig {
public:
    /**
     * @brief Constructs a configuration with every default applied and logging to the console only.
     */
    OperatorConfig();

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is missing or not valid JSON.
     */
    explicit OperatorConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration from an already parsed document.
     *
     * @param configJson Configuration document.
     * @throws std::runtime_error If a value has the wrong type or is out of range.
     */
    explicit OperatorConfig(const Json::Value& configJson);

    /**
     * @brief Logs a message to stdout and the configured log file.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and the configured error log file.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Logs a message only when debug logging is enabled.
     */
    void logDebug(const std::string& message) const;

    std::string logFile;                    ///< Path to the log file (empty: console only).
    std::string errorLogFile;               ///< Path to the error log file (empty: console only).
    bool debug = false;                     ///< Enables logDebug output.
    bool quiet = false;                     ///< Suppresses console output; files are still written.
    std::string stateFile = "pgfleet_state.json"; ///< State file used by the command line tool.

    bool fenceBeforeSnapshot = true;        ///< Fence the target member while snapshotting.
    int maxFenceConflictRetries = 5;        ///< Compare-and-swap attempts on the fencing annotation.
    std::chrono::seconds requeueDelay{10};  ///< Delay returned while waiting on fencing or snapshots.
    std::chrono::seconds daemonInterval{30}; ///< Daemon polling interval when nothing is requeued.
    std::chrono::milliseconds callTimeout{30000}; ///< Deadline applied to each reconciliation.

    std::string controlDataCommand;         ///< Template running pg_controldata; {namespace} and {pod} are substituted.
    ReplicaSettings replica;                ///< Replica configuration writer settings.
    Json::Value telegramConfig;             ///< Telegram configuration for event notifications.

private:
    void load(const Json::Value& configJson);
    void writeLine(const std::string& path, const std::string& entry, bool toStderr) const;

    mutable std::mutex logMutex;            ///< Serializes log file appends.
};

#endif // OPERATOR_CONFIG_HPP
