#include "operator_config.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    return timeBuf;
}

int positiveInt(const Json::Value& value, const char* key, int fallback) {
    if (!value.isMember(key)) {
        return fallback;
    }
    if (!value[key].isInt() || value[key].asInt() <= 0) {
        throw std::runtime_error(std::string("Invalid configuration value for ") + key + ": expected a positive integer");
    }
    return value[key].asInt();
}

} // namespace

OperatorConfig::OperatorConfig() = default;

OperatorConfig::OperatorConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + configFile);
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error("Failed to parse config file: " + configFile + " (" + errors + ")");
    }
    load(configJson);
}

OperatorConfig::OperatorConfig(const Json::Value& configJson) {
    load(configJson);
}

void OperatorConfig::load(const Json::Value& configJson) {
    if (configJson.isNull()) {
        return;
    }
    if (!configJson.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    logFile = configJson.get("log_file", "").asString();
    errorLogFile = configJson.get("error_log_file", logFile).asString();
    debug = configJson.get("debug", false).asBool();
    quiet = configJson.get("quiet", false).asBool();
    stateFile = configJson.get("state_file", stateFile).asString();

    Json::Value fencing = configJson["fencing"];
    fenceBeforeSnapshot = fencing.get("enabled", true).asBool();
    maxFenceConflictRetries = positiveInt(fencing, "max_conflict_retries", maxFenceConflictRetries);

    requeueDelay = std::chrono::seconds(positiveInt(configJson, "requeue_delay_seconds", 10));
    callTimeout = std::chrono::milliseconds(positiveInt(configJson, "call_timeout_ms", 30000));

    Json::Value daemon = configJson["daemon"];
    daemonInterval = std::chrono::seconds(positiveInt(daemon, "interval_seconds", 30));

    controlDataCommand = configJson["control_data"].get("command", "").asString();

    Json::Value replicaJson = configJson["replica"];
    replica.pgData = replicaJson.get("pgdata", replica.pgData).asString();
    replica.podName = replicaJson.get("pod_name", "").asString();
    replica.clusterName = replicaJson.get("cluster_name", "").asString();
    replica.namespace_ = replicaJson.get("namespace", replica.namespace_).asString();
    replica.serverCertDir = replicaJson.get("server_cert_dir", replica.serverCertDir).asString();
    replica.passfileDir = replicaJson.get("passfile_dir", replica.passfileDir).asString();
    replica.restoreCommand = replicaJson.get("restore_command", "").asString();

    telegramConfig = configJson["telegram"];
}

void OperatorConfig::writeLine(const std::string& path, const std::string& entry, bool toStderr) const {
    std::lock_guard<std::mutex> lock(logMutex);
    if (!quiet) {
        (toStderr ? std::cerr : std::cout) << entry << std::endl;
    }
    if (path.empty()) {
        return;
    }

    fs::path logPath(path);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else {
        std::cerr << "Error: Cannot write to log file: " << path << std::endl;
    }
}

void OperatorConfig::logMessage(const std::string& message) const {
    writeLine(logFile, "[" + timestamp() + "] " + message, false);
}

void OperatorConfig::logError(const std::string& message) const {
    writeLine(errorLogFile, "[" + timestamp() + "] ERROR: " + message, true);
}

void OperatorConfig::logDebug(const std::string& message) const {
    if (debug) {
        writeLine(logFile, "[" + timestamp() + "] DEBUG: " + message, false);
    }
}
