#include "replica_config.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char* const kAutoConfFile = "postgresql.auto.conf";
const char* const kOverrideConfFile = "override.conf";
const char* const kStandbySignalFile = "standby.signal";

std::expected<std::string, Error> readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return makeError(ErrorCode::IoFailed, "cannot open " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

std::expected<void, Error> writeFile(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return makeError(ErrorCode::IoFailed, "cannot write " + path.string());
    }
    file << content;
    file.close();
    if (!file) {
        return makeError(ErrorCode::IoFailed, "error while writing " + path.string());
    }
    return {};
}

// Writes only when the content differs; returns whether the file changed.
std::expected<bool, Error> writeFileIfChanged(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        auto current = readFile(path);
        if (!current) {
            return std::unexpected(current.error());
        }
        if (*current == content) {
            return false;
        }
    } else if (ec) {
        return makeError(ErrorCode::IoFailed, "cannot stat " + path.string() + ": " + ec.message());
    }
    if (auto ok = writeFile(path, content); !ok) {
        return std::unexpected(ok.error());
    }
    return true;
}

std::string quoteConfValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

std::string quoteConnValue(const std::string& value) {
    bool needsQuotes = value.empty();
    for (char c : value) {
        if (c == ' ' || c == '\'' || c == '\\') {
            needsQuotes = true;
        }
    }
    if (!needsQuotes) {
        return value;
    }
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "'";
}

std::string escapePgpass(const std::string& value) {
    std::string escaped;
    for (char c : value) {
        if (c == ':' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string pgpassField(const StringMap& parameters, const std::string& key) {
    auto it = parameters.find(key);
    if (it == parameters.end() || it->second.empty()) {
        return "*";
    }
    return escapePgpass(it->second);
}

} // namespace

SecretConnectionConfigurer::SecretConnectionConfigurer(SecretStore& secrets, const OperatorConfig& config)
    : secrets(secrets), config(config) {}

std::string SecretConnectionConfigurer::connectionString(const StringMap& parameters) {
    std::string result;
    for (const auto& [key, value] : parameters) {
        if (!result.empty()) {
            result += ' ';
        }
        result += key + "=" + quoteConnValue(value);
    }
    return result;
}

std::expected<ExternalConnection, Error> SecretConnectionConfigurer::configureConnection(
    const OperationContext& ctx,
    const std::string& namespace_,
    const ExternalCluster& server) {
    ExternalConnection connection;
    connection.connectionString = connectionString(server.connectionParameters);
    if (!server.password) {
        return connection;
    }

    auto secret = secrets.getSecret(ctx, namespace_, server.password->name);
    if (!secret) {
        return makeError(secret.error().code, "while reading password of external cluster " + server.name + ": " +
                                                  secret.error().message);
    }
    auto value = secret->data.find(server.password->key);
    if (value == secret->data.end()) {
        return makeError(ErrorCode::InvalidConfiguration,
                         "secret " + server.password->name + " has no key " + server.password->key);
    }

    fs::path directory = fs::path(config.replica.passfileDir) / server.name;
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return makeError(ErrorCode::IoFailed, "cannot create " + directory.string() + ": " + ec.message());
    }

    std::string line = pgpassField(server.connectionParameters, "host") + ":" +
                       pgpassField(server.connectionParameters, "port") + ":" +
                       pgpassField(server.connectionParameters, "dbname") + ":" +
                       pgpassField(server.connectionParameters, "user") + ":" + escapePgpass(value->second) + "\n";
    fs::path passfile = directory / "pgpass";
    if (auto ok = writeFile(passfile, line); !ok) {
        return std::unexpected(ok.error());
    }
    // libpq ignores password files readable by anyone but the owner.
    fs::permissions(passfile, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
        return makeError(ErrorCode::IoFailed, "cannot restrict " + passfile.string() + ": " + ec.message());
    }

    config.logDebug("Wrote pgpass file for external cluster " + server.name);
    connection.passfile = passfile.string();
    return connection;
}

ReplicaConfigWriter::ReplicaConfigWriter(ReplicaSettings settings,
                                         ExternalConnectionConfigurer& connections,
                                         const OperatorConfig& config)
    : settings(std::move(settings)), connections(connections), config(config) {}

std::expected<bool, Error> ReplicaConfigWriter::isPrimary() const {
    std::error_code ec;
    bool standby = fs::exists(fs::path(settings.pgData) / kStandbySignalFile, ec);
    if (ec) {
        return makeError(ErrorCode::IoFailed, "cannot check standby.signal: " + ec.message());
    }
    return !standby;
}

std::string ReplicaConfigWriter::primaryConnInfo(const Cluster& cluster) const {
    fs::path certs(settings.serverCertDir);
    return "host=" + cluster.readWriteServiceName() +
           " user=streaming_replica port=5432"
           " sslkey=" + (certs / "streaming_replica.key").string() +
           " sslcert=" + (certs / "streaming_replica.crt").string() +
           " sslrootcert=" + (certs / "ca.crt").string() +
           " application_name=" + settings.podName +
           " sslmode=verify-ca dbname=postgres connect_timeout=5";
}

std::string ReplicaConfigWriter::renderOverride(const std::string& connInfo, const std::string& slotName) const {
    std::string content;
    content += "primary_conninfo = " + quoteConfValue(connInfo) + "\n";
    content += "recovery_target_timeline = 'latest'\n";
    if (!slotName.empty()) {
        content += "primary_slot_name = " + quoteConfValue(slotName) + "\n";
    }
    if (!settings.restoreCommand.empty()) {
        content += "restore_command = " + quoteConfValue(settings.restoreCommand) + "\n";
    }
    return content;
}

std::expected<bool, Error> ReplicaConfigWriter::removeArchiveModeOverride() const {
    fs::path autoConf = fs::path(settings.pgData) / kAutoConfFile;
    std::error_code ec;
    if (!fs::exists(autoConf, ec)) {
        if (ec) {
            return makeError(ErrorCode::IoFailed, "cannot stat " + autoConf.string() + ": " + ec.message());
        }
        return false;
    }

    auto content = readFile(autoConf);
    if (!content) {
        return std::unexpected(content.error());
    }

    std::istringstream lines(*content);
    std::string kept;
    std::string line;
    bool removed = false;
    while (std::getline(lines, line)) {
        auto start = line.find_first_not_of(" \t");
        if (start != std::string::npos && line.compare(start, 12, "archive_mode") == 0) {
            removed = true;
            continue;
        }
        kept += line + "\n";
    }
    if (!removed) {
        return false;
    }
    if (auto ok = writeFile(autoConf, kept); !ok) {
        return std::unexpected(ok.error());
    }
    config.logMessage("Removed archive_mode override from " + autoConf.string());
    return true;
}

std::expected<bool, Error> ReplicaConfigWriter::writeReplicaConfiguration(const std::string& connInfo,
                                                                          const std::string& slotName) const {
    fs::path pgData(settings.pgData);
    auto changed = writeFileIfChanged(pgData / kOverrideConfFile, renderOverride(connInfo, slotName));
    if (!changed) {
        return changed;
    }

    fs::path signal = pgData / kStandbySignalFile;
    std::error_code ec;
    bool present = fs::exists(signal, ec);
    if (ec) {
        return makeError(ErrorCode::IoFailed, "cannot stat " + signal.string() + ": " + ec.message());
    }
    if (!present) {
        if (auto ok = writeFile(signal, ""); !ok) {
            return std::unexpected(ok.error());
        }
        return true;
    }
    return *changed;
}

std::expected<bool, Error> ReplicaConfigWriter::writeForDesignatedPrimary(const OperationContext& ctx,
                                                                          const Cluster& cluster) {
    auto server = cluster.externalCluster(cluster.spec.replica->source);
    if (!server) {
        return makeError(ErrorCode::MissingExternalSource,
                         "missing external cluster " + cluster.spec.replica->source);
    }

    auto connection = connections.configureConnection(ctx, settings.namespace_, *server);
    if (!connection) {
        return std::unexpected(connection.error());
    }
    std::string connInfo = connection->connectionString;
    if (!connection->passfile.empty()) {
        connInfo += " passfile=" + connection->passfile;
    }
    return writeReplicaConfiguration(connInfo, cluster.slotNameForInstance(settings.podName));
}

std::expected<bool, Error> ReplicaConfigWriter::refresh(const OperationContext& ctx, const Cluster& cluster) {
    if (auto ok = ctx.check(); !ok) {
        return std::unexpected(ok.error());
    }

    auto purged = removeArchiveModeOverride();
    if (!purged) {
        return purged;
    }

    auto primary = isPrimary();
    if (!primary) {
        return primary;
    }
    if (*primary) {
        return false;
    }

    std::expected<bool, Error> written;
    if (cluster.isReplica() && cluster.status.targetPrimary == settings.podName) {
        config.logDebug("Pod " + settings.podName + " is the designated primary, following " +
                        cluster.spec.replica->source);
        written = writeForDesignatedPrimary(ctx, cluster);
    } else {
        written = writeReplicaConfiguration(primaryConnInfo(cluster), cluster.slotNameForInstance(settings.podName));
    }
    if (!written) {
        return written;
    }
    return *purged || *written;
}
