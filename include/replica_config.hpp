/**
 * @file replica_config.hpp
 * @brief Writes the replication source configuration of a standby member.
 *
 * A standby either follows the fleet's current primary through the read-write service,
 * or, when the whole cluster is a replica cluster and the member is its designated
 * primary, follows the external source named by the cluster. The configuration lands in
 * override.conf inside the data directory together with standby.signal.
 *
 * @note Only PostgreSQL 12 and later layouts are written (no recovery.conf).
 */

#ifndef REPLICA_CONFIG_HPP
#define REPLICA_CONFIG_HPP

#include <expected>
#include <string>
#include "error.hpp"
#include "object_store.hpp"
#include "operation_context.hpp"
#include "operator_config.hpp"
#include "resources.hpp"

/**
 * @brief Connection to an external server, ready for primary_conninfo.
 */
struct ExternalConnection {
    std::string connectionString; ///< libpq keyword/value string.
    std::string passfile;         ///< pgpass file written for the server; empty when no password is set.
};

/**
 * @brief Resolves how to reach an external cluster.
 */
class ExternalConnectionConfigurer {
public:
    virtual ~ExternalConnectionConfigurer() = default;

    virtual std::expected<ExternalConnection, Error> configureConnection(const OperationContext& ctx,
                                                                         const std::string& namespace_,
                                                                         const ExternalCluster& server) = 0;
};

/**
 * @brief Builds the connection string from the server's parameters and materializes its
 * password Secret as a pgpass file readable by the owner only.
 */
class SecretConnectionConfigurer : public ExternalConnectionConfigurer {
public:
    SecretConnectionConfigurer(SecretStore& secrets, const OperatorConfig& config);

    std::expected<ExternalConnection, Error> configureConnection(const OperationContext& ctx,
                                                                 const std::string& namespace_,
                                                                 const ExternalCluster& server) override;

    /**
     * @brief Joins parameters as sorted key=value pairs, quoting values libpq would split.
     */
    static std::string connectionString(const StringMap& parameters);

private:
    SecretStore& secrets;
    const OperatorConfig& config;
};

/**
 * @brief Keeps one member's standby configuration in line with the cluster topology.
 */
class ReplicaConfigWriter {
public:
    /**
     * @brief Constructs a writer for the member described by @p settings.
     *
     * @param settings Data directory, member name, namespace and TLS/restore settings.
     * @param connections Resolver used when the member is a designated primary.
     * @param config Operator configuration (logging).
     */
    ReplicaConfigWriter(ReplicaSettings settings,
                        ExternalConnectionConfigurer& connections,
                        const OperatorConfig& config);

    /**
     * @brief Brings the on-disk configuration in line with @p cluster.
     *
     * A primary member (no standby.signal) only gets the legacy archive_mode override
     * removed and reports false.
     *
     * @return std::expected<bool, Error> Whether a file changed, i.e. whether a reload is
     *         needed. MissingExternalSource when the replica source is not declared,
     *         IoFailed when the data directory cannot be written.
     */
    std::expected<bool, Error> refresh(const OperationContext& ctx, const Cluster& cluster);

    /**
     * @brief Tells whether the member runs as a primary.
     */
    std::expected<bool, Error> isPrimary() const;

    /**
     * @brief Connection string pointing at the fleet's read-write service.
     */
    std::string primaryConnInfo(const Cluster& cluster) const;

    /**
     * @brief Renders override.conf for the given source and slot.
     */
    std::string renderOverride(const std::string& connInfo, const std::string& slotName) const;

private:
    std::expected<bool, Error> removeArchiveModeOverride() const;
    std::expected<bool, Error> writeReplicaConfiguration(const std::string& connInfo, const std::string& slotName) const;
    std::expected<bool, Error> writeForDesignatedPrimary(const OperationContext& ctx, const Cluster& cluster);

    ReplicaSettings settings;
    ExternalConnectionConfigurer& connections;
    const OperatorConfig& config;
};

#endif // REPLICA_CONFIG_HPP
