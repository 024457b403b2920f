/**
 * @file instance_probe.hpp
 * @brief Queries a running member for diagnostic data.
 *
 * The only query needed today is the pg_controldata dump stamped on snapshots. Callers
 * treat it as best effort: a failure is logged and the snapshot is taken anyway.
 */

#ifndef INSTANCE_PROBE_HPP
#define INSTANCE_PROBE_HPP

#include <expected>
#include <string>
#include "error.hpp"
#include "operation_context.hpp"
#include "operator_config.hpp"
#include "resources.hpp"

/**
 * @brief Interface for member probes.
 */
class InstanceProbe {
public:
    virtual ~InstanceProbe() = default;

    /**
     * @brief Fetches the textual pg_controldata output of a member.
     *
     * @return std::expected<std::string, Error> The dump or the reason it could not be taken.
     */
    virtual std::expected<std::string, Error> getControlData(const OperationContext& ctx, const Pod& pod) = 0;
};

/**
 * @brief Probe running a configured shell command and capturing its output.
 *
 * The command template comes from OperatorConfig::controlDataCommand, e.g.
 * "kubectl exec -n {namespace} {pod} -- pg_controldata". Placeholders are replaced
 * by single-quoted values. The command runs under /bin/sh in its own process group;
 * when the context is cancelled or its deadline passes, the group is killed and the
 * context's error is returned.
 */
class CommandControlDataProbe : public InstanceProbe {
public:
    explicit CommandControlDataProbe(const OperatorConfig& config);

    std::expected<std::string, Error> getControlData(const OperationContext& ctx, const Pod& pod) override;

    /**
     * @brief Expands the command template for a pod.
     */
    std::string buildCommand(const Pod& pod) const;

private:
    const OperatorConfig& config;
};

#endif // INSTANCE_PROBE_HPP
