/**
 * @file fencing.hpp
 * @brief Fencing: suspending write access to cluster members.
 *
 * The set of fenced members lives in the kFencedInstancesAnnotation annotation of the
 * Cluster, encoded as a JSON list of member names. The wildcard "*" fences every
 * member. The controller mutates the annotation with compare-and-swap updates, so a
 * concurrent edit of the Cluster only costs a re-read.
 */

#ifndef FENCING_HPP
#define FENCING_HPP

#include <expected>
#include <functional>
#include <set>
#include <string>
#include "error.hpp"
#include "object_store.hpp"
#include "operation_context.hpp"
#include "operator_config.hpp"
#include "resources.hpp"

using FencedInstances = std::set<std::string>;

/**
 * @brief Decodes the fenced members from a Cluster's annotations.
 *
 * @return std::expected<FencedInstances, Error> The set (empty when the annotation is absent),
 *         or ParseError when the annotation is not a JSON list of strings.
 */
std::expected<FencedInstances, Error> getFencedInstances(const StringMap& annotations);

/**
 * @brief Encodes the fenced members into the annotations; an empty set removes the annotation.
 */
void setFencedInstances(ObjectMeta& meta, const FencedInstances& instances);

/**
 * @brief Adds a member to the fenced set.
 *
 * Fencing the wildcard replaces the whole set.
 *
 * @return std::expected<void, Error> Success, or AlreadyFenced when the member or the wildcard is present.
 */
std::expected<void, Error> addFencedInstance(const std::string& instanceName, FencedInstances& instances);

/**
 * @brief Removes a member from the fenced set.
 *
 * Removing the wildcard clears the whole set.
 *
 * @return std::expected<void, Error> Success, AlreadyUnfenced when the member is not fenced,
 *         or ConflictingFenceState when a single member is removed while all are fenced.
 */
std::expected<void, Error> removeFencedInstance(const std::string& instanceName, FencedInstances& instances);

/**
 * @brief Requests and releases fencing on the Cluster object.
 */
class FencingController {
public:
    /// Mutation applied to the freshly read set on every compare-and-swap attempt.
    using FenceFunc = std::function<std::expected<void, Error>(FencedInstances&)>;

    /**
     * @brief Outcome of a single compare-and-swap attempt.
     */
    enum class UpdateOutcome {
        Updated,       ///< The annotation was written.
        ConflictRetry, ///< Someone else wrote the Cluster first; read again.
        Fatal,         ///< Anything else; stop and report.
    };

    /**
     * @brief Constructs a fencing controller.
     *
     * @param clusters Store holding the Cluster objects.
     * @param pods Store used by the readiness check.
     * @param config Operator configuration (conflict retry bound, logging).
     */
    FencingController(ClusterStore& clusters, PodStore& pods, const OperatorConfig& config);

    /**
     * @brief Fences @p instanceName, exclusively.
     *
     * @return std::expected<void, Error> Success; AlreadyFenced when the member already is the
     *         only fenced one; ConflictingFenceState when any other member is fenced.
     */
    std::expected<void, Error> requestFence(const OperationContext& ctx,
                                            const std::string& namespace_,
                                            const std::string& clusterName,
                                            const std::string& instanceName);

    /**
     * @brief Unfences @p instanceName. A member that is not fenced is left alone and the call succeeds.
     *
     * @return std::expected<bool, Error> Whether the annotation was rewritten.
     */
    std::expected<bool, Error> requestUnfence(const OperationContext& ctx,
                                              const std::string& namespace_,
                                              const std::string& clusterName,
                                              const std::string& instanceName);

    /**
     * @brief Tells whether fencing took effect, i.e. the member's pod stopped being ready.
     */
    std::expected<bool, Error> isFenceEffective(const OperationContext& ctx,
                                                const std::string& namespace_,
                                                const std::string& podName);

    /**
     * @brief Applies @p fn to the fenced set with a bounded compare-and-swap retry loop.
     *
     * An error returned by @p fn aborts the loop without writing and is propagated. A
     * Conflict from the store restarts from a fresh read; after
     * OperatorConfig::maxFenceConflictRetries attempts the Conflict is returned.
     */
    std::expected<void, Error> applyFenceFunc(const OperationContext& ctx,
                                              const std::string& namespace_,
                                              const std::string& clusterName,
                                              const FenceFunc& fn);

private:
    UpdateOutcome attemptUpdate(const OperationContext& ctx,
                                const std::string& namespace_,
                                const std::string& clusterName,
                                const FenceFunc& fn,
                                Error& error);

    ClusterStore& clusters;
    PodStore& pods;
    const OperatorConfig& config;
};

#endif // FENCING_HPP
