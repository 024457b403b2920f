#include "fencing.hpp"
#include "manifest.hpp"

std::expected<FencedInstances, Error> getFencedInstances(const StringMap& annotations) {
    FencedInstances instances;
    auto it = annotations.find(kFencedInstancesAnnotation);
    if (it == annotations.end() || it->second.empty()) {
        return instances;
    }

    auto document = parseJsonDocument(it->second);
    if (!document) {
        return makeError(ErrorCode::ParseError, "could not decode fenced instances: " + document.error().message);
    }
    if (!document->isArray()) {
        return makeError(ErrorCode::ParseError, "fenced instances annotation must be a JSON list");
    }
    for (const auto& item : *document) {
        if (!item.isString()) {
            return makeError(ErrorCode::ParseError, "fenced instances annotation must only contain strings");
        }
        instances.insert(item.asString());
    }
    return instances;
}

void setFencedInstances(ObjectMeta& meta, const FencedInstances& instances) {
    if (instances.empty()) {
        meta.annotations.erase(kFencedInstancesAnnotation);
        return;
    }
    Json::Value list(Json::arrayValue);
    for (const auto& name : instances) {
        list.append(name);
    }
    meta.annotations[kFencedInstancesAnnotation] = toCompactString(list);
}

std::expected<void, Error> addFencedInstance(const std::string& instanceName, FencedInstances& instances) {
    if (instances.contains(kFenceAllInstances)) {
        return makeError(ErrorCode::AlreadyFenced, "all instances are already fenced");
    }
    if (instances.contains(instanceName)) {
        return makeError(ErrorCode::AlreadyFenced, "instance " + instanceName + " is already fenced");
    }
    if (instanceName == kFenceAllInstances) {
        instances.clear();
    }
    instances.insert(instanceName);
    return {};
}

std::expected<void, Error> removeFencedInstance(const std::string& instanceName, FencedInstances& instances) {
    if (instances.empty()) {
        return makeError(ErrorCode::AlreadyUnfenced, "no instance is fenced");
    }
    if (instanceName == kFenceAllInstances) {
        instances.clear();
        return {};
    }
    if (instances.contains(kFenceAllInstances)) {
        return makeError(ErrorCode::ConflictingFenceState,
                         "cannot unfence instance " + instanceName + " while all instances are fenced");
    }
    if (!instances.contains(instanceName)) {
        return makeError(ErrorCode::AlreadyUnfenced, "instance " + instanceName + " is not fenced");
    }
    instances.erase(instanceName);
    return {};
}

FencingController::FencingController(ClusterStore& clusters, PodStore& pods, const OperatorConfig& config)
    : clusters(clusters), pods(pods), config(config) {}

FencingController::UpdateOutcome FencingController::attemptUpdate(const OperationContext& ctx,
                                                                  const std::string& namespace_,
                                                                  const std::string& clusterName,
                                                                  const FenceFunc& fn,
                                                                  Error& error) {
    auto cluster = clusters.getCluster(ctx, namespace_, clusterName);
    if (!cluster) {
        error = cluster.error();
        return UpdateOutcome::Fatal;
    }

    auto instances = getFencedInstances(cluster->metadata.annotations);
    if (!instances) {
        error = instances.error();
        return UpdateOutcome::Fatal;
    }
    if (auto applied = fn(*instances); !applied) {
        error = applied.error();
        return UpdateOutcome::Fatal;
    }

    setFencedInstances(cluster->metadata, *instances);
    auto updated = clusters.updateCluster(ctx, *cluster);
    if (!updated) {
        error = updated.error();
        return updated.error().code == ErrorCode::Conflict ? UpdateOutcome::ConflictRetry : UpdateOutcome::Fatal;
    }
    return UpdateOutcome::Updated;
}

std::expected<void, Error> FencingController::applyFenceFunc(const OperationContext& ctx,
                                                             const std::string& namespace_,
                                                             const std::string& clusterName,
                                                             const FenceFunc& fn) {
    Error error;
    for (int attempt = 1; attempt <= config.maxFenceConflictRetries; ++attempt) {
        switch (attemptUpdate(ctx, namespace_, clusterName, fn, error)) {
        case UpdateOutcome::Updated:
            return {};
        case UpdateOutcome::Fatal:
            return std::unexpected(error);
        case UpdateOutcome::ConflictRetry:
            config.logDebug("Conflict while updating fenced instances of cluster " + clusterName +
                            ", attempt " + std::to_string(attempt));
            break;
        }
    }
    return std::unexpected(error);
}

std::expected<void, Error> FencingController::requestFence(const OperationContext& ctx,
                                                           const std::string& namespace_,
                                                           const std::string& clusterName,
                                                           const std::string& instanceName) {
    return applyFenceFunc(ctx, namespace_, clusterName, [&](FencedInstances& instances) -> std::expected<void, Error> {
        if (instances.size() == 1 && instances.contains(instanceName)) {
            return makeError(ErrorCode::AlreadyFenced, "instance " + instanceName + " is already fenced");
        }
        if (!instances.empty()) {
            return makeError(ErrorCode::ConflictingFenceState,
                             "cannot fence instance " + instanceName + " on cluster " + clusterName +
                                 ": other instances are already fenced");
        }
        return addFencedInstance(instanceName, instances);
    });
}

std::expected<bool, Error> FencingController::requestUnfence(const OperationContext& ctx,
                                                             const std::string& namespace_,
                                                             const std::string& clusterName,
                                                             const std::string& instanceName) {
    auto result = applyFenceFunc(ctx, namespace_, clusterName, [&](FencedInstances& instances) {
        return removeFencedInstance(instanceName, instances);
    });
    if (!result) {
        if (result.error().code == ErrorCode::AlreadyUnfenced) {
            return false;
        }
        return std::unexpected(result.error());
    }
    return true;
}

std::expected<bool, Error> FencingController::isFenceEffective(const OperationContext& ctx,
                                                               const std::string& namespace_,
                                                               const std::string& podName) {
    auto pod = pods.getPod(ctx, namespace_, podName);
    if (!pod) {
        return std::unexpected(pod.error());
    }
    return !isPodReady(*pod);
}
