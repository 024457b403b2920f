#include "fleet_operator.hpp"
#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {

volatile std::sig_atomic_t gShutdownFlag = 0;

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

OrchestratorOptions orchestratorOptions(const OperatorConfig& config) {
    OrchestratorOptions options;
    options.shouldFence = config.fenceBeforeSnapshot;
    options.requeueDelay = config.requeueDelay;
    return options;
}

} // namespace

FleetOperator::FleetOperator(const std::string& configFile, const std::string& stateFileOverride)
    : config(configFile),
      stateFile(stateFileOverride.empty() ? config.stateFile : stateFileOverride),
      probe(config),
      fencing(store, store, config),
      gateway(store, probe, events, config),
      orchestrator(fencing, gateway, events, config, orchestratorOptions(config)),
      runner(store, store, store, store, orchestrator, events, config),
      connections(store, config) {
    events.add(std::make_unique<LogEventSink>(config));
    if (config.telegramConfig.isObject()) {
        events.add(std::make_unique<TelegramEventSink>(config.telegramConfig));
    }
}

OperationContext FleetOperator::callContext() const {
    return rootContext.withTimeout(config.callTimeout);
}

std::expected<void, Error> FleetOperator::loadState() {
    store.clear();
    auto loaded = loadStateFile(stateFile, store);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    baseline = std::move(*loaded);
    return {};
}

std::expected<void, Error> FleetOperator::saveState() {
    return saveStateFile(stateFile, store, baseline);
}

std::expected<ExecuteResult, Error> FleetOperator::reconcileBackup(const std::string& namespace_,
                                                                   const std::string& name) {
    if (auto ok = loadState(); !ok) {
        return std::unexpected(ok.error());
    }

    auto result = runner.reconcile(callContext(), namespace_, name);

    // A failed reconciliation may still have recorded the failure on the Backup.
    auto saved = saveState();
    if (!saved) {
        if (result) {
            return std::unexpected(saved.error());
        }
        config.logError("while saving state after a failed reconciliation: " + describe(saved.error()));
    }
    return result;
}

std::expected<std::size_t, Error> FleetOperator::reconcileAll() {
    if (auto ok = loadState(); !ok) {
        return std::unexpected(ok.error());
    }

    auto backups = store.listBackups(callContext());
    if (!backups) {
        return std::unexpected(backups.error());
    }

    std::size_t inProgress = 0;
    nextRequeue = std::chrono::seconds(0);
    auto noteRequeue = [this](std::chrono::seconds delay) {
        if (nextRequeue.count() == 0 || delay < nextRequeue) {
            nextRequeue = delay;
        }
    };
    for (const auto& backup : *backups) {
        if (backup.isDone()) {
            continue;
        }
        auto result = runner.reconcile(callContext(), backup.metadata.namespace_, backup.metadata.name);
        if (!result) {
            config.logError("[backup " + backup.metadata.namespace_ + "/" + backup.metadata.name + "] " +
                            describe(result.error()));
            if (isRetryable(result.error().code)) {
                ++inProgress;
                noteRequeue(config.requeueDelay);
            }
        } else if (result->requeueAfter.count() > 0) {
            ++inProgress;
            noteRequeue(result->requeueAfter);
        }
    }

    if (auto ok = saveState(); !ok) {
        return std::unexpected(ok.error());
    }
    return inProgress;
}

std::expected<bool, Error> FleetOperator::refreshReplica(const std::string& namespace_, const std::string& clusterName) {
    ReplicaSettings settings = config.replica;
    if (settings.podName.empty()) {
        return makeError(ErrorCode::InvalidConfiguration, "replica.pod_name is not configured");
    }
    if (!namespace_.empty()) {
        settings.namespace_ = namespace_;
    }

    if (auto ok = loadState(); !ok) {
        return std::unexpected(ok.error());
    }
    OperationContext ctx = callContext();
    auto cluster = store.getCluster(ctx, settings.namespace_, clusterName);
    if (!cluster) {
        return std::unexpected(cluster.error());
    }

    ReplicaConfigWriter writer(settings, connections, config);
    auto changed = writer.refresh(ctx, *cluster);
    if (changed) {
        config.logMessage("Replica configuration of " + settings.podName +
                          (*changed ? " changed, a reload is required" : " is up to date"));
    }
    return changed;
}

void FleetOperator::runDaemon() {
#ifdef _WIN32
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
#else
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif

    std::cout << "Daemon mode started, polling " << stateFile << std::endl;

    while (!gShutdownFlag) {
        std::chrono::seconds wait = config.daemonInterval;
        auto inProgress = reconcileAll();
        if (!inProgress) {
            config.logError("Daemon cycle failed: " + describe(inProgress.error()));
        } else if (*inProgress > 0) {
            config.logDebug(std::to_string(*inProgress) + " backups in progress");
            wait = std::min(wait, std::max(nextRequeue, std::chrono::seconds(1)));
        }

        auto remaining = wait.count();
        while (remaining > 0 && !gShutdownFlag) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            --remaining;
        }
    }
    rootContext.cancel();
    config.logMessage("Daemon shutting down gracefully");
}
