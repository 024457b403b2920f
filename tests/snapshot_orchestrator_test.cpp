#include <gtest/gtest.h>
#include "snapshot_orchestrator.hpp"
#include "test_support.hpp"

TEST(ObserveTest, FencesFirst) {
    ObservedState state;
    state.instanceName = "db-1";
    state.volumeCount = 1;
    EXPECT_EQ(SnapshotOrchestrator::observe(state).step, BackupStep::Fencing);
}

TEST(ObserveTest, OtherFencedMembersFailFast) {
    ObservedState state;
    state.instanceName = "db-1";
    state.volumeCount = 1;
    state.fencedInstances = {"db-2"};
    NextAction next = SnapshotOrchestrator::observe(state);
    EXPECT_EQ(next.step, BackupStep::Failed);
    ASSERT_TRUE(next.failure.has_value());
    EXPECT_EQ(next.failure->code, ErrorCode::ConflictingFenceState);

    state.fencedInstances = {"db-1", "db-2"};
    EXPECT_EQ(SnapshotOrchestrator::observe(state).step, BackupStep::Failed);

    state.fencedInstances = {kFenceAllInstances};
    EXPECT_EQ(SnapshotOrchestrator::observe(state).step, BackupStep::Failed);
}

TEST(ObserveTest, WaitsUntilMemberStopsBeingReady) {
    ObservedState state;
    state.instanceName = "db-1";
    state.volumeCount = 2;
    state.fencedInstances = {"db-1"};
    state.podReady = true;
    EXPECT_EQ(SnapshotOrchestrator::observe(state).step, BackupStep::AwaitFenced);

    state.podReady = false;
    EXPECT_EQ(SnapshotOrchestrator::observe(state).step, BackupStep::Snapshotting);

    state.snapshots = {{SnapshotPhase::Ready, ""}, {SnapshotPhase::Pending, ""}};
    EXPECT_EQ(SnapshotOrchestrator::observe(state).step, BackupStep::AwaitSnapshotsReady);
}

TEST(ObserveTest, ReadySnapshotsCompleteWhateverTheFencing) {
    ObservedState state;
    state.instanceName = "db-1";
    state.volumeCount = 2;
    state.snapshots = {{SnapshotPhase::Ready, ""}, {SnapshotPhase::Ready, ""}};
    EXPECT_EQ(SnapshotOrchestrator::observe(state).step, BackupStep::Unfencing);

    state.fencedInstances = {"db-2"};
    EXPECT_EQ(SnapshotOrchestrator::observe(state).step, BackupStep::Unfencing);
}

TEST(ObserveTest, FailedSnapshotFailsBackup) {
    ObservedState state;
    state.instanceName = "db-1";
    state.volumeCount = 2;
    state.fencedInstances = {"db-1"};
    state.podReady = false;
    state.snapshots = {{SnapshotPhase::Ready, ""}, {SnapshotPhase::Failed, "VolumeSnapshot x failed: quota"}};
    NextAction next = SnapshotOrchestrator::observe(state);
    EXPECT_EQ(next.step, BackupStep::Failed);
    ASSERT_TRUE(next.failure.has_value());
    EXPECT_EQ(next.failure->code, ErrorCode::SnapshotFailed);
    EXPECT_EQ(next.failure->message, "VolumeSnapshot x failed: quota");
}

TEST(ObserveTest, NoVolumesCompletesOnceFenced) {
    ObservedState state;
    state.instanceName = "db-1";
    state.fencedInstances = {"db-1"};
    state.podReady = false;
    EXPECT_EQ(SnapshotOrchestrator::observe(state).step, BackupStep::Unfencing);
}

TEST(ObserveTest, MissingSnapshotConfigurationFailsBeforeFencing) {
    ObservedState state;
    state.instanceName = "db-1";
    state.volumeCount = 1;
    state.snapshotsConfigured = false;
    NextAction next = SnapshotOrchestrator::observe(state);
    EXPECT_EQ(next.step, BackupStep::Failed);
    ASSERT_TRUE(next.failure.has_value());
    EXPECT_EQ(next.failure->code, ErrorCode::InvalidConfiguration);
}

TEST(ObserveTest, WithoutFencingSnapshotsReadyMember) {
    ObservedState state;
    state.shouldFence = false;
    state.instanceName = "db-1";
    state.volumeCount = 1;
    state.podReady = true;
    EXPECT_EQ(SnapshotOrchestrator::observe(state).step, BackupStep::Snapshotting);
}

class SnapshotOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        makeQuiet(config);
        store.putCluster(makeCluster("pg"));
        store.putPod(makePod("db-1", "pg", true));
        backup = makeBackup("nightly", "pg");
        pvcs = {makePvc("db-1", "db-1"), makePvc("db-1-wal", "db-1", kPvcRolePgWal)};
    }

    std::expected<ExecuteResult, Error> step(SnapshotOrchestrator& orchestrator) {
        auto cluster = store.getCluster(ctx, "default", "pg");
        EXPECT_TRUE(cluster.has_value());
        auto pod = store.getPod(ctx, "default", "db-1");
        EXPECT_TRUE(pod.has_value());
        return orchestrator.execute(ctx, *cluster, backup, *pod, pvcs);
    }

    void setPodReady(bool ready) { store.putPod(makePod("db-1", "pg", ready)); }

    FencedInstances fenced() {
        auto cluster = store.getCluster(ctx, "default", "pg");
        EXPECT_TRUE(cluster.has_value());
        auto instances = getFencedInstances(cluster->metadata.annotations);
        EXPECT_TRUE(instances.has_value());
        return *instances;
    }

    OperatorConfig config;
    ScriptedStore store;
    StaticProbe probe;
    RecordingEventSink events;
    OperationContext ctx;
    FencingController fencing{store, store, config};
    SnapshotGateway gateway{store, probe, events, config, [] { return std::int64_t{1700000000}; }};
    SnapshotOrchestrator orchestrator{fencing, gateway, events, config, OrchestratorOptions{true, std::chrono::seconds(7)}};

    Backup backup;
    std::vector<PersistentVolumeClaim> pvcs;
};

TEST_F(SnapshotOrchestratorTest, RunsFullSequenceAcrossInvocations) {
    auto result = step(orchestrator);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->step, BackupStep::AwaitFenced);
    EXPECT_EQ(result->requeueAfter, std::chrono::seconds(7));
    EXPECT_EQ(fenced(), (FencedInstances{"db-1"}));
    EXPECT_EQ(events.count("FencePod"), 1u);

    // Still ready: keep waiting, no second fence request.
    result = step(orchestrator);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->step, BackupStep::AwaitFenced);
    EXPECT_EQ(events.count("FencePod"), 1u);

    setPodReady(false);
    result = step(orchestrator);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->step, BackupStep::Snapshotting);
    EXPECT_EQ(store.snapshotCreates, 2);

    result = step(orchestrator);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->step, BackupStep::AwaitSnapshotsReady);
    EXPECT_EQ(store.snapshotCreates, 2);

    reportSnapshots(store, readyStatus());
    result = step(orchestrator);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->isDone());
    EXPECT_EQ(result->snapshots, (std::vector<std::string>{"db-1-1700000000", "db-1-wal-1700000000"}));
    EXPECT_TRUE(fenced().empty());
    EXPECT_EQ(events.count("UnfencePod"), 1u);
}

TEST_F(SnapshotOrchestratorTest, ResumesFromReadySnapshotsWithoutFencing) {
    setPodReady(false);
    ASSERT_TRUE(step(orchestrator).has_value());
    ASSERT_TRUE(step(orchestrator).has_value());
    reportSnapshots(store, readyStatus());
    ASSERT_TRUE(step(orchestrator)->isDone());
    int updates = store.clusterUpdates;

    // A restarted caller runs the same backup again.
    setPodReady(true);
    auto result = step(orchestrator);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->isDone());
    EXPECT_EQ(result->snapshots.size(), 2u);
    EXPECT_EQ(store.snapshotCreates, 2);
    EXPECT_EQ(store.clusterUpdates, updates);
    EXPECT_EQ(events.count("FencePod"), 1u);
}

TEST_F(SnapshotOrchestratorTest, NoVolumesCompletesInOneCall) {
    pvcs.clear();
    setPodReady(false);
    auto result = step(orchestrator);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->isDone());
    EXPECT_TRUE(result->snapshots.empty());
    EXPECT_TRUE(fenced().empty());
    EXPECT_EQ(store.snapshotCreates, 0);
}

TEST_F(SnapshotOrchestratorTest, OtherFencedMemberFailsWithoutWrites) {
    Cluster cluster = makeCluster("pg");
    setFencedInstances(cluster.metadata, {"db-2"});
    store.putCluster(cluster);

    auto result = step(orchestrator);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConflictingFenceState);
    EXPECT_EQ(store.clusterUpdates, 0);
    EXPECT_EQ(store.snapshotCreates, 0);
    EXPECT_EQ(fenced(), (FencedInstances{"db-2"}));
}

TEST_F(SnapshotOrchestratorTest, FailedSnapshotUnfencesMember) {
    setPodReady(false);
    ASSERT_TRUE(step(orchestrator).has_value());
    EXPECT_EQ(fenced(), (FencedInstances{"db-1"}));

    reportSnapshots(store, errorStatus("quota exceeded"));
    auto result = step(orchestrator);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SnapshotFailed);
    EXPECT_NE(result.error().message.find("quota exceeded"), std::string::npos);
    EXPECT_TRUE(fenced().empty());
    EXPECT_EQ(events.count("UnfencePod"), 1u);
}

TEST_F(SnapshotOrchestratorTest, UnfenceEventOnlyWhenAnnotationChanges) {
    auto cluster = store.getCluster(ctx, "default", "pg");
    ASSERT_TRUE(cluster.has_value());
    ASSERT_TRUE(orchestrator.ensureUnfenced(ctx, *cluster, backup, "db-1").has_value());
    EXPECT_EQ(events.count("UnfencePod"), 0u);
    EXPECT_EQ(store.clusterUpdates, 0);

    Cluster other = makeCluster("pg");
    setFencedInstances(other.metadata, {"db-2"});
    store.putCluster(other);
    ASSERT_TRUE(orchestrator.ensureUnfenced(ctx, other, backup, "db-1").has_value());
    EXPECT_EQ(events.count("UnfencePod"), 0u);
    EXPECT_EQ(fenced(), (FencedInstances{"db-2"}));
}

TEST_F(SnapshotOrchestratorTest, FailureAfterManualUnfenceRecordsNoUnfenceEvent) {
    setPodReady(false);
    ASSERT_TRUE(step(orchestrator).has_value());
    ASSERT_TRUE(step(orchestrator).has_value());
    auto removed = fencing.requestUnfence(ctx, "default", "pg", "db-1");
    ASSERT_TRUE(removed.has_value());
    EXPECT_TRUE(*removed);

    reportSnapshots(store, errorStatus("quota exceeded"));
    auto result = step(orchestrator);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SnapshotFailed);
    EXPECT_EQ(events.count("UnfencePod"), 0u);
}

TEST_F(SnapshotOrchestratorTest, MemberAlreadyFencedAloneIsTreatedAsOwnFence) {
    Cluster cluster = makeCluster("pg");
    setFencedInstances(cluster.metadata, {"db-1"});
    store.putCluster(cluster);
    setPodReady(false);

    auto result = step(orchestrator);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->step, BackupStep::Snapshotting);
    EXPECT_EQ(events.count("FencePod"), 0u);

    reportSnapshots(store, readyStatus());
    ASSERT_TRUE(step(orchestrator)->isDone());
    EXPECT_TRUE(fenced().empty());
}

TEST_F(SnapshotOrchestratorTest, WithoutFencingNeverTouchesAnnotation) {
    SnapshotOrchestrator unfenced{fencing, gateway, events, config, OrchestratorOptions{false, std::chrono::seconds(1)}};
    auto result = step(unfenced);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->step, BackupStep::Snapshotting);

    reportSnapshots(store, readyStatus());
    result = step(unfenced);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->isDone());
    EXPECT_EQ(store.clusterUpdates, 0);
    EXPECT_EQ(events.count("FencePod"), 0u);
    EXPECT_EQ(events.count("UnfencePod"), 0u);
}

TEST_F(SnapshotOrchestratorTest, CancelledContextDoesNothing) {
    OperationContext cancelled;
    cancelled.cancel();
    auto cluster = store.getCluster(ctx, "default", "pg");
    auto pod = store.getPod(ctx, "default", "db-1");
    ASSERT_TRUE(cluster.has_value());
    ASSERT_TRUE(pod.has_value());

    auto result = orchestrator.execute(cancelled, *cluster, backup, *pod, pvcs);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_TRUE(fenced().empty());
}

