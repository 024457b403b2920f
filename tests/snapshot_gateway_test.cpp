#include <gtest/gtest.h>
#include "manifest.hpp"
#include "snapshot_gateway.hpp"
#include "test_support.hpp"

class SnapshotGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        makeQuiet(config);
        cluster = makeCluster("pg");
        backup = makeBackup("nightly", "pg");
        pod = makePod("db-1", "pg", false);
    }

    OperatorConfig config;
    ScriptedStore store;
    StaticProbe probe;
    RecordingEventSink events;
    OperationContext ctx;
    SnapshotGateway gateway{store, probe, events, config, [] { return std::int64_t{1700000000}; }};

    Cluster cluster;
    Backup backup;
    Pod pod;
};

TEST_F(SnapshotGatewayTest, NamesSnapshotsAfterVolumeAndSharedSuffix) {
    std::vector<PersistentVolumeClaim> pvcs{makePvc("db-1", "db-1"), makePvc("db-1-wal", "db-1", kPvcRolePgWal)};
    auto created = gateway.createSnapshotSet(ctx, cluster, backup, pod, pvcs);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(*created, (std::vector<std::string>{"db-1-1700000000", "db-1-wal-1700000000"}));
    EXPECT_EQ(events.count("CreateSnapshot"), 2u);

    auto listed = gateway.listSnapshotsForBackup(ctx, cluster, backup);
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed->size(), 2u);
}

TEST_F(SnapshotGatewayTest, SnapshotTemplateWinsOverVolumeMetadata) {
    cluster.spec.volumeSnapshot->labels = {{"tier", "gold"}};
    cluster.spec.volumeSnapshot->annotations = {{"team", "dba"}};
    PersistentVolumeClaim pvc = makePvc("db-1", "db-1");
    pvc.metadata.labels["tier"] = "bronze";
    pvc.metadata.labels["zone"] = "a";
    pvc.metadata.annotations["team"] = "storage";

    VolumeSnapshot snapshot = gateway.buildSnapshot(ctx, cluster, backup, pod, pvc, "42");
    EXPECT_EQ(snapshot.metadata.name, "db-1-42");
    EXPECT_EQ(snapshot.sourcePvcName, "db-1");
    EXPECT_EQ(snapshot.metadata.labels.at("tier"), "gold");
    EXPECT_EQ(snapshot.metadata.labels.at("zone"), "a");
    EXPECT_EQ(snapshot.metadata.labels.at(kBackupNameLabel), "nightly");
    EXPECT_EQ(snapshot.metadata.annotations.at("team"), "dba");
}

TEST_F(SnapshotGatewayTest, WalVolumesUseWalClassWhenSet) {
    cluster.spec.volumeSnapshot->className = "fast";
    PersistentVolumeClaim wal = makePvc("db-1-wal", "db-1", kPvcRolePgWal);

    VolumeSnapshot snapshot = gateway.buildSnapshot(ctx, cluster, backup, pod, wal, "1");
    ASSERT_TRUE(snapshot.className.has_value());
    EXPECT_EQ(*snapshot.className, "fast");

    cluster.spec.volumeSnapshot->walClassName = "wal-class";
    snapshot = gateway.buildSnapshot(ctx, cluster, backup, pod, wal, "1");
    EXPECT_EQ(*snapshot.className, "wal-class");

    snapshot = gateway.buildSnapshot(ctx, cluster, backup, pod, makePvc("db-1", "db-1"), "1");
    EXPECT_EQ(*snapshot.className, "fast");
}

TEST_F(SnapshotGatewayTest, NoClassLeavesProviderDefault) {
    VolumeSnapshot snapshot = gateway.buildSnapshot(ctx, cluster, backup, pod, makePvc("db-1", "db-1"), "1");
    EXPECT_FALSE(snapshot.className.has_value());
}

TEST_F(SnapshotGatewayTest, OwnerReferenceFollowsPolicy) {
    cluster.spec.inheritedMetadata.labels = {{"app", "billing"}};

    VolumeSnapshot none = gateway.buildSnapshot(ctx, cluster, backup, pod, makePvc("db-1", "db-1"), "1");
    EXPECT_TRUE(none.metadata.ownerReferences.empty());
    EXPECT_FALSE(none.metadata.labels.contains("app"));

    cluster.spec.volumeSnapshot->ownerReference = SnapshotOwnerReference::Cluster;
    VolumeSnapshot owned = gateway.buildSnapshot(ctx, cluster, backup, pod, makePvc("db-1", "db-1"), "1");
    ASSERT_EQ(owned.metadata.ownerReferences.size(), 1u);
    EXPECT_EQ(owned.metadata.ownerReferences[0].kind, "Cluster");
    EXPECT_EQ(owned.metadata.ownerReferences[0].uid, "pg-uid");
    EXPECT_EQ(owned.metadata.labels.at("app"), "billing");

    cluster.spec.volumeSnapshot->ownerReference = SnapshotOwnerReference::Backup;
    VolumeSnapshot byBackup = gateway.buildSnapshot(ctx, cluster, backup, pod, makePvc("db-1", "db-1"), "1");
    ASSERT_EQ(byBackup.metadata.ownerReferences.size(), 1u);
    EXPECT_EQ(byBackup.metadata.ownerReferences[0].kind, "Backup");
    EXPECT_EQ(byBackup.metadata.ownerReferences[0].name, "nightly");
}

TEST_F(SnapshotGatewayTest, StampsClusterManifestAndControlData) {
    VolumeSnapshot snapshot = gateway.buildSnapshot(ctx, cluster, backup, pod, makePvc("db-1", "db-1"), "1");
    EXPECT_EQ(snapshot.metadata.annotations.at(kPgControldataAnnotation), probe.output);

    auto manifest = parseJsonDocument(snapshot.metadata.annotations.at(kClusterManifestAnnotation));
    ASSERT_TRUE(manifest.has_value());
    auto decoded = clusterFromJson(*manifest);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->metadata.name, "pg");
    EXPECT_EQ(decoded->status.currentPrimary, "db-1");
}

TEST_F(SnapshotGatewayTest, ControlDataFailureDoesNotBlockSnapshot) {
    probe.fail = true;
    auto created = gateway.createSnapshotSet(ctx, cluster, backup, pod, {makePvc("db-1", "db-1")});
    ASSERT_TRUE(created.has_value());
    ASSERT_EQ(store.snapshots().size(), 1u);
    EXPECT_FALSE(store.snapshots()[0].metadata.annotations.contains(kPgControldataAnnotation));
}

TEST_F(SnapshotGatewayTest, MissingSnapshotConfigurationIsRejected) {
    cluster.spec.volumeSnapshot.reset();
    auto created = gateway.createSnapshotSet(ctx, cluster, backup, pod, {makePvc("db-1", "db-1")});
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, ErrorCode::InvalidConfiguration);
    EXPECT_EQ(store.snapshotCreates, 0);
}

TEST_F(SnapshotGatewayTest, CreateErrorNamesTheSnapshot) {
    ASSERT_TRUE(gateway.createSnapshotSet(ctx, cluster, backup, pod, {makePvc("db-1", "db-1")}).has_value());
    auto again = gateway.createSnapshotSet(ctx, cluster, backup, pod, {makePvc("db-1", "db-1")});
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::AlreadyExists);
    EXPECT_NE(again.error().message.find("db-1-1700000000"), std::string::npos);
}

TEST(SnapshotClassifyTest, MissingStatusIsPending) {
    VolumeSnapshot snapshot;
    EXPECT_EQ(SnapshotGateway::classifyState(snapshot).phase, SnapshotPhase::Pending);

    snapshot.status = Json::Value(Json::objectValue);
    snapshot.status["readyToUse"] = false;
    EXPECT_EQ(SnapshotGateway::classifyState(snapshot).phase, SnapshotPhase::Pending);
}

TEST(SnapshotClassifyTest, ReadyToUseIsReady) {
    VolumeSnapshot snapshot;
    snapshot.status = readyStatus();
    EXPECT_EQ(SnapshotGateway::classifyState(snapshot).phase, SnapshotPhase::Ready);
}

TEST(SnapshotClassifyTest, ProviderErrorIsFailedWithMessage) {
    VolumeSnapshot snapshot;
    snapshot.metadata.name = "db-1-1";
    snapshot.status = errorStatus("quota exceeded");
    SnapshotState state = SnapshotGateway::classifyState(snapshot);
    EXPECT_EQ(state.phase, SnapshotPhase::Failed);
    EXPECT_NE(state.reason.find("quota exceeded"), std::string::npos);
    EXPECT_NE(state.reason.find("db-1-1"), std::string::npos);
}

TEST(SnapshotClassifyTest, MalformedStatusIsFailed) {
    VolumeSnapshot snapshot;
    snapshot.status = Json::Value("ready");
    EXPECT_EQ(SnapshotGateway::classifyState(snapshot).phase, SnapshotPhase::Failed);

    snapshot.status = Json::Value(Json::objectValue);
    snapshot.status["readyToUse"] = "yes";
    EXPECT_EQ(SnapshotGateway::classifyState(snapshot).phase, SnapshotPhase::Failed);

    snapshot.status = Json::Value(Json::objectValue);
    snapshot.status["error"] = "boom";
    SnapshotState state = SnapshotGateway::classifyState(snapshot);
    EXPECT_EQ(state.phase, SnapshotPhase::Failed);
    EXPECT_NE(state.reason.find("cannot parse"), std::string::npos);
}

