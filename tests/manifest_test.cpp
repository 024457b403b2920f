#include <gtest/gtest.h>
#include "manifest.hpp"
#include "test_support.hpp"

TEST(ManifestTest, ClusterSurvivesEncoding) {
    Cluster cluster = makeCluster("pg", "db-1");
    cluster.spec.volumeSnapshot->className = "fast";
    cluster.spec.volumeSnapshot->ownerReference = SnapshotOwnerReference::Backup;
    cluster.spec.replica = ReplicaClusterConfig{true, "origin"};
    cluster.spec.externalClusters.push_back(
        ExternalCluster{"origin", {{"host", "up"}}, SecretKeySelector{"creds", "password"}});
    cluster.spec.replicationSlots.slotPrefix = "fleet_";

    auto decoded = clusterFromJson(toJson(cluster));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->spec.volumeSnapshot.has_value());
    EXPECT_EQ(decoded->spec.volumeSnapshot->className, "fast");
    EXPECT_EQ(decoded->spec.volumeSnapshot->ownerReference, SnapshotOwnerReference::Backup);
    EXPECT_TRUE(decoded->isReplica());
    auto origin = decoded->externalCluster("origin");
    ASSERT_TRUE(origin.has_value());
    ASSERT_TRUE(origin->password.has_value());
    EXPECT_EQ(origin->password->key, "password");
    EXPECT_EQ(decoded->slotNameForInstance("db-2"), "fleet_db_2");
}

TEST(ManifestTest, BackupDecodesProviderLayout) {
    auto document = parseJsonDocument(R"({
        "metadata": {"name": "nightly"},
        "spec": {"cluster": {"name": "pg"}, "target": "prefer-standby"},
        "status": {"phase": "completed", "instanceID": {"podName": "db-2"},
                   "backupSnapshotStatus": {"elements": ["db-2-1", "db-2-wal-1"]},
                   "startedAt": 1700000000}
    })");
    ASSERT_TRUE(document.has_value());

    auto backup = backupFromJson(*document);
    ASSERT_TRUE(backup.has_value());
    EXPECT_EQ(backup->metadata.namespace_, "default");
    EXPECT_EQ(backup->spec.target, BackupTarget::PreferStandby);
    EXPECT_EQ(backup->status.phase, BackupPhase::Completed);
    EXPECT_EQ(backup->status.instanceName, "db-2");
    EXPECT_EQ(backup->status.snapshots.size(), 2u);
    EXPECT_EQ(backup->status.startedAt, std::optional<std::int64_t>(1700000000));
    EXPECT_FALSE(backup->status.stoppedAt.has_value());
    EXPECT_TRUE(backup->isDone());
}

TEST(ManifestTest, MalformedDocumentsAreParseErrors) {
    auto noName = parseJsonDocument(R"({"metadata": {}, "spec": {"cluster": {"name": "pg"}}})");
    ASSERT_TRUE(noName.has_value());
    auto backup = backupFromJson(*noName);
    ASSERT_FALSE(backup.has_value());
    EXPECT_EQ(backup.error().code, ErrorCode::ParseError);

    auto badPhase = parseJsonDocument(
        R"({"metadata": {"name": "b"}, "spec": {"cluster": {"name": "pg"}}, "status": {"phase": "sleeping"}})");
    ASSERT_TRUE(badPhase.has_value());
    backup = backupFromJson(*badPhase);
    ASSERT_FALSE(backup.has_value());
    EXPECT_EQ(backup.error().code, ErrorCode::ParseError);

    auto badLabels = parseJsonDocument(R"({"metadata": {"name": "p", "labels": {"a": 1}}})");
    ASSERT_TRUE(badLabels.has_value());
    auto pod = podFromJson(*badLabels);
    ASSERT_FALSE(pod.has_value());
    EXPECT_EQ(pod.error().code, ErrorCode::ParseError);

    auto broken = parseJsonDocument("{not json");
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().code, ErrorCode::ParseError);
}

TEST(ManifestTest, SnapshotStatusIsKeptVerbatim) {
    VolumeSnapshot snapshot;
    snapshot.metadata.name = "db-1-1";
    snapshot.metadata.namespace_ = "default";
    snapshot.sourcePvcName = "db-1";
    snapshot.status = errorStatus("quota exceeded");

    auto decoded = snapshotFromJson(toJson(snapshot));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->sourcePvcName, "db-1");
    EXPECT_FALSE(decoded->className.has_value());
    EXPECT_EQ(decoded->status["error"]["message"].asString(), "quota exceeded");
}

