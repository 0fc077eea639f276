#include <gtest/gtest.h>
#include "federated/model_sync.h"
#include "test_utils.h"
#include <cmath>
#include <limits>

using namespace fedcore;

class ModelSyncTest : public ::testing::Test {
protected:
    // Chain of models v1..vN, each linked to its predecessor
    static std::vector<GlobalModel> buildChain(int count) {
        std::vector<GlobalModel> chain;
        std::string previous_hash;
        for (int v = 1; v <= count; ++v) {
            GlobalModel model(v, v, TestUtils::flatWeights({static_cast<double>(v), 0.5}), previous_hash);
            previous_hash = model.weights_hash;
            chain.push_back(model);
        }
        return chain;
    }

    ModelSynchronizer synchronizer{"node-1", 3};
};

TEST_F(ModelSyncTest, StartsEmpty) {
    EXPECT_EQ(synchronizer.nodeId(), "node-1");
    EXPECT_EQ(synchronizer.getModelVersion(), 0);
    EXPECT_FALSE(synchronizer.getCurrentModel().has_value());
    EXPECT_EQ(synchronizer.getSyncStatus(), SyncStatus::PENDING);
    EXPECT_DOUBLE_EQ(synchronizer.getLastSyncTime(), 0.0);
    EXPECT_TRUE(synchronizer.getHistoryVersions().empty());
}

TEST_F(ModelSyncTest, AcceptsNewerModels) {
    std::vector<GlobalModel> chain = buildChain(2);

    EXPECT_TRUE(synchronizer.receiveGlobalModel(chain[0], "aggregator"));
    EXPECT_EQ(synchronizer.getModelVersion(), 1);
    EXPECT_EQ(synchronizer.getSyncStatus(), SyncStatus::ACTIVE);
    EXPECT_GT(synchronizer.getLastSyncTime(), 0.0);

    EXPECT_TRUE(synchronizer.receiveGlobalModel(chain[1]));
    EXPECT_EQ(synchronizer.getModelVersion(), 2);
    EXPECT_EQ(synchronizer.getCurrentModel()->weights_hash, chain[1].weights_hash);
    EXPECT_EQ(synchronizer.getHistoryVersions(), std::vector<int64_t>({1}));
    EXPECT_EQ(synchronizer.getNodeVersions().at("aggregator"), 1);
}

TEST_F(ModelSyncTest, RejectsStaleModels) {
    std::vector<GlobalModel> chain = buildChain(2);
    ASSERT_TRUE(synchronizer.receiveGlobalModel(chain[1]));

    EXPECT_FALSE(synchronizer.receiveGlobalModel(chain[0]));
    EXPECT_FALSE(synchronizer.receiveGlobalModel(chain[1]));
    EXPECT_EQ(synchronizer.getModelVersion(), 2);
    EXPECT_TRUE(synchronizer.getHistoryVersions().empty());
}

TEST_F(ModelSyncTest, RejectsInvalidModelsWithoutStateChange) {
    std::vector<GlobalModel> chain = buildChain(1);
    ASSERT_TRUE(synchronizer.receiveGlobalModel(chain[0]));
    const double synced_at = synchronizer.getLastSyncTime();

    GlobalModel tampered(5, 5, TestUtils::flatWeights({1.0, 2.0}));
    tampered.weights.layer_weights["layer0"][0] = 99.0;
    EXPECT_FALSE(synchronizer.receiveGlobalModel(tampered));

    GlobalModel negative(-1, 1, TestUtils::flatWeights({1.0}));
    EXPECT_FALSE(synchronizer.receiveGlobalModel(negative));

    GlobalModel empty(6, 6, ModelWeights());
    EXPECT_FALSE(synchronizer.receiveGlobalModel(empty));

    GlobalModel overflowed(7, 7, TestUtils::flatWeights({1.0, std::numeric_limits<double>::infinity()}));
    EXPECT_FALSE(synchronizer.receiveGlobalModel(overflowed));

    GlobalModel undefined(8, 8, TestUtils::flatWeights({std::nan("")}));
    EXPECT_FALSE(synchronizer.receiveGlobalModel(undefined));

    EXPECT_EQ(synchronizer.getModelVersion(), 1);
    EXPECT_DOUBLE_EQ(synchronizer.getLastSyncTime(), synced_at);
    EXPECT_TRUE(synchronizer.getHistoryVersions().empty());
}

TEST_F(ModelSyncTest, VersionZeroIsAcceptedWhenEmpty) {
    GlobalModel initial(0, 0, TestUtils::flatWeights({0.0}));
    EXPECT_TRUE(synchronizer.receiveGlobalModel(initial));
    EXPECT_EQ(synchronizer.getModelVersion(), 0);
    EXPECT_TRUE(synchronizer.getCurrentModel().has_value());
}

TEST_F(ModelSyncTest, HistoryIsBounded) {
    for (const auto& model : buildChain(5)) {
        ASSERT_TRUE(synchronizer.receiveGlobalModel(model));
    }
    EXPECT_EQ(synchronizer.getModelVersion(), 5);
    EXPECT_EQ(synchronizer.getHistoryVersions(), std::vector<int64_t>({2, 3, 4}));
}

TEST_F(ModelSyncTest, RollbackRestoresHistoricVersion) {
    std::vector<GlobalModel> chain = buildChain(4);
    for (const auto& model : chain) {
        ASSERT_TRUE(synchronizer.receiveGlobalModel(model));
    }

    EXPECT_TRUE(synchronizer.rollback(2));
    EXPECT_EQ(synchronizer.getModelVersion(), 2);
    EXPECT_EQ(synchronizer.getCurrentModel()->weights_hash, chain[1].weights_hash);
    EXPECT_EQ(synchronizer.getHistoryVersions(), std::vector<int64_t>({1, 3, 4}));

    EXPECT_FALSE(synchronizer.rollback(2));
    EXPECT_FALSE(synchronizer.rollback(42));
    EXPECT_EQ(synchronizer.getModelVersion(), 2);
}

TEST_F(ModelSyncTest, LocalModelRecordsOwnVersion) {
    std::vector<GlobalModel> chain = buildChain(1);
    EXPECT_TRUE(synchronizer.setLocalModel(chain[0]));
    EXPECT_EQ(synchronizer.getNodeVersions().at("node-1"), 1);

    synchronizer.updateNodeVersion("node-7", 4);
    EXPECT_EQ(synchronizer.getNodeVersions().at("node-7"), 4);
    EXPECT_EQ(synchronizer.getNodeVersions().size(), 2u);
}

TEST_F(ModelSyncTest, StatusTransitions) {
    synchronizer.markDistributing();
    EXPECT_EQ(synchronizer.getSyncStatus(), SyncStatus::DISTRIBUTING);
    synchronizer.markDeprecated();
    EXPECT_EQ(syncStatusToString(synchronizer.getSyncStatus()), "deprecated");
}

TEST_F(ModelSyncTest, DetectsVersionConflicts) {
    std::vector<GlobalModel> chain = buildChain(3);

    std::vector<ModelConflict> behind = synchronizer.checkForConflicts(chain[1], chain[2]);
    ASSERT_GE(behind.size(), 1u);
    EXPECT_EQ(behind[0].type, ConflictType::VERSION_MISMATCH);
    EXPECT_EQ(behind[0].severity, ConflictSeverity::MEDIUM);
    EXPECT_EQ(behind[0].local_version, 2);
    EXPECT_EQ(behind[0].global_version, 3);

    std::vector<ModelConflict> ahead = synchronizer.checkForConflicts(chain[2], chain[1]);
    EXPECT_EQ(ahead[0].severity, ConflictSeverity::HIGH);
}

TEST_F(ModelSyncTest, DetectsHashAndRoundConflicts) {
    GlobalModel local(3, 7, TestUtils::flatWeights({1.0, 2.0}));
    GlobalModel global(3, 8, TestUtils::flatWeights({1.0, 2.5}));

    std::vector<ModelConflict> conflicts = synchronizer.checkForConflicts(local, global);
    ASSERT_EQ(conflicts.size(), 2u);
    EXPECT_EQ(conflicts[0].type, ConflictType::HASH_MISMATCH);
    EXPECT_EQ(conflicts[0].severity, ConflictSeverity::CRITICAL);
    EXPECT_EQ(conflicts[1].type, ConflictType::ROUND_MISMATCH);
    EXPECT_EQ(conflictTypeToString(conflicts[1].type), "round_mismatch");

    EXPECT_TRUE(synchronizer.checkForConflicts(local, local).empty());
    EXPECT_EQ(synchronizer.getConflictLog().size(), 2u);
}

TEST_F(ModelSyncTest, ResolveConflicts) {
    std::vector<GlobalModel> chain = buildChain(2);
    std::vector<ModelConflict> conflicts = synchronizer.checkForConflicts(chain[0], chain[1]);

    ResolutionOutcome global = synchronizer.resolveConflicts(conflicts, ResolutionStrategy::PREFER_GLOBAL);
    EXPECT_TRUE(global.resolved);
    EXPECT_EQ(global.kept, "global");
    EXPECT_EQ(global.conflicts_resolved, conflicts.size());

    ResolutionOutcome local = synchronizer.resolveConflicts(conflicts, parseResolutionStrategy("prefer_local"));
    EXPECT_EQ(local.kept, "local");

    EXPECT_THROW(synchronizer.resolveConflicts(conflicts, ResolutionStrategy::MERGE), UnsupportedResolutionError);
    EXPECT_EQ(parseResolutionStrategy("merge"), ResolutionStrategy::MERGE);
    EXPECT_THROW(parseResolutionStrategy("average"), std::invalid_argument);
}

TEST_F(ModelSyncTest, VerifyModelChain) {
    std::vector<GlobalModel> chain = buildChain(3);
    ChainVerification ok = ModelSynchronizer::verifyModelChain(chain);
    EXPECT_TRUE(ok.valid);
    EXPECT_TRUE(ok.problems.empty());
    EXPECT_TRUE(ModelSynchronizer::verifyModelChain({}).valid);

    std::vector<GlobalModel> broken = chain;
    broken[2].previous_hash = "0000";
    ChainVerification unlinked = ModelSynchronizer::verifyModelChain(broken);
    EXPECT_FALSE(unlinked.valid);
    EXPECT_EQ(unlinked.problems.size(), 1u);

    std::vector<GlobalModel> tampered = chain;
    tampered[1].weights.layer_weights["layer0"][1] = -0.5;
    EXPECT_FALSE(ModelSynchronizer::verifyModelChain(tampered).valid);

    std::vector<GlobalModel> reordered = {chain[1], chain[0]};
    EXPECT_FALSE(ModelSynchronizer::verifyModelChain(reordered).valid);
}
