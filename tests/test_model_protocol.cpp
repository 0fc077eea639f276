#include <gtest/gtest.h>
#include "federated/model_protocol.h"
#include "test_utils.h"

using namespace fedcore;

class ModelProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        weights = TestUtils::layeredWeights(0.5);
        weights.metadata["architecture"] = "tiny-cnn";
    }

    ModelWeights weights;
};

TEST_F(ModelProtocolTest, EffectiveSamplesNeverBelowOne) {
    ModelUpdate update("node-1", 1, weights, 0);
    EXPECT_EQ(update.effectiveSamples(), 1);

    update.num_samples = -3;
    EXPECT_EQ(update.effectiveSamples(), 1);

    update.num_samples = 250;
    EXPECT_EQ(update.effectiveSamples(), 250);
}

TEST_F(ModelProtocolTest, WithWeightsCopiesEverythingElse) {
    ModelUpdate update("node-1", 7, weights, 42, 0.3, 0.4);
    update.gradient_norm = 1.5;

    ModelUpdate replaced = update.withWeights(TestUtils::flatWeights({1.0, 2.0}));
    EXPECT_EQ(replaced.node_id, "node-1");
    EXPECT_EQ(replaced.round_number, 7);
    EXPECT_EQ(replaced.num_samples, 42);
    EXPECT_DOUBLE_EQ(replaced.gradient_norm, 1.5);
    EXPECT_EQ(replaced.weights, TestUtils::flatWeights({1.0, 2.0}));
    EXPECT_EQ(update.weights, weights);
}

TEST_F(ModelProtocolTest, ModelUpdateJsonRoundTrip) {
    ModelUpdate update("node-7", 3, weights, 128, 0.25, 0.5);
    update.noise_scale = 0.011;
    update.clip_norm = 1.0;

    ModelUpdate parsed = ModelUpdate::fromJson(utils::JsonParser::parse(update.toJson().dump()));
    EXPECT_EQ(parsed.node_id, update.node_id);
    EXPECT_EQ(parsed.round_number, update.round_number);
    EXPECT_EQ(parsed.weights, update.weights);
    EXPECT_EQ(parsed.weights.metadata, update.weights.metadata);
    EXPECT_EQ(parsed.num_samples, update.num_samples);
    EXPECT_EQ(parsed.training_loss, update.training_loss);
    EXPECT_EQ(parsed.validation_loss, update.validation_loss);
    EXPECT_EQ(parsed.noise_scale, update.noise_scale);
    EXPECT_EQ(parsed.clip_norm, update.clip_norm);
    EXPECT_EQ(parsed.timestamp, update.timestamp);
}

TEST_F(ModelProtocolTest, GlobalModelComputesAndVerifiesHash) {
    GlobalModel model(1, 1, weights);
    EXPECT_EQ(model.weights_hash, weights.computeHash());
    EXPECT_TRUE(model.previous_hash.empty());
    EXPECT_TRUE(model.verifyHash());

    model.weights.layer_weights["fc"][0] += 1e-9;
    EXPECT_FALSE(model.verifyHash());
}

TEST_F(ModelProtocolTest, GlobalModelKeepsSuppliedHash) {
    GlobalModel model(2, 5, weights, "prev", "deadbeef");
    EXPECT_EQ(model.weights_hash, "deadbeef");
    EXPECT_EQ(model.previous_hash, "prev");
    EXPECT_FALSE(model.verifyHash());
}

TEST_F(ModelProtocolTest, GlobalModelJsonDetectsTampering) {
    GlobalModel model(4, 9, weights, "abc123");
    model.aggregation_method = "krum_f1";
    model.num_contributors = 3;
    model.total_samples = 300;

    utils::JsonValue json = model.toJson();
    GlobalModel parsed = GlobalModel::fromJson(utils::JsonParser::parse(json.dump()));
    EXPECT_EQ(parsed.version, 4);
    EXPECT_EQ(parsed.round_number, 9);
    EXPECT_EQ(parsed.aggregation_method, "krum_f1");
    EXPECT_EQ(parsed.num_contributors, 3);
    EXPECT_EQ(parsed.total_samples, 300);
    EXPECT_EQ(parsed.previous_hash, "abc123");
    EXPECT_EQ(parsed.weights_hash, model.weights_hash);
    EXPECT_EQ(parsed.created_at, model.created_at);
    EXPECT_TRUE(parsed.verifyHash());

    ModelWeights tampered_weights = weights;
    tampered_weights.layer_weights["conv1"][1] = 100.0;
    json.set("weights", tampered_weights.toJson());
    GlobalModel tampered = GlobalModel::fromJson(json);
    EXPECT_EQ(tampered.weights_hash, model.weights_hash);
    EXPECT_FALSE(tampered.verifyHash());
}

TEST_F(ModelProtocolTest, BinarySnapshotRoundTrip) {
    GlobalModel model(3, 12, weights, "feedface");
    model.aggregation_method = "fedavg";
    model.avg_training_loss = 0.125;

    std::vector<uint8_t> bytes = model.serialize();
    ASSERT_GT(bytes.size(), 13u);
    EXPECT_EQ(bytes[0], 'F');
    EXPECT_EQ(bytes[1], 'C');

    GlobalModel restored = GlobalModel::deserialize(bytes);
    EXPECT_EQ(restored.version, 3);
    EXPECT_EQ(restored.round_number, 12);
    EXPECT_EQ(restored.weights, model.weights);
    EXPECT_EQ(restored.weights_hash, model.weights_hash);
    EXPECT_EQ(restored.previous_hash, "feedface");
    EXPECT_EQ(restored.aggregation_method, "fedavg");
    EXPECT_DOUBLE_EQ(restored.avg_training_loss, 0.125);
    EXPECT_TRUE(restored.verifyHash());
}

TEST_F(ModelProtocolTest, BinarySnapshotRejectsCorruption) {
    GlobalModel model(1, 1, weights);
    std::vector<uint8_t> bytes = model.serialize();

    std::vector<uint8_t> bad_magic = bytes;
    bad_magic[0] = 'X';
    EXPECT_THROW(GlobalModel::deserialize(bad_magic), std::runtime_error);

    std::vector<uint8_t> bad_version = bytes;
    bad_version[4] = 99;
    EXPECT_THROW(GlobalModel::deserialize(bad_version), std::runtime_error);

    std::vector<uint8_t> truncated(bytes.begin(), bytes.end() - 5);
    EXPECT_THROW(GlobalModel::deserialize(truncated), std::runtime_error);

    // Last byte belongs to the zlib checksum
    std::vector<uint8_t> bad_checksum = bytes;
    bad_checksum.back() ^= 0xFF;
    EXPECT_THROW(GlobalModel::deserialize(bad_checksum), std::runtime_error);

    EXPECT_THROW(GlobalModel::deserialize({}), std::runtime_error);

    // Declared size far beyond what the compressed body can expand to
    std::vector<uint8_t> oversized = bytes;
    oversized[5] = 0xFF;
    oversized[6] = 0xFF;
    oversized[7] = 0xFF;
    oversized[8] = 0xF0;
    EXPECT_THROW(GlobalModel::deserialize(oversized), std::runtime_error);

    std::vector<uint8_t> zero_size = bytes;
    zero_size[5] = zero_size[6] = zero_size[7] = zero_size[8] = 0;
    EXPECT_THROW(GlobalModel::deserialize(zero_size), std::runtime_error);
}

TEST_F(ModelProtocolTest, FailureResultCarriesNoModel) {
    AggregationResult result = AggregationResult::failure("No updates to aggregate", 0.5);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.global_model.has_value());
    EXPECT_EQ(result.error_message, "No updates to aggregate");
    EXPECT_DOUBLE_EQ(result.aggregation_time_seconds, 0.5);
}

TEST_F(ModelProtocolTest, AggregationResultJsonRoundTrip) {
    AggregationResult result;
    result.success = true;
    result.global_model = GlobalModel(2, 4, weights, "abc");
    result.updates_received = 6;
    result.updates_accepted = 5;
    result.updates_rejected = 1;
    result.suspected_byzantine = {"node-9"};
    result.privacy_epsilon_spent = 0.01;
    result.privacy_budget_remaining = 0.99;
    result.aggregation_time_seconds = 0.002;

    AggregationDiagnostics diagnostics;
    diagnostics.selected_strategy = "krum";
    diagnostics.distance_backend = "threaded";
    diagnostics.effective_f = 1;
    result.diagnostics = diagnostics;

    AggregationResult parsed = AggregationResult::fromJson(utils::JsonParser::parse(result.toJson().dump()));
    EXPECT_TRUE(parsed.success);
    ASSERT_TRUE(parsed.global_model.has_value());
    EXPECT_EQ(parsed.global_model->weights_hash, result.global_model->weights_hash);
    EXPECT_EQ(parsed.updates_received, 6);
    EXPECT_EQ(parsed.updates_accepted, 5);
    EXPECT_EQ(parsed.updates_rejected, 1);
    EXPECT_EQ(parsed.suspected_byzantine, result.suspected_byzantine);
    ASSERT_TRUE(parsed.privacy_epsilon_spent.has_value());
    EXPECT_DOUBLE_EQ(*parsed.privacy_epsilon_spent, 0.01);
    EXPECT_DOUBLE_EQ(*parsed.privacy_budget_remaining, 0.99);
    ASSERT_TRUE(parsed.diagnostics.has_value());
    EXPECT_EQ(parsed.diagnostics->selected_strategy, "krum");
    EXPECT_EQ(parsed.diagnostics->distance_backend, "threaded");
    EXPECT_EQ(parsed.diagnostics->effective_f, 1);
    EXPECT_DOUBLE_EQ(parsed.diagnostics->effective_beta, -1.0);

    AggregationResult failure = AggregationResult::fromJson(
        utils::JsonParser::parse(AggregationResult::failure("boom").toJson().dump()));
    EXPECT_FALSE(failure.success);
    EXPECT_FALSE(failure.global_model.has_value());
    EXPECT_FALSE(failure.privacy_epsilon_spent.has_value());
    EXPECT_FALSE(failure.diagnostics.has_value());
    EXPECT_EQ(failure.error_message, "boom");
}
