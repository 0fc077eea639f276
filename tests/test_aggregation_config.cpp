#include <gtest/gtest.h>
#include "federated/aggregation_config.h"
#include "federated/adaptive_selector.h"
#include "federated/byzantine_robust.h"
#include "federated/secure_aggregators.h"
#include "utils/config_manager.h"

using namespace fedcore;

class AggregationConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::ConfigManager::getInstance().clear();
    }

    void TearDown() override {
        utils::ConfigManager::getInstance().clear();
    }
};

TEST_F(AggregationConfigTest, DefaultsWithoutConfiguration) {
    AggregationConfig config;
    config.loadFromConfig();

    EXPECT_EQ(config.method, "fedavg");
    EXPECT_EQ(config.params.f, 1);
    EXPECT_FALSE(config.params.multi_krum.has_value());
    EXPECT_DOUBLE_EQ(config.params.beta, 0.1);
    EXPECT_EQ(config.params.outlier_method, OutlierMethod::IQR);
    EXPECT_FALSE(config.enable_dp);
    EXPECT_DOUBLE_EQ(config.dp.target_epsilon, 1.0);
    EXPECT_EQ(config.sample_dims, 100u);

    EXPECT_EQ(createAggregator(config)->name(), "fedavg");
}

TEST_F(AggregationConfigTest, LoadsAggregationAndPrivacyKeys) {
    utils::ConfigManager::getInstance().loadFromString(
        "aggregation.method = enhanced_krum\n"
        "aggregation.f = 2\n"
        "aggregation.m = 3\n"
        "aggregation.multi_krum = false\n"
        "aggregation.beta = 0.2\n"
        "aggregation.adaptive = off\n"
        "aggregation.outlier_method = zscore\n"
        "aggregation.variance_threshold = 0.5\n"
        "aggregation.sample_dims = 10\n"
        "privacy.enable_dp = true\n"
        "privacy.target_epsilon = 2.0\n"
        "privacy.max_rounds = 8\n");

    AggregationConfig config;
    config.loadFromConfig();

    EXPECT_EQ(config.method, "enhanced_krum");
    EXPECT_EQ(config.params.f, 2);
    EXPECT_EQ(config.params.m, 3);
    ASSERT_TRUE(config.params.multi_krum.has_value());
    EXPECT_FALSE(*config.params.multi_krum);
    EXPECT_DOUBLE_EQ(config.params.beta, 0.2);
    EXPECT_FALSE(config.params.adaptive);
    EXPECT_EQ(config.params.outlier_method, OutlierMethod::ZSCORE);
    EXPECT_DOUBLE_EQ(config.variance_threshold, 0.5);
    EXPECT_EQ(config.sample_dims, 10u);
    EXPECT_TRUE(config.enable_dp);
    EXPECT_DOUBLE_EQ(config.dp.target_epsilon, 2.0);
    EXPECT_DOUBLE_EQ(config.dp.perRoundEpsilon(), 0.25);

    auto aggregator = createAggregator(config);
    auto* krum = dynamic_cast<EnhancedKrumAggregator*>(aggregator.get());
    ASSERT_NE(krum, nullptr);
    EXPECT_EQ(krum->f(), 2);
    EXPECT_FALSE(krum->multiKrum());
    EXPECT_FALSE(krum->adaptiveF());
}

TEST_F(AggregationConfigTest, InvalidOutlierMethodIsAConfigurationError) {
    utils::ConfigManager::getInstance().setValue("aggregation.outlier_method", "grubbs");
    AggregationConfig config;
    EXPECT_THROW(config.loadFromConfig(), std::invalid_argument);
}

TEST_F(AggregationConfigTest, CreatesEveryKnownMethod) {
    const std::vector<std::string> methods = {
        "fedavg", "krum", "trimmed_mean", "median", "enhanced_krum",
        "adaptive_trimmed_mean", "secure_fedavg", "secure_krum", "adaptive",
    };

    for (const auto& method : methods) {
        AggregationConfig config;
        config.method = method;
        EXPECT_EQ(createAggregator(config)->name(), method) << method;
    }
}

TEST_F(AggregationConfigTest, MultiKrumDefaultsDependOnStrategy) {
    AggregationConfig config;

    config.method = "krum";
    auto krum = createAggregator(config);
    EXPECT_FALSE(dynamic_cast<KrumAggregator*>(krum.get())->multiKrum());

    config.method = "enhanced_krum";
    auto enhanced = createAggregator(config);
    EXPECT_TRUE(dynamic_cast<KrumAggregator*>(enhanced.get())->multiKrum());
}

TEST_F(AggregationConfigTest, SecureMethodsFollowPrivacySwitch) {
    AggregationConfig config;
    config.method = "secure_fedavg";

    auto without_dp = createAggregator(config);
    EXPECT_FALSE(dynamic_cast<SecureAggregator*>(without_dp.get())->dpEnabled());

    config.enable_dp = true;
    auto with_dp = createAggregator(config);
    EXPECT_TRUE(dynamic_cast<SecureAggregator*>(with_dp.get())->dpEnabled());
}

TEST_F(AggregationConfigTest, AdaptiveUsesSelectorSettings) {
    AggregationConfig config;
    config.method = "adaptive";
    config.variance_threshold = 3.5;
    config.sample_dims = 7;

    auto aggregator = createAggregator(config);
    auto* adaptive = dynamic_cast<AdaptiveAggregator*>(aggregator.get());
    ASSERT_NE(adaptive, nullptr);
    EXPECT_DOUBLE_EQ(adaptive->varianceThreshold(), 3.5);
    EXPECT_EQ(adaptive->sampleDims(), 7u);
}

TEST_F(AggregationConfigTest, UnknownMethodListsAlternatives) {
    AggregationConfig config;
    config.method = "fedprox";
    try {
        createAggregator(config);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("Unknown aggregator: fedprox"), std::string::npos);
        EXPECT_NE(message.find("secure_krum"), std::string::npos);
        EXPECT_NE(message.find("adaptive"), std::string::npos);
    }
}

TEST_F(AggregationConfigTest, InvalidParametersAreNotReportedAsUnknownMethod) {
    AggregationConfig config;
    config.method = "krum";
    config.params.f = -1;
    try {
        createAggregator(config);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_EQ(std::string(e.what()).find("Unknown aggregator"), std::string::npos);
    }

    config.method = "secure_fedavg";
    config.params.f = 1;
    config.dp.max_grad_norm = 0.0;
    EXPECT_THROW(createAggregator(config), std::invalid_argument);
}
