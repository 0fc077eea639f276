#include <gtest/gtest.h>
#include "federated/privacy.h"
#include <cmath>

using namespace fedcore;

class PrivacyTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::ConfigManager::getInstance().clear();

        config.target_epsilon = 1.0;
        config.target_delta = 1e-5;
        config.max_grad_norm = 1.0;
        config.noise_multiplier = 1.1;
        config.max_rounds = 4;
        config.seed = 1234;
    }

    void TearDown() override {
        utils::ConfigManager::getInstance().clear();
    }

    DPConfig config;
};

TEST_F(PrivacyTest, BudgetLedger) {
    PrivacyBudget budget;
    EXPECT_EQ(budget.roundsParticipated(), 0);
    EXPECT_DOUBLE_EQ(budget.averageEpsilonPerRound(), 0.0);

    budget.addRound(0.25, 0.011);
    budget.addRound(0.5, 0.022);
    EXPECT_DOUBLE_EQ(budget.epsilonSpent(), 0.75);
    EXPECT_EQ(budget.roundsParticipated(), 2);
    EXPECT_DOUBLE_EQ(budget.averageEpsilonPerRound(), 0.375);
    ASSERT_EQ(budget.ledger().size(), 2u);
    EXPECT_DOUBLE_EQ(budget.ledger()[1].noise_scale, 0.022);

    EXPECT_DOUBLE_EQ(budget.remaining(1.0), 0.25);
    EXPECT_DOUBLE_EQ(budget.remaining(0.5), 0.0);
    EXPECT_FALSE(budget.isExhausted(1.0));
    EXPECT_TRUE(budget.isExhausted(0.75));

    EXPECT_THROW(budget.addRound(-0.1, 0.0), std::invalid_argument);
    EXPECT_EQ(budget.roundsParticipated(), 2);
}

TEST_F(PrivacyTest, ClipperRescalesLargeVectors) {
    GradientClipper clipper(1.0);

    ClipResult large = clipper.clip({3.0, 4.0});
    EXPECT_TRUE(large.was_clipped);
    EXPECT_DOUBLE_EQ(large.original_norm, 5.0);
    EXPECT_NEAR(large.clipped[0], 0.6, 1e-12);
    EXPECT_NEAR(large.clipped[1], 0.8, 1e-12);
    EXPECT_NEAR(GradientClipper::l2Norm(large.clipped), 1.0, 1e-12);

    ClipResult small = clipper.clip({0.3, 0.4});
    EXPECT_FALSE(small.was_clipped);
    EXPECT_EQ(small.clipped, Vector({0.3, 0.4}));

    EXPECT_EQ(clipper.totalCalls(), 2);
    EXPECT_EQ(clipper.clippedCalls(), 1);
    EXPECT_DOUBLE_EQ(clipper.clipRate(), 0.5);

    EXPECT_THROW(GradientClipper(0.0), std::invalid_argument);
}

TEST_F(PrivacyTest, SeededNoiseIsReproducible) {
    GaussianNoiseGenerator a(42);
    GaussianNoiseGenerator b(42);
    Vector zeros(16, 0.0);
    EXPECT_EQ(a.addNoise(zeros, 0.5), b.addNoise(zeros, 0.5));

    EXPECT_EQ(a.addNoise({1.0, 2.0}, 0.0), Vector({1.0, 2.0}));
    EXPECT_EQ(a.sample(0.0), 0.0);
}

TEST_F(PrivacyTest, NoiseHasRequestedSpread) {
    GaussianNoiseGenerator generator(7);
    Vector noise = generator.addNoise(Vector(20000, 0.0), 2.0);

    double mean = 0.0;
    for (double v : noise) {
        mean += v;
    }
    mean /= noise.size();

    double var = 0.0;
    for (double v : noise) {
        var += (v - mean) * (v - mean);
    }
    const double stddev = std::sqrt(var / noise.size());

    EXPECT_NEAR(mean, 0.0, 0.1);
    EXPECT_NEAR(stddev, 2.0, 0.1);
}

TEST_F(PrivacyTest, CalibrateNoise) {
    EXPECT_NEAR(GaussianNoiseGenerator::calibrateNoise(1.0, 1.0, 1e-5), 4.845, 1e-3);
    EXPECT_NEAR(GaussianNoiseGenerator::calibrateNoise(2.0, 0.5, 1e-5), 4.0 * 4.845, 4e-3);
    EXPECT_THROW(GaussianNoiseGenerator::calibrateNoise(1.0, 0.0, 1e-5), std::invalid_argument);
    EXPECT_THROW(GaussianNoiseGenerator::calibrateNoise(1.0, 1.0, 1.0), std::invalid_argument);
}

TEST_F(PrivacyTest, NoiseScaleFloorsSampleCount) {
    DifferentialPrivacy dp(config);
    EXPECT_NEAR(dp.noiseScale(100), 0.011, 1e-12);
    EXPECT_DOUBLE_EQ(dp.noiseScale(0), 1.1);
    EXPECT_DOUBLE_EQ(dp.noiseScale(-5), 1.1);
}

TEST_F(PrivacyTest, PrivatizeClipsAndChargesBudget) {
    config.noise_multiplier = 0.0;
    DifferentialPrivacy dp(config);

    PrivatizedGradients result = dp.privatizeGradients({30.0, 40.0}, 10);
    EXPECT_DOUBLE_EQ(result.original_norm, 50.0);
    EXPECT_DOUBLE_EQ(result.noise_scale, 0.0);
    EXPECT_NEAR(result.values[0], 0.6, 1e-12);
    EXPECT_NEAR(result.values[1], 0.8, 1e-12);

    std::pair<double, double> spent = dp.getPrivacySpent();
    EXPECT_DOUBLE_EQ(spent.first, 0.25);
    EXPECT_DOUBLE_EQ(spent.second, 1e-5);
    EXPECT_EQ(dp.budget().roundsParticipated(), 1);
}

TEST_F(PrivacyTest, BudgetExhaustsAfterMaxRounds) {
    DifferentialPrivacy dp(config);
    EXPECT_DOUBLE_EQ(config.perRoundEpsilon(), 0.25);

    for (int round = 0; round < 3; ++round) {
        dp.privatizeGradients({0.1, 0.1}, 100);
        EXPECT_TRUE(dp.canContinueTraining());
    }
    dp.privatizeGradients({0.1, 0.1}, 100);
    EXPECT_FALSE(dp.canContinueTraining());
    EXPECT_DOUBLE_EQ(dp.getPrivacySpent().first, 1.0);

    // Exhaustion is advisory
    PrivatizedGradients late = dp.privatizeGradients({0.1, 0.1}, 100);
    EXPECT_EQ(late.values.size(), 2u);
    EXPECT_EQ(dp.budget().roundsParticipated(), 5);
}

TEST_F(PrivacyTest, BudgetExhaustsWhenRoundEpsilonIsInexact) {
    config.max_rounds = 10;
    DifferentialPrivacy dp(config);

    for (int round = 0; round < 9; ++round) {
        dp.privatizeGradients({0.1, 0.1}, 100);
        EXPECT_TRUE(dp.canContinueTraining()) << "round " << round;
    }
    dp.privatizeGradients({0.1, 0.1}, 100);
    EXPECT_FALSE(dp.canContinueTraining());
    EXPECT_EQ(dp.budget().remaining(config.target_epsilon), 0.0);
    EXPECT_GT(dp.budget().remaining(1.5), 0.49);
}

TEST_F(PrivacyTest, ConfigValidation) {
    EXPECT_NO_THROW(config.validate());

    DPConfig bad = config;
    bad.target_epsilon = 0.0;
    EXPECT_THROW(bad.validate(), std::invalid_argument);

    bad = config;
    bad.target_delta = 1.0;
    EXPECT_THROW(bad.validate(), std::invalid_argument);

    bad = config;
    bad.max_rounds = 0;
    EXPECT_THROW(DifferentialPrivacy dp(bad), std::invalid_argument);

    bad = config;
    bad.noise_multiplier = -1.0;
    EXPECT_THROW(bad.validate(), std::invalid_argument);
}

TEST_F(PrivacyTest, ConfigLoadsFromConfigManager) {
    auto& manager = utils::ConfigManager::getInstance();
    manager.loadFromString(
        "privacy.target_epsilon = 8.0\n"
        "privacy.max_grad_norm = 0.5\n"
        "privacy.max_rounds = 16\n"
        "privacy.seed = 99\n");

    DPConfig loaded;
    loaded.loadFromConfig();
    EXPECT_DOUBLE_EQ(loaded.target_epsilon, 8.0);
    EXPECT_DOUBLE_EQ(loaded.max_grad_norm, 0.5);
    EXPECT_EQ(loaded.max_rounds, 16);
    EXPECT_EQ(loaded.seed, 99u);
    EXPECT_DOUBLE_EQ(loaded.target_delta, 1e-5);
    EXPECT_DOUBLE_EQ(loaded.noise_multiplier, 1.1);
    EXPECT_DOUBLE_EQ(loaded.perRoundEpsilon(), 0.5);
}
