/*
 * Differential privacy primitives for federated aggregation
 * Budget ledger, L2 clipping and calibrated Gaussian noise
 */

#ifndef FEDCORE_PRIVACY_H
#define FEDCORE_PRIVACY_H

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <utility>
#include <vector>

#include "federated/robust_stats.h"
#include "utils/config_manager.h"

namespace fedcore {

struct DPConfig {
    double target_epsilon = 1.0;
    double target_delta = 1e-5;
    double max_grad_norm = 1.0;
    double noise_multiplier = 1.1;
    int max_rounds = 100;
    uint64_t seed = 0;  // 0 seeds from std::random_device

    double perRoundEpsilon() const {
        return target_epsilon / (max_rounds > 1 ? max_rounds : 1);
    }

    // Throws std::invalid_argument for out-of-range values
    void validate() const;

    // Load configuration from ConfigManager
    void loadFromConfig() {
        auto& config = utils::ConfigManager::getInstance();
        target_epsilon = config.getDouble("privacy.target_epsilon", target_epsilon);
        target_delta = config.getDouble("privacy.target_delta", target_delta);
        max_grad_norm = config.getDouble("privacy.max_grad_norm", max_grad_norm);
        noise_multiplier = config.getDouble("privacy.noise_multiplier", noise_multiplier);
        max_rounds = config.getInt("privacy.max_rounds", max_rounds);
        seed = config.getUInt64("privacy.seed", seed);
    }
};

struct PrivacyLedgerEntry {
    double epsilon;
    double noise_scale;
};

// Append-only record of privacy spending. Not synchronised; owners guard it.
class PrivacyBudget {
public:
    // Throws std::invalid_argument for negative epsilon
    void addRound(double epsilon, double noise_scale);

    double epsilonSpent() const { return epsilon_spent_; }
    int64_t roundsParticipated() const { return rounds_participated_; }
    const std::vector<PrivacyLedgerEntry>& ledger() const { return ledger_; }

    // Spending within a relative 1e-9 of max_epsilon counts as the full budget,
    // so max_rounds charges of max_epsilon / max_rounds always exhaust it
    double remaining(double max_epsilon) const;
    bool isExhausted(double max_epsilon) const;
    double averageEpsilonPerRound() const;

private:
    double epsilon_spent_ = 0.0;
    int64_t rounds_participated_ = 0;
    std::vector<PrivacyLedgerEntry> ledger_;
};

struct ClipResult {
    Vector clipped;
    double original_norm = 0.0;
    bool was_clipped = false;
};

class GradientClipper {
public:
    explicit GradientClipper(double max_norm);

    // Rescales to exactly max_norm when the L2 norm exceeds it
    ClipResult clip(const Vector& values);

    double maxNorm() const { return max_norm_; }
    double clipRate() const;
    int64_t totalCalls() const { return total_calls_.load(); }
    int64_t clippedCalls() const { return clipped_calls_.load(); }

    static double l2Norm(const Vector& values);

private:
    double max_norm_;
    std::atomic<int64_t> total_calls_{0};
    std::atomic<int64_t> clipped_calls_{0};
};

class GaussianNoiseGenerator {
public:
    explicit GaussianNoiseGenerator(uint64_t seed = 0);

    double sample(double sigma);
    Vector addNoise(const Vector& values, double sigma);

    // sensitivity * sqrt(2 ln(1.25 / delta)) / epsilon
    static double calibrateNoise(double sensitivity, double epsilon, double delta);

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

struct PrivatizedGradients {
    Vector values;
    double original_norm = 0.0;
    double noise_scale = 0.0;
};

class DifferentialPrivacy {
public:
    explicit DifferentialPrivacy(const DPConfig& config = DPConfig());

    // noise_multiplier * max_grad_norm / max(1, num_samples)
    double noiseScale(int64_t num_samples) const;

    // Clip, add noise and charge one round of perRoundEpsilon() to the ledger
    PrivatizedGradients privatizeGradients(const Vector& gradients, int64_t num_samples);

    // {epsilon spent, target delta}
    std::pair<double, double> getPrivacySpent() const;

    bool canContinueTraining() const;
    PrivacyBudget budget() const;
    const DPConfig& config() const { return config_; }

private:
    DPConfig config_;
    GradientClipper clipper_;
    GaussianNoiseGenerator noise_;

    mutable std::mutex budget_mutex_;
    PrivacyBudget budget_;
};

} // namespace fedcore

#endif // FEDCORE_PRIVACY_H
