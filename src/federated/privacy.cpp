/*
 * Differential privacy implementation
 */

#include "federated/privacy.h"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace fedcore {

namespace {

constexpr double BUDGET_TOLERANCE = 1e-9;

} // namespace

void DPConfig::validate() const {
    if (!(target_epsilon > 0.0)) {
        throw std::invalid_argument("privacy.target_epsilon must be positive");
    }
    if (!(target_delta > 0.0 && target_delta < 1.0)) {
        throw std::invalid_argument("privacy.target_delta must lie in (0, 1)");
    }
    if (!(max_grad_norm > 0.0)) {
        throw std::invalid_argument("privacy.max_grad_norm must be positive");
    }
    if (noise_multiplier < 0.0) {
        throw std::invalid_argument("privacy.noise_multiplier must be non-negative");
    }
    if (max_rounds < 1) {
        throw std::invalid_argument("privacy.max_rounds must be at least 1");
    }
}

// PrivacyBudget implementation
void PrivacyBudget::addRound(double epsilon, double noise_scale) {
    if (epsilon < 0.0 || std::isnan(epsilon)) {
        throw std::invalid_argument("Privacy ledger epsilon must be non-negative");
    }
    epsilon_spent_ += epsilon;
    rounds_participated_++;
    ledger_.push_back({epsilon, noise_scale});
}

double PrivacyBudget::remaining(double max_epsilon) const {
    if (isExhausted(max_epsilon)) {
        return 0.0;
    }
    return max_epsilon - epsilon_spent_;
}

bool PrivacyBudget::isExhausted(double max_epsilon) const {
    return epsilon_spent_ >= max_epsilon - std::fabs(max_epsilon) * BUDGET_TOLERANCE;
}

double PrivacyBudget::averageEpsilonPerRound() const {
    return epsilon_spent_ / (rounds_participated_ > 1 ? rounds_participated_ : 1);
}

// GradientClipper implementation
GradientClipper::GradientClipper(double max_norm) : max_norm_(max_norm) {
    if (!(max_norm_ > 0.0)) {
        throw std::invalid_argument("Clipping norm must be positive");
    }
}

double GradientClipper::l2Norm(const Vector& values) {
    double sum = 0.0;
    for (double v : values) {
        sum += v * v;
    }
    return std::sqrt(sum);
}

ClipResult GradientClipper::clip(const Vector& values) {
    ClipResult result;
    result.original_norm = l2Norm(values);
    result.clipped = values;

    total_calls_++;
    if (result.original_norm > max_norm_) {
        const double scale = max_norm_ / result.original_norm;
        for (double& v : result.clipped) {
            v *= scale;
        }
        result.was_clipped = true;
        clipped_calls_++;
    }
    return result;
}

double GradientClipper::clipRate() const {
    const int64_t total = total_calls_.load();
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(clipped_calls_.load()) / total;
}

// GaussianNoiseGenerator implementation
GaussianNoiseGenerator::GaussianNoiseGenerator(uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        engine_.seed((static_cast<uint64_t>(rd()) << 32) | rd());
    } else {
        engine_.seed(seed);
    }
}

double GaussianNoiseGenerator::sample(double sigma) {
    if (sigma <= 0.0) {
        return 0.0;
    }
    std::normal_distribution<double> dist(0.0, sigma);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(engine_);
}

Vector GaussianNoiseGenerator::addNoise(const Vector& values, double sigma) {
    Vector noisy = values;
    if (sigma <= 0.0) {
        return noisy;
    }

    std::normal_distribution<double> dist(0.0, sigma);
    std::lock_guard<std::mutex> lock(mutex_);
    for (double& v : noisy) {
        v += dist(engine_);
    }
    return noisy;
}

double GaussianNoiseGenerator::calibrateNoise(double sensitivity, double epsilon, double delta) {
    if (!(epsilon > 0.0)) {
        throw std::invalid_argument("Epsilon must be positive");
    }
    if (!(delta > 0.0 && delta < 1.0)) {
        throw std::invalid_argument("Delta must lie in (0, 1)");
    }
    return sensitivity * std::sqrt(2.0 * std::log(1.25 / delta)) / epsilon;
}

// DifferentialPrivacy implementation
DifferentialPrivacy::DifferentialPrivacy(const DPConfig& config)
    : config_(config),
      clipper_(config.max_grad_norm),
      noise_(config.seed) {
    config_.validate();
}

double DifferentialPrivacy::noiseScale(int64_t num_samples) const {
    const double samples = static_cast<double>(num_samples > 1 ? num_samples : 1);
    return config_.noise_multiplier * config_.max_grad_norm / samples;
}

PrivatizedGradients DifferentialPrivacy::privatizeGradients(const Vector& gradients, int64_t num_samples) {
    ClipResult clipped = clipper_.clip(gradients);

    PrivatizedGradients result;
    result.original_norm = clipped.original_norm;
    result.noise_scale = noiseScale(num_samples);
    result.values = noise_.addNoise(clipped.clipped, result.noise_scale);

    std::lock_guard<std::mutex> lock(budget_mutex_);
    budget_.addRound(config_.perRoundEpsilon(), result.noise_scale);
    if (budget_.isExhausted(config_.target_epsilon)) {
        std::cerr << "[Privacy] Budget exhausted: epsilon spent " << budget_.epsilonSpent()
                  << " of " << config_.target_epsilon << std::endl;
    }
    return result;
}

std::pair<double, double> DifferentialPrivacy::getPrivacySpent() const {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    return {budget_.epsilonSpent(), config_.target_delta};
}

bool DifferentialPrivacy::canContinueTraining() const {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    return !budget_.isExhausted(config_.target_epsilon);
}

PrivacyBudget DifferentialPrivacy::budget() const {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    return budget_;
}

} // namespace fedcore
