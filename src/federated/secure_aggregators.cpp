/*
 * Privacy-preserving aggregators implementation
 */

#include "federated/secure_aggregators.h"
#include "federated/parameter_codec.h"
#include <iostream>
#include <stdexcept>

namespace fedcore {

SecureAggregator::SecureAggregator(std::string name, std::unique_ptr<Aggregator> inner,
                                   const DPConfig& dp_config, bool enable_dp)
    : Aggregator(std::move(name)),
      inner_(std::move(inner)),
      dp_config_(dp_config),
      enable_dp_(enable_dp),
      clipper_(dp_config.max_grad_norm),
      noise_(dp_config.seed) {
    dp_config_.validate();
}

std::vector<ModelUpdate> SecureAggregator::protectUpdates(const std::vector<ModelUpdate>& updates) {
    std::vector<ModelUpdate> protected_updates;
    protected_updates.reserve(updates.size());

    for (const auto& update : updates) {
        ClipResult clipped = clipper_.clip(update.weights.toFlatVector());
        Vector values = std::move(clipped.clipped);

        double sigma = 0.0;
        if (enable_dp_) {
            sigma = dp_config_.noise_multiplier * dp_config_.max_grad_norm /
                    static_cast<double>(update.effectiveSamples());
            values = noise_.addNoise(values, sigma);
        }

        ModelWeights weights = ParameterCodec::reconstruct(values, ParameterCodec::layerShapes(update.weights));
        weights.metadata = update.weights.metadata;

        ModelUpdate protected_update = update.withWeights(std::move(weights));
        protected_update.clip_norm = dp_config_.max_grad_norm;
        protected_update.noise_scale = sigma;
        protected_updates.push_back(std::move(protected_update));
    }

    return protected_updates;
}

AggregationResult SecureAggregator::runAggregation(const std::vector<ModelUpdate>& updates,
                                                   const GlobalModel* previous) {
    if (updates.empty()) {
        return AggregationResult::failure("No updates to aggregate");
    }

    AggregationResult result = inner_->aggregate(protectUpdates(updates), previous);
    if (!result.success) {
        return result;
    }

    result.global_model->aggregation_method = "secure_" + result.global_model->aggregation_method;

    if (enable_dp_) {
        const double epsilon = dp_config_.perRoundEpsilon();
        std::lock_guard<std::mutex> lock(budget_mutex_);
        budget_.addRound(epsilon, dp_config_.noise_multiplier);
        result.privacy_epsilon_spent = epsilon;
        result.privacy_budget_remaining = budget_.remaining(dp_config_.target_epsilon);

        if (budget_.isExhausted(dp_config_.target_epsilon)) {
            std::cerr << "[" << name() << "] Privacy budget exhausted after "
                      << budget_.roundsParticipated() << " rounds" << std::endl;
        }
    }

    return result;
}

PrivacyBudget SecureAggregator::privacyBudget() const {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    return budget_;
}

bool SecureAggregator::canContinueTraining() const {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    return !budget_.isExhausted(dp_config_.target_epsilon);
}

SecureFedAvgAggregator::SecureFedAvgAggregator(const DPConfig& dp_config, bool enable_dp)
    : SecureAggregator("secure_fedavg", std::make_unique<FedAvgAggregator>(), dp_config, enable_dp) {}

SecureKrumAggregator::SecureKrumAggregator(int f, bool multi_krum, int m,
                                           const DPConfig& dp_config, bool enable_dp)
    : SecureAggregator("secure_krum", std::make_unique<KrumAggregator>(f, multi_krum, m),
                       dp_config, enable_dp) {}

std::unique_ptr<Aggregator> getSecureAggregator(const std::string& method, const DPConfig& dp_config,
                                                bool enable_dp, const AggregatorParams& params) {
    if (method == "secure_fedavg") {
        return std::make_unique<SecureFedAvgAggregator>(dp_config, enable_dp);
    }
    if (method == "secure_krum") {
        return std::make_unique<SecureKrumAggregator>(params.f, params.multi_krum.value_or(false),
                                                      params.m, dp_config, enable_dp);
    }
    if (!isBaseAggregator(method)) {
        throw std::invalid_argument("Unknown aggregator: " + method +
                                    ". Available: secure_fedavg, secure_krum, "
                                    "fedavg, krum, trimmed_mean, median");
    }
    return getAggregator(method, params);
}

} // namespace fedcore
