/*
 * Privacy-preserving aggregators
 * Clip, optionally noise, then delegate to FedAvg or Krum
 */

#ifndef FEDCORE_SECURE_AGGREGATORS_H
#define FEDCORE_SECURE_AGGREGATORS_H

#include <memory>
#include <mutex>
#include <string>

#include "federated/aggregators.h"
#include "federated/privacy.h"

namespace fedcore {

class SecureAggregator : public Aggregator {
public:
    bool dpEnabled() const { return enable_dp_; }
    const DPConfig& dpConfig() const { return dp_config_; }

    PrivacyBudget privacyBudget() const;
    bool canContinueTraining() const;
    double clipRate() const { return clipper_.clipRate(); }

    // Clipped (and, with DP on, noised) copies of the updates
    std::vector<ModelUpdate> protectUpdates(const std::vector<ModelUpdate>& updates);

protected:
    SecureAggregator(std::string name, std::unique_ptr<Aggregator> inner,
                     const DPConfig& dp_config, bool enable_dp);

    AggregationResult runAggregation(const std::vector<ModelUpdate>& updates,
                                     const GlobalModel* previous) override;

private:
    std::unique_ptr<Aggregator> inner_;
    DPConfig dp_config_;
    bool enable_dp_;
    GradientClipper clipper_;
    GaussianNoiseGenerator noise_;

    mutable std::mutex budget_mutex_;
    PrivacyBudget budget_;
};

class SecureFedAvgAggregator : public SecureAggregator {
public:
    explicit SecureFedAvgAggregator(const DPConfig& dp_config = DPConfig(), bool enable_dp = true);
};

class SecureKrumAggregator : public SecureAggregator {
public:
    explicit SecureKrumAggregator(int f = 1, bool multi_krum = false, int m = 1,
                                  const DPConfig& dp_config = DPConfig(), bool enable_dp = true);
};

// Names: secure_fedavg, secure_krum, then everything getAggregator knows
std::unique_ptr<Aggregator> getSecureAggregator(const std::string& method,
                                                const DPConfig& dp_config = DPConfig(),
                                                bool enable_dp = true,
                                                const AggregatorParams& params = AggregatorParams());

} // namespace fedcore

#endif // FEDCORE_SECURE_AGGREGATORS_H
