/*
 * Adaptive aggregation strategy selection
 * Chooses FedAvg, Krum or trimmed mean per round from the update statistics
 */

#ifndef FEDCORE_ADAPTIVE_SELECTOR_H
#define FEDCORE_ADAPTIVE_SELECTOR_H

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "federated/aggregators.h"

namespace fedcore {

struct StrategyUsage {
    int64_t count = 0;
    double fraction = 0.0;
};

struct StrategyStats {
    int64_t total_rounds = 0;
    std::map<std::string, StrategyUsage> strategies;
};

class AdaptiveAggregator : public Aggregator {
public:
    static constexpr const char* FEDAVG = "fedavg";
    static constexpr const char* KRUM = "krum";
    static constexpr const char* TRIMMED_MEAN = "trimmed_mean";

    explicit AdaptiveAggregator(double variance_threshold = 1.0, size_t sample_dims = 100);

    // High variance with n >= 3 picks trimmed mean, otherwise n >= 5 picks
    // Krum, otherwise FedAvg
    std::string selectStrategy(const std::vector<ModelUpdate>& updates,
                               double* mean_variance = nullptr) const;

    StrategyStats getStrategyStats() const;
    std::vector<std::string> selectionHistory() const;

    double varianceThreshold() const { return variance_threshold_; }
    size_t sampleDims() const { return sample_dims_; }

protected:
    AggregationResult runAggregation(const std::vector<ModelUpdate>& updates,
                                     const GlobalModel* previous) override;

private:
    double variance_threshold_;
    size_t sample_dims_;

    FedAvgAggregator fedavg_;
    KrumAggregator krum_;
    TrimmedMeanAggregator trimmed_mean_;

    mutable std::mutex history_mutex_;
    std::vector<std::string> history_;
};

} // namespace fedcore

#endif // FEDCORE_ADAPTIVE_SELECTOR_H
