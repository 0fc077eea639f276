/*
 * Adaptive aggregation strategy selection implementation
 */

#include "federated/adaptive_selector.h"
#include <iostream>

namespace fedcore {

AdaptiveAggregator::AdaptiveAggregator(double variance_threshold, size_t sample_dims)
    : Aggregator("adaptive"),
      variance_threshold_(variance_threshold),
      sample_dims_(sample_dims),
      krum_(1),
      trimmed_mean_(0.1) {}

std::string AdaptiveAggregator::selectStrategy(const std::vector<ModelUpdate>& updates,
                                               double* mean_variance) const {
    const size_t n = updates.size();
    double variance = 0.0;
    if (n >= 3) {
        variance = meanCoordinateVariance(extractVectors(updates), sample_dims_);
    }
    if (mean_variance) {
        *mean_variance = variance;
    }

    if (n >= 3 && variance > variance_threshold_) {
        return TRIMMED_MEAN;
    }
    if (n >= 5) {
        return KRUM;
    }
    return FEDAVG;
}

AggregationResult AdaptiveAggregator::runAggregation(const std::vector<ModelUpdate>& updates,
                                                     const GlobalModel* previous) {
    double variance = 0.0;
    const std::string strategy = selectStrategy(updates, &variance);

    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.push_back(strategy);
    }
    std::cout << "[AdaptiveAggregator] Selected " << strategy << " for " << updates.size()
              << " updates (variance " << variance << ")" << std::endl;

    AggregationResult result;
    if (strategy == TRIMMED_MEAN) {
        result = trimmed_mean_.aggregate(updates, previous);
    } else if (strategy == KRUM) {
        result = krum_.aggregate(updates, previous);
    } else {
        result = fedavg_.aggregate(updates, previous);
    }

    if (result.success) {
        AggregationDiagnostics diagnostics = result.diagnostics.value_or(AggregationDiagnostics());
        diagnostics.selected_strategy = strategy;
        diagnostics.mean_variance = variance;
        result.diagnostics = diagnostics;
    }
    return result;
}

StrategyStats AdaptiveAggregator::getStrategyStats() const {
    std::lock_guard<std::mutex> lock(history_mutex_);

    StrategyStats stats;
    stats.total_rounds = static_cast<int64_t>(history_.size());
    for (const auto& strategy : history_) {
        stats.strategies[strategy].count++;
    }
    for (auto& entry : stats.strategies) {
        entry.second.fraction = static_cast<double>(entry.second.count) / stats.total_rounds;
    }
    return stats;
}

std::vector<std::string> AdaptiveAggregator::selectionHistory() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_;
}

} // namespace fedcore
