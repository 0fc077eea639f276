/*
 * Configuration-driven aggregator construction
 */

#ifndef FEDCORE_AGGREGATION_CONFIG_H
#define FEDCORE_AGGREGATION_CONFIG_H

#include <memory>
#include <string>

#include "federated/aggregators.h"
#include "federated/privacy.h"

namespace fedcore {

struct AggregationConfig {
    // fedavg, krum, trimmed_mean, median, enhanced_krum, adaptive_trimmed_mean,
    // secure_fedavg, secure_krum or adaptive
    std::string method = "fedavg";
    AggregatorParams params;

    bool enable_dp = false;
    DPConfig dp;

    // Adaptive selector settings
    double variance_threshold = 1.0;
    size_t sample_dims = 100;

    // Load configuration from ConfigManager
    void loadFromConfig();
};

// Throws std::invalid_argument for unknown methods or outlier method names
std::unique_ptr<Aggregator> createAggregator(const AggregationConfig& config);

} // namespace fedcore

#endif // FEDCORE_AGGREGATION_CONFIG_H
