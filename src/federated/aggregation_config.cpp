/*
 * Configuration-driven aggregator construction implementation
 */

#include "federated/aggregation_config.h"
#include "federated/adaptive_selector.h"
#include "federated/byzantine_robust.h"
#include "federated/secure_aggregators.h"
#include "utils/config_manager.h"
#include <stdexcept>

namespace fedcore {

void AggregationConfig::loadFromConfig() {
    auto& config = utils::ConfigManager::getInstance();
    method = config.getString("aggregation.method", method);

    params.f = config.getInt("aggregation.f", params.f);
    params.m = config.getInt("aggregation.m", params.m);
    if (config.hasKey("aggregation.multi_krum")) {
        params.multi_krum = config.getBool("aggregation.multi_krum");
    }
    params.beta = config.getDouble("aggregation.beta", params.beta);
    params.adaptive = config.getBool("aggregation.adaptive", params.adaptive);
    params.outlier_method = outlierMethodFromString(
        config.getString("aggregation.outlier_method", outlierMethodToString(params.outlier_method)));

    variance_threshold = config.getDouble("aggregation.variance_threshold", variance_threshold);
    sample_dims = static_cast<size_t>(config.getUInt64("aggregation.sample_dims", sample_dims));

    enable_dp = config.getBool("privacy.enable_dp", enable_dp);
    dp.loadFromConfig();
}

std::unique_ptr<Aggregator> createAggregator(const AggregationConfig& config) {
    const std::string& method = config.method;
    if (method == "adaptive") {
        return std::make_unique<AdaptiveAggregator>(config.variance_threshold, config.sample_dims);
    }
    if (method == "secure_fedavg" || method == "secure_krum") {
        return getSecureAggregator(method, config.dp, config.enable_dp, config.params);
    }
    if (method == "enhanced_krum" || method == "adaptive_trimmed_mean" || isBaseAggregator(method)) {
        return getEnhancedAggregator(method, config.params);
    }
    throw std::invalid_argument("Unknown aggregator: " + method +
                                ". Available: fedavg, krum, trimmed_mean, median, enhanced_krum, "
                                "adaptive_trimmed_mean, secure_fedavg, secure_krum, adaptive");
}

} // namespace fedcore
