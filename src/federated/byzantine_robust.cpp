/*
 * Byzantine-robust aggregation variants implementation
 */

#include "federated/byzantine_robust.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <set>

namespace fedcore {

namespace {

constexpr double HIGH_TRUST = 0.8;
constexpr double LOW_TRUST = 0.5;

} // namespace

// EnhancedKrumAggregator implementation
EnhancedKrumAggregator::EnhancedKrumAggregator(int f, bool multi_krum, int m, bool adaptive_f,
                                               std::shared_ptr<TrustProvider> trust,
                                               std::shared_ptr<DistanceBackend> backend)
    : KrumAggregator("enhanced_krum", f, multi_krum, m,
                     backend ? std::move(backend) : makeDefaultDistanceBackend()),
      adaptive_f_(adaptive_f),
      trust_(std::move(trust)) {}

double EnhancedKrumAggregator::averageTrust(const std::vector<ModelUpdate>& updates) const {
    if (!trust_ || updates.empty()) {
        return 1.0;
    }
    double total = 0.0;
    for (const auto& update : updates) {
        total += trust_->trustScore(update.node_id);
    }
    return total / updates.size();
}

int EnhancedKrumAggregator::effectiveF(const std::vector<ModelUpdate>& updates) const {
    if (!adaptive_f_) {
        return f_;
    }

    const double trust = averageTrust(updates);
    if (trust > HIGH_TRUST) {
        // Capped at the configured f used for the quorum check
        return std::min(f_, std::max(1, f_ - 1));
    }
    if (trust < LOW_TRUST) {
        const int n = static_cast<int>(updates.size());
        return std::max(0, std::min(f_ + 1, (n - 3) / 2));
    }
    return f_;
}

Matrix EnhancedKrumAggregator::computeDistances(const std::vector<Vector>& vectors,
                                                std::string& backend_used) const {
    try {
        Matrix distances = backend_->pairwiseDistances(vectors);
        backend_used = backend_->name();
        return distances;
    } catch (const std::exception& e) {
        std::cerr << "[EnhancedKrum] " << backend_->name() << " distance backend failed ("
                  << e.what() << "), falling back to " << fallback_backend_.name() << std::endl;
    }
    backend_used = fallback_backend_.name();
    return fallback_backend_.pairwiseDistances(vectors);
}

AggregationResult EnhancedKrumAggregator::runAggregation(const std::vector<ModelUpdate>& updates,
                                                         const GlobalModel* previous) {
    auto start_time = std::chrono::steady_clock::now();

    if (updates.size() < minimumUpdates(f_)) {
        return quorumFailure(updates.size());
    }

    const int f_eff = effectiveF(updates);
    std::vector<Vector> vectors = extractVectors(updates);

    std::string backend_used;
    Matrix distances = computeDistances(vectors, backend_used);

    AggregationResult result = selectAndAverage(updates, vectors, distances, previous, f_eff,
                                                "enhanced_krum_f" + std::to_string(f_eff),
                                                backend_used);

    auto end_time = std::chrono::steady_clock::now();
    const double elapsed = std::chrono::duration<double>(end_time - start_time).count();

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.byzantine_detected += static_cast<int64_t>(result.suspected_byzantine.size());
        stats_.total_rounds++;
        stats_.avg_aggregation_time +=
            (elapsed - stats_.avg_aggregation_time) / stats_.total_rounds;
    }

    return result;
}

EnhancedKrumStats EnhancedKrumAggregator::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

// AdaptiveTrimmedMeanAggregator implementation
AdaptiveTrimmedMeanAggregator::AdaptiveTrimmedMeanAggregator(double beta, bool adaptive_beta,
                                                             OutlierMethod outlier_method)
    : TrimmedMeanAggregator("adaptive_trimmed_mean", beta),
      adaptive_beta_(adaptive_beta),
      outlier_method_(outlier_method) {}

double AdaptiveTrimmedMeanAggregator::effectiveBeta(double mean_variance) const {
    if (!adaptive_beta_) {
        return beta_;
    }
    if (mean_variance > HIGH_VARIANCE) {
        return clampBeta(std::min(0.3, beta_ * 1.5));
    }
    if (mean_variance < LOW_VARIANCE) {
        return clampBeta(std::max(0.05, beta_ * 0.5));
    }
    return beta_;
}

AggregationResult AdaptiveTrimmedMeanAggregator::runAggregation(const std::vector<ModelUpdate>& updates,
                                                                const GlobalModel* previous) {
    const size_t n = updates.size();
    if (n < 3) {
        return AggregationResult::failure("Trimmed mean requires at least 3 updates");
    }

    std::vector<Vector> vectors = extractVectors(updates);
    const double variance = meanCoordinateVariance(vectors);
    const double beta = effectiveBeta(variance);
    const size_t trim_count = static_cast<size_t>(std::floor(n * beta));

    std::vector<size_t> outliers = detectOutliers(vectors, outlier_method_);
    std::set<size_t> outlier_set(outliers.begin(), outliers.end());

    Vector aggregated(vectors[0].size());
    for (size_t d = 0; d < aggregated.size(); ++d) {
        std::vector<double> all_values;
        std::vector<double> kept;
        all_values.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            all_values.push_back(vectors[i][d]);
            if (outlier_set.count(i) == 0) {
                kept.push_back(vectors[i][d]);
            }
        }
        if (kept.size() < 2) {
            kept = all_values;
        }
        std::sort(kept.begin(), kept.end());

        size_t begin = 0;
        size_t end = kept.size();
        if (trim_count > 0 && kept.size() > 2 * trim_count) {
            begin = trim_count;
            end = kept.size() - trim_count;
        }

        double sum = 0.0;
        for (size_t i = begin; i < end; ++i) {
            sum += kept[i];
        }
        aggregated[d] = sum / (end - begin);
    }

    const int64_t accepted = static_cast<int64_t>(n - 2 * trim_count);
    GlobalModel model = buildGlobalModel(aggregated, updates, previous,
                                         "adaptive_trimmed_mean_b" + formatBeta(beta), accepted);

    AggregationResult result = successResult(std::move(model), static_cast<int64_t>(n), accepted);
    AggregationDiagnostics diagnostics;
    diagnostics.effective_beta = beta;
    diagnostics.outliers_removed = static_cast<int64_t>(outliers.size());
    diagnostics.mean_variance = variance;
    result.diagnostics = diagnostics;

    if (!outliers.empty()) {
        std::cout << "[AdaptiveTrimmedMean] " << outliers.size() << " outlier update(s) filtered using "
                  << outlierMethodToString(outlier_method_) << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.outliers_detected += static_cast<int64_t>(outliers.size());
        stats_.total_rounds++;
        stats_.avg_trimmed += (2.0 * trim_count - stats_.avg_trimmed) / stats_.total_rounds;
    }

    return result;
}

AdaptiveTrimmedMeanStats AdaptiveTrimmedMeanAggregator::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

std::unique_ptr<Aggregator> getEnhancedAggregator(const std::string& method, const AggregatorParams& params) {
    if (method == "enhanced_krum") {
        return std::make_unique<EnhancedKrumAggregator>(params.f, params.multi_krum.value_or(true),
                                                        params.m, params.adaptive);
    }
    if (method == "adaptive_trimmed_mean") {
        return std::make_unique<AdaptiveTrimmedMeanAggregator>(params.beta, params.adaptive,
                                                               params.outlier_method);
    }
    if (!isBaseAggregator(method)) {
        throw std::invalid_argument("Unknown aggregator: " + method +
                                    ". Available: enhanced_krum, adaptive_trimmed_mean, "
                                    "fedavg, krum, trimmed_mean, median");
    }
    return getAggregator(method, params);
}

} // namespace fedcore
