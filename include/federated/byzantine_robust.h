/*
 * Byzantine-robust aggregation variants
 * Krum with adaptive f and trimmed mean with adaptive beta and outlier filtering
 */

#ifndef FEDCORE_BYZANTINE_ROBUST_H
#define FEDCORE_BYZANTINE_ROBUST_H

#include <memory>
#include <mutex>
#include <string>

#include "federated/aggregators.h"

namespace fedcore {

// Source of per-node trust in [0, 1]
class TrustProvider {
public:
    virtual ~TrustProvider() = default;
    virtual double trustScore(const std::string& node_id) const = 0;
};

struct EnhancedKrumStats {
    int64_t byzantine_detected = 0;
    int64_t total_rounds = 0;
    double avg_aggregation_time = 0.0;
};

class EnhancedKrumAggregator : public KrumAggregator {
public:
    // backend == nullptr resolves to makeDefaultDistanceBackend().
    // trust == nullptr treats every node as fully trusted.
    explicit EnhancedKrumAggregator(int f = 1, bool multi_krum = true, int m = 1,
                                    bool adaptive_f = true,
                                    std::shared_ptr<TrustProvider> trust = nullptr,
                                    std::shared_ptr<DistanceBackend> backend = nullptr);

    bool adaptiveF() const { return adaptive_f_; }

    // f used for a round of n updates; the configured f is left unchanged
    int effectiveF(const std::vector<ModelUpdate>& updates) const;

    EnhancedKrumStats getStats() const;

protected:
    AggregationResult runAggregation(const std::vector<ModelUpdate>& updates,
                                     const GlobalModel* previous) override;

private:
    bool adaptive_f_;
    std::shared_ptr<TrustProvider> trust_;
    PairwiseDistanceBackend fallback_backend_;

    mutable std::mutex stats_mutex_;
    EnhancedKrumStats stats_;

    Matrix computeDistances(const std::vector<Vector>& vectors, std::string& backend_used) const;
    double averageTrust(const std::vector<ModelUpdate>& updates) const;
};

struct AdaptiveTrimmedMeanStats {
    int64_t total_rounds = 0;
    double avg_trimmed = 0.0;
    int64_t outliers_detected = 0;
};

class AdaptiveTrimmedMeanAggregator : public TrimmedMeanAggregator {
public:
    static constexpr double HIGH_VARIANCE = 1.0;
    static constexpr double LOW_VARIANCE = 0.1;

    explicit AdaptiveTrimmedMeanAggregator(double beta = 0.1, bool adaptive_beta = true,
                                           OutlierMethod outlier_method = OutlierMethod::IQR);

    bool adaptiveBeta() const { return adaptive_beta_; }
    OutlierMethod outlierMethod() const { return outlier_method_; }

    // beta used for a round with the given mean coordinate variance
    double effectiveBeta(double mean_variance) const;

    AdaptiveTrimmedMeanStats getStats() const;

protected:
    AggregationResult runAggregation(const std::vector<ModelUpdate>& updates,
                                     const GlobalModel* previous) override;

private:
    bool adaptive_beta_;
    OutlierMethod outlier_method_;

    mutable std::mutex stats_mutex_;
    AdaptiveTrimmedMeanStats stats_;
};

// Names: enhanced_krum, adaptive_trimmed_mean, then everything getAggregator knows
std::unique_ptr<Aggregator> getEnhancedAggregator(const std::string& method,
                                                  const AggregatorParams& params = AggregatorParams());

} // namespace fedcore

#endif // FEDCORE_BYZANTINE_ROBUST_H
