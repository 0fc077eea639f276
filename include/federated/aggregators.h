/*
 * Aggregation strategies for federated learning
 * FedAvg, Krum / Multi-Krum, coordinate-wise trimmed mean and median
 */

#ifndef FEDCORE_AGGREGATORS_H
#define FEDCORE_AGGREGATORS_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "federated/model_protocol.h"
#include "federated/robust_stats.h"

namespace fedcore {

// Construction parameters shared by the factories. Each strategy reads the
// fields it understands and ignores the rest. An unset multi_krum leaves
// each strategy on its own default.
struct AggregatorParams {
    int f = 1;
    std::optional<bool> multi_krum;
    int m = 1;
    double beta = 0.1;
    bool adaptive = true;
    OutlierMethod outlier_method = OutlierMethod::IQR;
};

class Aggregator {
public:
    explicit Aggregator(std::string name) : name_(std::move(name)) {}
    virtual ~Aggregator() = default;

    const std::string& name() const { return name_; }

    // Never throws. Failures come back as success == false with a message;
    // aggregation_time_seconds is always set.
    AggregationResult aggregate(const std::vector<ModelUpdate>& updates,
                                const GlobalModel* previous = nullptr);

protected:
    virtual AggregationResult runAggregation(const std::vector<ModelUpdate>& updates,
                                             const GlobalModel* previous) = 0;

    // Flat vectors of every update; throws std::invalid_argument on empty
    // input or mismatched dimensions
    static std::vector<Vector> extractVectors(const std::vector<ModelUpdate>& updates);

    // Rebuilds layer structure from the first update, or a single "flat"
    // layer when it carries none
    static ModelWeights reconstructWeights(const Vector& flat, const std::vector<ModelUpdate>& updates);

    static GlobalModel buildGlobalModel(const Vector& flat,
                                        const std::vector<ModelUpdate>& updates,
                                        const GlobalModel* previous,
                                        const std::string& method,
                                        int64_t num_contributors);

    static std::vector<double> sampleWeights(const std::vector<ModelUpdate>& updates);

    static AggregationResult successResult(GlobalModel model, int64_t received, int64_t accepted);

private:
    std::string name_;
};

class FedAvgAggregator : public Aggregator {
public:
    FedAvgAggregator() : Aggregator("fedavg") {}

protected:
    AggregationResult runAggregation(const std::vector<ModelUpdate>& updates,
                                     const GlobalModel* previous) override;
};

class KrumAggregator : public Aggregator {
public:
    // backend == nullptr selects PairwiseDistanceBackend
    explicit KrumAggregator(int f = 1, bool multi_krum = false, int m = 1,
                            std::shared_ptr<DistanceBackend> backend = nullptr);

    int f() const { return f_; }
    bool multiKrum() const { return multi_krum_; }
    int m() const { return m_; }
    const DistanceBackend& distanceBackend() const { return *backend_; }

    static size_t minimumUpdates(int f) { return static_cast<size_t>(2 * f + 3); }

protected:
    KrumAggregator(std::string name, int f, bool multi_krum, int m,
                   std::shared_ptr<DistanceBackend> backend);

    AggregationResult runAggregation(const std::vector<ModelUpdate>& updates,
                                     const GlobalModel* previous) override;

    // Indices ordered by ascending (score, index)
    static std::vector<size_t> rankByScore(const Matrix& distances, int f,
                                           std::vector<double>* scores = nullptr);

    AggregationResult selectAndAverage(const std::vector<ModelUpdate>& updates,
                                       const std::vector<Vector>& vectors,
                                       const Matrix& distances,
                                       const GlobalModel* previous,
                                       int effective_f,
                                       const std::string& method,
                                       const std::string& backend_name) const;

    AggregationResult quorumFailure(size_t n) const;

    int f_;
    bool multi_krum_;
    int m_;
    std::shared_ptr<DistanceBackend> backend_;
};

class TrimmedMeanAggregator : public Aggregator {
public:
    static constexpr double MAX_BETA = 0.49;

    // beta is clamped to [0, MAX_BETA]
    explicit TrimmedMeanAggregator(double beta = 0.1);

    double beta() const { return beta_; }

    static double clampBeta(double beta);
    static std::string formatBeta(double beta);

protected:
    TrimmedMeanAggregator(std::string name, double beta);

    AggregationResult runAggregation(const std::vector<ModelUpdate>& updates,
                                     const GlobalModel* previous) override;

    double beta_;
};

class MedianAggregator : public Aggregator {
public:
    MedianAggregator() : Aggregator("median") {}

protected:
    AggregationResult runAggregation(const std::vector<ModelUpdate>& updates,
                                     const GlobalModel* previous) override;
};

// True for the names getAggregator accepts
bool isBaseAggregator(const std::string& method);

// Names: fedavg, krum, trimmed_mean, median.
// Throws std::invalid_argument listing the available names otherwise.
std::unique_ptr<Aggregator> getAggregator(const std::string& method,
                                          const AggregatorParams& params = AggregatorParams());

} // namespace fedcore

#endif // FEDCORE_AGGREGATORS_H
