/*
 * Robust statistics over flat parameter vectors
 * Distance matrices, coordinate-wise estimators and outlier detection
 */

#ifndef FEDCORE_ROBUST_STATS_H
#define FEDCORE_ROBUST_STATS_H

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fedcore {

using Vector = std::vector<double>;
using Matrix = std::vector<std::vector<double>>;

double euclideanDistance(const Vector& a, const Vector& b);

// Computes the symmetric n x n Euclidean distance matrix of a vector set.
// Implementations must return bit-identical matrices for the same input.
class DistanceBackend {
public:
    virtual ~DistanceBackend() = default;

    virtual std::string name() const = 0;
    virtual Matrix pairwiseDistances(const std::vector<Vector>& vectors) const = 0;
};

class PairwiseDistanceBackend : public DistanceBackend {
public:
    std::string name() const override { return "pairwise"; }
    Matrix pairwiseDistances(const std::vector<Vector>& vectors) const override;
};

// Splits rows of the upper triangle across worker threads. Each cell is
// written exactly once with the same arithmetic as the pairwise backend.
class ThreadedDistanceBackend : public DistanceBackend {
public:
    // 0 means std::thread::hardware_concurrency()
    explicit ThreadedDistanceBackend(unsigned num_threads = 0);

    std::string name() const override { return "threaded"; }
    Matrix pairwiseDistances(const std::vector<Vector>& vectors) const override;

    unsigned numThreads() const { return num_threads_; }

protected:
    // Starts one worker. Throws std::system_error when no thread can be created.
    virtual std::thread startWorker(std::function<void()> work) const;

private:
    unsigned num_threads_;
};

// Threaded when more than one hardware thread is available, pairwise otherwise
std::shared_ptr<DistanceBackend> makeDefaultDistanceBackend();

// Throws std::invalid_argument on empty input, length mismatch or zero total weight
Vector weightedAverage(const std::vector<Vector>& vectors, const std::vector<double>& weights);

Vector coordinateMedian(const std::vector<Vector>& vectors);

// Drops trim_count values from each end of every sorted coordinate
Vector coordinateTrimmedMean(const std::vector<Vector>& vectors, size_t trim_count);

// Mean of the per-coordinate population variance over the first
// min(sample_dims, dim) coordinates (all when sample_dims is 0)
double meanCoordinateVariance(const std::vector<Vector>& vectors, size_t sample_dims = 0);

double median(std::vector<double> values);

// Linear interpolation between closest ranks, p in [0, 100]
double percentile(std::vector<double> values, double p);

enum class OutlierMethod {
    IQR,
    ZSCORE,
    MAD
};

std::string outlierMethodToString(OutlierMethod method);
// Throws std::invalid_argument for unknown names
OutlierMethod outlierMethodFromString(const std::string& name);

// Indices (sorted, unique) of vectors with any coordinate outside the
// method's bounds. Fewer than 3 vectors never yield outliers.
std::vector<size_t> detectOutliers(const std::vector<Vector>& vectors, OutlierMethod method,
                                   double threshold = 3.0);

} // namespace fedcore

#endif // FEDCORE_ROBUST_STATS_H
