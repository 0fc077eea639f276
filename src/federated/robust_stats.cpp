/*
 * Robust statistics implementation
 */

#include "federated/robust_stats.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace fedcore {

namespace {

constexpr double EPSILON = 1e-8;
constexpr double IQR_FENCE = 1.5;

void checkDimensions(const std::vector<Vector>& vectors) {
    if (vectors.empty()) {
        throw std::invalid_argument("No vectors to aggregate");
    }
    const size_t dim = vectors[0].size();
    for (const auto& v : vectors) {
        if (v.size() != dim) {
            throw std::invalid_argument("Parameter dimension mismatch between vectors");
        }
    }
}

std::vector<double> column(const std::vector<Vector>& vectors, size_t d) {
    std::vector<double> values;
    values.reserve(vectors.size());
    for (const auto& v : vectors) {
        values.push_back(v[d]);
    }
    return values;
}

void fillDistanceRow(const std::vector<Vector>& vectors, size_t i, Matrix& distances) {
    for (size_t j = i + 1; j < vectors.size(); ++j) {
        double dist = euclideanDistance(vectors[i], vectors[j]);
        distances[i][j] = dist;
        distances[j][i] = dist;
    }
}

} // namespace

double euclideanDistance(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Cannot compute distance between vectors of different length");
    }
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double diff = a[i] - b[i];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

Matrix PairwiseDistanceBackend::pairwiseDistances(const std::vector<Vector>& vectors) const {
    const size_t n = vectors.size();
    Matrix distances(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        fillDistanceRow(vectors, i, distances);
    }
    return distances;
}

ThreadedDistanceBackend::ThreadedDistanceBackend(unsigned num_threads)
    : num_threads_(num_threads) {
    if (num_threads_ == 0) {
        num_threads_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

Matrix ThreadedDistanceBackend::pairwiseDistances(const std::vector<Vector>& vectors) const {
    const size_t n = vectors.size();
    Matrix distances(n, std::vector<double>(n, 0.0));

    const size_t workers = std::min<size_t>(num_threads_, n);
    if (workers <= 1) {
        for (size_t i = 0; i < n; ++i) {
            fillDistanceRow(vectors, i, distances);
        }
        return distances;
    }

    // Rows are interleaved so that the shrinking upper triangle is spread evenly
    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
        for (size_t t = 0; t < workers; ++t) {
            threads.push_back(startWorker([&vectors, &distances, t, workers, n]() {
                for (size_t i = t; i < n; i += workers) {
                    fillDistanceRow(vectors, i, distances);
                }
            }));
        }
    } catch (...) {
        // Workers already running still reference distances
        for (auto& thread : threads) {
            thread.join();
        }
        throw;
    }

    for (auto& thread : threads) {
        thread.join();
    }

    return distances;
}

std::thread ThreadedDistanceBackend::startWorker(std::function<void()> work) const {
    return std::thread(std::move(work));
}

std::shared_ptr<DistanceBackend> makeDefaultDistanceBackend() {
    if (std::thread::hardware_concurrency() > 1) {
        return std::make_shared<ThreadedDistanceBackend>();
    }
    return std::make_shared<PairwiseDistanceBackend>();
}

Vector weightedAverage(const std::vector<Vector>& vectors, const std::vector<double>& weights) {
    checkDimensions(vectors);
    if (weights.size() != vectors.size()) {
        throw std::invalid_argument("Weight count does not match vector count");
    }

    double total_weight = 0.0;
    for (double w : weights) {
        total_weight += w;
    }
    if (total_weight <= 0.0) {
        throw std::invalid_argument("Total aggregation weight must be positive");
    }

    Vector result(vectors[0].size(), 0.0);
    for (size_t i = 0; i < vectors.size(); ++i) {
        const double w = weights[i] / total_weight;
        for (size_t d = 0; d < result.size(); ++d) {
            result[d] += vectors[i][d] * w;
        }
    }
    return result;
}

double median(std::vector<double> values) {
    if (values.empty()) {
        throw std::invalid_argument("Median of empty set");
    }
    std::sort(values.begin(), values.end());
    const size_t n = values.size();
    if (n % 2 == 1) {
        return values[n / 2];
    }
    return (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

double percentile(std::vector<double> values, double p) {
    if (values.empty()) {
        throw std::invalid_argument("Percentile of empty set");
    }
    std::sort(values.begin(), values.end());
    p = std::min(100.0, std::max(0.0, p));

    const double rank = (p / 100.0) * (values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(rank));
    const size_t upper = std::min(lower + 1, values.size() - 1);
    const double fraction = rank - lower;
    return values[lower] + (values[upper] - values[lower]) * fraction;
}

Vector coordinateMedian(const std::vector<Vector>& vectors) {
    checkDimensions(vectors);
    Vector result(vectors[0].size());
    for (size_t d = 0; d < result.size(); ++d) {
        result[d] = median(column(vectors, d));
    }
    return result;
}

Vector coordinateTrimmedMean(const std::vector<Vector>& vectors, size_t trim_count) {
    checkDimensions(vectors);
    const size_t n = vectors.size();
    if (2 * trim_count >= n) {
        throw std::invalid_argument("Trim count leaves no values to average");
    }

    Vector result(vectors[0].size());
    for (size_t d = 0; d < result.size(); ++d) {
        std::vector<double> values = column(vectors, d);
        std::sort(values.begin(), values.end());

        double sum = 0.0;
        for (size_t i = trim_count; i < n - trim_count; ++i) {
            sum += values[i];
        }
        result[d] = sum / (n - 2 * trim_count);
    }
    return result;
}

double meanCoordinateVariance(const std::vector<Vector>& vectors, size_t sample_dims) {
    checkDimensions(vectors);
    size_t dims = vectors[0].size();
    if (sample_dims > 0) {
        dims = std::min(dims, sample_dims);
    }
    if (dims == 0) {
        return 0.0;
    }

    const double n = static_cast<double>(vectors.size());
    double total = 0.0;
    for (size_t d = 0; d < dims; ++d) {
        double mean = 0.0;
        for (const auto& v : vectors) {
            mean += v[d];
        }
        mean /= n;

        double var = 0.0;
        for (const auto& v : vectors) {
            var += (v[d] - mean) * (v[d] - mean);
        }
        total += var / n;
    }
    return total / dims;
}

std::string outlierMethodToString(OutlierMethod method) {
    switch (method) {
        case OutlierMethod::IQR: return "iqr";
        case OutlierMethod::ZSCORE: return "zscore";
        case OutlierMethod::MAD: return "mad";
    }
    return "unknown";
}

OutlierMethod outlierMethodFromString(const std::string& name) {
    if (name == "iqr") return OutlierMethod::IQR;
    if (name == "zscore") return OutlierMethod::ZSCORE;
    if (name == "mad") return OutlierMethod::MAD;
    throw std::invalid_argument("Unknown outlier method: " + name + " (available: iqr, zscore, mad)");
}

std::vector<size_t> detectOutliers(const std::vector<Vector>& vectors, OutlierMethod method,
                                   double threshold) {
    const size_t n = vectors.size();
    if (n < 3) {
        return {};
    }
    checkDimensions(vectors);

    std::vector<bool> flagged(n, false);
    for (size_t d = 0; d < vectors[0].size(); ++d) {
        std::vector<double> values = column(vectors, d);

        switch (method) {
            case OutlierMethod::IQR: {
                const double q1 = percentile(values, 25.0);
                const double q3 = percentile(values, 75.0);
                const double iqr = q3 - q1;
                const double lower = q1 - IQR_FENCE * iqr;
                const double upper = q3 + IQR_FENCE * iqr;
                for (size_t i = 0; i < n; ++i) {
                    if (values[i] < lower || values[i] > upper) {
                        flagged[i] = true;
                    }
                }
                break;
            }
            case OutlierMethod::ZSCORE: {
                double mean = 0.0;
                for (double v : values) {
                    mean += v;
                }
                mean /= n;
                double var = 0.0;
                for (double v : values) {
                    var += (v - mean) * (v - mean);
                }
                const double stddev = std::sqrt(var / n);
                for (size_t i = 0; i < n; ++i) {
                    if (std::abs(values[i] - mean) / (stddev + EPSILON) > threshold) {
                        flagged[i] = true;
                    }
                }
                break;
            }
            case OutlierMethod::MAD: {
                const double med = median(values);
                std::vector<double> deviations;
                deviations.reserve(n);
                for (double v : values) {
                    deviations.push_back(std::abs(v - med));
                }
                const double mad = median(deviations);
                for (size_t i = 0; i < n; ++i) {
                    if (deviations[i] / (mad + EPSILON) > threshold) {
                        flagged[i] = true;
                    }
                }
                break;
            }
        }
    }

    std::vector<size_t> outliers;
    for (size_t i = 0; i < n; ++i) {
        if (flagged[i]) {
            outliers.push_back(i);
        }
    }
    return outliers;
}

} // namespace fedcore
