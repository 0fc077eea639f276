/*
 * Aggregation strategies implementation
 */

#include "federated/aggregators.h"
#include "federated/parameter_codec.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <numeric>
#include <stdexcept>

namespace fedcore {

// Aggregator base implementation
AggregationResult Aggregator::aggregate(const std::vector<ModelUpdate>& updates,
                                        const GlobalModel* previous) {
    auto start_time = std::chrono::steady_clock::now();

    AggregationResult result;
    try {
        result = runAggregation(updates, previous);
    } catch (const std::exception& e) {
        std::cerr << "[" << name_ << "] Aggregation failed: " << e.what() << std::endl;
        result = AggregationResult::failure(e.what());
    }

    if (!result.success) {
        result.global_model.reset();
        result.updates_received = static_cast<int64_t>(updates.size());
    }

    auto end_time = std::chrono::steady_clock::now();
    result.aggregation_time_seconds = std::chrono::duration<double>(end_time - start_time).count();
    return result;
}

std::vector<Vector> Aggregator::extractVectors(const std::vector<ModelUpdate>& updates) {
    if (updates.empty()) {
        throw std::invalid_argument("No updates to aggregate");
    }

    std::vector<Vector> vectors;
    vectors.reserve(updates.size());
    for (const auto& update : updates) {
        vectors.push_back(update.weights.toFlatVector());
        if (vectors.back().size() != vectors.front().size()) {
            throw std::invalid_argument("Parameter dimension mismatch: update from " + update.node_id +
                                        " has " + std::to_string(vectors.back().size()) +
                                        " values, expected " +
                                        std::to_string(vectors.front().size()));
        }
    }
    return vectors;
}

ModelWeights Aggregator::reconstructWeights(const Vector& flat, const std::vector<ModelUpdate>& updates) {
    const ModelWeights& template_weights = updates.front().weights;
    if (template_weights.empty()) {
        ModelWeights weights;
        weights.layer_weights["flat"] = flat;
        return weights;
    }

    ModelWeights weights = ParameterCodec::reconstruct(flat, ParameterCodec::layerShapes(template_weights));
    weights.metadata = template_weights.metadata;
    return weights;
}

GlobalModel Aggregator::buildGlobalModel(const Vector& flat,
                                         const std::vector<ModelUpdate>& updates,
                                         const GlobalModel* previous,
                                         const std::string& method,
                                         int64_t num_contributors) {
    int64_t version = previous ? previous->version + 1 : 1;
    int64_t round_number = 0;
    int64_t total_samples = 0;
    double training_loss = 0.0;
    double validation_loss = 0.0;
    for (const auto& update : updates) {
        round_number = std::max(round_number, update.round_number);
        total_samples += update.num_samples;
        training_loss += update.training_loss;
        validation_loss += update.validation_loss;
    }

    GlobalModel model(version, round_number, reconstructWeights(flat, updates),
                      previous ? previous->weights_hash : "");
    model.num_contributors = num_contributors;
    model.total_samples = total_samples;
    model.aggregation_method = method;
    model.avg_training_loss = training_loss / updates.size();
    model.avg_validation_loss = validation_loss / updates.size();
    return model;
}

std::vector<double> Aggregator::sampleWeights(const std::vector<ModelUpdate>& updates) {
    std::vector<double> weights;
    weights.reserve(updates.size());
    for (const auto& update : updates) {
        weights.push_back(static_cast<double>(update.effectiveSamples()));
    }
    return weights;
}

AggregationResult Aggregator::successResult(GlobalModel model, int64_t received, int64_t accepted) {
    AggregationResult result;
    result.success = true;
    result.global_model = std::move(model);
    result.updates_received = received;
    result.updates_accepted = accepted;
    result.updates_rejected = received - accepted;
    return result;
}

// FedAvgAggregator implementation
AggregationResult FedAvgAggregator::runAggregation(const std::vector<ModelUpdate>& updates,
                                                   const GlobalModel* previous) {
    if (updates.empty()) {
        return AggregationResult::failure("No updates to aggregate");
    }

    std::vector<Vector> vectors = extractVectors(updates);
    Vector averaged = weightedAverage(vectors, sampleWeights(updates));

    const int64_t n = static_cast<int64_t>(updates.size());
    GlobalModel model = buildGlobalModel(averaged, updates, previous, "fedavg", n);

    // FedAvg reports the sample counts it actually weighted by
    model.total_samples = 0;
    for (const auto& update : updates) {
        model.total_samples += update.effectiveSamples();
    }
    return successResult(std::move(model), n, n);
}

// KrumAggregator implementation
KrumAggregator::KrumAggregator(int f, bool multi_krum, int m, std::shared_ptr<DistanceBackend> backend)
    : KrumAggregator(multi_krum ? "multi_krum" : "krum", f, multi_krum, m, std::move(backend)) {}

KrumAggregator::KrumAggregator(std::string name, int f, bool multi_krum, int m,
                               std::shared_ptr<DistanceBackend> backend)
    : Aggregator(std::move(name)),
      f_(f),
      multi_krum_(multi_krum),
      m_(m),
      backend_(std::move(backend)) {
    if (f_ < 0) {
        throw std::invalid_argument("Krum f must be non-negative");
    }
    if (m_ < 1) {
        throw std::invalid_argument("Multi-Krum m must be at least 1");
    }
    if (!backend_) {
        backend_ = std::make_shared<PairwiseDistanceBackend>();
    }
}

AggregationResult KrumAggregator::quorumFailure(size_t n) const {
    return AggregationResult::failure("Krum requires at least " + std::to_string(minimumUpdates(f_)) +
                                      " updates, got " + std::to_string(n));
}

AggregationResult KrumAggregator::runAggregation(const std::vector<ModelUpdate>& updates,
                                                 const GlobalModel* previous) {
    if (updates.size() < minimumUpdates(f_)) {
        return quorumFailure(updates.size());
    }

    std::vector<Vector> vectors = extractVectors(updates);
    Matrix distances = backend_->pairwiseDistances(vectors);

    std::string method = (multi_krum_ ? "multi_krum_f" : "krum_f") + std::to_string(f_);
    return selectAndAverage(updates, vectors, distances, previous, f_, method, backend_->name());
}

std::vector<size_t> KrumAggregator::rankByScore(const Matrix& distances, int f, std::vector<double>* scores) {
    const size_t n = distances.size();
    const long closest = static_cast<long>(n) - f - 2;
    const size_t k = static_cast<size_t>(std::max(1L, closest));

    std::vector<double> score(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        std::vector<double> others;
        others.reserve(n - 1);
        for (size_t j = 0; j < n; ++j) {
            if (j != i) {
                others.push_back(distances[i][j]);
            }
        }
        std::sort(others.begin(), others.end());
        const size_t count = std::min(k, others.size());
        for (size_t j = 0; j < count; ++j) {
            score[i] += others[j];
        }
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&score](size_t a, size_t b) {
        return score[a] < score[b];
    });

    if (scores) {
        *scores = std::move(score);
    }
    return order;
}

AggregationResult KrumAggregator::selectAndAverage(const std::vector<ModelUpdate>& updates,
                                                   const std::vector<Vector>& vectors,
                                                   const Matrix& distances,
                                                   const GlobalModel* previous,
                                                   int effective_f,
                                                   const std::string& method,
                                                   const std::string& backend_name) const {
    const size_t n = updates.size();
    std::vector<size_t> order = rankByScore(distances, effective_f);

    size_t selected_count = 1;
    if (multi_krum_) {
        const size_t upper = n - static_cast<size_t>(effective_f);
        selected_count = std::max<size_t>(1, std::min(static_cast<size_t>(m_), upper));
    }

    std::vector<ModelUpdate> selected_updates;
    std::vector<Vector> selected_vectors;
    for (size_t i = 0; i < selected_count; ++i) {
        selected_updates.push_back(updates[order[i]]);
        selected_vectors.push_back(vectors[order[i]]);
    }

    Vector aggregated = selected_count == 1
        ? selected_vectors.front()
        : weightedAverage(selected_vectors, sampleWeights(selected_updates));

    std::vector<std::string> suspected;
    const size_t suspect_count = std::min(static_cast<size_t>(effective_f), n);
    for (size_t i = 0; i < suspect_count; ++i) {
        suspected.push_back(updates[order[n - 1 - i]].node_id);
    }

    GlobalModel model = buildGlobalModel(aggregated, updates, previous, method,
                                         static_cast<int64_t>(selected_count));
    AggregationResult result = successResult(std::move(model), static_cast<int64_t>(n),
                                             static_cast<int64_t>(selected_count));
    result.suspected_byzantine = suspected;

    AggregationDiagnostics diagnostics;
    diagnostics.distance_backend = backend_name;
    diagnostics.effective_f = effective_f;
    result.diagnostics = diagnostics;

    if (!suspected.empty()) {
        std::cout << "[Krum] Selected " << selected_count << " of " << n
                  << " updates, most suspicious: " << suspected.front() << std::endl;
    }
    return result;
}

// TrimmedMeanAggregator implementation
TrimmedMeanAggregator::TrimmedMeanAggregator(double beta)
    : TrimmedMeanAggregator("trimmed_mean", beta) {}

TrimmedMeanAggregator::TrimmedMeanAggregator(std::string name, double beta)
    : Aggregator(std::move(name)), beta_(clampBeta(beta)) {}

double TrimmedMeanAggregator::clampBeta(double beta) {
    if (std::isnan(beta)) {
        return 0.0;
    }
    return std::min(MAX_BETA, std::max(0.0, beta));
}

std::string TrimmedMeanAggregator::formatBeta(double beta) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", beta);
    return buffer;
}

AggregationResult TrimmedMeanAggregator::runAggregation(const std::vector<ModelUpdate>& updates,
                                                        const GlobalModel* previous) {
    const size_t n = updates.size();
    if (n < 3) {
        return AggregationResult::failure("Trimmed mean requires at least 3 updates");
    }

    std::vector<Vector> vectors = extractVectors(updates);
    const size_t trim_count = static_cast<size_t>(std::floor(n * beta_));
    Vector aggregated = coordinateTrimmedMean(vectors, trim_count);

    const int64_t accepted = static_cast<int64_t>(n - 2 * trim_count);
    GlobalModel model = buildGlobalModel(aggregated, updates, previous,
                                         "trimmed_mean_b" + formatBeta(beta_), accepted);

    AggregationResult result = successResult(std::move(model), static_cast<int64_t>(n), accepted);
    AggregationDiagnostics diagnostics;
    diagnostics.effective_beta = beta_;
    result.diagnostics = diagnostics;
    return result;
}

// MedianAggregator implementation
AggregationResult MedianAggregator::runAggregation(const std::vector<ModelUpdate>& updates,
                                                   const GlobalModel* previous) {
    if (updates.empty()) {
        return AggregationResult::failure("No updates to aggregate");
    }

    std::vector<Vector> vectors = extractVectors(updates);
    Vector aggregated = coordinateMedian(vectors);

    const int64_t n = static_cast<int64_t>(updates.size());
    return successResult(buildGlobalModel(aggregated, updates, previous, "median", n), n, n);
}

bool isBaseAggregator(const std::string& method) {
    return method == "fedavg" || method == "krum" || method == "trimmed_mean" || method == "median";
}

std::unique_ptr<Aggregator> getAggregator(const std::string& method, const AggregatorParams& params) {
    if (method == "fedavg") {
        return std::make_unique<FedAvgAggregator>();
    }
    if (method == "krum") {
        return std::make_unique<KrumAggregator>(params.f, params.multi_krum.value_or(false), params.m);
    }
    if (method == "trimmed_mean") {
        return std::make_unique<TrimmedMeanAggregator>(params.beta);
    }
    if (method == "median") {
        return std::make_unique<MedianAggregator>();
    }
    throw std::invalid_argument("Unknown aggregator: " + method +
                                ". Available: fedavg, krum, trimmed_mean, median");
}

} // namespace fedcore
