/*
 * Federated model protocol types
 * Model weights, per-node updates, global model snapshots and aggregation results
 */

#ifndef FEDCORE_MODEL_PROTOCOL_H
#define FEDCORE_MODEL_PROTOCOL_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "utils/json.h"

namespace fedcore {

using utils::JsonValue;

// Seconds since the Unix epoch
double nowSeconds();

// Layer-structured model parameters. Layer order is always lexicographic.
struct ModelWeights {
    std::map<std::string, std::vector<double>> layer_weights;
    std::map<std::string, std::vector<double>> layer_biases;
    std::map<std::string, std::string> metadata;

    bool empty() const { return layer_weights.empty() && layer_biases.empty(); }
    size_t parameterCount() const;

    std::vector<double> toFlatVector() const;
    std::string computeHash() const;

    JsonValue toJson() const;
    static ModelWeights fromJson(const JsonValue& json);

    // Parameter equality; metadata is opaque and not compared
    bool operator==(const ModelWeights& other) const {
        return layer_weights == other.layer_weights &&
               layer_biases == other.layer_biases;
    }
    bool operator!=(const ModelWeights& other) const { return !(*this == other); }
};

// One node's contribution to one round. Treated as immutable once built.
struct ModelUpdate {
    std::string node_id;
    int64_t round_number = 0;
    ModelWeights weights;
    int64_t num_samples = 0;

    double training_loss = 0.0;
    double validation_loss = 0.0;
    double gradient_norm = 0.0;
    double gradient_variance = 0.0;

    // Privacy provenance
    double noise_scale = 0.0;
    double clip_norm = 0.0;

    double timestamp = 0.0;

    ModelUpdate() = default;
    ModelUpdate(std::string node_id, int64_t round_number, ModelWeights weights,
                int64_t num_samples = 0, double training_loss = 0.0,
                double validation_loss = 0.0);

    // Averaging weight; a node reporting zero samples still counts once
    int64_t effectiveSamples() const { return num_samples > 1 ? num_samples : 1; }

    ModelUpdate withWeights(ModelWeights new_weights) const;

    JsonValue toJson() const;
    static ModelUpdate fromJson(const JsonValue& json);
};

// Result of one successful aggregation. weights_hash is filled on construction
// when not supplied; previous_hash links to the prior model.
struct GlobalModel {
    int64_t version = 0;
    int64_t round_number = 0;
    ModelWeights weights;
    int64_t num_contributors = 0;
    int64_t total_samples = 0;
    std::string aggregation_method;
    double avg_training_loss = 0.0;
    double avg_validation_loss = 0.0;
    std::string weights_hash;
    std::string previous_hash;
    double created_at = 0.0;

    GlobalModel() = default;
    GlobalModel(int64_t version, int64_t round_number, ModelWeights weights,
                std::string previous_hash = "", std::string weights_hash = "");

    bool verifyHash() const;

    JsonValue toJson() const;
    static GlobalModel fromJson(const JsonValue& json);

    // Compact binary form for distribution (zlib-compressed body)
    std::vector<uint8_t> serialize() const;
    static GlobalModel deserialize(const std::vector<uint8_t>& data);
};

// Strategy-specific details about how a result was produced
struct AggregationDiagnostics {
    std::string selected_strategy;
    std::string distance_backend;
    int effective_f = -1;
    double effective_beta = -1.0;
    int64_t outliers_removed = 0;
    double mean_variance = 0.0;

    JsonValue toJson() const;
    static AggregationDiagnostics fromJson(const JsonValue& json);
};

struct AggregationResult {
    bool success = false;
    std::optional<GlobalModel> global_model;

    int64_t updates_received = 0;
    int64_t updates_accepted = 0;
    int64_t updates_rejected = 0;
    std::vector<std::string> suspected_byzantine;

    std::string error_message;

    std::optional<double> privacy_epsilon_spent;
    std::optional<double> privacy_budget_remaining;

    double aggregation_time_seconds = 0.0;

    std::optional<AggregationDiagnostics> diagnostics;

    static AggregationResult failure(const std::string& message, double elapsed_seconds = 0.0);

    JsonValue toJson() const;
    static AggregationResult fromJson(const JsonValue& json);
};

} // namespace fedcore

#endif // FEDCORE_MODEL_PROTOCOL_H
