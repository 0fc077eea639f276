/*
 * Federated model protocol implementation
 * JSON wire shapes and compressed binary snapshots
 */

#include "federated/model_protocol.h"
#include "federated/parameter_codec.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <zlib.h>

namespace fedcore {

namespace {

constexpr uint8_t SNAPSHOT_MAGIC[4] = {'F', 'C', 'G', 'M'};
constexpr uint8_t SNAPSHOT_FORMAT_VERSION = 1;
constexpr size_t SNAPSHOT_HEADER_SIZE = 4 + 1 + 4 + 4;
// deflate cannot expand input by more than about 1032:1
constexpr uint64_t SNAPSHOT_MAX_EXPANSION = 1032;

JsonValue layersToJson(const std::map<std::string, std::vector<double>>& layers) {
    JsonValue obj = JsonValue::object();
    for (const auto& entry : layers) {
        obj.set(entry.first, JsonValue::fromNumbers(entry.second));
    }
    return obj;
}

std::map<std::string, std::vector<double>> layersFromJson(const JsonValue& json) {
    std::map<std::string, std::vector<double>> layers;
    if (json.isNull()) {
        return layers;
    }
    for (const auto& entry : json.asObject()) {
        layers[entry.first] = entry.second.asNumbers();
    }
    return layers;
}

void writeU32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        out.push_back((value >> (i * 8)) & 0xFF);
    }
}

uint32_t readU32(const std::vector<uint8_t>& data, size_t offset) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data[offset + i];
    }
    return value;
}

} // namespace

double nowSeconds() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

// ModelWeights implementation
size_t ModelWeights::parameterCount() const {
    size_t count = 0;
    for (const auto& entry : layer_weights) {
        count += entry.second.size();
    }
    for (const auto& entry : layer_biases) {
        count += entry.second.size();
    }
    return count;
}

std::vector<double> ModelWeights::toFlatVector() const {
    return ParameterCodec::flatten(*this);
}

std::string ModelWeights::computeHash() const {
    return ParameterCodec::hash(*this);
}

JsonValue ModelWeights::toJson() const {
    JsonValue json = JsonValue::object();
    json.set("layer_weights", layersToJson(layer_weights));
    json.set("layer_biases", layersToJson(layer_biases));

    JsonValue meta = JsonValue::object();
    for (const auto& entry : metadata) {
        meta.set(entry.first, entry.second);
    }
    json.set("metadata", meta);
    return json;
}

ModelWeights ModelWeights::fromJson(const JsonValue& json) {
    ModelWeights weights;
    weights.layer_weights = layersFromJson(json["layer_weights"]);
    weights.layer_biases = layersFromJson(json["layer_biases"]);
    if (json.has("metadata") && !json["metadata"].isNull()) {
        for (const auto& entry : json["metadata"].asObject()) {
            weights.metadata[entry.first] = entry.second.asString();
        }
    }
    return weights;
}

// ModelUpdate implementation
ModelUpdate::ModelUpdate(std::string node_id, int64_t round_number, ModelWeights weights,
                         int64_t num_samples, double training_loss, double validation_loss)
    : node_id(std::move(node_id)),
      round_number(round_number),
      weights(std::move(weights)),
      num_samples(num_samples),
      training_loss(training_loss),
      validation_loss(validation_loss),
      timestamp(nowSeconds()) {}

ModelUpdate ModelUpdate::withWeights(ModelWeights new_weights) const {
    ModelUpdate copy = *this;
    copy.weights = std::move(new_weights);
    return copy;
}

JsonValue ModelUpdate::toJson() const {
    JsonValue json = JsonValue::object();
    json.set("node_id", node_id);
    json.set("round_number", round_number);
    json.set("weights", weights.toJson());
    json.set("num_samples", num_samples);
    json.set("training_loss", training_loss);
    json.set("validation_loss", validation_loss);
    json.set("gradient_norm", gradient_norm);
    json.set("gradient_variance", gradient_variance);
    json.set("noise_scale", noise_scale);
    json.set("clip_norm", clip_norm);
    json.set("timestamp", timestamp);
    return json;
}

ModelUpdate ModelUpdate::fromJson(const JsonValue& json) {
    ModelUpdate update;
    update.node_id = json.getString("node_id");
    update.round_number = json.getInt64("round_number");
    update.weights = ModelWeights::fromJson(json["weights"]);
    update.num_samples = json.getInt64("num_samples");
    update.training_loss = json.getNumber("training_loss");
    update.validation_loss = json.getNumber("validation_loss");
    update.gradient_norm = json.getNumber("gradient_norm");
    update.gradient_variance = json.getNumber("gradient_variance");
    update.noise_scale = json.getNumber("noise_scale");
    update.clip_norm = json.getNumber("clip_norm");
    update.timestamp = json.getNumber("timestamp");
    return update;
}

// GlobalModel implementation
GlobalModel::GlobalModel(int64_t version, int64_t round_number, ModelWeights weights,
                         std::string previous_hash, std::string weights_hash)
    : version(version),
      round_number(round_number),
      weights(std::move(weights)),
      weights_hash(std::move(weights_hash)),
      previous_hash(std::move(previous_hash)),
      created_at(nowSeconds()) {
    if (this->weights_hash.empty()) {
        this->weights_hash = this->weights.computeHash();
    }
}

bool GlobalModel::verifyHash() const {
    return !weights_hash.empty() && weights.computeHash() == weights_hash;
}

JsonValue GlobalModel::toJson() const {
    JsonValue json = JsonValue::object();
    json.set("version", version);
    json.set("round_number", round_number);
    json.set("weights", weights.toJson());
    json.set("num_contributors", num_contributors);
    json.set("total_samples", total_samples);
    json.set("aggregation_method", aggregation_method);
    json.set("avg_training_loss", avg_training_loss);
    json.set("avg_validation_loss", avg_validation_loss);
    json.set("weights_hash", weights_hash);
    json.set("previous_hash", previous_hash);
    json.set("created_at", created_at);
    return json;
}

GlobalModel GlobalModel::fromJson(const JsonValue& json) {
    GlobalModel model;
    model.version = json.getInt64("version");
    model.round_number = json.getInt64("round_number");
    model.weights = ModelWeights::fromJson(json["weights"]);
    model.num_contributors = json.getInt64("num_contributors");
    model.total_samples = json.getInt64("total_samples");
    model.aggregation_method = json.getString("aggregation_method");
    model.avg_training_loss = json.getNumber("avg_training_loss");
    model.avg_validation_loss = json.getNumber("avg_validation_loss");
    model.previous_hash = json.getString("previous_hash");
    model.created_at = json.getNumber("created_at");

    // A supplied hash is kept as-is so that a tampered payload fails verifyHash()
    model.weights_hash = json.getString("weights_hash");
    if (model.weights_hash.empty()) {
        model.weights_hash = model.weights.computeHash();
    }
    return model;
}

std::vector<uint8_t> GlobalModel::serialize() const {
    std::string body = toJson().dump();

    uLongf compressed_size = compressBound(body.size());
    std::vector<uint8_t> compressed(compressed_size);
    int rc = compress2(compressed.data(), &compressed_size,
                       reinterpret_cast<const Bytef*>(body.data()), body.size(),
                       Z_BEST_COMPRESSION);
    if (rc != Z_OK) {
        throw std::runtime_error("Failed to compress global model (zlib error " +
                                 std::to_string(rc) + ")");
    }
    compressed.resize(compressed_size);

    std::vector<uint8_t> result;
    result.reserve(SNAPSHOT_HEADER_SIZE + compressed.size());
    result.insert(result.end(), SNAPSHOT_MAGIC, SNAPSHOT_MAGIC + 4);
    result.push_back(SNAPSHOT_FORMAT_VERSION);
    writeU32(result, static_cast<uint32_t>(body.size()));
    writeU32(result, static_cast<uint32_t>(compressed.size()));
    result.insert(result.end(), compressed.begin(), compressed.end());
    return result;
}

GlobalModel GlobalModel::deserialize(const std::vector<uint8_t>& data) {
    if (data.size() < SNAPSHOT_HEADER_SIZE ||
        !std::equal(SNAPSHOT_MAGIC, SNAPSHOT_MAGIC + 4, data.begin())) {
        throw std::runtime_error("Invalid global model snapshot format");
    }
    if (data[4] != SNAPSHOT_FORMAT_VERSION) {
        throw std::runtime_error("Unsupported global model snapshot version " +
                                 std::to_string(data[4]));
    }

    uint32_t body_size = readU32(data, 5);
    uint32_t compressed_size = readU32(data, 9);
    if (data.size() - SNAPSHOT_HEADER_SIZE != compressed_size) {
        throw std::runtime_error("Truncated global model snapshot");
    }
    if (body_size == 0 ||
        static_cast<uint64_t>(body_size) > static_cast<uint64_t>(compressed_size) * SNAPSHOT_MAX_EXPANSION) {
        throw std::runtime_error("Global model snapshot declares an implausible size of " +
                                 std::to_string(body_size) + " bytes");
    }

    std::string body(body_size, '\0');
    uLongf out_size = body_size;
    int rc = uncompress(reinterpret_cast<Bytef*>(&body[0]), &out_size,
                        data.data() + SNAPSHOT_HEADER_SIZE, compressed_size);
    if (rc != Z_OK || out_size != body_size) {
        throw std::runtime_error("Corrupt global model snapshot (zlib error " +
                                 std::to_string(rc) + ")");
    }

    return fromJson(utils::JsonParser::parse(body));
}

// AggregationDiagnostics implementation
JsonValue AggregationDiagnostics::toJson() const {
    JsonValue json = JsonValue::object();
    json.set("selected_strategy", selected_strategy);
    json.set("distance_backend", distance_backend);
    json.set("effective_f", effective_f);
    json.set("effective_beta", effective_beta);
    json.set("outliers_removed", outliers_removed);
    json.set("mean_variance", mean_variance);
    return json;
}

AggregationDiagnostics AggregationDiagnostics::fromJson(const JsonValue& json) {
    AggregationDiagnostics diag;
    diag.selected_strategy = json.getString("selected_strategy");
    diag.distance_backend = json.getString("distance_backend");
    diag.effective_f = static_cast<int>(json.getInt64("effective_f", -1));
    diag.effective_beta = json.getNumber("effective_beta", -1.0);
    diag.outliers_removed = json.getInt64("outliers_removed");
    diag.mean_variance = json.getNumber("mean_variance");
    return diag;
}

// AggregationResult implementation
AggregationResult AggregationResult::failure(const std::string& message, double elapsed_seconds) {
    AggregationResult result;
    result.success = false;
    result.error_message = message;
    result.aggregation_time_seconds = elapsed_seconds;
    return result;
}

JsonValue AggregationResult::toJson() const {
    JsonValue json = JsonValue::object();
    json.set("success", success);
    json.set("global_model", global_model ? global_model->toJson() : JsonValue());
    json.set("updates_received", updates_received);
    json.set("updates_accepted", updates_accepted);
    json.set("updates_rejected", updates_rejected);

    JsonValue suspected = JsonValue::array();
    for (const auto& node : suspected_byzantine) {
        suspected.push_back(node);
    }
    json.set("suspected_byzantine", suspected);

    json.set("error_message", error_message);
    json.set("privacy_epsilon_spent",
             privacy_epsilon_spent ? JsonValue(*privacy_epsilon_spent) : JsonValue());
    json.set("privacy_budget_remaining",
             privacy_budget_remaining ? JsonValue(*privacy_budget_remaining) : JsonValue());
    json.set("aggregation_time_seconds", aggregation_time_seconds);
    json.set("diagnostics", diagnostics ? diagnostics->toJson() : JsonValue());
    return json;
}

AggregationResult AggregationResult::fromJson(const JsonValue& json) {
    AggregationResult result;
    result.success = json.getBool("success");
    if (json.has("global_model") && !json["global_model"].isNull()) {
        result.global_model = GlobalModel::fromJson(json["global_model"]);
    }
    result.updates_received = json.getInt64("updates_received");
    result.updates_accepted = json.getInt64("updates_accepted");
    result.updates_rejected = json.getInt64("updates_rejected");
    if (json.has("suspected_byzantine") && !json["suspected_byzantine"].isNull()) {
        for (const auto& node : json["suspected_byzantine"].asArray()) {
            result.suspected_byzantine.push_back(node.asString());
        }
    }
    result.error_message = json.getString("error_message");
    if (json.has("privacy_epsilon_spent") && !json["privacy_epsilon_spent"].isNull()) {
        result.privacy_epsilon_spent = json["privacy_epsilon_spent"].asNumber();
    }
    if (json.has("privacy_budget_remaining") && !json["privacy_budget_remaining"].isNull()) {
        result.privacy_budget_remaining = json["privacy_budget_remaining"].asNumber();
    }
    result.aggregation_time_seconds = json.getNumber("aggregation_time_seconds");
    if (json.has("diagnostics") && !json["diagnostics"].isNull()) {
        result.diagnostics = AggregationDiagnostics::fromJson(json["diagnostics"]);
    }
    return result;
}

} // namespace fedcore
