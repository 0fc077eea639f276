/*
 * Parameter codec implementation
 */

#include "federated/parameter_codec.h"
#include "federated/sha256.h"
#include <cstring>
#include <set>
#include <stdexcept>

namespace fedcore {

namespace {

std::set<std::string> layerNames(const ModelWeights& weights) {
    std::set<std::string> names;
    for (const auto& entry : weights.layer_weights) {
        names.insert(entry.first);
    }
    for (const auto& entry : weights.layer_biases) {
        names.insert(entry.first);
    }
    return names;
}

} // namespace

std::vector<double> ParameterCodec::flatten(const ModelWeights& weights) {
    std::vector<double> flat;
    flat.reserve(weights.parameterCount());

    for (const auto& name : layerNames(weights)) {
        auto w_it = weights.layer_weights.find(name);
        if (w_it != weights.layer_weights.end()) {
            flat.insert(flat.end(), w_it->second.begin(), w_it->second.end());
        }
        auto b_it = weights.layer_biases.find(name);
        if (b_it != weights.layer_biases.end()) {
            flat.insert(flat.end(), b_it->second.begin(), b_it->second.end());
        }
    }

    return flat;
}

LayerShapes ParameterCodec::layerShapes(const ModelWeights& weights) {
    LayerShapes shapes;
    for (const auto& name : layerNames(weights)) {
        LayerShape shape;
        shape.name = name;

        auto w_it = weights.layer_weights.find(name);
        if (w_it != weights.layer_weights.end()) {
            shape.has_weights = true;
            shape.weight_size = w_it->second.size();
        }
        auto b_it = weights.layer_biases.find(name);
        if (b_it != weights.layer_biases.end()) {
            shape.has_bias = true;
            shape.bias_size = b_it->second.size();
        }
        shapes.push_back(shape);
    }
    return shapes;
}

size_t ParameterCodec::totalSize(const LayerShapes& shapes) {
    size_t total = 0;
    for (const auto& shape : shapes) {
        total += shape.weight_size + shape.bias_size;
    }
    return total;
}

ModelWeights ParameterCodec::reconstruct(const std::vector<double>& flat, const LayerShapes& shapes) {
    size_t expected = totalSize(shapes);
    if (flat.size() != expected) {
        throw std::invalid_argument("Parameter dimension mismatch: expected " +
                                    std::to_string(expected) + " values, got " +
                                    std::to_string(flat.size()));
    }

    ModelWeights weights;
    size_t offset = 0;
    for (const auto& shape : shapes) {
        if (shape.has_weights) {
            weights.layer_weights[shape.name].assign(flat.begin() + offset,
                                                     flat.begin() + offset + shape.weight_size);
            offset += shape.weight_size;
        }
        if (shape.has_bias) {
            weights.layer_biases[shape.name].assign(flat.begin() + offset,
                                                    flat.begin() + offset + shape.bias_size);
            offset += shape.bias_size;
        }
    }

    return weights;
}

std::string ParameterCodec::hash(const ModelWeights& weights) {
    return hashVector(flatten(weights));
}

std::string ParameterCodec::hashVector(const std::vector<double>& flat) {
    SHA256 sha256;

    // Fixed-width little-endian encoding keeps the hash independent of host byte order
    uint8_t encoded[8];
    for (double value : flat) {
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        for (int i = 0; i < 8; ++i) {
            encoded[i] = static_cast<uint8_t>(bits >> (i * 8));
        }
        sha256.update(encoded, sizeof(encoded));
    }

    return sha256.finalHex();
}

} // namespace fedcore
