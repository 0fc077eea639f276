/*
 * Parameter codec
 * Canonical flat-vector view of layer-structured model weights
 */

#ifndef FEDCORE_PARAMETER_CODEC_H
#define FEDCORE_PARAMETER_CODEC_H

#include <string>
#include <vector>

#include "federated/model_protocol.h"

namespace fedcore {

// Size table entry for one layer, in flatten order
struct LayerShape {
    std::string name;
    size_t weight_size = 0;
    size_t bias_size = 0;
    bool has_weights = false;
    bool has_bias = false;

    bool operator==(const LayerShape& other) const {
        return name == other.name && weight_size == other.weight_size &&
               bias_size == other.bias_size && has_weights == other.has_weights &&
               has_bias == other.has_bias;
    }
};

using LayerShapes = std::vector<LayerShape>;

class ParameterCodec {
public:
    // Layers in lexicographic order, weights then biases per layer
    static std::vector<double> flatten(const ModelWeights& weights);

    static LayerShapes layerShapes(const ModelWeights& weights);
    static size_t totalSize(const LayerShapes& shapes);

    // Throws std::invalid_argument when flat.size() differs from the shape table
    static ModelWeights reconstruct(const std::vector<double>& flat, const LayerShapes& shapes);

    // SHA-256 over little-endian IEEE-754 doubles, 64 hex chars
    static std::string hash(const ModelWeights& weights);
    static std::string hashVector(const std::vector<double>& flat);
};

} // namespace fedcore

#endif // FEDCORE_PARAMETER_CODEC_H
