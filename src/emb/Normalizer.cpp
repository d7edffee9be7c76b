#include "fastembed/emb/Normalizer.hpp"
#include "fastembed/core/Errors.hpp"

#include <cmath>

namespace fastembed {

Embedding l2_normalize(const float* v, size_t dim) {
    double ss = 0.0;
    for (size_t i = 0; i < dim; ++i) ss += (double)v[i] * (double)v[i];

    Embedding out(dim);
    if (ss <= 0.0) {
        for (float& x : out) x = kNormEpsilon;
        return out;
    }

    const float norm = (float)std::sqrt(ss);
    for (size_t i = 0; i < dim; ++i) out[i] = v[i] / norm + kNormEpsilon;
    return out;
}

std::vector<Embedding> pool_and_normalize(const TensorBuffer<float>& hidden) {
    if (hidden.shape.size() != 3) {
        throw ShapeError("hidden states must be rank 3, got rank " + std::to_string(hidden.shape.size()));
    }
    if (!hidden.consistent()) {
        throw ShapeError("hidden states hold " + std::to_string(hidden.data.size()) +
                         " values, shape needs " + std::to_string(hidden.element_count()));
    }

    const size_t batch = (size_t)hidden.shape[0];
    const size_t seq_len = (size_t)hidden.shape[1];
    const size_t dim = (size_t)hidden.shape[2];

    std::vector<Embedding> out;
    out.reserve(batch);
    for (size_t i = 0; i < batch; ++i) {
        const float* row = hidden.data.data() + i * seq_len * dim;
        out.push_back(l2_normalize(row, dim));
    }
    return out;
}

} // namespace fastembed
