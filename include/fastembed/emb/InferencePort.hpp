#pragma once
#include "fastembed/emb/TensorAssembler.hpp"

namespace fastembed {

// Forward pass: three [batch, seq_len] inputs -> [batch, seq_len, hidden_dim].
// Implementations must be callable from several threads at once.
class InferencePort {
public:
    virtual ~InferencePort() = default;
    virtual TensorBuffer<float> infer(const AssembledBatch& batch) const = 0;
};

} // namespace fastembed
