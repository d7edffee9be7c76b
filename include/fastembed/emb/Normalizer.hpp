#pragma once
#include "fastembed/emb/TensorAssembler.hpp"

#include <vector>

namespace fastembed {

using Embedding = std::vector<float>;

constexpr float kNormEpsilon = 1e-12f;

// v / ||v|| + kNormEpsilon, elementwise. The epsilon is added after the
// division, so a non-zero vector ends up with norm ~ 1 + eps * sqrt(dim).
// An all-zero vector has no direction and comes back as eps everywhere.
Embedding l2_normalize(const float* v, size_t dim);

// hidden: [batch, seq_len, hidden_dim]. Takes the first token ([CLS]) of each
// row and normalizes it.
std::vector<Embedding> pool_and_normalize(const TensorBuffer<float>& hidden);

} // namespace fastembed
