#pragma once
#include "fastembed/emb/Tokenizer.hpp"

#include <cstdint>
#include <vector>

namespace fastembed {

// Flat row-major tensor. data.size() == product(shape).
template <typename T>
struct TensorBuffer {
    std::vector<T> data;
    std::vector<int64_t> shape;

    size_t element_count() const {
        if (shape.empty()) return 0;
        size_t n = 1;
        for (int64_t d : shape) n *= (size_t)d;
        return n;
    }
    bool consistent() const { return data.size() == element_count(); }
};

// The three model inputs for one chunk, each shaped [batch, max_len].
struct AssembledBatch {
    TensorBuffer<int64_t> ids;
    TensorBuffer<int64_t> mask;
    TensorBuffer<int64_t> type_ids;

    size_t batch_size() const { return ids.shape.empty() ? 0 : (size_t)ids.shape[0]; }
    size_t seq_len() const { return ids.shape.size() < 2 ? 0 : (size_t)ids.shape[1]; }
};

// Throws ShapeError if any sequence is not exactly max_len long.
AssembledBatch assemble_batch(const std::vector<EncodedSequence>& sequences, size_t max_len);

} // namespace fastembed
