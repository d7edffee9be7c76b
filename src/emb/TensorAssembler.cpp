#include "fastembed/emb/TensorAssembler.hpp"
#include "fastembed/core/Errors.hpp"

#include <string>

namespace fastembed {

static void append_row(std::vector<int64_t>& dst, const std::vector<int64_t>& src, size_t max_len, size_t row) {
    if (src.size() != max_len) {
        throw ShapeError("sequence " + std::to_string(row) + " has " + std::to_string(src.size()) +
                         " elements, expected " + std::to_string(max_len));
    }
    dst.insert(dst.end(), src.begin(), src.end());
}

AssembledBatch assemble_batch(const std::vector<EncodedSequence>& sequences, size_t max_len) {
    const size_t n = sequences.size();
    std::vector<int64_t> shape{(int64_t)n, (int64_t)max_len};

    AssembledBatch b;
    b.ids.data.reserve(n * max_len);
    b.mask.data.reserve(n * max_len);
    b.type_ids.data.reserve(n * max_len);

    for (size_t i = 0; i < n; ++i) {
        append_row(b.ids.data, sequences[i].ids, max_len, i);
        append_row(b.mask.data, sequences[i].attention_mask, max_len, i);
        append_row(b.type_ids.data, sequences[i].type_ids, max_len, i);
    }

    b.ids.shape = shape;
    b.mask.shape = shape;
    b.type_ids.shape = shape;
    return b;
}

} // namespace fastembed
