#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace fastembed {

// One tokenized input. All three arrays have the same length.
struct EncodedSequence {
    std::vector<int64_t> ids;
    std::vector<int64_t> attention_mask; // 1 = real token, 0 = padding
    std::vector<int64_t> type_ids;
};

class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    // Truncated to max_len and right-padded to exactly max_len.
    virtual EncodedSequence encode(const std::string& text, size_t max_len) const = 0;
};

} // namespace fastembed
