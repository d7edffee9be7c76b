#pragma once
#include "fastembed/emb/Tokenizer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fastembed {

// Batch front-end over a Tokenizer with a fixed sequence length.
class Encoder {
public:
    Encoder(std::shared_ptr<const Tokenizer> tokenizer, size_t max_len);

    // Every returned sequence has exactly max_len() elements per array.
    std::vector<EncodedSequence> encode(const std::vector<std::string>& batch) const;

    size_t max_len() const { return m_max_len; }

private:
    std::shared_ptr<const Tokenizer> m_tok;
    size_t m_max_len;
};

} // namespace fastembed
