#include "fastembed/emb/Encoder.hpp"
#include "fastembed/core/Errors.hpp"

#include <sstream>

namespace fastembed {

Encoder::Encoder(std::shared_ptr<const Tokenizer> tokenizer, size_t max_len)
    : m_tok(std::move(tokenizer)), m_max_len(max_len) {
    if (!m_tok) throw EncodingError("Encoder: no tokenizer");
    if (m_max_len == 0) throw EncodingError("Encoder: max_len must be positive");
}

std::vector<EncodedSequence> Encoder::encode(const std::vector<std::string>& batch) const {
    std::vector<EncodedSequence> out;
    out.reserve(batch.size());

    for (size_t i = 0; i < batch.size(); ++i) {
        EncodedSequence seq;
        try {
            seq = m_tok->encode(batch[i], m_max_len);
        } catch (const EncodingError&) {
            throw;
        } catch (const std::exception& e) {
            throw EncodingError(std::string("tokenizer failed: ") + e.what());
        }

        if (seq.ids.size() != m_max_len || seq.attention_mask.size() != m_max_len ||
            seq.type_ids.size() != m_max_len) {
            std::ostringstream oss;
            oss << "tokenizer returned " << seq.ids.size() << "/" << seq.attention_mask.size() << "/"
                << seq.type_ids.size() << " elements for input " << i << ", expected " << m_max_len;
            throw EncodingError(oss.str());
        }
        out.push_back(std::move(seq));
    }
    return out;
}

} // namespace fastembed
