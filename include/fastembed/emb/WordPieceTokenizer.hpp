#pragma once
#include "fastembed/emb/Tokenizer.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fastembed {

class WordPieceTokenizer final : public Tokenizer {
public:
    static constexpr int64_t kPadId = 0;

    // HuggingFace tokenizer.json with a WordPiece model
    void load_tokenizer_json(const std::string& path);
    // one token per line, line number = id
    void load_vocab(const std::string& vocab_path);

    // [CLS] ... [SEP], truncated to max_len, padded with kPadId
    EncodedSequence encode(const std::string& text, size_t max_len) const override;

    int64_t unk_id() const { return id_or(-1, m_unk_token); }
    int64_t cls_id() const { return id_or(-1, "[CLS]"); }
    int64_t sep_id() const { return id_or(-1, "[SEP]"); }
    size_t vocab_size() const { return m_tok_to_id.size(); }

private:
    std::unordered_map<std::string, int64_t> m_tok_to_id;
    std::string m_unk_token = "[UNK]";
    std::string m_subword_prefix = "##";
    size_t m_max_chars_per_word = 100;
    // BertNormalizer flags; strip_accents follows lowercase when unset
    bool m_clean_text = true;
    bool m_handle_chinese_chars = true;
    bool m_lowercase = true;
    std::optional<bool> m_strip_accents;

    void check_special_tokens(const std::string& source) const;
    std::string normalize(const std::string& text) const;
    std::vector<std::string> basic_tokenize(const std::string& text) const;
    std::vector<std::string> wordpiece(const std::string& token) const;

    int64_t id_or(int64_t def, const std::string& tok) const;
};

} // namespace fastembed
