#include "fastembed/emb/WordPieceTokenizer.hpp"
#include "fastembed/core/Errors.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

using json = nlohmann::json;

namespace fastembed {

void WordPieceTokenizer::load_tokenizer_json(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw EncodingError("failed to open tokenizer config: " + path);

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw EncodingError("failed to parse " + path + ": " + e.what());
    }

    if (!j.contains("model") || !j.at("model").is_object()) {
        throw EncodingError(path + " missing required field: model");
    }
    const json& model = j.at("model");
    if (model.contains("type") && model.at("type") != "WordPiece") {
        throw EncodingError(path + ": unsupported tokenizer model " + model.at("type").dump());
    }
    if (!model.contains("vocab") || !model.at("vocab").is_object()) {
        throw EncodingError(path + " missing required field: model.vocab");
    }

    m_tok_to_id.clear();
    for (auto it = model.at("vocab").begin(); it != model.at("vocab").end(); ++it) {
        if (!it.value().is_number_integer()) {
            throw EncodingError(path + ": vocab id for '" + it.key() + "' must be an integer");
        }
        m_tok_to_id.emplace(it.key(), it.value().get<int64_t>());
    }

    if (model.contains("unk_token") && model.at("unk_token").is_string()) {
        m_unk_token = model.at("unk_token").get<std::string>();
    }
    if (model.contains("continuing_subword_prefix") && model.at("continuing_subword_prefix").is_string()) {
        m_subword_prefix = model.at("continuing_subword_prefix").get<std::string>();
    }
    if (model.contains("max_input_chars_per_word") && model.at("max_input_chars_per_word").is_number_integer()) {
        int64_t n = model.at("max_input_chars_per_word").get<int64_t>();
        if (n > 0) m_max_chars_per_word = (size_t)n;
    }

    // absent normalizer keeps the BERT defaults
    if (j.contains("normalizer") && j.at("normalizer").is_object()) {
        const json& norm = j.at("normalizer");
        auto flag = [&](const char* key, bool& dst) {
            if (norm.contains(key) && norm.at(key).is_boolean()) dst = norm.at(key).get<bool>();
        };
        flag("clean_text", m_clean_text);
        flag("handle_chinese_chars", m_handle_chinese_chars);
        flag("lowercase", m_lowercase);
        if (norm.contains("strip_accents") && norm.at("strip_accents").is_boolean()) {
            m_strip_accents = norm.at("strip_accents").get<bool>();
        }
    }

    check_special_tokens(path);
}

void WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) throw EncodingError("failed to open vocab: " + vocab_path);

    m_tok_to_id.clear();

    std::string line;
    int64_t id = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        m_tok_to_id.emplace(line, id++);
    }
    check_special_tokens(vocab_path);
}

void WordPieceTokenizer::check_special_tokens(const std::string& source) const {
    if (m_tok_to_id.empty()) throw EncodingError(source + ": empty vocabulary");
    for (const std::string& tok : {std::string("[CLS]"), std::string("[SEP]"), m_unk_token}) {
        if (m_tok_to_id.find(tok) == m_tok_to_id.end()) {
            throw EncodingError(source + ": vocabulary has no " + tok + " token");
        }
    }
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

static bool is_ws(UChar32 c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || u_isUWhiteSpace(c);
}

// tab, newline and carriage return count as whitespace, not control
static bool is_control(UChar32 c) {
    if (c == '\t' || c == '\n' || c == '\r') return false;
    switch (u_charType(c)) {
    case U_CONTROL_CHAR:
    case U_FORMAT_CHAR:
    case U_SURROGATE:
    case U_PRIVATE_USE_CHAR:
    case U_UNASSIGNED:
        return true;
    default:
        return false;
    }
}

// ASCII symbols like $ + < = > ^ ` | ~ split words too
static bool is_punct(UChar32 c) {
    return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) ||
           (c >= 91 && c <= 96) || (c >= 123 && c <= 126) || u_ispunct(c);
}

// CJK Unified Ideographs blocks, not all of CJK
static bool is_cjk(UChar32 c) {
    return (c >= 0x4E00 && c <= 0x9FFF) || (c >= 0x3400 && c <= 0x4DBF) ||
           (c >= 0x20000 && c <= 0x2A6DF) || (c >= 0x2A700 && c <= 0x2B73F) ||
           (c >= 0x2B740 && c <= 0x2B81F) || (c >= 0x2B920 && c <= 0x2CEAF) ||
           (c >= 0xF900 && c <= 0xFAFF) || (c >= 0x2F800 && c <= 0x2FA1F);
}

static icu::UnicodeString from_utf8(const std::string& s) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(s.data(), (int32_t)s.size()));
}

static std::string to_utf8(const icu::UnicodeString& s) {
    std::string out;
    s.toUTF8String(out);
    return out;
}

// byte offsets of every code point start, plus the end
static std::vector<size_t> char_starts(const std::string& s) {
    std::vector<size_t> out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (((unsigned char)s[i] & 0xC0) != 0x80) out.push_back(i);
    }
    out.push_back(s.size());
    return out;
}

std::string WordPieceTokenizer::normalize(const std::string& text) const {
    icu::UnicodeString in = from_utf8(text);
    icu::UnicodeString out;

    for (int32_t i = 0; i < in.length(); ) {
        UChar32 c = in.char32At(i);
        i += U16_LENGTH(c);

        if (m_clean_text) {
            if (c == 0 || c == 0xFFFD || is_control(c)) continue;
            if (is_ws(c)) {
                out.append((UChar32)0x20);
                continue;
            }
        }
        if (m_handle_chinese_chars && is_cjk(c)) {
            out.append((UChar32)0x20).append(c).append((UChar32)0x20);
            continue;
        }
        out.append(c);
    }

    if (m_strip_accents.value_or(m_lowercase)) {
        UErrorCode status = U_ZERO_ERROR;
        const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
        icu::UnicodeString decomposed;
        if (U_SUCCESS(status)) decomposed = nfd->normalize(out, status);
        if (U_FAILURE(status)) {
            throw EncodingError(std::string("NFD normalization failed: ") + u_errorName(status));
        }

        out.remove();
        for (int32_t i = 0; i < decomposed.length(); ) {
            UChar32 c = decomposed.char32At(i);
            i += U16_LENGTH(c);
            if (u_charType(c) != U_NON_SPACING_MARK) out.append(c);
        }
    }

    if (m_lowercase) out.toLower(icu::Locale::getRoot());
    return to_utf8(out);
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> out;
    icu::UnicodeString s = from_utf8(normalize(text));

    icu::UnicodeString cur;
    auto flush = [&](){
        if (!cur.isEmpty()) { out.push_back(to_utf8(cur)); cur.remove(); }
    };

    for (int32_t i = 0; i < s.length(); ) {
        UChar32 c = s.char32At(i);
        i += U16_LENGTH(c);
        if (is_ws(c)) {
            flush();
        } else if (is_punct(c)) {
            flush();
            out.push_back(to_utf8(icu::UnicodeString(c)));
        } else {
            cur.append(c);
        }
    }
    flush();
    return out;
}

// greedy longest match over code points
std::vector<std::string> WordPieceTokenizer::wordpiece(const std::string& token) const {
    std::vector<size_t> starts = char_starts(token);
    size_t n_chars = starts.size() - 1;
    if (n_chars == 0 || n_chars > m_max_chars_per_word) return {m_unk_token};

    std::vector<std::string> pieces;
    size_t start = 0;

    while (start < n_chars) {
        size_t end = n_chars;
        std::string best;

        while (end > start) {
            std::string sub = token.substr(starts[start], starts[end] - starts[start]);
            if (start > 0) sub = m_subword_prefix + sub;

            if (m_tok_to_id.find(sub) != m_tok_to_id.end()) {
                best = sub;
                break;
            }
            --end;
        }

        if (best.empty()) return {m_unk_token};
        pieces.push_back(best);
        start = end;
    }

    return pieces;
}

EncodedSequence WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    if (max_len < 2) throw EncodingError("max_len must leave room for [CLS] and [SEP]");

    int64_t cls = cls_id(), sep = sep_id(), unk = unk_id();

    EncodedSequence seq;
    std::vector<int64_t>& ids = seq.ids;
    ids.reserve(max_len);
    ids.push_back(cls);

    auto basic = basic_tokenize(text);
    for (const auto& t : basic) {
        auto pieces = wordpiece(t);
        for (const auto& p : pieces) {
            if (ids.size() + 1 >= max_len) break; // keep room for [SEP]
            ids.push_back(id_or(unk, p));
        }
        if (ids.size() + 1 >= max_len) break;
    }

    ids.push_back(sep);

    seq.attention_mask.assign(ids.size(), 1);
    seq.type_ids.assign(max_len, 0);

    ids.resize(max_len, kPadId);
    seq.attention_mask.resize(max_len, 0);
    return seq;
}

} // namespace fastembed
