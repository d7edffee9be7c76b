#pragma once
#include "fastembed/emb/Normalizer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fastembed {

// Binary dump of embedded texts, little-endian:
//   "FEMB" u32 version u32 dim u64 count, then per record u32 len, text, dim x f32
// save() writes a sibling .tmp file and renames it over path.
class EmbeddingFile {
public:
    // vectors[i] belongs to texts[i]; all vectors must have the same length
    void set(std::vector<std::string> texts, const std::vector<Embedding>& vectors);

    void save(const std::string& path) const;
    void load(const std::string& path);

    size_t dim() const { return m_dim; }
    size_t size() const { return m_texts.size(); }
    const std::string& text(size_t i) const { return m_texts.at(i); }
    Embedding vector(size_t i) const;

private:
    size_t m_dim = 0;
    std::vector<std::string> m_texts;
    std::vector<float> m_vecs; // packed: size = size()*dim()
};

} // namespace fastembed
