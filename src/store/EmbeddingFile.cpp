#include "fastembed/store/EmbeddingFile.hpp"
#include "fastembed/core/Errors.hpp"

#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace fastembed {

static constexpr char kMagic[4] = {'F', 'E', 'M', 'B'};
static constexpr uint32_t kVersion = 1;
static constexpr uint64_t kHeaderSize = sizeof(kMagic) + 4 + 4 + 8;

template <typename T>
static void put(std::ofstream& out, T v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

// Bounded reads: nothing is allocated past what the file can still hold.
class RecordReader {
public:
    RecordReader(std::ifstream& in, uint64_t size, const std::string& path)
        : m_in(in), m_left(size), m_path(path) {}

    void need(uint64_t n) const {
        if (n > m_left) throw FilesystemError("truncated embedding file: " + m_path);
    }

    template <typename T>
    T get() {
        T v{};
        bytes(reinterpret_cast<char*>(&v), sizeof(v));
        return v;
    }

    void bytes(char* dst, uint64_t n) {
        need(n);
        m_in.read(dst, (std::streamsize)n);
        if (!m_in) throw FilesystemError("failed reading " + m_path);
        m_left -= n;
    }

    uint64_t left() const { return m_left; }

private:
    std::ifstream& m_in;
    uint64_t m_left;
    const std::string& m_path;
};

void EmbeddingFile::set(std::vector<std::string> texts, const std::vector<Embedding>& vectors) {
    if (texts.size() != vectors.size()) {
        throw ShapeError("EmbeddingFile: " + std::to_string(texts.size()) + " texts but " +
                         std::to_string(vectors.size()) + " vectors");
    }

    size_t dim = vectors.empty() ? 0 : vectors.front().size();
    std::vector<float> packed;
    packed.reserve(dim * vectors.size());
    for (const auto& v : vectors) {
        if (v.size() != dim) throw ShapeError("EmbeddingFile: inconsistent embedding dim");
        packed.insert(packed.end(), v.begin(), v.end());
    }

    m_texts = std::move(texts);
    m_vecs = std::move(packed);
    m_dim = dim;
}

Embedding EmbeddingFile::vector(size_t i) const {
    if (i >= size()) throw std::out_of_range("EmbeddingFile: index out of range");
    auto first = m_vecs.begin() + (std::ptrdiff_t)(i * m_dim);
    return Embedding(first, first + (std::ptrdiff_t)m_dim);
}

void EmbeddingFile::save(const std::string& path) const {
    // readers never see a half-written file
    const fs::path target(path);
    fs::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw FilesystemError("failed to open output file: " + tmp.string());

        out.write(kMagic, sizeof(kMagic));
        put<uint32_t>(out, kVersion);
        put<uint32_t>(out, (uint32_t)m_dim);
        put<uint64_t>(out, (uint64_t)m_texts.size());

        for (size_t i = 0; i < m_texts.size(); ++i) {
            const std::string& t = m_texts[i];
            put<uint32_t>(out, (uint32_t)t.size());
            out.write(t.data(), (std::streamsize)t.size());
            out.write(reinterpret_cast<const char*>(m_vecs.data() + i * m_dim),
                      (std::streamsize)(sizeof(float) * m_dim));
        }
        out.close();
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw FilesystemError("failed writing " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw FilesystemError("cannot move " + tmp.string() + " to " + path + ": " + ec.message());
    }
}

void EmbeddingFile::load(const std::string& path) {
    std::error_code ec;
    const uintmax_t file_size = fs::file_size(path, ec);
    if (ec) throw FilesystemError("failed to open embedding file: " + path + ": " + ec.message());

    std::ifstream in(path, std::ios::binary);
    if (!in) throw FilesystemError("failed to open embedding file: " + path);
    RecordReader r(in, (uint64_t)file_size, path);

    r.need(kHeaderSize);
    char magic[sizeof(kMagic)];
    r.bytes(magic, sizeof(magic));
    if (std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        throw FilesystemError(path + " is not an embedding file");
    }
    const uint32_t version = r.get<uint32_t>();
    if (version != kVersion) {
        throw FilesystemError(path + ": unsupported embedding file version " + std::to_string(version));
    }
    const uint32_t dim = r.get<uint32_t>();
    const uint64_t n = r.get<uint64_t>();

    // every record is at least a length field and one vector
    const uint64_t min_record = 4 + (uint64_t)dim * sizeof(float);
    if (n > r.left() / min_record) {
        throw FilesystemError("embedding file " + path + " claims " + std::to_string(n) +
                              " records but holds " + std::to_string(r.left()) + " bytes");
    }

    std::vector<std::string> texts;
    std::vector<float> vecs;
    texts.reserve((size_t)n);
    vecs.resize((size_t)(n * dim));

    for (uint64_t i = 0; i < n; ++i) {
        const uint32_t len = r.get<uint32_t>();
        r.need((uint64_t)len + (uint64_t)dim * sizeof(float));
        std::string s(len, '\0');
        r.bytes(s.data(), len);
        r.bytes(reinterpret_cast<char*>(vecs.data() + i * dim), (uint64_t)dim * sizeof(float));
        texts.push_back(std::move(s));
    }
    if (r.left() != 0) {
        throw FilesystemError("embedding file " + path + " has " + std::to_string(r.left()) + " trailing bytes");
    }

    m_dim = dim;
    m_texts = std::move(texts);
    m_vecs = std::move(vecs);
}

} // namespace fastembed
