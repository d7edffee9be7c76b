#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>

typedef struct z_stream_s z_stream;

namespace fastembed {

// Push-style gzip decoder. Concatenated gzip members are decoded back to back.
class GzipInflater {
public:
    using Sink = std::function<void(const char* data, size_t len)>;

    explicit GzipInflater(Sink sink);
    ~GzipInflater();

    GzipInflater(const GzipInflater&) = delete;
    GzipInflater& operator=(const GzipInflater&) = delete;

    void write(const char* data, size_t len);
    // Throws ExtractError if the stream stopped mid-member.
    void finish();

private:
    std::unique_ptr<z_stream> m_zs;
    Sink m_sink;
    bool m_stream_end = false;
    bool m_seen_input = false;
};

// Push-style tar reader that writes directories and regular files under root.
// Other entry types are skipped. GNU long names ('L'), pax 'path' records ('x')
// and ustar prefixes are honored.
class TarExtractor {
public:
    explicit TarExtractor(std::filesystem::path root);

    void write(const char* data, size_t len);
    // Throws ExtractError if the archive ended inside an entry.
    void finish();

    size_t files_written() const { return m_files; }

private:
    enum class State { Header, Data, Padding, Done };
    enum class Entry { File, LongName, PaxHeader, Skip };

    std::filesystem::path m_root;
    State m_state = State::Header;
    Entry m_entry = Entry::Skip;

    std::array<char, 512> m_block{};
    size_t m_fill = 0;
    int m_zero_blocks = 0;

    uint64_t m_remaining = 0;
    size_t m_padding = 0;

    std::ofstream m_out;
    std::filesystem::path m_out_path;
    std::string m_meta;              // body of the current 'L' or 'x' entry
    std::string m_pending_long_name; // applies to the next entry only
    size_t m_files = 0;

    void on_header();
    void consume_data(const char* data, size_t len);
    void end_entry();
    std::filesystem::path safe_path(const std::string& name) const;
};

// gzip -> tar, the layout of a model archive.
class TarGzExtractor {
public:
    explicit TarGzExtractor(const std::filesystem::path& root);

    void write(const char* data, size_t len) { m_gz.write(data, len); }
    void finish();

    size_t files_written() const { return m_tar.files_written(); }

private:
    TarExtractor m_tar;
    GzipInflater m_gz;
};

} // namespace fastembed
