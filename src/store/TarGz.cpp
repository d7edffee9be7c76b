#include "fastembed/store/TarGz.hpp"
#include "fastembed/core/Errors.hpp"

#include <algorithm>
#include <cstring>
#include <vector>

#include <zlib.h>

namespace fs = std::filesystem;

namespace fastembed {

// ---------- gzip ----------

GzipInflater::GzipInflater(Sink sink) : m_zs(std::make_unique<z_stream>()), m_sink(std::move(sink)) {
    std::memset(m_zs.get(), 0, sizeof(z_stream));
    // 15 window bits + 16: expect a gzip wrapper
    if (inflateInit2(m_zs.get(), 15 + 16) != Z_OK) {
        throw ExtractError("gzip: failed to initialize decoder");
    }
}

GzipInflater::~GzipInflater() {
    inflateEnd(m_zs.get());
}

void GzipInflater::write(const char* data, size_t len) {
    if (len == 0) return;
    m_seen_input = true;

    std::vector<char> out(64 * 1024);
    z_stream& zs = *m_zs;
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    zs.avail_in = (uInt)len;

    while (zs.avail_in > 0) {
        if (m_stream_end) {
            // another gzip member follows
            if (inflateReset(&zs) != Z_OK) throw ExtractError("gzip: failed to reset decoder");
            m_stream_end = false;
        }

        zs.next_out = reinterpret_cast<Bytef*>(out.data());
        zs.avail_out = (uInt)out.size();

        int rc = inflate(&zs, Z_NO_FLUSH);
        size_t produced = out.size() - zs.avail_out;
        if (produced > 0) m_sink(out.data(), produced);

        if (rc == Z_STREAM_END) {
            m_stream_end = true;
        } else if (rc == Z_BUF_ERROR) {
            if (produced == 0) break; // needs more input
        } else if (rc != Z_OK) {
            throw ExtractError(std::string("gzip: ") + (zs.msg ? zs.msg : "corrupt stream"));
        }
    }

    // drain output still buffered inside zlib
    while (!m_stream_end) {
        zs.next_out = reinterpret_cast<Bytef*>(out.data());
        zs.avail_out = (uInt)out.size();
        int rc = inflate(&zs, Z_NO_FLUSH);
        size_t produced = out.size() - zs.avail_out;
        if (produced > 0) m_sink(out.data(), produced);
        if (rc == Z_STREAM_END) m_stream_end = true;
        else if (rc != Z_OK && rc != Z_BUF_ERROR) {
            throw ExtractError(std::string("gzip: ") + (zs.msg ? zs.msg : "corrupt stream"));
        }
        if (produced == 0) break;
    }
}

void GzipInflater::finish() {
    if (!m_seen_input) throw ExtractError("gzip: empty stream");
    if (!m_stream_end) throw ExtractError("gzip: unexpected end of stream");
}

// ---------- tar ----------

static uint64_t parse_numeric(const char* field, size_t len) {
    const unsigned char* u = reinterpret_cast<const unsigned char*>(field);
    if (u[0] & 0x80) {
        // GNU base-256 for sizes past 8 GiB
        uint64_t v = u[0] & 0x7f;
        for (size_t i = 1; i < len; ++i) v = (v << 8) | u[i];
        return v;
    }

    uint64_t v = 0;
    size_t i = 0;
    while (i < len && (field[i] == ' ' || field[i] == '\0')) ++i;
    for (; i < len && field[i] != ' ' && field[i] != '\0'; ++i) {
        if (field[i] < '0' || field[i] > '7') throw ExtractError("tar: malformed numeric field");
        v = (v << 3) | (uint64_t)(field[i] - '0');
    }
    return v;
}

static std::string field_string(const char* field, size_t len) {
    size_t n = 0;
    while (n < len && field[n] != '\0') ++n;
    return std::string(field, n);
}

static bool checksum_ok(const std::array<char, 512>& b) {
    uint64_t expected = parse_numeric(b.data() + 148, 8);
    uint64_t unsigned_sum = 0;
    int64_t signed_sum = 0;
    for (size_t i = 0; i < b.size(); ++i) {
        char c = (i >= 148 && i < 156) ? ' ' : b[i];
        unsigned_sum += (unsigned char)c;
        signed_sum += (signed char)c;
    }
    return expected == unsigned_sum || (int64_t)expected == signed_sum;
}

TarExtractor::TarExtractor(fs::path root) : m_root(std::move(root)) {}

fs::path TarExtractor::safe_path(const std::string& name) const {
    fs::path rel = fs::path(name).lexically_normal();
    if (rel.is_absolute() || rel.has_root_name()) {
        throw ExtractError("tar: absolute entry path: " + name);
    }
    for (const auto& part : rel) {
        if (part == "..") throw ExtractError("tar: entry escapes the target directory: " + name);
    }
    return m_root / rel;
}

void TarExtractor::write(const char* data, size_t len) {
    while (len > 0) {
        size_t take = 0;
        switch (m_state) {
        case State::Header:
            take = std::min(m_block.size() - m_fill, len);
            std::memcpy(m_block.data() + m_fill, data, take);
            m_fill += take;
            if (m_fill == m_block.size()) {
                m_fill = 0;
                on_header();
            }
            break;
        case State::Data:
            take = (size_t)std::min<uint64_t>(m_remaining, len);
            consume_data(data, take);
            m_remaining -= take;
            if (m_remaining == 0) end_entry();
            break;
        case State::Padding:
            take = std::min(m_padding, len);
            m_padding -= take;
            if (m_padding == 0) m_state = State::Header;
            break;
        case State::Done:
            return; // trailing zero fill
        }
        data += take;
        len -= take;
    }
}

static constexpr uint64_t kMaxMetaSize = 1 << 20;

// "<len> <key>=<value>\n" records, len counting the whole record
static std::string pax_path(const std::string& body) {
    std::string path;
    size_t pos = 0;
    while (pos < body.size()) {
        size_t space = body.find(' ', pos);
        if (space == std::string::npos) throw ExtractError("tar: malformed pax record");

        uint64_t len = 0;
        for (size_t i = pos; i < space; ++i) {
            char c = body[i];
            if (c < '0' || c > '9') throw ExtractError("tar: malformed pax record length");
            len = len * 10 + (uint64_t)(c - '0');
            if (len > body.size()) throw ExtractError("tar: pax record overruns header");
        }
        if (len <= space - pos + 1 || pos + len > body.size() || body[pos + len - 1] != '\n') {
            throw ExtractError("tar: malformed pax record");
        }

        std::string record = body.substr(space + 1, pos + len - space - 2);
        size_t eq = record.find('=');
        if (eq == std::string::npos) throw ExtractError("tar: pax record without '='");
        if (record.compare(0, eq, "path") == 0 && eq == 4) path = record.substr(eq + 1);

        pos += len;
    }
    return path;
}

void TarExtractor::on_header() {
    bool all_zero = std::all_of(m_block.begin(), m_block.end(), [](char c) { return c == '\0'; });
    if (all_zero) {
        if (++m_zero_blocks == 2) m_state = State::Done;
        return;
    }
    m_zero_blocks = 0;

    if (!checksum_ok(m_block)) throw ExtractError("tar: header checksum mismatch");

    std::string name;
    if (!m_pending_long_name.empty()) {
        name = std::move(m_pending_long_name);
        m_pending_long_name.clear();
    } else {
        name = field_string(m_block.data(), 100);
        if (std::memcmp(m_block.data() + 257, "ustar", 5) == 0) {
            std::string prefix = field_string(m_block.data() + 345, 155);
            if (!prefix.empty()) name = prefix + "/" + name;
        }
    }

    const uint64_t size = parse_numeric(m_block.data() + 124, 12);
    const char type = m_block[156];

    m_entry = Entry::Skip;
    try {
        switch (type) {
        case '5': {
            fs::create_directories(safe_path(name));
            break;
        }
        case '0':
        case '\0':
        case '7': {
            m_out_path = safe_path(name);
            if (m_out_path.has_parent_path()) fs::create_directories(m_out_path.parent_path());
            m_out.open(m_out_path, std::ios::binary | std::ios::trunc);
            if (!m_out) throw ExtractError("tar: failed to create " + m_out_path.string());
            m_entry = Entry::File;
            break;
        }
        case 'L':
        case 'x':
            if (size > kMaxMetaSize) throw ExtractError("tar: oversized extended header");
            m_entry = type == 'L' ? Entry::LongName : Entry::PaxHeader;
            m_meta.clear();
            break;
        default:
            break; // links, devices, global pax headers
        }
    } catch (const fs::filesystem_error& e) {
        throw ExtractError(std::string("tar: ") + e.what());
    }

    m_remaining = size;
    m_padding = (size_t)((512 - size % 512) % 512);
    if (m_remaining > 0) {
        m_state = State::Data;
    } else {
        end_entry();
    }
}

void TarExtractor::consume_data(const char* data, size_t len) {
    switch (m_entry) {
    case Entry::File:
        m_out.write(data, (std::streamsize)len);
        if (!m_out) throw ExtractError("tar: failed writing " + m_out_path.string());
        break;
    case Entry::LongName:
    case Entry::PaxHeader:
        m_meta.append(data, len);
        break;
    case Entry::Skip:
        break;
    }
}

void TarExtractor::end_entry() {
    if (m_entry == Entry::File) {
        m_out.close();
        if (!m_out) throw ExtractError("tar: failed writing " + m_out_path.string());
        ++m_files;
    } else if (m_entry == Entry::LongName) {
        m_pending_long_name = field_string(m_meta.data(), m_meta.size());
    } else if (m_entry == Entry::PaxHeader) {
        std::string path = pax_path(m_meta);
        if (!path.empty()) m_pending_long_name = std::move(path);
    }
    m_entry = Entry::Skip;
    m_state = m_padding > 0 ? State::Padding : State::Header;
}

void TarExtractor::finish() {
    // an archive may stop at a header boundary without the two zero blocks
    bool at_boundary = m_state == State::Header && m_fill == 0;
    if (m_state != State::Done && !at_boundary) {
        throw ExtractError("tar: archive truncated");
    }
    if (m_out.is_open()) m_out.close();
}

// ---------- tar.gz ----------

TarGzExtractor::TarGzExtractor(const fs::path& root)
    : m_tar(root), m_gz([this](const char* data, size_t len) { m_tar.write(data, len); }) {}

void TarGzExtractor::finish() {
    m_gz.finish();
    m_tar.finish();
}

} // namespace fastembed
