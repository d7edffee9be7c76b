#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace fastembed {

// Single-line byte counter on a stream. Purely observational.
class DownloadProgress {
public:
    DownloadProgress(std::string label, bool enabled, std::ostream& out);

    void start(uint64_t total_bytes);
    void advance(size_t n);
    void finish();

    uint64_t bytes() const { return m_done; }

private:
    std::string m_label;
    bool m_enabled;
    std::ostream& m_out;
    uint64_t m_total = 0;
    uint64_t m_done = 0;
    int64_t m_last_step = -1;

    void draw();
};

} // namespace fastembed
