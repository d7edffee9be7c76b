#include "fastembed/store/DownloadProgress.hpp"

#include <iomanip>
#include <ostream>

namespace fastembed {

static double mib(uint64_t n) {
    return (double)n / (1024.0 * 1024.0);
}

DownloadProgress::DownloadProgress(std::string label, bool enabled, std::ostream& out)
    : m_label(std::move(label)), m_enabled(enabled), m_out(out) {}

void DownloadProgress::start(uint64_t total_bytes) {
    m_total = total_bytes;
    m_done = 0;
    m_last_step = -1;
    draw();
}

void DownloadProgress::advance(size_t n) {
    m_done += n;
    draw();
}

void DownloadProgress::finish() {
    if (!m_enabled) return;
    m_last_step = -1;
    draw();
    m_out << "\n";
    m_out.flush();
}

void DownloadProgress::draw() {
    if (!m_enabled) return;

    // redraw once per percent, or once per MiB when the size is unknown
    int64_t step = m_total > 0 ? (int64_t)(m_done * 100 / m_total) : (int64_t)(m_done >> 20);
    if (step == m_last_step) return;
    m_last_step = step;

    m_out << "\r" << m_label << " " << std::fixed << std::setprecision(1);
    if (m_total > 0) {
        m_out << std::setw(3) << step << "% (" << mib(m_done) << " / " << mib(m_total) << " MiB)";
    } else {
        m_out << mib(m_done) << " MiB";
    }
    m_out.flush();
}

} // namespace fastembed
