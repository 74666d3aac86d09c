#include "progress.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    if (bytes < 1024) return std::to_string(bytes) + "B";
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << units[unit];
    return oss.str();
}

ProgressMeter::ProgressMeter(std::string label, uint64_t total, std::ostream& out, bool enabled)
    : m_label(std::move(label)),
      m_total(total),
      m_out(out),
      m_enabled(enabled),
      m_start(std::chrono::steady_clock::now()),
      m_last_draw(m_start) {}

void ProgressMeter::advance(uint64_t n) {
    m_current += n;
    draw(false);
}

void ProgressMeter::update(uint64_t current, uint64_t total) {
    m_current = current;
    if (total) m_total = total;
    draw(false);
}

void ProgressMeter::finish() {
    if (m_finished) return;
    m_finished = true;
    draw(true);
    if (m_enabled) m_out << std::endl;
}

void ProgressMeter::draw(bool force) {
    if (!m_enabled) return;
    const auto now = std::chrono::steady_clock::now();
    if (!force && now - m_last_draw < std::chrono::milliseconds(100)) return;
    m_last_draw = now;

    const double elapsed = std::chrono::duration<double>(now - m_start).count();
    const auto rate = elapsed > 0 ? static_cast<uint64_t>(static_cast<double>(m_current) / elapsed) : 0;

    std::ostringstream line;
    line << "\r" << m_label << " ";
    if (m_total > 0) {
        const double ratio = std::min(1.0, static_cast<double>(m_current) / static_cast<double>(m_total));
        const int width = 30;
        const int filled = static_cast<int>(ratio * width);
        line << "[" << std::string(filled, '=') << (filled < width ? ">" : "")
             << std::string(width - filled - (filled < width ? 1 : 0), ' ') << "] " << std::fixed
             << std::setprecision(1) << std::setw(5) << ratio * 100.0 << "% ";
    }
    line << format_bytes(m_current) << " " << format_bytes(rate) << "/s";
    m_out << line.str() << std::flush;
}
