#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

// "1.5KiB", "12.0MiB"... like `numfmt --to=iec-i --suffix=B`.
std::string format_bytes(uint64_t bytes);

// Throughput meter drawing a single-line progress bar.
class ProgressMeter {
   public:
    ProgressMeter(std::string label, uint64_t total, std::ostream& out, bool enabled);

    void advance(uint64_t n);
    void update(uint64_t current, uint64_t total);
    void finish();

    uint64_t transferred() const { return m_current; }

   private:
    void draw(bool force);

    std::string m_label;
    uint64_t m_total;
    uint64_t m_current = 0;
    std::ostream& m_out;
    bool m_enabled;
    bool m_finished = false;
    std::chrono::steady_clock::time_point m_start;
    std::chrono::steady_clock::time_point m_last_draw;
};
