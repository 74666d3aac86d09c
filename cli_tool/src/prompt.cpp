#include "prompt.hpp"

#include <termios.h>
#include <unistd.h>

#include "utils.hpp"

namespace {
// Turns terminal echo off for its lifetime.
class EchoOff {
   public:
    EchoOff() {
        if (::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &m_saved) == 0) {
            termios silent = m_saved;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            m_active = ::tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
        }
    }
    ~EchoOff() {
        if (m_active) ::tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
    }

   private:
    termios m_saved{};
    bool m_active = false;
};
}  // namespace

bool is_yes(const std::string& answer, bool default_yes) {
    const std::string trimmed = Utils::trim(answer);
    if (trimmed.empty()) return default_yes;
    return trimmed == "y" || trimmed == "Y";
}

std::string TerminalPrompter::read_secret(const std::string& prompt) {
    m_out << prompt << std::flush;
    std::string line;
    {
        EchoOff echo_off;
        std::getline(m_in, line);
    }
    m_out << std::endl;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

bool TerminalPrompter::confirm(const std::string& prompt, bool default_yes) {
    m_out << prompt << (default_yes ? " (Y/n): " : " (y/N): ") << std::flush;
    std::string line;
    if (!std::getline(m_in, line)) return false;
    return is_yes(line, default_yes);
}
