#include "staging.hpp"

#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <system_error>
#include <vector>

#include "error.hpp"
#include "log.hpp"

Artifact Artifact::borrowed(fs::path path, std::string logical_name) {
    return Artifact(std::move(path), std::move(logical_name), false);
}

Artifact Artifact::owned(fs::path path, std::string logical_name) {
    return Artifact(std::move(path), std::move(logical_name), true);
}

Artifact::Artifact(Artifact&& other) noexcept
    : m_path(std::move(other.m_path)), m_logical_name(std::move(other.m_logical_name)), m_owned(other.m_owned) {
    other.m_path.clear();
    other.m_owned = false;
}

Artifact& Artifact::operator=(Artifact&& other) noexcept {
    if (this != &other) {
        // the incoming artifact is already written, so the previous one can go
        reset();
        m_path = std::move(other.m_path);
        m_logical_name = std::move(other.m_logical_name);
        m_owned = other.m_owned;
        other.m_path.clear();
        other.m_owned = false;
    }
    return *this;
}

Artifact::~Artifact() { reset(); }

fs::path Artifact::release() {
    m_owned = false;
    return m_path;
}

void Artifact::reset() noexcept {
    if (m_owned && !m_path.empty()) {
        std::error_code ec;
        fs::remove(m_path, ec);
        if (ec) {
            Log::warn("Could not remove temporary file " + m_path.string() + ": " + ec.message());
        } else {
            Log::debug("Removed temporary file " + m_path.string());
        }
    }
    m_path.clear();
    m_owned = false;
}

StagingArea::StagingArea(const fs::path& root) {
    std::string pattern = (root / "transfersh.XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw StagingError("[STAGING] Cannot create temporary directory in " + root.string() + ": " +
                           std::error_code(errno, std::generic_category()).message());
    }
    m_dir = buf.data();
    Log::debug("Staging directory: " + m_dir.string());
}

StagingArea::~StagingArea() {
    std::error_code ec;
    fs::remove_all(m_dir, ec);
    if (ec) {
        Log::warn("Could not remove staging directory " + m_dir.string() + ": " + ec.message());
    }
}

fs::path StagingArea::reserve(const std::string& file_name) {
    return m_dir / (std::to_string(++m_counter) + "-" + file_name);
}

std::size_t StagingArea::entry_count() const {
    std::size_t n = 0;
    for ([[maybe_unused]] const auto& entry : fs::directory_iterator(m_dir)) ++n;
    return n;
}

InterruptGuard::InterruptGuard(const StagingArea& staging)
    : m_signals(m_io, SIGINT, SIGTERM), m_dir(staging.dir()) {
    m_restore_terminal = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &m_terminal) == 0;
    m_signals.async_wait([this](const asio::error_code& ec, int signal_number) {
        if (ec) return;
        if (m_restore_terminal) ::tcsetattr(STDIN_FILENO, TCSANOW, &m_terminal);
        std::cerr << "\nInterrupted (signal " << signal_number << "), cleaning up" << std::endl;
        std::error_code rm_ec;
        fs::remove_all(m_dir, rm_ec);
        std::_Exit(130);
    });
    m_thread = std::thread([this] { m_io.run(); });
}

InterruptGuard::~InterruptGuard() {
    asio::error_code ec;
    m_signals.cancel(ec);
    m_io.stop();
    if (m_thread.joinable()) m_thread.join();
}

void move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing);
    fs::remove(from);
}
