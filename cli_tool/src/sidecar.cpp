#include "sidecar.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <asio.hpp>
#include <atomic>
#include <cerrno>
#include <system_error>

#include "error.hpp"
#include "log.hpp"

namespace {
std::system_error last_error(const std::string& what) {
    return std::system_error(errno, std::generic_category(), what);
}
}  // namespace

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        close();
        m_fd = other.release();
    }
    return *this;
}

void FileDescriptor::close() noexcept {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

void FileDescriptor::write_all(const char* data, std::size_t n) {
    while (n > 0) {
        const ssize_t written = ::write(m_fd, data, n);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw last_error("write to channel");
        }
        data += written;
        n -= static_cast<std::size_t>(written);
    }
}

Pipe::Pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw last_error("pipe");
    }
    m_reader = FileDescriptor(fds[0]);
    m_writer = FileDescriptor(fds[1]);
}

SidecarChannel::SidecarChannel(const fs::path& dir) {
    static std::atomic<unsigned> counter{0};
    for (;;) {
        m_path = dir / ("sidecar." + std::to_string(::getpid()) + "." + std::to_string(++counter));
        if (::mkfifo(m_path.c_str(), 0600) == 0) break;
        if (errno != EEXIST) {
            throw StagingError("[SIDECAR] Cannot create header channel " + m_path.string() + ": " +
                               std::error_code(errno, std::generic_category()).message());
        }
    }
    try {
        // reader first and non-blocking, otherwise opening either end would wait for the other
        m_reader = FileDescriptor(::open(m_path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
        if (!m_reader.valid()) throw last_error("open sidecar for reading");
        m_writer = FileDescriptor(::open(m_path.c_str(), O_WRONLY | O_CLOEXEC));
        if (!m_writer.valid()) throw last_error("open sidecar for writing");
        const int flags = ::fcntl(m_reader.get(), F_GETFL);
        if (flags < 0 || ::fcntl(m_reader.get(), F_SETFL, flags & ~O_NONBLOCK) < 0) {
            throw last_error("fcntl sidecar");
        }
    } catch (const std::system_error& e) {
        ::unlink(m_path.c_str());
        throw StagingError("[SIDECAR] " + std::string(e.what()));
    }
    Log::debug("Sidecar channel attached: " + m_path.string());
}

SidecarChannel::~SidecarChannel() {
    m_writer.close();
    m_reader.close();
    if (::unlink(m_path.c_str()) != 0 && errno != ENOENT) {
        Log::warn("Could not remove sidecar channel " + m_path.string());
    } else {
        Log::debug("Sidecar channel removed: " + m_path.string());
    }
}

std::string drain(FileDescriptor fd) {
    asio::io_context io;
    asio::posix::stream_descriptor descriptor(io, fd.release());
    std::string out;
    asio::error_code ec;
    asio::read(descriptor, asio::dynamic_buffer(out), ec);
    if (ec && ec != asio::error::eof) {
        throw std::system_error(ec, "read from channel");
    }
    return out;
}
