// Unidirectional byte channels used to split one HTTP exchange into headers and body.
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Owned file descriptor.
class FileDescriptor {
   public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : m_fd(fd) {}
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : m_fd(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;
    ~FileDescriptor() { close(); }

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }
    int release() {
        int fd = m_fd;
        m_fd = -1;
        return fd;
    }
    void close() noexcept;

    // Writes everything or throws std::system_error.
    void write_all(const char* data, std::size_t n);
    void write_all(const std::string& s) { write_all(s.data(), s.size()); }

   private:
    int m_fd = -1;
};

// Anonymous pipe carrying the response body.
class Pipe {
   public:
    Pipe();

    FileDescriptor take_reader() { return std::move(m_reader); }
    FileDescriptor take_writer() { return std::move(m_writer); }

   private:
    FileDescriptor m_reader;
    FileDescriptor m_writer;
};

// Named FIFO carrying the response headers. The read end is opened in the constructor,
// before anything can be written, and the FIFO is unlinked when the channel goes away.
class SidecarChannel {
   public:
    explicit SidecarChannel(const fs::path& dir);
    SidecarChannel(const SidecarChannel&) = delete;
    SidecarChannel& operator=(const SidecarChannel&) = delete;
    ~SidecarChannel();

    const fs::path& path() const { return m_path; }

    FileDescriptor take_reader() { return std::move(m_reader); }
    FileDescriptor take_writer() { return std::move(m_writer); }

   private:
    fs::path m_path;
    FileDescriptor m_reader;
    FileDescriptor m_writer;
};

// Reads fd until EOF.
std::string drain(FileDescriptor fd);
