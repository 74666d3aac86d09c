// Temporary resources of one pipeline run: the staging directory and the artifacts in it.
#pragma once

#include <termios.h>

#include <asio.hpp>
#include <filesystem>
#include <string>
#include <thread>

namespace fs = std::filesystem;

// A payload at one pipeline stage. An owned artifact removes its file when destroyed or
// replaced; a borrowed one (a caller's original input) is never touched.
class Artifact {
   public:
    static Artifact borrowed(fs::path path, std::string logical_name);
    static Artifact owned(fs::path path, std::string logical_name);

    Artifact() = default;
    Artifact(const Artifact&) = delete;
    Artifact& operator=(const Artifact&) = delete;
    Artifact(Artifact&& other) noexcept;
    Artifact& operator=(Artifact&& other) noexcept;
    ~Artifact();

    const fs::path& path() const { return m_path; }
    const std::string& logical_name() const { return m_logical_name; }
    bool is_owned() const { return m_owned; }
    bool empty() const { return m_path.empty(); }

    // Gives up ownership; the file stays on disk.
    fs::path release();
    // Removes the file now if owned.
    void reset() noexcept;

   private:
    Artifact(fs::path path, std::string logical_name, bool owned)
        : m_path(std::move(path)), m_logical_name(std::move(logical_name)), m_owned(owned) {}

    fs::path m_path;
    std::string m_logical_name;
    bool m_owned = false;
};

// Per-invocation private directory. Every owned artifact and the sidecar FIFO live here,
// so removing it releases everything the run created.
class StagingArea {
   public:
    explicit StagingArea(const fs::path& root);
    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;
    ~StagingArea();

    const fs::path& dir() const { return m_dir; }

    // A fresh path inside the staging directory ending in file_name. Nothing is created.
    fs::path reserve(const std::string& file_name);

    // Number of entries currently present in the staging directory.
    std::size_t entry_count() const;

   private:
    fs::path m_dir;
    unsigned m_counter = 0;
};

// Removes the staging directory and exits with 130 on SIGINT/SIGTERM. The terminal
// settings of stdin seen at construction are put back first, so an interrupted secret
// prompt does not leave echo off.
class InterruptGuard {
   public:
    explicit InterruptGuard(const StagingArea& staging);
    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;
    ~InterruptGuard();

   private:
    asio::io_context m_io;
    asio::signal_set m_signals;
    fs::path m_dir;
    termios m_terminal{};
    bool m_restore_terminal = false;
    std::thread m_thread;
};

// Moves a file, falling back to copy+remove across filesystems.
void move_file(const fs::path& from, const fs::path& to);
