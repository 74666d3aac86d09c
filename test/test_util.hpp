#pragma once

#include <httplib.h>
#include <stdlib.h>

#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "archive.hpp"
#include "crypto.hpp"
#include "error.hpp"
#include "prompt.hpp"
#include "service.hpp"
#include "staging.hpp"
#include "storage.hpp"
#include "transport.hpp"

namespace transfersh::test {

// Scratch directory removed with everything in it.
class TempDir {
   public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "transfersh-test.XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data()) == nullptr) throw std::runtime_error("mkdtemp failed");
        m_path = buf.data();
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }
    fs::path operator/(const std::string& name) const { return m_path / name; }

   private:
    fs::path m_path;
};

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::string from_hex(const std::string& hex) {
    std::string out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out += static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16));
    }
    return out;
}

// First regular file called name anywhere under dir.
inline std::optional<fs::path> find_file(const fs::path& dir, const std::string& name) {
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().filename() == name) return entry.path();
    }
    return std::nullopt;
}

// Answers prompts from prepared queues; runs out into "no answer".
class ScriptedPrompter : public Prompter {
   public:
    std::string read_secret(const std::string& prompt) override {
        prompts.push_back(prompt);
        if (secrets.empty()) return {};
        std::string s = secrets.front();
        secrets.pop_front();
        return s;
    }

    bool confirm(const std::string& prompt, bool default_yes) override {
        prompts.push_back(prompt);
        if (answers.empty()) return default_yes;
        bool answer = answers.front();
        answers.pop_front();
        return answer;
    }

    std::deque<std::string> secrets;
    std::deque<bool> answers;
    std::vector<std::string> prompts;
};

inline const std::string canned_response =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: text/plain\r\n"
    "X-Url-Delete: https://transfer.example/abc123/file.txt/del456\r\n"
    "\r\n"
    "https://transfer.example/abc123/file.txt\n";

// In-memory stand-in for the hosting service.
class FakeTransport : public Transport {
   public:
    std::string upload(const Artifact& artifact, const UploadOptions& options) override {
        ++upload_calls;
        uploaded_name = artifact.logical_name();
        uploaded_bytes = read_file(artifact.path());
        uploaded_owned = artifact.is_owned();
        last_options = options;
        if (fail_upload) throw NetworkError("[UPLOAD] connection refused");
        return response;
    }

    void download(const std::string& url, const fs::path& destination, bool /*show_progress*/) override {
        auto it = files.find(url);
        if (it == files.end()) throw NetworkError("[DOWNLOAD] Download failed for URL: " + url + " (HTTP 404)");
        write_file(destination, it->second);
    }

    HttpReply remove(const std::string& url) override {
        removed.push_back(url);
        return delete_reply;
    }

    std::string head(const std::string& /*url*/) override { return head_reply; }

    std::string response = canned_response;
    bool fail_upload = false;
    int upload_calls = 0;
    std::string uploaded_name;
    std::string uploaded_bytes;
    bool uploaded_owned = false;
    UploadOptions last_options;

    std::map<std::string, std::string> files;
    std::vector<std::string> removed;
    HttpReply delete_reply{200, "File deleted\n"};
    std::string head_reply;
};

// Leaves a partial archive in the staging directory, then fails.
class FailingArchiver : public ZipArchiver {
   public:
    void require_packer() const override {}
    Artifact archive(const std::vector<fs::path>& /*inputs*/, StagingArea& staging) override {
        Artifact partial = Artifact::owned(staging.reserve(std::string(ARCHIVE_NAME)), std::string(ARCHIVE_NAME));
        write_file(partial.path(), "PK partial");
        throw StagingError("[ARCHIVE] zip exited with code 12");
    }
};

class FailingCipher : public Cipher {
   public:
    Artifact encrypt(const Artifact& input, const std::string& /*key*/, StagingArea& staging) override {
        const std::string name = input.logical_name() + std::string(ENCRYPTED_SUFFIX);
        Artifact partial = Artifact::owned(staging.reserve(name), name);
        write_file(partial.path(), "Salted__");
        throw StagingError("[CRYPTO] Encryption failed");
    }
    Artifact decrypt(const Artifact& /*input*/, const std::string& /*key*/, const fs::path& /*output*/) override {
        throw StagingError("[CRYPTO] Decryption failed");
    }
};

// Hosting service on an ephemeral loopback port.
class DevServer {
   public:
    explicit DevServer(std::optional<Credentials> auth = std::nullopt) : m_service(m_storage, std::move(auth)) {
        m_service.mount(m_server);
        m_port = m_server.bind_to_any_port("127.0.0.1");
        m_thread = std::thread([this] { m_server.listen_after_bind(); });
        m_server.wait_until_ready();
    }
    ~DevServer() {
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }
    DevServer(const DevServer&) = delete;
    DevServer& operator=(const DevServer&) = delete;

    std::string url() const { return "http://127.0.0.1:" + std::to_string(m_port); }

   private:
    MemoryStorage m_storage;
    HostingService m_service;
    httplib::Server m_server;
    int m_port = 0;
    std::thread m_thread;
};

}  // namespace transfersh::test
