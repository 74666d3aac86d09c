#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

using Clock = std::chrono::system_clock;

// Metadata of one uploaded file.
struct StoredFile {
    std::string token;
    std::string name;
    std::string delete_token;
    std::string content_type;
    uint64_t size{};
    std::optional<uint32_t> remaining_downloads;  // unlimited if empty
    std::optional<Clock::time_point> expires_at;  // never if empty
};

// Live means neither expired nor out of downloads.
bool is_live(const StoredFile& file, Clock::time_point now);

class Storage {
   public:
    virtual ~Storage() = default;

    virtual void put(const StoredFile& file, const std::string& body) = 0;
    // Live metadata, no side effect.
    virtual std::optional<StoredFile> find(const std::string& token, const std::string& name) = 0;
    // Counts one download and returns the metadata after counting.
    virtual std::optional<StoredFile> consume(const std::string& token, const std::string& name) = 0;
    virtual std::string load(const StoredFile& file) = 0;
    // False when no entry matches all three values.
    virtual bool remove(const std::string& token, const std::string& name, const std::string& delete_token) = 0;
};

class MemoryStorage : public Storage {
   public:
    void put(const StoredFile& file, const std::string& body) override;
    std::optional<StoredFile> find(const std::string& token, const std::string& name) override;
    std::optional<StoredFile> consume(const std::string& token, const std::string& name) override;
    std::string load(const StoredFile& file) override;
    bool remove(const std::string& token, const std::string& name, const std::string& delete_token) override;

   private:
    struct Entry {
        StoredFile file;
        std::string body;
    };

    std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;  // keyed by token
};
