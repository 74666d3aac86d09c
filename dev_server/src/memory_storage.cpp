#include "storage.hpp"

bool is_live(const StoredFile& file, Clock::time_point now) {
    if (file.expires_at && *file.expires_at <= now) return false;
    if (file.remaining_downloads && *file.remaining_downloads == 0) return false;
    return true;
}

void MemoryStorage::put(const StoredFile& file, const std::string& body) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[file.token] = Entry{file, body};
}

std::optional<StoredFile> MemoryStorage::find(const std::string& token, const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(token);
    if (it == m_entries.end() || it->second.file.name != name || !is_live(it->second.file, Clock::now())) {
        return std::nullopt;
    }
    return it->second.file;
}

std::optional<StoredFile> MemoryStorage::consume(const std::string& token, const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(token);
    if (it == m_entries.end() || it->second.file.name != name || !is_live(it->second.file, Clock::now())) {
        return std::nullopt;
    }
    StoredFile& file = it->second.file;
    if (file.remaining_downloads) --*file.remaining_downloads;
    return file;
}

std::string MemoryStorage::load(const StoredFile& file) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(file.token);
    return it == m_entries.end() ? std::string() : it->second.body;
}

bool MemoryStorage::remove(const std::string& token, const std::string& name, const std::string& delete_token) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(token);
    if (it == m_entries.end() || it->second.file.name != name || it->second.file.delete_token != delete_token) {
        return false;
    }
    m_entries.erase(it);
    return true;
}
