#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Command {
inline constexpr std::string_view SEND = "send";
inline constexpr std::string_view RECEIVE = "receive";
inline constexpr std::string_view DELETE = "delete";
inline constexpr std::string_view INFO = "info";
}  // namespace Command

namespace Header {
// transfer.sh wire contract
inline constexpr std::string_view UrlDelete = "X-Url-Delete";
inline constexpr std::string_view MaxDownloads = "Max-Downloads";
inline constexpr std::string_view MaxDays = "Max-Days";
inline constexpr std::string_view RemainingDownloads = "X-Remaining-Downloads";
inline constexpr std::string_view RemainingDays = "X-Remaining-Days";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
}  // namespace Header

inline constexpr std::string_view ARCHIVE_NAME = "transfer_archive.zip";
inline constexpr std::string_view ENCRYPTED_SUFFIX = ".enc";
inline constexpr std::string_view DEFAULT_SERVICE_URL = "https://transfer.obeone.cloud";

struct Credentials {
    std::string user;
    std::string password;
};

struct TransferRequest {
    std::vector<std::filesystem::path> inputs;
    std::string service_url{DEFAULT_SERVICE_URL};
    std::optional<uint32_t> max_downloads;
    std::optional<uint32_t> max_days;
    std::optional<std::string> encryption_key;
    std::optional<Credentials> credentials;
    bool request_confirmation = true;
    bool show_progress = true;
};

struct TransferResult {
    std::string download_url;
    std::optional<std::string> delete_url;
};

struct ReceiveRequest {
    std::string url;
    std::filesystem::path destination{"."};
    std::optional<std::string> decryption_key;
    bool offer_extract = false;
    bool show_progress = true;
};

struct ReceiveResult {
    std::filesystem::path output;
    bool extracted = false;
    bool archive_removed = false;
};

struct FileInfo {
    std::optional<uint64_t> size;
    std::optional<std::string> mime_type;
    std::optional<std::string> remaining_days;
    std::optional<std::string> remaining_downloads;
};

struct HttpReply {
    int status = 0;
    std::string body;
};
