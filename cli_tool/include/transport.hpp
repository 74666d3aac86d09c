#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "staging.hpp"
#include "types.h"

namespace httplib {
class Client;
}

struct UploadOptions {
    std::string service_url;
    std::optional<uint32_t> max_downloads;
    std::optional<uint32_t> max_days;
    std::optional<Credentials> credentials;
    bool show_progress = true;
};

class Transport {
   public:
    virtual ~Transport() = default;

    // Streams the artifact to <service_url>/<logical name>. Returns the captured exchange:
    // status line and headers, a blank line, then the response body.
    virtual std::string upload(const Artifact& artifact, const UploadOptions& options) = 0;
    virtual void download(const std::string& url, const fs::path& destination, bool show_progress) = 0;
    virtual HttpReply remove(const std::string& url) = 0;
    // Status line and headers of a HEAD request.
    virtual std::string head(const std::string& url) = 0;
};

class HttpTransport : public Transport {
   public:
    // The sidecar FIFO of each upload is created inside channel_dir.
    HttpTransport(fs::path channel_dir, std::chrono::seconds read_timeout);

    std::string upload(const Artifact& artifact, const UploadOptions& options) override;
    void download(const std::string& url, const fs::path& destination, bool show_progress) override;
    HttpReply remove(const std::string& url) override;
    std::string head(const std::string& url) override;

   private:
    std::unique_ptr<httplib::Client> make_client(const std::string& origin,
                                                 const std::optional<Credentials>& credentials) const;

    fs::path m_channel_dir;
    std::chrono::seconds m_read_timeout;
};
