#include "transport.hpp"

#include <httplib.h>

#include <algorithm>
#include <asio.hpp>
#include <exception>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>

#include "error.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "response.hpp"
#include "sidecar.hpp"
#include "utils.hpp"

namespace {
constexpr std::size_t UPLOAD_CHUNK = 64 * 1024;

bool is_success(int status) { return status >= 200 && status < 300; }

// Status line and headers in wire order, terminated by the blank line.
std::string render_head(const httplib::Response& response) {
    std::string text = (response.version.empty() ? std::string("HTTP/1.1") : response.version) + " " +
                       std::to_string(response.status) + " " + response.reason + "\r\n";
    for (const auto& [name, value] : response.headers) {
        text += name + ": " + value + "\r\n";
    }
    text += "\r\n";
    return text;
}

// Output file removed unless the download completes.
class DownloadTarget {
   public:
    explicit DownloadTarget(const fs::path& path) : m_path(path), m_out(path, std::ios::binary | std::ios::trunc) {
        if (!m_out.is_open()) {
            throw StagingError("[DOWNLOAD] Cannot open output file: " + path.string());
        }
    }
    ~DownloadTarget() {
        if (m_complete) return;
        m_out.close();
        std::error_code ec;
        fs::remove(m_path, ec);
    }

    bool write(const char* data, std::size_t n) {
        m_out.write(data, static_cast<std::streamsize>(n));
        return static_cast<bool>(m_out);
    }

    void complete() {
        m_out.close();
        if (!m_out) throw StagingError("[DOWNLOAD] Write failed: " + m_path.string());
        m_complete = true;
    }

   private:
    fs::path m_path;
    std::ofstream m_out;
    bool m_complete = false;
};
}  // namespace

HttpTransport::HttpTransport(fs::path channel_dir, std::chrono::seconds read_timeout)
    : m_channel_dir(std::move(channel_dir)), m_read_timeout(read_timeout) {}

std::unique_ptr<httplib::Client> HttpTransport::make_client(const std::string& origin,
                                                            const std::optional<Credentials>& credentials) const {
    auto client = std::make_unique<httplib::Client>(origin);
    if (!client->is_valid()) {
        throw NetworkError("[HTTP] Cannot create client for " + origin);
    }
    client->set_read_timeout(static_cast<time_t>(m_read_timeout.count()), 0);
    if (credentials) {
        client->set_basic_auth(credentials->user, credentials->password);
        Log::debug("Using basic auth credentials for user " + credentials->user);
    }
    return client;
}

std::string HttpTransport::upload(const Artifact& artifact, const UploadOptions& options) {
    const std::string url = Utils::join_url(options.service_url, artifact.logical_name());
    const SplitUrl target = Utils::split_url(url);

    std::error_code ec;
    const uint64_t size = fs::file_size(artifact.path(), ec);
    if (ec) {
        throw StagingError("[UPLOAD] Cannot stat " + artifact.path().string() + ": " + ec.message());
    }
    std::ifstream file(artifact.path(), std::ifstream::binary);
    if (!file.is_open()) {
        throw StagingError("[UPLOAD] Cannot open " + artifact.path().string());
    }
    Log::info("Uploading '" + artifact.logical_name() + "' (size: " + format_bytes(size) + ")...");
    Log::debug("PUT " + url);

    auto client = make_client(target.origin, options.credentials);

    httplib::Request req;
    req.method = "PUT";
    req.path = target.path;
    if (options.max_downloads) req.set_header(std::string(Header::MaxDownloads), std::to_string(*options.max_downloads));
    if (options.max_days) req.set_header(std::string(Header::MaxDays), std::to_string(*options.max_days));

    ProgressMeter meter("Uploading", size, std::cerr, options.show_progress);
    std::vector<char> chunk(UPLOAD_CHUNK);
    std::exception_ptr source_error;
    req.content_length_ = static_cast<size_t>(size);
    req.content_provider_ = [&](size_t /*offset*/, size_t length, httplib::DataSink& sink) {
        file.read(chunk.data(), static_cast<std::streamsize>(std::min(length, chunk.size())));
        const std::streamsize n = file.gcount();
        if (n <= 0) {
            source_error = std::make_exception_ptr(
                StagingError("[UPLOAD] " + artifact.path().string() + " ended before " + std::to_string(size) + " bytes"));
            return false;
        }
        if (!sink.write(chunk.data(), static_cast<size_t>(n))) return false;
        meter.advance(static_cast<uint64_t>(n));
        return true;
    };

    SidecarChannel sidecar(m_channel_dir);
    Pipe body;
    std::string header_text;
    std::string body_text;
    std::exception_ptr header_error;
    std::exception_ptr body_error;
    std::exception_ptr channel_error;
    httplib::Response res;
    httplib::Error error = httplib::Error::Success;
    bool sent = false;
    {
        // readers are attached before the request goes out
        asio::thread_pool readers(2);
        asio::post(readers, [&header_text, &header_error, fd = sidecar.take_reader()]() mutable {
            try {
                header_text = drain(std::move(fd));
            } catch (const std::exception&) {
                header_error = std::current_exception();
            }
        });
        asio::post(readers, [&body_text, &body_error, fd = body.take_reader()]() mutable {
            try {
                body_text = drain(std::move(fd));
            } catch (const std::exception&) {
                body_error = std::current_exception();
            }
        });

        // closed before the pool joins, on every path
        FileDescriptor header_writer = sidecar.take_writer();
        FileDescriptor body_writer = body.take_writer();

        req.response_handler = [&](const httplib::Response& response) {
            try {
                header_writer.write_all(render_head(response));
                header_writer.close();
                return true;
            } catch (const std::system_error&) {
                channel_error = std::current_exception();
                return false;
            }
        };
        req.content_receiver = [&](const char* data, size_t n, uint64_t /*offset*/, uint64_t /*total*/) {
            try {
                body_writer.write_all(data, n);
                return true;
            } catch (const std::system_error&) {
                channel_error = std::current_exception();
                return false;
            }
        };

        sent = client->send(req, res, error);
        meter.finish();
        header_writer.close();
        body_writer.close();
        readers.join();
    }

    for (const auto& failure : {source_error, channel_error, header_error, body_error}) {
        if (!failure) continue;
        try {
            std::rethrow_exception(failure);
        } catch (const TransferError&) {
            throw;
        } catch (const std::exception& e) {
            throw NetworkError("[UPLOAD] Response capture failed: " + std::string(e.what()));
        }
    }

    std::string raw = header_text + body_text;
    Log::debug("Raw response (headers and body):\n" + raw);

    if (Response::is_authorization_failure(raw)) {
        throw AuthorizationError("[UPLOAD] Authorization failed for " + url + ". Please check your credentials.");
    }
    if (!sent) {
        throw NetworkError("[UPLOAD] Failed to upload '" + artifact.logical_name() + "' to " + url + ": " +
                           httplib::to_string(error));
    }
    if (!is_success(res.status)) {
        throw NetworkError("[UPLOAD] Failed to upload '" + artifact.logical_name() + "' (HTTP " +
                           std::to_string(res.status) + ")" + (body_text.empty() ? "" : ": " + Utils::trim(body_text)));
    }
    return raw;
}

void HttpTransport::download(const std::string& url, const fs::path& destination, bool show_progress) {
    const SplitUrl target = Utils::split_url(url);
    auto client = make_client(target.origin, std::nullopt);
    client->set_follow_location(true);

    DownloadTarget out(destination);
    ProgressMeter meter("Downloading", 0, std::cerr, show_progress);
    int status = 0;
    bool write_failed = false;

    Log::debug("GET " + url + " -> " + destination.string());
    auto res = client->Get(
        target.path, httplib::Headers{},
        [&](const httplib::Response& response) {
            status = response.status;
            return is_success(response.status);
        },
        [&](const char* data, size_t n) {
            if (!out.write(data, n)) {
                write_failed = true;
                return false;
            }
            return true;
        },
        [&](uint64_t current, uint64_t total) {
            meter.update(current, total);
            return true;
        });
    meter.finish();

    if (write_failed) {
        throw StagingError("[DOWNLOAD] Write failed: " + destination.string());
    }
    if (status != 0 && !is_success(status)) {
        throw NetworkError("[DOWNLOAD] Download failed for URL: " + url + " (HTTP " + std::to_string(status) + ")");
    }
    if (!res) {
        throw NetworkError("[DOWNLOAD] Download failed for URL: " + url + ": " + httplib::to_string(res.error()));
    }
    out.complete();
}

HttpReply HttpTransport::remove(const std::string& url) {
    const SplitUrl target = Utils::split_url(url);
    auto client = make_client(target.origin, std::nullopt);
    Log::debug("DELETE " + url);
    auto res = client->Delete(target.path);
    if (!res) {
        throw NetworkError("[DELETE] Request to " + url + " failed: " + httplib::to_string(res.error()));
    }
    return HttpReply{res->status, res->body};
}

std::string HttpTransport::head(const std::string& url) {
    const SplitUrl target = Utils::split_url(url);
    auto client = make_client(target.origin, std::nullopt);
    client->set_follow_location(true);
    Log::debug("HEAD " + url);
    auto res = client->Head(target.path);
    if (!res) {
        throw NetworkError("[INFO] Failed to retrieve headers from " + url + ": " + httplib::to_string(res.error()));
    }
    return render_head(*res);
}
