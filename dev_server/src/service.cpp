#include "service.hpp"

#include <httplib.h>

#include <chrono>
#include <cstdio>
#include <random>
#include <stdexcept>

#include "log.hpp"
#include "utils.hpp"

namespace {
constexpr std::size_t TOKEN_LENGTH = 10;
constexpr std::size_t DELETE_TOKEN_LENGTH = 20;
constexpr auto SECONDS_PER_DAY = 24 * 60 * 60;

std::string base_url(const httplib::Request& req) {
    const std::string host = req.get_header_value("Host");
    return "http://" + (host.empty() ? std::string("localhost") : host);
}

std::string guess_content_type(const std::string& name) {
    if (Utils::ends_with(name, ".zip")) return "application/zip";
    if (Utils::ends_with(name, ".tar.gz") || Utils::ends_with(name, ".tgz")) return "application/gzip";
    if (Utils::ends_with(name, ".txt")) return "text/plain; charset=utf-8";
    if (Utils::ends_with(name, ".json")) return "application/json";
    return "application/octet-stream";
}

std::optional<uint32_t> limit_header(const httplib::Request& req, std::string_view name) {
    const std::string key(name);
    if (!req.has_header(key)) return std::nullopt;
    const std::string value = Utils::trim(req.get_header_value(key));
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 9 ||
        std::stoul(value) == 0) {
        throw std::invalid_argument("Invalid " + key + " header: " + value);
    }
    return static_cast<uint32_t>(std::stoul(value));
}

void set_remaining_headers(const StoredFile& file, httplib::Response& res) {
    if (file.remaining_downloads) {
        res.set_header(std::string(Header::RemainingDownloads), std::to_string(*file.remaining_downloads));
    }
    if (file.expires_at) {
        const auto left = std::chrono::duration_cast<std::chrono::seconds>(*file.expires_at - Clock::now()).count();
        const auto days = left <= 0 ? 0 : (left + SECONDS_PER_DAY - 1) / SECONDS_PER_DAY;
        res.set_header(std::string(Header::RemainingDays), std::to_string(days));
    }
}
}  // namespace

HostingService::HostingService(Storage& storage, std::optional<Credentials> auth)
    : m_storage(storage), m_auth(std::move(auth)) {}

std::string HostingService::generate_token(std::size_t length) {
    static constexpr char alphabet[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::size_t> dis(0, sizeof(alphabet) - 2);

    std::string token;
    token.reserve(length);
    for (std::size_t i = 0; i < length; ++i) token += alphabet[dis(gen)];
    return token;
}

void HostingService::mount(httplib::Server& svr) {
    // Request logger
    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        Log::debug(req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    // Error logger
    svr.set_error_logger([](const httplib::Error& err, const httplib::Request* req) {
        std::string message = httplib::to_string(err) + " while processing request";
        if (req) {
            message += ", request: '" + req->method + " " + req->path + " " + req->version + "'" +
                       ", host: " + req->get_header_value("Host");
        }
        Log::warn(message);
    });

    // Error handler, keeps bodies the routes already set
    svr.set_error_handler([](const httplib::Request& /*req*/, httplib::Response& res) {
        if (!res.body.empty()) return;
        char buf[64];
        std::snprintf(buf, sizeof(buf), "Error Status: %d\n", res.status);
        res.set_content(buf, "text/plain");
    });

    // Exception handler
    svr.set_exception_handler([](const httplib::Request& /*req*/, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "Unknown Exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::invalid_argument& e) {
            res.status = httplib::StatusCode::BadRequest_400;
            res.set_content(std::string(e.what()) + "\n", "text/plain");
            return;
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // reported below as a 500
        }
        Log::error("Error 500: " + what);
        res.set_content("Error 500: " + what + "\n", "text/plain");
        res.status = httplib::StatusCode::InternalServerError_500;
    });

    svr.Put(R"(/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (m_auth) {
            const auto expected = httplib::make_basic_authentication_header(m_auth->user, m_auth->password);
            if (req.get_header_value(expected.first) != expected.second) {
                res.status = httplib::StatusCode::Unauthorized_401;
                res.set_header("WWW-Authenticate", "Basic realm=\"Restricted\"");
                res.set_content("Not authorized\n", "text/plain");
                return;
            }
        }

        StoredFile file;
        file.name = req.matches[1].str();
        file.token = generate_token(TOKEN_LENGTH);
        file.delete_token = generate_token(DELETE_TOKEN_LENGTH);
        file.size = req.body.size();
        file.content_type = req.has_header(std::string(Header::ContentType))
                                ? req.get_header_value(std::string(Header::ContentType))
                                : guess_content_type(file.name);
        file.remaining_downloads = limit_header(req, Header::MaxDownloads);
        if (auto days = limit_header(req, Header::MaxDays)) {
            file.expires_at = Clock::now() + std::chrono::seconds(static_cast<long long>(*days) * SECONDS_PER_DAY);
        }
        m_storage.put(file, req.body);
        Log::info("Stored '" + file.name + "' (" + std::to_string(file.size) + " bytes) as " + file.token);

        const std::string url = base_url(req) + "/" + file.token + "/" + Utils::percent_encode(file.name);
        res.set_header(std::string(Header::UrlDelete), url + "/" + file.delete_token);
        res.set_content(url + "\n", "text/plain");
    });

    // HEAD is routed here as well; only GET counts a download
    svr.Get(R"(/([A-Za-z0-9]+)/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string token = req.matches[1].str();
        const std::string name = req.matches[2].str();
        const bool head = req.method == "HEAD";

        auto file = head ? m_storage.find(token, name) : m_storage.consume(token, name);
        if (!file) {
            res.status = httplib::StatusCode::NotFound_404;
            res.set_content("Not Found\n", "text/plain");
            return;
        }
        set_remaining_headers(*file, res);
        res.set_content(m_storage.load(*file), file->content_type);
    });

    svr.Delete(R"(/([A-Za-z0-9]+)/([^/]+)/([A-Za-z0-9]+))",
               [this](const httplib::Request& req, httplib::Response& res) {
                   if (!m_storage.remove(req.matches[1].str(), req.matches[2].str(), req.matches[3].str())) {
                       res.status = httplib::StatusCode::NotFound_404;
                       res.set_content("Not Found\n", "text/plain");
                       return;
                   }
                   Log::info("Deleted " + req.matches[1].str());
                   res.set_content("File deleted\n", "text/plain");
               });

    svr.Get("/health", [](const httplib::Request& /*req*/, httplib::Response& res) {
        res.set_content("Approaching Neutral Zone, all systems normal and functioning.\n", "text/plain");
    });
}
