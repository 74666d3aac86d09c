#include "response.hpp"

#include <cctype>
#include <vector>

#include "utils.hpp"

namespace {
std::vector<std::string_view> split_lines(std::string_view raw) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos < raw.size()) {
        auto end = raw.find('\n', pos);
        if (end == std::string_view::npos) end = raw.size();
        std::string_view line = raw.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        pos = end + 1;
    }
    return lines;
}

bool is_status_line(std::string_view line) { return line.substr(0, 5) == "HTTP/"; }

std::optional<int> parse_status(std::string_view line) {
    const auto space = line.find(' ');
    if (space == std::string_view::npos) return std::nullopt;
    int code = 0;
    size_t i = space + 1;
    size_t digits = 0;
    for (; i < line.size() && std::isdigit(static_cast<unsigned char>(line[i])); ++i, ++digits) {
        code = code * 10 + (line[i] - '0');
    }
    if (digits != 3) return std::nullopt;
    return code;
}

std::string first_token(std::string_view value) {
    const std::string trimmed = Utils::trim(value);
    return trimmed.substr(0, trimmed.find_first_of(" \t"));
}

bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }
}  // namespace

namespace Response {
std::optional<std::string> header_value(std::string_view raw, std::string_view key) {
    const std::string prefix = std::string(key) + ":";
    for (auto line : split_lines(raw)) {
        if (Utils::istarts_with(line, prefix)) {
            return Utils::trim(line.substr(prefix.size()));
        }
    }
    return std::nullopt;
}

std::optional<int> status_code(std::string_view raw) {
    std::optional<int> code;
    for (auto line : split_lines(raw)) {
        if (is_status_line(line)) code = parse_status(line);
    }
    return code;
}

bool is_authorization_failure(std::string_view raw) {
    if (Utils::icontains(raw, "not authorized")) return true;
    for (auto line : split_lines(raw)) {
        if (is_status_line(line) && parse_status(line) == 401) return true;
    }
    return false;
}

std::string strip_progress_artifacts(std::string_view line) {
    auto p = line.rfind('%');
    while (p != std::string_view::npos) {
        // "%2F" and friends are URL escapes, not a percentage
        const bool escape = p + 2 < line.size() && is_hex(line[p + 1]) && is_hex(line[p + 2]);
        if (!escape) {
            bool digit = false;
            size_t i = p;
            while (i > 0 && (std::isdigit(static_cast<unsigned char>(line[i - 1])) || line[i - 1] == '.')) {
                digit = digit || line[i - 1] != '.';
                --i;
            }
            if (digit) return Utils::trim(line.substr(p + 1));
        }
        p = p == 0 ? std::string_view::npos : line.rfind('%', p - 1);
    }
    return Utils::trim(line);
}

ExtractedUrls extract(std::string_view raw) {
    ExtractedUrls urls;
    urls.delete_url = header_value(raw, Header::UrlDelete).value_or("");

    // the body starts after the first blank line that follows a status line;
    // text without any status line is all body
    std::vector<std::string_view> body;
    bool in_body = true;
    for (auto line : split_lines(raw)) {
        if (is_status_line(line)) {
            in_body = false;
            body.clear();
            continue;
        }
        if (in_body) body.push_back(line);
        if (Utils::trim(line).empty()) in_body = true;
    }
    for (auto it = body.rbegin(); it != body.rend(); ++it) {
        if (!Utils::trim(*it).empty()) {
            urls.download_url = strip_progress_artifacts(*it);
            break;
        }
    }
    return urls;
}

FileInfo parse_info(std::string_view headers) {
    FileInfo info;
    if (auto length = header_value(headers, Header::ContentLength)) {
        const std::string token = first_token(*length);
        // more than 19 digits may not fit in 64 bits
        if (!token.empty() && token.size() <= 19 && token.find_first_not_of("0123456789") == std::string::npos) {
            info.size = std::stoull(token);
        }
    }
    if (auto mime = header_value(headers, Header::ContentType); mime && !mime->empty()) {
        info.mime_type = *mime;
    }
    if (auto days = header_value(headers, Header::RemainingDays)) {
        if (auto token = first_token(*days); !token.empty()) info.remaining_days = token;
    }
    if (auto downloads = header_value(headers, Header::RemainingDownloads)) {
        if (auto token = first_token(*downloads); !token.empty()) info.remaining_downloads = token;
    }
    return info;
}
}  // namespace Response
