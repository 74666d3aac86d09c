#pragma once

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>
#include <string_view>

#include "error.hpp"

struct SplitUrl {
    std::string origin;  // scheme://host[:port]
    std::string path;    // always starts with '/'
};

namespace Utils {
inline bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool istarts_with(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

inline bool icontains(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
    return it != haystack.end();
}

inline std::string trim(std::string_view s) {
    const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return std::string(s.substr(begin, end - begin));
}

inline SplitUrl split_url(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        throw UsageError("Invalid URL (missing scheme): " + std::string(url));
    }
    const std::string_view scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        throw UsageError("Unsupported URL scheme '" + std::string(scheme) + "': " + std::string(url));
    }
    const auto host_begin = scheme_end + 3;
    const auto path_begin = url.find('/', host_begin);
    SplitUrl out;
    out.origin = std::string(url.substr(0, path_begin));
    out.path = path_begin == std::string_view::npos ? "/" : std::string(url.substr(path_begin));
    if (out.origin.size() == host_begin) {
        throw UsageError("Invalid URL (missing host): " + std::string(url));
    }
    return out;
}

// Last path segment of the URL, without query or fragment.
inline std::string url_basename(std::string_view url) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) url = url.substr(0, cut);
    while (!url.empty() && url.back() == '/') url.remove_suffix(1);
    const auto scheme_end = url.find("://");
    const auto host_begin = scheme_end == std::string_view::npos ? 0 : scheme_end + 3;
    const auto slash = url.rfind('/');
    if (slash == std::string_view::npos || slash < host_begin) return {};
    return std::string(url.substr(slash + 1));
}

inline std::string percent_encode(std::string_view segment) {
    std::string out;
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

inline std::string percent_decode(std::string_view segment) {
    std::string out;
    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '%' && i + 2 < segment.size() &&
            std::isxdigit(static_cast<unsigned char>(segment[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(segment[i + 2]))) {
            out += static_cast<char>(std::stoi(std::string(segment.substr(i + 1, 2)), nullptr, 16));
            i += 2;
        } else {
            out += segment[i];
        }
    }
    return out;
}

inline std::string join_url(std::string_view base, std::string_view name) {
    std::string out(base);
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out + "/" + percent_encode(name);
}
}  // namespace Utils
