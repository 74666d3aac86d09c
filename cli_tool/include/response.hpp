// Pure functions over the captured exchange text (status line, headers, blank line, body).
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "types.h"

namespace Response {
struct ExtractedUrls {
    std::string delete_url;
    std::string download_url;
};

ExtractedUrls extract(std::string_view raw);

// Remainder of the first line starting with "<key>:" (case-insensitive), trimmed.
std::optional<std::string> header_value(std::string_view raw, std::string_view key);

// Status code of the last HTTP status line in the text.
std::optional<int> status_code(std::string_view raw);

bool is_authorization_failure(std::string_view raw);

// Drops a progress meter ("... 100.0%") that leaked in front of a captured line.
std::string strip_progress_artifacts(std::string_view line);

FileInfo parse_info(std::string_view headers);
}  // namespace Response
