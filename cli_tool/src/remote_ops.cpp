#include "error.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "response.hpp"
#include "utils.hpp"

namespace Remote {
HttpReply delete_file(Transport& transport, const std::string& delete_url) {
    if (delete_url.empty()) {
        throw UsageError("No delete URL specified.");
    }
    Log::info("Attempting to delete file using URL: " + delete_url);
    HttpReply reply = transport.remove(delete_url);
    const std::string body = Utils::trim(reply.body);
    Log::debug("Delete response HTTP code: " + std::to_string(reply.status));

    if (reply.status < 200 || reply.status >= 300) {
        throw NetworkError("Failed to delete file (HTTP " + std::to_string(reply.status) + ")" +
                           (body.empty() ? "" : ". Server response: " + body));
    }
    Log::info("File delete request sent successfully (HTTP " + std::to_string(reply.status) + ").");
    if (!body.empty()) Log::info("Server response: " + body);
    return reply;
}

FileInfo info(Transport& transport, const std::string& url) {
    if (url.empty()) {
        throw UsageError("No URL specified for info.");
    }
    Log::info("Retrieving information for URL: " + url);
    const std::string headers = transport.head(url);
    if (Utils::trim(headers).empty()) {
        throw NetworkError("No headers received from " + url + ". URL might be invalid or server unresponsive.");
    }
    Log::debug("Headers received:\n" + headers);
    if (auto code = Response::status_code(headers); code && (*code < 200 || *code >= 300)) {
        Log::warn("Server answered HTTP " + std::to_string(*code) + " for " + url);
    }
    return Response::parse_info(headers);
}
}  // namespace Remote
