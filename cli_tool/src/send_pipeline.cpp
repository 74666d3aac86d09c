#include <system_error>

#include "error.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "response.hpp"
#include "utils.hpp"

void validate(const TransferRequest& request) {
    if (request.inputs.empty()) {
        throw UsageError("No files or directories specified to send.");
    }
    for (const auto& input : request.inputs) {
        std::error_code ec;
        if (!fs::exists(input, ec)) {
            throw UsageError("No such file or directory: " + input.string());
        }
    }
    if (request.max_downloads && *request.max_downloads == 0) {
        throw UsageError("Max downloads must be a positive integer.");
    }
    if (request.max_days && *request.max_days == 0) {
        throw UsageError("Max days must be a positive integer.");
    }
    if (request.credentials && (request.credentials->user.empty() || request.credentials->password.empty())) {
        throw UsageError("Basic auth needs both a username and a password.");
    }
    Utils::split_url(request.service_url);
}

std::optional<std::string> SendPipeline::resolve_key(const TransferRequest& request) {
    if (request.encryption_key && !request.encryption_key->empty()) {
        return request.encryption_key;
    }
    if (!request.request_confirmation) return std::nullopt;

    std::string answer = m_prompter.read_secret("Enter encryption key (leave empty for no encryption, press Enter): ");
    if (answer.empty()) {
        Log::debug("No encryption key provided interactively.");
        return std::nullopt;
    }
    Log::debug("Encryption key provided interactively.");
    return answer;
}

void SendPipeline::confirm(const TransferRequest& request, bool encrypted) {
    std::string message = "You are about to send the following files/directories:\n";
    for (const auto& input : request.inputs) {
        message += "  " + input.filename().string() + "\n";
    }
    if (encrypted) message += "These will be encrypted.\n";
    if (request.max_downloads) message += "Max downloads: " + std::to_string(*request.max_downloads) + "\n";
    if (request.max_days) message += "Max days: " + std::to_string(*request.max_days) + "\n";
    message += "Are you sure you want to proceed?";
    if (!m_prompter.confirm(message, true)) {
        throw Cancelled("Upload cancelled by user.");
    }
}

TransferResult SendPipeline::run(const TransferRequest& request) {
    validate(request);
    const bool bundle = Archive::needs_archive(request.inputs);
    if (bundle) m_archiver.require_packer();

    const std::optional<std::string> key = resolve_key(request);
    if (request.request_confirmation) confirm(request, key.has_value());

    // RAW -> ARCHIVED
    Artifact current = bundle ? m_archiver.archive(request.inputs, m_staging)
                              : Artifact::borrowed(request.inputs.front(), request.inputs.front().filename().string());

    // -> ENCRYPTED; assigning drops the previous owned artifact once the new one exists
    if (key) current = m_cipher.encrypt(current, *key, m_staging);

    if (Log::enabled(Log::Level::Debug)) {
        Log::debug("SHA-256 of '" + current.logical_name() + "': " + Crypto::compute_file_hash(current.path()));
    }

    // -> TRANSMITTED
    UploadOptions options;
    options.service_url = request.service_url;
    options.max_downloads = request.max_downloads;
    options.max_days = request.max_days;
    options.credentials = request.credentials;
    options.show_progress = request.show_progress;
    const std::string raw = m_transport.upload(current, options);
    current.reset();

    // -> PARSED
    const Response::ExtractedUrls urls = Response::extract(raw);
    Log::debug("Extracted delete URL: '" + urls.delete_url + "'");
    Log::debug("Extracted download URL: '" + urls.download_url + "'");
    if (urls.download_url.empty()) {
        throw ParseError(
            "Could not extract download URL from the response. Upload may have failed silently or the response "
            "format changed.",
            raw);
    }

    TransferResult result;
    result.download_url = urls.download_url;
    if (urls.delete_url.empty()) {
        Log::warn("Could not extract delete URL from the response.");
    } else {
        result.delete_url = urls.delete_url;
    }
    return result;
}
