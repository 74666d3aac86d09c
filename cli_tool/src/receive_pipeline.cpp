#include <string>
#include <system_error>

#include "error.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "utils.hpp"

namespace {
// Local file name for a remote URL. Escapes are decoded unless the result would carry a
// path separator or a NUL, in which case the escaped segment is kept as is.
std::string local_name(const std::string& url) {
    const std::string raw = Utils::url_basename(url);
    const std::string decoded = Utils::percent_decode(raw);
    if (decoded.find('/') != std::string::npos || decoded.find('\0') != std::string::npos) {
        Log::warn("Remote name '" + raw + "' decodes to a path, keeping it escaped.");
        return raw;
    }
    return decoded;
}

// dir/name, or dir/name.N for the first N that does not exist yet.
fs::path unused_path(const fs::path& dir, const std::string& name) {
    std::error_code ec;
    fs::path candidate = dir / name;
    for (unsigned n = 1; fs::exists(candidate, ec); ++n) {
        candidate = dir / (name + "." + std::to_string(n));
    }
    return candidate;
}

void place(Artifact& artifact, const fs::path& output) {
    try {
        move_file(artifact.path(), output);
    } catch (const fs::filesystem_error& e) {
        throw StagingError("Cannot move '" + artifact.path().string() + "' to '" + output.string() + "': " + e.what());
    }
    artifact.release();
}
}  // namespace

ReceiveResult ReceivePipeline::run(const ReceiveRequest& request) {
    if (request.url.empty()) {
        throw UsageError("No URL specified to receive.");
    }
    Utils::split_url(request.url);
    const std::string remote_name = local_name(request.url);
    if (remote_name.empty() || remote_name == "." || remote_name == "..") {
        throw UsageError("Cannot derive a file name from URL: " + request.url);
    }

    std::error_code ec;
    const bool into_directory = fs::is_directory(request.destination, ec);
    fs::path output = into_directory ? request.destination / remote_name : request.destination;

    const bool encrypted = Utils::ends_with(remote_name, ENCRYPTED_SUFFIX);
    if (encrypted && (into_directory || Utils::ends_with(output.filename().string(), ENCRYPTED_SUFFIX))) {
        std::string plain = output.filename().string();
        plain.resize(plain.size() - ENCRYPTED_SUFFIX.size());
        output.replace_filename(plain);
    }

    std::string key;
    if (encrypted) {
        key = request.decryption_key.value_or("");
        if (key.empty()) {
            key = m_prompter.read_secret("File appears to be encrypted. Enter decryption key: ");
        }
        if (key.empty()) {
            throw UsageError("No decryption key provided for an encrypted file. Aborting.");
        }
    }

    const std::string final_name = output.filename().string();
    const bool extractable = request.offer_extract && Archive::is_extractable(final_name);
    if (extractable) m_archiver.require_unpacker(final_name);

    const fs::path output_dir = output.parent_path().empty() ? fs::path(".") : output.parent_path();
    if (!into_directory && !fs::is_directory(output_dir, ec)) {
        Log::info("Destination directory '" + output_dir.string() + "' does not exist. Creating it.");
        fs::create_directories(output_dir, ec);
        if (ec) {
            throw StagingError("Failed to create destination directory '" + output_dir.string() + "': " + ec.message());
        }
    }

    // DOWNLOADING, into the staging directory so a failure never touches an existing output
    Log::info("Downloading file from " + request.url);
    Artifact received = Artifact::owned(m_staging.reserve(remote_name), remote_name);
    Log::debug("Downloading to temporary file: " + received.path().string());
    m_transport.download(request.url, received.path(), request.show_progress);

    if (encrypted) {
        // DECRYPTING
        Log::info("Decrypting '" + remote_name + "' to '" + output.string() + "'...");
        Artifact plain = Artifact::owned(m_staging.reserve(final_name), final_name);
        try {
            m_cipher.decrypt(received, key, plain.path());
        } catch (const StagingError& e) {
            // keep the ciphertext so the operator can retry with another key
            const fs::path kept = unused_path(output_dir, remote_name);
            try {
                move_file(received.path(), kept);
                received.release();
            } catch (const fs::filesystem_error& move_error) {
                throw StagingError(std::string(e.what()) + " (the encrypted download could not be kept: " +
                                   move_error.what() + ")");
            }
            throw StagingError(std::string(e.what()) + ". The downloaded encrypted file is at: " + kept.string());
        }
        received = std::move(plain);
        place(received, output);
        Log::info("Decryption successful. Output: " + output.string());
    } else {
        place(received, output);
        Log::info("Download successful (not encrypted). Output: " + output.string());
    }

    ReceiveResult result;
    result.output = output;

    // EXTRACTING
    if (extractable &&
        m_prompter.confirm("Downloaded file appears to be an archive: " + final_name + "\nDo you want to extract it?")) {
        m_archiver.extract(output, output_dir);
        result.extracted = true;
        Log::info("Extraction successful.");
        if (m_prompter.confirm("Do you want to delete the original archive file?")) {
            fs::remove(output, ec);
            if (ec) {
                Log::warn("Could not delete archive '" + output.string() + "': " + ec.message());
            } else {
                result.archive_removed = true;
                Log::info("Original archive file '" + output.string() + "' deleted.");
            }
        }
    }

    Log::info("File successfully received at '" + output.string() + "'.");
    return result;
}
