#include "archive.hpp"

#include <string>
#include <system_error>

#include "error.hpp"
#include "log.hpp"
#include "process.hpp"
#include "types.h"
#include "utils.hpp"

namespace {
using Utils::ends_with;

bool is_tarball(std::string_view name) { return ends_with(name, ".tar.gz") || ends_with(name, ".tgz"); }
}  // namespace

namespace Archive {
bool needs_archive(const std::vector<fs::path>& inputs) {
    if (inputs.size() > 1) return true;
    std::error_code ec;
    return inputs.size() == 1 && fs::is_directory(inputs.front(), ec);
}

bool is_extractable(std::string_view file_name) { return ends_with(file_name, ".zip") || is_tarball(file_name); }
}  // namespace Archive

void ZipArchiver::require_packer() const { Process::require("zip"); }

void ZipArchiver::require_unpacker(std::string_view file_name) const {
    Process::require(is_tarball(file_name) ? "tar" : "unzip");
}

Artifact ZipArchiver::archive(const std::vector<fs::path>& inputs, StagingArea& staging) {
    const fs::path out = staging.reserve(std::string(ARCHIVE_NAME));
    // owned from the start so a partial archive is removed on failure
    Artifact artifact = Artifact::owned(out, std::string(ARCHIVE_NAME));

    std::vector<std::string> argv{"zip", "-r", "-q", out.string()};
    std::string listing;
    for (const auto& input : inputs) {
        argv.push_back(input.string());
        listing += (listing.empty() ? "" : ", ") + input.string();
    }
    Log::debug("Creating ZIP file " + out.string() + " with content: " + listing);

    int rc = 0;
    try {
        rc = Process::run(argv);
    } catch (const std::system_error& e) {
        throw StagingError("[ARCHIVE] Failed to run zip for " + out.string() + ": " + e.what());
    }
    if (rc != 0 || !fs::exists(out)) {
        throw StagingError("[ARCHIVE] Failed to create ZIP file " + out.string() + " (zip exited with code " +
                           std::to_string(rc) + ")");
    }
    return artifact;
}

void ZipArchiver::extract(const fs::path& archive, const fs::path& destination_dir) {
    const std::string name = archive.filename().string();
    std::vector<std::string> argv;
    if (is_tarball(name)) {
        argv = {"tar", "-xzf", archive.string(), "-C", destination_dir.string()};
    } else if (ends_with(name, ".zip")) {
        argv = {"unzip", "-o", "-q", archive.string(), "-d", destination_dir.string()};
    } else {
        throw StagingError("[ARCHIVE] Unsupported archive type: " + name);
    }
    Log::info("Extracting '" + archive.string() + "' into '" + destination_dir.string() + "'...");

    int rc = 0;
    try {
        rc = Process::run(argv);
    } catch (const std::system_error& e) {
        throw StagingError("[ARCHIVE] Failed to run " + argv.front() + " for " + archive.string() + ": " + e.what());
    }
    if (rc != 0) {
        throw StagingError("[ARCHIVE] Failed to extract '" + archive.string() + "' (" + argv.front() +
                           " exited with code " + std::to_string(rc) + ")");
    }
}
