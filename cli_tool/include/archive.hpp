#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "staging.hpp"

namespace Archive {
// More than one input, or a single directory, has to be bundled before upload.
bool needs_archive(const std::vector<fs::path>& inputs);

// .zip, .tar.gz and .tgz can be extracted after download.
bool is_extractable(std::string_view file_name);
}  // namespace Archive

class Archiver {
   public:
    virtual ~Archiver() = default;

    // Fails with DependencyMissing when bundling is impossible on this machine.
    virtual void require_packer() const = 0;
    // Same for extracting file_name.
    virtual void require_unpacker(std::string_view file_name) const = 0;

    // Bundles inputs recursively into an owned artifact named ARCHIVE_NAME.
    virtual Artifact archive(const std::vector<fs::path>& inputs, StagingArea& staging) = 0;
    virtual void extract(const fs::path& archive, const fs::path& destination_dir) = 0;
};

// Drives the zip, unzip and tar programs.
class ZipArchiver : public Archiver {
   public:
    void require_packer() const override;
    void require_unpacker(std::string_view file_name) const override;

    Artifact archive(const std::vector<fs::path>& inputs, StagingArea& staging) override;
    void extract(const fs::path& archive, const fs::path& destination_dir) override;
};
