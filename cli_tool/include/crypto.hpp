#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

#include "staging.hpp"

namespace Crypto {
inline constexpr std::string_view SALT_MAGIC = "Salted__";
inline constexpr std::size_t SALT_SIZE = 8;
inline constexpr int PBKDF2_ITERATIONS = 10000;

using Salt = std::array<unsigned char, SALT_SIZE>;

// AES-256-CBC, PBKDF2-HMAC-SHA256, same file layout as `openssl enc -aes-256-cbc -salt -pbkdf2`.
// Both throw StagingError and never leave a partial output file behind.
void encrypt_file(const fs::path& in, const fs::path& out, const std::string& key);
void encrypt_file(const fs::path& in, const fs::path& out, const std::string& key, const Salt& salt);
void decrypt_file(const fs::path& in, const fs::path& out, const std::string& key);

// Hex SHA-256 of the file contents.
std::string compute_file_hash(const fs::path& path);
}  // namespace Crypto

class Cipher {
   public:
    virtual ~Cipher() = default;

    // New owned artifact named "<logical name>.enc".
    virtual Artifact encrypt(const Artifact& input, const std::string& key, StagingArea& staging) = 0;
    // Writes the plaintext to output and returns it as a borrowed artifact. The input is left alone.
    virtual Artifact decrypt(const Artifact& input, const std::string& key, const fs::path& output) = 0;
};

class OpenSslCipher : public Cipher {
   public:
    Artifact encrypt(const Artifact& input, const std::string& key, StagingArea& staging) override;
    Artifact decrypt(const Artifact& input, const std::string& key, const fs::path& output) override;
};
