#include "crypto.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>
#include <vector>

#include "error.hpp"
#include "log.hpp"
#include "types.h"

namespace {
constexpr std::size_t KEY_SIZE = 32;
constexpr std::size_t IV_SIZE = 16;
constexpr std::size_t CHUNK_SIZE = 64 * 1024;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
struct DigestCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

// Output file that is removed unless commit() is reached.
class PartialOutput {
   public:
    explicit PartialOutput(const fs::path& path) : m_path(path), m_stream(path, std::ios::binary | std::ios::trunc) {
        if (!m_stream.is_open()) {
            throw StagingError("[CRYPTO] Cannot open output file: " + path.string());
        }
    }
    ~PartialOutput() {
        if (m_committed) return;
        m_stream.close();
        std::error_code ec;
        fs::remove(m_path, ec);
    }

    void write(const unsigned char* data, std::size_t n) {
        m_stream.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
        if (!m_stream) throw StagingError("[CRYPTO] Write failed: " + m_path.string());
    }

    void commit() {
        m_stream.close();
        if (!m_stream) throw StagingError("[CRYPTO] Write failed: " + m_path.string());
        m_committed = true;
    }

   private:
    fs::path m_path;
    std::ofstream m_stream;
    bool m_committed = false;
};

void derive_key_iv(const std::string& key, const Crypto::Salt& salt, unsigned char* key_out, unsigned char* iv_out) {
    unsigned char material[KEY_SIZE + IV_SIZE];
    if (PKCS5_PBKDF2_HMAC(key.data(), static_cast<int>(key.size()), salt.data(), static_cast<int>(salt.size()),
                          Crypto::PBKDF2_ITERATIONS, EVP_sha256(), sizeof(material), material) != 1) {
        throw StagingError("[CRYPTO] Key derivation failed");
    }
    std::copy(material, material + KEY_SIZE, key_out);
    std::copy(material + KEY_SIZE, material + KEY_SIZE + IV_SIZE, iv_out);
    OPENSSL_cleanse(material, sizeof(material));
}

std::ifstream open_input(const fs::path& path) {
    std::ifstream in(path, std::ifstream::binary);
    if (!in.is_open()) {
        throw StagingError("[CRYPTO] Error opening file: " + path.string());
    }
    return in;
}

// Pushes the whole input through ctx into out. Returns false when finalization fails (bad padding).
bool transform(EVP_CIPHER_CTX* ctx, std::ifstream& in, PartialOutput& out, bool encrypting) {
    std::vector<unsigned char> buffer(CHUNK_SIZE);
    std::vector<unsigned char> processed(CHUNK_SIZE + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    while (in) {
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize n = in.gcount();
        if (n <= 0) break;
        const int rc = encrypting ? EVP_EncryptUpdate(ctx, processed.data(), &len, buffer.data(), static_cast<int>(n))
                                  : EVP_DecryptUpdate(ctx, processed.data(), &len, buffer.data(), static_cast<int>(n));
        if (rc != 1) return false;
        out.write(processed.data(), static_cast<std::size_t>(len));
    }
    if (in.bad()) {
        throw StagingError("[CRYPTO] Read error");
    }
    const int rc = encrypting ? EVP_EncryptFinal_ex(ctx, processed.data(), &len)
                              : EVP_DecryptFinal_ex(ctx, processed.data(), &len);
    if (rc != 1) return false;
    out.write(processed.data(), static_cast<std::size_t>(len));
    return true;
}
}  // namespace

namespace Crypto {
void encrypt_file(const fs::path& in, const fs::path& out, const std::string& key) {
    Salt salt{};
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw StagingError("[CRYPTO] Cannot generate salt");
    }
    encrypt_file(in, out, key, salt);
}

void encrypt_file(const fs::path& in, const fs::path& out, const std::string& key, const Salt& salt) {
    std::ifstream input = open_input(in);
    PartialOutput output(out);

    unsigned char k[KEY_SIZE];
    unsigned char iv[IV_SIZE];
    derive_key_iv(key, salt, k, iv);

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, k, iv) != 1) {
        OPENSSL_cleanse(k, sizeof(k));
        throw StagingError("[CRYPTO] Cannot initialise AES-256-CBC");
    }
    OPENSSL_cleanse(k, sizeof(k));

    output.write(reinterpret_cast<const unsigned char*>(SALT_MAGIC.data()), SALT_MAGIC.size());
    output.write(salt.data(), salt.size());
    if (!transform(ctx.get(), input, output, true)) {
        throw StagingError("[CRYPTO] Encryption failed for file: " + in.string());
    }
    output.commit();
}

void decrypt_file(const fs::path& in, const fs::path& out, const std::string& key) {
    std::ifstream input = open_input(in);

    char magic[SALT_MAGIC.size()];
    Salt salt{};
    input.read(magic, sizeof(magic));
    input.read(reinterpret_cast<char*>(salt.data()), static_cast<std::streamsize>(salt.size()));
    if (!input || std::string_view(magic, sizeof(magic)) != SALT_MAGIC) {
        throw StagingError("[CRYPTO] Decryption failed for file: " + in.string() + " (not a salted AES file)");
    }

    PartialOutput output(out);
    unsigned char k[KEY_SIZE];
    unsigned char iv[IV_SIZE];
    derive_key_iv(key, salt, k, iv);

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, k, iv) != 1) {
        OPENSSL_cleanse(k, sizeof(k));
        throw StagingError("[CRYPTO] Cannot initialise AES-256-CBC");
    }
    OPENSSL_cleanse(k, sizeof(k));

    if (!transform(ctx.get(), input, output, false)) {
        throw StagingError("[CRYPTO] Decryption failed for file: " + in.string() + " (wrong key or corrupted data)");
    }
    output.commit();
}

std::string compute_file_hash(const fs::path& path) {
    std::ifstream file(path, std::ifstream::binary);
    if (!file.is_open()) {
        throw std::runtime_error("[CRYPTO] Error opening file: " + path.string());
    }
    DigestCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("[CRYPTO] Cannot initialise SHA-256");
    }
    const int buffer_size = 4096;
    char buffer[buffer_size];
    while (file.read(buffer, buffer_size)) {
        EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(file.gcount()));
    }
    if (file.gcount() > 0) {
        EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(file.gcount()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(ctx.get(), hash, &hash_len);

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
}  // namespace Crypto

Artifact OpenSslCipher::encrypt(const Artifact& input, const std::string& key, StagingArea& staging) {
    const std::string logical_name = input.logical_name() + std::string(ENCRYPTED_SUFFIX);
    const fs::path out = staging.reserve(logical_name);
    Log::info("Encrypting '" + input.logical_name() + "' to '" + logical_name + "'...");
    Crypto::encrypt_file(input.path(), out, key);
    return Artifact::owned(out, logical_name);
}

Artifact OpenSslCipher::decrypt(const Artifact& input, const std::string& key, const fs::path& output) {
    Log::debug("Decrypting file '" + input.path().string() + "' to '" + output.string() + "'");
    Crypto::decrypt_file(input.path(), output, key);
    return Artifact::borrowed(output, output.filename().string());
}
