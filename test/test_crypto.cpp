#include <catch2/catch.hpp>

#include "crypto.hpp"
#include "error.hpp"
#include "test_util.hpp"

namespace transfersh::test {

// `openssl enc -aes-256-cbc -salt -pbkdf2 -pass pass:pw` over "round trip payload\n", salt 0102030405060708
const std::string openssl_fixture_hex =
    "53616c7465645f5f010203040506070864e1c3a40a738add36bbb4c881ef92ef0481da4510fe086ae7c1f5bf67e288e7";
const std::string fixture_plaintext = "round trip payload\n";
const Crypto::Salt fixture_salt{1, 2, 3, 4, 5, 6, 7, 8};

TEST_CASE("encryption matches the openssl enc layout", "[unit][crypto]") {
    TempDir dir;
    write_file(dir / "plain.txt", fixture_plaintext);

    Crypto::encrypt_file(dir / "plain.txt", dir / "plain.txt.enc", "pw", fixture_salt);
    CHECK(read_file(dir / "plain.txt.enc") == from_hex(openssl_fixture_hex));
}

TEST_CASE("openssl produced ciphertext decrypts", "[unit][crypto]") {
    TempDir dir;
    write_file(dir / "in.enc", from_hex(openssl_fixture_hex));

    Crypto::decrypt_file(dir / "in.enc", dir / "out.txt", "pw");
    CHECK(read_file(dir / "out.txt") == fixture_plaintext);
}

TEST_CASE("wrong key fails and leaves no output", "[unit][crypto]") {
    TempDir dir;
    write_file(dir / "in.enc", from_hex(openssl_fixture_hex));

    for (const char* key : {"wrong", "pw2"}) {
        CHECK_THROWS_AS(Crypto::decrypt_file(dir / "in.enc", dir / "out.txt", key), StagingError);
        CHECK_FALSE(fs::exists(dir / "out.txt"));
    }
    CHECK(read_file(dir / "in.enc") == from_hex(openssl_fixture_hex));
}

TEST_CASE("input without salt header is rejected", "[unit][crypto]") {
    TempDir dir;
    write_file(dir / "in.enc", "definitely not ciphertext");

    CHECK_THROWS_AS(Crypto::decrypt_file(dir / "in.enc", dir / "out.txt", "pw"), StagingError);
    CHECK_FALSE(fs::exists(dir / "out.txt"));
}

TEST_CASE("random salt round trip", "[unit][crypto]") {
    TempDir dir;
    std::string payload;
    for (int i = 0; i < 100000; ++i) payload += static_cast<char>(i * 31 % 251);
    write_file(dir / "data.bin", payload);

    Crypto::encrypt_file(dir / "data.bin", dir / "a.enc", "s3cret");
    Crypto::encrypt_file(dir / "data.bin", dir / "b.enc", "s3cret");
    CHECK(read_file(dir / "a.enc").substr(0, 8) == "Salted__");
    CHECK(read_file(dir / "a.enc") != read_file(dir / "b.enc"));

    Crypto::decrypt_file(dir / "a.enc", dir / "data.out", "s3cret");
    CHECK(read_file(dir / "data.out") == payload);
}

TEST_CASE("empty file round trip", "[unit][crypto]") {
    TempDir dir;
    write_file(dir / "empty", "");

    Crypto::encrypt_file(dir / "empty", dir / "empty.enc", "k");
    CHECK(fs::file_size(dir / "empty.enc") == 32);
    Crypto::decrypt_file(dir / "empty.enc", dir / "empty.out", "k");
    CHECK(fs::exists(dir / "empty.out"));
    CHECK(fs::file_size(dir / "empty.out") == 0);
}

TEST_CASE("sha-256 of a file", "[unit][crypto]") {
    TempDir dir;
    write_file(dir / "abc", "abc");
    CHECK(Crypto::compute_file_hash(dir / "abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("cipher artifacts", "[unit][crypto]") {
    TempDir dir;
    StagingArea staging(dir.path());
    write_file(dir / "notes.txt", "hello");
    OpenSslCipher cipher;

    Artifact input = Artifact::borrowed(dir / "notes.txt", "notes.txt");
    Artifact encrypted = cipher.encrypt(input, "pw", staging);
    CHECK(encrypted.logical_name() == "notes.txt.enc");
    CHECK(encrypted.is_owned());
    CHECK(encrypted.path().parent_path() == staging.dir());
    CHECK(read_file(dir / "notes.txt") == "hello");

    Artifact plain = cipher.decrypt(encrypted, "pw", dir / "notes.out");
    CHECK_FALSE(plain.is_owned());
    CHECK(read_file(plain.path()) == "hello");
    CHECK(fs::exists(encrypted.path()));
}

}  // namespace transfersh::test
