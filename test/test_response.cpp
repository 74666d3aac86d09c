#include <catch2/catch.hpp>

#include "response.hpp"

TEST_CASE("extract urls from a transfer.sh answer", "[unit][response]") {
    const std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain; charset=utf-8\r\n"
        "X-Url-Delete: https://transfer.sh/AbC12/report.pdf/Zx9Yw8\r\n"
        "\r\n"
        "https://transfer.sh/AbC12/report.pdf\n";

    auto urls = Response::extract(raw);
    CHECK(urls.delete_url == "https://transfer.sh/AbC12/report.pdf/Zx9Yw8");
    CHECK(urls.download_url == "https://transfer.sh/AbC12/report.pdf");
}

TEST_CASE("header names match case-insensitively", "[unit][response]") {
    const std::string raw =
        "HTTP/2 200\r\n"
        "x-url-delete:   https://t.example/a/b/c  \r\n"
        "\r\n"
        "https://t.example/a/b\r\n";

    auto urls = Response::extract(raw);
    CHECK(urls.delete_url == "https://t.example/a/b/c");
    CHECK(urls.download_url == "https://t.example/a/b");
    CHECK(Response::header_value(raw, "X-URL-DELETE") == std::optional<std::string>("https://t.example/a/b/c"));
    CHECK_FALSE(Response::header_value(raw, "Max-Days"));
}

TEST_CASE("progress meter in front of the url is dropped", "[unit][response]") {
    const std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "X-Url-Delete: https://t.example/a/f.bin/d\r\n"
        "\r\n"
        "######################################################################## 100.0%https://t.example/a/f.bin\n";

    CHECK(Response::extract(raw).download_url == "https://t.example/a/f.bin");
    CHECK(Response::strip_progress_artifacts("  42.5% https://t.example/x") == "https://t.example/x");
    CHECK(Response::strip_progress_artifacts("https://t.example/x") == "https://t.example/x");
}

TEST_CASE("url escapes are not taken for a progress meter", "[unit][response]") {
    CHECK(Response::strip_progress_artifacts("https://t.example/a/my%20file.txt") ==
          "https://t.example/a/my%20file.txt");
    CHECK(Response::strip_progress_artifacts("100% https://t.example/a/my%20file.txt") ==
          "https://t.example/a/my%20file.txt");
}

TEST_CASE("missing delete header leaves delete url empty", "[unit][response]") {
    const std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 32\r\n"
        "\r\n"
        "https://t.example/abc/file.txt\n"
        "\n";

    auto urls = Response::extract(raw);
    CHECK(urls.delete_url.empty());
    CHECK(urls.download_url == "https://t.example/abc/file.txt");
}

TEST_CASE("headers only answer has no download url", "[unit][response]") {
    const std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "X-Url-Delete: https://t.example/a/b/c\r\n"
        "\r\n";

    auto urls = Response::extract(raw);
    CHECK(urls.delete_url == "https://t.example/a/b/c");
    CHECK(urls.download_url.empty());
}

TEST_CASE("body of the final response wins", "[unit][response]") {
    const std::string raw =
        "HTTP/1.1 100 Continue\r\n"
        "\r\n"
        "HTTP/1.1 200 OK\r\n"
        "\r\n"
        "https://t.example/final/x\n";

    CHECK(Response::extract(raw).download_url == "https://t.example/final/x");
    CHECK(Response::status_code(raw) == std::optional<int>(200));
}

TEST_CASE("bare body is taken as the body", "[unit][response]") {
    CHECK(Response::extract("https://t.example/a/b\n").download_url == "https://t.example/a/b");
    CHECK_FALSE(Response::status_code("https://t.example/a/b\n"));
}

TEST_CASE("authorization failure detection", "[unit][response]") {
    CHECK(Response::is_authorization_failure("HTTP/1.1 401 Unauthorized\r\n\r\n"));
    CHECK(Response::is_authorization_failure("HTTP/1.1 200 OK\r\n\r\nNot Authorized\n"));
    CHECK(Response::is_authorization_failure("not authorized"));
    CHECK_FALSE(Response::is_authorization_failure("HTTP/1.1 200 OK\r\n\r\nhttps://t.example/a/b\n"));
    CHECK_FALSE(Response::is_authorization_failure("HTTP/1.1 404 Not Found\r\n\r\n"));
}

TEST_CASE("info headers", "[unit][response]") {
    SECTION("all fields") {
        const std::string raw =
            "HTTP/1.1 200 OK\r\n"
            "Content-Length: 1536\r\n"
            "Content-Type: application/zip\r\n"
            "X-Remaining-Days: 3\r\n"
            "X-Remaining-Downloads: 7\r\n"
            "\r\n";
        auto info = Response::parse_info(raw);
        CHECK(info.size == std::optional<uint64_t>(1536));
        CHECK(info.mime_type == std::optional<std::string>("application/zip"));
        CHECK(info.remaining_days == std::optional<std::string>("3"));
        CHECK(info.remaining_downloads == std::optional<std::string>("7"));
    }

    SECTION("absent fields are not an error") {
        auto info = Response::parse_info("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\n");
        CHECK_FALSE(info.size);
        CHECK(info.mime_type == std::optional<std::string>("text/plain"));
        CHECK_FALSE(info.remaining_days);
        CHECK_FALSE(info.remaining_downloads);
    }

    SECTION("non numeric length is ignored") {
        auto info = Response::parse_info("HTTP/1.1 200 OK\r\nContent-Length: lots\r\n\r\n");
        CHECK_FALSE(info.size);
    }

    SECTION("oversized length is ignored") {
        FileInfo info;
        CHECK_NOTHROW(info = Response::parse_info(
                          "HTTP/1.1 200 OK\r\nContent-Length: 99999999999999999999999\r\nX-Remaining-Days: 3\r\n\r\n"));
        CHECK_FALSE(info.size);
        CHECK(info.remaining_days == std::optional<std::string>("3"));
        CHECK(Response::parse_info("HTTP/1.1 200 OK\r\nContent-Length: 9223372036854775807\r\n\r\n").size ==
              std::optional<uint64_t>(9223372036854775807ull));
    }
}
