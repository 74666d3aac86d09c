#include <catch2/catch.hpp>

#include "archive.hpp"
#include "process.hpp"
#include "test_util.hpp"

namespace transfersh::test {

TEST_CASE("archiving rule", "[unit][archive]") {
    TempDir dir;
    write_file(dir / "a.txt", "a");
    write_file(dir / "b.txt", "b");
    fs::create_directories(dir / "folder");

    CHECK_FALSE(Archive::needs_archive({dir / "a.txt"}));
    CHECK(Archive::needs_archive({dir / "a.txt", dir / "b.txt"}));
    CHECK(Archive::needs_archive({dir / "folder"}));
    CHECK(Archive::needs_archive({dir / "a.txt", dir / "folder"}));
    CHECK_FALSE(Archive::needs_archive({}));
}

TEST_CASE("extractable names", "[unit][archive]") {
    CHECK(Archive::is_extractable("transfer_archive.zip"));
    CHECK(Archive::is_extractable("backup.tar.gz"));
    CHECK(Archive::is_extractable("backup.tgz"));
    CHECK_FALSE(Archive::is_extractable("notes.txt"));
    CHECK_FALSE(Archive::is_extractable("backup.tar"));
    CHECK_FALSE(Archive::is_extractable("photo.zip.enc"));
}

TEST_CASE("zip archive round trip", "[unit][archive]") {
    if (!Process::available("zip") || !Process::available("unzip")) {
        WARN("zip/unzip not installed, skipping");
        return;
    }
    TempDir dir;
    write_file(dir / "src" / "one.txt", "first file");
    write_file(dir / "src" / "nested" / "two.txt", "second file");
    write_file(dir / "three.txt", "third file");

    ZipArchiver archiver;
    {
        StagingArea staging(dir.path());
        Artifact archive = archiver.archive({dir / "src", dir / "three.txt"}, staging);
        CHECK(archive.logical_name() == "transfer_archive.zip");
        CHECK(archive.is_owned());
        REQUIRE(fs::exists(archive.path()));

        fs::create_directories(dir / "out");
        archiver.extract(archive.path(), dir / "out");

        auto one = find_file(dir / "out", "one.txt");
        auto two = find_file(dir / "out", "two.txt");
        auto three = find_file(dir / "out", "three.txt");
        REQUIRE(one);
        REQUIRE(two);
        REQUIRE(three);
        CHECK(read_file(*one) == "first file");
        CHECK(read_file(*two) == "second file");
        CHECK(read_file(*three) == "third file");
        CHECK(two->parent_path().filename() == "nested");

        const fs::path archive_path = archive.path();
        archive.reset();
        CHECK_FALSE(fs::exists(archive_path));
    }
}

TEST_CASE("tarball extraction", "[unit][archive]") {
    if (!Process::available("tar")) {
        WARN("tar not installed, skipping");
        return;
    }
    TempDir dir;
    write_file(dir / "payload" / "data.txt", "tarred");
    REQUIRE(Process::run({"tar", "-czf", (dir / "bundle.tgz").string(), "-C", dir.path().string(), "payload"}) == 0);

    fs::create_directories(dir / "out");
    ZipArchiver archiver;
    archiver.extract(dir / "bundle.tgz", dir / "out");
    CHECK(read_file(dir / "out" / "payload" / "data.txt") == "tarred");
}

TEST_CASE("archive failures", "[unit][archive]") {
    TempDir dir;
    ZipArchiver archiver;

    SECTION("unsupported type") {
        write_file(dir / "x.rar", "rar");
        CHECK_THROWS_AS(archiver.extract(dir / "x.rar", dir.path()), StagingError);
    }

    SECTION("corrupt zip") {
        if (!Process::available("unzip")) return;
        write_file(dir / "broken.zip", "this is not a zip file");
        CHECK_THROWS_AS(archiver.extract(dir / "broken.zip", dir.path()), StagingError);
    }

    SECTION("zip of a vanished input leaves nothing behind") {
        if (!Process::available("zip")) return;
        StagingArea staging(dir.path());
        CHECK_THROWS_AS(archiver.archive({dir / "missing-a", dir / "missing-b"}, staging), StagingError);
        CHECK(staging.entry_count() == 0);
    }
}

TEST_CASE("external programs", "[unit][process]") {
    CHECK(Process::available("sh"));
    CHECK_FALSE(Process::available("transfersh-no-such-program"));
    CHECK_THROWS_AS(Process::require("transfersh-no-such-program"), DependencyMissing);
    CHECK(Process::run({"sh", "-c", "exit 0"}) == 0);
    CHECK(Process::run({"sh", "-c", "exit 3"}) == 3);
}

}  // namespace transfersh::test
