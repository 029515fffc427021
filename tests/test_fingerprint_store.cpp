#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <optional>
#include <string>

#include "storage/FileFingerprintStore.hpp"
#include "storage/Snapshot.hpp"
#include "utils/temp_dir.hpp"

using storage::FileFingerprintStore;
using storage::Snapshot;
using storage::WatchTarget;
using test_utils::TempDir;

namespace fs = std::filesystem;

namespace
{

constexpr const char* kHelloSha256 = "185f8db32271fe25f561a6fc938b2e264306ec304eda518007d1764826381969";
constexpr const char* kEmptySha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

} // namespace

TEST_CASE("sha256_hex", "[storage][hash]")
{
    REQUIRE(storage::sha256_hex("Hello") == kHelloSha256);
    REQUIRE(storage::sha256_hex("") == kEmptySha256);

    Snapshot a = Snapshot::fromText("Hello");
    Snapshot b = Snapshot::fromText("Hello");
    Snapshot c = Snapshot::fromText("Hello ");
    REQUIRE(a.sha256 == kHelloSha256);
    REQUIRE(a.sameContentAs(b));
    REQUIRE_FALSE(a.sameContentAs(c));
}

TEST_CASE("FileFingerprintStore first load", "[storage]")
{
    TempDir tmp;
    FileFingerprintStore store;
    std::string error;
    std::optional<Snapshot> snap;

    SECTION("missing state directory is an absent snapshot")
    {
        WatchTarget target{ "https://example.com", (tmp.path() / "never-created").string() };
        REQUIRE(store.load(target, snap, error));
        REQUIRE_FALSE(snap.has_value());
        REQUIRE_FALSE(fs::exists(target.state_dir));
    }

    SECTION("empty state directory is an absent snapshot")
    {
        WatchTarget target{ "https://example.com", tmp.str() };
        REQUIRE(store.load(target, snap, error));
        REQUIRE_FALSE(snap.has_value());
    }
}

TEST_CASE("FileFingerprintStore save and load", "[storage]")
{
    TempDir tmp;
    FileFingerprintStore store;
    WatchTarget target{ "https://example.com", (tmp.path() / "nested" / "state").string() };
    std::string error;

    REQUIRE(store.save(target, "Hello", error));

    SECTION("save creates the directory and both files")
    {
        REQUIRE(fs::is_directory(target.state_dir));
        REQUIRE(test_utils::read_file(FileFingerprintStore::textPath(target)) == "Hello");
        REQUIRE(test_utils::read_file(FileFingerprintStore::hashPath(target)) == kHelloSha256);
        REQUIRE_FALSE(fs::exists(FileFingerprintStore::textPath(target).string() + ".tmp"));
    }

    SECTION("load returns what was saved")
    {
        std::optional<Snapshot> snap;
        REQUIRE(store.load(target, snap, error));
        REQUIRE(snap.has_value());
        REQUIRE(snap->text == "Hello");
        REQUIRE(snap->sha256 == kHelloSha256);
    }

    SECTION("save replaces the previous snapshot")
    {
        REQUIRE(store.save(target, "Hello\nWorld", error));
        std::optional<Snapshot> snap;
        REQUIRE(store.load(target, snap, error));
        REQUIRE(snap->text == "Hello\nWorld");
        REQUIRE(snap->sha256 == storage::sha256_hex("Hello\nWorld"));
    }

    SECTION("empty text is a present snapshot")
    {
        REQUIRE(store.save(target, "", error));
        std::optional<Snapshot> snap;
        REQUIRE(store.load(target, snap, error));
        REQUIRE(snap.has_value());
        REQUIRE(snap->text.empty());
        REQUIRE(snap->sha256 == kEmptySha256);
    }

    SECTION("hash is recomputed when the digest file is stale or missing")
    {
        test_utils::write_file(FileFingerprintStore::hashPath(target), "deadbeef\n");
        std::optional<Snapshot> snap;
        REQUIRE(store.load(target, snap, error));
        REQUIRE(snap->sha256 == kHelloSha256);

        fs::remove(FileFingerprintStore::hashPath(target));
        REQUIRE(store.load(target, snap, error));
        REQUIRE(snap->sha256 == kHelloSha256);
    }
}

TEST_CASE("FileFingerprintStore reports unusable state", "[storage][errors]")
{
    TempDir tmp;
    FileFingerprintStore store;
    std::string error;

    SECTION("state directory path is a regular file")
    {
        const fs::path blocker = tmp.path() / "blocker";
        test_utils::write_file(blocker, "not a directory");
        WatchTarget target{ "https://example.com", blocker.string() };

        REQUIRE_FALSE(store.save(target, "Hello", error));
        REQUIRE_FALSE(error.empty());
        REQUIRE(test_utils::read_file(blocker) == "not a directory");
    }

    SECTION("snapshot path is not a file")
    {
        WatchTarget target{ "https://example.com", tmp.str() };
        fs::create_directories(FileFingerprintStore::textPath(target));

        std::optional<Snapshot> snap;
        REQUIRE_FALSE(store.load(target, snap, error));
        REQUIRE_FALSE(snap.has_value());
        REQUIRE(error.find("previous.txt") != std::string::npos);
    }
}
