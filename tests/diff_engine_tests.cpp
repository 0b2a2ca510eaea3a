// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <patchsync/core/diff_engine.hpp>
#include <patchsync/core/hasher.hpp>
#include <patchsync/core/local_state.hpp>
#include <patchsync/core/manifest.hpp>

#include <map>

#include "support/temp_dir.hpp"

using namespace patchsync::core;
using patchsync::test::TempDir;
using patchsync::test::write_file;

namespace fs = std::filesystem;

namespace {

Manifest manifest_of(const std::vector<std::pair<std::string, std::string>>& files) {
    std::string text;
    for (const auto& [path, contents] : files) {
        text += path + "," + sha256_hex(contents) + "\n";
    }
    auto m = parse_manifest(text, ManifestPolicy::strict);
    REQUIRE(m.has_value());
    return *m;
}

} // namespace

TEST_CASE("LocalStateScanner - stat and hash", "[local_state]") {
    TempDir dir("scan");
    write_file(dir / "a.txt", "hello");
    fs::create_directories(dir / "folder.bin");

    LocalStateScanner scanner(dir.path());

    SECTION("Regular file") {
        auto record = scanner.stat("a.txt");
        CHECK(record.exists);
        CHECK(record.size_bytes == 5);
        CHECK_FALSE(record.observed_hash.has_value());

        auto digest = scanner.hash(record);
        REQUIRE(digest.has_value());
        CHECK(*digest == sha256_hex("hello"));
        CHECK(record.observed_hash == sha256_hex("hello"));

        // Cached on the record
        (void)scanner.hash(record);
        CHECK(scanner.hashes_computed() == 1);
    }

    SECTION("Missing file and directory count as absent") {
        auto missing = scanner.stat("missing.txt");
        CHECK_FALSE(missing.exists);
        CHECK_FALSE(scanner.hash(missing).has_value());

        CHECK_FALSE(scanner.stat("folder.bin").exists);
    }

    SECTION("Symlink counts as absent") {
        std::error_code ec;
        fs::create_symlink(dir / "a.txt", dir / "link.txt", ec);
        if (!ec) {
            CHECK_FALSE(scanner.stat("link.txt").exists);
        }
    }

    SECTION("scan follows manifest order") {
        auto m = manifest_of({{"zzz.txt", "x"}, {"a.txt", "hello"}});
        auto records = scanner.scan(m);
        REQUIRE(records.size() == 2);
        CHECK(records[0].relative_path == "zzz.txt");
        CHECK_FALSE(records[0].exists);
        CHECK(records[1].exists);
        CHECK(scanner.hashes_computed() == 0);
    }
}

TEST_CASE("LocalStateScanner - symlinked parent directories", "[local_state]") {
    TempDir dir("scan");
    TempDir outside("outside");
    write_file(outside / "x.bin", "elsewhere");
    write_file(dir / "plain/x.bin", "here");

    std::error_code ec;
    fs::create_directory_symlink(outside.path(), dir / "data", ec);
    if (!ec) {
        CHECK(crosses_symlink(dir.path(), "data/x.bin"));
        CHECK(crosses_symlink(dir.path(), "data/deeper/x.bin"));
        CHECK_FALSE(crosses_symlink(dir.path(), "plain/x.bin"));
        CHECK_FALSE(crosses_symlink(dir.path(), "new/dir/x.bin"));

        LocalStateScanner scanner(dir.path());
        CHECK_FALSE(scanner.stat("data/x.bin").exists);
        CHECK(scanner.stat("plain/x.bin").exists);
    }
}

TEST_CASE("LocalStateScanner::walk", "[local_state]") {
    TempDir dir("walk");
    write_file(dir / "b/x.dat", "1");
    write_file(dir / "a.txt", "2");
    write_file(dir / "big.iso.pspart", "3");
    write_file(dir / ".patchsync/progress/0123.json", "{}");

    LocalStateScanner scanner(dir.path());
    auto files = scanner.walk();
    REQUIRE(files.has_value());
    CHECK(*files == std::vector<std::string>{"a.txt", "b/x.dat"});

    SECTION("Missing root walks to nothing") {
        LocalStateScanner empty(dir / "does-not-exist");
        auto none = empty.walk();
        REQUIRE(none.has_value());
        CHECK(none->empty());
    }
}

TEST_CASE("DiffEngine - classification", "[diff]") {
    TempDir dir("diff");
    write_file(dir / "same.txt", "unchanged");
    write_file(dir / "changed.txt", "old contents");

    auto m = manifest_of({
        {"missing.bin", "new file"},
        {"same.txt", "unchanged"},
        {"changed.txt", "new contents"},
    });

    LocalStateScanner scanner(dir.path());
    auto plan = DiffEngine().plan(m, scanner);

    REQUIRE(plan.items.size() == 3);
    CHECK(plan.items[0].kind == WorkKind::download);
    CHECK(plan.items[0].relative_path == "missing.bin");
    CHECK(plan.items[0].manifest_index == 0);
    CHECK(plan.items[1].kind == WorkKind::skip);
    CHECK(plan.items[2].kind == WorkKind::download);
    CHECK(plan.items[2].local_size == 12);
    CHECK(plan.items[2].expected_hash == sha256_hex("new contents"));

    CHECK(plan.count(WorkKind::download) == 2);
    CHECK(plan.count(WorkKind::skip) == 1);
    CHECK(plan.count(WorkKind::remove) == 0);

    // Absent files are never hashed
    CHECK(scanner.hashes_computed() == 2);
}

TEST_CASE("DiffEngine - remote size probe", "[diff]") {
    TempDir dir("probe");
    write_file(dir / "a.bin", "1234");
    write_file(dir / "b.bin", "5678");

    auto m = manifest_of({{"a.bin", "1234"}, {"b.bin", "5678"}});

    std::map<std::string, std::uint64_t> sizes{{"a.bin", 999}, {"b.bin", 4}};
    std::vector<std::string> asked;

    DiffOptions options;
    options.probe = [&](const ManifestEntry& entry) -> std::optional<std::uint64_t> {
        asked.push_back(entry.relative_path);
        return sizes.at(entry.relative_path);
    };

    LocalStateScanner scanner(dir.path());
    auto plan = DiffEngine(options).plan(m, scanner);

    REQUIRE(plan.items.size() == 2);
    // Size differs: downloaded without hashing
    CHECK(plan.items[0].kind == WorkKind::download);
    CHECK(plan.items[0].remote_size == 999u);
    // Size matches: hash decides
    CHECK(plan.items[1].kind == WorkKind::skip);
    CHECK(scanner.hashes_computed() == 1);
    CHECK(asked.size() == 2);
}

TEST_CASE("DiffEngine - extraneous files", "[diff]") {
    TempDir dir("extra");
    write_file(dir / "keep.txt", "k");
    write_file(dir / "old/stale.dll", "s");
    write_file(dir / "leftover.bin.pspart", "p");

    auto m = manifest_of({{"keep.txt", "k"}});

    SECTION("Left alone by default") {
        LocalStateScanner scanner(dir.path());
        auto plan = DiffEngine().plan(m, scanner);
        CHECK(plan.count(WorkKind::remove) == 0);
    }

    SECTION("Removed when enabled, numbered after the manifest") {
        DiffOptions options;
        options.delete_extraneous = true;
        LocalStateScanner scanner(dir.path());
        auto plan = DiffEngine(options).plan(m, scanner);

        REQUIRE(plan.items.size() == 2);
        CHECK(plan.items[1].kind == WorkKind::remove);
        CHECK(plan.items[1].relative_path == "old/stale.dll");
        CHECK(plan.items[1].manifest_index == 1);
        CHECK(plan.items[1].expected_hash.empty());
    }
}

TEST_CASE("WorkKind::to_string", "[diff]") {
    CHECK(to_string(WorkKind::download) == "download");
    CHECK(to_string(WorkKind::skip) == "skip");
    CHECK(to_string(WorkKind::remove) == "remove");
}
