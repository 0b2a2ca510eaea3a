// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <patchsync/core/http_session.hpp>
#include <patchsync/disk/error.hpp>

#include <string>

#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"

using namespace patchsync::core;
using patchsync::test::TempDir;
using patchsync::test::make_payload;
using patchsync::test::write_file;

TEST_CASE("HttpSession::status_error", "[http]") {
    CHECK(HttpSession::status_error(404) == SyncErrc::not_found);
    CHECK(HttpSession::status_error(410) == SyncErrc::not_found);
    CHECK(HttpSession::status_error(416) == SyncErrc::invalid_range);
    CHECK(HttpSession::status_error(403) == SyncErrc::http_error);

    CHECK(HttpSession::status_error(408) == SyncErrc::network_transient);
    CHECK(HttpSession::status_error(429) == SyncErrc::network_transient);
    CHECK(HttpSession::status_error(503) == SyncErrc::network_transient);
    CHECK(is_transient(HttpSession::status_error(502)));
    CHECK_FALSE(is_transient(HttpSession::status_error(401)));
}

TEST_CASE("is_transient", "[error]") {
    CHECK(is_transient(make_error_code(SyncErrc::network_transient)));
    CHECK(is_transient(SyncErrc::stall_detected));
    CHECK_FALSE(is_transient(SyncErrc::transfer_failed));
    CHECK_FALSE(is_transient(SyncErrc::cancelled));
    CHECK_FALSE(is_transient(make_error_code(patchsync::disk::DiskErrc::write_error)));
    CHECK_FALSE(is_transient({}));
}

TEST_CASE("HttpSession::parse_content_range", "[http]") {
    SECTION("Full form") {
        auto range = HttpSession::parse_content_range("bytes 100-199/1000");
        REQUIRE(range.has_value());
        CHECK(range->first == 100);
        CHECK(range->last == 199);
        CHECK(range->total == 1000u);
    }

    SECTION("Unknown total") {
        auto range = HttpSession::parse_content_range("bytes 0-9/*");
        REQUIRE(range.has_value());
        CHECK_FALSE(range->total.has_value());
    }

    SECTION("Malformed") {
        CHECK_FALSE(HttpSession::parse_content_range("").has_value());
        CHECK_FALSE(HttpSession::parse_content_range("items 0-9/10").has_value());
        CHECK_FALSE(HttpSession::parse_content_range("bytes 9-0/10").has_value());
        CHECK_FALSE(HttpSession::parse_content_range("bytes 0-9").has_value());
        CHECK_FALSE(HttpSession::parse_content_range("bytes a-9/10").has_value());
        CHECK_FALSE(HttpSession::parse_content_range("bytes */10").has_value());
    }
}

TEST_CASE("HttpSession over file URLs", "[http][file]") {
    HttpSession::global_init();

    TempDir dir("http");
    auto payload = make_payload(50'000);
    write_file(dir / "blob.bin", payload);
    write_file(dir / "files.txt", "a.txt,abc\n");

    const std::string base = "file://" + dir.path().string() + "/";
    HttpSession session;

    SECTION("get_text") {
        auto text = session.get_text(base + "files.txt", {});
        REQUIRE(text.has_value());
        CHECK(*text == "a.txt,abc\n");
    }

    SECTION("Missing file") {
        auto text = session.get_text(base + "nope.txt", {});
        REQUIRE_FALSE(text.has_value());
        CHECK(text.error() == SyncErrc::not_found);
    }

    SECTION("head reports the size") {
        auto info = session.head(base + "blob.bin", {});
        REQUIRE(info.has_value());
        CHECK(info->content_length == payload.size());
    }

    SECTION("Ranged fetch") {
        std::string received;
        std::optional<ResponseHead> seen;
        FetchRequest request{base + "blob.bin", 1'000, 1'999};

        auto ec = session.fetch(request,
            [&](const ResponseHead& head) -> std::error_code {
                seen = head;
                return {};
            },
            [&](std::span<const std::byte> data) -> std::error_code {
                received.append(reinterpret_cast<const char*>(data.data()), data.size());
                return {};
            },
            {});
        REQUIRE_FALSE(ec);
        REQUIRE(seen.has_value());
        CHECK(seen->partial);
        CHECK(seen->range_start == 1'000);
        CHECK(received == payload.substr(1'000, 1'000));
    }

    SECTION("Handler error aborts the transfer") {
        auto ec = session.fetch(FetchRequest{base + "blob.bin", 0, std::nullopt},
            [](const ResponseHead&) -> std::error_code {
                return make_error_code(SyncErrc::range_unsupported);
            },
            [](std::span<const std::byte>) -> std::error_code { return {}; },
            {});
        CHECK(ec == SyncErrc::range_unsupported);
    }

    SECTION("Inverted range is refused up front") {
        auto ec = session.fetch(FetchRequest{base + "blob.bin", 10, 5},
            [](const ResponseHead&) -> std::error_code { return {}; },
            [](std::span<const std::byte>) -> std::error_code { return {}; },
            {});
        CHECK(ec == SyncErrc::invalid_range);
    }

    HttpSession::global_cleanup();
}
