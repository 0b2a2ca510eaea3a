// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <patchsync/core/bandwidth_limiter.hpp>
#include <patchsync/core/chunked_downloader.hpp>
#include <patchsync/core/progress_store.hpp>

#include <chrono>
#include <memory>
#include <thread>

#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"

using namespace patchsync::core;
using namespace std::chrono_literals;
using patchsync::test::FakeTransport;
using patchsync::test::TempDir;
using patchsync::test::make_payload;
using patchsync::test::read_file;
using patchsync::test::write_file;

namespace fs = std::filesystem;

namespace {

constexpr const char* URL = "https://cdn.example.com/patch/data.bin";
constexpr std::uint64_t THRESHOLD = 64 * 1024;

struct Fixture {
    TempDir dir{"chunked"};
    FakeTransport transport;
    BandwidthLimiter limiter{0};
    std::shared_ptr<MemoryBackend> backend = std::make_shared<MemoryBackend>();
    ProgressStore store{backend, std::chrono::seconds(3600)};
    DownloaderOptions options;

    Fixture() {
        options.multithreading_threshold = THRESHOLD;
        options.range_workers = 4;
        options.retry_count = 3;
        options.backoff_initial = 1ms;
        options.backoff_max = 4ms;
        options.checkpoint_bytes = 8 * 1024;
    }

    fs::path destination() const { return dir / "data.bin"; }

    DownloadRequest request(std::optional<std::uint64_t> size) const {
        return DownloadRequest{URL, "data.bin", destination(), size, std::nullopt};
    }

    std::expected<DownloadResult, std::error_code>
    run(const DownloadRequest& req, std::stop_token stop = {}, const ByteProgress& progress = {}) {
        ChunkedDownloader downloader(transport, limiter, store, options);
        return downloader.download(req, stop, progress);
    }
};

} // namespace

TEST_CASE("ChunkedDownloader::partition", "[chunked]") {
    SECTION("Even split") {
        auto ranges = ChunkedDownloader::partition(0, 400, 4);
        REQUIRE(ranges.size() == 4);
        CHECK(ranges[0] == RangeProgress{0, 100, 0});
        CHECK(ranges[3] == RangeProgress{300, 100, 0});
    }

    SECTION("Remainder goes to the last range") {
        auto ranges = ChunkedDownloader::partition(10, 20, 3);
        REQUIRE(ranges.size() == 3);
        CHECK(ranges[0].offset == 10);
        CHECK(ranges[0].size == 4);
        CHECK(ranges[2].offset == 18);
        CHECK(ranges[2].size == 2);
    }

    SECTION("Never more ranges than bytes") {
        CHECK(ChunkedDownloader::partition(0, 2, 8).size() == 2);
        CHECK(ChunkedDownloader::partition(5, 5, 4).empty());
    }

    SECTION("Part file suffix") {
        CHECK(ChunkedDownloader::part_path("/t/a.bin") == fs::path("/t/a.bin.pspart"));
    }
}

TEST_CASE("ChunkedDownloader - single stream below threshold", "[chunked]") {
    Fixture f;
    auto payload = make_payload(THRESHOLD - 1);
    f.transport.serve(URL, payload);

    auto result = f.run(f.request(payload.size()));
    REQUIRE(result.has_value());
    CHECK_FALSE(result->multi_range);
    CHECK(result->size == payload.size());
    CHECK(result->fetched == payload.size());
    CHECK(result->part_path == ChunkedDownloader::part_path(f.destination()));
    CHECK(read_file(result->part_path) == payload);
    CHECK_FALSE(fs::exists(f.destination()));

    auto fetches = f.transport.fetches();
    REQUIRE(fetches.size() == 1);
    CHECK_FALSE(fetches[0].wants_range());
}

TEST_CASE("ChunkedDownloader - multi-range at threshold", "[chunked]") {
    Fixture f;
    auto payload = make_payload(THRESHOLD * 3 + 3);
    f.transport.serve(URL, payload);

    auto result = f.run(f.request(payload.size()));
    REQUIRE(result.has_value());
    CHECK(result->multi_range);
    CHECK(read_file(result->part_path) == payload);
    CHECK(result->fetched == payload.size());

    auto fetches = f.transport.fetches();
    REQUIRE(fetches.size() == 4);
    for (const auto& fetch : fetches) {
        CHECK(fetch.last_byte.has_value());
    }

    SECTION("Exactly the threshold is multi-range") {
        Fixture g;
        auto exact = make_payload(THRESHOLD, 7);
        g.transport.serve(URL, exact);
        auto r = g.run(g.request(exact.size()));
        REQUIRE(r.has_value());
        CHECK(r->multi_range);
        CHECK(read_file(r->part_path) == exact);
    }
}

TEST_CASE("ChunkedDownloader - unknown size", "[chunked]") {
    Fixture f;
    auto payload = make_payload(THRESHOLD * 2);
    f.transport.serve(URL, payload);

    auto result = f.run(f.request(std::nullopt));
    REQUIRE(result.has_value());
    CHECK_FALSE(result->multi_range);
    CHECK(read_file(result->part_path) == payload);
}

TEST_CASE("ChunkedDownloader - progress reports", "[chunked]") {
    Fixture f;
    auto payload = make_payload(20'000);
    f.transport.serve(URL, payload);

    std::uint64_t last = 0;
    bool monotonic = true;
    std::uint64_t reported_total = 0;
    auto result = f.run(f.request(payload.size()), {}, [&](std::uint64_t done, std::uint64_t total) {
        if (done < last) monotonic = false;
        last = done;
        reported_total = total;
    });
    REQUIRE(result.has_value());
    CHECK(monotonic);
    CHECK(last == payload.size());
    CHECK(reported_total == payload.size());
}

TEST_CASE("ChunkedDownloader - single stream resume", "[chunked]") {
    Fixture f;
    auto payload = make_payload(30'000);
    f.transport.serve(URL, payload);
    const auto part = ChunkedDownloader::part_path(f.destination());

    SECTION("Continues after the confirmed bytes") {
        write_file(part, payload.substr(0, 5'000));
        REQUIRE_FALSE(f.store.save("data.bin", 5'000, payload.size()));

        auto req = f.request(payload.size());
        req.resume = f.store.load("data.bin");
        REQUIRE(req.resume.has_value());

        auto result = f.run(req);
        REQUIRE(result.has_value());
        CHECK(result->resumed_from == 5'000);
        CHECK(result->fetched == payload.size() - 5'000);
        CHECK(read_file(part) == payload);

        auto fetches = f.transport.fetches();
        REQUIRE(fetches.size() == 1);
        CHECK(fetches[0].offset == 5'000);
        CHECK(f.transport.bytes_sent() == payload.size() - 5'000);
    }

    SECTION("Part file shorter than the record") {
        write_file(part, payload.substr(0, 3'000));
        REQUIRE_FALSE(f.store.save("data.bin", 5'000, payload.size()));

        auto req = f.request(payload.size());
        req.resume = f.store.load("data.bin");
        auto result = f.run(req);
        REQUIRE(result.has_value());
        CHECK(result->resumed_from == 3'000);
        CHECK(read_file(part) == payload);
    }

    SECTION("Remote size changed") {
        write_file(part, std::string(5'000, 'x'));
        REQUIRE_FALSE(f.store.save("data.bin", 5'000, payload.size() + 10));

        auto req = f.request(payload.size());
        req.resume = f.store.load("data.bin");
        auto result = f.run(req);
        REQUIRE(result.has_value());
        CHECK(result->resumed_from == 0);
        CHECK(read_file(part) == payload);
        CHECK(f.transport.fetches()[0].offset == 0);
    }

    SECTION("Already complete on disk") {
        write_file(part, payload);
        REQUIRE_FALSE(f.store.save("data.bin", payload.size(), payload.size()));

        auto req = f.request(payload.size());
        req.resume = f.store.load("data.bin");
        auto result = f.run(req);
        REQUIRE(result.has_value());
        CHECK(result->fetched == 0);
        CHECK(f.transport.fetches().empty());
    }
}

TEST_CASE("ChunkedDownloader - multi-range resume", "[chunked]") {
    Fixture f;
    auto payload = make_payload(THRESHOLD * 4);
    f.transport.serve(URL, payload);
    const auto part = ChunkedDownloader::part_path(f.destination());

    auto ranges = ChunkedDownloader::partition(0, payload.size(), 4);
    REQUIRE(ranges.size() == 4);
    const auto range_size = ranges[0].size;
    ranges[0].downloaded = range_size;     // Finished
    ranges[1].downloaded = 10'000;         // Partly done

    // Pre-allocated part file holding only the confirmed bytes
    std::string on_disk(payload.size(), '\0');
    on_disk.replace(0, range_size, payload, 0, range_size);
    on_disk.replace(range_size, 10'000, payload, range_size, 10'000);
    write_file(part, on_disk);

    ProgressRecord record;
    record.relative_path = "data.bin";
    record.total_bytes = payload.size();
    record.bytes_confirmed = range_size + 10'000;
    record.ranges = ranges;
    REQUIRE_FALSE(f.store.save(record));

    auto req = f.request(payload.size());
    req.resume = f.store.load("data.bin");
    auto result = f.run(req);
    REQUIRE(result.has_value());
    CHECK(result->multi_range);
    CHECK(result->resumed_from == range_size + 10'000);
    CHECK(result->fetched == payload.size() - range_size - 10'000);
    CHECK(read_file(part) == payload);

    // Earlier bytes are never requested again
    auto fetches = f.transport.fetches();
    REQUIRE(fetches.size() == 3);
    for (const auto& fetch : fetches) {
        CHECK(fetch.offset >= range_size + 10'000);
    }
}

TEST_CASE("ChunkedDownloader - ranges that do not tile restart from zero", "[chunked]") {
    Fixture f;
    auto payload = make_payload(THRESHOLD * 2);
    f.transport.serve(URL, payload);
    const auto part = ChunkedDownloader::part_path(f.destination());
    write_file(part, std::string(payload.size(), 'x'));

    // Gap between the two stored ranges
    ProgressRecord record;
    record.relative_path = "data.bin";
    record.total_bytes = payload.size();
    record.bytes_confirmed = 2048;
    record.ranges = {{0, 1024, 1024}, {4096, payload.size() - 4096, 1024}};
    REQUIRE_FALSE(f.store.save(record));

    auto req = f.request(payload.size());
    req.resume = f.store.load("data.bin");
    REQUIRE(req.resume.has_value());

    auto result = f.run(req);
    REQUIRE(result.has_value());
    CHECK(result->resumed_from == 0);
    CHECK(result->fetched == payload.size());
    CHECK(read_file(part) == payload);
}

TEST_CASE("ChunkedDownloader - finished ranges are saved while a sibling runs", "[chunked]") {
    Fixture f;
    f.options.checkpoint_bytes = THRESHOLD * 4;   // Only range ends save
    auto payload = make_payload(THRESHOLD * 4);
    f.transport.serve(URL, payload);

    const auto range_size = ChunkedDownloader::partition(0, payload.size(), 4)[0].size;
    f.transport.hold_from(3 * range_size);

    std::expected<DownloadResult, std::error_code> result;
    std::jthread worker([&] { result = f.run(f.request(payload.size())); });

    std::optional<ProgressRecord> record;
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        record = f.store.load("data.bin");
        if (f.transport.held() == 1 && record && record->bytes_confirmed == 3 * range_size) break;
        std::this_thread::sleep_for(5ms);
    }

    REQUIRE(record.has_value());
    CHECK(record->bytes_confirmed == 3 * range_size);
    REQUIRE(record->ranges.size() == 4);
    CHECK(record->ranges[0].downloaded == range_size);
    CHECK(record->ranges[2].downloaded == range_size);
    CHECK(record->ranges[3].downloaded == 0);

    f.transport.release();
    worker.join();
    REQUIRE(result.has_value());
    CHECK(read_file(result->part_path) == payload);
}

TEST_CASE("ChunkedDownloader - shared limiter paces every transfer", "[chunked][limiter]") {
    Fixture f;
    BandwidthLimiter limiter(256);   // 256 KB/s
    const std::string small_url = "https://cdn.example.com/patch/small.bin";

    auto large = make_payload(THRESHOLD + 32 * 1024, 3);   // Multi-range
    auto small = make_payload(32 * 1024, 4);               // Single stream
    f.transport.serve(URL, large);
    f.transport.serve(small_url, small);

    ChunkedDownloader downloader(f.transport, limiter, f.store, f.options);
    const DownloadRequest small_request{small_url, "small.bin", f.dir / "small.bin", small.size(), std::nullopt};

    std::expected<DownloadResult, std::error_code> large_result;
    std::expected<DownloadResult, std::error_code> small_result;

    const auto start = std::chrono::steady_clock::now();
    {
        std::jthread a([&] { large_result = downloader.download(f.request(large.size()), {}); });
        std::jthread b([&] { small_result = downloader.download(small_request, {}); });
    }
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    REQUIRE(large_result.has_value());
    REQUIRE(small_result.has_value());
    CHECK(large_result->multi_range);
    CHECK_FALSE(small_result->multi_range);
    CHECK(read_file(large_result->part_path) == large);
    CHECK(read_file(small_result->part_path) == small);

    const auto total = static_cast<double>(large.size() + small.size());
    const auto rate = static_cast<double>(limiter.rate_bytes_per_sec());
    CHECK(elapsed >= (total - static_cast<double>(limiter.slice_bytes())) / rate);
    CHECK(limiter.total_granted() == f.transport.bytes_sent());
    CHECK(limiter.total_granted() == large.size() + small.size());
}

TEST_CASE("ChunkedDownloader - transient failures", "[chunked]") {
    Fixture f;
    f.transport.chunk_size(1024);

    SECTION("Single stream retries from where it stopped") {
        auto payload = make_payload(20'000);
        f.transport.serve(URL, payload);
        f.transport.fail(URL, {1, 4'096});

        auto result = f.run(f.request(payload.size()));
        REQUIRE(result.has_value());
        CHECK(read_file(result->part_path) == payload);

        auto fetches = f.transport.fetches();
        REQUIRE(fetches.size() == 2);
        CHECK(fetches[1].offset == 4'096);
        CHECK(f.transport.bytes_sent() == payload.size());
    }

    SECTION("One failing range is retried alone") {
        auto payload = make_payload(THRESHOLD * 2);
        f.transport.serve(URL, payload);
        f.transport.fail(URL, {1, 2'048});

        auto result = f.run(f.request(payload.size()));
        REQUIRE(result.has_value());
        CHECK(read_file(result->part_path) == payload);
        CHECK(f.transport.fetches().size() == 5);
        CHECK(f.transport.bytes_sent() == payload.size());
    }

    SECTION("Retries run out") {
        auto payload = make_payload(10'000);
        f.transport.serve(URL, payload);
        f.transport.fail(URL, {100, 0});
        f.options.retry_count = 2;

        auto result = f.run(f.request(payload.size()));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == SyncErrc::transfer_failed);
        CHECK(f.transport.fetches().size() == 3);
    }

    SECTION("Stalls count as transient") {
        auto payload = make_payload(10'000);
        f.transport.serve(URL, payload);
        f.transport.fail(URL, {1, 1'024, make_error_code(SyncErrc::stall_detected)});

        auto result = f.run(f.request(payload.size()));
        REQUIRE(result.has_value());
        CHECK(f.transport.fetches().size() == 2);
    }
}

TEST_CASE("ChunkedDownloader - permanent failures", "[chunked]") {
    Fixture f;

    SECTION("Missing remote file is not retried") {
        auto result = f.run(f.request(100));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == SyncErrc::not_found);
        CHECK(f.transport.fetches().size() == 1);
    }

    SECTION("Body larger than announced") {
        auto payload = make_payload(10'000);
        f.transport.serve(URL, payload);

        auto result = f.run(f.request(5'000));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == SyncErrc::invalid_range);
        CHECK_FALSE(fs::exists(ChunkedDownloader::part_path(f.destination())));
        CHECK(f.backend->size() == 0);
    }
}

TEST_CASE("ChunkedDownloader - server ignores ranges", "[chunked]") {
    Fixture f;
    f.transport.ranges(false);

    SECTION("Multi-range falls back to one stream") {
        auto payload = make_payload(THRESHOLD * 2);
        f.transport.serve(URL, payload);

        auto result = f.run(f.request(payload.size()));
        REQUIRE(result.has_value());
        CHECK(result->range_fallback);
        CHECK_FALSE(result->multi_range);
        CHECK(read_file(result->part_path) == payload);
    }

    SECTION("Resume restarts from zero") {
        auto payload = make_payload(20'000);
        f.transport.serve(URL, payload);
        const auto part = ChunkedDownloader::part_path(f.destination());
        write_file(part, payload.substr(0, 8'000));
        REQUIRE_FALSE(f.store.save("data.bin", 8'000, payload.size()));

        auto req = f.request(payload.size());
        req.resume = f.store.load("data.bin");
        auto result = f.run(req);
        REQUIRE(result.has_value());
        CHECK(result->range_fallback);
        CHECK(result->resumed_from == 0);
        CHECK(read_file(part) == payload);
    }
}

TEST_CASE("ChunkedDownloader - cancellation keeps partial state", "[chunked]") {
    Fixture f;
    auto payload = make_payload(200 * 1024);
    f.transport.serve(URL, payload);
    f.transport.chunk_size(1024);
    f.transport.chunk_delay(2ms);

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(60ms);
        stop.request_stop();
    });

    auto result = f.run(f.request(payload.size()), stop.get_token());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == SyncErrc::cancelled);

    const auto part = ChunkedDownloader::part_path(f.destination());
    CHECK(fs::exists(part));

    auto record = f.store.load("data.bin");
    REQUIRE(record.has_value());
    CHECK(record->bytes_confirmed > 0);
    CHECK(record->bytes_confirmed < payload.size());
    CHECK(record->ranges.size() == 4);

    SECTION("Next attempt finishes without refetching") {
        f.transport.chunk_delay(0ms);
        f.transport.reset_counters();

        auto req = f.request(payload.size());
        req.resume = record;
        auto resumed = f.run(req);
        REQUIRE(resumed.has_value());
        CHECK(read_file(part) == payload);
        CHECK(resumed->resumed_from == record->bytes_confirmed);
        CHECK(f.transport.bytes_sent() == payload.size() - record->bytes_confirmed);
    }
}
