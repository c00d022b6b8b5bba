// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tandem/core/progress.hpp>
#include <tandem/core/subscription.hpp>
#include <nlohmann/json.hpp>
#include <thread>

using namespace tandem::core;
using namespace std::chrono_literals;

TEST_CASE("ProgressTracker", "[progress]") {
    const auto t0 = ProgressTracker::Clock::now();

    SECTION("Initial state") {
        ProgressTracker tracker(1000);
        CHECK(tracker.bytes_downloaded() == 0);
        CHECK(tracker.remaining() == 1000);
        CHECK(tracker.percent() == 0.0);
        CHECK(tracker.throughput() == 0.0);
        CHECK(tracker.eta() == 0.0);
        CHECK_FALSE(tracker.started());
    }

    SECTION("Throughput and ETA from elapsed time") {
        ProgressTracker tracker(100);
        tracker.start(t0);
        tracker.record(50, t0 + 2s);

        CHECK(tracker.bytes_downloaded() == 50);
        CHECK(tracker.throughput() == Catch::Approx(25.0));
        CHECK(tracker.eta() == Catch::Approx(2.0));
        CHECK(tracker.percent() == 50.0);
    }

    SECTION("No elapsed time keeps the previous throughput") {
        ProgressTracker tracker(100);
        tracker.start(t0);
        tracker.record(10, t0);
        CHECK(tracker.throughput() == 0.0);
        CHECK(tracker.eta() == 0.0);

        tracker.record(10, t0 + 1s);
        CHECK(tracker.throughput() == Catch::Approx(20.0));
        tracker.record(0, t0 + 1s);
        CHECK(tracker.throughput() == Catch::Approx(20.0));
    }

    SECTION("Percent is rounded to two decimals") {
        ProgressTracker tracker(3);
        tracker.record(1, t0);
        CHECK(tracker.percent() == Catch::Approx(33.33));
        tracker.record(2, t0);
        CHECK(tracker.percent() == 100.0);
        CHECK(tracker.remaining() == 0);
    }

    SECTION("Zero total") {
        ProgressTracker tracker(0);
        CHECK(tracker.percent() == 0.0);
    }
}

TEST_CASE("Formatting helpers", "[progress][format]") {
    SECTION("Speed") {
        CHECK(format_speed(0) == "0 B/s");
        CHECK(format_speed(512.4) == "512 B/s");
        CHECK(format_speed(1536) == "1.50 KB/s");
        CHECK(format_speed(3.25 * 1024 * 1024) == "3.25 MB/s");
    }

    SECTION("ETA") {
        CHECK(format_eta(0) == "0s");
        CHECK(format_eta(42.4) == "42s");
        CHECK(format_eta(187) == "3m 7s");
        CHECK(format_eta(2 * 3600 + 15 * 60 + 30) == "2h 15m");
    }

    SECTION("Bytes") {
        CHECK(format_bytes(0) == "0 B");
        CHECK(format_bytes(512) == "512 B");
        CHECK(format_bytes(1536) == "1.5 KB");
        CHECK(format_bytes(1024 * 1024) == "1 MB");
        CHECK(format_bytes(120ull * 1024 * 1024) == "120 MB");
        CHECK(format_bytes(2ull * 1024 * 1024 * 1024) == "2 GB");
    }

    SECTION("round2") {
        CHECK(round2(12.345678) == Catch::Approx(12.35));
        CHECK(round2(99.994) == Catch::Approx(99.99));
    }
}

TEST_CASE("TransferStatus", "[progress]") {
    CHECK(to_string(TransferStatus::downloading) == "downloading");
    CHECK(to_string(TransferStatus::cancelled) == "cancelled");

    CHECK(is_terminal(TransferStatus::completed));
    CHECK(is_terminal(TransferStatus::error));
    CHECK(is_terminal(TransferStatus::cancelled));
    CHECK_FALSE(is_terminal(TransferStatus::paused));
    CHECK_FALSE(is_terminal(TransferStatus::merging));
}

TEST_CASE("ProgressSnapshot JSON", "[progress][json]") {
    ProgressSnapshot s;
    s.job_id = "dl_1_abc";
    s.file_name = "video.mp4";
    s.status = TransferStatus::downloading;
    s.bytes_downloaded = 50;
    s.total_bytes = 200;
    s.percent = 25.0;
    s.speed_bps = 1536.0;
    s.speed_formatted = "1.50 KB/s";
    s.eta_seconds = 3;
    s.eta_formatted = "3s";
    s.completed_chunks = 1;
    s.total_chunks = 4;
    s.local_path = "downloads/video.mp4";

    nlohmann::json j = s;
    CHECK(j["jobId"] == "dl_1_abc");
    CHECK(j["fileName"] == "video.mp4");
    CHECK(j["status"] == "downloading");
    CHECK(j["bytesDownloaded"] == 50);
    CHECK(j["totalBytes"] == 200);
    CHECK(j["percent"] == 25.0);
    CHECK(j["speed"] == 1536.0);
    CHECK(j["speedFormatted"] == "1.50 KB/s");
    CHECK(j["eta"] == 3);
    CHECK(j["etaFormatted"] == "3s");
    CHECK(j["completedChunks"] == 1);
    CHECK(j["totalChunks"] == 4);
    CHECK(j["localPath"] == "downloads/video.mp4");
    CHECK(j["error"].is_null());

    s.status = TransferStatus::error;
    s.error = "Chunk 2 failed: timeout";
    j = s;
    CHECK(j["status"] == "error");
    CHECK(j["error"] == "Chunk 2 failed: timeout");
}

TEST_CASE("ProgressSubscription", "[progress][subscription]") {
    auto snap = [](TransferStatus status, std::uint64_t bytes) {
        ProgressSnapshot s;
        s.status = status;
        s.bytes_downloaded = bytes;
        return s;
    };

    SECTION("Delivers in order and ends after a terminal snapshot") {
        ProgressSubscription sub;
        sub.push(snap(TransferStatus::downloading, 1));
        sub.push(snap(TransferStatus::downloading, 2));
        sub.push(snap(TransferStatus::completed, 3));
        sub.push(snap(TransferStatus::downloading, 4));   // Ignored

        CHECK(sub.next()->bytes_downloaded == 1);
        CHECK(sub.next()->bytes_downloaded == 2);
        CHECK_FALSE(sub.finished());
        auto last = sub.next();
        REQUIRE(last);
        CHECK(last->status == TransferStatus::completed);
        CHECK(sub.finished());
        CHECK_FALSE(sub.next());
    }

    SECTION("try_next and next_for do not block") {
        ProgressSubscription sub;
        CHECK_FALSE(sub.try_next());
        CHECK_FALSE(sub.next_for(10ms));
        sub.push(snap(TransferStatus::paused, 5));
        auto s = sub.try_next();
        REQUIRE(s);
        CHECK(s->status == TransferStatus::paused);
    }

    SECTION("next wakes up on push from another thread") {
        ProgressSubscription sub;
        std::jthread producer([&] {
            std::this_thread::sleep_for(20ms);
            sub.push(snap(TransferStatus::cancelled, 0));
        });
        auto s = sub.next();
        REQUIRE(s);
        CHECK(s->status == TransferStatus::cancelled);
    }

    SECTION("close drops pending snapshots and wakes readers") {
        ProgressSubscription sub;
        sub.push(snap(TransferStatus::downloading, 1));
        sub.close();
        CHECK(sub.closed());
        CHECK(sub.finished());
        CHECK_FALSE(sub.next());
        sub.push(snap(TransferStatus::downloading, 2));
        CHECK_FALSE(sub.try_next());
    }
}
