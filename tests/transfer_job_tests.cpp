// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tandem/core/transfer_job.hpp>
#include "test_support.hpp"
#include <thread>

using namespace tandem::core;
using namespace std::chrono_literals;
using tandem::test::FakeExecutor;
using tandem::test::TempDir;
using tandem::test::read_file;

namespace {

constexpr std::uint64_t KiB = 1024;
constexpr const char* REMOTE = "/sdcard/Movies/clip.mp4";

std::unique_ptr<TransferJob> make_job(const std::shared_ptr<FakeExecutor>& exec,
                                      const std::filesystem::path& dest,
                                      std::uint64_t total,
                                      std::uint64_t chunk_size,
                                      std::uint32_t workers) {
    auto chunks = plan_chunks(static_cast<std::int64_t>(total), chunk_size, dest);
    REQUIRE(chunks);
    return std::make_unique<TransferJob>("dl_test", REMOTE, dest, total, std::move(*chunks), exec, workers);
}

bool any_temp_exists(const TransferJob& job) {
    for (const auto& c : job.chunks()) {
        if (std::filesystem::exists(c.temp_path)) return true;
    }
    return false;
}

} // namespace

TEST_CASE("Transfer job fetches all chunks and merges in order", "[job]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    const auto payload = tandem::test::make_payload(120 * KiB);
    exec->add_file(REMOTE, payload);
    // First chunk finishes last
    exec->delay_offset(0, 60ms);

    const auto dest = dir / "clip.mp4";
    auto job = make_job(exec, dest, payload.size(), 50 * KiB, 4);

    auto chunks = job->chunks();
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].size == 50 * KiB);
    CHECK(chunks[1].size == 50 * KiB);
    CHECK(chunks[2].size == 20 * KiB);

    REQUIRE_FALSE(job->start());
    auto final = job->wait();

    CHECK(final.status == TransferStatus::completed);
    CHECK(final.job_id == "dl_test");
    CHECK(final.file_name == "clip.mp4");
    CHECK(final.bytes_downloaded == payload.size());
    CHECK(final.total_bytes == payload.size());
    CHECK(final.percent == 100.0);
    CHECK(final.completed_chunks == 3);
    CHECK(final.total_chunks == 3);
    CHECK_FALSE(final.error);
    CHECK(final.local_path == dest.string());

    CHECK(read_file(dest) == payload);
    CHECK_FALSE(any_temp_exists(*job));
    CHECK(exec->reads() == 3);
}

TEST_CASE("Transfer job stops on a failed chunk", "[job][error]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    const auto payload = tandem::test::make_payload(150);
    exec->add_file(REMOTE, payload);
    exec->on_offset(50, FakeExecutor::Behavior::fail, "dd: I/O error");
    exec->hold();

    const auto dest = dir / "clip.mp4";
    auto job = make_job(exec, dest, payload.size(), 50, 4);
    REQUIRE_FALSE(job->start());

    // All three reads are in flight before any of them resolves
    REQUIRE(exec->wait_for_in_flight(3));
    exec->release();
    auto final = job->wait();

    CHECK(final.status == TransferStatus::error);
    REQUIRE(final.error);
    CHECK(*final.error == "Chunk 1 failed: dd: I/O error");
    CHECK(job->error() == final.error);
    CHECK(final.completed_chunks == 2);
    CHECK(final.bytes_downloaded == 100);

    auto chunks = job->chunks();
    CHECK(chunks[0].state == ChunkState::completed);
    CHECK(chunks[1].state == ChunkState::error);
    CHECK(chunks[2].state == ChunkState::completed);

    // No merge; finished chunks stay until cancelled
    CHECK_FALSE(std::filesystem::exists(dest));
    CHECK(std::filesystem::exists(chunks[0].temp_path));
    CHECK_FALSE(std::filesystem::exists(chunks[1].temp_path));
    CHECK(std::filesystem::exists(chunks[2].temp_path));

    job->cancel();
    CHECK(job->status() == TransferStatus::error);
    CHECK_FALSE(any_temp_exists(*job));
}

TEST_CASE("Transfer job never exceeds its worker count", "[job][concurrency]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    const auto payload = tandem::test::make_payload(10 * 16);
    exec->add_file(REMOTE, payload);
    exec->delay(5ms);

    SECTION("Three workers") {
        exec->hold();
        auto job = make_job(exec, dir / "out.bin", payload.size(), 16, 3);
        REQUIRE_FALSE(job->start());

        REQUIRE(exec->wait_for_in_flight(3));
        std::this_thread::sleep_for(50ms);
        CHECK(exec->in_flight() == 3);
        exec->release();

        auto final = job->wait();
        CHECK(final.status == TransferStatus::completed);
        CHECK(exec->max_in_flight() == 3);
        CHECK(exec->reads() == 10);
        CHECK(read_file(dir / "out.bin") == payload);
    }

    SECTION("One worker is sequential") {
        auto job = make_job(exec, dir / "out.bin", payload.size(), 16, 1);
        REQUIRE_FALSE(job->start());
        auto final = job->wait();
        CHECK(final.status == TransferStatus::completed);
        CHECK(exec->max_in_flight() == 1);
        CHECK(read_file(dir / "out.bin") == payload);
    }

    SECTION("More workers than chunks") {
        auto job = make_job(exec, dir / "out.bin", 32, 16, 8);
        exec->add_file(REMOTE, payload.substr(0, 32));
        REQUIRE_FALSE(job->start());
        CHECK(job->wait().status == TransferStatus::completed);
        CHECK(exec->max_in_flight() <= 2);
    }
}

TEST_CASE("Transfer job pause and resume", "[job][pause]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    const auto payload = tandem::test::make_payload(6 * 16);
    exec->add_file(REMOTE, payload);
    exec->hold();

    const auto dest = dir / "out.bin";
    auto job = make_job(exec, dest, payload.size(), 16, 2);
    REQUIRE_FALSE(job->start());
    REQUIRE(exec->wait_for_in_flight(2));

    SECTION("In-flight chunks finish, nothing new is dispatched") {
        REQUIRE_FALSE(job->pause());
        CHECK(job->status() == TransferStatus::paused);
        exec->release();

        auto paused = job->wait();
        CHECK(paused.status == TransferStatus::paused);
        CHECK(paused.completed_chunks == 2);
        CHECK(exec->reads() == 2);
        CHECK_FALSE(std::filesystem::exists(dest));

        REQUIRE_FALSE(job->resume());
        auto final = job->wait();
        CHECK(final.status == TransferStatus::completed);
        CHECK(final.completed_chunks == 6);
        CHECK(exec->reads() == 6);
        CHECK(exec->max_in_flight() <= 2);
        CHECK(read_file(dest) == payload);
    }

    SECTION("Resume before in-flight chunks drain") {
        REQUIRE_FALSE(job->pause());
        REQUIRE_FALSE(job->resume());
        exec->release();

        auto final = job->wait();
        CHECK(final.status == TransferStatus::completed);
        CHECK(read_file(dest) == payload);
    }
}

TEST_CASE("Transfer job resumed as its coordinator winds down", "[job][pause]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    const auto payload = tandem::test::make_payload(2 * 16);
    exec->add_file(REMOTE, payload);
    exec->hold();

    const auto dest = dir / "out.bin";
    auto job = make_job(exec, dest, payload.size(), 16, 1);
    REQUIRE_FALSE(job->start());
    REQUIRE(exec->wait_for_in_flight(1));

    // The only in-flight read lands while paused; resume races the
    // coordinator leaving its dispatch loop
    REQUIRE_FALSE(job->pause());
    exec->release();
    REQUIRE_FALSE(job->resume());

    auto final = job->wait_for(5s);
    REQUIRE(final);
    CHECK(final->status == TransferStatus::completed);
    CHECK(final->completed_chunks == 2);
    CHECK(read_file(dest) == payload);
}

TEST_CASE("Transfer job survives repeated pause and resume", "[job][pause][concurrency]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    const auto payload = tandem::test::make_payload(8 * 16);
    exec->add_file(REMOTE, payload);
    exec->delay(1ms);

    for (int round = 0; round < 25; ++round) {
        const auto dest = dir / ("out" + std::to_string(round) + ".bin");
        auto job = make_job(exec, dest, payload.size(), 16, 2);
        REQUIRE_FALSE(job->start());

        for (int i = 0; i < 40; ++i) {
            if (!job->pause()) {
                std::this_thread::yield();
                REQUIRE_FALSE(job->resume());
            }
        }

        auto final = job->wait_for(5s);
        REQUIRE(final);
        CHECK(final->status == TransferStatus::completed);
        CHECK(read_file(dest) == payload);
        CHECK_FALSE(any_temp_exists(*job));
    }
}

TEST_CASE("Transfer job rejects invalid transitions", "[job][state]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    exec->add_file(REMOTE, "abcdefgh");
    auto job = make_job(exec, dir / "out.bin", 8, 4, 2);

    CHECK(job->status() == TransferStatus::pending);
    CHECK(job->pause() == TransferErrc::invalid_state);
    CHECK(job->resume() == TransferErrc::invalid_state);
    CHECK(job->status() == TransferStatus::pending);

    REQUIRE_FALSE(job->start());
    CHECK(job->start() == TransferErrc::invalid_state);

    CHECK(job->wait().status == TransferStatus::completed);
    CHECK(job->pause() == TransferErrc::invalid_state);
    CHECK(job->resume() == TransferErrc::invalid_state);

    job->cancel();
    CHECK(job->status() == TransferStatus::completed);
    CHECK(read_file(dir / "out.bin") == "abcdefgh");
}

TEST_CASE("Transfer job cancel removes temporaries", "[job][cancel]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    const auto payload = tandem::test::make_payload(8 * 16);
    exec->add_file(REMOTE, payload);
    exec->hold();

    const auto dest = dir / "out.bin";
    auto job = make_job(exec, dest, payload.size(), 16, 2);
    auto sub = job->subscribe();
    REQUIRE_FALSE(job->start());
    REQUIRE(exec->wait_for_in_flight(2));

    job->cancel();
    CHECK(job->status() == TransferStatus::cancelled);

    // In-flight reads land after the cancel and clean up after themselves
    exec->release();
    auto final = job->wait();

    CHECK(final.status == TransferStatus::cancelled);
    CHECK(exec->reads() == 2);
    CHECK_FALSE(any_temp_exists(*job));
    CHECK_FALSE(std::filesystem::exists(dest));

    std::optional<ProgressSnapshot> last;
    while (auto s = sub->next()) {
        last = s;
    }
    REQUIRE(last);
    CHECK(last->status == TransferStatus::cancelled);

    job->cancel();
    CHECK(job->status() == TransferStatus::cancelled);
}

TEST_CASE("Transfer job cancelled after an error removes late chunks", "[job][cancel][error]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    const auto payload = tandem::test::make_payload(3 * 32);
    exec->add_file(REMOTE, payload);
    exec->on_offset(32, FakeExecutor::Behavior::fail, "device offline");
    exec->delay_offset(0, 300ms);
    exec->delay_offset(64, 300ms);
    exec->hold();

    const auto dest = dir / "out.bin";
    auto job = make_job(exec, dest, payload.size(), 32, 3);
    auto sub = job->subscribe();
    REQUIRE_FALSE(job->start());
    REQUIRE(exec->wait_for_in_flight(3));
    exec->release();

    std::optional<ProgressSnapshot> last;
    while (auto s = sub->next()) {
        last = s;
    }
    REQUIRE(last);
    REQUIRE(last->status == TransferStatus::error);

    // Chunks 0 and 2 are still being read
    CHECK(exec->in_flight() == 2);
    job->cancel();
    CHECK(job->status() == TransferStatus::error);

    auto final = job->wait();
    CHECK(final.status == TransferStatus::error);
    CHECK(exec->in_flight() == 0);
    CHECK_FALSE(any_temp_exists(*job));
    CHECK_FALSE(std::filesystem::exists(dest));
}

TEST_CASE("Transfer job merge failure", "[job][error]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    exec->add_file(REMOTE, "aaaabbbbcccc");
    // Chunk 1 claims success but leaves nothing to merge
    exec->on_offset(4, FakeExecutor::Behavior::skip_write);

    const auto dest = dir / "out.bin";
    auto job = make_job(exec, dest, 12, 4, 3);
    REQUIRE_FALSE(job->start());
    auto final = job->wait();

    CHECK(final.status == TransferStatus::error);
    REQUIRE(final.error);
    CHECK_THAT(*final.error, Catch::Matchers::StartsWith("Merge failed:"));

    auto chunks = job->chunks();
    CHECK_FALSE(std::filesystem::exists(chunks[0].temp_path));   // Appended before the failure
    CHECK(std::filesystem::exists(chunks[2].temp_path));
    CHECK(read_file(dest) == "aaaa");
}

TEST_CASE("Transfer job progress stream", "[job][subscription]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    const auto payload = tandem::test::make_payload(5 * 32);
    exec->add_file(REMOTE, payload);
    exec->delay(2ms);

    const auto dest = dir / "out.bin";
    auto job = make_job(exec, dest, payload.size(), 32, 2);

    SECTION("Subscriber sees every step up to completion") {
        auto sub = job->subscribe();
        REQUIRE_FALSE(job->start());

        std::vector<ProgressSnapshot> seen;
        while (auto s = sub->next()) {
            seen.push_back(*s);
        }

        REQUIRE(seen.size() >= 3);
        CHECK(seen.front().status == TransferStatus::pending);
        CHECK(seen.back().status == TransferStatus::completed);
        CHECK(seen.back().local_path == dest.string());
        CHECK(sub->finished());

        bool saw_merging = false;
        std::uint32_t chunk_updates = 0;
        for (std::size_t i = 1; i < seen.size(); ++i) {
            CHECK(seen[i].percent >= seen[i - 1].percent);
            CHECK(seen[i].completed_chunks >= seen[i - 1].completed_chunks);
            if (seen[i].completed_chunks != seen[i - 1].completed_chunks) ++chunk_updates;
            if (seen[i].status == TransferStatus::merging) {
                saw_merging = true;
                CHECK(seen[i].bytes_downloaded == payload.size());
            }
        }
        CHECK(saw_merging);
        CHECK(chunk_updates == 5);
    }

    SECTION("Late subscriber gets the final snapshot only") {
        REQUIRE_FALSE(job->start());
        CHECK(job->wait().status == TransferStatus::completed);

        auto sub = job->subscribe();
        auto s = sub->next();
        REQUIRE(s);
        CHECK(s->status == TransferStatus::completed);
        CHECK_FALSE(sub->next());
    }

    SECTION("Detached subscribers do not hold the job up") {
        auto early = job->subscribe();
        auto listener = job->subscribe();
        early->close();
        REQUIRE_FALSE(job->start());

        CHECK(job->wait().status == TransferStatus::completed);
        std::optional<ProgressSnapshot> last;
        while (auto s = listener->next()) {
            last = s;
        }
        REQUIRE(last);
        CHECK(last->status == TransferStatus::completed);
    }
}
