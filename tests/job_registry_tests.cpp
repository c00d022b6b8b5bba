// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tandem/core/job_registry.hpp>
#include "test_support.hpp"
#include <regex>
#include <set>
#include <thread>

using namespace tandem::core;
using namespace std::chrono_literals;
using tandem::test::FakeExecutor;
using tandem::test::TempDir;

TEST_CASE("JobRegistry creates jobs with unique ids", "[registry]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    JobRegistry registry(exec, 16, 2);

    const std::regex id_format("dl_[0-9]+_[0-9a-z]{9}");
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        auto job = registry.create("/r/f.bin", dir / ("f" + std::to_string(i)), 100);
        REQUIRE(job);
        CHECK(std::regex_match((*job)->id(), id_format));
        CHECK((*job)->status() == TransferStatus::pending);
        ids.insert((*job)->id());
    }
    CHECK(ids.size() == 50);
    CHECK(registry.size() == 50);
    CHECK(registry.list_all().size() == 50);
}

TEST_CASE("JobRegistry lookups", "[registry]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    JobRegistry registry(exec, 16, 2);

    SECTION("Unknown id") {
        auto job = registry.get("dl_0_missing00");
        REQUIRE_FALSE(job);
        CHECK(job.error() == TransferErrc::job_not_found);
    }

    SECTION("Known id returns the same job") {
        auto created = registry.create("/r/f.bin", dir / "f", 64);
        REQUIRE(created);
        auto found = registry.get((*created)->id());
        REQUIRE(found);
        CHECK(found->get() == created->get());
        CHECK((*found)->chunks().size() == 4);
    }

    SECTION("Invalid size is rejected") {
        auto job = registry.create("/r/f.bin", dir / "f", 0);
        REQUIRE_FALSE(job);
        CHECK(job.error() == TransferErrc::invalid_size);
        CHECK(registry.size() == 0);
    }
}

TEST_CASE("JobRegistry runs jobs independently", "[registry][concurrency]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    const auto a = tandem::test::make_payload(100, 1);
    const auto b = tandem::test::make_payload(70, 2);
    exec->add_file("/r/a.bin", a);
    exec->add_file("/r/b.bin", b);
    exec->delay(2ms);

    JobRegistry registry(exec, 16, 2);
    auto job_a = registry.create("/r/a.bin", dir / "a.bin", 100);
    auto job_b = registry.create("/r/b.bin", dir / "b.bin", 70);
    REQUIRE(job_a);
    REQUIRE(job_b);
    CHECK((*job_a)->id() != (*job_b)->id());

    auto sub_a = (*job_a)->subscribe();
    auto sub_b = (*job_b)->subscribe();
    REQUIRE_FALSE((*job_a)->start());
    REQUIRE_FALSE((*job_b)->start());

    auto drain = [](const std::shared_ptr<ProgressSubscription>& sub, const std::string& id) {
        std::optional<ProgressSnapshot> last;
        while (auto s = sub->next()) {
            CHECK(s->job_id == id);
            last = s;
        }
        return last;
    };

    auto last_a = drain(sub_a, (*job_a)->id());
    auto last_b = drain(sub_b, (*job_b)->id());
    REQUIRE(last_a);
    REQUIRE(last_b);
    CHECK(last_a->status == TransferStatus::completed);
    CHECK(last_b->status == TransferStatus::completed);
    CHECK(last_a->total_chunks == 7);
    CHECK(last_b->total_chunks == 5);

    CHECK(tandem::test::read_file(dir / "a.bin") == a);
    CHECK(tandem::test::read_file(dir / "b.bin") == b);
}

TEST_CASE("JobRegistry remove", "[registry][cancel]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    exec->add_file("/r/f.bin", tandem::test::make_payload(64));
    JobRegistry registry(exec, 16, 2);

    SECTION("Drops the job and its temporaries without waiting for reads") {
        exec->hold();
        auto job = registry.create("/r/f.bin", dir / "f.bin", 64);
        REQUIRE(job);
        const std::string id = (*job)->id();
        const auto chunks = (*job)->chunks();
        REQUIRE_FALSE((*job)->start());
        REQUIRE(exec->wait_for_in_flight(2));

        registry.remove(id);
        CHECK((*job)->status() == TransferStatus::cancelled);
        CHECK(registry.list_all().empty());
        CHECK_FALSE(registry.get(id));
        CHECK(registry.retired_count() == 1);

        job->reset();
        exec->release();

        // Reaped by the next registry mutation once its reads have landed
        for (int i = 0; i < 200 && registry.retired_count() > 0; ++i) {
            std::this_thread::sleep_for(5ms);
            registry.remove("dl_0_nothing00");
        }
        CHECK(registry.retired_count() == 0);
        for (const auto& c : chunks) {
            CHECK_FALSE(std::filesystem::exists(c.temp_path));
        }
    }

    SECTION("Removing a failed job cleans up reads that land afterwards") {
        exec->on_offset(16, FakeExecutor::Behavior::fail, "device offline");
        exec->delay_offset(0, 300ms);
        exec->hold();
        auto job = registry.create("/r/f.bin", dir / "f.bin", 64);
        REQUIRE(job);
        const std::string id = (*job)->id();
        const auto chunks = (*job)->chunks();
        auto sub = (*job)->subscribe();
        REQUIRE_FALSE((*job)->start());
        REQUIRE(exec->wait_for_in_flight(2));
        exec->release();

        std::optional<ProgressSnapshot> last;
        while (auto s = sub->next()) {
            last = s;
        }
        REQUIRE(last);
        REQUIRE(last->status == TransferStatus::error);

        registry.remove(id);
        job->reset();

        for (int i = 0; i < 200 && registry.retired_count() > 0; ++i) {
            std::this_thread::sleep_for(5ms);
            registry.remove("dl_0_nothing00");
        }
        CHECK(registry.retired_count() == 0);
        for (const auto& c : chunks) {
            CHECK_FALSE(std::filesystem::exists(c.temp_path));
        }
    }

    SECTION("Unknown id is a no-op") {
        auto job = registry.create("/r/f.bin", dir / "f.bin", 64);
        REQUIRE(job);
        registry.remove("dl_0_unknown00");
        CHECK(registry.size() == 1);
    }

    SECTION("Removing twice is harmless") {
        auto job = registry.create("/r/f.bin", dir / "f.bin", 64);
        REQUIRE(job);
        const std::string id = (*job)->id();
        registry.remove(id);
        registry.remove(id);
        CHECK(registry.size() == 0);
        CHECK((*job)->status() == TransferStatus::cancelled);
    }
}

TEST_CASE("JobRegistry destruction cancels running jobs", "[registry][cancel]") {
    TempDir dir;
    auto exec = std::make_shared<FakeExecutor>();
    exec->add_file("/r/f.bin", tandem::test::make_payload(64));
    exec->delay(20ms);

    std::shared_ptr<TransferJob> job;
    {
        JobRegistry registry(exec, 16, 1);
        auto created = registry.create("/r/f.bin", dir / "f.bin", 64);
        REQUIRE(created);
        job = *created;
        REQUIRE_FALSE(job->start());
    }
    CHECK(job->status() == TransferStatus::cancelled);
    job->wait();
    CHECK_FALSE(std::filesystem::exists(dir / "f.bin"));
}
