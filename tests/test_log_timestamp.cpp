/**
 * @file test_log_timestamp.cpp
 * @brief Tests for the producer-side timestamp cache
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdlib>
#include <thread>

#include "nexuslog/log_timestamp.hpp"

using namespace nexuslog;
using namespace std::chrono_literals;

namespace
{

int64_t nanos_between(log_timestamp a, log_timestamp b)
{
    return (static_cast<int64_t>(b.secs) - static_cast<int64_t>(a.secs)) * NANOS_PER_SECOND +
           (static_cast<int64_t>(b.nanos) - static_cast<int64_t>(a.nanos));
}

} // namespace

TEST_CASE("Wall timestamp is sane", "[timestamp]")
{
    auto ts = log_wall_timestamp();
    REQUIRE(ts.nanos < NANOS_PER_SECOND);
    // After 2020-01-01
    REQUIRE(ts.secs > 1577836800ULL);
}

TEST_CASE("thread_timestamp_cache derivation", "[timestamp]")
{
    thread_timestamp_cache cache;
    auto anchor = cache.anchor();
    auto base   = cache.base();

    SECTION("Within the interval the time is derived from the anchor")
    {
        auto ts = cache.now_at(anchor + 500ms);
        REQUIRE(nanos_between(base, ts) == 500'000'000);
        REQUIRE(ts.nanos < NANOS_PER_SECOND);
        REQUIRE(cache.anchor() == anchor);
    }

    SECTION("Carry into the next second")
    {
        auto ts = cache.now_at(anchor + 999'999'999ns);
        REQUIRE(nanos_between(base, ts) == 999'999'999);
        REQUIRE(ts.nanos < NANOS_PER_SECOND);
    }

    SECTION("Anchor itself yields the base")
    {
        REQUIRE(cache.now_at(anchor) == base);
    }

    SECTION("One second or more resynchronizes")
    {
        cache.now_at(anchor + 1s);
        REQUIRE(cache.anchor() == anchor + 1s);
        REQUIRE(nanos_between(base, cache.base()) >= 0);
    }

    SECTION("A point before the anchor resynchronizes")
    {
        cache.now_at(anchor - 1ms);
        REQUIRE(cache.anchor() == anchor - 1ms);
    }
}

TEST_CASE("Cached timestamps track the wall clock", "[timestamp]")
{
    for (int i = 0; i < 10000; ++i)
    {
        auto ts = cached_timestamp();
        REQUIRE(ts.nanos < NANOS_PER_SECOND);
        REQUIRE(std::llabs(nanos_between(log_wall_timestamp(), ts)) < 2'000'000'000LL);
    }
}
