/**
 * @file test_log_registry.cpp
 * @brief Tests for sink sharing and lifetime
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <thread>
#include <vector>

#include "nexuslog/log.hpp"
#include "test_helpers.hpp"

using namespace nexuslog;

class registry_test_fixture : public nexuslog_test::temp_dir_fixture
{
};

TEST_CASE("sink_key resolution", "[registry]")
{
    SECTION("Console key")
    {
        auto key = sink_key::for_target(std::nullopt);
        REQUIRE(key.console);
        REQUIRE(key.path.empty());
    }

    SECTION("Equivalent spellings of a path share a key")
    {
        auto a = sink_key::for_target("/tmp/nexuslog_keys/app.log");
        auto b = sink_key::for_target("/tmp/nexuslog_keys/./sub/../app.log");
        REQUIRE_FALSE(a.console);
        REQUIRE(a == b);
        REQUIRE(sink_key_hash{}(a) == sink_key_hash{}(b));
    }

    SECTION("Relative paths resolve against the working directory")
    {
        auto rel = sink_key::for_target("logs/app.log");
        auto abs = sink_key::for_target((std::filesystem::current_path() / "logs" / "app.log").string());
        REQUIRE(rel == abs);
    }

    SECTION("Different files differ")
    {
        REQUIRE_FALSE(sink_key::for_target("/tmp/a.log") == sink_key::for_target("/tmp/b.log"));
    }
}

TEST_CASE_METHOD(registry_test_fixture, "Loggers on one path share a sink", "[registry]")
{
    auto path = path_of("shared.log");

    logger a({.name = "a", .path = path});
    logger b({.name = "b", .path = test_dir.string() + "/./shared.log"});
    logger other({.path = path_of("other.log")});

    REQUIRE(a.sink() == b.sink());
    REQUIRE(a.sink() != other.sink());
    REQUIRE(sink_registry::instance().find(path) == a.sink());
}

TEST_CASE_METHOD(registry_test_fixture, "Sink lives until its last owner is gone", "[registry]")
{
    auto path = path_of("life.log");
    std::weak_ptr<shared_sink> observed;

    {
        logger a({.path = path});
        observed = a.sink();

        {
            logger b({.path = path});
            b.info("from b");
        }

        // b is gone, a still owns the sink
        auto sink = observed.lock();
        REQUIRE(sink);
        REQUIRE(sink->running());
        sink.reset();

        a.info("from a");
        a.flush();
    }

    REQUIRE(observed.expired());
    REQUIRE(sink_registry::instance().find(path) == nullptr);

    auto lines = all_lines();
    REQUIRE(lines.size() == 2);
    REQUIRE_THAT(lines[0], Catch::Matchers::EndsWith("msg=\"from b\""));
    REQUIRE_THAT(lines[1], Catch::Matchers::EndsWith("msg=\"from a\""));
}

TEST_CASE_METHOD(registry_test_fixture, "A target is reopened after its sink ended", "[registry]")
{
    auto path = path_of("again.log");

    {
        logger first({.path = path, .timestamps = timestamp_mode::unix_epoch});
        first.info("first");
        first.shutdown();
    }

    logger second({.path = path, .timestamps = timestamp_mode::unix_epoch});
    REQUIRE(second.sink()->running());
    second.info("second");
    second.shutdown();

    auto lines = all_lines();
    REQUIRE(lines.size() == 2);
    REQUIRE_THAT(lines[0], Catch::Matchers::EndsWith("msg=\"first\""));
    REQUIRE_THAT(lines[1], Catch::Matchers::EndsWith("msg=\"second\""));
}

TEST_CASE_METHOD(registry_test_fixture, "First creator's time rendering wins", "[registry]")
{
    auto path = path_of("mode.log");

    logger unix_logger({.path = path, .timestamps = timestamp_mode::unix_epoch});
    logger calendar_logger({.path = path, .timestamps = timestamp_mode::calendar});
    REQUIRE(calendar_logger.sink()->config().timestamps == timestamp_mode::unix_epoch);
}

TEST_CASE_METHOD(registry_test_fixture, "Concurrent writers to one file", "[registry][concurrent]")
{
    auto path             = path_of("mixed.log");
    constexpr int threads = 4;
    constexpr int count   = 2000;

    {
        std::vector<logger> loggers;
        for (int t = 0; t < threads; ++t) { loggers.emplace_back(logger_options{.name = fmt::format("t{}", t), .path = path}); }

        std::vector<std::thread> workers;
        for (int t = 0; t < threads; ++t)
        {
            workers.emplace_back(
                [&, t]
                {
                    for (int i = 0; i < count; ++i) { loggers[t].info("line {} of thread {}", i, t); }
                    loggers[t].flush();
                });
        }
        for (auto &w : workers) w.join();
    }

    auto lines = all_lines();
    REQUIRE(lines.size() == threads * count);

    // Every line is whole, and each thread's lines are in call order
    std::vector<int> next(threads, 0);
    for (const auto &line : lines)
    {
        REQUIRE(line.rfind("time=", 0) == 0);
        auto pos = line.find(" name=t");
        REQUIRE(pos != std::string::npos);
        int t = line[pos + 7] - '0';
        REQUIRE(line.substr(pos) ==
                fmt::format(" name=t{} msg=\"line {} of thread {}\"", t, next[t], t));
        ++next[t];
    }
}

TEST_CASE_METHOD(registry_test_fixture, "Loggers owned by exiting threads lose nothing", "[registry][concurrent]")
{
    auto path             = path_of("owners.log");
    constexpr int rounds  = 5;
    constexpr int threads = 4;
    constexpr int count   = 3000;

    for (int r = 0; r < rounds; ++r)
    {
        // Every thread holds its own reference; whichever finishes last stops the sink
        std::vector<std::thread> workers;
        for (int t = 0; t < threads; ++t)
        {
            workers.emplace_back(
                [&, r, t]
                {
                    logger log({.name = fmt::format("r{}t{}", r, t), .path = path});
                    for (int i = 0; i < count; ++i) { log.info("{}", i); }
                });
        }
        for (auto &w : workers) w.join();

        REQUIRE(sink_registry::instance().find(path) == nullptr);
    }

    REQUIRE(all_lines().size() == static_cast<size_t>(rounds * threads * count));
}
