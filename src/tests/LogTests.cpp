// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace parley;

namespace
{

/// Routes log output into a vector for the lifetime of the object.
struct CapturedLog
{
    std::vector<std::pair<log::Level, std::string>> lines;
    log::Level previousLevel = log::getLevel();

    CapturedLog()
    {
        log::setCallback([this](log::Level level, std::string_view message) { lines.emplace_back(level, message); });
    }

    ~CapturedLog()
    {
        log::setCallback({});
        log::setLevel(previousLevel);
    }
};

} // namespace

TEST_CASE("levelFromString parses level names", "[log]")
{
    CHECK(log::levelFromString("error") == log::Level::Error);
    CHECK(log::levelFromString("WARN") == log::Level::Warning);
    CHECK(log::levelFromString("Warning") == log::Level::Warning);
    CHECK(log::levelFromString("info") == log::Level::Info);
    CHECK(log::levelFromString("debug") == log::Level::Debug);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(!log::levelFromString("verbose").has_value());
}

TEST_CASE("levelName round-trips through levelFromString", "[log]")
{
    for (auto const level: { log::Level::Error, log::Level::Warning, log::Level::Info, log::Level::Debug, log::Level::Trace })
        CHECK(log::levelFromString(log::levelName(level)) == level);
}

TEST_CASE("Log messages above the configured level are dropped", "[log]")
{
    auto captured = CapturedLog {};
    log::setLevel(log::Level::Info);

    log::error("disk {}", "full");
    log::info("hello {}", 42);
    log::debug("hidden");
    log::trace("hidden");

    REQUIRE(captured.lines.size() == 2);
    CHECK(captured.lines[0] == std::pair { log::Level::Error, std::string { "disk full" } });
    CHECK(captured.lines[1] == std::pair { log::Level::Info, std::string { "hello 42" } });

    log::setLevel(log::Level::Trace);
    log::trace("visible");
    REQUIRE(captured.lines.size() == 3);
    CHECK(captured.lines[2].second == "visible");
}

TEST_CASE("Log callback may log from within itself", "[log]")
{
    auto const previousLevel = log::getLevel();
    log::setLevel(log::Level::Info);

    auto lines = std::vector<std::string> {};
    log::setCallback([&lines](log::Level, std::string_view message) {
        lines.emplace_back(message);
        if (message == "outer")
            log::info("inner");
    });

    log::info("outer");

    log::setCallback({});
    log::setLevel(previousLevel);
    CHECK(lines == std::vector<std::string> { "outer", "inner" });
}
