// SPDX-License-Identifier: Apache-2.0
#include <speech/SettingsStore.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace parley;

TEST_CASE("JsonSettingsStore reports missing keys as nullopt", "[settings]")
{
    auto const store = JsonSettingsStore {};
    CHECK(!store.string("x").has_value());
    CHECK(!store.number("x").has_value());
    CHECK(!store.integer("x").has_value());
    CHECK(!store.boolean("x").has_value());
    CHECK(store.stringList("x").empty());
}

TEST_CASE("JsonSettingsStore reads native JSON values", "[settings]")
{
    auto const store = JsonSettingsStore(nlohmann::json {
        { "name", "alloy" },
        { "speed", 1.25 },
        { "latency", 3 },
        { "flag", true },
        { "list", nlohmann::json::array({ "word", "segment" }) },
        { "cleared", nullptr },
    });

    CHECK(store.string("name") == "alloy");
    CHECK(store.number("speed") == 1.25);
    CHECK(store.number("latency") == 3.0);
    CHECK(store.integer("latency") == 3);
    CHECK(store.boolean("flag") == true);
    CHECK(store.stringList("list") == std::vector<std::string> { "word", "segment" });
    CHECK(!store.string("cleared").has_value());
}

TEST_CASE("JsonSettingsStore parses values stored as strings", "[settings]")
{
    auto const store = JsonSettingsStore(nlohmann::json {
        { "speed", " 0.75 " },
        { "latency", "2" },
        { "on", "true" },
        { "off", "No" },
        { "list", R"(["word"])" },
        { "garbage", "fast" },
        { "blank", "  " },
    });

    CHECK(store.number("speed") == 0.75);
    CHECK(store.integer("latency") == 2);
    CHECK(store.boolean("on") == true);
    CHECK(store.boolean("off") == false);
    CHECK(store.stringList("list") == std::vector<std::string> { "word" });

    CHECK(!store.number("garbage").has_value());
    CHECK(!store.integer("garbage").has_value());
    CHECK(!store.boolean("garbage").has_value());
    CHECK(store.stringList("garbage").empty());
    CHECK(!store.number("blank").has_value());
}

TEST_CASE("JsonSettingsStore rejects integers outside the int range", "[settings]")
{
    auto const store = JsonSettingsStore(nlohmann::json {
        { "huge", 5000000000LL },
        { "hugeUnsigned", 5000000000ULL },
        { "tiny", -5000000000LL },
        { "max", 2147483647 },
        { "min", -2147483647LL - 1 },
        { "hugeString", "5000000000" },
    });

    CHECK(!store.integer("huge").has_value());
    CHECK(!store.integer("hugeUnsigned").has_value());
    CHECK(!store.integer("tiny").has_value());
    CHECK(!store.integer("hugeString").has_value());
    CHECK(store.integer("max") == 2147483647);
    CHECK(store.integer("min") == -2147483647 - 1);
}

TEST_CASE("JsonSettingsStore rejects values of the wrong type", "[settings]")
{
    auto const store = JsonSettingsStore(nlohmann::json {
        { "speed", true },
        { "name", 42 },
        { "ratio", 0.5 },
    });

    CHECK(!store.number("speed").has_value());
    CHECK(!store.string("name").has_value());
    CHECK(!store.integer("ratio").has_value());
}

TEST_CASE("JsonSettingsStore set replaces values", "[settings]")
{
    auto store = JsonSettingsStore {};
    store.set("ttsProvider", "groq");
    CHECK(store.string("ttsProvider") == "groq");

    store.set("ttsProvider", nullptr);
    CHECK(!store.string("ttsProvider").has_value());
    CHECK(store.values().contains("ttsProvider"));
}

TEST_CASE("JsonSettingsStore ignores a non-object document", "[settings]")
{
    auto const store = JsonSettingsStore(nlohmann::json::array({ 1, 2 }));
    CHECK(store.values().is_object());
    CHECK(store.values().empty());
}
