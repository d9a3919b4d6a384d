#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"

#include <string>
#include <vector>

using namespace tracesdk;

TEST_CASE("Log: sink may log from inside itself", "[log]") {
    const auto previous_level = utils::log::get_level();
    utils::log::set_level(utils::log::Level::DEBUG);

    std::vector<std::string> messages;
    bool nested = false;
    utils::log::set_sink([&](utils::log::Level, const std::string& msg) {
        messages.push_back(msg);
        if (!nested) {
            nested = true;
            utils::log::debug("from sink");
        }
    });

    utils::log::info("outer");

    utils::log::set_sink(nullptr);
    utils::log::set_level(previous_level);

    REQUIRE(messages.size() == 2);
    CHECK(messages[0] == "outer");
    CHECK(messages[1] == "from sink");
}

TEST_CASE("Log: messages below the level are skipped", "[log]") {
    const auto previous_level = utils::log::get_level();
    utils::log::set_level(utils::log::Level::WARN);

    int calls = 0;
    utils::log::set_sink([&](utils::log::Level, const std::string&) { ++calls; });
    utils::log::info("quiet");
    utils::log::error("loud");

    utils::log::set_sink(nullptr);
    utils::log::set_level(previous_level);

    CHECK(calls == 1);
}
