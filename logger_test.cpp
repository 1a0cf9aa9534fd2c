#include <doctest/doctest.h>
#include "logger.hpp"
#include <sstream>

using namespace baseobject;

TEST_SUITE("Logger") {

TEST_CASE("messages below the threshold are dropped") {
    std::ostringstream out;
    log::Logger logger("test", log::Level::warning, out);
    logger.setColoured(false);

    logger.info("hidden");
    logger.error("shown");

    auto const text = out.str();
    CHECK(text.find("hidden") == std::string::npos);
    CHECK(text.find("] - [ERROR] - [test] - shown\n") != std::string::npos);
    REQUIRE(text.size() > 21);
    CHECK(text.front() == '[');
    CHECK(text[20] == ']');
}

TEST_CASE("level names") {
    CHECK(log::levelName(log::Level::warning) == "WARNING");
    CHECK(log::parseLevel("debug") == log::Level::debug);
    CHECK(log::parseLevel("Critical") == log::Level::critical);
    CHECK(log::parseLevel("verbose") == log::Level::info);
    CHECK(log::parseLevel("verbose", log::Level::error) == log::Level::error);
}

TEST_CASE("macros skip formatting for disabled levels") {
    std::ostringstream out;
    log::Logger logger("test", log::Level::info, out);

    int evaluated = 0;
    auto expensive = [&evaluated] { ++evaluated; return "value"; };

    BASEOBJECT_LOG_DEBUG(logger, "debug " << expensive());
    CHECK(evaluated == 0);
    CHECK(out.str().empty());

    BASEOBJECT_LOG_INFO(logger, "info " << expensive());
    CHECK(evaluated == 1);
    CHECK(out.str().find("info value") != std::string::npos);
}

TEST_CASE("coloured output") {
    std::ostringstream out;
    log::Logger logger("colours", log::Level::silent, out);

    logger.critical("boom");
    CHECK(out.str().starts_with("\033[91m["));
    CHECK(out.str().find("\033[0m") != std::string::npos);

    logger.setName("renamed");
    logger.setLevel(log::Level::critical);
    CHECK_FALSE(logger.isEnabled(log::Level::error));
    CHECK(logger.name() == "renamed");
}

} // TEST_SUITE("Logger")
