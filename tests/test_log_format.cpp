#include <doctest/doctest.h>
#include <string>
#include <vector>
#include <sstream>

#include "draw2d/log/Log.h"

using namespace draw2d;

static std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        result.push_back(line);
    }
    return result;
}

static size_t columns(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

TEST_SUITE("Log") {
    TEST_CASE("priority names") {
        CHECK(std::string(log::priorityName(SDL_LOG_PRIORITY_INFO)) == "INFO");
        CHECK(std::string(log::priorityName(SDL_LOG_PRIORITY_WARN)) == "WARN");
        CHECK(std::string(log::priorityName(SDL_LOG_PRIORITY_ERROR)) == "ERROR");
        CHECK(std::string(log::categoryName(SDL_LOG_CATEGORY_APPLICATION)) == "app");
        CHECK(std::string(log::categoryName(SDL_LOG_CATEGORY_GPU)) == "gpu");
    }

    TEST_CASE("parsePriority accepts any case") {
        CHECK(log::parsePriority("trace") == SDL_LOG_PRIORITY_TRACE);
        CHECK(log::parsePriority("DEBUG") == SDL_LOG_PRIORITY_DEBUG);
        CHECK(log::parsePriority("Info") == SDL_LOG_PRIORITY_INFO);
        CHECK(log::parsePriority("warn") == SDL_LOG_PRIORITY_WARN);
        CHECK(log::parsePriority("error") == SDL_LOG_PRIORITY_ERROR);
        CHECK_FALSE(log::parsePriority("loud"));
        CHECK_FALSE(log::parsePriority(""));
    }

    TEST_CASE("the environment wins over the config") {
        CHECK(log::resolvePriority("error", "debug") == SDL_LOG_PRIORITY_ERROR);
        CHECK(log::resolvePriority(nullptr, "debug") == SDL_LOG_PRIORITY_DEBUG);
        CHECK(log::resolvePriority("", "warn") == SDL_LOG_PRIORITY_WARN);
        CHECK(log::resolvePriority("nonsense", "warn") == SDL_LOG_PRIORITY_WARN);
        CHECK(log::resolvePriority(nullptr, "nonsense") == SDL_LOG_PRIORITY_INFO);
    }

    TEST_CASE("short text gets the opening bracket only") {
        CHECK(log::wrap("hello world", 74) == "┏ hello world");
    }

    TEST_CASE("following lines get the continuation bracket") {
        const auto result = lines(log::wrap("first\nsecond\nthird", 74));
        REQUIRE(result.size() == 3);
        CHECK(result[0] == "┏ first");
        CHECK(result[1] == "┃ second");
        CHECK(result[2] == "┃ third");
    }

    TEST_CASE("long lines wrap at word boundaries within the width") {
        const std::string text = "the quick brown fox jumps over the lazy dog again and again";
        const auto result = lines(log::wrap(text, 20));
        REQUIRE(result.size() > 1);
        for (const auto& line : result) {
            CHECK(columns(line) <= 20);
        }
        CHECK(result[0] == "┏ the quick brown");
        CHECK(result[1].rfind("┃ fox", 0) == 0);
    }

    TEST_CASE("words longer than a line are split") {
        const auto result = lines(log::wrap(std::string(30, 'x'), 12));
        REQUIRE(result.size() == 3);
        CHECK(result[0] == "┏ " + std::string(10, 'x'));
        CHECK(result[1] == "┃ " + std::string(10, 'x'));
        CHECK(result[2] == "┃ " + std::string(10, 'x'));
    }

    TEST_CASE("lines that fit keep their spacing") {
        const auto result = lines(log::wrap("  | a    | b |", 74));
        REQUIRE(result.size() == 1);
        CHECK(result[0] == "┏   | a    | b |");
    }

    TEST_CASE("blank lines are kept") {
        const auto result = lines(log::wrap("a\n\nb", 74));
        REQUIRE(result.size() == 3);
        CHECK(result[1] == "┃ ");
    }

    TEST_CASE("formatRecord puts the header on its own line") {
        const std::string record = log::formatRecord(SDL_LOG_PRIORITY_WARN, SDL_LOG_CATEGORY_APPLICATION,
                                                     "12:03:55.123456", "swapchain out of date", 74);
        const auto result = lines(record);
        REQUIRE(result.size() == 2);
        CHECK(result[0] == "┏ WARN [12:03:55.123456] [app]");
        CHECK(result[1] == "┃ swapchain out of date");
    }

    TEST_CASE("timestamps are HH:MM:SS.ffffff") {
        const std::string timestamp = log::currentTimestamp();
        REQUIRE(timestamp.size() == 15);
        CHECK(timestamp[2] == ':');
        CHECK(timestamp[5] == ':');
        CHECK(timestamp[8] == '.');
    }

    TEST_CASE("output width never exceeds 74") {
        CHECK(log::outputWidth() <= 74);
        CHECK(log::outputWidth() > 0);
    }
}
