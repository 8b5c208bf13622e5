#include <catch2/catch_test_macros.hpp>

#include <opencv2/core.hpp>

#include "cli_config.hpp"

static CliConfig applyJson(const std::string& json, CliConfig config = CliConfig()) {
    cv::FileStorage storage(json, cv::FileStorage::READ | cv::FileStorage::MEMORY);
    applyConfig(storage.root(), config);
    return config;
}

TEST_CASE("defaults", "[config]") {
    CliConfig config;
    CHECK(config.difficulty == Difficulty::Medium);
    CHECK_FALSE(config.seed.has_value());
    CHECK(config.steps == 20);
    CHECK(config.logLevel == cv::utils::logging::LOG_LEVEL_WARNING);
}

TEST_CASE("every key is read", "[config]") {
    CliConfig config = applyJson(R"({ "difficulty": "hard", "seed": 42, "steps": 5, "log_level": "debug" })");

    CHECK(config.difficulty == Difficulty::Hard);
    REQUIRE(config.seed.has_value());
    CHECK(*config.seed == 42u);
    CHECK(config.steps == 5);
    CHECK(config.logLevel == cv::utils::logging::LOG_LEVEL_DEBUG);
}

TEST_CASE("absent keys keep their value", "[config]") {
    CliConfig base;
    base.steps = 100;
    base.seed = 7u;

    CliConfig config = applyJson(R"({ "difficulty": "easy" })", base);
    CHECK(config.difficulty == Difficulty::Easy);
    CHECK(config.steps == 100);
    CHECK(*config.seed == 7u);
}

TEST_CASE("seeds span the unsigned range", "[config]") {
    CliConfig config = applyJson(R"({ "seed": 4000000000.0 })");
    REQUIRE(config.seed.has_value());
    CHECK(*config.seed == 4000000000u);

    config = applyJson(R"({ "seed": "4294967295" })");
    CHECK(*config.seed == 4294967295u);

    config = applyJson(R"({ "seed": "12" })");
    CHECK(*config.seed == 12u);

    CHECK_THROWS_AS(applyJson(R"({ "seed": 4294967296.0 })"), cv::Exception);
    CHECK_THROWS_AS(applyJson(R"({ "seed": "4294967296" })"), cv::Exception);
    CHECK_THROWS_AS(applyJson(R"({ "seed": 1.5 })"), cv::Exception);
    CHECK_THROWS_AS(applyJson(R"({ "seed": "-3" })"), cv::Exception);
}

TEST_CASE("bad values are rejected", "[config]") {
    CHECK_THROWS_AS(applyJson(R"({ "difficulty": "expert" })"), cv::Exception);
    CHECK_THROWS_AS(applyJson(R"({ "difficulty": 3 })"), cv::Exception);
    CHECK_THROWS_AS(applyJson(R"({ "seed": -1 })"), cv::Exception);
    CHECK_THROWS_AS(applyJson(R"({ "steps": "all" })"), cv::Exception);
    CHECK_THROWS_AS(applyJson(R"({ "log_level": "loud" })"), cv::Exception);
}

TEST_CASE("log level names", "[config]") {
    CHECK(parseLogLevel("silent") == cv::utils::logging::LOG_LEVEL_SILENT);
    CHECK(parseLogLevel("Warning") == cv::utils::logging::LOG_LEVEL_WARNING);
    CHECK(parseLogLevel("INFO") == cv::utils::logging::LOG_LEVEL_INFO);
    CHECK_THROWS_AS(parseLogLevel("trace"), cv::Exception);
}

TEST_CASE("missing config file", "[config]") {
    CHECK_THROWS_AS(loadConfig("/nonexistent/sudoku_cli.yml"), cv::Exception);
}
