#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

#include "sudoku_generator.hpp"

// Settings of sudoku_cli; a --config file fills them in, command-line options override
struct CliConfig {
    Difficulty difficulty = Difficulty::Medium;
    std::optional<uint32_t> seed;
    int steps = 20; // trace steps to print
    cv::utils::logging::LogLevel logLevel = cv::utils::logging::LOG_LEVEL_WARNING;
};

// "silent", "error", "warning", "info", "debug" or "verbose"; throws cv::Exception otherwise
cv::utils::logging::LogLevel parseLogLevel(std::string_view name);

// Keys difficulty, seed, steps and log_level; absent keys keep their current value
void applyConfig(const cv::FileNode& root, CliConfig& config);
CliConfig loadConfig(const std::string& path, CliConfig config = CliConfig());
