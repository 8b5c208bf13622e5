#include "cli_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

using cv::utils::logging::LogLevel;

LogLevel parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "silent") return cv::utils::logging::LOG_LEVEL_SILENT;
    if (lower == "error") return cv::utils::logging::LOG_LEVEL_ERROR;
    if (lower == "warning") return cv::utils::logging::LOG_LEVEL_WARNING;
    if (lower == "info") return cv::utils::logging::LOG_LEVEL_INFO;
    if (lower == "debug") return cv::utils::logging::LOG_LEVEL_DEBUG;
    if (lower == "verbose") return cv::utils::logging::LOG_LEVEL_VERBOSE;
    CV_Error(cv::Error::StsBadArg, "unknown log level '" + lower + "'");
}

namespace {

// FileStorage keeps integers as int, so seeds above INT_MAX are written as a
// real (4000000000.0) or a string ("4000000000")
uint32_t parseSeed(const cv::FileNode& node) {
    const char* message = "seed must be an integer in [0, 4294967295]";
    if (node.isInt()) {
        if ((int)node < 0) CV_Error(cv::Error::StsParseError, message);
        return static_cast<uint32_t>((int)node);
    }
    if (node.isReal()) {
        double value = (double)node;
        if (value < 0 || value > std::numeric_limits<uint32_t>::max() || std::floor(value) != value)
            CV_Error(cv::Error::StsParseError, message);
        return static_cast<uint32_t>(value);
    }
    if (node.isString()) {
        std::string text = (std::string)node;
        uint32_t value = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || end != text.data() + text.size())
            CV_Error(cv::Error::StsParseError, message);
        return value;
    }
    CV_Error(cv::Error::StsParseError, message);
}

} // namespace

void applyConfig(const cv::FileNode& root, CliConfig& config) {
    cv::FileNode node = root["difficulty"];
    if (!node.empty()) {
        if (!node.isString()) CV_Error(cv::Error::StsParseError, "difficulty must be a string");
        config.difficulty = parseDifficulty((std::string)node);
    }

    node = root["seed"];
    if (!node.empty()) {
        config.seed = parseSeed(node);
    }

    node = root["steps"];
    if (!node.empty()) {
        if (!node.isInt() || (int)node < 0) CV_Error(cv::Error::StsParseError, "steps must be a non-negative integer");
        config.steps = (int)node;
    }

    node = root["log_level"];
    if (!node.empty()) {
        if (!node.isString()) CV_Error(cv::Error::StsParseError, "log_level must be a string");
        config.logLevel = parseLogLevel((std::string)node);
    }
}

CliConfig loadConfig(const std::string& path, CliConfig config) {
    cv::FileStorage storage(path, cv::FileStorage::READ);
    if (!storage.isOpened())
        CV_Error(cv::Error::StsObjectNotFound, "could not open config file " + path);
    applyConfig(storage.root(), config);
    return config;
}
