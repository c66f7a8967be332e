/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Console and file sink settings for the docstore logger

**************************************************/

#ifndef DOCSTORE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define DOCSTORE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <utility>

#include "../core/config_section.hpp"

namespace docstore::config {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, Off };

namespace detail {

// First spelling of each level is the canonical one.
inline constexpr std::array<std::pair<std::string_view, LogLevel>, 12>
    LOG_LEVEL_NAMES{{{"trace", LogLevel::Trace},
                     {"debug", LogLevel::Debug},
                     {"info", LogLevel::Info},
                     {"warn", LogLevel::Warn},
                     {"warning", LogLevel::Warn},
                     {"error", LogLevel::Error},
                     {"err", LogLevel::Error},
                     {"critical", LogLevel::Critical},
                     {"fatal", LogLevel::Critical},
                     {"off", LogLevel::Off},
                     {"none", LogLevel::Off},
                     {"information", LogLevel::Info}}};

}  // namespace detail

[[nodiscard]] inline std::string logLevelToString(LogLevel level) {
    auto it = std::find_if(
        detail::LOG_LEVEL_NAMES.begin(), detail::LOG_LEVEL_NAMES.end(),
        [level](const auto& entry) { return entry.second == level; });
    return std::string(it != detail::LOG_LEVEL_NAMES.end() ? it->first
                                                           : "info");
}

/// Unknown names fall back to Info.
[[nodiscard]] inline LogLevel logLevelFromString(std::string_view name) {
    for (const auto& [spelling, level] : detail::LOG_LEVEL_NAMES) {
        if (spelling == name) {
            return level;
        }
    }
    return LogLevel::Info;
}

/**
 * @brief Settings for the default logger
 *
 * @example
 * ```json
 * {
 *   "docstore": {
 *     "logging": {
 *       "consoleLevel": "info",
 *       "enableFile": true,
 *       "logDir": "logs",
 *       "fileLevel": "debug"
 *     }
 *   }
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "/docstore/logging";

    bool enableConsole{true};
    LogLevel consoleLevel{LogLevel::Info};
    bool consoleColor{true};  ///< stderr sink with ANSI colors

    bool enableFile{false};
    std::string logDir{"logs"};
    std::string logFilename{"docstore"};  ///< ".log" is appended
    LogLevel fileLevel{LogLevel::Debug};

    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};

    [[nodiscard]] json serialize() const {
        return {{"enableConsole", enableConsole},
                {"consoleLevel", logLevelToString(consoleLevel)},
                {"consoleColor", consoleColor},
                {"enableFile", enableFile},
                {"logDir", logDir},
                {"logFilename", logFilename},
                {"fileLevel", logLevelToString(fileLevel)},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        auto level = [&j](const char* key, LogLevel fallback) {
            return j.contains(key)
                       ? logLevelFromString(j.at(key).get<std::string>())
                       : fallback;
        };

        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = level("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = level("fileLevel", cfg.fileLevel);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json levels = json::array();
        for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                           LogLevel::Warn, LogLevel::Error, LogLevel::Critical,
                           LogLevel::Off}) {
            levels.push_back(logLevelToString(level));
        }
        auto text = [](const char* fallback) {
            return json{{"type", "string"}, {"default", fallback}};
        };
        auto flag = [](bool fallback) {
            return json{{"type", "boolean"}, {"default", fallback}};
        };
        return {{"type", "object"},
                {"properties",
                 {{"enableConsole", flag(true)},
                  {"consoleLevel",
                   {{"type", "string"}, {"enum", levels}, {"default", "info"}}},
                  {"consoleColor", flag(true)},
                  {"enableFile", flag(false)},
                  {"logDir", text("logs")},
                  {"logFilename", text("docstore")},
                  {"fileLevel",
                   {{"type", "string"}, {"enum", levels}, {"default", "debug"}}},
                  {"pattern", {{"type", "string"}}}}}};
    }
};

}  // namespace docstore::config

#endif  // DOCSTORE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
