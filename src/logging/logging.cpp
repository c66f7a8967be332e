/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace docstore::logging {

auto toSpdlogLevel(config::LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case config::LogLevel::Trace: return spdlog::level::trace;
        case config::LogLevel::Debug: return spdlog::level::debug;
        case config::LogLevel::Info: return spdlog::level::info;
        case config::LogLevel::Warn: return spdlog::level::warn;
        case config::LogLevel::Error: return spdlog::level::err;
        case config::LogLevel::Critical: return spdlog::level::critical;
        case config::LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

void initialize(const config::LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinkList;

    if (config.enableConsole) {
        spdlog::sink_ptr console;
        if (config.consoleColor) {
            console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else {
            console = std::make_shared<spdlog::sinks::stderr_sink_mt>();
        }
        console->set_level(toSpdlogLevel(config.consoleLevel));
        sinkList.push_back(console);
    }

    std::string fileProblem;
    if (config.enableFile) {
        std::filesystem::path dir(config.logDir);
        auto file = dir / (config.logFilename + ".log");
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            fileProblem = "cannot create " + dir.string() + ": " + ec.message();
        } else {
            try {
                auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    file.string());
                sink->set_level(toSpdlogLevel(config.fileLevel));
                sinkList.push_back(sink);
            } catch (const spdlog::spdlog_ex& e) {
                fileProblem = e.what();
            }
        }
    }

    auto defaultLogger = std::make_shared<spdlog::logger>(
        "docstore", sinkList.begin(), sinkList.end());

    // Logger level is the most verbose sink level; sinks filter the rest
    auto level = spdlog::level::off;
    for (const auto& sink : sinkList) {
        level = std::min(level, sink->level());
    }
    defaultLogger->set_level(level);
    defaultLogger->set_pattern(config.pattern);

    spdlog::set_default_logger(defaultLogger);

    if (!fileProblem.empty()) {
        spdlog::warn("File logging disabled: {}", fileProblem);
    }
}

void flush() { spdlog::default_logger()->flush(); }

}  // namespace docstore::logging
