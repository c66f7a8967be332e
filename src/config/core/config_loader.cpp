/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_loader.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

#include "exception.hpp"

namespace docstore::config {

auto loadConfigFile(const fs::path& path) -> json {
    std::ifstream ifs(path);
    if (!ifs) {
        spdlog::error("Failed to open config file: {}", path.string());
        THROW_CONFIG_IO_ERROR("Failed to open config file: " + path.string());
    }
    if (ifs.peek() == std::ifstream::traits_type::eof()) {
        spdlog::warn("Config file is empty: {}", path.string());
        return json::object();
    }

    json root;
    try {
        root = json::parse(ifs);
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse file: {}, error message: {}",
                      path.string(), e.what());
        THROW_INVALID_CONFIG_ERROR("Failed to parse config file " +
                                   path.string() + ": " + e.what());
    }
    if (!root.is_object()) {
        THROW_INVALID_CONFIG_ERROR("Config file " + path.string() +
                                   " must hold a JSON object");
    }

    spdlog::info("Config loaded from file: {}", path.string());
    return root;
}

}  // namespace docstore::config
