/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Loading of JSON configuration documents from disk

**************************************************/

#ifndef DOCSTORE_CONFIG_CORE_CONFIG_LOADER_HPP
#define DOCSTORE_CONFIG_CORE_CONFIG_LOADER_HPP

#include <filesystem>

#include "config_section.hpp"

namespace docstore::config {

namespace fs = std::filesystem;

/**
 * @brief Read and parse a JSON configuration document.
 *
 * @param path File to read.
 * @return The document root; an empty file yields an empty object.
 * @throws ConfigIoError if the file cannot be opened.
 * @throws InvalidConfigError if the content is not valid JSON or the root
 * is not an object.
 */
[[nodiscard]] json loadConfigFile(const fs::path& path);

}  // namespace docstore::config

#endif  // DOCSTORE_CONFIG_CORE_CONFIG_LOADER_HPP
