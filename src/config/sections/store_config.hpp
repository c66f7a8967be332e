/*
 * store_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Storage backend selection settings

**************************************************/

#ifndef DOCSTORE_CONFIG_SECTIONS_STORE_CONFIG_HPP
#define DOCSTORE_CONFIG_SECTIONS_STORE_CONFIG_HPP

#include <cstdlib>
#include <string>

#include "../core/config_section.hpp"

namespace docstore::config {

/**
 * @brief Connection descriptors for the storage engines
 *
 * An empty descriptor means the engine is not configured. With neither
 * configured the store keeps data in memory.
 *
 * @example
 * ```json
 * {
 *   "docstore": {
 *     "store": {
 *       "relationalUrl": "sqlite:///var/lib/docstore/data.db",
 *       "documentUri": "mongodb://localhost:27017",
 *       "documentDatabase": "docstore"
 *     }
 *   }
 * }
 * ```
 */
struct StoreConfig : ConfigSection<StoreConfig> {
    /// Configuration path in the config tree
    static constexpr std::string_view PATH = "/docstore/store";

    static constexpr const char* RELATIONAL_ENV = "DATABASE_URL";
    static constexpr const char* DOCUMENT_URI_ENV = "MONGO_URI";
    static constexpr const char* DOCUMENT_DATABASE_ENV = "MONGO_DB_NAME";

    std::string relationalUrl;                ///< SQLite path or sqlite:// URL
    std::string documentUri;                  ///< MongoDB connection string
    std::string documentDatabase{"docstore"};  ///< MongoDB database name

    [[nodiscard]] bool hasRelational() const noexcept {
        return !relationalUrl.empty();
    }

    [[nodiscard]] bool hasDocument() const noexcept {
        return !documentUri.empty();
    }

    /**
     * @brief Override descriptors from DATABASE_URL, MONGO_URI and
     * MONGO_DB_NAME; unset or empty variables leave values untouched.
     */
    void applyEnvironment() {
        auto overlay = [](const char* name, std::string& target) {
            if (const char* value = std::getenv(name);
                value != nullptr && *value != '\0') {
                target = value;
            }
        };
        overlay(RELATIONAL_ENV, relationalUrl);
        overlay(DOCUMENT_URI_ENV, documentUri);
        overlay(DOCUMENT_DATABASE_ENV, documentDatabase);
    }

    [[nodiscard]] json serialize() const {
        return {{"relationalUrl", relationalUrl},
                {"documentUri", documentUri},
                {"documentDatabase", documentDatabase}};
    }

    [[nodiscard]] static StoreConfig deserialize(const json& j) {
        StoreConfig cfg;
        cfg.relationalUrl = j.value("relationalUrl", cfg.relationalUrl);
        cfg.documentUri = j.value("documentUri", cfg.documentUri);
        cfg.documentDatabase =
            j.value("documentDatabase", cfg.documentDatabase);
        if (cfg.documentDatabase.empty()) {
            cfg.documentDatabase = "docstore";
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties",
             {{"relationalUrl", {{"type", "string"}, {"default", ""}}},
              {"documentUri", {{"type", "string"}, {"default", ""}}},
              {"documentDatabase",
               {{"type", "string"}, {"minLength", 1}, {"default", "docstore"}}}}}};
    }
};

}  // namespace docstore::config

#endif  // DOCSTORE_CONFIG_SECTIONS_STORE_CONFIG_HPP
