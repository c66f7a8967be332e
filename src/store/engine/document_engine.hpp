// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Docstore - A polymorphic document store
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef DOCSTORE_STORE_ENGINE_DOCUMENT_ENGINE_HPP
#define DOCSTORE_STORE_ENGINE_DOCUMENT_ENGINE_HPP

#ifdef DOCSTORE_HAS_MONGOCXX

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "../core/engine.hpp"

namespace docstore::store {

/**
 * @brief Storage engine backed by a MongoDB database.
 *
 * Collections map to native collections. Native `_id` values are exposed
 * as strings: ObjectIds as 24 hex digits, integers in decimal.
 * Timestamps are stored as BSON dates and lose sub-millisecond precision.
 */
class DocumentEngine : public StorageEngine {
public:
    /**
     * @brief Connect and ping the server.
     *
     * @param uri MongoDB connection string.
     * @param databaseName Logical database holding the collections.
     * @throws BackendUnavailableError if the client cannot be created or the
     * ping fails.
     */
    DocumentEngine(const std::string& uri, const std::string& databaseName);
    ~DocumentEngine() override;

    DocumentEngine(const DocumentEngine&) = delete;
    DocumentEngine& operator=(const DocumentEngine&) = delete;

    [[nodiscard]] EngineKind kind() const noexcept override {
        return EngineKind::Document;
    }

    std::vector<std::string> listCollections() override;

    std::string createDocument(const std::string& collection,
                               const Fields& fields) override;

    std::optional<Document> getDocument(const std::string& collection,
                                        const std::string& id) override;

    std::size_t updateDocument(const std::string& collection,
                               const std::string& id,
                               const Fields& fields) override;

    std::size_t deleteDocument(const std::string& collection,
                               const std::string& id) override;

    std::vector<Document> listDocuments(const std::string& collection,
                                        const ListOptions& options) override;

    std::size_t countDocuments(const std::string& collection,
                               const QuerySpec& query) override;

    void close() override;

private:
    struct Connection;

    std::unique_ptr<Connection> conn_;
    std::string databaseName_;
    std::mutex mutex_;

    Connection& connection();

    template <typename Func>
    auto guarded(std::string_view operation, Func&& func);
};

}  // namespace docstore::store

#endif  // DOCSTORE_HAS_MONGOCXX

#endif  // DOCSTORE_STORE_ENGINE_DOCUMENT_ENGINE_HPP
