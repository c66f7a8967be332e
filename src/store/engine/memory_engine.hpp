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

#ifndef DOCSTORE_STORE_ENGINE_MEMORY_ENGINE_HPP
#define DOCSTORE_STORE_ENGINE_MEMORY_ENGINE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "../core/engine.hpp"

namespace docstore::store {

/**
 * @brief Process-local storage engine; data does not survive the process.
 *
 * Documents are kept per collection in insertion order. Ids are minted from
 * a per-collection counter starting at 1. Not synchronized: callers sharing
 * one instance across threads must serialize access themselves.
 */
class MemoryEngine : public StorageEngine {
public:
    MemoryEngine() = default;

    [[nodiscard]] EngineKind kind() const noexcept override {
        return EngineKind::Memory;
    }

    std::vector<std::string> listCollections() override;

    /**
     * @brief Append a copy of @p fields as a new document.
     *
     * @throws BackendOperationError if a caller supplied `_id` is already
     * used in the collection.
     */
    std::string createDocument(const std::string& collection,
                               const Fields& fields) override;

    std::optional<Document> getDocument(const std::string& collection,
                                        const std::string& id) override;

    std::size_t updateDocument(const std::string& collection,
                               const std::string& id,
                               const Fields& fields) override;

    std::size_t deleteDocument(const std::string& collection,
                               const std::string& id) override;

    /**
     * @brief Filter, then sort, then apply skip and limit.
     *
     * Sort keys are applied last to first, each as a stable sort on a single
     * key, so earlier keys take precedence and ties keep insertion order.
     */
    std::vector<Document> listDocuments(const std::string& collection,
                                        const ListOptions& options) override;

    std::size_t countDocuments(const std::string& collection,
                               const QuerySpec& query) override;

    /// Drops every collection.
    void close() override;

private:
    struct Collection {
        std::vector<Document> documents;
        int64_t nextId{1};
    };

    std::map<std::string, Collection> collections_;

    Collection* find(const std::string& collection);
    std::string mintId(Collection& coll);
};

}  // namespace docstore::store

#endif  // DOCSTORE_STORE_ENGINE_MEMORY_ENGINE_HPP
