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

#ifndef DOCSTORE_STORE_STORE_FACADE_HPP
#define DOCSTORE_STORE_STORE_FACADE_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "core/engine.hpp"
#include "engine/engine_selector.hpp"

namespace docstore::store {

/**
 * @brief Engine-independent document store API.
 *
 * Validates caller input, binds an engine on first use and delegates.
 * Engine errors reach the caller unchanged.
 */
class StoreFacade {
public:
    explicit StoreFacade(config::StoreConfig config,
                         EngineFactories factories = EngineFactories::defaults());

    /// Collection names, sorted.
    std::vector<std::string> listCollections();

    /**
     * @brief Insert a document.
     *
     * @param fields Field values; may carry `_id`, `created_at` and
     * `updated_at`.
     * @return The id of the new document.
     * @throws ValidationError if the collection name or @p fields is empty.
     */
    std::string createDocument(const std::string& collection,
                               const Fields& fields);

    /**
     * @throws NotFoundError if no document has @p id.
     */
    Document getDocument(const std::string& collection, const std::string& id);

    /**
     * @brief Merge @p fields into a document and refresh its updated_at.
     *
     * @return 1 if the document exists, otherwise 0.
     * @throws ValidationError if @p fields names a reserved field.
     */
    std::size_t updateDocument(const std::string& collection,
                               const std::string& id, const Fields& fields);

    /// @return Number of documents removed (0 or 1).
    std::size_t deleteDocument(const std::string& collection,
                               const std::string& id);

    /**
     * @throws ValidationError if a sort key has an empty field or a zero
     * direction.
     */
    std::vector<Document> listDocuments(const std::string& collection,
                                        const QuerySpec& query = {},
                                        const SortSpec& sort = {},
                                        std::size_t limit = DEFAULT_LIST_LIMIT,
                                        std::size_t skip = 0);

    std::vector<Document> listDocuments(const std::string& collection,
                                        const ListOptions& options);

    std::size_t countDocuments(const std::string& collection,
                               const QuerySpec& query = {});

    /// Kind of the bound engine; binds one if needed.
    EngineKind engineKind();

    /// Close the bound engine; the next operation probes again.
    void close();

    [[nodiscard]] EngineSelector& selector() noexcept { return selector_; }

private:
    EngineSelector selector_;
};

}  // namespace docstore::store

#endif  // DOCSTORE_STORE_STORE_FACADE_HPP
