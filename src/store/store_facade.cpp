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

#include "store_facade.hpp"

#include "core/types.hpp"

namespace docstore::store {

namespace {

void requireCollection(const std::string& collection) {
    if (collection.empty()) {
        THROW_VALIDATION_ERROR("Collection name is required");
    }
}

void requireId(const std::string& id) {
    if (id.empty()) {
        THROW_VALIDATION_ERROR("Document id is required");
    }
}

void requireSort(const SortSpec& sort) {
    for (const auto& key : sort) {
        if (key.field.empty()) {
            THROW_VALIDATION_ERROR("Sort field name is required");
        }
        if (key.direction == 0) {
            THROW_VALIDATION_ERROR("Sort direction for '" + key.field +
                                   "' must be positive or negative");
        }
    }
}

}  // namespace

StoreFacade::StoreFacade(config::StoreConfig config, EngineFactories factories)
    : selector_(std::move(config), std::move(factories)) {}

std::vector<std::string> StoreFacade::listCollections() {
    return selector_.engine().listCollections();
}

std::string StoreFacade::createDocument(const std::string& collection,
                                        const Fields& fields) {
    requireCollection(collection);
    if (fields.empty()) {
        THROW_VALIDATION_ERROR("Document data is required");
    }
    return selector_.engine().createDocument(collection, fields);
}

Document StoreFacade::getDocument(const std::string& collection,
                                  const std::string& id) {
    requireCollection(collection);
    requireId(id);
    auto doc = selector_.engine().getDocument(collection, id);
    if (!doc) {
        THROW_NOT_FOUND_ERROR("Document '" + id + "' not found in '" +
                              collection + "'");
    }
    return std::move(*doc);
}

std::size_t StoreFacade::updateDocument(const std::string& collection,
                                        const std::string& id,
                                        const Fields& fields) {
    requireCollection(collection);
    requireId(id);
    for (const auto& [name, value] : fields) {
        if (isReservedField(name)) {
            THROW_VALIDATION_ERROR("Field '" + name +
                                   "' is managed by the store");
        }
    }
    return selector_.engine().updateDocument(collection, id, fields);
}

std::size_t StoreFacade::deleteDocument(const std::string& collection,
                                        const std::string& id) {
    requireCollection(collection);
    requireId(id);
    return selector_.engine().deleteDocument(collection, id);
}

std::vector<Document> StoreFacade::listDocuments(const std::string& collection,
                                                 const QuerySpec& query,
                                                 const SortSpec& sort,
                                                 std::size_t limit,
                                                 std::size_t skip) {
    return listDocuments(collection, ListOptions{query, sort, limit, skip});
}

std::vector<Document> StoreFacade::listDocuments(const std::string& collection,
                                                 const ListOptions& options) {
    requireCollection(collection);
    requireSort(options.sort);
    return selector_.engine().listDocuments(collection, options);
}

std::size_t StoreFacade::countDocuments(const std::string& collection,
                                        const QuerySpec& query) {
    requireCollection(collection);
    return selector_.engine().countDocuments(collection, query);
}

EngineKind StoreFacade::engineKind() { return selector_.engine().kind(); }

void StoreFacade::close() { selector_.close(); }

}  // namespace docstore::store
