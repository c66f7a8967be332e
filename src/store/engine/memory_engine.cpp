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

#include "memory_engine.hpp"

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

#include "../core/types.hpp"

namespace docstore::store {

namespace {

bool containsId(const std::vector<Document>& documents, const std::string& id) {
    return std::any_of(documents.begin(), documents.end(),
                       [&id](const Document& doc) { return doc.id == id; });
}

}  // namespace

//------------------------------------------------------------------------------
// MemoryEngine Implementation
//------------------------------------------------------------------------------

MemoryEngine::Collection* MemoryEngine::find(const std::string& collection) {
    auto it = collections_.find(collection);
    return it == collections_.end() ? nullptr : &it->second;
}

std::string MemoryEngine::mintId(Collection& coll) {
    std::string id;
    do {
        id = std::to_string(coll.nextId++);
    } while (containsId(coll.documents, id));
    return id;
}

std::vector<std::string> MemoryEngine::listCollections() {
    std::vector<std::string> names;
    names.reserve(collections_.size());
    for (const auto& [name, coll] : collections_) {
        names.push_back(name);
    }
    return names;
}

std::string MemoryEngine::createDocument(const std::string& collection,
                                         const Fields& fields) {
    Document doc;
    doc.fields = fields;
    DocumentMeta meta = extractMeta(doc.fields);

    auto& coll = collections_[collection];
    if (meta.id) {
        if (containsId(coll.documents, *meta.id)) {
            THROW_BACKEND_OPERATION_ERROR("Duplicate _id '" + *meta.id +
                                          "' in collection '" + collection +
                                          "'");
        }
        doc.id = *meta.id;
    } else {
        doc.id = mintId(coll);
    }

    auto now = currentTimestamp();
    doc.createdAt = meta.createdAt.value_or(now);
    doc.updatedAt = std::max(meta.updatedAt.value_or(now), doc.createdAt);

    coll.documents.push_back(std::move(doc));
    spdlog::debug("Inserted document {} into memory collection {}",
                  coll.documents.back().id, collection);
    return coll.documents.back().id;
}

std::optional<Document> MemoryEngine::getDocument(const std::string& collection,
                                                  const std::string& id) {
    auto* coll = find(collection);
    if (!coll) {
        return std::nullopt;
    }
    for (const auto& doc : coll->documents) {
        if (doc.id == id) {
            return doc;
        }
    }
    return std::nullopt;
}

std::size_t MemoryEngine::updateDocument(const std::string& collection,
                                         const std::string& id,
                                         const Fields& fields) {
    auto* coll = find(collection);
    if (!coll) {
        return 0;
    }
    for (auto& doc : coll->documents) {
        if (doc.id != id) {
            continue;
        }
        for (const auto& [name, value] : fields) {
            doc.fields[name] = value;
        }
        doc.updatedAt = std::max(currentTimestamp(), doc.updatedAt);
        return 1;
    }
    return 0;
}

std::size_t MemoryEngine::deleteDocument(const std::string& collection,
                                         const std::string& id) {
    auto* coll = find(collection);
    if (!coll) {
        return 0;
    }
    auto removed = std::erase_if(
        coll->documents, [&id](const Document& doc) { return doc.id == id; });
    return static_cast<std::size_t>(removed);
}

std::vector<Document> MemoryEngine::listDocuments(
    const std::string& collection, const ListOptions& options) {
    std::vector<Document> results;
    auto* coll = find(collection);
    if (!coll) {
        return results;
    }

    std::copy_if(coll->documents.begin(), coll->documents.end(),
                 std::back_inserter(results), [&options](const Document& doc) {
                     return matchesQuery(doc, options.query);
                 });

    for (auto key = options.sort.rbegin(); key != options.sort.rend(); ++key) {
        const std::string& field = key->field;
        const bool descending = key->direction < 0;
        std::stable_sort(
            results.begin(), results.end(),
            [&field, descending](const Document& lhs, const Document& rhs) {
                Value left = fieldOf(lhs, field).value_or(Value{});
                Value right = fieldOf(rhs, field).value_or(Value{});
                int order = left.compare(right);
                return descending ? order > 0 : order < 0;
            });
    }

    if (options.skip >= results.size()) {
        return {};
    }
    auto first = results.begin() + static_cast<std::ptrdiff_t>(options.skip);
    std::size_t available = results.size() - options.skip;
    std::size_t take = std::min(options.limit, available);
    return std::vector<Document>(first,
                                 first + static_cast<std::ptrdiff_t>(take));
}

std::size_t MemoryEngine::countDocuments(const std::string& collection,
                                         const QuerySpec& query) {
    auto* coll = find(collection);
    if (!coll) {
        return 0;
    }
    return static_cast<std::size_t>(
        std::count_if(coll->documents.begin(), coll->documents.end(),
                      [&query](const Document& doc) {
                          return matchesQuery(doc, query);
                      }));
}

void MemoryEngine::close() {
    spdlog::debug("Dropping {} in-memory collections", collections_.size());
    collections_.clear();
}

}  // namespace docstore::store
