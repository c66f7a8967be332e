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

#ifndef DOCSTORE_STORE_ENGINE_RELATIONAL_ENGINE_HPP
#define DOCSTORE_STORE_ENGINE_RELATIONAL_ENGINE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "../core/engine.hpp"
#include "schema.hpp"

namespace docstore::store {

namespace sqlite {
class Database;
class Statement;
}  // namespace sqlite

namespace query {
class QueryBuilder;
}  // namespace query

/**
 * @brief Storage engine backed by an SQLite database.
 *
 * Each collection is a table whose columns are inferred from the first
 * document written to it. Every mutation runs in its own transaction.
 */
class RelationalEngine : public StorageEngine {
public:
    /**
     * @brief Open the database named by @p descriptor.
     *
     * @param descriptor A file path, optionally prefixed with `sqlite://`,
     * or `:memory:`.
     * @throws BackendUnavailableError if the database cannot be opened.
     */
    explicit RelationalEngine(const std::string& descriptor);
    ~RelationalEngine() override;

    RelationalEngine(const RelationalEngine&) = delete;
    RelationalEngine& operator=(const RelationalEngine&) = delete;

    /**
     * @brief Strip the optional `sqlite://` scheme from a descriptor.
     */
    [[nodiscard]] static std::string databasePath(std::string_view descriptor);

    [[nodiscard]] EngineKind kind() const noexcept override {
        return EngineKind::Relational;
    }

    std::vector<std::string> listCollections() override;

    /**
     * @brief Insert a document, creating the table on first write.
     *
     * @throws ValidationError if a collection or field name is not an
     * identifier, the fields name columns the table lacks, or the table has
     * a non-integer `_id` and none was supplied.
     * @throws BackendOperationError if the insert fails (duplicate `_id`,
     * type mismatch on the identity column, I/O errors).
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

    std::vector<Document> listDocuments(const std::string& collection,
                                        const ListOptions& options) override;

    std::size_t countDocuments(const std::string& collection,
                               const QuerySpec& query) override;

    void close() override;

    /**
     * @brief Cached or freshly loaded schema of a collection table.
     *
     * @return nullopt if the table does not exist.
     */
    std::optional<TableSchema> describe(const std::string& collection);

private:
    std::unique_ptr<sqlite::Database> db_;
    std::map<std::string, TableSchema> schemas_;
    std::mutex mutex_;

    sqlite::Database& database();
    const TableSchema* findSchema(const std::string& table);
    const TableSchema& ensureTable(const std::string& table,
                                   const Fields& fields,
                                   const std::optional<Value>& id);

    /// Add the query predicates; false if the query names a missing column.
    static bool applyQuery(query::QueryBuilder& builder,
                           const TableSchema& schema, const QuerySpec& query);

    static Document readDocument(const sqlite::Statement& stmt,
                                 const TableSchema& schema);

    template <typename Func>
    auto guarded(std::string_view operation, Func&& func);
};

}  // namespace docstore::store

#endif  // DOCSTORE_STORE_ENGINE_RELATIONAL_ENGINE_HPP
