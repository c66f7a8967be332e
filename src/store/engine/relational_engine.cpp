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

#include "relational_engine.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "../core/types.hpp"
#include "../query/query_builder.hpp"
#include "../sqlite/database.hpp"
#include "../sqlite/statement.hpp"
#include "../sqlite/transaction.hpp"

namespace docstore::store {

using query::QueryBuilder;

namespace {

constexpr std::string_view SQLITE_SCHEME = "sqlite://";

// Ties in ORDER BY fall back to insertion order
constexpr std::string_view ROWID_COLUMN = "rowid";

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty())
            joined += ", ";
        joined += name;
    }
    return joined;
}

void requireCellTypes(const std::string& collection, const TableSchema& schema,
                      const Fields& fields) {
    auto mismatched = schema.mismatchedColumns(fields);
    if (!mismatched.empty()) {
        THROW_VALIDATION_ERROR("Collection '" + collection +
                               "' cannot store field(s): " +
                               joinNames(mismatched));
    }
}

void requireFieldNames(const Fields& fields) {
    for (const auto& [name, value] : fields) {
        requireIdentifier(name, "field");
    }
}

}  // namespace

//------------------------------------------------------------------------------
// RelationalEngine Implementation
//------------------------------------------------------------------------------

RelationalEngine::RelationalEngine(const std::string& descriptor) {
    std::string path = databasePath(descriptor);
    if (path.empty()) {
        THROW_BACKEND_UNAVAILABLE_ERROR("Empty SQLite database path");
    }
    try {
        db_ = std::make_unique<sqlite::Database>(path);
    } catch (const std::exception& e) {
        THROW_BACKEND_UNAVAILABLE_ERROR("Cannot connect to SQLite database '" +
                                        path + "': " + e.what());
    }
    spdlog::info("Relational engine connected to {}", path);
}

RelationalEngine::~RelationalEngine() = default;

std::string RelationalEngine::databasePath(std::string_view descriptor) {
    if (descriptor.starts_with(SQLITE_SCHEME)) {
        descriptor.remove_prefix(SQLITE_SCHEME.size());
    }
    return std::string(descriptor);
}

template <typename Func>
auto RelationalEngine::guarded(std::string_view operation, Func&& func) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return func();
    } catch (const ValidationError&) {
        throw;
    } catch (const BackendOperationError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Relational {} failed: {}", operation, e.what());
        THROW_BACKEND_OPERATION_ERROR("Relational " + std::string(operation) +
                                      " failed: " + e.what());
    }
}

sqlite::Database& RelationalEngine::database() {
    if (!db_) {
        THROW_BACKEND_OPERATION_ERROR("Relational engine is closed");
    }
    return *db_;
}

const TableSchema* RelationalEngine::findSchema(const std::string& table) {
    if (auto it = schemas_.find(table); it != schemas_.end()) {
        return &it->second;
    }
    if (!database().tableExists(table)) {
        return nullptr;
    }
    auto loaded = TableSchema::load(database(), table);
    if (!loaded) {
        return nullptr;
    }
    return &schemas_.insert_or_assign(table, std::move(*loaded)).first->second;
}

const TableSchema& RelationalEngine::ensureTable(
    const std::string& table, const Fields& fields,
    const std::optional<Value>& id) {
    if (const auto* existing = findSchema(table)) {
        return *existing;
    }

    auto schema = TableSchema::infer(table, fields, id);
    database().execute(schema.createTableSql());
    spdlog::info("Created table {} with {} inferred columns", table,
                 schema.columns().size());
    return schemas_.insert_or_assign(table, std::move(schema)).first->second;
}

std::optional<TableSchema> RelationalEngine::describe(
    const std::string& collection) {
    requireIdentifier(collection, "collection");
    return guarded("describe", [&]() -> std::optional<TableSchema> {
        const auto* schema = findSchema(collection);
        if (!schema) {
            return std::nullopt;
        }
        return *schema;
    });
}

bool RelationalEngine::applyQuery(QueryBuilder& builder,
                                  const TableSchema& schema,
                                  const QuerySpec& query) {
    for (const auto& [name, expected] : query) {
        auto type = schema.columnType(name);
        if (!type) {
            return false;
        }
        if (name == ID_FIELD) {
            builder.whereEquals(name, expected);
            continue;
        }
        // A value the column cannot hold never matches
        if (!columnAccepts(*type, expected)) {
            return false;
        }
        builder.whereEquals(name, encodeCell(*type, expected));
    }
    return true;
}

Document RelationalEngine::readDocument(const sqlite::Statement& stmt,
                                        const TableSchema& schema) {
    Document doc;
    for (int i = 0; i < stmt.getColumnCount(); ++i) {
        std::string name = stmt.getColumnName(i);
        if (name == ID_FIELD) {
            doc.id = stmt.getText(i);
        } else if (name == CREATED_AT_FIELD || name == UPDATED_AT_FIELD) {
            auto ts = parseTimestamp(stmt.getText(i));
            (name == CREATED_AT_FIELD ? doc.createdAt : doc.updatedAt) =
                ts.value_or(Timestamp{});
        } else {
            auto declared = schema.columnType(name).value_or(ColumnType::Text);
            doc.fields.emplace(std::move(name), readValue(stmt, i, declared));
        }
    }
    return doc;
}

std::vector<std::string> RelationalEngine::listCollections() {
    return guarded("listCollections", [&]() {
        auto stmt = database().prepare(
            "SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT "
            "LIKE 'sqlite_%' ORDER BY name");
        std::vector<std::string> names;
        while (stmt->step()) {
            names.push_back(stmt->getText(0));
        }
        return names;
    });
}

std::string RelationalEngine::createDocument(const std::string& collection,
                                             const Fields& fields) {
    requireIdentifier(collection, "collection");

    Fields values = fields;
    std::optional<Value> rawId;
    if (auto it = values.find(std::string(ID_FIELD)); it != values.end()) {
        rawId = it->second;
    }
    DocumentMeta meta = extractMeta(values);
    requireFieldNames(values);

    return guarded("create", [&]() {
        auto& db = database();
        auto txn = db.beginTransaction(sqlite::TransactionMode::Immediate);
        try {
            const auto& schema = ensureTable(collection, values, rawId);

            auto unknown = schema.unknownColumns(values);
            if (!unknown.empty()) {
                THROW_VALIDATION_ERROR("Collection '" + collection +
                                       "' has no column for field(s): " +
                                       joinNames(unknown));
            }
            requireCellTypes(collection, schema, values);
            if (!meta.id && !schema.autoId()) {
                THROW_VALIDATION_ERROR("Collection '" + collection +
                                       "' requires an explicit _id");
            }

            auto now = currentTimestamp();
            Timestamp createdAt = meta.createdAt.value_or(now);
            Timestamp updatedAt =
                std::max(meta.updatedAt.value_or(now), createdAt);

            std::vector<std::string> columns;
            std::vector<Value> params;
            if (rawId) {
                columns.emplace_back(ID_FIELD);
                params.push_back(*rawId);
            }
            for (const auto& [name, value] : values) {
                columns.push_back(name);
                params.push_back(encodeCell(*schema.columnType(name), value));
            }
            columns.emplace_back(CREATED_AT_FIELD);
            params.emplace_back(createdAt);
            columns.emplace_back(UPDATED_AT_FIELD);
            params.emplace_back(updatedAt);

            std::string sql = "INSERT INTO " +
                              QueryBuilder::quoteIdentifier(collection) + " (";
            std::string placeholders;
            for (std::size_t i = 0; i < columns.size(); ++i) {
                if (i > 0) {
                    sql += ", ";
                    placeholders += ", ";
                }
                sql += QueryBuilder::quoteIdentifier(columns[i]);
                placeholders += "?";
            }
            sql += ") VALUES (" + placeholders + ")";

            auto stmt = db.prepare(sql);
            stmt->bindAll(params).execute();

            std::string id =
                meta.id ? *meta.id : std::to_string(db.lastInsertRowId());
            txn->commit();
            spdlog::debug("Inserted document {} into table {}", id,
                          collection);
            return id;
        } catch (...) {
            // Table creation is rolled back with the insert
            schemas_.erase(collection);
            throw;
        }
    });
}

std::optional<Document> RelationalEngine::getDocument(
    const std::string& collection, const std::string& id) {
    requireIdentifier(collection, "collection");
    return guarded("get", [&]() -> std::optional<Document> {
        const auto* schema = findSchema(collection);
        if (!schema) {
            return std::nullopt;
        }
        QueryBuilder builder(collection);
        builder.whereEquals(std::string(ID_FIELD), Value{id}).limit(1);

        auto stmt = database().prepare(builder.build());
        stmt->bindValue(1, builder.getParamValues().front());
        if (!stmt->step()) {
            return std::nullopt;
        }
        return readDocument(*stmt, *schema);
    });
}

std::size_t RelationalEngine::updateDocument(const std::string& collection,
                                             const std::string& id,
                                             const Fields& fields) {
    requireIdentifier(collection, "collection");
    requireFieldNames(fields);

    return guarded("update", [&]() -> std::size_t {
        const auto* schema = findSchema(collection);
        if (!schema) {
            return 0;
        }
        auto unknown = schema->unknownColumns(fields);
        if (!unknown.empty()) {
            THROW_VALIDATION_ERROR("Collection '" + collection +
                                   "' has no column for field(s): " +
                                   joinNames(unknown));
        }
        requireCellTypes(collection, *schema, fields);

        std::string sql =
            "UPDATE " + QueryBuilder::quoteIdentifier(collection) + " SET ";
        for (const auto& [name, value] : fields) {
            sql += QueryBuilder::quoteIdentifier(name) + " = ?, ";
        }
        // Fixed-width timestamp text orders chronologically
        const auto updatedAt = QueryBuilder::quoteIdentifier(UPDATED_AT_FIELD);
        sql += updatedAt + " = MAX(COALESCE(" + updatedAt + ", ''), ?) WHERE " +
               QueryBuilder::quoteIdentifier(ID_FIELD) + " = ?";

        auto& db = database();
        auto txn = db.beginTransaction(sqlite::TransactionMode::Immediate);
        auto stmt = db.prepare(sql);
        int index = 1;
        for (const auto& [name, value] : fields) {
            stmt->bindValue(index++,
                            encodeCell(*schema->columnType(name), value));
        }
        stmt->bindValue(index++, Value{currentTimestamp()});
        stmt->bind(index, id);
        stmt->execute();
        auto changed = static_cast<std::size_t>(db.changes());
        txn->commit();
        spdlog::debug("Updated {} row(s) in table {}", changed, collection);
        return changed;
    });
}

std::size_t RelationalEngine::deleteDocument(const std::string& collection,
                                             const std::string& id) {
    requireIdentifier(collection, "collection");
    return guarded("delete", [&]() -> std::size_t {
        if (!findSchema(collection)) {
            return 0;
        }
        QueryBuilder builder(collection);
        builder.whereEquals(std::string(ID_FIELD), Value{id});

        auto& db = database();
        auto txn = db.beginTransaction(sqlite::TransactionMode::Immediate);
        auto stmt = db.prepare(builder.buildDelete());
        stmt->bindValue(1, builder.getParamValues().front());
        stmt->execute();
        auto removed = static_cast<std::size_t>(db.changes());
        txn->commit();
        return removed;
    });
}

std::vector<Document> RelationalEngine::listDocuments(
    const std::string& collection, const ListOptions& options) {
    requireIdentifier(collection, "collection");
    return guarded("list", [&]() {
        std::vector<Document> results;
        const auto* schema = findSchema(collection);
        if (!schema) {
            return results;
        }

        QueryBuilder builder(collection);
        if (!applyQuery(builder, *schema, options.query)) {
            return results;
        }
        for (const auto& key : options.sort) {
            if (schema->hasColumn(key.field)) {
                builder.orderBy(key.field, key.direction > 0);
            } else {
                spdlog::debug("Ignoring sort on unknown column {}.{}",
                              collection, key.field);
            }
        }
        builder.orderBy(std::string(ROWID_COLUMN))
            .limit(options.limit)
            .offset(options.skip);

        auto stmt = database().prepare(builder.build());
        const auto& params = builder.getParamValues();
        stmt->bindAll(params);
        while (stmt->step()) {
            results.push_back(readDocument(*stmt, *schema));
        }
        return results;
    });
}

std::size_t RelationalEngine::countDocuments(const std::string& collection,
                                             const QuerySpec& query) {
    requireIdentifier(collection, "collection");
    return guarded("count", [&]() -> std::size_t {
        const auto* schema = findSchema(collection);
        if (!schema) {
            return 0;
        }
        QueryBuilder builder(collection);
        if (!applyQuery(builder, *schema, query)) {
            return 0;
        }

        auto stmt = database().prepare(builder.buildCount());
        const auto& params = builder.getParamValues();
        stmt->bindAll(params);
        if (!stmt->step()) {
            return 0;
        }
        return static_cast<std::size_t>(stmt->getInt64(0));
    });
}

void RelationalEngine::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        spdlog::info("Closing relational engine ({})", db_->name());
    }
    schemas_.clear();
    db_.reset();
}

}  // namespace docstore::store
