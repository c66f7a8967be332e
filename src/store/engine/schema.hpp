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

#ifndef DOCSTORE_STORE_ENGINE_SCHEMA_HPP
#define DOCSTORE_STORE_ENGINE_SCHEMA_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/value.hpp"

namespace docstore::store {

namespace sqlite {
class Database;
class Statement;
}  // namespace sqlite

/**
 * @brief Declared column types used for inferred tables.
 *
 * BOOLEAN, NUMERIC and TIMESTAMP get NUMERIC affinity in SQLite, JSON_TEXT
 * and TEXT get TEXT affinity.
 */
enum class ColumnType : uint8_t {
    Integer,
    Numeric,
    Boolean,
    Timestamp,
    JsonText,
    Text
};

[[nodiscard]] std::string_view columnTypeToString(ColumnType type) noexcept;

/**
 * @brief Map a declared type back to a ColumnType (case-insensitive).
 *
 * Unrecognized declarations read as Text.
 */
[[nodiscard]] ColumnType columnTypeFromString(std::string_view declared);

/**
 * @brief Column type for a value's runtime type. Null infers Text.
 */
[[nodiscard]] ColumnType inferColumnType(const Value& value) noexcept;

/**
 * @brief Whether a cell of @p type reads @p value back as the same kind.
 *
 * Null fits every column. NUMERIC also takes integers. JSON_TEXT takes any
 * value that holds no timestamp, at any depth.
 */
[[nodiscard]] bool columnAccepts(ColumnType type, const Value& value);

/**
 * @brief The value bound for @p value in a column of @p type.
 *
 * JSON_TEXT cells hold the JSON encoding of every non-null value, so a
 * string such as "123" is stored quoted and decodes as a string.
 */
[[nodiscard]] Value encodeCell(ColumnType type, const Value& value);

/**
 * @brief True for `[A-Za-z_][A-Za-z0-9_]*`.
 */
[[nodiscard]] bool isIdentifier(std::string_view name) noexcept;

/**
 * @brief Throw ValidationError unless @p name is an identifier.
 *
 * @param what Describes the name in the error message ("collection",
 * "field").
 */
void requireIdentifier(std::string_view name, std::string_view what);

struct ColumnInfo {
    std::string name;
    ColumnType type{ColumnType::Text};
    bool primaryKey{false};
};

/**
 * @brief Column layout of one collection table.
 *
 * Columns are ordered: `_id` first, then value columns, then `created_at`
 * and `updated_at`.
 */
class TableSchema {
public:
    TableSchema() = default;

    /**
     * @brief Infer a schema from the first document written to a table.
     *
     * @param table Table name.
     * @param fields Value fields with reserved entries already removed.
     * @param id The caller supplied `_id`, if any. Its type decides the
     * identity column type; without it `_id` is an autoincrement integer.
     */
    static TableSchema infer(const std::string& table, const Fields& fields,
                             const std::optional<Value>& id);

    /**
     * @brief Read the schema of an existing table with PRAGMA table_info.
     *
     * @return nullopt if the table does not exist.
     */
    static std::optional<TableSchema> load(sqlite::Database& db,
                                           const std::string& table);

    /**
     * @brief CREATE TABLE statement for this schema.
     */
    [[nodiscard]] std::string createTableSql() const;

    [[nodiscard]] const std::string& table() const noexcept { return table_; }
    [[nodiscard]] const std::vector<ColumnInfo>& columns() const noexcept {
        return columns_;
    }

    [[nodiscard]] bool hasColumn(std::string_view name) const;
    [[nodiscard]] std::optional<ColumnType> columnType(
        std::string_view name) const;

    /// Identity column is an autoincrementing rowid alias.
    [[nodiscard]] bool autoId() const noexcept { return autoId_; }

    /// Column names in @p fields this schema lacks, in field order.
    [[nodiscard]] std::vector<std::string> unknownColumns(
        const Fields& fields) const;

    /// Fields whose value kind their column cannot hold (see columnAccepts).
    [[nodiscard]] std::vector<std::string> mismatchedColumns(
        const Fields& fields) const;

private:
    std::string table_;
    std::vector<ColumnInfo> columns_;
    bool autoId_{false};
};

/**
 * @brief Decode a result cell by storage class, refined by the declared
 * column type.
 */
[[nodiscard]] Value readValue(const sqlite::Statement& stmt, int index,
                              ColumnType declared);

}  // namespace docstore::store

#endif  // DOCSTORE_STORE_ENGINE_SCHEMA_HPP
