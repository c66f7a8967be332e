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

#include "schema.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>

#include "../core/types.hpp"
#include "../query/query_builder.hpp"
#include "../sqlite/database.hpp"
#include "../sqlite/statement.hpp"

namespace docstore::store {

using query::QueryBuilder;

std::string_view columnTypeToString(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::Integer:
            return "INTEGER";
        case ColumnType::Numeric:
            return "NUMERIC";
        case ColumnType::Boolean:
            return "BOOLEAN";
        case ColumnType::Timestamp:
            return "TIMESTAMP";
        case ColumnType::JsonText:
            return "JSON_TEXT";
        case ColumnType::Text:
            return "TEXT";
    }
    return "TEXT";
}

ColumnType columnTypeFromString(std::string_view declared) {
    std::string upper(declared);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    for (auto type : {ColumnType::Integer, ColumnType::Numeric,
                      ColumnType::Boolean, ColumnType::Timestamp,
                      ColumnType::JsonText, ColumnType::Text}) {
        if (upper == columnTypeToString(type)) {
            return type;
        }
    }
    return ColumnType::Text;
}

ColumnType inferColumnType(const Value& value) noexcept {
    switch (value.type()) {
        case Value::Type::Integer:
            return ColumnType::Integer;
        case Value::Type::Float:
            return ColumnType::Numeric;
        case Value::Type::Boolean:
            return ColumnType::Boolean;
        case Value::Type::Timestamp:
            return ColumnType::Timestamp;
        case Value::Type::Object:
        case Value::Type::Array:
            return ColumnType::JsonText;
        default:
            return ColumnType::Text;
    }
}

namespace {

// JSON has no timestamp type, so nested timestamps would read back as text
bool holdsTimestamp(const Value& value) {
    if (value.isTimestamp()) {
        return true;
    }
    if (value.isObject()) {
        for (const auto& [key, member] : value.asObject()) {
            if (holdsTimestamp(member)) {
                return true;
            }
        }
    } else if (value.isArray()) {
        for (const auto& item : value.asArray()) {
            if (holdsTimestamp(item)) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

bool columnAccepts(ColumnType type, const Value& value) {
    if (value.isNull()) {
        return true;
    }
    if (type == ColumnType::JsonText) {
        return !holdsTimestamp(value);
    }
    if (value.isInteger() && type == ColumnType::Numeric) {
        return true;
    }
    return type == inferColumnType(value);
}

Value encodeCell(ColumnType type, const Value& value) {
    if (type == ColumnType::JsonText && !value.isNull()) {
        return Value{value.toJson().dump()};
    }
    return value;
}

bool isIdentifier(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    auto head = static_cast<unsigned char>(name.front());
    if (!std::isalpha(head) && head != '_') {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), [](char c) {
        auto ch = static_cast<unsigned char>(c);
        return std::isalnum(ch) || ch == '_';
    });
}

void requireIdentifier(std::string_view name, std::string_view what) {
    if (!isIdentifier(name)) {
        THROW_VALIDATION_ERROR("Invalid " + std::string(what) + " name '" +
                               std::string(name) +
                               "': expected [A-Za-z_][A-Za-z0-9_]*");
    }
}

//------------------------------------------------------------------------------
// TableSchema Implementation
//------------------------------------------------------------------------------

TableSchema TableSchema::infer(const std::string& table, const Fields& fields,
                               const std::optional<Value>& id) {
    TableSchema schema;
    schema.table_ = table;

    ColumnInfo idColumn{std::string(ID_FIELD), ColumnType::Integer, true};
    if (id) {
        idColumn.type = id->isInteger() ? ColumnType::Integer : ColumnType::Text;
    }
    schema.autoId_ = idColumn.type == ColumnType::Integer;
    schema.columns_.push_back(std::move(idColumn));

    for (const auto& [name, value] : fields) {
        schema.columns_.push_back({name, inferColumnType(value), false});
    }
    schema.columns_.push_back(
        {std::string(CREATED_AT_FIELD), ColumnType::Timestamp, false});
    schema.columns_.push_back(
        {std::string(UPDATED_AT_FIELD), ColumnType::Timestamp, false});
    return schema;
}

std::optional<TableSchema> TableSchema::load(sqlite::Database& db,
                                             const std::string& table) {
    auto stmt = db.prepare("PRAGMA table_info(" +
                           QueryBuilder::quoteIdentifier(table) + ")");
    TableSchema schema;
    schema.table_ = table;
    // cid, name, type, notnull, dflt_value, pk
    while (stmt->step()) {
        ColumnInfo column;
        column.name = stmt->getText(1);
        column.type = columnTypeFromString(stmt->getText(2));
        column.primaryKey = stmt->getInt64(5) != 0;
        schema.columns_.push_back(std::move(column));
    }
    if (schema.columns_.empty()) {
        return std::nullopt;
    }

    auto idType = schema.columnType(ID_FIELD);
    schema.autoId_ = idType && *idType == ColumnType::Integer;
    return schema;
}

std::string TableSchema::createTableSql() const {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << QueryBuilder::quoteIdentifier(table_)
        << " (";
    bool first = true;
    for (const auto& column : columns_) {
        if (!first)
            sql << ", ";
        first = false;
        sql << QueryBuilder::quoteIdentifier(column.name) << ' '
            << columnTypeToString(column.type);
        if (column.primaryKey) {
            sql << " PRIMARY KEY";
            if (autoId_) {
                sql << " AUTOINCREMENT";
            }
        } else if (column.name == CREATED_AT_FIELD ||
                   column.name == UPDATED_AT_FIELD) {
            sql << " DEFAULT CURRENT_TIMESTAMP";
        }
    }
    sql << ")";
    return sql.str();
}

bool TableSchema::hasColumn(std::string_view name) const {
    return columnType(name).has_value();
}

std::optional<ColumnType> TableSchema::columnType(std::string_view name) const {
    for (const auto& column : columns_) {
        if (column.name == name) {
            return column.type;
        }
    }
    return std::nullopt;
}

std::vector<std::string> TableSchema::unknownColumns(
    const Fields& fields) const {
    std::vector<std::string> unknown;
    for (const auto& [name, value] : fields) {
        if (!hasColumn(name)) {
            unknown.push_back(name);
        }
    }
    return unknown;
}

std::vector<std::string> TableSchema::mismatchedColumns(
    const Fields& fields) const {
    std::vector<std::string> mismatched;
    for (const auto& [name, value] : fields) {
        auto type = columnType(name);
        if (type && !columnAccepts(*type, value)) {
            mismatched.push_back(name + " (" +
                                 std::string(columnTypeToString(*type)) +
                                 " column, got " +
                                 std::string(Value::typeName(value.type())) +
                                 ")");
        }
    }
    return mismatched;
}

//------------------------------------------------------------------------------
// Value codec
//------------------------------------------------------------------------------

Value readValue(const sqlite::Statement& stmt, int index, ColumnType declared) {
    switch (stmt.getColumnType(index)) {
        case SQLITE_NULL:
            return Value{};
        case SQLITE_INTEGER: {
            int64_t number = stmt.getInt64(index);
            if (declared == ColumnType::Boolean) {
                return Value{number != 0};
            }
            if (declared == ColumnType::Numeric) {
                return Value{static_cast<double>(number)};
            }
            return Value{number};
        }
        case SQLITE_FLOAT:
            return Value{stmt.getDouble(index)};
        default:
            break;
    }

    std::string text = stmt.getText(index);
    if (declared == ColumnType::Timestamp) {
        if (auto ts = parseTimestamp(text)) {
            return Value{*ts};
        }
    } else if (declared == ColumnType::JsonText) {
        json parsed = json::parse(text, nullptr, false);
        if (!parsed.is_discarded()) {
            return Value::fromJson(parsed);
        }
        spdlog::warn("Column {} holds malformed JSON; returning raw text",
                     stmt.getColumnName(index));
    }
    return Value{std::move(text)};
}

}  // namespace docstore::store
