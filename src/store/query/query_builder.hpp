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

#ifndef DOCSTORE_STORE_QUERY_QUERY_BUILDER_HPP
#define DOCSTORE_STORE_QUERY_QUERY_BUILDER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/value.hpp"

namespace docstore::store::query {

/**
 * @brief A fluent SQL builder for SELECT, COUNT and DELETE statements.
 *
 * Identifiers are double-quoted; every comparison value becomes a `?`
 * placeholder whose value is collected in getParamValues(), in placeholder
 * order. WHERE conditions are joined with AND.
 */
class QueryBuilder {
public:
    explicit QueryBuilder(const std::string& tableName);

    /**
     * @brief Adds an equality predicate on a column.
     *
     * A null value produces `IS NULL` and binds nothing.
     */
    QueryBuilder& whereEquals(const std::string& column, const Value& value);

    /// Appends an ORDER BY key; keys apply in call order.
    QueryBuilder& orderBy(const std::string& column, bool asc = true);

    /// UNLIMITED, or anything past the int64 range, clears the limit.
    QueryBuilder& limit(std::size_t limit);
    /// Offsets past the int64 range are clamped to it.
    QueryBuilder& offset(std::size_t offset);

    std::string build() const;
    std::string buildCount() const;  ///< `SELECT COUNT(*)`, same predicates
    std::string buildDelete() const;

    /**
     * @brief Validates the query parameters.
     *
     * @throws ValidationError if the table name is empty
     */
    void validate() const;

    /// Values for the WHERE placeholders, in placeholder order.
    const std::vector<Value>& getParamValues() const { return paramValues; }
    std::size_t getParamCount() const { return paramValues.size(); }

    /// "name", with embedded quotes doubled.
    static std::string quoteIdentifier(std::string_view name);

private:
    std::string tableName;
    std::vector<std::string> whereConditions;  ///< ANDed together.
    std::vector<std::string> orderByClauses;
    std::optional<std::size_t> limitValue;
    std::size_t offsetValue = 0;
    std::vector<Value> paramValues;

    std::string whereClause() const;
};

}  // namespace docstore::store::query

#endif  // DOCSTORE_STORE_QUERY_QUERY_BUILDER_HPP
