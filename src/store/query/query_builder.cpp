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

#include "query_builder.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>

#include "../core/types.hpp"

namespace docstore::store::query {

namespace {

constexpr auto MAX_SQL_INTEGER =
    static_cast<std::size_t>(std::numeric_limits<int64_t>::max());

std::string join(const std::vector<std::string>& parts,
                 std::string_view separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

}  // namespace

QueryBuilder::QueryBuilder(const std::string& tableName)
    : tableName(tableName) {}

QueryBuilder& QueryBuilder::whereEquals(const std::string& column,
                                        const Value& value) {
    std::string condition = quoteIdentifier(column);
    if (value.isNull()) {
        condition += " IS NULL";
    } else {
        condition += " = ?";
        paramValues.push_back(value);
    }
    whereConditions.push_back(std::move(condition));
    return *this;
}

QueryBuilder& QueryBuilder::orderBy(const std::string& column, bool asc) {
    orderByClauses.push_back(quoteIdentifier(column) + (asc ? " ASC" : " DESC"));
    return *this;
}

QueryBuilder& QueryBuilder::limit(std::size_t limit) {
    // SQLite rejects a LIMIT beyond int64; no row count reaches one anyway
    limitValue = limit > MAX_SQL_INTEGER ? std::nullopt
                                         : std::optional<std::size_t>(limit);
    return *this;
}

QueryBuilder& QueryBuilder::offset(std::size_t offset) {
    offsetValue = std::min(offset, MAX_SQL_INTEGER);
    return *this;
}

std::string QueryBuilder::whereClause() const {
    return whereConditions.empty()
               ? std::string{}
               : " WHERE " + join(whereConditions, " AND ");
}

std::string QueryBuilder::build() const {
    validate();

    std::ostringstream sql;
    sql << "SELECT * FROM " << quoteIdentifier(tableName) << whereClause();
    if (!orderByClauses.empty()) {
        sql << " ORDER BY " << join(orderByClauses, ", ");
    }

    // SQLite only accepts OFFSET after a LIMIT; -1 means no limit
    if (limitValue || offsetValue > 0) {
        sql << " LIMIT ";
        if (limitValue) {
            sql << *limitValue;
        } else {
            sql << -1;
        }
    }
    if (offsetValue > 0) {
        sql << " OFFSET " << offsetValue;
    }
    return sql.str();
}

std::string QueryBuilder::buildCount() const {
    validate();
    return "SELECT COUNT(*) FROM " + quoteIdentifier(tableName) + whereClause();
}

std::string QueryBuilder::buildDelete() const {
    validate();
    return "DELETE FROM " + quoteIdentifier(tableName) + whereClause();
}

void QueryBuilder::validate() const {
    if (tableName.empty()) {
        THROW_VALIDATION_ERROR("Table name cannot be empty");
    }
}

std::string QueryBuilder::quoteIdentifier(std::string_view name) {
    std::string quoted(1, '"');
    for (char c : name) {
        quoted += c;
        if (c == '"') {
            quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

}  // namespace docstore::store::query
