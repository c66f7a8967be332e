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

/*
 * test_query_builder.cpp
 *
 * Tests for the SQL QueryBuilder
 * - SELECT, COUNT and DELETE generation
 * - Equality predicates and NULL handling
 * - ORDER BY, LIMIT and OFFSET
 * - Identifier quoting
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <limits>

#include "store/core/types.hpp"
#include "store/core/value.hpp"
#include "store/query/query_builder.hpp"

using namespace docstore::store;
using namespace docstore::store::query;

// ==================== QueryBuilder Tests ====================

TEST(QueryBuilderTest, SelectAll) {
    QueryBuilder builder("users");
    EXPECT_EQ(builder.build(), "SELECT * FROM \"users\"");
    EXPECT_EQ(builder.getParamCount(), 0u);
}

TEST(QueryBuilderTest, WhereConditionsAreConjoined) {
    QueryBuilder builder("users");
    builder.whereEquals("name", Value("ada")).whereEquals("age", Value(36));
    EXPECT_EQ(builder.build(),
              "SELECT * FROM \"users\" WHERE \"name\" = ? AND \"age\" = ?");
    ASSERT_EQ(builder.getParamCount(), 2u);
    EXPECT_EQ(builder.getParamValues()[0], Value("ada"));
    EXPECT_EQ(builder.getParamValues()[1], Value(36));
}

TEST(QueryBuilderTest, NullPredicateUsesIsNull) {
    QueryBuilder builder("users");
    builder.whereEquals("email", Value()).whereEquals("name", Value("x"));
    EXPECT_EQ(builder.build(),
              "SELECT * FROM \"users\" WHERE \"email\" IS NULL AND \"name\" = ?");
    EXPECT_EQ(builder.getParamCount(), 1u);
}

TEST(QueryBuilderTest, OrderByKeepsCallOrder) {
    QueryBuilder builder("users");
    builder.orderBy("age", false).orderBy("name");
    EXPECT_EQ(builder.build(),
              "SELECT * FROM \"users\" ORDER BY \"age\" DESC, \"name\" ASC");
}

TEST(QueryBuilderTest, LimitAndOffset) {
    QueryBuilder builder("users");
    builder.limit(10).offset(20);
    EXPECT_EQ(builder.build(), "SELECT * FROM \"users\" LIMIT 10 OFFSET 20");
}

TEST(QueryBuilderTest, OffsetWithoutLimitEmitsUnboundedLimit) {
    QueryBuilder builder("users");
    builder.offset(5);
    EXPECT_EQ(builder.build(), "SELECT * FROM \"users\" LIMIT -1 OFFSET 5");
}

TEST(QueryBuilderTest, UnlimitedClearsLimit) {
    QueryBuilder builder("users");
    builder.limit(10).limit(UNLIMITED);
    EXPECT_EQ(builder.build(), "SELECT * FROM \"users\"");
}

TEST(QueryBuilderTest, ZeroLimitIsEmitted) {
    QueryBuilder builder("users");
    builder.limit(0);
    EXPECT_EQ(builder.build(), "SELECT * FROM \"users\" LIMIT 0");
}

TEST(QueryBuilderTest, PagingBeyondInt64IsClamped) {
    constexpr auto maxSql =
        static_cast<std::size_t>(std::numeric_limits<int64_t>::max());

    QueryBuilder builder("users");
    builder.limit(maxSql + 1);
    EXPECT_EQ(builder.build(), "SELECT * FROM \"users\"");

    builder.limit(maxSql).offset(maxSql + 5);
    EXPECT_EQ(builder.build(),
              "SELECT * FROM \"users\" LIMIT 9223372036854775807 OFFSET "
              "9223372036854775807");
}

TEST(QueryBuilderTest, CountAndDeleteShareWhereClause) {
    QueryBuilder builder("users");
    builder.whereEquals("_id", Value("7")).orderBy("name").limit(1);
    EXPECT_EQ(builder.buildCount(),
              "SELECT COUNT(*) FROM \"users\" WHERE \"_id\" = ?");
    EXPECT_EQ(builder.buildDelete(), "DELETE FROM \"users\" WHERE \"_id\" = ?");
}

TEST(QueryBuilderTest, EmptyTableNameFailsValidation) {
    QueryBuilder builder("");
    EXPECT_THROW(builder.build(), ValidationError);
    EXPECT_THROW(builder.buildCount(), ValidationError);
    EXPECT_THROW(builder.buildDelete(), ValidationError);
}

TEST(QueryBuilderTest, QuoteIdentifierDoublesEmbeddedQuotes) {
    EXPECT_EQ(QueryBuilder::quoteIdentifier("plain"), "\"plain\"");
    EXPECT_EQ(QueryBuilder::quoteIdentifier("we\"ird"), "\"we\"\"ird\"");
    EXPECT_EQ(QueryBuilder::quoteIdentifier(""), "\"\"");
}
