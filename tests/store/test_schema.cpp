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
 * test_schema.cpp
 *
 * Tests for relational schema inference and the SQLite value codec
 * - Column type mapping
 * - Identifier validation
 * - Schema inference, creation and reload
 * - Binding and decoding values by declared type
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>

#include "store/core/types.hpp"
#include "store/core/value.hpp"
#include "store/engine/schema.hpp"
#include "store/sqlite/database.hpp"
#include "store/sqlite/statement.hpp"

using namespace docstore::store;
using namespace docstore::store::sqlite;

// ==================== Column Type Tests ====================

TEST(ColumnTypeTest, RoundTripsThroughDeclaredName) {
    for (auto type : {ColumnType::Integer, ColumnType::Numeric,
                      ColumnType::Boolean, ColumnType::Timestamp,
                      ColumnType::JsonText, ColumnType::Text}) {
        EXPECT_EQ(columnTypeFromString(columnTypeToString(type)), type);
    }
}

TEST(ColumnTypeTest, FromStringIsCaseInsensitive) {
    EXPECT_EQ(columnTypeFromString("boolean"), ColumnType::Boolean);
    EXPECT_EQ(columnTypeFromString("json_text"), ColumnType::JsonText);
    EXPECT_EQ(columnTypeFromString("VARCHAR(20)"), ColumnType::Text);
}

TEST(ColumnTypeTest, InferFromValue) {
    EXPECT_EQ(inferColumnType(Value(1)), ColumnType::Integer);
    EXPECT_EQ(inferColumnType(Value(1.5)), ColumnType::Numeric);
    EXPECT_EQ(inferColumnType(Value(true)), ColumnType::Boolean);
    EXPECT_EQ(inferColumnType(Value("s")), ColumnType::Text);
    EXPECT_EQ(inferColumnType(Value(currentTimestamp())),
              ColumnType::Timestamp);
    EXPECT_EQ(inferColumnType(Value(Value::Object{})), ColumnType::JsonText);
    EXPECT_EQ(inferColumnType(Value(Value::Array{})), ColumnType::JsonText);
    EXPECT_EQ(inferColumnType(Value()), ColumnType::Text);
}

TEST(ColumnTypeTest, AcceptsOnlyItsOwnKind) {
    EXPECT_TRUE(columnAccepts(ColumnType::Integer, Value(1)));
    EXPECT_FALSE(columnAccepts(ColumnType::Integer, Value("1")));
    EXPECT_TRUE(columnAccepts(ColumnType::Numeric, Value(1)));
    EXPECT_FALSE(columnAccepts(ColumnType::Boolean, Value(1)));
    EXPECT_FALSE(columnAccepts(ColumnType::Timestamp,
                               Value("2024-03-01 12:00:00.000000")));
    EXPECT_FALSE(columnAccepts(ColumnType::Text, Value(currentTimestamp())));
    EXPECT_TRUE(columnAccepts(ColumnType::Text, Value()));

    EXPECT_TRUE(columnAccepts(ColumnType::JsonText, Value("s")));
    EXPECT_TRUE(columnAccepts(ColumnType::JsonText, Value(2.5)));
    EXPECT_FALSE(columnAccepts(
        ColumnType::JsonText,
        Value(Value::Array{Value(Value::Object{{"t", Value(currentTimestamp())}})})));
}

TEST(ColumnTypeTest, JsonCellsHoldEncodedValues) {
    EXPECT_EQ(encodeCell(ColumnType::JsonText, Value("123")), Value("\"123\""));
    EXPECT_EQ(encodeCell(ColumnType::JsonText, Value(true)), Value("true"));
    EXPECT_TRUE(encodeCell(ColumnType::JsonText, Value()).isNull());
    EXPECT_EQ(encodeCell(ColumnType::Text, Value("123")), Value("123"));
}

// ==================== Identifier Tests ====================

TEST(IdentifierTest, AcceptsSqlIdentifiers) {
    EXPECT_TRUE(isIdentifier("users"));
    EXPECT_TRUE(isIdentifier("_private"));
    EXPECT_TRUE(isIdentifier("table_2"));
    EXPECT_FALSE(isIdentifier(""));
    EXPECT_FALSE(isIdentifier("2fast"));
    EXPECT_FALSE(isIdentifier("drop table"));
    EXPECT_FALSE(isIdentifier("a-b"));
    EXPECT_FALSE(isIdentifier("x\";--"));
}

TEST(IdentifierTest, RequireIdentifierThrowsValidationError) {
    EXPECT_NO_THROW(requireIdentifier("users", "collection"));
    EXPECT_THROW(requireIdentifier("bad name", "collection"), ValidationError);
}

// ==================== TableSchema Tests ====================

class TableSchemaTest : public ::testing::Test {
protected:
    void SetUp() override { db = std::make_unique<Database>(":memory:"); }

    void TearDown() override { db.reset(); }

    std::unique_ptr<Database> db;
};

TEST_F(TableSchemaTest, InferOrdersColumns) {
    Fields fields{{"name", Value("ada")}, {"age", Value(36)}};
    auto schema = TableSchema::infer("people", fields, std::nullopt);

    ASSERT_EQ(schema.columns().size(), 5u);
    EXPECT_EQ(schema.columns().front().name, "_id");
    EXPECT_TRUE(schema.columns().front().primaryKey);
    EXPECT_EQ(schema.columns()[3].name, "created_at");
    EXPECT_EQ(schema.columns()[4].name, "updated_at");
    EXPECT_TRUE(schema.autoId());
    EXPECT_EQ(schema.columnType("age").value(), ColumnType::Integer);
    EXPECT_EQ(schema.columnType("name").value(), ColumnType::Text);
    EXPECT_FALSE(schema.columnType("missing").has_value());
}

TEST_F(TableSchemaTest, StringIdMakesTextPrimaryKey) {
    auto schema = TableSchema::infer("tags", {}, Value("abc"));
    EXPECT_FALSE(schema.autoId());
    EXPECT_EQ(schema.columnType("_id").value(), ColumnType::Text);
    EXPECT_EQ(schema.createTableSql(),
              "CREATE TABLE IF NOT EXISTS \"tags\" (\"_id\" TEXT PRIMARY KEY, "
              "\"created_at\" TIMESTAMP DEFAULT CURRENT_TIMESTAMP, "
              "\"updated_at\" TIMESTAMP DEFAULT CURRENT_TIMESTAMP)");
}

TEST_F(TableSchemaTest, IntegerIdUsesAutoincrement) {
    auto schema = TableSchema::infer("counters", {{"n", Value(1)}}, Value(5));
    EXPECT_TRUE(schema.autoId());
    EXPECT_NE(schema.createTableSql().find(
                  "\"_id\" INTEGER PRIMARY KEY AUTOINCREMENT"),
              std::string::npos);
}

TEST_F(TableSchemaTest, LoadReadsBackCreatedTable) {
    Fields fields{{"active", Value(true)},
                  {"score", Value(1.5)},
                  {"tags", Value(Value::Array{Value("a")})}};
    auto inferred = TableSchema::infer("players", fields, std::nullopt);
    db->execute(inferred.createTableSql());

    auto loaded = TableSchema::load(*db, "players");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->autoId());
    ASSERT_EQ(loaded->columns().size(), inferred.columns().size());
    for (std::size_t i = 0; i < inferred.columns().size(); ++i) {
        EXPECT_EQ(loaded->columns()[i].name, inferred.columns()[i].name);
        EXPECT_EQ(loaded->columns()[i].type, inferred.columns()[i].type);
        EXPECT_EQ(loaded->columns()[i].primaryKey,
                  inferred.columns()[i].primaryKey);
    }
}

TEST_F(TableSchemaTest, LoadMissingTableReturnsNullopt) {
    EXPECT_FALSE(TableSchema::load(*db, "ghost").has_value());
}

TEST_F(TableSchemaTest, UnknownColumnsKeepFieldOrder) {
    auto schema =
        TableSchema::infer("people", {{"name", Value("x")}}, std::nullopt);
    Fields update{{"age", Value(1)}, {"name", Value("y")}, {"zip", Value(2)}};
    auto unknown = schema.unknownColumns(update);
    ASSERT_EQ(unknown.size(), 2u);
    EXPECT_EQ(unknown[0], "age");
    EXPECT_EQ(unknown[1], "zip");
}

// ==================== Value Codec Tests ====================

class ValueCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = std::make_unique<Database>(":memory:");
        db->execute(
            "CREATE TABLE cells (b BOOLEAN, n NUMERIC, t TIMESTAMP, "
            "j JSON_TEXT, s TEXT, i INTEGER)");
    }

    void TearDown() override { db.reset(); }

    static constexpr ColumnType declared[] = {
        ColumnType::Boolean,  ColumnType::Numeric, ColumnType::Timestamp,
        ColumnType::JsonText, ColumnType::Text,    ColumnType::Integer};

    // Writes one row and reads each cell back by its declared type
    std::vector<Value> roundTrip(const std::vector<Value>& row) {
        db->execute("DELETE FROM cells");
        auto insert =
            db->prepare("INSERT INTO cells VALUES (?, ?, ?, ?, ?, ?)");
        for (std::size_t i = 0; i < row.size(); ++i) {
            insert->bindValue(static_cast<int>(i) + 1,
                              encodeCell(declared[i], row[i]));
        }
        insert->execute();

        auto select = db->prepare("SELECT b, n, t, j, s, i FROM cells");
        std::vector<Value> out;
        if (select->step()) {
            for (int i = 0; i < 6; ++i) {
                out.push_back(readValue(*select, i, declared[i]));
            }
        }
        return out;
    }

    std::unique_ptr<Database> db;
};

TEST_F(ValueCodecTest, DecodesByDeclaredType) {
    auto ts = currentTimestamp();
    Value::Object nested{{"k", Value(Value::Array{Value(1), Value("two")})}};
    auto out = roundTrip({Value(true), Value(2.0), Value(ts), Value(nested),
                          Value("hello"), Value(int64_t{1} << 40)});

    ASSERT_EQ(out.size(), 6u);
    EXPECT_TRUE(out[0].isBool());
    EXPECT_TRUE(out[0].asBool());
    // NUMERIC affinity stores 2.0 as an integer; the codec restores a float
    EXPECT_TRUE(out[1].isFloat());
    EXPECT_DOUBLE_EQ(out[1].asFloat(), 2.0);
    ASSERT_TRUE(out[2].isTimestamp());
    EXPECT_EQ(out[2].asTimestamp(), ts);
    EXPECT_EQ(out[3], Value(nested));
    EXPECT_EQ(out[4], Value("hello"));
    EXPECT_EQ(out[5].asInteger(), int64_t{1} << 40);
}

TEST_F(ValueCodecTest, JsonCellKeepsStrings) {
    auto out = roundTrip({Value(), Value(), Value(), Value("[1]"), Value(),
                          Value()});
    ASSERT_EQ(out.size(), 6u);
    EXPECT_TRUE(out[3].isString());
    EXPECT_EQ(out[3], Value("[1]"));
}

TEST_F(ValueCodecTest, NullsStayNull) {
    auto out = roundTrip({Value(), Value(), Value(), Value(), Value(), Value()});
    ASSERT_EQ(out.size(), 6u);
    for (const auto& value : out) {
        EXPECT_TRUE(value.isNull());
    }
}

TEST_F(ValueCodecTest, MalformedJsonFallsBackToText) {
    db->execute("INSERT INTO cells (j) VALUES ('{not json')");
    auto select = db->prepare("SELECT j FROM cells");
    ASSERT_TRUE(select->step());
    auto value = readValue(*select, 0, ColumnType::JsonText);
    EXPECT_EQ(value, Value("{not json"));
}

TEST_F(ValueCodecTest, DefaultTimestampTextParses) {
    db->execute("INSERT INTO cells (t) VALUES (CURRENT_TIMESTAMP)");
    auto select = db->prepare("SELECT t FROM cells");
    ASSERT_TRUE(select->step());
    EXPECT_TRUE(readValue(*select, 0, ColumnType::Timestamp).isTimestamp());
}
