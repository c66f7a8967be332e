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
 * test_memory_engine.cpp
 *
 * Tests for the in-memory storage engine
 * - Id minting and duplicate ids
 * - Metadata handling
 * - Filtering, multi-key sorting and paging
 * - Collection listing and close
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>

#include "store/core/types.hpp"
#include "store/core/value.hpp"
#include "store/engine/memory_engine.hpp"

using namespace docstore::store;
using namespace std::chrono;

// ==================== MemoryEngine Tests ====================

class MemoryEngineTest : public ::testing::Test {
protected:
    void SetUp() override { engine = std::make_unique<MemoryEngine>(); }

    void TearDown() override { engine.reset(); }

    std::vector<std::string> idsOf(const std::vector<Document>& docs) {
        std::vector<std::string> ids;
        for (const auto& doc : docs) {
            ids.push_back(doc.id);
        }
        return ids;
    }

    std::unique_ptr<MemoryEngine> engine;
};

TEST_F(MemoryEngineTest, KindIsMemory) {
    EXPECT_EQ(engine->kind(), EngineKind::Memory);
}

TEST_F(MemoryEngineTest, MintsSequentialIdsPerCollection) {
    EXPECT_EQ(engine->createDocument("a", {{"x", Value(1)}}), "1");
    EXPECT_EQ(engine->createDocument("a", {{"x", Value(2)}}), "2");
    EXPECT_EQ(engine->createDocument("b", {{"x", Value(3)}}), "1");
}

TEST_F(MemoryEngineTest, MintedIdsSkipCallerSuppliedOnes) {
    EXPECT_EQ(engine->createDocument("a", {{"_id", Value(1)}}), "1");
    EXPECT_EQ(engine->createDocument("a", {{"x", Value(true)}}), "2");
}

TEST_F(MemoryEngineTest, DuplicateIdThrows) {
    engine->createDocument("a", {{"_id", Value("k")}});
    EXPECT_THROW(engine->createDocument("a", {{"_id", Value("k")}}),
                 BackendOperationError);
    EXPECT_EQ(engine->countDocuments("a", {}), 1u);
}

TEST_F(MemoryEngineTest, StoredFieldsExcludeReservedNames) {
    auto id = engine->createDocument("a", {{"_id", Value("k")},
                                           {"name", Value("ada")}});
    auto doc = engine->getDocument("a", id);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->id, "k");
    EXPECT_EQ(doc->fields.size(), 1u);
    EXPECT_EQ(doc->fields.at("name"), Value("ada"));
    EXPECT_LE(doc->createdAt, doc->updatedAt);
}

TEST_F(MemoryEngineTest, SuppliedTimestampsAreKept) {
    Timestamp created = sys_days{2020y / 1 / 2} + hours{3};
    auto id = engine->createDocument(
        "a", {{"created_at", Value(created)}, {"n", Value(1)}});
    auto doc = engine->getDocument("a", id);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->createdAt, created);
    EXPECT_GE(doc->updatedAt, created);
}

TEST_F(MemoryEngineTest, UpdateMergesAndRefreshesTimestamp) {
    auto id = engine->createDocument("a", {{"n", Value(1)}, {"s", Value("x")}});
    auto before = engine->getDocument("a", id);
    ASSERT_TRUE(before.has_value());

    EXPECT_EQ(engine->updateDocument("a", id, {{"n", Value(2)}}), 1u);
    auto after = engine->getDocument("a", id);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->fields.at("n"), Value(2));
    EXPECT_EQ(after->fields.at("s"), Value("x"));
    EXPECT_GE(after->updatedAt, before->updatedAt);
    EXPECT_EQ(after->createdAt, before->createdAt);
}

TEST_F(MemoryEngineTest, MissingTargetsReportZero) {
    EXPECT_FALSE(engine->getDocument("none", "1").has_value());
    EXPECT_EQ(engine->updateDocument("none", "1", {{"n", Value(1)}}), 0u);
    EXPECT_EQ(engine->deleteDocument("none", "1"), 0u);
    EXPECT_EQ(engine->countDocuments("none", {}), 0u);
    EXPECT_TRUE(engine->listDocuments("none", {}).empty());
}

TEST_F(MemoryEngineTest, DeleteIsIdempotent) {
    auto id = engine->createDocument("a", {{"n", Value(1)}});
    EXPECT_EQ(engine->deleteDocument("a", id), 1u);
    EXPECT_EQ(engine->deleteDocument("a", id), 0u);
    EXPECT_FALSE(engine->getDocument("a", id).has_value());
}

TEST_F(MemoryEngineTest, MultiKeySortIsStable) {
    engine->createDocument("p", {{"team", Value("red")}, {"score", Value(3)}});
    engine->createDocument("p", {{"team", Value("blue")}, {"score", Value(3)}});
    engine->createDocument("p", {{"team", Value("red")}, {"score", Value(9)}});
    engine->createDocument("p", {{"team", Value("blue")}, {"score", Value(1)}});
    engine->createDocument("p", {{"team", Value("red")}, {"score", Value(3)}});

    ListOptions options;
    options.sort = {{"team", 1}, {"score", -1}};
    auto ids = idsOf(engine->listDocuments("p", options));
    std::vector<std::string> expected{"2", "4", "3", "1", "5"};
    EXPECT_EQ(ids, expected);
}

TEST_F(MemoryEngineTest, MissingSortFieldSortsFirstAscending) {
    engine->createDocument("p", {{"rank", Value(2)}});
    engine->createDocument("p", {{"other", Value(1)}});
    engine->createDocument("p", {{"rank", Value(1)}});

    ListOptions options;
    options.sort = {{"rank", 1}};
    std::vector<std::string> expected{"2", "3", "1"};
    EXPECT_EQ(idsOf(engine->listDocuments("p", options)), expected);
}

TEST_F(MemoryEngineTest, SortByMetadataField) {
    engine->createDocument("p", {{"_id", Value("b")}});
    engine->createDocument("p", {{"_id", Value("a")}});
    engine->createDocument("p", {{"_id", Value("c")}});

    ListOptions options;
    options.sort = {{"_id", -1}};
    std::vector<std::string> expected{"c", "b", "a"};
    EXPECT_EQ(idsOf(engine->listDocuments("p", options)), expected);
}

TEST_F(MemoryEngineTest, FilterThenSkipThenLimit) {
    for (int i = 0; i < 10; ++i) {
        engine->createDocument(
            "n", {{"i", Value(i)}, {"even", Value(i % 2 == 0)}});
    }
    ListOptions options;
    options.query = {{"even", Value(true)}};
    options.sort = {{"i", -1}};
    options.skip = 1;
    options.limit = 2;

    auto docs = engine->listDocuments("n", options);
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0].fields.at("i"), Value(6));
    EXPECT_EQ(docs[1].fields.at("i"), Value(4));
    EXPECT_EQ(engine->countDocuments("n", options.query), 5u);
}

TEST_F(MemoryEngineTest, ZeroLimitAndLargeSkipReturnNothing) {
    engine->createDocument("n", {{"i", Value(1)}});
    ListOptions zero;
    zero.limit = 0;
    EXPECT_TRUE(engine->listDocuments("n", zero).empty());

    ListOptions past;
    past.skip = 5;
    EXPECT_TRUE(engine->listDocuments("n", past).empty());
}

TEST_F(MemoryEngineTest, UnlimitedReturnsEverything) {
    for (int i = 0; i < 150; ++i) {
        engine->createDocument("n", {{"i", Value(i)}});
    }
    ListOptions options;
    EXPECT_EQ(engine->listDocuments("n", options).size(), DEFAULT_LIST_LIMIT);
    options.limit = UNLIMITED;
    EXPECT_EQ(engine->listDocuments("n", options).size(), 150u);
}

TEST_F(MemoryEngineTest, ListCollectionsAndClose) {
    engine->createDocument("zeta", {{"n", Value(1)}});
    engine->createDocument("alpha", {{"n", Value(1)}});
    std::vector<std::string> expected{"alpha", "zeta"};
    EXPECT_EQ(engine->listCollections(), expected);

    engine->close();
    EXPECT_TRUE(engine->listCollections().empty());
}
