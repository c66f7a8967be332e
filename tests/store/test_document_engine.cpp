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
 * test_document_engine.cpp
 *
 * Tests for the MongoDB document engine
 * - Unreachable servers report BackendUnavailableError
 * - CRUD, query, sort and count against a live server
 *
 * Live tests run only when DOCSTORE_TEST_MONGO_URI names a server.
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <string>

#include "store/core/types.hpp"
#include "store/engine/document_engine.hpp"

using namespace docstore::store;

// ==================== DocumentEngine Tests ====================

TEST(DocumentEngineConnectTest, UnreachableServerIsUnavailable) {
    EXPECT_THROW(
        DocumentEngine("mongodb://127.0.0.1:1/?serverSelectionTimeoutMS=200",
                       "docstore_test"),
        BackendUnavailableError);
}

class DocumentEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* uri = std::getenv("DOCSTORE_TEST_MONGO_URI");
        if (uri == nullptr || *uri == '\0') {
            GTEST_SKIP() << "DOCSTORE_TEST_MONGO_URI not set";
        }
        engine = std::make_unique<DocumentEngine>(uri, "docstore_test");
        engine->deleteDocument("people", "seed");
        for (const auto& doc : engine->listDocuments("people", everything())) {
            engine->deleteDocument("people", doc.id);
        }
    }

    void TearDown() override {
        if (engine) {
            engine->close();
        }
    }

    static ListOptions everything() {
        ListOptions options;
        options.limit = UNLIMITED;
        return options;
    }

    std::unique_ptr<DocumentEngine> engine;
};

TEST_F(DocumentEngineTest, CreateGetUpdateDelete) {
    auto id = engine->createDocument("people", {{"name", Value("ada")},
                                                {"age", Value(36)}});
    EXPECT_EQ(id.size(), 24u);

    auto doc = engine->getDocument("people", id);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->fields.at("name"), Value("ada"));
    EXPECT_EQ(doc->fields.at("age"), Value(36));

    EXPECT_EQ(engine->updateDocument("people", id, {{"age", Value(37)}}), 1u);
    auto updated = engine->getDocument("people", id);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->fields.at("age"), Value(37));
    EXPECT_GE(updated->updatedAt, doc->updatedAt);

    EXPECT_EQ(engine->deleteDocument("people", id), 1u);
    EXPECT_EQ(engine->deleteDocument("people", id), 0u);
}

TEST_F(DocumentEngineTest, CallerSuppliedIds) {
    EXPECT_EQ(engine->createDocument("people", {{"_id", Value("seed")},
                                                {"name", Value("x")}}),
              "seed");
    EXPECT_TRUE(engine->getDocument("people", "seed").has_value());
    EXPECT_THROW(engine->createDocument("people", {{"_id", Value("seed")}}),
                 BackendOperationError);
}

TEST_F(DocumentEngineTest, QuerySortAndCount) {
    engine->createDocument("people", {{"team", Value("red")}, {"n", Value(2)}});
    engine->createDocument("people", {{"team", Value("blue")}, {"n", Value(1)}});
    engine->createDocument("people", {{"team", Value("red")}, {"n", Value(3)}});

    EXPECT_EQ(engine->countDocuments("people", {{"team", Value("red")}}), 2u);

    ListOptions options = everything();
    options.sort = {{"n", -1}};
    auto docs = engine->listDocuments("people", options);
    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ(docs[0].fields.at("n"), Value(3));
    EXPECT_EQ(docs[2].fields.at("n"), Value(1));

    options.limit = 0;
    EXPECT_TRUE(engine->listDocuments("people", options).empty());
}
