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

#ifndef DOCSTORE_STORE_STORE_HPP
#define DOCSTORE_STORE_STORE_HPP

/**
 * @file store.hpp
 * @brief Aggregated header for the document store.
 *
 * Components:
 * - core: Value, Document, StorageEngine and the exception types
 * - sqlite: Database, Statement, Transaction over SQLite
 * - query: QueryBuilder for parameterized SQL
 * - engine: memory, relational and (optionally) MongoDB engines plus the
 *   EngineSelector
 * - StoreFacade: the public entry point
 */

#include <memory>

#include "core/engine.hpp"
#include "core/types.hpp"
#include "core/value.hpp"

#include "sqlite/database.hpp"
#include "sqlite/statement.hpp"
#include "sqlite/transaction.hpp"

#include "query/query_builder.hpp"

#include "engine/engine_selector.hpp"
#include "engine/memory_engine.hpp"
#include "engine/relational_engine.hpp"
#include "engine/schema.hpp"

#ifdef DOCSTORE_HAS_MONGOCXX
#include "engine/document_engine.hpp"
#endif

#include "store_facade.hpp"

namespace docstore::store {

/**
 * @brief Build a facade from a configuration document.
 *
 * Reads the `/docstore/store` section, then overlays the environment.
 */
[[nodiscard]] inline std::unique_ptr<StoreFacade> createStore(
    const config::json& root = config::json::object()) {
    auto cfg = config::StoreConfig::fromDocument(root);
    cfg.applyEnvironment();
    return std::make_unique<StoreFacade>(std::move(cfg));
}

}  // namespace docstore::store

#endif  // DOCSTORE_STORE_STORE_HPP
