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

#include "engine_selector.hpp"

#include <spdlog/spdlog.h>

#include "../core/types.hpp"
#include "memory_engine.hpp"
#include "relational_engine.hpp"

#ifdef DOCSTORE_HAS_MONGOCXX
#include "document_engine.hpp"
#endif

namespace docstore::store {

std::string_view selectorStateToString(SelectorState state) noexcept {
    switch (state) {
        case SelectorState::Uninitialized:
            return "uninitialized";
        case SelectorState::Probing:
            return "probing";
        case SelectorState::Bound:
            return "bound";
        case SelectorState::Closed:
            return "closed";
    }
    return "unknown";
}

EngineFactories EngineFactories::defaults() {
    EngineFactories factories;
    factories.relational = [](const std::string& descriptor) {
        return std::make_unique<RelationalEngine>(descriptor);
    };
#ifdef DOCSTORE_HAS_MONGOCXX
    factories.document = [](const std::string& uri,
                            const std::string& database) {
        return std::make_unique<DocumentEngine>(uri, database);
    };
#endif
    factories.memory = []() { return std::make_unique<MemoryEngine>(); };
    return factories;
}

//------------------------------------------------------------------------------
// EngineSelector Implementation
//------------------------------------------------------------------------------

EngineSelector::EngineSelector(config::StoreConfig config,
                               EngineFactories factories)
    : config_(std::move(config)), factories_(std::move(factories)) {}

EngineSelector::~EngineSelector() {
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::error("Failed to close storage engine: {}", e.what());
    }
}

StorageEngine& EngineSelector::engine() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (engine_) {
        return *engine_;
    }

    state_ = SelectorState::Probing;
    try {
        engine_ = probe();
    } catch (...) {
        state_ = SelectorState::Uninitialized;
        throw;
    }
    state_ = SelectorState::Bound;
    spdlog::info("Storage engine bound: {}",
                 engineKindToString(engine_->kind()));
    return *engine_;
}

std::unique_ptr<StorageEngine> EngineSelector::probe() {
    if (config_.hasRelational() && factories_.relational) {
        try {
            return factories_.relational(config_.relationalUrl);
        } catch (const BackendUnavailableError& e) {
            spdlog::error("Relational engine unavailable: {}", e.what());
        }
    }

    if (config_.hasDocument()) {
        if (!factories_.document) {
            spdlog::warn(
                "Document store configured but this build has no document "
                "engine; skipping");
        } else {
            try {
                return factories_.document(config_.documentUri,
                                           config_.documentDatabase);
            } catch (const BackendUnavailableError& e) {
                spdlog::error("Document engine unavailable: {}", e.what());
            }
        }
    }

    spdlog::warn(
        "No persistent storage backend available; using in-memory storage. "
        "Data will not survive a process restart");
    return factories_.memory();
}

void EngineSelector::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!engine_) {
        return;
    }
    auto engine = std::move(engine_);
    state_ = SelectorState::Closed;
    spdlog::info("Closing storage engine: {}",
                 engineKindToString(engine->kind()));
    engine->close();
}

SelectorState EngineSelector::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<EngineKind> EngineSelector::boundKind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!engine_) {
        return std::nullopt;
    }
    return engine_->kind();
}

}  // namespace docstore::store
