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

#ifndef DOCSTORE_STORE_ENGINE_ENGINE_SELECTOR_HPP
#define DOCSTORE_STORE_ENGINE_ENGINE_SELECTOR_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../core/engine.hpp"
#include "config/sections/store_config.hpp"

namespace docstore::store {

enum class SelectorState : uint8_t { Uninitialized, Probing, Bound, Closed };

[[nodiscard]] std::string_view selectorStateToString(
    SelectorState state) noexcept;

/**
 * @brief Engine constructors used while probing.
 *
 * A factory reports an unreachable backend by throwing
 * BackendUnavailableError. An empty `document` factory means the document
 * engine is not available in this build.
 */
struct EngineFactories {
    using RelationalFactory =
        std::function<std::unique_ptr<StorageEngine>(const std::string&)>;
    using DocumentFactory = std::function<std::unique_ptr<StorageEngine>(
        const std::string&, const std::string&)>;
    using MemoryFactory = std::function<std::unique_ptr<StorageEngine>()>;

    RelationalFactory relational;
    DocumentFactory document;
    MemoryFactory memory;

    /// Factories constructing the engines compiled into this build.
    [[nodiscard]] static EngineFactories defaults();
};

/**
 * @brief Lazily binds one storage engine and caches it until close().
 *
 * Engines are probed in priority order: relational, document, memory.
 * An engine is only probed when its descriptor is configured; the
 * in-memory engine always succeeds.
 */
class EngineSelector {
public:
    explicit EngineSelector(config::StoreConfig config,
                            EngineFactories factories = EngineFactories::defaults());
    ~EngineSelector();

    EngineSelector(const EngineSelector&) = delete;
    EngineSelector& operator=(const EngineSelector&) = delete;

    /**
     * @brief The bound engine, probing first if none is bound.
     *
     * @throws Whatever a factory throws other than BackendUnavailableError;
     * the selector is then left unbound.
     */
    StorageEngine& engine();

    /**
     * @brief Close the bound engine, if any, and forget it.
     *
     * The next engine() call probes again.
     */
    void close();

    [[nodiscard]] SelectorState state() const;
    [[nodiscard]] std::optional<EngineKind> boundKind() const;
    [[nodiscard]] const config::StoreConfig& config() const noexcept {
        return config_;
    }

private:
    config::StoreConfig config_;
    EngineFactories factories_;
    std::unique_ptr<StorageEngine> engine_;
    SelectorState state_{SelectorState::Uninitialized};
    mutable std::mutex mutex_;

    std::unique_ptr<StorageEngine> probe();
};

}  // namespace docstore::store

#endif  // DOCSTORE_STORE_ENGINE_ENGINE_SELECTOR_HPP
