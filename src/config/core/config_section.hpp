/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Typed view over one object of the configuration document

**************************************************/

#ifndef DOCSTORE_CONFIG_CORE_CONFIG_SECTION_HPP
#define DOCSTORE_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "exception.hpp"

namespace docstore::config {

using json = nlohmann::json;

/**
 * @brief What a section struct provides to ConfigSection.
 *
 * PATH is a JSON pointer into the whole document, e.g. "/docstore/store".
 */
template <typename T>
concept SectionFields = std::default_initializable<T> &&
                        requires(const T& section, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { section.serialize() } -> std::same_as<json>;
    { T::deserialize(j) } -> std::same_as<T>;
    { T::generateSchema() } -> std::same_as<json>;
};

namespace detail {

// Objects merge key by key; null leaves the target alone.
inline void overlay(json& target, const json& source) {
    if (!source.is_object()) {
        return;
    }
    for (const auto& [key, value] : source.items()) {
        if (value.is_null()) {
            continue;
        }
        auto it = target.find(key);
        if (value.is_object() && it != target.end() && it->is_object()) {
            overlay(*it, value);
        } else {
            target[key] = value;
        }
    }
}

}  // namespace detail

/**
 * @brief CRTP base giving a section struct its JSON plumbing.
 *
 * Missing keys keep their defaults. A key holding the wrong JSON type is an
 * error rather than silently ignored.
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] json toJson() const { return self().serialize(); }

    /**
     * @throws InvalidConfigError if @p j is not an object or a key has the
     * wrong type.
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        if (!j.is_object()) {
            THROW_INVALID_CONFIG_ERROR("Section " + std::string(path()) +
                                       " must be an object, got " +
                                       std::string(j.type_name()));
        }
        try {
            return Derived::deserialize(j);
        } catch (const json::exception& e) {
            THROW_INVALID_CONFIG_ERROR("Section " + std::string(path()) +
                                       ": " + e.what());
        }
    }

    /// Like fromJson(), but reports failure as nullopt.
    [[nodiscard]] static std::optional<Derived> tryFromJson(const json& j) {
        try {
            return fromJson(j);
        } catch (const InvalidConfigError&) {
            return std::nullopt;
        }
    }

    /**
     * @brief Read this section out of a whole configuration document.
     *
     * A document without the section yields defaults.
     */
    [[nodiscard]] static Derived fromDocument(const json& root) {
        const json::json_pointer pointer{std::string(path())};
        if (!root.contains(pointer)) {
            return defaults();
        }
        return fromJson(root.at(pointer));
    }

    /// Overlay the non-null values of @p other onto this section.
    void merge(const Derived& other) {
        json combined = toJson();
        detail::overlay(combined, other.toJson());
        self() = Derived::deserialize(combined);
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == other.toJson();
    }

private:
    [[nodiscard]] const Derived& self() const {
        static_assert(SectionFields<Derived>);
        return static_cast<const Derived&>(*this);
    }
    [[nodiscard]] Derived& self() { return static_cast<Derived&>(*this); }
};

}  // namespace docstore::config

#endif  // DOCSTORE_CONFIG_CORE_CONFIG_SECTION_HPP
