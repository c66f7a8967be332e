#ifndef DOCSTORE_STORE_CORE_VALUE_HPP
#define DOCSTORE_STORE_CORE_VALUE_HPP

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace docstore::store {

using json = nlohmann::json;

/// UTC wall-clock instant with microsecond resolution.
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

/**
 * @brief Current time truncated to Timestamp resolution.
 */
[[nodiscard]] Timestamp currentTimestamp();

/**
 * @brief Format a timestamp as "YYYY-MM-DD HH:MM:SS.ffffff" (UTC).
 *
 * The fixed-width layout sorts lexicographically in chronological order,
 * which the relational engine relies on.
 */
[[nodiscard]] std::string formatTimestamp(Timestamp ts);

/**
 * @brief Parse "YYYY-MM-DD[ T]HH:MM:SS[.fraction][Z]".
 * @return The timestamp, or nullopt if the text is not in that layout.
 */
[[nodiscard]] std::optional<Timestamp> parseTimestamp(std::string_view text);

/**
 * @brief A document field value.
 *
 * Tagged union over null, boolean, 64-bit integer, double, string,
 * timestamp, nested mapping and sequence.
 */
class Value {
public:
    using Object = std::map<std::string, Value>;
    using Array = std::vector<Value>;

    enum class Type : uint8_t {
        Null,
        Boolean,
        Integer,
        Float,
        String,
        Timestamp,
        Object,
        Array
    };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : data_(value) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T value) : data_(static_cast<int64_t>(value)) {}

    template <std::floating_point T>
    Value(T value) : data_(static_cast<double>(value)) {}

    Value(const char* value) : data_(std::string(value)) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(std::string_view value) : data_(std::string(value)) {}
    Value(Timestamp value) : data_(value) {}
    Value(std::chrono::system_clock::time_point value)
        : data_(std::chrono::floor<std::chrono::microseconds>(value)) {}
    Value(Object value) : data_(std::move(value)) {}
    Value(Array value) : data_(std::move(value)) {}

    [[nodiscard]] Type type() const noexcept {
        return static_cast<Type>(data_.index());
    }

    [[nodiscard]] bool isNull() const noexcept { return type() == Type::Null; }
    [[nodiscard]] bool isBool() const noexcept {
        return type() == Type::Boolean;
    }
    [[nodiscard]] bool isInteger() const noexcept {
        return type() == Type::Integer;
    }
    [[nodiscard]] bool isFloat() const noexcept {
        return type() == Type::Float;
    }
    [[nodiscard]] bool isNumber() const noexcept {
        return isInteger() || isFloat();
    }
    [[nodiscard]] bool isString() const noexcept {
        return type() == Type::String;
    }
    [[nodiscard]] bool isTimestamp() const noexcept {
        return type() == Type::Timestamp;
    }
    [[nodiscard]] bool isObject() const noexcept {
        return type() == Type::Object;
    }
    [[nodiscard]] bool isArray() const noexcept {
        return type() == Type::Array;
    }

    /**
     * @brief Typed accessors.
     * @throws ValidationError if the value holds a different type.
     */
    [[nodiscard]] bool asBool() const;
    [[nodiscard]] int64_t asInteger() const;
    [[nodiscard]] double asFloat() const;  ///< Accepts integers too.
    [[nodiscard]] const std::string& asString() const;
    [[nodiscard]] Timestamp asTimestamp() const;
    [[nodiscard]] const Object& asObject() const;
    [[nodiscard]] const Array& asArray() const;

    /**
     * @brief Three-way comparison defining a total order across types.
     *
     * null < boolean < number < string < timestamp < object < array.
     * Integers and floats compare numerically.
     *
     * @return negative, zero or positive.
     */
    [[nodiscard]] int compare(const Value& other) const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    /**
     * @brief Human readable form; strings are returned without quotes.
     */
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static Value fromJson(const json& j);

    [[nodiscard]] static std::string_view typeName(Type type) noexcept;

private:
    std::variant<std::nullptr_t, bool, int64_t, double, std::string,
                 Timestamp, Object, Array>
        data_{nullptr};
};

using Fields = Value::Object;

/// Field name -> expected value; all entries must match (conjunction).
using QuerySpec = Value::Object;

struct SortKey {
    std::string field;
    int direction{1};  ///< > 0 ascending, < 0 descending
};

using SortSpec = std::vector<SortKey>;

/// Reserved field names managed by the store.
inline constexpr std::string_view ID_FIELD = "_id";
inline constexpr std::string_view CREATED_AT_FIELD = "created_at";
inline constexpr std::string_view UPDATED_AT_FIELD = "updated_at";

[[nodiscard]] inline bool isReservedField(std::string_view name) noexcept {
    return name == ID_FIELD || name == CREATED_AT_FIELD ||
           name == UPDATED_AT_FIELD;
}

inline constexpr std::size_t DEFAULT_LIST_LIMIT = 100;
inline constexpr std::size_t UNLIMITED = std::numeric_limits<std::size_t>::max();

struct ListOptions {
    QuerySpec query;
    SortSpec sort;
    std::size_t limit{DEFAULT_LIST_LIMIT};
    std::size_t skip{0};
};

struct Document {
    std::string id;
    Fields fields;
    Timestamp createdAt{};
    Timestamp updatedAt{};

    /**
     * @brief Fields plus the reserved metadata entries.
     */
    [[nodiscard]] json toJson() const;
};

/**
 * @brief Reserved entries split off a caller supplied field map.
 */
struct DocumentMeta {
    std::optional<std::string> id;
    std::optional<Timestamp> createdAt;
    std::optional<Timestamp> updatedAt;
};

/**
 * @brief Move `_id`, `created_at` and `updated_at` out of @p fields.
 *
 * @throws ValidationError if `_id` is not a string or integer, or a
 * timestamp field holds a non-timestamp value.
 */
DocumentMeta extractMeta(Fields& fields);

/**
 * @brief String form of an identifier value (string or integer).
 * @throws ValidationError for any other type.
 */
[[nodiscard]] std::string idToString(const Value& id);

/**
 * @brief Look up a field by name, treating reserved names as metadata.
 * @return Copy of the value, or nullopt if the document lacks the field.
 */
[[nodiscard]] std::optional<Value> fieldOf(const Document& doc,
                                           const std::string& name);

/**
 * @brief True if every entry of @p query equals the document's field.
 */
[[nodiscard]] bool matchesQuery(const Document& doc, const QuerySpec& query);

}  // namespace docstore::store

#endif  // DOCSTORE_STORE_CORE_VALUE_HPP
