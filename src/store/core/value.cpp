#include "value.hpp"

#include <cstdio>

#include "types.hpp"

namespace docstore::store {

namespace {

int typeRank(Value::Type type) {
    switch (type) {
        case Value::Type::Null:
            return 0;
        case Value::Type::Boolean:
            return 1;
        case Value::Type::Integer:
        case Value::Type::Float:
            return 2;
        case Value::Type::String:
            return 3;
        case Value::Type::Timestamp:
            return 4;
        case Value::Type::Object:
            return 5;
        case Value::Type::Array:
            return 6;
    }
    return 7;
}

template <typename T>
int threeWay(const T& lhs, const T& rhs) {
    if (lhs < rhs) {
        return -1;
    }
    if (rhs < lhs) {
        return 1;
    }
    return 0;
}

bool readDigits(std::string_view text, std::size_t& pos, std::size_t width,
                int& out) {
    if (pos + width > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += width;
    out = value;
    return true;
}

bool expectChar(std::string_view text, std::size_t& pos, char expected) {
    if (pos >= text.size() || text[pos] != expected) {
        return false;
    }
    ++pos;
    return true;
}

std::string toIsoString(Timestamp ts) {
    std::string text = formatTimestamp(ts);
    text[10] = 'T';
    text += 'Z';
    return text;
}

}  // namespace

//------------------------------------------------------------------------------
// Timestamps
//------------------------------------------------------------------------------

Timestamp currentTimestamp() {
    return std::chrono::floor<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

std::string formatTimestamp(Timestamp ts) {
    using namespace std::chrono;

    auto dayPoint = floor<days>(ts);
    year_month_day ymd{dayPoint};
    hh_mm_ss<microseconds> time{ts - dayPoint};

    char buffer[40];
    std::snprintf(buffer, sizeof(buffer),
                  "%04d-%02u-%02u %02d:%02d:%02d.%06lld",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(time.hours().count()),
                  static_cast<int>(time.minutes().count()),
                  static_cast<int>(time.seconds().count()),
                  static_cast<long long>(time.subseconds().count()));
    return buffer;
}

std::optional<Timestamp> parseTimestamp(std::string_view text) {
    using namespace std::chrono;

    std::size_t pos = 0;
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!readDigits(text, pos, 4, y) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, mo) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, d)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != ' ' && text[pos] != 'T')) {
        return std::nullopt;
    }
    ++pos;
    if (!readDigits(text, pos, 2, h) || !expectChar(text, pos, ':') ||
        !readDigits(text, pos, 2, mi) || !expectChar(text, pos, ':') ||
        !readDigits(text, pos, 2, s)) {
        return std::nullopt;
    }

    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                       day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) {
        return std::nullopt;
    }
    return Timestamp{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{s} +
           microseconds{micros};
}

//------------------------------------------------------------------------------
// Value Implementation
//------------------------------------------------------------------------------

bool Value::asBool() const {
    if (!isBool()) {
        THROW_VALIDATION_ERROR("Expected boolean but value is " +
                               std::string(typeName(type())));
    }
    return std::get<bool>(data_);
}

int64_t Value::asInteger() const {
    if (!isInteger()) {
        THROW_VALIDATION_ERROR("Expected integer but value is " +
                               std::string(typeName(type())));
    }
    return std::get<int64_t>(data_);
}

double Value::asFloat() const {
    if (isInteger()) {
        return static_cast<double>(std::get<int64_t>(data_));
    }
    if (!isFloat()) {
        THROW_VALIDATION_ERROR("Expected float but value is " +
                               std::string(typeName(type())));
    }
    return std::get<double>(data_);
}

const std::string& Value::asString() const {
    if (!isString()) {
        THROW_VALIDATION_ERROR("Expected string but value is " +
                               std::string(typeName(type())));
    }
    return std::get<std::string>(data_);
}

Timestamp Value::asTimestamp() const {
    if (!isTimestamp()) {
        THROW_VALIDATION_ERROR("Expected timestamp but value is " +
                               std::string(typeName(type())));
    }
    return std::get<Timestamp>(data_);
}

const Value::Object& Value::asObject() const {
    if (!isObject()) {
        THROW_VALIDATION_ERROR("Expected object but value is " +
                               std::string(typeName(type())));
    }
    return std::get<Object>(data_);
}

const Value::Array& Value::asArray() const {
    if (!isArray()) {
        THROW_VALIDATION_ERROR("Expected array but value is " +
                               std::string(typeName(type())));
    }
    return std::get<Array>(data_);
}

int Value::compare(const Value& other) const {
    int lhsRank = typeRank(type());
    int rhsRank = typeRank(other.type());
    if (lhsRank != rhsRank) {
        return lhsRank < rhsRank ? -1 : 1;
    }

    switch (type()) {
        case Type::Null:
            return 0;
        case Type::Boolean:
            return threeWay(std::get<bool>(data_), std::get<bool>(other.data_));
        case Type::Integer:
        case Type::Float:
            if (isInteger() && other.isInteger()) {
                return threeWay(std::get<int64_t>(data_),
                                std::get<int64_t>(other.data_));
            }
            return threeWay(asFloat(), other.asFloat());
        case Type::String:
            return threeWay(std::get<std::string>(data_),
                            std::get<std::string>(other.data_));
        case Type::Timestamp:
            return threeWay(std::get<Timestamp>(data_),
                            std::get<Timestamp>(other.data_));
        case Type::Object: {
            const auto& lhs = std::get<Object>(data_);
            const auto& rhs = std::get<Object>(other.data_);
            auto lit = lhs.begin();
            auto rit = rhs.begin();
            for (; lit != lhs.end() && rit != rhs.end(); ++lit, ++rit) {
                if (int c = threeWay(lit->first, rit->first); c != 0) {
                    return c;
                }
                if (int c = lit->second.compare(rit->second); c != 0) {
                    return c;
                }
            }
            return threeWay(lhs.size(), rhs.size());
        }
        case Type::Array: {
            const auto& lhs = std::get<Array>(data_);
            const auto& rhs = std::get<Array>(other.data_);
            for (std::size_t i = 0; i < lhs.size() && i < rhs.size(); ++i) {
                if (int c = lhs[i].compare(rhs[i]); c != 0) {
                    return c;
                }
            }
            return threeWay(lhs.size(), rhs.size());
        }
    }
    return 0;
}

bool Value::operator==(const Value& other) const {
    if (isNumber() && other.isNumber()) {
        if (isInteger() && other.isInteger()) {
            return std::get<int64_t>(data_) == std::get<int64_t>(other.data_);
        }
        return asFloat() == other.asFloat();
    }
    return data_ == other.data_;
}

std::string Value::toString() const {
    switch (type()) {
        case Type::Null:
            return "null";
        case Type::Boolean:
            return std::get<bool>(data_) ? "true" : "false";
        case Type::Integer:
            return std::to_string(std::get<int64_t>(data_));
        case Type::Float:
            return json(std::get<double>(data_)).dump();
        case Type::String:
            return std::get<std::string>(data_);
        case Type::Timestamp:
            return formatTimestamp(std::get<Timestamp>(data_));
        case Type::Object:
        case Type::Array:
            return toJson().dump();
    }
    return {};
}

json Value::toJson() const {
    switch (type()) {
        case Type::Null:
            return nullptr;
        case Type::Boolean:
            return std::get<bool>(data_);
        case Type::Integer:
            return std::get<int64_t>(data_);
        case Type::Float:
            return std::get<double>(data_);
        case Type::String:
            return std::get<std::string>(data_);
        case Type::Timestamp:
            return toIsoString(std::get<Timestamp>(data_));
        case Type::Object: {
            json result = json::object();
            for (const auto& [key, value] : std::get<Object>(data_)) {
                result[key] = value.toJson();
            }
            return result;
        }
        case Type::Array: {
            json result = json::array();
            for (const auto& value : std::get<Array>(data_)) {
                result.push_back(value.toJson());
            }
            return result;
        }
    }
    return nullptr;
}

Value Value::fromJson(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
            return Value{};
        case json::value_t::boolean:
            return Value{j.get<bool>()};
        case json::value_t::number_integer:
            return Value{j.get<int64_t>()};
        case json::value_t::number_unsigned: {
            auto value = j.get<uint64_t>();
            if (value > static_cast<uint64_t>(
                            std::numeric_limits<int64_t>::max())) {
                return Value{static_cast<double>(value)};
            }
            return Value{static_cast<int64_t>(value)};
        }
        case json::value_t::number_float:
            return Value{j.get<double>()};
        case json::value_t::string:
            return Value{j.get<std::string>()};
        case json::value_t::object: {
            Object object;
            for (const auto& [key, value] : j.items()) {
                object.emplace(key, fromJson(value));
            }
            return Value{std::move(object)};
        }
        case json::value_t::array: {
            Array array;
            array.reserve(j.size());
            for (const auto& value : j) {
                array.push_back(fromJson(value));
            }
            return Value{std::move(array)};
        }
        default:
            THROW_VALIDATION_ERROR("Unsupported JSON value type: " +
                                   std::string(j.type_name()));
    }
}

std::string_view Value::typeName(Type type) noexcept {
    switch (type) {
        case Type::Null:
            return "null";
        case Type::Boolean:
            return "boolean";
        case Type::Integer:
            return "integer";
        case Type::Float:
            return "float";
        case Type::String:
            return "string";
        case Type::Timestamp:
            return "timestamp";
        case Type::Object:
            return "object";
        case Type::Array:
            return "array";
    }
    return "unknown";
}

//------------------------------------------------------------------------------
// Document helpers
//------------------------------------------------------------------------------

json Document::toJson() const {
    json result = Value{fields}.toJson();
    result[std::string(ID_FIELD)] = id;
    result[std::string(CREATED_AT_FIELD)] = toIsoString(createdAt);
    result[std::string(UPDATED_AT_FIELD)] = toIsoString(updatedAt);
    return result;
}

DocumentMeta extractMeta(Fields& fields) {
    DocumentMeta meta;

    if (auto it = fields.find(std::string(ID_FIELD)); it != fields.end()) {
        meta.id = idToString(it->second);
        fields.erase(it);
    }
    for (auto [name, slot] :
         {std::pair{CREATED_AT_FIELD, &meta.createdAt},
          std::pair{UPDATED_AT_FIELD, &meta.updatedAt}}) {
        auto it = fields.find(std::string(name));
        if (it == fields.end()) {
            continue;
        }
        if (!it->second.isTimestamp()) {
            THROW_VALIDATION_ERROR("Field '" + std::string(name) +
                                   "' must be a timestamp");
        }
        *slot = it->second.asTimestamp();
        fields.erase(it);
    }
    return meta;
}

std::string idToString(const Value& id) {
    if (id.isInteger()) {
        return std::to_string(id.asInteger());
    }
    if (id.isString()) {
        if (id.asString().empty()) {
            THROW_VALIDATION_ERROR("Document _id must not be empty");
        }
        return id.asString();
    }
    THROW_VALIDATION_ERROR("Document _id must be a string or integer, got " +
                           std::string(Value::typeName(id.type())));
}

std::optional<Value> fieldOf(const Document& doc, const std::string& name) {
    if (name == ID_FIELD) {
        return Value{doc.id};
    }
    if (name == CREATED_AT_FIELD) {
        return Value{doc.createdAt};
    }
    if (name == UPDATED_AT_FIELD) {
        return Value{doc.updatedAt};
    }
    auto it = doc.fields.find(name);
    if (it == doc.fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool matchesQuery(const Document& doc, const QuerySpec& query) {
    for (const auto& [name, expected] : query) {
        if (name == ID_FIELD) {
            if (!expected.isString() && !expected.isInteger()) {
                return false;
            }
            if (expected.toString() != doc.id) {
                return false;
            }
            continue;
        }
        auto actual = fieldOf(doc, name);
        if (!actual || *actual != expected) {
            return false;
        }
    }
    return true;
}

}  // namespace docstore::store
