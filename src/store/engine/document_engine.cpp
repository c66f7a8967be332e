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

#include "document_engine.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/builder/basic/sub_array.hpp>
#include <bsoncxx/builder/basic/sub_document.hpp>
#include <bsoncxx/document/view.hpp>
#include <bsoncxx/oid.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/uri.hpp>
#include <spdlog/spdlog.h>

#include "../core/types.hpp"

namespace docstore::store {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using bsoncxx::builder::basic::sub_array;
using bsoncxx::builder::basic::sub_document;

namespace {

void ensureDriverInstance() {
    // The driver must be initialized exactly once per process
    static mongocxx::instance instance{};
}

bsoncxx::types::b_date toDate(Timestamp ts) {
    return bsoncxx::types::b_date{
        std::chrono::duration_cast<std::chrono::milliseconds>(
            ts.time_since_epoch())};
}

Timestamp fromDate(const bsoncxx::types::b_date& date) {
    return Timestamp{
        std::chrono::duration_cast<std::chrono::microseconds>(date.value)};
}

void appendValue(sub_array& arr, const Value& value);

void appendValue(sub_document& doc, const std::string& key,
                 const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            doc.append(kvp(key, bsoncxx::types::b_null{}));
            break;
        case Value::Type::Boolean:
            doc.append(kvp(key, bsoncxx::types::b_bool{value.asBool()}));
            break;
        case Value::Type::Integer:
            doc.append(kvp(key, bsoncxx::types::b_int64{value.asInteger()}));
            break;
        case Value::Type::Float:
            doc.append(kvp(key, bsoncxx::types::b_double{value.asFloat()}));
            break;
        case Value::Type::String:
            doc.append(kvp(key, value.asString()));
            break;
        case Value::Type::Timestamp:
            doc.append(kvp(key, toDate(value.asTimestamp())));
            break;
        case Value::Type::Object:
            doc.append(kvp(key, [&value](sub_document sub) {
                for (const auto& [name, item] : value.asObject()) {
                    appendValue(sub, name, item);
                }
            }));
            break;
        case Value::Type::Array:
            doc.append(kvp(key, [&value](sub_array sub) {
                for (const auto& item : value.asArray()) {
                    appendValue(sub, item);
                }
            }));
            break;
    }
}

void appendValue(sub_array& arr, const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            arr.append(bsoncxx::types::b_null{});
            break;
        case Value::Type::Boolean:
            arr.append(bsoncxx::types::b_bool{value.asBool()});
            break;
        case Value::Type::Integer:
            arr.append(bsoncxx::types::b_int64{value.asInteger()});
            break;
        case Value::Type::Float:
            arr.append(bsoncxx::types::b_double{value.asFloat()});
            break;
        case Value::Type::String:
            arr.append(value.asString());
            break;
        case Value::Type::Timestamp:
            arr.append(toDate(value.asTimestamp()));
            break;
        case Value::Type::Object:
            arr.append([&value](sub_document sub) {
                for (const auto& [name, item] : value.asObject()) {
                    appendValue(sub, name, item);
                }
            });
            break;
        case Value::Type::Array:
            arr.append([&value](sub_array sub) {
                for (const auto& item : value.asArray()) {
                    appendValue(sub, item);
                }
            });
            break;
    }
}

Value fromElement(const bsoncxx::document::element& element) {
    switch (element.type()) {
        case bsoncxx::type::k_null:
            return Value{};
        case bsoncxx::type::k_bool:
            return Value{element.get_bool().value};
        case bsoncxx::type::k_int32:
            return Value{element.get_int32().value};
        case bsoncxx::type::k_int64:
            return Value{element.get_int64().value};
        case bsoncxx::type::k_double:
            return Value{element.get_double().value};
        case bsoncxx::type::k_string:
            return Value{std::string(element.get_string().value)};
        case bsoncxx::type::k_date:
            return Value{fromDate(element.get_date())};
        case bsoncxx::type::k_oid:
            return Value{element.get_oid().value.to_string()};
        case bsoncxx::type::k_decimal128:
            return Value{element.get_decimal128().value.to_string()};
        case bsoncxx::type::k_document: {
            Value::Object object;
            for (const auto& child : element.get_document().value) {
                object.emplace(std::string(child.key()), fromElement(child));
            }
            return Value{std::move(object)};
        }
        case bsoncxx::type::k_array: {
            Value::Array array;
            for (const auto& child : element.get_array().value) {
                array.push_back(fromElement(child));
            }
            return Value{std::move(array)};
        }
        default:
            spdlog::debug("Unsupported BSON type in field {}; reading null",
                          std::string(element.key()));
            return Value{};
    }
}

std::string idOf(const bsoncxx::document::element& element) {
    switch (element.type()) {
        case bsoncxx::type::k_oid:
            return element.get_oid().value.to_string();
        case bsoncxx::type::k_int32:
            return std::to_string(element.get_int32().value);
        case bsoncxx::type::k_int64:
            return std::to_string(element.get_int64().value);
        case bsoncxx::type::k_string:
            return std::string(element.get_string().value);
        default:
            return fromElement(element).toString();
    }
}

Document toDocument(const bsoncxx::document::view& view) {
    Document doc;
    for (const auto& element : view) {
        std::string key(element.key());
        if (key == ID_FIELD) {
            doc.id = idOf(element);
        } else if (key == CREATED_AT_FIELD &&
                   element.type() == bsoncxx::type::k_date) {
            doc.createdAt = fromDate(element.get_date());
        } else if (key == UPDATED_AT_FIELD &&
                   element.type() == bsoncxx::type::k_date) {
            doc.updatedAt = fromDate(element.get_date());
        } else {
            doc.fields.emplace(std::move(key), fromElement(element));
        }
    }
    return doc;
}

bool isObjectIdHex(const std::string& id) {
    return id.size() == 24 &&
           std::all_of(id.begin(), id.end(), [](unsigned char c) {
               return std::isxdigit(c) != 0;
           });
}

std::optional<int64_t> parseInteger(const std::string& id) {
    int64_t number = 0;
    const char* end = id.data() + id.size();
    auto [ptr, ec] = std::from_chars(id.data(), end, number);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return number;
}

// Matches every native form a string id may have been stored as
void appendIdMatch(sub_document& doc, const std::string& id) {
    doc.append(kvp(std::string(ID_FIELD), [&id](sub_document match) {
        match.append(kvp("$in", [&id](sub_array candidates) {
            if (isObjectIdHex(id)) {
                candidates.append(bsoncxx::oid{id});
            }
            candidates.append(id);
            if (auto number = parseInteger(id)) {
                candidates.append(bsoncxx::types::b_int64{*number});
            }
        }));
    }));
}

bsoncxx::document::value idFilter(const std::string& id) {
    bsoncxx::builder::basic::document filter;
    appendIdMatch(filter, id);
    return filter.extract();
}

bsoncxx::document::value queryFilter(const QuerySpec& query) {
    bsoncxx::builder::basic::document filter;
    for (const auto& [name, expected] : query) {
        if (name == ID_FIELD && (expected.isString() || expected.isInteger())) {
            appendIdMatch(filter, expected.toString());
        } else {
            appendValue(filter, name, expected);
        }
    }
    return filter.extract();
}

}  // namespace

//------------------------------------------------------------------------------
// DocumentEngine Implementation
//------------------------------------------------------------------------------

struct DocumentEngine::Connection {
    explicit Connection(const std::string& uri) : client(mongocxx::uri{uri}) {}

    mongocxx::client client;
};

DocumentEngine::DocumentEngine(const std::string& uri,
                               const std::string& databaseName)
    : databaseName_(databaseName) {
    if (uri.empty()) {
        THROW_BACKEND_UNAVAILABLE_ERROR("Empty MongoDB connection string");
    }
    try {
        ensureDriverInstance();
        conn_ = std::make_unique<Connection>(uri);
        conn_->client[databaseName_].run_command(make_document(kvp("ping", 1)));
    } catch (const std::exception& e) {
        conn_.reset();
        THROW_BACKEND_UNAVAILABLE_ERROR("Cannot connect to MongoDB database '" +
                                        databaseName_ + "': " + e.what());
    }
    spdlog::info("Document engine connected to database {}", databaseName_);
}

DocumentEngine::~DocumentEngine() = default;

template <typename Func>
auto DocumentEngine::guarded(std::string_view operation, Func&& func) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return func();
    } catch (const ValidationError&) {
        throw;
    } catch (const BackendOperationError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Document {} failed: {}", operation, e.what());
        THROW_BACKEND_OPERATION_ERROR("Document " + std::string(operation) +
                                      " failed: " + e.what());
    }
}

DocumentEngine::Connection& DocumentEngine::connection() {
    if (!conn_) {
        THROW_BACKEND_OPERATION_ERROR("Document engine is closed");
    }
    return *conn_;
}

std::vector<std::string> DocumentEngine::listCollections() {
    return guarded("listCollections", [&]() {
        auto names =
            connection().client[databaseName_].list_collection_names();
        std::sort(names.begin(), names.end());
        return names;
    });
}

std::string DocumentEngine::createDocument(const std::string& collection,
                                           const Fields& fields) {
    Fields values = fields;
    std::optional<Value> rawId;
    if (auto it = values.find(std::string(ID_FIELD)); it != values.end()) {
        rawId = it->second;
    }
    DocumentMeta meta = extractMeta(values);

    auto now = currentTimestamp();
    Timestamp createdAt = meta.createdAt.value_or(now);
    Timestamp updatedAt = std::max(meta.updatedAt.value_or(now), createdAt);

    bsoncxx::builder::basic::document doc;
    std::string id;
    if (rawId) {
        appendValue(doc, std::string(ID_FIELD), *rawId);
        id = *meta.id;
    } else {
        bsoncxx::oid oid;
        doc.append(kvp(std::string(ID_FIELD), oid));
        id = oid.to_string();
    }
    for (const auto& [name, value] : values) {
        appendValue(doc, name, value);
    }
    doc.append(kvp(std::string(CREATED_AT_FIELD), toDate(createdAt)));
    doc.append(kvp(std::string(UPDATED_AT_FIELD), toDate(updatedAt)));

    return guarded("create", [&]() {
        connection().client[databaseName_][collection].insert_one(doc.view());
        spdlog::debug("Inserted document {} into collection {}", id,
                      collection);
        return id;
    });
}

std::optional<Document> DocumentEngine::getDocument(
    const std::string& collection, const std::string& id) {
    return guarded("get", [&]() -> std::optional<Document> {
        auto found = connection().client[databaseName_][collection].find_one(
            idFilter(id).view());
        if (!found) {
            return std::nullopt;
        }
        return toDocument(found->view());
    });
}

std::size_t DocumentEngine::updateDocument(const std::string& collection,
                                           const std::string& id,
                                           const Fields& fields) {
    bsoncxx::builder::basic::document update;
    if (!fields.empty()) {
        update.append(kvp("$set", [&fields](sub_document set) {
            for (const auto& [name, value] : fields) {
                appendValue(set, name, value);
            }
        }));
    }
    update.append(kvp("$max", [](sub_document max) {
        max.append(kvp(std::string(UPDATED_AT_FIELD),
                       toDate(currentTimestamp())));
    }));

    return guarded("update", [&]() -> std::size_t {
        auto result = connection().client[databaseName_][collection].update_one(
            idFilter(id).view(), update.view());
        if (!result) {
            return 0;
        }
        return static_cast<std::size_t>(result->matched_count());
    });
}

std::size_t DocumentEngine::deleteDocument(const std::string& collection,
                                           const std::string& id) {
    return guarded("delete", [&]() -> std::size_t {
        auto result = connection().client[databaseName_][collection].delete_one(
            idFilter(id).view());
        if (!result) {
            return 0;
        }
        return static_cast<std::size_t>(result->deleted_count());
    });
}

std::vector<Document> DocumentEngine::listDocuments(
    const std::string& collection, const ListOptions& options) {
    std::vector<Document> results;
    // A zero limit means "no limit" to the server
    if (options.limit == 0) {
        return results;
    }

    auto filter = queryFilter(options.query);
    bsoncxx::builder::basic::document sort;
    for (const auto& key : options.sort) {
        sort.append(kvp(key.field, key.direction > 0 ? 1 : -1));
    }
    auto sortDoc = sort.extract();

    mongocxx::options::find findOptions;
    if (!options.sort.empty()) {
        findOptions.sort(sortDoc.view());
    }
    if (options.limit != UNLIMITED) {
        findOptions.limit(static_cast<int64_t>(options.limit));
    }
    if (options.skip > 0) {
        findOptions.skip(static_cast<int64_t>(options.skip));
    }

    return guarded("list", [&]() {
        auto cursor = connection().client[databaseName_][collection].find(
            filter.view(), findOptions);
        for (auto&& view : cursor) {
            results.push_back(toDocument(view));
        }
        return results;
    });
}

std::size_t DocumentEngine::countDocuments(const std::string& collection,
                                           const QuerySpec& query) {
    auto filter = queryFilter(query);
    return guarded("count", [&]() -> std::size_t {
        return static_cast<std::size_t>(
            connection().client[databaseName_][collection].count_documents(
                filter.view()));
    });
}

void DocumentEngine::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn_) {
        spdlog::info("Closing document engine ({})", databaseName_);
    }
    conn_.reset();
}

}  // namespace docstore::store
