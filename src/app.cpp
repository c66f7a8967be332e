/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Command line front end for the document store

**************************************************/

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/core/config_loader.hpp"
#include "config/core/exception.hpp"
#include "config/sections/logging_config.hpp"
#include "config/sections/store_config.hpp"
#include "logging/logging.hpp"
#include "store/store.hpp"

#include "atom/utils/argsview.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

using docstore::config::json;
using docstore::store::Fields;
using docstore::store::QuerySpec;
using docstore::store::SortSpec;
using docstore::store::StoreFacade;
using docstore::store::Value;

namespace {

constexpr int EXIT_INVALID = 2;
constexpr int EXIT_NOT_FOUND = 3;

struct CliRequest {
    std::string command;
    std::string collection;
    std::string id;
    std::string data;
    std::string query;
    std::string sort;
    int limit{static_cast<int>(docstore::store::DEFAULT_LIST_LIMIT)};
    int skip{0};
};

/**
 * @brief Parse a JSON object argument into a field map
 */
Fields parseObject(const std::string& text, const char* what) {
    if (text.empty()) {
        return {};
    }
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        THROW_VALIDATION_ERROR("--"s + what + " must be a JSON object");
    }
    return Value::fromJson(parsed).asObject();
}

/**
 * @brief Parse --sort: [["field", 1], ...] or [{"field": "f", "direction": -1}]
 */
SortSpec parseSort(const std::string& text) {
    SortSpec sort;
    if (text.empty()) {
        return sort;
    }
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        THROW_VALIDATION_ERROR("--sort must be a JSON array");
    }
    for (const auto& entry : parsed) {
        if (entry.is_array() && entry.size() == 2 && entry[0].is_string() &&
            entry[1].is_number_integer()) {
            sort.push_back({entry[0].get<std::string>(), entry[1].get<int>()});
        } else if (entry.is_object() && entry.contains("field")) {
            sort.push_back({entry.value("field", ""s),
                            entry.value("direction", 1)});
        } else {
            THROW_VALIDATION_ERROR("Invalid --sort entry: " + entry.dump());
        }
    }
    return sort;
}

json documentsToJson(const std::vector<docstore::store::Document>& docs) {
    json result = json::array();
    for (const auto& doc : docs) {
        result.push_back(doc.toJson());
    }
    return result;
}

json runCommand(StoreFacade& store, const CliRequest& request) {
    const auto& command = request.command;
    if (command == "collections") {
        return store.listCollections();
    }
    if (command == "create") {
        auto id = store.createDocument(request.collection,
                                       parseObject(request.data, "data"));
        return {{"_id", id}};
    }
    if (command == "get") {
        return store.getDocument(request.collection, request.id).toJson();
    }
    if (command == "update") {
        auto modified = store.updateDocument(
            request.collection, request.id, parseObject(request.data, "data"));
        return {{"modified", modified}};
    }
    if (command == "delete") {
        return {{"deleted",
                 store.deleteDocument(request.collection, request.id)}};
    }
    if (command == "list") {
        std::size_t limit = request.limit < 0
                                ? docstore::store::UNLIMITED
                                : static_cast<std::size_t>(request.limit);
        if (request.skip < 0) {
            THROW_VALIDATION_ERROR("--skip must not be negative");
        }
        return documentsToJson(store.listDocuments(
            request.collection, parseObject(request.query, "query"),
            parseSort(request.sort), limit,
            static_cast<std::size_t>(request.skip)));
    }
    if (command == "count") {
        return {{"count", store.countDocuments(
                              request.collection,
                              parseObject(request.query, "query"))}};
    }
    THROW_VALIDATION_ERROR("Unknown command '" + command +
                           "' (expected collections, create, get, update, "
                           "delete, list or count)");
}

}  // namespace

int main(int argc, char* argv[]) {
    atom::utils::ArgumentParser program("docstore"s);

    program.addArgument("command", atom::utils::ArgumentParser::ArgType::STRING,
                        true, ""s,
                        "collections, create, get, update, delete, list or "
                        "count",
                        {"x"});
    program.addArgument("collection",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Collection name", {"C"});
    program.addArgument("id", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Document id", {"i"});
    program.addArgument("data", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Document fields as a JSON object", {"d"});
    program.addArgument("query", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Equality filter as a JSON object", {"q"});
    program.addArgument("sort", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Sort keys as a JSON array", {"s"});
    program.addArgument("limit", atom::utils::ArgumentParser::ArgType::INTEGER,
                        false, 100, "Maximum documents to list (-1: all)",
                        {"n"});
    program.addArgument("skip", atom::utils::ArgumentParser::ArgType::INTEGER,
                        false, 0, "Documents to skip before listing", {"k"});
    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Path to a JSON config file", {"c"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Log level (trace/debug/info/warn/error)", {"l"});

    program.addDescription("Docstore Command Line Interface:");
    program.addEpilog("Backends: DATABASE_URL, MONGO_URI and MONGO_DB_NAME "
                      "override the config file.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    // NOTE: The command arguments' priority is higher than the config file
    docstore::config::LoggingConfig loggingConfig;
    docstore::config::StoreConfig storeConfig;
    try {
        json root = json::object();
        if (auto configPath = program.get<std::string>("config").value_or(""s);
            !configPath.empty()) {
            root = docstore::config::loadConfigFile(fs::path(configPath));
        }
        loggingConfig = docstore::config::LoggingConfig::fromDocument(root);
        storeConfig = docstore::config::StoreConfig::fromDocument(root);
    } catch (const docstore::config::ConfigError& e) {
        std::cerr << "Failed to load configuration: " << e.what() << '\n';
        return 1;
    }

    if (auto level = program.get<std::string>("log-level");
        level && !level->empty()) {
        loggingConfig.consoleLevel = docstore::config::logLevelFromString(*level);
    }
    docstore::logging::initialize(loggingConfig);
    storeConfig.applyEnvironment();

    CliRequest request;
    request.command = program.get<std::string>("command").value_or(""s);
    request.collection = program.get<std::string>("collection").value_or(""s);
    request.id = program.get<std::string>("id").value_or(""s);
    request.data = program.get<std::string>("data").value_or(""s);
    request.query = program.get<std::string>("query").value_or(""s);
    request.sort = program.get<std::string>("sort").value_or(""s);
    request.limit = program.get<int>("limit").value_or(request.limit);
    request.skip = program.get<int>("skip").value_or(0);

    int exitCode = 0;
    StoreFacade store(std::move(storeConfig));
    try {
        std::cout << runCommand(store, request).dump(2) << '\n';
    } catch (const docstore::store::ValidationError& e) {
        spdlog::error("Invalid request: {}", e.what());
        exitCode = EXIT_INVALID;
    } catch (const docstore::store::NotFoundError& e) {
        spdlog::error("{}", e.what());
        exitCode = EXIT_NOT_FOUND;
    } catch (const std::exception& e) {
        spdlog::error("Command '{}' failed: {}", request.command, e.what());
        exitCode = 1;
    }

    store.close();
    docstore::logging::flush();
    return exitCode;
}
