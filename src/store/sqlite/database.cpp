#include "database.hpp"

#include <spdlog/spdlog.h>

#include "statement.hpp"
#include "transaction.hpp"

namespace docstore::store::sqlite {

namespace {

constexpr std::string_view MEMORY_PATH = ":memory:";

}  // namespace

void Database::Closer::operator()(sqlite3* handle) const noexcept {
    if (handle == nullptr) {
        return;
    }
    // Best effort; the connection is gone either way
    sqlite3_exec(handle, "PRAGMA optimize;", nullptr, nullptr, nullptr);
    if (sqlite3_close_v2(handle) != SQLITE_OK) {
        spdlog::warn("sqlite3_close_v2 reported an error on shutdown");
    }
}

Database::Database(std::string path, OpenOptions options)
    : path_(std::move(path)) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path_.c_str(), &raw, options.flags, nullptr);
    handle_.reset(raw);
    if (rc != SQLITE_OK) {
        std::string reason = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        handle_.reset();
        spdlog::error("Cannot open SQLite database '{}': {}", path_, reason);
        THROW_DATABASE_OPEN_ERROR("Cannot open SQLite database '" + path_ +
                                  "': " + reason);
    }

    try {
        applyOptions(options);
    } catch (const SqlExecutionError& e) {
        handle_.reset();
        THROW_DATABASE_OPEN_ERROR("Cannot configure SQLite database '" +
                                  path_ + "': " + e.what());
    }
    spdlog::info("Opened SQLite database {}", path_);
}

Database::~Database() = default;

void Database::applyOptions(const OpenOptions& options) {
    sqlite3_busy_timeout(handle_.get(),
                         static_cast<int>(options.busyTimeout.count()));
    if (options.foreignKeys) {
        execute("PRAGMA foreign_keys = ON;");
    }
    if (options.writeAheadLog && !isMemory()) {
        execute("PRAGMA journal_mode = WAL;");
        execute("PRAGMA synchronous = NORMAL;");
    }
}

sqlite3* Database::get() {
    if (!handle_) {
        THROW_DATABASE_OPEN_ERROR("SQLite connection '" + path_ +
                                  "' is closed");
    }
    return handle_.get();
}

std::unique_ptr<Statement> Database::prepare(const std::string& sql) {
    return std::make_unique<Statement>(*this, sql);
}

std::unique_ptr<Transaction> Database::beginTransaction() {
    return beginTransaction(TransactionMode::Deferred);
}

std::unique_ptr<Transaction> Database::beginTransaction(TransactionMode mode) {
    get();
    return std::make_unique<Transaction>(*this, mode);
}

void Database::execute(const std::string& sql) {
    char* message = nullptr;
    int rc = sqlite3_exec(get(), sql.c_str(), nullptr, nullptr, &message);
    if (rc == SQLITE_OK) {
        spdlog::debug("SQL: {}", sql);
        return;
    }

    std::string reason = message ? message : sqlite3_errstr(rc);
    sqlite3_free(message);
    spdlog::error("SQL failed: {} [{}]", reason, sql);
    THROW_SQL_EXECUTION_ERROR("SQL failed: " + reason);
}

bool Database::tableExists(std::string_view table) {
    auto stmt = prepare(
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt->bind(1, std::string(table));
    return stmt->step();
}

int64_t Database::lastInsertRowId() {
    return sqlite3_last_insert_rowid(get());
}

int Database::changes() { return sqlite3_changes(get()); }

bool Database::isMemory() const noexcept {
    return path_ == MEMORY_PATH || path_.empty();
}

std::string Database::lastError() const {
    return handle_ ? sqlite3_errmsg(handle_.get()) : "connection closed";
}

}  // namespace docstore::store::sqlite
