#ifndef DOCSTORE_STORE_SQLITE_DATABASE_HPP
#define DOCSTORE_STORE_SQLITE_DATABASE_HPP

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "../core/types.hpp"

namespace docstore::store::sqlite {

class Statement;
class Transaction;

enum class TransactionMode : uint8_t;

/**
 * @brief Connection tuning applied right after open.
 */
struct OpenOptions {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    std::chrono::milliseconds busyTimeout{5000};
    bool foreignKeys = true;
    /// Switch file databases to write-ahead logging; ignored for ":memory:".
    bool writeAheadLog = true;
};

/**
 * @brief Owning handle to one SQLite connection.
 *
 * Movable, not copyable. A moved-from Database is closed: every operation
 * on it throws DatabaseOpenError.
 */
class Database {
public:
    /**
     * @brief Open (or create) the database at @p path.
     *
     * @param path File path, or ":memory:" for a private in-memory database.
     * @throws DatabaseOpenError if the file cannot be opened or configured.
     */
    explicit Database(std::string path, OpenOptions options = {});
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept = default;
    Database& operator=(Database&& other) noexcept = default;

    /**
     * @brief Raw connection handle.
     * @throws DatabaseOpenError if the connection is closed.
     */
    sqlite3* get();

    /**
     * @throws StatementPrepareError if @p sql does not compile.
     */
    std::unique_ptr<Statement> prepare(const std::string& sql);

    std::unique_ptr<Transaction> beginTransaction();
    std::unique_ptr<Transaction> beginTransaction(TransactionMode mode);

    /**
     * @brief Run one or more statements that return no rows.
     * @throws SqlExecutionError on failure.
     */
    void execute(const std::string& sql);

    /// True if a regular table named @p table exists.
    bool tableExists(std::string_view table);

    int64_t lastInsertRowId();
    int changes();

    [[nodiscard]] bool isValid() const noexcept { return handle_ != nullptr; }
    [[nodiscard]] bool isMemory() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept { return path_; }

    /// Most recent error text reported on this connection.
    [[nodiscard]] std::string lastError() const;

private:
    struct Closer {
        void operator()(sqlite3* handle) const noexcept;
    };

    std::unique_ptr<sqlite3, Closer> handle_;
    std::string path_;

    void applyOptions(const OpenOptions& options);
};

}  // namespace docstore::store::sqlite

#endif  // DOCSTORE_STORE_SQLITE_DATABASE_HPP
