#ifndef DOCSTORE_STORE_SQLITE_STATEMENT_HPP
#define DOCSTORE_STORE_SQLITE_STATEMENT_HPP

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../core/types.hpp"
#include "../core/value.hpp"

namespace docstore::store::sqlite {

class Database;

/**
 * @brief A compiled SQL statement bound to one connection.
 *
 * Parameter indices are 1-based, column indices 0-based; both are range
 * checked. Column readers refer to the row produced by the last step().
 */
class Statement {
public:
    /**
     * @throws StatementPrepareError if @p sql does not compile.
     * @throws DatabaseOpenError if @p db is closed.
     */
    Statement(Database& db, std::string sql);

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /// @throws StatementPrepareError on a bad index or bind failure.
    Statement& bind(int index, int value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bindNull(int index);

    /**
     * @brief Bind a document value.
     *
     * Booleans bind as 0/1, timestamps as formatTimestamp() text, mappings
     * and sequences as JSON text.
     */
    Statement& bindValue(int index, const Value& value);

    /// Bind @p values to consecutive parameters starting at 1.
    Statement& bindAll(const std::vector<Value>& values);

    /**
     * @brief Run to completion, discarding any rows.
     *
     * Leaves the statement ready to run again; bindings are kept.
     * @throws SqlExecutionError on failure.
     */
    void execute();

    /**
     * @brief Advance to the next row.
     * @return false once the statement is done.
     * @throws SqlExecutionError on failure.
     */
    bool step();

    int64_t getInt64(int index) const;
    double getDouble(int index) const;
    std::string getText(int index) const;  ///< NULL reads as "".
    bool isNull(int index) const;

    /// SQLITE_INTEGER, SQLITE_FLOAT, SQLITE_TEXT, SQLITE_BLOB or SQLITE_NULL.
    int getColumnType(int index) const;
    int getColumnCount() const;
    std::string getColumnName(int index) const;
    int getParamCount() const;

    sqlite3_stmt* get() const { return stmt_.get(); }
    const std::string& getSql() const { return sql_; }

private:
    struct Finalizer {
        void operator()(sqlite3_stmt* stmt) const noexcept {
            sqlite3_finalize(stmt);
        }
    };

    Database& db_;
    std::string sql_;
    std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;

    int checkParam(int index) const;
    int checkColumn(int index) const;
    void checkBind(int rc, std::string_view kind, int index) const;
    [[noreturn]] void failStep(int rc) const;
};

}  // namespace docstore::store::sqlite

#endif  // DOCSTORE_STORE_SQLITE_STATEMENT_HPP
