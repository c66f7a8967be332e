#ifndef DOCSTORE_STORE_SQLITE_TRANSACTION_HPP
#define DOCSTORE_STORE_SQLITE_TRANSACTION_HPP

#include <cstdint>
#include <string_view>

#include "../core/types.hpp"

namespace docstore::store::sqlite {

class Database;

/**
 * @brief Lock acquisition for BEGIN.
 *
 * Immediate takes the write lock up front, so a writer never fails halfway
 * through on a read-to-write lock upgrade.
 */
enum class TransactionMode : uint8_t { Deferred, Immediate };

/**
 * @brief Scoped transaction; rolls back on destruction unless finished.
 *
 * Transactions do not nest: beginning one while another is open on the same
 * connection throws TransactionError.
 */
class Transaction {
public:
    enum class State : uint8_t { Active, Committed, RolledBack };

    /**
     * @throws TransactionError if BEGIN fails.
     */
    explicit Transaction(Database& db,
                         TransactionMode mode = TransactionMode::Deferred);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @throws TransactionError if already finished or COMMIT fails.
     */
    void commit();

    /**
     * @throws TransactionError if already finished or ROLLBACK fails.
     */
    void rollback();

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool isActive() const noexcept {
        return state_ == State::Active;
    }

private:
    Database& db_;
    State state_{State::Active};

    void finish(std::string_view verb, State next);
};

}  // namespace docstore::store::sqlite

#endif  // DOCSTORE_STORE_SQLITE_TRANSACTION_HPP
