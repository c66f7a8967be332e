#include "transaction.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "database.hpp"

namespace docstore::store::sqlite {

Transaction::Transaction(Database& db, TransactionMode mode) : db_(db) {
    const char* begin = mode == TransactionMode::Immediate
                            ? "BEGIN IMMEDIATE;"
                            : "BEGIN DEFERRED;";
    try {
        db_.execute(begin);
    } catch (const SqlExecutionError& e) {
        THROW_TRANSACTION_ERROR("Cannot begin transaction on '" + db_.name() +
                                "': " + e.what());
    }
}

Transaction::~Transaction() {
    if (state_ != State::Active) {
        return;
    }
    try {
        finish("ROLLBACK", State::RolledBack);
        spdlog::debug("Rolled back unfinished transaction on {}", db_.name());
    } catch (const std::exception& e) {
        spdlog::error("Automatic rollback failed on {}: {}", db_.name(),
                      e.what());
    }
}

void Transaction::commit() { finish("COMMIT", State::Committed); }

void Transaction::rollback() { finish("ROLLBACK", State::RolledBack); }

void Transaction::finish(std::string_view verb, State next) {
    if (state_ != State::Active) {
        THROW_TRANSACTION_ERROR(std::string(verb) +
                                " on a transaction that already ended");
    }
    try {
        db_.execute(std::string(verb) + ";");
    } catch (const std::exception& e) {
        THROW_TRANSACTION_ERROR(std::string(verb) + " failed on '" +
                                db_.name() + "': " + e.what());
    }
    state_ = next;
}

}  // namespace docstore::store::sqlite
