#ifndef DOCSTORE_STORE_CORE_TYPES_HPP
#define DOCSTORE_STORE_CORE_TYPES_HPP

#include "atom/error/exception.hpp"

namespace docstore::store {

// Caller-facing exception classes - all follow the XxxError naming convention
class ValidationError : public atom::error::Exception {
    using Exception::Exception;
};

class NotFoundError : public atom::error::Exception {
    using Exception::Exception;
};

class BackendUnavailableError : public atom::error::Exception {
    using Exception::Exception;
};

class BackendOperationError : public atom::error::Exception {
    using Exception::Exception;
};

// SQLite access layer exceptions; wrapped by the relational engine
class DatabaseOpenError : public atom::error::Exception {
    using Exception::Exception;
};

class SqlExecutionError : public atom::error::Exception {
    using Exception::Exception;
};

class StatementPrepareError : public atom::error::Exception {
    using Exception::Exception;
};

class TransactionError : public atom::error::Exception {
    using Exception::Exception;
};

#define THROW_VALIDATION_ERROR(...)          \
    throw docstore::store::ValidationError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_NOT_FOUND_ERROR(...)         \
    throw docstore::store::NotFoundError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_BACKEND_UNAVAILABLE_ERROR(...)         \
    throw docstore::store::BackendUnavailableError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_BACKEND_OPERATION_ERROR(...)         \
    throw docstore::store::BackendOperationError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_DATABASE_OPEN_ERROR(...)         \
    throw docstore::store::DatabaseOpenError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_SQL_EXECUTION_ERROR(...)         \
    throw docstore::store::SqlExecutionError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_STATEMENT_PREPARE_ERROR(...)         \
    throw docstore::store::StatementPrepareError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_TRANSACTION_ERROR(...)         \
    throw docstore::store::TransactionError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace docstore::store

#endif  // DOCSTORE_STORE_CORE_TYPES_HPP
