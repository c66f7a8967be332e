#include "statement.hpp"

#include <spdlog/spdlog.h>

#include "database.hpp"

namespace docstore::store::sqlite {

Statement::Statement(Database& db, std::string sql)
    : db_(db), sql_(std::move(sql)) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_.get(), sql_.c_str(),
                                static_cast<int>(sql_.size()), &raw, nullptr);
    stmt_.reset(raw);
    if (rc != SQLITE_OK) {
        std::string reason = db_.lastError();
        spdlog::error("Cannot prepare SQL: {} [{}]", reason, sql_);
        THROW_STATEMENT_PREPARE_ERROR("Cannot prepare SQL: " + reason);
    }
    spdlog::debug("Prepared: {}", sql_);
}

int Statement::checkParam(int index) const {
    if (index < 1 || index > sqlite3_bind_parameter_count(stmt_.get())) {
        THROW_STATEMENT_PREPARE_ERROR("Parameter " + std::to_string(index) +
                                      " out of range for: " + sql_);
    }
    return index;
}

int Statement::checkColumn(int index) const {
    if (index < 0 || index >= sqlite3_column_count(stmt_.get())) {
        THROW_SQL_EXECUTION_ERROR("Column " + std::to_string(index) +
                                  " out of range for: " + sql_);
    }
    return index;
}

void Statement::checkBind(int rc, std::string_view kind, int index) const {
    if (rc == SQLITE_OK) {
        return;
    }
    std::string reason = db_.lastError();
    spdlog::error("Cannot bind {} to parameter {}: {}", kind, index, reason);
    THROW_STATEMENT_PREPARE_ERROR("Cannot bind " + std::string(kind) +
                                  " to parameter " + std::to_string(index) +
                                  ": " + reason);
}

void Statement::failStep(int rc) const {
    std::string reason = db_.lastError();
    spdlog::error("SQL step failed ({}): {} [{}]", rc, reason, sql_);
    THROW_SQL_EXECUTION_ERROR("SQL step failed: " + reason);
}

Statement& Statement::bind(int index, int value) {
    checkBind(sqlite3_bind_int(stmt_.get(), checkParam(index), value), "int",
              index);
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    checkBind(sqlite3_bind_int64(stmt_.get(), checkParam(index), value),
              "int64", index);
    return *this;
}

Statement& Statement::bind(int index, double value) {
    checkBind(sqlite3_bind_double(stmt_.get(), checkParam(index), value),
              "double", index);
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    checkBind(sqlite3_bind_text64(stmt_.get(), checkParam(index), value.data(),
                                  value.size(), SQLITE_TRANSIENT, SQLITE_UTF8),
              "text", index);
    return *this;
}

Statement& Statement::bindNull(int index) {
    checkBind(sqlite3_bind_null(stmt_.get(), checkParam(index)), "null", index);
    return *this;
}

Statement& Statement::bindValue(int index, const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            return bindNull(index);
        case Value::Type::Boolean:
            return bind(index, value.asBool() ? 1 : 0);
        case Value::Type::Integer:
            return bind(index, value.asInteger());
        case Value::Type::Float:
            return bind(index, value.asFloat());
        case Value::Type::String:
            return bind(index, value.asString());
        case Value::Type::Timestamp:
            return bind(index, formatTimestamp(value.asTimestamp()));
        case Value::Type::Object:
        case Value::Type::Array:
            return bind(index, value.toJson().dump());
    }
    return *this;
}

Statement& Statement::bindAll(const std::vector<Value>& values) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        bindValue(static_cast<int>(i) + 1, values[i]);
    }
    return *this;
}

void Statement::execute() {
    int rc;
    while ((rc = sqlite3_step(stmt_.get())) == SQLITE_ROW) {
    }
    if (rc != SQLITE_DONE) {
        failStep(rc);
    }
    sqlite3_reset(stmt_.get());
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc != SQLITE_DONE) {
        failStep(rc);
    }
    return false;
}

int64_t Statement::getInt64(int index) const {
    return sqlite3_column_int64(stmt_.get(), checkColumn(index));
}

double Statement::getDouble(int index) const {
    return sqlite3_column_double(stmt_.get(), checkColumn(index));
}

std::string Statement::getText(int index) const {
    const auto* text = sqlite3_column_text(stmt_.get(), checkColumn(index));
    if (text == nullptr) {
        return {};
    }
    auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), index));
    return {reinterpret_cast<const char*>(text), size};
}

bool Statement::isNull(int index) const {
    return getColumnType(index) == SQLITE_NULL;
}

int Statement::getColumnType(int index) const {
    return sqlite3_column_type(stmt_.get(), checkColumn(index));
}

int Statement::getColumnCount() const {
    return sqlite3_column_count(stmt_.get());
}

std::string Statement::getColumnName(int index) const {
    const char* name = sqlite3_column_name(stmt_.get(), checkColumn(index));
    return name ? name : "";
}

int Statement::getParamCount() const {
    return sqlite3_bind_parameter_count(stmt_.get());
}

}  // namespace docstore::store::sqlite
