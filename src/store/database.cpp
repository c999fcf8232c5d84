// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <strata/store/database.h>

namespace strata::store {

namespace {

Error cancelledError(std::string_view phase) {
    return Error{ErrorCode::OperationCancelled, fmt::format("{}: operation cancelled", phase)};
}

bool startsWithKeyword(std::string_view text, std::string_view keyword) {
    if (text.size() < keyword.size()) {
        return false;
    }
    for (size_t i = 0; i < keyword.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != keyword[i]) {
            return false;
        }
    }
    return true;
}

} // namespace

// Transaction implementation
Transaction::Transaction(std::unique_ptr<ITransaction> tx, std::unique_ptr<PooledConnection> lease,
                         TransactionType type)
    : tx_(std::move(tx)), lease_(std::move(lease)), type_(type) {}

Transaction::~Transaction() {
    close();
}

Transaction::Transaction(Transaction&& other) noexcept
    : tx_(std::move(other.tx_)), lease_(std::move(other.lease_)), type_(other.type_) {}

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        close();
        tx_ = std::move(other.tx_);
        lease_ = std::move(other.lease_);
        type_ = other.type_;
    }
    return *this;
}

Result<Rows> Transaction::query(const std::string& statement, std::stop_token stop) {
    if (!tx_) {
        return Error{ErrorCode::InvalidState, "transaction is closed"};
    }
    if (stop.stop_requested()) {
        return cancelledError(transactionTypeToString(type_));
    }
    return tx_->query(statement, stop);
}

Result<void> Transaction::commit() {
    if (!tx_) {
        return Error{ErrorCode::InvalidState, "transaction is closed"};
    }
    auto result = tx_->commit();
    finish();
    if (!result) {
        return wrapError("commit", result.error());
    }
    return {};
}

Result<void> Transaction::rollback() {
    if (!tx_) {
        return Error{ErrorCode::InvalidState, "transaction is closed"};
    }
    auto result = tx_->rollback();
    finish();
    if (!result) {
        return wrapError("rollback", result.error());
    }
    return {};
}

void Transaction::close() {
    if (tx_) {
        finish();
    }
}

void Transaction::finish() {
    if (tx_) {
        tx_->close();
        tx_.reset();
    }
    // The lease goes back only after the driver transaction is gone
    if (lease_) {
        lease_->release();
        lease_.reset();
    }
}

// Database implementation
Database::Database(std::shared_ptr<IConnection> connection, std::string name)
    : connection_(std::move(connection)), name_(std::move(name)) {}

Database::Database(std::shared_ptr<ConnectionPool> pool, std::string name)
    : pool_(std::move(pool)), name_(std::move(name)) {}

Result<Transaction> Database::begin(TransactionType type, std::stop_token stop) {
    const char* kind = transactionTypeToString(type);
    if (stop.stop_requested()) {
        return cancelledError(fmt::format("open {} transaction", kind));
    }

    if (pool_) {
        auto leaseResult = pool_->acquire(stop);
        if (!leaseResult) {
            return wrapError("acquire connection", leaseResult.error());
        }
        auto lease = std::move(leaseResult).value();
        auto txResult = (*lease)->transaction(name_, type);
        if (!txResult) {
            return wrapError(fmt::format("open {} transaction", kind), txResult.error());
        }
        return Transaction(std::move(txResult).value(), std::move(lease), type);
    }

    if (!connection_) {
        return Error{ErrorCode::NotInitialized, "database has no connection"};
    }
    auto txResult = connection_->transaction(name_, type);
    if (!txResult) {
        return wrapError(fmt::format("open {} transaction", kind), txResult.error());
    }
    return Transaction(std::move(txResult).value(), nullptr, type);
}

Result<Rows> Database::executeRead(const std::string& statement, std::stop_token stop) {
    auto txResult = begin(TransactionType::Read, stop);
    if (!txResult) {
        return txResult.error();
    }
    auto tx = std::move(txResult).value();

    auto rows = tx.query(statement, stop);
    tx.close();
    if (!rows) {
        return wrapError("read", rows.error());
    }
    return rows;
}

Result<void> Database::executeWrite(const std::string& statement, std::stop_token stop) {
    return transaction(
        TransactionType::Write,
        [&](Transaction& tx) -> Result<void> {
            auto rows = tx.query(statement, stop);
            if (!rows) {
                return wrapError("write", rows.error());
            }
            return {};
        },
        stop);
}

Result<void> Database::executeSchema(const std::string& statement, std::stop_token stop) {
    return transaction(
        TransactionType::Schema,
        [&](Transaction& tx) -> Result<void> {
            auto rows = tx.query(statement, stop);
            if (!rows) {
                return wrapError("schema", rows.error());
            }
            return {};
        },
        stop);
}

Result<void> Database::finishTransaction(Transaction& tx, Result<void> result) {
    if (!result) {
        if (auto rb = tx.rollback(); !rb) {
            spdlog::warn("Rollback after failed {} transaction failed: {}",
                         transactionTypeToString(tx.type()), rb.error().message);
        }
        return result;
    }
    if (tx.type() == TransactionType::Read) {
        tx.close();
        return {};
    }
    return tx.commit();
}

Result<std::string> Database::schema(std::stop_token stop) {
    if (stop.stop_requested()) {
        return cancelledError("fetch schema");
    }
    auto result = withConnection(
        [this](IConnection& conn) -> Result<std::string> { return conn.schema(name_); }, stop);
    if (!result) {
        return wrapError("fetch schema", result.error());
    }
    return result;
}

Result<bool> Database::ensureDatabase(std::stop_token stop) {
    if (stop.stop_requested()) {
        return cancelledError("ensure database");
    }
    return withConnection(
        [this](IConnection& conn) -> Result<bool> {
            auto exists = conn.containsDatabase(name_);
            if (!exists) {
                return wrapError("check database", exists.error());
            }
            if (exists.value()) {
                return false;
            }
            if (auto created = conn.createDatabase(name_); !created) {
                return wrapError(fmt::format("create database '{}'", name_), created.error());
            }
            spdlog::info("Created database '{}'", name_);
            return true;
        },
        stop);
}

void Database::close() {
    if (pool_) {
        pool_->shutdown();
    }
    if (connection_) {
        connection_->close();
    }
}

TransactionType inferTransactionType(std::string_view statement) {
    auto first = std::find_if(statement.begin(), statement.end(),
                              [](unsigned char c) { return !std::isspace(c); });
    std::string_view trimmed = statement.substr(static_cast<size_t>(first - statement.begin()));
    if (startsWithKeyword(trimmed, "define") || startsWithKeyword(trimmed, "undefine") ||
        startsWithKeyword(trimmed, "redefine")) {
        return TransactionType::Schema;
    }
    return TransactionType::Write;
}

Result<void> executeStatement(Database& db, const std::string& statement, std::stop_token stop) {
    if (inferTransactionType(statement) == TransactionType::Schema) {
        return db.executeSchema(statement, stop);
    }
    return db.executeWrite(statement, stop);
}

Result<Database> createDatabaseWithPool(const ConnectionPoolConfig& config, std::string name,
                                        ConnectionFactory factory) {
    auto pool = createConnectionPool(config, std::move(factory));
    if (!pool) {
        return wrapError("create connection pool", pool.error());
    }
    return Database(std::move(pool).value(), std::move(name));
}

} // namespace strata::store
