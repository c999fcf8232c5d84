#pragma once

#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <strata/store/connection.h>
#include <strata/store/connection_pool.h>

namespace strata::store {

/**
 * @brief Open transaction bound to the connection it runs on
 *
 * For pooled databases the transaction holds the connection lease and returns it
 * to the pool exactly once, when the transaction is committed, rolled back,
 * closed or destroyed.
 */
class Transaction {
public:
    Transaction(std::unique_ptr<ITransaction> tx, std::unique_ptr<PooledConnection> lease,
                TransactionType type);
    ~Transaction();

    // Move-only
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @brief Execute one statement; refused once @p stop has been triggered
     */
    Result<Rows> query(const std::string& statement, std::stop_token stop = {});

    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Close without committing; safe to call more than once
     */
    void close();

    [[nodiscard]] bool isOpen() const { return tx_ != nullptr; }
    [[nodiscard]] TransactionType type() const { return type_; }

private:
    std::unique_ptr<ITransaction> tx_;
    std::unique_ptr<PooledConnection> lease_;
    TransactionType type_;

    void finish();
};

/**
 * @brief A named store database reached through a direct connection or a pool
 */
class Database {
public:
    Database(std::shared_ptr<IConnection> connection, std::string name);
    Database(std::shared_ptr<ConnectionPool> pool, std::string name);
    ~Database() = default;

    // Move-only
    Database(Database&&) noexcept = default;
    Database& operator=(Database&&) noexcept = default;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] bool isPooled() const { return pool_ != nullptr; }
    [[nodiscard]] ConnectionPool* pool() const { return pool_.get(); }

    /**
     * @brief Open a transaction, acquiring a pooled connection when pooling
     */
    Result<Transaction> begin(TransactionType type, std::stop_token stop = {});

    /**
     * @brief Run a read query in its own read transaction
     */
    Result<Rows> executeRead(const std::string& statement, std::stop_token stop = {});

    /**
     * @brief Run a data statement in its own write transaction and commit
     */
    Result<void> executeWrite(const std::string& statement, std::stop_token stop = {});

    /**
     * @brief Run a schema statement in its own schema transaction and commit
     */
    Result<void> executeSchema(const std::string& statement, std::stop_token stop = {});

    /**
     * @brief Execute within transaction
     *
     * @p func receives the open Transaction and returns Result<void>. A failed
     * result rolls back; success commits (read transactions are just closed).
     */
    template <typename Func>
    Result<void> transaction(TransactionType type, Func&& func, std::stop_token stop = {}) {
        auto txResult = begin(type, stop);
        if (!txResult) {
            return txResult.error();
        }
        auto tx = std::move(txResult).value();

        try {
            Result<void> result = func(tx);
            return finishTransaction(tx, std::move(result));
        } catch (...) {
            tx.close();
            throw;
        }
    }

    /**
     * @brief Current schema definition text of this database
     */
    Result<std::string> schema(std::stop_token stop = {});

    /**
     * @brief Create the database if it does not exist
     * @return true when it was created by this call
     */
    Result<bool> ensureDatabase(std::stop_token stop = {});

    /**
     * @brief Close the direct connection or shut down the pool
     */
    void close();

private:
    std::shared_ptr<IConnection> connection_;
    std::shared_ptr<ConnectionPool> pool_;
    std::string name_;

    Result<void> finishTransaction(Transaction& tx, Result<void> result);

    template <typename Func>
    auto withConnection(Func&& func, std::stop_token stop)
        -> std::invoke_result_t<Func, IConnection&> {
        if (pool_) {
            return pool_->withConnection(std::forward<Func>(func), stop);
        }
        if (!connection_) {
            return Error{ErrorCode::NotInitialized, "database has no connection"};
        }
        return func(*connection_);
    }
};

/**
 * @brief Transaction kind a raw statement needs
 *
 * Statements beginning with define, undefine or redefine (any case, after leading
 * whitespace) need a schema transaction; everything else a write transaction.
 */
TransactionType inferTransactionType(std::string_view statement);

/**
 * @brief Execute a raw statement in a transaction of the inferred kind
 */
Result<void> executeStatement(Database& db, const std::string& statement,
                              std::stop_token stop = {});

/**
 * @brief Build a pooled Database that owns a freshly initialized pool
 */
Result<Database> createDatabaseWithPool(const ConnectionPoolConfig& config, std::string name,
                                        ConnectionFactory factory);

} // namespace strata::store
