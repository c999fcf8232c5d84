#pragma once

#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>
#include <strata/core/types.h>
#include <strata/store/value.h>

namespace strata::store {

/**
 * @brief Kind of transaction opened against the store
 */
enum class TransactionType {
    Read = 0,  ///< Data retrieval only
    Write = 1, ///< Data modification
    Schema = 2 ///< Schema definition changes
};

constexpr const char* transactionTypeToString(TransactionType type) {
    switch (type) {
        case TransactionType::Read:
            return "read";
        case TransactionType::Write:
            return "write";
        case TransactionType::Schema:
            return "schema";
    }
    return "unknown";
}

/**
 * @brief Store transaction as exposed by the driver
 *
 * Implementations check the stop token before sending a statement; a statement
 * that has started is never interrupted.
 */
class ITransaction {
public:
    virtual ~ITransaction() = default;

    /**
     * @brief Execute one statement and return its rows
     */
    virtual Result<Rows> query(const std::string& statement, std::stop_token stop) = 0;

    virtual Result<void> commit() = 0;
    virtual Result<void> rollback() = 0;

    /**
     * @brief Release driver resources; safe to call more than once
     */
    virtual void close() = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;
};

/**
 * @brief Store connection as exposed by the driver
 */
class IConnection {
public:
    virtual ~IConnection() = default;

    virtual Result<std::unique_ptr<ITransaction>> transaction(const std::string& database,
                                                              TransactionType type) = 0;

    /**
     * @brief Current schema definition text of @p database
     */
    virtual Result<std::string> schema(const std::string& database) = 0;

    virtual Result<void> createDatabase(const std::string& name) = 0;
    virtual Result<void> deleteDatabase(const std::string& name) = 0;
    virtual Result<bool> containsDatabase(const std::string& name) = 0;
    virtual Result<std::vector<std::string>> listDatabases() = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;
};

/**
 * @brief Creates new store connections, used by the pool
 */
using ConnectionFactory = std::function<Result<std::unique_ptr<IConnection>>()>;

} // namespace strata::store
