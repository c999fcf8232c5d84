#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <strata/store/connection.h>

namespace strata::store {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t minConnections = 2;                    ///< Connections created up front and kept warm
    size_t maxConnections = 10;                   ///< Upper bound on open connections (0 = unlimited)
    std::chrono::milliseconds idleTimeout{300000}; ///< Idle age before eviction (0 = never)
    std::chrono::milliseconds waitTimeout{10000};  ///< Max wait when at capacity (0 = no limit)
    std::chrono::milliseconds maintenanceInterval{0}; ///< Eviction sweep period (0 = idleTimeout / 2)
};

class ConnectionPool;

/**
 * @brief Store connection checked out of a pool
 *
 * Exclusively owned by the caller that acquired it. Destroying it (or calling
 * release()) hands the connection back to the pool, which must outlive it.
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<IConnection> conn, ConnectionPool* owner,
                     std::chrono::steady_clock::time_point createdAt);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;
    PooledConnection(PooledConnection&&) = delete;
    PooledConnection& operator=(PooledConnection&&) = delete;

    /**
     * @brief Access the underlying connection
     */
    IConnection* operator->() { return conn_.get(); }
    const IConnection* operator->() const { return conn_.get(); }
    IConnection& operator*() { return *conn_; }
    const IConnection& operator*() const { return *conn_; }

    /**
     * @brief Connection is still held and reports itself open
     */
    [[nodiscard]] bool isHealthy() const { return conn_ && conn_->isOpen(); }

    [[nodiscard]] std::chrono::steady_clock::time_point lastUsed() const { return lastUsed_; }
    [[nodiscard]] std::chrono::steady_clock::time_point createdAt() const { return createdAt_; }

    void touch() { lastUsed_ = std::chrono::steady_clock::now(); }

    /**
     * @brief Return the connection to its pool now; later calls are no-ops
     */
    void release();

private:
    std::unique_ptr<IConnection> conn_;
    ConnectionPool* owner_ = nullptr;
    std::chrono::steady_clock::time_point createdAt_;
    std::chrono::steady_clock::time_point lastUsed_;
};

/**
 * @brief Thread-safe bounded pool of store connections
 *
 * All pool state (idle set, open count, waiter queue) is guarded by one mutex.
 * Callers that find the pool at capacity queue in FIFO order; a returned
 * connection is handed straight to the longest waiter. A maintenance thread
 * evicts connections idle for longer than idleTimeout, never dropping the open
 * count below minConnections.
 */
class ConnectionPool {
public:
    ConnectionPool(const ConnectionPoolConfig& config, ConnectionFactory factory);
    ~ConnectionPool();

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    /**
     * @brief Validate the configuration and pre-create minConnections
     *
     * A factory failure closes whatever was created and fails the whole call.
     */
    Result<void> initialize();

    /**
     * @brief Close idle connections and refuse further acquisitions
     *
     * Connections currently checked out are closed when they come back.
     */
    void shutdown();

    /**
     * @brief Acquire a connection, blocking while the pool is at capacity
     *
     * Fails with Timeout after waitTimeout, OperationCancelled when @p stop is
     * triggered, and PoolClosed once the pool has been shut down.
     */
    Result<std::unique_ptr<PooledConnection>> acquire(std::stop_token stop = {});

    /**
     * @brief Return a connection previously obtained from acquire()
     */
    void release(std::unique_ptr<PooledConnection> conn);

    /**
     * @brief Execute a function with a connection
     */
    template <typename Func>
    auto withConnection(Func&& func, std::stop_token stop = {})
        -> std::invoke_result_t<Func, IConnection&> {
        auto connResult = acquire(stop);
        if (!connResult) {
            return connResult.error();
        }

        auto conn = std::move(connResult).value();
        conn->touch();

        try {
            return func(**conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

    /**
     * @brief Point-in-time pool statistics
     *
     * availableConnections + activeConnections == totalConnections always holds.
     */
    struct Stats {
        size_t availableConnections;
        size_t activeConnections;
        size_t totalConnections;
        size_t waitingRequests;
        size_t maxObservedWaiting;
        std::uint64_t totalWaitMicros;
        size_t timeoutCount;
        size_t totalAcquired;
        size_t totalReleased;
        size_t failedAcquisitions;
        size_t evictedConnections;
    };

    [[nodiscard]] Stats getStats() const;

    /**
     * @brief Close idle connections older than idleTimeout, keeping minConnections open
     */
    void pruneIdleConnections();

    [[nodiscard]] bool isClosed() const;

    [[nodiscard]] const ConnectionPoolConfig& config() const { return config_; }

private:
    friend class PooledConnection;

    struct IdleConnection {
        std::unique_ptr<IConnection> conn;
        std::chrono::steady_clock::time_point lastUsed;
        std::chrono::steady_clock::time_point createdAt;
    };

    struct Waiter {
        std::unique_ptr<IdleConnection> handoff;
        bool retry = false;
        std::condition_variable_any cv;
    };

    ConnectionPoolConfig config_;
    ConnectionFactory factory_;

    mutable std::mutex mutex_;
    std::deque<IdleConnection> idle_;
    std::deque<Waiter*> waiters_;
    size_t totalConnections_ = 0;
    bool initialized_ = false;
    bool shutdown_ = false;

    size_t maxWaitingRequests_ = 0;
    std::uint64_t totalWaitMicros_ = 0;
    size_t timeoutCount_ = 0;
    size_t totalAcquired_ = 0;
    size_t totalReleased_ = 0;
    size_t failedAcquisitions_ = 0;
    size_t evictedConnections_ = 0;

    std::condition_variable_any maintenanceCv_;
    std::jthread maintenanceThread_;

    /**
     * @brief Take back a connection from a PooledConnection
     */
    void returnConnection(std::unique_ptr<IConnection> conn,
                          std::chrono::steady_clock::time_point createdAt);

    std::unique_ptr<PooledConnection> leaseLocked(IdleConnection entry);

    /**
     * @brief A slot was freed without a handoff; let the oldest waiter try to create
     */
    void wakeWaiterForCapacityLocked();

    void startMaintenanceThread();
};

/**
 * @brief Validate, construct and pre-warm a pool in one step
 */
Result<std::shared_ptr<ConnectionPool>> createConnectionPool(const ConnectionPoolConfig& config,
                                                             ConnectionFactory factory);

/**
 * @brief RAII helper for automatic connection management
 */
class ScopedConnection {
public:
    explicit ScopedConnection(ConnectionPool& pool, std::stop_token stop = {}) {
        auto result = pool.acquire(stop);
        if (result) {
            conn_ = std::move(result).value();
        } else {
            error_ = result.error();
        }
    }

    ~ScopedConnection() = default;

    // Non-copyable, movable
    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;
    ScopedConnection(ScopedConnection&&) = default;
    ScopedConnection& operator=(ScopedConnection&&) = delete;

    /**
     * @brief Check if connection was acquired successfully
     */
    [[nodiscard]] bool isValid() const { return conn_ && conn_->isHealthy(); }

    /**
     * @brief Why acquisition failed, when isValid() is false
     */
    [[nodiscard]] const Error& error() const { return error_; }

    IConnection* operator->() { return conn_ ? &(**conn_) : nullptr; }

    const IConnection* operator->() const { return conn_ ? &(**conn_) : nullptr; }

    IConnection& operator*() { return **conn_; }

    const IConnection& operator*() const { return **conn_; }

private:
    std::unique_ptr<PooledConnection> conn_;
    Error error_;
};

} // namespace strata::store
