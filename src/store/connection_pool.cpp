// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <vector>
#include <strata/store/connection_pool.h>

namespace strata::store {

namespace {

// Closes connections on scope exit, after the pool mutex has been released.
class DeferredClose {
public:
    DeferredClose() = default;
    ~DeferredClose() {
        for (auto& conn : conns_) {
            if (conn) {
                conn->close();
            }
        }
    }

    DeferredClose(const DeferredClose&) = delete;
    DeferredClose& operator=(const DeferredClose&) = delete;

    void add(std::unique_ptr<IConnection> conn) { conns_.push_back(std::move(conn)); }

    [[nodiscard]] size_t size() const { return conns_.size(); }

private:
    std::vector<std::unique_ptr<IConnection>> conns_;
};

} // namespace

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<IConnection> conn, ConnectionPool* owner,
                                   std::chrono::steady_clock::time_point createdAt)
    : conn_(std::move(conn)), owner_(owner), createdAt_(createdAt),
      lastUsed_(std::chrono::steady_clock::now()) {}

PooledConnection::~PooledConnection() {
    release();
}

void PooledConnection::release() {
    if (owner_) {
        auto* owner = owner_;
        owner_ = nullptr;
        owner->returnConnection(std::move(conn_), createdAt_);
    } else if (conn_) {
        conn_->close();
        conn_.reset();
    }
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(const ConnectionPoolConfig& config, ConnectionFactory factory)
    : config_(config), factory_(std::move(factory)) {}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }
    if (initialized_) {
        return {};
    }
    if (!factory_) {
        return Error{ErrorCode::InvalidArgument, "Connection pool requires a connection factory"};
    }
    if (config_.maxConnections > 0 && config_.minConnections > config_.maxConnections) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("invalid pool config: min connections ({}) exceeds max "
                                 "connections ({})",
                                 config_.minConnections, config_.maxConnections)};
    }

    // Create minimum connections
    for (size_t i = 0; i < config_.minConnections; ++i) {
        auto connResult = factory_();
        if (!connResult || !connResult.value()) {
            // Clean up any created connections
            for (auto& entry : idle_) {
                entry.conn->close();
            }
            idle_.clear();
            totalConnections_ = 0;
            Error cause = connResult ? Error{ErrorCode::DatabaseError, "factory returned no connection"}
                                     : connResult.error();
            return wrapError(fmt::format("failed to create initial connection {}/{}", i + 1,
                                         config_.minConnections),
                             cause);
        }

        auto now = std::chrono::steady_clock::now();
        idle_.push_back(IdleConnection{std::move(connResult).value(), now, now});
        totalConnections_++;
    }

    initialized_ = true;
    spdlog::debug("Connection pool initialized with {} connections (max {})",
                  config_.minConnections, config_.maxConnections);

    if (config_.idleTimeout.count() > 0) {
        startMaintenanceThread();
    }
    return {};
}

void ConnectionPool::shutdown() {
    DeferredClose toClose;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (shutdown_) {
            return; // Already shut down
        }
        shutdown_ = true;

        for (auto& entry : idle_) {
            toClose.add(std::move(entry.conn));
        }
        totalConnections_ -= idle_.size();
        idle_.clear();

        // Waiters observe shutdown_ and fail with PoolClosed
        for (auto* waiter : waiters_) {
            waiter->cv.notify_all();
        }
        waiters_.clear();
    }

    if (maintenanceThread_.joinable()) {
        maintenanceThread_.request_stop();
        maintenanceThread_.join();
    }

    spdlog::debug("Connection pool shut down, closing {} idle connections", toClose.size());
}

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire(std::stop_token stop) {
    DeferredClose discarded;
    std::unique_lock<std::mutex> lock(mutex_);

    if (!initialized_ && !shutdown_) {
        return Error{ErrorCode::NotInitialized, "Connection pool is not initialized"};
    }

    const bool bounded = config_.waitTimeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + config_.waitTimeout;

    while (true) {
        if (shutdown_) {
            failedAcquisitions_++;
            return Error{ErrorCode::PoolClosed, "connection pool is closed"};
        }
        if (stop.stop_requested()) {
            failedAcquisitions_++;
            return Error{ErrorCode::OperationCancelled, "connection acquire cancelled"};
        }

        // Most recently returned first
        while (!idle_.empty()) {
            IdleConnection entry = std::move(idle_.back());
            idle_.pop_back();
            if (entry.conn && entry.conn->isOpen()) {
                return leaseLocked(std::move(entry));
            }
            totalConnections_--;
            spdlog::warn("Discarding unhealthy idle connection");
            discarded.add(std::move(entry.conn));
        }

        if (config_.maxConnections == 0 || totalConnections_ < config_.maxConnections) {
            // Reserve the slot before creating outside the lock
            totalConnections_++;
            lock.unlock();
            auto connResult = factory_();
            lock.lock();

            if (!connResult || !connResult.value()) {
                totalConnections_--;
                failedAcquisitions_++;
                wakeWaiterForCapacityLocked();
                Error cause = connResult
                                  ? Error{ErrorCode::DatabaseError, "factory returned no connection"}
                                  : connResult.error();
                spdlog::warn("Failed to create pooled connection: {}", cause.message);
                return wrapError("create connection", cause);
            }

            auto conn = std::move(connResult).value();
            if (shutdown_) {
                totalConnections_--;
                failedAcquisitions_++;
                discarded.add(std::move(conn));
                return Error{ErrorCode::PoolClosed, "connection pool is closed"};
            }

            auto now = std::chrono::steady_clock::now();
            return leaseLocked(IdleConnection{std::move(conn), now, now});
        }

        // At capacity: queue behind earlier waiters
        Waiter waiter;
        waiters_.push_back(&waiter);
        maxWaitingRequests_ = std::max(maxWaitingRequests_, waiters_.size());

        const auto waitStart = std::chrono::steady_clock::now();
        auto ready = [&] { return waiter.handoff != nullptr || waiter.retry || shutdown_; };
        if (bounded) {
            waiter.cv.wait_until(lock, stop, deadline, ready);
        } else {
            waiter.cv.wait(lock, stop, ready);
        }
        totalWaitMicros_ += static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - waitStart)
                .count());

        // Still queued when woken by timeout or cancellation
        std::erase(waiters_, &waiter);

        if (waiter.handoff) {
            IdleConnection entry = std::move(*waiter.handoff);
            if (entry.conn && entry.conn->isOpen()) {
                return leaseLocked(std::move(entry));
            }
            totalConnections_--;
            discarded.add(std::move(entry.conn));
            continue;
        }
        if (waiter.retry && (shutdown_ || stop.stop_requested())) {
            // Woken for a freed slot but leaving; pass the slot to the next waiter
            wakeWaiterForCapacityLocked();
        }
        if (shutdown_ || waiter.retry || stop.stop_requested()) {
            continue;
        }

        timeoutCount_++;
        failedAcquisitions_++;
        spdlog::debug("Timed out waiting for connection ({} open, {} waiting)", totalConnections_,
                      waiters_.size());
        return Error{ErrorCode::Timeout,
                     fmt::format("timed out after {}ms waiting for a connection",
                                 config_.waitTimeout.count())};
    }
}

void ConnectionPool::release(std::unique_ptr<PooledConnection> conn) {
    if (conn) {
        conn->release();
    }
}

void ConnectionPool::returnConnection(std::unique_ptr<IConnection> conn,
                                      std::chrono::steady_clock::time_point createdAt) {
    DeferredClose toClose;
    const bool healthy = conn && conn->isOpen();

    std::lock_guard<std::mutex> lock(mutex_);
    totalReleased_++;

    if (shutdown_) {
        if (totalConnections_ > 0) {
            totalConnections_--;
        }
        toClose.add(std::move(conn));
        return;
    }

    if (!healthy) {
        totalConnections_--;
        toClose.add(std::move(conn));
        spdlog::debug("Dropped unhealthy connection on release");
        wakeWaiterForCapacityLocked();
        return;
    }

    auto now = std::chrono::steady_clock::now();
    if (!waiters_.empty()) {
        auto* waiter = waiters_.front();
        waiters_.pop_front();
        waiter->handoff = std::make_unique<IdleConnection>(IdleConnection{std::move(conn), now, createdAt});
        waiter->cv.notify_one();
        return;
    }

    idle_.push_back(IdleConnection{std::move(conn), now, createdAt});
}

std::unique_ptr<PooledConnection> ConnectionPool::leaseLocked(IdleConnection entry) {
    totalAcquired_++;
    return std::make_unique<PooledConnection>(std::move(entry.conn), this, entry.createdAt);
}

void ConnectionPool::wakeWaiterForCapacityLocked() {
    if (waiters_.empty()) {
        return;
    }
    auto* waiter = waiters_.front();
    waiters_.pop_front();
    waiter->retry = true;
    waiter->cv.notify_one();
}

ConnectionPool::Stats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats{};
    stats.availableConnections = idle_.size();
    stats.totalConnections = totalConnections_;
    stats.activeConnections = totalConnections_ - idle_.size();
    stats.waitingRequests = waiters_.size();
    stats.maxObservedWaiting = maxWaitingRequests_;
    stats.totalWaitMicros = totalWaitMicros_;
    stats.timeoutCount = timeoutCount_;
    stats.totalAcquired = totalAcquired_;
    stats.totalReleased = totalReleased_;
    stats.failedAcquisitions = failedAcquisitions_;
    stats.evictedConnections = evictedConnections_;
    return stats;
}

void ConnectionPool::pruneIdleConnections() {
    if (config_.idleTimeout.count() <= 0) {
        return;
    }

    DeferredClose evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }

        auto now = std::chrono::steady_clock::now();
        // Front of the idle list holds the longest-idle connections
        for (auto it = idle_.begin(); it != idle_.end();) {
            if (totalConnections_ <= config_.minConnections) {
                break;
            }
            if (now - it->lastUsed >= config_.idleTimeout) {
                evicted.add(std::move(it->conn));
                it = idle_.erase(it);
                totalConnections_--;
                evictedConnections_++;
            } else {
                ++it;
            }
        }
    }

    if (evicted.size() > 0) {
        spdlog::debug("Evicted {} idle connections", evicted.size());
    }
}

bool ConnectionPool::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

void ConnectionPool::startMaintenanceThread() {
    auto interval = config_.maintenanceInterval.count() > 0 ? config_.maintenanceInterval
                                                            : config_.idleTimeout / 2;
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds(1);
    }

    maintenanceThread_ = std::jthread([this, interval](std::stop_token stopToken) {
        while (!stopToken.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                maintenanceCv_.wait_for(lock, stopToken, interval, [] { return false; });
            }
            if (stopToken.stop_requested()) {
                break;
            }
            pruneIdleConnections();
        }
    });
}

Result<std::shared_ptr<ConnectionPool>> createConnectionPool(const ConnectionPoolConfig& config,
                                                             ConnectionFactory factory) {
    auto pool = std::make_shared<ConnectionPool>(config, std::move(factory));
    if (auto result = pool->initialize(); !result) {
        return result.error();
    }
    return pool;
}

} // namespace strata::store
