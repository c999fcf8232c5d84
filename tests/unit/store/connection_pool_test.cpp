#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>
#include <strata/store/connection_pool.h>

#include "../../support/fake_connection.h"

using namespace std::chrono_literals;
using namespace strata;
using namespace strata::store;
using strata::test_support::FakeConnection;
using strata::test_support::FakeConnectionStats;
using strata::test_support::fakeConnectionFactory;

namespace {

int connectionId(PooledConnection& lease) {
    auto* fake = dynamic_cast<FakeConnection*>(&*lease);
    return fake ? fake->id() : -1;
}

// Poll until @p pred holds or two seconds pass
template <typename Pred> bool waitFor(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

void expectBalanced(const ConnectionPool::Stats& stats) {
    EXPECT_EQ(stats.availableConnections + stats.activeConnections, stats.totalConnections);
}

} // namespace

class ConnectionPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        stats_ = std::make_shared<FakeConnectionStats>();
        config_.minConnections = 1;
        config_.maxConnections = 2;
        config_.idleTimeout = 0ms;
        config_.waitTimeout = 200ms;
    }

    std::unique_ptr<ConnectionPool> makePool() {
        auto pool = std::make_unique<ConnectionPool>(config_, fakeConnectionFactory(stats_));
        auto init = pool->initialize();
        EXPECT_TRUE(init.has_value()) << (init ? "" : init.error().message);
        return pool;
    }

    std::shared_ptr<FakeConnectionStats> stats_;
    ConnectionPoolConfig config_;
};

TEST_F(ConnectionPoolTest, InitializePrewarmsMinimum) {
    config_.minConnections = 2;
    config_.maxConnections = 4;
    auto pool = makePool();

    auto stats = pool->getStats();
    EXPECT_EQ(stats.totalConnections, 2u);
    EXPECT_EQ(stats.availableConnections, 2u);
    EXPECT_EQ(stats.activeConnections, 0u);
    EXPECT_EQ(stats_->created.load(), 2);
}

TEST_F(ConnectionPoolTest, InitializeRejectsMinAboveMax) {
    config_.minConnections = 5;
    config_.maxConnections = 2;
    ConnectionPool pool(config_, fakeConnectionFactory(stats_));

    auto result = pool.initialize();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(stats_->created.load(), 0);
}

TEST_F(ConnectionPoolTest, InitializeFailureClosesPartialConnections) {
    config_.minConnections = 3;
    config_.maxConnections = 3;
    auto inner = fakeConnectionFactory(stats_);
    int calls = 0;
    ConnectionPool pool(config_, [&]() -> Result<std::unique_ptr<IConnection>> {
        if (++calls == 3) {
            return Error{ErrorCode::DatabaseError, "connection refused"};
        }
        return inner();
    });

    auto result = pool.initialize();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::DatabaseError);
    EXPECT_NE(result.error().message.find("connection refused"), std::string::npos);
    EXPECT_EQ(stats_->created.load(), 2);
    EXPECT_EQ(stats_->open(), 0);
    EXPECT_EQ(pool.getStats().totalConnections, 0u);
}

TEST_F(ConnectionPoolTest, AcquireBeforeInitializeFails) {
    ConnectionPool pool(config_, fakeConnectionFactory(stats_));
    auto lease = pool.acquire();
    ASSERT_FALSE(lease);
    EXPECT_EQ(lease.error().code, ErrorCode::NotInitialized);
}

TEST_F(ConnectionPoolTest, ReleasedConnectionIsReused) {
    auto pool = makePool();

    int firstId = 0;
    {
        auto lease = pool->acquire();
        ASSERT_TRUE(lease);
        firstId = connectionId(*lease.value());
        EXPECT_EQ(pool->getStats().activeConnections, 1u);
    }

    auto again = pool->acquire();
    ASSERT_TRUE(again);
    EXPECT_EQ(connectionId(*again.value()), firstId);
    EXPECT_EQ(stats_->created.load(), 1);

    auto stats = pool->getStats();
    EXPECT_EQ(stats.totalAcquired, 2u);
    EXPECT_EQ(stats.totalReleased, 1u);
}

TEST_F(ConnectionPoolTest, GrowsUpToMaximum) {
    config_.maxConnections = 3;
    auto pool = makePool();

    std::vector<std::unique_ptr<PooledConnection>> leases;
    for (int i = 0; i < 3; ++i) {
        auto lease = pool->acquire();
        ASSERT_TRUE(lease);
        leases.push_back(std::move(lease).value());
        expectBalanced(pool->getStats());
    }

    auto stats = pool->getStats();
    EXPECT_EQ(stats.totalConnections, 3u);
    EXPECT_EQ(stats.activeConnections, 3u);
    EXPECT_EQ(stats.availableConnections, 0u);

    leases.clear();
    stats = pool->getStats();
    EXPECT_EQ(stats.availableConnections, 3u);
    EXPECT_EQ(stats.activeConnections, 0u);
}

TEST_F(ConnectionPoolTest, UnlimitedMaximumKeepsCreating) {
    config_.maxConnections = 0;
    auto pool = makePool();

    std::vector<std::unique_ptr<PooledConnection>> leases;
    for (int i = 0; i < 12; ++i) {
        auto lease = pool->acquire();
        ASSERT_TRUE(lease);
        leases.push_back(std::move(lease).value());
    }
    EXPECT_EQ(pool->getStats().totalConnections, 12u);
}

TEST_F(ConnectionPoolTest, TimesOutWhenExhausted) {
    config_.maxConnections = 1;
    config_.waitTimeout = 50ms;
    auto pool = makePool();

    auto held = pool->acquire();
    ASSERT_TRUE(held);

    auto start = std::chrono::steady_clock::now();
    auto second = pool->acquire();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::Timeout);
    EXPECT_GE(elapsed, 45ms);
    EXPECT_LT(elapsed, 500ms);
    EXPECT_TRUE(isRetryable(second.error().code));

    auto stats = pool->getStats();
    EXPECT_EQ(stats.timeoutCount, 1u);
    EXPECT_EQ(stats.waitingRequests, 0u);
    EXPECT_EQ(stats.maxObservedWaiting, 1u);
    EXPECT_EQ(stats.totalConnections, 1u);
}

TEST_F(ConnectionPoolTest, CancelledBeforeWaiting) {
    auto pool = makePool();
    std::stop_source source;
    source.request_stop();

    auto lease = pool->acquire(source.get_token());
    ASSERT_FALSE(lease);
    EXPECT_EQ(lease.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(pool->getStats().activeConnections, 0u);
}

TEST_F(ConnectionPoolTest, CancelWakesWaiter) {
    config_.maxConnections = 1;
    config_.waitTimeout = 0ms;
    auto pool = makePool();

    auto held = pool->acquire();
    ASSERT_TRUE(held);

    std::stop_source source;
    Result<std::unique_ptr<PooledConnection>> waited = Error{ErrorCode::Unknown};
    std::thread waiter([&] { waited = pool->acquire(source.get_token()); });

    ASSERT_TRUE(waitFor([&] { return pool->getStats().waitingRequests == 1; }));
    source.request_stop();
    waiter.join();

    ASSERT_FALSE(waited);
    EXPECT_EQ(waited.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(pool->getStats().waitingRequests, 0u);
}

TEST_F(ConnectionPoolTest, ReleaseHandsConnectionToWaiter) {
    config_.maxConnections = 1;
    config_.waitTimeout = 2000ms;
    auto pool = makePool();

    auto held = pool->acquire();
    ASSERT_TRUE(held);
    int heldId = connectionId(*held.value());

    int receivedId = 0;
    std::thread waiter([&] {
        auto lease = pool->acquire();
        if (lease) {
            receivedId = connectionId(*lease.value());
        }
    });

    ASSERT_TRUE(waitFor([&] { return pool->getStats().waitingRequests == 1; }));
    held.value()->release();
    waiter.join();

    EXPECT_EQ(receivedId, heldId);
    EXPECT_EQ(stats_->created.load(), 1);
}

TEST_F(ConnectionPoolTest, WaitersAreServedInArrivalOrder) {
    config_.maxConnections = 1;
    config_.waitTimeout = 2000ms;
    auto pool = makePool();

    auto held = pool->acquire();
    ASSERT_TRUE(held);

    std::mutex orderMutex;
    std::vector<std::string> order;
    auto worker = [&](std::string label) {
        auto lease = pool->acquire();
        if (lease) {
            std::lock_guard<std::mutex> lock(orderMutex);
            order.push_back(std::move(label));
        }
    };

    std::thread first(worker, "first");
    ASSERT_TRUE(waitFor([&] { return pool->getStats().waitingRequests == 1; }));
    std::thread second(worker, "second");
    ASSERT_TRUE(waitFor([&] { return pool->getStats().waitingRequests == 2; }));

    held.value()->release();
    first.join();
    second.join();

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "first");
    EXPECT_EQ(order[1], "second");
}

TEST_F(ConnectionPoolTest, CancelledWaiterPassesFreedSlotOn) {
    config_.minConnections = 0;
    config_.maxConnections = 1;
    config_.waitTimeout = 1000ms;
    auto pool = makePool();

    // The first waiter is cancelled while the dropped connection's slot is
    // offered to it; the second waiter must still get a connection
    for (int round = 0; round < 50; ++round) {
        auto held = pool->acquire();
        ASSERT_TRUE(held);

        std::stop_source cancel;
        std::jthread first([&] { auto lease = pool->acquire(cancel.get_token()); });
        ASSERT_TRUE(waitFor([&] { return pool->getStats().waitingRequests == 1; }));

        Result<std::unique_ptr<PooledConnection>> second = Error{ErrorCode::Unknown};
        std::jthread secondThread([&] { second = pool->acquire(); });
        ASSERT_TRUE(waitFor([&] { return pool->getStats().waitingRequests == 2; }));

        dynamic_cast<FakeConnection&>(**held.value()).kill();
        std::jthread canceller([&] { cancel.request_stop(); });
        held.value()->release();
        canceller.join();
        first.join();
        secondThread.join();

        ASSERT_TRUE(second) << "round " << round << ": " << second.error().message;
        second.value()->release();

        auto stats = pool->getStats();
        expectBalanced(stats);
        EXPECT_EQ(stats.waitingRequests, 0u);
        EXPECT_LE(stats.totalConnections, 1u);
    }
    EXPECT_EQ(pool->getStats().timeoutCount, 0u);
}

TEST_F(ConnectionPoolTest, ShutdownFailsWaitersAndLaterAcquires) {
    config_.maxConnections = 1;
    config_.waitTimeout = 0ms;
    auto pool = makePool();

    auto held = pool->acquire();
    ASSERT_TRUE(held);

    Result<std::unique_ptr<PooledConnection>> waited = Error{ErrorCode::Unknown};
    std::thread waiter([&] { waited = pool->acquire(); });
    ASSERT_TRUE(waitFor([&] { return pool->getStats().waitingRequests == 1; }));

    pool->shutdown();
    waiter.join();

    ASSERT_FALSE(waited);
    EXPECT_EQ(waited.error().code, ErrorCode::PoolClosed);
    EXPECT_FALSE(isRetryable(waited.error().code));
    EXPECT_TRUE(pool->isClosed());

    auto after = pool->acquire();
    ASSERT_FALSE(after);
    EXPECT_EQ(after.error().code, ErrorCode::PoolClosed);

    // Connection still checked out is closed when it comes back
    held.value()->release();
    EXPECT_EQ(stats_->open(), 0);
    EXPECT_EQ(pool->getStats().totalConnections, 0u);

    pool->shutdown();
}

TEST_F(ConnectionPoolTest, DeadIdleConnectionIsReplaced) {
    auto pool = makePool();

    FakeConnection* fake = nullptr;
    {
        auto lease = pool->acquire();
        ASSERT_TRUE(lease);
        fake = dynamic_cast<FakeConnection*>(&**lease.value());
        ASSERT_NE(fake, nullptr);
    }
    int deadId = fake->id();
    fake->kill();

    auto lease = pool->acquire();
    ASSERT_TRUE(lease);
    EXPECT_NE(connectionId(*lease.value()), deadId);
    EXPECT_EQ(stats_->closed.load(), 1);
    EXPECT_EQ(pool->getStats().totalConnections, 1u);
}

TEST_F(ConnectionPoolTest, UnhealthyConnectionIsDroppedOnRelease) {
    auto pool = makePool();

    {
        auto lease = pool->acquire();
        ASSERT_TRUE(lease);
        dynamic_cast<FakeConnection&>(**lease.value()).kill();
    }

    auto stats = pool->getStats();
    EXPECT_EQ(stats.totalConnections, 0u);
    EXPECT_EQ(stats.availableConnections, 0u);
    EXPECT_EQ(stats_->closed.load(), 1);
}

TEST_F(ConnectionPoolTest, FailedCreateDoesNotLeakCapacity) {
    config_.minConnections = 0;
    config_.maxConnections = 1;
    auto pool = makePool();

    stats_->failCreate = true;
    auto failed = pool->acquire();
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::DatabaseError);

    auto stats = pool->getStats();
    EXPECT_EQ(stats.totalConnections, 0u);
    EXPECT_EQ(stats.failedAcquisitions, 1u);

    stats_->failCreate = false;
    auto lease = pool->acquire();
    ASSERT_TRUE(lease);
    EXPECT_EQ(pool->getStats().totalConnections, 1u);
}

TEST_F(ConnectionPoolTest, PruneKeepsMinimum) {
    config_.minConnections = 1;
    config_.maxConnections = 4;
    config_.idleTimeout = 30ms;
    config_.maintenanceInterval = std::chrono::hours(1);
    auto pool = makePool();

    {
        std::vector<std::unique_ptr<PooledConnection>> leases;
        for (int i = 0; i < 3; ++i) {
            auto lease = pool->acquire();
            ASSERT_TRUE(lease);
            leases.push_back(std::move(lease).value());
        }
    }
    EXPECT_EQ(pool->getStats().availableConnections, 3u);

    std::this_thread::sleep_for(60ms);
    pool->pruneIdleConnections();

    auto stats = pool->getStats();
    EXPECT_EQ(stats.totalConnections, 1u);
    EXPECT_EQ(stats.evictedConnections, 2u);
    EXPECT_EQ(stats_->open(), 1);
}

TEST_F(ConnectionPoolTest, MaintenanceThreadEvictsIdleConnections) {
    config_.minConnections = 1;
    config_.maxConnections = 4;
    config_.idleTimeout = 20ms;
    config_.maintenanceInterval = 5ms;
    auto pool = makePool();

    {
        auto a = pool->acquire();
        auto b = pool->acquire();
        ASSERT_TRUE(a);
        ASSERT_TRUE(b);
    }

    EXPECT_TRUE(waitFor([&] { return pool->getStats().totalConnections == 1; }));
    EXPECT_GE(pool->getStats().evictedConnections, 1u);
}

TEST_F(ConnectionPoolTest, WithConnectionReturnsResultAndReleases) {
    auto pool = makePool();

    auto result = pool->withConnection(
        [](IConnection& conn) -> Result<bool> { return conn.isOpen(); });
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value());
    EXPECT_EQ(pool->getStats().activeConnections, 0u);

    auto thrown = pool->withConnection([](IConnection&) -> Result<void> {
        throw std::runtime_error("driver exploded");
    });
    ASSERT_FALSE(thrown);
    EXPECT_EQ(thrown.error().code, ErrorCode::DatabaseError);
    EXPECT_EQ(thrown.error().message, "driver exploded");
    EXPECT_EQ(pool->getStats().activeConnections, 0u);
}

TEST_F(ConnectionPoolTest, ScopedConnectionReportsAcquireError) {
    auto pool = makePool();
    {
        ScopedConnection scoped(*pool);
        EXPECT_TRUE(scoped.isValid());
        EXPECT_EQ(pool->getStats().activeConnections, 1u);
    }
    EXPECT_EQ(pool->getStats().activeConnections, 0u);

    pool->shutdown();
    ScopedConnection closed(*pool);
    EXPECT_FALSE(closed.isValid());
    EXPECT_EQ(closed.error().code, ErrorCode::PoolClosed);
}

TEST_F(ConnectionPoolTest, ConcurrentUseNeverExceedsMaximum) {
    config_.minConnections = 0;
    config_.maxConnections = 3;
    config_.waitTimeout = 5000ms;
    auto pool = makePool();

    std::atomic<int> inUse{0};
    std::atomic<int> peak{0};
    std::atomic<int> failures{0};

    std::atomic<bool> done{false};
    std::atomic<int> samples{0};
    std::atomic<int> violations{0};
    std::thread sampler([&] {
        do {
            auto stats = pool->getStats();
            if (stats.availableConnections > stats.totalConnections ||
                stats.availableConnections + stats.activeConnections != stats.totalConnections ||
                stats.totalConnections > 3) {
                violations++;
            }
            samples++;
            std::this_thread::yield();
        } while (!done);
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                auto lease = pool->acquire();
                if (!lease) {
                    failures++;
                    continue;
                }
                int now = ++inUse;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::yield();
                --inUse;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    done = true;
    sampler.join();

    EXPECT_GT(samples.load(), 0);
    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(failures.load(), 0);
    EXPECT_LE(peak.load(), 3);
    EXPECT_LE(stats_->created.load(), 3);

    auto stats = pool->getStats();
    expectBalanced(stats);
    EXPECT_EQ(stats.activeConnections, 0u);
    EXPECT_EQ(stats.totalAcquired, 400u);
    EXPECT_EQ(stats.totalReleased, 400u);
}

TEST(CreateConnectionPoolTest, RejectsInvalidConfig) {
    auto stats = std::make_shared<FakeConnectionStats>();
    ConnectionPoolConfig config;
    config.minConnections = 3;
    config.maxConnections = 1;

    auto pool = createConnectionPool(config, fakeConnectionFactory(stats));
    ASSERT_FALSE(pool);
    EXPECT_EQ(pool.error().code, ErrorCode::InvalidArgument);
}

TEST(CreateConnectionPoolTest, ReturnsInitializedPool) {
    auto stats = std::make_shared<FakeConnectionStats>();
    ConnectionPoolConfig config;
    config.minConnections = 2;
    config.maxConnections = 2;
    config.idleTimeout = std::chrono::milliseconds(0);

    auto pool = createConnectionPool(config, fakeConnectionFactory(stats));
    ASSERT_TRUE(pool);
    EXPECT_EQ(pool.value()->getStats().totalConnections, 2u);
    pool.value()->shutdown();
    EXPECT_EQ(stats->open(), 0);
}
