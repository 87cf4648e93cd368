#include "dbjob/connection_pool.h"
#include "dbjob/job_scope.h"
#include "dbjob/test/fake_driver.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class ConnectionPoolTest
    : public ::testing::Test
{
protected:
    std::shared_ptr<ConnectionPool> makePool(std::size_t size, std::chrono::milliseconds timeout = 50ms) {
        return ConnectionPool::create(driver, size, timeout);
    }

    static std::size_t idOf(const ConnectionLease & lease) {
        return dynamic_cast<FakeConnection &>(lease.get()).getId();
    }

    std::shared_ptr<FakeDriver> driver = std::make_shared<FakeDriver>();
    FakeDatabase & database = driver->getDatabase();
};

TEST_F(ConnectionPoolTest, InvalidConfiguration) {
    EXPECT_THROW(ConnectionPool::create(nullptr, 1, 10ms), JobException);
    EXPECT_THROW(ConnectionPool::create(driver, 0, 10ms), JobException);
}

TEST_F(ConnectionPoolTest, OpensLazily) {
    auto pool = makePool(4);
    EXPECT_EQ(pool->getOpenCount(), 0u);
    EXPECT_EQ(database.getConnectionsOpened(), 0u);

    auto lease = pool->acquire();
    EXPECT_TRUE(lease);
    EXPECT_EQ(pool->getOpenCount(), 1u);
    EXPECT_EQ(pool->getIdleCount(), 0u);
}

TEST_F(ConnectionPoolTest, ReusesMostRecentlyReturned) {
    auto pool = makePool(3);

    auto first = pool->acquire();
    auto second = pool->acquire();
    ASSERT_EQ(idOf(first), 1u);
    ASSERT_EQ(idOf(second), 2u);

    first.release();
    second.release();
    EXPECT_EQ(pool->getIdleCount(), 2u);

    auto reused = pool->acquire();
    EXPECT_EQ(idOf(reused), 2u);
    EXPECT_EQ(database.getConnectionsOpened(), 2u);
}

TEST_F(ConnectionPoolTest, ExhaustedPoolTimesOut) {
    auto pool = makePool(1, 20ms);
    auto held = pool->acquire();

    try {
        pool->acquire();
        FAIL() << "no exception thrown";
    }
    catch (const JobException & ex) {
        EXPECT_EQ(ex.getKind(), ErrorKind::TransientConnectionError);
        EXPECT_EQ(ex.getCode(), ErrorCode::PoolExhausted);
        EXPECT_EQ(ex.getComponent(), Component::ConnectionPool);
    }
}

TEST_F(ConnectionPoolTest, WaiterGetsReturnedConnection) {
    auto pool = makePool(1, 2000ms);
    auto held = pool->acquire();

    std::thread releaser([&] {
        std::this_thread::sleep_for(20ms);
        held.release();
    });

    auto lease = pool->acquire();
    releaser.join();

    EXPECT_EQ(idOf(lease), 1u);
    EXPECT_EQ(database.getConnectionsOpened(), 1u);
}

TEST_F(ConnectionPoolTest, BrokenConnectionsAreDiscarded) {
    auto pool = makePool(1);

    {
        auto lease = pool->acquire();
        lease.markBroken();
    }

    EXPECT_EQ(pool->getOpenCount(), 0u);
    EXPECT_EQ(pool->getIdleCount(), 0u);
    EXPECT_EQ(database.journalCount("disconnect#1"), 1u);

    auto lease = pool->acquire();
    EXPECT_EQ(idOf(lease), 2u);
}

TEST_F(ConnectionPoolTest, DeadIdleConnectionsAreReplaced) {
    auto pool = makePool(2);
    pool->acquire().release();
    EXPECT_EQ(pool->getIdleCount(), 1u);

    database.setAlive(false);
    auto lease = pool->acquire();

    EXPECT_EQ(idOf(lease), 2u);
    EXPECT_EQ(pool->getOpenCount(), 1u);
    EXPECT_EQ(database.journalCount("disconnect#1"), 1u);
}

TEST_F(ConnectionPoolTest, FailedConnectFreesTheSlot) {
    auto pool = makePool(1);
    database.failNextConnect(makeTransientError());

    EXPECT_THROW(pool->acquire(), JobException);
    EXPECT_EQ(pool->getOpenCount(), 0u);

    auto lease = pool->acquire();
    EXPECT_TRUE(lease);
}

TEST_F(ConnectionPoolTest, ClearDropsIdleConnections) {
    auto pool = makePool(2);
    {
        auto a = pool->acquire();
        auto b = pool->acquire();
    }
    EXPECT_EQ(pool->getIdleCount(), 2u);

    pool->clear();
    EXPECT_EQ(pool->getIdleCount(), 0u);
    EXPECT_EQ(pool->getOpenCount(), 0u);
    EXPECT_EQ(database.journalCount("disconnect#1") + database.journalCount("disconnect#2"), 2u);
}

TEST_F(ConnectionPoolTest, ConcurrentAcquireNeverExceedsTheBound) {
    constexpr std::size_t pool_size = 3;
    auto pool = makePool(pool_size, 5000ms);

    std::atomic<std::size_t> in_use{0};
    std::atomic<std::size_t> peak{0};
    std::vector<std::thread> workers;

    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&] {
            for (int j = 0; j < 20; ++j) {
                auto lease = pool->acquire();
                const auto now = ++in_use;
                auto seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(1ms);
                --in_use;
            }
        });
    }

    for (auto & worker : workers) {
        worker.join();
    }

    EXPECT_LE(peak.load(), pool_size);
    EXPECT_LE(database.getConnectionsOpened(), pool_size);
    EXPECT_EQ(pool->getIdleCount(), pool->getOpenCount());
}

TEST_F(ConnectionPoolTest, LeaseOutlivesPoolHandle) {
    auto pool = makePool(1);
    auto lease = pool->acquire();
    pool.reset();

    EXPECT_EQ(idOf(lease), 1u);
    lease.release();
    EXPECT_EQ(database.journalCount("disconnect#1"), 1u);
}

TEST_F(ConnectionPoolTest, ScopeRollsBackUnlessCommitted) {
    auto pool = makePool(1);

    {
        JobScope scope(pool->acquire(), IsolationLevel::Serializable);
        EXPECT_TRUE(scope.hasTransaction());
        EXPECT_NE(scope.getTransaction(), nullptr);
    }

    EXPECT_EQ(database.journalCount("begin Serializable"), 1u);
    EXPECT_EQ(database.journalCount("rollback"), 1u);
    EXPECT_EQ(pool->getIdleCount(), 1u);

    database.clearJournal();
    {
        JobScope scope(pool->acquire(), IsolationLevel::ReadCommitted);
        scope.commit();
        EXPECT_FALSE(scope.hasTransaction());
        EXPECT_THROW(scope.commit(), JobException);
        EXPECT_THROW(scope.rollback(), JobException);
    }

    EXPECT_EQ(database.journalCount("commit"), 1u);
    EXPECT_EQ(database.journalCount("rollback"), 0u);
}

TEST_F(ConnectionPoolTest, FailedScopeCommitDiscardsTheConnection) {
    auto pool = makePool(1);
    database.failCommit(makeCommandError("commit rejected"));

    {
        JobScope scope(pool->acquire(), IsolationLevel::ReadCommitted);
        EXPECT_THROW(scope.commit(), JobException);
        EXPECT_FALSE(scope.hasTransaction());
    }

    EXPECT_EQ(database.journalCount("commit failed"), 1u);
    EXPECT_EQ(database.journalCount("rollback on release"), 0u);
    EXPECT_EQ(pool->getIdleCount(), 0u);
    EXPECT_EQ(pool->getOpenCount(), 0u);
}

TEST_F(ConnectionPoolTest, ScopeWithoutIsolationHasNoTransaction) {
    auto pool = makePool(1);
    JobScope scope(pool->acquire(), IsolationLevel::Unspecified);

    EXPECT_FALSE(scope.hasTransaction());
    EXPECT_THROW(scope.commit(), JobException);
    EXPECT_EQ(database.journalCount("begin Unspecified"), 0u);
}
