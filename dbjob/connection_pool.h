#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/driver.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

#include <cstddef>

class ConnectionPool;

// Exclusive use of one pooled connection. Returns the connection to the pool on destruction,
// or discards it if it was marked broken.
class ConnectionLease {
public:
    ConnectionLease() = default;
    ConnectionLease(std::shared_ptr<ConnectionPool> pool_, std::unique_ptr<DriverConnection> connection_);

    ConnectionLease(const ConnectionLease &) = delete;
    ConnectionLease & operator= (const ConnectionLease &) = delete;

    ConnectionLease(ConnectionLease && other) noexcept;
    ConnectionLease & operator= (ConnectionLease && other) noexcept;

    ~ConnectionLease();

    DriverConnection & get() const;
    DriverConnection * operator-> () const;
    explicit operator bool () const noexcept;

    void markBroken() noexcept;
    bool isBroken() const noexcept;

    void release() noexcept;

private:
    std::shared_ptr<ConnectionPool> pool;
    std::unique_ptr<DriverConnection> connection;
    bool broken = false;
};

// Bounded pool of driver connections. Idle connections are reused most recently returned first.
class ConnectionPool
    : public std::enable_shared_from_this<ConnectionPool>
{
private:
    struct Private {};

public:
    ConnectionPool(Private, std::shared_ptr<Driver> driver_, std::size_t max_size_, std::chrono::milliseconds acquire_timeout_);

    static std::shared_ptr<ConnectionPool> create(std::shared_ptr<Driver> driver, std::size_t max_size, std::chrono::milliseconds acquire_timeout);

    // Blocks until a connection is available, throws TransientConnectionError/PoolExhausted on timeout.
    ConnectionLease acquire();

    // Drops idle connections.
    void clear();

    Driver & getDriver() const noexcept;
    std::size_t getMaxSize() const noexcept;
    std::size_t getOpenCount() const;
    std::size_t getIdleCount() const;

private:
    friend class ConnectionLease;

    void giveBack(std::unique_ptr<DriverConnection> connection, bool broken) noexcept;
    void forgetOne() noexcept;

private:
    const std::shared_ptr<Driver> driver;
    const std::size_t max_size;
    const std::chrono::milliseconds acquire_timeout;

    mutable std::mutex mutex;
    std::condition_variable available;
    std::deque<std::unique_ptr<DriverConnection>> idle;
    std::size_t open_count = 0;
};
