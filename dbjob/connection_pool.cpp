#include "dbjob/connection_pool.h"
#include "dbjob/exception.h"
#include "dbjob/log/log.h"

ConnectionLease::ConnectionLease(std::shared_ptr<ConnectionPool> pool_, std::unique_ptr<DriverConnection> connection_)
    : pool(std::move(pool_))
    , connection(std::move(connection_))
{
}

ConnectionLease::ConnectionLease(ConnectionLease && other) noexcept
    : pool(std::move(other.pool))
    , connection(std::move(other.connection))
    , broken(other.broken)
{
}

ConnectionLease & ConnectionLease::operator= (ConnectionLease && other) noexcept {
    if (this != &other) {
        release();
        pool = std::move(other.pool);
        connection = std::move(other.connection);
        broken = other.broken;
    }
    return *this;
}

ConnectionLease::~ConnectionLease() {
    release();
}

DriverConnection & ConnectionLease::get() const {
    if (!connection)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::ConnectionPool, "Connection lease is empty");
    return *connection;
}

DriverConnection * ConnectionLease::operator-> () const {
    return &get();
}

ConnectionLease::operator bool () const noexcept {
    return static_cast<bool>(connection);
}

void ConnectionLease::markBroken() noexcept {
    broken = true;
}

bool ConnectionLease::isBroken() const noexcept {
    return broken;
}

void ConnectionLease::release() noexcept {
    if (pool && connection)
        pool->giveBack(std::move(connection), broken);

    connection.reset();
    pool.reset();
    broken = false;
}

ConnectionPool::ConnectionPool(Private, std::shared_ptr<Driver> driver_, std::size_t max_size_, std::chrono::milliseconds acquire_timeout_)
    : driver(std::move(driver_))
    , max_size(max_size_)
    , acquire_timeout(acquire_timeout_)
{
    if (!driver)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::ConnectionPool, "Connection pool requires a driver");

    if (max_size == 0)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::ConnectionPool, "Connection pool size must be positive");
}

std::shared_ptr<ConnectionPool> ConnectionPool::create(std::shared_ptr<Driver> driver, std::size_t max_size, std::chrono::milliseconds acquire_timeout) {
    return std::make_shared<ConnectionPool>(Private{}, std::move(driver), max_size, acquire_timeout);
}

ConnectionLease ConnectionPool::acquire() {
    const auto deadline = std::chrono::steady_clock::now() + acquire_timeout;
    std::unique_lock<std::mutex> lock(mutex);

    while (true) {
        if (!idle.empty()) {
            auto connection = std::move(idle.back());
            idle.pop_back();
            lock.unlock();

            if (connection->isAlive())
                return ConnectionLease{shared_from_this(), std::move(connection)};

            LOG("Discarding dead idle connection of " << driver->getName());
            connection.reset();
            forgetOne();

            lock.lock();
            continue;
        }

        if (open_count < max_size) {
            ++open_count;
            lock.unlock();

            std::unique_ptr<DriverConnection> connection;
            try {
                connection = driver->openConnection();
            }
            catch (...) {
                forgetOne();
                throw;
            }

            LOG("Opened new connection of " << driver->getName() << ", pool size " << max_size);
            return ConnectionLease{shared_from_this(), std::move(connection)};
        }

        if (available.wait_until(lock, deadline) == std::cv_status::timeout && idle.empty() && open_count >= max_size) {
            throw JobException(ErrorKind::TransientConnectionError, ErrorCode::PoolExhausted, Component::ConnectionPool,
                "No connection became available in " + std::to_string(acquire_timeout.count()) + " ms, all " + std::to_string(max_size) + " are in use",
                "HYT00");
        }
    }
}

void ConnectionPool::clear() {
    std::deque<std::unique_ptr<DriverConnection>> dropped;

    {
        std::lock_guard<std::mutex> lock(mutex);
        dropped.swap(idle);
        open_count -= dropped.size();
    }

    available.notify_all();
}

Driver & ConnectionPool::getDriver() const noexcept {
    return *driver;
}

std::size_t ConnectionPool::getMaxSize() const noexcept {
    return max_size;
}

std::size_t ConnectionPool::getOpenCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return open_count;
}

std::size_t ConnectionPool::getIdleCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return idle.size();
}

void ConnectionPool::giveBack(std::unique_ptr<DriverConnection> connection, bool broken) noexcept {
    if (broken) {
        LOG("Discarding broken connection of " << driver->getName());
        connection.reset();
        forgetOne();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        idle.push_back(std::move(connection));
    }

    available.notify_one();
}

void ConnectionPool::forgetOne() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (open_count > 0)
            --open_count;
    }

    available.notify_one();
}
