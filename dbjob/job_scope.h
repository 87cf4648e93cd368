#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/connection_pool.h"
#include "dbjob/driver.h"

#include <memory>
#include <mutex>

// A connection, and optionally a transaction, owned by the caller and shared by several jobs.
// Jobs chained to a scope never commit, roll back or release them, and run one at a time.
class JobScope {
public:
    JobScope(ConnectionLease lease_, IsolationLevel isolation);
    ~JobScope();

    JobScope(const JobScope &) = delete;
    JobScope & operator= (const JobScope &) = delete;

    DriverConnection & getConnection() const;
    DriverTransaction * getTransaction() const noexcept;
    bool hasTransaction() const noexcept;

    void commit();
    void rollback();

    // Marks the connection so that it is discarded instead of pooled when the scope ends.
    void markBroken() noexcept;

    std::unique_lock<std::mutex> lockForRun();

private:
    ConnectionLease lease;
    std::unique_ptr<DriverTransaction> transaction;
    bool finished = false;
    std::mutex run_mutex;
};
