#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/cancellation.h"
#include "dbjob/connection_pool.h"
#include "dbjob/driver.h"
#include "dbjob/job_scope.h"

#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

// Stack of release actions, executed in reverse registration order exactly once.
class DeferredDisposer {
public:
    DeferredDisposer() = default;
    ~DeferredDisposer();

    DeferredDisposer(const DeferredDisposer &) = delete;
    DeferredDisposer & operator= (const DeferredDisposer &) = delete;

    void defer(std::string name, std::function<void()> release);

    // Failures of individual actions are logged and do not stop the rest.
    void disposeAll() noexcept;

    std::size_t size() const noexcept;

private:
    std::vector<std::pair<std::string, std::function<void()>>> actions;
};

// Per-execution state of one job run: the live connection, optional transaction,
// cancellation state, effective timeout, and the resources to release at the end of the run.
class RunContext {
public:
    RunContext(std::uint64_t run_id_, std::size_t attempt_, CancellationToken token_, std::optional<std::chrono::seconds> timeout_);
    ~RunContext();

    RunContext(const RunContext &) = delete;
    RunContext & operator= (const RunContext &) = delete;

    std::uint64_t getRunId() const noexcept;
    std::size_t getAttempt() const noexcept;
    const CancellationToken & getCancellationToken() const noexcept;
    bool isCancellationRequested() const noexcept;
    std::optional<std::chrono::seconds> getTimeout() const noexcept;

    void acquireConnection(ConnectionPool & pool);
    void joinScope(std::shared_ptr<JobScope> scope_);
    bool isScoped() const noexcept;
    DriverConnection & getConnection() const;

    void beginTransaction(IsolationLevel level);
    DriverTransaction * getTransaction() const noexcept;
    bool ownsTransaction() const noexcept;
    void commit();
    void rollback();

    DriverCommand & adoptCommand(std::unique_ptr<DriverCommand> command_);
    DriverCursor & adoptCursor(std::unique_ptr<DriverCursor> cursor_);
    DriverCommand * getCommand() const noexcept;
    DriverCursor * getCursor() const noexcept;

    // The connection will be discarded instead of returned to the pool.
    void markConnectionBroken() noexcept;

    // The pooled connection will be closed when the run releases it. Connections of a scope are kept.
    void closeConnectionOnRelease();

    void dispose() noexcept;
    bool isDisposed() const noexcept;

    bool isLoggingEnabled() const;
    void writeLogMessagePrefix(std::ostream & stream);
    void writeLogLine(const std::string & line);

private:
    const std::uint64_t run_id;
    const std::size_t attempt;
    const CancellationToken token;
    const std::optional<std::chrono::seconds> timeout;

    std::shared_ptr<JobScope> scope;
    std::unique_lock<std::mutex> scope_lock;
    std::unique_ptr<ConnectionLease> lease;
    bool close_connection = false;
    std::unique_ptr<DriverTransaction> transaction;
    bool transaction_finished = false;
    std::unique_ptr<DriverCommand> command;
    CancellationRegistration cancel_registration;
    std::unique_ptr<DriverCursor> cursor;

    DeferredDisposer disposer;
    bool disposed = false;
};
