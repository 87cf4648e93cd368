#include "dbjob/run_context.h"
#include "dbjob/log/log.h"

DeferredDisposer::~DeferredDisposer() {
    disposeAll();
}

void DeferredDisposer::defer(std::string name, std::function<void()> release) {
    actions.emplace_back(std::move(name), std::move(release));
}

void DeferredDisposer::disposeAll() noexcept {
    while (!actions.empty()) {
        auto action = std::move(actions.back());
        actions.pop_back();

        try {
            action.second();
        }
        catch (const std::exception & ex) {
            LOG("Failed to dispose " << action.first << ": " << ex.what());
        }
    }
}

std::size_t DeferredDisposer::size() const noexcept {
    return actions.size();
}

RunContext::RunContext(std::uint64_t run_id_, std::size_t attempt_, CancellationToken token_, std::optional<std::chrono::seconds> timeout_)
    : run_id(run_id_)
    , attempt(attempt_)
    , token(std::move(token_))
    , timeout(timeout_)
{
}

RunContext::~RunContext() {
    dispose();
}

std::uint64_t RunContext::getRunId() const noexcept {
    return run_id;
}

std::size_t RunContext::getAttempt() const noexcept {
    return attempt;
}

const CancellationToken & RunContext::getCancellationToken() const noexcept {
    return token;
}

bool RunContext::isCancellationRequested() const noexcept {
    return token.isCancellationRequested();
}

std::optional<std::chrono::seconds> RunContext::getTimeout() const noexcept {
    return timeout;
}

void RunContext::acquireConnection(ConnectionPool & pool) {
    lease = std::make_unique<ConnectionLease>(pool.acquire());
    disposer.defer("connection", [this] () {
        if (close_connection && !lease->isBroken()) {
            LOG_LOCAL("Closing connection");
            lease->markBroken();
        }
        else {
            LOG_LOCAL("Releasing connection" << (lease->isBroken() ? " (broken)" : ""));
        }
        lease.reset();
    });
}

void RunContext::joinScope(std::shared_ptr<JobScope> scope_) {
    scope = std::move(scope_);
    scope_lock = scope->lockForRun();
    disposer.defer("scope", [this] () {
        if (scope_lock.owns_lock())
            scope_lock.unlock();
        scope.reset();
    });
}

bool RunContext::isScoped() const noexcept {
    return static_cast<bool>(scope);
}

DriverConnection & RunContext::getConnection() const {
    if (scope)
        return scope->getConnection();

    if (!lease || !*lease)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Pipeline, "Run has no connection");

    return lease->get();
}

void RunContext::beginTransaction(IsolationLevel level) {
    transaction = getConnection().beginTransaction(level);
    transaction_finished = false;
    disposer.defer("transaction", [this] () {
        if (!transaction_finished)
            LOG_LOCAL("Transaction was neither committed nor rolled back, rolling back");
        transaction.reset();
    });
}

DriverTransaction * RunContext::getTransaction() const noexcept {
    if (transaction && !transaction_finished)
        return transaction.get();

    if (scope)
        return scope->getTransaction();

    return nullptr;
}

bool RunContext::ownsTransaction() const noexcept {
    return (transaction && !transaction_finished);
}

void RunContext::commit() {
    if (!ownsTransaction())
        return;

    transaction_finished = true;
    try {
        transaction->commit();
    }
    catch (...) {
        // The server side state of the transaction is unknown, the connection must not be reused.
        markConnectionBroken();
        throw;
    }
    LOG_LOCAL("Transaction committed");
}

void RunContext::rollback() {
    if (!ownsTransaction())
        return;

    transaction_finished = true;
    try {
        transaction->rollback();
    }
    catch (...) {
        markConnectionBroken();
        throw;
    }
    LOG_LOCAL("Transaction rolled back");
}

DriverCommand & RunContext::adoptCommand(std::unique_ptr<DriverCommand> command_) {
    command = std::move(command_);
    disposer.defer("command", [this] () {
        command.reset();
    });

    auto * command_ptr = command.get();
    cancel_registration = token.registerCallback([command_ptr] () {
        command_ptr->cancel();
    });
    disposer.defer("cancellation registration", [this] () {
        cancel_registration.reset();
    });

    return *command;
}

DriverCursor & RunContext::adoptCursor(std::unique_ptr<DriverCursor> cursor_) {
    cursor = std::move(cursor_);
    disposer.defer("cursor", [this] () {
        cursor.reset();
    });
    return *cursor;
}

DriverCommand * RunContext::getCommand() const noexcept {
    return command.get();
}

DriverCursor * RunContext::getCursor() const noexcept {
    return cursor.get();
}

void RunContext::markConnectionBroken() noexcept {
    if (lease)
        lease->markBroken();
    else if (scope)
        scope->markBroken();
}

void RunContext::closeConnectionOnRelease() {
    if (scope) {
        LOG_LOCAL("CloseConnection is ignored for a run of a scope");
        return;
    }

    close_connection = true;
}

void RunContext::dispose() noexcept {
    if (disposed)
        return;

    disposed = true;
    disposer.disposeAll();
}

bool RunContext::isDisposed() const noexcept {
    return disposed;
}

bool RunContext::isLoggingEnabled() const {
    return Engine::getInstance().isLoggingEnabled();
}

void RunContext::writeLogMessagePrefix(std::ostream & stream) {
    Engine::getInstance().writeLogMessagePrefix(stream);
    stream << " [RUN=" << run_id << "#" << attempt << "]";
}

void RunContext::writeLogLine(const std::string & line) {
    Engine::getInstance().writeLogLine(line);
}
