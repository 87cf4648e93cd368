#include "dbjob/job_scope.h"
#include "dbjob/log/log.h"

JobScope::JobScope(ConnectionLease lease_, IsolationLevel isolation)
    : lease(std::move(lease_))
{
    if (isolation != IsolationLevel::Unspecified)
        transaction = lease->beginTransaction(isolation);
}

JobScope::~JobScope() {
    if (transaction && !finished) {
        LOG("Scope ended without commit, rolling back");
        try {
            transaction->rollback();
        }
        catch (const std::exception & ex) {
            LOG("Rollback failed: " << ex.what());
            lease.markBroken();
        }
    }

    transaction.reset();
}

DriverConnection & JobScope::getConnection() const {
    return lease.get();
}

DriverTransaction * JobScope::getTransaction() const noexcept {
    return (finished ? nullptr : transaction.get());
}

bool JobScope::hasTransaction() const noexcept {
    return (transaction && !finished);
}

void JobScope::commit() {
    std::lock_guard<std::mutex> lock(run_mutex);
    if (!transaction || finished)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Pipeline, "Scope has no open transaction to commit");

    finished = true;
    try {
        transaction->commit();
    }
    catch (...) {
        lease.markBroken();
        throw;
    }
}

void JobScope::rollback() {
    std::lock_guard<std::mutex> lock(run_mutex);
    if (!transaction || finished)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Pipeline, "Scope has no open transaction to roll back");

    finished = true;
    try {
        transaction->rollback();
    }
    catch (...) {
        lease.markBroken();
        throw;
    }
}

void JobScope::markBroken() noexcept {
    lease.markBroken();
}

std::unique_lock<std::mutex> JobScope::lockForRun() {
    return std::unique_lock<std::mutex>(run_mutex);
}
