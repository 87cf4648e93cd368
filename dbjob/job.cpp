#include "dbjob/job.h"
#include "dbjob/log/log.h"

#include <algorithm>
#include <thread>

const char * toString(JobState state) noexcept {
    switch (state) {
        case JobState::Configured:         return "Configured";
        case JobState::ConnectionAcquired: return "ConnectionAcquired";
        case JobState::TransactionOpen:    return "TransactionOpen";
        case JobState::Executing:          return "Executing";
        case JobState::Materializing:      return "Materializing";
        case JobState::Completing:         return "Completing";
        case JobState::Succeeded:          return "Succeeded";
        case JobState::Failed:             return "Failed";
        case JobState::Canceled:           return "Canceled";
    }
    return "Unknown";
}

bool isTerminal(JobState state) noexcept {
    return (
        state == JobState::Succeeded ||
        state == JobState::Failed ||
        state == JobState::Canceled
    );
}

JobExecution::JobExecution(
    std::unique_ptr<RunContext> & context_,
    DriverCommand & command_,
    const CommandDefinition & definition_,
    CommandBehavior behavior_,
    bool buffered_,
    bool use_plan_cache_,
    bool commit_on_cancel_,
    StateListener listener_
)
    : context(context_)
    , command(command_)
    , definition(definition_)
    , behavior(behavior_)
    , buffered(buffered_)
    , use_plan_cache(use_plan_cache_)
    , commit_on_cancel(commit_on_cancel_)
    , listener(std::move(listener_))
{
}

RunContext & JobExecution::getContext() const {
    if (!context)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Pipeline, "Run context was moved to a lazy result");
    return *context;
}

DriverCommand & JobExecution::getCommand() const noexcept {
    return command;
}

const CommandDefinition & JobExecution::getDefinition() const noexcept {
    return definition;
}

CommandBehavior JobExecution::getBehavior() const noexcept {
    return behavior;
}

bool JobExecution::isBuffered() const noexcept {
    return buffered;
}

ResultReader & JobExecution::executeReader() {
    if (reader)
        return *reader;

    auto & run = getContext();
    auto & cursor = run.adoptCursor(command.execute(behavior));

    if (listener)
        listener(JobState::Materializing);

    reader = std::make_unique<ResultReader>(cursor, behavior, run.getCancellationToken(), definition.map_settings, use_plan_cache);
    return *reader;
}

std::int64_t JobExecution::executeNonQuery() {
    getContext();
    const auto affected = command.executeNonQuery();

    if (listener)
        listener(JobState::Materializing);

    return affected;
}

std::shared_ptr<ActiveRun> JobExecution::detach() {
    if (reader)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Pipeline, "Run already has a buffered reader");

    auto & run = getContext();
    auto & cursor = run.adoptCursor(command.execute(behavior));

    if (listener)
        listener(JobState::Materializing);

    const bool commit_when_canceled = commit_on_cancel;
    auto on_finish = [commit_when_canceled] (RunContext & finished, std::exception_ptr error) {
        if (!error) {
            job_pipeline::completeTransaction(finished, finished.isCancellationRequested(), commit_when_canceled);
            LOG_TARGET(finished, "Lazy result completed");
            return;
        }

        try {
            finished.rollback();
        }
        catch (const std::exception & ex) {
            LOG_TARGET(finished, "Failed to roll back after a lazy read failure: " << ex.what());
            finished.markConnectionBroken();
        }
    };

    auto active_run = std::make_shared<ActiveRun>(std::move(context), cursor, behavior, definition.map_settings, use_plan_cache, std::move(on_finish));
    detached = true;
    return active_run;
}

bool JobExecution::isDetached() const noexcept {
    return detached;
}

bool JobExecution::wasCanceled() const noexcept {
    if (reader && reader->wasCanceled())
        return true;

    return (context && context->isCancellationRequested());
}

namespace job_pipeline {

JobError makeError(ErrorKind kind, ErrorCode code, Component component, const std::string & message, std::size_t attempt) {
    JobError error;
    error.kind = kind;
    error.code = code;
    error.component = component;
    error.message = message;
    error.attempt = attempt;

    if (kind == ErrorKind::CanceledError)
        error.sql_state = "HY008";

    return error;
}

void logTransition(std::uint64_t run_id, std::size_t attempt, JobState from, JobState to) {
    LOG("[RUN=" << run_id << "#" << attempt << "] " << toString(from) << " -> " << toString(to));
}

void finishFailedAttempt(RunContext & context, const JobError & error, bool commit_on_cancel) noexcept {
    if (context.ownsTransaction()) {
        try {
            if (error.kind == ErrorKind::CanceledError && commit_on_cancel)
                context.commit();
            else
                context.rollback();
        }
        catch (const std::exception & ex) {
            LOG_TARGET(context, "Failed to end transaction after error: " << ex.what());
            context.markConnectionBroken();
        }
    }

    if (error.isTransient())
        context.markConnectionBroken();

    context.dispose();
}

void completeTransaction(RunContext & context, bool canceled, bool commit_on_cancel) {
    if (canceled && !commit_on_cancel)
        context.rollback();
    else
        context.commit();
}

ParameterCollection readOutputParameters(DriverCommand & command, const ParameterCollection & parameters) {
    ParameterCollection outputs;

    for (const auto & descriptor : parameters) {
        if (!descriptor.isOutput() || descriptor.isPositional())
            continue;

        auto output = descriptor;
        output.value = command.getOutputValue(descriptor.name);
        outputs.add(std::move(output));
    }

    return outputs;
}

bool waitBeforeRetry(std::chrono::milliseconds delay, const CancellationToken & token) {
    constexpr std::chrono::milliseconds slice{20};
    const auto deadline = std::chrono::steady_clock::now() + delay;

    while (!token.isCancellationRequested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return true;

        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
    }

    return false;
}

void throwStarted() {
    throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::JobHandle,
        "Job settings cannot be changed after the job has started", "HY010");
}

} // namespace job_pipeline
