#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/config/config.h"
#include "dbjob/cancellation.h"
#include "dbjob/command.h"
#include "dbjob/connection_pool.h"
#include "dbjob/diagnostics.h"
#include "dbjob/engine.h"
#include "dbjob/exception.h"
#include "dbjob/job_scope.h"
#include "dbjob/log/log.h"
#include "dbjob/result_reader.h"
#include "dbjob/result_sequence.h"
#include "dbjob/run_context.h"

#include <Poco/Exception.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <cstddef>
#include <cstdint>

enum class JobState {
    Configured,
    ConnectionAcquired,
    TransactionOpen,
    Executing,
    Materializing,
    Completing,
    Succeeded,
    Failed,
    Canceled
};

const char * toString(JobState state) noexcept;
bool isTerminal(JobState state) noexcept;

struct RetryPolicy {
    std::size_t max_attempts = 1;
    std::chrono::milliseconds delay{0};
};

// Outcome of one run of a job.
template <typename T>
class JobResult
    : public DiagnosticsContainer
{
public:
    JobState getState() const noexcept {
        return state;
    }

    bool isSucceeded() const noexcept {
        return (state == JobState::Succeeded);
    }

    bool isFailed() const noexcept {
        return (state == JobState::Failed);
    }

    bool isCanceled() const noexcept {
        return (state == JobState::Canceled);
    }

    bool hasValue() const noexcept {
        return value.has_value();
    }

    const T & getValue() const {
        if (!value)
            throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::JobHandle,
                std::string{"Job result holds no value, terminal state is "} + toString(state));
        return *value;
    }

    T & getValue() {
        return const_cast<T &>(static_cast<const JobResult &>(*this).getValue());
    }

    T takeValue() {
        auto & stored = getValue();
        return std::move(stored);
    }

    /// The error that ended the run. Still set when a fallback value was substituted.
    const std::optional<JobError> & getError() const noexcept {
        return error;
    }

    bool usedFallback() const noexcept {
        return used_fallback;
    }

    std::size_t getAttempts() const noexcept {
        return attempts;
    }

    /// Values of output, input-output and return value parameters after a successful run.
    const ParameterCollection & getOutputParameters() const noexcept {
        return output_parameters;
    }

    void setState(JobState state_) noexcept {
        state = state_;
    }

    void setValue(T && value_) {
        value.emplace(std::move(value_));
    }

    void resetValue() noexcept {
        value.reset();
    }

    void setError(const JobError & error_) {
        error = error_;
    }

    void setUsedFallback(bool used_fallback_) noexcept {
        used_fallback = used_fallback_;
    }

    void setAttempts(std::size_t attempts_) noexcept {
        attempts = attempts_;
    }

    void setOutputParameters(ParameterCollection output_parameters_) {
        output_parameters = std::move(output_parameters_);
    }

private:
    JobState state = JobState::Configured;
    std::optional<T> value;
    std::optional<JobError> error;
    bool used_fallback = false;
    std::size_t attempts = 0;
    ParameterCollection output_parameters;
};

// What a job's materializer sees of the running command.
class JobExecution {
public:
    using StateListener = std::function<void(JobState)>;

    JobExecution(
        std::unique_ptr<RunContext> & context_,
        DriverCommand & command_,
        const CommandDefinition & definition_,
        CommandBehavior behavior_,
        bool buffered_,
        bool use_plan_cache_,
        bool commit_on_cancel_,
        StateListener listener_
    );

    RunContext & getContext() const;
    DriverCommand & getCommand() const noexcept;
    const CommandDefinition & getDefinition() const noexcept;
    CommandBehavior getBehavior() const noexcept;
    bool isBuffered() const noexcept;

    /// Executes the command and returns a reader over its cursor. The cursor is owned by the run.
    ResultReader & executeReader();

    /// Executes the command, consuming every segment. Returns the affected row count, -1 if not known.
    std::int64_t executeNonQuery();

    /// Executes the command and moves the run's resources into an ActiveRun. The transaction is ended
    /// when the caller exhausts, closes or drops the rows: rollback on a read failure, else commit.
    std::shared_ptr<ActiveRun> detach();
    bool isDetached() const noexcept;

    /// Cancellation stopped the reader, or was requested during the run.
    bool wasCanceled() const noexcept;

private:
    std::unique_ptr<RunContext> & context;
    DriverCommand & command;
    const CommandDefinition & definition;
    const CommandBehavior behavior;
    const bool buffered;
    const bool use_plan_cache;
    const bool commit_on_cancel;
    StateListener listener;

    std::unique_ptr<ResultReader> reader;
    bool detached = false;
};

namespace job_pipeline {

    // Settings of a job that are fixed once it started running.
    struct Config {
        std::shared_ptr<ConnectionPool> pool;
        std::function<void(CommandDefinition &)> command_source;
        CommandBehavior default_behavior = CommandBehavior::Default;
        IsolationLevel isolation = IsolationLevel::Unspecified;
        std::optional<std::chrono::seconds> timeout;
        RetryPolicy retry;
        bool buffered = true;
        bool commit_on_cancel = false;
        bool plan_cache = true;
        CancellationToken token;
        std::shared_ptr<JobScope> scope;
        JobFlags flags = JobFlags::None;
    };

    JobError makeError(ErrorKind kind, ErrorCode code, Component component, const std::string & message, std::size_t attempt);

    void logTransition(std::uint64_t run_id, std::size_t attempt, JobState from, JobState to);

    // Ends the transaction of a failed attempt and releases its resources.
    void finishFailedAttempt(RunContext & context, const JobError & error, bool commit_on_cancel) noexcept;

    // Ends the transaction of an attempt that produced its result.
    void completeTransaction(RunContext & context, bool canceled, bool commit_on_cancel);

    // Output parameter values, read back from the command.
    ParameterCollection readOutputParameters(DriverCommand & command, const ParameterCollection & parameters);

    // Returns false if the wait was interrupted by cancellation.
    bool waitBeforeRetry(std::chrono::milliseconds delay, const CancellationToken & token);

    [[noreturn]] void throwStarted();

} // namespace job_pipeline

// A deferred, configurable unit of database work. Setters may only be used before the first run.
template <typename T>
class Job {
public:
    using Materializer = std::function<T(JobExecution &)>;
    using CommandSource = std::function<void(CommandDefinition &)>;
    using ErrorFallback = std::function<T(const JobError &)>;
    using CompletionHook = std::function<T(T &&)>;

private:
    struct Shared {
        job_pipeline::Config config;
        Materializer materializer;
        ErrorFallback fallback;
        CompletionHook on_completed;
        std::atomic<JobState> state{JobState::Configured};
        std::atomic<bool> started{false};
    };

public:
    Job(
        std::shared_ptr<ConnectionPool> pool,
        CommandSource command_source,
        Materializer materializer,
        CommandBehavior default_behavior,
        const EngineSettings & settings = EngineSettings{}
    )
        : shared(std::make_shared<Shared>())
    {
        if (!pool)
            throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::JobHandle, "Job requires a connection pool");

        if (!command_source)
            throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::JobHandle, "Job requires a command source");

        if (!materializer)
            throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::JobHandle, "Job requires a materializer");

        auto & config = shared->config;
        config.pool = std::move(pool);
        config.command_source = std::move(command_source);
        config.default_behavior = default_behavior;
        config.isolation = settings.isolation;
        if (settings.timeout.count() > 0)
            config.timeout = settings.timeout;
        config.retry.max_attempts = settings.max_attempts;
        config.retry.delay = settings.retry_delay;
        config.buffered = settings.buffered;
        config.plan_cache = settings.plan_cache;

        shared->materializer = std::move(materializer);
    }

    Job(const Job &) = delete;
    Job & operator= (const Job &) = delete;
    Job(Job &&) = default;
    Job & operator= (Job &&) = default;

    Job & setIsolationLevel(IsolationLevel level) {
        configurable().config.isolation = level;
        return *this;
    }

    Job & setTimeout(std::chrono::seconds timeout) {
        if (timeout.count() < 0)
            throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::JobHandle, "Timeout cannot be negative");
        configurable().config.timeout = timeout;
        return *this;
    }

    Job & setRetryPolicy(const RetryPolicy & retry) {
        if (retry.max_attempts == 0)
            throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::JobHandle, "At least one attempt is required");
        configurable().config.retry = retry;
        return *this;
    }

    Job & setMaxAttempts(std::size_t max_attempts) {
        auto retry = shared->config.retry;
        retry.max_attempts = max_attempts;
        return setRetryPolicy(retry);
    }

    Job & setBuffered(bool buffered) {
        configurable().config.buffered = buffered;
        return *this;
    }

    /// Substitutes a value for a Failed run, which then ends Succeeded. Pass nullptr to remove a fallback.
    Job & setOnError(ErrorFallback fallback) {
        configurable().fallback = std::move(fallback);
        return *this;
    }

    /// Transforms the value of a successful run before it is returned.
    Job & setOnCompleted(CompletionHook on_completed) {
        configurable().on_completed = std::move(on_completed);
        return *this;
    }

    /// Commit instead of rolling back when the run is canceled.
    Job & setCommitOnCancel(bool commit_on_cancel) {
        configurable().config.commit_on_cancel = commit_on_cancel;
        return *this;
    }

    Job & setCancellationToken(CancellationToken token) {
        configurable().config.token = std::move(token);
        return *this;
    }

    /// Runs on the connection and transaction of the scope instead of a pooled connection.
    Job & setScope(std::shared_ptr<JobScope> scope) {
        configurable().config.scope = std::move(scope);
        return *this;
    }

    Job & setFlags(JobFlags flags) {
        configurable().config.flags = flags;
        return *this;
    }

    IsolationLevel getIsolationLevel() const noexcept {
        return shared->config.isolation;
    }

    bool isBuffered() const noexcept {
        return shared->config.buffered;
    }

    const RetryPolicy & getRetryPolicy() const noexcept {
        return shared->config.retry;
    }

    /// The state of the latest run.
    JobState getState() const noexcept {
        return shared->state.load();
    }

    /// Never throws for failures of the run itself, they are reported in the result.
    JobResult<T> run() {
        return runPipeline(*shared);
    }

    /// Throws JobException if the run Failed. A Canceled run returns what was materialized, or T{}.
    T execute() {
        auto result = run();

        if (result.isFailed()) {
            const auto & error = *result.getError();
            throw JobException(error.kind, error.code, error.component, error.message, error.sql_state, error.native_error);
        }

        if (!result.hasValue()) {
            if constexpr (std::is_default_constructible_v<T>)
                return T{};
            else
                throw JobException(ErrorKind::CanceledError, ErrorCode::Canceled, Component::JobHandle, "Job was canceled", "HY008");
        }

        return result.takeValue();
    }

    /// Runs on a worker thread. The job handle may be destroyed before the future is ready.
    std::future<JobResult<T>> runAsync() {
        return std::async(std::launch::async, [state = shared] () {
            return runPipeline(*state);
        });
    }

private:
    Shared & configurable() {
        if (shared->started)
            job_pipeline::throwStarted();
        return *shared;
    }

    static void transition(Shared & job, std::uint64_t run_id, std::size_t attempt, JobState to) {
        const auto from = job.state.exchange(to);
        if (from != to)
            job_pipeline::logTransition(run_id, attempt, from, to);
    }

    static JobResult<T> runPipeline(Shared & job) {
        using job_pipeline::makeError;

        job.started = true;
        job.state = JobState::Configured;

        const auto & config = job.config;
        const auto run_id = Engine::getInstance().nextRunId();

        JobResult<T> result;
        std::optional<JobError> error;
        std::optional<T> value;
        bool canceled = false;
        std::size_t attempt = 0;

        // Command construction, validation and list expansion happen once, before any I/O.
        CommandDefinition definition;
        ExpandedCommand expanded;
        try {
            config.command_source(definition);
            CommandBuilder::validate(definition);
            expanded = CommandBuilder::expand(definition);
        }
        catch (const JobException & ex) {
            error = JobError::fromException(ex, 0);
        }
        catch (const Poco::Exception & ex) {
            error = makeError(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::CommandBuilder, ex.displayText(), 0);
        }
        catch (const std::exception & ex) {
            error = makeError(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::CommandBuilder, ex.what(), 0);
        }

        if (error)
            result.fillDiag(*error);

        const auto flags = config.flags | definition.flags;
        const auto behavior = definition.behavior.value_or(config.default_behavior);
        const auto timeout = CommandBuilder::resolveTimeout(definition.timeout, config.timeout);
        const bool use_plan_cache = (config.plan_cache && !hasFlag(flags, JobFlags::NoCache));

        while (!error && !canceled) {
            if (config.token.isCancellationRequested()) {
                canceled = true;
                break;
            }

            ++attempt;

            auto context = std::make_unique<RunContext>(run_id, attempt, config.token, timeout);
            bool detached = false;

            try {
                if (config.scope)
                    context->joinScope(config.scope);
                else
                    context->acquireConnection(*config.pool);

                transition(job, run_id, attempt, JobState::ConnectionAcquired);

                if (config.isolation != IsolationLevel::Unspecified && !context->getTransaction()) {
                    context->beginTransaction(config.isolation);
                    transition(job, run_id, attempt, JobState::TransactionOpen);
                }

                auto & command = CommandBuilder::build(*context, definition, expanded);
                if (hasFlag(behavior, CommandBehavior::CloseConnection))
                    context->closeConnectionOnRelease();
                transition(job, run_id, attempt, JobState::Executing);

                JobExecution execution(context, command, definition, behavior, config.buffered, use_plan_cache, config.commit_on_cancel,
                    [&job, run_id, attempt] (JobState state) {
                        transition(job, run_id, attempt, state);
                    }
                );

                value.emplace(job.materializer(execution));
                transition(job, run_id, attempt, JobState::Completing);

                canceled = execution.wasCanceled();
                detached = execution.isDetached();

                if (!detached) {
                    job_pipeline::completeTransaction(*context, canceled, config.commit_on_cancel);
                    result.setOutputParameters(job_pipeline::readOutputParameters(command, definition.parameters));
                }
            }
            catch (const JobException & ex) {
                error = JobError::fromException(ex, attempt);
            }
            catch (const Poco::Exception & ex) {
                error = makeError(ErrorKind::CommandExecutionError, ErrorCode::CommandRejected, Component::Driver, ex.displayText(), attempt);
            }
            catch (const std::exception & ex) {
                error = makeError(ErrorKind::CommandExecutionError, ErrorCode::CommandRejected, Component::Pipeline, ex.what(), attempt);
            }

            if (!error) {
                if (context)
                    context->dispose();
                break;
            }

            transition(job, run_id, attempt, JobState::Completing);
            value.reset();

            if (context)
                job_pipeline::finishFailedAttempt(*context, *error, config.commit_on_cancel);

            LOG("[RUN=" << run_id << "#" << attempt << "] " << error->toString());

            if (error->kind == ErrorKind::CanceledError) {
                canceled = true;
                error.reset();
                break;
            }

            result.fillDiag(*error);

            if (error->isTransient() && attempt < config.retry.max_attempts) {
                if (!job_pipeline::waitBeforeRetry(config.retry.delay, config.token)) {
                    canceled = true;
                    error.reset();
                    break;
                }

                LOG("[RUN=" << run_id << "] Retrying, attempt " << (attempt + 1) << " of " << config.retry.max_attempts);
                error.reset();
                continue;
            }

            break;
        }

        result.setAttempts(attempt);

        if (error) {
            result.setError(*error);
            result.setState(JobState::Failed);
        }
        else if (canceled) {
            const auto cancel_error = makeError(ErrorKind::CanceledError, ErrorCode::Canceled, Component::Pipeline, "Job was canceled", attempt);
            result.fillDiag(cancel_error);
            result.setError(cancel_error);
            result.setState(JobState::Canceled);
            if (value)
                result.setValue(std::move(*value));
        }
        else {
            result.setState(JobState::Succeeded);
            if (value)
                result.setValue(std::move(*value));
        }

        if (result.isSucceeded() && job.on_completed) {
            try {
                auto transformed = job.on_completed(std::move(result.getValue()));
                result.setValue(std::move(transformed));
            }
            catch (const JobException & ex) {
                error = JobError::fromException(ex, attempt);
            }
            catch (const std::exception & ex) {
                error = makeError(ErrorKind::CommandExecutionError, ErrorCode::None, Component::JobHandle, ex.what(), attempt);
            }

            if (error) {
                result.fillDiag(*error);
                result.setError(*error);
                result.setState(JobState::Failed);
                result.resetValue();
            }
        }

        if (result.isFailed() && job.fallback) {
            std::optional<JobError> fallback_error;
            try {
                result.setValue(job.fallback(*result.getError()));
                result.setUsedFallback(true);
                result.setState(JobState::Succeeded);
                LOG("[RUN=" << run_id << "] Failure replaced by fallback value: " << result.getError()->toString());
            }
            catch (const JobException & ex) {
                fallback_error = JobError::fromException(ex, attempt);
            }
            catch (const std::exception & ex) {
                fallback_error = makeError(ErrorKind::ConfigurationError, ErrorCode::None, Component::JobHandle, ex.what(), attempt);
            }

            // The run stays Failed with its original error, the fallback failure is kept as a diagnostic record.
            if (fallback_error) {
                LOG("[RUN=" << run_id << "] Fallback failed: " << fallback_error->toString());
                result.fillDiag(*fallback_error);
            }
        }

        transition(job, run_id, attempt, result.getState());
        return result;
    }

private:
    std::shared_ptr<Shared> shared;
};
