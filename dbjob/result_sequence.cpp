#include "dbjob/result_sequence.h"
#include "dbjob/log/log.h"

ActiveRun::ActiveRun(std::unique_ptr<RunContext> context_, DriverCursor & cursor, CommandBehavior behavior, ColumnMapSettings settings, bool use_plan_cache, FinishHandler on_finish_)
    : context(std::move(context_))
    , reader(cursor, behavior, context->getCancellationToken(), std::move(settings), use_plan_cache)
    , on_finish(std::move(on_finish_))
{
}

ActiveRun::~ActiveRun() {
    if (completed)
        return;

    LOG_TARGET(*context, "Lazy result abandoned before it was exhausted");
    try {
        complete();
    }
    catch (const std::exception & ex) {
        LOG_TARGET(*context, "Failed to complete abandoned run: " << ex.what());
    }
}

RunContext & ActiveRun::getContext() const noexcept {
    return *context;
}

ResultReader & ActiveRun::getReader() noexcept {
    return reader;
}

void ActiveRun::complete(std::exception_ptr error) {
    if (completed)
        return;

    completed = true;

    std::exception_ptr finish_error;
    try {
        if (on_finish)
            on_finish(*context, error);
    }
    catch (...) {
        finish_error = std::current_exception();
    }

    context->dispose();

    if (finish_error)
        std::rethrow_exception(finish_error);
}

bool ActiveRun::isCompleted() const noexcept {
    return completed;
}
