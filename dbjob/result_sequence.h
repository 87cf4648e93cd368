#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/result_reader.h"
#include "dbjob/run_context.h"
#include "dbjob/exception.h"
#include "dbjob/log/log.h"

#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <cstddef>

// The resources of a run whose rows are consumed after the job returned.
// Completing the run ends its transaction and disposes the run context, exactly once.
class ActiveRun {
public:
    // Called with the error that ended the run, or nullptr when it ended normally.
    using FinishHandler = std::function<void(RunContext &, std::exception_ptr)>;

    ActiveRun(std::unique_ptr<RunContext> context_, DriverCursor & cursor, CommandBehavior behavior, ColumnMapSettings settings, bool use_plan_cache, FinishHandler on_finish_);
    ~ActiveRun();

    ActiveRun(const ActiveRun &) = delete;
    ActiveRun & operator= (const ActiveRun &) = delete;

    RunContext & getContext() const noexcept;
    ResultReader & getReader() noexcept;

    /// Rethrows a failure of the finish handler after the context has been disposed.
    void complete(std::exception_ptr error = nullptr);
    bool isCompleted() const noexcept;

private:
    std::unique_ptr<RunContext> context;
    ResultReader reader;
    FinishHandler on_finish;
    bool completed = false;
};

// Rows of one result segment, either materialized (buffered) or produced on demand from a live cursor (lazy).
// A lazy sequence is forward-only, can be iterated once, must not be shared between threads,
// and fails with CursorDisposed when iterated after it was exhausted, closed or its run failed.
template <typename T>
class ResultSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T *;
        using reference = T &;

        iterator() = default;

        explicit iterator(ResultSequence * sequence_)
            : sequence(sequence_)
        {
            fetch();
        }

        reference operator* () {
            return *current;
        }

        pointer operator-> () {
            return &*current;
        }

        iterator & operator++ () {
            fetch();
            return *this;
        }

        friend bool operator== (const iterator & lhs, const iterator & rhs) {
            return (lhs.sequence == rhs.sequence);
        }

        friend bool operator!= (const iterator & lhs, const iterator & rhs) {
            return !(lhs == rhs);
        }

    private:
        void fetch() {
            current = sequence->fetchNext();
            if (!current)
                sequence = nullptr;
        }

        ResultSequence * sequence = nullptr;
        std::optional<T> current;
    };

public:
    ResultSequence() = default;

    explicit ResultSequence(std::vector<T> rows_)
        : rows(std::move(rows_))
    {
    }

    explicit ResultSequence(std::shared_ptr<ActiveRun> run_)
        : run(std::move(run_))
        , lazy(true)
    {
    }

    ResultSequence(const ResultSequence &) = delete;
    ResultSequence & operator= (const ResultSequence &) = delete;
    ResultSequence(ResultSequence &&) = default;
    ResultSequence & operator= (ResultSequence &&) = default;

    bool isBuffered() const noexcept {
        return !lazy;
    }

    iterator begin() {
        return iterator{this};
    }

    iterator end() {
        return iterator{};
    }

    /// Consumes the remaining rows.
    std::vector<T> toVector() {
        std::vector<T> result;
        for (auto & row : *this) {
            result.push_back(std::move(row));
        }
        return result;
    }

    /// Completes a lazy run early. Further iteration fails with CursorDisposed.
    void close() {
        if (run && !exhausted)
            run->complete();
        run.reset();
    }

    ~ResultSequence() = default;

private:
    std::optional<T> fetchNext() {
        if (!lazy) {
            if (position < rows.size())
                return std::move(rows[position++]);
            return std::nullopt;
        }

        // Within one pass the iterator stops at the first empty fetch, so getting here again means a new pass.
        if (exhausted || !run || run->isCompleted() || run->getContext().isDisposed())
            throw JobException(ErrorKind::ConfigurationError, ErrorCode::CursorDisposed, Component::ResultMaterializer,
                "Lazy result sequence cannot be iterated after its run has been completed", "24000");

        try {
            auto & reader = run->getReader();
            if (reader.nextRow())
                return reader.template readCurrent<T>();
        }
        catch (...) {
            const auto error = std::current_exception();
            try {
                run->complete(error);
            }
            catch (const std::exception & ex) {
                LOG("Failed to complete a run after a read failure: " << ex.what());
            }
            run.reset();
            std::rethrow_exception(error);
        }

        exhausted = true;
        auto finished_run = std::move(run);
        finished_run->complete();
        return std::nullopt;
    }

private:
    std::vector<T> rows;
    std::size_t position = 0;
    std::shared_ptr<ActiveRun> run;
    bool lazy = false;
    bool exhausted = false;
};
