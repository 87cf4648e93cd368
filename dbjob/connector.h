#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/collection_set.h"
#include "dbjob/config/config.h"
#include "dbjob/connection_pool.h"
#include "dbjob/job.h"
#include "dbjob/job_scope.h"
#include "dbjob/mapping/record.h"
#include "dbjob/result_reader.h"
#include "dbjob/result_sequence.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <cstdint>

// Entry point of the library: creates jobs bound to one connection pool and the engine settings.
// Jobs are deferred, nothing touches the database until run(), execute() or runAsync() is called.
class Connector {
public:
    using CommandSource = std::function<void(CommandDefinition &)>;

    // Creates a pool over the driver, sized by the settings.
    explicit Connector(std::shared_ptr<Driver> driver, const EngineSettings & settings_ = EngineSettings{});
    Connector(std::shared_ptr<ConnectionPool> pool_, const EngineSettings & settings_);

    const EngineSettings & getSettings() const noexcept;
    const std::shared_ptr<ConnectionPool> & getPool() const noexcept;

    /// A connection, and a transaction if an isolation level is given, shared by the jobs
    /// attached to the scope with Job::setScope(). The caller commits the scope.
    std::shared_ptr<JobScope> createScope(IsolationLevel isolation = IsolationLevel::Unspecified) const;

    /// Rows of the first segment. Lazy when the job is not buffered. Empty on failure unless setOnError() replaces it.
    template <typename T>
    Job<ResultSequence<T>> read(CommandSource source) const {
        auto job = makeJob<ResultSequence<T>>(std::move(source), CommandBehavior::SingleResult,
            [] (JobExecution & execution) {
                if (execution.isBuffered())
                    return ResultSequence<T>(execution.executeReader().template toList<T>());
                return ResultSequence<T>(execution.detach());
            }
        );
        job.setOnError([] (const JobError &) { return ResultSequence<T>{}; });
        return job;
    }

    template <typename T>
    Job<ResultSequence<T>> read(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const {
        return read<T>(textSource(sql, std::move(parameters)));
    }

    template <typename T>
    Job<T> readFirst(CommandSource source) const {
        return makeJob<T>(std::move(source), CommandBehavior::SingleResult | CommandBehavior::SingleRow,
            [] (JobExecution & execution) {
                return execution.executeReader().template first<T>();
            }
        );
    }

    template <typename T>
    Job<T> readFirst(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const {
        return readFirst<T>(textSource(sql, std::move(parameters)));
    }

    template <typename T>
    Job<std::optional<T>> readFirstOrDefault(CommandSource source) const {
        return makeJob<std::optional<T>>(std::move(source), CommandBehavior::SingleResult | CommandBehavior::SingleRow,
            [] (JobExecution & execution) {
                return execution.executeReader().template firstOrDefault<T>();
            }
        );
    }

    template <typename T>
    Job<std::optional<T>> readFirstOrDefault(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const {
        return readFirstOrDefault<T>(textSource(sql, std::move(parameters)));
    }

    template <typename T>
    Job<T> readSingle(CommandSource source) const {
        return makeJob<T>(std::move(source), CommandBehavior::SingleResult,
            [] (JobExecution & execution) {
                return execution.executeReader().template single<T>();
            }
        );
    }

    template <typename T>
    Job<T> readSingle(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const {
        return readSingle<T>(textSource(sql, std::move(parameters)));
    }

    template <typename T>
    Job<std::optional<T>> readSingleOrDefault(CommandSource source) const {
        return makeJob<std::optional<T>>(std::move(source), CommandBehavior::SingleResult,
            [] (JobExecution & execution) {
                return execution.executeReader().template singleOrDefault<T>();
            }
        );
    }

    template <typename T>
    Job<std::optional<T>> readSingleOrDefault(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const {
        return readSingleOrDefault<T>(textSource(sql, std::move(parameters)));
    }

    template <typename T>
    Job<std::vector<T>> readToList(CommandSource source) const {
        auto job = makeJob<std::vector<T>>(std::move(source), CommandBehavior::SingleResult,
            [] (JobExecution & execution) {
                return execution.executeReader().template toList<T>();
            }
        );
        job.setOnError([] (const JobError &) { return std::vector<T>{}; });
        return job;
    }

    template <typename T>
    Job<std::vector<T>> readToList(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const {
        return readToList<T>(textSource(sql, std::move(parameters)));
    }

    /// One list per segment, in order. Extra segments are ignored, missing ones stay empty
    /// unless their slot is marked as required.
    template <typename... Ts>
    Job<std::tuple<std::vector<Ts>...>> readMulti(CommandSource source, RequiredSlots required = RequiredSlots{}) const {
        return makeJob<std::tuple<std::vector<Ts>...>>(std::move(source), CommandBehavior::Default,
            [required] (JobExecution & execution) {
                return execution.executeReader().template toMulti<Ts...>(required);
            }
        );
    }

    template <typename... Ts>
    Job<std::tuple<std::vector<Ts>...>> readMulti(const std::string & sql, ParameterCollection parameters = ParameterCollection{}, RequiredSlots required = RequiredSlots{}) const {
        return readMulti<Ts...>(textSource(sql, std::move(parameters)), required);
    }

    Job<DataTable> readToDataTable(CommandSource source) const;
    Job<DataTable> readToDataTable(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const;

    Job<DataSet> readToDataSet(CommandSource source) const;
    Job<DataSet> readToDataSet(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const;

    /// Every segment of the command, each convertible to a typed list after the run.
    Job<CollectionSet> readToCollectionSet(CommandSource source) const;
    Job<CollectionSet> readToCollectionSet(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const;

    /// Rows as ordered name/value lists, duplicate column names kept.
    Job<std::vector<Record>> readToRecords(CommandSource source) const;
    Job<std::vector<Record>> readToRecords(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const;

    /// Rows as case-insensitive maps, the first of duplicate column names wins.
    Job<std::vector<RecordMap>> readToDictionaries(CommandSource source) const;
    Job<std::vector<RecordMap>> readToDictionaries(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const;

    /// Column 0 of row 0, T{} when there are no rows.
    template <typename T>
    Job<T> scalar(CommandSource source) const {
        return makeJob<T>(std::move(source), CommandBehavior::SingleResult,
            [] (JobExecution & execution) {
                return execution.executeReader().template scalar<T>();
            }
        );
    }

    template <typename T>
    Job<T> scalar(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const {
        return scalar<T>(textSource(sql, std::move(parameters)));
    }

    /// Affected row count (-1 if the driver does not know it). Runs in a ReadCommitted transaction
    /// and yields no value on failure unless setOnError() replaces it.
    Job<std::optional<std::int64_t>> nonQuery(CommandSource source) const;
    Job<std::optional<std::int64_t>> nonQuery(const std::string & sql, ParameterCollection parameters = ParameterCollection{}) const;

    /// Any result shape, produced by a caller supplied materializer.
    template <typename T>
    Job<T> build(CommandSource source, typename Job<T>::Materializer materializer, CommandBehavior behavior = CommandBehavior::Default) const {
        return makeJob<T>(std::move(source), behavior, std::move(materializer));
    }

    static CommandSource textSource(const std::string & sql, ParameterCollection parameters);

private:
    template <typename T>
    Job<T> makeJob(CommandSource source, CommandBehavior behavior, typename Job<T>::Materializer materializer) const {
        return Job<T>(pool, std::move(source), std::move(materializer), behavior, settings);
    }

private:
    const EngineSettings settings;
    std::shared_ptr<ConnectionPool> pool;
};
