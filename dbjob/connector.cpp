#include "dbjob/connector.h"
#include "dbjob/log/log.h"

Connector::Connector(std::shared_ptr<Driver> driver, const EngineSettings & settings_)
    : settings(settings_)
{
    if (!driver)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::Engine, "Connector requires a driver");

    pool = ConnectionPool::create(std::move(driver), settings.pool_size, settings.pool_timeout);
    LOG("Connector created, " << toString(settings));
}

Connector::Connector(std::shared_ptr<ConnectionPool> pool_, const EngineSettings & settings_)
    : settings(settings_)
    , pool(std::move(pool_))
{
    if (!pool)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::Engine, "Connector requires a connection pool");
}

const EngineSettings & Connector::getSettings() const noexcept {
    return settings;
}

const std::shared_ptr<ConnectionPool> & Connector::getPool() const noexcept {
    return pool;
}

std::shared_ptr<JobScope> Connector::createScope(IsolationLevel isolation) const {
    return std::make_shared<JobScope>(pool->acquire(), isolation);
}

Connector::CommandSource Connector::textSource(const std::string & sql, ParameterCollection parameters) {
    return [sql, parameters = std::move(parameters)] (CommandDefinition & definition) {
        definition.text = sql;
        definition.type = CommandType::Text;
        definition.parameters = parameters;
    };
}

Job<DataTable> Connector::readToDataTable(CommandSource source) const {
    return makeJob<DataTable>(std::move(source), CommandBehavior::SingleResult,
        [] (JobExecution & execution) {
            return execution.executeReader().toDataTable();
        }
    );
}

Job<DataTable> Connector::readToDataTable(const std::string & sql, ParameterCollection parameters) const {
    return readToDataTable(textSource(sql, std::move(parameters)));
}

Job<DataSet> Connector::readToDataSet(CommandSource source) const {
    return makeJob<DataSet>(std::move(source), CommandBehavior::Default,
        [] (JobExecution & execution) {
            return execution.executeReader().toDataSet();
        }
    );
}

Job<DataSet> Connector::readToDataSet(const std::string & sql, ParameterCollection parameters) const {
    return readToDataSet(textSource(sql, std::move(parameters)));
}

Job<CollectionSet> Connector::readToCollectionSet(CommandSource source) const {
    return makeJob<CollectionSet>(std::move(source), CommandBehavior::Default,
        [] (JobExecution & execution) {
            return CollectionSet{execution.executeReader().toDataSet()};
        }
    );
}

Job<CollectionSet> Connector::readToCollectionSet(const std::string & sql, ParameterCollection parameters) const {
    return readToCollectionSet(textSource(sql, std::move(parameters)));
}

Job<std::vector<Record>> Connector::readToRecords(CommandSource source) const {
    return readToList<Record>(std::move(source));
}

Job<std::vector<Record>> Connector::readToRecords(const std::string & sql, ParameterCollection parameters) const {
    return readToRecords(textSource(sql, std::move(parameters)));
}

Job<std::vector<RecordMap>> Connector::readToDictionaries(CommandSource source) const {
    return readToList<RecordMap>(std::move(source));
}

Job<std::vector<RecordMap>> Connector::readToDictionaries(const std::string & sql, ParameterCollection parameters) const {
    return readToDictionaries(textSource(sql, std::move(parameters)));
}

Job<std::optional<std::int64_t>> Connector::nonQuery(CommandSource source) const {
    auto job = makeJob<std::optional<std::int64_t>>(std::move(source), CommandBehavior::Default,
        [] (JobExecution & execution) {
            return std::optional<std::int64_t>{execution.executeNonQuery()};
        }
    );

    if (settings.isolation == IsolationLevel::Unspecified)
        job.setIsolationLevel(IsolationLevel::ReadCommitted);

    job.setOnError([] (const JobError &) { return std::optional<std::int64_t>{}; });
    return job;
}

Job<std::optional<std::int64_t>> Connector::nonQuery(const std::string & sql, ParameterCollection parameters) const {
    return nonQuery(textSource(sql, std::move(parameters)));
}
