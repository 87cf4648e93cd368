#include "dbjob/test/fake_driver.h"

#include <algorithm>

FakeSegment makeSegment(const std::vector<std::string> & columns, std::vector<std::vector<Value>> rows, ValueType type) {
    FakeSegment segment;
    for (const auto & name : columns) {
        segment.schema.push_back(ColumnInfo{name, type, true});
    }
    segment.rows = std::move(rows);
    return segment;
}

void FakeDatabase::setSegments(std::vector<FakeSegment> segments_) {
    std::lock_guard<std::mutex> lock(mutex);
    segments = std::move(segments_);
}

std::vector<FakeSegment> FakeDatabase::getSegments() const {
    std::lock_guard<std::mutex> lock(mutex);
    return segments;
}

void FakeDatabase::setNonQueryResult(std::int64_t affected_rows) {
    std::lock_guard<std::mutex> lock(mutex);
    non_query_result = affected_rows;
}

std::int64_t FakeDatabase::getNonQueryResult() const {
    std::lock_guard<std::mutex> lock(mutex);
    return non_query_result;
}

void FakeDatabase::setOutputValue(const std::string & name, Value value) {
    std::lock_guard<std::mutex> lock(mutex);
    output_values[name] = std::move(value);
}

std::optional<Value> FakeDatabase::getOutputValue(const std::string & name) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = output_values.find(name);
    if (it == output_values.end())
        return std::nullopt;
    return it->second;
}

void FakeDatabase::failNextConnect(JobException ex, std::size_t times) {
    std::lock_guard<std::mutex> lock(mutex);
    for (std::size_t i = 0; i < times; ++i) {
        connect_failures.push_back(ex);
    }
}

void FakeDatabase::failNextExecute(JobException ex, std::size_t times) {
    std::lock_guard<std::mutex> lock(mutex);
    for (std::size_t i = 0; i < times; ++i) {
        execute_failures.push_back(ex);
    }
}

void FakeDatabase::failCommit(JobException ex) {
    std::lock_guard<std::mutex> lock(mutex);
    commit_failure.emplace(std::move(ex));
}

std::optional<JobException> FakeDatabase::takeConnectFailure() {
    std::lock_guard<std::mutex> lock(mutex);
    if (connect_failures.empty())
        return std::nullopt;

    auto ex = connect_failures.front();
    connect_failures.pop_front();
    return ex;
}

std::optional<JobException> FakeDatabase::takeExecuteFailure() {
    std::lock_guard<std::mutex> lock(mutex);
    if (execute_failures.empty())
        return std::nullopt;

    auto ex = execute_failures.front();
    execute_failures.pop_front();
    return ex;
}

std::optional<JobException> FakeDatabase::takeCommitFailure() {
    std::lock_guard<std::mutex> lock(mutex);
    auto ex = commit_failure;
    commit_failure.reset();
    return ex;
}

void FakeDatabase::setOnFetch(std::function<void(std::size_t)> on_fetch_) {
    std::lock_guard<std::mutex> lock(mutex);
    on_fetch = std::move(on_fetch_);
}

void FakeDatabase::notifyFetch(std::size_t row_index) {
    std::function<void(std::size_t)> hook;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hook = on_fetch;
    }

    if (hook)
        hook(row_index);
}

void FakeDatabase::setAlive(bool alive_) {
    std::lock_guard<std::mutex> lock(mutex);
    alive = alive_;
}

bool FakeDatabase::isAlive() const {
    std::lock_guard<std::mutex> lock(mutex);
    return alive;
}

void FakeDatabase::record(const std::string & event) {
    std::lock_guard<std::mutex> lock(mutex);
    journal.push_back(event);
}

std::vector<std::string> FakeDatabase::getJournal() const {
    std::lock_guard<std::mutex> lock(mutex);
    return journal;
}

void FakeDatabase::clearJournal() {
    std::lock_guard<std::mutex> lock(mutex);
    journal.clear();
}

long FakeDatabase::journalIndexOf(const std::string & event) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = std::find(journal.begin(), journal.end(), event);
    return (it == journal.end() ? -1 : static_cast<long>(it - journal.begin()));
}

std::size_t FakeDatabase::journalCount(const std::string & event) const {
    std::lock_guard<std::mutex> lock(mutex);
    return static_cast<std::size_t>(std::count(journal.begin(), journal.end(), event));
}

void FakeDatabase::setLastCommand(const FakeCommandRecord & command) {
    std::lock_guard<std::mutex> lock(mutex);
    last_command = command;
}

void FakeDatabase::updateLastCommand(const std::function<void(FakeCommandRecord &)> & update) {
    std::lock_guard<std::mutex> lock(mutex);
    update(last_command);
}

FakeCommandRecord FakeDatabase::getLastCommand() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last_command;
}

std::size_t FakeDatabase::getConnectionsOpened() const {
    std::lock_guard<std::mutex> lock(mutex);
    return connections_opened;
}

std::size_t FakeDatabase::nextConnectionId() {
    std::lock_guard<std::mutex> lock(mutex);
    return ++connections_opened;
}

FakeCursor::FakeCursor(std::shared_ptr<FakeDatabase> database_, std::vector<FakeSegment> segments_, std::shared_ptr<std::atomic<bool>> cancel_requested_)
    : database(std::move(database_))
    , segments(std::move(segments_))
    , cancel_requested(std::move(cancel_requested_))
{
}

FakeCursor::~FakeCursor() {
    database->record("cursor closed");
}

const ColumnSchema & FakeCursor::getColumnSchema() const {
    static const ColumnSchema no_columns;
    return (segment < segments.size() ? segments[segment].schema : no_columns);
}

bool FakeCursor::advanceRow() {
    if (segment >= segments.size())
        return false;

    const auto next = (row ? *row + 1 : 0);
    if (next >= segments[segment].rows.size())
        return false;

    database->notifyFetch(next);
    if (cancel_requested && cancel_requested->exchange(false))
        throw JobException(ErrorKind::CanceledError, ErrorCode::Canceled, Component::Driver, "Operation canceled", "HY008");

    row = next;
    return true;
}

bool FakeCursor::advanceSegment() {
    if (segment >= segments.size())
        return false;

    ++segment;
    row.reset();
    return (segment < segments.size());
}

Value FakeCursor::readColumn(std::size_t index) {
    if (segment >= segments.size() || !row)
        throw JobException(ErrorKind::CommandExecutionError, ErrorCode::InvalidState, Component::Driver, "No current row");

    const auto & values = segments[segment].rows[*row];
    if (index >= values.size())
        throw JobException(ErrorKind::CommandExecutionError, ErrorCode::InvalidState, Component::Driver, "Column index out of range", "07009");

    return values[index];
}

std::int64_t FakeCursor::getAffectedRowCount() const {
    return (segment < segments.size() ? segments[segment].affected_rows : -1);
}

FakeCommand::FakeCommand(std::shared_ptr<FakeDatabase> database_, FakeCommandRecord record_)
    : database(std::move(database_))
    , record(std::move(record_))
{
    database->record("prepare");
    database->setLastCommand(record);
}

FakeCommand::~FakeCommand() {
    database->record("command disposed");
}

void FakeCommand::bindParameter(const ParameterDescriptor & descriptor) {
    record.parameters.push_back(descriptor);
    database->updateLastCommand([&descriptor] (FakeCommandRecord & last) {
        last.parameters.push_back(descriptor);
    });
}

void FakeCommand::beginExecution(CommandBehavior behavior) {
    record.behavior = behavior;
    database->updateLastCommand([behavior] (FakeCommandRecord & last) {
        last.behavior = behavior;
    });

    if (auto failure = database->takeExecuteFailure())
        throw *failure;
}

std::unique_ptr<DriverCursor> FakeCommand::execute(CommandBehavior behavior) {
    database->record("execute");
    beginExecution(behavior);
    return std::make_unique<FakeCursor>(database, database->getSegments(), cancel_requested);
}

std::int64_t FakeCommand::executeNonQuery() {
    database->record("execute non-query");
    beginExecution(CommandBehavior::Default);
    return database->getNonQueryResult();
}

void FakeCommand::cancel() {
    cancel_requested->store(true);
    database->record("cancel");
    database->updateLastCommand([] (FakeCommandRecord & last) {
        last.canceled = true;
    });
}

Value FakeCommand::getOutputValue(const std::string & name) const {
    if (auto value = database->getOutputValue(name))
        return *value;

    throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::Driver, "No output parameter named " + name);
}

FakeTransaction::FakeTransaction(std::shared_ptr<FakeDatabase> database_, FakeConnection & connection_, IsolationLevel level_)
    : database(std::move(database_))
    , connection(connection_)
    , level(level_)
{
    database->record(std::string{"begin "} + toString(level));
    connection.setInTransaction(true);
}

FakeTransaction::~FakeTransaction() {
    if (!finished) {
        database->record("rollback on release");
        connection.setInTransaction(false);
    }
}

void FakeTransaction::commit() {
    finished = true;
    connection.setInTransaction(false);

    if (auto failure = database->takeCommitFailure()) {
        database->record("commit failed");
        throw *failure;
    }

    database->record("commit");
}

void FakeTransaction::rollback() {
    finished = true;
    connection.setInTransaction(false);
    database->record("rollback");
}

IsolationLevel FakeTransaction::getIsolationLevel() const {
    return level;
}

FakeConnection::FakeConnection(std::shared_ptr<FakeDatabase> database_, std::size_t id_)
    : database(std::move(database_))
    , id(id_)
{
    database->record("connect#" + std::to_string(id));
}

FakeConnection::~FakeConnection() {
    database->record("disconnect#" + std::to_string(id));
}

std::unique_ptr<DriverTransaction> FakeConnection::beginTransaction(IsolationLevel level) {
    if (in_transaction)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Driver, "Transaction already active", "25000");

    return std::make_unique<FakeTransaction>(database, *this, level);
}

std::unique_ptr<DriverCommand> FakeConnection::prepareCommand(
    const std::string & text,
    CommandType type,
    std::optional<std::chrono::seconds> timeout,
    DriverTransaction * transaction
) {
    FakeCommandRecord record;
    record.text = text;
    record.type = type;
    record.timeout = timeout;
    record.in_transaction = (transaction != nullptr);
    return std::make_unique<FakeCommand>(database, std::move(record));
}

bool FakeConnection::isAlive() const {
    return database->isAlive();
}

std::size_t FakeConnection::getId() const noexcept {
    return id;
}

void FakeConnection::setInTransaction(bool in_transaction_) noexcept {
    in_transaction = in_transaction_;
}

FakeDriver::FakeDriver()
    : database(std::make_shared<FakeDatabase>())
{
}

FakeDriver::FakeDriver(std::shared_ptr<FakeDatabase> database_)
    : database(std::move(database_))
{
}

std::unique_ptr<DriverConnection> FakeDriver::openConnection() {
    if (auto failure = database->takeConnectFailure()) {
        database->record("connect failed");
        throw *failure;
    }

    return std::make_unique<FakeConnection>(database, database->nextConnectionId());
}

std::string FakeDriver::getName() const {
    return "Fake";
}

FakeDatabase & FakeDriver::getDatabase() const noexcept {
    return *database;
}

const std::shared_ptr<FakeDatabase> & FakeDriver::getDatabasePtr() const noexcept {
    return database;
}

JobException makeTransientError(const std::string & message) {
    return JobException(ErrorKind::TransientConnectionError, ErrorCode::ConnectionFailure, Component::Driver, message, "08S01");
}

JobException makeCommandError(const std::string & message) {
    return JobException(ErrorKind::CommandExecutionError, ErrorCode::CommandRejected, Component::Driver, message, "42000");
}
