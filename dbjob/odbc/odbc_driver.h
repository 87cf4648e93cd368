#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/odbc/odbc_utils.h"
#include "dbjob/driver.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <cstddef>
#include <cstdint>

class OdbcConnection;
class OdbcCommand;

// Backend over the ODBC C API. Every connection is opened with SQLDriverConnect using the same connection string.
class OdbcDriver
    : public Driver
{
public:
    explicit OdbcDriver(std::string connection_string_);

    std::unique_ptr<DriverConnection> openConnection() override;
    std::string getName() const override;

private:
    const std::string connection_string;
    std::shared_ptr<OdbcHandle> environment;
};

class OdbcTransaction
    : public DriverTransaction
{
public:
    OdbcTransaction(OdbcConnection & connection_, IsolationLevel level_);
    ~OdbcTransaction() override;

    void commit() override;
    void rollback() override;
    IsolationLevel getIsolationLevel() const override;

private:
    void end(SQLSMALLINT completion_type);

    OdbcConnection & connection;
    const IsolationLevel level;
    bool finished = false;
};

class OdbcConnection
    : public DriverConnection
{
public:
    OdbcConnection(std::shared_ptr<OdbcHandle> environment_, const std::string & connection_string);
    ~OdbcConnection() override;

    std::unique_ptr<DriverTransaction> beginTransaction(IsolationLevel level) override;

    std::unique_ptr<DriverCommand> prepareCommand(
        const std::string & text,
        CommandType type,
        std::optional<std::chrono::seconds> timeout,
        DriverTransaction * transaction
    ) override;

    bool isAlive() const override;

    SQLHDBC getHandle() const noexcept;
    void setAutoCommit(bool enabled);

    // Rolls back and restores autocommit after a failed SQLEndTran. If that fails too,
    // the connection reports itself dead so that the pool discards it.
    void recoverFromFailedEnd() noexcept;
    void markUnusable() noexcept;

private:
    std::shared_ptr<OdbcHandle> environment;
    OdbcHandle connection;
    bool connected = false;
    bool in_transaction = false;
    bool usable = true;
};

// Parameter value as bound with SQLBindParameter. The buffer must outlive the execution.
struct OdbcParameterBuffer {
    const ParameterDescriptor * descriptor = nullptr;
    SQLSMALLINT io_type = SQL_PARAM_INPUT;
    SQLSMALLINT c_type = SQL_C_CHAR;
    SQLSMALLINT sql_type = SQL_VARCHAR;
    SQLULEN column_size = 0;
    SQLSMALLINT decimal_digits = 0;
    std::vector<char> data;
    SQLLEN indicator = 0;

    Value decode() const;
};

OdbcParameterBuffer makeParameterBuffer(const ParameterDescriptor & descriptor);

class OdbcCommand
    : public DriverCommand
{
public:
    OdbcCommand(OdbcConnection & connection, std::string text_, CommandType type_, std::optional<std::chrono::seconds> timeout);
    ~OdbcCommand() override;

    void bindParameter(const ParameterDescriptor & descriptor) override;
    std::unique_ptr<DriverCursor> execute(CommandBehavior behavior) override;
    std::int64_t executeNonQuery() override;
    void cancel() override;
    Value getOutputValue(const std::string & name) const override;

    SQLHSTMT getHandle() const noexcept;

private:
    void prepareAndExecute(CommandBehavior behavior);
    void bindBuffers();

    OdbcHandle statement;
    const std::string text;
    const CommandType type;
    std::vector<ParameterDescriptor> parameters;
    std::vector<OdbcParameterBuffer> buffers;
    bool executed = false;
};

class OdbcCursor
    : public DriverCursor
{
public:
    OdbcCursor(OdbcCommand & command_, CommandBehavior behavior_);
    ~OdbcCursor() override;

    const ColumnSchema & getColumnSchema() const override;
    bool advanceRow() override;
    bool advanceSegment() override;
    Value readColumn(std::size_t index) override;
    std::int64_t getAffectedRowCount() const override;

private:
    // Skips segments without columns (row counts of DML statements), like a data reader does.
    bool seekResultWithColumns();
    void describeColumns();
    Value fetchColumn(std::size_t index);

    OdbcCommand & command;
    const CommandBehavior behavior;
    ColumnSchema schema;
    std::vector<SQLSMALLINT> sql_types;
    std::vector<std::optional<Value>> row_cache;
    std::size_t next_column = 0;
    std::int64_t affected_rows = -1;
    bool exhausted = false;
};

namespace odbc_mapping {

    ValueType toValueType(SQLSMALLINT sql_type, bool is_unsigned) noexcept;
    SQLULEN toTxnIsolation(IsolationLevel level);

    // Text, stored procedure call or table query as sent to the driver, and the order markers bind parameters in.
    std::string buildNativeText(const std::string & text, CommandType type, const std::vector<ParameterDescriptor> & parameters,
        std::vector<const ParameterDescriptor *> & binding_order);

} // namespace odbc_mapping
