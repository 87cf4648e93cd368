#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/parameters.h"
#include "dbjob/value.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <cstdint>

enum class IsolationLevel {
    Unspecified,
    ReadUncommitted,
    ReadCommitted,
    RepeatableRead,
    Serializable,
    Snapshot
};

const char * toString(IsolationLevel level) noexcept;

// Accepts the enumerator names case-insensitively, with or without spaces ("read committed").
// An empty string is Unspecified.
std::optional<IsolationLevel> tryParseIsolationLevel(const std::string & str);

enum class CommandType {
    Text,
    StoredProcedure,
    TableDirect
};

const char * toString(CommandType type) noexcept;

enum class CommandBehavior : std::uint32_t {
    Default         = 0,
    SingleResult    = 1 << 0, // segments after the first are not read
    SchemaOnly      = 1 << 1, // columns are described, no row is fetched
    SingleRow       = 1 << 2, // rows after the first of a segment are not read
    CloseConnection = 1 << 3  // the connection is closed with the cursor instead of returned to the pool
};

constexpr CommandBehavior operator| (CommandBehavior lhs, CommandBehavior rhs) noexcept {
    return static_cast<CommandBehavior>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

constexpr CommandBehavior operator& (CommandBehavior lhs, CommandBehavior rhs) noexcept {
    return static_cast<CommandBehavior>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
}

constexpr bool hasFlag(CommandBehavior behavior, CommandBehavior flag) noexcept {
    return (static_cast<std::uint32_t>(behavior & flag) != 0);
}

std::string toString(CommandBehavior behavior);

// Forward-only, single pass reader over one or more result segments.
// Closing is the destructor.
class DriverCursor {
public:
    virtual ~DriverCursor() = default;

    // Schema of the current segment.
    virtual const ColumnSchema & getColumnSchema() const = 0;

    // Moves to the next row of the current segment, false at its end.
    virtual bool advanceRow() = 0;

    // Moves to the next segment, false when there are no more.
    virtual bool advanceSegment() = 0;

    // Columns of the current row. Some drivers allow reading each column once and in ascending order only.
    virtual Value readColumn(std::size_t index) = 0;

    // Rows affected by the statement that produced the current segment, -1 if not known.
    virtual std::int64_t getAffectedRowCount() const = 0;
};

class DriverCommand {
public:
    virtual ~DriverCommand() = default;

    virtual void bindParameter(const ParameterDescriptor & descriptor) = 0;

    virtual std::unique_ptr<DriverCursor> execute(CommandBehavior behavior) = 0;

    // Executes and consumes every segment, returns the total number of affected rows or -1 if not known.
    virtual std::int64_t executeNonQuery() = 0;

    // May be called from another thread while execute() or a cursor read is in progress.
    virtual void cancel() = 0;

    // Value of an output, input-output or return value parameter after execution.
    virtual Value getOutputValue(const std::string & name) const = 0;
};

// Rolls back on destruction unless committed or rolled back explicitly.
class DriverTransaction {
public:
    virtual ~DriverTransaction() = default;

    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual IsolationLevel getIsolationLevel() const = 0;
};

class DriverConnection {
public:
    virtual ~DriverConnection() = default;

    // At most one transaction is active on a connection.
    virtual std::unique_ptr<DriverTransaction> beginTransaction(IsolationLevel level) = 0;

    // Timeout of std::nullopt means driver default.
    virtual std::unique_ptr<DriverCommand> prepareCommand(
        const std::string & text,
        CommandType type,
        std::optional<std::chrono::seconds> timeout,
        DriverTransaction * transaction
    ) = 0;

    virtual bool isAlive() const = 0;
};

class Driver {
public:
    virtual ~Driver() = default;

    virtual std::unique_ptr<DriverConnection> openConnection() = 0;

    virtual std::string getName() const = 0;
};
