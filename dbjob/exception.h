#pragma once

#include "dbjob/platform/platform.h"

#include <stdexcept>
#include <string>

#include <cstdint>

// Classification of a job failure. Only TransientConnectionError is ever retried.
enum class ErrorKind {
    ConfigurationError,
    ParameterBindingError,
    TransientConnectionError,
    CommandExecutionError,
    MappingError,
    CardinalityError,
    CanceledError
};

enum class ErrorCode {
    None,
    InvalidConfiguration,
    InvalidState,
    DuplicateParameterName,
    UnsupportedParameterShape,
    ConnectionFailure,
    PoolExhausted,
    Timeout,
    CommandRejected,
    ColumnTypeMismatch,
    EmptyResult,
    MultipleRowsFound,
    CursorDisposed,
    Canceled
};

// The part of the engine a failure originates from.
enum class Component {
    Engine,
    Configuration,
    ParameterBinder,
    CommandBuilder,
    RowMapper,
    ResultMaterializer,
    Pipeline,
    JobHandle,
    ConnectionPool,
    Driver
};

const char * toString(ErrorKind kind) noexcept;
const char * toString(ErrorCode code) noexcept;
const char * toString(Component component) noexcept;

class JobException
    : public std::runtime_error
{
public:
    explicit JobException(
        ErrorKind kind_,
        ErrorCode code_,
        Component component_,
        const std::string & message_,
        const std::string & sql_state_ = "HY000",
        std::int32_t native_error_ = 0
    );

    ErrorKind getKind() const noexcept;
    ErrorCode getCode() const noexcept;
    Component getComponent() const noexcept;
    const std::string & getSQLState() const noexcept;
    std::int32_t getNativeError() const noexcept;

    bool isTransient() const noexcept;

private:
    const ErrorKind kind;
    const ErrorCode code;
    const Component component;
    const std::string sql_state;
    const std::int32_t native_error = 0;
};

// Raised by value conversions. The row mapper and the parameter binder attribute it
// to a column, field or parameter and rethrow it as a JobException.
class ConversionError
    : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
