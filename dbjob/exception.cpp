#include "dbjob/exception.h"

const char * toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ConfigurationError:       return "ConfigurationError";
        case ErrorKind::ParameterBindingError:    return "ParameterBindingError";
        case ErrorKind::TransientConnectionError: return "TransientConnectionError";
        case ErrorKind::CommandExecutionError:    return "CommandExecutionError";
        case ErrorKind::MappingError:             return "MappingError";
        case ErrorKind::CardinalityError:         return "CardinalityError";
        case ErrorKind::CanceledError:            return "CanceledError";
    }
    return "UnknownError";
}

const char * toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:                      return "None";
        case ErrorCode::InvalidConfiguration:      return "InvalidConfiguration";
        case ErrorCode::InvalidState:              return "InvalidState";
        case ErrorCode::DuplicateParameterName:    return "DuplicateParameterName";
        case ErrorCode::UnsupportedParameterShape: return "UnsupportedParameterShape";
        case ErrorCode::ConnectionFailure:         return "ConnectionFailure";
        case ErrorCode::PoolExhausted:             return "PoolExhausted";
        case ErrorCode::Timeout:                   return "Timeout";
        case ErrorCode::CommandRejected:           return "CommandRejected";
        case ErrorCode::ColumnTypeMismatch:        return "ColumnTypeMismatch";
        case ErrorCode::EmptyResult:               return "EmptyResult";
        case ErrorCode::MultipleRowsFound:         return "MultipleRowsFound";
        case ErrorCode::CursorDisposed:            return "CursorDisposed";
        case ErrorCode::Canceled:                  return "Canceled";
    }
    return "Unknown";
}

const char * toString(Component component) noexcept {
    switch (component) {
        case Component::Engine:             return "Engine";
        case Component::Configuration:      return "Configuration";
        case Component::ParameterBinder:    return "ParameterBinder";
        case Component::CommandBuilder:     return "CommandBuilder";
        case Component::RowMapper:          return "RowMapper";
        case Component::ResultMaterializer: return "ResultMaterializer";
        case Component::Pipeline:           return "Pipeline";
        case Component::JobHandle:          return "JobHandle";
        case Component::ConnectionPool:     return "ConnectionPool";
        case Component::Driver:             return "Driver";
    }
    return "Unknown";
}

JobException::JobException(
    ErrorKind kind_,
    ErrorCode code_,
    Component component_,
    const std::string & message_,
    const std::string & sql_state_,
    std::int32_t native_error_
)
    : std::runtime_error(message_)
    , kind(kind_)
    , code(code_)
    , component(component_)
    , sql_state(sql_state_)
    , native_error(native_error_)
{
}

ErrorKind JobException::getKind() const noexcept {
    return kind;
}

ErrorCode JobException::getCode() const noexcept {
    return code;
}

Component JobException::getComponent() const noexcept {
    return component;
}

const std::string & JobException::getSQLState() const noexcept {
    return sql_state;
}

std::int32_t JobException::getNativeError() const noexcept {
    return native_error;
}

bool JobException::isTransient() const noexcept {
    return (kind == ErrorKind::TransientConnectionError);
}
