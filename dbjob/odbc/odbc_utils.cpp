#include "dbjob/odbc/odbc_utils.h"
#include "dbjob/log/log.h"

#include <sstream>

std::vector<OdbcDiagRecord> extractDiagnostics(SQLSMALLINT handle_type, SQLHANDLE handle) {
    std::vector<OdbcDiagRecord> records;

    if (handle == SQL_NULL_HANDLE)
        return records;

    SQLSMALLINT i = 0;
    SQLRETURN rc = SQL_SUCCESS;

    do {
        SQLCHAR state[6] = {}; // 5 chars of SQLSTATE plus the terminating null
        SQLCHAR text[10240] = {};
        SQLINTEGER native = 0;
        SQLSMALLINT len = 0;

        rc = SQLGetDiagRec(handle_type, handle, ++i, state, &native, text, sizeof(text), &len);
        if (SQL_SUCCEEDED(rc)) {
            OdbcDiagRecord record;
            record.sql_state = reinterpret_cast<const char *>(state);
            record.native_error = native;
            record.message = reinterpret_cast<const char *>(text);
            records.push_back(std::move(record));
        }
    } while (SQL_SUCCEEDED(rc));

    return records;
}

bool isTransientSQLState(const std::string & sql_state) noexcept {
    return (
        sql_state.compare(0, 2, "08") == 0 ||
        sql_state == "HYT00" ||
        sql_state == "HYT01" ||
        sql_state == "40001"
    );
}

JobException makeOdbcException(SQLSMALLINT handle_type, SQLHANDLE handle, SQLRETURN rc, const std::string & action) {
    if (rc == SQL_INVALID_HANDLE)
        return JobException(ErrorKind::CommandExecutionError, ErrorCode::CommandRejected, Component::Driver, action + ": invalid handle", "HY000");

    const auto records = extractDiagnostics(handle_type, handle);

    std::ostringstream message;
    message << action << " failed";
    for (const auto & record : records) {
        message << "\n[" << record.sql_state << "][" << record.native_error << "] " << record.message;
    }

    if (records.empty()) {
        message << " (rc=" << rc << ")";
        return JobException(ErrorKind::CommandExecutionError, ErrorCode::CommandRejected, Component::Driver, message.str(), "HY000");
    }

    const auto & first = records.front();

    if (first.sql_state == "HY008")
        return JobException(ErrorKind::CanceledError, ErrorCode::Canceled, Component::Driver, message.str(), first.sql_state, first.native_error);

    if (first.sql_state == "HYT00" || first.sql_state == "HYT01")
        return JobException(ErrorKind::TransientConnectionError, ErrorCode::Timeout, Component::Driver, message.str(), first.sql_state, first.native_error);

    if (first.sql_state.compare(0, 2, "08") == 0)
        return JobException(ErrorKind::TransientConnectionError, ErrorCode::ConnectionFailure, Component::Driver, message.str(), first.sql_state, first.native_error);

    if (isTransientSQLState(first.sql_state))
        return JobException(ErrorKind::TransientConnectionError, ErrorCode::CommandRejected, Component::Driver, message.str(), first.sql_state, first.native_error);

    return JobException(ErrorKind::CommandExecutionError, ErrorCode::CommandRejected, Component::Driver, message.str(), first.sql_state, first.native_error);
}

OdbcHandle::OdbcHandle(SQLSMALLINT type_, SQLHANDLE parent)
    : type(type_)
{
    const auto rc = SQLAllocHandle(type, parent, &handle);
    if (!SQL_SUCCEEDED(rc)) {
        switch (type) {
            case SQL_HANDLE_DBC:  throw makeOdbcException(SQL_HANDLE_ENV, parent, rc, "SQLAllocHandle(DBC)");
            case SQL_HANDLE_STMT: throw makeOdbcException(SQL_HANDLE_DBC, parent, rc, "SQLAllocHandle(STMT)");
            default:
                throw JobException(ErrorKind::TransientConnectionError, ErrorCode::ConnectionFailure, Component::Driver, "Unable to allocate an ODBC environment", "HY001");
        }
    }
}

OdbcHandle::~OdbcHandle() {
    if (handle == SQL_NULL_HANDLE)
        return;

    const auto rc = SQLFreeHandle(type, handle);
    if (!SQL_SUCCEEDED(rc))
        LOG("SQLFreeHandle failed, handle type " << type << ", rc=" << rc);
}
