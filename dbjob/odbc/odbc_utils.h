#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/exception.h"

#include <sql.h>
#include <sqlext.h>

#include <string>
#include <utility>
#include <vector>

#include <cstdint>

struct OdbcDiagRecord {
    std::string sql_state;
    std::int32_t native_error = 0;
    std::string message;
};

std::vector<OdbcDiagRecord> extractDiagnostics(SQLSMALLINT handle_type, SQLHANDLE handle);

// SQLSTATE class 08, HYT00, HYT01 and 40001 are worth a retry on a fresh connection.
bool isTransientSQLState(const std::string & sql_state) noexcept;

// Builds the exception for a failed ODBC call from the diagnostics records of the handle.
JobException makeOdbcException(SQLSMALLINT handle_type, SQLHANDLE handle, SQLRETURN rc, const std::string & action);

inline SQLRETURN odbcCall(SQLSMALLINT handle_type, SQLHANDLE handle, SQLRETURN rc, const char * action) {
    if (rc == SQL_INVALID_HANDLE || (!SQL_SUCCEEDED(rc) && rc != SQL_NO_DATA && rc != SQL_NEED_DATA))
        throw makeOdbcException(handle_type, handle, rc, action);
    return rc;
}

inline SQLRETURN odbcCallOnEnv(SQLHENV henv, SQLRETURN rc, const char * action) {
    return odbcCall(SQL_HANDLE_ENV, henv, rc, action);
}

inline SQLRETURN odbcCallOnDbc(SQLHDBC hdbc, SQLRETURN rc, const char * action) {
    return odbcCall(SQL_HANDLE_DBC, hdbc, rc, action);
}

inline SQLRETURN odbcCallOnStmt(SQLHSTMT hstmt, SQLRETURN rc, const char * action) {
    return odbcCall(SQL_HANDLE_STMT, hstmt, rc, action);
}

// Owns one ODBC handle, freed on destruction.
class OdbcHandle {
public:
    OdbcHandle(SQLSMALLINT type_, SQLHANDLE parent);
    ~OdbcHandle();

    OdbcHandle(const OdbcHandle &) = delete;
    OdbcHandle & operator= (const OdbcHandle &) = delete;

    SQLHANDLE get() const noexcept {
        return handle;
    }

    SQLSMALLINT getType() const noexcept {
        return type;
    }

private:
    const SQLSMALLINT type;
    SQLHANDLE handle = SQL_NULL_HANDLE;
};
