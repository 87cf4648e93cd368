#include "dbjob/odbc/odbc_driver.h"
#include "dbjob/utils/conversion.h"
#include "dbjob/utils/parameter_markers.h"
#include "dbjob/utils/utils.h"
#include "dbjob/log/log.h"

#include <algorithm>
#include <cstring>

namespace {

    // SQL_TXN_SS_SNAPSHOT of the SQL Server drivers.
    constexpr SQLULEN TXN_SNAPSHOT = 0x00000020;

    template <typename T>
    void storeFixed(OdbcParameterBuffer & buffer, const T & value) {
        buffer.data.resize(sizeof(T));
        std::memcpy(buffer.data.data(), &value, sizeof(T));
    }

    template <typename T>
    T loadFixed(const std::vector<char> & data) {
        T value{};
        if (data.size() >= sizeof(T))
            std::memcpy(&value, data.data(), sizeof(T));
        return value;
    }

    SQL_DATE_STRUCT toSQLDate(const Date & date) {
        SQL_DATE_STRUCT result{};
        result.year = date.year;
        result.month = date.month;
        result.day = date.day;
        return result;
    }

    SQL_TIME_STRUCT toSQLTime(const Time & time) {
        SQL_TIME_STRUCT result{};
        result.hour = time.hour;
        result.minute = time.minute;
        result.second = time.second;
        return result;
    }

    SQL_TIMESTAMP_STRUCT toSQLTimestamp(const DateTime & datetime) {
        SQL_TIMESTAMP_STRUCT result{};
        result.year = datetime.date.year;
        result.month = datetime.date.month;
        result.day = datetime.date.day;
        result.hour = datetime.time.hour;
        result.minute = datetime.time.minute;
        result.second = datetime.time.second;
        result.fraction = datetime.fraction;
        return result;
    }

    Date fromSQLDate(const SQL_DATE_STRUCT & date) {
        return Date{date.year, date.month, date.day};
    }

    Time fromSQLTime(const SQL_TIME_STRUCT & time) {
        return Time{time.hour, time.minute, time.second};
    }

    DateTime fromSQLTimestamp(const SQL_TIMESTAMP_STRUCT & ts) {
        DateTime result;
        result.date = Date{ts.year, ts.month, ts.day};
        result.time = Time{ts.hour, ts.minute, ts.second};
        result.fraction = ts.fraction;
        return result;
    }

    JobException unboundMarker(const std::string & name) {
        return JobException(ErrorKind::ParameterBindingError, ErrorCode::InvalidConfiguration, Component::Driver,
            "No value bound for parameter " + (name.empty() ? std::string{"marker '?'"} : name), "07002");
    }

    template <typename T>
    T convertParameter(const ParameterDescriptor & descriptor) {
        try {
            return convertValue<T>(descriptor.value);
        }
        catch (const ConversionError & ex) {
            throw JobException(ErrorKind::ParameterBindingError, ErrorCode::ColumnTypeMismatch, Component::Driver,
                "Parameter " + descriptor.name + ": " + ex.what(), "07006");
        }
    }

} // namespace

namespace odbc_mapping {

ValueType toValueType(SQLSMALLINT sql_type, bool is_unsigned) noexcept {
    switch (sql_type) {
        case SQL_BIT:
            return ValueType::Boolean;

        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
            return ValueType::Int64;

        case SQL_BIGINT:
            return (is_unsigned ? ValueType::UInt64 : ValueType::Int64);

        case SQL_REAL:
        case SQL_FLOAT:
        case SQL_DOUBLE:
            return ValueType::Float64;

        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY:
            return ValueType::Binary;

        case SQL_TYPE_DATE:
        case SQL_DATE:
            return ValueType::Date;

        case SQL_TYPE_TIME:
        case SQL_TIME:
            return ValueType::Time;

        case SQL_TYPE_TIMESTAMP:
        case SQL_TIMESTAMP:
            return ValueType::DateTime;

        // DECIMAL and NUMERIC are read as text to keep their precision.
        default:
            return ValueType::String;
    }
}

SQLULEN toTxnIsolation(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::ReadUncommitted: return SQL_TXN_READ_UNCOMMITTED;
        case IsolationLevel::ReadCommitted:   return SQL_TXN_READ_COMMITTED;
        case IsolationLevel::RepeatableRead:  return SQL_TXN_REPEATABLE_READ;
        case IsolationLevel::Serializable:    return SQL_TXN_SERIALIZABLE;
        case IsolationLevel::Snapshot:        return TXN_SNAPSHOT;
        case IsolationLevel::Unspecified:     break;
    }

    throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::Driver,
        std::string{"Isolation level has no ODBC equivalent: "} + toString(level), "HY024");
}

std::string buildNativeText(const std::string & text, CommandType type, const std::vector<ParameterDescriptor> & parameters,
    std::vector<const ParameterDescriptor *> & binding_order
) {
    binding_order.clear();

    switch (type) {
        case CommandType::Text: {
            const auto markers = scanParameterMarkers(text);
            std::size_t next_positional = 0;

            for (const auto & marker : markers) {
                const ParameterDescriptor * bound = nullptr;

                if (marker.isPositional()) {
                    std::size_t seen = 0;
                    for (const auto & descriptor : parameters) {
                        if (descriptor.isPositional() && seen++ == next_positional) {
                            bound = &descriptor;
                            break;
                        }
                    }
                    ++next_positional;
                }
                else {
                    const auto name = tryStripParamPrefix(marker.name);
                    for (const auto & descriptor : parameters) {
                        if (!descriptor.isPositional() && equalsIgnoreCase(descriptor.name, name)) {
                            bound = &descriptor;
                            break;
                        }
                    }
                }

                if (!bound)
                    throw unboundMarker(marker.name);

                binding_order.push_back(bound);
            }

            return rewriteParameterMarkers(text, markers, [] (const ParameterMarker &) {
                return std::string{"?"};
            });
        }

        case CommandType::StoredProcedure: {
            const ParameterDescriptor * return_value = nullptr;
            for (const auto & descriptor : parameters) {
                if (descriptor.direction == ParameterDirection::ReturnValue)
                    return_value = &descriptor;
            }

            std::string native = "{";
            if (return_value) {
                native += "? = ";
                binding_order.push_back(return_value);
            }

            native += "CALL " + text + "(";
            bool first = true;
            for (const auto & descriptor : parameters) {
                if (descriptor.direction == ParameterDirection::ReturnValue)
                    continue;

                native += (first ? "?" : ", ?");
                first = false;
                binding_order.push_back(&descriptor);
            }
            native += ")}";
            return native;
        }

        case CommandType::TableDirect:
            return "SELECT * FROM " + text;
    }

    return text;
}

} // namespace odbc_mapping

Value OdbcParameterBuffer::decode() const {
    if (indicator == SQL_NULL_DATA)
        return Value::null();

    switch (c_type) {
        case SQL_C_BIT:            return Value(loadFixed<unsigned char>(data) != 0);
        case SQL_C_SBIGINT:        return Value(static_cast<std::int64_t>(loadFixed<SQLBIGINT>(data)));
        case SQL_C_UBIGINT:        return Value(static_cast<std::uint64_t>(loadFixed<SQLUBIGINT>(data)));
        case SQL_C_DOUBLE:         return Value(loadFixed<SQLDOUBLE>(data));
        case SQL_C_TYPE_DATE:      return Value(fromSQLDate(loadFixed<SQL_DATE_STRUCT>(data)));
        case SQL_C_TYPE_TIME:      return Value(fromSQLTime(loadFixed<SQL_TIME_STRUCT>(data)));
        case SQL_C_TYPE_TIMESTAMP: return Value(fromSQLTimestamp(loadFixed<SQL_TIMESTAMP_STRUCT>(data)));

        case SQL_C_BINARY: {
            const auto size = (indicator == SQL_NO_TOTAL ? data.size() : std::min<std::size_t>(indicator, data.size()));
            return Value(Binary(data.begin(), data.begin() + size));
        }

        default: {
            const auto capacity = (data.empty() ? 0 : data.size() - 1);
            const auto size = (indicator == SQL_NO_TOTAL ? ::strnlen(data.data(), capacity) : std::min<std::size_t>(indicator, capacity));
            return Value(std::string(data.data(), size));
        }
    }
}

OdbcParameterBuffer makeParameterBuffer(const ParameterDescriptor & descriptor) {
    OdbcParameterBuffer buffer;
    buffer.descriptor = &descriptor;

    switch (descriptor.direction) {
        case ParameterDirection::Input:       buffer.io_type = SQL_PARAM_INPUT; break;
        case ParameterDirection::InputOutput: buffer.io_type = SQL_PARAM_INPUT_OUTPUT; break;
        case ParameterDirection::Output:
        case ParameterDirection::ReturnValue: buffer.io_type = SQL_PARAM_OUTPUT; break;
    }

    const bool has_value = (descriptor.isInput() && !descriptor.value.isNull());
    const std::size_t output_size = (descriptor.size > 0 ? descriptor.size : DBJOB_DEFAULT_OUTPUT_SIZE);

    auto type = descriptor.getEffectiveType();
    if (type == ValueType::Null && descriptor.isOutput())
        type = ValueType::String;

    switch (type) {
        case ValueType::Boolean:
            buffer.c_type = SQL_C_BIT;
            buffer.sql_type = SQL_BIT;
            buffer.column_size = 1;
            storeFixed(buffer, static_cast<unsigned char>(has_value && convertParameter<bool>(descriptor) ? 1 : 0));
            break;

        case ValueType::Int64:
            buffer.c_type = SQL_C_SBIGINT;
            buffer.sql_type = SQL_BIGINT;
            buffer.column_size = 19;
            storeFixed(buffer, static_cast<SQLBIGINT>(has_value ? convertParameter<std::int64_t>(descriptor) : 0));
            break;

        case ValueType::UInt64:
            buffer.c_type = SQL_C_UBIGINT;
            buffer.sql_type = SQL_BIGINT;
            buffer.column_size = 20;
            storeFixed(buffer, static_cast<SQLUBIGINT>(has_value ? convertParameter<std::uint64_t>(descriptor) : 0));
            break;

        case ValueType::Float64:
            buffer.c_type = SQL_C_DOUBLE;
            buffer.sql_type = SQL_DOUBLE;
            buffer.column_size = 15;
            storeFixed(buffer, static_cast<SQLDOUBLE>(has_value ? convertParameter<double>(descriptor) : 0.0));
            break;

        case ValueType::Date:
            buffer.c_type = SQL_C_TYPE_DATE;
            buffer.sql_type = SQL_TYPE_DATE;
            buffer.column_size = 10;
            storeFixed(buffer, has_value ? toSQLDate(convertParameter<Date>(descriptor)) : SQL_DATE_STRUCT{});
            break;

        case ValueType::Time:
            buffer.c_type = SQL_C_TYPE_TIME;
            buffer.sql_type = SQL_TYPE_TIME;
            buffer.column_size = 8;
            storeFixed(buffer, has_value ? toSQLTime(convertParameter<Time>(descriptor)) : SQL_TIME_STRUCT{});
            break;

        case ValueType::DateTime:
            buffer.c_type = SQL_C_TYPE_TIMESTAMP;
            buffer.sql_type = SQL_TYPE_TIMESTAMP;
            buffer.column_size = 29;
            buffer.decimal_digits = 9;
            storeFixed(buffer, has_value ? toSQLTimestamp(convertParameter<DateTime>(descriptor)) : SQL_TIMESTAMP_STRUCT{});
            break;

        case ValueType::Binary: {
            const auto bytes = (has_value ? convertParameter<Binary>(descriptor) : Binary{});
            buffer.c_type = SQL_C_BINARY;
            buffer.sql_type = SQL_VARBINARY;
            buffer.data.assign(bytes.begin(), bytes.end());
            if (descriptor.isOutput())
                buffer.data.resize(std::max(buffer.data.size(), output_size));
            buffer.column_size = std::max<std::size_t>(buffer.data.size(), 1);
            buffer.indicator = static_cast<SQLLEN>(bytes.size());
            break;
        }

        case ValueType::Null:
        case ValueType::String: {
            const auto str = (has_value ? convertParameter<std::string>(descriptor) : std::string{});
            buffer.c_type = SQL_C_CHAR;
            buffer.sql_type = SQL_VARCHAR;
            buffer.data.assign(str.begin(), str.end());
            if (descriptor.isOutput())
                buffer.data.resize(std::max(buffer.data.size(), output_size));
            buffer.data.push_back('\0');
            buffer.column_size = std::max<std::size_t>(buffer.data.size() - 1, 1);
            buffer.indicator = static_cast<SQLLEN>(str.size());
            break;
        }
    }

    if (descriptor.isInput() && descriptor.value.isNull())
        buffer.indicator = SQL_NULL_DATA;
    else if (buffer.c_type != SQL_C_CHAR && buffer.c_type != SQL_C_BINARY)
        buffer.indicator = static_cast<SQLLEN>(buffer.data.size());

    return buffer;
}

OdbcDriver::OdbcDriver(std::string connection_string_)
    : connection_string(std::move(connection_string_))
{
    if (connection_string.empty())
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::Driver, "ODBC connection string is empty", "HY024");

    environment = std::make_shared<OdbcHandle>(SQL_HANDLE_ENV, SQL_NULL_HANDLE);
    odbcCallOnEnv(environment->get(),
        SQLSetEnvAttr(environment->get(), SQL_ATTR_ODBC_VERSION, reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0),
        "SQLSetEnvAttr(SQL_ATTR_ODBC_VERSION)"
    );
}

std::unique_ptr<DriverConnection> OdbcDriver::openConnection() {
    return std::make_unique<OdbcConnection>(environment, connection_string);
}

std::string OdbcDriver::getName() const {
    return "ODBC";
}

OdbcTransaction::OdbcTransaction(OdbcConnection & connection_, IsolationLevel level_)
    : connection(connection_)
    , level(level_)
{
    if (level != IsolationLevel::Unspecified) {
        odbcCallOnDbc(connection.getHandle(),
            SQLSetConnectAttr(connection.getHandle(), SQL_ATTR_TXN_ISOLATION, reinterpret_cast<SQLPOINTER>(odbc_mapping::toTxnIsolation(level)), SQL_IS_UINTEGER),
            "SQLSetConnectAttr(SQL_ATTR_TXN_ISOLATION)"
        );
    }

    connection.setAutoCommit(false);
}

OdbcTransaction::~OdbcTransaction() {
    if (finished)
        return;

    try {
        rollback();
    }
    catch (const std::exception & ex) {
        LOG("ODBC transaction rollback on release failed: " << ex.what());
    }
}

void OdbcTransaction::commit() {
    end(SQL_COMMIT);
}

void OdbcTransaction::rollback() {
    end(SQL_ROLLBACK);
}

IsolationLevel OdbcTransaction::getIsolationLevel() const {
    return level;
}

void OdbcTransaction::end(SQLSMALLINT completion_type) {
    if (finished)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Driver, "Transaction has already ended", "25000");

    finished = true;

    const auto rc = SQLEndTran(SQL_HANDLE_DBC, connection.getHandle(), completion_type);
    if (!SQL_SUCCEEDED(rc)) {
        auto ex = makeOdbcException(SQL_HANDLE_DBC, connection.getHandle(), rc, (completion_type == SQL_COMMIT ? "SQLEndTran(SQL_COMMIT)" : "SQLEndTran(SQL_ROLLBACK)"));
        connection.recoverFromFailedEnd();
        throw ex;
    }

    try {
        connection.setAutoCommit(true);
    }
    catch (const std::exception & ex) {
        LOG("Failed to restore autocommit after the transaction ended: " << ex.what());
        connection.markUnusable();
    }
}

OdbcConnection::OdbcConnection(std::shared_ptr<OdbcHandle> environment_, const std::string & connection_string)
    : environment(std::move(environment_))
    , connection(SQL_HANDLE_DBC, environment->get())
{
    std::vector<SQLCHAR> encoded(connection_string.begin(), connection_string.end());
    encoded.push_back('\0');

    odbcCallOnDbc(connection.get(),
        SQLDriverConnect(connection.get(), nullptr, encoded.data(), SQL_NTS, nullptr, 0, nullptr, SQL_DRIVER_NOPROMPT),
        "SQLDriverConnect"
    );

    connected = true;
    LOG("ODBC connection opened");
}

OdbcConnection::~OdbcConnection() {
    if (in_transaction) {
        const auto rc = SQLEndTran(SQL_HANDLE_DBC, connection.get(), SQL_ROLLBACK);
        if (!SQL_SUCCEEDED(rc))
            LOG("Rollback on disconnect failed, rc=" << rc);
    }

    if (connected) {
        const auto rc = SQLDisconnect(connection.get());
        if (!SQL_SUCCEEDED(rc))
            LOG("SQLDisconnect failed, rc=" << rc);
        else
            LOG("ODBC connection closed");
    }
}

std::unique_ptr<DriverTransaction> OdbcConnection::beginTransaction(IsolationLevel level) {
    if (in_transaction)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Driver, "Connection already has an active transaction", "25000");

    return std::make_unique<OdbcTransaction>(*this, level);
}

std::unique_ptr<DriverCommand> OdbcConnection::prepareCommand(
    const std::string & text,
    CommandType type,
    std::optional<std::chrono::seconds> timeout,
    DriverTransaction * transaction
) {
    if (transaction && !in_transaction)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Driver, "Transaction does not belong to this connection", "25000");

    return std::make_unique<OdbcCommand>(*this, text, type, timeout);
}

bool OdbcConnection::isAlive() const {
    if (!connected || !usable)
        return false;

    SQLUINTEGER dead = SQL_CD_FALSE;
    const auto rc = SQLGetConnectAttr(connection.get(), SQL_ATTR_CONNECTION_DEAD, &dead, 0, nullptr);

    // Drivers that do not support the attribute are assumed alive.
    if (!SQL_SUCCEEDED(rc))
        return true;

    return (dead == SQL_CD_FALSE);
}

SQLHDBC OdbcConnection::getHandle() const noexcept {
    return connection.get();
}

void OdbcConnection::setAutoCommit(bool enabled) {
    const auto value = (enabled ? SQL_AUTOCOMMIT_ON : SQL_AUTOCOMMIT_OFF);
    odbcCallOnDbc(connection.get(),
        SQLSetConnectAttr(connection.get(), SQL_ATTR_AUTOCOMMIT, reinterpret_cast<SQLPOINTER>(static_cast<SQLULEN>(value)), SQL_IS_UINTEGER),
        "SQLSetConnectAttr(SQL_ATTR_AUTOCOMMIT)"
    );
    in_transaction = !enabled;
}

void OdbcConnection::recoverFromFailedEnd() noexcept {
    // Enabling autocommit commits an open transaction, so it is only restored after a successful rollback.
    const auto rc = SQLEndTran(SQL_HANDLE_DBC, connection.get(), SQL_ROLLBACK);
    if (SQL_SUCCEEDED(rc)) {
        try {
            setAutoCommit(true);
            return;
        }
        catch (const std::exception & ex) {
            LOG("Failed to restore autocommit after a failed transaction end: " << ex.what());
        }
    }
    else {
        LOG("Rollback after a failed transaction end failed, rc=" << rc);
    }

    markUnusable();
}

void OdbcConnection::markUnusable() noexcept {
    usable = false;
    in_transaction = false;
}

OdbcCommand::OdbcCommand(OdbcConnection & connection, std::string text_, CommandType type_, std::optional<std::chrono::seconds> timeout)
    : statement(SQL_HANDLE_STMT, connection.getHandle())
    , text(std::move(text_))
    , type(type_)
{
    if (timeout) {
        odbcCallOnStmt(statement.get(),
            SQLSetStmtAttr(statement.get(), SQL_ATTR_QUERY_TIMEOUT, reinterpret_cast<SQLPOINTER>(static_cast<SQLULEN>(timeout->count())), SQL_IS_UINTEGER),
            "SQLSetStmtAttr(SQL_ATTR_QUERY_TIMEOUT)"
        );
    }
}

OdbcCommand::~OdbcCommand() {
    SQLFreeStmt(statement.get(), SQL_CLOSE);
    SQLFreeStmt(statement.get(), SQL_RESET_PARAMS);
}

void OdbcCommand::bindParameter(const ParameterDescriptor & descriptor) {
    if (executed)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Driver, "Parameters cannot be bound after execution", "HY010");

    parameters.push_back(descriptor);
}

std::unique_ptr<DriverCursor> OdbcCommand::execute(CommandBehavior behavior) {
    prepareAndExecute(behavior);
    return std::make_unique<OdbcCursor>(*this, behavior);
}

std::int64_t OdbcCommand::executeNonQuery() {
    prepareAndExecute(CommandBehavior::Default);

    std::int64_t total = -1;
    SQLRETURN rc = SQL_SUCCESS;

    do {
        SQLLEN count = -1;
        odbcCallOnStmt(statement.get(), SQLRowCount(statement.get(), &count), "SQLRowCount");
        if (count >= 0)
            total = (total < 0 ? 0 : total) + count;

        rc = odbcCallOnStmt(statement.get(), SQLMoreResults(statement.get()), "SQLMoreResults");
    } while (rc != SQL_NO_DATA);

    return total;
}

void OdbcCommand::cancel() {
    const auto rc = SQLCancel(statement.get());
    if (!SQL_SUCCEEDED(rc))
        LOG("SQLCancel failed: " << makeOdbcException(SQL_HANDLE_STMT, statement.get(), rc, "SQLCancel").what());
}

Value OdbcCommand::getOutputValue(const std::string & name) const {
    const auto stripped = tryStripParamPrefix(name);

    for (const auto & buffer : buffers) {
        if (buffer.descriptor->isOutput() && equalsIgnoreCase(buffer.descriptor->name, stripped))
            return buffer.decode();
    }

    throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::Driver, "No output parameter named " + name, "07009");
}

SQLHSTMT OdbcCommand::getHandle() const noexcept {
    return statement.get();
}

void OdbcCommand::prepareAndExecute(CommandBehavior behavior) {
    if (executed)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidState, Component::Driver, "Command has already been executed", "HY010");

    std::vector<const ParameterDescriptor *> order;
    auto native_text = odbc_mapping::buildNativeText(text, type, parameters, order);

    odbcCallOnStmt(statement.get(),
        SQLPrepare(statement.get(), reinterpret_cast<SQLCHAR *>(native_text.data()), SQL_NTS),
        "SQLPrepare"
    );

    buffers.clear();
    buffers.reserve(order.size());
    for (const auto * descriptor : order) {
        buffers.push_back(makeParameterBuffer(*descriptor));
    }

    bindBuffers();
    executed = true;

    // Result columns of a prepared statement can be described without executing it.
    if (hasFlag(behavior, CommandBehavior::SchemaOnly))
        return;

    odbcCallOnStmt(statement.get(), SQLExecute(statement.get()), "SQLExecute");
}

void OdbcCommand::bindBuffers() {
    for (std::size_t i = 0; i < buffers.size(); ++i) {
        auto & buffer = buffers[i];
        odbcCallOnStmt(statement.get(),
            SQLBindParameter(
                statement.get(),
                static_cast<SQLUSMALLINT>(i + 1),
                buffer.io_type,
                buffer.c_type,
                buffer.sql_type,
                buffer.column_size,
                buffer.decimal_digits,
                buffer.data.data(),
                static_cast<SQLLEN>(buffer.data.size()),
                &buffer.indicator
            ),
            "SQLBindParameter"
        );
    }
}

OdbcCursor::OdbcCursor(OdbcCommand & command_, CommandBehavior behavior_)
    : command(command_)
    , behavior(behavior_)
{
    if (hasFlag(behavior, CommandBehavior::SchemaOnly)) {
        describeColumns();
        exhausted = true;
        return;
    }

    seekResultWithColumns();
}

OdbcCursor::~OdbcCursor() {
    const auto rc = SQLFreeStmt(command.getHandle(), SQL_CLOSE);
    if (!SQL_SUCCEEDED(rc))
        LOG("Closing ODBC cursor failed, rc=" << rc);
}

const ColumnSchema & OdbcCursor::getColumnSchema() const {
    return schema;
}

bool OdbcCursor::advanceRow() {
    if (schema.empty() || hasFlag(behavior, CommandBehavior::SchemaOnly))
        return false;

    const auto rc = odbcCallOnStmt(command.getHandle(), SQLFetch(command.getHandle()), "SQLFetch");
    if (rc == SQL_NO_DATA)
        return false;

    row_cache.assign(schema.size(), std::nullopt);
    next_column = 0;
    return true;
}

bool OdbcCursor::advanceSegment() {
    if (exhausted)
        return false;

    if (hasFlag(behavior, CommandBehavior::SingleResult)) {
        exhausted = true;
        schema.clear();
        return false;
    }

    const auto rc = odbcCallOnStmt(command.getHandle(), SQLMoreResults(command.getHandle()), "SQLMoreResults");
    if (rc == SQL_NO_DATA) {
        exhausted = true;
        schema.clear();
        return false;
    }

    return seekResultWithColumns();
}

Value OdbcCursor::readColumn(std::size_t index) {
    if (index >= schema.size() || index >= row_cache.size())
        throw JobException(ErrorKind::CommandExecutionError, ErrorCode::InvalidState, Component::Driver,
            "Column index " + std::to_string(index) + " is out of range or no row is current", "07009");

    // SQLGetData is forward-only, earlier columns are kept for out of order reads.
    while (next_column <= index) {
        row_cache[next_column] = fetchColumn(next_column);
        ++next_column;
    }

    return *row_cache[index];
}

std::int64_t OdbcCursor::getAffectedRowCount() const {
    return affected_rows;
}

bool OdbcCursor::seekResultWithColumns() {
    const auto hstmt = command.getHandle();

    while (true) {
        SQLSMALLINT column_count = 0;
        odbcCallOnStmt(hstmt, SQLNumResultCols(hstmt, &column_count), "SQLNumResultCols");

        if (column_count > 0) {
            describeColumns();
            return true;
        }

        SQLLEN count = -1;
        odbcCallOnStmt(hstmt, SQLRowCount(hstmt, &count), "SQLRowCount");
        if (count >= 0)
            affected_rows = (affected_rows < 0 ? 0 : affected_rows) + count;

        const auto rc = odbcCallOnStmt(hstmt, SQLMoreResults(hstmt), "SQLMoreResults");
        if (rc == SQL_NO_DATA) {
            exhausted = true;
            schema.clear();
            return false;
        }
    }
}

void OdbcCursor::describeColumns() {
    const auto hstmt = command.getHandle();

    SQLSMALLINT column_count = 0;
    odbcCallOnStmt(hstmt, SQLNumResultCols(hstmt, &column_count), "SQLNumResultCols");

    schema.clear();
    sql_types.clear();
    row_cache.clear();
    next_column = 0;

    for (SQLUSMALLINT column = 1; column <= static_cast<SQLUSMALLINT>(column_count); ++column) {
        SQLCHAR name[512] = {};
        SQLSMALLINT name_length = 0;
        SQLSMALLINT data_type = 0;
        SQLULEN column_size = 0;
        SQLSMALLINT decimal_digits = 0;
        SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;

        odbcCallOnStmt(hstmt,
            SQLDescribeCol(hstmt, column, name, sizeof(name), &name_length, &data_type, &column_size, &decimal_digits, &nullable),
            "SQLDescribeCol"
        );

        SQLLEN is_unsigned = SQL_FALSE;
        if (data_type == SQL_BIGINT)
            odbcCallOnStmt(hstmt, SQLColAttribute(hstmt, column, SQL_DESC_UNSIGNED, nullptr, 0, nullptr, &is_unsigned), "SQLColAttribute");

        ColumnInfo info;
        info.name = reinterpret_cast<const char *>(name);
        info.type = odbc_mapping::toValueType(data_type, is_unsigned == SQL_TRUE);
        info.nullable = (nullable != SQL_NO_NULLS);

        schema.push_back(std::move(info));
        sql_types.push_back(data_type);
    }
}

Value OdbcCursor::fetchColumn(std::size_t index) {
    const auto hstmt = command.getHandle();
    const auto column = static_cast<SQLUSMALLINT>(index + 1);

    const auto get_fixed = [&] (SQLSMALLINT c_type, auto & value) {
        SQLLEN indicator = 0;
        odbcCallOnStmt(hstmt, SQLGetData(hstmt, column, c_type, &value, sizeof(value), &indicator), "SQLGetData");
        return (indicator != SQL_NULL_DATA);
    };

    switch (schema[index].type) {
        case ValueType::Boolean: {
            unsigned char value = 0;
            return (get_fixed(SQL_C_BIT, value) ? Value(value != 0) : Value::null());
        }

        case ValueType::Int64: {
            SQLBIGINT value = 0;
            return (get_fixed(SQL_C_SBIGINT, value) ? Value(static_cast<std::int64_t>(value)) : Value::null());
        }

        case ValueType::UInt64: {
            SQLUBIGINT value = 0;
            return (get_fixed(SQL_C_UBIGINT, value) ? Value(static_cast<std::uint64_t>(value)) : Value::null());
        }

        case ValueType::Float64: {
            SQLDOUBLE value = 0;
            return (get_fixed(SQL_C_DOUBLE, value) ? Value(static_cast<double>(value)) : Value::null());
        }

        case ValueType::Date: {
            SQL_DATE_STRUCT value{};
            return (get_fixed(SQL_C_TYPE_DATE, value) ? Value(fromSQLDate(value)) : Value::null());
        }

        case ValueType::Time: {
            SQL_TIME_STRUCT value{};
            return (get_fixed(SQL_C_TYPE_TIME, value) ? Value(fromSQLTime(value)) : Value::null());
        }

        case ValueType::DateTime: {
            SQL_TIMESTAMP_STRUCT value{};
            return (get_fixed(SQL_C_TYPE_TIMESTAMP, value) ? Value(fromSQLTimestamp(value)) : Value::null());
        }

        default:
            break;
    }

    const bool binary = (schema[index].type == ValueType::Binary);
    const SQLSMALLINT c_type = (binary ? SQL_C_BINARY : SQL_C_CHAR);
    const std::size_t terminator = (binary ? 0 : 1);

    std::string data;
    std::vector<char> chunk(DBJOB_DATA_CHUNK_SIZE);

    while (true) {
        SQLLEN indicator = 0;
        const auto rc = odbcCallOnStmt(hstmt, SQLGetData(hstmt, column, c_type, chunk.data(), static_cast<SQLLEN>(chunk.size()), &indicator), "SQLGetData");
        if (rc == SQL_NO_DATA)
            break;

        if (indicator == SQL_NULL_DATA)
            return Value::null();

        std::size_t written = chunk.size() - terminator;
        if (indicator != SQL_NO_TOTAL && static_cast<std::size_t>(indicator) + terminator <= chunk.size())
            written = static_cast<std::size_t>(indicator);

        data.append(chunk.data(), written);

        if (rc == SQL_SUCCESS)
            break;
    }

    if (binary)
        return Value(Binary(data.begin(), data.end()));

    return Value(std::move(data));
}
