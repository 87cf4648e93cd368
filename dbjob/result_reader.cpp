#include "dbjob/result_reader.h"
#include "dbjob/log/log.h"

const char * toString(CursorState state) noexcept {
    switch (state) {
        case CursorState::BeforeFirstSegment: return "BeforeFirstSegment";
        case CursorState::InSegment:          return "InSegment";
        case CursorState::AfterSegment:       return "AfterSegment";
        case CursorState::Exhausted:          return "Exhausted";
    }
    return "Unknown";
}

ResultReader::ResultReader(DriverCursor & cursor_, CommandBehavior behavior_, CancellationToken token_, ColumnMapSettings settings_, bool use_plan_cache_)
    : cursor(cursor_)
    , behavior(behavior_)
    , token(std::move(token_))
    , settings(std::move(settings_))
    , use_plan_cache(use_plan_cache_)
{
}

CursorState ResultReader::getState() const noexcept {
    return state;
}

std::size_t ResultReader::getSegmentIndex() const noexcept {
    return segment_index;
}

bool ResultReader::wasCanceled() const noexcept {
    return canceled;
}

const ColumnSchema & ResultReader::getColumnSchema() const {
    return cursor.getColumnSchema();
}

bool ResultReader::checkCanceled() {
    if (!canceled && token.isCancellationRequested()) {
        canceled = true;
        LOG("Cancellation requested, reading stopped in segment " << segment_index << " after " << rows_in_segment << " row(s)");
    }
    return canceled;
}

void ResultReader::onDriverCanceled() {
    canceled = true;
    LOG("Driver canceled the command, reading stopped in segment " << segment_index << " after " << rows_in_segment << " row(s)");
}

bool ResultReader::nextRow() {
    if (checkCanceled())
        return false;

    if (state == CursorState::BeforeFirstSegment)
        state = CursorState::InSegment;

    if (state != CursorState::InSegment)
        return false;

    if (hasFlag(behavior, CommandBehavior::SchemaOnly) || (hasFlag(behavior, CommandBehavior::SingleRow) && rows_in_segment > 0)) {
        state = CursorState::AfterSegment;
        return false;
    }

    bool advanced = false;
    try {
        advanced = cursor.advanceRow();
    }
    catch (const JobException & ex) {
        if (ex.getKind() != ErrorKind::CanceledError)
            throw;
        onDriverCanceled();
        return false;
    }

    if (!advanced) {
        state = CursorState::AfterSegment;
        return false;
    }

    ++rows_in_segment;
    return true;
}

bool ResultReader::nextSegment() {
    if (checkCanceled())
        return false;

    if (state == CursorState::Exhausted)
        return false;

    bool advanced = false;
    if (!hasFlag(behavior, CommandBehavior::SingleResult)) {
        try {
            advanced = cursor.advanceSegment();
        }
        catch (const JobException & ex) {
            if (ex.getKind() != ErrorKind::CanceledError)
                throw;
            onDriverCanceled();
            return false;
        }
    }

    if (!advanced) {
        state = CursorState::Exhausted;
        return false;
    }

    ++segment_index;
    rows_in_segment = 0;
    state = CursorState::InSegment;
    return true;
}

DataTable ResultReader::toDataTable() {
    DataTable table;
    table.columns = cursor.getColumnSchema();

    while (nextRow()) {
        try {
            table.rows.push_back(readRowValues(cursor, table.columns.size()));
        }
        catch (const JobException & ex) {
            if (ex.getKind() != ErrorKind::CanceledError)
                throw;
            onDriverCanceled();
            break;
        }
    }

    return table;
}

DataSet ResultReader::toDataSet() {
    DataSet tables;

    do {
        auto table = toDataTable();
        if (wasCanceled())
            break;
        tables.push_back(std::move(table));
    } while (nextSegment());

    return tables;
}

std::int64_t ResultReader::getAffectedRowCount() const {
    return cursor.getAffectedRowCount();
}

void ResultReader::throwMissingSegment(std::size_t slot) const {
    throw JobException(ErrorKind::CardinalityError, ErrorCode::EmptyResult, Component::ResultMaterializer,
        "Result set " + std::to_string(slot) + " is required but the command did not produce it",
        "02000");
}

void ResultReader::ensureNoMoreRows() {
    if (nextRow())
        throw JobException(ErrorKind::CardinalityError, ErrorCode::MultipleRowsFound, Component::ResultMaterializer,
            "Result contains more than one row", "21000");
}
