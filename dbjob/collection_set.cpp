#include "dbjob/collection_set.h"
#include "dbjob/exception.h"

#include <string>
#include <utility>

TableCursor::TableCursor(const DataTable & table_)
    : table(table_)
{
}

const ColumnSchema & TableCursor::getColumnSchema() const {
    return table.columns;
}

bool TableCursor::advanceRow() {
    const auto next = (row ? *row + 1 : 0);
    if (next >= table.rows.size())
        return false;

    row = next;
    return true;
}

bool TableCursor::advanceSegment() {
    return false;
}

Value TableCursor::readColumn(std::size_t index) {
    if (!row || index >= table.rows[*row].size())
        throw JobException(ErrorKind::MappingError, ErrorCode::InvalidState, Component::ResultMaterializer,
            "Column index " + std::to_string(index) + " is out of range or no row is current", "07009");

    return table.rows[*row][index];
}

std::int64_t TableCursor::getAffectedRowCount() const {
    return -1;
}

CollectionSet::CollectionSet(DataSet tables_)
    : tables(std::move(tables_))
{
}

std::size_t CollectionSet::getCount() const noexcept {
    return tables.size();
}

bool CollectionSet::empty() const noexcept {
    return tables.empty();
}

const DataTable & CollectionSet::getTable(std::size_t index) const {
    if (index >= tables.size())
        throw JobException(ErrorKind::CardinalityError, ErrorCode::EmptyResult, Component::ResultMaterializer,
            "Result set " + std::to_string(index) + " was not produced, the command returned " + std::to_string(tables.size()), "02000");

    return tables[index];
}

const DataSet & CollectionSet::getTables() const noexcept {
    return tables;
}
