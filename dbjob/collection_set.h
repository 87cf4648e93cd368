#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/mapping/record.h"
#include "dbjob/cancellation.h"
#include "dbjob/driver.h"
#include "dbjob/result_reader.h"

#include <optional>
#include <vector>

#include <cstddef>
#include <cstdint>

// Cursor over rows that were already materialized. Has a single segment.
class TableCursor
    : public DriverCursor
{
public:
    explicit TableCursor(const DataTable & table_);

    const ColumnSchema & getColumnSchema() const override;
    bool advanceRow() override;
    bool advanceSegment() override;
    Value readColumn(std::size_t index) override;
    std::int64_t getAffectedRowCount() const override;

private:
    const DataTable & table;
    std::optional<std::size_t> row;
};

// Every result segment of one command, kept as data and converted to typed collections on request.
// Segment k of the command is item k.
class CollectionSet {
public:
    CollectionSet() = default;
    explicit CollectionSet(DataSet tables_);

    std::size_t getCount() const noexcept;
    bool empty() const noexcept;

    /// Throws CardinalityError/EmptyResult if the command did not produce the item.
    const DataTable & getTable(std::size_t index) const;

    /// Rows of the item mapped to T, the same way a typed read of the segment maps them.
    template <typename T>
    std::vector<T> toList(std::size_t index, const ColumnMapSettings & settings = ColumnMapSettings{}) const {
        TableCursor cursor(getTable(index));
        ResultReader reader(cursor, CommandBehavior::SingleResult, CancellationToken{}, settings, true);
        return reader.toList<T>();
    }

    /// First row of the item mapped to T, std::nullopt if it has no rows.
    template <typename T>
    std::optional<T> firstOrDefault(std::size_t index, const ColumnMapSettings & settings = ColumnMapSettings{}) const {
        TableCursor cursor(getTable(index));
        ResultReader reader(cursor, CommandBehavior::SingleResult | CommandBehavior::SingleRow, CancellationToken{}, settings, true);
        return reader.firstOrDefault<T>();
    }

    const DataSet & getTables() const noexcept;

private:
    DataSet tables;
};
