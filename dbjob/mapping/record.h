#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/utils/utils.h"
#include "dbjob/value.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>

// A generic row: ordered (column name, value) pairs. Duplicate column names are kept.
class Record {
public:
    using Field = std::pair<std::string, Value>;
    using const_iterator = std::vector<Field>::const_iterator;

    void add(std::string name, Value value);

    // First field with the name, compared case-insensitively.
    const Value * find(const std::string & name) const;
    const Value & at(const std::string & name) const;
    const Field & operator[] (std::size_t index) const;

    std::vector<std::string> getNames() const;
    std::size_t size() const noexcept;
    bool empty() const noexcept;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    friend bool operator== (const Record & lhs, const Record & rhs);

private:
    std::vector<Field> fields;
};

// A generic row keyed by column name. The first of duplicate columns wins.
using RecordMap = std::map<std::string, Value, UTF8CaseInsensitiveCompare>;

// Columns and rows of one result segment, in the order the cursor produced them.
struct DataTable {
    ColumnSchema columns;
    std::vector<std::vector<Value>> rows;

    std::vector<std::string> getColumnNames() const;
    std::size_t getColumnCount() const noexcept;
    std::size_t getRowCount() const noexcept;
    std::optional<std::size_t> findColumn(const std::string & name) const;
    const Value & at(std::size_t row, std::size_t column) const;
};

// One table per result segment.
using DataSet = std::vector<DataTable>;
