#include "dbjob/mapping/record.h"

#include <stdexcept>

void Record::add(std::string name, Value value) {
    fields.emplace_back(std::move(name), std::move(value));
}

const Value * Record::find(const std::string & name) const {
    for (const auto & field : fields) {
        if (equalsIgnoreCase(field.first, name))
            return &field.second;
    }
    return nullptr;
}

const Value & Record::at(const std::string & name) const {
    const auto * value = find(name);
    if (!value)
        throw std::out_of_range("record has no field '" + name + "'");
    return *value;
}

const Record::Field & Record::operator[] (std::size_t index) const {
    return fields.at(index);
}

std::vector<std::string> Record::getNames() const {
    std::vector<std::string> names;
    names.reserve(fields.size());
    for (const auto & field : fields) {
        names.push_back(field.first);
    }
    return names;
}

std::size_t Record::size() const noexcept {
    return fields.size();
}

bool Record::empty() const noexcept {
    return fields.empty();
}

Record::const_iterator Record::begin() const noexcept {
    return fields.begin();
}

Record::const_iterator Record::end() const noexcept {
    return fields.end();
}

bool operator== (const Record & lhs, const Record & rhs) {
    return (lhs.fields == rhs.fields);
}

std::vector<std::string> DataTable::getColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto & column : columns) {
        names.push_back(column.name);
    }
    return names;
}

std::size_t DataTable::getColumnCount() const noexcept {
    return columns.size();
}

std::size_t DataTable::getRowCount() const noexcept {
    return rows.size();
}

std::optional<std::size_t> DataTable::findColumn(const std::string & name) const {
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (equalsIgnoreCase(columns[i].name, name))
            return i;
    }
    return std::nullopt;
}

const Value & DataTable::at(std::size_t row, std::size_t column) const {
    return rows.at(row).at(column);
}
