#include "dbjob/mapping/mapping_plan.h"

#include <algorithm>

ColumnMapSettings & ColumnMapSettings::mapColumn(const std::string & column, const std::string & field) {
    if (column.empty() || field.empty())
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::RowMapper,
            "Column map override requires both column and field names");

    overrides.emplace_back(column, field);
    return *this;
}

ColumnMapSettings & ColumnMapSettings::ignoreColumn(const std::string & column) {
    ignored.push_back(column);
    return *this;
}

std::optional<std::string> ColumnMapSettings::findFieldFor(const std::string & column) const {
    for (const auto & entry : overrides) {
        if (equalsIgnoreCase(entry.first, column))
            return entry.second;
    }
    return std::nullopt;
}

bool ColumnMapSettings::isIgnored(const std::string & column) const {
    return std::any_of(ignored.begin(), ignored.end(), [&column] (const std::string & name) {
        return equalsIgnoreCase(name, column);
    });
}

bool ColumnMapSettings::empty() const noexcept {
    return (overrides.empty() && ignored.empty());
}

std::string ColumnMapSettings::signature() const {
    const auto quoted = [] (const std::string & name) {
        return std::to_string(name.size()) + ":" + name;
    };

    std::string result;
    for (const auto & entry : overrides) {
        result += quoted(Poco::UTF8::toLower(entry.first)) + "->" + quoted(entry.second) + ";";
    }
    for (const auto & name : ignored) {
        result += "!" + quoted(Poco::UTF8::toLower(name)) + ";";
    }
    return result;
}

const char * toString(ShapeKind kind) noexcept {
    switch (kind) {
        case ShapeKind::Scalar:    return "Scalar";
        case ShapeKind::Composite: return "Composite";
        case ShapeKind::Generic:   return "Generic";
    }
    return "Unknown";
}

MappingPlan buildScalarPlan(const ColumnSchema & schema) {
    if (schema.empty())
        throw JobException(ErrorKind::MappingError, ErrorCode::ColumnTypeMismatch, Component::RowMapper,
            "Result has no columns to read a scalar value from");

    MappingPlan plan;
    plan.kind = ShapeKind::Scalar;
    plan.column_count = schema.size();

    ColumnBinding binding;
    binding.column = 0;
    binding.column_name = schema[0].name;
    plan.bindings.push_back(binding);

    return plan;
}

MappingPlan buildGenericPlan(const ColumnSchema & schema, const ColumnMapSettings & settings) {
    MappingPlan plan;
    plan.kind = ShapeKind::Generic;
    plan.column_count = schema.size();

    for (std::size_t i = 0; i < schema.size(); ++i) {
        const auto & column = schema[i];
        if (settings.isIgnored(column.name))
            continue;

        ColumnBinding binding;
        binding.column = i;
        binding.column_name = column.name;
        binding.field_name = settings.findFieldFor(column.name).value_or(column.name);
        plan.bindings.push_back(std::move(binding));
    }

    return plan;
}

MappingPlan buildCompositePlan(const ColumnSchema & schema, const std::vector<std::string> & field_names, const ColumnMapSettings & settings) {
    MappingPlan plan;
    plan.kind = ShapeKind::Composite;
    plan.column_count = schema.size();

    const auto find_field = [&field_names] (const std::string & name) -> std::optional<std::size_t> {
        for (std::size_t i = 0; i < field_names.size(); ++i) {
            if (equalsIgnoreCase(field_names[i], name))
                return i;
        }
        return std::nullopt;
    };

    std::vector<bool> field_bound(field_names.size(), false);
    std::vector<bool> column_handled(schema.size(), false);

    const auto bind = [&] (std::size_t column, std::size_t field) {
        ColumnBinding binding;
        binding.column = column;
        binding.column_name = schema[column].name;
        binding.field = field;
        binding.field_name = field_names[field];
        plan.bindings.push_back(std::move(binding));
        field_bound[field] = true;
    };

    // Overrides first, so that they win over name matching of other columns.
    for (std::size_t i = 0; i < schema.size(); ++i) {
        const auto & column = schema[i];

        if (settings.isIgnored(column.name)) {
            column_handled[i] = true;
            continue;
        }

        const auto target = settings.findFieldFor(column.name);
        if (!target)
            continue;

        column_handled[i] = true;

        const auto field = find_field(*target);
        if (!field)
            throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::RowMapper,
                "Column '" + column.name + "' is mapped to unknown field '" + *target + "'");

        if (!field_bound[*field])
            bind(i, *field);
    }

    for (std::size_t i = 0; i < schema.size(); ++i) {
        if (column_handled[i])
            continue;

        const auto field = find_field(schema[i].name);
        if (field && !field_bound[*field])
            bind(i, *field);
    }

    std::sort(plan.bindings.begin(), plan.bindings.end(), [] (const ColumnBinding & lhs, const ColumnBinding & rhs) {
        return lhs.column < rhs.column;
    });

    return plan;
}

MappingPlanCache & MappingPlanCache::getInstance() noexcept {
    static MappingPlanCache cache;
    return cache;
}

std::shared_ptr<const MappingPlan> MappingPlanCache::getOrBuild(const std::string & key, const std::function<MappingPlan()> & build) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = plans.find(key);
        if (it != plans.end()) {
            ++hits;
            return it->second;
        }
        ++misses;
    }

    // Built outside of the lock, a concurrent builder of the same key keeps the first stored plan.
    auto plan = std::make_shared<const MappingPlan>(build());

    std::lock_guard<std::mutex> lock(mutex);
    return plans.emplace(key, std::move(plan)).first->second;
}

void MappingPlanCache::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    plans.clear();
    hits = 0;
    misses = 0;
}

std::size_t MappingPlanCache::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return plans.size();
}

std::size_t MappingPlanCache::getHitCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return hits;
}

std::size_t MappingPlanCache::getMissCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return misses;
}

void throwColumnTypeMismatch(const ColumnBinding & binding, const std::string & reason) {
    std::string message = "Column '" + binding.column_name + "' (index " + std::to_string(binding.column) + ")";
    if (!binding.field_name.empty())
        message += " cannot be mapped to field '" + binding.field_name + "'";
    else
        message += " cannot be mapped";
    message += ": " + reason;

    throw JobException(ErrorKind::MappingError, ErrorCode::ColumnTypeMismatch, Component::RowMapper, message, "07006");
}

std::vector<Value> readRowValues(DriverCursor & cursor, std::size_t column_count) {
    std::vector<Value> values;
    values.reserve(column_count);
    for (std::size_t i = 0; i < column_count; ++i) {
        values.push_back(cursor.readColumn(i));
    }
    return values;
}
