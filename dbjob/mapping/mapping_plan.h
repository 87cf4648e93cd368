#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/utils/utils.h"
#include "dbjob/utils/conversion.h"
#include "dbjob/mapping/record.h"
#include "dbjob/mapping/record_binding.h"
#include "dbjob/driver.h"
#include "dbjob/exception.h"
#include "dbjob/value.h"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include <cstddef>

// Per-job adjustments of the default name matching.
class ColumnMapSettings {
public:
    /// Maps the column to the named field (or, for generic records, renames the key).
    /// Takes precedence over name matching.
    ColumnMapSettings & mapColumn(const std::string & column, const std::string & field);

    /// The column is never mapped, not even into generic records.
    ColumnMapSettings & ignoreColumn(const std::string & column);

    std::optional<std::string> findFieldFor(const std::string & column) const;
    bool isIgnored(const std::string & column) const;
    bool empty() const noexcept;

    std::string signature() const;

private:
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> ignored;
};

enum class ShapeKind {
    Scalar,    // column 0 of each row
    Composite, // fields of a type with a RecordBinding
    Generic    // every column, keyed by name
};

const char * toString(ShapeKind kind) noexcept;

template <typename T>
inline constexpr ShapeKind shapeKindOf() {
    if constexpr (std::is_same_v<T, Record> || std::is_same_v<T, RecordMap>)
        return ShapeKind::Generic;
    else if constexpr (is_record_bindable_v<T>)
        return ShapeKind::Composite;
    else if constexpr (is_value_convertible_v<T>)
        return ShapeKind::Scalar;
    else
        static_assert(always_false<T>::value, "rows cannot be mapped into this type, specialize RecordBinding for it");
}

struct ColumnBinding {
    std::size_t column = 0;
    std::string column_name;
    std::size_t field = 0;   // index into the FieldMap, for composite shapes
    std::string field_name;  // field name, or the key for generic shapes
};

// Immutable column-to-field bindings for one (shape, schema, settings) combination.
// Bindings are ordered by column index.
struct MappingPlan {
    ShapeKind kind = ShapeKind::Scalar;
    std::vector<ColumnBinding> bindings;
    std::size_t column_count = 0;
};

MappingPlan buildScalarPlan(const ColumnSchema & schema);
MappingPlan buildGenericPlan(const ColumnSchema & schema, const ColumnMapSettings & settings);
MappingPlan buildCompositePlan(const ColumnSchema & schema, const std::vector<std::string> & field_names, const ColumnMapSettings & settings);

template <typename T>
MappingPlan buildPlan(const ColumnSchema & schema, const ColumnMapSettings & settings) {
    constexpr auto kind = shapeKindOf<T>();

    if constexpr (kind == ShapeKind::Scalar)
        return buildScalarPlan(schema);
    else if constexpr (kind == ShapeKind::Generic)
        return buildGenericPlan(schema, settings);
    else
        return buildCompositePlan(schema, RecordBinding<T>::fields().fieldNames(), settings);
}

// Process wide cache of mapping plans. Plans are shared and never modified after they are built.
class MappingPlanCache {
private:
    MappingPlanCache() = default;

public:
    static MappingPlanCache & getInstance() noexcept;

    std::shared_ptr<const MappingPlan> getOrBuild(const std::string & key, const std::function<MappingPlan()> & build);

    void clear();
    std::size_t size() const;
    std::size_t getHitCount() const;
    std::size_t getMissCount() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<const MappingPlan>> plans;
    std::size_t hits = 0;
    std::size_t misses = 0;
};

template <typename T>
std::shared_ptr<const MappingPlan> getMappingPlan(const ColumnSchema & schema, const ColumnMapSettings & settings, bool use_cache) {
    if (!use_cache)
        return std::make_shared<const MappingPlan>(buildPlan<T>(schema, settings));

    const auto key = std::string{typeid(T).name()} + "|" + schemaSignature(schema) + "|" + settings.signature();
    return MappingPlanCache::getInstance().getOrBuild(key, [&] () {
        return buildPlan<T>(schema, settings);
    });
}

[[noreturn]] void throwColumnTypeMismatch(const ColumnBinding & binding, const std::string & reason);

// Reads the current row of the cursor into T. Columns are read in ascending index order.
template <typename T>
T mapRow(DriverCursor & cursor, const MappingPlan & plan) {
    constexpr auto kind = shapeKindOf<T>();

    if constexpr (kind == ShapeKind::Scalar) {
        const auto & binding = plan.bindings.front();
        try {
            return ValueTraits<T>::fromValue(cursor.readColumn(binding.column));
        }
        catch (const ConversionError & ex) {
            throwColumnTypeMismatch(binding, ex.what());
        }
    }
    else if constexpr (kind == ShapeKind::Generic) {
        T row;
        for (const auto & binding : plan.bindings) {
            auto value = cursor.readColumn(binding.column);
            if constexpr (std::is_same_v<T, Record>)
                row.add(binding.field_name, std::move(value));
            else
                row.emplace(binding.field_name, std::move(value));
        }
        return row;
    }
    else {
        static_assert(std::is_default_constructible_v<T>, "composite record types must be default constructible");

        const auto & fields = RecordBinding<T>::fields().getFields();

        T row{};
        for (const auto & binding : plan.bindings) {
            try {
                fields[binding.field].set(row, cursor.readColumn(binding.column));
            }
            catch (const ConversionError & ex) {
                throwColumnTypeMismatch(binding, ex.what());
            }
        }
        return row;
    }
}

// Every column of the current row, in order.
std::vector<Value> readRowValues(DriverCursor & cursor, std::size_t column_count);
