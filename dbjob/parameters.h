#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/utils/utils.h"
#include "dbjob/utils/conversion.h"
#include "dbjob/mapping/record.h"
#include "dbjob/mapping/record_binding.h"
#include "dbjob/exception.h"
#include "dbjob/value.h"

#include <iterator>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <cstddef>

enum class ParameterDirection {
    Input,
    Output,
    InputOutput,
    ReturnValue
};

const char * toString(ParameterDirection direction) noexcept;

struct ParameterDescriptor {
    std::string name; // without the '@' prefix, empty for a positional parameter
    ParameterDirection direction = ParameterDirection::Input;
    std::optional<ValueType> type_hint;
    Value value;
    std::optional<std::vector<Value>> list_values; // set for "IN (...)" expansion
    std::size_t size = 0; // output buffer size, 0 means DBJOB_DEFAULT_OUTPUT_SIZE

    bool isPositional() const noexcept;
    bool isList() const noexcept;
    bool isInput() const noexcept;
    bool isOutput() const noexcept;

    // Hint if present, else the type of the bound value (of the first list element for lists).
    ValueType getEffectiveType() const noexcept;
};

struct BindingRestrictions {
    std::vector<std::string> exclude;
    std::vector<std::string> include_only;
    std::string prefix;
    std::string suffix;

    bool admits(const std::string & name) const;
    std::string decorate(const std::string & name) const;
};

namespace parameter_source {

    template <typename T, typename = void>
    struct is_iterable : std::false_type {};

    template <typename T>
    struct is_iterable<T, std::void_t<decltype(std::begin(std::declval<const T &>())), decltype(std::end(std::declval<const T &>()))>> : std::true_type {};

    template <typename T, typename = void>
    struct is_named_map : std::false_type {};

    template <typename T>
    struct is_named_map<T, std::void_t<typename T::key_type, typename T::mapped_type>>
        : std::bool_constant<std::is_same_v<typename T::key_type, std::string>>
    {
    };

    template <typename T>
    inline constexpr bool is_scalar_v = (is_value_convertible_v<T> || std::is_constructible_v<Value, const T &>);

} // namespace parameter_source

// Insertion ordered set of parameter descriptors. Names are unique, compared case-insensitively
// and with the optional '@' prefix ignored. Positional parameters have no name and may repeat.
class ParameterCollection {
public:
    using const_iterator = std::vector<ParameterDescriptor>::const_iterator;

    template <typename T>
    ParameterCollection & add(const std::string & name, const T & value, ParameterDirection direction = ParameterDirection::Input) {
        return add(name, makeValue(value), direction, typeHintFor<T>());
    }

    ParameterCollection & add(const std::string & name, Value value, ParameterDirection direction, std::optional<ValueType> type_hint);

    // A sequence bound to a single name, expanded into one marker per element by the command builder.
    ParameterCollection & addList(const std::string & name, std::vector<Value> values, std::optional<ValueType> type_hint = std::nullopt);

    template <typename T>
    ParameterCollection & addList(const std::string & name, const std::vector<T> & values) {
        std::vector<Value> converted;
        converted.reserve(values.size());
        for (const auto & value : values) {
            converted.push_back(makeValue(value));
        }
        return addList(name, std::move(converted), typeHintFor<T>());
    }

    ParameterCollection & addOutput(const std::string & name, ValueType type, std::size_t size = 0, ParameterDirection direction = ParameterDirection::Output);

    ParameterCollection & addPositional(Value value, std::optional<ValueType> type_hint = std::nullopt);

    ParameterCollection & add(ParameterDescriptor descriptor);

    // Accepts a ParameterCollection, a generic record, a map keyed by name, a composite record type
    // with a RecordBinding, or a flat value (bound as one positional parameter).
    template <typename Source>
    ParameterCollection & addFor(const Source & source, const BindingRestrictions & restrictions = BindingRestrictions{});

    ParameterCollection & merge(const ParameterCollection & other, const BindingRestrictions & restrictions = BindingRestrictions{});

    const ParameterDescriptor * find(const std::string & name) const;
    ParameterDescriptor * find(const std::string & name);

    std::vector<std::string> getNames() const;
    std::size_t size() const noexcept;
    bool empty() const noexcept;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    std::string toString() const;

private:
    template <typename T>
    static Value makeValue(const T & value) {
        if constexpr (std::is_constructible_v<Value, const T &>)
            return Value(value);
        else
            return ValueTraits<T>::toValue(value);
    }

    template <typename T>
    static std::optional<ValueType> typeHintFor() {
        if constexpr (is_value_convertible_v<T> && !std::is_same_v<T, Value>)
            return ValueTraits<T>::type;
        else
            return std::nullopt;
    }

    void insert(ParameterDescriptor && descriptor);

private:
    std::vector<ParameterDescriptor> descriptors;
};

template <typename Source>
ParameterCollection & ParameterCollection::addFor(const Source & source, const BindingRestrictions & restrictions) {
    if constexpr (std::is_same_v<Source, ParameterCollection>) {
        return merge(source, restrictions);
    }
    else if constexpr (std::is_same_v<Source, Record>) {
        for (const auto & field : source) {
            if (restrictions.admits(field.first))
                add(restrictions.decorate(field.first), field.second, ParameterDirection::Input, std::nullopt);
        }
        return *this;
    }
    else if constexpr (parameter_source::is_named_map<Source>::value) {
        for (const auto & field : source) {
            if (restrictions.admits(field.first))
                add(restrictions.decorate(field.first), makeValue(field.second), ParameterDirection::Input, typeHintFor<typename Source::mapped_type>());
        }
        return *this;
    }
    else if constexpr (is_record_bindable_v<Source>) {
        for (const auto & field : RecordBinding<Source>::fields().getFields()) {
            if (restrictions.admits(field.name))
                add(restrictions.decorate(field.name), field.get(source), ParameterDirection::Input, field.type);
        }
        return *this;
    }
    else if constexpr (parameter_source::is_scalar_v<Source>) {
        return addPositional(makeValue(source), typeHintFor<Source>());
    }
    else if constexpr (parameter_source::is_iterable<Source>::value) {
        throw JobException(ErrorKind::ParameterBindingError, ErrorCode::UnsupportedParameterShape, Component::ParameterBinder,
            "A sequence cannot be used as a parameter source, bind it as the value of a named parameter instead");
    }
    else {
        static_assert(always_false<Source>::value, "unsupported parameter source, specialize RecordBinding for it");
    }
}
