#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/utils/utils.h"
#include "dbjob/utils/conversion.h"
#include "dbjob/exception.h"
#include "dbjob/value.h"

#include <functional>
#include <string>
#include <type_traits>
#include <vector>

// Read/write access to one field of a composite record type.
template <typename T>
struct FieldAccessor {
    std::string name;
    ValueType type = ValueType::Null;
    std::function<void(T &, const Value &)> set;
    std::function<Value(const T &)> get;
};

// Ordered list of the mappable fields of T, built from member pointers:
//
//     FieldMap<Person>{}.add("id", &Person::id).add("name", &Person::name)
//
// Field names are matched case-insensitively.
template <typename T>
class FieldMap {
public:
    template <typename M>
    FieldMap & add(const std::string & name, M T::* member) {
        static_assert(is_value_convertible_v<M>, "field type cannot be converted from Value");

        if (find(name))
            throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::RowMapper,
                "Field '" + name + "' is declared more than once");

        FieldAccessor<T> accessor;
        accessor.name = name;
        accessor.type = ValueTraits<M>::type;
        accessor.set = [member] (T & target, const Value & value) {
            target.*member = ValueTraits<M>::fromValue(value);
        };
        accessor.get = [member] (const T & source) {
            return ValueTraits<M>::toValue(source.*member);
        };

        fields.push_back(std::move(accessor));
        return *this;
    }

    const std::vector<FieldAccessor<T>> & getFields() const noexcept {
        return fields;
    }

    std::vector<std::string> fieldNames() const {
        std::vector<std::string> names;
        names.reserve(fields.size());
        for (const auto & field : fields) {
            names.push_back(field.name);
        }
        return names;
    }

    std::size_t size() const noexcept {
        return fields.size();
    }

    const FieldAccessor<T> * find(const std::string & name) const {
        for (const auto & field : fields) {
            if (equalsIgnoreCase(field.name, name))
                return &field;
        }
        return nullptr;
    }

    void setField(T & target, const std::string & name, const Value & value) const {
        const auto * field = find(name);
        if (!field)
            throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::RowMapper,
                "Unknown field '" + name + "'");
        field->set(target, value);
    }

private:
    std::vector<FieldAccessor<T>> fields;
};

// Specialize for every composite record type that rows are mapped into or parameters are taken from:
//
//     template <>
//     struct RecordBinding<Person> {
//         static constexpr bool supported = true;
//         static const FieldMap<Person> & fields();
//     };
template <typename T>
struct RecordBinding {
    static constexpr bool supported = false;
};

template <typename T>
inline constexpr bool is_record_bindable_v = RecordBinding<T>::supported;
