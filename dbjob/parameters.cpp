#include "dbjob/parameters.h"

#include <algorithm>
#include <sstream>

const char * toString(ParameterDirection direction) noexcept {
    switch (direction) {
        case ParameterDirection::Input:       return "Input";
        case ParameterDirection::Output:      return "Output";
        case ParameterDirection::InputOutput: return "InputOutput";
        case ParameterDirection::ReturnValue: return "ReturnValue";
    }
    return "Unknown";
}

bool ParameterDescriptor::isPositional() const noexcept {
    return name.empty();
}

bool ParameterDescriptor::isList() const noexcept {
    return list_values.has_value();
}

bool ParameterDescriptor::isInput() const noexcept {
    return (direction == ParameterDirection::Input || direction == ParameterDirection::InputOutput);
}

bool ParameterDescriptor::isOutput() const noexcept {
    return (direction != ParameterDirection::Input);
}

ValueType ParameterDescriptor::getEffectiveType() const noexcept {
    if (type_hint)
        return *type_hint;

    if (list_values) {
        for (const auto & element : *list_values) {
            if (!element.isNull())
                return element.getType();
        }
        return ValueType::Null;
    }

    return value.getType();
}

bool BindingRestrictions::admits(const std::string & name) const {
    const auto stripped = tryStripParamPrefix(name);
    const auto matches = [&stripped] (const std::string & candidate) {
        return equalsIgnoreCase(tryStripParamPrefix(candidate), stripped);
    };

    if (std::any_of(exclude.begin(), exclude.end(), matches))
        return false;

    if (!include_only.empty() && std::none_of(include_only.begin(), include_only.end(), matches))
        return false;

    return true;
}

std::string BindingRestrictions::decorate(const std::string & name) const {
    return prefix + tryStripParamPrefix(name) + suffix;
}

ParameterCollection & ParameterCollection::add(const std::string & name, Value value, ParameterDirection direction, std::optional<ValueType> type_hint) {
    ParameterDescriptor descriptor;
    descriptor.name = tryStripParamPrefix(name);
    descriptor.direction = direction;
    descriptor.type_hint = type_hint;
    descriptor.value = std::move(value);

    if (descriptor.name.empty())
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::ParameterBinder,
            "Parameter name cannot be empty, use addPositional() for positional parameters");

    insert(std::move(descriptor));
    return *this;
}

ParameterCollection & ParameterCollection::addList(const std::string & name, std::vector<Value> values, std::optional<ValueType> type_hint) {
    ParameterDescriptor descriptor;
    descriptor.name = tryStripParamPrefix(name);
    descriptor.type_hint = type_hint;
    descriptor.list_values = std::move(values);

    if (descriptor.name.empty())
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::ParameterBinder,
            "List parameter must have a name");

    insert(std::move(descriptor));
    return *this;
}

ParameterCollection & ParameterCollection::addOutput(const std::string & name, ValueType type, std::size_t size, ParameterDirection direction) {
    if (direction == ParameterDirection::Input)
        throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::ParameterBinder,
            "Output parameter '" + name + "' cannot have Input direction");

    add(name, Value::null(), direction, type);
    find(name)->size = size;
    return *this;
}

ParameterCollection & ParameterCollection::addPositional(Value value, std::optional<ValueType> type_hint) {
    ParameterDescriptor descriptor;
    descriptor.type_hint = type_hint;
    descriptor.value = std::move(value);
    insert(std::move(descriptor));
    return *this;
}

ParameterCollection & ParameterCollection::add(ParameterDescriptor descriptor) {
    descriptor.name = tryStripParamPrefix(descriptor.name);
    insert(std::move(descriptor));
    return *this;
}

ParameterCollection & ParameterCollection::merge(const ParameterCollection & other, const BindingRestrictions & restrictions) {
    for (const auto & descriptor : other) {
        if (descriptor.isPositional()) {
            insert(ParameterDescriptor{descriptor});
        }
        else if (restrictions.admits(descriptor.name)) {
            auto copy = descriptor;
            copy.name = restrictions.decorate(descriptor.name);
            insert(std::move(copy));
        }
    }
    return *this;
}

void ParameterCollection::insert(ParameterDescriptor && descriptor) {
    if (!descriptor.isPositional() && find(descriptor.name))
        throw JobException(ErrorKind::ParameterBindingError, ErrorCode::DuplicateParameterName, Component::ParameterBinder,
            "Parameter '@" + descriptor.name + "' is bound more than once");

    descriptors.push_back(std::move(descriptor));
}

const ParameterDescriptor * ParameterCollection::find(const std::string & name) const {
    const auto stripped = tryStripParamPrefix(name);
    if (stripped.empty())
        return nullptr;

    for (const auto & descriptor : descriptors) {
        if (equalsIgnoreCase(descriptor.name, stripped))
            return &descriptor;
    }

    return nullptr;
}

ParameterDescriptor * ParameterCollection::find(const std::string & name) {
    return const_cast<ParameterDescriptor *>(static_cast<const ParameterCollection &>(*this).find(name));
}

std::vector<std::string> ParameterCollection::getNames() const {
    std::vector<std::string> names;
    for (const auto & descriptor : descriptors) {
        if (!descriptor.isPositional())
            names.push_back(descriptor.name);
    }
    return names;
}

std::size_t ParameterCollection::size() const noexcept {
    return descriptors.size();
}

bool ParameterCollection::empty() const noexcept {
    return descriptors.empty();
}

ParameterCollection::const_iterator ParameterCollection::begin() const noexcept {
    return descriptors.begin();
}

ParameterCollection::const_iterator ParameterCollection::end() const noexcept {
    return descriptors.end();
}

std::string ParameterCollection::toString() const {
    std::ostringstream stream;
    bool first = true;

    for (const auto & descriptor : descriptors) {
        if (!first)
            stream << ", ";
        first = false;

        stream << (descriptor.isPositional() ? "?" : "@" + descriptor.name);

        if (descriptor.direction != ParameterDirection::Input)
            stream << " " << ::toString(descriptor.direction);

        if (descriptor.isList()) {
            stream << "=[";
            for (std::size_t i = 0; i < descriptor.list_values->size(); ++i) {
                stream << (i == 0 ? "" : ", ") << (*descriptor.list_values)[i];
            }
            stream << "]";
        }
        else if (descriptor.isInput()) {
            stream << "=" << descriptor.value;
        }
    }

    return stream.str();
}
