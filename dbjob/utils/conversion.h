#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/utils/utils.h"
#include "dbjob/exception.h"
#include "dbjob/value.h"

#include <Poco/NumberParser.h>
#include <Poco/String.h>

#include <limits>
#include <optional>
#include <string>
#include <type_traits>

#include <cmath>
#include <cstdint>

/***********************************************************************************************************************
// ValueTraits<T> describes how a C++ type takes part in the value model:
//
//     ValueTraits<T>::supported   - true for every type that can be a column target or a parameter value
//     ValueTraits<T>::type        - the natural ValueType of T, used as a type hint for parameters
//     ValueTraits<T>::fromValue() - Value -> T, the native alternative first, then a best effort conversion
//     ValueTraits<T>::toValue()   - T -> Value
//
// Null converts to the default/zero value of T (or to std::nullopt for optional targets).
// A conversion that cannot be performed throws ConversionError.
***********************************************************************************************************************/

namespace value_conversion {

    [[noreturn]] inline void throwConversionError(const Value & value, const char * target, const std::string & reason = "") {
        std::string message = "Cannot convert ";
        message += toString(value.getType());
        if (!value.isNull() && value.getType() != ValueType::Binary)
            message += " value '" + value.toString() + "'";
        message += " to ";
        message += target;
        if (!reason.empty())
            message += ": " + reason;
        throw ConversionError(message);
    }

    template <typename T>
    inline T narrowInteger(std::int64_t src, const Value & value, const char * target) {
        if constexpr (std::is_signed_v<T>) {
            if (src < static_cast<std::int64_t>(std::numeric_limits<T>::min()) || src > static_cast<std::int64_t>(std::numeric_limits<T>::max()))
                throwConversionError(value, target, "value out of range");
        }
        else {
            if (src < 0 || static_cast<std::uint64_t>(src) > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
                throwConversionError(value, target, "value out of range");
        }
        return static_cast<T>(src);
    }

    template <typename T>
    inline T narrowInteger(std::uint64_t src, const Value & value, const char * target) {
        if (src > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
            throwConversionError(value, target, "value out of range");
        return static_cast<T>(src);
    }

    // Truncates toward zero.
    template <typename T>
    inline T narrowInteger(double src, const Value & value, const char * target) {
        if (!std::isfinite(src))
            throwConversionError(value, target, "value is not finite");

        bool in_range = false;
        if constexpr (std::is_signed_v<T>)
            in_range = (src >= static_cast<double>(std::numeric_limits<T>::min()) && src < -static_cast<double>(std::numeric_limits<T>::min()));
        else
            in_range = (src > -1.0 && src < static_cast<double>(std::numeric_limits<T>::max()) + 1.0);

        if (!in_range)
            throwConversionError(value, target, "value out of range");

        return static_cast<T>(src);
    }

    template <typename T>
    inline T parseInteger(const std::string & str, const Value & value, const char * target) {
        const auto trimmed = Poco::trim(str);

        if constexpr (std::is_signed_v<T>) {
            Poco::Int64 parsed = 0;
            if (Poco::NumberParser::tryParse64(trimmed, parsed))
                return narrowInteger<T>(static_cast<std::int64_t>(parsed), value, target);
        }
        else {
            Poco::UInt64 parsed = 0;
            if (Poco::NumberParser::tryParseUnsigned64(trimmed, parsed))
                return narrowInteger<T>(static_cast<std::uint64_t>(parsed), value, target);
        }

        double parsed_float = 0;
        if (Poco::NumberParser::tryParseFloat(trimmed, parsed_float))
            return narrowInteger<T>(parsed_float, value, target);

        throwConversionError(value, target, "not a number");
    }

} // namespace value_conversion

template <typename T, typename Enable = void>
struct ValueTraits {
    static constexpr bool supported = false;
};

template <>
struct ValueTraits<bool> {
    static constexpr bool supported = true;
    static constexpr ValueType type = ValueType::Boolean;
    static constexpr const char * name = "Boolean";

    static bool fromValue(const Value & value) {
        return std::visit([&] (const auto & src) -> bool {
            using S = std::decay_t<decltype(src)>;

            if constexpr (std::is_same_v<S, std::monostate>) {
                return false;
            }
            else if constexpr (std::is_same_v<S, bool>) {
                return src;
            }
            else if constexpr (std::is_arithmetic_v<S>) {
                return (src != 0);
            }
            else if constexpr (std::is_same_v<S, std::string>) {
                if (!isYesOrNo(src))
                    value_conversion::throwConversionError(value, name);
                return isYes(src);
            }
            else {
                value_conversion::throwConversionError(value, name);
            }
        }, value.getStorage());
    }

    static Value toValue(bool src) {
        return Value{src};
    }
};

template <typename T>
struct ValueTraits<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static constexpr bool supported = true;
    static constexpr ValueType type = (std::is_signed_v<T> ? ValueType::Int64 : ValueType::UInt64);
    static constexpr const char * name = (std::is_signed_v<T> ? "signed integer" : "unsigned integer");

    static T fromValue(const Value & value) {
        return std::visit([&] (const auto & src) -> T {
            using S = std::decay_t<decltype(src)>;

            if constexpr (std::is_same_v<S, std::monostate>) {
                return T{};
            }
            else if constexpr (std::is_same_v<S, bool>) {
                return static_cast<T>(src ? 1 : 0);
            }
            else if constexpr (std::is_same_v<S, std::int64_t> || std::is_same_v<S, std::uint64_t> || std::is_same_v<S, double>) {
                return value_conversion::narrowInteger<T>(src, value, name);
            }
            else if constexpr (std::is_same_v<S, std::string>) {
                return value_conversion::parseInteger<T>(src, value, name);
            }
            else {
                value_conversion::throwConversionError(value, name);
            }
        }, value.getStorage());
    }

    static Value toValue(T src) {
        return Value{src};
    }
};

template <typename T>
struct ValueTraits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static constexpr bool supported = true;
    static constexpr ValueType type = ValueType::Float64;
    static constexpr const char * name = "Float64";

    static T fromValue(const Value & value) {
        return std::visit([&] (const auto & src) -> T {
            using S = std::decay_t<decltype(src)>;

            if constexpr (std::is_same_v<S, std::monostate>) {
                return T{};
            }
            else if constexpr (std::is_same_v<S, bool>) {
                return static_cast<T>(src ? 1 : 0);
            }
            else if constexpr (std::is_arithmetic_v<S>) {
                return static_cast<T>(src);
            }
            else if constexpr (std::is_same_v<S, std::string>) {
                double parsed = 0;
                if (!Poco::NumberParser::tryParseFloat(Poco::trim(src), parsed))
                    value_conversion::throwConversionError(value, name, "not a number");
                return static_cast<T>(parsed);
            }
            else {
                value_conversion::throwConversionError(value, name);
            }
        }, value.getStorage());
    }

    static Value toValue(T src) {
        return Value{src};
    }
};

template <>
struct ValueTraits<std::string> {
    static constexpr bool supported = true;
    static constexpr ValueType type = ValueType::String;
    static constexpr const char * name = "String";

    static std::string fromValue(const Value & value) {
        if (const auto * binary = value.getIf<Binary>())
            return std::string(binary->begin(), binary->end());

        return value.toString();
    }

    static Value toValue(const std::string & src) {
        return Value{src};
    }
};

template <>
struct ValueTraits<Binary> {
    static constexpr bool supported = true;
    static constexpr ValueType type = ValueType::Binary;
    static constexpr const char * name = "Binary";

    static Binary fromValue(const Value & value) {
        if (value.isNull())
            return Binary{};

        if (const auto * binary = value.getIf<Binary>())
            return *binary;

        if (const auto * str = value.getIf<std::string>())
            return Binary(str->begin(), str->end());

        value_conversion::throwConversionError(value, name);
    }

    static Value toValue(const Binary & src) {
        return Value{src};
    }
};

template <>
struct ValueTraits<Date> {
    static constexpr bool supported = true;
    static constexpr ValueType type = ValueType::Date;
    static constexpr const char * name = "Date";

    static Date fromValue(const Value & value) {
        if (value.isNull())
            return Date{};

        if (const auto * date = value.getIf<Date>())
            return *date;

        if (const auto * timestamp = value.getIf<DateTime>())
            return timestamp->date;

        if (const auto * str = value.getIf<std::string>()) {
            if (const auto timestamp = tryParseDateTime(Poco::trim(*str)))
                return timestamp->date;
        }

        value_conversion::throwConversionError(value, name);
    }

    static Value toValue(const Date & src) {
        return Value{src};
    }
};

template <>
struct ValueTraits<Time> {
    static constexpr bool supported = true;
    static constexpr ValueType type = ValueType::Time;
    static constexpr const char * name = "Time";

    static Time fromValue(const Value & value) {
        if (value.isNull())
            return Time{};

        if (const auto * time = value.getIf<Time>())
            return *time;

        if (const auto * timestamp = value.getIf<DateTime>())
            return timestamp->time;

        if (const auto * str = value.getIf<std::string>()) {
            if (const auto time = tryParseTime(Poco::trim(*str)))
                return *time;
        }

        value_conversion::throwConversionError(value, name);
    }

    static Value toValue(const Time & src) {
        return Value{src};
    }
};

template <>
struct ValueTraits<DateTime> {
    static constexpr bool supported = true;
    static constexpr ValueType type = ValueType::DateTime;
    static constexpr const char * name = "DateTime";

    static DateTime fromValue(const Value & value) {
        if (value.isNull())
            return DateTime{};

        if (const auto * timestamp = value.getIf<DateTime>())
            return *timestamp;

        if (const auto * date = value.getIf<Date>()) {
            DateTime result;
            result.date = *date;
            return result;
        }

        if (const auto * str = value.getIf<std::string>()) {
            if (const auto timestamp = tryParseDateTime(Poco::trim(*str)))
                return *timestamp;
        }

        value_conversion::throwConversionError(value, name);
    }

    static Value toValue(const DateTime & src) {
        return Value{src};
    }
};

template <>
struct ValueTraits<Value> {
    static constexpr bool supported = true;
    static constexpr ValueType type = ValueType::Null;
    static constexpr const char * name = "Value";

    static Value fromValue(const Value & value) {
        return value;
    }

    static Value toValue(const Value & src) {
        return src;
    }
};

template <typename T>
struct ValueTraits<std::optional<T>, std::enable_if_t<ValueTraits<T>::supported>> {
    static constexpr bool supported = true;
    static constexpr ValueType type = ValueTraits<T>::type;
    static constexpr const char * name = ValueTraits<T>::name;

    static std::optional<T> fromValue(const Value & value) {
        if (value.isNull())
            return std::nullopt;

        return ValueTraits<T>::fromValue(value);
    }

    static Value toValue(const std::optional<T> & src) {
        if (!src)
            return Value::null();

        return ValueTraits<T>::toValue(*src);
    }
};

template <typename T>
inline constexpr bool is_value_convertible_v = ValueTraits<T>::supported;

template <typename T>
inline T convertValue(const Value & value) {
    static_assert(is_value_convertible_v<T>, "type cannot be converted from Value");
    return ValueTraits<T>::fromValue(value);
}

template <typename T>
inline Value toValue(const T & src) {
    static_assert(is_value_convertible_v<T>, "type cannot be converted to Value");
    return ValueTraits<T>::toValue(src);
}
