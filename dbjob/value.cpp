#include "dbjob/value.h"

#include <iomanip>
#include <ostream>
#include <sstream>

#include <cstdio>

const char * toString(ValueType type) noexcept {
    switch (type) {
        case ValueType::Null:     return "Null";
        case ValueType::Boolean:  return "Boolean";
        case ValueType::Int64:    return "Int64";
        case ValueType::UInt64:   return "UInt64";
        case ValueType::Float64:  return "Float64";
        case ValueType::String:   return "String";
        case ValueType::Binary:   return "Binary";
        case ValueType::Date:     return "Date";
        case ValueType::Time:     return "Time";
        case ValueType::DateTime: return "DateTime";
    }
    return "Unknown";
}

bool operator== (const Date & lhs, const Date & rhs) noexcept {
    return (lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day);
}

bool operator== (const Time & lhs, const Time & rhs) noexcept {
    return (lhs.hour == rhs.hour && lhs.minute == rhs.minute && lhs.second == rhs.second);
}

bool operator== (const DateTime & lhs, const DateTime & rhs) noexcept {
    return (lhs.date == rhs.date && lhs.time == rhs.time && lhs.fraction == rhs.fraction);
}

std::string toString(const Date & date) {
    char buf[64] = {};
    const auto written = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", static_cast<int>(date.year), static_cast<int>(date.month), static_cast<int>(date.day));
    if (written < 10 || written >= static_cast<int>(sizeof(buf)))
        buf[0] = '\0';
    return std::string{buf};
}

std::string toString(const Time & time) {
    char buf[64] = {};
    const auto written = std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", static_cast<int>(time.hour), static_cast<int>(time.minute), static_cast<int>(time.second));
    if (written < 8 || written >= static_cast<int>(sizeof(buf)))
        buf[0] = '\0';
    return std::string{buf};
}

std::string toString(const DateTime & timestamp) {
    auto result = toString(timestamp.date) + " " + toString(timestamp.time);

    if (timestamp.fraction > 0 && timestamp.fraction < 1000000000) {
        char buf[16] = {};
        std::snprintf(buf, sizeof(buf), ".%09u", static_cast<unsigned int>(timestamp.fraction));
        result += buf;
    }

    return result;
}

std::string toString(const Binary & binary) {
    std::ostringstream stream;
    stream << "0x" << std::hex << std::setfill('0');
    for (const auto byte : binary) {
        stream << std::setw(2) << static_cast<unsigned int>(byte);
    }
    return stream.str();
}

std::optional<Date> tryParseDate(const std::string & str) {
    int year = 0;
    unsigned int month = 0;
    unsigned int day = 0;
    char extra = '\0';

    const auto read = std::sscanf(str.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &extra);
    if (read != 3 || month < 1 || month > 12 || day < 1 || day > 31)
        return std::nullopt;

    Date date;
    date.year = static_cast<std::int16_t>(year);
    date.month = static_cast<std::uint16_t>(month);
    date.day = static_cast<std::uint16_t>(day);
    return date;
}

std::optional<Time> tryParseTime(const std::string & str) {
    unsigned int hour = 0;
    unsigned int minute = 0;
    unsigned int second = 0;
    char extra = '\0';

    const auto read = std::sscanf(str.c_str(), "%2u:%2u:%2u%c", &hour, &minute, &second, &extra);
    if (read != 3 || hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    Time time;
    time.hour = static_cast<std::uint16_t>(hour);
    time.minute = static_cast<std::uint16_t>(minute);
    time.second = static_cast<std::uint16_t>(second);
    return time;
}

std::optional<DateTime> tryParseDateTime(const std::string & str) {
    if (str.size() < 10)
        return std::nullopt;

    const auto date = tryParseDate(str.substr(0, 10));
    if (!date)
        return std::nullopt;

    DateTime timestamp;
    timestamp.date = *date;

    if (str.size() == 10)
        return timestamp;

    if (str[10] != ' ' && str[10] != 'T')
        return std::nullopt;

    const auto time_part = str.substr(11, 8);
    const auto time = tryParseTime(time_part);
    if (!time)
        return std::nullopt;

    timestamp.time = *time;

    const auto rest_pos = 11 + time_part.size();
    if (rest_pos == str.size())
        return timestamp;

    if (str[rest_pos] != '.')
        return std::nullopt;

    // Fraction digits are scaled to nanoseconds, extra digits beyond 9 are rejected.
    std::uint32_t fraction = 0;
    std::size_t digits = 0;
    for (auto i = rest_pos + 1; i < str.size(); ++i) {
        const auto ch = str[i];
        if (ch < '0' || ch > '9' || digits >= 9)
            return std::nullopt;
        fraction = fraction * 10 + static_cast<std::uint32_t>(ch - '0');
        ++digits;
    }

    if (digits == 0)
        return std::nullopt;

    for (; digits < 9; ++digits) {
        fraction *= 10;
    }

    timestamp.fraction = fraction;
    return timestamp;
}

bool Value::isNull() const noexcept {
    return std::holds_alternative<std::monostate>(storage);
}

ValueType Value::getType() const noexcept {
    return static_cast<ValueType>(storage.index());
}

std::string Value::toString() const {
    return std::visit([] (const auto & value) -> std::string {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::string{};
        }
        else if constexpr (std::is_same_v<T, bool>) {
            return (value ? "true" : "false");
        }
        else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream stream;
            stream << std::setprecision(17) << value;
            return stream.str();
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return value;
        }
        else if constexpr (std::is_arithmetic_v<T>) {
            return std::to_string(value);
        }
        else {
            return ::toString(value);
        }
    }, storage);
}

bool operator== (const Value & lhs, const Value & rhs) {
    return (lhs.storage == rhs.storage);
}

bool operator!= (const Value & lhs, const Value & rhs) {
    return !(lhs == rhs);
}

std::ostream & operator<< (std::ostream & stream, const Value & value) {
    if (value.isNull())
        return stream << "NULL";

    if (value.getType() == ValueType::String)
        return stream << "'" << value.toString() << "'";

    return stream << value.toString();
}

std::string schemaSignature(const ColumnSchema & schema) {
    // Names are length-prefixed, so any characters they contain cannot make two schemas collide.
    std::string signature = std::to_string(schema.size()) + "#";
    for (const auto & column : schema) {
        signature += std::to_string(column.name.size());
        signature += ':';
        signature += column.name;
        signature += ':';
        signature += toString(column.type);
        signature += (column.nullable ? "?" : "");
        signature += '|';
    }
    return signature;
}
