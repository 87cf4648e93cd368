#pragma once

#include "dbjob/platform/platform.h"

#include <iosfwd>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <cstdint>

// The order of types matches the order of alternatives in Value::storage_t.
enum class ValueType {
    Null,
    Boolean,
    Int64,
    UInt64,
    Float64,
    String,
    Binary,
    Date,
    Time,
    DateTime
};

const char * toString(ValueType type) noexcept;

using Binary = std::vector<std::uint8_t>;

struct Date {
    std::int16_t year = 0;
    std::uint16_t month = 0;
    std::uint16_t day = 0;
};

struct Time {
    std::uint16_t hour = 0;
    std::uint16_t minute = 0;
    std::uint16_t second = 0;
};

struct DateTime {
    Date date;
    Time time;
    std::uint32_t fraction = 0; // nanoseconds
};

bool operator== (const Date & lhs, const Date & rhs) noexcept;
bool operator== (const Time & lhs, const Time & rhs) noexcept;
bool operator== (const DateTime & lhs, const DateTime & rhs) noexcept;

std::string toString(const Date & date);
std::string toString(const Time & time);
std::string toString(const DateTime & timestamp);
std::string toString(const Binary & binary);

// "YYYY-MM-DD", "hh:mm:ss" and "YYYY-MM-DD hh:mm:ss[.fffffffff]" ('T' is accepted as a separator too).
std::optional<Date> tryParseDate(const std::string & str);
std::optional<Time> tryParseTime(const std::string & str);
std::optional<DateTime> tryParseDateTime(const std::string & str);

// A column value, a parameter value or a field of a generic record.
class Value {
public:
    using storage_t = std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, std::string, Binary, Date, Time, DateTime>;

public:
    Value() = default;

    Value(bool value)
        : storage(value)
    {
    }

    template <typename T,
        std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> && std::is_signed_v<T>> * = nullptr>
    Value(T value)
        : storage(static_cast<std::int64_t>(value))
    {
    }

    template <typename T,
        std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> && std::is_unsigned_v<T>> * = nullptr>
    Value(T value)
        : storage(static_cast<std::uint64_t>(value))
    {
    }

    template <typename T, std::enable_if_t<std::is_floating_point_v<T>> * = nullptr>
    Value(T value)
        : storage(static_cast<double>(value))
    {
    }

    Value(const char * value)
        : storage(std::string{value ? value : ""})
    {
    }

    Value(std::string value)
        : storage(std::move(value))
    {
    }

    Value(Binary value)
        : storage(std::move(value))
    {
    }

    Value(const Date & value)
        : storage(value)
    {
    }

    Value(const Time & value)
        : storage(value)
    {
    }

    Value(const DateTime & value)
        : storage(value)
    {
    }

    static Value null() {
        return Value{};
    }

    bool isNull() const noexcept;
    ValueType getType() const noexcept;

    template <typename T>
    const T * getIf() const noexcept {
        return std::get_if<T>(&storage);
    }

    const storage_t & getStorage() const noexcept {
        return storage;
    }

    // Text form used for logging and for coercion into text fields. Null is rendered as an empty string.
    std::string toString() const;

    friend bool operator== (const Value & lhs, const Value & rhs);
    friend bool operator!= (const Value & lhs, const Value & rhs);

private:
    storage_t storage;
};

std::ostream & operator<< (std::ostream & stream, const Value & value);

struct ColumnInfo {
    std::string name;
    ValueType type = ValueType::String;
    bool nullable = true;
};

// Ordered column descriptions of one result segment. Duplicate names are allowed.
using ColumnSchema = std::vector<ColumnInfo>;

// Identity of a schema for the purposes of mapping plan caching.
std::string schemaSignature(const ColumnSchema & schema);
