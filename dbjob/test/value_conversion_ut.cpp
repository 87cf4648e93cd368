#include "dbjob/utils/conversion.h"
#include "dbjob/value.h"

#include <gtest/gtest.h>

#include <limits>
#include <optional>
#include <string>

template <typename T>
class IntegerConversion
    : public ::testing::Test
{
};

using IntegerTypes = ::testing::Types<std::int8_t, std::uint8_t, std::int16_t, std::uint16_t, std::int32_t, std::uint32_t, std::int64_t, std::uint64_t>;
TYPED_TEST_SUITE(IntegerConversion, IntegerTypes);

TYPED_TEST(IntegerConversion, FromNativeAlternatives) {
    using T = TypeParam;

    EXPECT_EQ(convertValue<T>(Value(std::int64_t{42})), T{42});
    EXPECT_EQ(convertValue<T>(Value(std::uint64_t{42})), T{42});
    EXPECT_EQ(convertValue<T>(Value(42.9)), T{42});
    EXPECT_EQ(convertValue<T>(Value(true)), T{1});
    EXPECT_EQ(convertValue<T>(Value(" 42 ")), T{42});
    EXPECT_EQ(convertValue<T>(Value::null()), T{0});
}

TYPED_TEST(IntegerConversion, Limits) {
    using T = TypeParam;

    const auto max = std::numeric_limits<T>::max();
    const auto min = std::numeric_limits<T>::min();

    EXPECT_EQ(convertValue<T>(Value(max)), max);
    EXPECT_EQ(convertValue<T>(Value(min)), min);
    EXPECT_EQ(convertValue<T>(Value(std::to_string(max))), max);
}

TYPED_TEST(IntegerConversion, OutOfRange) {
    using T = TypeParam;

    if constexpr (sizeof(T) < sizeof(std::int64_t)) {
        const auto above = static_cast<std::int64_t>(std::numeric_limits<T>::max()) + 1;
        EXPECT_THROW(convertValue<T>(Value(above)), ConversionError);
    }

    if constexpr (std::is_unsigned_v<T>)
        EXPECT_THROW(convertValue<T>(Value(std::int64_t{-1})), ConversionError);

    EXPECT_THROW(convertValue<T>(Value(std::numeric_limits<double>::infinity())), ConversionError);
    EXPECT_THROW(convertValue<T>(Value("forty two")), ConversionError);
    EXPECT_THROW(convertValue<T>(Value(Date{2024, 1, 1})), ConversionError);
}

TEST(ValueConversion, Boolean) {
    EXPECT_TRUE(convertValue<bool>(Value(std::int64_t{5})));
    EXPECT_FALSE(convertValue<bool>(Value(0.0)));
    EXPECT_TRUE(convertValue<bool>(Value("yes")));
    EXPECT_FALSE(convertValue<bool>(Value("off")));
    EXPECT_FALSE(convertValue<bool>(Value::null()));
    EXPECT_THROW(convertValue<bool>(Value("sometimes")), ConversionError);
}

TEST(ValueConversion, FloatingPoint) {
    EXPECT_DOUBLE_EQ(convertValue<double>(Value(std::int64_t{-3})), -3.0);
    EXPECT_DOUBLE_EQ(convertValue<double>(Value("2.5")), 2.5);
    EXPECT_FLOAT_EQ(convertValue<float>(Value(0.25)), 0.25f);
    EXPECT_THROW(convertValue<double>(Value("abc")), ConversionError);
}

TEST(ValueConversion, String) {
    EXPECT_EQ(convertValue<std::string>(Value(std::int64_t{17})), "17");
    EXPECT_EQ(convertValue<std::string>(Value(true)), "true");
    EXPECT_EQ(convertValue<std::string>(Value::null()), "");
    EXPECT_EQ(convertValue<std::string>(Value(Binary{'a', 'b'})), "ab");
    EXPECT_EQ(convertValue<std::string>(Value(Date{2024, 2, 29})), "2024-02-29");
}

TEST(ValueConversion, DateAndTimeText) {
    EXPECT_EQ(toString(Date{987, 1, 2}), "0987-01-02");
    EXPECT_EQ(toString(Time{7, 5, 9}), "07:05:09");
    EXPECT_EQ(toString(DateTime{Date{2024, 2, 29}, Time{13, 14, 15}, 0}), "2024-02-29 13:14:15");
    EXPECT_EQ(toString(DateTime{Date{2024, 2, 29}, Time{13, 14, 15}, 500000000}), "2024-02-29 13:14:15.500000000");
}

TEST(ValueConversion, DateAndTime) {
    EXPECT_EQ(convertValue<Date>(Value("2024-02-29")), (Date{2024, 2, 29}));
    EXPECT_EQ(convertValue<Date>(Value("2024-02-29 13:14:15")), (Date{2024, 2, 29}));
    EXPECT_EQ(convertValue<Time>(Value("13:14:15")), (Time{13, 14, 15}));

    const auto timestamp = convertValue<DateTime>(Value("2024-02-29T13:14:15.5"));
    EXPECT_EQ(timestamp.date, (Date{2024, 2, 29}));
    EXPECT_EQ(timestamp.time, (Time{13, 14, 15}));
    EXPECT_EQ(timestamp.fraction, 500000000u);

    EXPECT_EQ(convertValue<DateTime>(Value(Date{2000, 1, 2})).date, (Date{2000, 1, 2}));
    EXPECT_THROW(convertValue<Date>(Value("29.02.2024")), ConversionError);
    EXPECT_THROW(convertValue<Time>(Value("25:00:00")), ConversionError);
    EXPECT_THROW(convertValue<DateTime>(Value("2024-02-29 13:14:15.1234567890")), ConversionError);
}

TEST(ValueConversion, Optional) {
    EXPECT_EQ(convertValue<std::optional<int>>(Value::null()), std::nullopt);
    EXPECT_EQ(convertValue<std::optional<int>>(Value("7")), std::optional<int>{7});
    EXPECT_TRUE(toValue(std::optional<std::string>{}).isNull());
    EXPECT_EQ(toValue(std::optional<std::string>{"x"}), Value("x"));
}

TEST(Value, TypesAndEquality) {
    EXPECT_EQ(Value(1).getType(), ValueType::Int64);
    EXPECT_EQ(Value(1u).getType(), ValueType::UInt64);
    EXPECT_EQ(Value(1.0f).getType(), ValueType::Float64);
    EXPECT_EQ(Value("a").getType(), ValueType::String);
    EXPECT_EQ(Value::null().getType(), ValueType::Null);
    EXPECT_TRUE(Value::null().isNull());

    EXPECT_EQ(Value(std::int64_t{1}), Value(1));
    EXPECT_NE(Value(std::int64_t{1}), Value(std::uint64_t{1}));
}

TEST(Value, DateTimeText) {
    DateTime timestamp;
    timestamp.date = Date{1999, 12, 31};
    timestamp.time = Time{23, 59, 58};
    EXPECT_EQ(toString(timestamp), "1999-12-31 23:59:58");

    timestamp.fraction = 1000;
    EXPECT_EQ(toString(timestamp), "1999-12-31 23:59:58.000001000");

    const auto parsed = tryParseDateTime(toString(timestamp));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, timestamp);
}
