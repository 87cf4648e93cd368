#pragma once

#include "dbjob/mapping/record_binding.h"
#include "dbjob/value.h"

#include <optional>
#include <string>

struct Person {
    std::int64_t id = 0;
    std::string name;
    std::optional<double> score;
};

template <>
struct RecordBinding<Person> {
    static constexpr bool supported = true;

    static const FieldMap<Person> & fields() {
        static const auto map = FieldMap<Person>{}
            .add("Id", &Person::id)
            .add("Name", &Person::name)
            .add("Score", &Person::score);
        return map;
    }
};

struct Order {
    std::int64_t order_id = 0;
    std::int64_t person_id = 0;
    Date placed;
};

template <>
struct RecordBinding<Order> {
    static constexpr bool supported = true;

    static const FieldMap<Order> & fields() {
        static const auto map = FieldMap<Order>{}
            .add("OrderId", &Order::order_id)
            .add("PersonId", &Order::person_id)
            .add("Placed", &Order::placed);
        return map;
    }
};

struct Tag {
    std::string label;
};

template <>
struct RecordBinding<Tag> {
    static constexpr bool supported = true;

    static const FieldMap<Tag> & fields() {
        static const auto map = FieldMap<Tag>{}
            .add("Label", &Tag::label);
        return map;
    }
};
